#ifndef SP_SCP_ERRORS_HEADER
#define SP_SCP_ERRORS_HEADER

#include "types.hpp"

namespace securepath::scp {

enum scp_error_code : std::uint32_t {
	scp_noerror          = 0,
	// opening, starting or doing I/O on the remote command failed
	scp_transport_error  = 1,
	// the byte stream did not follow the scp protocol
	scp_protocol_error   = 2,
	// the remote scp reported fatal error
	scp_remote_error     = 3,
	// local file system operation failed
	scp_local_error      = 4,
	// the accept function returned error
	scp_filter_error     = 5,
	// caller supplied data that does not match what was promised
	scp_invalid_argument = 6,
	// the transfer was cancelled through the stop token
	scp_cancelled        = 7
};

std::string_view to_string(scp_error_code);

class scp_error {
public:
	scp_error() = default;
	scp_error(scp_error_code code, std::string message)
	: code_(code)
	, message_(std::move(message))
	{}

	scp_error_code code() const { return code_; }
	std::string const& message() const { return message_; }

	/// this is an error if error code is not zero
	explicit operator bool() const {
		return code_ != scp_noerror;
	}

	/// returns copy of this error with "context: " prepended to the message, no-op for non-error
	scp_error wrap(std::string_view context) const;

	/// returns copy of this error with the code replaced
	scp_error with_code(scp_error_code) const;

private:
	scp_error_code code_{scp_noerror};
	std::string message_;
};

std::string to_string(scp_error const&);

/// error for failed system call, message is "<op> '<path>': <strerror(err)>"
scp_error system_error(scp_error_code code, std::string_view op, std::string_view path, int err);

}

#endif
