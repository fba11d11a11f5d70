#ifndef SP_SCP_REMOTE_SOURCE_HEADER
#define SP_SCP_REMOTE_SOURCE_HEADER

#include "protocol_codec.hpp"
#include "scp_config.hpp"
#include "transfer_observer.hpp"
#include "scp/common/logger.hpp"

#include <type_traits>

namespace securepath::scp {

/** \brief Drives remote "scp -f", reads headers and file bodies sent by the remote side
 *
 *  Every header read is acknowledged before returning it, every file body is followed by
 *  reply from the remote side and our acknowledgement.
 */
class remote_source {
public:
	remote_source(logger&, scp_config const&, in_stream& remote_out, out_stream& remote_in, transfer_observer* = nullptr);

	/// send the initial ok that tells the remote side to start sending
	scp_error start();

	/// read next header or reply, out is empty at the end of stream
	scp_error read_header_or_reply(std::optional<scp_message>& out);

	/// read next message and require it to be of type Header
	template<typename Header>
	scp_error read_header(Header& out);

	/// stream exactly header.size bytes to dest and exchange the trailing acknowledgement
	scp_error copy_file_body_to(file_header const&, out_stream& dest);

private:
	scp_error write_ok();
	scp_error unexpected(message_kind expected, std::optional<scp_message> const& got) const;

	template<typename Header>
	static constexpr message_kind kind_for();

private:
	logger& log_;
	scp_config const& config_;
	stream_reader reader_;
	out_stream& remote_in_;
	transfer_observer* observer_{};
};

template<typename Header>
constexpr message_kind remote_source::kind_for() {
	if constexpr(std::is_same_v<Header, time_header>) {
		return message_kind::time;
	} else if constexpr(std::is_same_v<Header, file_header>) {
		return message_kind::file;
	} else if constexpr(std::is_same_v<Header, start_directory_header>) {
		return message_kind::start_directory;
	} else if constexpr(std::is_same_v<Header, end_directory_header>) {
		return message_kind::end_directory;
	} else {
		return message_kind::reply;
	}
}

template<typename Header>
scp_error remote_source::read_header(Header& out) {
	std::optional<scp_message> m;
	auto err = read_header_or_reply(m);
	if(err) {
		return err;
	}
	if(m) {
		if(auto h = std::get_if<Header>(&*m)) {
			out = std::move(*h);
			return {};
		}
	}
	return unexpected(kind_for<Header>(), m);
}

}

#endif
