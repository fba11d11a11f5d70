#ifndef SP_SCP_SESSION_HEADER
#define SP_SCP_SESSION_HEADER

#include "scp_config.hpp"
#include "transport.hpp"
#include "scp/common/logger.hpp"

#include <functional>
#include <mutex>
#include <stop_token>

namespace securepath::scp {

enum class session_state {
	created,
	started,  // remote command running, data flows
	closed
};
std::string_view to_string(session_state);

struct session_options {
	transfer_direction direction{transfer_direction::from_remote};
	// path on the remote side, given to scp as is (escaped for shell)
	std::string remote_path;
	// -r
	bool recursive{};
	// -d, the remote path must be a directory
	bool target_is_dir{};
};

/// command line for the remote scp, "<scp_path> -<f|t>[p][r][d] '<path>'"
std::string make_scp_command(scp_config const&, session_options const&);

/** \brief Owns one remote scp command execution
 *
 *  created -> started -> closed. Closing is idempotent and can be done from any thread,
 *  it makes blocked reads and writes of the session fail.
 */
class scp_session {
public:
	using handler = std::function<scp_error(scp_session&)>;

	scp_session(logger&, channel_factory&, scp_config const&, session_options);
	~scp_session();

	scp_session(scp_session const&) = delete;
	scp_session& operator=(scp_session const&) = delete;

	/** \brief Start the remote command, run the handler and wait for the remote command to exit.
	 *
	 *  Stop request on the token closes the session. The session is always closed when this returns.
	 *  The first error is returned, later teardown errors are only logged.
	 */
	scp_error run(std::stop_token, handler const&);

	/// open channel and start the remote command
	scp_error start();

	/// signal end of input and wait for the remote command to exit
	scp_error finish();

	/// close the channel, no-op if already closed
	void close();

	session_state state() const;
	bool cancelled() const;

	in_stream& remote_out();
	out_stream& remote_in();

	logger& log() { return log_; }
	std::string const& command() const { return command_; }
	session_options const& options() const { return options_; }

private:
	void cancel();

private:
	session_logger log_;
	channel_factory& factory_;
	scp_config const& config_;
	session_options const options_;
	std::string const command_;

	std::unique_ptr<command_channel> channel_;

	mutable std::mutex mutex_;
	session_state state_{session_state::created};
	bool cancelled_{};
};

}

#endif
