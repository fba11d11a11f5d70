#ifndef SP_SCP_CLIENT_SCP_CLIENT_HEADER
#define SP_SCP_CLIENT_SCP_CLIENT_HEADER

#include "accept.hpp"
#include "scp/core/remote_sink.hpp"
#include "scp/core/remote_source.hpp"
#include "scp/core/scp_session.hpp"

#include <memory>
#include <stop_token>

namespace securepath::scp {

/** \brief Copies files and directories to and from remote host using the scp protocol
 *
 *  Every call runs one remote scp command through a channel from the factory and blocks until
 *  the transfer is done. Stop request on the token closes the channel and fails the transfer with scp_cancelled.
 *  The client can be used for one transfer at a time.
 */
class scp_client {
public:
	scp_client(channel_factory&, logger&, scp_config = {});

	/// optional progress callbacks, the observer must outlive the transfers
	void set_observer(transfer_observer* o) { observer_ = o; }

	scp_config const& config() const { return config_; }

	/// receive single remote file to dest, info is set to the received file's attributes (name is base name of remote_file)
	scp_error receive(std::string const& remote_file, out_stream& dest, file_info& info, std::stop_token = {});

	/// receive single remote file, if local_path is existing directory the file is created inside it
	scp_error receive_file(std::string const& remote_file, std::string const& local_path, std::stop_token = {});

	/** \brief Receive remote directory recursively
	 *
	 *  If local_dir does not exist it is created and the remote directory's content goes directly to it,
	 *  otherwise the remote directory is created inside local_dir.
	 */
	scp_error receive_dir(std::string const& remote_dir, std::string const& local_dir, accept_function const& accept = {}, std::stop_token = {});

	/// send exactly info.size bytes from source as remote_file, if info.name is empty the base name of remote_file is used
	scp_error send(file_info info, std::unique_ptr<in_stream> source, std::string const& remote_file, std::stop_token = {});

	/// send local file, the mode and times are preserved
	scp_error send_file(std::string const& local_file, std::string const& remote_file, std::stop_token = {});

	/// send local directory recursively, the accept function is called for every entry before it is sent
	scp_error send_dir(std::string const& local_dir, std::string const& remote_dir, accept_function const& accept = {}, std::stop_token = {});

private:
	using source_handler = std::function<scp_error(remote_source&)>;
	using sink_handler = std::function<scp_error(remote_sink&)>;

	scp_error run_source(std::string const& remote_path, bool recursive, std::stop_token, source_handler const&);
	scp_error run_sink(std::string const& remote_path, bool recursive, std::stop_token, sink_handler const&);

	scp_error receive_single(remote_source&, file_header&, std::optional<time_header>&);

private:
	channel_factory& factory_;
	logger& log_;
	scp_config const config_;
	transfer_observer* observer_{};
};

}

#endif
