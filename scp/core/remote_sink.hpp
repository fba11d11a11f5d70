#ifndef SP_SCP_REMOTE_SINK_HEADER
#define SP_SCP_REMOTE_SINK_HEADER

#include "protocol_codec.hpp"
#include "scp_config.hpp"
#include "transfer_observer.hpp"
#include "scp/common/logger.hpp"

#include <memory>

namespace securepath::scp {

/** \brief Drives remote "scp -t", sends headers and file bodies to the remote side
 *
 *  Every header is followed by waiting the reply before anything else is sent.
 *  start_directory and end_directory calls must nest.
 */
class remote_sink {
public:
	remote_sink(logger&, scp_config const&, in_stream& remote_out, out_stream& remote_in, transfer_observer* = nullptr);

	/// wait for the initial ok from the remote side
	scp_error start();

	/** \brief Send file with content from source
	 *
	 *  The source must supply exactly info.size bytes. The source is released (closed) when returning.
	 */
	scp_error write_file(file_info const& info, std::unique_ptr<in_stream> source);

	/// send time (if preserving) and start directory header
	scp_error start_directory(file_info const& info);

	/// send end directory header for the latest started directory
	scp_error end_directory();

	/// number of directories started but not ended
	std::size_t depth() const { return depth_; }

private:
	scp_error send_header(scp_message const&);
	scp_error wait_reply(std::string_view context);
	scp_error send_time(file_info const&);
	scp_error send_body(file_info const&, in_stream& source);

private:
	logger& log_;
	scp_config const& config_;
	stream_reader reader_;
	out_stream& remote_in_;
	transfer_observer* observer_{};
	std::size_t depth_{};
};

}

#endif
