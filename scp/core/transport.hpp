#ifndef SP_SCP_TRANSPORT_HEADER
#define SP_SCP_TRANSPORT_HEADER

#include "scp/common/streams.hpp"

#include <memory>

namespace securepath::scp {

/** \brief Single remote command execution
 *
 *  Normally this is a session channel of an established ssh connection.
 */
class command_channel {
public:
	virtual ~command_channel() = default;

	/// start the command line on the remote side
	virtual scp_error start(std::string const& command) = 0;

	/// stream connected to the standard input of the remote command
	virtual out_stream& input() = 0;

	/// stream connected to the standard output of the remote command
	virtual in_stream& output() = 0;

	/// signal end of input to the remote command
	virtual scp_error close_input() = 0;

	/// wait for the remote command to exit, non-zero exit status is an error
	virtual scp_error wait() = 0;

	/** \brief Close the channel
	 *
	 *  Can be called from any thread and multiple times. Makes any blocked or later read and write fail.
	 */
	virtual void close() = 0;
};

/// the part of ssh client that can open command channels
class channel_factory {
public:
	virtual ~channel_factory() = default;

	virtual scp_error open_channel(std::unique_ptr<command_channel>& out) = 0;
};

}

#endif
