#ifndef SP_SCP_PROCESS_CHANNEL_HEADER
#define SP_SCP_PROCESS_CHANNEL_HEADER

#include "scp/common/logger.hpp"
#include "scp/core/transport.hpp"
#include "scp/fs/local_fs.hpp"

#include <mutex>
#include <thread>
#include <vector>

#include <sys/types.h>

namespace securepath::scp {

/** \brief Runs the command as local child process, "<argv_prefix...> <command>"
 *
 *  The standard input and output of the child are the channel streams, standard error is collected
 *  for error messages. With prefix {"ssh", host} the command runs on the remote host.
 */
class process_channel : public command_channel {
public:
	process_channel(logger&, std::vector<std::string> argv_prefix);
	~process_channel();

	scp_error start(std::string const& command) override;
	out_stream& input() override;
	in_stream& output() override;
	scp_error close_input() override;
	scp_error wait() override;
	void close() override;

	pid_t pid() const { return pid_; }

	/// standard error output of the child so far (at most max_stderr_size bytes are kept)
	std::string stderr_text() const;

	static std::size_t const max_stderr_size{16*1024};

private:
	class pipe_in : public in_stream {
	public:
		pipe_in(process_channel& p) : p_(p) {}
		scp_error read_some(span out, std::size_t& read) override;
	private:
		process_channel& p_;
	};

	class pipe_out : public out_stream {
	public:
		using out_stream::write;
		pipe_out(process_channel& p) : p_(p) {}
		scp_error write(const_span) override;
	private:
		process_channel& p_;
	};

	// wait until fd is ready for events or the channel is closed
	scp_error wait_ready(int fd, short events, std::string_view what);
	void read_stderr();
	void kill_child();
	void reap();

private:
	logger& log_;
	std::vector<std::string> const argv_prefix_;
	pid_t pid_{-1};

	fs::file_descriptor stdin_;
	fs::file_descriptor stdout_;
	fs::file_descriptor stderr_;
	// written to on close to wake up blocked reads and writes
	fs::file_descriptor wake_read_;
	fs::file_descriptor wake_write_;

	pipe_in in_{*this};
	pipe_out out_{*this};

	std::thread stderr_thread_;

	mutable std::mutex mutex_;
	std::string stderr_text_;
	bool closed_{};
	bool exited_{};
	int status_{};
};

/** \brief Opens process_channels with the given argv prefix
 *
 *  SIGPIPE is ignored in the process when the factory is created, writing to exited child fails with EPIPE.
 */
class process_channel_factory : public channel_factory {
public:
	process_channel_factory(logger&, std::vector<std::string> argv_prefix);

	scp_error open_channel(std::unique_ptr<command_channel>& out) override;

	std::vector<std::string> const& argv_prefix() const { return argv_prefix_; }

private:
	logger& log_;
	std::vector<std::string> const argv_prefix_;
};

/// argv prefix for running commands on host through the OpenSSH client
std::vector<std::string> ssh_argv_prefix(std::string const& ssh_path, std::string const& host, std::string const& port, std::string const& user);

}

#endif
