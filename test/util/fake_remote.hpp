#ifndef SP_SCP_TEST_UTIL_FAKE_REMOTE_HEADER
#define SP_SCP_TEST_UTIL_FAKE_REMOTE_HEADER

#include "scp/common/logger.hpp"
#include "scp/core/transport.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

namespace securepath::scp::test {

/// unbounded in-memory pipe, the reader blocks until data is written or the pipe is closed
class byte_pipe : public in_stream, public out_stream {
public:
	using out_stream::write;

	scp_error read_some(span out, std::size_t& read) override;
	scp_error write(const_span) override;

	/// reader gets end of stream after the buffered data
	void close_write();

	/// reads and writes fail from now on
	void abort();

private:
	std::mutex mutex_;
	std::condition_variable cond_;
	std::deque<std::byte> data_;
	bool write_closed_{};
	bool aborted_{};
};

/// misbehaviour of the fake remote, applied to the file or directory with the given name
struct fake_remote_options {
	// source: send warning before the header, sink: answer the file body with warning
	std::string warning_on;
	// source: send fatal instead of the header, sink: answer the file header with fatal
	std::string fatal_on;
	// stop sending or answering before the entry until the channel is closed
	std::string hang_on;
	// open_channel fails
	bool fail_open{};
};

class fake_channel;

/** \brief Runs scp commands against the local file system in-process
 *
 *  Understands "<scp> -f|-t[p][r][d] '<path>'" and plays the remote scp over in-memory pipes
 *  on its own thread.
 */
class fake_channel_factory : public channel_factory {
public:
	fake_channel_factory(logger&, fake_remote_options = {});

	scp_error open_channel(std::unique_ptr<command_channel>& out) override;

	std::vector<std::string> commands() const;
	std::size_t opened() const { return opened_; }
	std::size_t closed() const { return closed_; }

	/// true after the remote started waiting for the channel to be closed (see hang_on)
	bool hanging() const { return hanging_; }

	fake_remote_options const& options() const { return options_; }
	logger& log() { return log_; }

private:
	friend class fake_channel;

	logger& log_;
	fake_remote_options const options_;

	mutable std::mutex mutex_;
	std::vector<std::string> commands_;
	std::atomic<std::size_t> opened_{};
	std::atomic<std::size_t> closed_{};
	std::atomic<bool> hanging_{};
};

class fake_channel : public command_channel {
public:
	fake_channel(fake_channel_factory&);
	~fake_channel();

	scp_error start(std::string const& command) override;
	out_stream& input() override { return from_client_; }
	in_stream& output() override { return to_client_; }
	scp_error close_input() override;
	scp_error wait() override;
	void close() override;

	/// wait until closed
	void hang();

private:
	void run(std::string command);

private:
	fake_channel_factory& factory_;
	byte_pipe from_client_;
	byte_pipe to_client_;
	std::thread thread_;

	std::mutex mutex_;
	std::condition_variable cond_;
	bool closed_{};
	int exit_status_{-1};
	std::string error_text_;
};

/// split "<scp> -<flags> <quoted path>", returns false if the command is not understood
bool parse_scp_command(std::string_view command, std::string& flags, std::string& path);

}

#endif
