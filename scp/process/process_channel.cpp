#include "process_channel.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace securepath::scp {

static scp_error make_pipe(fs::file_descriptor& read_end, fs::file_descriptor& write_end) {
	int p[2];
	if(::pipe2(p, O_CLOEXEC) != 0) {
		return system_error(scp_transport_error, "failed to create", "pipe", errno);
	}
	read_end = fs::file_descriptor(p[0]);
	write_end = fs::file_descriptor(p[1]);
	return {};
}

static scp_error set_non_blocking(int fd) {
	int flags = ::fcntl(fd, F_GETFL);
	if(flags == -1 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
		return system_error(scp_transport_error, "failed to set non-blocking", "pipe", errno);
	}
	return {};
}

process_channel::process_channel(logger& log, std::vector<std::string> argv_prefix)
: log_(log)
, argv_prefix_(std::move(argv_prefix))
{
}

process_channel::~process_channel() {
	close();
	if(pid_ > 0 && !exited_) {
		int status{};
		while(::waitpid(pid_, &status, 0) == -1 && errno == EINTR) {
		}
	}
	if(stderr_thread_.joinable()) {
		stderr_thread_.join();
	}
}

scp_error process_channel::start(std::string const& command) {
	if(pid_ != -1) {
		return scp_error{scp_transport_error, "process already started"};
	}

	fs::file_descriptor child_in, child_out, child_err;
	auto err = make_pipe(child_in, stdin_);
	if(!err) err = make_pipe(stdout_, child_out);
	if(!err) err = make_pipe(stderr_, child_err);
	if(!err) err = make_pipe(wake_read_, wake_write_);
	if(!err) err = set_non_blocking(stdin_.get());
	if(!err) err = set_non_blocking(stdout_.get());
	if(err) {
		return err;
	}

	std::vector<std::string> args = argv_prefix_;
	args.push_back(command);
	std::vector<char*> argv;
	for(auto& a : args) {
		argv.push_back(a.data());
	}
	argv.push_back(nullptr);

	log_.log(logger::debug, "executing '{}' with command '{}'", args.front(), command);

	{
		std::lock_guard l{mutex_};
		if(closed_) {
			return scp_error{scp_transport_error, "channel closed"};
		}
		pid_ = ::fork();
	}

	if(pid_ == -1) {
		return system_error(scp_transport_error, "failed to fork for", args.front(), errno);
	}

	if(pid_ == 0) {
		::dup2(child_in.get(), 0);
		::dup2(child_out.get(), 1);
		::dup2(child_err.get(), 2);
		::execvp(argv[0], argv.data());
		char const* e = std::strerror(errno);
		(void)!::write(2, "exec failed: ", 13);
		(void)!::write(2, e, std::strlen(e));
		(void)!::write(2, "\n", 1);
		::_exit(127);
	}

	// the child ends are closed in the parent when going out of scope
	stderr_thread_ = std::thread([this] { read_stderr(); });
	return {};
}

out_stream& process_channel::input() {
	return out_;
}

in_stream& process_channel::output() {
	return in_;
}

scp_error process_channel::wait_ready(int fd, short events, std::string_view what) {
	for(;;) {
		pollfd fds[2] = {{fd, events, 0}, {wake_read_.get(), POLLIN, 0}};
		int res = ::poll(fds, 2, -1);
		if(res < 0) {
			if(errno == EINTR) {
				continue;
			}
			return system_error(scp_transport_error, "failed to poll", what, errno);
		}
		if(fds[1].revents) {
			return scp_error{scp_transport_error, "channel closed"};
		}
		if(fds[0].revents) {
			return {};
		}
	}
}

scp_error process_channel::pipe_in::read_some(span out, std::size_t& read) {
	read = 0;
	if(!p_.stdout_) {
		return scp_error{scp_transport_error, "process not started"};
	}
	for(;;) {
		auto err = p_.wait_ready(p_.stdout_.get(), POLLIN, "command output");
		if(err) {
			return err;
		}
		auto n = ::read(p_.stdout_.get(), out.data(), out.size());
		if(n >= 0) {
			read = std::size_t(n);
			return {};
		}
		if(errno != EINTR && errno != EAGAIN) {
			return system_error(scp_transport_error, "failed to read", "command output", errno);
		}
	}
}

scp_error process_channel::pipe_out::write(const_span s) {
	while(!s.empty()) {
		if(!p_.stdin_) {
			return scp_error{scp_transport_error, "command input is closed"};
		}
		auto err = p_.wait_ready(p_.stdin_.get(), POLLOUT, "command input");
		if(err) {
			return err;
		}
		auto n = ::write(p_.stdin_.get(), s.data(), s.size());
		if(n < 0) {
			if(errno == EINTR || errno == EAGAIN) {
				continue;
			}
			return system_error(scp_transport_error, "failed to write", "command input", errno);
		}
		s = s.subspan(std::size_t(n));
	}
	return {};
}

void process_channel::read_stderr() {
	char buf[1024];
	for(;;) {
		if(wait_ready(stderr_.get(), POLLIN, "command error output")) {
			return;
		}
		auto n = ::read(stderr_.get(), buf, sizeof(buf));
		if(n < 0 && errno == EINTR) {
			continue;
		}
		if(n <= 0) {
			return;
		}
		std::string_view text(buf, std::size_t(n));
		log_.log(logger::debug, "stderr: {}", text);

		std::lock_guard l{mutex_};
		if(stderr_text_.size() < max_stderr_size) {
			stderr_text_.append(text.substr(0, max_stderr_size - stderr_text_.size()));
		}
	}
}

std::string process_channel::stderr_text() const {
	std::lock_guard l{mutex_};
	return stderr_text_;
}

scp_error process_channel::close_input() {
	if(stdin_ && stdin_.close() != 0) {
		return system_error(scp_transport_error, "failed to close", "command input", errno);
	}
	return {};
}

void process_channel::kill_child() {
	// caller holds the mutex, exited is only set with the mutex held so the pid was not reused
	if(pid_ > 0 && !exited_) {
		::kill(pid_, SIGKILL);
	}
}

void process_channel::reap() {
	// wait without reaping so that kill_child never sees recycled pid
	siginfo_t info{};
	while(::waitid(P_PID, id_t(pid_), &info, WEXITED | WNOWAIT) == -1 && errno == EINTR) {
	}

	std::lock_guard l{mutex_};
	while(::waitpid(pid_, &status_, 0) == -1 && errno == EINTR) {
	}
	exited_ = true;
}

scp_error process_channel::wait() {
	if(pid_ <= 0) {
		return scp_error{scp_transport_error, "process not started"};
	}

	auto err = close_input();
	if(err) {
		log_.log(logger::debug, "{}", err.message());
	}

	reap();
	if(stderr_thread_.joinable()) {
		stderr_thread_.join();
	}

	std::lock_guard l{mutex_};
	if(closed_) {
		return scp_error{scp_transport_error, "channel closed"};
	}

	std::string text = stderr_text_;
	while(!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
		text.pop_back();
	}

	if(WIFEXITED(status_)) {
		int code = WEXITSTATUS(status_);
		log_.log(logger::debug, "process exited with status {}", code);
		if(code == 0) {
			return {};
		}
		return scp_error{scp_transport_error, simple_format("command exited with status {}: {}", code, text)};
	}
	if(WIFSIGNALED(status_)) {
		return scp_error{scp_transport_error, simple_format("command killed by signal {}: {}", WTERMSIG(status_), text)};
	}
	return scp_error{scp_transport_error, "command ended with unknown status"};
}

void process_channel::close() {
	std::lock_guard l{mutex_};
	if(closed_) {
		return;
	}
	closed_ = true;

	if(wake_write_) {
		char c{};
		(void)!::write(wake_write_.get(), &c, 1);
	}
	kill_child();
}

process_channel_factory::process_channel_factory(logger& log, std::vector<std::string> argv_prefix)
: log_(log)
, argv_prefix_(std::move(argv_prefix))
{
	SPSCP_ASSERT(!argv_prefix_.empty(), "empty argv prefix");
	::signal(SIGPIPE, SIG_IGN);
}

scp_error process_channel_factory::open_channel(std::unique_ptr<command_channel>& out) {
	if(argv_prefix_.empty()) {
		return scp_error{scp_invalid_argument, "no program to run"};
	}
	out = std::make_unique<process_channel>(log_, argv_prefix_);
	return {};
}

std::vector<std::string> ssh_argv_prefix(std::string const& ssh_path, std::string const& host, std::string const& port, std::string const& user) {
	std::vector<std::string> args{ssh_path, "-x"};
	if(!port.empty()) {
		args.insert(args.end(), {"-p", port});
	}
	if(!user.empty()) {
		args.insert(args.end(), {"-l", user});
	}
	args.push_back(host);
	return args;
}

}
