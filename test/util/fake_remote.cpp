#include "fake_remote.hpp"
#include "fs_util.hpp"
#include "scp/core/protocol.hpp"
#include "scp/fs/local_fs.hpp"

#include <algorithm>
#include <functional>
#include <optional>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace securepath::scp::test {

scp_error byte_pipe::read_some(span out, std::size_t& read) {
	read = 0;
	std::unique_lock l{mutex_};
	cond_.wait(l, [&] { return aborted_ || write_closed_ || !data_.empty(); });
	if(aborted_) {
		return scp_error{scp_transport_error, "pipe closed"};
	}
	read = std::min(out.size(), data_.size());
	std::copy_n(data_.begin(), read, out.begin());
	data_.erase(data_.begin(), data_.begin() + read);
	return {};
}

scp_error byte_pipe::write(const_span s) {
	std::lock_guard l{mutex_};
	if(aborted_ || write_closed_) {
		return scp_error{scp_transport_error, "pipe closed"};
	}
	data_.insert(data_.end(), s.begin(), s.end());
	cond_.notify_all();
	return {};
}

void byte_pipe::close_write() {
	std::lock_guard l{mutex_};
	write_closed_ = true;
	cond_.notify_all();
}

void byte_pipe::abort() {
	std::lock_guard l{mutex_};
	aborted_ = true;
	cond_.notify_all();
}

bool parse_scp_command(std::string_view command, std::string& flags, std::string& path) {
	auto first = command.find(' ');
	if(first == std::string_view::npos) {
		return false;
	}
	auto second = command.find(' ', first + 1);
	if(second == std::string_view::npos) {
		return false;
	}
	flags = command.substr(first + 1, second - first - 1);
	if(flags.size() < 2 || flags[0] != '-') {
		return false;
	}

	// undo shell quoting
	path.clear();
	bool quoted = false;
	for(std::size_t i = second + 1; i != command.size(); ++i) {
		char c = command[i];
		if(c == '\'') {
			quoted = !quoted;
		} else if(c == '\\' && !quoted && i + 1 != command.size()) {
			path += command[++i];
		} else {
			path += c;
		}
	}
	return !quoted;
}

namespace {

struct remote_failure : std::runtime_error {
	using std::runtime_error::runtime_error;
};

std::string octal(std::uint32_t mode) {
	std::ostringstream out;
	out << std::oct << std::setw(4) << std::setfill('0') << (mode & 07777);
	return out.str();
}

/// the remote end of scp, reports failures with remote_failure
class remote_scp {
public:
	remote_scp(fake_remote_options const& opts, bool preserve, bool recursive, bool target_dir, in_stream& in, out_stream& out)
	: opts_(opts)
	, preserve_(preserve)
	, recursive_(recursive)
	, target_dir_(target_dir)
	, reader_(in, 4096)
	, out_(out)
	{}

	void source(std::string const& path);
	void sink(std::string const& target);

	void set_hang_callback(std::function<void()> f) { on_hang_ = std::move(f); }

private:
	void send(std::string_view s) {
		if(out_.write(s)) {
			throw remote_failure("write failed");
		}
	}

	void read_ack() {
		std::byte b{};
		bool eof{};
		if(reader_.read_byte(b, eof) || eof) {
			throw remote_failure("failed to read ack");
		}
		if(b == std::byte{0}) {
			return;
		}
		std::string line;
		if(reader_.read_line(line, 1024)) {
			throw remote_failure("failed to read ack message");
		}
		if(b != std::byte{1}) {
			throw remote_failure("client sent error: " + line);
		}
	}

	void fail(std::string const& message) {
		send("\x02" + message + "\n");
		throw remote_failure(message);
	}

	void check_hang(std::string const& name) {
		if(name == opts_.hang_on) {
			on_hang_();
			throw remote_failure("closed while hanging");
		}
	}

	void send_entry(std::string const& path);
	void receive_file(std::string const& line, std::string const& dest_dir, std::string const& target, std::optional<time_header> const&);

private:
	fake_remote_options const& opts_;
	bool preserve_;
	bool recursive_;
	bool target_dir_;
	stream_reader reader_;
	out_stream& out_;
	std::function<void()> on_hang_;
};

void remote_scp::send_entry(std::string const& path) {
	file_info info;
	fs::file_type type{};
	if(fs::stat(path, info, &type)) {
		send("\x01scp: " + path + ": No such file or directory\n");
		return;
	}

	if(info.name == opts_.fatal_on) {
		fail("scp: " + path + ": injected fatal error");
	}
	if(info.name == opts_.warning_on) {
		send("\x01scp: " + path + ": injected warning\n");
	}
	check_hang(info.name);

	if(preserve_) {
		send("T" + std::to_string(info.mtime) + " 0 " + std::to_string(info.atime) + " 0\n");
		read_ack();
	}

	if(type == fs::file_type::directory) {
		send("D" + octal(info.mode) + " 0 " + info.name + "\n");
		read_ack();
		std::vector<std::string> names;
		if(fs::list_dir(path, names)) {
			throw remote_failure("cannot list " + path);
		}
		for(auto& n : names) {
			send_entry(path + "/" + n);
		}
		send("E\n");
		read_ack();
	} else {
		send("C" + octal(info.mode) + " " + std::to_string(info.size) + " " + info.name + "\n");
		read_ack();
		send(read_file(path));
		send(std::string(1, '\0'));
		read_ack();
	}
}

void remote_scp::source(std::string const& path) {
	read_ack();

	file_info info;
	fs::file_type type{};
	if(fs::stat(path, info, &type)) {
		send("\x01scp: " + path + ": No such file or directory\n");
		throw remote_failure("no such file");
	}
	if(type == fs::file_type::directory && !recursive_) {
		send("\x01scp: " + path + ": not a regular file\n");
		throw remote_failure("not a regular file");
	}
	send_entry(path);
}

void remote_scp::receive_file(std::string const& line, std::string const& dest_dir, std::string const& target, std::optional<time_header> const& time) {
	std::istringstream in(line.substr(1));
	std::uint32_t mode{};
	std::uint64_t size{};
	std::string name;
	if(!(in >> std::oct >> mode >> std::dec >> size) || in.get() != ' ' || !std::getline(in, name)) {
		fail("scp: protocol error: bad file header");
	}
	if(name == opts_.fatal_on) {
		fail("scp: " + name + ": injected fatal error");
	}
	check_hang(name);
	send(std::string(1, '\0'));

	std::string content(size, '\0');
	for(std::size_t done = 0; done < size;) {
		std::size_t n{};
		if(reader_.read_some(span((std::byte*)content.data() + done, size - done), n) || !n) {
			throw remote_failure("failed to read file body");
		}
		done += n;
	}
	read_ack();

	std::string dest = dest_dir.empty() ? target : dest_dir + "/" + name;
	write_file(dest, content, mode);
	if(time) {
		set_times(dest, time->mtime, time->atime);
	}

	if(name == opts_.warning_on) {
		send("\x01scp: " + name + ": injected warning\n");
	} else {
		send(std::string(1, '\0'));
	}
}

void remote_scp::sink(std::string const& target) {
	struct dir_frame {
		std::string path;
		std::uint32_t mode;
		std::optional<time_header> time;
	};

	std::optional<file_info> existing;
	if(fs::lookup(target, existing)) {
		fail("scp: " + target + ": cannot stat");
	}
	bool target_is_dir = existing && existing->is_dir();
	if(target_dir_ && !target_is_dir) {
		fail("scp: " + target + ": Not a directory");
	}

	send(std::string(1, '\0'));

	std::vector<dir_frame> dirs;
	std::optional<time_header> pending;

	auto current_dir = [&]() -> std::string {
		if(!dirs.empty()) {
			return dirs.back().path;
		}
		return target_is_dir ? target : std::string();
	};

	for(;;) {
		std::byte b{};
		bool eof{};
		if(reader_.read_byte(b, eof)) {
			throw remote_failure("failed to read header");
		}
		if(eof) {
			if(!dirs.empty()) {
				throw remote_failure("unterminated directory");
			}
			return;
		}
		std::string line;
		if(reader_.read_line(line, 64*1024)) {
			throw remote_failure("failed to read header line");
		}
		line.insert(line.begin(), char(b));

		if(line[0] == 'T') {
			time_header t;
			std::istringstream in(line.substr(1));
			long long frac1{}, frac2{};
			if(!(in >> t.mtime >> frac1 >> t.atime >> frac2)) {
				fail("scp: protocol error: bad time header");
			}
			pending = t;
			send(std::string(1, '\0'));
		} else if(line[0] == 'C') {
			receive_file(line, current_dir(), target, pending);
			pending.reset();
		} else if(line[0] == 'D') {
			if(!recursive_) {
				fail("scp: received directory without -r");
			}
			std::istringstream in(line.substr(1));
			std::uint32_t mode{};
			std::uint64_t zero{};
			std::string name;
			if(!(in >> std::oct >> mode >> std::dec >> zero) || in.get() != ' ' || !std::getline(in, name)) {
				fail("scp: protocol error: bad directory header");
			}
			check_hang(name);
			std::string dir = current_dir();
			std::string path = dir.empty() ? target : dir + "/" + name;
			if(!exists(path)) {
				make_dir(path, 0700);
			}
			dirs.push_back(dir_frame{path, mode, pending});
			pending.reset();
			send(std::string(1, '\0'));
		} else if(line[0] == 'E') {
			if(dirs.empty()) {
				fail("scp: protocol error: unexpected end of directory");
			}
			auto f = dirs.back();
			dirs.pop_back();
			set_mode(f.path, f.mode);
			if(f.time) {
				set_times(f.path, f.time->mtime, f.time->atime);
			}
			send(std::string(1, '\0'));
		} else {
			fail("scp: protocol error: unexpected header");
		}
	}
}

}

fake_channel_factory::fake_channel_factory(logger& log, fake_remote_options opts)
: log_(log)
, options_(std::move(opts))
{
}

scp_error fake_channel_factory::open_channel(std::unique_ptr<command_channel>& out) {
	if(options_.fail_open) {
		return scp_error{scp_transport_error, "injected open failure"};
	}
	++opened_;
	out = std::make_unique<fake_channel>(*this);
	return {};
}

std::vector<std::string> fake_channel_factory::commands() const {
	std::lock_guard l{mutex_};
	return commands_;
}

fake_channel::fake_channel(fake_channel_factory& f)
: factory_(f)
{
}

fake_channel::~fake_channel() {
	close();
	if(thread_.joinable()) {
		thread_.join();
	}
}

scp_error fake_channel::start(std::string const& command) {
	{
		std::lock_guard l{factory_.mutex_};
		factory_.commands_.push_back(command);
	}
	std::string flags, path;
	if(!parse_scp_command(command, flags, path)) {
		return scp_error{scp_transport_error, "fake remote does not understand '" + command + "'"};
	}
	thread_ = std::thread([this, command] { run(command); });
	return {};
}

void fake_channel::hang() {
	factory_.hanging_ = true;
	std::unique_lock l{mutex_};
	cond_.wait(l, [&] { return closed_; });
}

void fake_channel::run(std::string command) {
	std::string flags, path;
	parse_scp_command(command, flags, path);

	bool preserve = flags.find('p') != std::string::npos;
	bool recursive = flags.find('r') != std::string::npos;
	bool target_dir = flags.find('d') != std::string::npos;

	remote_scp remote(factory_.options(), preserve, recursive, target_dir, from_client_, to_client_);
	remote.set_hang_callback([this] { hang(); });

	int status = 0;
	std::string error;
	try {
		if(flags[1] == 'f') {
			remote.source(path);
		} else if(flags[1] == 't') {
			remote.sink(path);
		} else {
			throw remote_failure("unknown mode " + flags);
		}
	} catch(std::exception const& e) {
		status = 1;
		error = e.what();
		factory_.log().log(logger::debug, "fake remote failed: {}", error);
	}

	to_client_.close_write();

	std::lock_guard l{mutex_};
	exit_status_ = status;
	error_text_ = error;
	cond_.notify_all();
}

scp_error fake_channel::close_input() {
	from_client_.close_write();
	return {};
}

scp_error fake_channel::wait() {
	if(thread_.joinable()) {
		thread_.join();
	}
	std::lock_guard l{mutex_};
	if(closed_) {
		return scp_error{scp_transport_error, "channel closed"};
	}
	if(exit_status_ != 0) {
		return scp_error{scp_transport_error, simple_format("remote exited with status {}: {}", exit_status_, error_text_)};
	}
	return {};
}

void fake_channel::close() {
	{
		std::lock_guard l{mutex_};
		if(closed_) {
			return;
		}
		closed_ = true;
		cond_.notify_all();
	}
	++factory_.closed_;
	from_client_.abort();
	to_client_.abort();
}

}
