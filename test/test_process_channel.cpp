#include "log.hpp"
#include "util/fs_util.hpp"
#include "scp/client/scp_client.hpp"
#include "scp/process/process_channel.hpp"

#include <catch2/catch.hpp>

#include <chrono>
#include <thread>

namespace securepath::scp::test {

namespace {

std::unique_ptr<command_channel> open_shell() {
	process_channel_factory factory(test_log(), {"/bin/sh", "-c"});
	std::unique_ptr<command_channel> ch;
	REQUIRE(!factory.open_channel(ch));
	REQUIRE(ch);
	return ch;
}

scp_error read_all(in_stream& in, std::string& out) {
	out.clear();
	for(;;) {
		std::byte buf[256];
		std::size_t n{};
		auto err = in.read_some(buf, n);
		if(err || !n) {
			return err;
		}
		out.append((char const*)buf, n);
	}
}

}

TEST_CASE("process channel output", "[process]") {
	auto ch = open_shell();
	REQUIRE(!ch->start("printf 'hello\\nworld'"));

	std::string out;
	REQUIRE(!read_all(ch->output(), out));
	CHECK(out == "hello\nworld");
	CHECK(!ch->wait());
}

TEST_CASE("process channel input", "[process]") {
	auto ch = open_shell();
	REQUIRE(!ch->start("cat"));

	std::string const data(200000, 'c');
	// larger than pipe buffer, read concurrently
	std::string out;
	scp_error read_err;
	std::thread reader([&] { read_err = read_all(ch->output(), out); });

	REQUIRE(!ch->input().write(data));
	REQUIRE(!ch->close_input());
	reader.join();

	CHECK(!read_err);
	CHECK(out == data);
	CHECK(!ch->wait());

	// writing after the input is closed fails
	CHECK(ch->input().write("x").code() == scp_transport_error);
}

TEST_CASE("process channel exit status", "[process]") {
	auto ch = open_shell();
	REQUIRE(!ch->start("echo oops >&2; exit 3"));
	auto err = ch->wait();
	CHECK(err.code() == scp_transport_error);
	CHECK(err.message() == "command exited with status 3: oops");
}

TEST_CASE("process channel exec failure", "[process]") {
	process_channel_factory factory(test_log(), {"/nonexistent/program"});
	std::unique_ptr<command_channel> ch;
	REQUIRE(!factory.open_channel(ch));
	REQUIRE(!ch->start("x"));
	auto err = ch->wait();
	CHECK(err.code() == scp_transport_error);
	CHECK(err.message().find("status 127") != std::string::npos);
	CHECK(err.message().find("exec failed") != std::string::npos);
}

TEST_CASE("process channel close unblocks", "[process]") {
	auto ch = open_shell();
	REQUIRE(!ch->start("exec sleep 30"));

	std::string out;
	scp_error read_err;
	std::thread reader([&] { read_err = read_all(ch->output(), out); });

	std::this_thread::sleep_for(std::chrono::milliseconds(50));
	ch->close();
	ch->close();
	reader.join();

	CHECK(read_err.code() == scp_transport_error);
	CHECK(ch->wait().message() == "channel closed");
	std::size_t n{};
	CHECK(ch->output().read_some(span(), n).code() == scp_transport_error);
}

TEST_CASE("ssh argv prefix", "[unit]") {
	CHECK(ssh_argv_prefix("ssh", "host", "", "") == std::vector<std::string>{"ssh", "-x", "host"});
	CHECK(ssh_argv_prefix("/usr/bin/ssh", "h", "2222", "me") == std::vector<std::string>{"/usr/bin/ssh", "-x", "-p", "2222", "-l", "me", "h"});
}

// needs scp installed on this machine
TEST_CASE("system scp", "[.integration]") {
	temp_dir dir;
	process_channel_factory factory(test_log(), {"/bin/sh", "-c"});
	scp_client client(factory, test_log());

	auto expected = make_sample_tree(dir / "src");
	REQUIRE(!client.send_dir(dir / "src", dir / "remote"));
	REQUIRE(!client.receive_dir(dir / "remote", dir / "dest"));
	CHECK(snapshot(dir / "dest") == expected);

	write_file(dir / "single", "single file", 0640);
	REQUIRE(!client.send_file(dir / "single", dir / "single_remote"));
	REQUIRE(!client.receive_file(dir / "single_remote", dir / "single_back"));
	CHECK(read_file(dir / "single_back") == "single file");
}

}
