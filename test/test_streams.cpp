#include "log.hpp"
#include "scp/common/streams.hpp"

#include <catch2/catch.hpp>

#include <algorithm>
#include <cstring>

namespace securepath::scp::test {

using namespace std::literals;

namespace {

// returns the data in chunks of given size to exercise buffer refills
struct chunked_in_stream : in_stream {
	chunked_in_stream(std::string d, std::size_t chunk) : data(std::move(d)), chunk(chunk) {}

	scp_error read_some(span out, std::size_t& read) override {
		read = std::min({out.size(), chunk, data.size() - pos});
		std::memcpy(out.data(), data.data() + pos, read);
		pos += read;
		++calls;
		return {};
	}

	std::string data;
	std::size_t chunk;
	std::size_t pos{};
	std::size_t calls{};
};

struct failing_in_stream : in_stream {
	scp_error read_some(span, std::size_t& read) override {
		read = 0;
		return scp_error{scp_transport_error, "broken"};
	}
};

}

TEST_CASE("stream_reader read_line", "[unit]") {
	chunked_in_stream in("first line\nsecond\n\nlast", 3);
	stream_reader r(in, 4);

	std::string line;
	REQUIRE(!r.read_line(line, 100));
	CHECK(line == "first line");
	REQUIRE(!r.read_line(line, 100));
	CHECK(line == "second");
	REQUIRE(!r.read_line(line, 100));
	CHECK(line == "");

	// no new line before end of stream
	auto err = r.read_line(line, 100);
	CHECK(err.code() == scp_transport_error);
}

TEST_CASE("stream_reader line limit", "[unit]") {
	string_in_stream in("0123456789\n");
	stream_reader r(in, 64);
	std::string line;
	CHECK(r.read_line(line, 5).code() == scp_protocol_error);

	string_in_stream in2("01234\n");
	stream_reader r2(in2, 64);
	CHECK(!r2.read_line(line, 5));
	CHECK(line == "01234");
}

TEST_CASE("stream_reader mixed reads", "[unit]") {
	chunked_in_stream in("C0644 5 x\nhello\x00rest"s, 7);
	stream_reader r(in, 8);

	std::string line;
	REQUIRE(!r.read_line(line, 100));
	CHECK(line == "C0644 5 x");

	std::string body;
	while(body.size() < 5) {
		std::byte buf[16];
		std::size_t n{};
		REQUIRE(!r.read_some(span(buf, 5 - body.size()), n));
		REQUIRE(n > 0);
		body.append((char const*)buf, n);
	}
	CHECK(body == "hello");

	std::byte b{};
	bool eof{};
	REQUIRE(!r.read_byte(b, eof));
	CHECK(!eof);
	CHECK(b == std::byte{0});

	std::string rest;
	for(;;) {
		REQUIRE(!r.read_byte(b, eof));
		if(eof) {
			break;
		}
		rest += char(b);
	}
	CHECK(rest == "rest");
}

TEST_CASE("stream_reader large read bypasses buffer", "[unit]") {
	chunked_in_stream in(std::string(100, 'x'), 100);
	stream_reader r(in, 8);
	byte_vector out(64);
	std::size_t n{};
	REQUIRE(!r.read_some(out, n));
	CHECK(n == 64);
	CHECK(r.buffered() == 0);
}

TEST_CASE("stream_reader passes errors", "[unit]") {
	failing_in_stream in;
	stream_reader r(in);
	std::byte b{};
	bool eof{};
	CHECK(r.read_byte(b, eof).code() == scp_transport_error);
	std::string line;
	CHECK(r.read_line(line, 10).message() == "broken");
}

TEST_CASE("memory streams", "[unit]") {
	string_out_stream out;
	REQUIRE(!out.write("abc"));
	REQUIRE(!out.write(std::string_view("def")));
	CHECK(out.data == "abcdef");

	null_out_stream null;
	REQUIRE(!null.write("12345"));
	CHECK(null.written == 5);

	string_in_stream in("xy");
	std::byte buf[4];
	std::size_t n{};
	REQUIRE(!in.read_some(buf, n));
	CHECK(n == 2);
	REQUIRE(!in.read_some(buf, n));
	CHECK(n == 0);
}

}
