#include "protocol_codec.hpp"

#include "scp/common/logger.hpp"

#include <charconv>
#include <iomanip>
#include <sstream>

namespace securepath::scp {

// longest accepted mode, "07777" plus possible extra leading zero
std::size_t const max_mode_digits = 6;
// the fraction of second is in microseconds
std::int64_t const max_time_fraction = 999999;

std::string encode(time_header const& h) {
	// sub-second part is not kept
	return simple_format("{}{} 0 {} 0\n", time_message, h.mtime, h.atime);
}

static void write_mode(std::ostream& out, std::uint32_t mode) {
	out << std::oct << std::setw(4) << std::setfill('0') << (mode & mode_permissions) << std::dec;
}

std::string encode(file_header const& h) {
	std::ostringstream out;
	out << file_message;
	write_mode(out, h.mode);
	out << ' ' << h.size << ' ' << h.name << '\n';
	return out.str();
}

std::string encode(start_directory_header const& h) {
	std::ostringstream out;
	out << start_directory_message;
	write_mode(out, h.mode);
	out << " 0 " << h.name << '\n';
	return out.str();
}

std::string encode(end_directory_header const&) {
	return std::string{end_directory_message, '\n'};
}

std::string encode(reply_message const& r) {
	switch(r.type) {
		case reply_type::ok:      return std::string(1, '\0');
		case reply_type::warning: return '\x01' + r.text + '\n';
		case reply_type::fatal:   return '\x02' + r.text + '\n';
	}
	return std::string(1, '\0');
}

std::string encode(scp_message const& m) {
	return std::visit([](auto const& h) { return encode(h); }, m);
}

bool is_valid_file_name(std::string_view name) {
	return !name.empty()
		&& name != "."
		&& name != ".."
		&& name.find_first_of(std::string_view("/\n\0", 3)) == std::string_view::npos;
}

namespace {

// simple cursor over header line
struct line_parser {
	std::string_view rest;

	template<typename T>
	bool number(T& v, int base = 10) {
		auto [p, ec] = std::from_chars(rest.data(), rest.data() + rest.size(), v, base);
		if(ec != std::errc{} || p == rest.data()) {
			return false;
		}
		rest.remove_prefix(p - rest.data());
		return true;
	}

	bool mode(std::uint32_t& m) {
		std::size_t digits = 0;
		while(digits < rest.size() && rest[digits] >= '0' && rest[digits] <= '7') {
			++digits;
		}
		if(digits == 0 || digits > max_mode_digits) {
			return false;
		}
		return number(m, 8) && m <= mode_permissions;
	}

	bool space() {
		if(rest.empty() || rest.front() != ' ') {
			return false;
		}
		rest.remove_prefix(1);
		return true;
	}
};

std::string hex_byte(std::byte b) {
	std::ostringstream out;
	out << "0x" << std::hex << std::setw(2) << std::setfill('0') << std::to_integer<int>(b);
	return out.str();
}

scp_error bad_header(std::string_view what, std::string_view line) {
	return scp_error{scp_protocol_error, simple_format("invalid {}: '{}'", what, line)};
}

scp_error decode_time(std::string_view line, scp_message& out) {
	line_parser p{line.substr(1)};
	time_header h;
	std::int64_t mtime_frac{}, atime_frac{};
	bool res = p.number(h.mtime) && p.space() && p.number(mtime_frac) && p.space()
		&& p.number(h.atime) && p.space() && p.number(atime_frac) && p.rest.empty();

	if(!res || mtime_frac < 0 || mtime_frac > max_time_fraction || atime_frac < 0 || atime_frac > max_time_fraction) {
		return bad_header(to_string(message_kind::time), line);
	}
	out = h;
	return {};
}

scp_error decode_file(std::string_view line, scp_message& out) {
	line_parser p{line.substr(1)};
	file_header h;
	if(!(p.mode(h.mode) && p.space() && p.number(h.size) && p.space())) {
		return bad_header(to_string(message_kind::file), line);
	}
	if(!is_valid_file_name(p.rest)) {
		return scp_error{scp_protocol_error, simple_format("invalid file name in file header: '{}'", p.rest)};
	}
	h.name = p.rest;
	out = std::move(h);
	return {};
}

scp_error decode_start_directory(std::string_view line, scp_message& out) {
	line_parser p{line.substr(1)};
	start_directory_header h;
	std::uint64_t size{};
	if(!(p.mode(h.mode) && p.space() && p.number(size) && p.space())) {
		return bad_header(to_string(message_kind::start_directory), line);
	}
	if(!is_valid_file_name(p.rest)) {
		return scp_error{scp_protocol_error, simple_format("invalid directory name in directory header: '{}'", p.rest)};
	}
	h.name = p.rest;
	out = std::move(h);
	return {};
}

}

scp_error decode_header(std::string_view line, scp_message& out) {
	if(line.empty()) {
		return scp_error{scp_protocol_error, "empty header"};
	}
	switch(line.front()) {
		case time_message:            return decode_time(line, out);
		case file_message:            return decode_file(line, out);
		case start_directory_message: return decode_start_directory(line, out);
		case end_directory_message:
			if(line.size() != 1) {
				return bad_header(to_string(message_kind::end_directory), line);
			}
			out = end_directory_header{};
			return {};
		default: break;
	}
	return scp_error{scp_protocol_error, simple_format("unexpected message type {}", hex_byte(std::byte(line.front())))};
}

static scp_error read_reply_text(stream_reader& reader, std::size_t max_line, std::string& text) {
	auto err = reader.read_line(text, max_line);
	if(err) {
		return err.wrap("failed to read reply message");
	}
	return {};
}

scp_error read_message(stream_reader& reader, std::size_t max_line, std::optional<scp_message>& out) {
	out.reset();

	std::byte b{};
	bool eof{};
	auto err = reader.read_byte(b, eof);
	if(err || eof) {
		return err;
	}

	if(b == reply_ok) {
		out = reply_message{};
		return {};
	}

	if(b == reply_warning || b == reply_fatal) {
		std::string text;
		err = read_reply_text(reader, max_line, text);
		if(err) {
			return err;
		}
		if(b == reply_fatal) {
			return scp_error{scp_remote_error, text};
		}
		out = reply_message{reply_type::warning, std::move(text)};
		return {};
	}

	char type = char(b);
	if(type != time_message && type != file_message && type != start_directory_message && type != end_directory_message) {
		return scp_error{scp_protocol_error, simple_format("unexpected message type {}", hex_byte(b))};
	}

	std::string line;
	err = reader.read_line(line, max_line);
	if(err) {
		return err.wrap("failed to read message header");
	}
	line.insert(line.begin(), type);

	scp_message m;
	err = decode_header(line, m);
	if(!err) {
		out = std::move(m);
	}
	return err;
}

scp_error read_reply(stream_reader& reader, std::size_t max_line, reply_message& out) {
	std::byte b{};
	bool eof{};
	auto err = reader.read_byte(b, eof);
	if(err) {
		return err.wrap("failed to read reply");
	}
	if(eof) {
		return scp_error{scp_transport_error, "unexpected end of stream while waiting for reply"};
	}

	if(b == reply_ok) {
		out = reply_message{};
		return {};
	}

	if(b == reply_warning || b == reply_fatal) {
		std::string text;
		err = read_reply_text(reader, max_line, text);
		if(err) {
			return err;
		}
		if(b == reply_fatal) {
			return scp_error{scp_remote_error, text};
		}
		out = reply_message{reply_type::warning, std::move(text)};
		return {};
	}

	return scp_error{scp_protocol_error, simple_format("unexpected reply byte {}", hex_byte(b))};
}

}
