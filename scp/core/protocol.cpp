#include "protocol.hpp"

#include "scp/common/logger.hpp"

#include <iomanip>
#include <sstream>

namespace securepath::scp {

std::string_view to_string(message_kind k) {
	using enum message_kind;
	switch(k) {
		case time:            return "time header";
		case file:            return "file header";
		case start_directory: return "start directory header";
		case end_directory:   return "end directory header";
		case reply:           return "reply";
	}
	return "unknown";
}

std::string_view to_string(reply_type t) {
	using enum reply_type;
	switch(t) {
		case ok:      return "ok";
		case warning: return "warning";
		case fatal:   return "fatal";
	}
	return "unknown";
}

message_kind kind_of(scp_message const& m) {
	struct visitor {
		message_kind operator()(time_header const&) const { return message_kind::time; }
		message_kind operator()(file_header const&) const { return message_kind::file; }
		message_kind operator()(start_directory_header const&) const { return message_kind::start_directory; }
		message_kind operator()(end_directory_header const&) const { return message_kind::end_directory; }
		message_kind operator()(reply_message const&) const { return message_kind::reply; }
	};
	return std::visit(visitor{}, m);
}

static std::string octal_mode(std::uint32_t mode) {
	std::ostringstream out;
	out << std::oct << std::setw(4) << std::setfill('0') << (mode & mode_permissions);
	return out.str();
}

std::string describe(scp_message const& m) {
	struct visitor {
		std::string operator()(time_header const& h) const {
			return simple_format("time header [mtime={}, atime={}]", h.mtime, h.atime);
		}
		std::string operator()(file_header const& h) const {
			return simple_format("file header [mode={}, size={}, name={}]", octal_mode(h.mode), h.size, h.name);
		}
		std::string operator()(start_directory_header const& h) const {
			return simple_format("start directory header [mode={}, name={}]", octal_mode(h.mode), h.name);
		}
		std::string operator()(end_directory_header const&) const {
			return "end directory header";
		}
		std::string operator()(reply_message const& h) const {
			if(h.type == reply_type::ok) {
				return "ok reply";
			}
			return simple_format("{} reply: {}", to_string(h.type), h.text);
		}
	};
	return std::visit(visitor{}, m);
}

std::string to_string(file_info const& i) {
	return simple_format("{} [{}, mode={}, size={}, mtime={}, atime={}]"
		, i.name, i.is_dir() ? "dir" : "file", octal_mode(i.mode), i.size, i.mtime, i.atime);
}

}
