#include "logger.hpp"

#include <ostream>
#include <utility>
#include <stdio.h>

namespace securepath::scp {

std::string_view to_string(logger::type t) {
	switch(t) {
		case logger::error:       return "error";
		case logger::warning:     return "warning";
		case logger::info:        return "info";
		case logger::debug:       return "debug";
		case logger::debug_trace: return "trace";
		default: break;
	}
	return "log";
}

void stdout_logger::do_log_line(logger::type, std::string const& s, std::source_location&&) {
	std::puts(s.c_str());
}

stream_logger::stream_logger(std::ostream& out, type t)
: logger(t)
, out_(out)
{
}

void stream_logger::do_log_line(logger::type t, std::string const& s, std::source_location&&) {
	std::lock_guard l{mutex_};
	out_ << to_string(t) << ": " << s << std::endl;
}

session_logger::session_logger(logger& l, std::string tag)
: log_(l)
, tag_(std::move(tag))
{}

void session_logger::do_log_line(logger::type t, std::string const& s, std::source_location&& loc) {
	log_.log_line(t, tag_ + s, std::move(loc));
}

}
