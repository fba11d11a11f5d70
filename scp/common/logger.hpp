#ifndef SP_SCP_LOGGER_HEADER
#define SP_SCP_LOGGER_HEADER

#include "types.hpp"

#include <iosfwd>
#include <mutex>
#include <sstream>
#include <source_location>

namespace securepath::scp {

// "{}" placeholders only (no escaping), std::format is not available on all supported compilers
template<typename... Args>
std::string simple_format(std::string_view fmt, Args const&...);

class logger {
public:
	enum type {
		error         = 0x1,
		warning       = 0x2,
		info          = 0x4,
		debug         = 0x8,
		debug_trace   = 0x10,

		log_none = 0,
		log_all = error | warning | info | debug | debug_trace
	};

	logger(type t = log_all)
	: level_(t)
	{}

	virtual ~logger() = default;

	logger(logger const&) = delete;
	logger& operator=(logger const&) = delete;

	struct log_type {
		log_type(logger::type t, std::source_location location = std::source_location::current())
		: type(t)
		, location(std::move(location))
		{}

		logger::type type;
		std::source_location location;
	};

	template<typename... Args>
	void log(log_type t, std::string_view fmt, Args&&... args)
	{
		if(would_log(t.type)) {
			do_log_line(t.type, simple_format(fmt, std::forward<Args>(args)...), std::move(t.location));
		}
	}

	void log_line(type t, std::string const& s, std::source_location&& l = std::source_location::current()) {
		if(would_log(t)) {
			do_log_line(t, s, std::move(l));
		}
	}

	bool would_log(type t) const {
		return t & level_;
	}

	void set_level(type t) {
		level_ = t;
	}

protected:
	virtual void do_log_line(type, std::string const&, std::source_location&&) = 0;

private:
	type level_{log_all};
};

std::string_view to_string(logger::type);

template<typename... Args>
std::string simple_format(std::string_view fmt, Args const&... args) {
	std::ostringstream out;
	std::string_view::size_type pos = 0;

	auto replace = [&](auto&& arg) {
		if(pos != std::string_view::npos) {
			auto f = fmt.find("{}", pos);
			if(f != std::string_view::npos) {
				out << fmt.substr(pos, f-pos);
				out << arg;
				pos = f+2;
			}
		}
	};

	(replace(args), ...);

	if(pos < fmt.size()) {
		out << fmt.substr(pos);
	}

	return out.str();
}

class stdout_logger : public logger {
public:
	using logger::logger;

protected:
	void do_log_line(type, std::string const&, std::source_location&&) override;
};

/// writes "<level>: <line>" to the given stream, can be shared between threads
class stream_logger : public logger {
public:
	stream_logger(std::ostream&, type t = log_all);

protected:
	void do_log_line(type, std::string const&, std::source_location&&) override;

private:
	std::mutex mutex_;
	std::ostream& out_;
};

/// forwards to another logger prefixing every line with a tag
class session_logger : public logger {
public:
	session_logger(logger&, std::string tag);

protected:
	void do_log_line(type, std::string const&, std::source_location&&) override;
private:
	logger& log_;
	std::string tag_;
};

}

#endif
