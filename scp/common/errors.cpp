#include "errors.hpp"

#include <cstring>

namespace securepath::scp {

std::string_view to_string(scp_error_code c) {
	switch(c) {
		case scp_noerror:          return "no error";
		case scp_transport_error:  return "transport error";
		case scp_protocol_error:   return "protocol error";
		case scp_remote_error:     return "remote error";
		case scp_local_error:      return "local error";
		case scp_filter_error:     return "filter error";
		case scp_invalid_argument: return "invalid argument";
		case scp_cancelled:        return "cancelled";
	}
	return "unknown error";
}

scp_error scp_error::wrap(std::string_view context) const {
	if(!*this) {
		return *this;
	}
	std::string m(context);
	m += ": ";
	m += message_;
	return scp_error{code_, std::move(m)};
}

scp_error scp_error::with_code(scp_error_code code) const {
	return scp_error{code, message_};
}

std::string to_string(scp_error const& e) {
	if(!e) {
		return std::string(to_string(scp_noerror));
	}
	return std::string(to_string(e.code())) + ": " + e.message();
}

scp_error system_error(scp_error_code code, std::string_view op, std::string_view path, int err) {
	std::string m(op);
	if(!path.empty()) {
		m += " '";
		m += path;
		m += "'";
	}
	m += ": ";
	m += std::strerror(err);
	return scp_error{code, std::move(m)};
}

}
