#include "accept.hpp"

namespace securepath::scp {

scp_error call_accept(accept_function const& f, std::string const& parent_dir, file_info const& info, bool& accept) {
	accept = true;
	if(!f) {
		return {};
	}
	auto err = f(parent_dir, info, accept);
	if(err) {
		return err.with_code(scp_filter_error).wrap("error from accept function");
	}
	return {};
}

}
