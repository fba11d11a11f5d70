#include "util.hpp"

#include <algorithm>
#include <vector>

namespace securepath::scp {

std::string escape_shell_arg(std::string_view arg) {
	std::string res;
	res.reserve(arg.size() + 2);
	res += '\'';
	for(auto c : arg) {
		if(c == '\'') {
			res += "'\\''";
		} else {
			res += c;
		}
	}
	res += '\'';
	return res;
}

std::string clean_path(std::string_view path) {
	if(path.empty()) {
		return ".";
	}

	bool const rooted = path.front() == '/';
	std::vector<std::string_view> elems;

	std::string_view::size_type start = 0;
	while(start <= path.size()) {
		auto end = path.find('/', start);
		if(end == std::string_view::npos) {
			end = path.size();
		}
		std::string_view e = path.substr(start, end - start);
		if(e.empty() || e == ".") {
			// skip
		} else if(e == "..") {
			if(!elems.empty() && elems.back() != "..") {
				elems.pop_back();
			} else if(!rooted) {
				elems.push_back(e);
			}
		} else {
			elems.push_back(e);
		}
		start = end + 1;
	}

	std::string res;
	if(rooted) {
		res += '/';
	}
	bool first = true;
	for(auto&& e : elems) {
		if(!first) {
			res += '/';
		}
		first = false;
		res += e;
	}
	if(res.empty()) {
		res = ".";
	}
	return res;
}

std::string to_remote_path(std::string_view path) {
	std::string p(path);
	std::replace(p.begin(), p.end(), '\\', '/');
	return clean_path(p);
}

std::string base_name(std::string_view path) {
	std::string p = clean_path(path);
	if(p == "/") {
		return p;
	}
	auto pos = p.rfind('/');
	if(pos == std::string::npos) {
		return p;
	}
	return p.substr(pos + 1);
}

std::string dir_name(std::string_view path) {
	std::string p = clean_path(path);
	auto pos = p.rfind('/');
	if(pos == std::string::npos) {
		return ".";
	}
	if(pos == 0) {
		return "/";
	}
	return p.substr(0, pos);
}

std::string join_path(std::string_view a, std::string_view b) {
	if(a.empty()) {
		return std::string(b);
	}
	if(b.empty()) {
		return std::string(a);
	}
	std::string res(a);
	if(res.back() != '/') {
		res += '/';
	}
	res += b.front() == '/' ? b.substr(1) : b;
	return res;
}

}
