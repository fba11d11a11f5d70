#include "directory_sender.hpp"
#include "scp/common/util.hpp"
#include "scp/core/protocol_codec.hpp"
#include "scp/fs/local_fs.hpp"

namespace securepath::scp {

directory_sender::directory_sender(logger& log, remote_sink& sink, accept_function const& accept)
: log_(log)
, sink_(sink)
, accept_(accept)
{
}

scp_error directory_sender::send_file(std::string const& path, file_info const& info) {
	std::unique_ptr<fs::file_in_stream> in;
	auto err = fs::open_for_read(path, in);
	if(!err) {
		err = sink_.write_file(info, std::move(in));
	}
	return err;
}

scp_error directory_sender::visit(std::string const& parent, std::string const& path, bool follow_links, bool& descended) {
	descended = false;

	file_info info;
	fs::file_type type{};
	auto err = follow_links ? fs::stat(path, info, &type) : fs::lstat(path, info, &type);
	if(err) {
		return err;
	}

	if(type == fs::file_type::other) {
		log_.log(logger::warning, "skipping '{}', not a regular file or directory", path);
		return {};
	}

	if(!is_valid_file_name(info.name)) {
		if(follow_links) {
			return scp_error{scp_invalid_argument, simple_format("invalid file name '{}'", path)};
		}
		log_.log(logger::warning, "skipping '{}', file name contains a newline or nul", path);
		return {};
	}

	log_.log(logger::debug, "visiting {}", to_string(info));

	bool accepted{};
	err = call_accept(accept_, parent, info, accepted);
	if(err) {
		return err;
	}

	if(!accepted) {
		log_.log(logger::debug, "skipping '{}', not accepted", path);
		return {};
	}

	if(type == fs::file_type::regular) {
		return send_file(path, info);
	}

	frame f{path, {}, 0};
	err = fs::list_dir(path, f.names);
	if(!err) {
		err = sink_.start_directory(info);
	}
	if(!err) {
		stack_.push_back(std::move(f));
		descended = true;
	}
	return err;
}

scp_error directory_sender::send(std::string const& local_path) {
	stack_.clear();

	std::string root = clean_path(local_path);
	bool descended{};
	// the root is followed if it is a symlink, entries below it are not
	auto err = visit(dir_name(root), root, true, descended);

	while(!err && !stack_.empty()) {
		auto& top = stack_.back();
		if(top.next == top.names.size()) {
			stack_.pop_back();
			err = sink_.end_directory();
		} else {
			std::string parent = top.path;
			std::string path = join_path(top.path, top.names[top.next++]);
			// may push new frame and invalidate top
			err = visit(parent, path, false, descended);
		}
	}
	return err;
}

}
