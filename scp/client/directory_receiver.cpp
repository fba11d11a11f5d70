#include "directory_receiver.hpp"
#include "scp/common/util.hpp"
#include "scp/fs/local_fs.hpp"

#include <utility>

namespace securepath::scp {

// directories are writable for us until their end marker sets the final mode
std::uint32_t const owner_rwx = 0700;

directory_receiver::directory_receiver(logger& log, remote_source& source, accept_function const& accept, std::string dest, bool dest_is_root)
: log_(log)
, source_(source)
, accept_(accept)
, dest_(std::move(dest))
, first_is_root_(dest_is_root)
{
}

std::string const& directory_receiver::current_dir() const {
	return stack_.empty() ? dest_ : stack_.back().path;
}

bool directory_receiver::skipping() const {
	return !stack_.empty() && stack_.back().skipping;
}

scp_error directory_receiver::receive() {
	for(;;) {
		std::optional<scp_message> m;
		auto err = source_.read_header_or_reply(m);
		if(err) {
			return err.wrap("failed to read scp message header");
		}
		if(!m) {
			break;
		}

		struct visitor {
			directory_receiver& r;
			scp_error operator()(time_header const& h) {
				r.pending_time_ = h;
				return {};
			}
			scp_error operator()(file_header const& h) { return r.on_file(h); }
			scp_error operator()(start_directory_header const& h) { return r.on_start_directory(h); }
			scp_error operator()(end_directory_header const&) { return r.on_end_directory(); }
			scp_error operator()(reply_message const&) {
				// acknowledgements and warnings are handled by the source
				return {};
			}
		};

		err = std::visit(visitor{*this}, *m);
		if(err) {
			return err;
		}
	}

	if(!stack_.empty()) {
		return scp_error{scp_protocol_error, simple_format("stream ended with {} directories open", stack_.size())};
	}
	return {};
}

scp_error directory_receiver::on_start_directory(start_directory_header const& h) {
	auto time = std::exchange(pending_time_, std::nullopt);

	if(first_is_root_) {
		first_is_root_ = false;
		// the destination did not exist, so the first directory becomes it. It is not given to the accept function.
		log_.log(logger::debug, "receiving '{}' as '{}'", h.name, dest_);
		stack_.push_back(frame{dest_, h.mode, time, false});
		return {};
	}

	frame f{join_path(current_dir(), h.name), h.mode, time, skipping()};

	if(!f.skipping) {
		file_info info{h.name, 0, h.mode | mode_directory, time ? time->mtime : 0, time ? time->atime : 0};
		bool accepted{};
		auto err = call_accept(accept_, current_dir(), info, accepted);
		if(err) {
			return err;
		}
		if(accepted) {
			err = fs::make_dirs(f.path, h.mode | owner_rwx);
			if(err) {
				return err.wrap("failed to create directory");
			}
		} else {
			log_.log(logger::debug, "skipping directory '{}'", f.path);
			f.skipping = true;
		}
	}

	stack_.push_back(std::move(f));
	return {};
}

scp_error directory_receiver::on_end_directory() {
	if(stack_.empty()) {
		return scp_error{scp_protocol_error, "end directory without start directory"};
	}

	frame f = std::move(stack_.back());
	stack_.pop_back();

	if(f.skipping) {
		return {};
	}

	scp_error err;
	if(f.time) {
		err = fs::set_mode_and_times(f.path, f.mode, f.time->mtime, f.time->atime);
	} else {
		err = fs::set_mode(f.path, f.mode);
	}
	if(err) {
		return err.wrap("failed to set directory attributes");
	}
	return {};
}

scp_error directory_receiver::write_file(std::string const& path, file_header const& h, std::optional<time_header> const& time) {
	std::unique_ptr<fs::file_out_stream> out;
	auto err = fs::open_for_write(path, h.mode, out);
	if(err) {
		return err.wrap("failed to open destination file");
	}

	err = source_.copy_file_body_to(h, *out);
	if(err) {
		return err.wrap("failed to copy file");
	}

	err = out->close();
	if(!err) {
		if(time) {
			err = fs::set_mode_and_times(path, h.mode, time->mtime, time->atime);
		} else {
			err = fs::set_mode(path, h.mode);
		}
	}
	return err;
}

scp_error directory_receiver::on_file(file_header const& h) {
	auto time = std::exchange(pending_time_, std::nullopt);
	// single file sent instead of directory goes inside the destination
	first_is_root_ = false;

	if(!skipping()) {
		file_info info{h.name, h.size, h.mode, time ? time->mtime : 0, time ? time->atime : 0};
		bool accepted{};
		auto err = call_accept(accept_, current_dir(), info, accepted);
		if(err) {
			return err;
		}
		if(accepted) {
			return write_file(join_path(current_dir(), h.name), h, time);
		}
		log_.log(logger::debug, "skipping file '{}'", join_path(current_dir(), h.name));
	}

	// the body is on the wire anyway
	null_out_stream discard;
	auto err = source_.copy_file_body_to(h, discard);
	if(err) {
		return err.wrap("failed to skip file");
	}
	return {};
}

}
