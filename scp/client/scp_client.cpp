#include "scp_client.hpp"
#include "directory_receiver.hpp"
#include "directory_sender.hpp"
#include "scp/common/util.hpp"
#include "scp/fs/local_fs.hpp"

namespace securepath::scp {

scp_client::scp_client(channel_factory& factory, logger& log, scp_config config)
: factory_(factory)
, log_(log)
, config_(std::move(config))
{
	SPSCP_ASSERT(config_.valid(), "invalid scp configuration");
}

scp_error scp_client::run_source(std::string const& remote_path, bool recursive, std::stop_token stop, source_handler const& h) {
	scp_session session(log_, factory_, config_, session_options{transfer_direction::from_remote, remote_path, recursive, false});
	return session.run(std::move(stop), [&](scp_session& s) {
		remote_source source(s.log(), config_, s.remote_out(), s.remote_in(), observer_);
		auto err = source.start();
		if(!err) {
			err = h(source);
		}
		return err;
	});
}

scp_error scp_client::run_sink(std::string const& remote_path, bool recursive, std::stop_token stop, sink_handler const& h) {
	scp_session session(log_, factory_, config_, session_options{transfer_direction::to_remote, remote_path, recursive, false});
	return session.run(std::move(stop), [&](scp_session& s) {
		remote_sink sink(s.log(), config_, s.remote_out(), s.remote_in(), observer_);
		auto err = sink.start();
		if(!err) {
			err = h(sink);
		}
		return err;
	});
}

scp_error scp_client::receive_single(remote_source& source, file_header& header, std::optional<time_header>& time) {
	if(config_.preserve) {
		time_header t;
		auto err = source.read_header(t);
		if(err) {
			return err.wrap("failed to read scp message header");
		}
		time = t;
	}
	auto err = source.read_header(header);
	if(err) {
		return err.wrap("failed to read scp message header");
	}
	return {};
}

scp_error scp_client::receive(std::string const& remote_file, out_stream& dest, file_info& info, std::stop_token stop) {
	std::string remote = to_remote_path(remote_file);
	return run_source(remote, false, std::move(stop), [&](remote_source& source) {
		file_header header;
		std::optional<time_header> time;
		auto err = receive_single(source, header, time);
		if(!err) {
			err = source.copy_file_body_to(header, dest);
			if(err) {
				return err.wrap("failed to copy file");
			}
		}
		if(!err) {
			info = file_info{base_name(remote), header.size, header.mode, time ? time->mtime : 0, time ? time->atime : 0};
		}
		return err;
	});
}

scp_error scp_client::receive_file(std::string const& remote_file, std::string const& local_path, std::stop_token stop) {
	std::string remote = to_remote_path(remote_file);
	std::string dest = clean_path(local_path);

	std::optional<file_info> existing;
	auto err = fs::lookup(dest, existing);
	if(err) {
		return err.wrap("failed to get information of destination file");
	}
	if(existing && existing->is_dir()) {
		dest = join_path(dest, base_name(remote));
	}

	return run_source(remote, false, std::move(stop), [&](remote_source& source) {
		file_header header;
		std::optional<time_header> time;
		auto err = receive_single(source, header, time);
		if(err) {
			return err;
		}

		std::unique_ptr<fs::file_out_stream> out;
		err = fs::open_for_write(dest, header.mode, out);
		if(err) {
			return err.wrap("failed to open destination file");
		}
		err = source.copy_file_body_to(header, *out);
		if(err) {
			return err.wrap("failed to copy file");
		}
		err = out->close();
		if(err) {
			return err;
		}
		if(time) {
			return fs::set_mode_and_times(dest, header.mode, time->mtime, time->atime);
		}
		return fs::set_mode(dest, header.mode);
	});
}

scp_error scp_client::receive_dir(std::string const& remote_dir, std::string const& local_dir, accept_function const& accept, std::stop_token stop) {
	std::string remote = to_remote_path(remote_dir);
	std::string dest = clean_path(local_dir);

	std::optional<file_info> existing;
	auto err = fs::lookup(dest, existing);
	if(err) {
		return err.wrap("failed to get information of destination directory");
	}
	if(existing && !existing->is_dir()) {
		return scp_error{scp_local_error, simple_format("destination '{}' is not a directory", dest)};
	}

	bool dest_is_root = !existing;
	if(dest_is_root) {
		err = fs::make_dirs(dest, 0777);
		if(err) {
			return err.wrap("failed to create destination directory");
		}
	}

	return run_source(remote, true, std::move(stop), [&](remote_source& source) {
		directory_receiver receiver(log_, source, accept, dest, dest_is_root);
		return receiver.receive();
	});
}

scp_error scp_client::send(file_info info, std::unique_ptr<in_stream> source, std::string const& remote_file, std::stop_token stop) {
	std::string remote = to_remote_path(remote_file);
	if(info.name.empty()) {
		info.name = base_name(remote);
	}
	return run_sink(remote, false, std::move(stop), [&](remote_sink& sink) {
		auto err = sink.write_file(info, std::move(source));
		if(err) {
			return err.wrap("failed to copy file");
		}
		return err;
	});
}

scp_error scp_client::send_file(std::string const& local_file, std::string const& remote_file, std::stop_token stop) {
	std::string path = clean_path(local_file);

	file_info info;
	fs::file_type type{};
	auto err = fs::stat(path, info, &type);
	if(err) {
		return err.wrap("failed to get information of source file");
	}
	if(type != fs::file_type::regular) {
		return scp_error{scp_local_error, simple_format("source '{}' is not a regular file", path)};
	}

	std::unique_ptr<fs::file_in_stream> in;
	err = fs::open_for_read(path, in);
	if(err) {
		return err.wrap("failed to open source file");
	}

	return send(std::move(info), std::move(in), remote_file, std::move(stop));
}

scp_error scp_client::send_dir(std::string const& local_dir, std::string const& remote_dir, accept_function const& accept, std::stop_token stop) {
	std::string path = clean_path(local_dir);

	file_info info;
	fs::file_type type{};
	auto err = fs::stat(path, info, &type);
	if(err) {
		return err.wrap("failed to get information of source directory");
	}
	if(type != fs::file_type::directory) {
		return scp_error{scp_local_error, simple_format("source '{}' is not a directory", path)};
	}

	return run_sink(to_remote_path(remote_dir), true, std::move(stop), [&](remote_sink& sink) {
		directory_sender sender(log_, sink, accept);
		return sender.send(path);
	});
}

}
