#include "remote_sink.hpp"

#include <algorithm>

namespace securepath::scp {

remote_sink::remote_sink(logger& log, scp_config const& config, in_stream& remote_out, out_stream& remote_in, transfer_observer* observer)
: log_(log)
, config_(config)
, reader_(remote_out, 1024)
, remote_in_(remote_in)
, observer_(observer)
{
}

scp_error remote_sink::wait_reply(std::string_view context) {
	reply_message reply;
	auto err = read_reply(reader_, config_.max_header_line, reply);
	if(err) {
		return err.wrap(context);
	}
	if(reply.type == reply_type::warning) {
		log_.log(logger::warning, "remote: {}", reply.text);
	}
	return {};
}

scp_error remote_sink::start() {
	log_.log(logger::debug_trace, "waiting for initial ok");
	return wait_reply("remote did not accept the transfer");
}

scp_error remote_sink::send_header(scp_message const& m) {
	log_.log(logger::debug_trace, "sending {}", describe(m));
	auto err = remote_in_.write(encode(m));
	if(err) {
		return err.wrap(simple_format("failed to send {}", to_string(kind_of(m))));
	}
	return wait_reply(simple_format("{} not accepted", to_string(kind_of(m))));
}

scp_error remote_sink::send_time(file_info const& info) {
	if(!config_.preserve) {
		return {};
	}
	return send_header(time_header{info.mtime, info.atime});
}

scp_error remote_sink::send_body(file_info const& info, in_stream& source) {
	byte_vector chunk(std::max<std::uint64_t>(1, std::min<std::uint64_t>(config_.copy_buffer_size, info.size)));
	std::uint64_t done = 0;
	while(done < info.size) {
		std::size_t want = std::size_t(std::min<std::uint64_t>(chunk.size(), info.size - done));
		std::size_t n{};
		auto err = source.read_some(span(chunk.data(), want), n);
		if(err) {
			return err.wrap("failed to read source");
		}
		if(!n) {
			return scp_error{scp_invalid_argument
				, simple_format("source ended before the announced size [read={}, size={}]", done, info.size)};
		}
		err = remote_in_.write(const_span(chunk.data(), n));
		if(err) {
			return err.wrap("failed to send file body");
		}
		done += n;
		if(observer_) {
			observer_->on_file_progress(info.name, done, info.size);
		}
	}

	// the source must be exhausted now
	std::byte extra{};
	std::size_t n{};
	auto err = source.read_some(span(&extra, 1), n);
	if(err) {
		return err.wrap("failed to read source");
	}
	if(n) {
		return scp_error{scp_invalid_argument, simple_format("source has more data than the announced size [size={}]", info.size)};
	}

	// trailing ok after the body
	err = remote_in_.write(encode(reply_message{}));
	if(err) {
		return err.wrap("failed to send file body status");
	}
	return wait_reply("file body not accepted");
}

scp_error remote_sink::write_file(file_info const& info, std::unique_ptr<in_stream> source) {
	SPSCP_ASSERT(source, "no source stream");
	SPSCP_ASSERT(!info.is_dir(), "write_file called for directory");

	if(!is_valid_file_name(info.name)) {
		return scp_error{scp_invalid_argument, simple_format("invalid file name '{}'", info.name)};
	}

	log_.log(logger::debug, "sending file [name={}, size={}]", info.name, info.size);

	auto err = send_time(info);
	if(!err) {
		err = send_header(file_header{info.permissions(), info.size, info.name});
	}
	if(err) {
		return err;
	}

	if(observer_) {
		observer_->on_file_begin(info.name, info.size);
	}
	err = send_body(info, *source);
	if(observer_) {
		observer_->on_file_end(info.name, err);
	}
	return err;
}

scp_error remote_sink::start_directory(file_info const& info) {
	SPSCP_ASSERT(info.is_dir(), "start_directory called for file");

	if(!is_valid_file_name(info.name)) {
		return scp_error{scp_invalid_argument, simple_format("invalid directory name '{}'", info.name)};
	}

	log_.log(logger::debug, "start directory [name={}, depth={}]", info.name, depth_);

	auto err = send_time(info);
	if(!err) {
		err = send_header(start_directory_header{info.permissions(), info.name});
	}
	if(!err) {
		++depth_;
	}
	return err;
}

scp_error remote_sink::end_directory() {
	SPSCP_ASSERT(depth_ > 0, "end_directory without start_directory");

	log_.log(logger::debug, "end directory [depth={}]", depth_);

	auto err = send_header(end_directory_header{});
	if(!err) {
		--depth_;
	}
	return err;
}

}
