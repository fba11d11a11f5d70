#include "remote_source.hpp"

#include <algorithm>

namespace securepath::scp {

remote_source::remote_source(logger& log, scp_config const& config, in_stream& remote_out, out_stream& remote_in, transfer_observer* observer)
: log_(log)
, config_(config)
, reader_(remote_out, config.copy_buffer_size)
, remote_in_(remote_in)
, observer_(observer)
{
}

scp_error remote_source::write_ok() {
	auto err = remote_in_.write(encode(reply_message{}));
	if(err) {
		return err.wrap("failed to send reply");
	}
	return {};
}

scp_error remote_source::start() {
	log_.log(logger::debug_trace, "sending initial ok");
	return write_ok();
}

scp_error remote_source::read_header_or_reply(std::optional<scp_message>& out) {
	auto err = read_message(reader_, config_.max_header_line, out);
	if(err) {
		log_.log(logger::debug, "failed to read message: {}", err.message());
		return err;
	}

	if(!out) {
		log_.log(logger::debug_trace, "end of stream");
		return {};
	}

	log_.log(logger::debug_trace, "received {}", describe(*out));

	if(auto r = std::get_if<reply_message>(&*out)) {
		if(r->type == reply_type::warning) {
			log_.log(logger::warning, "remote: {}", r->text);
		}
		return {};
	}

	// every header is acknowledged
	return write_ok();
}

scp_error remote_source::unexpected(message_kind expected, std::optional<scp_message> const& got) const {
	std::string actual = got ? describe(*got) : std::string("end of stream");
	return scp_error{scp_protocol_error, simple_format("expected {}, got {}", to_string(expected), actual)};
}

scp_error remote_source::copy_file_body_to(file_header const& header, out_stream& dest) {
	log_.log(logger::debug, "receiving file body [name={}, size={}]", header.name, header.size);
	if(observer_) {
		observer_->on_file_begin(header.name, header.size);
	}

	auto finish = [&](scp_error err) {
		if(observer_) {
			observer_->on_file_end(header.name, err);
		}
		return err;
	};

	byte_vector chunk(std::max<std::uint64_t>(1, std::min<std::uint64_t>(config_.copy_buffer_size, header.size)));
	std::uint64_t done = 0;
	while(done < header.size) {
		std::size_t want = std::size_t(std::min<std::uint64_t>(chunk.size(), header.size - done));
		std::size_t n{};
		auto err = reader_.read_some(span(chunk.data(), want), n);
		if(err) {
			return finish(err.wrap("failed to read file body"));
		}
		if(!n) {
			return finish(scp_error{scp_transport_error
				, simple_format("unexpected end of stream in file body [received={}, size={}]", done, header.size)});
		}
		err = dest.write(const_span(chunk.data(), n));
		if(err) {
			return finish(err.wrap("failed to write file body"));
		}
		done += n;
		if(observer_) {
			observer_->on_file_progress(header.name, done, header.size);
		}
	}

	// the remote side tells if the body was sent successfully
	reply_message reply;
	auto err = read_reply(reader_, config_.max_header_line, reply);
	if(err) {
		return finish(err.wrap("failed to read file body status"));
	}
	if(reply.type == reply_type::warning) {
		log_.log(logger::warning, "remote: {}", reply.text);
	}

	return finish(write_ok());
}

}
