#include "streams.hpp"

#include <algorithm>
#include <cstring>

namespace securepath::scp {

scp_error string_in_stream::read_some(span out, std::size_t& read) {
	read = std::min(out.size(), data.size() - pos);
	if(read) {
		std::memcpy(out.data(), data.data() + pos, read);
		pos += read;
	}
	return {};
}

stream_reader::stream_reader(in_stream& in, std::size_t buffer_size)
: in_(in)
{
	SPSCP_ASSERT(buffer_size > 0, "invalid buffer size");
	buffer_.resize(buffer_size);
}

scp_error stream_reader::fill(bool& eof) {
	SPSCP_ASSERT(pos_ == end_, "filling non-empty buffer");
	pos_ = end_ = 0;
	std::size_t n{};
	auto err = in_.read_some(buffer_, n);
	if(!err) {
		end_ = n;
		eof = n == 0;
	}
	return err;
}

scp_error stream_reader::read_byte(std::byte& out, bool& eof) {
	eof = false;
	if(pos_ == end_) {
		auto err = fill(eof);
		if(err || eof) {
			return err;
		}
	}
	out = buffer_[pos_++];
	return {};
}

scp_error stream_reader::read_line(std::string& line, std::size_t max_size) {
	line.clear();
	for(;;) {
		if(pos_ == end_) {
			bool eof{};
			auto err = fill(eof);
			if(err) {
				return err;
			}
			if(eof) {
				return scp_error{scp_transport_error, "unexpected end of stream while reading line"};
			}
		}
		auto begin = buffer_.begin() + pos_;
		auto end = buffer_.begin() + end_;
		auto it = std::find(begin, end, std::byte{'\n'});

		std::size_t count = it - begin;
		if(line.size() + count > max_size) {
			return scp_error{scp_protocol_error, "line too long"};
		}
		line.append((char const*)buffer_.data() + pos_, count);
		pos_ += count;

		if(it != end) {
			// skip the new line
			++pos_;
			return {};
		}
	}
}

scp_error stream_reader::read_some(span out, std::size_t& read) {
	read = 0;
	if(out.empty()) {
		return {};
	}
	if(pos_ == end_) {
		// large reads go directly to the destination
		if(out.size() >= buffer_.size()) {
			return in_.read_some(out, read);
		}
		bool eof{};
		auto err = fill(eof);
		if(err || eof) {
			return err;
		}
	}
	read = std::min(out.size(), end_ - pos_);
	std::memcpy(out.data(), buffer_.data() + pos_, read);
	pos_ += read;
	return {};
}

}
