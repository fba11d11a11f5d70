#ifndef SP_SCP_STREAMS_HEADER
#define SP_SCP_STREAMS_HEADER

#include "errors.hpp"

namespace securepath::scp {

std::size_t const default_buffer_size{32*1024};

/** \brief Blocking input stream
 *
 *  Used for the remote command output and for local file contents.
 */
class in_stream {
public:
	virtual ~in_stream() = default;

	/** \brief Read at most out.size() bytes, blocking until at least one byte is available.
	 *   Sets read to zero at the end of stream (which is not an error).
	 */
	virtual scp_error read_some(span out, std::size_t& read) = 0;
};

/** \brief Blocking output stream
 *
 */
class out_stream {
public:
	virtual ~out_stream() = default;

	/// Write all of the data or fail
	virtual scp_error write(const_span) = 0;

	/// Uses write to write string_view to the stream
	scp_error write(std::string_view s) {
		return write(to_span(s));
	}
};

/// out_stream that throws away everything written to it
class null_out_stream : public out_stream {
public:
	using out_stream::write;

	scp_error write(const_span s) override {
		written += s.size();
		return {};
	}

	std::uint64_t written{};
};

class string_in_stream : public in_stream {
public:
	string_in_stream(std::string s = {}) : data(std::move(s)) {}

	scp_error read_some(span out, std::size_t& read) override;

	std::string data;
	std::size_t pos{};
};

class string_out_stream : public out_stream {
public:
	using out_stream::write;

	scp_error write(const_span s) override {
		data.append(to_string_view(s));
		return {};
	}

	std::string data;
};

/** \brief Buffered reader on top of in_stream
 *
 *  Header lines are read through the buffer and file bodies are passed through it
 *  in pieces of at most the buffer size, so whole files are never held in memory.
 */
class stream_reader {
public:
	stream_reader(in_stream&, std::size_t buffer_size = default_buffer_size);

	/// read single byte, eof is set if the stream ended before any byte was read
	scp_error read_byte(std::byte& out, bool& eof);

	/// read up to and including '\n', the '\n' is not put in the line. Fails if the stream ends or max_size is reached first.
	scp_error read_line(std::string& line, std::size_t max_size);

	/// read whatever is buffered or at most out.size() from the stream, read is zero at end of stream
	scp_error read_some(span out, std::size_t& read);

	/// bytes currently buffered
	std::size_t buffered() const { return end_ - pos_; }

private:
	scp_error fill(bool& eof);

private:
	in_stream& in_;
	byte_vector buffer_;
	std::size_t pos_{};
	std::size_t end_{};
};

}

#endif
