#ifndef SP_SCP_PROTOCOL_CODEC_HEADER
#define SP_SCP_PROTOCOL_CODEC_HEADER

#include "protocol.hpp"
#include "scp/common/streams.hpp"

#include <optional>

namespace securepath::scp {

std::string encode(time_header const&);
std::string encode(file_header const&);
std::string encode(start_directory_header const&);
std::string encode(end_directory_header const&);
std::string encode(reply_message const&);
std::string encode(scp_message const&);

/// decode header line, the type character is included and the terminating new line is not
scp_error decode_header(std::string_view line, scp_message& out);

/** \brief Read next header or reply from the stream
 *
 *  out is left empty if the stream ended cleanly before the first byte of message.
 *  Warning replies are returned as reply_message, fatal replies as scp_remote_error.
 */
scp_error read_message(stream_reader&, std::size_t max_line, std::optional<scp_message>& out);

/** \brief Read reply, ok and warning are returned in out, fatal reply is returned as scp_remote_error.
 *
 *  End of stream and unknown reply byte are errors.
 */
scp_error read_reply(stream_reader&, std::size_t max_line, reply_message& out);

/// name in file and directory header must be single path element without newline or nul
bool is_valid_file_name(std::string_view);

}

#endif
