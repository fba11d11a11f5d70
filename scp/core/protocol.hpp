#ifndef SP_SCP_PROTOCOL_HEADER
#define SP_SCP_PROTOCOL_HEADER

#include "file_info.hpp"

#include <variant>

namespace securepath::scp {

/*
	Legacy scp protocol (rcp), every header is single line starting with the type character:

		T<mtime> <mtime usec> <atime> <atime usec>\n
		C<mode> <size> <name>\n     followed by size bytes of file data and a reply
		D<mode> 0 <name>\n
		E\n

	Every header and file body is answered with reply: 0x00 ok, or 0x01/0x02 followed by message line.
*/

char const time_message = 'T';
char const file_message = 'C';
char const start_directory_message = 'D';
char const end_directory_message = 'E';

std::byte const reply_ok{0x0};
std::byte const reply_warning{0x1};
std::byte const reply_fatal{0x2};

struct time_header {
	unix_time mtime{};
	unix_time atime{};
};

struct file_header {
	std::uint32_t mode{};
	std::uint64_t size{};
	std::string name;
};

struct start_directory_header {
	std::uint32_t mode{};
	std::string name;
};

struct end_directory_header {
};

enum class reply_type {
	ok,
	warning,
	fatal
};

struct reply_message {
	reply_type type{reply_type::ok};
	std::string text;
};

using scp_message = std::variant<time_header, file_header, start_directory_header, end_directory_header, reply_message>;

enum class message_kind {
	time,
	file,
	start_directory,
	end_directory,
	reply
};

std::string_view to_string(message_kind);
std::string_view to_string(reply_type);

message_kind kind_of(scp_message const&);

/// human readable description of the message, used in errors and logging
std::string describe(scp_message const&);

}

#endif
