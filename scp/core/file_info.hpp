#ifndef SP_SCP_FILE_INFO_HEADER
#define SP_SCP_FILE_INFO_HEADER

#include "scp/common/types.hpp"

namespace securepath::scp {

/// directory flag in file_info::mode (same as S_IFDIR)
std::uint32_t const mode_directory = 0040000;
/// permission bits carried by the protocol (including set-id and sticky bits)
std::uint32_t const mode_permissions = 07777;

/// seconds since Jan 1, 1970 UTC
using unix_time = std::int64_t;

/** \brief Describes one file or directory that is transferred
 *
 */
struct file_info {
	/// base name without any path separators
	std::string name;
	/// size in bytes, zero for directories
	std::uint64_t size{};
	/// permission bits and mode_directory for directories
	std::uint32_t mode{};
	/// modification time
	unix_time mtime{};
	/// access time
	unix_time atime{};

	bool is_dir() const {
		return (mode & mode_directory) != 0;
	}

	std::uint32_t permissions() const {
		return mode & mode_permissions;
	}
};

std::string to_string(file_info const&);

}

#endif
