#ifndef SP_SCP_FS_LOCAL_FS_HEADER
#define SP_SCP_FS_LOCAL_FS_HEADER

#include "scp/common/streams.hpp"
#include "scp/core/file_info.hpp"

#include <memory>
#include <optional>

namespace securepath::scp::fs {

enum class file_type {
	regular,
	directory,
	other
};

/// stat the path (following symlinks), the name of the result is the base name of the path. out is empty if the path does not exist.
scp_error lookup(std::string const& path, std::optional<file_info>& out);

/// stat the path, not existing is an error
scp_error stat(std::string const& path, file_info& out, file_type* type = nullptr);

/// like stat but does not follow symlinks, a symlink is file_type::other
scp_error lstat(std::string const& path, file_info& out, file_type* type = nullptr);

/// names of the directory entries (without "." and ".."), sorted
scp_error list_dir(std::string const& path, std::vector<std::string>& names);

/// create directory, existing directory is not an error
scp_error make_dir(std::string const& path, std::uint32_t mode);

/// create directory and all missing parents
scp_error make_dirs(std::string const& path, std::uint32_t mode);

scp_error set_mode(std::string const& path, std::uint32_t mode);

scp_error set_times(std::string const& path, unix_time mtime, unix_time atime);

/// set mode and then times, both are attempted and both failures are reported
scp_error set_mode_and_times(std::string const& path, std::uint32_t mode, unix_time mtime, unix_time atime);

/// owns file descriptor
class file_descriptor {
public:
	explicit file_descriptor(int fd = -1) : fd_(fd) {}
	~file_descriptor();

	file_descriptor(file_descriptor&&);
	file_descriptor& operator=(file_descriptor&&);

	int get() const { return fd_; }
	explicit operator bool() const { return fd_ != -1; }

	/// close now, error is reported unlike with destructor
	int close();

private:
	int fd_{-1};
};

class file_in_stream : public in_stream {
public:
	file_in_stream(file_descriptor fd, std::string path);

	scp_error read_some(span out, std::size_t& read) override;

private:
	file_descriptor fd_;
	std::string path_;
};

class file_out_stream : public out_stream {
public:
	using out_stream::write;

	file_out_stream(file_descriptor fd, std::string path);

	scp_error write(const_span) override;

	/// close the file and report error (for example delayed write errors)
	scp_error close();

private:
	file_descriptor fd_;
	std::string path_;
};

scp_error open_for_read(std::string const& path, std::unique_ptr<file_in_stream>& out);

/// create or truncate file for writing, mode is used if the file is created
scp_error open_for_write(std::string const& path, std::uint32_t mode, std::unique_ptr<file_out_stream>& out);

}

#endif
