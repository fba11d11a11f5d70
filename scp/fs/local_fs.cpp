#include "local_fs.hpp"
#include "scp/common/logger.hpp"
#include "scp/common/util.hpp"

#include <algorithm>
#include <cerrno>

#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace securepath::scp::fs {

static file_info to_file_info(std::string const& path, struct stat const& st) {
	file_info info;
	info.name = base_name(path);
	info.mode = st.st_mode & mode_permissions;
	if(S_ISDIR(st.st_mode)) {
		info.mode |= mode_directory;
	} else {
		info.size = std::uint64_t(st.st_size);
	}
	info.mtime = st.st_mtim.tv_sec;
	info.atime = st.st_atim.tv_sec;
	return info;
}

scp_error lookup(std::string const& path, std::optional<file_info>& out) {
	out.reset();
	struct stat st{};
	if(::stat(path.c_str(), &st) != 0) {
		if(errno == ENOENT) {
			return {};
		}
		return system_error(scp_local_error, "failed to stat", path, errno);
	}
	out = to_file_info(path, st);
	return {};
}

static void to_file_type(struct stat const& st, file_type* type) {
	if(type) {
		*type = S_ISREG(st.st_mode) ? file_type::regular
			: S_ISDIR(st.st_mode) ? file_type::directory : file_type::other;
	}
}

scp_error stat(std::string const& path, file_info& out, file_type* type) {
	struct stat st{};
	if(::stat(path.c_str(), &st) != 0) {
		return system_error(scp_local_error, "failed to stat", path, errno);
	}
	out = to_file_info(path, st);
	to_file_type(st, type);
	return {};
}

scp_error lstat(std::string const& path, file_info& out, file_type* type) {
	struct stat st{};
	if(::lstat(path.c_str(), &st) != 0) {
		return system_error(scp_local_error, "failed to stat", path, errno);
	}
	out = to_file_info(path, st);
	to_file_type(st, type);
	return {};
}

scp_error list_dir(std::string const& path, std::vector<std::string>& names) {
	names.clear();
	DIR* dir = ::opendir(path.c_str());
	if(!dir) {
		return system_error(scp_local_error, "failed to open directory", path, errno);
	}
	errno = 0;
	while(dirent* e = ::readdir(dir)) {
		std::string_view n = e->d_name;
		if(n != "." && n != "..") {
			names.emplace_back(n);
		}
		errno = 0;
	}
	int err = errno;
	::closedir(dir);
	if(err) {
		return system_error(scp_local_error, "failed to read directory", path, err);
	}
	std::sort(names.begin(), names.end());
	return {};
}

scp_error make_dir(std::string const& path, std::uint32_t mode) {
	if(::mkdir(path.c_str(), mode & mode_permissions) != 0) {
		int err = errno;
		struct stat st{};
		if(err == EEXIST && ::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) {
			return {};
		}
		return system_error(scp_local_error, "failed to create directory", path, err);
	}
	return {};
}

scp_error make_dirs(std::string const& path, std::uint32_t mode) {
	std::string p = clean_path(path);
	std::optional<file_info> info;
	auto err = lookup(p, info);
	if(err) {
		return err;
	}
	if(info) {
		if(!info->is_dir()) {
			return scp_error{scp_local_error, simple_format("not a directory '{}'", p)};
		}
		return {};
	}
	auto parent = dir_name(p);
	if(parent != p) {
		err = make_dirs(parent, mode);
		if(err) {
			return err;
		}
	}
	return make_dir(p, mode);
}

scp_error set_mode(std::string const& path, std::uint32_t mode) {
	if(::chmod(path.c_str(), mode & mode_permissions) != 0) {
		return system_error(scp_local_error, "failed to change mode of", path, errno);
	}
	return {};
}

scp_error set_times(std::string const& path, unix_time mtime, unix_time atime) {
	struct timespec times[2]{};
	times[0].tv_sec = atime;
	times[1].tv_sec = mtime;
	if(::utimensat(AT_FDCWD, path.c_str(), times, 0) != 0) {
		return system_error(scp_local_error, "failed to change times of", path, errno);
	}
	return {};
}

scp_error set_mode_and_times(std::string const& path, std::uint32_t mode, unix_time mtime, unix_time atime) {
	auto mode_err = set_mode(path, mode);
	auto time_err = set_times(path, mtime, atime);
	if(mode_err && time_err) {
		return scp_error{scp_local_error, mode_err.message() + "; " + time_err.message()};
	}
	return mode_err ? mode_err : time_err;
}

file_descriptor::~file_descriptor() {
	close();
}

file_descriptor::file_descriptor(file_descriptor&& other)
: fd_(other.fd_)
{
	other.fd_ = -1;
}

file_descriptor& file_descriptor::operator=(file_descriptor&& other) {
	if(this != &other) {
		close();
		fd_ = other.fd_;
		other.fd_ = -1;
	}
	return *this;
}

int file_descriptor::close() {
	int res = 0;
	if(fd_ != -1) {
		res = ::close(fd_);
		fd_ = -1;
	}
	return res;
}

file_in_stream::file_in_stream(file_descriptor fd, std::string path)
: fd_(std::move(fd))
, path_(std::move(path))
{
}

scp_error file_in_stream::read_some(span out, std::size_t& read) {
	read = 0;
	for(;;) {
		auto n = ::read(fd_.get(), out.data(), out.size());
		if(n >= 0) {
			read = std::size_t(n);
			return {};
		}
		if(errno != EINTR) {
			return system_error(scp_local_error, "failed to read", path_, errno);
		}
	}
}

file_out_stream::file_out_stream(file_descriptor fd, std::string path)
: fd_(std::move(fd))
, path_(std::move(path))
{
}

scp_error file_out_stream::write(const_span s) {
	while(!s.empty()) {
		auto n = ::write(fd_.get(), s.data(), s.size());
		if(n < 0) {
			if(errno == EINTR) {
				continue;
			}
			return system_error(scp_local_error, "failed to write", path_, errno);
		}
		s = s.subspan(std::size_t(n));
	}
	return {};
}

scp_error file_out_stream::close() {
	if(fd_ && fd_.close() != 0) {
		return system_error(scp_local_error, "failed to close", path_, errno);
	}
	return {};
}

scp_error open_for_read(std::string const& path, std::unique_ptr<file_in_stream>& out) {
	file_descriptor fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
	if(!fd) {
		return system_error(scp_local_error, "failed to open", path, errno);
	}
	out = std::make_unique<file_in_stream>(std::move(fd), path);
	return {};
}

scp_error open_for_write(std::string const& path, std::uint32_t mode, std::unique_ptr<file_out_stream>& out) {
	file_descriptor fd(::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode & mode_permissions));
	if(!fd) {
		return system_error(scp_local_error, "failed to create", path, errno);
	}
	out = std::make_unique<file_out_stream>(std::move(fd), path);
	return {};
}

}
