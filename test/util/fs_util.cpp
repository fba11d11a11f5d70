#include "fs_util.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <ostream>
#include <sstream>
#include <stdexcept>

#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace securepath::scp::test {

static void check(bool ok, std::string const& what, std::string const& path) {
	if(!ok) {
		throw std::runtime_error(what + " '" + path + "': " + std::strerror(errno));
	}
}

temp_dir::temp_dir() {
	char const* base = std::getenv("TMPDIR");
	std::string templ = base && *base ? base : "/tmp";
	while(templ.size() > 1 && templ.back() == '/') {
		templ.pop_back();
	}
	templ += "/spscp_test_XXXXXX";
	char* p = ::mkdtemp(templ.data());
	check(p != nullptr, "mkdtemp", templ);
	path_ = p;
}

temp_dir::~temp_dir() {
	try {
		remove_all(path_);
	} catch(std::exception const&) {
		// left behind in the temp directory
	}
}

std::string temp_dir::operator/(std::string_view rel) const {
	return path_ + "/" + std::string(rel);
}

void write_file(std::string const& path, std::string_view content, std::uint32_t mode) {
	{
		std::ofstream out(path, std::ios::binary | std::ios::trunc);
		check(bool(out), "open", path);
		out.write(content.data(), content.size());
		check(bool(out), "write", path);
	}
	set_mode(path, mode);
}

std::string read_file(std::string const& path) {
	std::ifstream in(path, std::ios::binary);
	check(bool(in), "open", path);
	std::ostringstream s;
	s << in.rdbuf();
	return s.str();
}

void make_dir(std::string const& path, std::uint32_t mode) {
	check(::mkdir(path.c_str(), 0700) == 0, "mkdir", path);
	set_mode(path, mode);
}

void make_symlink(std::string const& target, std::string const& path) {
	check(::symlink(target.c_str(), path.c_str()) == 0, "symlink", path);
}

void set_mode(std::string const& path, std::uint32_t mode) {
	check(::chmod(path.c_str(), mode) == 0, "chmod", path);
}

void set_times(std::string const& path, unix_time mtime, unix_time atime) {
	timespec ts[2]{};
	ts[0].tv_sec = atime;
	ts[1].tv_sec = mtime;
	check(::utimensat(AT_FDCWD, path.c_str(), ts, 0) == 0, "utimensat", path);
}

bool exists(std::string const& path) {
	struct stat st{};
	return ::lstat(path.c_str(), &st) == 0;
}

void remove_all(std::string const& path) {
	struct stat st{};
	if(::lstat(path.c_str(), &st) != 0) {
		return;
	}
	if(S_ISDIR(st.st_mode)) {
		::chmod(path.c_str(), 0700);
		DIR* d = ::opendir(path.c_str());
		check(d != nullptr, "opendir", path);
		std::vector<std::string> names;
		while(dirent* e = ::readdir(d)) {
			std::string n = e->d_name;
			if(n != "." && n != "..") {
				names.push_back(n);
			}
		}
		::closedir(d);
		for(auto& n : names) {
			remove_all(path + "/" + n);
		}
		check(::rmdir(path.c_str()) == 0, "rmdir", path);
	} else {
		check(::unlink(path.c_str()) == 0, "unlink", path);
	}
}

static void snapshot(std::string const& root, std::string const& rel, tree& out) {
	std::string dir = rel.empty() ? root : root + "/" + rel;
	DIR* d = ::opendir(dir.c_str());
	check(d != nullptr, "opendir", dir);
	std::vector<std::string> names;
	while(dirent* e = ::readdir(d)) {
		std::string n = e->d_name;
		if(n != "." && n != "..") {
			names.push_back(n);
		}
	}
	::closedir(d);

	for(auto& n : names) {
		std::string r = rel.empty() ? n : rel + "/" + n;
		std::string full = root + "/" + r;
		struct stat st{};
		check(::lstat(full.c_str(), &st) == 0, "lstat", full);

		tree_entry e;
		e.dir = S_ISDIR(st.st_mode);
		e.mode = st.st_mode & 07777;
		e.mtime = st.st_mtim.tv_sec;
		// reading files and listing directories changes access times, so they are taken first
		e.atime = st.st_atim.tv_sec;
		if(e.dir) {
			// the directory may not be readable with its final mode
			::chmod(full.c_str(), 0700);
			snapshot(root, r, out);
			::chmod(full.c_str(), e.mode);
		} else {
			::chmod(full.c_str(), 0600);
			e.content = read_file(full);
			::chmod(full.c_str(), e.mode);
		}
		out[r] = e;
	}
}

tree snapshot(std::string const& root) {
	tree t;
	snapshot(root, "", t);
	return t;
}

std::ostream& operator<<(std::ostream& out, tree_entry const& e) {
	return out << (e.dir ? "dir" : "file") << " mode=" << std::oct << e.mode << std::dec
		<< " mtime=" << e.mtime << " atime=" << e.atime << " size=" << e.content.size();
}

tree make_sample_tree(std::string const& root) {
	struct entry_def {
		std::string path;
		bool dir;
		std::uint32_t mode;
		std::string content;
	};
	// children before parents so that setting the times of parent is not undone
	std::vector<entry_def> const defs{
		{"baz", true, 0755, {}},
		{"baz/emptyDir", true, 0500, {}},
		{"baz/foo", false, 0400, "inner foo\n"},
		{"baz/hoge", false, 0602, std::string(100000, 'h')},
		{"bar", false, 0600, "bar content, a bit longer\n"},
		{"foo", false, 0644, "foo content\n"},
	};

	make_dir(root, 0755);
	tree t;
	unix_time time = 1500000000;
	for(auto const& d : defs) {
		std::string full = root + "/" + d.path;
		if(d.dir) {
			::mkdir(full.c_str(), 0700);
		} else {
			write_file(full, d.content, 0600);
		}
		t[d.path] = tree_entry{d.dir, d.mode, time, time + 100, d.content};
		time += 1000;
	}

	// deepest first
	for(auto it = defs.rbegin(); it != defs.rend(); ++it) {
		std::string full = root + "/" + it->path;
		auto const& e = t[it->path];
		set_mode(full, e.mode);
		set_times(full, e.mtime, e.atime);
	}
	return t;
}

}
