#ifndef SP_SCP_CLIENT_DIRECTORY_RECEIVER_HEADER
#define SP_SCP_CLIENT_DIRECTORY_RECEIVER_HEADER

#include "accept.hpp"
#include "scp/core/remote_source.hpp"

namespace securepath::scp {

/** \brief Rebuilds directory tree from the messages read from remote_source
 *
 *  Each start directory pushes a frame that is popped by the matching end directory. A frame of
 *  rejected directory is marked skipping and so are all frames above it; file bodies inside skipped
 *  directories are still read (and discarded) to keep the stream in sync.
 */
class directory_receiver {
public:
	/// if dest_is_root is set, the first received directory is the destination directory itself
	directory_receiver(logger&, remote_source&, accept_function const&, std::string dest, bool dest_is_root);

	scp_error receive();

private:
	struct frame {
		std::string path;
		std::uint32_t mode{};
		std::optional<time_header> time;
		bool skipping{};
	};

	scp_error on_start_directory(start_directory_header const&);
	scp_error on_end_directory();
	scp_error on_file(file_header const&);
	scp_error write_file(std::string const& path, file_header const&, std::optional<time_header> const&);

	std::string const& current_dir() const;
	bool skipping() const;

private:
	logger& log_;
	remote_source& source_;
	accept_function const& accept_;
	std::string const dest_;
	bool first_is_root_{};

	std::vector<frame> stack_;
	// time header for the next file or directory
	std::optional<time_header> pending_time_;
};

}

#endif
