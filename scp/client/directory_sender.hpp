#ifndef SP_SCP_CLIENT_DIRECTORY_SENDER_HEADER
#define SP_SCP_CLIENT_DIRECTORY_SENDER_HEADER

#include "accept.hpp"
#include "scp/core/remote_sink.hpp"

namespace securepath::scp {

/** \brief Walks local directory tree depth first and sends it through remote_sink
 *
 *  Entries are visited in lexical order. Rejected directories are not descended into and
 *  rejected files are never opened. Symlinks below the root and names that cannot be
 *  carried in a header are skipped with a warning.
 */
class directory_sender {
public:
	directory_sender(logger&, remote_sink&, accept_function const&);

	scp_error send(std::string const& local_path);

private:
	struct frame {
		std::string path;
		std::vector<std::string> names;
		std::size_t next{};
	};

	// returns true in descended if directory was started and pushed
	scp_error visit(std::string const& parent, std::string const& path, bool follow_links, bool& descended);
	scp_error send_file(std::string const& path, file_info const&);

private:
	logger& log_;
	remote_sink& sink_;
	accept_function const& accept_;
	std::vector<frame> stack_;
};

}

#endif
