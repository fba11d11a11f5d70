#ifndef SP_SCP_CONFIG_HEADER
#define SP_SCP_CONFIG_HEADER

#include "scp/common/streams.hpp"

namespace securepath::scp {

/** \brief SCP client configuration
 */
struct scp_config {
	// name or path of the scp binary on the remote side
	std::string scp_path{"scp"};

	// preserve modification and access times and modes (-p), time headers are sent and expected
	bool preserve{true};

	// chunk size used when streaming file bodies
	std::size_t copy_buffer_size{default_buffer_size};

	// longest accepted header or reply line (without the new line)
	std::size_t max_header_line{64*1024};

public:
	// simple sanity check for the values
	bool valid() const {
		return !scp_path.empty() && copy_buffer_size > 0 && max_header_line > 0;
	}
};

}

#endif
