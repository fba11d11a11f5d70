#ifndef SP_SCP_CLIENT_ACCEPT_HEADER
#define SP_SCP_CLIENT_ACCEPT_HEADER

#include "scp/common/errors.hpp"
#include "scp/core/file_info.hpp"

#include <functional>

namespace securepath::scp {

/** \brief Decides if file or directory is transferred
 *
 *  parent_dir is the local directory that contains (or will contain) the entry. Rejecting directory
 *  skips everything under it. Returning error aborts the whole transfer.
 *  Empty function accepts everything.
 */
using accept_function = std::function<scp_error(std::string const& parent_dir, file_info const& info, bool& accept)>;

/// call the accept function, empty function accepts
scp_error call_accept(accept_function const&, std::string const& parent_dir, file_info const& info, bool& accept);

}

#endif
