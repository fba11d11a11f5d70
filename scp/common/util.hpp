#ifndef SP_SCP_UTIL_HEADER
#define SP_SCP_UTIL_HEADER

#include "types.hpp"

namespace securepath::scp {

/// quote argument for POSIX shell using single quotes ("it's" -> 'it'\''s')
std::string escape_shell_arg(std::string_view);

/** \brief Lexically clean '/' separated path
 *
 *  Removes repeated separators, "." elements and resolves ".." against the preceding element.
 *  Empty result becomes ".", leading ".." elements are kept for relative paths and dropped for absolute ones.
 */
std::string clean_path(std::string_view);

/// clean_path for path given to the remote side, '\\' is also taken as separator
std::string to_remote_path(std::string_view);

/// last element of the path after cleaning ("/" for root, "." for empty)
std::string base_name(std::string_view);

/// all but the last element of the path after cleaning ("." if there is no directory part)
std::string dir_name(std::string_view);

/// join two path elements with single '/'
std::string join_path(std::string_view, std::string_view);

}

#endif
