#ifndef SP_SCP_TYPES_HEADER
#define SP_SCP_TYPES_HEADER

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace securepath::scp {

using byte_vector = std::vector<std::byte>;
using span = std::span<std::byte>;
using const_span = std::span<std::byte const>;

inline std::string_view to_string_view(const_span s) {
	return std::string_view((char const*)s.data(), s.size());
}

inline const_span to_span(std::string_view v) {
	return const_span((std::byte const*)v.data(), v.size());
}

/// which remote scp mode the session drives
enum class transfer_direction {
	// remote is started with -f and sends files to us
	from_remote,
	// remote is started with -t and receives files from us
	to_remote
};

#if !defined(SPSCP_ASSERT)
#	if !defined(NDEBUG)
#		define SPSCP_ASSERT(cond, message) assert((cond) && (message))
#	else
#		define SPSCP_ASSERT(cond, message) ((void)0)
#	endif
#endif

}

#endif
