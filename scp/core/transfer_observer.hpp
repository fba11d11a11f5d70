#ifndef SP_SCP_TRANSFER_OBSERVER_HEADER
#define SP_SCP_TRANSFER_OBSERVER_HEADER

#include "scp/common/errors.hpp"

namespace securepath::scp {

/// Optional progress callbacks, called synchronously from the transferring thread
class transfer_observer {
public:
	virtual ~transfer_observer() = default;

	/// file body is about to be transferred
	virtual void on_file_begin(std::string_view name, std::uint64_t size) = 0;

	/// part of the file body was transferred, transferred is the total so far
	virtual void on_file_progress(std::string_view name, std::uint64_t transferred, std::uint64_t size) = 0;

	/// file body transfer ended, error is set if it failed
	virtual void on_file_end(std::string_view name, scp_error const& error) = 0;
};

}

#endif
