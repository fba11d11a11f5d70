#ifndef SP_SCP_TOOLS_SPSCP_PROGRESS_PRINTER_HEADER
#define SP_SCP_TOOLS_SPSCP_PROGRESS_PRINTER_HEADER

#include "scp/core/transfer_observer.hpp"

#include <iosfwd>

namespace securepath::scp {

/// prints one line per file and updates it when the percentage changes
class progress_printer : public transfer_observer {
public:
	progress_printer(std::ostream& out);

	void on_file_begin(std::string_view name, std::uint64_t size) override;
	void on_file_progress(std::string_view name, std::uint64_t transferred, std::uint64_t size) override;
	void on_file_end(std::string_view name, scp_error const& error) override;

private:
	void print(std::string_view name, std::uint64_t transferred, std::uint64_t size, bool done);

private:
	std::ostream& out_;
	int last_percent_{-1};
	std::uint64_t transferred_{};
	std::uint64_t size_{};
};

}

#endif
