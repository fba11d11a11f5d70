#ifndef SP_SCP_TOOLS_SPSCP_SCP_TOOL_HEADER
#define SP_SCP_TOOLS_SPSCP_SCP_TOOL_HEADER

#include "tools/common/command_parser.hpp"
#include "scp/core/scp_config.hpp"

#include <iosfwd>

namespace securepath::scp {

struct spscp_commands : scp_config, command_parser {
	bool help{};
	bool verbose{};
	bool very_verbose{};
	bool quiet{};
	bool recursive{};
	// run the scp command with /bin/sh on this machine instead of ssh
	bool local{};
	std::string host;
	std::string port;
	std::string user;
	std::string ssh_path{"ssh"};
	std::string config_file;
	std::vector<std::string> get;
	std::vector<std::string> put;

	spscp_commands();

	/// throws invalid_argument if the options do not make sense together
	void validate() const;
};

/// exit codes of the tool
enum tool_result {
	tool_ok = 0,
	tool_failed = 1,
	tool_usage = 2,
	tool_cancelled = 130
};

class spscp_tool {
public:
	spscp_tool(spscp_commands const&, std::ostream& log_out);

	int run();

private:
	spscp_commands const& commands_;
	std::ostream& log_out_;
};

}

#endif
