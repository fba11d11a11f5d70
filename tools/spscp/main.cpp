#include "scp_tool.hpp"

#include <iostream>
#include <stdexcept>

int main(int argc, char* argv[]) {
	using namespace securepath::scp;
	try {
		spscp_commands c;
		c.parse(argc, argv);
		if(c.help) {
			std::cout << "spscp - copy files with the scp protocol\n";
			spscp_commands().print_help(std::cout);
			return tool_ok;
		}
		if(!c.config_file.empty()) {
			c.parse_file(c.config_file);
			// command line wins over the options file
			c.parse(argc, argv);
		}
		c.validate();

		spscp_tool tool(c, std::cerr);
		return tool.run();
	} catch(invalid_argument const& e) {
		std::cerr << "Invalid arguments: " << e.what() << "\n";
		return tool_usage;
	} catch(std::exception const& e) {
		std::cerr << "Exception: " << e.what() << "\n";
		return tool_failed;
	}
}
