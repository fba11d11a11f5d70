#include "command_parser.hpp"

#include <fstream>
#include <iomanip>

namespace securepath::scp {

namespace {

struct flag_value : option_value {
	flag_value(bool& v) : value(v) {}

	void parse(std::vector<std::string> const& args) override {
		if(!args.empty()) {
			throw invalid_argument("flag does not take values");
		}
		value = true;
	}
	void print(std::ostream& o) const override { o << (value ? "true" : "false"); }
	std::size_t max_values() const override { return 0; }

	bool& value;
};

bool is_option(std::string const& s) {
	return s.size() > 1 && s[0] == '-';
}

}

void command_parser::add_option(std::unique_ptr<option_value> v, std::string name, std::string alias, std::string info) {
	auto o = std::make_shared<option>(option{std::move(name), std::move(alias), std::move(info), std::move(v)});
	if(!o->name.empty()) {
		lookup_["--" + o->name] = o;
	}
	if(!o->alias.empty()) {
		lookup_["-" + o->alias] = o;
	}
	options_.push_back(std::move(o));
}

void command_parser::add(bool& var, std::string name, std::string alias, std::string info) {
	add_option(std::make_unique<flag_value>(var), std::move(name), std::move(alias), std::move(info));
}

void command_parser::parse(int argc, char* argv[]) {
	parse(std::vector<std::string>(argv + 1, argv + argc));
}

void command_parser::parse(std::vector<std::string> const& args) {
	for(std::size_t i = 0; i != args.size();) {
		std::string arg = args[i++];
		if(!is_option(arg)) {
			positionals_.push_back(std::move(arg));
			continue;
		}

		std::vector<std::string> values;
		// --name=value
		auto eq = arg.find('=');
		if(eq != std::string::npos) {
			values.push_back(arg.substr(eq + 1));
			arg.resize(eq);
		}

		auto it = lookup_.find(arg);
		if(it == lookup_.end()) {
			throw invalid_argument("unknown option '" + arg + "'");
		}
		auto& value = *it->second->value;

		while(i != args.size() && !is_option(args[i]) && values.size() < value.max_values()) {
			values.push_back(args[i++]);
		}

		try {
			value.parse(values);
		} catch(invalid_argument const& e) {
			throw invalid_argument(arg + ": " + e.what());
		}
	}
}

std::vector<std::string> split_arguments(std::string const& line) {
	std::vector<std::string> args;
	std::string current;
	bool in_arg = false;
	bool quoted = false;

	for(std::size_t i = 0; i != line.size(); ++i) {
		char c = line[i];
		if(c == '\\' && i + 1 != line.size()) {
			current += line[++i];
			in_arg = true;
		} else if(c == '"') {
			quoted = !quoted;
			in_arg = true;
		} else if(!quoted && (c == ' ' || c == '\t' || c == '\r')) {
			if(in_arg) {
				args.push_back(std::move(current));
				current.clear();
				in_arg = false;
			}
		} else {
			current += c;
			in_arg = true;
		}
	}
	if(quoted) {
		throw invalid_argument("unterminated quote in '" + line + "'");
	}
	if(in_arg) {
		args.push_back(std::move(current));
	}
	return args;
}

void command_parser::parse_line(std::string const& line) {
	auto start = line.find_first_not_of(" \t");
	if(start == std::string::npos || line[start] == '#') {
		return;
	}
	parse(split_arguments(line));
}

void command_parser::parse_file(std::string const& file_name) {
	std::ifstream in(file_name);
	if(!in) {
		throw invalid_argument("failed to open options file '" + file_name + "'");
	}
	std::string line;
	while(std::getline(in, line)) {
		parse_line(line);
	}
}

void command_parser::print_help(std::ostream& out) const {
	for(auto&& o : options_) {
		std::string names = "--" + o->name;
		if(!o->alias.empty()) {
			names += ", -" + o->alias;
		}
		if(o->value->max_values() == 1) {
			names += " <value>";
		} else if(o->value->max_values() > 1) {
			names += " <values...>";
		}

		out << "  " << std::left << std::setw(34) << names << " " << o->info;

		std::ostringstream current;
		o->value->print(current);
		if(o->value->max_values() && !current.str().empty()) {
			out << " (" << current.str() << ")";
		}
		out << "\n";
	}
}

}
