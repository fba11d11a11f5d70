#ifndef SP_SCP_TOOLS_COMMON_COMMAND_PARSER_HEADER
#define SP_SCP_TOOLS_COMMON_COMMAND_PARSER_HEADER

#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace securepath::scp {

struct invalid_argument : std::runtime_error {
	using std::runtime_error::runtime_error;
};

/// sets bound variable from the values following an option
struct option_value {
	virtual ~option_value() = default;
	virtual void parse(std::vector<std::string> const&) = 0;
	virtual void print(std::ostream&) const = 0;
	// maximum number of values, 0 for flags
	virtual std::size_t max_values() const = 0;
};

struct option {
	std::string name;
	std::string alias;
	std::string info;
	std::unique_ptr<option_value> value;
};

/** \brief Parses "--name value..." and "-alias value..." options into bound variables
 *
 *  Values are read until the next argument starting with '-'. The same syntax is accepted from
 *  options files, one or more options per line, empty lines and lines starting with '#' are ignored.
 *  Arguments that do not belong to any option are collected as positionals.
 */
class command_parser {
public:
	template<typename T>
	void add(T& var, std::string name, std::string alias, std::string info);
	template<typename T>
	void add(std::vector<T>& var, std::string name, std::string alias, std::string info);
	template<typename T>
	void add(std::optional<T>& var, std::string name, std::string alias, std::string info);
	void add(bool& var, std::string name, std::string alias, std::string info);

	/// throws invalid_argument
	void parse(int argc, char* argv[]);
	void parse(std::vector<std::string> const& args);
	void parse_line(std::string const& line);
	void parse_file(std::string const& file_name);

	std::vector<std::string> const& positionals() const { return positionals_; }

	void print_help(std::ostream&) const;

private:
	void add_option(std::unique_ptr<option_value>, std::string name, std::string alias, std::string info);

private:
	std::vector<std::shared_ptr<option>> options_;
	std::map<std::string, std::shared_ptr<option>> lookup_;
	std::vector<std::string> positionals_;
};

/// split line to arguments, double quotes group words and backslash escapes the next character
std::vector<std::string> split_arguments(std::string const& line);

namespace detail {

template<typename T>
void from_string(std::string const& s, T& out) {
	if constexpr(std::is_same_v<T, std::string>) {
		out = s;
	} else {
		std::istringstream in(s);
		if(!(in >> out) || !(in >> std::ws).eof()) {
			throw invalid_argument("failed to interpret argument '" + s + "'");
		}
	}
}

template<typename T>
struct single_value : option_value {
	single_value(T& v) : value(v) {}

	void parse(std::vector<std::string> const& args) override {
		if(args.size() != 1) {
			throw invalid_argument("expected exactly one value, got " + std::to_string(args.size()));
		}
		from_string(args[0], value);
	}
	void print(std::ostream& o) const override { o << value; }
	std::size_t max_values() const override { return 1; }

	T& value;
};

template<typename T>
struct list_value : option_value {
	list_value(std::vector<T>& v) : value(v) {}

	void parse(std::vector<std::string> const& args) override {
		value.clear();
		for(auto&& a : args) {
			from_string(a, value.emplace_back());
		}
	}
	void print(std::ostream& o) const override {
		for(std::size_t i = 0; i != value.size(); ++i) {
			o << (i ? " " : "") << value[i];
		}
	}
	std::size_t max_values() const override { return std::size_t(-1); }

	std::vector<T>& value;
};

template<typename T>
struct optional_value : option_value {
	optional_value(std::optional<T>& v) : value(v) {}

	void parse(std::vector<std::string> const& args) override {
		if(args.size() > 1) {
			throw invalid_argument("expected at most one value, got " + std::to_string(args.size()));
		}
		value.emplace();
		if(!args.empty()) {
			from_string(args[0], *value);
		}
	}
	void print(std::ostream& o) const override {
		if(value) {
			o << *value;
		}
	}
	std::size_t max_values() const override { return 1; }

	std::optional<T>& value;
};

}

template<typename T>
void command_parser::add(T& var, std::string name, std::string alias, std::string info) {
	add_option(std::make_unique<detail::single_value<T>>(var), std::move(name), std::move(alias), std::move(info));
}

template<typename T>
void command_parser::add(std::vector<T>& var, std::string name, std::string alias, std::string info) {
	add_option(std::make_unique<detail::list_value<T>>(var), std::move(name), std::move(alias), std::move(info));
}

template<typename T>
void command_parser::add(std::optional<T>& var, std::string name, std::string alias, std::string info) {
	add_option(std::make_unique<detail::optional_value<T>>(var), std::move(name), std::move(alias), std::move(info));
}

}

#endif
