#pragma once

#include <string>
#include <vector>
#include <map>
#include <functional>
#include <iostream>
#include <stdexcept>

namespace vgraph {

/**
 * @brief Thrown for a malformed command line (unknown option, missing value)
 */
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

// One option's value as given on the command line (or its default)
struct ArgValue {
    std::string value;
    bool is_set = false;

    operator bool() const { return is_set; }
    operator std::string() const { return value; }

    // Throws when the value is present but not a whole integer
    int as_int(int default_val = 0) const;

    // Accepts true/false, 1/0, yes/no, on/off
    bool as_bool(bool default_val = false) const;

    // Comma-separated items, trimmed, empty items dropped
    std::vector<std::string> as_list(char delim = ',') const;
};

/**
 * @brief Parsed command line for one command
 */
class Args {
public:
    std::map<std::string, ArgValue> named;
    std::vector<std::string> positional;
    bool help = false;      // --help/-h was seen; nothing after it was parsed

    ArgValue get(const std::string& name, const std::string& default_val = "") const;
    bool has(const std::string& name) const;
    std::string require(const std::string& name) const;
};

struct ArgDef {
    std::string name;           // Long form, without the leading "--"
    std::string short_name;     // One character or empty
    std::string description;
    std::string default_value;
    bool required = false;
    bool is_flag = false;       // Presence means "true"; never takes a value
};

/**
 * @brief Options shared by several commands, printed under one heading
 */
struct OptionGroup {
    std::string title;
    std::vector<ArgDef> args;
};

struct Command {
    std::string name;
    std::string description;
    std::vector<OptionGroup> groups;
    std::function<int(const Args&)> handler;
    std::string usage;          // Positional arguments, e.g. "<id|path>"

    const ArgDef* find_long(const std::string& long_name) const;
    const ArgDef* find_short(char c) const;

    /**
     * @brief Reject option tables the parser could not tell apart
     *
     * Throws std::logic_error for duplicate long or short names (across all
     * groups), the reserved --help/-h, malformed names, and flags that are
     * marked required or carry a default.
     */
    void validate() const;

    void print_help(std::ostream& out, const std::string& program) const;
};

/**
 * @brief Parse the tokens that follow the command name
 *
 * Accepts "--name value", "--name=value", "-x value", flags, and "--" to end
 * option parsing. Defaults are filled in and required options checked unless
 * help was requested. Throws UsageError on anything it cannot place.
 */
Args parse_command_args(const Command& cmd, const std::vector<std::string>& tokens);

/**
 * @brief Command registry and dispatcher
 *
 * Only "--version" prints the version at top level; "-v" is left to the
 * commands, which use it for --verbose.
 */
class CLI {
public:
    CLI(std::string program_name, std::string version,
        std::ostream& out = std::cout, std::ostream& err = std::cerr);

    // Throws std::logic_error if the command's options are inconsistent or the name is taken
    void register_command(Command cmd);
    void register_alias(const std::string& alias, const std::string& target);

    int run(int argc, char** argv);
    int run(const std::vector<std::string>& tokens);

    void print_help(std::ostream& out) const;

private:
    const Command* find(const std::string& name) const;

    std::string program_name_;
    std::string version_;
    std::ostream& out_;
    std::ostream& err_;
    std::map<std::string, Command> commands_;
    std::map<std::string, std::string> aliases_;
};

} // namespace vgraph
