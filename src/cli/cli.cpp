#include "cli/cli.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <set>
#include <sstream>

namespace vgraph {

namespace {

bool looks_like_option(const std::string& token) {
    return token.size() > 1 && token[0] == '-' &&
           !std::isdigit(static_cast<unsigned char>(token[1]));
}

std::string display_name(const ArgDef& def) {
    return "--" + def.name;
}

} // namespace

// ==========================================
// ArgValue / Args
// ==========================================

int ArgValue::as_int(int default_val) const {
    if (!is_set) return default_val;
    try {
        size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (used == value.size()) return parsed;
    } catch (const std::exception&) {
        // Reported below with the offending text
    }
    throw std::runtime_error("Expected an integer, got '" + value + "'");
}

bool ArgValue::as_bool(bool default_val) const {
    if (!is_set) return default_val;
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
    if (v == "false" || v == "0" || v == "no" || v == "off") return false;
    throw std::runtime_error("Expected true or false, got '" + value + "'");
}

std::vector<std::string> ArgValue::as_list(char delim) const {
    std::vector<std::string> items;
    if (!is_set) return items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, delim)) {
        auto begin = item.find_first_not_of(" \t");
        if (begin == std::string::npos) continue;
        auto end = item.find_last_not_of(" \t");
        items.push_back(item.substr(begin, end - begin + 1));
    }
    return items;
}

ArgValue Args::get(const std::string& name, const std::string& default_val) const {
    auto it = named.find(name);
    if (it != named.end()) return it->second;
    return ArgValue{default_val, !default_val.empty()};
}

bool Args::has(const std::string& name) const {
    auto it = named.find(name);
    return it != named.end() && it->second.is_set;
}

std::string Args::require(const std::string& name) const {
    if (!has(name)) {
        throw UsageError("Missing required argument: --" + name);
    }
    return named.at(name).value;
}

// ==========================================
// Command
// ==========================================

const ArgDef* Command::find_long(const std::string& long_name) const {
    for (const auto& group : groups) {
        for (const auto& def : group.args) {
            if (def.name == long_name) return &def;
        }
    }
    return nullptr;
}

const ArgDef* Command::find_short(char c) const {
    for (const auto& group : groups) {
        for (const auto& def : group.args) {
            if (def.short_name.size() == 1 && def.short_name[0] == c) return &def;
        }
    }
    return nullptr;
}

void Command::validate() const {
    std::map<std::string, std::string> shorts;     // short -> long
    std::set<std::string> longs;
    auto fail = [this](const std::string& msg) {
        throw std::logic_error("command '" + name + "': " + msg);
    };

    for (const auto& group : groups) {
        for (const auto& def : group.args) {
            if (def.name.empty() || def.name[0] == '-' || def.name.find('=') != std::string::npos) {
                fail("invalid option name '" + def.name + "'");
            }
            if (def.name == "help" || def.short_name == "h") {
                fail("--help/-h is reserved");
            }
            if (!longs.insert(def.name).second) {
                fail("option --" + def.name + " is defined twice");
            }
            if (!def.short_name.empty()) {
                if (def.short_name.size() != 1 || def.short_name[0] == '-') {
                    fail("short name for --" + def.name + " must be one character");
                }
                auto [it, inserted] = shorts.emplace(def.short_name, def.name);
                if (!inserted) {
                    fail("-" + def.short_name + " is used by both --" + it->second +
                         " and --" + def.name);
                }
            }
            if (def.is_flag && (def.required || !def.default_value.empty())) {
                fail("flag --" + def.name + " cannot be required or have a default");
            }
        }
    }
}

void Command::print_help(std::ostream& out, const std::string& program) const {
    out << "\nUsage: " << program << " " << name;
    if (!usage.empty()) {
        out << " " << usage;
    }
    for (const auto& group : groups) {
        for (const auto& def : group.args) {
            if (def.required) out << " --" << def.name << " <value>";
        }
    }
    out << " [options]\n\n" << description << "\n";

    for (const auto& group : groups) {
        if (group.args.empty()) continue;
        out << "\n" << group.title << " options:\n";
        for (const auto& def : group.args) {
            std::string head = "  --" + def.name;
            if (!def.short_name.empty()) head += ", -" + def.short_name;
            if (!def.is_flag) head += " <value>";
            out << head << "\n      " << def.description;
            if (!def.default_value.empty()) out << " (default: " << def.default_value << ")";
            if (def.required) out << " [required]";
            out << "\n";
        }
    }
    out << "\n";
}

// ==========================================
// Parsing
// ==========================================

Args parse_command_args(const Command& cmd, const std::vector<std::string>& tokens) {
    Args args;
    bool options_done = false;

    for (size_t i = 0; i < tokens.size(); ++i) {
        const std::string& token = tokens[i];

        if (options_done || !looks_like_option(token)) {
            args.positional.push_back(token);
            continue;
        }
        if (token == "--") {
            options_done = true;
            continue;
        }
        if (token == "--help" || token == "-h") {
            args.help = true;
            return args;
        }

        const ArgDef* def = nullptr;
        std::string inline_value;
        bool has_inline = false;

        if (token.rfind("--", 0) == 0) {
            std::string body = token.substr(2);
            auto eq = body.find('=');
            if (eq != std::string::npos) {
                inline_value = body.substr(eq + 1);
                has_inline = true;
                body.resize(eq);
            }
            def = cmd.find_long(body);
            if (!def) throw UsageError("Unknown option: --" + body);
        } else {
            if (token.size() != 2) throw UsageError("Unknown option: " + token);
            def = cmd.find_short(token[1]);
            if (!def) throw UsageError("Unknown option: " + token);
        }

        ArgValue& slot = args.named[def->name];
        if (slot.is_set) {
            throw UsageError("Option " + display_name(*def) + " given more than once");
        }

        if (def->is_flag) {
            if (has_inline) {
                throw UsageError("Option " + display_name(*def) + " is a flag and takes no value");
            }
            slot = ArgValue{"true", true};
            continue;
        }

        if (has_inline) {
            if (inline_value.empty()) {
                throw UsageError("Option " + display_name(*def) + " requires a value");
            }
            slot = ArgValue{inline_value, true};
            continue;
        }
        if (i + 1 >= tokens.size() || tokens[i + 1].rfind("--", 0) == 0) {
            throw UsageError("Option " + display_name(*def) + " requires a value");
        }
        slot = ArgValue{tokens[++i], true};
    }

    for (const auto& group : cmd.groups) {
        for (const auto& def : group.args) {
            if (args.has(def.name)) continue;
            if (def.required) {
                throw UsageError("Missing required argument: --" + def.name);
            }
            if (!def.default_value.empty()) {
                args.named[def.name] = ArgValue{def.default_value, true};
            }
        }
    }
    return args;
}

// ==========================================
// CLI
// ==========================================

CLI::CLI(std::string program_name, std::string version, std::ostream& out, std::ostream& err)
    : program_name_(std::move(program_name)), version_(std::move(version)), out_(out), err_(err) {}

void CLI::register_command(Command cmd) {
    cmd.validate();
    if (commands_.count(cmd.name) || aliases_.count(cmd.name)) {
        throw std::logic_error("command '" + cmd.name + "' registered twice");
    }
    std::string name = cmd.name;
    commands_.emplace(std::move(name), std::move(cmd));
}

void CLI::register_alias(const std::string& alias, const std::string& target) {
    if (!commands_.count(target)) {
        throw std::logic_error("alias '" + alias + "' points to unknown command '" + target + "'");
    }
    if (commands_.count(alias) || aliases_.count(alias)) {
        throw std::logic_error("command '" + alias + "' registered twice");
    }
    aliases_[alias] = target;
}

const Command* CLI::find(const std::string& name) const {
    auto alias = aliases_.find(name);
    auto it = commands_.find(alias != aliases_.end() ? alias->second : name);
    return it != commands_.end() ? &it->second : nullptr;
}

int CLI::run(int argc, char** argv) {
    std::vector<std::string> tokens;
    for (int i = 1; i < argc; ++i) {
        tokens.emplace_back(argv[i]);
    }
    return run(tokens);
}

int CLI::run(const std::vector<std::string>& tokens) {
    if (tokens.empty()) {
        print_help(err_);
        return 1;
    }

    const std::string& first = tokens[0];
    if (first == "--help" || first == "-h" || first == "help") {
        print_help(out_);
        return 0;
    }
    if (first == "--version") {
        out_ << program_name_ << " version " << version_ << "\n";
        return 0;
    }
    if (looks_like_option(first)) {
        err_ << "Error: expected a command before " << first << "\n";
        if (first == "-v") {
            err_ << "Use --version for the version; -v means --verbose after a command.\n";
        }
        return 1;
    }

    const Command* cmd = find(first);
    if (!cmd) {
        err_ << "Unknown command: " << first << "\n";
        err_ << "Run '" << program_name_ << " --help' for available commands.\n";
        return 1;
    }

    Args args;
    try {
        args = parse_command_args(*cmd, std::vector<std::string>(tokens.begin() + 1, tokens.end()));
    } catch (const UsageError& e) {
        err_ << "Error: " << e.what() << "\n";
        cmd->print_help(err_, program_name_);
        return 1;
    }
    if (args.help) {
        cmd->print_help(out_, program_name_);
        return 0;
    }

    try {
        return cmd->handler(args);
    } catch (const std::exception& e) {
        err_ << "Error: " << e.what() << "\n";
        return 1;
    }
}

void CLI::print_help(std::ostream& out) const {
    out << program_name_ << " - vault link-graph analytics\n\n";
    out << "Usage: " << program_name_ << " <command> [options]\n\n";
    out << "Commands:\n";
    for (const auto& [name, cmd] : commands_) {
        out << "  " << std::left << std::setw(16) << name << cmd.description << "\n";
    }
    for (const auto& [alias, target] : aliases_) {
        out << "  " << std::left << std::setw(16) << alias << "Alias for " << target << "\n";
    }
    out << "\nRun '" << program_name_ << " <command> --help' for command-specific options.\n";
    out << "Run '" << program_name_ << " --version' for the version.\n";
}

} // namespace vgraph
