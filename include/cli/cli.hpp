#pragma once

#include "util/text_utils.hpp"
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace cg {

// ============================================================================
// Parsed Options
// ============================================================================

/**
 * @brief Value of one command-line option
 */
struct ArgValue {
    std::string value;
    bool is_set = false;

    /**
     * @brief Strict integer conversion
     * @throws std::invalid_argument on trailing text or out-of-range values
     */
    int as_int(int default_val = 0) const {
        if (!is_set) return default_val;

        const char* begin = value.c_str();
        char* end = nullptr;
        errno = 0;
        long parsed = std::strtol(begin, &end, 10);
        if (value.empty() || *end != '\0' || errno == ERANGE ||
            parsed < INT_MIN || parsed > INT_MAX) {
            throw std::invalid_argument("Expected an integer, got '" + value + "'");
        }
        return static_cast<int>(parsed);
    }

    // "a, b,,c" -> {"a", "b", "c"}
    std::vector<std::string> as_list() const {
        return is_set ? split_list(value) : std::vector<std::string>{};
    }
};

/**
 * @brief Options given to one command, defaults already applied
 */
class Args {
public:
    std::map<std::string, ArgValue> named;

    ArgValue get(const std::string& name, const std::string& fallback = "") const {
        auto it = named.find(name);
        return it != named.end() ? it->second : ArgValue{fallback, !fallback.empty()};
    }

    bool has(const std::string& name) const {
        return get(name).is_set;
    }

    std::string require(const std::string& name) const {
        ArgValue arg = get(name);
        if (!arg.is_set) {
            throw std::invalid_argument("--" + name + " is required");
        }
        return arg.value;
    }
};

// ============================================================================
// Command Definitions
// ============================================================================

struct ArgDef {
    std::string name;            // --name
    std::string short_name;      // -x, optional
    std::string description;
    std::string default_value;
    bool required = false;
    bool is_flag = false;        // Takes no value
};

struct Command {
    std::string name;
    std::string description;
    std::vector<ArgDef> args;
    std::function<int(const Args&)> handler;

    const ArgDef* find_option(const std::string& token) const {
        for (const auto& arg : args) {
            if (token == "--" + arg.name) return &arg;
            if (!arg.short_name.empty() && token == "-" + arg.short_name) return &arg;
        }
        return nullptr;
    }

    void print_help(const std::string& program_name) const {
        std::cout << "\n" << program_name << " " << name << ": " << description << "\n\n";
        if (args.empty()) return;

        for (const auto& arg : args) {
            std::string flag = "--" + arg.name;
            if (!arg.short_name.empty()) flag = "-" + arg.short_name + ", " + flag;
            if (!arg.is_flag) flag += " <value>";

            std::cout << "  " << std::left << std::setw(26) << flag << arg.description;
            if (arg.required) std::cout << " [required]";
            if (!arg.default_value.empty()) std::cout << " [default: " << arg.default_value << "]";
            std::cout << "\n";
        }
        std::cout << "\n";
    }
};

// ============================================================================
// Dispatcher
// ============================================================================

/**
 * @brief Subcommand dispatcher for the cg executable
 *
 * Commands are listed in registration order. Handler exceptions are
 * reported on stderr and turn into exit code 1.
 */
class CLI {
public:
    CLI(const std::string& program_name, const std::string& version)
        : program_name_(program_name), version_(version) {}

    void register_command(Command cmd) {
        commands_.push_back(std::move(cmd));
    }

    int run(int argc, char** argv) {
        std::vector<std::string> tokens(argv + 1, argv + argc);
        if (tokens.empty()) {
            print_help();
            return 1;
        }

        const std::string& first = tokens.front();
        if (first == "--help" || first == "-h" || first == "help") {
            const Command* cmd = tokens.size() > 1 ? find_command(tokens[1]) : nullptr;
            if (cmd) {
                cmd->print_help(program_name_);
            } else {
                print_help();
            }
            return 0;
        }
        if (first == "--version" || first == "-v") {
            std::cout << program_name_ << " " << version_ << "\n";
            return 0;
        }

        const Command* cmd = find_command(first);
        if (!cmd) {
            std::cerr << "Unknown command '" << first << "'. See '"
                      << program_name_ << " --help'.\n";
            return 1;
        }

        std::vector<std::string> options(tokens.begin() + 1, tokens.end());
        for (const auto& token : options) {
            if (token == "--help" || token == "-h") {
                cmd->print_help(program_name_);
                return 0;
            }
        }

        Args args;
        try {
            args = parse_options(*cmd, options);
        } catch (const std::invalid_argument& e) {
            std::cerr << "Error: " << e.what() << "\n";
            cmd->print_help(program_name_);
            return 1;
        }

        try {
            return cmd->handler(args);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
    }

    void print_help() const {
        std::cout << program_name_ << " " << version_ << ": unified context graph\n\n"
                  << "Usage: " << program_name_ << " <command> [options]\n\n"
                  << "Commands:\n";
        for (const auto& cmd : commands_) {
            std::cout << "  " << std::left << std::setw(12) << cmd.name << cmd.description << "\n";
        }
        std::cout << "\nSee '" << program_name_ << " help <command>' for its options.\n";
    }

private:
    const Command* find_command(const std::string& name) const {
        for (const auto& cmd : commands_) {
            if (cmd.name == name) return &cmd;
        }
        return nullptr;
    }

    // Accepts --name value, --name=value, -x value and bare flags
    static Args parse_options(const Command& cmd, const std::vector<std::string>& tokens) {
        Args result;

        for (size_t i = 0; i < tokens.size(); ++i) {
            std::string token = tokens[i];
            std::string inline_value;
            bool has_inline_value = false;

            size_t eq = token.find('=');
            if (token.rfind("--", 0) == 0 && eq != std::string::npos) {
                inline_value = token.substr(eq + 1);
                token = token.substr(0, eq);
                has_inline_value = true;
            }

            const ArgDef* def = cmd.find_option(token);
            if (!def) {
                throw std::invalid_argument("Unknown option: " + tokens[i]);
            }

            if (def->is_flag) {
                if (has_inline_value) {
                    throw std::invalid_argument("--" + def->name + " takes no value");
                }
                result.named[def->name] = ArgValue{"true", true};
            } else if (has_inline_value) {
                result.named[def->name] = ArgValue{inline_value, true};
            } else if (i + 1 < tokens.size()) {
                result.named[def->name] = ArgValue{tokens[++i], true};
            } else {
                throw std::invalid_argument(token + " needs a value");
            }
        }

        for (const auto& def : cmd.args) {
            if (result.named.count(def.name)) continue;
            if (def.required) {
                throw std::invalid_argument("--" + def.name + " is required");
            }
            if (!def.default_value.empty()) {
                result.named[def.name] = ArgValue{def.default_value, true};
            }
        }

        return result;
    }

    std::string program_name_;
    std::string version_;
    std::vector<Command> commands_;
};

} // namespace cg
