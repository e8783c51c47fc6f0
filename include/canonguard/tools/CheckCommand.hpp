#pragma once

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>

namespace CG::Tools {

enum class CheckKind { Input, Directory, FileName };

struct CheckOptions {
    std::string config_path;
    CheckKind   kind{CheckKind::Input};
    std::string type{"SafeString"};
    std::size_t max_length{256};
    bool        allow_null{false};
    std::string value;
    bool        has_value{false};
    bool        show_help{false};
};

// Problems are written to err; nullopt means the command line is unusable.
auto ParseCheckArguments(int argc, char** argv, std::ostream& err) -> std::optional<CheckOptions>;

void PrintCheckUsage(std::ostream& out);

/**
 * Loads the configuration (defaults when config_path is empty, then the
 * CANONGUARD_* environment overrides) and checks one value in strict mode.
 * Prints "valid" to out and returns 0, or "invalid: <user message>" to out with
 * the log message on err and returns 1. Configuration problems also return 1.
 */
auto RunCheck(CheckOptions const& options, std::ostream& out, std::ostream& err) -> int;

// Whole command: parse, usage on --help or bad flags, then RunCheck.
auto RunCheckCommand(int argc, char** argv, std::ostream& out, std::ostream& err) -> int;

} // namespace CG::Tools
