#include "canonguard/web/GuardServerOptions.hpp"

#include <charconv>
#include <cstdlib>
#include <iostream>
#include <string_view>

namespace CG::Web {

namespace {

template <typename T>
bool parse_integer_in_range(std::string_view text, T min, T max, T& out) {
    T    value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    if (value < min || value > max) {
        return false;
    }
    out = value;
    return true;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

} // namespace

bool IsValidGuardServerPort(int port) {
    return port > 0 && port <= 65535;
}

auto ValidateGuardServerOptions(GuardServerOptions const& options) -> std::optional<std::string> {
    if (options.host.empty()) {
        return std::string{"--host must not be empty"};
    }
    if (!IsValidGuardServerPort(options.port)) {
        return std::string{"--port must be within 1-65535"};
    }
    return std::nullopt;
}

bool ApplyGuardServerEnvOverrides(GuardServerOptions& options) {
    if (!apply_env("CANONGUARD_SERVE_HOST", [&](std::string_view value) {
            if (value.empty()) {
                std::cerr << "CANONGUARD_SERVE_HOST must not be empty\n";
                return false;
            }
            options.host = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_env("CANONGUARD_SERVE_PORT", [&](std::string_view value) {
            int parsed = options.port;
            if (!parse_integer_in_range<int>(value, 1, 65535, parsed)) {
                std::cerr << "CANONGUARD_SERVE_PORT must be within 1-65535\n";
                return false;
            }
            options.port = parsed;
            return true;
        })) {
        return false;
    }

    if (!apply_env("CANONGUARD_CONFIG", [&](std::string_view value) {
            options.config_path = std::string{value};
            return true;
        })) {
        return false;
    }

    return true;
}

void PrintGuardServerUsage() {
    std::cout << "Usage: canonguard_serve [options]\n"
              << "  --host <host>     Bind address (default 127.0.0.1)\n"
              << "  --port <port>     Bind port (default 8080)\n"
              << "  --config <path>   Security configuration JSON (defaults when omitted)\n"
              << "  --help            Show this help\n";
}

std::optional<GuardServerOptions> ParseGuardServerArguments(int argc, char** argv) {
    GuardServerOptions options{};
    if (!ApplyGuardServerEnvOverrides(options)) {
        return std::nullopt;
    }

    auto require_value = [&](int& index, std::string_view flag) -> std::optional<std::string_view> {
        if (index + 1 >= argc) {
            std::cerr << flag << " requires a value\n";
            return std::nullopt;
        }
        return std::string_view{argv[++index]};
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == "--host") {
            if (auto value = require_value(i, "--host")) {
                if (value->empty()) {
                    std::cerr << "--host must not be empty\n";
                    return std::nullopt;
                }
                options.host = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--port") {
            if (auto value = require_value(i, "--port")) {
                int parsed = options.port;
                if (!parse_integer_in_range<int>(*value, 1, 65535, parsed)) {
                    std::cerr << "--port must be within 1-65535\n";
                    return std::nullopt;
                }
                options.port = parsed;
            } else {
                return std::nullopt;
            }
        } else if (arg == "--config") {
            if (auto value = require_value(i, "--config")) {
                options.config_path = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return std::nullopt;
        }
    }

    if (auto problem = ValidateGuardServerOptions(options)) {
        std::cerr << *problem << "\n";
        return std::nullopt;
    }
    return options;
}

} // namespace CG::Web
