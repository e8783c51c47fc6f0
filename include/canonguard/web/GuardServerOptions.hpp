#pragma once

#include <optional>
#include <string>

namespace CG::Web {

struct GuardServerOptions {
    std::string host{"127.0.0.1"};
    int         port{8080};
    std::string config_path;
    bool        show_help{false};
};

auto ParseGuardServerArguments(int argc, char** argv) -> std::optional<GuardServerOptions>;

void PrintGuardServerUsage();

bool ApplyGuardServerEnvOverrides(GuardServerOptions& options);

auto ValidateGuardServerOptions(GuardServerOptions const& options) -> std::optional<std::string>;

bool IsValidGuardServerPort(int port);

} // namespace CG::Web
