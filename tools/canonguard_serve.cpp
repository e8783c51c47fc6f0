#include <csignal>
#include <cstdlib>
#include <iostream>

#include <CanonGuard.hpp>
#include <canonguard/web/GuardServer.hpp>

namespace {
void handle_signal(int) {
    CG::Web::RequestGuardServerStop();
}
} // namespace

int main(int argc, char** argv) {
    auto options_opt = CG::Web::ParseGuardServerArguments(argc, argv);
    if (!options_opt) {
        return EXIT_FAILURE;
    }

    auto options = *options_opt;
    if (options.show_help) {
        CG::Web::PrintGuardServerUsage();
        return EXIT_SUCCESS;
    }

    auto configuration = options.config_path.empty() ? CG::Expected<CG::SecurityConfiguration>{CG::SecurityConfiguration{}}
                                                     : CG::LoadSecurityConfiguration(options.config_path);
    if (!configuration) {
        std::cerr << "[canonguard_serve] " << CG::describeErrorChain(configuration.error()) << "\n";
        return EXIT_FAILURE;
    }
    if (!CG::ApplySecurityConfigurationEnvOverrides(*configuration)) {
        return EXIT_FAILURE;
    }

    auto policy = CG::SecurityPolicy::create(std::move(*configuration));
    if (!policy) {
        std::cerr << "[canonguard_serve] " << CG::describeErrorChain(policy.error()) << "\n";
        return EXIT_FAILURE;
    }
    auto validator = CG::Validator::create(std::move(*policy));

    CG::Web::ResetGuardServerStopFlag();
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    return CG::Web::RunGuardServer(*validator, options);
}
