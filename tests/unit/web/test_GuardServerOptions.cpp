#include "CanonGuardTestHelper.hpp"
#include "canonguard/web/GuardServerOptions.hpp"

#include <string>
#include <vector>

using CG::Test::ArgvBuilder;
using CG::Test::EnvGuard;

namespace {

struct CleanServeEnv {
    EnvGuard host{"CANONGUARD_SERVE_HOST", nullptr};
    EnvGuard port{"CANONGUARD_SERVE_PORT", nullptr};
    EnvGuard config{"CANONGUARD_CONFIG", nullptr};
};

} // namespace

TEST_CASE("GuardServerOptions port range") {
    CHECK(CG::Web::IsValidGuardServerPort(80));
    CHECK(CG::Web::IsValidGuardServerPort(65535));
    CHECK_FALSE(CG::Web::IsValidGuardServerPort(0));
    CHECK_FALSE(CG::Web::IsValidGuardServerPort(70000));
}

TEST_CASE("GuardServerOptions Validate reports the offending flag") {
    CG::Web::GuardServerOptions options{};
    options.port = 70000;
    auto error   = CG::Web::ValidateGuardServerOptions(options);
    REQUIRE(error.has_value());
    CHECK(error->find("--port") != std::string::npos);

    options.port = 8080;
    options.host.clear();
    error = CG::Web::ValidateGuardServerOptions(options);
    REQUIRE(error.has_value());
    CHECK(error->find("--host") != std::string::npos);
}

TEST_CASE("GuardServerOptions parse flags over defaults") {
    CleanServeEnv env;

    ArgvBuilder defaults{"canonguard_serve"};
    auto        parsed = CG::Web::ParseGuardServerArguments(defaults.argc(), defaults.argv());
    REQUIRE(parsed.has_value());
    CHECK(parsed->host == "127.0.0.1");
    CHECK(parsed->port == 8080);
    CHECK(parsed->config_path.empty());

    ArgvBuilder args{"canonguard_serve", "--host", "0.0.0.0", "--port", "9090", "--config", "policy.json"};
    parsed = CG::Web::ParseGuardServerArguments(args.argc(), args.argv());
    REQUIRE(parsed.has_value());
    CHECK(parsed->host == "0.0.0.0");
    CHECK(parsed->port == 9090);
    CHECK(parsed->config_path == "policy.json");
    CHECK_FALSE(parsed->show_help);
}

TEST_CASE("GuardServerOptions reject bad arguments") {
    CleanServeEnv env;

    ArgvBuilder unknown{"canonguard_serve", "--verbose"};
    CHECK_FALSE(CG::Web::ParseGuardServerArguments(unknown.argc(), unknown.argv()).has_value());

    ArgvBuilder missingValue{"canonguard_serve", "--port"};
    CHECK_FALSE(CG::Web::ParseGuardServerArguments(missingValue.argc(), missingValue.argv()).has_value());

    ArgvBuilder badPort{"canonguard_serve", "--port", "80a"};
    CHECK_FALSE(CG::Web::ParseGuardServerArguments(badPort.argc(), badPort.argv()).has_value());
}

TEST_CASE("GuardServerOptions environment overrides apply before flags") {
    CleanServeEnv env;
    EnvGuard      host("CANONGUARD_SERVE_HOST", "10.0.0.5");
    EnvGuard      port("CANONGUARD_SERVE_PORT", "7000");
    EnvGuard      config("CANONGUARD_CONFIG", "/etc/canonguard.json");

    ArgvBuilder args{"canonguard_serve", "--port", "7001"};
    auto        parsed = CG::Web::ParseGuardServerArguments(args.argc(), args.argv());
    REQUIRE(parsed.has_value());
    CHECK(parsed->host == "10.0.0.5");
    CHECK(parsed->port == 7001);
    CHECK(parsed->config_path == "/etc/canonguard.json");
}

TEST_CASE("GuardServerOptions invalid environment port fails") {
    CleanServeEnv               env;
    EnvGuard                    port("CANONGUARD_SERVE_PORT", "0");
    CG::Web::GuardServerOptions options{};
    CHECK_FALSE(CG::Web::ApplyGuardServerEnvOverrides(options));
}
