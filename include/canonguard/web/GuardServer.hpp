#pragma once

#include "canonguard/validation/Validator.hpp"
#include "canonguard/web/GuardServerOptions.hpp"

#include <atomic>
#include <string>

namespace httplib {
class Server;
struct Request;
} // namespace httplib

namespace CG::Web {

// Outcome of screening one request before routing; status 0 lets it through.
struct GuardDecision {
    int         status{0};
    std::string message;
};

auto EvaluateRequest(Validator const& validator, httplib::Request const& req) -> GuardDecision;

// Rejects every request that fails whole-request validation: 400 for invalid input, 403 for intrusion.
void InstallRequestGuard(httplib::Server& server, Validator const& validator);

void RequestGuardServerStop();
void ResetGuardServerStopFlag();

int RunGuardServerWithStopFlag(Validator const& validator, GuardServerOptions const& options, std::atomic<bool>& should_stop);
int RunGuardServer(Validator const& validator, GuardServerOptions const& options);

} // namespace CG::Web
