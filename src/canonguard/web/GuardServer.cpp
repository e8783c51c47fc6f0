#include "canonguard/web/GuardServer.hpp"

#include "canonguard/core/Exceptions.hpp"
#include "log/TaggedLogger.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <thread>

namespace CG::Web {

static std::atomic<bool> g_should_stop{false};

namespace {

void respond_rejected(httplib::Response& res, int status, std::string const& message) {
    nlohmann::json body{{"error", message}, {"status", status}};
    res.status = status;
    res.set_header("Cache-Control", "no-store");
    res.set_content(body.dump(), "application/json");
}

} // namespace

auto EvaluateRequest(Validator const& validator, httplib::Request const& req) -> GuardDecision {
    try {
        validator.assertIsValidHTTPRequest(&req);
    } catch (IntrusionException const& e) {
        cg_log("Rejected request " + req.method + " " + req.path + ": " + e.logMessage(), "Intrusion", "Web");
        return GuardDecision{403, e.userMessage()};
    } catch (ValidationException const& e) {
        cg_log("Rejected request " + req.method + " " + req.path + ": " + e.logMessage(), "Validation", "Web");
        return GuardDecision{400, e.userMessage()};
    }
    return GuardDecision{};
}

void InstallRequestGuard(httplib::Server& server, Validator const& validator) {
    server.set_pre_routing_handler([&validator](httplib::Request const& req, httplib::Response& res) {
        auto decision = EvaluateRequest(validator, req);
        if (decision.status == 0) {
            return httplib::Server::HandlerResponse::Unhandled;
        }
        respond_rejected(res, decision.status, decision.message);
        return httplib::Server::HandlerResponse::Handled;
    });
}

void RequestGuardServerStop() {
    g_should_stop.store(true);
}

void ResetGuardServerStopFlag() {
    g_should_stop.store(false);
}

int RunGuardServerWithStopFlag(Validator const& validator, GuardServerOptions const& options, std::atomic<bool>& should_stop) {
    httplib::Server server;
    InstallRequestGuard(server, validator);

    server.Get("/healthz", [](httplib::Request const&, httplib::Response& res) {
        res.set_header("Cache-Control", "no-store");
        res.set_content("ok", "text/plain");
    });

    // Form bodies are parsed after pre-routing, so the handler screens the request again.
    server.Post("/echo", [&validator](httplib::Request const& req, httplib::Response& res) {
        if (auto decision = EvaluateRequest(validator, req); decision.status != 0) {
            respond_rejected(res, decision.status, decision.message);
            return;
        }
        nlohmann::json params = nlohmann::json::object();
        for (auto const& [name, value] : req.params) {
            params[name] = value;
        }
        res.set_content(nlohmann::json{{"params", params}}.dump(), "application/json");
    });

    std::atomic<bool> listen_failed{false};
    std::thread       server_thread([&]() {
        if (!server.listen(options.host.c_str(), options.port)) {
            if (!should_stop.load()) {
                listen_failed.store(true);
                should_stop.store(true);
                std::cerr << "[canonguard_serve] Failed to bind " << options.host << ":" << options.port << '\n';
            }
        }
    });

    std::cout << "[canonguard_serve] Listening on http://" << options.host << ":" << options.port << '\n';

    while (!should_stop.load(std::memory_order_acquire) && !listen_failed.load(std::memory_order_acquire)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    server.stop();
    if (server_thread.joinable()) {
        server_thread.join();
    }
    return listen_failed.load() ? EXIT_FAILURE : EXIT_SUCCESS;
}

int RunGuardServer(Validator const& validator, GuardServerOptions const& options) {
    return RunGuardServerWithStopFlag(validator, options, g_should_stop);
}

} // namespace CG::Web
