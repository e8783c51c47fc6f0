#include "CanonGuardTestHelper.hpp"
#include "log/TaggedLogger.hpp"

#include <chrono>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

#ifdef CG_LOG_DEBUG

using namespace std::chrono_literals;
using CG::Test::EnvGuard;

namespace {

// Clears every logger variable for the lifetime of a test.
struct QuietEnvironment {
    EnvGuard enabled{"CANONGUARD_LOG_ENABLED", nullptr};
    EnvGuard log{"CANONGUARD_LOG", nullptr};
    EnvGuard enableTags{"CANONGUARD_LOG_ENABLE_TAGS", nullptr};
    EnvGuard skipTags{"CANONGUARD_LOG_SKIP_TAGS", nullptr};
};

auto captureStderr(std::function<void()> fn) -> std::string {
    std::ostringstream buffer;
    auto*              original = std::cerr.rdbuf(buffer.rdbuf());
    fn();
    std::cerr.rdbuf(original);
    return buffer.str();
}

// The logger destructor drains the queue, so scoping it flushes everything.
auto logOnce(std::string const& message, std::string const& tag) -> std::string {
    return captureStderr([&] {
        CG::TaggedLogger logger;
        logger.log_impl(message, std::source_location::current(), tag);
    });
}

} // namespace

TEST_SUITE("log.tagged_logger") {

TEST_CASE("logging_disabled_by_default_drops_messages") {
    QuietEnvironment env;
    CHECK(logOnce("should not appear", "Validation").empty());
}

TEST_CASE("environment_flag_enables_logging") {
    QuietEnvironment env;
    EnvGuard         enable("CANONGUARD_LOG_ENABLED", "1");

    auto output = logOnce("hello log", "Validation");
    CHECK(output.find("[Validation]") != std::string::npos);
    CHECK(output.find("hello log") != std::string::npos);
    CHECK(output.find("Thread 0") != std::string::npos);
}

TEST_CASE("short_env_name_accepts_words") {
    QuietEnvironment env;
    EnvGuard         enable("CANONGUARD_LOG", "on");
    CHECK(logOnce("env enabled", "Intrusion").find("env enabled") != std::string::npos);
}

TEST_CASE("trace_is_skipped_by_default") {
    QuietEnvironment env;
    EnvGuard         enable("CANONGUARD_LOG_ENABLED", "1");
    CHECK(logOnce("filtered", "Trace").empty());
}

TEST_CASE("enabled_tags_gate_output") {
    QuietEnvironment env;
    EnvGuard         enable("CANONGUARD_LOG_ENABLED", "1");
    EnvGuard         focus("CANONGUARD_LOG_ENABLE_TAGS", "Intrusion");

    CHECK(logOnce("keep me", "Intrusion").find("keep me") != std::string::npos);
    CHECK(logOnce("drop me", "Validation").empty());
}

TEST_CASE("skip_tags_are_trimmed_and_extend_the_filter") {
    QuietEnvironment env;
    EnvGuard         enable("CANONGUARD_LOG_ENABLED", "1");
    EnvGuard         skip("CANONGUARD_LOG_SKIP_TAGS", " Validation , Codec ");

    CHECK(logOnce("first", "Codec").empty());
    CHECK(logOnce("second", "Validation").empty());
    CHECK(logOnce("third", "Intrusion").find("third") != std::string::npos);
}

TEST_CASE("multiple_tags_are_written_in_call_order") {
    QuietEnvironment env;
    EnvGuard         enable("CANONGUARD_LOG_ENABLED", "1");

    auto output = captureStderr([] {
        CG::TaggedLogger logger;
        logger.log_impl("first", std::source_location::current(), "Validation", "Error");
        logger.log_impl("second", std::source_location::current(), "Encoding");
    });
    CHECK(output.find("[Validation][Error]") != std::string::npos);
    CHECK(output.find("first") < output.find("second"));
}

TEST_CASE("enabled_tags_must_cover_every_tag") {
    QuietEnvironment env;
    EnvGuard         enable("CANONGUARD_LOG_ENABLED", "1");
    EnvGuard         focus("CANONGUARD_LOG_ENABLE_TAGS", "Validation");

    auto output = captureStderr([] {
        CG::TaggedLogger logger;
        logger.log_impl("mixed", std::source_location::current(), "Validation", "Error");
    });
    CHECK(output.empty());
}

TEST_CASE("thread_name_is_used_in_output") {
    QuietEnvironment env;
    EnvGuard         enable("CANONGUARD_LOG_ENABLED", "1");

    auto output = captureStderr([] {
        CG::TaggedLogger logger;
        logger.setThreadName("Screen-3");
        logger.log_impl("with name", std::source_location::current(), "Web");
    });
    CHECK(output.find("[Screen-3]") != std::string::npos);
}

TEST_CASE("set_logging_enabled_overrides_env") {
    QuietEnvironment env;
    EnvGuard         enable("CANONGUARD_LOG_ENABLED", "1");

    auto suppressed = captureStderr([] {
        CG::TaggedLogger logger;
        logger.setLoggingEnabled(false);
        logger.log_impl("disabled", std::source_location::current(), "Validation");
    });
    CHECK(suppressed.empty());
}

TEST_CASE("short_path_includes_parent_directory") {
    QuietEnvironment env;
    EnvGuard         enable("CANONGUARD_LOG_ENABLED", "1");

    auto output = captureStderr([] {
        CG::TaggedLogger logger;
#line 42 "rules/DateRuleTrace.cpp"
        logger.log_impl("has parent", std::source_location::current(), "Rules");
#line 125 "tests/unit/log/test_TaggedLogger.cpp"
    });
    CHECK(output.find("rules/DateRuleTrace.cpp:42") != std::string::npos);
}

TEST_CASE("validation_rejections_reach_the_global_logger") {
    QuietEnvironment env;

    auto output = captureStderr([] {
        CG::set_logging_enabled(true);
        auto validator = CG::Test::makeValidator();
        CHECK_FALSE(validator->isValidInput("search", "<script>", "SafeString", 64, false));
        std::this_thread::sleep_for(50ms);
        CG::set_logging_enabled(false);
    });
    CHECK(output.find("[Validation]") != std::string::npos);
    CHECK(output.find("context=search") != std::string::npos);
}

} // TEST_SUITE

#endif // CG_LOG_DEBUG
