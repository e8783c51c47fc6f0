#ifdef CG_LOG_DEBUG
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <set>
#include <source_location>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace CG {

/**
 * Asynchronous tagged logger. Records are filtered by tag when they are queued and
 * written to stderr by a single worker thread; the destructor drains the queue.
 *
 * Environment (read once at construction):
 *   CANONGUARD_LOG_ENABLED / CANONGUARD_LOG  turn logging on (1, true, yes, on)
 *   CANONGUARD_LOG_ENABLE_TAGS               only records whose tags are all listed
 *   CANONGUARD_LOG_SKIP_TAGS                 drop records carrying any listed tag ("Trace" always)
 */
class TaggedLogger {
public:
    TaggedLogger();
    ~TaggedLogger();

    TaggedLogger(const TaggedLogger&)            = delete;
    TaggedLogger& operator=(const TaggedLogger&) = delete;

    template <typename... Tags>
    auto log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void {
        if (!enabled.load(std::memory_order_relaxed))
            return;
        this->enqueue(message, location, {std::string(std::forward<Tags>(tags))...});
    }

    auto setThreadName(const std::string& name) -> void;
    auto setLoggingEnabled(bool on) -> void;

private:
    struct Record {
        std::chrono::system_clock::time_point timestamp;
        std::vector<std::string>              tags;
        std::string                           message;
        std::string                           thread;
        std::source_location                  location;
    };

    auto accepts(std::vector<std::string> const& tags) const -> bool;
    auto enqueue(const std::string& message, const std::source_location& location, std::vector<std::string> tags) -> void;
    auto threadLabel() -> std::string;
    auto drain() -> void;
    static auto format(const Record& record) -> std::string;

    std::atomic<bool>     enabled{false};
    std::set<std::string> onlyTags;
    std::set<std::string> skipTags{"Trace"};

    std::mutex              queueMutex;
    std::condition_variable queueReady;
    std::vector<Record>     pending;
    bool                    stopping{false};

    std::mutex                                       labelMutex;
    std::unordered_map<std::thread::id, std::string> labels;
    int                                              nextLabel{0};

    std::thread worker;
};

TaggedLogger& logger();

#define cg_log(message, ...) ::CG::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)

void set_thread_name(const std::string& name);
void set_logging_enabled(bool enabled);

} // namespace CG

#else
#define cg_log(message, ...) ((void)0)
#endif // CG_LOG_DEBUG
