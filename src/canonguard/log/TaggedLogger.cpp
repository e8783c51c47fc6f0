#ifdef CG_LOG_DEBUG
#include "TaggedLogger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string_view>

namespace CG {

namespace {

auto env_flag(const char* key) -> bool {
    const char* raw = std::getenv(key);
    if (raw == nullptr) {
        return false;
    }
    std::string value{raw};
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

auto env_tags(const char* key) -> std::set<std::string> {
    std::set<std::string> tags;
    const char*           raw = std::getenv(key);
    if (raw == nullptr) {
        return tags;
    }
    std::string_view rest{raw};
    while (!rest.empty()) {
        auto comma = rest.find(',');
        auto token = rest.substr(0, comma);
        while (!token.empty() && std::isspace(static_cast<unsigned char>(token.front())) != 0)
            token.remove_prefix(1);
        while (!token.empty() && std::isspace(static_cast<unsigned char>(token.back())) != 0)
            token.remove_suffix(1);
        if (!token.empty())
            tags.emplace(token);
        if (comma == std::string_view::npos)
            break;
        rest.remove_prefix(comma + 1);
    }
    return tags;
}

// "src/canonguard/rules/DateRule.cpp" -> "rules/DateRule.cpp"
auto short_location(const char* file) -> std::string {
    std::filesystem::path path{file};
    if (!path.has_parent_path()) {
        return path.filename().string();
    }
    return (path.parent_path().filename() / path.filename()).string();
}

} // namespace

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger() {
    if (env_flag("CANONGUARD_LOG_ENABLED") || env_flag("CANONGUARD_LOG")) {
        this->enabled.store(true, std::memory_order_relaxed);
    }
    this->onlyTags = env_tags("CANONGUARD_LOG_ENABLE_TAGS");
    this->skipTags.merge(env_tags("CANONGUARD_LOG_SKIP_TAGS"));
    this->worker = std::thread(&TaggedLogger::drain, this);
}

TaggedLogger::~TaggedLogger() {
    {
        std::lock_guard<std::mutex> lock(this->queueMutex);
        this->stopping = true;
    }
    this->queueReady.notify_one();
    if (this->worker.joinable()) {
        this->worker.join();
    }
}

auto TaggedLogger::setThreadName(const std::string& name) -> void {
    std::lock_guard<std::mutex> lock(this->labelMutex);
    this->labels[std::this_thread::get_id()] = name;
}

auto TaggedLogger::setLoggingEnabled(bool on) -> void {
    this->enabled.store(on, std::memory_order_relaxed);
}

auto TaggedLogger::accepts(std::vector<std::string> const& tags) const -> bool {
    for (auto const& tag : tags) {
        if (this->skipTags.contains(tag))
            return false;
        if (!this->onlyTags.empty() && !this->onlyTags.contains(tag))
            return false;
    }
    return true;
}

auto TaggedLogger::enqueue(const std::string& message, const std::source_location& location, std::vector<std::string> tags)
        -> void {
    if (!this->accepts(tags))
        return;
    Record record{.timestamp = std::chrono::system_clock::now(),
                  .tags      = std::move(tags),
                  .message   = message,
                  .thread    = this->threadLabel(),
                  .location  = location};
    {
        std::lock_guard<std::mutex> lock(this->queueMutex);
        this->pending.push_back(std::move(record));
    }
    this->queueReady.notify_one();
}

auto TaggedLogger::threadLabel() -> std::string {
    std::lock_guard<std::mutex> lock(this->labelMutex);
    auto [it, inserted] = this->labels.try_emplace(std::this_thread::get_id());
    if (inserted) {
        it->second = "Thread " + std::to_string(this->nextLabel++);
    }
    return it->second;
}

auto TaggedLogger::drain() -> void {
    std::vector<Record> batch;
    while (true) {
        {
            std::unique_lock<std::mutex> lock(this->queueMutex);
            this->queueReady.wait(lock, [this] { return !this->pending.empty() || this->stopping; });
            if (this->pending.empty()) {
                return;
            }
            batch.swap(this->pending);
        }
        std::string text;
        for (auto const& record : batch) {
            text += format(record);
        }
        std::cerr << text << std::flush;
        batch.clear();
    }
}

// 2024-05-01 12:00:00.042 [Validation] [Thread 0] [rules/StringRule.cpp:61] message
auto TaggedLogger::format(const Record& record) -> std::string {
    auto const seconds = std::chrono::system_clock::to_time_t(record.timestamp);
    auto const millis =
            std::chrono::duration_cast<std::chrono::milliseconds>(record.timestamp.time_since_epoch()).count() % 1000;
    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis << ' ';
    oss << '[';
    for (std::size_t i = 0; i < record.tags.size(); ++i) {
        oss << (i == 0 ? "" : "][") << record.tags[i];
    }
    oss << "] [" << record.thread << "] [" << short_location(record.location.file_name()) << ':' << record.location.line()
        << "] " << record.message << '\n';
    return oss.str();
}

void set_thread_name(const std::string& name) {
    logger().setThreadName(name);
}

void set_logging_enabled(bool enabled) {
    logger().setLoggingEnabled(enabled);
}

} // namespace CG
#endif // CG_LOG_DEBUG
