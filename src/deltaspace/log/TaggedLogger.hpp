#pragma once
#ifdef DS_LOG_DEBUG
#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <source_location>
#include <string>

namespace DS {

/**
 * Tag-filtered diagnostic logger.
 *
 * Messages are formatted and written to stderr on the calling thread. A
 * message is dropped when logging is disabled or when any of its tags is in
 * the skip set; when the enabled set is non-empty only messages carrying at
 * least one enabled tag are written.
 */
class TaggedLogger {
public:
    struct LogMessage {
        std::chrono::system_clock::time_point timestamp;
        std::set<std::string>                 tags;
        std::string                           message;
        std::source_location                  location;
    };

    TaggedLogger();
    ~TaggedLogger() = default;

    TaggedLogger(const TaggedLogger&)            = delete;
    TaggedLogger& operator=(const TaggedLogger&) = delete;
    TaggedLogger(TaggedLogger&&)                 = delete;
    TaggedLogger& operator=(TaggedLogger&&)      = delete;

    template <typename... Tags>
    auto log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void;

    auto setLoggingEnabled(bool enabled) -> void;
    auto skipTag(const std::string& tag) -> void;
    auto enableTag(const std::string& tag) -> void;

    static std::mutex coutMutex;

private:
    std::atomic<bool>     loggingEnabled;
    std::set<std::string> skipTags{};
    std::set<std::string> enabledTags{};
    mutable std::mutex    tagsMutex;

    auto        accepts(const std::set<std::string>& tags) const -> bool;
    auto        writeToStderr(const LogMessage& msg) const -> void;
    static auto getShortPath(const char* filepath) -> std::string;
};

TaggedLogger& logger();

template <typename... Tags>
auto TaggedLogger::log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void {
    if (!loggingEnabled)
        return;

    auto const logMessage = LogMessage{.timestamp = std::chrono::system_clock::now(),
                                       .tags      = {std::string(std::forward<Tags>(tags))...},
                                       .message   = message,
                                       .location  = location};
    if (!this->accepts(logMessage.tags))
        return;
    this->writeToStderr(logMessage);
}

#define ds_log(message, ...) ::DS::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)

void set_logging_enabled(bool enabled);

} // namespace DS

#else
#define ds_log(message, ...) ((void)0)
#endif // DS_LOG_DEBUG
