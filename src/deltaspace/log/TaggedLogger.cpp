#ifdef DS_LOG_DEBUG
#include "log/TaggedLogger.hpp"

#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace DS {

std::mutex TaggedLogger::coutMutex;

TaggedLogger::TaggedLogger() : loggingEnabled(true) {}

auto TaggedLogger::setLoggingEnabled(bool enabled) -> void {
    loggingEnabled.store(enabled, std::memory_order_relaxed);
}

auto TaggedLogger::skipTag(const std::string& tag) -> void {
    std::lock_guard<std::mutex> lock(tagsMutex);
    skipTags.insert(tag);
}

auto TaggedLogger::enableTag(const std::string& tag) -> void {
    std::lock_guard<std::mutex> lock(tagsMutex);
    enabledTags.insert(tag);
}

auto TaggedLogger::accepts(const std::set<std::string>& tags) const -> bool {
    std::lock_guard<std::mutex> lock(tagsMutex);
    for (auto const& tag : tags) {
        if (skipTags.contains(tag))
            return false;
    }
    if (enabledTags.empty())
        return true;
    for (auto const& tag : tags) {
        if (enabledTags.contains(tag))
            return true;
    }
    return false;
}

auto TaggedLogger::writeToStderr(const LogMessage& msg) const -> void {
    const auto now      = msg.timestamp;
    const auto nowMs    = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    const auto nowTimeT = std::chrono::system_clock::to_time_t(now);
    std::tm    nowTm{};
    localtime_r(&nowTimeT, &nowTm);

    std::ostringstream oss;
    oss << std::put_time(&nowTm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << nowMs.count() << ' ';

    oss << '[';
    bool first = true;
    for (auto const& tag : msg.tags) {
        if (!first)
            oss << "][";
        oss << tag;
        first = false;
    }
    oss << "] ";

    oss << getShortPath(msg.location.file_name()) << ':' << msg.location.line() << ' ';
    oss << msg.message << '\n';

    std::lock_guard<std::mutex> lock(coutMutex);
    std::cerr << oss.str() << std::flush;
}

auto TaggedLogger::getShortPath(const char* filepath) -> std::string {
    if (filepath == nullptr)
        return {};
    return std::filesystem::path(filepath).filename().string();
}

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

void set_logging_enabled(bool enabled) {
    logger().setLoggingEnabled(enabled);
}

} // namespace DS
#endif // DS_LOG_DEBUG
