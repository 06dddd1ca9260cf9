#include "utils/logging.hpp"

#include <algorithm>
#include <atomic>
#include <iostream>
#include <map>
#include <mutex>

#include "utils/common.hpp"

namespace kiln::utils {
namespace {

std::mutex g_log_mutex;
std::atomic<int> g_min_level{static_cast<int>(LogLevel::kInfo)};

}  // namespace

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
    const auto lowered = ToLower(Trim(value));
    if (lowered == "debug" || lowered == "trace") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return fallback;
}

void ConfigureLogging(const LogConfig& config) {
    g_min_level = static_cast<int>(config.min_level);
}

LogConfig CurrentLogConfig() {
    LogConfig config{};
    config.min_level = static_cast<LogLevel>(g_min_level.load());
    return config;
}

void Log(const std::string& tag, const LogMessage& message) {
    if (static_cast<int>(message.level) < g_min_level.load()) {
        return;
    }
    // Sorted so that lines are stable across runs.
    std::map<std::string, std::string> ordered(message.fields.begin(), message.fields.end());
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << "[" << tag << "] " << ToString(message.level) << " " << message.message;
    for (const auto& [key, value] : ordered) {
        std::cerr << " " << key << "=" << value;
    }
    std::cerr << std::endl;
}

void Log(LogLevel level,
         const std::string& tag,
         const std::string& message,
         const std::unordered_map<std::string, std::string>& fields) {
    Log(tag, LogMessage{level, message, fields});
}

}  // namespace kiln::utils
