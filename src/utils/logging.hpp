#pragma once

#include <string>
#include <unordered_map>

namespace kiln::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo: return "INFO";
        case LogLevel::kWarn: return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback = LogLevel::kInfo);

struct LogMessage {
    LogLevel level;
    std::string message;
    std::unordered_map<std::string, std::string> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

void ConfigureLogging(const LogConfig& config);
LogConfig CurrentLogConfig();

// Writes "[tag] LEVEL message key=value ..." to stderr.
void Log(const std::string& tag, const LogMessage& message);
void Log(LogLevel level,
         const std::string& tag,
         const std::string& message,
         const std::unordered_map<std::string, std::string>& fields = {});

inline void LogDebug(const std::string& tag,
                     const std::string& message,
                     const std::unordered_map<std::string, std::string>& fields = {}) {
    Log(LogLevel::kDebug, tag, message, fields);
}

inline void LogInfo(const std::string& tag,
                    const std::string& message,
                    const std::unordered_map<std::string, std::string>& fields = {}) {
    Log(LogLevel::kInfo, tag, message, fields);
}

inline void LogWarn(const std::string& tag,
                    const std::string& message,
                    const std::unordered_map<std::string, std::string>& fields = {}) {
    Log(LogLevel::kWarn, tag, message, fields);
}

inline void LogError(const std::string& tag,
                     const std::string& message,
                     const std::unordered_map<std::string, std::string>& fields = {}) {
    Log(LogLevel::kError, tag, message, fields);
}

}  // namespace kiln::utils
