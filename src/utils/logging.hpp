#pragma once

#include <string>
#include <unordered_map>

namespace rampart::utils {

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

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback);

struct LogMessage {
    LogLevel level;
    std::string tag;
    std::string message;
    std::unordered_map<std::string, std::string> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

// Reads RAMPART_LOG_LEVEL on first use.
LogConfig& GlobalLogConfig();

std::string FormatLogLine(const LogMessage& msg);

// Writes "[tag] LEVEL message key=value ..." to stderr.
void Log(LogLevel level,
         const std::string& tag,
         const std::string& message,
         const std::unordered_map<std::string, std::string>& fields = {});

inline void LogDebug(const std::string& tag, const std::string& message) {
    Log(LogLevel::kDebug, tag, message);
}

inline void LogInfo(const std::string& tag, const std::string& message) {
    Log(LogLevel::kInfo, tag, message);
}

inline void LogWarn(const std::string& tag, const std::string& message) {
    Log(LogLevel::kWarn, tag, message);
}

inline void LogError(const std::string& tag, const std::string& message) {
    Log(LogLevel::kError, tag, message);
}

}  // namespace rampart::utils
