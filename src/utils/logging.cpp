#include "utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>

namespace rampart::utils {
namespace {

std::mutex& LogMutex() {
    static std::mutex mutex;
    return mutex;
}

}  // namespace

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") {
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

LogConfig& GlobalLogConfig() {
    static LogConfig config = [] {
        LogConfig initial{};
        if (const char* value = std::getenv("RAMPART_LOG_LEVEL")) {
            initial.min_level = ParseLogLevel(value, initial.min_level);
        }
        return initial;
    }();
    return config;
}

std::string FormatLogLine(const LogMessage& msg) {
    std::ostringstream oss;
    oss << "[" << msg.tag << "] " << ToString(msg.level) << " " << msg.message;
    // Sorted so lines are stable across runs.
    const std::map<std::string, std::string> sorted(msg.fields.begin(), msg.fields.end());
    for (const auto& [key, value] : sorted) {
        oss << " " << key << "=" << value;
    }
    return oss.str();
}

void Log(LogLevel level,
         const std::string& tag,
         const std::string& message,
         const std::unordered_map<std::string, std::string>& fields) {
    if (static_cast<int>(level) < static_cast<int>(GlobalLogConfig().min_level)) {
        return;
    }
    const auto line = FormatLogLine(LogMessage{level, tag, message, fields});
    std::lock_guard<std::mutex> guard(LogMutex());
    std::cerr << line << std::endl;
}

}  // namespace rampart::utils
