#include "presencelink/utils/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace presencelink {
namespace utils {

namespace {

LogLevel resolveFromEnvironment() {
    if (const char* level = std::getenv("PRESENCELINK_LOG_LEVEL")) {
        return parseLogLevel(level, LogLevel::Warn);
    }
    if (const char* debug = std::getenv("PRESENCELINK_DEBUG")) {
        if (std::string(debug) == "1") {
            return LogLevel::Debug;
        }
    }
    return LogLevel::Warn;
}

std::atomic<int>& levelStorage() {
    static std::atomic<int> level{static_cast<int>(resolveFromEnvironment())};
    return level;
}

std::mutex& outputMutex() {
    static std::mutex mutex;
    return mutex;
}

} // namespace

LogLevel activeLogLevel() {
    return static_cast<LogLevel>(levelStorage().load(std::memory_order_relaxed));
}

void setLogLevel(LogLevel level) {
    levelStorage().store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel parseLogLevel(const std::string& text, LogLevel fallback) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "debug" || lowered == "trace") return LogLevel::Debug;
    if (lowered == "info") return LogLevel::Info;
    if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
    if (lowered == "error") return LogLevel::Error;
    if (lowered == "off" || lowered == "none") return LogLevel::Off;
    return fallback;
}

const char* toString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off: return "OFF";
    }
    return "OFF";
}

void writeLogLine(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(outputMutex());
    std::cerr << "[presencelink] [" << toString(level) << "] " << message << std::endl;
}

} // namespace utils
} // namespace presencelink
