#pragma once

#include <sstream>
#include <string>

namespace presencelink {
namespace utils {

/**
 * @brief Severity of a log line, ordered from most to least verbose.
 */
enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

/**
 * @brief Active threshold.
 *
 * Resolved once per process from PRESENCELINK_LOG_LEVEL
 * (debug|info|warn|error|off) or PRESENCELINK_DEBUG=1, defaulting to warn.
 * setLogLevel() replaces the resolved value.
 */
LogLevel activeLogLevel();
void setLogLevel(LogLevel level);

LogLevel parseLogLevel(const std::string& text, LogLevel fallback);
const char* toString(LogLevel level);

inline bool isLogEnabled(LogLevel level) {
    return level != LogLevel::Off && static_cast<int>(level) >= static_cast<int>(activeLogLevel());
}

// Writes "[presencelink] [LEVEL] message" to std::cerr as one line.
void writeLogLine(LogLevel level, const std::string& message);

} // namespace utils
} // namespace presencelink

#define PLINK_LOG(level, message) \
    do { \
        if (::presencelink::utils::isLogEnabled(level)) { \
            std::ostringstream plink_log_stream_; \
            plink_log_stream_ << message; \
            ::presencelink::utils::writeLogLine(level, plink_log_stream_.str()); \
        } \
    } while (false)

#define PLINK_LOG_DEBUG(message) PLINK_LOG(::presencelink::utils::LogLevel::Debug, message)
#define PLINK_LOG_INFO(message)  PLINK_LOG(::presencelink::utils::LogLevel::Info, message)
#define PLINK_LOG_WARN(message)  PLINK_LOG(::presencelink::utils::LogLevel::Warn, message)
#define PLINK_LOG_ERROR(message) PLINK_LOG(::presencelink::utils::LogLevel::Error, message)
