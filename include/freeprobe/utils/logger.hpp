/**
 * @file logger.hpp
 * @brief Thread-safe logging for FreeProbe.
 *
 * One line per call: timestamp, level tag, component tag, message.
 * Output goes to stderr unless redirected, so that dry-run metrics on
 * stdout stay clean.
 *
 * @copyright Copyright (c) 2024 FreeProbe Contributors
 * @license MIT License
 */

#pragma once

#include "freeprobe/utils/export.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace freeprobe {
namespace utils {

/**
 * @enum LogLevel
 * @brief Logging severity levels.
 */
enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6
};

/**
 * @brief Five-character tag used in log lines ("INFO ", "ERROR").
 */
FREEPROBE_UTILS_API const char* logLevelToString(LogLevel level);

/**
 * @brief Parse a level name (case-sensitive, upper case).
 * @param name Level name such as "DEBUG".
 * @param level Output level when the name is known.
 * @return False if the name is not a level.
 */
FREEPROBE_UTILS_API bool parseLogLevel(const std::string& name, LogLevel& level);

namespace detail {

inline void appendFormatted(std::ostringstream& oss, const char* format) {
    oss << format;
}

/// Substitute `value` for the first "{}" of `format`, then recurse on the rest.
template<typename T, typename... Args>
void appendFormatted(std::ostringstream& oss, const char* format, T&& value, Args&&... args) {
    for (const char* p = format; *p; ++p) {
        if (p[0] == '{' && p[1] == '}') {
            oss.write(format, p - format);
            oss << value;
            appendFormatted(oss, p + 2, std::forward<Args>(args)...);
            return;
        }
    }
    oss << format;
}

}  // namespace detail

/**
 * @class Logger
 * @brief Process-wide logger.
 *
 * The level check is lock-free; only writing a finished line takes the
 * mutex.
 *
 * Usage:
 * @code
 * Logger::instance().setLevel(LogLevel::DEBUG);
 * LOG_INFO("Discovery", "Resolved {} at {}", name, address);
 * @endcode
 */
class FREEPROBE_UTILS_API Logger {
public:
    static Logger& instance();

    void setLevel(LogLevel level) {
        level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel getLevel() const {
        return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
    }

    bool isEnabled(LogLevel level) const {
        return static_cast<int>(level) >= level_.load(std::memory_order_relaxed);
    }

    void setColorEnabled(bool enabled) {
        colorEnabled_.store(enabled, std::memory_order_relaxed);
    }

    /**
     * @brief Redirect log output. Pass nullptr to restore stderr.
     * The stream must outlive every subsequent log call.
     */
    void setOutput(std::ostream* out);

    /**
     * @brief Log a message; each "{}" in `format` takes the next argument.
     */
    template<typename... Args>
    void log(LogLevel level, const char* component, const char* format, Args&&... args) {
        if (!isEnabled(level)) {
            return;
        }
        std::ostringstream message;
        detail::appendFormatted(message, format, std::forward<Args>(args)...);
        write(level, component, message.str());
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger();

    void write(LogLevel level, const char* component, const std::string& message);

    std::atomic<int> level_;
    std::atomic<bool> colorEnabled_;
    std::mutex mutex_;
    std::ostream* out_;
};

}  // namespace utils
}  // namespace freeprobe

#define LOG_TRACE(component, ...) \
    ::freeprobe::utils::Logger::instance().log(::freeprobe::utils::LogLevel::TRACE, component, __VA_ARGS__)

#define LOG_DEBUG(component, ...) \
    ::freeprobe::utils::Logger::instance().log(::freeprobe::utils::LogLevel::DEBUG, component, __VA_ARGS__)

#define LOG_INFO(component, ...) \
    ::freeprobe::utils::Logger::instance().log(::freeprobe::utils::LogLevel::INFO, component, __VA_ARGS__)

#define LOG_WARN(component, ...) \
    ::freeprobe::utils::Logger::instance().log(::freeprobe::utils::LogLevel::WARN, component, __VA_ARGS__)

#define LOG_ERROR(component, ...) \
    ::freeprobe::utils::Logger::instance().log(::freeprobe::utils::LogLevel::ERROR, component, __VA_ARGS__)
