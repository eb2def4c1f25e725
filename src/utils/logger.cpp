/**
 * @file logger.cpp
 * @brief Logger line rendering and level names.
 *
 * @copyright Copyright (c) 2024 FreeProbe Contributors
 * @license MIT License
 */

#include "freeprobe/utils/logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>

namespace freeprobe {
namespace utils {

namespace {

const char* colorFor(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "\033[90m";
        case LogLevel::DEBUG: return "\033[36m";
        case LogLevel::INFO:  return "\033[32m";
        case LogLevel::WARN:  return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
        case LogLevel::FATAL: return "\033[35;1m";
        default:              return "";
    }
}

}  // namespace

const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF  ";
        default:              return "?????";
    }
}

bool parseLogLevel(const std::string& name, LogLevel& level) {
    static const struct {
        const char* name;
        LogLevel level;
    } LEVELS[] = {
        {"TRACE", LogLevel::TRACE}, {"DEBUG", LogLevel::DEBUG}, {"INFO", LogLevel::INFO},
        {"WARN", LogLevel::WARN},   {"ERROR", LogLevel::ERROR}, {"FATAL", LogLevel::FATAL},
        {"OFF", LogLevel::OFF},
    };
    for (const auto& entry : LEVELS) {
        if (name == entry.name) {
            level = entry.level;
            return true;
        }
    }
    return false;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger()
    : level_(static_cast<int>(LogLevel::INFO))
    , colorEnabled_(false)
    , out_(&std::cerr)
{
}

void Logger::setOutput(std::ostream* out) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ = out ? out : &std::cerr;
}

void Logger::write(LogLevel level, const char* component, const std::string& message) {
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    // [YYYY-MM-DD HH:MM:SS.mmm] [LEVEL] [Component] message
    std::ostringstream line;
    line << '[' << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.'
         << std::setfill('0') << std::setw(3) << millis << "] ";
    if (colorEnabled_.load(std::memory_order_relaxed)) {
        line << colorFor(level) << '[' << logLevelToString(level) << "]\033[0m";
    } else {
        line << '[' << logLevelToString(level) << ']';
    }
    line << " [" << component << "] " << message << '\n';

    std::lock_guard<std::mutex> lock(mutex_);
    *out_ << line.str();
    out_->flush();
}

}  // namespace utils
}  // namespace freeprobe
