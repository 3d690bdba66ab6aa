// Copyright (c) 2026 Joe Conigliaro
// https://github.com/joe-conigliaro
#pragma once

#include <atomic>
#include <string>
#include <sstream>
#include <iostream>

namespace tapegrad {
namespace utils {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    NONE
};

inline const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
        case LogLevel::NONE:    return "NONE";
    }
    return "UNKNOWN";
}

namespace detail {
inline std::atomic<LogLevel>& log_level_storage() {
    static std::atomic<LogLevel> level{LogLevel::WARNING};
    return level;
}
} // namespace detail

inline void set_log_level(LogLevel level) {
    detail::log_level_storage().store(level, std::memory_order_relaxed);
}

inline LogLevel log_level() {
    return detail::log_level_storage().load(std::memory_order_relaxed);
}

inline bool log_enabled(LogLevel level) {
    return level != LogLevel::NONE && level >= log_level();
}

// "[LEVEL] tapegrad: message". DEBUG/INFO to stdout, WARNING/ERROR to stderr.
inline void log(LogLevel level, const std::string& msg) {
    if (!log_enabled(level)) return;
    std::ostream& os = (level >= LogLevel::WARNING) ? std::cerr : std::cout;
    os << "[" << to_string(level) << "] tapegrad: " << msg << std::endl;
}

} // namespace utils
} // namespace tapegrad

// Message is only built when the level is enabled.
#define TAPEGRAD_LOG(level, expr) do { \
    if (::tapegrad::utils::log_enabled(level)) { \
        std::ostringstream _tg_log_os; \
        _tg_log_os << expr; \
        ::tapegrad::utils::log(level, _tg_log_os.str()); \
    } \
} while(0)

#define TAPEGRAD_LOG_DEBUG(expr)   TAPEGRAD_LOG(::tapegrad::utils::LogLevel::DEBUG, expr)
#define TAPEGRAD_LOG_INFO(expr)    TAPEGRAD_LOG(::tapegrad::utils::LogLevel::INFO, expr)
#define TAPEGRAD_LOG_WARNING(expr) TAPEGRAD_LOG(::tapegrad::utils::LogLevel::WARNING, expr)
#define TAPEGRAD_LOG_ERROR(expr)   TAPEGRAD_LOG(::tapegrad::utils::LogLevel::ERROR, expr)
