/**
 * @file Debug.h
 * @brief Console logging utilities with timestamps and a level threshold
 *
 * (c) 2026 Wharf Project
 * Licensed under MIT License
 */

#pragma once

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <mutex>

namespace Wharf {

/**
 * @brief Console log severity, lowest first
 */
enum class LogLevel : int {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

// The reactor thread and the thread calling FtpServer::stop() both log.
inline std::mutex g_logMutex;

// Messages below this level are dropped. Set once at startup.
inline std::atomic<int> g_logLevel{static_cast<int>(LogLevel::INFO)};

inline void setLogLevel(LogLevel level) {
    g_logLevel.store(static_cast<int>(level));
}

inline bool isLogEnabled(LogLevel level) {
    return static_cast<int>(level) >= g_logLevel.load(std::memory_order_relaxed);
}

/**
 * @brief Parse "debug", "info", "warning" or "error"
 * @return false for any other text
 */
inline bool parseLogLevel(const std::string& text, LogLevel& level) {
    if (text == "debug") {
        level = LogLevel::DEBUG;
    } else if (text == "info") {
        level = LogLevel::INFO;
    } else if (text == "warning") {
        level = LogLevel::WARNING;
    } else if (text == "error") {
        level = LogLevel::ERROR;
    } else {
        return false;
    }
    return true;
}

/**
 * @brief Get current timestamp as formatted string
 * @return Timestamp in format [HH:MM:SS.mmm]
 */
inline std::string getTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t nowT = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&nowT, &tm);

    std::ostringstream oss;
    oss << "[" << std::setfill('0') << std::setw(2) << tm.tm_hour
        << ":" << std::setw(2) << tm.tm_min
        << ":" << std::setw(2) << tm.tm_sec
        << "." << std::setw(3) << ms.count() << "]";
    return oss.str();
}

/**
 * @brief Thread-safe logging macros with timestamp
 *
 * The message expression is only evaluated when the level is enabled.
 */
#define WHARF_LOG_AT(level, tag, msg) \
    do { \
        if (Wharf::isLogEnabled(level)) { \
            std::lock_guard<std::mutex> lock(Wharf::g_logMutex); \
            std::cerr << Wharf::getTimestamp() << " [" tag "] " << msg << std::endl; \
        } \
    } while(0)

#define LOG_DEBUG(msg)   WHARF_LOG_AT(Wharf::LogLevel::DEBUG, "DEBUG", msg)
#define LOG_INFO(msg)    WHARF_LOG_AT(Wharf::LogLevel::INFO, "INFO", msg)
#define LOG_WARNING(msg) WHARF_LOG_AT(Wharf::LogLevel::WARNING, "WARNING", msg)
#define LOG_ERROR(msg)   WHARF_LOG_AT(Wharf::LogLevel::ERROR, "ERROR", msg)

} // namespace Wharf
