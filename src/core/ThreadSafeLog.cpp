/**
 * @file ThreadSafeLog.cpp
 * @brief Server trace file implementation
 *
 * (c) 2026 Wharf Project
 * Licensed under MIT License
 */

#include "wharf/ThreadSafeLog.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <thread>

namespace Wharf {

std::mutex ThreadSafeLog::s_mutex;
std::filesystem::path ThreadSafeLog::s_logPath;
std::ofstream ThreadSafeLog::s_stream;

void ThreadSafeLog::initialize(const std::filesystem::path& logPath) {
    std::lock_guard<std::mutex> lock(s_mutex);

    if (s_stream.is_open()) {
        s_stream.close();
    }
    s_logPath = logPath;
    if (s_logPath.empty()) {
        return;
    }

    s_stream.open(s_logPath, std::ios::app);
    if (!s_stream.is_open()) {
        s_logPath.clear();  // Unwritable path: tracing stays off
    }
}

bool ThreadSafeLog::isEnabled() {
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_stream.is_open();
}

void ThreadSafeLog::log(const std::string& message) {
    std::lock_guard<std::mutex> lock(s_mutex);
    if (!s_stream.is_open()) {
        return;
    }

    const auto now = std::chrono::system_clock::now();
    const std::time_t nowT = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tmBuf{};
    localtime_r(&nowT, &tmBuf);

    // 2026-10-18 09:15:02.117 [140233] message
    s_stream << std::put_time(&tmBuf, "%Y-%m-%d %H:%M:%S")
             << '.' << std::setfill('0') << std::setw(3) << millis.count()
             << " [" << std::this_thread::get_id() << "] " << message << '\n';
    s_stream.flush();
}

void ThreadSafeLog::log(const char* message) {
    log(std::string(message ? message : ""));
}

} // namespace Wharf
