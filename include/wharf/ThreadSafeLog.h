/**
 * @file ThreadSafeLog.h
 * @brief Thread-safe file logging for server trace output
 *
 * (c) 2026 Wharf Project
 * Licensed under MIT License
 */

#pragma once

#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

namespace Wharf {

/**
 * @brief Thread-safe append-only logging to a trace file
 *
 * Used by LogEventSink for the structured event trail and by FtpServer for
 * start/stop traces. The reactor thread and the controlling thread (the one
 * calling FtpServer::stop()) may log concurrently, so every write is
 * serialized on a global mutex.
 *
 * Note: initialize() MUST be called before the reactor thread starts.
 */
class ThreadSafeLog {
public:
    /**
     * @brief Set the trace file path (call before starting the server)
     * @param logPath Path to the log file; an empty path disables logging
     *
     * The file is opened for append and stays open until the next
     * initialize(). An unwritable path leaves tracing disabled. Calling
     * log() before initialize() silently does nothing.
     */
    static void initialize(const std::filesystem::path& logPath);

    /**
     * @brief Whether a trace file is open
     */
    static bool isEnabled();

    /**
     * @brief Log a std::string message
     * @param message Message to log
     *
     * Thread-safe: locks global mutex before writing to file.
     */
    static void log(const std::string& message);

    /**
     * @brief Log a const char* message
     * @param message Message to log
     *
     * This overload prevents ambiguity when passing string literals.
     */
    static void log(const char* message);

private:
    /// Global mutex for synchronizing file access across all threads
    static std::mutex s_mutex;

    /// Trace file path (set by initialize())
    static std::filesystem::path s_logPath;

    /// Open trace stream, guarded by s_mutex
    static std::ofstream s_stream;
};

} // namespace Wharf
