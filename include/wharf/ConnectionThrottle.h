#pragma once

#include <cstdint>
#include <chrono>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

#include "wharf/config.h"

namespace Wharf {

/// Per-source sliding-window throttle for incoming control connections.
/// Thread-safe via internal mutex.
///
/// Call shouldAccept(sourceIp) for each accepted TCP connection before a
/// Session is created. A false result means the socket must be closed
/// without sending any reply.
class ConnectionThrottle {
public:
    using Clock = std::chrono::steady_clock;

    ConnectionThrottle() = default;

    /// Construct with custom limits (from ServerConfig, or tests).
    explicit ConnectionThrottle(size_t maxCount,
                                int64_t windowMs,
                                size_t maxSources = MAX_TRACKED_SOURCES)
        : m_maxCount(maxCount), m_windowMs(windowMs), m_maxSources(maxSources) {}

    /// Returns true if this connection should be accepted (under the ceiling).
    bool shouldAccept(const std::string& sourceIp);

    /// Same as above with an explicit clock reading.
    bool shouldAccept(const std::string& sourceIp, Clock::time_point now);

    /// Number of source addresses currently tracked.
    size_t trackedSources() const;

    size_t maxCount() const { return m_maxCount; }
    int64_t windowMs() const { return m_windowMs; }

private:
    size_t  m_maxCount{MAX_CONNECTIONS_PER_SOURCE_DEFAULT};
    int64_t m_windowMs{static_cast<int64_t>(THROTTLE_WINDOW_S_DEFAULT) * 1000};
    size_t  m_maxSources{MAX_TRACKED_SOURCES};

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::deque<Clock::time_point>> m_history;
    uint64_t m_callCount{0};
};

} // namespace Wharf
