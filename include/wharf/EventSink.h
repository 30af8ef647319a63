/**
 * @file EventSink.h
 * @brief Observability hook for server events
 */

#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <string>

namespace Wharf {

/**
 * @brief Kinds of events reported by FtpServer and Session
 */
enum class ServerEventType : uint8_t {
    CONNECTION_ACCEPTED,
    CONNECTION_REJECTED,   ///< Flood protection or session ceiling
    SESSION_CLOSED,
    LOGIN_SUCCEEDED,
    LOGIN_FAILED,
    TRANSFER_STARTED,
    TRANSFER_COMPLETED,
    TRANSFER_FAILED,
    RATE_LIMIT_ENGAGED,    ///< A transfer stalled on an empty budget
    COUNT                  ///< Number of event types (not an event)
};

/**
 * @brief Convert ServerEventType to string
 */
inline std::string serverEventTypeToString(ServerEventType type) {
    switch (type) {
        case ServerEventType::CONNECTION_ACCEPTED: return "ConnectionAccepted";
        case ServerEventType::CONNECTION_REJECTED: return "ConnectionRejected";
        case ServerEventType::SESSION_CLOSED:      return "SessionClosed";
        case ServerEventType::LOGIN_SUCCEEDED:     return "LoginSucceeded";
        case ServerEventType::LOGIN_FAILED:        return "LoginFailed";
        case ServerEventType::TRANSFER_STARTED:    return "TransferStarted";
        case ServerEventType::TRANSFER_COMPLETED:  return "TransferCompleted";
        case ServerEventType::TRANSFER_FAILED:     return "TransferFailed";
        case ServerEventType::RATE_LIMIT_ENGAGED:  return "RateLimitEngaged";
        default:                                   return "Unknown";
    }
}

/**
 * @brief One reported event
 */
struct ServerEvent {
    ServerEventType type{ServerEventType::CONNECTION_ACCEPTED};
    std::string peer;      ///< Client address
    std::string user;      ///< Logged-in user, if any
    std::string path;      ///< Virtual path for transfer events
    uint64_t bytes{0};     ///< Bytes moved for transfer events
    std::string detail;    ///< Free-form reason
};

/**
 * @class EventSink
 * @brief Receives server events on the reactor thread
 *
 * Implementations must not block; they run inline with the event loop.
 */
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void onEvent(const ServerEvent& event) = 0;
};

/**
 * @class LogEventSink
 * @brief EventSink that logs every event and keeps per-type counters
 *
 * Connection and login noise goes to LOG_DEBUG; transfers and rejections go
 * to LOG_INFO / LOG_WARNING. Every event is also appended to the
 * ThreadSafeLog trace file when one is configured. Counters may be read
 * from any thread.
 */
class LogEventSink : public EventSink {
public:
    LogEventSink();

    void onEvent(const ServerEvent& event) override;

    /**
     * @brief Number of events of a type seen so far
     */
    uint64_t count(ServerEventType type) const;

    /**
     * @brief Sum of bytes reported by TRANSFER_COMPLETED events
     */
    uint64_t bytesTransferred() const { return m_bytesTransferred.load(); }

private:
    std::array<std::atomic<uint64_t>, static_cast<size_t>(ServerEventType::COUNT)> m_counts;
    std::atomic<uint64_t> m_bytesTransferred{0};
};

}  // namespace Wharf
