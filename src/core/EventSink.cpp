/**
 * @file EventSink.cpp
 * @brief Logging event sink
 */

#include "wharf/EventSink.h"
#include "wharf/Debug.h"
#include "wharf/ThreadSafeLog.h"

#include <sstream>

namespace Wharf {

LogEventSink::LogEventSink() {
    for (auto& counter : m_counts) {
        counter.store(0);
    }
}

void LogEventSink::onEvent(const ServerEvent& event) {
    const size_t index = static_cast<size_t>(event.type);
    if (index < m_counts.size()) {
        m_counts[index].fetch_add(1);
    }
    if (event.type == ServerEventType::TRANSFER_COMPLETED) {
        m_bytesTransferred.fetch_add(event.bytes);
    }

    std::ostringstream oss;
    oss << "[Event] " << serverEventTypeToString(event.type) << " peer=" << event.peer;
    if (!event.user.empty()) {
        oss << " user=" << event.user;
    }
    if (!event.path.empty()) {
        oss << " path=" << event.path;
    }
    if (event.type == ServerEventType::TRANSFER_COMPLETED ||
        event.type == ServerEventType::TRANSFER_FAILED) {
        oss << " bytes=" << event.bytes;
    }
    if (!event.detail.empty()) {
        oss << " (" << event.detail << ")";
    }
    const std::string line = oss.str();

    switch (event.type) {
        case ServerEventType::CONNECTION_REJECTED:
        case ServerEventType::LOGIN_FAILED:
        case ServerEventType::TRANSFER_FAILED:
            LOG_WARNING(line);
            break;
        case ServerEventType::TRANSFER_STARTED:
        case ServerEventType::TRANSFER_COMPLETED:
        case ServerEventType::LOGIN_SUCCEEDED:
            LOG_INFO(line);
            break;
        default:
            LOG_DEBUG(line);
            break;
    }

    ThreadSafeLog::log(line);
}

uint64_t LogEventSink::count(ServerEventType type) const {
    const size_t index = static_cast<size_t>(type);
    if (index >= m_counts.size()) {
        return 0;
    }
    return m_counts[index].load();
}

}  // namespace Wharf
