#include "wharf/ConnectionThrottle.h"
#include "wharf/Debug.h"

namespace Wharf {

bool ConnectionThrottle::shouldAccept(const std::string& sourceIp) {
    return shouldAccept(sourceIp, Clock::now());
}

bool ConnectionThrottle::shouldAccept(const std::string& sourceIp, Clock::time_point now) {
    const auto windowStart = now - std::chrono::milliseconds(m_windowMs);

    std::lock_guard<std::mutex> lock(m_mutex);

    // Periodic sweeping to bound memory growth from long-gone sources.
    m_callCount++;
    if ((m_callCount % THROTTLE_SWEEP_EVERY) == 0) {
        for (auto it = m_history.begin(); it != m_history.end(); ) {
            auto& hist = it->second;
            while (!hist.empty() && hist.front() <= windowStart) {
                hist.pop_front();
            }
            if (hist.empty()) {
                it = m_history.erase(it);
            } else {
                ++it;
            }
        }
    }

    auto it = m_history.find(sourceIp);
    if (it == m_history.end()) {
        if (m_history.size() >= m_maxSources) {
            LOG_WARNING("[ConnectionThrottle] Max source tracking capacity reached ("
                        << m_maxSources << "); dropping connection from " << sourceIp);
            return false;
        }
        it = m_history.emplace(sourceIp, std::deque<Clock::time_point>{}).first;
    }

    auto& dq = it->second;

    while (!dq.empty() && dq.front() <= windowStart) {
        dq.pop_front();
    }

    if (dq.size() >= m_maxCount) {
        LOG_WARNING("[ConnectionThrottle] Connection ceiling reached for "
                    << sourceIp << " (" << dq.size()
                    << " accepts in " << m_windowMs << " ms window)");
        return false;
    }

    dq.push_back(now);
    return true;
}

size_t ConnectionThrottle::trackedSources() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_history.size();
}

} // namespace Wharf
