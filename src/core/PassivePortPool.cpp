/**
 * @file PassivePortPool.cpp
 * @brief Lease table for passive-mode data ports
 */

#include "wharf/PassivePortPool.h"
#include "wharf/Debug.h"

#include <utility>

namespace Wharf {

//=============================================================================
// PortLease
//=============================================================================

PortLease::~PortLease() {
    release();
}

PortLease::PortLease(PortLease&& other) noexcept
    : m_pool(other.m_pool)
    , m_port(other.m_port)
{
    other.m_pool = nullptr;
    other.m_port = 0;
}

PortLease& PortLease::operator=(PortLease&& other) noexcept {
    if (this != &other) {
        release();
        m_pool = other.m_pool;
        m_port = other.m_port;
        other.m_pool = nullptr;
        other.m_port = 0;
    }
    return *this;
}

void PortLease::release() {
    if (m_pool) {
        m_pool->release(m_port);
        m_pool = nullptr;
        m_port = 0;
    }
}

//=============================================================================
// PassivePortPool
//=============================================================================

PassivePortPool::PassivePortPool(uint16_t low, uint16_t high)
    : m_low(low <= high ? low : high)
    , m_high(low <= high ? high : low)
    , m_leased(static_cast<size_t>(m_high - m_low) + 1, false)
{
}

bool PassivePortPool::acquire(PortLease& lease) {
    bool found = false;
    uint16_t port = 0;

    {
        std::lock_guard<std::mutex> lock(m_mutex);

        const size_t count = m_leased.size();
        for (size_t i = 0; i < count; ++i) {
            const size_t index = (m_cursor + i) % count;
            if (!m_leased[index]) {
                m_leased[index] = true;
                ++m_leasedCount;
                m_cursor = (index + 1) % count;
                port = static_cast<uint16_t>(m_low + index);
                found = true;
                break;
            }
        }
    }

    if (!found) {
        return false;
    }

    // Assigning may release a port the caller's lease already held, which
    // takes the mutex again, so this happens outside the lock.
    lease = PortLease(this, port);
    return true;
}

void PassivePortPool::release(uint16_t port) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (port < m_low || port > m_high) {
        LOG_WARNING("[PassivePortPool] Release of out-of-range port " << port);
        return;
    }

    const size_t index = static_cast<size_t>(port - m_low);
    if (!m_leased[index]) {
        LOG_WARNING("[PassivePortPool] Double release of port " << port);
        return;
    }

    m_leased[index] = false;
    --m_leasedCount;
}

size_t PassivePortPool::leasedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_leasedCount;
}

bool PassivePortPool::isLeased(uint16_t port) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (port < m_low || port > m_high) {
        return false;
    }
    return m_leased[static_cast<size_t>(port - m_low)];
}

std::vector<uint16_t> PassivePortPool::leasedPorts() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<uint16_t> ports;
    ports.reserve(m_leasedCount);
    for (size_t i = 0; i < m_leased.size(); ++i) {
        if (m_leased[i]) {
            ports.push_back(static_cast<uint16_t>(m_low + i));
        }
    }
    return ports;
}

}  // namespace Wharf
