/**
 * @file PassivePortPool.h
 * @brief Lease table for passive-mode data ports
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

namespace Wharf {

class PassivePortPool;

/**
 * @class PortLease
 * @brief Move-only handle to one leased passive port
 *
 * The port returns to its pool when the lease is released or destroyed, so
 * a DataChannel that goes away for any reason can never leak a port.
 * The pool must outlive every lease it hands out.
 */
class PortLease {
public:
    PortLease() = default;
    ~PortLease();

    // Prevent copying (a port is leased to one owner at a time)
    PortLease(const PortLease&) = delete;
    PortLease& operator=(const PortLease&) = delete;

    PortLease(PortLease&& other) noexcept;
    PortLease& operator=(PortLease&& other) noexcept;

    bool isValid() const { return m_pool != nullptr; }
    uint16_t port() const { return m_port; }

    /**
     * @brief Return the port to the pool now (no-op if not valid)
     */
    void release();

private:
    friend class PassivePortPool;
    PortLease(PassivePortPool* pool, uint16_t port) : m_pool(pool), m_port(port) {}

    PassivePortPool* m_pool{nullptr};
    uint16_t m_port{0};
};

/**
 * @class PassivePortPool
 * @brief Bitmap arena over an inclusive [low, high] port range
 *
 * acquire() scans from a rotating cursor so consecutive leases spread over
 * the range (a port just released is not immediately reissued, which keeps
 * late connections from a previous transfer away from the next one).
 *
 * Invariants:
 * - Every leased port lies in [low, high].
 * - A port is leased to at most one PortLease at a time.
 *
 * Thread Safety:
 * - All methods lock an internal mutex, so several reactor threads may
 *   share one pool.
 */
class PassivePortPool {
public:
    /**
     * @brief Construct a pool; low > high is normalized by swapping
     */
    PassivePortPool(uint16_t low, uint16_t high);

    PassivePortPool(const PassivePortPool&) = delete;
    PassivePortPool& operator=(const PassivePortPool&) = delete;

    /**
     * @brief Lease the next free port
     * @param lease Receives the lease on success
     * @return false if every port in the range is leased
     */
    bool acquire(PortLease& lease);

    uint16_t low() const { return m_low; }
    uint16_t high() const { return m_high; }

    /**
     * @brief Number of ports in the range
     */
    size_t capacity() const { return m_leased.size(); }

    /**
     * @brief Number of ports currently leased
     */
    size_t leasedCount() const;

    bool isLeased(uint16_t port) const;

    /**
     * @brief Snapshot of the leased ports in ascending order
     */
    std::vector<uint16_t> leasedPorts() const;

private:
    friend class PortLease;
    void release(uint16_t port);

    uint16_t m_low;
    uint16_t m_high;

    mutable std::mutex m_mutex;
    std::vector<bool> m_leased;
    size_t m_cursor{0};
    size_t m_leasedCount{0};
};

}  // namespace Wharf
