/**
 * @file Reactor.h
 * @brief Single-threaded epoll event loop
 */

#pragma once

#include "config.h"
#include "SocketUtils.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <utility>

struct epoll_event;

namespace Wharf {

/**
 * @brief Interest and readiness bits used by the reactor
 */
namespace IoEvent {
inline constexpr uint32_t NONE = 0;
inline constexpr uint32_t READABLE = 1u << 0;
inline constexpr uint32_t WRITABLE = 1u << 1;
inline constexpr uint32_t HANGUP = 1u << 2;   ///< Reported only, never requested
inline constexpr uint32_t ERROR = 1u << 3;    ///< Reported only, never requested
}  // namespace IoEvent

/**
 * @class EventHandler
 * @brief Receiver of readiness events for registered descriptors
 */
class EventHandler {
public:
    virtual ~EventHandler() = default;

    /**
     * @brief A registered fd is ready
     * @param fd The descriptor
     * @param events IoEvent bits
     */
    virtual void handleEvent(int fd, uint32_t events) = 0;

    /**
     * @brief handleEvent() threw; the handler should tear itself down
     */
    virtual void handleError(int fd, const std::string& reason) = 0;
};

/**
 * @class Reactor
 * @brief Readiness-driven dispatch of many sockets on one thread
 *
 * Level-triggered epoll. Each run() iteration waits at most
 * HOUSEKEEPING_INTERVAL_MS, dispatches ready descriptors to their handlers,
 * then calls the housekeeping callback.
 *
 * Registration carries a generation token so that an event collected for an
 * fd which was deregistered (and possibly reused) earlier in the same batch
 * is dropped instead of reaching the wrong handler.
 *
 * Thread Safety:
 * - stop() may be called from any thread (and from a signal handler)
 * - Everything else must be called on the reactor thread
 */
class Reactor {
public:
    using HousekeepingCallback = std::function<void()>;

    Reactor() = default;
    virtual ~Reactor() = default;

    // Prevent copying
    Reactor(const Reactor&) = delete;
    Reactor& operator=(const Reactor&) = delete;

    /**
     * @brief Create the epoll instance and the wakeup eventfd
     */
    bool initialize(std::string& errorMsg);

    /**
     * @brief Start watching fd
     * @return false if fd is already registered or epoll_ctl fails
     */
    bool registerHandle(int fd, uint32_t interest, EventHandler* handler, std::string& errorMsg);

    /**
     * @brief Change the interest set of a registered fd
     *
     * IoEvent::NONE keeps the registration but stops readiness reports
     * (hangup and error are still reported by the kernel).
     */
    bool modifyInterest(int fd, uint32_t interest, std::string& errorMsg);

    /**
     * @brief Stop watching fd; a no-op when fd is not registered
     */
    void deregister(int fd);

    bool isRegistered(int fd) const;
    uint32_t interestOf(int fd) const;
    size_t handleCount() const { return m_handles.size(); }

    void setHousekeepingCallback(HousekeepingCallback callback) {
        m_housekeeping = std::move(callback);
    }

    /**
     * @brief Run until stop() is called
     * @param errorMsg Set when the poll primitive fails
     * @return false on a fatal polling failure, true after stop()
     */
    bool run(std::string& errorMsg);

    /**
     * @brief One wait/dispatch/housekeeping iteration
     * @param timeoutMs Maximum wait
     * @return false on a fatal polling failure
     */
    bool runOnce(int timeoutMs, std::string& errorMsg);

    /**
     * @brief Ask run() to return; thread-safe and async-signal-safe
     */
    void stop();

    bool isRunning() const { return m_running.load(); }

protected:
    /**
     * @brief Wait for events (epoll_wait); returns -1 with errno on failure
     */
    virtual int waitForEvents(epoll_event* events, int maxEvents, int timeoutMs);

private:
    struct Registration {
        EventHandler* handler{nullptr};
        uint32_t interest{IoEvent::NONE};
        uint32_t generation{0};
    };

    void dispatch(int fd, uint32_t generation, uint32_t events);
    void drainWakeup();

    UniqueFd m_epollFd;
    UniqueFd m_wakeFd;

    std::unordered_map<int, Registration> m_handles;
    uint32_t m_nextGeneration{1};

    HousekeepingCallback m_housekeeping;
    std::atomic<bool> m_stopRequested{false};
    std::atomic<bool> m_running{false};
};

}  // namespace Wharf
