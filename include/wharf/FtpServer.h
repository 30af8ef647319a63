/**
 * @file FtpServer.h
 * @brief FTP server: control listener, session table and event loop
 */

#pragma once

#include "config.h"
#include "ConnectionThrottle.h"
#include "EventSink.h"
#include "PassivePortPool.h"
#include "RateBudget.h"
#include "Reactor.h"
#include "ServerConfig.h"
#include "Session.h"
#include "SocketUtils.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>

namespace Wharf {

/**
 * @class FtpServer
 * @brief Accepts control connections and drives every Session on one reactor
 *
 * Architecture:
 * - One reactor thread (start()) or the caller's thread (run())
 * - Listening socket registered with the reactor; accepted connections are
 *   checked against ConnectionThrottle before a Session is created
 * - Housekeeping every HOUSEKEEPING_INTERVAL_MS: session ticks, then
 *   reaping of closed sessions
 * - A fatal reactor error stops the loop; every session is then closed and
 *   every passive port returned
 *
 * Thread Safety:
 * - getActiveSessionCount(), getPort() and portPool() may be read from
 *   any thread
 * - stop() may be called from any thread or a signal handler
 * - start(), run() and the setters are NOT thread-safe
 *
 * Usage:
 * @code
 * ServerConfig config;
 * config.listenPort = 0;
 * FtpServer server(config);
 * std::string error;
 * if (server.start(error)) {
 *     // clients connect to server.getPort()
 *     server.stop();
 * }
 * @endcode
 */
class FtpServer : public EventHandler {
public:
    /**
     * @param config Runtime configuration (copied)
     * @param events Event sink; nullptr uses an internal LogEventSink
     */
    explicit FtpServer(const ServerConfig& config, EventSink* events = nullptr);

    /**
     * @brief Destructor - stops the server and joins the reactor thread
     */
    ~FtpServer() override;

    // Prevent copying and moving (sessions hold references into the server)
    FtpServer(const FtpServer&) = delete;
    FtpServer& operator=(const FtpServer&) = delete;
    FtpServer(FtpServer&&) = delete;
    FtpServer& operator=(FtpServer&&) = delete;

    //=========================================================================
    // Server Control Methods
    //=========================================================================

    /**
     * @brief Set up the reactor and the listening socket (no thread started)
     */
    bool initialize(std::string& errorMsg);

    /**
     * @brief initialize() if needed, then run the loop on a background thread
     */
    bool start(std::string& errorMsg);

    /**
     * @brief initialize() if needed, then run the loop on the calling thread
     * @return false if the loop ended on a fatal reactor error
     */
    bool run(std::string& errorMsg);

    /**
     * @brief Ask the loop to finish and join the background thread
     *
     * From a signal handler only the stop request is made; the thread
     * running run() returns on its own.
     */
    void stop();

    bool isRunning() const { return m_running.load(); }

    //=========================================================================
    // Query Methods
    //=========================================================================

    /**
     * @brief Bound control port (the ephemeral one when listen_port is 0)
     */
    uint16_t getPort() const { return m_port.load(); }

    size_t getActiveSessionCount() const { return m_sessionCount.load(); }

    /**
     * @brief Whether accepting is paused after a descriptor-exhaustion error
     *
     * The listener is re-armed on the next housekeeping tick.
     */
    bool isAcceptPaused() const { return m_acceptPaused.load(); }

    const PassivePortPool& portPool() const { return m_portPool; }
    const ServerConfig& config() const { return m_config; }

    //=========================================================================
    // Configuration Methods
    //=========================================================================

    /**
     * @brief Override how a user's FileSystem is built (default: LocalFileSystem on home)
     */
    void setFileSystemFactory(FileSystemFactory factory) {
        m_fileSystemFactory = std::move(factory);
    }

    void handleEvent(int fd, uint32_t events) override;
    void handleError(int fd, const std::string& reason) override;

private:
    void acceptConnections();
    void rejectConnection(UniqueFd& fd, const Endpoint& peer, const std::string& reply,
                          const std::string& reason);
    void pauseAccepting();
    void resumeAccepting();
    void housekeeping();
    bool runLoop(std::string& errorMsg);
    void reapClosedSessions();
    void shutdownSessions();
    SessionContext makeContext();

    ServerConfig m_config;
    LogEventSink m_defaultEvents;
    EventSink* m_events;
    FileSystemFactory m_fileSystemFactory;

    Reactor m_reactor;
    PassivePortPool m_portPool;
    RateBudget m_globalBudget;
    ConnectionThrottle m_throttle;
    UniqueFd m_listenFd;

    // Declared last: sessions release fds and port leases into the members above.
    std::unordered_map<uint64_t, std::unique_ptr<Session>> m_sessions;
    uint64_t m_nextSessionId{1};

    std::thread m_thread;
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_initialized{false};
    std::atomic<uint16_t> m_port{0};
    std::atomic<size_t> m_sessionCount{0};
    std::atomic<bool> m_acceptPaused{false};
};

}  // namespace Wharf
