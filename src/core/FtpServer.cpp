/**
 * @file FtpServer.cpp
 * @brief FTP server: control listener, session table and event loop
 */

#include "wharf/FtpServer.h"
#include "wharf/Debug.h"
#include "wharf/ErrorCodes.h"
#include "wharf/FtpReply.h"
#include "wharf/ThreadSafeLog.h"

#include <sys/socket.h>
#include <utility>

namespace Wharf {

namespace {

// Bounds the work one readable event on the listener may do.
constexpr int MAX_ACCEPTS_PER_EVENT = 64;

}  // namespace

//=============================================================================
// Construction / Destruction
//=============================================================================

FtpServer::FtpServer(const ServerConfig& config, EventSink* events)
    : m_config(config)
    , m_events(events ? events : &m_defaultEvents)
    , m_portPool(config.passivePortLow, config.passivePortHigh)
    , m_globalBudget(config.globalBytesPerSecond, config.burstBytes)
    , m_throttle(config.maxConnectionsPerSource,
                 static_cast<int64_t>(config.windowSeconds) * 1000)
{
}

FtpServer::~FtpServer() {
    stop();
    // run()/start() already closed every session; this covers a server that
    // was initialized but never run.
    shutdownSessions();
}

//=============================================================================
// Server Control Methods
//=============================================================================

bool FtpServer::initialize(std::string& errorMsg) {
    if (m_initialized.load()) {
        return true;
    }

    LogLevel level;
    if (parseLogLevel(m_config.logLevel, level)) {
        setLogLevel(level);
    }
    if (!m_config.logFile.empty()) {
        ThreadSafeLog::initialize(m_config.logFile);
    }

    if (!m_reactor.initialize(errorMsg)) {
        return false;
    }

    const Endpoint bindEndpoint{m_config.listenAddress, m_config.listenPort};
    if (!createListenSocket(bindEndpoint, SOMAXCONN_VALUE, m_listenFd, errorMsg)) {
        return false;
    }

    Endpoint bound;
    if (!getLocalEndpoint(m_listenFd.get(), bound)) {
        errorMsg = "getsockname() failed: " + errnoToString(errno);
        m_listenFd.reset();
        return false;
    }
    m_port.store(bound.port);

    if (!m_reactor.registerHandle(m_listenFd.get(), IoEvent::READABLE, this, errorMsg)) {
        m_listenFd.reset();
        return false;
    }
    m_reactor.setHousekeepingCallback([this]() { housekeeping(); });

    LOG_INFO("[FtpServer] Listening on " << bound.address << ":" << bound.port
             << " (passive ports " << m_portPool.low() << "-" << m_portPool.high() << ")");
    ThreadSafeLog::log("[FtpServer] Listening on " + bound.address + ":" + std::to_string(bound.port));

    m_initialized.store(true);
    return true;
}

bool FtpServer::start(std::string& errorMsg) {
    if (m_running.load()) {
        errorMsg = "Server already running";
        return false;
    }
    if (!initialize(errorMsg)) {
        return false;
    }

    m_running.store(true);
    m_thread = std::thread([this]() {
        std::string loopError;
        runLoop(loopError);
    });
    return true;
}

bool FtpServer::run(std::string& errorMsg) {
    if (m_running.load()) {
        errorMsg = "Server already running";
        return false;
    }
    if (!initialize(errorMsg)) {
        return false;
    }

    m_running.store(true);
    return runLoop(errorMsg);
}

void FtpServer::stop() {
    m_reactor.stop();

    if (m_thread.joinable() && m_thread.get_id() != std::this_thread::get_id()) {
        m_thread.join();
    }
}

bool FtpServer::runLoop(std::string& errorMsg) {
    const bool ok = m_reactor.run(errorMsg);
    if (!ok) {
        LOG_ERROR("[FtpServer] Event loop failed, shutting down: " << errorMsg);
        ThreadSafeLog::log("[FtpServer] Event loop failed: " + errorMsg);
    }

    shutdownSessions();
    LOG_INFO("[FtpServer] Stopped");
    ThreadSafeLog::log("[FtpServer] Stopped");
    m_running.store(false);
    return ok;
}

void FtpServer::shutdownSessions() {
    for (auto& pair : m_sessions) {
        pair.second->shutdown("Server shutting down");
    }
    m_sessions.clear();
    m_sessionCount.store(0);

    if (m_listenFd.isValid()) {
        m_reactor.deregister(m_listenFd.get());
        m_listenFd.reset();
    }
    m_port.store(0);
    m_acceptPaused.store(false);
    m_initialized.store(false);
}

//=============================================================================
// Event handling
//=============================================================================

void FtpServer::handleEvent(int fd, uint32_t events) {
    (void)events;
    if (fd == m_listenFd.get()) {
        acceptConnections();
    }
}

void FtpServer::handleError(int fd, const std::string& reason) {
    LOG_ERROR("[FtpServer] Listener fd " << fd << " error: " << reason);
}

void FtpServer::acceptConnections() {
    // Closed sessions no longer count against max_sessions.
    reapClosedSessions();

    for (int i = 0; i < MAX_ACCEPTS_PER_EVENT; ++i) {
        UniqueFd fd;
        Endpoint peer;
        std::string errorMsg;
        if (!acceptConnection(m_listenFd.get(), fd, peer, errorMsg)) {
            if (!errorMsg.empty()) {
                // EMFILE and friends leave the listener readable; stop watching
                // it until the next housekeeping tick instead of spinning.
                LOG_WARNING("[FtpServer] " << errorMsg << ", pausing accepts");
                pauseAccepting();
            }
            return;
        }

        if (!m_throttle.shouldAccept(peer.address)) {
            // Flood rejections get no reply at all.
            rejectConnection(fd, peer, std::string(), "connection flood");
            continue;
        }

        if (m_sessions.size() >= m_config.maxSessions) {
            rejectConnection(fd, peer,
                             formatReply(ReplyCodes::SERVICE_NOT_AVAILABLE, "Too many connections"),
                             "session limit reached");
            continue;
        }

        tuneControlSocket(fd.get());

        auto session = std::make_unique<Session>(std::move(fd), peer, makeContext());
        if (!session->start(errorMsg)) {
            LOG_ERROR("[FtpServer] Failed to start session for " << peer.address << ": " << errorMsg);
            continue;
        }

        m_sessions[m_nextSessionId++] = std::move(session);
        m_sessionCount.store(m_sessions.size());

        ServerEvent event;
        event.type = ServerEventType::CONNECTION_ACCEPTED;
        event.peer = peer.address;
        m_events->onEvent(event);
    }
}

void FtpServer::rejectConnection(UniqueFd& fd, const Endpoint& peer, const std::string& reply,
                                 const std::string& reason) {
    if (!reply.empty()) {
        // Best effort; the socket is closed right after either way.
        const ssize_t sent = ::send(fd.get(), reply.data(), reply.size(), MSG_NOSIGNAL | MSG_DONTWAIT);
        (void)sent;
    }
    fd.reset();

    ServerEvent event;
    event.type = ServerEventType::CONNECTION_REJECTED;
    event.peer = peer.address;
    event.detail = reason;
    m_events->onEvent(event);
}

void FtpServer::pauseAccepting() {
    std::string errorMsg;
    if (!m_reactor.modifyInterest(m_listenFd.get(), IoEvent::NONE, errorMsg)) {
        LOG_ERROR("[FtpServer] " << errorMsg);
        return;
    }
    m_acceptPaused.store(true);
}

void FtpServer::resumeAccepting() {
    std::string errorMsg;
    if (!m_reactor.modifyInterest(m_listenFd.get(), IoEvent::READABLE, errorMsg)) {
        LOG_ERROR("[FtpServer] " << errorMsg);
        return;
    }
    m_acceptPaused.store(false);
}

void FtpServer::housekeeping() {
    const auto now = Session::Clock::now();
    for (auto& pair : m_sessions) {
        pair.second->onTick(now);
    }
    reapClosedSessions();

    if (m_acceptPaused.load()) {
        resumeAccepting();
    }
}

void FtpServer::reapClosedSessions() {
    for (auto it = m_sessions.begin(); it != m_sessions.end();) {
        if (it->second->isClosed()) {
            it = m_sessions.erase(it);
        } else {
            ++it;
        }
    }
    m_sessionCount.store(m_sessions.size());
}

SessionContext FtpServer::makeContext() {
    SessionSettings settings;
    settings.passiveAddress = m_config.passiveAddress;
    settings.bytesPerSecond = m_config.perConnectionBytesPerSecond;
    settings.burstBytes = m_config.burstBytes;
    settings.idleTimeoutSeconds = m_config.idleTimeoutSeconds;
    settings.dataConnectTimeoutSeconds = m_config.dataConnectTimeoutSeconds;
    settings.maxLoginAttempts = m_config.maxLoginAttempts;
    settings.allowForeignActive = m_config.allowForeignActive;

    return SessionContext{
        m_reactor,
        m_portPool,
        m_globalBudget.isUnlimited() ? nullptr : &m_globalBudget,
        m_config.users,
        m_events,
        m_fileSystemFactory,
        settings
    };
}

}  // namespace Wharf
