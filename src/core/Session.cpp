/**
 * @file Session.cpp
 * @brief One FTP control connection and its data channel
 */

#include "wharf/Session.h"
#include "wharf/Debug.h"
#include "wharf/ErrorCodes.h"
#include "wharf/FtpReply.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <ctime>
#include <sys/socket.h>
#include <unistd.h>
#include <utility>

namespace Wharf {

namespace {

std::string toUpper(std::string text) {
    for (char& c : text) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return text;
}

}  // namespace

//=============================================================================
// Command table
//=============================================================================

const Session::CommandSpec* Session::findCommand(const std::string& verb) {
    // verb, handler, requiresAuth, needsDataChannel
    static const CommandSpec table[] = {
        {"ABOR", &Session::cmdAbor, false, false},
        {"ALLO", &Session::cmdAllo, true,  false},
        {"APPE", &Session::cmdAppe, true,  true },
        {"CDUP", &Session::cmdCdup, true,  false},
        {"CWD",  &Session::cmdCwd,  true,  false},
        {"DELE", &Session::cmdDele, true,  false},
        {"EPRT", &Session::cmdEprt, true,  false},
        {"EPSV", &Session::cmdEpsv, true,  false},
        {"FEAT", &Session::cmdFeat, false, false},
        {"HELP", &Session::cmdHelp, false, false},
        {"LIST", &Session::cmdList, true,  true },
        {"MDTM", &Session::cmdMdtm, true,  false},
        {"MKD",  &Session::cmdMkd,  true,  false},
        {"MODE", &Session::cmdMode, true,  false},
        {"NLST", &Session::cmdNlst, true,  true },
        {"NOOP", &Session::cmdNoop, false, false},
        {"OPTS", &Session::cmdOpts, false, false},
        {"PASS", &Session::cmdPass, false, false},
        {"PASV", &Session::cmdPasv, true,  false},
        {"PORT", &Session::cmdPort, true,  false},
        {"PWD",  &Session::cmdPwd,  true,  false},
        {"QUIT", &Session::cmdQuit, false, false},
        {"REIN", &Session::cmdRein, false, false},
        {"REST", &Session::cmdRest, true,  false},
        {"RETR", &Session::cmdRetr, true,  true },
        {"RMD",  &Session::cmdRmd,  true,  false},
        {"RNFR", &Session::cmdRnfr, true,  false},
        {"RNTO", &Session::cmdRnto, true,  false},
        {"SIZE", &Session::cmdSize, true,  false},
        {"STAT", &Session::cmdStat, false, false},
        {"STOR", &Session::cmdStor, true,  true },
        {"STRU", &Session::cmdStru, true,  false},
        {"SYST", &Session::cmdSyst, false, false},
        {"TYPE", &Session::cmdType, true,  false},
        {"USER", &Session::cmdUser, false, false},
        {"XCUP", &Session::cmdCdup, true,  false},
        {"XCWD", &Session::cmdCwd,  true,  false},
        {"XMKD", &Session::cmdMkd,  true,  false},
        {"XPWD", &Session::cmdPwd,  true,  false},
        {"XRMD", &Session::cmdRmd,  true,  false},
    };

    for (const auto& spec : table) {
        if (verb == spec.verb) {
            return &spec;
        }
    }
    return nullptr;
}

//=============================================================================
// Construction / Destruction
//=============================================================================

Session::Session(UniqueFd controlFd, const Endpoint& peer, SessionContext context)
    : m_controlFd(std::move(controlFd))
    , m_peer(peer)
    , m_context(std::move(context))
    , m_connectionBudget(m_context.settings.bytesPerSecond, m_context.settings.burstBytes)
    , m_lastActivity(Clock::now())
{
    if (!getLocalEndpoint(m_controlFd.get(), m_local)) {
        m_local.address = LOCALHOST_IP;
    }
}

Session::~Session() {
    if (!isClosed()) {
        close("Session destroyed");
    }
}

bool Session::start(std::string& errorMsg) {
    if (!m_context.reactor.registerHandle(m_controlFd.get(), IoEvent::READABLE, this, errorMsg)) {
        return false;
    }

    reply(ReplyCodes::SERVICE_READY, std::string(SERVER_NAME) + " ready");
    flushOutput();
    return true;
}

//=============================================================================
// Event handling
//=============================================================================

void Session::handleEvent(int fd, uint32_t events) {
    if (isClosed()) {
        return;
    }

    if (fd == m_controlFd.get()) {
        onControlEvent(events);
    } else if (m_engine && m_channel && fd == m_channel->dataFd()) {
        onTransferEvent(events);
    } else if (m_channel && fd == m_registeredChannelFd) {
        onChannelEvent(fd, events);
    }

    drainQueuedLines();
    flushOutput();
}

void Session::handleError(int fd, const std::string& reason) {
    LOG_ERROR("[Session] " << m_peer.address << " fd " << fd << ": " << reason);
    close("Internal error: " + reason);
}

void Session::onControlEvent(uint32_t events) {
    if (events & IoEvent::WRITABLE) {
        flushOutput();
        if (isClosed()) {
            return;
        }
    }

    if (!(events & (IoEvent::READABLE | IoEvent::HANGUP | IoEvent::ERROR))) {
        return;
    }

    char buffer[CONTROL_READ_SIZE];
    const ssize_t n = ::recv(m_controlFd.get(), buffer, sizeof(buffer), 0);
    if (n == 0) {
        close("Client closed connection");
        return;
    }
    if (n < 0) {
        if (isWouldBlock(errno)) {
            return;
        }
        close("recv() failed: " + errnoToString(errno));
        return;
    }

    m_input.append(buffer, static_cast<size_t>(n));

    std::string line;
    for (;;) {
        const LineBuffer::Result result = m_input.nextLine(line);
        if (result == LineBuffer::Result::NONE || isClosed() || m_closeAfterReply) {
            break;
        }
        dispatchLine(line, result == LineBuffer::Result::OVERLONG);
    }
}

void Session::dispatchLine(const std::string& line, bool overlong) {
    const bool busy = m_state == SessionState::AWAITING_DATA_CHANNEL ||
                      m_state == SessionState::TRANSFERRING;

    if (busy && !overlong) {
        FtpCommand command;
        if (parseCommandLine(line, command)) {
            if (command.verb == "ABOR") {
                m_lastActivity = Clock::now();
                cmdAbor(command.argument);
                return;
            }
            if (command.verb == "QUIT") {
                cmdQuit(command.argument);
                return;
            }
        }
    }

    if (busy || !m_queuedLines.empty()) {
        if (m_queuedLines.size() >= MAX_QUEUED_COMMANDS) {
            LOG_WARNING("[Session] " << m_peer.address << " exceeded the command queue");
            reply(ReplyCodes::SERVICE_NOT_AVAILABLE, "Too many pipelined commands");
            closeAfterReply();
            return;
        }
        m_queuedLines.push_back(QueuedLine{line, overlong});
        return;
    }

    processLine(line, overlong);
}

void Session::drainQueuedLines() {
    while (!m_queuedLines.empty() && !isClosed() && !m_closeAfterReply &&
           (m_state == SessionState::UNAUTHENTICATED || m_state == SessionState::IDLE)) {
        QueuedLine next = std::move(m_queuedLines.front());
        m_queuedLines.pop_front();
        processLine(next.text, next.overlong);
    }
}

void Session::processLine(const std::string& line, bool overlong) {
    m_lastActivity = Clock::now();

    if (overlong) {
        reply(ReplyCodes::SYNTAX_ERROR, "Command line too long");
        return;
    }

    FtpCommand command;
    if (!parseCommandLine(line, command)) {
        reply(ReplyCodes::SYNTAX_ERROR, "Syntax error, command unrecognized");
        return;
    }

    LOG_DEBUG("[Session] " << m_peer.address << " <- " << command.verb
              << (command.verb == "PASS" ? " ****" : (command.argument.empty() ? "" : " " + command.argument)));

    const CommandSpec* spec = findCommand(command.verb);
    if (!spec) {
        reply(ReplyCodes::SYNTAX_ERROR, "Unknown command " + command.verb);
        return;
    }

    if (!isCommandAllowed(m_state, spec->requiresAuth)) {
        reply(ReplyCodes::NOT_LOGGED_IN, "Please login with USER and PASS");
        return;
    }

    if (spec->needsDataChannel && !m_channel) {
        reply(ReplyCodes::CANNOT_OPEN_DATA, "Use PORT or PASV first");
        return;
    }

    (this->*spec->handler)(command.argument);

    if (command.verb != "RNFR") {
        m_renameFrom.clear();
    }
}

void Session::onChannelEvent(int fd, uint32_t events) {
    (void)fd;
    (void)events;
    std::string errorMsg;

    if (m_channel->mode() == DataChannelMode::PASSIVE) {
        bool accepted = false;
        if (!m_channel->acceptPending(accepted, errorMsg)) {
            LOG_WARNING("[Session] " << m_peer.address << " passive accept failed: " << errorMsg);
            failPendingTransfer(ReplyCodes::CANNOT_OPEN_DATA, "Cannot open data connection");
            return;
        }
        if (!accepted) {
            return;
        }

        // The listener is gone; its registration goes with it.
        m_context.reactor.deregister(m_registeredChannelFd);
        m_registeredChannelFd = -1;

        if (m_hasPendingJob) {
            startEngine();
        }
        return;
    }

    if (!m_channel->isConnecting()) {
        return;
    }

    m_context.reactor.deregister(m_registeredChannelFd);
    m_registeredChannelFd = -1;

    if (!m_channel->completeConnect(errorMsg)) {
        LOG_WARNING("[Session] " << m_peer.address << " active connect failed: " << errorMsg);
        failPendingTransfer(ReplyCodes::CANNOT_OPEN_DATA, "Cannot open data connection");
        return;
    }

    if (m_hasPendingJob) {
        startEngine();
    }
}

void Session::onTransferEvent(uint32_t events) {
    if (m_throttled) {
        // Only hangup/error reach a paused socket.
        if (events & (IoEvent::HANGUP | IoEvent::ERROR)) {
            m_engine->abort();
            finishTransfer(TransferStatus::FAILED);
        }
        return;
    }

    const TransferStatus status = m_engine->step(Clock::now());
    switch (status) {
        case TransferStatus::CONTINUE:
            break;

        case TransferStatus::THROTTLED: {
            std::string errorMsg;
            if (!m_context.reactor.modifyInterest(m_channel->dataFd(), IoEvent::NONE, errorMsg)) {
                LOG_ERROR("[Session] " << errorMsg);
                m_engine->abort();
                finishTransfer(TransferStatus::FAILED);
                break;
            }
            m_throttled = true;
            emit(ServerEventType::RATE_LIMIT_ENGAGED, m_engine->job().virtualPath,
                 m_engine->bytesTransferred());
            break;
        }

        case TransferStatus::COMPLETED:
        case TransferStatus::FAILED:
            finishTransfer(status);
            break;
    }
}

void Session::onTick(Clock::time_point now) {
    if (isClosed()) {
        return;
    }

    if (m_engine && m_throttled && m_engine->hasTokens(now)) {
        std::string errorMsg;
        if (m_context.reactor.modifyInterest(m_channel->dataFd(), m_engine->interest(), errorMsg)) {
            m_throttled = false;
        } else {
            LOG_ERROR("[Session] " << errorMsg);
        }
    }

    if (m_channel && !m_engine && m_channel->state() == DataChannelState::NEGOTIATING &&
        now >= m_channel->deadline()) {
        if (m_state == SessionState::AWAITING_DATA_CHANNEL) {
            LOG_WARNING("[Session] " << m_peer.address << " data connection timed out");
            failPendingTransfer(ReplyCodes::CANNOT_OPEN_DATA, "Data connection timed out");
        } else {
            closeChannel();
        }
    }

    const bool waitingForCommand = m_state == SessionState::UNAUTHENTICATED ||
                                   m_state == SessionState::IDLE;
    if (waitingForCommand && !m_closeAfterReply &&
        now - m_lastActivity >= std::chrono::seconds(m_context.settings.idleTimeoutSeconds)) {
        reply(ReplyCodes::SERVICE_NOT_AVAILABLE, "Idle timeout, closing control connection");
        closeAfterReply();
    }

    drainQueuedLines();
    flushOutput();
}

void Session::shutdown(const std::string& text) {
    if (isClosed()) {
        return;
    }
    if (!text.empty()) {
        reply(ReplyCodes::SERVICE_NOT_AVAILABLE, text);
        flushOutput();
    }
    close("Server shutting down");
}

//=============================================================================
// Replies and control socket
//=============================================================================

void Session::reply(int code, const std::string& text) {
    m_output += formatReply(code, text);
}

void Session::replyMultiline(int code, const std::vector<std::string>& lines) {
    m_output += formatMultilineReply(code, lines);
}

void Session::flushOutput() {
    if (isClosed()) {
        return;
    }

    while (!m_output.empty()) {
        const ssize_t n = ::send(m_controlFd.get(), m_output.data(), m_output.size(), MSG_NOSIGNAL);
        if (n < 0) {
            if (isWouldBlock(errno)) {
                break;
            }
            close("send() failed: " + errnoToString(errno));
            return;
        }
        m_output.erase(0, static_cast<size_t>(n));
    }

    if (m_output.empty() && m_closeAfterReply) {
        close("Closed after final reply");
        return;
    }

    const uint32_t interest = m_output.empty()
        ? IoEvent::READABLE
        : (IoEvent::READABLE | IoEvent::WRITABLE);

    std::string errorMsg;
    if (!m_context.reactor.modifyInterest(m_controlFd.get(), interest, errorMsg)) {
        close(errorMsg);
    }
}

void Session::closeAfterReply() {
    m_closeAfterReply = true;
}

void Session::close(const std::string& reason) {
    if (isClosed()) {
        return;
    }

    LOG_DEBUG("[Session] " << m_peer.address << ":" << m_peer.port << " closing: " << reason);

    if (m_engine || m_hasPendingJob) {
        cancelTransfer(reason);
    }
    closeChannel();

    m_context.reactor.deregister(m_controlFd.get());
    m_controlFd.reset();

    SessionState next = SessionState::CLOSED;
    if (nextSessionState(m_state, SessionEvent::DISCONNECTED, next)) {
        m_state = next;
    }

    m_queuedLines.clear();
    m_output.clear();
    m_input.clear();

    emit(ServerEventType::SESSION_CLOSED, std::string(), 0, reason);
}

//=============================================================================
// State machine
//=============================================================================

void Session::transition(SessionEvent event) {
    SessionState next = m_state;
    if (!nextSessionState(m_state, event, next)) {
        LOG_WARNING("[Session] Ignoring illegal transition from "
                    << sessionStateToString(m_state) << " (event " << static_cast<int>(event) << ")");
        return;
    }
    if (next != m_state) {
        // Idle time counts from the end of a transfer, not from the command that started it.
        m_lastActivity = Clock::now();
    }
    m_state = next;
}

//=============================================================================
// Data channel and transfers
//=============================================================================

void Session::closeChannel() {
    if (m_registeredChannelFd >= 0) {
        m_context.reactor.deregister(m_registeredChannelFd);
        m_registeredChannelFd = -1;
    }
    if (m_channel) {
        m_channel->close();
        m_channel.reset();
    }
    m_throttled = false;
}

bool Session::registerChannelFd() {
    int fd = -1;
    uint32_t interest = IoEvent::NONE;

    if (m_engine) {
        fd = m_channel->dataFd();
        interest = m_engine->interest();
    } else {
        fd = m_channel->watchFd();
        interest = m_channel->mode() == DataChannelMode::PASSIVE ? IoEvent::READABLE : IoEvent::WRITABLE;
    }

    std::string errorMsg;
    if (fd == m_registeredChannelFd && fd >= 0) {
        if (!m_context.reactor.modifyInterest(fd, interest, errorMsg)) {
            LOG_ERROR("[Session] " << errorMsg);
            return false;
        }
        return true;
    }

    if (m_registeredChannelFd >= 0) {
        m_context.reactor.deregister(m_registeredChannelFd);
        m_registeredChannelFd = -1;
    }
    if (fd < 0) {
        return true;
    }

    if (!m_context.reactor.registerHandle(fd, interest, this, errorMsg)) {
        LOG_ERROR("[Session] " << errorMsg);
        return false;
    }
    m_registeredChannelFd = fd;
    return true;
}

void Session::openPassive(bool extended) {
    closeChannel();

    Endpoint advertised;
    advertised.address = m_context.settings.passiveAddress.empty()
        ? m_local.address
        : m_context.settings.passiveAddress;

    if (!extended && advertised.isIpv6()) {
        reply(ReplyCodes::CANNOT_OPEN_DATA, "PASV requires IPv4, use EPSV");
        return;
    }

    std::unique_ptr<DataChannel> channel;
    SessionError failure = SessionError::DATA_CHANNEL;
    std::string errorMsg;
    if (!DataChannel::openPassive(m_context.portPool, m_local.address, channel, failure, errorMsg)) {
        LOG_WARNING("[Session] " << m_peer.address << " passive open failed: " << errorMsg);
        if (failure == SessionError::RESOURCE_EXHAUSTED) {
            reply(replyCodeFor(failure), "No data port available");
        } else {
            reply(replyCodeFor(failure), "Cannot open passive connection");
        }
        return;
    }

    channel->setDeadline(Clock::now() + std::chrono::seconds(m_context.settings.dataConnectTimeoutSeconds));
    m_channel = std::move(channel);

    if (!registerChannelFd()) {
        closeChannel();
        reply(ReplyCodes::CANNOT_OPEN_DATA, "Cannot open passive connection");
        return;
    }

    advertised.port = m_channel->port();
    if (extended) {
        reply(ReplyCodes::ENTERING_EXTENDED_PASSIVE, formatEpsvReplyText(advertised.port));
        return;
    }

    std::string text;
    if (!formatPasvReplyText(advertised, text)) {
        closeChannel();
        reply(ReplyCodes::CANNOT_OPEN_DATA, "PASV requires IPv4, use EPSV");
        return;
    }
    reply(ReplyCodes::ENTERING_PASSIVE, text);
}

void Session::setActiveTarget(const Endpoint& target, const std::string& verb) {
    if (!m_context.settings.allowForeignActive) {
        if (normalizeAddress(target.address) != m_peer.address || target.port < ACTIVE_PORT_MIN) {
            LOG_WARNING("[Session] " << m_peer.address << " refused active target "
                        << target.address << ":" << target.port);
            reply(ReplyCodes::SYNTAX_ERROR_ARGS, "Illegal PORT target");
            return;
        }
    }

    closeChannel();
    m_channel = DataChannel::makeActive(target);
    reply(ReplyCodes::COMMAND_OK, verb + " command successful");
}

void Session::beginTransfer(TransferJob job, UniqueFd file) {
    m_pendingJob = std::move(job);
    m_pendingFile = std::move(file);
    m_hasPendingJob = true;

    if (m_channel->state() == DataChannelState::OPEN) {
        startEngine();
        return;
    }

    if (m_channel->mode() == DataChannelMode::ACTIVE && !m_channel->isConnecting()) {
        bool connected = false;
        std::string errorMsg;
        if (!m_channel->startConnect(connected, errorMsg)) {
            LOG_WARNING("[Session] " << m_peer.address << " active connect failed: " << errorMsg);
            failPendingTransfer(ReplyCodes::CANNOT_OPEN_DATA, "Cannot open data connection");
            return;
        }
        m_channel->setDeadline(Clock::now() + std::chrono::seconds(m_context.settings.dataConnectTimeoutSeconds));

        if (connected) {
            startEngine();
            return;
        }
        if (!registerChannelFd()) {
            failPendingTransfer(ReplyCodes::CANNOT_OPEN_DATA, "Cannot open data connection");
            return;
        }
    }

    transition(SessionEvent::DATA_CHANNEL_PENDING);
}

void Session::startEngine() {
    m_engine = std::make_unique<TransferEngine>(std::move(m_pendingJob), std::move(m_pendingFile),
                                                m_channel->dataFd(), &m_connectionBudget,
                                                m_context.globalBudget);
    m_hasPendingJob = false;
    m_pendingJob = TransferJob();
    m_throttled = false;

    transition(SessionEvent::TRANSFER_STARTED);
    emit(ServerEventType::TRANSFER_STARTED, m_engine->job().virtualPath, m_engine->job().startOffset);

    if (!registerChannelFd()) {
        m_engine->abort();
        finishTransfer(TransferStatus::FAILED);
    }
}

void Session::finishTransfer(TransferStatus status) {
    const uint64_t bytes = m_engine->bytesTransferred();
    const std::string path = m_engine->job().virtualPath;
    const bool aborted = m_engine->isAborted();
    const SessionError kind = m_engine->failureKind();
    const std::string errorMsg = m_engine->errorMessage();

    m_engine.reset();
    closeChannel();
    transition(aborted ? SessionEvent::ABORTED : SessionEvent::TRANSFER_FINISHED);

    if (status == TransferStatus::COMPLETED) {
        reply(ReplyCodes::TRANSFER_COMPLETE, "Transfer complete (" + std::to_string(bytes) + " bytes)");
        emit(ServerEventType::TRANSFER_COMPLETED, path, bytes);
        return;
    }

    if (aborted) {
        reply(ReplyCodes::TRANSFER_ABORTED, "Transfer aborted");
    } else if (kind == SessionError::TRANSFER_FILE) {
        LOG_WARNING("[Session] " << m_peer.address << " " << path << ": " << errorMsg);
        reply(replyCodeFor(kind), "Local error in processing: " + errorMsg);
    } else {
        LOG_WARNING("[Session] " << m_peer.address << " " << path << ": " << errorMsg);
        reply(replyCodeFor(kind), "Connection closed; transfer aborted");
    }
    emit(ServerEventType::TRANSFER_FAILED, path, bytes, aborted ? "aborted" : errorMsg);
}

void Session::cancelTransfer(const std::string& reason) {
    std::string path;
    uint64_t bytes = 0;
    if (m_engine) {
        path = m_engine->job().virtualPath;
        bytes = m_engine->bytesTransferred();
        m_engine.reset();
    } else {
        path = m_pendingJob.virtualPath;
    }

    m_hasPendingJob = false;
    m_pendingJob = TransferJob();
    m_pendingFile.reset();
    closeChannel();
    emit(ServerEventType::TRANSFER_FAILED, path, bytes, reason);
}

void Session::failPendingTransfer(int code, const std::string& text) {
    const std::string path = m_pendingJob.virtualPath;
    const bool hadJob = m_hasPendingJob;

    m_hasPendingJob = false;
    m_pendingJob = TransferJob();
    m_pendingFile.reset();
    closeChannel();

    if (m_state == SessionState::AWAITING_DATA_CHANNEL) {
        transition(SessionEvent::DATA_CHANNEL_FAILED);
    }
    if (hadJob) {
        reply(code, text);
        emit(ServerEventType::TRANSFER_FAILED, path, 0, text);
    }
}

bool Session::takeRestartOffset(uint64_t& offset) {
    const bool had = m_hasRestartOffset;
    offset = had ? m_restartOffset : 0;
    m_hasRestartOffset = false;
    m_restartOffset = 0;
    return had;
}

bool Session::requireWrite() {
    if (!m_account.canWrite) {
        reply(ReplyCodes::PERMISSION_DENIED, "Permission denied");
        return false;
    }
    return true;
}

void Session::emit(ServerEventType type, const std::string& path, uint64_t bytes, const std::string& detail) {
    if (!m_context.events) {
        return;
    }

    ServerEvent event;
    event.type = type;
    event.peer = m_peer.address;
    event.user = m_account.name;
    event.path = path;
    event.bytes = bytes;
    event.detail = detail;
    m_context.events->onEvent(event);
}

//=============================================================================
// Login
//=============================================================================

void Session::cmdUser(const std::string& argument) {
    if (m_state != SessionState::UNAUTHENTICATED) {
        reply(ReplyCodes::BAD_SEQUENCE, "Already logged in, use REIN first");
        return;
    }
    if (argument.empty()) {
        reply(ReplyCodes::SYNTAX_ERROR_ARGS, "USER requires a name");
        return;
    }
    m_pendingUser = argument;
    reply(ReplyCodes::NEED_PASSWORD, "Password required for " + argument);
}

void Session::cmdPass(const std::string& argument) {
    if (m_state != SessionState::UNAUTHENTICATED) {
        reply(ReplyCodes::BAD_SEQUENCE, "Already logged in");
        return;
    }
    if (m_pendingUser.empty()) {
        reply(ReplyCodes::BAD_SEQUENCE, "Login with USER first");
        return;
    }

    const std::string user = m_pendingUser;
    m_pendingUser.clear();

    UserAccount account;
    std::unique_ptr<FileSystem> fileSystem;
    if (m_context.credentials.authenticate(user, argument, account)) {
        if (m_context.fileSystemFactory) {
            fileSystem = m_context.fileSystemFactory(account);
        } else {
            fileSystem = std::make_unique<LocalFileSystem>(account.homeDirectory);
        }
    }

    if (!fileSystem) {
        ++m_failedLogins;

        ServerEvent event;
        event.type = ServerEventType::LOGIN_FAILED;
        event.peer = m_peer.address;
        event.user = user;
        event.detail = "attempt " + std::to_string(m_failedLogins);
        if (m_context.events) {
            m_context.events->onEvent(event);
        }

        if (m_failedLogins >= m_context.settings.maxLoginAttempts) {
            reply(ReplyCodes::SERVICE_NOT_AVAILABLE, "Too many failed login attempts");
            closeAfterReply();
        } else {
            reply(ReplyCodes::NOT_LOGGED_IN, "Login incorrect");
        }
        return;
    }

    m_account = account;
    m_fileSystem = std::move(fileSystem);
    m_cwd = "/";
    m_failedLogins = 0;
    transition(SessionEvent::LOGIN_SUCCEEDED);

    reply(ReplyCodes::LOGGED_IN, "User " + user + " logged in");
    emit(ServerEventType::LOGIN_SUCCEEDED);
}

void Session::cmdQuit(const std::string& argument) {
    (void)argument;
    if (m_engine || m_hasPendingJob) {
        cancelTransfer("Client quit");
        if (m_state == SessionState::AWAITING_DATA_CHANNEL || m_state == SessionState::TRANSFERRING) {
            transition(SessionEvent::ABORTED);
        }
    }
    closeChannel();
    reply(ReplyCodes::CLOSING_CONTROL, "Goodbye");
    closeAfterReply();
}

void Session::cmdRein(const std::string& argument) {
    (void)argument;
    closeChannel();
    if (m_state == SessionState::IDLE) {
        transition(SessionEvent::LOGGED_OUT);
    }

    m_account = UserAccount();
    m_fileSystem.reset();
    m_pendingUser.clear();
    m_cwd = "/";
    m_hasRestartOffset = false;
    m_restartOffset = 0;
    m_transferType = 'A';
    reply(ReplyCodes::SERVICE_READY, "Service ready for new user");
}

//=============================================================================
// Informational commands
//=============================================================================

void Session::cmdNoop(const std::string& argument) {
    (void)argument;
    reply(ReplyCodes::COMMAND_OK, "NOOP ok");
}

void Session::cmdSyst(const std::string& argument) {
    (void)argument;
    reply(ReplyCodes::SYSTEM_TYPE, "UNIX Type: L8");
}

void Session::cmdType(const std::string& argument) {
    const std::string type = toUpper(argument);
    if (type == "A" || type == "A N") {
        m_transferType = 'A';
    } else if (type == "I" || type == "L 8") {
        m_transferType = 'I';
    } else if (type.empty()) {
        reply(ReplyCodes::SYNTAX_ERROR_ARGS, "TYPE requires an argument");
        return;
    } else {
        reply(ReplyCodes::NOT_IMPLEMENTED_FOR_PARAM, "Type " + argument + " not supported");
        return;
    }
    reply(ReplyCodes::COMMAND_OK, std::string("Type set to ") + m_transferType);
}

void Session::cmdMode(const std::string& argument) {
    if (toUpper(argument) != "S") {
        reply(ReplyCodes::NOT_IMPLEMENTED_FOR_PARAM, "Only stream mode is supported");
        return;
    }
    reply(ReplyCodes::COMMAND_OK, "Mode set to S");
}

void Session::cmdStru(const std::string& argument) {
    if (toUpper(argument) != "F") {
        reply(ReplyCodes::NOT_IMPLEMENTED_FOR_PARAM, "Only file structure is supported");
        return;
    }
    reply(ReplyCodes::COMMAND_OK, "Structure set to F");
}

void Session::cmdFeat(const std::string& argument) {
    (void)argument;
    replyMultiline(ReplyCodes::SYSTEM_STATUS, {
        "Features:", "EPRT", "EPSV", "MDTM", "PASV", "REST STREAM", "SIZE", "UTF8", "End"
    });
}

void Session::cmdOpts(const std::string& argument) {
    const std::string option = toUpper(argument);
    if (option == "UTF8 ON" || option == "UTF8") {
        reply(ReplyCodes::COMMAND_OK, "UTF8 mode enabled");
        return;
    }
    reply(ReplyCodes::SYNTAX_ERROR_ARGS, "Option not understood");
}

void Session::cmdHelp(const std::string& argument) {
    (void)argument;
    replyMultiline(ReplyCodes::HELP_MESSAGE, {
        "The following commands are recognized:",
        "ABOR ALLO APPE CDUP CWD  DELE EPRT EPSV FEAT HELP LIST MDTM MKD",
        "MODE NLST NOOP OPTS PASS PASV PORT PWD  QUIT REIN REST RETR RMD",
        "RNFR RNTO SIZE STAT STOR STRU SYST TYPE USER XCUP XCWD XMKD XPWD XRMD",
        "Help OK"
    });
}

void Session::cmdStat(const std::string& argument) {
    if (!argument.empty()) {
        reply(ReplyCodes::NOT_IMPLEMENTED_FOR_PARAM, "STAT with a path is not supported");
        return;
    }

    std::vector<std::string> lines;
    lines.push_back(std::string(SERVER_NAME) + " status:");
    lines.push_back("Connected to " + m_peer.address);
    lines.push_back(m_account.name.empty() ? "Not logged in" : "Logged in as " + m_account.name);
    lines.push_back(std::string("TYPE: ") + (m_transferType == 'I' ? "BINARY" : "ASCII"));
    lines.push_back("Session state: " + sessionStateToString(m_state));
    lines.push_back("End of status");
    replyMultiline(ReplyCodes::SYSTEM_STATUS, lines);
}

void Session::cmdAllo(const std::string& argument) {
    (void)argument;
    reply(ReplyCodes::COMMAND_SUPERFLUOUS, "ALLO command ignored");
}

//=============================================================================
// Directory and file management
//=============================================================================

void Session::cmdPwd(const std::string& argument) {
    (void)argument;
    reply(ReplyCodes::PATH_CREATED, quotePath(m_cwd) + " is the current directory");
}

void Session::cmdCwd(const std::string& argument) {
    const std::string path = normalizeVirtualPath(m_cwd, argument);
    FileInfo info;
    std::string errorMsg;
    if (!m_fileSystem->stat(path, info, errorMsg)) {
        reply(ReplyCodes::FILE_UNAVAILABLE, errorMsg);
        return;
    }
    if (!info.isDirectory) {
        reply(ReplyCodes::FILE_UNAVAILABLE, path + ": Not a directory");
        return;
    }
    m_cwd = path;
    reply(ReplyCodes::FILE_ACTION_OK, "Directory changed to " + path);
}

void Session::cmdCdup(const std::string& argument) {
    (void)argument;
    cmdCwd("..");
}

void Session::cmdMkd(const std::string& argument) {
    if (!requireWrite()) {
        return;
    }
    if (argument.empty()) {
        reply(ReplyCodes::SYNTAX_ERROR_ARGS, "MKD requires a path");
        return;
    }
    const std::string path = normalizeVirtualPath(m_cwd, argument);
    std::string errorMsg;
    if (!m_fileSystem->makeDirectory(path, errorMsg)) {
        reply(ReplyCodes::FILE_UNAVAILABLE, errorMsg);
        return;
    }
    reply(ReplyCodes::PATH_CREATED, quotePath(path) + " created");
}

void Session::cmdRmd(const std::string& argument) {
    if (!requireWrite()) {
        return;
    }
    if (argument.empty()) {
        reply(ReplyCodes::SYNTAX_ERROR_ARGS, "RMD requires a path");
        return;
    }
    const std::string path = normalizeVirtualPath(m_cwd, argument);
    std::string errorMsg;
    if (!m_fileSystem->removeDirectory(path, errorMsg)) {
        reply(ReplyCodes::FILE_UNAVAILABLE, errorMsg);
        return;
    }
    reply(ReplyCodes::FILE_ACTION_OK, "Directory removed");
}

void Session::cmdDele(const std::string& argument) {
    if (!requireWrite()) {
        return;
    }
    if (argument.empty()) {
        reply(ReplyCodes::SYNTAX_ERROR_ARGS, "DELE requires a path");
        return;
    }
    const std::string path = normalizeVirtualPath(m_cwd, argument);
    std::string errorMsg;
    if (!m_fileSystem->removeFile(path, errorMsg)) {
        reply(ReplyCodes::FILE_UNAVAILABLE, errorMsg);
        return;
    }
    reply(ReplyCodes::FILE_ACTION_OK, "File deleted");
}

void Session::cmdRnfr(const std::string& argument) {
    m_renameFrom.clear();
    if (!requireWrite()) {
        return;
    }
    if (argument.empty()) {
        reply(ReplyCodes::SYNTAX_ERROR_ARGS, "RNFR requires a path");
        return;
    }
    const std::string path = normalizeVirtualPath(m_cwd, argument);
    FileInfo info;
    std::string errorMsg;
    if (!m_fileSystem->stat(path, info, errorMsg)) {
        reply(ReplyCodes::FILE_UNAVAILABLE, errorMsg);
        return;
    }
    m_renameFrom = path;
    reply(ReplyCodes::PENDING_FURTHER_INFO, "File exists, ready for destination name");
}

void Session::cmdRnto(const std::string& argument) {
    if (m_renameFrom.empty()) {
        reply(ReplyCodes::BAD_SEQUENCE, "RNFR required first");
        return;
    }
    if (!requireWrite()) {
        return;
    }
    if (argument.empty()) {
        reply(ReplyCodes::SYNTAX_ERROR_ARGS, "RNTO requires a path");
        return;
    }
    const std::string path = normalizeVirtualPath(m_cwd, argument);
    std::string errorMsg;
    if (!m_fileSystem->rename(m_renameFrom, path, errorMsg)) {
        reply(ReplyCodes::NAME_NOT_ALLOWED, errorMsg);
        return;
    }
    reply(ReplyCodes::FILE_ACTION_OK, "Rename successful");
}

void Session::cmdSize(const std::string& argument) {
    const std::string path = normalizeVirtualPath(m_cwd, argument);
    FileInfo info;
    std::string errorMsg;
    if (!m_fileSystem->stat(path, info, errorMsg)) {
        reply(ReplyCodes::FILE_UNAVAILABLE, errorMsg);
        return;
    }
    if (info.isDirectory) {
        reply(ReplyCodes::FILE_UNAVAILABLE, path + ": Not a regular file");
        return;
    }
    reply(ReplyCodes::FILE_STATUS, std::to_string(info.size));
}

void Session::cmdMdtm(const std::string& argument) {
    const std::string path = normalizeVirtualPath(m_cwd, argument);
    FileInfo info;
    std::string errorMsg;
    if (!m_fileSystem->stat(path, info, errorMsg)) {
        reply(ReplyCodes::FILE_UNAVAILABLE, errorMsg);
        return;
    }
    reply(ReplyCodes::FILE_STATUS, formatMdtm(info.modified));
}

//=============================================================================
// Data channel negotiation
//=============================================================================

void Session::cmdPasv(const std::string& argument) {
    (void)argument;
    openPassive(false);
}

void Session::cmdEpsv(const std::string& argument) {
    if (toUpper(argument) == "ALL") {
        reply(ReplyCodes::COMMAND_OK, "EPSV ALL ok");
        return;
    }
    openPassive(true);
}

void Session::cmdPort(const std::string& argument) {
    Endpoint target;
    if (!parsePortArgument(argument, target)) {
        reply(ReplyCodes::SYNTAX_ERROR_ARGS, "Invalid PORT argument");
        return;
    }
    setActiveTarget(target, "PORT");
}

void Session::cmdEprt(const std::string& argument) {
    Endpoint target;
    if (!parseEprtArgument(argument, target)) {
        reply(ReplyCodes::SYNTAX_ERROR_ARGS, "Invalid EPRT argument");
        return;
    }
    setActiveTarget(target, "EPRT");
}

//=============================================================================
// Transfers
//=============================================================================

void Session::cmdList(const std::string& argument) {
    sendListing(argument, false);
}

void Session::cmdNlst(const std::string& argument) {
    sendListing(argument, true);
}

void Session::sendListing(const std::string& argument, bool namesOnly) {
    const std::string path = normalizeVirtualPath(m_cwd, stripListOptions(argument));

    std::vector<FileInfo> entries;
    std::string errorMsg;
    if (!m_fileSystem->list(path, entries, errorMsg)) {
        reply(ReplyCodes::FILE_UNAVAILABLE, errorMsg);
        return;
    }

    TransferJob job;
    job.direction = TransferDirection::LISTING;
    job.virtualPath = path;
    job.listing = formatListing(entries, namesOnly, std::time(nullptr));

    reply(ReplyCodes::FILE_STATUS_OK, "Opening ASCII mode data connection for file list");
    beginTransfer(std::move(job), UniqueFd());
}

void Session::cmdRetr(const std::string& argument) {
    uint64_t offset = 0;
    takeRestartOffset(offset);

    if (argument.empty()) {
        reply(ReplyCodes::SYNTAX_ERROR_ARGS, "RETR requires a path");
        return;
    }

    const std::string path = normalizeVirtualPath(m_cwd, argument);
    UniqueFd file;
    uint64_t size = 0;
    std::string errorMsg;
    if (!m_fileSystem->openForRead(path, file, size, errorMsg)) {
        reply(ReplyCodes::FILE_UNAVAILABLE, errorMsg);
        return;
    }
    if (offset > size) {
        reply(ReplyCodes::INVALID_RESTART, "Invalid restart position");
        return;
    }

    TransferJob job;
    job.direction = TransferDirection::DOWNLOAD;
    job.virtualPath = path;
    job.startOffset = offset;

    reply(ReplyCodes::FILE_STATUS_OK,
          std::string("Opening ") + (m_transferType == 'I' ? "BINARY" : "ASCII") +
          " mode data connection for " + path + " (" + std::to_string(size - offset) + " bytes)");
    beginTransfer(std::move(job), std::move(file));
}

void Session::cmdStor(const std::string& argument) {
    storeFile(argument, false);
}

void Session::cmdAppe(const std::string& argument) {
    storeFile(argument, true);
}

void Session::storeFile(const std::string& argument, bool append) {
    uint64_t offset = 0;
    takeRestartOffset(offset);

    if (!requireWrite()) {
        return;
    }
    if (argument.empty()) {
        reply(ReplyCodes::SYNTAX_ERROR_ARGS, "A file name is required");
        return;
    }

    const std::string path = normalizeVirtualPath(m_cwd, argument);
    const bool truncate = !append && offset == 0;

    if (!append && offset > 0) {
        // Check before opening so a bad resume never creates the file.
        FileInfo existing;
        std::string statError;
        if (!m_fileSystem->stat(path, existing, statError) || offset > existing.size) {
            reply(ReplyCodes::INVALID_RESTART, "Invalid restart position");
            return;
        }
    }

    UniqueFd file;
    uint64_t size = 0;
    std::string errorMsg;
    if (!m_fileSystem->openForWrite(path, truncate, file, size, errorMsg)) {
        reply(ReplyCodes::FILE_UNAVAILABLE, errorMsg);
        return;
    }

    if (append) {
        offset = size;
    } else if (offset > size) {
        reply(ReplyCodes::INVALID_RESTART, "Invalid restart position");
        return;
    } else if (offset < size && ::ftruncate(file.get(), static_cast<off_t>(offset)) != 0) {
        // Resumed uploads replace everything past the restart point.
        reply(ReplyCodes::LOCAL_ERROR, "Local error in processing: " + errnoToString(errno));
        return;
    }

    TransferJob job;
    job.direction = TransferDirection::UPLOAD;
    job.virtualPath = path;
    job.startOffset = offset;

    reply(ReplyCodes::FILE_STATUS_OK, "Opening data connection for " + path);
    beginTransfer(std::move(job), std::move(file));
}

void Session::cmdRest(const std::string& argument) {
    uint64_t offset = 0;
    if (!parseRestartOffset(argument, offset)) {
        reply(ReplyCodes::SYNTAX_ERROR_ARGS, "Invalid restart offset");
        return;
    }
    m_hasRestartOffset = true;
    m_restartOffset = offset;
    reply(ReplyCodes::PENDING_FURTHER_INFO,
          "Restarting at " + std::to_string(offset) + ". Send STORE or RETRIEVE to initiate transfer");
}

void Session::cmdAbor(const std::string& argument) {
    (void)argument;

    if (m_state == SessionState::TRANSFERRING && m_engine) {
        m_engine->abort();
        finishTransfer(TransferStatus::FAILED);
        reply(ReplyCodes::TRANSFER_COMPLETE, "ABOR command successful");
        return;
    }

    if (m_state == SessionState::AWAITING_DATA_CHANNEL) {
        const std::string path = m_pendingJob.virtualPath;
        m_hasPendingJob = false;
        m_pendingJob = TransferJob();
        m_pendingFile.reset();
        closeChannel();
        transition(SessionEvent::ABORTED);
        reply(ReplyCodes::TRANSFER_ABORTED, "Transfer aborted");
        reply(ReplyCodes::TRANSFER_COMPLETE, "ABOR command successful");
        emit(ServerEventType::TRANSFER_FAILED, path, 0, "aborted");
        return;
    }

    closeChannel();
    reply(ReplyCodes::NO_TRANSFER_TO_ABORT, "No transfer to abort");
}

}  // namespace Wharf
