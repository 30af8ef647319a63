/**
 * @file Session.h
 * @brief One FTP control connection and its data channel
 */

#pragma once

#include "config.h"
#include "DataChannel.h"
#include "EventSink.h"
#include "FileSystem.h"
#include "FtpCommand.h"
#include "RateBudget.h"
#include "Reactor.h"
#include "SessionState.h"
#include "SocketUtils.h"
#include "TransferEngine.h"
#include "UserStore.h"

#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <string>

namespace Wharf {

/**
 * @brief Creates the FileSystem a user sees after login
 */
using FileSystemFactory = std::function<std::unique_ptr<FileSystem>(const UserAccount&)>;

/**
 * @brief Per-session limits, copied from ServerConfig
 */
struct SessionSettings {
    std::string passiveAddress;
    uint64_t bytesPerSecond{0};
    uint64_t burstBytes{0};
    uint32_t idleTimeoutSeconds{IDLE_TIMEOUT_S_DEFAULT};
    uint32_t dataConnectTimeoutSeconds{DATA_CONNECT_TIMEOUT_S_DEFAULT};
    uint32_t maxLoginAttempts{MAX_LOGIN_ATTEMPTS_DEFAULT};
    bool allowForeignActive{false};
};

/**
 * @brief Server-owned collaborators shared by every session
 *
 * All references must outlive the sessions built from this context.
 */
struct SessionContext {
    Reactor& reactor;
    PassivePortPool& portPool;
    RateBudget* globalBudget;          ///< May be nullptr (unlimited)
    const CredentialStore& credentials;
    EventSink* events;                 ///< May be nullptr
    FileSystemFactory fileSystemFactory;
    SessionSettings settings;
};

/**
 * @class Session
 * @brief Command-channel state machine for one client
 *
 * Lifecycle: UNAUTHENTICATED -> IDLE -> {AWAITING_DATA_CHANNEL, TRANSFERRING}
 * -> CLOSED (see SessionState.h). The session registers its control socket
 * and its data channel descriptors with the reactor and is driven entirely
 * by handleEvent() and onTick() on the reactor thread.
 *
 * Ordering: while a transfer is pending or running, complete command lines
 * are queued and processed once it finishes, so every command receives its
 * reply in order. ABOR and QUIT bypass the queue.
 *
 * Replies are appended to an output buffer and written when the control
 * socket is writable.
 *
 * A closed session has released every descriptor and port lease; the owner
 * destroys it outside of any handler call.
 */
class Session : public EventHandler {
public:
    using Clock = std::chrono::steady_clock;

    Session(UniqueFd controlFd, const Endpoint& peer, SessionContext context);
    ~Session() override;

    // Prevent copying
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /**
     * @brief Register with the reactor and queue the 220 greeting
     */
    bool start(std::string& errorMsg);

    void handleEvent(int fd, uint32_t events) override;
    void handleError(int fd, const std::string& reason) override;

    /**
     * @brief Housekeeping: idle expiry, negotiation timeout, throttle resume
     */
    void onTick(Clock::time_point now);

    /**
     * @brief Tear down immediately (server shutdown)
     * @param reply Optional last reply to attempt before closing
     */
    void shutdown(const std::string& reply);

    SessionState state() const { return m_state; }
    bool isClosed() const { return m_state == SessionState::CLOSED; }
    int controlFd() const { return m_controlFd.get(); }
    const Endpoint& peer() const { return m_peer; }
    const std::string& userName() const { return m_account.name; }
    const std::string& workingDirectory() const { return m_cwd; }

private:
    using Handler = void (Session::*)(const std::string& argument);

    struct CommandSpec {
        const char* verb;
        Handler handler;
        bool requiresAuth;
        bool needsDataChannel;
    };

    struct QueuedLine {
        std::string text;
        bool overlong;
    };

    static const CommandSpec* findCommand(const std::string& verb);

    //=========================================================================
    // Event handling
    //=========================================================================

    void onControlEvent(uint32_t events);
    void onChannelEvent(int fd, uint32_t events);
    void onTransferEvent(uint32_t events);

    void dispatchLine(const std::string& line, bool overlong);
    void processLine(const std::string& line, bool overlong);
    void drainQueuedLines();

    //=========================================================================
    // Replies and control socket
    //=========================================================================

    void reply(int code, const std::string& text);
    void replyMultiline(int code, const std::vector<std::string>& lines);
    void flushOutput();
    void closeAfterReply();
    void close(const std::string& reason);

    //=========================================================================
    // State machine
    //=========================================================================

    void transition(SessionEvent event);

    //=========================================================================
    // Data channel and transfers
    //=========================================================================

    void closeChannel();
    bool registerChannelFd();
    void openPassive(bool extended);
    void setActiveTarget(const Endpoint& target, const std::string& verb);
    void beginTransfer(TransferJob job, UniqueFd file);
    void startEngine();
    void finishTransfer(TransferStatus status);
    void cancelTransfer(const std::string& reason);
    void failPendingTransfer(int code, const std::string& text);
    bool takeRestartOffset(uint64_t& offset);
    bool requireWrite();

    void emit(ServerEventType type, const std::string& path = std::string(),
              uint64_t bytes = 0, const std::string& detail = std::string());

    //=========================================================================
    // Command handlers
    //=========================================================================

    void cmdUser(const std::string& argument);
    void cmdPass(const std::string& argument);
    void cmdQuit(const std::string& argument);
    void cmdRein(const std::string& argument);
    void cmdNoop(const std::string& argument);
    void cmdSyst(const std::string& argument);
    void cmdType(const std::string& argument);
    void cmdMode(const std::string& argument);
    void cmdStru(const std::string& argument);
    void cmdFeat(const std::string& argument);
    void cmdOpts(const std::string& argument);
    void cmdHelp(const std::string& argument);
    void cmdStat(const std::string& argument);
    void cmdAllo(const std::string& argument);
    void cmdPwd(const std::string& argument);
    void cmdCwd(const std::string& argument);
    void cmdCdup(const std::string& argument);
    void cmdMkd(const std::string& argument);
    void cmdRmd(const std::string& argument);
    void cmdDele(const std::string& argument);
    void cmdRnfr(const std::string& argument);
    void cmdRnto(const std::string& argument);
    void cmdSize(const std::string& argument);
    void cmdMdtm(const std::string& argument);
    void cmdPasv(const std::string& argument);
    void cmdEpsv(const std::string& argument);
    void cmdPort(const std::string& argument);
    void cmdEprt(const std::string& argument);
    void cmdList(const std::string& argument);
    void cmdNlst(const std::string& argument);
    void cmdRetr(const std::string& argument);
    void cmdStor(const std::string& argument);
    void cmdAppe(const std::string& argument);
    void cmdRest(const std::string& argument);
    void cmdAbor(const std::string& argument);

    void sendListing(const std::string& argument, bool namesOnly);
    void storeFile(const std::string& argument, bool append);

    //=========================================================================
    // Members
    //=========================================================================

    UniqueFd m_controlFd;
    Endpoint m_peer;
    Endpoint m_local;
    SessionContext m_context;
    SessionState m_state{SessionState::UNAUTHENTICATED};

    LineBuffer m_input;
    std::deque<QueuedLine> m_queuedLines;
    std::string m_output;
    bool m_closeAfterReply{false};

    std::string m_pendingUser;
    uint32_t m_failedLogins{0};
    UserAccount m_account;
    std::unique_ptr<FileSystem> m_fileSystem;
    std::string m_cwd{"/"};
    std::string m_renameFrom;
    bool m_hasRestartOffset{false};
    uint64_t m_restartOffset{0};
    char m_transferType{'A'};

    std::unique_ptr<DataChannel> m_channel;
    int m_registeredChannelFd{-1};

    bool m_hasPendingJob{false};
    TransferJob m_pendingJob;
    UniqueFd m_pendingFile;

    std::unique_ptr<TransferEngine> m_engine;
    bool m_throttled{false};

    RateBudget m_connectionBudget;
    Clock::time_point m_lastActivity;
};

}  // namespace Wharf
