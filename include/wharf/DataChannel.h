/**
 * @file DataChannel.h
 * @brief Active and passive FTP data connections
 */

#pragma once

#include "ErrorCodes.h"
#include "PassivePortPool.h"
#include "SocketUtils.h"

#include <chrono>
#include <memory>
#include <string>

namespace Wharf {

enum class DataChannelMode : uint8_t {
    ACTIVE,   ///< Server connects to the client (PORT/EPRT)
    PASSIVE   ///< Client connects to a leased server port (PASV/EPSV)
};

enum class DataChannelState : uint8_t {
    NEGOTIATING,  ///< Listening, connecting, or waiting for a transfer to start connecting
    OPEN,         ///< Connected data socket available
    CLOSED
};

/**
 * @class DataChannel
 * @brief One data connection owned by a Session
 *
 * Passive channels hold a PortLease and a listening socket until the first
 * client connection is accepted; the listener is closed right after so later
 * connection attempts are refused. Active channels only record the target
 * until startConnect() is called for a transfer.
 *
 * The channel never touches the reactor; the owning Session registers
 * whatever descriptor watchFd() reports.
 */
class DataChannel {
public:
    using Clock = std::chrono::steady_clock;

    ~DataChannel() = default;

    DataChannel(const DataChannel&) = delete;
    DataChannel& operator=(const DataChannel&) = delete;

    /**
     * @brief Lease a passive port and listen on it
     * @param pool Port pool to lease from
     * @param bindAddress Local address of the control connection
     * @param out Receives the channel
     * @param failure Set to RESOURCE_EXHAUSTED (pool empty) or DATA_CHANNEL
     * @param errorMsg Output error message
     *
     * A port that is busy at OS level (EADDRINUSE) is skipped and the next
     * pool port is tried.
     */
    static bool openPassive(PassivePortPool& pool,
                            const std::string& bindAddress,
                            std::unique_ptr<DataChannel>& out,
                            SessionError& failure,
                            std::string& errorMsg);

    /**
     * @brief Record an active-mode target; no connection is made yet
     */
    static std::unique_ptr<DataChannel> makeActive(const Endpoint& target);

    DataChannelMode mode() const { return m_mode; }
    DataChannelState state() const { return m_state; }

    /**
     * @brief Passive port (lease) or active target port
     */
    uint16_t port() const;

    /**
     * @brief Active target, or the accepted passive peer once open
     */
    const Endpoint& peer() const { return m_peer; }

    int listenFd() const { return m_listenFd.get(); }
    int dataFd() const { return m_dataFd.get(); }

    /**
     * @brief Descriptor the session should watch while negotiating
     * @return listen fd (passive), connecting fd (active), or -1
     */
    int watchFd() const;

    /**
     * @brief Whether an active connect is in flight
     */
    bool isConnecting() const { return m_connecting; }

    /**
     * @brief Begin the non-blocking outbound connect (active mode)
     * @param connected Set when the connect completed immediately
     */
    bool startConnect(bool& connected, std::string& errorMsg);

    /**
     * @brief Check the outcome of an in-flight connect on writability
     */
    bool completeConnect(std::string& errorMsg);

    /**
     * @brief Accept the first client connection (passive mode)
     * @param accepted Set when a connection was accepted and the channel opened
     * @return false on an accept error
     */
    bool acceptPending(bool& accepted, std::string& errorMsg);

    /**
     * @brief Close sockets and return the leased port
     */
    void close();

    void setDeadline(Clock::time_point deadline) { m_deadline = deadline; }
    Clock::time_point deadline() const { return m_deadline; }

private:
    explicit DataChannel(DataChannelMode mode) : m_mode(mode) {}

    DataChannelMode m_mode;
    DataChannelState m_state{DataChannelState::NEGOTIATING};

    PortLease m_lease;
    UniqueFd m_listenFd;
    UniqueFd m_dataFd;
    Endpoint m_peer;
    bool m_connecting{false};
    Clock::time_point m_deadline{Clock::time_point::max()};
};

}  // namespace Wharf
