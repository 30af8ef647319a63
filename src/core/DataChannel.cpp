/**
 * @file DataChannel.cpp
 * @brief Active and passive FTP data connections
 */

#include "wharf/DataChannel.h"
#include "wharf/Debug.h"

#include <cerrno>
#include <utility>
#include <vector>

namespace Wharf {

bool DataChannel::openPassive(PassivePortPool& pool,
                              const std::string& bindAddress,
                              std::unique_ptr<DataChannel>& out,
                              SessionError& failure,
                              std::string& errorMsg)
{
    // Ports found busy stay leased until we finish so acquire() moves past them.
    std::vector<PortLease> busy;

    for (size_t attempt = 0; attempt < pool.capacity(); ++attempt) {
        PortLease lease;
        if (!pool.acquire(lease)) {
            failure = SessionError::RESOURCE_EXHAUSTED;
            errorMsg = "No data port available";
            return false;
        }

        UniqueFd listener;
        int bindErrno = 0;
        if (!createListenSocket(Endpoint{bindAddress, lease.port()}, 1, listener, errorMsg, &bindErrno)) {
            if (bindErrno == EADDRINUSE) {
                LOG_DEBUG("[DataChannel] Port " << lease.port() << " busy, trying next");
                busy.push_back(std::move(lease));
                continue;
            }
            failure = SessionError::DATA_CHANNEL;
            return false;
        }

        std::unique_ptr<DataChannel> channel(new DataChannel(DataChannelMode::PASSIVE));
        channel->m_lease = std::move(lease);
        channel->m_listenFd = std::move(listener);
        out = std::move(channel);
        return true;
    }

    failure = SessionError::RESOURCE_EXHAUSTED;
    errorMsg = "No data port available";
    return false;
}

std::unique_ptr<DataChannel> DataChannel::makeActive(const Endpoint& target) {
    std::unique_ptr<DataChannel> channel(new DataChannel(DataChannelMode::ACTIVE));
    channel->m_peer = target;
    return channel;
}

uint16_t DataChannel::port() const {
    if (m_mode == DataChannelMode::PASSIVE) {
        return m_lease.port();
    }
    return m_peer.port;
}

int DataChannel::watchFd() const {
    if (m_state != DataChannelState::NEGOTIATING) {
        return -1;
    }
    if (m_mode == DataChannelMode::PASSIVE) {
        return m_listenFd.get();
    }
    return m_connecting ? m_dataFd.get() : -1;
}

bool DataChannel::startConnect(bool& connected, std::string& errorMsg) {
    connected = false;
    if (m_mode != DataChannelMode::ACTIVE || m_state != DataChannelState::NEGOTIATING) {
        errorMsg = "Channel is not an idle active channel";
        return false;
    }

    bool inProgress = false;
    if (!Wharf::startConnect(m_peer, m_dataFd, inProgress, errorMsg)) {
        return false;
    }

    if (inProgress) {
        m_connecting = true;
    } else {
        m_state = DataChannelState::OPEN;
        connected = true;
    }
    return true;
}

bool DataChannel::completeConnect(std::string& errorMsg) {
    if (!m_connecting) {
        errorMsg = "No connect in progress";
        return false;
    }
    m_connecting = false;

    if (!finishConnect(m_dataFd.get(), errorMsg)) {
        m_dataFd.reset();
        return false;
    }

    m_state = DataChannelState::OPEN;
    return true;
}

bool DataChannel::acceptPending(bool& accepted, std::string& errorMsg) {
    accepted = false;
    if (m_mode != DataChannelMode::PASSIVE || m_state != DataChannelState::NEGOTIATING) {
        return true;
    }

    UniqueFd conn;
    Endpoint peer;
    if (!acceptConnection(m_listenFd.get(), conn, peer, errorMsg)) {
        return errorMsg.empty();  // EAGAIN / ECONNABORTED: keep listening
    }

    m_dataFd = std::move(conn);
    m_peer = peer;
    m_listenFd.reset();
    m_state = DataChannelState::OPEN;
    accepted = true;
    return true;
}

void DataChannel::close() {
    m_listenFd.reset();
    m_dataFd.reset();
    m_lease.release();
    m_connecting = false;
    m_state = DataChannelState::CLOSED;
}

}  // namespace Wharf
