/**
 * @file data_channel_test.cpp
 * @brief Passive and active DataChannel tests on loopback
 */

#include <gtest/gtest.h>
#include "wharf/DataChannel.h"

#include <arpa/inet.h>
#include <chrono>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

using namespace Wharf;

namespace {

UniqueFd connectBlocking(uint16_t port) {
    UniqueFd sock(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    ::inet_pton(AF_INET, LOCALHOST_IP, &addr.sin_addr);
    if (::connect(sock.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        sock.reset();
    }
    return sock;
}

bool waitFor(int fd, short events, int timeoutMs) {
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = events;
    return ::poll(&pfd, 1, timeoutMs) == 1;
}

}  // namespace

TEST(DataChannelTest, PassiveAcceptsFirstConnectionThenStopsListening) {
    PassivePortPool pool(52100, 52109);
    std::unique_ptr<DataChannel> channel;
    SessionError failure = SessionError::PROTOCOL;
    std::string err;

    ASSERT_TRUE(DataChannel::openPassive(pool, LOCALHOST_IP, channel, failure, err)) << err;
    ASSERT_NE(channel, nullptr);
    EXPECT_EQ(channel->mode(), DataChannelMode::PASSIVE);
    EXPECT_EQ(channel->state(), DataChannelState::NEGOTIATING);
    EXPECT_GE(channel->port(), 52100);
    EXPECT_LE(channel->port(), 52109);
    EXPECT_EQ(channel->watchFd(), channel->listenFd());
    EXPECT_EQ(pool.leasedCount(), 1u);

    UniqueFd client = connectBlocking(channel->port());
    ASSERT_TRUE(client.isValid());
    ASSERT_TRUE(waitFor(channel->listenFd(), POLLIN, 1000));

    bool accepted = false;
    ASSERT_TRUE(channel->acceptPending(accepted, err)) << err;
    ASSERT_TRUE(accepted);
    EXPECT_EQ(channel->state(), DataChannelState::OPEN);
    EXPECT_EQ(channel->listenFd(), -1);
    EXPECT_EQ(channel->watchFd(), -1);
    EXPECT_EQ(channel->peer().address, LOCALHOST_IP);

    // The listener is gone, so a second connection is refused.
    UniqueFd late = connectBlocking(channel->port());
    EXPECT_FALSE(late.isValid());
}

TEST(DataChannelTest, AcceptWithNothingPendingKeepsListening) {
    PassivePortPool pool(52110, 52119);
    std::unique_ptr<DataChannel> channel;
    SessionError failure = SessionError::PROTOCOL;
    std::string err;
    ASSERT_TRUE(DataChannel::openPassive(pool, LOCALHOST_IP, channel, failure, err)) << err;

    bool accepted = true;
    EXPECT_TRUE(channel->acceptPending(accepted, err));
    EXPECT_FALSE(accepted);
    EXPECT_EQ(channel->state(), DataChannelState::NEGOTIATING);
}

TEST(DataChannelTest, CloseReturnsPassivePort) {
    PassivePortPool pool(52120, 52129);
    std::unique_ptr<DataChannel> channel;
    SessionError failure = SessionError::PROTOCOL;
    std::string err;
    ASSERT_TRUE(DataChannel::openPassive(pool, LOCALHOST_IP, channel, failure, err)) << err;
    EXPECT_EQ(pool.leasedCount(), 1u);

    channel->close();
    EXPECT_EQ(channel->state(), DataChannelState::CLOSED);
    EXPECT_EQ(pool.leasedCount(), 0u);

    ASSERT_TRUE(DataChannel::openPassive(pool, LOCALHOST_IP, channel, failure, err)) << err;
    channel.reset();
    EXPECT_EQ(pool.leasedCount(), 0u);
}

TEST(DataChannelTest, ExhaustedPoolReportsResourceExhausted) {
    PassivePortPool pool(52130, 52130);
    std::unique_ptr<DataChannel> first;
    std::unique_ptr<DataChannel> second;
    SessionError failure = SessionError::PROTOCOL;
    std::string err;

    ASSERT_TRUE(DataChannel::openPassive(pool, LOCALHOST_IP, first, failure, err)) << err;
    EXPECT_FALSE(DataChannel::openPassive(pool, LOCALHOST_IP, second, failure, err));
    EXPECT_EQ(failure, SessionError::RESOURCE_EXHAUSTED);
    EXPECT_EQ(second, nullptr);
}

TEST(DataChannelTest, BusyPortIsSkipped) {
    UniqueFd squatter;
    std::string err;
    ASSERT_TRUE(createListenSocket(Endpoint{LOCALHOST_IP, 52140}, 1, squatter, err)) << err;

    PassivePortPool pool(52140, 52141);
    std::unique_ptr<DataChannel> channel;
    SessionError failure = SessionError::PROTOCOL;
    ASSERT_TRUE(DataChannel::openPassive(pool, LOCALHOST_IP, channel, failure, err)) << err;
    EXPECT_EQ(channel->port(), 52141);
    EXPECT_EQ(pool.leasedCount(), 1u);
}

TEST(DataChannelTest, ActiveConnectReachesTarget) {
    UniqueFd listener;
    std::string err;
    ASSERT_TRUE(createListenSocket(Endpoint{LOCALHOST_IP, 0}, 4, listener, err)) << err;
    Endpoint bound;
    ASSERT_TRUE(getLocalEndpoint(listener.get(), bound));

    std::unique_ptr<DataChannel> channel = DataChannel::makeActive(Endpoint{LOCALHOST_IP, bound.port});
    EXPECT_EQ(channel->mode(), DataChannelMode::ACTIVE);
    EXPECT_EQ(channel->port(), bound.port);
    EXPECT_EQ(channel->watchFd(), -1);

    bool connected = false;
    ASSERT_TRUE(channel->startConnect(connected, err)) << err;
    if (!connected) {
        ASSERT_TRUE(channel->isConnecting());
        EXPECT_EQ(channel->watchFd(), channel->dataFd());
        ASSERT_TRUE(waitFor(channel->dataFd(), POLLOUT, 1000));
        ASSERT_TRUE(channel->completeConnect(err)) << err;
    }
    EXPECT_EQ(channel->state(), DataChannelState::OPEN);
    EXPECT_TRUE(channel->dataFd() >= 0);

    ASSERT_TRUE(waitFor(listener.get(), POLLIN, 1000));
    UniqueFd serverSide;
    Endpoint peer;
    EXPECT_TRUE(acceptConnection(listener.get(), serverSide, peer, err)) << err;
}

TEST(DataChannelTest, ActiveConnectToClosedPortFails) {
    // Bind then close to find a port nobody listens on.
    uint16_t port = 0;
    {
        UniqueFd listener;
        std::string err;
        ASSERT_TRUE(createListenSocket(Endpoint{LOCALHOST_IP, 0}, 1, listener, err)) << err;
        Endpoint bound;
        ASSERT_TRUE(getLocalEndpoint(listener.get(), bound));
        port = bound.port;
    }

    std::unique_ptr<DataChannel> channel = DataChannel::makeActive(Endpoint{LOCALHOST_IP, port});
    bool connected = false;
    std::string err;
    if (!channel->startConnect(connected, err)) {
        SUCCEED();
        return;
    }
    ASSERT_FALSE(connected);
    ASSERT_TRUE(waitFor(channel->dataFd(), POLLOUT, 1000));
    EXPECT_FALSE(channel->completeConnect(err));
    EXPECT_FALSE(err.empty());
    EXPECT_NE(channel->state(), DataChannelState::OPEN);
}
