/**
 * @file reactor_test.cpp
 * @brief Tests for the epoll Reactor
 */

#include <gtest/gtest.h>
#include "wharf/Reactor.h"

#include <cerrno>
#include <chrono>
#include <stdexcept>
#include <string>
#include <sys/epoll.h>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace Wharf;

namespace {

class RecordingHandler : public EventHandler {
public:
    struct Call {
        int fd;
        uint32_t events;
    };

    std::vector<Call> calls;
    std::vector<std::string> errors;
    bool throwOnEvent{false};

    void handleEvent(int fd, uint32_t events) override {
        calls.push_back(Call{fd, events});
        if (throwOnEvent) {
            throw std::runtime_error("handler failure");
        }
    }

    void handleError(int fd, const std::string& reason) override {
        (void)fd;
        errors.push_back(reason);
    }
};

// Closes the other pipe's read end when it fires, so a second event for
// that fd in the same batch must be dropped.
class ClosingHandler : public EventHandler {
public:
    Reactor* reactor{nullptr};
    int victimFd{-1};
    int eventsSeen{0};

    void handleEvent(int fd, uint32_t events) override {
        (void)fd;
        (void)events;
        ++eventsSeen;
        if (victimFd >= 0) {
            reactor->deregister(victimFd);
            victimFd = -1;
        }
    }

    void handleError(int, const std::string&) override {}
};

class FailingReactor : public Reactor {
public:
    int failWithErrno{EBADF};
    int waits{0};

protected:
    int waitForEvents(epoll_event* events, int maxEvents, int timeoutMs) override {
        ++waits;
        if (failWithErrno == EINTR && waits > 3) {
            return Reactor::waitForEvents(events, maxEvents, timeoutMs);
        }
        errno = failWithErrno;
        return -1;
    }
};

struct Pipe {
    UniqueFd readEnd;
    UniqueFd writeEnd;

    Pipe() {
        int fds[2];
        if (::pipe(fds) == 0) {
            readEnd.reset(fds[0]);
            writeEnd.reset(fds[1]);
        }
    }

    void poke() {
        const char byte = 'x';
        ssize_t n = ::write(writeEnd.get(), &byte, 1);
        (void)n;
    }
};

}  // namespace

class ReactorTest : public ::testing::Test {
protected:
    Reactor reactor;
    std::string err;

    void SetUp() override {
        ASSERT_TRUE(reactor.initialize(err)) << err;
    }
};

TEST_F(ReactorTest, DispatchesReadableEvent) {
    Pipe pipe;
    RecordingHandler handler;
    ASSERT_TRUE(reactor.registerHandle(pipe.readEnd.get(), IoEvent::READABLE, &handler, err)) << err;

    pipe.poke();
    ASSERT_TRUE(reactor.runOnce(100, err)) << err;

    ASSERT_EQ(handler.calls.size(), 1u);
    EXPECT_EQ(handler.calls[0].fd, pipe.readEnd.get());
    EXPECT_TRUE(handler.calls[0].events & IoEvent::READABLE);
}

TEST_F(ReactorTest, NoInterestMeansNoReadinessReports) {
    Pipe pipe;
    RecordingHandler handler;
    ASSERT_TRUE(reactor.registerHandle(pipe.readEnd.get(), IoEvent::READABLE, &handler, err)) << err;
    ASSERT_TRUE(reactor.modifyInterest(pipe.readEnd.get(), IoEvent::NONE, err)) << err;
    EXPECT_EQ(reactor.interestOf(pipe.readEnd.get()), IoEvent::NONE);

    pipe.poke();
    ASSERT_TRUE(reactor.runOnce(20, err)) << err;
    EXPECT_TRUE(handler.calls.empty());

    ASSERT_TRUE(reactor.modifyInterest(pipe.readEnd.get(), IoEvent::READABLE, err)) << err;
    ASSERT_TRUE(reactor.runOnce(100, err)) << err;
    EXPECT_EQ(handler.calls.size(), 1u);
}

TEST_F(ReactorTest, RegistrationBookkeeping) {
    Pipe pipe;
    RecordingHandler handler;
    const int fd = pipe.readEnd.get();

    EXPECT_FALSE(reactor.isRegistered(fd));
    ASSERT_TRUE(reactor.registerHandle(fd, IoEvent::READABLE, &handler, err)) << err;
    EXPECT_TRUE(reactor.isRegistered(fd));
    EXPECT_EQ(reactor.handleCount(), 1u);
    EXPECT_FALSE(reactor.registerHandle(fd, IoEvent::READABLE, &handler, err));

    reactor.deregister(fd);
    reactor.deregister(fd);
    EXPECT_FALSE(reactor.isRegistered(fd));
    EXPECT_EQ(reactor.handleCount(), 0u);
    EXPECT_FALSE(reactor.modifyInterest(fd, IoEvent::WRITABLE, err));
}

TEST_F(ReactorTest, EventForDeregisteredFdInSameBatchIsDropped) {
    Pipe first;
    Pipe second;
    ClosingHandler closer;
    closer.reactor = &reactor;
    ClosingHandler victim;

    ASSERT_TRUE(reactor.registerHandle(first.readEnd.get(), IoEvent::READABLE, &closer, err)) << err;
    ASSERT_TRUE(reactor.registerHandle(second.readEnd.get(), IoEvent::READABLE, &victim, err)) << err;

    // Whichever handler runs first deregisters the other.
    closer.victimFd = second.readEnd.get();
    victim.reactor = &reactor;
    victim.victimFd = first.readEnd.get();

    first.poke();
    second.poke();
    ASSERT_TRUE(reactor.runOnce(100, err)) << err;

    EXPECT_EQ(closer.eventsSeen + victim.eventsSeen, 1);
}

TEST_F(ReactorTest, HandlerExceptionRoutesToHandleError) {
    Pipe pipe;
    RecordingHandler handler;
    handler.throwOnEvent = true;
    ASSERT_TRUE(reactor.registerHandle(pipe.readEnd.get(), IoEvent::READABLE, &handler, err)) << err;

    pipe.poke();
    ASSERT_TRUE(reactor.runOnce(100, err)) << err;

    ASSERT_EQ(handler.errors.size(), 1u);
    EXPECT_EQ(handler.errors[0], "handler failure");
}

TEST_F(ReactorTest, HousekeepingRunsEveryIteration) {
    int ticks = 0;
    reactor.setHousekeepingCallback([&ticks]() { ++ticks; });

    ASSERT_TRUE(reactor.runOnce(0, err)) << err;
    ASSERT_TRUE(reactor.runOnce(0, err)) << err;
    EXPECT_EQ(ticks, 2);
}

TEST_F(ReactorTest, StopFromAnotherThreadEndsRun) {
    std::thread stopper([this]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        reactor.stop();
    });

    EXPECT_TRUE(reactor.run(err)) << err;
    EXPECT_FALSE(reactor.isRunning());
    stopper.join();
}

TEST_F(ReactorTest, StopFromHousekeepingEndsRun) {
    int ticks = 0;
    reactor.setHousekeepingCallback([this, &ticks]() {
        if (++ticks == 3) {
            reactor.stop();
        }
    });

    EXPECT_TRUE(reactor.run(err)) << err;
    EXPECT_EQ(ticks, 3);
}

TEST(ReactorFailureTest, PollFailureIsFatal) {
    FailingReactor reactor;
    std::string err;
    ASSERT_TRUE(reactor.initialize(err)) << err;

    EXPECT_FALSE(reactor.run(err));
    EXPECT_NE(err.find("epoll_wait"), std::string::npos);
    EXPECT_FALSE(reactor.isRunning());
}

TEST(ReactorFailureTest, InterruptedWaitIsRetried) {
    FailingReactor reactor;
    reactor.failWithErrno = EINTR;
    std::string err;
    ASSERT_TRUE(reactor.initialize(err)) << err;

    int ticks = 0;
    reactor.setHousekeepingCallback([&reactor, &ticks]() {
        if (++ticks == 5) {
            reactor.stop();
        }
    });

    EXPECT_TRUE(reactor.run(err)) << err;
    EXPECT_EQ(ticks, 5);
}

TEST(ReactorFailureTest, RegisterBeforeInitializeFails) {
    Reactor reactor;
    RecordingHandler handler;
    std::string err;
    EXPECT_FALSE(reactor.registerHandle(0, IoEvent::READABLE, &handler, err));
    EXPECT_FALSE(reactor.run(err));
}
