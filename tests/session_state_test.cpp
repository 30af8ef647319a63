/**
 * @file session_state_test.cpp
 * @brief Exhaustive tests for the session state machine
 */

#include <gtest/gtest.h>
#include "wharf/SessionState.h"

#include <vector>

using namespace Wharf;

namespace {

const std::vector<SessionState> kAllStates = {
    SessionState::UNAUTHENTICATED,
    SessionState::IDLE,
    SessionState::AWAITING_DATA_CHANNEL,
    SessionState::TRANSFERRING,
    SessionState::CLOSED,
};

const std::vector<SessionEvent> kAllEvents = {
    SessionEvent::LOGIN_SUCCEEDED,
    SessionEvent::LOGGED_OUT,
    SessionEvent::DATA_CHANNEL_PENDING,
    SessionEvent::TRANSFER_STARTED,
    SessionEvent::TRANSFER_FINISHED,
    SessionEvent::DATA_CHANNEL_FAILED,
    SessionEvent::ABORTED,
    SessionEvent::DISCONNECTED,
};

struct Transition {
    SessionState from;
    SessionEvent event;
    SessionState to;
};

// Every legal transition; anything not listed must be rejected.
const std::vector<Transition> kLegal = {
    {SessionState::UNAUTHENTICATED, SessionEvent::LOGIN_SUCCEEDED, SessionState::IDLE},
    {SessionState::UNAUTHENTICATED, SessionEvent::DISCONNECTED, SessionState::CLOSED},
    {SessionState::IDLE, SessionEvent::LOGGED_OUT, SessionState::UNAUTHENTICATED},
    {SessionState::IDLE, SessionEvent::DATA_CHANNEL_PENDING, SessionState::AWAITING_DATA_CHANNEL},
    {SessionState::IDLE, SessionEvent::TRANSFER_STARTED, SessionState::TRANSFERRING},
    {SessionState::IDLE, SessionEvent::DISCONNECTED, SessionState::CLOSED},
    {SessionState::AWAITING_DATA_CHANNEL, SessionEvent::TRANSFER_STARTED, SessionState::TRANSFERRING},
    {SessionState::AWAITING_DATA_CHANNEL, SessionEvent::DATA_CHANNEL_FAILED, SessionState::IDLE},
    {SessionState::AWAITING_DATA_CHANNEL, SessionEvent::ABORTED, SessionState::IDLE},
    {SessionState::AWAITING_DATA_CHANNEL, SessionEvent::DISCONNECTED, SessionState::CLOSED},
    {SessionState::TRANSFERRING, SessionEvent::TRANSFER_FINISHED, SessionState::IDLE},
    {SessionState::TRANSFERRING, SessionEvent::ABORTED, SessionState::IDLE},
    {SessionState::TRANSFERRING, SessionEvent::DISCONNECTED, SessionState::CLOSED},
};

const Transition* findLegal(SessionState from, SessionEvent event) {
    for (const auto& t : kLegal) {
        if (t.from == from && t.event == event) {
            return &t;
        }
    }
    return nullptr;
}

}  // namespace

TEST(SessionStateTest, TransitionTableIsExact) {
    for (SessionState from : kAllStates) {
        for (SessionEvent event : kAllEvents) {
            SessionState to = SessionState::CLOSED;
            const bool ok = nextSessionState(from, event, to);
            const Transition* expected = findLegal(from, event);

            if (expected) {
                EXPECT_TRUE(ok) << sessionStateToString(from) << " event " << static_cast<int>(event);
                EXPECT_EQ(to, expected->to) << sessionStateToString(from);
            } else {
                EXPECT_FALSE(ok) << sessionStateToString(from) << " event " << static_cast<int>(event);
            }
        }
    }
}

TEST(SessionStateTest, IllegalTransitionLeavesOutputUntouched) {
    SessionState to = SessionState::TRANSFERRING;
    EXPECT_FALSE(nextSessionState(SessionState::UNAUTHENTICATED, SessionEvent::TRANSFER_STARTED, to));
    EXPECT_EQ(to, SessionState::TRANSFERRING);
}

TEST(SessionStateTest, ClosedIsTerminal) {
    for (SessionEvent event : kAllEvents) {
        SessionState to = SessionState::IDLE;
        EXPECT_FALSE(nextSessionState(SessionState::CLOSED, event, to));
    }
}

TEST(SessionStateTest, CommandGate) {
    EXPECT_TRUE(isCommandAllowed(SessionState::UNAUTHENTICATED, false));
    EXPECT_FALSE(isCommandAllowed(SessionState::UNAUTHENTICATED, true));
    EXPECT_TRUE(isCommandAllowed(SessionState::IDLE, true));
    EXPECT_TRUE(isCommandAllowed(SessionState::IDLE, false));

    for (SessionState state : {SessionState::AWAITING_DATA_CHANNEL,
                               SessionState::TRANSFERRING,
                               SessionState::CLOSED}) {
        EXPECT_FALSE(isCommandAllowed(state, false)) << sessionStateToString(state);
        EXPECT_FALSE(isCommandAllowed(state, true)) << sessionStateToString(state);
    }
}

TEST(SessionStateTest, StateNames) {
    EXPECT_EQ(sessionStateToString(SessionState::UNAUTHENTICATED), "Unauthenticated");
    EXPECT_EQ(sessionStateToString(SessionState::AWAITING_DATA_CHANNEL), "AwaitingDataChannel");
    EXPECT_EQ(sessionStateToString(SessionState::CLOSED), "Closed");
}
