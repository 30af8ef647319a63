/**
 * @file SessionState.cpp
 * @brief Control session state machine
 */

#include "wharf/SessionState.h"

namespace Wharf {

bool nextSessionState(SessionState from, SessionEvent event, SessionState& to) {
    if (from == SessionState::CLOSED) {
        return false;
    }

    if (event == SessionEvent::DISCONNECTED) {
        to = SessionState::CLOSED;
        return true;
    }

    switch (from) {
        case SessionState::UNAUTHENTICATED:
            if (event == SessionEvent::LOGIN_SUCCEEDED) {
                to = SessionState::IDLE;
                return true;
            }
            return false;

        case SessionState::IDLE:
            switch (event) {
                case SessionEvent::LOGGED_OUT:
                    to = SessionState::UNAUTHENTICATED;
                    return true;
                case SessionEvent::DATA_CHANNEL_PENDING:
                    to = SessionState::AWAITING_DATA_CHANNEL;
                    return true;
                case SessionEvent::TRANSFER_STARTED:
                    to = SessionState::TRANSFERRING;
                    return true;
                default:
                    return false;
            }

        case SessionState::AWAITING_DATA_CHANNEL:
            switch (event) {
                case SessionEvent::TRANSFER_STARTED:
                    to = SessionState::TRANSFERRING;
                    return true;
                case SessionEvent::DATA_CHANNEL_FAILED:
                case SessionEvent::ABORTED:
                    to = SessionState::IDLE;
                    return true;
                default:
                    return false;
            }

        case SessionState::TRANSFERRING:
            switch (event) {
                case SessionEvent::TRANSFER_FINISHED:
                case SessionEvent::ABORTED:
                    to = SessionState::IDLE;
                    return true;
                default:
                    return false;
            }

        default:
            return false;
    }
}

bool isCommandAllowed(SessionState state, bool requiresAuth) {
    switch (state) {
        case SessionState::UNAUTHENTICATED:
            return !requiresAuth;
        case SessionState::IDLE:
            return true;
        default:
            return false;
    }
}

}  // namespace Wharf
