/**
 * @file SessionState.h
 * @brief Control session state machine
 */

#pragma once

#include <cstdint>
#include <string>

namespace Wharf {

/**
 * @brief Lifecycle state of a control session
 *
 * UNAUTHENTICATED -> IDLE -> {AWAITING_DATA_CHANNEL, TRANSFERRING} -> CLOSED
 */
enum class SessionState : uint8_t {
    UNAUTHENTICATED,        ///< Connected, not logged in
    IDLE,                   ///< Logged in, no transfer running
    AWAITING_DATA_CHANNEL,  ///< Transfer command accepted, data peer not connected yet
    TRANSFERRING,           ///< TransferEngine running
    CLOSED                  ///< Torn down
};

/**
 * @brief Inputs that move a session between states
 */
enum class SessionEvent : uint8_t {
    LOGIN_SUCCEEDED,       ///< PASS accepted
    LOGGED_OUT,            ///< REIN
    DATA_CHANNEL_PENDING,  ///< Transfer command issued, channel still negotiating
    TRANSFER_STARTED,      ///< Channel open, engine started
    TRANSFER_FINISHED,     ///< Engine completed or failed
    DATA_CHANNEL_FAILED,   ///< Negotiation failed or timed out
    ABORTED,               ///< ABOR while awaiting or transferring
    DISCONNECTED           ///< QUIT, peer close, idle timeout or fatal error
};

/**
 * @brief Transition function of the session state machine
 * @param from Current state
 * @param event Input event
 * @param to Receives the next state when the transition is legal
 * @return false if the event is illegal in state from (to is untouched)
 */
bool nextSessionState(SessionState from, SessionEvent event, SessionState& to);

/**
 * @brief Whether a command may run in a given state
 * @param state Current state
 * @param requiresAuth Command needs a logged-in user
 *
 * Commands never run while AWAITING_DATA_CHANNEL, TRANSFERRING or CLOSED;
 * the session queues them (except ABOR and QUIT) until the transfer ends.
 */
bool isCommandAllowed(SessionState state, bool requiresAuth);

/**
 * @brief Convert SessionState to string
 */
inline std::string sessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::UNAUTHENTICATED:       return "Unauthenticated";
        case SessionState::IDLE:                  return "Idle";
        case SessionState::AWAITING_DATA_CHANNEL: return "AwaitingDataChannel";
        case SessionState::TRANSFERRING:          return "Transferring";
        case SessionState::CLOSED:                return "Closed";
        default:                                  return "Unknown";
    }
}

}  // namespace Wharf
