/**
 * @file ErrorCodes.h
 * @brief FTP reply codes and the session error taxonomy.
 *
 * Reply codes follow RFC 959 / RFC 2428 / RFC 3659. Every per-session
 * failure is classified as a SessionError and converted to a control
 * channel reply; none of them terminates the reactor.
 */

#pragma once

namespace Wharf {
namespace ReplyCodes {

// Positive preliminary
inline constexpr int FILE_STATUS_OK = 150;

// Positive completion
inline constexpr int COMMAND_OK = 200;
inline constexpr int COMMAND_SUPERFLUOUS = 202;
inline constexpr int SYSTEM_STATUS = 211;
inline constexpr int FILE_STATUS = 213;
inline constexpr int HELP_MESSAGE = 214;
inline constexpr int SYSTEM_TYPE = 215;
inline constexpr int SERVICE_READY = 220;
inline constexpr int CLOSING_CONTROL = 221;
inline constexpr int NO_TRANSFER_TO_ABORT = 225;
inline constexpr int TRANSFER_COMPLETE = 226;
inline constexpr int ENTERING_PASSIVE = 227;
inline constexpr int ENTERING_EXTENDED_PASSIVE = 229;
inline constexpr int LOGGED_IN = 230;
inline constexpr int FILE_ACTION_OK = 250;
inline constexpr int PATH_CREATED = 257;

// Positive intermediate
inline constexpr int NEED_PASSWORD = 331;
inline constexpr int PENDING_FURTHER_INFO = 350;

// Transient negative
inline constexpr int SERVICE_NOT_AVAILABLE = 421;
inline constexpr int CANNOT_OPEN_DATA = 425;
inline constexpr int TRANSFER_ABORTED = 426;
inline constexpr int LOCAL_ERROR = 451;

// Permanent negative
inline constexpr int SYNTAX_ERROR = 500;
inline constexpr int SYNTAX_ERROR_ARGS = 501;
inline constexpr int NOT_IMPLEMENTED = 502;
inline constexpr int BAD_SEQUENCE = 503;
inline constexpr int NOT_IMPLEMENTED_FOR_PARAM = 504;
inline constexpr int NOT_LOGGED_IN = 530;
inline constexpr int FILE_UNAVAILABLE = 550;
inline constexpr int PERMISSION_DENIED = 550;
inline constexpr int NAME_NOT_ALLOWED = 553;
inline constexpr int INVALID_RESTART = 554;

}  // namespace ReplyCodes

/**
 * @brief Classification of per-session failures.
 *
 * FATAL_REACTOR is the only kind that leads to process-wide shutdown; it is
 * reported by Reactor::run() rather than converted to a reply.
 */
enum class SessionError {
    PROTOCOL,           ///< Malformed or unsupported command
    AUTH,               ///< Bad credentials or unauthenticated access
    DATA_CHANNEL,       ///< Negotiation or connect failure
    TRANSFER_FILE,      ///< Filesystem failure during a transfer
    TRANSFER_SOCKET,    ///< Data socket failure or abort during a transfer
    RESOURCE_EXHAUSTED, ///< No passive port available
    FATAL_REACTOR       ///< Polling primitive failure
};

/**
 * @brief Reply code used when a session error is reported to the client.
 */
inline int replyCodeFor(SessionError error) {
    switch (error) {
        case SessionError::PROTOCOL:           return ReplyCodes::SYNTAX_ERROR;
        case SessionError::AUTH:               return ReplyCodes::NOT_LOGGED_IN;
        case SessionError::DATA_CHANNEL:       return ReplyCodes::CANNOT_OPEN_DATA;
        case SessionError::TRANSFER_FILE:      return ReplyCodes::LOCAL_ERROR;
        case SessionError::TRANSFER_SOCKET:    return ReplyCodes::TRANSFER_ABORTED;
        case SessionError::RESOURCE_EXHAUSTED: return ReplyCodes::SERVICE_NOT_AVAILABLE;
        case SessionError::FATAL_REACTOR:      return ReplyCodes::SERVICE_NOT_AVAILABLE;
        default:                               return ReplyCodes::LOCAL_ERROR;
    }
}

}  // namespace Wharf
