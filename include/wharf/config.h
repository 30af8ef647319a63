/**
 * @file config.h
 * @brief Compile-time configuration constants for Wharf
 *
 * This file contains the compile-time defaults used throughout the Wharf
 * server: network ports, timing values, admission limits and buffer sizes.
 * Most of these values can be overridden at runtime through ServerConfig
 * (see ServerConfig.h); the constants here are the defaults applied when a
 * configuration key is absent.
 *
 * @note Changing the protocol limits (line length, chunk size) affects how
 *       much memory each session may hold.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <sys/socket.h>

/**
 * @namespace Wharf
 * @brief Wharf namespace containing all public APIs
 */
namespace Wharf {

//=========================================================================
// Network Ports
//=========================================================================

/** @defgroup NetworkPorts Network Ports Configuration
 * @brief Control port and passive data port range
 * @{
 */

/**
 * @brief Default control channel port.
 *
 * 2121 instead of 21 so the server can run without elevated privileges.
 */
constexpr uint16_t CONTROL_PORT_DEFAULT = 2121;

/**
 * @brief Default inclusive passive port range.
 *
 * 64 ports comfortably cover MAX_SESSIONS_DEFAULT concurrent transfers.
 */
constexpr uint16_t PASSIVE_PORT_LOW_DEFAULT = 50000;
constexpr uint16_t PASSIVE_PORT_HIGH_DEFAULT = 50063;

/**
 * @brief Lowest port accepted as an active-mode (PORT/EPRT) target.
 *
 * Privileged ports are refused to prevent FTP bounce attacks against
 * well-known services.
 */
constexpr uint16_t ACTIVE_PORT_MIN = 1024;

/**
 * @brief Default bind address for the control listener.
 */
constexpr const char* LISTEN_ADDRESS_DEFAULT = "0.0.0.0";

/**
 * @brief Loopback address, used by tests and local tooling.
 */
constexpr const char* LOCALHOST_IP = "127.0.0.1";

/**
 * @brief Listen backlog for control and passive sockets.
 */
constexpr int SOMAXCONN_VALUE = SOMAXCONN;

/** @} */ // end of NetworkPorts

//=========================================================================
// Timing
//=========================================================================

/** @defgroup Timing Timing Configuration
 * @brief Reactor ticks and timeouts
 * @{
 */

/**
 * @brief Upper bound for one epoll_wait() call (ms).
 *
 * The reactor runs housekeeping (budget refill resume, idle expiry,
 * negotiation timeouts, session reaping) at least this often. 20 ms keeps
 * throttled transfers smooth without measurable idle CPU.
 */
constexpr int HOUSEKEEPING_INTERVAL_MS = 20;

/**
 * @brief Idle control connection timeout (seconds).
 *
 * A session that issues no command for this long while not transferring
 * is sent 421 and closed.
 */
constexpr uint32_t IDLE_TIMEOUT_S_DEFAULT = 300;

/**
 * @brief Data channel negotiation timeout (seconds).
 *
 * A passive listener nobody connects to, or an active connect that does
 * not complete, fails the pending transfer after this long.
 */
constexpr uint32_t DATA_CONNECT_TIMEOUT_S_DEFAULT = 30;

/** @} */ // end of Timing

//=========================================================================
// Admission Control
//=========================================================================

/** @defgroup Admission Admission Control Configuration
 * @brief Flood protection and session ceilings
 * @{
 */

/**
 * @brief Maximum control connections accepted per source IP within the window.
 */
constexpr size_t MAX_CONNECTIONS_PER_SOURCE_DEFAULT = 10;

/**
 * @brief Sliding window for per-source connection throttling (seconds).
 */
constexpr uint32_t THROTTLE_WINDOW_S_DEFAULT = 10;

/**
 * @brief Maximum number of distinct source IPs tracked by the throttle.
 *
 * Bounds memory under a flood from many addresses. New sources beyond this
 * are rejected until the sweep frees entries.
 */
constexpr size_t MAX_TRACKED_SOURCES = 4096;

/**
 * @brief Throttle sweep period, in calls to shouldAccept().
 */
constexpr uint64_t THROTTLE_SWEEP_EVERY = 256;

/**
 * @brief Maximum concurrent sessions.
 */
constexpr size_t MAX_SESSIONS_DEFAULT = 64;

/**
 * @brief Failed PASS attempts before the control connection is closed.
 */
constexpr uint32_t MAX_LOGIN_ATTEMPTS_DEFAULT = 3;

/** @} */ // end of Admission

//=========================================================================
// Buffer Sizes
//=========================================================================

/** @defgroup BufferSizes Buffer Size Configuration
 * @brief Buffer sizes for control and data channels
 * @{
 */

/**
 * @brief Largest single transfer chunk (bytes).
 *
 * One readiness event moves at most this many bytes, so a fast peer cannot
 * monopolise the reactor thread.
 */
constexpr size_t TRANSFER_CHUNK_SIZE = 65536;  // 64 KB

/**
 * @brief Maximum accepted command line length, excluding CRLF.
 */
constexpr size_t MAX_COMMAND_LINE = 1024;

/**
 * @brief Control socket read size per readable event.
 */
constexpr size_t CONTROL_READ_SIZE = 4096;

/**
 * @brief Maximum command lines buffered while a transfer is in progress.
 *
 * Pipelining beyond this is treated as abuse and the session is closed.
 */
constexpr size_t MAX_QUEUED_COMMANDS = 32;

/** @} */ // end of BufferSizes

//=========================================================================
// Protocol
//=========================================================================

/** @defgroup Protocol Protocol Identifiers
 * @{
 */

/**
 * @brief Server name used in the greeting and SYST/STAT replies.
 */
constexpr const char* SERVER_NAME = "Wharf FTP server";

/**
 * @brief SHA-256 digest size in bytes (password hashes).
 */
constexpr size_t HASH_SIZE = 32;

/** @} */ // end of Protocol

}  // namespace Wharf
