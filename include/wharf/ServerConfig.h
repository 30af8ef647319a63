/**
 * @file ServerConfig.h
 * @brief Runtime server configuration loaded from JSON
 */

#pragma once

#include "config.h"
#include "UserStore.h"

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace Wharf {

/**
 * @brief All runtime settings of an FtpServer
 *
 * Defaults come from config.h. Rates of 0 mean unlimited.
 */
struct ServerConfig {
    std::string listenAddress{LISTEN_ADDRESS_DEFAULT};
    uint16_t listenPort{CONTROL_PORT_DEFAULT};   ///< 0 picks an ephemeral port

    uint16_t passivePortLow{PASSIVE_PORT_LOW_DEFAULT};
    uint16_t passivePortHigh{PASSIVE_PORT_HIGH_DEFAULT};
    std::string passiveAddress;                  ///< Advertised PASV address; empty = control socket's

    uint64_t perConnectionBytesPerSecond{0};
    uint64_t globalBytesPerSecond{0};
    uint64_t burstBytes{0};                      ///< Bucket capacity; 0 = one second of rate

    size_t maxConnectionsPerSource{MAX_CONNECTIONS_PER_SOURCE_DEFAULT};
    uint32_t windowSeconds{THROTTLE_WINDOW_S_DEFAULT};
    size_t maxSessions{MAX_SESSIONS_DEFAULT};

    uint32_t idleTimeoutSeconds{IDLE_TIMEOUT_S_DEFAULT};
    uint32_t dataConnectTimeoutSeconds{DATA_CONNECT_TIMEOUT_S_DEFAULT};
    uint32_t maxLoginAttempts{MAX_LOGIN_ATTEMPTS_DEFAULT};

    bool allowForeignActive{false};              ///< Disable PORT bounce protection
    std::string logFile;                         ///< ThreadSafeLog trace file; empty = off
    std::string logLevel{"info"};                ///< Console threshold: debug, info, warning or error

    UserStore users;

    /**
     * @brief Check value ranges and cross-field constraints
     * @return false with errorMsg set on the first problem
     */
    bool validate(std::string& errorMsg) const;

    nlohmann::json toJson() const;

    /**
     * @brief Build a config from a parsed JSON object
     *
     * Absent keys keep their defaults. Type mismatches and out-of-range
     * values are errors.
     */
    static bool fromJson(const nlohmann::json& j, ServerConfig& config, std::string& errorMsg);
};

/**
 * @brief Read, parse and validate a JSON config file
 * @param path Config file path
 * @param config Receives the configuration
 * @param errorMsg Output error message
 * @return true if successful
 */
bool loadServerConfig(const std::string& path, ServerConfig& config, std::string& errorMsg);

}  // namespace Wharf
