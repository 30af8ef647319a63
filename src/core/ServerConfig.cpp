/**
 * @file ServerConfig.cpp
 * @brief Runtime server configuration loaded from JSON
 */

#include "wharf/ServerConfig.h"
#include "wharf/Debug.h"
#include "wharf/SocketUtils.h"

#include <fstream>
#include <limits>
#include <utility>

namespace Wharf {

namespace {

template <typename T>
bool readUnsigned(const nlohmann::json& j, const char* key, T& out, std::string& errorMsg) {
    if (!j.contains(key)) {
        return true;
    }
    const auto& value = j[key];
    if (!value.is_number_unsigned()) {
        errorMsg = std::string("\"") + key + "\" must be a non-negative integer";
        return false;
    }
    const uint64_t raw = value.get<uint64_t>();
    if (raw > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
        errorMsg = std::string("\"") + key + "\" is out of range";
        return false;
    }
    out = static_cast<T>(raw);
    return true;
}

bool readString(const nlohmann::json& j, const char* key, std::string& out, std::string& errorMsg) {
    if (!j.contains(key)) {
        return true;
    }
    if (!j[key].is_string()) {
        errorMsg = std::string("\"") + key + "\" must be a string";
        return false;
    }
    out = j[key].get<std::string>();
    return true;
}

bool readBool(const nlohmann::json& j, const char* key, bool& out, std::string& errorMsg) {
    if (!j.contains(key)) {
        return true;
    }
    if (!j[key].is_boolean()) {
        errorMsg = std::string("\"") + key + "\" must be true or false";
        return false;
    }
    out = j[key].get<bool>();
    return true;
}

}  // namespace

bool ServerConfig::validate(std::string& errorMsg) const {
    if (passivePortLow == 0 || passivePortHigh == 0) {
        errorMsg = "passive port range must not include port 0";
        return false;
    }
    if (passivePortLow > passivePortHigh) {
        errorMsg = "passive_port_low must not exceed passive_port_high";
        return false;
    }
    if (maxConnectionsPerSource == 0) {
        errorMsg = "max_connections_per_source must be at least 1";
        return false;
    }
    if (windowSeconds == 0) {
        errorMsg = "window_seconds must be at least 1";
        return false;
    }
    if (maxSessions == 0) {
        errorMsg = "max_sessions must be at least 1";
        return false;
    }
    if (idleTimeoutSeconds == 0 || dataConnectTimeoutSeconds == 0) {
        errorMsg = "timeouts must be at least 1 second";
        return false;
    }
    if (maxLoginAttempts == 0) {
        errorMsg = "max_login_attempts must be at least 1";
        return false;
    }
    LogLevel level;
    if (!parseLogLevel(logLevel, level)) {
        errorMsg = "log_level must be debug, info, warning or error";
        return false;
    }

    sockaddr_storage storage{};
    socklen_t length = 0;
    if (!makeSockAddr(Endpoint{listenAddress, listenPort}, storage, length, errorMsg)) {
        errorMsg = "listen_address: " + errorMsg;
        return false;
    }
    if (!passiveAddress.empty() &&
        !makeSockAddr(Endpoint{passiveAddress, 0}, storage, length, errorMsg)) {
        errorMsg = "passive_address: " + errorMsg;
        return false;
    }
    return true;
}

nlohmann::json ServerConfig::toJson() const {
    nlohmann::json j;
    j["listen_address"] = listenAddress;
    j["listen_port"] = listenPort;
    j["passive_port_low"] = passivePortLow;
    j["passive_port_high"] = passivePortHigh;
    if (!passiveAddress.empty()) {
        j["passive_address"] = passiveAddress;
    }
    if (perConnectionBytesPerSecond > 0) {
        j["per_connection_bytes_per_second"] = perConnectionBytesPerSecond;
    }
    if (globalBytesPerSecond > 0) {
        j["global_bytes_per_second"] = globalBytesPerSecond;
    }
    if (burstBytes > 0) {
        j["burst_bytes"] = burstBytes;
    }
    j["max_connections_per_source"] = maxConnectionsPerSource;
    j["window_seconds"] = windowSeconds;
    j["max_sessions"] = maxSessions;
    j["idle_timeout_seconds"] = idleTimeoutSeconds;
    j["data_connect_timeout_seconds"] = dataConnectTimeoutSeconds;
    j["max_login_attempts"] = maxLoginAttempts;
    j["allow_foreign_active"] = allowForeignActive;
    if (!logFile.empty()) {
        j["log_file"] = logFile;
    }
    j["log_level"] = logLevel;
    j["users"] = users.toJson();
    return j;
}

bool ServerConfig::fromJson(const nlohmann::json& j, ServerConfig& config, std::string& errorMsg) {
    if (!j.is_object()) {
        errorMsg = "configuration must be a JSON object";
        return false;
    }

    ServerConfig out;
    if (!readString(j, "listen_address", out.listenAddress, errorMsg) ||
        !readUnsigned(j, "listen_port", out.listenPort, errorMsg) ||
        !readUnsigned(j, "passive_port_low", out.passivePortLow, errorMsg) ||
        !readUnsigned(j, "passive_port_high", out.passivePortHigh, errorMsg) ||
        !readString(j, "passive_address", out.passiveAddress, errorMsg) ||
        !readUnsigned(j, "per_connection_bytes_per_second", out.perConnectionBytesPerSecond, errorMsg) ||
        !readUnsigned(j, "global_bytes_per_second", out.globalBytesPerSecond, errorMsg) ||
        !readUnsigned(j, "burst_bytes", out.burstBytes, errorMsg) ||
        !readUnsigned(j, "max_connections_per_source", out.maxConnectionsPerSource, errorMsg) ||
        !readUnsigned(j, "window_seconds", out.windowSeconds, errorMsg) ||
        !readUnsigned(j, "max_sessions", out.maxSessions, errorMsg) ||
        !readUnsigned(j, "idle_timeout_seconds", out.idleTimeoutSeconds, errorMsg) ||
        !readUnsigned(j, "data_connect_timeout_seconds", out.dataConnectTimeoutSeconds, errorMsg) ||
        !readUnsigned(j, "max_login_attempts", out.maxLoginAttempts, errorMsg) ||
        !readBool(j, "allow_foreign_active", out.allowForeignActive, errorMsg) ||
        !readString(j, "log_file", out.logFile, errorMsg) ||
        !readString(j, "log_level", out.logLevel, errorMsg)) {
        return false;
    }

    if (j.contains("users") && !UserStore::fromJson(j["users"], out.users, errorMsg)) {
        return false;
    }

    if (!out.validate(errorMsg)) {
        return false;
    }

    config = std::move(out);
    return true;
}

bool loadServerConfig(const std::string& path, ServerConfig& config, std::string& errorMsg) {
    std::ifstream file(path);
    if (!file) {
        errorMsg = "Failed to open config file: " + path;
        return false;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        errorMsg = "Failed to parse " + path + ": " + e.what();
        return false;
    }

    if (!ServerConfig::fromJson(j, config, errorMsg)) {
        errorMsg = path + ": " + errorMsg;
        return false;
    }
    return true;
}

}  // namespace Wharf
