/**
 * @file wharfd.cpp
 * @brief Wharf FTP server daemon
 *
 * Usage:
 *   wharfd [--config FILE] [--port PORT] [--root DIR --user NAME --password PASS]
 *          [--log FILE] [--log-level LEVEL]
 *
 * Command line options override values read from the config file.
 */

#include "wharf/FtpServer.h"
#include "wharf/ServerConfig.h"
#include "wharf/config.h"

#include <atomic>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace Wharf;

//=============================================================================
// Global Variables for Signal Handling
//=============================================================================

static std::atomic<bool> g_running(true);
static FtpServer* g_server = nullptr;

//=============================================================================
// Signal Handler
//=============================================================================

void signalHandler(int signal) {
    (void)signal;
    g_running.store(false);

    if (g_server) {
        g_server->stop();
    }
}

//=============================================================================
// Helper Functions
//=============================================================================

static void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  --config FILE      JSON configuration file\n"
              << "  --port PORT        Control port (default: " << CONTROL_PORT_DEFAULT << ", 0 = ephemeral)\n"
              << "  --root DIR         Home directory for the --user account\n"
              << "  --user NAME        Add an account (requires --password and --root)\n"
              << "  --password PASS    Password for the --user account\n"
              << "  --log FILE         Trace log file\n"
              << "  --log-level LEVEL  debug, info, warning or error (default: info)\n"
              << "  --help, -h         Show this help message\n";
}

static bool parsePort(const std::string& text, uint16_t& port) {
    try {
        size_t consumed = 0;
        const unsigned long value = std::stoul(text, &consumed);
        if (consumed != text.size() || value > 65535) {
            return false;
        }
        port = static_cast<uint16_t>(value);
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

//=============================================================================
// Main Function
//=============================================================================

int main(int argc, char* argv[]) {
    std::string configPath;
    std::string portText;
    std::string rootDir;
    std::string userName;
    std::string password;
    std::string logFile;
    std::string logLevel;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            portText = argv[++i];
        } else if (arg == "--root" && i + 1 < argc) {
            rootDir = argv[++i];
        } else if (arg == "--user" && i + 1 < argc) {
            userName = argv[++i];
        } else if (arg == "--password" && i + 1 < argc) {
            password = argv[++i];
        } else if (arg == "--log" && i + 1 < argc) {
            logFile = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            logLevel = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "[ERROR] Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    //=========================================================================
    // Configuration
    //=========================================================================

    ServerConfig config;
    std::string error;

    if (!configPath.empty() && !loadServerConfig(configPath, config, error)) {
        std::cerr << "[ERROR] " << configPath << ": " << error << "\n";
        return 1;
    }

    if (!portText.empty() && !parsePort(portText, config.listenPort)) {
        std::cerr << "[ERROR] Invalid port: " << portText << "\n";
        return 2;
    }

    if (!userName.empty()) {
        if (rootDir.empty() || password.empty()) {
            std::cerr << "[ERROR] --user requires --password and --root\n";
            return 2;
        }
        if (!config.users.addUser(userName, password, rootDir, true, error)) {
            std::cerr << "[ERROR] Cannot add user " << userName << ": " << error << "\n";
            return 1;
        }
    }

    if (!logFile.empty()) {
        config.logFile = logFile;
    }
    if (!logLevel.empty()) {
        config.logLevel = logLevel;
    }

    if (!config.validate(error)) {
        std::cerr << "[ERROR] Invalid configuration: " << error << "\n";
        return 1;
    }

    if (config.users.size() == 0) {
        std::cerr << "[WARNING] No accounts configured; every login will fail\n";
    }

    //=========================================================================
    // Start Server
    //=========================================================================

    FtpServer server(config);
    g_server = &server;

    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    if (!server.initialize(error)) {
        std::cerr << "[ERROR] Failed to start server: " << error << "\n";
        g_server = nullptr;
        return 1;
    }

    //=========================================================================
    // Banner
    //=========================================================================

    std::cout << "\n";
    std::cout << "========================================\n";
    std::cout << "  " << SERVER_NAME << "\n";
    std::cout << "========================================\n";
    std::cout << "Listen: " << config.listenAddress << ":" << server.getPort() << "\n";
    std::cout << "Passive Ports: " << config.passivePortLow << "-" << config.passivePortHigh << "\n";
    std::cout << "Accounts: " << config.users.size() << "\n";
    std::cout << "Max Sessions: " << config.maxSessions << "\n";
    std::cout << "========================================\n\n";
    std::cout << "Press Ctrl+C to stop\n\n";

    const bool ok = server.run(error);
    g_server = nullptr;

    if (!ok) {
        std::cerr << "[ERROR] Server stopped: " << error << "\n";
        return 1;
    }

    std::cout << "\n[INFO] Server stopped\n";
    return 0;
}
