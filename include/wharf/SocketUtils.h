/**
 * @file SocketUtils.h
 * @brief Non-blocking POSIX socket helpers shared by the server, sessions
 *        and data channels
 */

#pragma once

#include "config.h"
#include <cstdint>
#include <string>
#include <sys/socket.h>

namespace Wharf {

/**
 * @class UniqueFd
 * @brief Owns a file descriptor and closes it on destruction
 */
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : m_fd(fd) {}
    ~UniqueFd() { reset(); }

    // Prevent copying (single owner)
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : m_fd(other.m_fd) { other.m_fd = -1; }
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset(other.m_fd);
            other.m_fd = -1;
        }
        return *this;
    }

    int get() const { return m_fd; }
    bool isValid() const { return m_fd >= 0; }

    /**
     * @brief Give up ownership without closing
     */
    int release() {
        int fd = m_fd;
        m_fd = -1;
        return fd;
    }

    /**
     * @brief Close the current descriptor (if any) and adopt fd
     */
    void reset(int fd = -1);

private:
    int m_fd{-1};
};

/**
 * @brief An IP address (textual, v4 or v6) plus port
 */
struct Endpoint {
    std::string address;
    uint16_t port{0};

    bool isIpv6() const { return address.find(':') != std::string::npos; }
};

/**
 * @brief Human-readable description of an errno value
 */
std::string errnoToString(int err);

/**
 * @brief Whether err means "try again after the next readiness event"
 */
bool isWouldBlock(int err);

/**
 * @brief Put a descriptor into non-blocking, close-on-exec mode
 */
bool setNonBlocking(int fd, std::string& errorMsg);

/**
 * @brief Enable TCP_NODELAY and SO_KEEPALIVE on a control socket
 */
void tuneControlSocket(int fd);

/**
 * @brief Build a sockaddr from a numeric address and port
 * @return false if the address is not a numeric IPv4/IPv6 literal
 */
bool makeSockAddr(const Endpoint& endpoint,
                  sockaddr_storage& storage,
                  socklen_t& length,
                  std::string& errorMsg);

/**
 * @brief Create a non-blocking listening socket
 * @param endpoint Address and port to bind (port 0 = OS choice)
 * @param backlog listen() backlog
 * @param out Receives the socket
 * @param errorMsg Output error message; errnoOut receives errno on failure
 * @return true if bound and listening
 */
bool createListenSocket(const Endpoint& endpoint,
                        int backlog,
                        UniqueFd& out,
                        std::string& errorMsg,
                        int* errnoOut = nullptr);

/**
 * @brief Start a non-blocking outbound connection
 * @param endpoint Target address and port
 * @param out Receives the socket
 * @param inProgress Set when the connect completes later (EINPROGRESS)
 * @param errorMsg Output error message
 * @return false on immediate failure
 */
bool startConnect(const Endpoint& endpoint,
                  UniqueFd& out,
                  bool& inProgress,
                  std::string& errorMsg);

/**
 * @brief Collect the result of a non-blocking connect once writable
 * @return true if the connection is established
 */
bool finishConnect(int fd, std::string& errorMsg);

/**
 * @brief Accept one pending connection as a non-blocking socket
 * @param listenFd Listening socket
 * @param out Receives the accepted socket
 * @param peer Receives the peer endpoint
 * @param errorMsg Output error message (empty when nothing is pending)
 * @return false if nothing was accepted
 */
bool acceptConnection(int listenFd, UniqueFd& out, Endpoint& peer, std::string& errorMsg);

/**
 * @brief Local address of a socket
 */
bool getLocalEndpoint(int fd, Endpoint& endpoint);

/**
 * @brief Remote address of a connected socket
 */
bool getPeerEndpoint(int fd, Endpoint& endpoint);

/**
 * @brief Strip the "::ffff:" prefix of IPv4-mapped IPv6 addresses
 */
std::string normalizeAddress(const std::string& address);

}  // namespace Wharf
