/**
 * @file SocketUtils.cpp
 * @brief Non-blocking POSIX socket helpers
 */

#include "wharf/SocketUtils.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <unistd.h>
#include <utility>

namespace Wharf {

namespace {

bool endpointFromSockAddr(const sockaddr_storage& storage, Endpoint& endpoint) {
    char buffer[INET6_ADDRSTRLEN] = {};

    if (storage.ss_family == AF_INET) {
        const auto* in4 = reinterpret_cast<const sockaddr_in*>(&storage);
        if (!inet_ntop(AF_INET, &in4->sin_addr, buffer, sizeof(buffer))) {
            return false;
        }
        endpoint.address = buffer;
        endpoint.port = ntohs(in4->sin_port);
        return true;
    }

    if (storage.ss_family == AF_INET6) {
        const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&storage);
        if (!inet_ntop(AF_INET6, &in6->sin6_addr, buffer, sizeof(buffer))) {
            return false;
        }
        endpoint.address = normalizeAddress(buffer);
        endpoint.port = ntohs(in6->sin6_port);
        return true;
    }

    return false;
}

} // anonymous namespace

//=============================================================================
// UniqueFd
//=============================================================================

void UniqueFd::reset(int fd) {
    if (m_fd >= 0 && m_fd != fd) {
        ::close(m_fd);
    }
    m_fd = fd;
}

//=============================================================================
// Error helpers
//=============================================================================

std::string errnoToString(int err) {
    return std::string(std::strerror(err)) + " (errno " + std::to_string(err) + ")";
}

bool isWouldBlock(int err) {
    return err == EAGAIN || err == EWOULDBLOCK || err == EINTR;
}

//=============================================================================
// Socket options
//=============================================================================

bool setNonBlocking(int fd, std::string& errorMsg) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        errorMsg = "fcntl(O_NONBLOCK) failed: " + errnoToString(errno);
        return false;
    }
    const int fdFlags = fcntl(fd, F_GETFD, 0);
    if (fdFlags < 0 || fcntl(fd, F_SETFD, fdFlags | FD_CLOEXEC) < 0) {
        errorMsg = "fcntl(FD_CLOEXEC) failed: " + errnoToString(errno);
        return false;
    }
    return true;
}

void tuneControlSocket(int fd) {
    const int one = 1;
    (void)setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    (void)setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &one, sizeof(one));
}

bool makeSockAddr(const Endpoint& endpoint,
                  sockaddr_storage& storage,
                  socklen_t& length,
                  std::string& errorMsg)
{
    std::memset(&storage, 0, sizeof(storage));

    auto* in4 = reinterpret_cast<sockaddr_in*>(&storage);
    if (inet_pton(AF_INET, endpoint.address.c_str(), &in4->sin_addr) == 1) {
        in4->sin_family = AF_INET;
        in4->sin_port = htons(endpoint.port);
        length = sizeof(sockaddr_in);
        return true;
    }

    auto* in6 = reinterpret_cast<sockaddr_in6*>(&storage);
    if (inet_pton(AF_INET6, endpoint.address.c_str(), &in6->sin6_addr) == 1) {
        in6->sin6_family = AF_INET6;
        in6->sin6_port = htons(endpoint.port);
        length = sizeof(sockaddr_in6);
        return true;
    }

    errorMsg = "Not a numeric IP address: " + endpoint.address;
    return false;
}

//=============================================================================
// Listen / connect / accept
//=============================================================================

bool createListenSocket(const Endpoint& endpoint,
                        int backlog,
                        UniqueFd& out,
                        std::string& errorMsg,
                        int* errnoOut)
{
    sockaddr_storage storage{};
    socklen_t length = 0;
    if (!makeSockAddr(endpoint, storage, length, errorMsg)) {
        if (errnoOut) *errnoOut = EINVAL;
        return false;
    }

    UniqueFd sock(::socket(storage.ss_family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP));
    if (!sock.isValid()) {
        if (errnoOut) *errnoOut = errno;
        errorMsg = "socket() failed: " + errnoToString(errno);
        return false;
    }

    const int one = 1;
    (void)setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    if (::bind(sock.get(), reinterpret_cast<const sockaddr*>(&storage), length) < 0) {
        if (errnoOut) *errnoOut = errno;
        errorMsg = "bind(" + endpoint.address + ":" + std::to_string(endpoint.port)
                 + ") failed: " + errnoToString(errno);
        return false;
    }

    if (::listen(sock.get(), backlog) < 0) {
        if (errnoOut) *errnoOut = errno;
        errorMsg = "listen() failed: " + errnoToString(errno);
        return false;
    }

    out = std::move(sock);
    return true;
}

bool startConnect(const Endpoint& endpoint,
                  UniqueFd& out,
                  bool& inProgress,
                  std::string& errorMsg)
{
    inProgress = false;

    sockaddr_storage storage{};
    socklen_t length = 0;
    if (!makeSockAddr(endpoint, storage, length, errorMsg)) {
        return false;
    }

    UniqueFd sock(::socket(storage.ss_family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP));
    if (!sock.isValid()) {
        errorMsg = "socket() failed: " + errnoToString(errno);
        return false;
    }

    if (::connect(sock.get(), reinterpret_cast<const sockaddr*>(&storage), length) < 0) {
        if (errno != EINPROGRESS) {
            errorMsg = "connect(" + endpoint.address + ":" + std::to_string(endpoint.port)
                     + ") failed: " + errnoToString(errno);
            return false;
        }
        inProgress = true;
    }

    out = std::move(sock);
    return true;
}

bool finishConnect(int fd, std::string& errorMsg) {
    int soError = 0;
    socklen_t len = sizeof(soError);
    if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len) < 0) {
        errorMsg = "getsockopt(SO_ERROR) failed: " + errnoToString(errno);
        return false;
    }
    if (soError != 0) {
        errorMsg = "connect() failed: " + errnoToString(soError);
        return false;
    }
    return true;
}

bool acceptConnection(int listenFd, UniqueFd& out, Endpoint& peer, std::string& errorMsg) {
    errorMsg.clear();

    sockaddr_storage storage{};
    socklen_t length = sizeof(storage);
    const int fd = ::accept4(listenFd, reinterpret_cast<sockaddr*>(&storage), &length,
                             SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd < 0) {
        if (!isWouldBlock(errno) && errno != ECONNABORTED) {
            errorMsg = "accept() failed: " + errnoToString(errno);
        }
        return false;
    }

    out.reset(fd);
    if (!endpointFromSockAddr(storage, peer)) {
        peer = Endpoint{};
    }
    return true;
}

bool getLocalEndpoint(int fd, Endpoint& endpoint) {
    sockaddr_storage storage{};
    socklen_t length = sizeof(storage);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&storage), &length) < 0) {
        return false;
    }
    return endpointFromSockAddr(storage, endpoint);
}

bool getPeerEndpoint(int fd, Endpoint& endpoint) {
    sockaddr_storage storage{};
    socklen_t length = sizeof(storage);
    if (::getpeername(fd, reinterpret_cast<sockaddr*>(&storage), &length) < 0) {
        return false;
    }
    return endpointFromSockAddr(storage, endpoint);
}

std::string normalizeAddress(const std::string& address) {
    static const std::string mappedPrefix = "::ffff:";
    if (address.size() > mappedPrefix.size() &&
        address.compare(0, mappedPrefix.size(), mappedPrefix) == 0 &&
        address.find('.') != std::string::npos) {
        return address.substr(mappedPrefix.size());
    }
    return address;
}

}  // namespace Wharf
