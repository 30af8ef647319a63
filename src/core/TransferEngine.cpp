/**
 * @file TransferEngine.cpp
 * @brief Chunked, rate-limited data transfer pipeline
 */

#include "wharf/TransferEngine.h"
#include "wharf/Reactor.h"

#include <cerrno>
#include <sys/socket.h>
#include <unistd.h>
#include <utility>

namespace Wharf {

TransferEngine::TransferEngine(TransferJob job,
                               UniqueFd file,
                               int dataFd,
                               RateBudget* connectionBudget,
                               RateBudget* globalBudget)
    : m_job(std::move(job))
    , m_file(std::move(file))
    , m_dataFd(dataFd)
    , m_connectionBudget(connectionBudget)
    , m_globalBudget(globalBudget)
    , m_fileOffset(m_job.startOffset)
{
    if (m_job.direction == TransferDirection::LISTING) {
        m_buffer.assign(m_job.listing.begin(), m_job.listing.end());
        m_pendingEnd = m_buffer.size();
        m_eof = true;
    } else {
        m_buffer.resize(TRANSFER_CHUNK_SIZE);
    }
}

TransferStatus TransferEngine::step(RateBudget::Clock::time_point now) {
    if (m_aborted) {
        return fail(SessionError::TRANSFER_SOCKET, "Transfer aborted");
    }
    if (m_job.direction == TransferDirection::UPLOAD) {
        return stepUpload(now);
    }
    return stepSend(now);
}

void TransferEngine::abort() {
    m_aborted = true;
}

uint32_t TransferEngine::interest() const {
    return m_job.direction == TransferDirection::UPLOAD ? IoEvent::READABLE : IoEvent::WRITABLE;
}

bool TransferEngine::hasTokens(RateBudget::Clock::time_point now) const {
    return RateBudget::clamp(1, m_connectionBudget, m_globalBudget, now) > 0;
}

TransferStatus TransferEngine::stepSend(RateBudget::Clock::time_point now) {
    if (m_pendingStart == m_pendingEnd) {
        if (m_eof) {
            return TransferStatus::COMPLETED;
        }
        if (!fillFromFile()) {
            return TransferStatus::FAILED;
        }
        if (m_pendingStart == m_pendingEnd) {
            return TransferStatus::COMPLETED;
        }
    }

    const uint64_t pending = m_pendingEnd - m_pendingStart;
    const uint64_t wanted = pending < TRANSFER_CHUNK_SIZE ? pending : TRANSFER_CHUNK_SIZE;
    const uint64_t allowed = RateBudget::clamp(wanted, m_connectionBudget, m_globalBudget, now);
    if (allowed == 0) {
        return TransferStatus::THROTTLED;
    }

    const ssize_t sent = ::send(m_dataFd, m_buffer.data() + m_pendingStart,
                                static_cast<size_t>(allowed), MSG_NOSIGNAL);
    if (sent < 0) {
        if (isWouldBlock(errno)) {
            return TransferStatus::CONTINUE;
        }
        return fail(SessionError::TRANSFER_SOCKET, "send() failed: " + errnoToString(errno));
    }

    RateBudget::consumeAll(static_cast<uint64_t>(sent), m_connectionBudget, m_globalBudget);
    m_pendingStart += static_cast<size_t>(sent);
    m_bytesTransferred += static_cast<uint64_t>(sent);

    if (m_pendingStart == m_pendingEnd && m_eof) {
        return TransferStatus::COMPLETED;
    }
    return TransferStatus::CONTINUE;
}

TransferStatus TransferEngine::stepUpload(RateBudget::Clock::time_point now) {
    const uint64_t allowed = RateBudget::clamp(TRANSFER_CHUNK_SIZE, m_connectionBudget, m_globalBudget, now);
    if (allowed == 0) {
        return TransferStatus::THROTTLED;
    }

    const ssize_t received = ::recv(m_dataFd, m_buffer.data(), static_cast<size_t>(allowed), 0);
    if (received == 0) {
        return TransferStatus::COMPLETED;
    }
    if (received < 0) {
        if (isWouldBlock(errno)) {
            return TransferStatus::CONTINUE;
        }
        return fail(SessionError::TRANSFER_SOCKET, "recv() failed: " + errnoToString(errno));
    }

    size_t written = 0;
    while (written < static_cast<size_t>(received)) {
        const ssize_t n = ::pwrite(m_file.get(), m_buffer.data() + written,
                                   static_cast<size_t>(received) - written,
                                   static_cast<off_t>(m_fileOffset + written));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return fail(SessionError::TRANSFER_FILE, "write failed: " + errnoToString(errno));
        }
        written += static_cast<size_t>(n);
    }

    RateBudget::consumeAll(static_cast<uint64_t>(received), m_connectionBudget, m_globalBudget);
    m_fileOffset += static_cast<uint64_t>(received);
    m_bytesTransferred += static_cast<uint64_t>(received);
    return TransferStatus::CONTINUE;
}

bool TransferEngine::fillFromFile() {
    ssize_t n;
    do {
        n = ::pread(m_file.get(), m_buffer.data(), m_buffer.size(), static_cast<off_t>(m_fileOffset));
    } while (n < 0 && errno == EINTR);

    if (n < 0) {
        fail(SessionError::TRANSFER_FILE, "read failed: " + errnoToString(errno));
        return false;
    }

    m_pendingStart = 0;
    m_pendingEnd = static_cast<size_t>(n);
    m_fileOffset += static_cast<uint64_t>(n);
    if (n == 0) {
        m_eof = true;
    }
    return true;
}

TransferStatus TransferEngine::fail(SessionError kind, const std::string& message) {
    m_failureKind = kind;
    m_errorMsg = message;
    return TransferStatus::FAILED;
}

}  // namespace Wharf
