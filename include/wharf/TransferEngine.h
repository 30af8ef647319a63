/**
 * @file TransferEngine.h
 * @brief Chunked, rate-limited data transfer pipeline
 */

#pragma once

#include "config.h"
#include "ErrorCodes.h"
#include "RateBudget.h"
#include "SocketUtils.h"

#include <cstdint>
#include <string>
#include <vector>

namespace Wharf {

enum class TransferDirection : uint8_t {
    UPLOAD,    ///< STOR / APPE: data socket -> file
    DOWNLOAD,  ///< RETR: file -> data socket
    LISTING    ///< LIST / NLST: in-memory text -> data socket
};

/**
 * @brief Result of one TransferEngine::step()
 */
enum class TransferStatus : uint8_t {
    CONTINUE,   ///< More to do; wait for the next readiness event
    THROTTLED,  ///< Budget exhausted; stop watching the socket until refill
    COMPLETED,
    FAILED      ///< See failureKind() / errorMessage()
};

/**
 * @brief What to transfer
 */
struct TransferJob {
    TransferDirection direction{TransferDirection::DOWNLOAD};
    std::string virtualPath;
    uint64_t startOffset{0};   ///< Restart offset (file position of the first byte)
    std::string listing;       ///< LISTING payload
};

/**
 * @class TransferEngine
 * @brief Moves one job's bytes between a file and a data socket
 *
 * Each step() moves at most one chunk:
 * min(TRANSFER_CHUNK_SIZE, tokens of every applicable budget).
 * Downloads use positional reads and keep any unsent remainder for the next
 * step; budgets are charged only for bytes actually sent. Uploads receive at
 * most the allowed amount and write it at the current file offset.
 *
 * The engine does not own the data socket; the file descriptor it is given
 * is owned and closed by the engine.
 */
class TransferEngine {
public:
    /**
     * @param job Transfer description
     * @param file Open file (unused for LISTING)
     * @param dataFd Connected non-blocking data socket
     * @param connectionBudget Per-connection budget (may be nullptr)
     * @param globalBudget Server-wide budget (may be nullptr)
     */
    TransferEngine(TransferJob job,
                   UniqueFd file,
                   int dataFd,
                   RateBudget* connectionBudget,
                   RateBudget* globalBudget);

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    /**
     * @brief Perform at most one chunk of work
     */
    TransferStatus step(RateBudget::Clock::time_point now);

    /**
     * @brief Stop at the current chunk boundary; the next step() fails
     */
    void abort();

    bool isAborted() const { return m_aborted; }

    /**
     * @brief Interest the data socket needs (READABLE for uploads, else WRITABLE)
     */
    uint32_t interest() const;

    /**
     * @brief Whether any budget currently has tokens for this job
     */
    bool hasTokens(RateBudget::Clock::time_point now) const;

    const TransferJob& job() const { return m_job; }
    uint64_t bytesTransferred() const { return m_bytesTransferred; }

    /**
     * @brief File position of the next byte
     */
    uint64_t fileOffset() const { return m_fileOffset; }

    SessionError failureKind() const { return m_failureKind; }
    const std::string& errorMessage() const { return m_errorMsg; }

private:
    TransferStatus stepSend(RateBudget::Clock::time_point now);
    TransferStatus stepUpload(RateBudget::Clock::time_point now);
    bool fillFromFile();
    TransferStatus fail(SessionError kind, const std::string& message);

    TransferJob m_job;
    UniqueFd m_file;
    int m_dataFd;
    RateBudget* m_connectionBudget;
    RateBudget* m_globalBudget;

    std::vector<char> m_buffer;
    size_t m_pendingStart{0};
    size_t m_pendingEnd{0};
    bool m_eof{false};

    uint64_t m_fileOffset;
    uint64_t m_bytesTransferred{0};
    bool m_aborted{false};

    SessionError m_failureKind{SessionError::TRANSFER_SOCKET};
    std::string m_errorMsg;
};

}  // namespace Wharf
