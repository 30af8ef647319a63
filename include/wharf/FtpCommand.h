/**
 * @file FtpCommand.h
 * @brief Control channel line framing and command argument parsing
 */

#pragma once

#include "config.h"
#include "SocketUtils.h"
#include <cstdint>
#include <string>

namespace Wharf {

//=============================================================================
// LineBuffer
//=============================================================================

/**
 * @class LineBuffer
 * @brief Accumulates control channel bytes and yields complete lines
 *
 * Lines end with CRLF; a bare LF is accepted too. An incomplete line stays
 * buffered until more bytes arrive. A line longer than the configured
 * maximum is discarded up to its terminator and reported once as overlong.
 */
class LineBuffer {
public:
    enum class Result {
        NONE,       ///< No complete line buffered
        LINE,       ///< A line was extracted
        OVERLONG    ///< A line exceeded the maximum and was dropped
    };

    explicit LineBuffer(size_t maxLineLength = MAX_COMMAND_LINE)
        : m_maxLineLength(maxLineLength) {}

    /**
     * @brief Append raw bytes read from the socket
     */
    void append(const char* data, size_t size);

    /**
     * @brief Extract the next line (without its terminator)
     */
    Result nextLine(std::string& line);

    /**
     * @brief Bytes buffered for the incomplete trailing line
     */
    size_t pendingBytes() const { return m_buffer.size(); }

    void clear();

private:
    size_t m_maxLineLength;
    std::string m_buffer;
    bool m_discarding{false};
};

//=============================================================================
// Command parsing
//=============================================================================

/**
 * @brief A parsed control channel command
 */
struct FtpCommand {
    std::string verb;      ///< Upper-cased command verb (e.g. "RETR")
    std::string argument;  ///< Everything after the first space, unmodified
};

/**
 * @brief Split a command line into verb and argument
 * @return false if the line is empty or the verb is not alphabetic
 */
bool parseCommandLine(const std::string& line, FtpCommand& command);

/**
 * @brief Parse a PORT argument "h1,h2,h3,h4,p1,p2"
 */
bool parsePortArgument(const std::string& argument, Endpoint& endpoint);

/**
 * @brief Parse an EPRT argument "|proto|address|port|" (RFC 2428)
 */
bool parseEprtArgument(const std::string& argument, Endpoint& endpoint);

/**
 * @brief Parse a REST argument (decimal, no sign, no overflow)
 */
bool parseRestartOffset(const std::string& argument, uint64_t& offset);

/**
 * @brief Strip LIST/NLST option flags ("-la", "-a") from an argument
 *
 * Clients commonly send "LIST -al"; the flags are ignored and the
 * remaining text (if any) is the path.
 */
std::string stripListOptions(const std::string& argument);

}  // namespace Wharf
