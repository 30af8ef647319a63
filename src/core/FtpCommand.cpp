/**
 * @file FtpCommand.cpp
 * @brief Control channel line framing and command argument parsing
 */

#include "wharf/FtpCommand.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace Wharf {

//=============================================================================
// LineBuffer
//=============================================================================

void LineBuffer::append(const char* data, size_t size) {
    m_buffer.append(data, size);
}

LineBuffer::Result LineBuffer::nextLine(std::string& line) {
    const size_t lf = m_buffer.find('\n');

    if (lf == std::string::npos) {
        if (m_buffer.size() > m_maxLineLength) {
            // Drop what we have; keep discarding until the terminator shows up.
            m_buffer.clear();
            if (!m_discarding) {
                m_discarding = true;
                return Result::OVERLONG;
            }
        }
        return Result::NONE;
    }

    if (m_discarding) {
        m_buffer.erase(0, lf + 1);
        m_discarding = false;
        return nextLine(line);
    }

    size_t end = lf;
    if (end > 0 && m_buffer[end - 1] == '\r') {
        --end;
    }

    if (end > m_maxLineLength) {
        m_buffer.erase(0, lf + 1);
        return Result::OVERLONG;
    }

    line.assign(m_buffer, 0, end);
    m_buffer.erase(0, lf + 1);
    return Result::LINE;
}

void LineBuffer::clear() {
    m_buffer.clear();
    m_discarding = false;
}

//=============================================================================
// Command parsing
//=============================================================================

bool parseCommandLine(const std::string& line, FtpCommand& command) {
    // Telnet IAC sequences some clients send ahead of ABOR are skipped.
    size_t start = 0;
    while (start < line.size() &&
           (static_cast<unsigned char>(line[start]) >= 0x80 || line[start] == ' ')) {
        ++start;
    }

    const size_t space = line.find(' ', start);
    std::string verb = line.substr(start, space == std::string::npos ? std::string::npos : space - start);
    if (verb.empty()) {
        return false;
    }

    for (char& c : verb) {
        if (!std::isalpha(static_cast<unsigned char>(c))) {
            return false;
        }
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    command.verb = verb;
    command.argument = (space == std::string::npos) ? std::string() : line.substr(space + 1);
    return true;
}

bool parsePortArgument(const std::string& argument, Endpoint& endpoint) {
    std::vector<unsigned> parts;
    std::istringstream iss(argument);
    std::string token;

    while (std::getline(iss, token, ',')) {
        if (token.empty() || token.size() > 3 ||
            !std::all_of(token.begin(), token.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return false;
        }
        const unsigned value = static_cast<unsigned>(std::stoul(token));
        if (value > 255) {
            return false;
        }
        parts.push_back(value);
    }

    if (parts.size() != 6) {
        return false;
    }

    endpoint.address = std::to_string(parts[0]) + "." + std::to_string(parts[1]) + "." +
                       std::to_string(parts[2]) + "." + std::to_string(parts[3]);
    endpoint.port = static_cast<uint16_t>((parts[4] << 8) | parts[5]);
    return endpoint.port != 0;
}

bool parseEprtArgument(const std::string& argument, Endpoint& endpoint) {
    if (argument.size() < 7) {
        return false;
    }

    // The first character is the delimiter chosen by the client.
    const char delim = argument[0];
    std::vector<std::string> fields;
    size_t pos = 1;
    while (pos <= argument.size()) {
        const size_t next = argument.find(delim, pos);
        if (next == std::string::npos) {
            break;
        }
        fields.push_back(argument.substr(pos, next - pos));
        pos = next + 1;
    }

    if (fields.size() != 3 || pos != argument.size()) {
        return false;
    }

    const std::string& proto = fields[0];
    const std::string& address = fields[1];
    const std::string& port = fields[2];

    if (proto != "1" && proto != "2") {
        return false;
    }
    if (port.empty() || port.size() > 5 ||
        !std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return false;
    }

    const unsigned long portValue = std::stoul(port);
    if (portValue == 0 || portValue > 65535) {
        return false;
    }

    Endpoint candidate{address, static_cast<uint16_t>(portValue)};
    sockaddr_storage storage{};
    socklen_t length = 0;
    std::string error;
    if (!makeSockAddr(candidate, storage, length, error)) {
        return false;
    }
    if ((proto == "1") != (storage.ss_family == AF_INET)) {
        return false;
    }

    endpoint = candidate;
    return true;
}

bool parseRestartOffset(const std::string& argument, uint64_t& offset) {
    if (argument.empty()) {
        return false;
    }

    uint64_t value = 0;
    for (char c : argument) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        const uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (UINT64_MAX - digit) / 10) {
            return false;
        }
        value = value * 10 + digit;
    }

    offset = value;
    return true;
}

std::string stripListOptions(const std::string& argument) {
    std::string rest = argument;
    while (!rest.empty() && rest[0] == '-') {
        const size_t space = rest.find(' ');
        if (space == std::string::npos) {
            return std::string();
        }
        rest = rest.substr(space + 1);
        while (!rest.empty() && rest[0] == ' ') {
            rest.erase(0, 1);
        }
    }
    return rest;
}

}  // namespace Wharf
