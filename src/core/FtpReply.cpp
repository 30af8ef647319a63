/**
 * @file FtpReply.cpp
 * @brief Control channel reply formatting
 */

#include "wharf/FtpReply.h"

#include <arpa/inet.h>
#include <algorithm>

namespace Wharf {

std::string formatReply(int code, const std::string& text) {
    // CR/LF inside a message would split the reply; replace them.
    std::string clean = text;
    std::replace(clean.begin(), clean.end(), '\r', ' ');
    std::replace(clean.begin(), clean.end(), '\n', ' ');
    return std::to_string(code) + " " + clean + "\r\n";
}

std::string formatMultilineReply(int code, const std::vector<std::string>& lines) {
    if (lines.empty()) {
        return formatReply(code, "");
    }
    if (lines.size() == 1) {
        return formatReply(code, lines.front());
    }

    const std::string codeText = std::to_string(code);
    std::string out = codeText + "-" + lines.front() + "\r\n";
    for (size_t i = 1; i + 1 < lines.size(); ++i) {
        out += " " + lines[i] + "\r\n";
    }
    out += codeText + " " + lines.back() + "\r\n";
    return out;
}

bool formatPasvReplyText(const Endpoint& endpoint, std::string& text) {
    in_addr addr{};
    if (inet_pton(AF_INET, endpoint.address.c_str(), &addr) != 1) {
        return false;
    }

    std::string hostPart = endpoint.address;
    std::replace(hostPart.begin(), hostPart.end(), '.', ',');

    text = "Entering Passive Mode (" + hostPart + "," +
           std::to_string(endpoint.port >> 8) + "," +
           std::to_string(endpoint.port & 0xFF) + ").";
    return true;
}

std::string formatEpsvReplyText(uint16_t port) {
    return "Entering Extended Passive Mode (|||" + std::to_string(port) + "|).";
}

std::string quotePath(const std::string& path) {
    std::string out = "\"";
    for (char c : path) {
        if (c == '"') {
            out += "\"\"";
        } else {
            out += c;
        }
    }
    out += "\"";
    return out;
}

}  // namespace Wharf
