/**
 * @file FtpReply.h
 * @brief Control channel reply formatting
 */

#pragma once

#include "SocketUtils.h"
#include <string>
#include <vector>

namespace Wharf {

/**
 * @brief Single-line reply: "NNN text\r\n"
 */
std::string formatReply(int code, const std::string& text);

/**
 * @brief Multi-line reply
 *
 * The first line is "NNN-first", body lines are indented by one space and
 * the final line is "NNN last", as RFC 959 section 4.2 describes.
 * A single-element vector yields a plain single-line reply.
 */
std::string formatMultilineReply(int code, const std::vector<std::string>& lines);

/**
 * @brief 227 reply text "Entering Passive Mode (h1,h2,h3,h4,p1,p2)."
 * @return false if the address is not IPv4
 */
bool formatPasvReplyText(const Endpoint& endpoint, std::string& text);

/**
 * @brief 229 reply text "Entering Extended Passive Mode (|||port|)."
 */
std::string formatEpsvReplyText(uint16_t port);

/**
 * @brief Quote a path for a 257 reply (embedded quotes are doubled)
 */
std::string quotePath(const std::string& path);

}  // namespace Wharf
