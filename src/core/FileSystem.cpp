/**
 * @file FileSystem.cpp
 * @brief Virtual path handling and the local-directory FileSystem
 */

#include "wharf/FileSystem.h"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

namespace Wharf {

namespace {

constexpr std::time_t SIX_MONTHS_S = 182 * 24 * 60 * 60;

FileInfo infoFromStat(const std::string& name, const struct stat& st) {
    FileInfo info;
    info.name = name;
    info.isDirectory = S_ISDIR(st.st_mode);
    info.size = info.isDirectory ? 0 : static_cast<uint64_t>(st.st_size);
    info.modified = st.st_mtime;
    info.mode = static_cast<uint32_t>(st.st_mode & 0777);
    return info;
}

std::string lastComponent(const std::string& virtualPath) {
    if (virtualPath == "/") {
        return "/";
    }
    return virtualPath.substr(virtualPath.rfind('/') + 1);
}

}  // namespace

//=============================================================================
// Virtual paths and listing text
//=============================================================================

std::string normalizeVirtualPath(const std::string& cwd, const std::string& argument) {
    std::string combined;
    if (!argument.empty() && argument[0] == '/') {
        combined = argument;
    } else {
        combined = cwd + "/" + argument;
    }

    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos <= combined.size()) {
        size_t next = combined.find('/', pos);
        if (next == std::string::npos) {
            next = combined.size();
        }
        const std::string part = combined.substr(pos, next - pos);
        if (part == "..") {
            if (!parts.empty()) {
                parts.pop_back();
            }
        } else if (!part.empty() && part != ".") {
            parts.push_back(part);
        }
        pos = next + 1;
    }

    if (parts.empty()) {
        return "/";
    }

    std::string out;
    for (const auto& part : parts) {
        out += "/" + part;
    }
    return out;
}

std::string formatListLine(const FileInfo& info, std::time_t now) {
    std::string perms = info.isDirectory ? "d" : "-";
    const char* flags = "rwxrwxrwx";
    for (int bit = 8; bit >= 0; --bit) {
        perms += (info.mode & (1u << bit)) ? flags[8 - bit] : '-';
    }

    std::tm tm{};
    gmtime_r(&info.modified, &tm);
    char date[32];
    const bool recent = info.modified <= now && (now - info.modified) < SIX_MONTHS_S;
    std::strftime(date, sizeof(date), recent ? "%b %d %H:%M" : "%b %d  %Y", &tm);

    char line[128];
    std::snprintf(line, sizeof(line), "%s 1 ftp ftp %13llu %s ",
                  perms.c_str(), static_cast<unsigned long long>(info.size), date);
    return std::string(line) + info.name;
}

std::string formatListing(const std::vector<FileInfo>& entries, bool namesOnly, std::time_t now) {
    std::string out;
    for (const auto& entry : entries) {
        out += namesOnly ? entry.name : formatListLine(entry, now);
        out += "\r\n";
    }
    return out;
}

std::string formatMdtm(std::time_t time) {
    std::tm tm{};
    gmtime_r(&time, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y%m%d%H%M%S", &tm);
    return buffer;
}

//=============================================================================
// LocalFileSystem
//=============================================================================

LocalFileSystem::LocalFileSystem(std::filesystem::path root)
    : m_root(std::move(root))
{
}

std::filesystem::path LocalFileSystem::toHostPath(const std::string& virtualPath) const {
    const std::string normalized = normalizeVirtualPath("/", virtualPath);
    if (normalized == "/") {
        return m_root;
    }
    return m_root / normalized.substr(1);
}

bool LocalFileSystem::openForRead(const std::string& path, UniqueFd& fd, uint64_t& size,
                                  std::string& errorMsg) {
    const std::string host = toHostPath(path).string();
    UniqueFd file(::open(host.c_str(), O_RDONLY | O_CLOEXEC));
    if (!file.isValid()) {
        errorMsg = path + ": " + errnoToString(errno);
        return false;
    }

    struct stat st{};
    if (::fstat(file.get(), &st) != 0) {
        errorMsg = path + ": " + errnoToString(errno);
        return false;
    }
    if (!S_ISREG(st.st_mode)) {
        errorMsg = path + ": Not a regular file";
        return false;
    }

    size = static_cast<uint64_t>(st.st_size);
    fd = std::move(file);
    return true;
}

bool LocalFileSystem::openForWrite(const std::string& path, bool truncate, UniqueFd& fd,
                                   uint64_t& size, std::string& errorMsg) {
    if (normalizeVirtualPath("/", path) == "/") {
        errorMsg = "Cannot write to the root directory";
        return false;
    }

    const std::string host = toHostPath(path).string();
    int flags = O_WRONLY | O_CREAT | O_CLOEXEC;
    if (truncate) {
        flags |= O_TRUNC;
    }

    UniqueFd file(::open(host.c_str(), flags, 0644));
    if (!file.isValid()) {
        errorMsg = path + ": " + errnoToString(errno);
        return false;
    }

    struct stat st{};
    if (::fstat(file.get(), &st) != 0) {
        errorMsg = path + ": " + errnoToString(errno);
        return false;
    }
    if (!S_ISREG(st.st_mode)) {
        errorMsg = path + ": Not a regular file";
        return false;
    }

    size = static_cast<uint64_t>(st.st_size);
    fd = std::move(file);
    return true;
}

bool LocalFileSystem::stat(const std::string& path, FileInfo& info, std::string& errorMsg) {
    const std::string host = toHostPath(path).string();
    struct stat st{};
    if (::stat(host.c_str(), &st) != 0) {
        errorMsg = path + ": " + errnoToString(errno);
        return false;
    }
    info = infoFromStat(lastComponent(normalizeVirtualPath("/", path)), st);
    return true;
}

bool LocalFileSystem::list(const std::string& path, std::vector<FileInfo>& entries,
                           std::string& errorMsg) {
    FileInfo self;
    if (!stat(path, self, errorMsg)) {
        return false;
    }

    entries.clear();
    if (!self.isDirectory) {
        entries.push_back(self);
        return true;
    }

    std::error_code ec;
    std::filesystem::directory_iterator it(toHostPath(path), ec);
    if (ec) {
        errorMsg = path + ": " + ec.message();
        return false;
    }

    for (const auto& entry : it) {
        struct stat st{};
        // Entries removed between readdir and stat are skipped.
        if (::stat(entry.path().c_str(), &st) != 0) {
            continue;
        }
        entries.push_back(infoFromStat(entry.path().filename().string(), st));
    }

    std::sort(entries.begin(), entries.end(),
              [](const FileInfo& a, const FileInfo& b) { return a.name < b.name; });
    return true;
}

bool LocalFileSystem::makeDirectory(const std::string& path, std::string& errorMsg) {
    const std::string host = toHostPath(path).string();
    if (::mkdir(host.c_str(), 0755) != 0) {
        errorMsg = path + ": " + errnoToString(errno);
        return false;
    }
    return true;
}

bool LocalFileSystem::removeDirectory(const std::string& path, std::string& errorMsg) {
    if (normalizeVirtualPath("/", path) == "/") {
        errorMsg = "Cannot remove the root directory";
        return false;
    }
    const std::string host = toHostPath(path).string();
    if (::rmdir(host.c_str()) != 0) {
        errorMsg = path + ": " + errnoToString(errno);
        return false;
    }
    return true;
}

bool LocalFileSystem::removeFile(const std::string& path, std::string& errorMsg) {
    const std::string host = toHostPath(path).string();
    struct stat st{};
    if (::stat(host.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) {
        errorMsg = path + ": Is a directory";
        return false;
    }
    if (::unlink(host.c_str()) != 0) {
        errorMsg = path + ": " + errnoToString(errno);
        return false;
    }
    return true;
}

bool LocalFileSystem::rename(const std::string& from, const std::string& to, std::string& errorMsg) {
    if (normalizeVirtualPath("/", from) == "/" || normalizeVirtualPath("/", to) == "/") {
        errorMsg = "Cannot rename the root directory";
        return false;
    }
    const std::string hostFrom = toHostPath(from).string();
    const std::string hostTo = toHostPath(to).string();
    if (::rename(hostFrom.c_str(), hostTo.c_str()) != 0) {
        errorMsg = from + ": " + errnoToString(errno);
        return false;
    }
    return true;
}

}  // namespace Wharf
