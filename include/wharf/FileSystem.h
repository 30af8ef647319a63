/**
 * @file FileSystem.h
 * @brief Filesystem collaborator: virtual paths mapped onto a host directory
 *
 * Sessions address files by virtual path ("/docs/a.txt"). A FileSystem
 * resolves those paths for one user's home directory and hands back raw
 * file descriptors so TransferEngine can use positional I/O.
 */

#pragma once

#include "SocketUtils.h"
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <string>
#include <vector>

namespace Wharf {

/**
 * @brief Metadata for one filesystem entry
 */
struct FileInfo {
    std::string name;        ///< Entry name (last path component)
    bool isDirectory{false};
    uint64_t size{0};
    std::time_t modified{0}; ///< Modification time (UTC seconds)
    uint32_t mode{0};        ///< Permission bits (st_mode & 0777)
};

/**
 * @brief Normalize a virtual path against a working directory
 * @param cwd Current virtual working directory (absolute)
 * @param argument Client-supplied path; absolute or relative, may be empty
 * @return Absolute virtual path without "." / ".." / duplicate slashes
 *
 * ".." at the virtual root stays at the root, so the result can never
 * name anything above it.
 */
std::string normalizeVirtualPath(const std::string& cwd, const std::string& argument);

/**
 * @brief Format one entry the way "ls -l" does
 *
 * Example: "-rw-r--r-- 1 ftp ftp      1024 Jan 02 13:45 name.txt"
 */
std::string formatListLine(const FileInfo& info, std::time_t now);

/**
 * @brief Build LIST (long) or NLST (names only) text, CRLF separated
 */
std::string formatListing(const std::vector<FileInfo>& entries, bool namesOnly, std::time_t now);

/**
 * @brief Format a time as the MDTM reply value YYYYMMDDHHMMSS (UTC)
 */
std::string formatMdtm(std::time_t time);

/**
 * @class FileSystem
 * @brief Interface used by Session for every file operation
 *
 * All paths are normalized virtual paths (see normalizeVirtualPath()).
 * Every method returns false and fills errorMsg on failure.
 */
class FileSystem {
public:
    virtual ~FileSystem() = default;

    /**
     * @brief Open an existing regular file for reading
     * @param size Receives the current file size
     */
    virtual bool openForRead(const std::string& path,
                             UniqueFd& fd,
                             uint64_t& size,
                             std::string& errorMsg) = 0;

    /**
     * @brief Open (creating if needed) a regular file for writing
     * @param truncate Truncate to zero length (fresh STOR)
     * @param size Receives the file size after opening
     */
    virtual bool openForWrite(const std::string& path,
                              bool truncate,
                              UniqueFd& fd,
                              uint64_t& size,
                              std::string& errorMsg) = 0;

    virtual bool stat(const std::string& path, FileInfo& info, std::string& errorMsg) = 0;

    /**
     * @brief List a directory, or a single file when path names one
     */
    virtual bool list(const std::string& path,
                      std::vector<FileInfo>& entries,
                      std::string& errorMsg) = 0;

    virtual bool makeDirectory(const std::string& path, std::string& errorMsg) = 0;
    virtual bool removeDirectory(const std::string& path, std::string& errorMsg) = 0;
    virtual bool removeFile(const std::string& path, std::string& errorMsg) = 0;
    virtual bool rename(const std::string& from, const std::string& to, std::string& errorMsg) = 0;
};

/**
 * @class LocalFileSystem
 * @brief FileSystem rooted at a host directory
 *
 * The virtual root "/" maps to the root directory given at construction.
 * Paths are normalized lexically before they are joined to the root, so a
 * client cannot climb above it with "..".
 */
class LocalFileSystem : public FileSystem {
public:
    explicit LocalFileSystem(std::filesystem::path root);

    const std::filesystem::path& root() const { return m_root; }

    /**
     * @brief Host path for a virtual path
     */
    std::filesystem::path toHostPath(const std::string& virtualPath) const;

    bool openForRead(const std::string& path, UniqueFd& fd, uint64_t& size,
                     std::string& errorMsg) override;
    bool openForWrite(const std::string& path, bool truncate, UniqueFd& fd,
                      uint64_t& size, std::string& errorMsg) override;
    bool stat(const std::string& path, FileInfo& info, std::string& errorMsg) override;
    bool list(const std::string& path, std::vector<FileInfo>& entries,
              std::string& errorMsg) override;
    bool makeDirectory(const std::string& path, std::string& errorMsg) override;
    bool removeDirectory(const std::string& path, std::string& errorMsg) override;
    bool removeFile(const std::string& path, std::string& errorMsg) override;
    bool rename(const std::string& from, const std::string& to, std::string& errorMsg) override;

private:
    std::filesystem::path m_root;
};

}  // namespace Wharf
