#ifndef TIERCACHE_SRC_STORAGE_POSIX_FILE_HPP_
#define TIERCACHE_SRC_STORAGE_POSIX_FILE_HPP_

#include "storage/storage_error.hpp"

#include <unistd.h>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

namespace TierCache::Storage
{

//------------------------------------------------------------------------------//
// RAII Wrappers
//------------------------------------------------------------------------------//

class FileDescriptorGuard
{
    private:
    int fd_;

    public:
    explicit FileDescriptorGuard(int fd = -1) noexcept : fd_(fd) {}
    ~FileDescriptorGuard() { reset(); }
    FileDescriptorGuard(const FileDescriptorGuard&)            = delete;
    FileDescriptorGuard& operator=(const FileDescriptorGuard&) = delete;
    FileDescriptorGuard(FileDescriptorGuard&& other) noexcept : fd_(other.release()) {}
    FileDescriptorGuard& operator=(FileDescriptorGuard&& other) noexcept
    {
        reset(other.release());
        return *this;
    }
    int get() const noexcept { return fd_; }
    int release() noexcept { return std::exchange(fd_, -1); }
    void reset(int new_fd = -1) noexcept
    {
        if (fd_ >= 0 && fd_ != new_fd) {
            ::close(fd_);
        }
        fd_ = new_fd;
    }
    explicit operator bool() const noexcept { return fd_ >= 0; }
};

enum class LockMode { Shared, Exclusive };

// Advisory flock() held for the lifetime of the object
class FileLock
{
    public:
    static StorageResult<FileLock> Acquire(int fd, LockMode mode);

    ~FileLock();
    FileLock(const FileLock&)            = delete;
    FileLock& operator=(const FileLock&) = delete;
    FileLock(FileLock&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    FileLock& operator=(FileLock&& other) noexcept;

    void Unlock() noexcept;

    private:
    explicit FileLock(int fd) noexcept : fd_(fd) {}

    int fd_ = -1;
};

//------------------------------------------------------------------------------//
// Locked Whole-Object I/O
//------------------------------------------------------------------------------//

/// Reads the whole file under a shared lock. A missing file is CacheMiss.
StorageResult<std::string> ReadFileLocked(const std::filesystem::path& path);

/// Reads at most max_bytes from the start of the file under a shared lock.
StorageResult<std::string> ReadFilePrefixLocked(
    const std::filesystem::path& path, std::size_t max_bytes
);

/// Truncates and overwrites the file from offset zero under an exclusive lock.
StorageResult<void> WriteFileLocked(
    const std::filesystem::path& path, std::string_view data, mode_t mode = 0644
);

/// Removes the file; a file that does not exist counts as removed.
StorageResult<void> RemoveFile(const std::filesystem::path& path);

StorageResult<std::string> ReadAll(int fd);
StorageResult<void> WriteAll(int fd, std::string_view data, off_t offset = 0);

}  // namespace TierCache::Storage

#endif  // TIERCACHE_SRC_STORAGE_POSIX_FILE_HPP_
