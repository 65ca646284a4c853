#include "storage/posix_file.hpp"

#include <fcntl.h>
#include <spdlog/spdlog.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <cerrno>
#include <cstring>

namespace TierCache::Storage
{

//------------------------------------------------------------------------------//
// FileLock
//------------------------------------------------------------------------------//

StorageResult<FileLock> FileLock::Acquire(int fd, LockMode mode)
{
    const int operation = mode == LockMode::Shared ? LOCK_SH : LOCK_EX;
    while (::flock(fd, operation) == -1) {
        if (errno == EINTR) {
            continue;
        }
        int err = errno;
        spdlog::debug("flock({}) failed on fd {}: {}", operation, fd, std::strerror(err));
        return std::unexpected(make_error_code(StorageErrc::LockFailed));
    }
    return FileLock(fd);
}

FileLock::~FileLock() { Unlock(); }

FileLock& FileLock::operator=(FileLock&& other) noexcept
{
    if (this != &other) {
        Unlock();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

void FileLock::Unlock() noexcept
{
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        fd_ = -1;
    }
}

//------------------------------------------------------------------------------//
// Raw I/O
//------------------------------------------------------------------------------//

StorageResult<std::string> ReadAll(int fd)
{
    std::string out;
    char buffer[8192];
    off_t offset = 0;
    while (true) {
        ssize_t n = ::pread(fd, buffer, sizeof(buffer), offset);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return std::unexpected(ErrnoToErrorCode(errno));
        }
        if (n == 0) {
            break;
        }
        out.append(buffer, static_cast<std::size_t>(n));
        offset += n;
    }
    return out;
}

StorageResult<void> WriteAll(int fd, std::string_view data, off_t offset)
{
    std::size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::pwrite(
            fd, data.data() + written, data.size() - written,
            offset + static_cast<off_t>(written)
        );
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return std::unexpected(ErrnoToErrorCode(errno));
        }
        written += static_cast<std::size_t>(n);
    }
    return {};
}

//------------------------------------------------------------------------------//
// Locked Whole-Object I/O
//------------------------------------------------------------------------------//

namespace
{

StorageResult<FileDescriptorGuard> OpenForRead(const std::filesystem::path& path)
{
    FileDescriptorGuard fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd) {
        if (errno == ENOENT) {
            return std::unexpected(make_error_code(StorageErrc::CacheMiss));
        }
        return std::unexpected(ErrnoToErrorCode(errno));
    }
    return fd;
}

}  // namespace

StorageResult<std::string> ReadFileLocked(const std::filesystem::path& path)
{
    auto fd = OpenForRead(path);
    if (!fd) {
        return std::unexpected(fd.error());
    }
    auto lock = FileLock::Acquire(fd->get(), LockMode::Shared);
    if (!lock) {
        return std::unexpected(lock.error());
    }
    return ReadAll(fd->get());
}

StorageResult<std::string> ReadFilePrefixLocked(
    const std::filesystem::path& path, std::size_t max_bytes
)
{
    auto fd = OpenForRead(path);
    if (!fd) {
        return std::unexpected(fd.error());
    }
    auto lock = FileLock::Acquire(fd->get(), LockMode::Shared);
    if (!lock) {
        return std::unexpected(lock.error());
    }

    std::string out(max_bytes, '\0');
    std::size_t got = 0;
    while (got < max_bytes) {
        ssize_t n = ::pread(fd->get(), out.data() + got, max_bytes - got, static_cast<off_t>(got));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return std::unexpected(ErrnoToErrorCode(errno));
        }
        if (n == 0) {
            break;
        }
        got += static_cast<std::size_t>(n);
    }
    out.resize(got);
    return out;
}

StorageResult<void> WriteFileLocked(
    const std::filesystem::path& path, std::string_view data, mode_t mode
)
{
    // No O_TRUNC: the file may only be emptied once the exclusive lock is held
    FileDescriptorGuard fd(::open(path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, mode));
    if (!fd) {
        return std::unexpected(ErrnoToErrorCode(errno));
    }
    auto lock = FileLock::Acquire(fd.get(), LockMode::Exclusive);
    if (!lock) {
        return std::unexpected(lock.error());
    }
    if (::ftruncate(fd.get(), 0) == -1) {
        return std::unexpected(ErrnoToErrorCode(errno));
    }
    return WriteAll(fd.get(), data, 0);
}

StorageResult<void> RemoveFile(const std::filesystem::path& path)
{
    if (::unlink(path.c_str()) == -1 && errno != ENOENT) {
        return std::unexpected(ErrnoToErrorCode(errno));
    }
    return {};
}

}  // namespace TierCache::Storage
