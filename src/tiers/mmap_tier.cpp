#include "tiers/mmap_tier.hpp"

#include "app_constants.hpp"
#include "storage/directory_provisioner.hpp"
#include "storage/envelope.hpp"
#include "storage/key_hasher.hpp"
#include "storage/posix_file.hpp"

#include <fcntl.h>
#include <spdlog/spdlog.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace TierCache::Tiers
{

namespace fs = std::filesystem;

namespace
{

class MappedRegion
{
    private:
    void* addr_        = MAP_FAILED;
    std::size_t length_ = 0;

    public:
    MappedRegion(int fd, std::size_t length, int prot)
        : addr_(::mmap(nullptr, length, prot, MAP_SHARED, fd, 0)), length_(length)
    {
    }
    ~MappedRegion()
    {
        if (addr_ != MAP_FAILED) {
            ::munmap(addr_, length_);
        }
    }
    MappedRegion(const MappedRegion&)            = delete;
    MappedRegion& operator=(const MappedRegion&) = delete;

    explicit operator bool() const noexcept { return addr_ != MAP_FAILED; }
    char* data() const noexcept { return static_cast<char*>(addr_); }
    std::size_t size() const noexcept { return length_; }
};

}  // namespace

MmapTier::MmapTier(
    const Config::MmapSettings& settings, std::string prefix, fs::path directory,
    std::shared_ptr<const Utils::IClock> clock
)
    : settings_(settings),
      prefix_(std::move(prefix)),
      directory_(std::move(directory)),
      clock_(std::move(clock))
{
}

fs::path MmapTier::PathForKey(const std::string& key) const
{
    return directory_ /
           (Storage::HashKey(prefix_ + key) + std::string(Constants::MMAP_EXTENSION));
}

bool MmapTier::IsOwnedFile(const fs::path& path) const
{
    return path.extension().string() == Constants::MMAP_EXTENSION &&
           Storage::IsHashedName(path.stem().string());
}

StorageResult<void> MmapTier::Initialize()
{
    Storage::DirectoryProvisioner provisioner;
    return provisioner.EnsureWritable(directory_);
}

StorageResult<void> MmapTier::Shutdown() { return {}; }

StorageResult<void> MmapTier::Verify()
{
    if (!Storage::DirectoryProvisioner::IsWritableDirectory(directory_)) {
        return std::unexpected(make_error_code(StorageErrc::PermissionDenied));
    }
    return VerifyRoundTrip(*this);
}

StorageResult<std::string> MmapTier::ReadMapped(const fs::path& path) const
{
    Storage::FileDescriptorGuard fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd) {
        if (errno == ENOENT) {
            return std::unexpected(make_error_code(StorageErrc::CacheMiss));
        }
        return std::unexpected(Storage::ErrnoToErrorCode(errno));
    }
    auto lock = Storage::FileLock::Acquire(fd.get(), Storage::LockMode::Shared);
    if (!lock) {
        return std::unexpected(lock.error());
    }

    struct stat st {};
    if (::fstat(fd.get(), &st) == -1) {
        return std::unexpected(Storage::ErrnoToErrorCode(errno));
    }
    if (st.st_size <= 0) {
        return std::unexpected(make_error_code(StorageErrc::CorruptEntry));
    }

    MappedRegion region(fd.get(), static_cast<std::size_t>(st.st_size), PROT_READ);
    if (!region) {
        return std::unexpected(Storage::ErrnoToErrorCode(errno));
    }
    const void* nul = std::memchr(region.data(), '\0', region.size());
    const auto used = nul ? static_cast<std::size_t>(static_cast<const char*>(nul) - region.data())
                          : region.size();
    return std::string(region.data(), used);
}

StorageResult<TierEntry> MmapTier::Get(const std::string& key)
{
    const auto path = PathForKey(key);
    auto bytes      = ReadMapped(path);
    if (!bytes && bytes.error() != make_error_code(StorageErrc::CorruptEntry)) {
        return std::unexpected(bytes.error());
    }

    StorageResult<Storage::EnvelopeRecord> record =
        std::unexpected(make_error_code(StorageErrc::CorruptEntry));
    if (bytes) {
        record = Storage::DecodeRecord(*bytes);
    }
    if (!record) {
        spdlog::debug("Removing undecodable mmap file {}", path.string());
        if (auto rm = Storage::RemoveFile(path); !rm) {
            spdlog::debug("Failed to remove {}: {}", path.string(), rm.error().message());
        }
        return std::unexpected(record.error());
    }

    if (Storage::IsExpired(*record->entry.expires_at, clock_->Now())) {
        if (auto rm = Storage::RemoveFile(path); !rm) {
            spdlog::debug("Failed to remove {}: {}", path.string(), rm.error().message());
        } else {
            unreported_expired_++;
        }
        return std::unexpected(make_error_code(StorageErrc::Expired));
    }
    return std::move(record->entry);
}

StorageResult<void> MmapTier::Put(
    const std::string& key, const CacheValue& value, std::int64_t ttl_seconds
)
{
    const auto path       = PathForKey(key);
    const auto expires_at = Storage::ComputeExpiry(clock_->Now(), ttl_seconds);
    const auto encoded    = Storage::EncodeRecord(value, expires_at);
    const auto extent     = Storage::ExtentSize(encoded.size(), settings_.file_size);

    Storage::FileDescriptorGuard fd(::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644));
    if (!fd) {
        return std::unexpected(Storage::ErrnoToErrorCode(errno));
    }
    auto lock = Storage::FileLock::Acquire(fd.get(), Storage::LockMode::Exclusive);
    if (!lock) {
        return std::unexpected(lock.error());
    }
    if (::ftruncate(fd.get(), static_cast<off_t>(extent)) == -1) {
        return std::unexpected(Storage::ErrnoToErrorCode(errno));
    }

    MappedRegion region(fd.get(), extent, PROT_READ | PROT_WRITE);
    if (!region) {
        return std::unexpected(Storage::ErrnoToErrorCode(errno));
    }
    std::memcpy(region.data(), encoded.data(), encoded.size());
    std::memset(region.data() + encoded.size(), 0, extent - encoded.size());
    if (::msync(region.data(), extent, MS_SYNC) == -1) {
        return std::unexpected(Storage::ErrnoToErrorCode(errno));
    }
    bytes_mapped_ += extent;
    return {};
}

StorageResult<void> MmapTier::Remove(const std::string& key)
{
    return Storage::RemoveFile(PathForKey(key));
}

StorageResult<void> MmapTier::Clear()
{
    std::error_code ec;
    fs::directory_iterator it(directory_, ec);
    if (ec) {
        return std::unexpected(Storage::ErrnoToErrorCode(ec.value()));
    }
    StorageResult<void> result{};
    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec) || !IsOwnedFile(entry.path())) {
            continue;
        }
        if (auto rm = Storage::RemoveFile(entry.path()); !rm) {
            result = rm;
        }
    }
    return result;
}

StorageResult<std::size_t> MmapTier::CleanupExpired()
{
    std::error_code ec;
    fs::directory_iterator it(directory_, ec);
    if (ec) {
        return std::unexpected(Storage::ErrnoToErrorCode(ec.value()));
    }

    const auto now      = clock_->Now();
    std::size_t removed = unreported_expired_.exchange(0);
    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec) || !IsOwnedFile(entry.path())) {
            continue;
        }
        auto bytes = ReadMapped(entry.path());
        if (!bytes && bytes.error() == make_error_code(StorageErrc::CacheMiss)) {
            continue;
        }
        bool stale = true;
        if (bytes) {
            auto record = Storage::DecodeRecord(*bytes);
            stale       = !record || Storage::IsExpired(*record->entry.expires_at, now);
        }
        if (stale && Storage::RemoveFile(entry.path())) {
            removed++;
        }
    }
    return removed;
}

bool MmapTier::IsHealthy()
{
    return Storage::DirectoryProvisioner::IsWritableDirectory(directory_);
}

nlohmann::json MmapTier::Stats() const
{
    std::size_t files = 0;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(directory_, ec)) {
        if (entry.is_regular_file(ec) && IsOwnedFile(entry.path())) {
            files++;
        }
    }
    return {
        {        "path",  directory_.string()},
        {       "files",                files},
        {   "file_size",  settings_.file_size},
        {"bytes_mapped", bytes_mapped_.load()},
    };
}

}  // namespace TierCache::Tiers
