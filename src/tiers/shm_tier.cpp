#include "tiers/shm_tier.hpp"

#include "storage/directory_provisioner.hpp"
#include "storage/envelope.hpp"
#include "storage/key_hasher.hpp"

#include <fcntl.h>
#include <spdlog/spdlog.h>
#include <sys/ipc.h>
#include <sys/shm.h>
#include <cerrno>
#include <cstring>
#include <vector>

namespace TierCache::Tiers
{

namespace fs = std::filesystem;

namespace
{

class SegmentAttachment
{
    private:
    void* addr_ = reinterpret_cast<void*>(-1);

    public:
    SegmentAttachment(int shm_id, int flags) : addr_(::shmat(shm_id, nullptr, flags)) {}
    ~SegmentAttachment()
    {
        if (*this) {
            ::shmdt(addr_);
        }
    }
    SegmentAttachment(const SegmentAttachment&)            = delete;
    SegmentAttachment& operator=(const SegmentAttachment&) = delete;

    explicit operator bool() const noexcept { return addr_ != reinterpret_cast<void*>(-1); }
    char* data() const noexcept { return static_cast<char*>(addr_); }
};

StorageResult<std::size_t> SegmentSize(int shm_id)
{
    struct shmid_ds ds {};
    if (::shmctl(shm_id, IPC_STAT, &ds) == -1) {
        return std::unexpected(Storage::ErrnoToErrorCode(errno));
    }
    return static_cast<std::size_t>(ds.shm_segsz);
}

fs::path DefaultLockDirectory()
{
    std::error_code ec;
    auto tmp = fs::temp_directory_path(ec);
    if (ec) {
        tmp = "/tmp";
    }
    return tmp / "tiercache_shm_locks";
}

}  // namespace

ShmTier::ShmTier(
    const Config::SharedMemorySettings& settings, std::string prefix, fs::path lock_directory,
    std::shared_ptr<const Utils::IClock> clock
)
    : settings_(settings),
      prefix_(std::move(prefix)),
      lock_directory_(lock_directory.empty() ? DefaultLockDirectory() : std::move(lock_directory)),
      clock_(std::move(clock))
{
}

key_t ShmTier::SegmentKeyFor(const std::string& key) const
{
    return Storage::SharedMemoryKey(settings_.base_key, prefix_ + key);
}

StorageResult<Storage::FileDescriptorGuard> ShmTier::OpenLockFile(key_t segment_key) const
{
    const auto path = lock_directory_ / (std::to_string(segment_key) + ".lock");
    Storage::FileDescriptorGuard fd(::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0666));
    if (!fd) {
        return std::unexpected(Storage::ErrnoToErrorCode(errno));
    }
    return fd;
}

StorageResult<std::string> ShmTier::ReadSegment(int shm_id) const
{
    auto size = SegmentSize(shm_id);
    if (!size) {
        return std::unexpected(size.error());
    }
    SegmentAttachment attachment(shm_id, SHM_RDONLY);
    if (!attachment) {
        return std::unexpected(Storage::ErrnoToErrorCode(errno));
    }
    const void* nul = std::memchr(attachment.data(), '\0', *size);
    const auto used =
        nul ? static_cast<std::size_t>(static_cast<const char*>(nul) - attachment.data()) : *size;
    return std::string(attachment.data(), used);
}

StorageResult<void> ShmTier::DestroySegment(int shm_id) const
{
    if (::shmctl(shm_id, IPC_RMID, nullptr) == -1 && errno != EINVAL && errno != EIDRM) {
        return std::unexpected(Storage::ErrnoToErrorCode(errno));
    }
    return {};
}

void ShmTier::Track(key_t segment_key, const std::string& prefixed_key)
{
    std::lock_guard<std::mutex> lock(tracked_mutex_);
    tracked_[segment_key] = prefixed_key;
}

void ShmTier::Untrack(key_t segment_key)
{
    std::lock_guard<std::mutex> lock(tracked_mutex_);
    tracked_.erase(segment_key);
}

std::size_t ShmTier::TrackedCount() const
{
    std::lock_guard<std::mutex> lock(tracked_mutex_);
    return tracked_.size();
}

StorageResult<void> ShmTier::Initialize()
{
    Storage::DirectoryProvisioner provisioner;
    return provisioner.EnsureWritable(lock_directory_);
}

// Segments outlive the process so other processes keep their view of the cache
StorageResult<void> ShmTier::Shutdown() { return {}; }

StorageResult<void> ShmTier::Verify() { return VerifyRoundTrip(*this); }

StorageResult<TierEntry> ShmTier::Get(const std::string& key)
{
    const auto prefixed    = prefix_ + key;
    const auto segment_key = SegmentKeyFor(key);

    auto lock_fd = OpenLockFile(segment_key);
    if (!lock_fd) {
        return std::unexpected(lock_fd.error());
    }
    auto lock = Storage::FileLock::Acquire(lock_fd->get(), Storage::LockMode::Shared);
    if (!lock) {
        return std::unexpected(lock.error());
    }

    const int shm_id = ::shmget(segment_key, 0, 0);
    if (shm_id == -1) {
        if (errno == ENOENT) {
            return std::unexpected(make_error_code(StorageErrc::CacheMiss));
        }
        return std::unexpected(Storage::ErrnoToErrorCode(errno));
    }

    auto bytes = ReadSegment(shm_id);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    auto record = Storage::DecodeRecord(*bytes);
    if (record) {
        if (record->key && *record->key != prefixed) {
            // Another key hashed into the same partition slot
            return std::unexpected(make_error_code(StorageErrc::CacheMiss));
        }
        if (!Storage::IsExpired(*record->entry.expires_at, clock_->Now())) {
            Track(segment_key, prefixed);
            return std::move(record->entry);
        }
    }

    lock->Unlock();
    return DiscardStaleSegment(lock_fd->get(), segment_key, prefixed);
}

StorageResult<TierEntry> ShmTier::DiscardStaleSegment(
    int lock_fd, key_t segment_key, const std::string& prefixed_key
)
{
    auto lock = Storage::FileLock::Acquire(lock_fd, Storage::LockMode::Exclusive);
    if (!lock) {
        return std::unexpected(lock.error());
    }

    // A writer may have replaced or removed the segment between the two locks
    const int shm_id = ::shmget(segment_key, 0, 0);
    if (shm_id == -1) {
        if (errno == ENOENT) {
            Untrack(segment_key);
            return std::unexpected(make_error_code(StorageErrc::CacheMiss));
        }
        return std::unexpected(Storage::ErrnoToErrorCode(errno));
    }
    auto bytes = ReadSegment(shm_id);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    auto record = Storage::DecodeRecord(*bytes);
    if (!record) {
        spdlog::debug("Destroying undecodable shared memory segment {:#x}", segment_key);
        if (auto rm = DestroySegment(shm_id); !rm) {
            spdlog::debug("Failed to destroy segment {:#x}: {}", segment_key, rm.error().message());
        }
        Untrack(segment_key);
        return std::unexpected(record.error());
    }
    if (record->key && *record->key != prefixed_key) {
        return std::unexpected(make_error_code(StorageErrc::CacheMiss));
    }
    if (!Storage::IsExpired(*record->entry.expires_at, clock_->Now())) {
        Track(segment_key, prefixed_key);
        return std::move(record->entry);
    }
    if (auto rm = DestroySegment(shm_id); !rm) {
        spdlog::debug("Failed to destroy segment {:#x}: {}", segment_key, rm.error().message());
    } else {
        unreported_expired_++;
    }
    Untrack(segment_key);
    return std::unexpected(make_error_code(StorageErrc::Expired));
}

StorageResult<void> ShmTier::Put(
    const std::string& key, const CacheValue& value, std::int64_t ttl_seconds
)
{
    const auto prefixed    = prefix_ + key;
    const auto segment_key = SegmentKeyFor(key);
    const auto expires_at  = Storage::ComputeExpiry(clock_->Now(), ttl_seconds);
    const auto encoded     = Storage::EncodeRecord(value, expires_at, prefixed);
    const auto extent      = Storage::ExtentSize(encoded.size(), settings_.segment_size);

    auto lock_fd = OpenLockFile(segment_key);
    if (!lock_fd) {
        return std::unexpected(lock_fd.error());
    }
    auto lock = Storage::FileLock::Acquire(lock_fd->get(), Storage::LockMode::Exclusive);
    if (!lock) {
        return std::unexpected(lock.error());
    }

    int shm_id = ::shmget(segment_key, 0, 0);
    if (shm_id != -1) {
        auto size = SegmentSize(shm_id);
        if (!size || *size < encoded.size() + 1) {
            if (auto rm = DestroySegment(shm_id); !rm) {
                return rm;
            }
            shm_id = -1;
        }
    }
    if (shm_id == -1) {
        shm_id = ::shmget(segment_key, extent, IPC_CREAT | 0666);
        if (shm_id == -1) {
            return std::unexpected(Storage::ErrnoToErrorCode(errno));
        }
    }

    auto size = SegmentSize(shm_id);
    if (!size) {
        return std::unexpected(size.error());
    }
    SegmentAttachment attachment(shm_id, 0);
    if (!attachment) {
        return std::unexpected(Storage::ErrnoToErrorCode(errno));
    }
    std::memcpy(attachment.data(), encoded.data(), encoded.size());
    std::memset(attachment.data() + encoded.size(), 0, *size - encoded.size());

    Track(segment_key, prefixed);
    return {};
}

StorageResult<void> ShmTier::Remove(const std::string& key)
{
    const auto prefixed    = prefix_ + key;
    const auto segment_key = SegmentKeyFor(key);

    auto lock_fd = OpenLockFile(segment_key);
    if (!lock_fd) {
        return std::unexpected(lock_fd.error());
    }
    auto lock = Storage::FileLock::Acquire(lock_fd->get(), Storage::LockMode::Exclusive);
    if (!lock) {
        return std::unexpected(lock.error());
    }

    const int shm_id = ::shmget(segment_key, 0, 0);
    if (shm_id == -1) {
        const int err = errno;
        if (err != ENOENT) {
            return std::unexpected(Storage::ErrnoToErrorCode(err));
        }
        Untrack(segment_key);
        return {};
    }

    auto bytes = ReadSegment(shm_id);
    if (bytes) {
        auto record = Storage::DecodeRecord(*bytes);
        if (record && record->key && *record->key != prefixed) {
            return {};
        }
    }
    Untrack(segment_key);
    return DestroySegment(shm_id);
}

StorageResult<void> ShmTier::Clear()
{
    std::map<key_t, std::string> tracked;
    {
        std::lock_guard<std::mutex> lock(tracked_mutex_);
        tracked.swap(tracked_);
    }

    StorageResult<void> result{};
    for (const auto& [segment_key, prefixed] : tracked) {
        const int shm_id = ::shmget(segment_key, 0, 0);
        if (shm_id == -1) {
            continue;
        }
        if (auto rm = DestroySegment(shm_id); !rm) {
            result = rm;
        }
    }
    return result;
}

StorageResult<std::size_t> ShmTier::CleanupExpired()
{
    std::vector<key_t> segment_keys;
    {
        std::lock_guard<std::mutex> lock(tracked_mutex_);
        for (const auto& [segment_key, prefixed] : tracked_) {
            segment_keys.push_back(segment_key);
        }
    }

    const auto now      = clock_->Now();
    std::size_t removed = unreported_expired_.exchange(0);
    for (const auto segment_key : segment_keys) {
        auto lock_fd = OpenLockFile(segment_key);
        if (!lock_fd) {
            continue;
        }
        auto lock = Storage::FileLock::Acquire(lock_fd->get(), Storage::LockMode::Exclusive);
        if (!lock) {
            continue;
        }

        const int shm_id = ::shmget(segment_key, 0, 0);
        if (shm_id == -1) {
            Untrack(segment_key);
            continue;
        }
        auto bytes = ReadSegment(shm_id);
        if (!bytes) {
            continue;
        }
        auto record = Storage::DecodeRecord(*bytes);
        if (!record || Storage::IsExpired(*record->entry.expires_at, now)) {
            Untrack(segment_key);
            if (DestroySegment(shm_id)) {
                removed++;
            }
        }
    }
    return removed;
}

bool ShmTier::IsHealthy()
{
    return Storage::DirectoryProvisioner::IsWritableDirectory(lock_directory_);
}

nlohmann::json ShmTier::Stats() const
{
    return {
        {     "base_key",        settings_.base_key},
        { "segment_size",    settings_.segment_size},
        {    "lock_path", lock_directory_.string()},
        {     "segments",            TrackedCount()},
    };
}

}  // namespace TierCache::Tiers
