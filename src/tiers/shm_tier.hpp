#ifndef TIERCACHE_SRC_TIERS_SHM_TIER_HPP_
#define TIERCACHE_SRC_TIERS_SHM_TIER_HPP_

#include "config/config_types.hpp"
#include "storage/posix_file.hpp"
#include "tiers/i_cache_tier.hpp"
#include "utils/clock.hpp"

#include <sys/types.h>
#include <atomic>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace TierCache::Tiers
{

// System V shared memory segments, one per key, partitioned from a configured base key.
// The logical key is stored inside the envelope so partition collisions read as misses.
class ShmTier : public ICacheTier
{
    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//
    ShmTier(
        const Config::SharedMemorySettings& settings, std::string prefix,
        std::filesystem::path lock_directory, std::shared_ptr<const Utils::IClock> clock
    );
    ~ShmTier() override = default;

    ShmTier(const ShmTier&)            = delete;
    ShmTier& operator=(const ShmTier&) = delete;
    ShmTier(ShmTier&&)                 = delete;
    ShmTier& operator=(ShmTier&&)      = delete;

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//

    // ICacheTier Implementation
    Config::Tier GetTier() const override { return Config::Tier::SharedMemory; }

    StorageResult<void> Initialize() override;
    StorageResult<void> Shutdown() override;
    StorageResult<void> Verify() override;

    StorageResult<TierEntry> Get(const std::string& key) override;
    StorageResult<void> Put(
        const std::string& key, const CacheValue& value, std::int64_t ttl_seconds
    ) override;
    StorageResult<void> Remove(const std::string& key) override;

    StorageResult<void> Clear() override;
    StorageResult<std::size_t> CleanupExpired() override;

    bool IsHealthy() override;
    nlohmann::json Stats() const override;

    key_t SegmentKeyFor(const std::string& key) const;
    std::size_t TrackedCount() const;

    private:
    //------------------------------------------------------------------------------//
    // Private Methods
    //------------------------------------------------------------------------------//
    StorageResult<Storage::FileDescriptorGuard> OpenLockFile(key_t segment_key) const;
    StorageResult<std::string> ReadSegment(int shm_id) const;
    StorageResult<void> DestroySegment(int shm_id) const;
    /// Re-reads the segment under the exclusive lock and destroys it if it is still stale.
    StorageResult<TierEntry> DiscardStaleSegment(
        int lock_fd, key_t segment_key, const std::string& prefixed_key
    );
    void Track(key_t segment_key, const std::string& prefixed_key);
    void Untrack(key_t segment_key);

    //------------------------------------------------------------------------------//
    // Private Fields
    //------------------------------------------------------------------------------//
    const Config::SharedMemorySettings settings_;
    const std::string prefix_;
    const std::filesystem::path lock_directory_;
    std::shared_ptr<const Utils::IClock> clock_;

    mutable std::mutex tracked_mutex_;
    std::map<key_t, std::string> tracked_;  ///< segment key -> prefixed logical key
    std::atomic<std::uint64_t> unreported_expired_{0};
};

}  // namespace TierCache::Tiers

#endif  // TIERCACHE_SRC_TIERS_SHM_TIER_HPP_
