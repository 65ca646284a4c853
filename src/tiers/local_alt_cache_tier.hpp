#ifndef TIERCACHE_SRC_TIERS_LOCAL_ALT_CACHE_TIER_HPP_
#define TIERCACHE_SRC_TIERS_LOCAL_ALT_CACHE_TIER_HPP_

#include "config/config_types.hpp"
#include "tiers/i_cache_tier.hpp"
#include "utils/clock.hpp"

#include <atomic>
#include <ctime>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace TierCache::Tiers
{

// Fixed table of slots addressed by key hash. A key landing on an occupied slot
// replaces whatever lived there, so reads of the displaced key become misses.
class LocalAltCacheTier : public ICacheTier
{
    private:
    struct Slot {
        std::string key;
        CacheValue value;
        std::time_t expires_at = 0;
    };

    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//
    LocalAltCacheTier(
        const Config::LocalAltCacheSettings& settings, std::string prefix,
        std::shared_ptr<const Utils::IClock> clock
    );
    ~LocalAltCacheTier() override = default;

    LocalAltCacheTier(const LocalAltCacheTier&)            = delete;
    LocalAltCacheTier& operator=(const LocalAltCacheTier&) = delete;
    LocalAltCacheTier(LocalAltCacheTier&&)                 = delete;
    LocalAltCacheTier& operator=(LocalAltCacheTier&&)      = delete;

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//

    // ICacheTier Implementation
    Config::Tier GetTier() const override { return Config::Tier::LocalProcessCacheAlt; }

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

    bool IsHealthy() override { return true; }
    nlohmann::json Stats() const override;

    /// Stored form of a key: prefixed, and hashed when longer than max_key_length.
    std::string StoredKey(const std::string& key) const;
    std::size_t SlotIndex(const std::string& stored_key) const;

    private:
    //------------------------------------------------------------------------------//
    // Private Fields
    //------------------------------------------------------------------------------//
    const Config::LocalAltCacheSettings settings_;
    const std::string prefix_;
    std::shared_ptr<const Utils::IClock> clock_;

    mutable std::mutex slots_mutex_;
    std::vector<std::optional<Slot>> slots_;

    std::atomic<std::uint64_t> overwrites_{0};
};

}  // namespace TierCache::Tiers

#endif  // TIERCACHE_SRC_TIERS_LOCAL_ALT_CACHE_TIER_HPP_
