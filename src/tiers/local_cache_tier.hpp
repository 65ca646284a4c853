#ifndef TIERCACHE_SRC_TIERS_LOCAL_CACHE_TIER_HPP_
#define TIERCACHE_SRC_TIERS_LOCAL_CACHE_TIER_HPP_

#include "config/config_types.hpp"
#include "tiers/i_cache_tier.hpp"
#include "utils/clock.hpp"

#include "boost/multi_index/hashed_index.hpp"
#include "boost/multi_index/indexed_by.hpp"
#include "boost/multi_index/member.hpp"
#include "boost/multi_index/ordered_index.hpp"
#include "boost/multi_index_container.hpp"

#include <atomic>
#include <ctime>
#include <memory>
#include <mutex>
#include <string>

namespace TierCache::Tiers
{

namespace bmi = boost::multi_index;

// In-process key/value store with per-entry expiry and bounded size
class LocalCacheTier : public ICacheTier
{
    private:
    //------------------------------------------------------------------------------//
    // Internal Types
    //------------------------------------------------------------------------------//
    struct Slot {
        std::string key;
        CacheValue value;
        std::time_t expires_at;
        std::uint64_t sequence;  ///< Insertion order, oldest evicted first
    };

    // Index tags
    struct by_key {
    };
    struct by_expiry {
    };
    struct by_sequence {
    };

    using SlotContainer = bmi::multi_index_container<
        Slot, bmi::indexed_by<
                  bmi::hashed_unique<bmi::tag<by_key>, bmi::member<Slot, std::string, &Slot::key>>,
                  bmi::ordered_non_unique<
                      bmi::tag<by_expiry>, bmi::member<Slot, std::time_t, &Slot::expires_at>>,
                  bmi::ordered_unique<
                      bmi::tag<by_sequence>, bmi::member<Slot, std::uint64_t, &Slot::sequence>>>>;

    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//
    LocalCacheTier(
        const Config::LocalCacheSettings& settings, std::string prefix,
        std::shared_ptr<const Utils::IClock> clock
    );
    ~LocalCacheTier() override = default;

    LocalCacheTier(const LocalCacheTier&)            = delete;
    LocalCacheTier& operator=(const LocalCacheTier&) = delete;
    LocalCacheTier(LocalCacheTier&&)                 = delete;
    LocalCacheTier& operator=(LocalCacheTier&&)      = delete;

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//

    // ICacheTier Implementation
    Config::Tier GetTier() const override { return Config::Tier::LocalProcessCache; }

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

    std::size_t Size() const;

    private:
    //------------------------------------------------------------------------------//
    // Private Methods
    //------------------------------------------------------------------------------//
    std::size_t RemoveExpired_impl(std::time_t now);
    void MakeRoom_impl(std::time_t now);

    //------------------------------------------------------------------------------//
    // Private Fields
    //------------------------------------------------------------------------------//
    const Config::LocalCacheSettings settings_;
    const std::string prefix_;
    std::shared_ptr<const Utils::IClock> clock_;

    mutable std::mutex slots_mutex_;
    SlotContainer slots_;
    std::uint64_t next_sequence_ = 0;

    std::atomic<std::uint64_t> evictions_{0};
};

}  // namespace TierCache::Tiers

#endif  // TIERCACHE_SRC_TIERS_LOCAL_CACHE_TIER_HPP_
