#ifndef TIERCACHE_SRC_TIERS_REDIS_TIER_HPP_
#define TIERCACHE_SRC_TIERS_REDIS_TIER_HPP_

#include "config/config_types.hpp"
#include "pool/connection_source.hpp"
#include "tiers/i_cache_tier.hpp"
#include "utils/clock.hpp"

#include <memory>
#include <string>

namespace TierCache::Tiers
{

// Distributed key-value store tier speaking RESP. Entries carry their own expiry
// in the record and are also given a server-side TTL.
class RedisTier : public ICacheTier, public IBatchOperations, public IPooledTier
{
    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//
    RedisTier(
        const Config::NetworkSettings& settings, std::string prefix, bool pooling,
        std::shared_ptr<const Utils::IClock> clock
    );
    ~RedisTier() override = default;

    RedisTier(const RedisTier&)            = delete;
    RedisTier& operator=(const RedisTier&) = delete;
    RedisTier(RedisTier&&)                 = delete;
    RedisTier& operator=(RedisTier&&)      = delete;

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//

    // ICacheTier Implementation
    Config::Tier GetTier() const override { return Config::Tier::NetworkKvStore; }

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

    // IBatchOperations Implementation
    StorageResult<std::vector<std::optional<TierEntry>>> GetMany(
        const std::vector<std::string>& keys
    ) override;
    StorageResult<void> PutMany(
        const std::vector<std::pair<std::string, CacheValue>>& items, std::int64_t ttl_seconds
    ) override;
    StorageResult<std::size_t> RemoveMany(const std::vector<std::string>& keys) override;

    // IPooledTier Implementation
    std::size_t CleanupIdleConnections() override;
    nlohmann::json ConnectionStats() const override;

    private:
    //------------------------------------------------------------------------------//
    // Private Methods
    //------------------------------------------------------------------------------//
    std::string StoredKey(const std::string& key) const { return prefix_ + key; }

    //------------------------------------------------------------------------------//
    // Private Fields
    //------------------------------------------------------------------------------//
    const Config::NetworkSettings settings_;
    const std::string prefix_;
    const bool pooling_;
    std::shared_ptr<const Utils::IClock> clock_;

    std::unique_ptr<Pool::ConnectionSource> source_;
};

}  // namespace TierCache::Tiers

#endif  // TIERCACHE_SRC_TIERS_REDIS_TIER_HPP_
