#ifndef TIERCACHE_SRC_TIERS_I_CACHE_TIER_HPP_
#define TIERCACHE_SRC_TIERS_I_CACHE_TIER_HPP_

#include "config/config_types.hpp"
#include "storage/cache_value.hpp"
#include "storage/storage_error.hpp"

#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace TierCache::Tiers
{

using Storage::CacheValue;
using Storage::make_error_code;
using Storage::StorageErrc;
using Storage::StorageResult;
using Storage::TierEntry;

// Interface for one storage tier of the hierarchy
class ICacheTier
{
    public:
    virtual ~ICacheTier() = default;

    // Identification
    virtual Config::Tier GetTier() const = 0;
    const char* GetName() const { return Config::TierToString(GetTier()); }

    // Initialization / Shutdown
    virtual StorageResult<void> Initialize() = 0;
    virtual StorageResult<void> Shutdown()   = 0;

    // Functional round trip deciding whether the tier is usable at all
    virtual StorageResult<void> Verify() = 0;

    // Core Operations
    // A key the tier does not hold is reported as StorageErrc::CacheMiss
    virtual StorageResult<TierEntry> Get(const std::string& key) = 0;
    virtual StorageResult<void> Put(
        const std::string& key, const CacheValue& value, std::int64_t ttl_seconds
    ) = 0;
    // Removing an absent key succeeds
    virtual StorageResult<void> Remove(const std::string& key) = 0;

    // Maintenance
    virtual StorageResult<void> Clear()                 = 0;
    virtual StorageResult<std::size_t> CleanupExpired() = 0;

    // Diagnostics
    virtual bool IsHealthy()              = 0;
    virtual nlohmann::json Stats() const = 0;
};

// Native multi-key operations of the network tiers. Results follow the order of the keys.
class IBatchOperations
{
    public:
    virtual ~IBatchOperations() = default;

    virtual StorageResult<std::vector<std::optional<TierEntry>>> GetMany(
        const std::vector<std::string>& keys
    ) = 0;
    virtual StorageResult<void> PutMany(
        const std::vector<std::pair<std::string, CacheValue>>& items, std::int64_t ttl_seconds
    ) = 0;
    virtual StorageResult<std::size_t> RemoveMany(const std::vector<std::string>& keys) = 0;
};

// Tiers that borrow network connections from a pool
class IPooledTier
{
    public:
    virtual ~IPooledTier() = default;

    virtual std::size_t CleanupIdleConnections() = 0;
    virtual nlohmann::json ConnectionStats() const = 0;
};

/// Writes a canary value, reads it back, compares and removes it.
StorageResult<void> VerifyRoundTrip(ICacheTier& tier);

}  // namespace TierCache::Tiers

#endif  // TIERCACHE_SRC_TIERS_I_CACHE_TIER_HPP_
