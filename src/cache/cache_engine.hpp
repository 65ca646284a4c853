#ifndef TIERCACHE_SRC_CACHE_CACHE_ENGINE_HPP_
#define TIERCACHE_SRC_CACHE_CACHE_ENGINE_HPP_

#include "app_constants.hpp"
#include "cache/cache_stats.hpp"
#include "cache/last_error.hpp"
#include "cache/tier_registry.hpp"
#include "config/config_types.hpp"
#include "storage/cache_value.hpp"
#include "utils/clock.hpp"

#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace TierCache::Cache
{

using Storage::CacheValue;

/// Outcome of an operation aimed at an explicit set of tiers.
struct TierOperationReport {
    std::map<Config::Tier, bool> results;
    std::size_t succeeded = 0;
    std::size_t failed    = 0;
};

// Single logical cache over every tier that works on this host.
// Reads walk the tiers fastest first and promote hits, writes go to all of them.
class CacheEngine
{
    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//
    explicit CacheEngine(
        Config::CacheConfig config,
        std::shared_ptr<const Utils::IClock> clock = Utils::DefaultClock()
    );
    ~CacheEngine();

    CacheEngine(const CacheEngine&)            = delete;
    CacheEngine& operator=(const CacheEngine&) = delete;
    CacheEngine(CacheEngine&&)                 = delete;
    CacheEngine& operator=(CacheEngine&&)      = delete;

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//

    // Core Operations
    std::optional<CacheValue> Get(const std::string& key);
    bool Set(
        const std::string& key, const CacheValue& value,
        std::int64_t ttl_seconds = Constants::DEFAULT_TTL_SECONDS
    );
    bool Delete(const std::string& key);
    bool Clear();

    /// Removes expired entries from every tier and closes idle pooled connections.
    /// Returns the number of entries removed.
    std::size_t Cleanup();

    // Tier-targeted Operations (no promotion)
    std::optional<CacheValue> GetFromTier(const std::string& key, Config::Tier tier);
    bool SetToTier(
        const std::string& key, const CacheValue& value, std::int64_t ttl_seconds,
        Config::Tier tier
    );
    bool DeleteFromTier(const std::string& key, Config::Tier tier);
    TierOperationReport SetToTiers(
        const std::string& key, const CacheValue& value, std::int64_t ttl_seconds,
        const std::vector<Config::Tier>& tiers
    );
    TierOperationReport DeleteFromTiers(
        const std::string& key, const std::vector<Config::Tier>& tiers
    );
    std::optional<CacheValue> GetWithTierPreference(
        const std::string& key, Config::Tier tier, bool fallback = true
    );

    // Batch Operations, results in the order of the input
    std::vector<std::optional<CacheValue>> GetMany(const std::vector<std::string>& keys);
    std::vector<bool> SetMany(
        const std::vector<std::pair<std::string, CacheValue>>& items,
        std::int64_t ttl_seconds = Constants::DEFAULT_TTL_SECONDS
    );
    std::vector<bool> DeleteMany(const std::vector<std::string>& keys);

    // Status
    std::vector<Config::Tier> AvailableTiers();
    bool IsTierAvailable(Config::Tier tier);
    std::optional<Config::Tier> LastUsedTier() const;
    std::map<Config::Tier, bool> Health();
    std::optional<std::string> LastError() const;
    nlohmann::json TierStatus();
    nlohmann::json GetStats();
    nlohmann::json Debug();

    // Configuration
    /// Makes path writable and moves the filesystem tier there. False when it cannot.
    bool SetCachePath(const std::filesystem::path& path);
    std::filesystem::path GetCachePath();

    /// Applies a per-tier option map before discovery. Returns false once tiers are discovered.
    /// @throws Storage::StorageException when an option is malformed.
    bool ConfigureTier(Config::Tier tier, const nlohmann::json& options);
    bool SetConnectionPooling(bool enabled);

    Config::CacheConfig GetConfig() const;
    std::int64_t DefaultTtl() const;
    bool IsAsyncEnabled() const;

    /// Shuts every tier down. Later operations behave as if no tier is available.
    void Close();

    private:
    //------------------------------------------------------------------------------//
    // Private Methods
    //------------------------------------------------------------------------------//
    void EnsureDiscovered();
    std::vector<TierPtr> AvailableInOrder();
    TierPtr RequireTier(Config::Tier tier);
    void RejectEmptyValue(const std::string& key);

    void Promote(
        const std::string& key, const Storage::TierEntry& entry,
        const std::vector<TierPtr>& tiers, std::size_t serving_index
    );
    bool PutToTier(
        Tiers::ICacheTier& tier, const std::string& key, const CacheValue& value,
        std::int64_t ttl_seconds
    );
    bool RemoveFromTier(Tiers::ICacheTier& tier, const std::string& key);
    void RecordFailure(const Tiers::ICacheTier& tier, const std::error_code& ec);
    void SetLastUsed(Config::Tier tier);

    //------------------------------------------------------------------------------//
    // Private Fields
    //------------------------------------------------------------------------------//
    Config::CacheConfig config_;
    std::shared_ptr<const Utils::IClock> clock_;
    mutable std::mutex config_mutex_;  ///< Guards config_ and discovery

    Cache::LastError last_error_;
    CacheStats stats_;
    TierRegistry registry_;

    mutable std::mutex state_mutex_;
    std::optional<Config::Tier> last_used_;
};

}  // namespace TierCache::Cache

#endif  // TIERCACHE_SRC_CACHE_CACHE_ENGINE_HPP_
