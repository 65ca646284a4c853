#ifndef TIERCACHE_SRC_CACHE_TIER_REGISTRY_HPP_
#define TIERCACHE_SRC_CACHE_TIER_REGISTRY_HPP_

#include "cache/last_error.hpp"
#include "config/config_types.hpp"
#include "tiers/i_cache_tier.hpp"
#include "utils/clock.hpp"

#include <ctime>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace TierCache::Cache
{

namespace fs = std::filesystem;

using TierPtr = std::shared_ptr<Tiers::ICacheTier>;

struct TierAvailability {
    Config::Tier tier;
    bool available       = false;
    std::time_t checked_at = 0;
    std::string reason;  ///< Why the tier is unavailable
};

// Decides once which tiers work on this host and keeps them in priority order
class TierRegistry
{
    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//
    TierRegistry(
        const Config::CacheConfig& config, std::shared_ptr<const Utils::IClock> clock,
        LastError& last_error
    );
    ~TierRegistry();

    TierRegistry(const TierRegistry&)            = delete;
    TierRegistry& operator=(const TierRegistry&) = delete;
    TierRegistry(TierRegistry&&)                 = delete;
    TierRegistry& operator=(TierRegistry&&)      = delete;

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//

    /// Provisions the cache directory, then initializes and verifies every enabled tier.
    /// Only the first call does any work.
    void Discover();
    bool IsDiscovered() const;

    /// Snapshot of the available tiers, fastest first.
    std::vector<TierPtr> Available() const;
    std::vector<Config::Tier> AvailableTiers() const;
    TierPtr Find(Config::Tier tier) const;
    std::vector<TierAvailability> Availability() const;

    fs::path CacheDirectory() const;

    /// Points the filesystem tier at a new directory that is already writable.
    Storage::StorageResult<void> RelocateFilesystemTier(const fs::path& directory);

    /// Shuts every tier down and forgets them.
    void ShutdownAll();

    private:
    //------------------------------------------------------------------------------//
    // Private Methods
    //------------------------------------------------------------------------------//
    TierAvailability CheckTier(Tiers::ICacheTier& tier) const;

    //------------------------------------------------------------------------------//
    // Private Fields
    //------------------------------------------------------------------------------//
    const Config::CacheConfig& config_;
    std::shared_ptr<const Utils::IClock> clock_;
    LastError& last_error_;

    mutable std::mutex mutex_;
    bool discovered_  = false;
    bool discovering_ = false;
    std::vector<TierPtr> tiers_;
    std::vector<TierAvailability> availability_;
    fs::path cache_directory_;
};

}  // namespace TierCache::Cache

#endif  // TIERCACHE_SRC_CACHE_TIER_REGISTRY_HPP_
