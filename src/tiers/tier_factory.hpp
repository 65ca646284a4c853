#ifndef TIERCACHE_SRC_TIERS_TIER_FACTORY_HPP_
#define TIERCACHE_SRC_TIERS_TIER_FACTORY_HPP_

#include "config/config_types.hpp"
#include "tiers/i_cache_tier.hpp"
#include "utils/clock.hpp"

#include <filesystem>
#include <memory>

namespace TierCache::Tiers
{

// Builds the concrete tier for a configuration entry
class TierFactory
{
    public:
    TierFactory(const Config::CacheConfig& config, std::shared_ptr<const Utils::IClock> clock)
        : config_(config), clock_(std::move(clock))
    {
    }

    /// cache_directory is the provisioned filesystem directory the file based tiers
    /// fall back to when they have no path of their own. Returns nullptr when a tier
    /// needs that directory and it is empty.
    std::unique_ptr<ICacheTier> Create(
        Config::Tier tier, const std::filesystem::path& cache_directory
    ) const;

    /// The tier prefix when one is configured, the global prefix otherwise.
    std::string PrefixFor(const std::string& tier_prefix) const;

    private:
    const Config::CacheConfig& config_;
    std::shared_ptr<const Utils::IClock> clock_;
};

}  // namespace TierCache::Tiers

#endif  // TIERCACHE_SRC_TIERS_TIER_FACTORY_HPP_
