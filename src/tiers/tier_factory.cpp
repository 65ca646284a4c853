#include "tiers/tier_factory.hpp"

#include "tiers/file_tier.hpp"
#include "tiers/local_alt_cache_tier.hpp"
#include "tiers/local_cache_tier.hpp"
#include "tiers/memcached_tier.hpp"
#include "tiers/mmap_tier.hpp"
#include "tiers/opcode_tier.hpp"
#include "tiers/redis_tier.hpp"
#include "tiers/shm_tier.hpp"

namespace TierCache::Tiers
{

std::string TierFactory::PrefixFor(const std::string& tier_prefix) const
{
    return tier_prefix.empty() ? config_.global_settings.prefix : tier_prefix;
}

std::unique_ptr<ICacheTier> TierFactory::Create(
    Config::Tier tier, const std::filesystem::path& cache_directory
) const
{
    const bool pooling = config_.global_settings.connection_pooling;

    switch (tier) {
        case Config::Tier::OpcodeCache: {
            if (config_.opcache.path.empty() && cache_directory.empty()) {
                return nullptr;
            }
            const auto dir =
                config_.opcache.path.empty() ? cache_directory / "opcache" : config_.opcache.path;
            return std::make_unique<OpcodeTier>(config_.opcache, dir, clock_);
        }
        case Config::Tier::SharedMemory:
            return std::make_unique<ShmTier>(
                config_.shmop, PrefixFor(config_.shmop.prefix), config_.shmop.lock_path, clock_
            );
        case Config::Tier::LocalProcessCache:
            return std::make_unique<LocalCacheTier>(
                config_.apcu, PrefixFor(config_.apcu.prefix), clock_
            );
        case Config::Tier::LocalProcessCacheAlt:
            return std::make_unique<LocalAltCacheTier>(
                config_.yac, PrefixFor(config_.yac.prefix), clock_
            );
        case Config::Tier::MemoryMappedFile: {
            if (config_.mmap.base_path.empty() && cache_directory.empty()) {
                return nullptr;
            }
            const auto dir =
                config_.mmap.base_path.empty() ? cache_directory / "mmap" : config_.mmap.base_path;
            return std::make_unique<MmapTier>(
                config_.mmap, PrefixFor(config_.mmap.prefix), dir, clock_
            );
        }
        case Config::Tier::NetworkKvStore:
            return std::make_unique<RedisTier>(
                config_.redis, PrefixFor(config_.redis.prefix), pooling, clock_
            );
        case Config::Tier::NetworkCacheCluster:
            return std::make_unique<MemcachedTier>(
                config_.memcached, PrefixFor(config_.memcached.prefix), pooling, clock_
            );
        case Config::Tier::Filesystem:
            if (cache_directory.empty()) {
                return nullptr;
            }
            return std::make_unique<FileTier>(
                config_.file, config_.global_settings.prefix, cache_directory, clock_
            );
        default:
            return nullptr;
    }
}

}  // namespace TierCache::Tiers
