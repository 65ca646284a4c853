#ifndef TIERCACHE_SRC_WARMING_I_CACHE_WARMER_HPP_
#define TIERCACHE_SRC_WARMING_I_CACHE_WARMER_HPP_

#include <cstddef>
#include <string>

namespace TierCache::Cache
{
class CacheEngine;
}

namespace TierCache::Warming
{

// A source that pre-populates the cache
class ICacheWarmer
{
    public:
    virtual ~ICacheWarmer() = default;

    /// Stores this warmer's entries and returns how many were accepted.
    virtual std::size_t Warm(Cache::CacheEngine& engine) = 0;

    virtual const std::string& Name() const = 0;
    virtual bool IsApplicable() const       = 0;
};

}  // namespace TierCache::Warming

#endif  // TIERCACHE_SRC_WARMING_I_CACHE_WARMER_HPP_
