#ifndef TIERCACHE_SRC_ASYNC_ASYNC_CACHE_HPP_
#define TIERCACHE_SRC_ASYNC_ASYNC_CACHE_HPP_

#include "app_constants.hpp"
#include "async/promise.hpp"
#include "async/scheduler.hpp"
#include "cache/cache_engine.hpp"

#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace TierCache::Async
{

using Cache::CacheValue;

/// One step of a pipelined batch.
struct PipelineOperation {
    enum class Kind { Get, Set, Delete, GetFromTier, SetToTier, DeleteFromTier };

    Kind kind = Kind::Get;
    std::string key;
    CacheValue value;
    std::int64_t ttl_seconds = Constants::DEFAULT_TTL_SECONDS;
    Config::Tier tier        = Config::Tier::Filesystem;

    static PipelineOperation Get(std::string key);
    static PipelineOperation Set(
        std::string key, CacheValue value,
        std::int64_t ttl_seconds = Constants::DEFAULT_TTL_SECONDS
    );
    static PipelineOperation Delete(std::string key);
    static PipelineOperation GetFromTier(std::string key, Config::Tier tier);
    static PipelineOperation SetToTier(
        std::string key, CacheValue value, std::int64_t ttl_seconds, Config::Tier tier
    );
    static PipelineOperation DeleteFromTier(std::string key, Config::Tier tier);
};

// Promise-returning facade over a CacheEngine. With a scheduler and async enabled every
// operation runs on the next tick, otherwise inline with an already settled promise.
// Queued tasks reference only the engine, so the facade may go away before the scheduler
// runs them; the engine must not.
class AsyncCache
{
    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//
    explicit AsyncCache(Cache::CacheEngine& engine, IScheduler* scheduler = nullptr);
    ~AsyncCache() = default;

    AsyncCache(const AsyncCache&)            = delete;
    AsyncCache& operator=(const AsyncCache&) = delete;

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//
    void EnableAsync(IScheduler& scheduler);
    void DisableAsync();
    bool IsAsyncEnabled() const;

    Promise<std::optional<CacheValue>> GetAsync(const std::string& key);
    Promise<bool> SetAsync(
        const std::string& key, const CacheValue& value,
        std::int64_t ttl_seconds = Constants::DEFAULT_TTL_SECONDS
    );
    Promise<bool> DeleteAsync(const std::string& key);
    Promise<bool> ClearAsync();
    Promise<std::size_t> CleanupAsync();

    Promise<std::optional<CacheValue>> GetFromTierAsync(
        const std::string& key, Config::Tier tier
    );
    Promise<bool> SetToTierAsync(
        const std::string& key, const CacheValue& value, std::int64_t ttl_seconds,
        Config::Tier tier
    );
    Promise<bool> DeleteFromTierAsync(const std::string& key, Config::Tier tier);
    Promise<Cache::TierOperationReport> SetToTiersAsync(
        const std::string& key, const CacheValue& value, std::int64_t ttl_seconds,
        const std::vector<Config::Tier>& tiers
    );
    Promise<Cache::TierOperationReport> DeleteFromTiersAsync(
        const std::string& key, const std::vector<Config::Tier>& tiers
    );
    Promise<std::optional<CacheValue>> GetWithTierPreferenceAsync(
        const std::string& key, Config::Tier tier, bool fallback = true
    );

    Promise<std::vector<std::optional<CacheValue>>> GetBatchAsync(
        const std::vector<std::string>& keys
    );
    Promise<std::vector<bool>> SetBatchAsync(
        const std::vector<std::pair<std::string, CacheValue>>& items,
        std::int64_t ttl_seconds = Constants::DEFAULT_TTL_SECONDS
    );
    Promise<std::vector<bool>> DeleteBatchAsync(const std::vector<std::string>& keys);

    /// Runs every operation and collects the results in order: the value or null for
    /// reads, a boolean for writes and deletes.
    Promise<std::vector<nlohmann::json>> PipelineAsync(
        const std::vector<PipelineOperation>& operations
    );

    private:
    //------------------------------------------------------------------------------//
    // Private Methods
    //------------------------------------------------------------------------------//
    template <typename T, typename Op>
    Promise<T> Run(Op operation)
    {
        Promise<T> promise;
        auto task = [promise, operation = std::move(operation)]() {
            try {
                promise.Resolve(operation());
            } catch (...) {
                promise.Reject(std::current_exception());
            }
        };

        IScheduler* scheduler = IsAsyncEnabled() ? scheduler_ : nullptr;
        if (scheduler) {
            scheduler->Defer(std::move(task));
        } else {
            task();
        }
        return promise;
    }

    //------------------------------------------------------------------------------//
    // Private Fields
    //------------------------------------------------------------------------------//
    Cache::CacheEngine& engine_;
    IScheduler* scheduler_ = nullptr;  ///< Not owned
    bool enabled_          = false;
};

}  // namespace TierCache::Async

#endif  // TIERCACHE_SRC_ASYNC_ASYNC_CACHE_HPP_
