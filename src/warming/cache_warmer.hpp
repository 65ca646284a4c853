#ifndef TIERCACHE_SRC_WARMING_CACHE_WARMER_HPP_
#define TIERCACHE_SRC_WARMING_CACHE_WARMER_HPP_

#include "async/promise.hpp"
#include "async/scheduler.hpp"
#include "utils/clock.hpp"
#include "warming/i_cache_warmer.hpp"

#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <ctime>
#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace TierCache::Warming
{

struct WarmResult {
    std::size_t count        = 0;
    std::int64_t duration_ms = 0;
};

struct WarmerStats {
    std::uint64_t runs             = 0;
    std::uint64_t total_items      = 0;
    std::int64_t total_duration_ms = 0;
    std::time_t last_run           = 0;  ///< Unix seconds
};

using WarmResults = std::map<std::string, WarmResult>;

// Registry of warmers with per-warmer run statistics.
// Deferred warming keeps the registry's statistics alive on its own, but the engine passed
// to WarmAllAsync must outlive every task still queued on the scheduler.
class CacheWarmer
{
    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//
    explicit CacheWarmer(std::shared_ptr<const Utils::IClock> clock = Utils::DefaultClock());

    CacheWarmer(const CacheWarmer&)            = delete;
    CacheWarmer& operator=(const CacheWarmer&) = delete;

    /// Builds the warmers listed in a "warmers" configuration array.
    /// @throws Storage::StorageException when an entry is malformed.
    static std::unique_ptr<CacheWarmer> FromConfig(
        const nlohmann::json& warmers, std::int64_t default_ttl,
        std::shared_ptr<const Utils::IClock> clock = Utils::DefaultClock()
    );

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//

    /// Adds a warmer, replacing one with the same name.
    void AddWarmer(std::shared_ptr<ICacheWarmer> warmer);
    bool RemoveWarmer(const std::string& name);
    std::vector<std::string> WarmerNames() const;

    /// Runs every applicable warmer in registration order.
    WarmResults WarmAll(Cache::CacheEngine& engine);

    /// Runs a single warmer. Fails when it is unknown or not applicable.
    std::expected<WarmResult, std::string> WarmWith(
        Cache::CacheEngine& engine, const std::string& name
    );

    /// Defers each applicable warmer to the scheduler and settles when all have run.
    Async::Promise<WarmResults> WarmAllAsync(
        Cache::CacheEngine& engine, Async::IScheduler& scheduler
    );

    std::map<std::string, WarmerStats> Stats() const;
    nlohmann::json StatsJson() const;
    void ResetStats();

    private:
    //------------------------------------------------------------------------------//
    // Private Methods
    //------------------------------------------------------------------------------//
    struct StatsLedger {
        std::mutex mutex;
        std::map<std::string, WarmerStats> entries;
    };

    static WarmResult Run(
        ICacheWarmer& warmer, Cache::CacheEngine& engine, StatsLedger& ledger,
        const Utils::IClock& clock
    );
    std::shared_ptr<ICacheWarmer> Find(const std::string& name) const;

    //------------------------------------------------------------------------------//
    // Private Fields
    //------------------------------------------------------------------------------//
    std::shared_ptr<const Utils::IClock> clock_;
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<ICacheWarmer>> warmers_;
    std::shared_ptr<StatsLedger> stats_ = std::make_shared<StatsLedger>();
};

}  // namespace TierCache::Warming

#endif  // TIERCACHE_SRC_WARMING_CACHE_WARMER_HPP_
