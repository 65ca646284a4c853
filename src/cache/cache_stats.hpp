#ifndef TIERCACHE_SRC_CACHE_CACHE_STATS_HPP_
#define TIERCACHE_SRC_CACHE_CACHE_STATS_HPP_

#include "config/config_types.hpp"

#include <nlohmann/json.hpp>
#include <array>
#include <atomic>
#include <cstdint>

namespace TierCache::Cache
{

class CacheStats
{
    public:
    CacheStats() = default;

    void IncrementHits(Config::Tier tier)
    {
        hits_++;
        tier_hits_[static_cast<std::size_t>(tier)]++;
    }
    uint64_t GetHits() const { return hits_.load(); }
    uint64_t GetTierHits(Config::Tier tier) const
    {
        return tier_hits_[static_cast<std::size_t>(tier)].load();
    }

    void IncrementMisses() { misses_++; }
    uint64_t GetMisses() const { return misses_.load(); }

    void IncrementSets() { sets_++; }
    uint64_t GetSets() const { return sets_.load(); }

    void IncrementSetFailures() { set_failures_++; }
    uint64_t GetSetFailures() const { return set_failures_.load(); }

    void IncrementDeletes() { deletes_++; }
    uint64_t GetDeletes() const { return deletes_.load(); }

    void IncrementPromotions() { promotions_++; }
    uint64_t GetPromotions() const { return promotions_.load(); }

    void AddItemsExpired(uint64_t count) { items_expired_ += count; }
    uint64_t GetItemsExpired() const { return items_expired_.load(); }

    nlohmann::json ToJson() const
    {
        nlohmann::json tier_hits = nlohmann::json::object();
        for (const auto tier : Config::ALL_TIERS) {
            tier_hits[Config::TierToString(tier)] = GetTierHits(tier);
        }
        return {
            {         "hits",        GetHits()},
            {       "misses",      GetMisses()},
            {         "sets",        GetSets()},
            { "set_failures", GetSetFailures()},
            {      "deletes",      GetDeletes()},
            {   "promotions",   GetPromotions()},
            {"items_expired", GetItemsExpired()},
            {    "tier_hits",         tier_hits},
        };
    }

    private:
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> sets_{0};
    std::atomic<uint64_t> set_failures_{0};
    std::atomic<uint64_t> deletes_{0};
    std::atomic<uint64_t> promotions_{0};
    std::atomic<uint64_t> items_expired_{0};
    std::array<std::atomic<uint64_t>, Config::ALL_TIERS.size()> tier_hits_{};
};

}  // namespace TierCache::Cache

#endif  // TIERCACHE_SRC_CACHE_CACHE_STATS_HPP_
