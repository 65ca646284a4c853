#include "tiers/local_cache_tier.hpp"

#include "storage/envelope.hpp"

#include <spdlog/spdlog.h>
#include <iterator>

namespace TierCache::Tiers
{

LocalCacheTier::LocalCacheTier(
    const Config::LocalCacheSettings& settings, std::string prefix,
    std::shared_ptr<const Utils::IClock> clock
)
    : settings_(settings), prefix_(std::move(prefix)), clock_(std::move(clock))
{
}

StorageResult<void> LocalCacheTier::Initialize() { return {}; }

StorageResult<void> LocalCacheTier::Shutdown() { return Clear(); }

StorageResult<void> LocalCacheTier::Verify() { return VerifyRoundTrip(*this); }

StorageResult<TierEntry> LocalCacheTier::Get(const std::string& key)
{
    std::lock_guard<std::mutex> lock(slots_mutex_);
    auto& index = slots_.get<by_key>();
    auto it     = index.find(prefix_ + key);
    if (it == index.end()) {
        return std::unexpected(make_error_code(StorageErrc::CacheMiss));
    }
    if (Storage::IsExpired(it->expires_at, clock_->Now())) {
        index.erase(it);
        return std::unexpected(make_error_code(StorageErrc::Expired));
    }
    return TierEntry{it->value, it->expires_at};
}

StorageResult<void> LocalCacheTier::Put(
    const std::string& key, const CacheValue& value, std::int64_t ttl_seconds
)
{
    const auto now        = clock_->Now();
    const auto expires_at = Storage::ComputeExpiry(now, ttl_seconds);
    const auto full_key   = prefix_ + key;

    std::lock_guard<std::mutex> lock(slots_mutex_);
    auto& index = slots_.get<by_key>();
    auto it     = index.find(full_key);
    if (it != index.end()) {
        index.modify(it, [&](Slot& slot) {
            slot.value      = value;
            slot.expires_at = expires_at;
            slot.sequence   = next_sequence_++;
        });
        return {};
    }

    if (slots_.size() >= settings_.max_entries) {
        MakeRoom_impl(now);
    }
    slots_.insert(Slot{full_key, value, expires_at, next_sequence_++});
    return {};
}

StorageResult<void> LocalCacheTier::Remove(const std::string& key)
{
    std::lock_guard<std::mutex> lock(slots_mutex_);
    slots_.get<by_key>().erase(prefix_ + key);
    return {};
}

StorageResult<void> LocalCacheTier::Clear()
{
    std::lock_guard<std::mutex> lock(slots_mutex_);
    slots_.clear();
    return {};
}

StorageResult<std::size_t> LocalCacheTier::CleanupExpired()
{
    std::lock_guard<std::mutex> lock(slots_mutex_);
    return RemoveExpired_impl(clock_->Now());
}

std::size_t LocalCacheTier::RemoveExpired_impl(std::time_t now)
{
    auto& index     = slots_.get<by_expiry>();
    auto last_stale = index.upper_bound(now);
    const auto removed =
        static_cast<std::size_t>(std::distance(index.begin(), last_stale));
    index.erase(index.begin(), last_stale);
    return removed;
}

void LocalCacheTier::MakeRoom_impl(std::time_t now)
{
    if (RemoveExpired_impl(now) > 0 && slots_.size() < settings_.max_entries) {
        return;
    }
    auto& index = slots_.get<by_sequence>();
    while (!index.empty() && slots_.size() >= settings_.max_entries) {
        spdlog::trace("Evicting local cache entry '{}'", index.begin()->key);
        index.erase(index.begin());
        evictions_++;
    }
}

std::size_t LocalCacheTier::Size() const
{
    std::lock_guard<std::mutex> lock(slots_mutex_);
    return slots_.size();
}

nlohmann::json LocalCacheTier::Stats() const
{
    return {
        {    "entries",              Size()},
        {"max_entries", settings_.max_entries},
        {  "evictions",   evictions_.load()},
    };
}

}  // namespace TierCache::Tiers
