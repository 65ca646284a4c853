#include "tiers/local_alt_cache_tier.hpp"

#include "storage/envelope.hpp"
#include "storage/key_hasher.hpp"

#include <boost/container_hash/hash.hpp>
#include <spdlog/spdlog.h>

namespace TierCache::Tiers
{

LocalAltCacheTier::LocalAltCacheTier(
    const Config::LocalAltCacheSettings& settings, std::string prefix,
    std::shared_ptr<const Utils::IClock> clock
)
    : settings_(settings), prefix_(std::move(prefix)), clock_(std::move(clock))
{
}

std::string LocalAltCacheTier::StoredKey(const std::string& key) const
{
    auto stored = prefix_ + key;
    if (stored.size() > settings_.max_key_length) {
        stored = Storage::HashKey(stored);
    }
    return stored;
}

std::size_t LocalAltCacheTier::SlotIndex(const std::string& stored_key) const
{
    return boost::hash<std::string>{}(stored_key) % settings_.slots;
}

StorageResult<void> LocalAltCacheTier::Initialize()
{
    std::lock_guard<std::mutex> lock(slots_mutex_);
    slots_.assign(settings_.slots, std::nullopt);
    return {};
}

StorageResult<void> LocalAltCacheTier::Shutdown()
{
    std::lock_guard<std::mutex> lock(slots_mutex_);
    slots_.clear();
    slots_.shrink_to_fit();
    return {};
}

StorageResult<void> LocalAltCacheTier::Verify()
{
    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        if (slots_.size() != settings_.slots) {
            return std::unexpected(make_error_code(StorageErrc::TierUnavailable));
        }
    }
    return VerifyRoundTrip(*this);
}

StorageResult<TierEntry> LocalAltCacheTier::Get(const std::string& key)
{
    const auto stored = StoredKey(key);

    std::lock_guard<std::mutex> lock(slots_mutex_);
    if (slots_.empty()) {
        return std::unexpected(make_error_code(StorageErrc::TierUnavailable));
    }
    auto& slot = slots_[SlotIndex(stored)];
    if (!slot || slot->key != stored) {
        return std::unexpected(make_error_code(StorageErrc::CacheMiss));
    }
    if (Storage::IsExpired(slot->expires_at, clock_->Now())) {
        slot.reset();
        return std::unexpected(make_error_code(StorageErrc::Expired));
    }
    return TierEntry{slot->value, slot->expires_at};
}

StorageResult<void> LocalAltCacheTier::Put(
    const std::string& key, const CacheValue& value, std::int64_t ttl_seconds
)
{
    const auto stored     = StoredKey(key);
    const auto expires_at = Storage::ComputeExpiry(clock_->Now(), ttl_seconds);

    std::lock_guard<std::mutex> lock(slots_mutex_);
    if (slots_.empty()) {
        return std::unexpected(make_error_code(StorageErrc::TierUnavailable));
    }
    auto& slot = slots_[SlotIndex(stored)];
    if (slot && slot->key != stored) {
        spdlog::trace("Slot collision: '{}' displaces '{}'", stored, slot->key);
        overwrites_++;
    }
    slot = Slot{stored, value, expires_at};
    return {};
}

StorageResult<void> LocalAltCacheTier::Remove(const std::string& key)
{
    const auto stored = StoredKey(key);

    std::lock_guard<std::mutex> lock(slots_mutex_);
    if (slots_.empty()) {
        return {};
    }
    auto& slot = slots_[SlotIndex(stored)];
    if (slot && slot->key == stored) {
        slot.reset();
    }
    return {};
}

StorageResult<void> LocalAltCacheTier::Clear()
{
    std::lock_guard<std::mutex> lock(slots_mutex_);
    for (auto& slot : slots_) {
        slot.reset();
    }
    return {};
}

StorageResult<std::size_t> LocalAltCacheTier::CleanupExpired()
{
    const auto now = clock_->Now();

    std::lock_guard<std::mutex> lock(slots_mutex_);
    std::size_t removed = 0;
    for (auto& slot : slots_) {
        if (slot && Storage::IsExpired(slot->expires_at, now)) {
            slot.reset();
            removed++;
        }
    }
    return removed;
}

nlohmann::json LocalAltCacheTier::Stats() const
{
    std::size_t occupied = 0;
    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        for (const auto& slot : slots_) {
            if (slot) {
                occupied++;
            }
        }
    }
    return {
        {      "slots",    settings_.slots},
        {   "occupied",           occupied},
        { "overwrites", overwrites_.load()},
    };
}

}  // namespace TierCache::Tiers
