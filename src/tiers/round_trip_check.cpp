#include "tiers/i_cache_tier.hpp"

#include "app_constants.hpp"

#include <spdlog/spdlog.h>
#include <unistd.h>
#include <atomic>
#include <chrono>

namespace TierCache::Tiers
{

StorageResult<void> VerifyRoundTrip(ICacheTier& tier)
{
    static std::atomic<std::uint64_t> canary_counter{0};

    const std::string key = std::string(Constants::CANARY_KEY_PREFIX) + std::to_string(::getpid()) +
                            "_" + std::to_string(canary_counter++);
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const CacheValue canary = "canary_" + std::to_string(stamp);

    if (auto put = tier.Put(key, canary, 60); !put) {
        spdlog::debug("Canary write to tier '{}' failed: {}", tier.GetName(), put.error().message());
        return std::unexpected(put.error());
    }

    auto got = tier.Get(key);
    auto removed = tier.Remove(key);
    if (!removed) {
        spdlog::debug(
            "Canary cleanup on tier '{}' failed: {}", tier.GetName(), removed.error().message()
        );
    }

    if (!got) {
        spdlog::debug("Canary read from tier '{}' failed: {}", tier.GetName(), got.error().message());
        return std::unexpected(make_error_code(StorageErrc::TierUnavailable));
    }
    if (got->value != canary) {
        spdlog::debug("Canary read from tier '{}' returned a different value", tier.GetName());
        return std::unexpected(make_error_code(StorageErrc::TierUnavailable));
    }
    return {};
}

}  // namespace TierCache::Tiers
