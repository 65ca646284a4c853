#ifndef TIERCACHE_SRC_TIERS_MMAP_TIER_HPP_
#define TIERCACHE_SRC_TIERS_MMAP_TIER_HPP_

#include "config/config_types.hpp"
#include "tiers/i_cache_tier.hpp"
#include "utils/clock.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>

namespace TierCache::Tiers
{

// Fixed-size, NUL-padded <hash(prefix + key)>.mmap files written through MAP_SHARED mappings
class MmapTier : public ICacheTier
{
    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//
    MmapTier(
        const Config::MmapSettings& settings, std::string prefix, std::filesystem::path directory,
        std::shared_ptr<const Utils::IClock> clock
    );
    ~MmapTier() override = default;

    MmapTier(const MmapTier&)            = delete;
    MmapTier& operator=(const MmapTier&) = delete;
    MmapTier(MmapTier&&)                 = delete;
    MmapTier& operator=(MmapTier&&)      = delete;

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//

    // ICacheTier Implementation
    Config::Tier GetTier() const override { return Config::Tier::MemoryMappedFile; }

    StorageResult<void> Initialize() override;
    StorageResult<void> Shutdown() override;
    StorageResult<void> Verify() override;

    StorageResult<TierEntry> Get(const std::string& key) override;
    StorageResult<void> Put(
        const std::string& key, const CacheValue& value, std::int64_t ttl_seconds
    ) override;
    StorageResult<void> Remove(const std::string& key) override;

    StorageResult<void> Clear() override;
    StorageResult<std::size_t> CleanupExpired() override;

    bool IsHealthy() override;
    nlohmann::json Stats() const override;

    std::filesystem::path PathForKey(const std::string& key) const;

    private:
    //------------------------------------------------------------------------------//
    // Private Methods
    //------------------------------------------------------------------------------//
    bool IsOwnedFile(const std::filesystem::path& path) const;
    StorageResult<std::string> ReadMapped(const std::filesystem::path& path) const;

    //------------------------------------------------------------------------------//
    // Private Fields
    //------------------------------------------------------------------------------//
    const Config::MmapSettings settings_;
    const std::string prefix_;
    const std::filesystem::path directory_;
    std::shared_ptr<const Utils::IClock> clock_;

    std::atomic<std::uint64_t> bytes_mapped_{0};
    std::atomic<std::uint64_t> unreported_expired_{0};  ///< Removed on read since the last cleanup
};

}  // namespace TierCache::Tiers

#endif  // TIERCACHE_SRC_TIERS_MMAP_TIER_HPP_
