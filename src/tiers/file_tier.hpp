#ifndef TIERCACHE_SRC_TIERS_FILE_TIER_HPP_
#define TIERCACHE_SRC_TIERS_FILE_TIER_HPP_

#include "config/config_types.hpp"
#include "tiers/i_cache_tier.hpp"
#include "utils/clock.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>

namespace TierCache::Tiers
{

// One file per key, <prefix><hash>, holding the fixed-width expiry envelope
class FileTier : public ICacheTier
{
    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//
    FileTier(
        const Config::FileSettings& settings, std::string key_prefix,
        std::filesystem::path directory, std::shared_ptr<const Utils::IClock> clock
    );
    ~FileTier() override = default;

    FileTier(const FileTier&)            = delete;
    FileTier& operator=(const FileTier&) = delete;
    FileTier(FileTier&&)                 = delete;
    FileTier& operator=(FileTier&&)      = delete;

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//

    // ICacheTier Implementation
    Config::Tier GetTier() const override { return Config::Tier::Filesystem; }

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

    const std::filesystem::path& GetDirectory() const { return directory_; }
    std::filesystem::path PathForKey(const std::string& key) const;

    private:
    //------------------------------------------------------------------------------//
    // Private Methods
    //------------------------------------------------------------------------------//
    bool IsOwnedFile(const std::filesystem::path& path) const;

    //------------------------------------------------------------------------------//
    // Private Fields
    //------------------------------------------------------------------------------//
    const Config::FileSettings settings_;
    const std::string key_prefix_;  ///< Global key prefix, hashed together with the key
    const std::filesystem::path directory_;
    std::shared_ptr<const Utils::IClock> clock_;

    std::atomic<std::uint64_t> corrupt_removed_{0};
    std::atomic<std::uint64_t> expired_removed_{0};
    std::atomic<std::uint64_t> unreported_expired_{0};  ///< Removed on read, reported by the next cleanup
};

}  // namespace TierCache::Tiers

#endif  // TIERCACHE_SRC_TIERS_FILE_TIER_HPP_
