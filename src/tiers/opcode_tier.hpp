#ifndef TIERCACHE_SRC_TIERS_OPCODE_TIER_HPP_
#define TIERCACHE_SRC_TIERS_OPCODE_TIER_HPP_

#include "config/config_types.hpp"
#include "tiers/i_cache_tier.hpp"
#include "utils/clock.hpp"

#include <sys/types.h>
#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace TierCache::Tiers
{

// Compiled artifact cache: <prefix><hash>.cache files published by rename, with the
// decoded form kept resident in the process until the file on disk changes
class OpcodeTier : public ICacheTier
{
    private:
    //------------------------------------------------------------------------------//
    // Internal Types
    //------------------------------------------------------------------------------//
    struct FileIdentity {
        ino_t inode          = 0;
        off_t size           = 0;
        std::int64_t mtime_ns = 0;

        bool operator==(const FileIdentity& other) const = default;
    };

    struct ResidentImage {
        FileIdentity identity;
        TierEntry entry;
    };

    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//
    OpcodeTier(
        const Config::OpcodeCacheSettings& settings, std::filesystem::path directory,
        std::shared_ptr<const Utils::IClock> clock
    );
    ~OpcodeTier() override = default;

    OpcodeTier(const OpcodeTier&)            = delete;
    OpcodeTier& operator=(const OpcodeTier&) = delete;
    OpcodeTier(OpcodeTier&&)                 = delete;
    OpcodeTier& operator=(OpcodeTier&&)      = delete;

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//

    // ICacheTier Implementation
    Config::Tier GetTier() const override { return Config::Tier::OpcodeCache; }

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
    std::size_t ResidentCount() const;

    private:
    //------------------------------------------------------------------------------//
    // Private Methods
    //------------------------------------------------------------------------------//
    bool IsOwnedFile(const std::filesystem::path& path) const;
    bool IsAbandonedTempFile(const std::filesystem::path& path) const;
    StorageResult<FileIdentity> StatIdentity(const std::filesystem::path& path) const;
    void Forget(const std::filesystem::path& path);

    //------------------------------------------------------------------------------//
    // Private Fields
    //------------------------------------------------------------------------------//
    const Config::OpcodeCacheSettings settings_;
    const std::filesystem::path directory_;
    std::shared_ptr<const Utils::IClock> clock_;

    mutable std::mutex resident_mutex_;
    std::unordered_map<std::string, ResidentImage> resident_;  ///< Keyed by file name

    std::atomic<std::uint64_t> resident_hits_{0};
    std::atomic<std::uint64_t> disk_loads_{0};
    std::atomic<std::uint64_t> unreported_expired_{0};
};

}  // namespace TierCache::Tiers

#endif  // TIERCACHE_SRC_TIERS_OPCODE_TIER_HPP_
