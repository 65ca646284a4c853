#ifndef TIERCACHE_SRC_CONFIG_CONFIG_TYPES_HPP_
#define TIERCACHE_SRC_CONFIG_CONFIG_TYPES_HPP_

#include "app_constants.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace TierCache::Config
{

//------------------------------------------------------------------------------//
// Enumerations for Configuration Types
//------------------------------------------------------------------------------//

/// Storage tiers in priority order, fastest first.
enum class Tier : std::uint8_t {
    OpcodeCache = 0,
    SharedMemory,
    LocalProcessCache,
    LocalProcessCacheAlt,
    MemoryMappedFile,
    NetworkKvStore,
    NetworkCacheCluster,
    Filesystem,
};

constexpr std::array<Tier, 8> ALL_TIERS = {
    Tier::OpcodeCache,         Tier::SharedMemory,     Tier::LocalProcessCache,
    Tier::LocalProcessCacheAlt, Tier::MemoryMappedFile, Tier::NetworkKvStore,
    Tier::NetworkCacheCluster, Tier::Filesystem,
};

constexpr int TierPriority(Tier tier) { return static_cast<int>(tier); }

std::optional<Tier> StringToTier(const std::string &tier_str);
const char *TierToString(Tier tier);

// Function to convert string to spdlog::level::level_enum
std::optional<spdlog::level::level_enum> StringToLogLevel(const std::string &level_str);

//------------------------------------------------------------------------------//
// Structs for Configuration Types
//------------------------------------------------------------------------------//

struct PoolSettings {
    std::size_t min_connections       = 1;
    std::size_t max_connections       = 5;
    std::chrono::seconds idle_timeout = Constants::DEFAULT_IDLE_TIMEOUT;

    bool IsValid() const { return max_connections > 0 && min_connections <= max_connections; }
};

struct NetworkSettings {
    bool enabled = true;
    std::string host = std::string(Constants::DEFAULT_NETWORK_HOST);
    std::uint16_t port = 0;
    std::string prefix;  ///< Empty means the global prefix
    bool persistent    = true;
    int retry_attempts = Constants::DEFAULT_RETRY_ATTEMPTS;
    std::chrono::milliseconds retry_delay  = Constants::DEFAULT_RETRY_DELAY;
    std::chrono::seconds connect_timeout   = Constants::DEFAULT_CONNECT_TIMEOUT;
    int database = 0;  ///< Key-value store only
    std::string password;
    PoolSettings pool;

    bool IsValid() const
    {
        return !host.empty() && port != 0 && retry_attempts >= 0 && database >= 0 &&
               connect_timeout.count() > 0 && pool.IsValid();
    }
};

struct OpcodeCacheSettings {
    bool enabled = true;
    std::string prefix = std::string(Constants::DEFAULT_OPCODE_PREFIX);
    std::filesystem::path path;  ///< Empty means <cache_path>/opcache

    bool IsValid() const { return !prefix.empty(); }
};

struct SharedMemorySettings {
    bool enabled = true;
    std::string prefix;
    std::size_t segment_size = Constants::DEFAULT_SEGMENT_SIZE;
    std::int32_t base_key    = Constants::DEFAULT_SHM_BASE_KEY;
    std::filesystem::path lock_path;  ///< Empty means <tmp>/tiercache_shm_locks

    bool IsValid() const { return segment_size > 0 && base_key > 0; }
};

struct LocalCacheSettings {
    bool enabled = true;
    std::string prefix;
    std::size_t max_entries = Constants::DEFAULT_LOCAL_MAX_ENTRIES;

    bool IsValid() const { return max_entries > 0; }
};

struct LocalAltCacheSettings {
    bool enabled = true;
    std::string prefix;
    std::size_t slots          = Constants::DEFAULT_ALT_SLOTS;
    std::size_t max_key_length = Constants::DEFAULT_ALT_MAX_KEY_LEN;

    bool IsValid() const { return slots > 0 && max_key_length > 0; }
};

struct MmapSettings {
    bool enabled = true;
    std::string prefix;
    std::size_t file_size = Constants::DEFAULT_MMAP_FILESIZE;
    std::filesystem::path base_path;  ///< Empty means <cache_path>/mmap

    bool IsValid() const { return file_size > 0; }
};

struct FileSettings {
    bool enabled       = true;
    std::string prefix = std::string(Constants::DEFAULT_FILE_PREFIX);

    bool IsValid() const { return true; }
};

struct GlobalSettings {
    spdlog::level::level_enum log_level = Constants::DEFAULT_LOG_LEVEL;
    std::filesystem::path cache_path;  ///< Empty means the fallback candidates only
    std::vector<std::filesystem::path> fallback_paths;  ///< Empty means the built-in fallbacks
    std::string prefix          = std::string(Constants::DEFAULT_KEY_PREFIX);
    std::int64_t default_ttl    = Constants::DEFAULT_TTL_SECONDS;
    std::int64_t promotion_ttl  = Constants::DEFAULT_PROMOTION_TTL;
    bool connection_pooling     = true;
    bool async                  = false;

    bool IsValid() const { return default_ttl > 0 && promotion_ttl > 0; }
};

struct CacheConfig {
    GlobalSettings global_settings;
    OpcodeCacheSettings opcache;
    SharedMemorySettings shmop;
    LocalCacheSettings apcu;
    LocalAltCacheSettings yac;
    MmapSettings mmap;
    NetworkSettings redis     = DefaultRedisSettings();
    NetworkSettings memcached = DefaultMemcachedSettings();
    FileSettings file;
    nlohmann::json warmers = nlohmann::json::array();

    bool IsValid() const;
    bool IsTierEnabled(Tier tier) const;

    static NetworkSettings DefaultRedisSettings();
    static NetworkSettings DefaultMemcachedSettings();
};

/// Appends ':' to a non-empty prefix that does not already end in ':' or '_'.
std::string NormalizePrefix(std::string prefix);

//------------------------------------------------------------------------------//
// Implementation of Enum / Logging Conversion Functions
//------------------------------------------------------------------------------//

inline std::optional<spdlog::level::level_enum> StringToLogLevel(const std::string &level_str)
{
    if (level_str == "trace") {
        return spdlog::level::trace;
    }
    if (level_str == "debug") {
        return spdlog::level::debug;
    }
    if (level_str == "info") {
        return spdlog::level::info;
    }
    if (level_str == "warn") {
        return spdlog::level::warn;
    }
    if (level_str == "error") {
        return spdlog::level::err;
    }
    if (level_str == "fatal" || level_str == "critical") {
        return spdlog::level::critical;
    }
    if (level_str == "off") {
        return spdlog::level::off;
    }
    return std::nullopt;
}

inline std::optional<Tier> StringToTier(const std::string &tier_str)
{
    if (tier_str == "opcache") {
        return Tier::OpcodeCache;
    }
    if (tier_str == "shmop") {
        return Tier::SharedMemory;
    }
    if (tier_str == "apcu") {
        return Tier::LocalProcessCache;
    }
    if (tier_str == "yac") {
        return Tier::LocalProcessCacheAlt;
    }
    if (tier_str == "mmap") {
        return Tier::MemoryMappedFile;
    }
    if (tier_str == "redis") {
        return Tier::NetworkKvStore;
    }
    if (tier_str == "memcached") {
        return Tier::NetworkCacheCluster;
    }
    if (tier_str == "file") {
        return Tier::Filesystem;
    }
    return std::nullopt;
}

inline const char *TierToString(Tier tier)
{
    switch (tier) {
        case Tier::OpcodeCache:
            return "opcache";
        case Tier::SharedMemory:
            return "shmop";
        case Tier::LocalProcessCache:
            return "apcu";
        case Tier::LocalProcessCacheAlt:
            return "yac";
        case Tier::MemoryMappedFile:
            return "mmap";
        case Tier::NetworkKvStore:
            return "redis";
        case Tier::NetworkCacheCluster:
            return "memcached";
        case Tier::Filesystem:
            return "file";
        default:
            return "unknown";
    }
}

inline std::string NormalizePrefix(std::string prefix)
{
    if (!prefix.empty() && prefix.back() != ':' && prefix.back() != '_') {
        prefix.push_back(':');
    }
    return prefix;
}

inline NetworkSettings CacheConfig::DefaultRedisSettings()
{
    NetworkSettings settings;
    settings.port                 = Constants::DEFAULT_REDIS_PORT;
    settings.pool.min_connections = Constants::DEFAULT_REDIS_MIN_CONNECTIONS;
    settings.pool.max_connections = Constants::DEFAULT_REDIS_MAX_CONNECTIONS;
    return settings;
}

inline NetworkSettings CacheConfig::DefaultMemcachedSettings()
{
    NetworkSettings settings;
    settings.port                 = Constants::DEFAULT_MEMCACHED_PORT;
    settings.pool.min_connections = Constants::DEFAULT_MEMCACHED_MIN_CONNECTIONS;
    settings.pool.max_connections = Constants::DEFAULT_MEMCACHED_MAX_CONNECTIONS;
    return settings;
}

inline bool CacheConfig::IsValid() const
{
    return global_settings.IsValid() && opcache.IsValid() && shmop.IsValid() && apcu.IsValid() &&
           yac.IsValid() && mmap.IsValid() && redis.IsValid() && memcached.IsValid() &&
           file.IsValid();
}

inline bool CacheConfig::IsTierEnabled(Tier tier) const
{
    switch (tier) {
        case Tier::OpcodeCache:
            return opcache.enabled;
        case Tier::SharedMemory:
            return shmop.enabled;
        case Tier::LocalProcessCache:
            return apcu.enabled;
        case Tier::LocalProcessCacheAlt:
            return yac.enabled;
        case Tier::MemoryMappedFile:
            return mmap.enabled;
        case Tier::NetworkKvStore:
            return redis.enabled;
        case Tier::NetworkCacheCluster:
            return memcached.enabled;
        case Tier::Filesystem:
            return file.enabled;
        default:
            return false;
    }
}

}  // namespace TierCache::Config

#endif  // TIERCACHE_SRC_CONFIG_CONFIG_TYPES_HPP_
