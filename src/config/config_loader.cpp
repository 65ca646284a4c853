#include "config/config_loader.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include <system_error>
#include "config/config_types.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <unordered_map>
#include <utility>

#define TRY_ASSIGN(target, json_obj, key, type)                            \
    try {                                                                  \
        if (json_obj.contains(key)) {                                      \
            target = json_obj.at(key).get<type>();                         \
        }                                                                  \
    } catch (const nlohmann::json::exception &e) {                         \
        spdlog::error("JSON parse error for key '{}': {}", key, e.what()); \
        return std::unexpected(LoadError::JsonParseError);                 \
    }

#define TRY_APPLY(expr)                                 \
    do {                                                \
        auto apply_res_ = (expr);                       \
        if (!apply_res_) {                              \
            return std::unexpected(apply_res_.error()); \
        }                                               \
    } while (0)

namespace TierCache::Config
{

// Parses a size string (e.g., "500MB", "2GB", "1024") into bytes.
// Returns std::nullopt if parsing fails.
std::optional<std::uint64_t> ParseSizeStringToBytes(const std::string &size_str)
{
    if (size_str.empty()) {
        return std::nullopt;
    }

    std::string num_part;
    std::string unit_part;

    size_t i = 0;
    while (i < size_str.length() && std::isdigit(static_cast<unsigned char>(size_str[i]))) {
        num_part += size_str[i];
        i++;
    }

    // Allow optional space between number and unit
    while (i < size_str.length() && std::isspace(static_cast<unsigned char>(size_str[i]))) {
        i++;
    }

    while (i < size_str.length() && std::isalpha(static_cast<unsigned char>(size_str[i]))) {
        unit_part += size_str[i];
        i++;
    }

    if (i < size_str.length()) {
        spdlog::warn("Invalid characters found after unit in size string: '{}'", size_str);
        return std::nullopt;
    }

    if (num_part.empty()) {
        spdlog::warn("No numeric part in size string: '{}'", size_str);
        return std::nullopt;
    }

    std::uint64_t value;
    auto conv_res = std::from_chars(num_part.data(), num_part.data() + num_part.length(), value);
    if (conv_res.ec != std::errc() || conv_res.ptr != num_part.data() + num_part.length()) {
        spdlog::warn("Failed to parse numeric part '{}' of size string: '{}'", num_part, size_str);
        return std::nullopt;
    }

    if (unit_part.empty()) {  // Assume bytes if no unit
        return value;
    }

    std::ranges::transform(unit_part, unit_part.begin(), [](unsigned char c) {
        return std::tolower(c);
    });

    static const std::unordered_map<std::string, std::uint64_t> unit_multipliers = {
        { "b",                           1},
        {"kb",                     1024ULL},
        { "k",                     1024ULL},
        {"mb",           1024ULL * 1024ULL},
        { "m",           1024ULL * 1024ULL},
        {"gb", 1024ULL * 1024ULL * 1024ULL},
        { "g", 1024ULL * 1024ULL * 1024ULL}
    };
    auto it = unit_multipliers.find(unit_part);
    if (it == unit_multipliers.end()) {
        spdlog::warn("Unknown size unit '{}' in string '{}'", unit_part, size_str);
        return std::nullopt;
    }
    if (value > std::numeric_limits<std::uint64_t>::max() / it->second) {
        spdlog::warn("Size string '{}' overflows a 64-bit byte count", size_str);
        return std::nullopt;
    }
    return value * it->second;
}

std::string LoadErrorToString(LoadError error)
{
    switch (error) {
        case LoadError::FileNotFound:
            return "File not found.";
        case LoadError::JsonParseError:
            return "JSON parsing failed.";
        case LoadError::ValidationError:
            return "Configuration validation failed.";
        default:
            return "Unknown error.";
    }
}

namespace
{

//------------------------------------------------------------------------------//
// Typed Option Readers
//------------------------------------------------------------------------------//

ApplyResult ReadSize(const nlohmann::json &obj, const char *key, std::size_t &target)
{
    if (!obj.contains(key)) {
        return {};
    }
    const auto &value = obj.at(key);
    if (value.is_number_unsigned() || (value.is_number_integer() && value.get<std::int64_t>() > 0)) {
        target = value.get<std::size_t>();
        return {};
    }
    if (value.is_string()) {
        auto parsed = ParseSizeStringToBytes(value.get<std::string>());
        if (parsed && *parsed > 0) {
            target = static_cast<std::size_t>(*parsed);
            return {};
        }
    }
    spdlog::error("'{}' must be a positive byte count or a size string", key);
    return std::unexpected(LoadError::ValidationError);
}

template <typename Int>
constexpr std::int64_t MaxRepresentable()
{
    constexpr auto int_max   = static_cast<std::uint64_t>(std::numeric_limits<Int>::max());
    constexpr auto int64_max = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    return static_cast<std::int64_t>(std::min(int_max, int64_max));
}

template <typename Int>
ApplyResult ReadBoundedInt(
    const nlohmann::json &obj, const char *key, Int &target, std::int64_t min,
    std::int64_t max = MaxRepresentable<Int>()
)
{
    if (!obj.contains(key)) {
        return {};
    }
    const auto &value = obj.at(key);
    if (!value.is_number_integer()) {
        spdlog::error("'{}' must be an integer", key);
        return std::unexpected(LoadError::JsonParseError);
    }
    const auto raw = value.get<std::int64_t>();
    if (raw < min || raw > max) {
        spdlog::error("'{}' value {} is outside [{}, {}]", key, raw, min, max);
        return std::unexpected(LoadError::ValidationError);
    }
    target = static_cast<Int>(raw);
    return {};
}

template <typename Duration>
ApplyResult ReadDuration(const nlohmann::json &obj, const char *key, Duration &target)
{
    std::int64_t count = target.count();
    TRY_APPLY(ReadBoundedInt(obj, key, count, 0));
    target = Duration(count);
    return {};
}

ApplyResult ReadPath(const nlohmann::json &obj, const char *key, std::filesystem::path &target)
{
    std::string path_str;
    if (!obj.contains(key)) {
        return {};
    }
    TRY_ASSIGN(path_str, obj, key, std::string);
    target = path_str;
    return {};
}

ApplyResult ReadPrefix(const nlohmann::json &obj, std::string &target)
{
    TRY_ASSIGN(target, obj, "prefix", std::string);
    return {};
}

//------------------------------------------------------------------------------//
// Per-Tier Option Maps
//------------------------------------------------------------------------------//

ApplyResult ApplyNetworkOptions(NetworkSettings &settings, const nlohmann::json &options)
{
    TRY_ASSIGN(settings.enabled, options, "enabled", bool);
    TRY_ASSIGN(settings.host, options, "host", std::string);
    TRY_APPLY(ReadBoundedInt(options, "port", settings.port, 1, 65535));
    TRY_APPLY(ReadPrefix(options, settings.prefix));
    TRY_ASSIGN(settings.persistent, options, "persistent", bool);
    TRY_APPLY(ReadBoundedInt(options, "retry_attempts", settings.retry_attempts, 0, 100));
    TRY_APPLY(ReadDuration(options, "retry_delay", settings.retry_delay));
    TRY_APPLY(ReadDuration(options, "connect_timeout", settings.connect_timeout));
    TRY_APPLY(ReadBoundedInt(options, "database", settings.database, 0, 1024));
    TRY_ASSIGN(settings.password, options, "password", std::string);
    TRY_APPLY(ReadBoundedInt(options, "min_connections", settings.pool.min_connections, 0));
    TRY_APPLY(ReadBoundedInt(options, "max_connections", settings.pool.max_connections, 1));
    TRY_APPLY(ReadDuration(options, "idle_timeout", settings.pool.idle_timeout));

    if (!settings.IsValid()) {
        spdlog::error("Network tier settings for {}:{} are invalid", settings.host, settings.port);
        return std::unexpected(LoadError::ValidationError);
    }
    return {};
}

ApplyResult ApplyOpcodeOptions(OpcodeCacheSettings &settings, const nlohmann::json &options)
{
    TRY_ASSIGN(settings.enabled, options, "enabled", bool);
    TRY_APPLY(ReadPrefix(options, settings.prefix));
    TRY_APPLY(ReadPath(options, "path", settings.path));
    TRY_APPLY(ReadPath(options, "base_path", settings.path));
    if (!settings.IsValid()) {
        spdlog::error("Compiled artifact cache prefix must not be empty");
        return std::unexpected(LoadError::ValidationError);
    }
    return {};
}

ApplyResult ApplySharedMemoryOptions(SharedMemorySettings &settings, const nlohmann::json &options)
{
    TRY_ASSIGN(settings.enabled, options, "enabled", bool);
    TRY_APPLY(ReadPrefix(options, settings.prefix));
    TRY_APPLY(ReadSize(options, "segment_size", settings.segment_size));
    TRY_APPLY(ReadBoundedInt(
        options, "base_key", settings.base_key, 1,
        static_cast<std::int64_t>(std::numeric_limits<std::int32_t>::max()) -
            static_cast<std::int64_t>(Constants::SHM_KEY_PARTITION_SIZE)
    ));
    TRY_APPLY(ReadPath(options, "base_path", settings.lock_path));
    TRY_APPLY(ReadPath(options, "lock_path", settings.lock_path));
    return {};
}

ApplyResult ApplyLocalCacheOptions(LocalCacheSettings &settings, const nlohmann::json &options)
{
    TRY_ASSIGN(settings.enabled, options, "enabled", bool);
    TRY_APPLY(ReadPrefix(options, settings.prefix));
    TRY_APPLY(ReadBoundedInt(options, "max_entries", settings.max_entries, 1));
    return {};
}

ApplyResult ApplyLocalAltCacheOptions(LocalAltCacheSettings &settings, const nlohmann::json &options)
{
    TRY_ASSIGN(settings.enabled, options, "enabled", bool);
    TRY_APPLY(ReadPrefix(options, settings.prefix));
    TRY_APPLY(ReadBoundedInt(options, "slots", settings.slots, 1));
    TRY_APPLY(ReadBoundedInt(options, "max_key_length", settings.max_key_length, 1));
    return {};
}

ApplyResult ApplyMmapOptions(MmapSettings &settings, const nlohmann::json &options)
{
    TRY_ASSIGN(settings.enabled, options, "enabled", bool);
    TRY_APPLY(ReadPrefix(options, settings.prefix));
    TRY_APPLY(ReadSize(options, "file_size", settings.file_size));
    TRY_APPLY(ReadPath(options, "base_path", settings.base_path));
    return {};
}

ApplyResult ApplyFileOptions(CacheConfig &config, const nlohmann::json &options)
{
    TRY_ASSIGN(config.file.enabled, options, "enabled", bool);
    TRY_APPLY(ReadPrefix(options, config.file.prefix));
    TRY_APPLY(ReadPath(options, "path", config.global_settings.cache_path));
    TRY_APPLY(ReadPath(options, "base_path", config.global_settings.cache_path));
    return {};
}

}  // namespace

ApplyResult ApplyTierOptions(CacheConfig &config, Tier tier, const nlohmann::json &options)
{
    if (!options.is_object()) {
        spdlog::error("Options for tier '{}' must be an object.", TierToString(tier));
        return std::unexpected(LoadError::ValidationError);
    }
    // Options land in a copy so a rejected key leaves the caller's config untouched
    CacheConfig next = config;
    try {
        switch (tier) {
            case Tier::OpcodeCache:
                TRY_APPLY(ApplyOpcodeOptions(next.opcache, options));
                break;
            case Tier::SharedMemory:
                TRY_APPLY(ApplySharedMemoryOptions(next.shmop, options));
                break;
            case Tier::LocalProcessCache:
                TRY_APPLY(ApplyLocalCacheOptions(next.apcu, options));
                break;
            case Tier::LocalProcessCacheAlt:
                TRY_APPLY(ApplyLocalAltCacheOptions(next.yac, options));
                break;
            case Tier::MemoryMappedFile:
                TRY_APPLY(ApplyMmapOptions(next.mmap, options));
                break;
            case Tier::NetworkKvStore:
                TRY_APPLY(ApplyNetworkOptions(next.redis, options));
                break;
            case Tier::NetworkCacheCluster:
                TRY_APPLY(ApplyNetworkOptions(next.memcached, options));
                break;
            case Tier::Filesystem:
                TRY_APPLY(ApplyFileOptions(next, options));
                break;
            default:
                return std::unexpected(LoadError::ValidationError);
        }
    } catch (const nlohmann::json::exception &e) {
        spdlog::error("JSON error in options for tier '{}': {}", TierToString(tier), e.what());
        return std::unexpected(LoadError::JsonParseError);
    }
    config = std::move(next);
    return {};
}

namespace
{

ApplyResult ApplyGlobalOptionsTo(GlobalSettings &settings, const nlohmann::json &options)
{

    std::string log_level_str;
    TRY_ASSIGN(log_level_str, options, "log_level", std::string);
    if (!log_level_str.empty()) {
        auto level_opt = StringToLogLevel(log_level_str);
        if (!level_opt) {
            spdlog::error(
                "Invalid 'log_level' value: {}. Using default '{}'.", log_level_str,
                spdlog::level::to_string_view(settings.log_level)
            );
        } else {
            settings.log_level = *level_opt;
        }
    }

    TRY_APPLY(ReadPath(options, "cache_path", settings.cache_path));
    if (options.contains("fallback_paths")) {
        std::vector<std::string> fallbacks;
        TRY_ASSIGN(fallbacks, options, "fallback_paths", std::vector<std::string>);
        settings.fallback_paths.assign(fallbacks.begin(), fallbacks.end());
    }
    if (options.contains("prefix")) {
        std::string prefix;
        TRY_ASSIGN(prefix, options, "prefix", std::string);
        settings.prefix = NormalizePrefix(std::move(prefix));
    }
    TRY_APPLY(ReadBoundedInt(options, "default_ttl", settings.default_ttl, 1));
    TRY_APPLY(ReadBoundedInt(options, "promotion_ttl", settings.promotion_ttl, 1));
    TRY_ASSIGN(settings.connection_pooling, options, "connection_pooling", bool);
    TRY_ASSIGN(settings.async, options, "async", bool);
    return {};
}

}  // namespace

ApplyResult ApplyGlobalOptions(GlobalSettings &settings, const nlohmann::json &options)
{
    if (!options.is_object()) {
        spdlog::error("'global' must be an object.");
        return std::unexpected(LoadError::ValidationError);
    }
    GlobalSettings next = settings;
    TRY_APPLY(ApplyGlobalOptionsTo(next, options));
    settings = std::move(next);
    return {};
}

LoadResult ParseConfig(const nlohmann::json &j)
{
    if (!j.is_object()) {
        spdlog::error("Configuration root must be an object.");
        return std::unexpected(LoadError::ValidationError);
    }

    CacheConfig config;

    if (j.contains("global")) {
        TRY_APPLY(ApplyGlobalOptions(config.global_settings, j.at("global")));
    }
    spdlog::info(
        "Global settings: log_level='{}', cache_path='{}', prefix='{}', pooling={}, async={}",
        spdlog::level::to_string_view(config.global_settings.log_level),
        config.global_settings.cache_path.string(), config.global_settings.prefix,
        config.global_settings.connection_pooling, config.global_settings.async
    );

    if (j.contains("tiers")) {
        const auto &tiers = j.at("tiers");
        if (!tiers.is_object()) {
            spdlog::error("'tiers' must be an object.");
            return std::unexpected(LoadError::ValidationError);
        }
        for (const auto &[name, options] : tiers.items()) {
            auto tier = StringToTier(name);
            if (!tier) {
                spdlog::warn("Ignoring options for unknown tier '{}'", name);
                continue;
            }
            TRY_APPLY(ApplyTierOptions(config, *tier, options));
            spdlog::debug("Applied options for tier '{}'", name);
        }
    }

    if (j.contains("warmers")) {
        if (!j.at("warmers").is_array()) {
            spdlog::error("'warmers' must be an array.");
            return std::unexpected(LoadError::ValidationError);
        }
        config.warmers = j.at("warmers");
    }

    if (!config.IsValid()) {
        spdlog::error("Overall cache configuration is invalid after parsing.");
        return std::unexpected(LoadError::ValidationError);
    }
    return config;
}

LoadResult loadConfigFromFile(const std::filesystem::path &file_path)
{
    spdlog::info("Attempting to load configuration from: {}", file_path.string());

    std::ifstream config_stream(file_path);
    if (!config_stream.is_open()) {
        spdlog::error("Failed to open config file: {}", file_path.string());
        return std::unexpected(LoadError::FileNotFound);
    }

    nlohmann::json j;
    try {
        config_stream >> j;
    } catch (const nlohmann::json::parse_error &e) {
        spdlog::error("Failed to parse JSON config file: {}", e.what());
        return std::unexpected(LoadError::JsonParseError);
    }

    auto config = ParseConfig(j);
    if (config) {
        spdlog::info("Configuration loaded successfully from {}", file_path.string());
    }
    return config;
}

LoadErrorMsg loadConfigFromFileVerbose(const std::filesystem::path &file_path)
{
    auto result = loadConfigFromFile(file_path);
    if (result.has_value()) {
        return result.value();
    }
    return std::unexpected(
        "Failed to load config (" + file_path.string() + "): " + LoadErrorToString(result.error())
    );
}

}  // namespace TierCache::Config
