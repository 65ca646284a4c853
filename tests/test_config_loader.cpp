#include "config/config_loader.hpp"
#include "config/config_types.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <string>

namespace TierCache::Config
{

TEST(SizeStringTest, ParsesUnitsCaseInsensitively)
{
    EXPECT_EQ(ParseSizeStringToBytes("1024"), 1024U);
    EXPECT_EQ(ParseSizeStringToBytes("64k"), 64U * 1024U);
    EXPECT_EQ(ParseSizeStringToBytes("2 MB"), 2U * 1024U * 1024U);
    EXPECT_EQ(ParseSizeStringToBytes("1Gb"), 1024ULL * 1024ULL * 1024ULL);
    EXPECT_EQ(ParseSizeStringToBytes("10b"), 10U);
}

TEST(SizeStringTest, RejectsGarbage)
{
    EXPECT_FALSE(ParseSizeStringToBytes(""));
    EXPECT_FALSE(ParseSizeStringToBytes("MB"));
    EXPECT_FALSE(ParseSizeStringToBytes("12TB"));
    EXPECT_FALSE(ParseSizeStringToBytes("12MB!"));
    EXPECT_FALSE(ParseSizeStringToBytes("-5"));
    EXPECT_FALSE(ParseSizeStringToBytes("17179869184GB"));
    EXPECT_EQ(ParseSizeStringToBytes("17179869183GB"), 17179869183ULL * 1024ULL * 1024ULL * 1024ULL);
}

TEST(ConfigTypesTest, PrefixGetsSeparator)
{
    EXPECT_EQ(NormalizePrefix("app"), "app:");
    EXPECT_EQ(NormalizePrefix("app:"), "app:");
    EXPECT_EQ(NormalizePrefix("app_"), "app_");
    EXPECT_EQ(NormalizePrefix(""), "");
}

TEST(ConfigTypesTest, TierNamesRoundTripInPriorityOrder)
{
    int expected_priority = 0;
    for (Tier tier : ALL_TIERS) {
        EXPECT_EQ(TierPriority(tier), expected_priority++);
        auto parsed = StringToTier(TierToString(tier));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, tier);
    }
    EXPECT_STREQ(TierToString(Tier::OpcodeCache), "opcache");
    EXPECT_STREQ(TierToString(Tier::Filesystem), "file");
    EXPECT_FALSE(StringToTier("apc"));
}

TEST(ConfigTypesTest, DefaultsEnableEveryTier)
{
    CacheConfig config;
    EXPECT_TRUE(config.IsValid());
    for (Tier tier : ALL_TIERS) {
        EXPECT_TRUE(config.IsTierEnabled(tier)) << TierToString(tier);
    }
    EXPECT_EQ(config.redis.port, Constants::DEFAULT_REDIS_PORT);
    EXPECT_EQ(config.memcached.port, Constants::DEFAULT_MEMCACHED_PORT);
    EXPECT_EQ(config.redis.pool.max_connections, Constants::DEFAULT_REDIS_MAX_CONNECTIONS);
    EXPECT_EQ(config.global_settings.default_ttl, Constants::DEFAULT_TTL_SECONDS);
}

TEST(ConfigLoaderTest, ParsesGlobalAndTierSections)
{
    auto document = nlohmann::json::parse(R"({
        "global": {
            "log_level": "debug",
            "cache_path": "/tmp/tiercache",
            "prefix": "app",
            "default_ttl": 120,
            "connection_pooling": false,
            "async": true
        },
        "tiers": {
            "redis": {"host": "10.0.0.5", "port": 6380, "database": 2, "max_connections": 3},
            "mmap": {"file_size": "2MB"},
            "yac": {"enabled": false},
            "file": {"path": "/var/cache/app"}
        },
        "warmers": [{"type": "file", "sources": []}]
    })");

    auto config = ParseConfig(document);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->global_settings.log_level, spdlog::level::debug);
    EXPECT_EQ(config->global_settings.prefix, "app:");
    EXPECT_EQ(config->global_settings.default_ttl, 120);
    EXPECT_FALSE(config->global_settings.connection_pooling);
    EXPECT_TRUE(config->global_settings.async);
    EXPECT_EQ(config->redis.host, "10.0.0.5");
    EXPECT_EQ(config->redis.port, 6380);
    EXPECT_EQ(config->redis.database, 2);
    EXPECT_EQ(config->redis.pool.max_connections, 3U);
    EXPECT_EQ(config->mmap.file_size, 2U * 1024U * 1024U);
    EXPECT_FALSE(config->IsTierEnabled(Tier::LocalProcessCacheAlt));
    EXPECT_EQ(config->global_settings.cache_path, "/var/cache/app");
    EXPECT_EQ(config->warmers.size(), 1U);
}

TEST(ConfigLoaderTest, UnknownTierIsIgnored)
{
    auto config = ParseConfig(nlohmann::json::parse(R"({"tiers": {"xcache": {"enabled": true}}})"));
    EXPECT_TRUE(config.has_value());
}

TEST(ConfigLoaderTest, RejectsMalformedDocuments)
{
    EXPECT_EQ(ParseConfig(nlohmann::json::array()).error(), LoadError::ValidationError);
    EXPECT_EQ(
        ParseConfig(nlohmann::json::parse(R"({"tiers": []})")).error(), LoadError::ValidationError
    );
    EXPECT_EQ(
        ParseConfig(nlohmann::json::parse(R"({"warmers": {}})")).error(),
        LoadError::ValidationError
    );
    EXPECT_EQ(
        ParseConfig(nlohmann::json::parse(R"({"global": {"default_ttl": 0}})")).error(),
        LoadError::ValidationError
    );
}

TEST(ConfigLoaderTest, TierOptionsAreValidated)
{
    CacheConfig config;
    EXPECT_EQ(
        ApplyTierOptions(config, Tier::NetworkKvStore, nlohmann::json{{"port", 70000}}).error(),
        LoadError::ValidationError
    );
    EXPECT_EQ(
        ApplyTierOptions(config, Tier::NetworkKvStore, nlohmann::json{{"port", "6379"}}).error(),
        LoadError::JsonParseError
    );
    EXPECT_EQ(
        ApplyTierOptions(config, Tier::MemoryMappedFile, nlohmann::json{{"file_size", "lots"}})
            .error(),
        LoadError::ValidationError
    );
    EXPECT_EQ(
        ApplyTierOptions(config, Tier::SharedMemory, nlohmann::json::array()).error(),
        LoadError::ValidationError
    );

    // Rejected options leave earlier values in place
    EXPECT_EQ(config.redis.port, Constants::DEFAULT_REDIS_PORT);
}

TEST(ConfigLoaderTest, RejectedTierOptionsApplyNothing)
{
    CacheConfig config;
    const auto host = config.redis.host;
    EXPECT_FALSE(ApplyTierOptions(
        config, Tier::NetworkKvStore, nlohmann::json{{"host", "elsewhere.example"}, {"port", 0}}
    ));
    EXPECT_EQ(config.redis.host, host);

    GlobalSettings global;
    EXPECT_FALSE(
        ApplyGlobalOptions(global, nlohmann::json{{"prefix", "other"}, {"default_ttl", 0}})
    );
    EXPECT_EQ(global.prefix, GlobalSettings{}.prefix);
}

TEST(ConfigLoaderTest, TierOptionsKeepUnspecifiedValues)
{
    CacheConfig config;
    ASSERT_TRUE(ApplyTierOptions(
        config, Tier::NetworkCacheCluster,
        nlohmann::json{{"host", "cache.local"}, {"retry_delay", 250}, {"unknown", 1}}
    ));
    EXPECT_EQ(config.memcached.host, "cache.local");
    EXPECT_EQ(config.memcached.retry_delay, std::chrono::milliseconds(250));
    EXPECT_EQ(config.memcached.port, Constants::DEFAULT_MEMCACHED_PORT);
}

TEST(ConfigLoaderTest, LoadsFromFile)
{
    Testing::TempDir dir;
    const auto path = dir.Path() / "config.json";
    {
        std::ofstream out(path);
        out << R"({"global": {"prefix": "svc_"}})";
    }
    auto config = loadConfigFromFile(path);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->global_settings.prefix, "svc_");

    EXPECT_EQ(loadConfigFromFile(dir.Path() / "missing.json").error(), LoadError::FileNotFound);

    {
        std::ofstream out(path, std::ios::trunc);
        out << "{ not json";
    }
    EXPECT_EQ(loadConfigFromFile(path).error(), LoadError::JsonParseError);

    auto verbose = loadConfigFromFileVerbose(dir.Path() / "missing.json");
    ASSERT_FALSE(verbose.has_value());
    EXPECT_NE(verbose.error().find("File not found."), std::string::npos);
}

}  // namespace TierCache::Config
