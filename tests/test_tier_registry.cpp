#include "cache/tier_registry.hpp"
#include "storage/directory_provisioner.hpp"
#include "storage/posix_file.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <unistd.h>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

namespace TierCache
{

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using Config::Tier;

//------------------------------------------------------------------------------//
// Directory provisioning
//------------------------------------------------------------------------------//

TEST(DirectoryProvisionerTest, CandidatesStartWithConfiguredPath)
{
    Storage::DirectoryProvisioner provisioner(1, 0ms);
    const auto candidates = provisioner.Candidates("/srv/cache");

    ASSERT_GE(candidates.size(), 3U);
    EXPECT_EQ(candidates[0], fs::path("/srv/cache"));
    EXPECT_EQ(
        candidates[1], fs::temp_directory_path() / ("tiercache_" + std::to_string(::getpid()))
    );
    EXPECT_EQ(candidates[2], fs::current_path() / "cache");
}

TEST(DirectoryProvisionerTest, EmptyAndDuplicateCandidatesAreSkipped)
{
    Storage::DirectoryProvisioner provisioner(1, 0ms);
    const auto tmp_candidate =
        fs::temp_directory_path() / ("tiercache_" + std::to_string(::getpid()));

    const auto without_configured = provisioner.Candidates({});
    ASSERT_FALSE(without_configured.empty());
    EXPECT_EQ(without_configured[0], tmp_candidate);

    const auto duplicate = provisioner.Candidates(tmp_candidate);
    EXPECT_EQ(std::count(duplicate.begin(), duplicate.end(), tmp_candidate), 1);
}

TEST(DirectoryProvisionerTest, CreatesNestedDirectories)
{
    Testing::TempDir dir;
    Storage::DirectoryProvisioner provisioner(1, 0ms);
    const auto nested = dir.Path() / "a" / "b" / "c";

    ASSERT_TRUE(provisioner.EnsureWritable(nested));
    EXPECT_TRUE(Storage::DirectoryProvisioner::IsWritableDirectory(nested));
}

TEST(DirectoryProvisionerTest, RepairsReadOnlyDirectory)
{
    Testing::TempDir dir;
    const auto locked = dir.Path() / "locked";
    fs::create_directory(locked);
    fs::permissions(locked, fs::perms::owner_read | fs::perms::owner_exec);

    Storage::DirectoryProvisioner provisioner(1, 0ms);
    ASSERT_TRUE(provisioner.EnsureWritable(locked));
    EXPECT_TRUE(Storage::DirectoryProvisioner::IsWritableDirectory(locked));
}

TEST(DirectoryProvisionerTest, PathBelowRegularFileFails)
{
    Testing::TempDir dir;
    const auto file = dir.Path() / "plain";
    ASSERT_TRUE(Storage::WriteFileLocked(file, "x"));

    Storage::DirectoryProvisioner provisioner(2, 1ms);
    EXPECT_FALSE(provisioner.EnsureWritable(file / "sub"));
    EXPECT_FALSE(Storage::DirectoryProvisioner::IsWritableDirectory(file));
}

TEST(DirectoryProvisionerTest, ProvisionFallsBackWhenConfiguredPathIsUnusable)
{
    Testing::TempDir dir;
    const auto file = dir.Path() / "plain";
    ASSERT_TRUE(Storage::WriteFileLocked(file, "x"));

    Storage::DirectoryProvisioner provisioner(1, 0ms);
    auto chosen = provisioner.Provision(file);
    ASSERT_TRUE(chosen.has_value());
    EXPECT_NE(*chosen, file);
    EXPECT_TRUE(Storage::DirectoryProvisioner::IsWritableDirectory(*chosen));
}

TEST(DirectoryProvisionerTest, ExplicitFallbacksReplaceBuiltInOnes)
{
    Testing::TempDir dir;
    Storage::DirectoryProvisioner provisioner(1, 0ms, {dir.Path() / "spare", dir.Path() / "spare"});

    const auto candidates = provisioner.Candidates(dir.Path() / "main");
    ASSERT_EQ(candidates.size(), 2U);
    EXPECT_EQ(candidates[0], dir.Path() / "main");
    EXPECT_EQ(candidates[1], dir.Path() / "spare");
}

TEST(DirectoryProvisionerTest, ProvisionFailsWhenNoCandidateIsUsable)
{
    Testing::TempDir dir;
    const auto file = dir.Path() / "plain";
    ASSERT_TRUE(Storage::WriteFileLocked(file, "x"));

    Storage::DirectoryProvisioner provisioner(1, 0ms, {file / "a", file / "b"});
    auto chosen = provisioner.Provision(file / "main");
    ASSERT_FALSE(chosen.has_value());
}

//------------------------------------------------------------------------------//
// Tier discovery
//------------------------------------------------------------------------------//

class TierRegistryTest : public ::testing::Test
{
    protected:
    std::unique_ptr<Cache::TierRegistry> MakeRegistry(const Config::CacheConfig& config)
    {
        config_ = config;
        return std::make_unique<Cache::TierRegistry>(config_, clock_, last_error_);
    }

    static const Cache::TierAvailability& Of(
        const std::vector<Cache::TierAvailability>& all, Tier tier
    )
    {
        auto it = std::find_if(all.begin(), all.end(), [tier](const auto& a) {
            return a.tier == tier;
        });
        if (it == all.end()) {
            throw std::runtime_error("tier missing from availability");
        }
        return *it;
    }

    Testing::TempDir dir_;
    Config::CacheConfig config_;
    std::shared_ptr<Utils::ManualClock> clock_ = std::make_shared<Utils::ManualClock>(1700000000);
    Cache::LastError last_error_;
};

TEST_F(TierRegistryTest, AvailableTiersKeepPriorityOrder)
{
    auto registry = MakeRegistry(Testing::OnlyTiers(
        {Tier::Filesystem, Tier::LocalProcessCacheAlt, Tier::LocalProcessCache}, dir_.Path()
    ));
    EXPECT_FALSE(registry->IsDiscovered());
    registry->Discover();
    ASSERT_TRUE(registry->IsDiscovered());

    const std::vector<Tier> expected = {
        Tier::LocalProcessCache, Tier::LocalProcessCacheAlt, Tier::Filesystem
    };
    EXPECT_EQ(registry->AvailableTiers(), expected);
    EXPECT_EQ(registry->CacheDirectory(), dir_.Path());
    EXPECT_NE(registry->Find(Tier::Filesystem), nullptr);
    EXPECT_EQ(registry->Find(Tier::OpcodeCache), nullptr);
}

TEST_F(TierRegistryTest, DisabledTiersAreReportedWithReason)
{
    auto registry = MakeRegistry(Testing::OnlyTiers({Tier::Filesystem}, dir_.Path()));
    registry->Discover();

    const auto availability = registry->Availability();
    EXPECT_EQ(availability.size(), Config::ALL_TIERS.size());
    EXPECT_TRUE(Of(availability, Tier::Filesystem).available);
    EXPECT_EQ(Of(availability, Tier::Filesystem).checked_at, 1700000000);
    EXPECT_FALSE(Of(availability, Tier::NetworkKvStore).available);
    EXPECT_EQ(Of(availability, Tier::NetworkKvStore).reason, "disabled");
}

TEST_F(TierRegistryTest, UnreachableServerIsExcluded)
{
    auto config = Testing::OnlyTiers({Tier::NetworkKvStore, Tier::Filesystem}, dir_.Path());
    config.redis.host            = "127.0.0.1";
    config.redis.port            = 1;
    config.redis.retry_attempts  = 0;
    config.redis.retry_delay     = 1ms;
    config.redis.connect_timeout = 1s;
    auto registry                = MakeRegistry(config);
    registry->Discover();

    EXPECT_EQ(registry->AvailableTiers(), std::vector<Tier>{Tier::Filesystem});
    const auto& redis = Of(registry->Availability(), Tier::NetworkKvStore);
    EXPECT_FALSE(redis.available);
    EXPECT_FALSE(redis.reason.empty());
    EXPECT_NE(redis.reason, "disabled");
}

TEST_F(TierRegistryTest, DiscoveryRunsOnce)
{
    auto registry = MakeRegistry(Testing::OnlyTiers({Tier::LocalProcessCache}, dir_.Path()));
    registry->Discover();
    auto first = registry->Find(Tier::LocalProcessCache);
    ASSERT_NE(first, nullptr);

    registry->Discover();
    EXPECT_EQ(registry->Find(Tier::LocalProcessCache), first);
}

TEST_F(TierRegistryTest, UnwritableCachePathFallsBack)
{
    const auto file = dir_.Path() / "not_a_dir";
    ASSERT_TRUE(Storage::WriteFileLocked(file, "x"));

    auto registry = MakeRegistry(Testing::OnlyTiers({Tier::Filesystem}, file));
    registry->Discover();
    EXPECT_NE(registry->CacheDirectory(), file);
    EXPECT_NE(registry->Find(Tier::Filesystem), nullptr);
}

TEST_F(TierRegistryTest, FilesystemTierCanBeRelocated)
{
    auto registry = MakeRegistry(Testing::OnlyTiers({Tier::Filesystem}, dir_.Path() / "one"));
    registry->Discover();
    auto before = registry->Find(Tier::Filesystem);
    ASSERT_NE(before, nullptr);

    const auto target = dir_.Path() / "two";
    fs::create_directory(target);
    ASSERT_TRUE(registry->RelocateFilesystemTier(target));
    EXPECT_EQ(registry->CacheDirectory(), target);

    auto after = registry->Find(Tier::Filesystem);
    ASSERT_NE(after, nullptr);
    EXPECT_NE(after, before);
    ASSERT_TRUE(after->Put("moved", Storage::CacheValue(1), 60));
    EXPECT_FALSE(fs::is_empty(target));
}

TEST_F(TierRegistryTest, FilesystemTierIsDroppedWhenNoDirectoryIsWritable)
{
    const auto file = dir_.Path() / "not_a_dir";
    ASSERT_TRUE(Storage::WriteFileLocked(file, "x"));

    auto config = Testing::OnlyTiers({Tier::LocalProcessCache, Tier::Filesystem}, file / "main");
    config.global_settings.fallback_paths = {file / "tmp", file / "cwd"};
    auto registry = MakeRegistry(config);
    registry->Discover();

    EXPECT_EQ(registry->AvailableTiers(), std::vector<Tier>{Tier::LocalProcessCache});
    EXPECT_TRUE(registry->CacheDirectory().empty());
    EXPECT_FALSE(Of(registry->Availability(), Tier::Filesystem).available);
    EXPECT_EQ(last_error_.Get(), "Unable to create writable cache directory");
}

TEST_F(TierRegistryTest, RelocationRebuildsAFilesystemTierThatWasUnavailable)
{
    const auto file = dir_.Path() / "not_a_dir";
    ASSERT_TRUE(Storage::WriteFileLocked(file, "x"));

    auto config = Testing::OnlyTiers({Tier::LocalProcessCache, Tier::Filesystem}, file / "main");
    config.global_settings.fallback_paths = {file / "tmp"};
    auto registry = MakeRegistry(config);
    registry->Discover();
    ASSERT_EQ(registry->Find(Tier::Filesystem), nullptr);

    const auto target = dir_.Path() / "usable";
    fs::create_directory(target);
    ASSERT_TRUE(registry->RelocateFilesystemTier(target));

    const std::vector<Tier> expected = {Tier::LocalProcessCache, Tier::Filesystem};
    EXPECT_EQ(registry->AvailableTiers(), expected);
    EXPECT_TRUE(Of(registry->Availability(), Tier::Filesystem).available);
    EXPECT_EQ(registry->CacheDirectory(), target);
}

TEST_F(TierRegistryTest, RelocatingADisabledFilesystemTierOnlyRecordsThePath)
{
    auto registry = MakeRegistry(Testing::OnlyTiers({Tier::LocalProcessCache}, dir_.Path()));
    registry->Discover();

    ASSERT_TRUE(registry->RelocateFilesystemTier(dir_.Path()));
    EXPECT_EQ(registry->Find(Tier::Filesystem), nullptr);
    ASSERT_TRUE(last_error_.Get().has_value());
    EXPECT_NE(last_error_.Get()->find("Filesystem tier is disabled"), std::string::npos);
}

TEST_F(TierRegistryTest, ShutdownForgetsTiers)
{
    auto registry = MakeRegistry(Testing::OnlyTiers({Tier::LocalProcessCache}, dir_.Path()));
    registry->Discover();
    ASSERT_FALSE(registry->Available().empty());

    registry->ShutdownAll();
    EXPECT_TRUE(registry->Available().empty());
    EXPECT_TRUE(registry->IsDiscovered());
}

}  // namespace TierCache
