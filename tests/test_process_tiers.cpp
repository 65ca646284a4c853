#include "storage/key_hasher.hpp"
#include "tiers/local_alt_cache_tier.hpp"
#include "tiers/local_cache_tier.hpp"
#include "utils/clock.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <string>

namespace TierCache::Tiers
{

using namespace std::chrono_literals;

namespace
{

constexpr std::time_t kStart = 1700000000;

bool IsError(const StorageResult<TierEntry>& result, StorageErrc errc)
{
    return !result && result.error() == make_error_code(errc);
}

}  // namespace

//------------------------------------------------------------------------------//
// Local process cache
//------------------------------------------------------------------------------//

class LocalCacheTierTest : public ::testing::Test
{
    protected:
    void SetUp() override
    {
        clock_                = std::make_shared<Utils::ManualClock>(kStart);
        settings_.max_entries = 3;
        tier_ = std::make_unique<LocalCacheTier>(settings_, "TIERCACHE:", clock_);
        ASSERT_TRUE(tier_->Initialize());
    }

    Config::LocalCacheSettings settings_;
    std::shared_ptr<Utils::ManualClock> clock_;
    std::unique_ptr<LocalCacheTier> tier_;
};

TEST_F(LocalCacheTierTest, RoundTripCarriesExpiry)
{
    ASSERT_TRUE(tier_->Put("k", CacheValue{{"a", 1}}, 30));
    auto entry = tier_->Get("k");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->value["a"], 1);
    EXPECT_EQ(entry->expires_at, kStart + 30);
    EXPECT_TRUE(IsError(tier_->Get("other"), StorageErrc::CacheMiss));
}

TEST_F(LocalCacheTierTest, EntryExpiresAtDeadline)
{
    ASSERT_TRUE(tier_->Put("k", CacheValue(1), 30));
    clock_->Advance(29s);
    EXPECT_TRUE(tier_->Get("k").has_value());
    clock_->Advance(1s);
    EXPECT_TRUE(IsError(tier_->Get("k"), StorageErrc::Expired));
    EXPECT_EQ(tier_->Size(), 0U);
}

TEST_F(LocalCacheTierTest, FullCacheEvictsExpiredFirstThenOldest)
{
    ASSERT_TRUE(tier_->Put("a", CacheValue(1), 100));
    ASSERT_TRUE(tier_->Put("b", CacheValue(2), 5));
    ASSERT_TRUE(tier_->Put("c", CacheValue(3), 100));
    clock_->Advance(10s);

    ASSERT_TRUE(tier_->Put("d", CacheValue(4), 100));
    EXPECT_TRUE(tier_->Get("a").has_value());
    EXPECT_TRUE(IsError(tier_->Get("b"), StorageErrc::CacheMiss));

    ASSERT_TRUE(tier_->Put("e", CacheValue(5), 100));
    EXPECT_EQ(tier_->Size(), 3U);
    EXPECT_TRUE(IsError(tier_->Get("a"), StorageErrc::CacheMiss));
    EXPECT_TRUE(tier_->Get("e").has_value());
    EXPECT_EQ(tier_->Stats()["evictions"], 1);
}

TEST_F(LocalCacheTierTest, OverwriteRefreshesPosition)
{
    ASSERT_TRUE(tier_->Put("a", CacheValue(1), 100));
    ASSERT_TRUE(tier_->Put("b", CacheValue(2), 100));
    ASSERT_TRUE(tier_->Put("c", CacheValue(3), 100));
    ASSERT_TRUE(tier_->Put("a", CacheValue(10), 100));
    ASSERT_TRUE(tier_->Put("d", CacheValue(4), 100));

    auto a = tier_->Get("a");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->value, 10);
    EXPECT_TRUE(IsError(tier_->Get("b"), StorageErrc::CacheMiss));
}

TEST_F(LocalCacheTierTest, CleanupCountsExpired)
{
    ASSERT_TRUE(tier_->Put("a", CacheValue(1), 1));
    ASSERT_TRUE(tier_->Put("b", CacheValue(2), 1));
    ASSERT_TRUE(tier_->Put("c", CacheValue(3), 50));
    clock_->Advance(1s);

    auto removed = tier_->CleanupExpired();
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(*removed, 2U);
    EXPECT_EQ(tier_->Size(), 1U);

    ASSERT_TRUE(tier_->Remove("c"));
    ASSERT_TRUE(tier_->Remove("c"));
    EXPECT_EQ(tier_->Size(), 0U);
}

TEST_F(LocalCacheTierTest, PrefixSeparatesInstancesOnlyByName)
{
    LocalCacheTier other(settings_, "OTHER:", clock_);
    ASSERT_TRUE(other.Put("k", CacheValue(1), 10));
    EXPECT_TRUE(IsError(tier_->Get("k"), StorageErrc::CacheMiss));
    EXPECT_TRUE(other.Verify());
}

//------------------------------------------------------------------------------//
// Slot table cache
//------------------------------------------------------------------------------//

class LocalAltCacheTierTest : public ::testing::Test
{
    protected:
    void SetUp() override
    {
        clock_                   = std::make_shared<Utils::ManualClock>(kStart);
        settings_.slots          = 64;
        settings_.max_key_length = 16;
        tier_ = std::make_unique<LocalAltCacheTier>(settings_, "TC:", clock_);
        ASSERT_TRUE(tier_->Initialize());
    }

    Config::LocalAltCacheSettings settings_;
    std::shared_ptr<Utils::ManualClock> clock_;
    std::unique_ptr<LocalAltCacheTier> tier_;
};

TEST_F(LocalAltCacheTierTest, LongKeysAreHashed)
{
    EXPECT_EQ(tier_->StoredKey("short"), "TC:short");
    const std::string long_key = "this key is longer than sixteen";
    EXPECT_EQ(tier_->StoredKey(long_key), Storage::HashKey("TC:" + long_key));

    ASSERT_TRUE(tier_->Put(long_key, CacheValue("v"), 10));
    auto entry = tier_->Get(long_key);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->value, "v");
}

TEST_F(LocalAltCacheTierTest, CollidingKeyDisplacesOccupant)
{
    const auto target = tier_->SlotIndex(tier_->StoredKey("k0"));
    std::string rival;
    for (int i = 1; i < 10000 && rival.empty(); ++i) {
        const auto candidate = "k" + std::to_string(i);
        if (tier_->SlotIndex(tier_->StoredKey(candidate)) == target) {
            rival = candidate;
        }
    }
    ASSERT_FALSE(rival.empty());

    ASSERT_TRUE(tier_->Put("k0", CacheValue(0), 10));
    ASSERT_TRUE(tier_->Put(rival, CacheValue(1), 10));
    EXPECT_TRUE(IsError(tier_->Get("k0"), StorageErrc::CacheMiss));
    EXPECT_TRUE(tier_->Get(rival).has_value());
    EXPECT_EQ(tier_->Stats()["overwrites"], 1);

    // Removing the displaced key leaves the occupant alone
    ASSERT_TRUE(tier_->Remove("k0"));
    EXPECT_TRUE(tier_->Get(rival).has_value());
}

TEST_F(LocalAltCacheTierTest, ExpiryAndCleanup)
{
    ASSERT_TRUE(tier_->Put("a", CacheValue(1), 2));
    ASSERT_TRUE(tier_->Put("b", CacheValue(2), 20));
    clock_->Advance(2s);

    auto removed = tier_->CleanupExpired();
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(*removed, 1U);
    EXPECT_TRUE(tier_->Get("b").has_value());

    ASSERT_TRUE(tier_->Clear());
    EXPECT_TRUE(IsError(tier_->Get("b"), StorageErrc::CacheMiss));
}

TEST_F(LocalAltCacheTierTest, UnavailableAfterShutdown)
{
    EXPECT_TRUE(tier_->Verify());
    ASSERT_TRUE(tier_->Shutdown());
    EXPECT_FALSE(tier_->Verify());
    EXPECT_TRUE(IsError(tier_->Get("a"), StorageErrc::TierUnavailable));
    EXPECT_FALSE(tier_->Put("a", CacheValue(1), 10));
}

}  // namespace TierCache::Tiers
