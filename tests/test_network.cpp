#include "pool/connection_pool.hpp"
#include "storage/key_hasher.hpp"
#include "test_support.hpp"
#include "tiers/memcached_tier.hpp"
#include "tiers/redis_tier.hpp"
#include "utils/clock.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace TierCache
{

using namespace std::chrono_literals;
using Storage::CacheValue;
using Storage::make_error_code;
using Storage::StorageErrc;

namespace
{

constexpr std::time_t kStart = 1700000000;

Config::NetworkSettings LoopbackSettings(std::uint16_t port)
{
    Config::NetworkSettings settings;
    settings.host           = "127.0.0.1";
    settings.port           = port;
    settings.retry_attempts = 1;
    settings.retry_delay    = 1ms;
    settings.connect_timeout = 1s;
    settings.pool.min_connections = 1;
    settings.pool.max_connections = 2;
    return settings;
}

}  // namespace

//------------------------------------------------------------------------------//
// RESP wire format used by the loopback server
//------------------------------------------------------------------------------//

TEST(RespWireTest, EncodesCommandAsBulkArray)
{
    EXPECT_EQ(
        Testing::EncodeCommand({"SET", "k", "v"}), "*3\r\n$3\r\nSET\r\n$1\r\nk\r\n$1\r\nv\r\n"
    );
    EXPECT_EQ(Testing::EncodeBulk(""), "$0\r\n\r\n");
    EXPECT_EQ(Testing::EncodeNull(), "$-1\r\n");
    EXPECT_EQ(Testing::EncodeInteger(-3), ":-3\r\n");
}

TEST(RespWireTest, ParsesAcrossPartialFeeds)
{
    Testing::RespParser parser;
    const std::string wire = "*2\r\n$5\r\nhello\r\n:42\r\n+OK\r\n";

    parser.Feed(wire.substr(0, 9));
    auto first = parser.Next();
    ASSERT_TRUE(first.has_value());
    EXPECT_FALSE(first->has_value());

    parser.Feed(wire.substr(9));
    auto array = parser.Next();
    ASSERT_TRUE(array.has_value() && array->has_value());
    ASSERT_EQ((*array)->type, Net::RespValue::Type::Array);
    ASSERT_EQ((*array)->elements.size(), 2U);
    EXPECT_EQ((*array)->elements[0].text, "hello");
    EXPECT_EQ((*array)->elements[1].integer, 42);

    auto ok = parser.Next();
    ASSERT_TRUE(ok.has_value() && ok->has_value());
    EXPECT_TRUE((*ok)->IsOk());
    EXPECT_EQ(parser.Buffered(), 0U);
}

TEST(RespWireTest, BinarySafeBulkAndNulls)
{
    Testing::RespParser parser;
    const std::string payload("a\r\nb\0c", 6);
    parser.Feed(Testing::EncodeBulk(payload) + Testing::EncodeNull() + "-ERR nope\r\n");

    auto bulk = parser.Next();
    ASSERT_TRUE(bulk.has_value() && bulk->has_value());
    EXPECT_EQ((*bulk)->text, payload);

    auto null = parser.Next();
    ASSERT_TRUE(null.has_value() && null->has_value());
    EXPECT_TRUE((*null)->IsNull());

    auto error = parser.Next();
    ASSERT_TRUE(error.has_value() && error->has_value());
    EXPECT_TRUE((*error)->IsError());
    EXPECT_EQ((*error)->text, "ERR nope");
}

TEST(RespWireTest, MalformedInputIsProtocolError)
{
    for (const char* wire : {"?what\r\n", ":12x\r\n", "$3\r\nabcd\r\n", "$-7\r\n"}) {
        Testing::RespParser parser;
        parser.Feed(wire);
        auto next = parser.Next();
        ASSERT_FALSE(next.has_value()) << wire;
        EXPECT_EQ(next.error(), make_error_code(StorageErrc::ProtocolError));
        EXPECT_EQ(parser.Buffered(), 0U);
    }
}

TEST(RespWireTest, CommandViewNeedsStringElements)
{
    Testing::RespParser parser;
    parser.Feed(Testing::EncodeCommand({"GET", "key"}) + "*1\r\n:1\r\n");

    auto command = parser.Next();
    ASSERT_TRUE(command.has_value() && command->has_value());
    auto args = Testing::AsCommand(**command);
    ASSERT_TRUE(args.has_value());
    EXPECT_EQ(*args, (std::vector<std::string>{"GET", "key"}));

    auto integers = parser.Next();
    ASSERT_TRUE(integers.has_value() && integers->has_value());
    EXPECT_FALSE(Testing::AsCommand(**integers).has_value());
}

//------------------------------------------------------------------------------//
// Connection pool
//------------------------------------------------------------------------------//

namespace
{

class FakeConnection : public Net::INetworkConnection
{
    public:
    explicit FakeConnection(std::shared_ptr<std::atomic<bool>> healthy)
        : healthy_(std::move(healthy))
    {
    }

    Storage::StorageResult<void> Ping() override
    {
        if (!healthy_->load()) {
            return std::unexpected(make_error_code(StorageErrc::ConnectionFailed));
        }
        return {};
    }
    bool IsOpen() const override { return open_; }
    void Close() override { open_ = false; }

    private:
    std::shared_ptr<std::atomic<bool>> healthy_;
    bool open_ = true;
};

class ConnectionPoolTest : public ::testing::Test
{
    protected:
    Pool::ConnectionFactory Factory()
    {
        return [this]() -> Storage::StorageResult<Pool::ConnectionPtr> {
            created_++;
            if (!reachable_) {
                return std::unexpected(make_error_code(StorageErrc::ConnectionFailed));
            }
            return Pool::ConnectionPtr(std::make_shared<FakeConnection>(healthy_));
        };
    }

    std::unique_ptr<Pool::ConnectionPool> MakePool(std::size_t min, std::size_t max)
    {
        Config::PoolSettings settings;
        settings.min_connections = min;
        settings.max_connections = max;
        settings.idle_timeout    = 30s;
        return std::make_unique<Pool::ConnectionPool>(
            "fake", settings, Pool::RetryPolicy{2, 0ms}, Factory()
        );
    }

    std::shared_ptr<std::atomic<bool>> healthy_ = std::make_shared<std::atomic<bool>>(true);
    bool reachable_ = true;
    int created_    = 0;
};

}  // namespace

TEST_F(ConnectionPoolTest, FirstAcquireOpensMinimumAndReusesIt)
{
    auto pool = MakePool(2, 4);
    {
        auto lease = pool->Acquire();
        ASSERT_TRUE(lease.has_value());
        EXPECT_EQ(created_, 2);
        EXPECT_EQ(pool->ActiveCount(), 1U);
        EXPECT_EQ(pool->IdleCount(), 1U);
    }
    EXPECT_EQ(pool->ActiveCount(), 0U);
    EXPECT_EQ(pool->IdleCount(), 2U);

    auto again = pool->Acquire();
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(created_, 2);
    EXPECT_EQ(pool->Stats()["total_reused"], 2);
}

TEST_F(ConnectionPoolTest, ExhaustedPoolFails)
{
    auto pool = MakePool(0, 2);
    auto a    = pool->Acquire();
    auto b    = pool->Acquire();
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());

    auto c = pool->Acquire();
    ASSERT_FALSE(c.has_value());
    EXPECT_EQ(c.error(), make_error_code(StorageErrc::PoolExhausted));
    EXPECT_EQ(pool->Stats()["total_exhausted"], 1);
}

TEST_F(ConnectionPoolTest, UnhealthyIdleConnectionIsReplaced)
{
    auto pool = MakePool(1, 2);
    {
        auto lease = pool->Acquire();
        ASSERT_TRUE(lease.has_value());
    }
    healthy_->store(false);
    auto failed = pool->Acquire();
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(pool->Stats()["total_discarded"], 1);

    healthy_->store(true);
    auto lease = pool->Acquire();
    ASSERT_TRUE(lease.has_value());
}

TEST_F(ConnectionPoolTest, BrokenLeaseIsNotKept)
{
    auto pool = MakePool(0, 2);
    {
        auto lease = pool->Acquire();
        ASSERT_TRUE(lease.has_value());
        lease->MarkBroken();
    }
    EXPECT_EQ(pool->IdleCount(), 0U);
    EXPECT_EQ(pool->ActiveCount(), 0U);
}

TEST_F(ConnectionPoolTest, RetriesUnreachableBackend)
{
    reachable_ = false;
    auto pool  = MakePool(0, 2);
    auto lease = pool->Acquire();
    ASSERT_FALSE(lease.has_value());
    EXPECT_EQ(lease.error(), make_error_code(StorageErrc::ConnectionFailed));
    EXPECT_EQ(created_, 2);
    EXPECT_EQ(pool->ActiveCount(), 0U);
}

TEST_F(ConnectionPoolTest, IdleConnectionsTimeOut)
{
    auto pool = MakePool(1, 4);
    {
        auto lease = pool->Acquire();
        ASSERT_TRUE(lease.has_value());
    }
    EXPECT_EQ(pool->CleanupIdle(Pool::SteadyClock::now()), 0U);
    EXPECT_EQ(pool->CleanupIdle(Pool::SteadyClock::now() + 31s), 1U);
    EXPECT_EQ(pool->IdleCount(), 0U);
}

//------------------------------------------------------------------------------//
// Key-value store tier
//------------------------------------------------------------------------------//

class RedisTierTest : public ::testing::TestWithParam<bool>
{
    protected:
    void SetUp() override
    {
        clock_ = std::make_shared<Utils::ManualClock>(kStart);
        tier_  = std::make_unique<Tiers::RedisTier>(
            LoopbackSettings(server_.Port()), "TIERCACHE:", GetParam(), clock_
        );
        ASSERT_TRUE(tier_->Initialize());
    }

    void TearDown() override
    {
        if (tier_) {
            EXPECT_TRUE(tier_->Shutdown());
        }
    }

    Testing::FakeRespServer server_;
    std::shared_ptr<Utils::ManualClock> clock_;
    std::unique_ptr<Tiers::RedisTier> tier_;
};

TEST_P(RedisTierTest, StoresPrefixedRecords)
{
    ASSERT_TRUE(tier_->Verify());
    ASSERT_TRUE(tier_->Put("user:42", CacheValue{{"name", "Ada"}}, 60));
    EXPECT_EQ(server_.Keys(), std::vector<std::string>{"TIERCACHE:user:42"});

    auto entry = tier_->Get("user:42");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->value["name"], "Ada");
    EXPECT_EQ(entry->expires_at, kStart + 60);

    auto missing = tier_->Get("nope");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error(), make_error_code(StorageErrc::CacheMiss));
}

TEST_P(RedisTierTest, StaleOrCorruptRecordsAreDeleted)
{
    ASSERT_TRUE(tier_->Put("k", CacheValue(1), 5));
    clock_->Advance(5s);
    auto expired = tier_->Get("k");
    ASSERT_FALSE(expired.has_value());
    EXPECT_EQ(expired.error(), make_error_code(StorageErrc::Expired));
    EXPECT_EQ(server_.Size(), 0U);

    server_.Inject("TIERCACHE:bad", "not a record");
    auto corrupt = tier_->Get("bad");
    ASSERT_FALSE(corrupt.has_value());
    EXPECT_EQ(corrupt.error(), make_error_code(StorageErrc::CorruptEntry));
    EXPECT_EQ(server_.Size(), 0U);
}

TEST_P(RedisTierTest, BatchOperationsKeepKeyOrder)
{
    ASSERT_TRUE(tier_->PutMany({{"a", CacheValue(1)}, {"c", CacheValue(3)}}, 60));

    auto entries = tier_->GetMany({"a", "b", "c"});
    ASSERT_TRUE(entries.has_value());
    ASSERT_EQ(entries->size(), 3U);
    EXPECT_EQ((*entries)[0]->value, 1);
    EXPECT_FALSE((*entries)[1].has_value());
    EXPECT_EQ((*entries)[2]->value, 3);

    auto removed = tier_->RemoveMany({"a", "b", "c"});
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(*removed, 2U);
}

TEST_P(RedisTierTest, ClearFlushesDatabase)
{
    ASSERT_TRUE(tier_->Put("a", CacheValue(1), 60));
    ASSERT_TRUE(tier_->Put("b", CacheValue(2), 60));
    ASSERT_TRUE(tier_->Clear());
    EXPECT_EQ(server_.Size(), 0U);
    EXPECT_TRUE(tier_->IsHealthy());
}

TEST_P(RedisTierTest, RecoversAfterServerDropsConnections)
{
    ASSERT_TRUE(tier_->Put("k", CacheValue("v"), 60));
    server_.DropClients();

    bool recovered = false;
    for (int attempt = 0; attempt < 2 && !recovered; ++attempt) {
        recovered = tier_->Get("k").has_value();
    }
    EXPECT_TRUE(recovered);
    EXPECT_GE(server_.AcceptedConnections(), 2U);
}

INSTANTIATE_TEST_SUITE_P(Pooling, RedisTierTest, ::testing::Bool());

TEST(RedisTierAuthTest, PasswordAndDatabaseAreSentOnConnect)
{
    Testing::FakeRespServer server("s3cret");
    auto settings     = LoopbackSettings(server.Port());
    settings.password = "s3cret";
    settings.database = 3;

    Tiers::RedisTier tier(settings, "", true, Utils::DefaultClock());
    ASSERT_TRUE(tier.Initialize());
    ASSERT_TRUE(tier.Verify());
    const auto log = server.CommandLog();
    ASSERT_GE(log.size(), 2U);
    EXPECT_EQ(log[0], "AUTH");
    EXPECT_EQ(log[1], "SELECT");

    settings.password = "wrong";
    Tiers::RedisTier rejected(settings, "", false, Utils::DefaultClock());
    ASSERT_TRUE(rejected.Initialize());
    auto check = rejected.Verify();
    ASSERT_FALSE(check.has_value());
    EXPECT_EQ(check.error(), make_error_code(StorageErrc::PermissionDenied));
}

TEST(RedisTierDownTest, UnreachableServerFailsVerification)
{
    std::uint16_t port = 0;
    {
        Testing::FakeRespServer server;
        port = server.Port();
    }
    Tiers::RedisTier tier(LoopbackSettings(port), "", true, Utils::DefaultClock());
    ASSERT_TRUE(tier.Initialize());
    EXPECT_FALSE(tier.Verify());
    EXPECT_FALSE(tier.IsHealthy());
}

//------------------------------------------------------------------------------//
// Cache cluster tier
//------------------------------------------------------------------------------//

class MemcachedTierTest : public ::testing::Test
{
    protected:
    void SetUp() override
    {
        clock_ = std::make_shared<Utils::ManualClock>(kStart);
        tier_  = std::make_unique<Tiers::MemcachedTier>(
            LoopbackSettings(server_.Port()), "TIERCACHE:", true, clock_
        );
        ASSERT_TRUE(tier_->Initialize());
    }

    Testing::FakeMemcachedServer server_;
    std::shared_ptr<Utils::ManualClock> clock_;
    std::unique_ptr<Tiers::MemcachedTier> tier_;
};

TEST_F(MemcachedTierTest, RoundTripAndDelete)
{
    ASSERT_TRUE(tier_->Verify());
    ASSERT_TRUE(tier_->Put("user:42", CacheValue{{"name", "Ada"}}, 60));
    EXPECT_EQ(server_.ExptimeOf("TIERCACHE:user:42"), 60);

    auto entry = tier_->Get("user:42");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->value["name"], "Ada");

    ASSERT_TRUE(tier_->Remove("user:42"));
    ASSERT_TRUE(tier_->Remove("user:42"));
    auto missing = tier_->Get("user:42");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error(), make_error_code(StorageErrc::CacheMiss));
}

TEST_F(MemcachedTierTest, UnsafeOrLongKeysAreHashed)
{
    EXPECT_EQ(tier_->StoredKey("plain"), "TIERCACHE:plain");
    EXPECT_EQ(tier_->StoredKey("has space"), "TIERCACHE:h:" + Storage::HashKey("has space"));
    const std::string long_key(300, 'x');
    EXPECT_EQ(tier_->StoredKey(long_key), "TIERCACHE:h:" + Storage::HashKey(long_key));

    ASSERT_TRUE(tier_->Put("has space", CacheValue(1), 60));
    EXPECT_TRUE(tier_->Get("has space").has_value());
}

TEST_F(MemcachedTierTest, StatsIncludeServerCounters)
{
    ASSERT_TRUE(tier_->Put("a", CacheValue(1), 60));
    const auto stats = tier_->Stats();
    ASSERT_TRUE(stats.contains("server"));
    EXPECT_EQ(stats["server"]["pid"], "4242");
    EXPECT_EQ(stats["server"]["curr_items"], "1");
}

TEST_F(MemcachedTierTest, LongTtlBecomesAbsoluteTime)
{
    EXPECT_EQ(tier_->ExpirationTime(0), 1);
    EXPECT_EQ(tier_->ExpirationTime(3600), 3600);
    const std::int64_t sixty_days = 60LL * 24 * 3600;
    EXPECT_EQ(tier_->ExpirationTime(sixty_days), kStart + sixty_days);
}

TEST_F(MemcachedTierTest, BatchAndFlush)
{
    ASSERT_TRUE(tier_->PutMany({{"a", CacheValue(1)}, {"b", CacheValue(2)}}, 60));
    auto entries = tier_->GetMany({"b", "missing", "a"});
    ASSERT_TRUE(entries.has_value());
    EXPECT_EQ((*entries)[0]->value, 2);
    EXPECT_FALSE((*entries)[1].has_value());
    EXPECT_EQ((*entries)[2]->value, 1);

    auto removed = tier_->RemoveMany({"a", "missing"});
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(*removed, 1U);

    ASSERT_TRUE(tier_->Clear());
    EXPECT_EQ(server_.Size(), 0U);
}

TEST_F(MemcachedTierTest, ExpiredRecordIsDeleted)
{
    ASSERT_TRUE(tier_->Put("k", CacheValue(1), 10));
    clock_->Advance(11s);
    auto expired = tier_->Get("k");
    ASSERT_FALSE(expired.has_value());
    EXPECT_EQ(expired.error(), make_error_code(StorageErrc::Expired));
    EXPECT_EQ(server_.Size(), 0U);
}

}  // namespace TierCache
