#include "async/async_cache.hpp"
#include "async/promise.hpp"
#include "async/scheduler.hpp"
#include "cache/cache_engine.hpp"
#include "storage/storage_error.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace TierCache::Async
{

using Config::Tier;

namespace
{

std::string MessageOf(const std::exception_ptr& error)
{
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    }
    return {};
}

}  // namespace

//------------------------------------------------------------------------------//
// Promise
//------------------------------------------------------------------------------//

TEST(PromiseTest, SettlesExactlyOnce)
{
    Promise<int> promise;
    EXPECT_TRUE(promise.IsPending());
    EXPECT_THROW(promise.Value(), std::logic_error);

    EXPECT_TRUE(promise.Resolve(1));
    EXPECT_FALSE(promise.Resolve(2));
    EXPECT_FALSE(promise.Reject(std::make_exception_ptr(std::runtime_error("late"))));
    EXPECT_TRUE(promise.IsFulfilled());
    EXPECT_EQ(promise.Value(), 1);
}

TEST(PromiseTest, CopiesShareTheOutcome)
{
    Promise<std::string> promise;
    auto copy = promise;
    copy.Resolve("shared");
    EXPECT_EQ(promise.Value(), "shared");
}

TEST(PromiseTest, CallbacksRunOnSettleOrImmediately)
{
    Promise<int> promise;
    int calls = 0;
    promise.Subscribe([&calls] {
        calls++;
    });
    EXPECT_EQ(calls, 0);

    promise.Resolve(5);
    EXPECT_EQ(calls, 1);

    promise.Subscribe([&calls] {
        calls++;
    });
    EXPECT_EQ(calls, 2);
}

TEST(PromiseTest, ThenTransformsAndPassesRejectionsThrough)
{
    Promise<int> source;
    auto doubled = source.Then([](int v) {
        return v * 2;
    });
    auto text = doubled.Then([](int v) {
        return std::to_string(v);
    });
    source.Resolve(21);
    EXPECT_EQ(text.Value(), "42");

    auto failed = Promise<int>::Rejected(Storage::make_error_code(Storage::StorageErrc::Timeout));
    int invoked = 0;
    auto passed = failed.Then([&invoked](int v) {
        invoked++;
        return v;
    });
    EXPECT_TRUE(passed.IsRejected());
    EXPECT_EQ(invoked, 0);
    EXPECT_THROW(std::rethrow_exception(passed.Error()), Storage::StorageException);
}

TEST(PromiseTest, ThrowingHandlerRejects)
{
    auto result = Promise<int>::Resolved(1).Then([](int) -> int {
        throw std::runtime_error("boom");
    });
    ASSERT_TRUE(result.IsRejected());
    EXPECT_EQ(MessageOf(result.Error()), "boom");
}

TEST(PromiseTest, CatchRecoversAndFinallyAlwaysRuns)
{
    auto recovered = Promise<int>::Rejected(std::make_exception_ptr(std::runtime_error("x")))
                         .Catch([](std::exception_ptr) {
                             return -1;
                         });
    EXPECT_EQ(recovered.Value(), -1);

    auto untouched = Promise<int>::Resolved(3).Catch([](std::exception_ptr) {
        return -1;
    });
    EXPECT_EQ(untouched.Value(), 3);

    int cleanups = 0;
    auto fulfilled = Promise<int>::Resolved(7).Finally([&cleanups] {
        cleanups++;
    });
    auto rejected = Promise<int>::Rejected(std::make_exception_ptr(std::runtime_error("y")))
                        .Finally([&cleanups] {
                            cleanups++;
                        });
    EXPECT_EQ(cleanups, 2);
    EXPECT_EQ(fulfilled.Value(), 7);
    EXPECT_TRUE(rejected.IsRejected());
}

TEST(PromiseCombinatorTest, AllKeepsInputOrder)
{
    Promise<int> first;
    Promise<int> second;
    auto all = All(std::vector<Promise<int>>{first, second});

    second.Resolve(2);
    EXPECT_TRUE(all.IsPending());
    first.Resolve(1);
    ASSERT_TRUE(all.IsFulfilled());
    EXPECT_EQ(all.Value(), (std::vector<int>{1, 2}));

    EXPECT_TRUE(All(std::vector<Promise<int>>{}).IsFulfilled());
}

TEST(PromiseCombinatorTest, AllRejectsWithFirstRejection)
{
    Promise<int> first;
    Promise<int> second;
    auto all = All(std::vector<Promise<int>>{first, second});

    second.Reject(std::make_exception_ptr(std::runtime_error("second")));
    first.Reject(std::make_exception_ptr(std::runtime_error("first")));
    ASSERT_TRUE(all.IsRejected());
    EXPECT_EQ(MessageOf(all.Error()), "second");
}

TEST(PromiseCombinatorTest, RaceFollowsFirstSettled)
{
    Promise<int> slow;
    Promise<int> fast;
    auto race = Race(std::vector<Promise<int>>{slow, fast});
    fast.Resolve(2);
    slow.Resolve(1);
    EXPECT_EQ(race.Value(), 2);

    EXPECT_TRUE(Race(std::vector<Promise<int>>{}).IsPending());
}

TEST(PromiseCombinatorTest, AllSettledReportsEveryOutcome)
{
    Promise<int> ok;
    Promise<int> bad;
    auto settled = AllSettled(std::vector<Promise<int>>{ok, bad});
    bad.Reject(std::make_exception_ptr(std::runtime_error("bad")));
    EXPECT_TRUE(settled.IsPending());
    ok.Resolve(4);

    ASSERT_TRUE(settled.IsFulfilled());
    const auto outcomes = settled.Value();
    ASSERT_EQ(outcomes.size(), 2U);
    EXPECT_TRUE(outcomes[0].IsFulfilled());
    EXPECT_EQ(outcomes[0].value, 4);
    EXPECT_EQ(outcomes[1].state, PromiseState::Rejected);
    EXPECT_EQ(MessageOf(outcomes[1].error), "bad");
}

//------------------------------------------------------------------------------//
// Event loop
//------------------------------------------------------------------------------//

TEST(EventLoopTest, TasksDeferredDuringATickWaitForTheNext)
{
    EventLoop loop;
    std::vector<int> order;
    loop.Defer([&] {
        order.push_back(1);
        loop.Defer([&] {
            order.push_back(3);
        });
    });
    loop.Defer([&] {
        order.push_back(2);
    });

    EXPECT_EQ(loop.RunOnce(), 2U);
    EXPECT_EQ(loop.Pending(), 1U);
    EXPECT_EQ(loop.RunUntilIdle(), 1U);
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(EventLoopTest, FailingTaskDoesNotStopTheTick)
{
    EventLoop loop;
    bool ran = false;
    loop.Defer([] {
        throw std::runtime_error("task failed");
    });
    loop.Defer([&ran] {
        ran = true;
    });
    EXPECT_EQ(loop.RunOnce(), 2U);
    EXPECT_TRUE(ran);
}

TEST(EventLoopTest, NonStandardThrowDoesNotStopTheTick)
{
    EventLoop loop;
    Promise<int> later;
    loop.Defer([] {
        throw 42;
    });
    loop.Defer([later] {
        later.Resolve(1);
    });
    EXPECT_EQ(loop.RunOnce(), 2U);
    EXPECT_TRUE(later.IsFulfilled());
}

//------------------------------------------------------------------------------//
// Async facade
//------------------------------------------------------------------------------//

class AsyncCacheTest : public ::testing::Test
{
    protected:
    void SetUp() override
    {
        engine_ = std::make_unique<Cache::CacheEngine>(
            Testing::OnlyTiers({Tier::LocalProcessCache, Tier::Filesystem}, dir_.Path())
        );
    }

    Testing::TempDir dir_;
    std::unique_ptr<Cache::CacheEngine> engine_;
    EventLoop loop_;
};

TEST_F(AsyncCacheTest, QueuedOperationsOutliveTheFacade)
{
    Promise<bool> set;
    {
        AsyncCache cache(*engine_);
        cache.EnableAsync(loop_);
        set = cache.SetAsync("k", Cache::CacheValue("v"), 60);
    }
    EXPECT_TRUE(set.IsPending());

    loop_.RunUntilIdle();
    ASSERT_TRUE(set.IsFulfilled());
    EXPECT_TRUE(set.Value());
    EXPECT_EQ(engine_->Get("k"), Cache::CacheValue("v"));
}

TEST_F(AsyncCacheTest, WithoutSchedulerOperationsSettleInline)
{
    AsyncCache cache(*engine_);
    EXPECT_FALSE(cache.IsAsyncEnabled());

    auto set = cache.SetAsync("k", Cache::CacheValue("v"), 60);
    ASSERT_TRUE(set.IsFulfilled());
    EXPECT_TRUE(set.Value());

    auto got = cache.GetAsync("k");
    ASSERT_TRUE(got.IsFulfilled());
    EXPECT_EQ(got.Value(), Cache::CacheValue("v"));
}

TEST_F(AsyncCacheTest, EnabledOperationsRunOnTheNextTick)
{
    AsyncCache cache(*engine_);
    cache.EnableAsync(loop_);
    ASSERT_TRUE(cache.IsAsyncEnabled());

    auto set = cache.SetAsync("k", Cache::CacheValue(1), 60);
    EXPECT_TRUE(set.IsPending());
    EXPECT_FALSE(engine_->Get("k").has_value());

    loop_.RunUntilIdle();
    ASSERT_TRUE(set.IsFulfilled());
    EXPECT_TRUE(set.Value());

    auto removed = cache.DeleteAsync("k");
    loop_.RunUntilIdle();
    EXPECT_TRUE(removed.Value());

    cache.DisableAsync();
    EXPECT_TRUE(cache.GetAsync("k").IsFulfilled());
}

TEST_F(AsyncCacheTest, TierTargetedOperationsResolveWithEngineResults)
{
    AsyncCache cache(*engine_, &loop_);
    cache.EnableAsync(loop_);

    auto stored = cache.SetToTierAsync("k", Cache::CacheValue("disk"), 60, Tier::Filesystem);
    auto missing = cache.GetFromTierAsync("k", Tier::NetworkKvStore);
    auto report  = cache.SetToTiersAsync(
        "j", Cache::CacheValue(2), 60, {Tier::LocalProcessCache, Tier::SharedMemory}
    );
    loop_.RunUntilIdle();

    EXPECT_TRUE(stored.Value());
    EXPECT_FALSE(missing.Value().has_value());
    EXPECT_EQ(report.Value().succeeded, 1U);
    EXPECT_EQ(report.Value().failed, 1U);

    auto preferred = cache.GetWithTierPreferenceAsync("k", Tier::LocalProcessCache, true);
    loop_.RunUntilIdle();
    EXPECT_EQ(preferred.Value(), Cache::CacheValue("disk"));
}

TEST_F(AsyncCacheTest, BatchesAndPipelinesKeepOrder)
{
    AsyncCache cache(*engine_);
    cache.EnableAsync(loop_);

    auto set = cache.SetBatchAsync({{"a", Cache::CacheValue(1)}, {"b", Cache::CacheValue(2)}}, 60);
    loop_.RunUntilIdle();
    EXPECT_EQ(set.Value(), (std::vector<bool>{true, true}));

    auto pipeline = cache.PipelineAsync({
        PipelineOperation::Get("a"),
        PipelineOperation::Set("c", Cache::CacheValue(3)),
        PipelineOperation::Delete("b"),
        PipelineOperation::Get("b"),
        PipelineOperation::GetFromTier("c", Tier::Filesystem),
    });
    EXPECT_TRUE(pipeline.IsPending());
    loop_.RunUntilIdle();

    ASSERT_TRUE(pipeline.IsFulfilled());
    const auto results = pipeline.Value();
    ASSERT_EQ(results.size(), 5U);
    EXPECT_EQ(results[0], 1);
    EXPECT_EQ(results[1], true);
    EXPECT_EQ(results[2], true);
    EXPECT_TRUE(results[3].is_null());
    EXPECT_EQ(results[4], 3);

    auto values = cache.GetBatchAsync({"c", "missing"});
    loop_.RunUntilIdle();
    ASSERT_EQ(values.Value().size(), 2U);
    EXPECT_FALSE(values.Value()[1].has_value());
}

TEST_F(AsyncCacheTest, ConfiguredAsyncFlagNeedsAScheduler)
{
    auto config = Testing::OnlyTiers({Tier::LocalProcessCache}, dir_.Path());
    config.global_settings.async = true;
    Cache::CacheEngine engine(config);

    AsyncCache detached(engine);
    EXPECT_FALSE(detached.IsAsyncEnabled());

    AsyncCache attached(engine, &loop_);
    EXPECT_TRUE(attached.IsAsyncEnabled());
    auto cleared = attached.ClearAsync();
    EXPECT_TRUE(cleared.IsPending());
    loop_.RunUntilIdle();
    EXPECT_TRUE(cleared.Value());
}

}  // namespace TierCache::Async
