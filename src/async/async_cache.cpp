#include "async/async_cache.hpp"

namespace TierCache::Async
{

//------------------------------------------------------------------------------//
// PipelineOperation
//------------------------------------------------------------------------------//

PipelineOperation PipelineOperation::Get(std::string key)
{
    PipelineOperation op;
    op.kind = Kind::Get;
    op.key  = std::move(key);
    return op;
}

PipelineOperation PipelineOperation::Set(
    std::string key, CacheValue value, std::int64_t ttl_seconds
)
{
    PipelineOperation op;
    op.kind        = Kind::Set;
    op.key         = std::move(key);
    op.value       = std::move(value);
    op.ttl_seconds = ttl_seconds;
    return op;
}

PipelineOperation PipelineOperation::Delete(std::string key)
{
    PipelineOperation op;
    op.kind = Kind::Delete;
    op.key  = std::move(key);
    return op;
}

PipelineOperation PipelineOperation::GetFromTier(std::string key, Config::Tier tier)
{
    PipelineOperation op = Get(std::move(key));
    op.kind              = Kind::GetFromTier;
    op.tier              = tier;
    return op;
}

PipelineOperation PipelineOperation::SetToTier(
    std::string key, CacheValue value, std::int64_t ttl_seconds, Config::Tier tier
)
{
    PipelineOperation op = Set(std::move(key), std::move(value), ttl_seconds);
    op.kind              = Kind::SetToTier;
    op.tier              = tier;
    return op;
}

PipelineOperation PipelineOperation::DeleteFromTier(std::string key, Config::Tier tier)
{
    PipelineOperation op = Delete(std::move(key));
    op.kind              = Kind::DeleteFromTier;
    op.tier              = tier;
    return op;
}

//------------------------------------------------------------------------------//
// AsyncCache
//------------------------------------------------------------------------------//

AsyncCache::AsyncCache(Cache::CacheEngine& engine, IScheduler* scheduler)
    : engine_(engine), scheduler_(scheduler), enabled_(engine.IsAsyncEnabled())
{
}

void AsyncCache::EnableAsync(IScheduler& scheduler)
{
    scheduler_ = &scheduler;
    enabled_   = true;
}

void AsyncCache::DisableAsync() { enabled_ = false; }

bool AsyncCache::IsAsyncEnabled() const { return enabled_ && scheduler_ != nullptr; }

Promise<std::optional<CacheValue>> AsyncCache::GetAsync(const std::string& key)
{
    return Run<std::optional<CacheValue>>([&engine = engine_, key]() {
        return engine.Get(key);
    });
}

Promise<bool> AsyncCache::SetAsync(
    const std::string& key, const CacheValue& value, std::int64_t ttl_seconds
)
{
    return Run<bool>([&engine = engine_, key, value, ttl_seconds]() {
        return engine.Set(key, value, ttl_seconds);
    });
}

Promise<bool> AsyncCache::DeleteAsync(const std::string& key)
{
    return Run<bool>([&engine = engine_, key]() {
        return engine.Delete(key);
    });
}

Promise<bool> AsyncCache::ClearAsync()
{
    return Run<bool>([&engine = engine_]() {
        return engine.Clear();
    });
}

Promise<std::size_t> AsyncCache::CleanupAsync()
{
    return Run<std::size_t>([&engine = engine_]() {
        return engine.Cleanup();
    });
}

Promise<std::optional<CacheValue>> AsyncCache::GetFromTierAsync(
    const std::string& key, Config::Tier tier
)
{
    return Run<std::optional<CacheValue>>([&engine = engine_, key, tier]() {
        return engine.GetFromTier(key, tier);
    });
}

Promise<bool> AsyncCache::SetToTierAsync(
    const std::string& key, const CacheValue& value, std::int64_t ttl_seconds, Config::Tier tier
)
{
    return Run<bool>([&engine = engine_, key, value, ttl_seconds, tier]() {
        return engine.SetToTier(key, value, ttl_seconds, tier);
    });
}

Promise<bool> AsyncCache::DeleteFromTierAsync(const std::string& key, Config::Tier tier)
{
    return Run<bool>([&engine = engine_, key, tier]() {
        return engine.DeleteFromTier(key, tier);
    });
}

Promise<Cache::TierOperationReport> AsyncCache::SetToTiersAsync(
    const std::string& key, const CacheValue& value, std::int64_t ttl_seconds,
    const std::vector<Config::Tier>& tiers
)
{
    return Run<Cache::TierOperationReport>([&engine = engine_, key, value, ttl_seconds, tiers]() {
        return engine.SetToTiers(key, value, ttl_seconds, tiers);
    });
}

Promise<Cache::TierOperationReport> AsyncCache::DeleteFromTiersAsync(
    const std::string& key, const std::vector<Config::Tier>& tiers
)
{
    return Run<Cache::TierOperationReport>([&engine = engine_, key, tiers]() {
        return engine.DeleteFromTiers(key, tiers);
    });
}

Promise<std::optional<CacheValue>> AsyncCache::GetWithTierPreferenceAsync(
    const std::string& key, Config::Tier tier, bool fallback
)
{
    return Run<std::optional<CacheValue>>([&engine = engine_, key, tier, fallback]() {
        return engine.GetWithTierPreference(key, tier, fallback);
    });
}

Promise<std::vector<std::optional<CacheValue>>> AsyncCache::GetBatchAsync(
    const std::vector<std::string>& keys
)
{
    std::vector<Promise<std::optional<CacheValue>>> promises;
    promises.reserve(keys.size());
    for (const auto& key : keys) {
        promises.push_back(GetAsync(key));
    }
    return All(promises);
}

Promise<std::vector<bool>> AsyncCache::SetBatchAsync(
    const std::vector<std::pair<std::string, CacheValue>>& items, std::int64_t ttl_seconds
)
{
    std::vector<Promise<bool>> promises;
    promises.reserve(items.size());
    for (const auto& [key, value] : items) {
        promises.push_back(SetAsync(key, value, ttl_seconds));
    }
    return All(promises);
}

Promise<std::vector<bool>> AsyncCache::DeleteBatchAsync(const std::vector<std::string>& keys)
{
    std::vector<Promise<bool>> promises;
    promises.reserve(keys.size());
    for (const auto& key : keys) {
        promises.push_back(DeleteAsync(key));
    }
    return All(promises);
}

Promise<std::vector<nlohmann::json>> AsyncCache::PipelineAsync(
    const std::vector<PipelineOperation>& operations
)
{
    const auto to_json = [](const std::optional<CacheValue>& value) {
        return value ? *value : nlohmann::json(nullptr);
    };
    const auto flag_to_json = [](bool ok) {
        return nlohmann::json(ok);
    };

    std::vector<Promise<nlohmann::json>> promises;
    promises.reserve(operations.size());
    for (const auto& op : operations) {
        using Kind = PipelineOperation::Kind;
        switch (op.kind) {
            case Kind::Get:
                promises.push_back(GetAsync(op.key).Then(to_json));
                break;
            case Kind::Set:
                promises.push_back(SetAsync(op.key, op.value, op.ttl_seconds).Then(flag_to_json));
                break;
            case Kind::Delete:
                promises.push_back(DeleteAsync(op.key).Then(flag_to_json));
                break;
            case Kind::GetFromTier:
                promises.push_back(GetFromTierAsync(op.key, op.tier).Then(to_json));
                break;
            case Kind::SetToTier:
                promises.push_back(
                    SetToTierAsync(op.key, op.value, op.ttl_seconds, op.tier).Then(flag_to_json)
                );
                break;
            case Kind::DeleteFromTier:
                promises.push_back(DeleteFromTierAsync(op.key, op.tier).Then(flag_to_json));
                break;
        }
    }
    return All(promises);
}

}  // namespace TierCache::Async
