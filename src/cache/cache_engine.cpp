#include "cache/cache_engine.hpp"

#include "config/config_loader.hpp"
#include "storage/directory_provisioner.hpp"
#include "storage/storage_error.hpp"

#include <spdlog/spdlog.h>
#include <unistd.h>
#include <algorithm>

namespace TierCache::Cache
{

CacheEngine::CacheEngine(Config::CacheConfig config, std::shared_ptr<const Utils::IClock> clock)
    : config_(std::move(config)),
      clock_(std::move(clock)),
      registry_(config_, clock_, last_error_)
{
    spdlog::debug("CacheEngine created with prefix '{}'", config_.global_settings.prefix);
}

CacheEngine::~CacheEngine() { Close(); }

//------------------------------------------------------------------------------//
// Core Operations
//------------------------------------------------------------------------------//

std::optional<CacheValue> CacheEngine::Get(const std::string& key)
{
    const auto tiers = AvailableInOrder();
    for (std::size_t i = 0; i < tiers.size(); ++i) {
        auto& tier = *tiers[i];
        auto entry = tier.Get(key);
        if (!entry) {
            if (!Storage::IsMissError(entry.error())) {
                RecordFailure(tier, entry.error());
            }
            continue;
        }

        stats_.IncrementHits(tier.GetTier());
        SetLastUsed(tier.GetTier());
        Promote(key, *entry, tiers, i);
        return std::move(entry->value);
    }

    stats_.IncrementMisses();
    return std::nullopt;
}

bool CacheEngine::Set(const std::string& key, const CacheValue& value, std::int64_t ttl_seconds)
{
    if (Storage::IsEmptyValue(value)) {
        RejectEmptyValue(key);
        return false;
    }

    bool stored = false;
    for (const auto& tier : AvailableInOrder()) {
        if (!PutToTier(*tier, key, value, ttl_seconds)) {
            continue;
        }
        if (!stored) {
            SetLastUsed(tier->GetTier());
        }
        stored = true;
    }

    if (stored) {
        stats_.IncrementSets();
    } else {
        stats_.IncrementSetFailures();
    }
    return stored;
}

bool CacheEngine::Delete(const std::string& key)
{
    bool all_removed = true;
    for (const auto& tier : AvailableInOrder()) {
        all_removed = RemoveFromTier(*tier, key) && all_removed;
    }
    if (all_removed) {
        stats_.IncrementDeletes();
    }
    return all_removed;
}

bool CacheEngine::Clear()
{
    bool all_cleared = true;
    for (const auto& tier : AvailableInOrder()) {
        if (auto cleared = tier->Clear(); !cleared) {
            RecordFailure(*tier, cleared.error());
            all_cleared = false;
        }
    }
    return all_cleared;
}

std::size_t CacheEngine::Cleanup()
{
    std::size_t removed = 0;
    for (const auto& tier : AvailableInOrder()) {
        auto count = tier->CleanupExpired();
        if (!count) {
            RecordFailure(*tier, count.error());
            continue;
        }
        removed += *count;

        if (auto* pooled = dynamic_cast<Tiers::IPooledTier*>(tier.get())) {
            const auto closed = pooled->CleanupIdleConnections();
            if (closed > 0) {
                spdlog::debug("Closed {} idle connections of '{}'", closed, tier->GetName());
            }
        }
    }
    stats_.AddItemsExpired(removed);
    spdlog::debug("Cleanup removed {} expired entries", removed);
    return removed;
}

//------------------------------------------------------------------------------//
// Tier-targeted Operations
//------------------------------------------------------------------------------//

std::optional<CacheValue> CacheEngine::GetFromTier(const std::string& key, Config::Tier tier)
{
    auto target = RequireTier(tier);
    if (!target) {
        return std::nullopt;
    }
    auto entry = target->Get(key);
    if (!entry) {
        if (!Storage::IsMissError(entry.error())) {
            RecordFailure(*target, entry.error());
        }
        stats_.IncrementMisses();
        return std::nullopt;
    }
    stats_.IncrementHits(tier);
    SetLastUsed(tier);
    return std::move(entry->value);
}

bool CacheEngine::SetToTier(
    const std::string& key, const CacheValue& value, std::int64_t ttl_seconds, Config::Tier tier
)
{
    if (Storage::IsEmptyValue(value)) {
        RejectEmptyValue(key);
        return false;
    }
    auto target = RequireTier(tier);
    if (!target || !PutToTier(*target, key, value, ttl_seconds)) {
        stats_.IncrementSetFailures();
        return false;
    }
    stats_.IncrementSets();
    SetLastUsed(tier);
    return true;
}

bool CacheEngine::DeleteFromTier(const std::string& key, Config::Tier tier)
{
    auto target = RequireTier(tier);
    if (!target || !RemoveFromTier(*target, key)) {
        return false;
    }
    stats_.IncrementDeletes();
    SetLastUsed(tier);
    return true;
}

TierOperationReport CacheEngine::SetToTiers(
    const std::string& key, const CacheValue& value, std::int64_t ttl_seconds,
    const std::vector<Config::Tier>& tiers
)
{
    TierOperationReport report;
    for (const auto tier : tiers) {
        const bool ok = SetToTier(key, value, ttl_seconds, tier);
        report.results[tier] = ok;
        if (ok) {
            ++report.succeeded;
        } else {
            ++report.failed;
        }
    }
    return report;
}

TierOperationReport CacheEngine::DeleteFromTiers(
    const std::string& key, const std::vector<Config::Tier>& tiers
)
{
    TierOperationReport report;
    for (const auto tier : tiers) {
        const bool ok = DeleteFromTier(key, tier);
        report.results[tier] = ok;
        if (ok) {
            ++report.succeeded;
        } else {
            ++report.failed;
        }
    }
    return report;
}

std::optional<CacheValue> CacheEngine::GetWithTierPreference(
    const std::string& key, Config::Tier tier, bool fallback
)
{
    if (IsTierAvailable(tier)) {
        if (auto value = GetFromTier(key, tier)) {
            return value;
        }
    }
    if (!fallback) {
        return std::nullopt;
    }
    return Get(key);
}

//------------------------------------------------------------------------------//
// Batch Operations
//------------------------------------------------------------------------------//

std::vector<std::optional<CacheValue>> CacheEngine::GetMany(const std::vector<std::string>& keys)
{
    std::vector<std::optional<CacheValue>> values;
    values.reserve(keys.size());
    for (const auto& key : keys) {
        values.push_back(Get(key));
    }
    return values;
}

std::vector<bool> CacheEngine::SetMany(
    const std::vector<std::pair<std::string, CacheValue>>& items, std::int64_t ttl_seconds
)
{
    std::vector<bool> results;
    results.reserve(items.size());
    for (const auto& [key, value] : items) {
        results.push_back(Set(key, value, ttl_seconds));
    }
    return results;
}

std::vector<bool> CacheEngine::DeleteMany(const std::vector<std::string>& keys)
{
    std::vector<bool> results;
    results.reserve(keys.size());
    for (const auto& key : keys) {
        results.push_back(Delete(key));
    }
    return results;
}

//------------------------------------------------------------------------------//
// Status
//------------------------------------------------------------------------------//

std::vector<Config::Tier> CacheEngine::AvailableTiers()
{
    EnsureDiscovered();
    return registry_.AvailableTiers();
}

bool CacheEngine::IsTierAvailable(Config::Tier tier)
{
    EnsureDiscovered();
    return registry_.Find(tier) != nullptr;
}

std::optional<Config::Tier> CacheEngine::LastUsedTier() const
{
    std::lock_guard lock(state_mutex_);
    return last_used_;
}

std::map<Config::Tier, bool> CacheEngine::Health()
{
    EnsureDiscovered();
    std::map<Config::Tier, bool> health;
    for (const auto tier : Config::ALL_TIERS) {
        auto instance = registry_.Find(tier);
        health[tier]  = instance && instance->IsHealthy();
    }
    return health;
}

std::optional<std::string> CacheEngine::LastError() const { return last_error_.Get(); }

nlohmann::json CacheEngine::TierStatus()
{
    nlohmann::json status = nlohmann::json::object();
    for (const auto& [tier, healthy] : Health()) {
        status[Config::TierToString(tier)] = {
            {"available", registry_.Find(tier) != nullptr},
            {  "healthy",                       healthy},
            { "priority",   Config::TierPriority(tier)},
        };
    }
    return status;
}

nlohmann::json CacheEngine::GetStats()
{
    nlohmann::json tiers = nlohmann::json::object();
    nlohmann::json pools = nlohmann::json::object();
    for (const auto& tier : AvailableInOrder()) {
        tiers[tier->GetName()] = tier->Stats();
        if (const auto* pooled = dynamic_cast<const Tiers::IPooledTier*>(tier.get())) {
            pools[tier->GetName()] = pooled->ConnectionStats();
        }
    }

    nlohmann::json stats = stats_.ToJson();
    stats["tiers"]       = std::move(tiers);
    stats["pools"]       = std::move(pools);
    stats["cache_path"]  = GetCachePath().string();
    return stats;
}

nlohmann::json CacheEngine::Debug()
{
    nlohmann::json available = nlohmann::json::array();
    for (const auto tier : AvailableTiers()) {
        available.push_back(Config::TierToString(tier));
    }
    nlohmann::json health = nlohmann::json::object();
    for (const auto& [tier, healthy] : Health()) {
        health[Config::TierToString(tier)] = healthy;
    }

    const auto config = GetConfig();
    nlohmann::json debug = {
        {   "available_tiers",                                 available},
        {            "health",                                    health},
        {        "last_error",                                   nullptr},
        {    "last_used_tier",                                   nullptr},
        {"connection_pooling", config.global_settings.connection_pooling},
        {             "async",              config.global_settings.async},
        {        "cache_path",                    GetCachePath().string()},
        {               "pid",                static_cast<int>(getpid())},
    };
    if (auto error = LastError()) {
        debug["last_error"] = *error;
    }
    if (auto last_used = LastUsedTier()) {
        debug["last_used_tier"] = Config::TierToString(*last_used);
    }
    return debug;
}

//------------------------------------------------------------------------------//
// Configuration
//------------------------------------------------------------------------------//

bool CacheEngine::SetCachePath(const std::filesystem::path& path)
{
    Storage::DirectoryProvisioner provisioner;
    if (auto writable = provisioner.EnsureWritable(path); !writable) {
        spdlog::warn("Cache path '{}' is not writable: {}", path.string(), writable.error().message());
        last_error_.Set("Cache path not writable: " + path.string());
        return false;
    }

    std::lock_guard lock(config_mutex_);
    config_.global_settings.cache_path = path;
    if (!registry_.IsDiscovered()) {
        return true;
    }
    if (auto relocated = registry_.RelocateFilesystemTier(path); !relocated) {
        last_error_.Set("file: " + relocated.error().message());
        return false;
    }
    return true;
}

std::filesystem::path CacheEngine::GetCachePath()
{
    EnsureDiscovered();
    auto directory = registry_.CacheDirectory();
    if (!directory.empty()) {
        return directory;
    }
    std::lock_guard lock(config_mutex_);
    return config_.global_settings.cache_path;
}

bool CacheEngine::ConfigureTier(Config::Tier tier, const nlohmann::json& options)
{
    std::lock_guard lock(config_mutex_);
    if (registry_.IsDiscovered()) {
        spdlog::warn(
            "Ignoring configuration for tier '{}': tiers are already discovered",
            Config::TierToString(tier)
        );
        return false;
    }
    if (auto applied = Config::ApplyTierOptions(config_, tier, options); !applied) {
        const std::string message = std::string("Invalid options for tier '") +
                                    Config::TierToString(tier) + "': " +
                                    Config::LoadErrorToString(applied.error());
        spdlog::error("{}", message);
        throw Storage::StorageException(
            Storage::make_error_code(Storage::StorageErrc::InvalidConfiguration), message
        );
    }
    return true;
}

bool CacheEngine::SetConnectionPooling(bool enabled)
{
    std::lock_guard lock(config_mutex_);
    if (registry_.IsDiscovered()) {
        return false;
    }
    config_.global_settings.connection_pooling = enabled;
    return true;
}

Config::CacheConfig CacheEngine::GetConfig() const
{
    std::lock_guard lock(config_mutex_);
    return config_;
}

std::int64_t CacheEngine::DefaultTtl() const
{
    std::lock_guard lock(config_mutex_);
    return config_.global_settings.default_ttl;
}

bool CacheEngine::IsAsyncEnabled() const
{
    std::lock_guard lock(config_mutex_);
    return config_.global_settings.async;
}

void CacheEngine::Close()
{
    std::lock_guard lock(config_mutex_);
    registry_.ShutdownAll();
}

//------------------------------------------------------------------------------//
// Private Methods
//------------------------------------------------------------------------------//

void CacheEngine::EnsureDiscovered()
{
    std::lock_guard lock(config_mutex_);
    if (!registry_.IsDiscovered()) {
        registry_.Discover();
    }
}

std::vector<TierPtr> CacheEngine::AvailableInOrder()
{
    EnsureDiscovered();
    return registry_.Available();
}

TierPtr CacheEngine::RequireTier(Config::Tier tier)
{
    EnsureDiscovered();
    auto instance = registry_.Find(tier);
    if (!instance) {
        last_error_.Set(std::string("Tier not available: ") + Config::TierToString(tier));
    }
    return instance;
}

void CacheEngine::RejectEmptyValue(const std::string& key)
{
    const auto reason = Storage::make_error_code(Storage::StorageErrc::EmptyValue).message();
    spdlog::debug("{}: '{}'", reason, key);
    last_error_.Set(reason + ": " + key);
}

void CacheEngine::Promote(
    const std::string& key, const Storage::TierEntry& entry, const std::vector<TierPtr>& tiers,
    std::size_t serving_index
)
{
    if (serving_index == 0) {
        return;
    }

    std::int64_t ttl = 0;
    {
        std::lock_guard lock(config_mutex_);
        ttl = config_.global_settings.promotion_ttl;
    }
    if (entry.expires_at) {
        ttl = std::max<std::int64_t>(1, *entry.expires_at - clock_->Now());
    }

    for (std::size_t i = 0; i < serving_index; ++i) {
        if (PutToTier(*tiers[i], key, entry.value, ttl)) {
            stats_.IncrementPromotions();
        }
    }
}

bool CacheEngine::PutToTier(
    Tiers::ICacheTier& tier, const std::string& key, const CacheValue& value,
    std::int64_t ttl_seconds
)
{
    if (auto put = tier.Put(key, value, ttl_seconds); !put) {
        RecordFailure(tier, put.error());
        return false;
    }
    return true;
}

bool CacheEngine::RemoveFromTier(Tiers::ICacheTier& tier, const std::string& key)
{
    if (auto removed = tier.Remove(key); !removed) {
        RecordFailure(tier, removed.error());
        return false;
    }
    return true;
}

void CacheEngine::RecordFailure(const Tiers::ICacheTier& tier, const std::error_code& ec)
{
    spdlog::debug("Tier '{}' operation failed: {}", tier.GetName(), ec.message());
    last_error_.Set(std::string(tier.GetName()) + ": " + ec.message());
}

void CacheEngine::SetLastUsed(Config::Tier tier)
{
    std::lock_guard lock(state_mutex_);
    last_used_ = tier;
}

}  // namespace TierCache::Cache
