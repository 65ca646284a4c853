#include "warming/cache_warmer.hpp"

#include "cache/cache_engine.hpp"
#include "storage/storage_error.hpp"
#include "warming/file_warmer.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <utility>

namespace TierCache::Warming
{

namespace
{

[[noreturn]] void ThrowInvalid(const std::string& message)
{
    spdlog::error("{}", message);
    throw Storage::StorageException(
        Storage::make_error_code(Storage::StorageErrc::InvalidConfiguration), message
    );
}

std::int64_t ReadTtl(const nlohmann::json& node, std::int64_t fallback, const std::string& where)
{
    if (!node.contains("ttl")) {
        return fallback;
    }
    const auto& ttl = node.at("ttl");
    if (!ttl.is_number_integer() || ttl.get<std::int64_t>() <= 0) {
        ThrowInvalid("'ttl' of " + where + " must be a positive integer");
    }
    return ttl.get<std::int64_t>();
}

std::shared_ptr<ICacheWarmer> ParseFileWarmer(const nlohmann::json& node, std::int64_t default_ttl)
{
    const std::string name = node.value("name", std::string("file"));
    const auto ttl         = ReadTtl(node, default_ttl, "warmer '" + name + "'");

    std::vector<FileSource> sources;
    if (node.contains("files")) {
        if (!node.at("files").is_array()) {
            ThrowInvalid("'files' of warmer '" + name + "' must be an array");
        }
        for (const auto& entry : node.at("files")) {
            if (!entry.is_object() || !entry.contains("cache_key") || !entry.contains("file") ||
                !entry.at("cache_key").is_string() || !entry.at("file").is_string()) {
                ThrowInvalid("Warmer '" + name + "' needs string 'cache_key' and 'file' per source");
            }
            FileSource source;
            source.cache_key = entry.at("cache_key").get<std::string>();
            source.file      = entry.at("file").get<std::string>();
            if (entry.contains("ttl")) {
                source.ttl_seconds = ReadTtl(entry, ttl, "source '" + source.cache_key + "'");
            }
            const std::string parser = entry.value("parser", std::string("raw"));
            auto parsed              = StringToFileParser(parser);
            if (!parsed) {
                ThrowInvalid("Unknown parser '" + parser + "' for source '" + source.cache_key + "'");
            }
            source.parser = *parsed;
            sources.push_back(std::move(source));
        }
    }
    return std::make_shared<FileWarmer>(std::move(sources), name, ttl);
}

}  // namespace

CacheWarmer::CacheWarmer(std::shared_ptr<const Utils::IClock> clock) : clock_(std::move(clock)) {}

std::unique_ptr<CacheWarmer> CacheWarmer::FromConfig(
    const nlohmann::json& warmers, std::int64_t default_ttl,
    std::shared_ptr<const Utils::IClock> clock
)
{
    auto registry = std::make_unique<CacheWarmer>(std::move(clock));
    if (warmers.is_null()) {
        return registry;
    }
    if (!warmers.is_array()) {
        ThrowInvalid("'warmers' must be an array");
    }

    for (const auto& node : warmers) {
        if (!node.is_object() || !node.contains("type") || !node.at("type").is_string()) {
            ThrowInvalid("Every warmer needs a string 'type'");
        }
        const auto type = node.at("type").get<std::string>();
        if (type == "file") {
            registry->AddWarmer(ParseFileWarmer(node, default_ttl));
        } else {
            spdlog::warn("Ignoring warmer of unsupported type '{}'", type);
        }
    }
    return registry;
}

void CacheWarmer::AddWarmer(std::shared_ptr<ICacheWarmer> warmer)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(warmers_.begin(), warmers_.end(), [&](const auto& existing) {
        return existing->Name() == warmer->Name();
    });
    if (it != warmers_.end()) {
        *it = std::move(warmer);
    } else {
        warmers_.push_back(std::move(warmer));
    }
}

bool CacheWarmer::RemoveWarmer(const std::string& name)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(warmers_.begin(), warmers_.end(), [&](const auto& existing) {
        return existing->Name() == name;
    });
    if (it == warmers_.end()) {
        return false;
    }
    warmers_.erase(it);
    return true;
}

std::vector<std::string> CacheWarmer::WarmerNames() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(warmers_.size());
    for (const auto& warmer : warmers_) {
        names.push_back(warmer->Name());
    }
    return names;
}

WarmResults CacheWarmer::WarmAll(Cache::CacheEngine& engine)
{
    std::vector<std::shared_ptr<ICacheWarmer>> warmers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        warmers = warmers_;
    }

    WarmResults results;
    for (const auto& warmer : warmers) {
        if (warmer->IsApplicable()) {
            results[warmer->Name()] = Run(*warmer, engine, *stats_, *clock_);
        }
    }
    return results;
}

std::expected<WarmResult, std::string> CacheWarmer::WarmWith(
    Cache::CacheEngine& engine, const std::string& name
)
{
    auto warmer = Find(name);
    if (!warmer) {
        return std::unexpected("Warmer '" + name + "' not found");
    }
    if (!warmer->IsApplicable()) {
        return std::unexpected("Warmer '" + name + "' is not applicable");
    }
    return Run(*warmer, engine, *stats_, *clock_);
}

Async::Promise<WarmResults> CacheWarmer::WarmAllAsync(
    Cache::CacheEngine& engine, Async::IScheduler& scheduler
)
{
    std::vector<std::shared_ptr<ICacheWarmer>> warmers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        warmers = warmers_;
    }

    std::vector<std::string> names;
    std::vector<Async::Promise<WarmResult>> promises;
    for (const auto& warmer : warmers) {
        if (!warmer->IsApplicable()) {
            continue;
        }
        Async::Promise<WarmResult> promise;
        scheduler.Defer([stats = stats_, clock = clock_, &engine, warmer, promise]() {
            try {
                promise.Resolve(Run(*warmer, engine, *stats, *clock));
            } catch (...) {
                promise.Reject(std::current_exception());
            }
        });
        names.push_back(warmer->Name());
        promises.push_back(std::move(promise));
    }

    return Async::All(promises).Then([names](const std::vector<WarmResult>& outcomes) {
        WarmResults results;
        for (std::size_t i = 0; i < outcomes.size(); ++i) {
            results[names[i]] = outcomes[i];
        }
        return results;
    });
}

std::map<std::string, WarmerStats> CacheWarmer::Stats() const
{
    std::lock_guard<std::mutex> lock(stats_->mutex);
    return stats_->entries;
}

nlohmann::json CacheWarmer::StatsJson() const
{
    nlohmann::json json = nlohmann::json::object();
    for (const auto& [name, stats] : Stats()) {
        json[name] = {
            {             "runs",              stats.runs},
            {      "total_items",       stats.total_items},
            {"total_duration_ms", stats.total_duration_ms},
            {         "last_run",          stats.last_run},
        };
    }
    return json;
}

void CacheWarmer::ResetStats()
{
    std::lock_guard<std::mutex> lock(stats_->mutex);
    stats_->entries.clear();
}

WarmResult CacheWarmer::Run(
    ICacheWarmer& warmer, Cache::CacheEngine& engine, StatsLedger& ledger,
    const Utils::IClock& clock
)
{
    const auto start  = std::chrono::steady_clock::now();
    const auto count  = warmer.Warm(engine);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::steady_clock::now() - start
    )
                            .count();

    WarmResult result{count, static_cast<std::int64_t>(millis)};
    {
        std::lock_guard<std::mutex> lock(ledger.mutex);
        auto& stats = ledger.entries[warmer.Name()];
        stats.runs++;
        stats.total_items += count;
        stats.total_duration_ms += result.duration_ms;
        stats.last_run = clock.Now();
    }
    return result;
}

std::shared_ptr<ICacheWarmer> CacheWarmer::Find(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(warmers_.begin(), warmers_.end(), [&](const auto& existing) {
        return existing->Name() == name;
    });
    return it != warmers_.end() ? *it : nullptr;
}

}  // namespace TierCache::Warming
