#include "cache/tier_registry.hpp"

#include "storage/directory_provisioner.hpp"
#include "tiers/tier_factory.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <utility>

namespace TierCache::Cache
{

TierRegistry::TierRegistry(
    const Config::CacheConfig& config, std::shared_ptr<const Utils::IClock> clock,
    LastError& last_error
)
    : config_(config), clock_(std::move(clock)), last_error_(last_error)
{
}

TierRegistry::~TierRegistry() { ShutdownAll(); }

TierAvailability TierRegistry::CheckTier(Tiers::ICacheTier& tier) const
{
    TierAvailability availability{tier.GetTier(), false, clock_->Now(), {}};
    if (auto init = tier.Initialize(); !init) {
        availability.reason = init.error().message();
        return availability;
    }
    if (auto check = tier.Verify(); !check) {
        availability.reason = check.error().message();
        if (auto shutdown = tier.Shutdown(); !shutdown) {
            spdlog::debug(
                "Shutting down tier '{}' failed: {}", tier.GetName(), shutdown.error().message()
            );
        }
        return availability;
    }
    availability.available = true;
    return availability;
}

void TierRegistry::Discover()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (discovered_ || discovering_) {
            return;
        }
        discovering_ = true;
    }

    Storage::DirectoryProvisioner provisioner(
        Constants::DIRECTORY_PROVISION_ATTEMPTS, Constants::DIRECTORY_PROVISION_DELAY,
        config_.global_settings.fallback_paths
    );
    fs::path cache_directory;
    if (auto provisioned = provisioner.Provision(config_.global_settings.cache_path)) {
        cache_directory = *provisioned;
        spdlog::info("Using cache directory {}", cache_directory.string());
    } else {
        spdlog::error("Unable to create writable cache directory");
        last_error_.Set("Unable to create writable cache directory");
    }

    Tiers::TierFactory factory(config_, clock_);
    std::vector<TierPtr> tiers;
    std::vector<TierAvailability> availability;
    for (const auto tier_id : Config::ALL_TIERS) {
        if (!config_.IsTierEnabled(tier_id)) {
            availability.push_back({tier_id, false, clock_->Now(), "disabled"});
            continue;
        }
        TierPtr tier = factory.Create(tier_id, cache_directory);
        if (!tier) {
            availability.push_back({tier_id, false, clock_->Now(), "no cache directory"});
            continue;
        }

        auto result = CheckTier(*tier);
        if (result.available) {
            spdlog::info("Tier '{}' available", tier->GetName());
            tiers.push_back(std::move(tier));
        } else {
            spdlog::debug("Tier '{}' unavailable: {}", tier->GetName(), result.reason);
        }
        availability.push_back(std::move(result));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    tiers_           = std::move(tiers);
    availability_    = std::move(availability);
    cache_directory_ = std::move(cache_directory);
    discovering_     = false;
    discovered_      = true;
}

bool TierRegistry::IsDiscovered() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return discovered_;
}

std::vector<TierPtr> TierRegistry::Available() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return tiers_;
}

std::vector<Config::Tier> TierRegistry::AvailableTiers() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Config::Tier> ids;
    ids.reserve(tiers_.size());
    for (const auto& tier : tiers_) {
        ids.push_back(tier->GetTier());
    }
    return ids;
}

TierPtr TierRegistry::Find(Config::Tier tier) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(tiers_.begin(), tiers_.end(), [tier](const TierPtr& candidate) {
        return candidate->GetTier() == tier;
    });
    return it != tiers_.end() ? *it : nullptr;
}

std::vector<TierAvailability> TierRegistry::Availability() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return availability_;
}

fs::path TierRegistry::CacheDirectory() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_directory_;
}

Storage::StorageResult<void> TierRegistry::RelocateFilesystemTier(const fs::path& directory)
{
    if (!config_.IsTierEnabled(Config::Tier::Filesystem)) {
        std::lock_guard<std::mutex> lock(mutex_);
        cache_directory_ = directory;
        last_error_.Set("Filesystem tier is disabled, cache path recorded only: " + directory.string());
        return {};
    }

    Tiers::TierFactory factory(config_, clock_);
    TierPtr replacement = factory.Create(Config::Tier::Filesystem, directory);
    if (!replacement) {
        return std::unexpected(Storage::make_error_code(Storage::StorageErrc::InvalidConfiguration));
    }
    if (auto init = replacement->Initialize(); !init) {
        return init;
    }

    TierPtr previous;
    bool rebuilt = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(tiers_.begin(), tiers_.end(), [](const TierPtr& candidate) {
            return candidate->GetTier() == Config::Tier::Filesystem;
        });
        if (it != tiers_.end()) {
            cache_directory_ = directory;
            previous         = std::exchange(*it, replacement);
        } else {
            rebuilt = true;
        }
    }

    if (rebuilt) {
        // The tier was unavailable at discovery, so it has to pass the round-trip check before serving
        if (auto check = replacement->Verify(); !check) {
            if (auto shutdown = replacement->Shutdown(); !shutdown) {
                spdlog::debug("Shutting down rebuilt filesystem tier failed: {}", shutdown.error().message());
            }
            return std::unexpected(check.error());
        }
        std::lock_guard<std::mutex> lock(mutex_);
        cache_directory_ = directory;
        auto pos = std::find_if(tiers_.begin(), tiers_.end(), [](const TierPtr& candidate) {
            return candidate->GetTier() > Config::Tier::Filesystem;
        });
        tiers_.insert(pos, replacement);
        for (auto& entry : availability_) {
            if (entry.tier == Config::Tier::Filesystem) {
                entry = {Config::Tier::Filesystem, true, clock_->Now(), {}};
            }
        }
        spdlog::info("Filesystem tier rebuilt at {}", directory.string());
        return {};
    }

    if (auto shutdown = previous->Shutdown(); !shutdown) {
        spdlog::debug("Shutting down previous filesystem tier failed: {}", shutdown.error().message());
    }
    spdlog::info("Filesystem tier moved to {}", directory.string());
    return {};
}

void TierRegistry::ShutdownAll()
{
    std::vector<TierPtr> tiers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tiers.swap(tiers_);
    }
    for (const auto& tier : tiers) {
        if (auto shutdown = tier->Shutdown(); !shutdown) {
            spdlog::debug(
                "Shutting down tier '{}' failed: {}", tier->GetName(), shutdown.error().message()
            );
        }
    }
}

}  // namespace TierCache::Cache
