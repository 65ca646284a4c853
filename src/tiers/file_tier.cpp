#include "tiers/file_tier.hpp"

#include "app_constants.hpp"
#include "storage/directory_provisioner.hpp"
#include "storage/envelope.hpp"
#include "storage/key_hasher.hpp"
#include "storage/posix_file.hpp"

#include <spdlog/spdlog.h>

namespace TierCache::Tiers
{

namespace fs = std::filesystem;

FileTier::FileTier(
    const Config::FileSettings& settings, std::string key_prefix, fs::path directory,
    std::shared_ptr<const Utils::IClock> clock
)
    : settings_(settings),
      key_prefix_(std::move(key_prefix)),
      directory_(std::move(directory)),
      clock_(std::move(clock))
{
}

fs::path FileTier::PathForKey(const std::string& key) const
{
    return directory_ / (settings_.prefix + Storage::HashKey(key_prefix_ + key));
}

bool FileTier::IsOwnedFile(const fs::path& path) const
{
    const auto name = path.filename().string();
    if (!name.starts_with(settings_.prefix)) {
        return false;
    }
    return Storage::IsHashedName(std::string_view(name).substr(settings_.prefix.size()));
}

StorageResult<void> FileTier::Initialize()
{
    Storage::DirectoryProvisioner provisioner;
    auto res = provisioner.EnsureWritable(directory_);
    if (!res) {
        spdlog::error(
            "File tier directory {} is not writable: {}", directory_.string(),
            res.error().message()
        );
        return res;
    }
    spdlog::debug("File tier using directory {}", directory_.string());
    return {};
}

StorageResult<void> FileTier::Shutdown() { return {}; }

StorageResult<void> FileTier::Verify()
{
    if (!Storage::DirectoryProvisioner::IsWritableDirectory(directory_)) {
        return std::unexpected(make_error_code(StorageErrc::PermissionDenied));
    }
    return VerifyRoundTrip(*this);
}

StorageResult<TierEntry> FileTier::Get(const std::string& key)
{
    const auto path = PathForKey(key);
    auto bytes      = Storage::ReadFileLocked(path);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }

    auto entry = Storage::DecodeFileEnvelope(*bytes);
    if (!entry) {
        spdlog::debug("Removing undecodable cache file {}", path.string());
        corrupt_removed_++;
        if (auto rm = Storage::RemoveFile(path); !rm) {
            spdlog::debug("Failed to remove {}: {}", path.string(), rm.error().message());
        }
        return std::unexpected(entry.error());
    }

    if (Storage::IsExpired(*entry->expires_at, clock_->Now())) {
        expired_removed_++;
        if (auto rm = Storage::RemoveFile(path); !rm) {
            spdlog::debug("Failed to remove {}: {}", path.string(), rm.error().message());
        } else {
            unreported_expired_++;
        }
        return std::unexpected(make_error_code(StorageErrc::Expired));
    }
    return entry;
}

StorageResult<void> FileTier::Put(
    const std::string& key, const CacheValue& value, std::int64_t ttl_seconds
)
{
    const auto expires_at = Storage::ComputeExpiry(clock_->Now(), ttl_seconds);
    return Storage::WriteFileLocked(
        PathForKey(key), Storage::EncodeFileEnvelope(value, expires_at)
    );
}

StorageResult<void> FileTier::Remove(const std::string& key)
{
    return Storage::RemoveFile(PathForKey(key));
}

StorageResult<void> FileTier::Clear()
{
    std::error_code ec;
    fs::directory_iterator it(directory_, ec);
    if (ec) {
        return std::unexpected(Storage::ErrnoToErrorCode(ec.value()));
    }

    StorageResult<void> result{};
    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec) || !IsOwnedFile(entry.path())) {
            continue;
        }
        if (auto rm = Storage::RemoveFile(entry.path()); !rm) {
            spdlog::debug("Failed to clear {}: {}", entry.path().string(), rm.error().message());
            result = rm;
        }
    }
    return result;
}

StorageResult<std::size_t> FileTier::CleanupExpired()
{
    std::error_code ec;
    fs::directory_iterator it(directory_, ec);
    if (ec) {
        return std::unexpected(Storage::ErrnoToErrorCode(ec.value()));
    }

    const auto now      = clock_->Now();
    std::size_t removed = unreported_expired_.exchange(0);
    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec) || !IsOwnedFile(entry.path())) {
            continue;
        }

        auto prefix = Storage::ReadFilePrefixLocked(entry.path(), Constants::EXPIRY_FIELD_WIDTH);
        if (!prefix && Storage::IsMissError(prefix.error())) {
            continue;  // removed concurrently
        }

        bool stale = true;
        if (prefix) {
            auto expires_at = Storage::DecodeExpiryPrefix(*prefix);
            stale           = !expires_at || Storage::IsExpired(*expires_at, now);
        }
        if (stale && Storage::RemoveFile(entry.path())) {
            removed++;
        }
    }
    spdlog::debug("File tier cleanup removed {} entries", removed);
    return removed;
}

bool FileTier::IsHealthy()
{
    return Storage::DirectoryProvisioner::IsWritableDirectory(directory_);
}

nlohmann::json FileTier::Stats() const
{
    std::size_t files = 0;
    std::uintmax_t bytes = 0;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(directory_, ec)) {
        if (entry.is_regular_file(ec) && IsOwnedFile(entry.path())) {
            files++;
            bytes += entry.file_size(ec);
        }
    }
    return {
        {           "path",     directory_.string()},
        {          "files",                   files},
        {          "bytes",                   bytes},
        {"expired_removed", expired_removed_.load()},
        {"corrupt_removed", corrupt_removed_.load()},
    };
}

}  // namespace TierCache::Tiers
