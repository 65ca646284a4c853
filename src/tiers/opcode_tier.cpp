#include "tiers/opcode_tier.hpp"

#include "app_constants.hpp"
#include "storage/directory_provisioner.hpp"
#include "storage/envelope.hpp"
#include "storage/key_hasher.hpp"
#include "storage/posix_file.hpp"

#include <fcntl.h>
#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <unistd.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <csignal>

namespace TierCache::Tiers
{

namespace fs = std::filesystem;

OpcodeTier::OpcodeTier(
    const Config::OpcodeCacheSettings& settings, fs::path directory,
    std::shared_ptr<const Utils::IClock> clock
)
    : settings_(settings), directory_(std::move(directory)), clock_(std::move(clock))
{
}

fs::path OpcodeTier::PathForKey(const std::string& key) const
{
    return directory_ /
           (settings_.prefix + Storage::HashKey(key) + std::string(Constants::OPCODE_EXTENSION));
}

bool OpcodeTier::IsOwnedFile(const fs::path& path) const
{
    const auto name = path.filename().string();
    const auto ext  = Constants::OPCODE_EXTENSION;
    if (name.size() <= settings_.prefix.size() + ext.size() || !name.starts_with(settings_.prefix) ||
        !name.ends_with(ext)) {
        return false;
    }
    const auto hash = std::string_view(name).substr(
        settings_.prefix.size(), name.size() - settings_.prefix.size() - ext.size()
    );
    return Storage::IsHashedName(hash);
}

bool OpcodeTier::IsAbandonedTempFile(const fs::path& path) const
{
    // <owned name>.tmp.<pid>.<counter>, left behind when the writer died before the rename
    const auto name = path.filename().string();
    const auto mark = name.rfind(".tmp.");
    if (mark == std::string::npos || !IsOwnedFile(path.parent_path() / name.substr(0, mark))) {
        return false;
    }
    const auto suffix = std::string_view(name).substr(mark + 5);
    const auto dot    = suffix.find('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 == suffix.size()) {
        return false;
    }
    auto all_digits = [](std::string_view s) {
        return std::ranges::all_of(s, [](unsigned char c) {
            return std::isdigit(c) != 0;
        });
    };
    if (!all_digits(suffix.substr(0, dot)) || !all_digits(suffix.substr(dot + 1))) {
        return false;
    }
    pid_t writer = 0;
    const auto pid_text = suffix.substr(0, dot);
    if (std::from_chars(pid_text.data(), pid_text.data() + pid_text.size(), writer).ec !=
        std::errc()) {
        return false;
    }
    return ::kill(writer, 0) == -1 && errno == ESRCH;
}

StorageResult<OpcodeTier::FileIdentity> OpcodeTier::StatIdentity(const fs::path& path) const
{
    struct stat st {};
    if (::stat(path.c_str(), &st) == -1) {
        if (errno == ENOENT) {
            return std::unexpected(make_error_code(StorageErrc::CacheMiss));
        }
        return std::unexpected(Storage::ErrnoToErrorCode(errno));
    }
    return FileIdentity{
        st.st_ino, st.st_size,
        static_cast<std::int64_t>(st.st_mtim.tv_sec) * 1'000'000'000 + st.st_mtim.tv_nsec
    };
}

void OpcodeTier::Forget(const fs::path& path)
{
    std::lock_guard<std::mutex> lock(resident_mutex_);
    resident_.erase(path.filename().string());
}

StorageResult<void> OpcodeTier::Initialize()
{
    Storage::DirectoryProvisioner provisioner;
    return provisioner.EnsureWritable(directory_);
}

StorageResult<void> OpcodeTier::Shutdown()
{
    std::lock_guard<std::mutex> lock(resident_mutex_);
    resident_.clear();
    return {};
}

StorageResult<void> OpcodeTier::Verify()
{
    if (!Storage::DirectoryProvisioner::IsWritableDirectory(directory_)) {
        return std::unexpected(make_error_code(StorageErrc::PermissionDenied));
    }
    return VerifyRoundTrip(*this);
}

StorageResult<TierEntry> OpcodeTier::Get(const std::string& key)
{
    const auto path = PathForKey(key);
    const auto name = path.filename().string();

    auto identity = StatIdentity(path);
    if (!identity) {
        Forget(path);
        return std::unexpected(identity.error());
    }

    std::optional<TierEntry> entry;
    {
        std::lock_guard<std::mutex> lock(resident_mutex_);
        auto it = resident_.find(name);
        if (it != resident_.end() && it->second.identity == *identity) {
            entry = it->second.entry;
            resident_hits_++;
        }
    }

    if (!entry) {
        auto bytes = Storage::ReadFileLocked(path);
        if (!bytes) {
            return std::unexpected(bytes.error());
        }
        auto decoded = Storage::DecodeFileEnvelope(*bytes);
        if (!decoded) {
            Forget(path);
            if (auto rm = Storage::RemoveFile(path); !rm) {
                spdlog::debug("Failed to remove {}: {}", path.string(), rm.error().message());
            }
            return std::unexpected(decoded.error());
        }
        disk_loads_++;
        entry = *decoded;

        // Identity of the file just read; a concurrent rename gives a new inode
        auto loaded_identity = StatIdentity(path);
        if (loaded_identity && *loaded_identity == *identity) {
            std::lock_guard<std::mutex> lock(resident_mutex_);
            resident_[name] = ResidentImage{*identity, *entry};
        }
    }

    if (Storage::IsExpired(*entry->expires_at, clock_->Now())) {
        Forget(path);
        if (auto rm = Storage::RemoveFile(path); !rm) {
            spdlog::debug("Failed to remove {}: {}", path.string(), rm.error().message());
        } else {
            unreported_expired_++;
        }
        return std::unexpected(make_error_code(StorageErrc::Expired));
    }
    return *entry;
}

StorageResult<void> OpcodeTier::Put(
    const std::string& key, const CacheValue& value, std::int64_t ttl_seconds
)
{
    static std::atomic<std::uint64_t> temp_counter{0};

    const auto path       = PathForKey(key);
    const auto expires_at = Storage::ComputeExpiry(clock_->Now(), ttl_seconds);
    const auto temp_path  = fs::path(
        path.string() + ".tmp." + std::to_string(::getpid()) + "." + std::to_string(temp_counter++)
    );

    auto written =
        Storage::WriteFileLocked(temp_path, Storage::EncodeFileEnvelope(value, expires_at));
    if (!written) {
        if (auto rm = Storage::RemoveFile(temp_path); !rm) {
            spdlog::debug("Failed to remove {}: {}", temp_path.string(), rm.error().message());
        }
        return written;
    }
    if (::rename(temp_path.c_str(), path.c_str()) == -1) {
        int err = errno;
        if (auto rm = Storage::RemoveFile(temp_path); !rm) {
            spdlog::debug("Failed to remove {}: {}", temp_path.string(), rm.error().message());
        }
        return std::unexpected(Storage::ErrnoToErrorCode(err));
    }

    auto identity = StatIdentity(path);
    std::lock_guard<std::mutex> lock(resident_mutex_);
    if (identity) {
        resident_[path.filename().string()] = ResidentImage{*identity, TierEntry{value, expires_at}};
    } else {
        resident_.erase(path.filename().string());
    }
    return {};
}

StorageResult<void> OpcodeTier::Remove(const std::string& key)
{
    const auto path = PathForKey(key);
    Forget(path);
    return Storage::RemoveFile(path);
}

StorageResult<void> OpcodeTier::Clear()
{
    {
        std::lock_guard<std::mutex> lock(resident_mutex_);
        resident_.clear();
    }

    std::error_code ec;
    fs::directory_iterator it(directory_, ec);
    if (ec) {
        return std::unexpected(Storage::ErrnoToErrorCode(ec.value()));
    }
    StorageResult<void> result{};
    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec) ||
            (!IsOwnedFile(entry.path()) && !IsAbandonedTempFile(entry.path()))) {
            continue;
        }
        if (auto rm = Storage::RemoveFile(entry.path()); !rm) {
            result = rm;
        }
    }
    return result;
}

StorageResult<std::size_t> OpcodeTier::CleanupExpired()
{
    std::error_code ec;
    fs::directory_iterator it(directory_, ec);
    if (ec) {
        return std::unexpected(Storage::ErrnoToErrorCode(ec.value()));
    }

    const auto now      = clock_->Now();
    std::size_t removed = unreported_expired_.exchange(0);
    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        if (IsAbandonedTempFile(entry.path())) {
            if (auto rm = Storage::RemoveFile(entry.path()); !rm) {
                spdlog::debug("Failed to remove {}: {}", entry.path().string(), rm.error().message());
            }
            continue;
        }
        if (!IsOwnedFile(entry.path())) {
            continue;
        }
        auto prefix = Storage::ReadFilePrefixLocked(entry.path(), Constants::EXPIRY_FIELD_WIDTH);
        if (!prefix && Storage::IsMissError(prefix.error())) {
            continue;
        }
        bool stale = true;
        if (prefix) {
            auto expires_at = Storage::DecodeExpiryPrefix(*prefix);
            stale           = !expires_at || Storage::IsExpired(*expires_at, now);
        }
        if (stale) {
            Forget(entry.path());
            if (Storage::RemoveFile(entry.path())) {
                removed++;
            }
        }
    }
    return removed;
}

bool OpcodeTier::IsHealthy()
{
    return Storage::DirectoryProvisioner::IsWritableDirectory(directory_);
}

std::size_t OpcodeTier::ResidentCount() const
{
    std::lock_guard<std::mutex> lock(resident_mutex_);
    return resident_.size();
}

nlohmann::json OpcodeTier::Stats() const
{
    return {
        {         "path", directory_.string()},
        {     "resident",     ResidentCount()},
        {"resident_hits", resident_hits_.load()},
        {   "disk_loads",   disk_loads_.load()},
    };
}

}  // namespace TierCache::Tiers
