#include "storage/directory_provisioner.hpp"

#include <spdlog/spdlog.h>
#include <unistd.h>
#include <algorithm>
#include <string>
#include <thread>
#include <utility>

namespace TierCache::Storage
{

namespace fs = std::filesystem;

DirectoryProvisioner::DirectoryProvisioner(
    int attempts, std::chrono::milliseconds delay, std::vector<fs::path> fallbacks
)
    : attempts_(std::max(attempts, 1)), delay_(delay), fallbacks_(std::move(fallbacks))
{
}

bool DirectoryProvisioner::IsWritableDirectory(const fs::path& dir)
{
    std::error_code ec;
    return fs::is_directory(dir, ec) && ::access(dir.c_str(), W_OK | X_OK) == 0;
}

std::vector<fs::path> DirectoryProvisioner::Candidates(const fs::path& configured) const
{
    std::vector<fs::path> candidates;
    auto add = [&candidates](const fs::path& p) {
        if (p.empty()) {
            return;
        }
        if (std::ranges::find(candidates, p) == candidates.end()) {
            candidates.push_back(p);
        }
    };

    add(configured);
    if (!fallbacks_.empty()) {
        for (const auto& fallback : fallbacks_) {
            add(fallback);
        }
        return candidates;
    }

    std::error_code ec;
    auto tmp = fs::temp_directory_path(ec);
    if (!ec) {
        add(tmp / ("tiercache_" + std::to_string(::getpid())));
    }

    auto cwd = fs::current_path(ec);
    if (!ec) {
        add(cwd / "cache");
    }

    auto exe = fs::read_symlink("/proc/self/exe", ec);
    if (!ec) {
        add(exe.parent_path() / "cache");
    }
    return candidates;
}

StorageResult<void> DirectoryProvisioner::EnsureWritable(const fs::path& dir) const
{
    std::error_code last_ec;
    for (int attempt = 0; attempt < attempts_; ++attempt) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            last_ec = ec;
            spdlog::debug(
                "Attempt {} to create cache directory {} failed: {}", attempt + 1, dir.string(),
                ec.message()
            );
        }

        if (IsWritableDirectory(dir)) {
            return {};
        }

        if (fs::is_directory(dir, ec)) {
            fs::permissions(dir, static_cast<fs::perms>(0755), fs::perm_options::replace, ec);
            if (IsWritableDirectory(dir)) {
                return {};
            }
            fs::permissions(dir, static_cast<fs::perms>(0777), fs::perm_options::replace, ec);
            if (IsWritableDirectory(dir)) {
                return {};
            }
            if (ec) {
                last_ec = ec;
            }
        }

        if (attempt + 1 < attempts_ && delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }
    }

    if (last_ec && (last_ec.category() == std::generic_category() ||
                    last_ec.category() == std::system_category())) {
        return std::unexpected(ErrnoToErrorCode(last_ec.value()));
    }
    return std::unexpected(make_error_code(StorageErrc::PermissionDenied));
}

StorageResult<fs::path> DirectoryProvisioner::Provision(const fs::path& configured) const
{
    for (const auto& candidate : Candidates(configured)) {
        auto res = EnsureWritable(candidate);
        if (res) {
            if (candidate != configured) {
                spdlog::warn(
                    "Cache directory {} unusable, falling back to {}", configured.string(),
                    candidate.string()
                );
            }
            return candidate;
        }
        spdlog::debug(
            "Cache directory candidate {} rejected: {}", candidate.string(), res.error().message()
        );
    }
    return std::unexpected(make_error_code(StorageErrc::PermissionDenied));
}

}  // namespace TierCache::Storage
