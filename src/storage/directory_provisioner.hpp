#ifndef TIERCACHE_SRC_STORAGE_DIRECTORY_PROVISIONER_HPP_
#define TIERCACHE_SRC_STORAGE_DIRECTORY_PROVISIONER_HPP_

#include "app_constants.hpp"
#include "storage/storage_error.hpp"

#include <chrono>
#include <filesystem>
#include <vector>

namespace TierCache::Storage
{

// Finds a writable cache directory, repairing permissions where it can
class DirectoryProvisioner
{
    public:
    explicit DirectoryProvisioner(
        int attempts                    = Constants::DIRECTORY_PROVISION_ATTEMPTS,
        std::chrono::milliseconds delay = Constants::DIRECTORY_PROVISION_DELAY,
        std::vector<std::filesystem::path> fallbacks = {}
    );

    /// Configured path first, then the fallbacks. Without explicit fallbacks these are the
    /// per-process temp directory, <cwd>/cache and <executable dir>/cache.
    /// Empty or duplicate candidates are skipped.
    std::vector<std::filesystem::path> Candidates(const std::filesystem::path& configured) const;

    /// First candidate that could be made writable.
    StorageResult<std::filesystem::path> Provision(const std::filesystem::path& configured) const;

    /// Creates the directory and retries with chmod 0755 and then 0777 until it is writable.
    StorageResult<void> EnsureWritable(const std::filesystem::path& dir) const;

    static bool IsWritableDirectory(const std::filesystem::path& dir);

    private:
    int attempts_;
    std::chrono::milliseconds delay_;
    std::vector<std::filesystem::path> fallbacks_;
};

}  // namespace TierCache::Storage

#endif  // TIERCACHE_SRC_STORAGE_DIRECTORY_PROVISIONER_HPP_
