#ifndef TIERCACHE_SRC_WARMING_FILE_WARMER_HPP_
#define TIERCACHE_SRC_WARMING_FILE_WARMER_HPP_

#include "app_constants.hpp"
#include "storage/cache_value.hpp"
#include "warming/i_cache_warmer.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace TierCache::Warming
{

enum class FileParser { Raw, Json, Lines };

std::optional<FileParser> StringToFileParser(const std::string& parser_str);

struct FileSource {
    std::string cache_key;
    std::filesystem::path file;
    std::optional<std::int64_t> ttl_seconds;  ///< Warmer default when unset
    FileParser parser = FileParser::Raw;
};

// Loads cache entries from files on disk
class FileWarmer : public ICacheWarmer
{
    public:
    explicit FileWarmer(
        std::vector<FileSource> sources, std::string name = "file",
        std::int64_t default_ttl = Constants::DEFAULT_TTL_SECONDS
    );

    // ICacheWarmer Implementation
    std::size_t Warm(Cache::CacheEngine& engine) override;
    const std::string& Name() const override { return name_; }
    bool IsApplicable() const override { return !sources_.empty(); }

    /// Reads and parses one source. Missing, unreadable and unparsable files give nullopt.
    static std::optional<Storage::CacheValue> Load(const FileSource& source);

    private:
    std::vector<FileSource> sources_;
    std::string name_;
    std::int64_t default_ttl_;
};

}  // namespace TierCache::Warming

#endif  // TIERCACHE_SRC_WARMING_FILE_WARMER_HPP_
