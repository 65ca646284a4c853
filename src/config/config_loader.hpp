#ifndef TIERCACHE_SRC_CONFIG_CONFIG_LOADER_HPP_
#define TIERCACHE_SRC_CONFIG_CONFIG_LOADER_HPP_

#include "config/config_types.hpp"

#include <nlohmann/json.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>

namespace TierCache::Config
{

//------------------------------------------------------------------------------//
// Error Handling for Configuration Loading
//------------------------------------------------------------------------------//

enum class LoadError {
    FileNotFound,
    JsonParseError,
    ValidationError,
};

using LoadResult   = std::expected<CacheConfig, LoadError>;
using LoadErrorMsg = std::expected<CacheConfig, std::string>;
using ApplyResult  = std::expected<void, LoadError>;

LoadResult loadConfigFromFile(const std::filesystem::path &file_path);
LoadErrorMsg loadConfigFromFileVerbose(const std::filesystem::path &file_path);

/// Builds a configuration from an already parsed document.
LoadResult ParseConfig(const nlohmann::json &document);

/// Applies a per-tier option map. Unknown keys are ignored, missing keys keep their value,
/// malformed values are rejected.
ApplyResult ApplyTierOptions(CacheConfig &config, Tier tier, const nlohmann::json &options);

ApplyResult ApplyGlobalOptions(GlobalSettings &settings, const nlohmann::json &options);

// Parses a size string (e.g., "500MB", "64k", "1024") into bytes.
std::optional<std::uint64_t> ParseSizeStringToBytes(const std::string &size_str);

std::string LoadErrorToString(LoadError error);

}  // namespace TierCache::Config

#endif  // TIERCACHE_SRC_CONFIG_CONFIG_LOADER_HPP_
