#include "warming/file_warmer.hpp"

#include "cache/cache_engine.hpp"
#include "storage/posix_file.hpp"

#include <spdlog/spdlog.h>
#include <sstream>

namespace TierCache::Warming
{

std::optional<FileParser> StringToFileParser(const std::string& parser_str)
{
    if (parser_str == "raw") {
        return FileParser::Raw;
    }
    if (parser_str == "json") {
        return FileParser::Json;
    }
    if (parser_str == "lines") {
        return FileParser::Lines;
    }
    return std::nullopt;
}

FileWarmer::FileWarmer(std::vector<FileSource> sources, std::string name, std::int64_t default_ttl)
    : sources_(std::move(sources)), name_(std::move(name)), default_ttl_(default_ttl)
{
}

std::optional<Storage::CacheValue> FileWarmer::Load(const FileSource& source)
{
    auto content = Storage::ReadFileLocked(source.file);
    if (!content) {
        spdlog::warn(
            "Skipping warm source '{}': cannot read {}: {}", source.cache_key,
            source.file.string(), content.error().message()
        );
        return std::nullopt;
    }

    switch (source.parser) {
        case FileParser::Json: {
            auto document = nlohmann::json::parse(*content, nullptr, false);
            if (document.is_discarded()) {
                spdlog::warn(
                    "Skipping warm source '{}': {} is not valid JSON", source.cache_key,
                    source.file.string()
                );
                return std::nullopt;
            }
            return document;
        }
        case FileParser::Lines: {
            Storage::CacheValue lines = Storage::CacheValue::array();
            std::istringstream stream(*content);
            std::string line;
            while (std::getline(stream, line)) {
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                if (!line.empty()) {
                    lines.push_back(line);
                }
            }
            return lines;
        }
        case FileParser::Raw:
        default:
            return Storage::CacheValue(std::move(*content));
    }
}

std::size_t FileWarmer::Warm(Cache::CacheEngine& engine)
{
    std::size_t warmed = 0;
    for (const auto& source : sources_) {
        auto value = Load(source);
        if (!value) {
            continue;
        }
        if (engine.Set(source.cache_key, *value, source.ttl_seconds.value_or(default_ttl_))) {
            ++warmed;
        } else {
            spdlog::debug("Warmer '{}' could not store '{}'", name_, source.cache_key);
        }
    }
    spdlog::info("Warmer '{}' stored {} of {} entries", name_, warmed, sources_.size());
    return warmed;
}

}  // namespace TierCache::Warming
