#include "storage/envelope.hpp"

#include "app_constants.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <charconv>
#include <cstdio>
#include <cstring>

namespace TierCache::Storage
{

std::string EncodePayload(const CacheValue& value)
{
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

StorageResult<CacheValue> DecodePayload(std::string_view text)
{
    auto value = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
    if (value.is_discarded()) {
        return std::unexpected(make_error_code(StorageErrc::CorruptEntry));
    }
    return value;
}

std::time_t ComputeExpiry(std::time_t now, std::int64_t ttl_seconds)
{
    if (ttl_seconds <= 0) {
        ttl_seconds = 1;
    }
    return now + static_cast<std::time_t>(ttl_seconds);
}

std::string EncodeFileEnvelope(const CacheValue& value, std::time_t expires_at)
{
    const auto clamped = std::clamp<std::int64_t>(expires_at, 0, Constants::MAX_ENCODED_EXPIRY);

    char header[Constants::EXPIRY_FIELD_WIDTH + 1];
    std::snprintf(header, sizeof(header), "%010lld", static_cast<long long>(clamped));

    std::string out(header, Constants::EXPIRY_FIELD_WIDTH);
    out += EncodePayload(value);
    return out;
}

StorageResult<std::time_t> DecodeExpiryPrefix(std::string_view bytes)
{
    if (bytes.size() < Constants::EXPIRY_FIELD_WIDTH) {
        return std::unexpected(make_error_code(StorageErrc::CorruptEntry));
    }
    const auto field = bytes.substr(0, Constants::EXPIRY_FIELD_WIDTH);
    if (!std::ranges::all_of(field, [](char c) { return c >= '0' && c <= '9'; })) {
        return std::unexpected(make_error_code(StorageErrc::CorruptEntry));
    }

    long long expires_at = 0;
    auto res = std::from_chars(field.data(), field.data() + field.size(), expires_at);
    if (res.ec != std::errc()) {
        return std::unexpected(make_error_code(StorageErrc::CorruptEntry));
    }
    return static_cast<std::time_t>(expires_at);
}

StorageResult<TierEntry> DecodeFileEnvelope(std::string_view bytes)
{
    auto expires_at = DecodeExpiryPrefix(bytes);
    if (!expires_at) {
        return std::unexpected(expires_at.error());
    }
    auto value = DecodePayload(bytes.substr(Constants::EXPIRY_FIELD_WIDTH));
    if (!value) {
        return std::unexpected(value.error());
    }
    return TierEntry{std::move(*value), *expires_at};
}

std::string EncodeRecord(
    const CacheValue& value, std::time_t expires_at, std::optional<std::string_view> key
)
{
    nlohmann::json record = {
        {"expires", static_cast<std::int64_t>(expires_at)},
        {   "data",                                  value}
    };
    if (key) {
        record["key"] = std::string(*key);
    }
    return EncodePayload(record);
}

StorageResult<EnvelopeRecord> DecodeRecord(std::string_view bytes)
{
    const auto nul = bytes.find('\0');
    if (nul != std::string_view::npos) {
        bytes = bytes.substr(0, nul);
    }
    if (bytes.empty()) {
        return std::unexpected(make_error_code(StorageErrc::CorruptEntry));
    }

    auto parsed = DecodePayload(bytes);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    const auto& record = *parsed;
    if (!record.is_object() || !record.contains("data") || !record.contains("expires") ||
        !record.at("expires").is_number_integer()) {
        spdlog::trace("Envelope record is missing required fields");
        return std::unexpected(make_error_code(StorageErrc::CorruptEntry));
    }

    EnvelopeRecord out;
    out.entry.value      = record.at("data");
    out.entry.expires_at = static_cast<std::time_t>(record.at("expires").get<std::int64_t>());
    if (record.contains("key") && record.at("key").is_string()) {
        out.key = record.at("key").get<std::string>();
    }
    return out;
}

std::size_t ExtentSize(std::size_t encoded_size, std::size_t min_size)
{
    return std::max(encoded_size + Constants::ENVELOPE_HEADROOM, min_size);
}

}  // namespace TierCache::Storage
