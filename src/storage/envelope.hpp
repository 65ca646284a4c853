#ifndef TIERCACHE_SRC_STORAGE_ENVELOPE_HPP_
#define TIERCACHE_SRC_STORAGE_ENVELOPE_HPP_

#include "storage/cache_value.hpp"
#include "storage/storage_error.hpp"

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>

namespace TierCache::Storage
{

//------------------------------------------------------------------------------//
// Payload Encoding
//------------------------------------------------------------------------------//

std::string EncodePayload(const CacheValue& value);
StorageResult<CacheValue> DecodePayload(std::string_view text);

/// Absolute expiry for a TTL given in seconds. A TTL <= 0 is stored as one second.
std::time_t ComputeExpiry(std::time_t now, std::int64_t ttl_seconds);

inline bool IsExpired(std::time_t expires_at, std::time_t now) { return expires_at <= now; }

//------------------------------------------------------------------------------//
// Fixed-Width Envelope (filesystem and compiled artifact tiers)
//
// <10 decimal digits of expiry><payload>
//------------------------------------------------------------------------------//

std::string EncodeFileEnvelope(const CacheValue& value, std::time_t expires_at);
StorageResult<std::time_t> DecodeExpiryPrefix(std::string_view bytes);
StorageResult<TierEntry> DecodeFileEnvelope(std::string_view bytes);

//------------------------------------------------------------------------------//
// Record Envelope (mmap, shared memory and network tiers)
//
// {"expires":E,"data":V[,"key":K]}, NUL-padded to the extent size when it is
// written into a fixed-size object.
//------------------------------------------------------------------------------//

struct EnvelopeRecord {
    TierEntry entry;
    std::optional<std::string> key;
};

std::string EncodeRecord(
    const CacheValue& value, std::time_t expires_at, std::optional<std::string_view> key = {}
);
/// Decodes up to the first NUL byte; anything after it is padding.
StorageResult<EnvelopeRecord> DecodeRecord(std::string_view bytes);

/// Size of the fixed extent that holds an encoded record of the given size.
std::size_t ExtentSize(std::size_t encoded_size, std::size_t min_size);

}  // namespace TierCache::Storage

#endif  // TIERCACHE_SRC_STORAGE_ENVELOPE_HPP_
