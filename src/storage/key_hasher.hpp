#ifndef TIERCACHE_SRC_STORAGE_KEY_HASHER_HPP_
#define TIERCACHE_SRC_STORAGE_KEY_HASHER_HPP_

#include <sys/types.h>
#include <cstdint>
#include <string>
#include <string_view>

namespace TierCache::Storage
{

// 128-bit FNV-1a rendered as 32 lowercase hex digits
std::string HashKey(std::string_view key);

// 32-bit FNV-1a
std::uint32_t HashKey32(std::string_view key);

/// True when name is exactly a HashKey() output.
bool IsHashedName(std::string_view name);

/// SysV key inside the partition [base_key, base_key + 100000).
key_t SharedMemoryKey(std::int32_t base_key, std::string_view prefixed_key);

}  // namespace TierCache::Storage

#endif  // TIERCACHE_SRC_STORAGE_KEY_HASHER_HPP_
