#include "storage/key_hasher.hpp"

#include "app_constants.hpp"

#include <algorithm>

namespace TierCache::Storage
{

namespace
{

using uint128 = unsigned __int128;

constexpr uint128 MakeUint128(std::uint64_t high, std::uint64_t low)
{
    return (static_cast<uint128>(high) << 64) | low;
}

constexpr uint128 FNV128_OFFSET_BASIS = MakeUint128(0x6c62272e07bb0142ULL, 0x62b821756295c58dULL);
constexpr uint128 FNV128_PRIME        = MakeUint128(0x0000000001000000ULL, 0x000000000000013bULL);

constexpr std::uint32_t FNV32_OFFSET_BASIS = 2166136261U;
constexpr std::uint32_t FNV32_PRIME        = 16777619U;

constexpr std::size_t HASH_HEX_LENGTH = 32;

void AppendHex(std::string &out, std::uint64_t word)
{
    static constexpr char digits[] = "0123456789abcdef";
    for (int shift = 60; shift >= 0; shift -= 4) {
        out.push_back(digits[(word >> shift) & 0xF]);
    }
}

}  // namespace

std::string HashKey(std::string_view key)
{
    uint128 hash = FNV128_OFFSET_BASIS;
    for (unsigned char c : key) {
        hash ^= c;
        hash *= FNV128_PRIME;
    }

    std::string out;
    out.reserve(HASH_HEX_LENGTH);
    AppendHex(out, static_cast<std::uint64_t>(hash >> 64));
    AppendHex(out, static_cast<std::uint64_t>(hash));
    return out;
}

std::uint32_t HashKey32(std::string_view key)
{
    std::uint32_t hash = FNV32_OFFSET_BASIS;
    for (unsigned char c : key) {
        hash ^= c;
        hash *= FNV32_PRIME;
    }
    return hash;
}

bool IsHashedName(std::string_view name)
{
    return name.size() == HASH_HEX_LENGTH && std::ranges::all_of(name, [](char c) {
               return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
           });
}

key_t SharedMemoryKey(std::int32_t base_key, std::string_view prefixed_key)
{
    const auto offset = HashKey32(prefixed_key) % Constants::SHM_KEY_PARTITION_SIZE;
    return static_cast<key_t>(base_key + static_cast<std::int32_t>(offset));
}

}  // namespace TierCache::Storage
