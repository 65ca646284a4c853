#ifndef TIERCACHE_SRC_STORAGE_CACHE_VALUE_HPP_
#define TIERCACHE_SRC_STORAGE_CACHE_VALUE_HPP_

#include <nlohmann/json.hpp>
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>

namespace TierCache::Storage
{

using CacheValue = nlohmann::json;

/// A value as read back from one tier, with its absolute expiry when the tier knows it.
struct TierEntry {
    CacheValue value;
    std::optional<std::time_t> expires_at;
};

/// Values that are never cached: null, false, zero, "", "0", [] and {}.
inline bool IsEmptyValue(const CacheValue &value)
{
    switch (value.type()) {
        case CacheValue::value_t::null:
        case CacheValue::value_t::discarded:
            return true;
        case CacheValue::value_t::boolean:
            return !value.get<bool>();
        case CacheValue::value_t::number_integer:
            return value.get<std::int64_t>() == 0;
        case CacheValue::value_t::number_unsigned:
            return value.get<std::uint64_t>() == 0;
        case CacheValue::value_t::number_float:
            return value.get<double>() == 0.0;
        case CacheValue::value_t::string: {
            const auto &str = value.get_ref<const std::string &>();
            return str.empty() || str == "0";
        }
        case CacheValue::value_t::array:
        case CacheValue::value_t::object:
        case CacheValue::value_t::binary:
            return value.empty();
        default:
            return false;
    }
}

}  // namespace TierCache::Storage

#endif  // TIERCACHE_SRC_STORAGE_CACHE_VALUE_HPP_
