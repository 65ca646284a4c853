#ifndef TIERCACHE_SRC_NET_REDIS_REPLY_HPP_
#define TIERCACHE_SRC_NET_REDIS_REPLY_HPP_

#include "storage/storage_error.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace TierCache::Net
{

using Storage::StorageResult;

// Owned copy of one server reply, detached from the client library's reply object
struct RespValue {
    enum class Type { SimpleString, Error, Integer, BulkString, Null, Array };

    Type type = Type::Null;
    std::string text;  ///< Simple string, error or bulk payload
    std::int64_t integer = 0;
    std::vector<RespValue> elements;

    bool IsNull() const { return type == Type::Null; }
    bool IsError() const { return type == Type::Error; }
    bool IsOk() const { return type == Type::SimpleString && text == "OK"; }
};

}  // namespace TierCache::Net

#endif  // TIERCACHE_SRC_NET_REDIS_REPLY_HPP_
