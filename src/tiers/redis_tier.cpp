#include "tiers/redis_tier.hpp"

#include "net/redis_connection.hpp"
#include "storage/envelope.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>

namespace TierCache::Tiers
{

using Net::RedisConnection;
using Net::RespValue;

namespace
{

std::error_code ReplyError(const RespValue& reply)
{
    spdlog::debug("Key-value store replied with error: {}", reply.text);
    return make_error_code(StorageErrc::ProtocolError);
}

}  // namespace

RedisTier::RedisTier(
    const Config::NetworkSettings& settings, std::string prefix, bool pooling,
    std::shared_ptr<const Utils::IClock> clock
)
    : settings_(settings), prefix_(std::move(prefix)), pooling_(pooling), clock_(std::move(clock))
{
}

StorageResult<void> RedisTier::Initialize()
{
    if (!settings_.IsValid()) {
        return std::unexpected(make_error_code(StorageErrc::InvalidConfiguration));
    }
    const auto settings = settings_;
    source_             = std::make_unique<Pool::ConnectionSource>(
        GetName(), settings_, pooling_,
        [settings]() -> StorageResult<Pool::ConnectionPtr> {
            auto connection = RedisConnection::Open(settings);
            if (!connection) {
                return std::unexpected(connection.error());
            }
            return Pool::ConnectionPtr(std::move(*connection));
        }
    );
    return {};
}

StorageResult<void> RedisTier::Shutdown()
{
    if (source_) {
        source_->Close();
    }
    return {};
}

StorageResult<void> RedisTier::Verify() { return VerifyRoundTrip(*this); }

StorageResult<TierEntry> RedisTier::Get(const std::string& key)
{
    if (!source_) {
        return std::unexpected(make_error_code(StorageErrc::TierUnavailable));
    }
    const auto stored = StoredKey(key);
    return source_->Run<RedisConnection>([&](RedisConnection& conn) -> StorageResult<TierEntry> {
        auto reply = conn.Command({"GET", stored});
        if (!reply) {
            return std::unexpected(reply.error());
        }
        if (reply->IsNull()) {
            return std::unexpected(make_error_code(StorageErrc::CacheMiss));
        }
        if (reply->type != RespValue::Type::BulkString) {
            return std::unexpected(ReplyError(*reply));
        }

        auto record = Storage::DecodeRecord(reply->text);
        const bool stale =
            !record || Storage::IsExpired(*record->entry.expires_at, clock_->Now());
        if (stale) {
            if (auto del = conn.Command({"DEL", stored}); !del) {
                return std::unexpected(del.error());
            }
            return std::unexpected(
                record ? make_error_code(StorageErrc::Expired) : record.error()
            );
        }
        return std::move(record->entry);
    });
}

StorageResult<void> RedisTier::Put(
    const std::string& key, const CacheValue& value, std::int64_t ttl_seconds
)
{
    if (!source_) {
        return std::unexpected(make_error_code(StorageErrc::TierUnavailable));
    }
    const auto ttl     = std::max<std::int64_t>(1, ttl_seconds);
    const auto encoded = Storage::EncodeRecord(value, Storage::ComputeExpiry(clock_->Now(), ttl));
    const auto stored  = StoredKey(key);
    return source_->Run<RedisConnection>([&](RedisConnection& conn) -> StorageResult<void> {
        auto reply = conn.Command({"SET", stored, encoded, "EX", std::to_string(ttl)});
        if (!reply) {
            return std::unexpected(reply.error());
        }
        if (!reply->IsOk()) {
            return std::unexpected(ReplyError(*reply));
        }
        return {};
    });
}

StorageResult<void> RedisTier::Remove(const std::string& key)
{
    if (!source_) {
        return std::unexpected(make_error_code(StorageErrc::TierUnavailable));
    }
    const auto stored = StoredKey(key);
    return source_->Run<RedisConnection>([&](RedisConnection& conn) -> StorageResult<void> {
        auto reply = conn.Command({"DEL", stored});
        if (!reply) {
            return std::unexpected(reply.error());
        }
        if (reply->type != RespValue::Type::Integer) {
            return std::unexpected(ReplyError(*reply));
        }
        return {};
    });
}

StorageResult<void> RedisTier::Clear()
{
    if (!source_) {
        return std::unexpected(make_error_code(StorageErrc::TierUnavailable));
    }
    return source_->Run<RedisConnection>([](RedisConnection& conn) -> StorageResult<void> {
        auto reply = conn.Command({"FLUSHDB"});
        if (!reply) {
            return std::unexpected(reply.error());
        }
        if (!reply->IsOk()) {
            return std::unexpected(ReplyError(*reply));
        }
        return {};
    });
}

// The server expires keys on its own
StorageResult<std::size_t> RedisTier::CleanupExpired() { return std::size_t{0}; }

bool RedisTier::IsHealthy()
{
    if (!source_) {
        return false;
    }
    auto ping = source_->Run<RedisConnection>([](RedisConnection& conn) { return conn.Ping(); });
    return ping.has_value();
}

nlohmann::json RedisTier::Stats() const
{
    nlohmann::json stats = {
        {    "host", settings_.host},
        {    "port", settings_.port},
        {"database", settings_.database},
        {  "prefix",          prefix_},
        { "pooling",         pooling_},
    };
    stats["connections"] = ConnectionStats();
    return stats;
}

nlohmann::json RedisTier::ConnectionStats() const
{
    return source_ ? source_->Stats() : nlohmann::json::object();
}

std::size_t RedisTier::CleanupIdleConnections() { return source_ ? source_->CleanupIdle() : 0; }

//------------------------------------------------------------------------------//
// Batch Operations
//------------------------------------------------------------------------------//

StorageResult<std::vector<std::optional<TierEntry>>> RedisTier::GetMany(
    const std::vector<std::string>& keys
)
{
    using Entries = std::vector<std::optional<TierEntry>>;
    if (!source_) {
        return std::unexpected(make_error_code(StorageErrc::TierUnavailable));
    }
    if (keys.empty()) {
        return Entries{};
    }

    std::vector<std::string> command{"MGET"};
    for (const auto& key : keys) {
        command.push_back(StoredKey(key));
    }
    return source_->Run<RedisConnection>([&](RedisConnection& conn) -> StorageResult<Entries> {
        auto reply = conn.Command(command);
        if (!reply) {
            return std::unexpected(reply.error());
        }
        if (reply->type != RespValue::Type::Array || reply->elements.size() != keys.size()) {
            return std::unexpected(ReplyError(*reply));
        }

        const auto now = clock_->Now();
        Entries entries(keys.size());
        for (std::size_t i = 0; i < keys.size(); ++i) {
            const auto& element = reply->elements[i];
            if (element.type != RespValue::Type::BulkString) {
                continue;
            }
            auto record = Storage::DecodeRecord(element.text);
            if (record && !Storage::IsExpired(*record->entry.expires_at, now)) {
                entries[i] = std::move(record->entry);
            }
        }
        return entries;
    });
}

StorageResult<void> RedisTier::PutMany(
    const std::vector<std::pair<std::string, CacheValue>>& items, std::int64_t ttl_seconds
)
{
    if (!source_) {
        return std::unexpected(make_error_code(StorageErrc::TierUnavailable));
    }
    if (items.empty()) {
        return {};
    }

    const auto ttl        = std::max<std::int64_t>(1, ttl_seconds);
    const auto expires_at = Storage::ComputeExpiry(clock_->Now(), ttl);
    std::vector<std::vector<std::string>> commands;
    commands.reserve(items.size());
    for (const auto& [key, value] : items) {
        commands.push_back(
            {"SET", StoredKey(key), Storage::EncodeRecord(value, expires_at), "EX",
             std::to_string(ttl)}
        );
    }
    return source_->Run<RedisConnection>([&](RedisConnection& conn) -> StorageResult<void> {
        auto replies = conn.Pipeline(commands);
        if (!replies) {
            return std::unexpected(replies.error());
        }
        for (const auto& reply : *replies) {
            if (!reply.IsOk()) {
                return std::unexpected(ReplyError(reply));
            }
        }
        return {};
    });
}

StorageResult<std::size_t> RedisTier::RemoveMany(const std::vector<std::string>& keys)
{
    if (!source_) {
        return std::unexpected(make_error_code(StorageErrc::TierUnavailable));
    }
    if (keys.empty()) {
        return std::size_t{0};
    }

    std::vector<std::string> command{"DEL"};
    for (const auto& key : keys) {
        command.push_back(StoredKey(key));
    }
    return source_->Run<RedisConnection>([&](RedisConnection& conn) -> StorageResult<std::size_t> {
        auto reply = conn.Command(command);
        if (!reply) {
            return std::unexpected(reply.error());
        }
        if (reply->type != RespValue::Type::Integer) {
            return std::unexpected(ReplyError(*reply));
        }
        return static_cast<std::size_t>(reply->integer);
    });
}

}  // namespace TierCache::Tiers
