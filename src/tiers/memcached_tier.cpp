#include "tiers/memcached_tier.hpp"

#include "net/memcached_connection.hpp"
#include "storage/envelope.hpp"
#include "storage/key_hasher.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>

namespace TierCache::Tiers
{

using Net::MemcachedConnection;

namespace
{

bool IsProtocolSafe(const std::string& key)
{
    return std::none_of(key.begin(), key.end(), [](unsigned char c) {
        return c <= 0x20 || c == 0x7f;
    });
}

}  // namespace

MemcachedTier::MemcachedTier(
    const Config::NetworkSettings& settings, std::string prefix, bool pooling,
    std::shared_ptr<const Utils::IClock> clock
)
    : settings_(settings), prefix_(std::move(prefix)), pooling_(pooling), clock_(std::move(clock))
{
}

std::string MemcachedTier::StoredKey(const std::string& key) const
{
    auto stored = prefix_ + key;
    if (stored.size() > Constants::MEMCACHED_MAX_KEY_LENGTH || !IsProtocolSafe(stored)) {
        stored = prefix_ + "h:" + Storage::HashKey(key);
    }
    return stored;
}

std::int64_t MemcachedTier::ExpirationTime(std::int64_t ttl_seconds) const
{
    const auto ttl = std::max<std::int64_t>(1, ttl_seconds);
    if (ttl > Constants::MEMCACHED_RELATIVE_TTL_LIMIT) {
        return static_cast<std::int64_t>(clock_->Now()) + ttl;
    }
    return ttl;
}

StorageResult<void> MemcachedTier::Initialize()
{
    if (!settings_.IsValid()) {
        return std::unexpected(make_error_code(StorageErrc::InvalidConfiguration));
    }
    const auto settings = settings_;
    source_             = std::make_unique<Pool::ConnectionSource>(
        GetName(), settings_, pooling_,
        [settings]() -> StorageResult<Pool::ConnectionPtr> {
            auto connection = MemcachedConnection::Open(settings);
            if (!connection) {
                return std::unexpected(connection.error());
            }
            return Pool::ConnectionPtr(std::move(*connection));
        }
    );
    return {};
}

StorageResult<void> MemcachedTier::Shutdown()
{
    if (source_) {
        source_->Close();
    }
    return {};
}

StorageResult<void> MemcachedTier::Verify() { return VerifyRoundTrip(*this); }

StorageResult<TierEntry> MemcachedTier::Get(const std::string& key)
{
    if (!source_) {
        return std::unexpected(make_error_code(StorageErrc::TierUnavailable));
    }
    const auto stored = StoredKey(key);
    return source_->Run<MemcachedConnection>(
        [&](MemcachedConnection& conn) -> StorageResult<TierEntry> {
            auto values = conn.Get({stored});
            if (!values) {
                return std::unexpected(values.error());
            }
            auto it = values->find(stored);
            if (it == values->end()) {
                return std::unexpected(make_error_code(StorageErrc::CacheMiss));
            }

            auto record = Storage::DecodeRecord(it->second);
            if (!record || Storage::IsExpired(*record->entry.expires_at, clock_->Now())) {
                if (auto del = conn.Delete(stored); !del) {
                    return std::unexpected(del.error());
                }
                return std::unexpected(
                    record ? make_error_code(StorageErrc::Expired) : record.error()
                );
            }
            return std::move(record->entry);
        }
    );
}

StorageResult<void> MemcachedTier::Put(
    const std::string& key, const CacheValue& value, std::int64_t ttl_seconds
)
{
    if (!source_) {
        return std::unexpected(make_error_code(StorageErrc::TierUnavailable));
    }
    const auto stored  = StoredKey(key);
    const auto encoded = Storage::EncodeRecord(
        value, Storage::ComputeExpiry(clock_->Now(), ttl_seconds)
    );
    const auto exptime = ExpirationTime(ttl_seconds);
    return source_->Run<MemcachedConnection>([&](MemcachedConnection& conn) {
        return conn.Set(stored, encoded, exptime);
    });
}

StorageResult<void> MemcachedTier::Remove(const std::string& key)
{
    if (!source_) {
        return std::unexpected(make_error_code(StorageErrc::TierUnavailable));
    }
    const auto stored = StoredKey(key);
    return source_->Run<MemcachedConnection>(
        [&](MemcachedConnection& conn) -> StorageResult<void> {
            auto deleted = conn.Delete(stored);
            if (!deleted) {
                return std::unexpected(deleted.error());
            }
            return {};
        }
    );
}

StorageResult<void> MemcachedTier::Clear()
{
    if (!source_) {
        return std::unexpected(make_error_code(StorageErrc::TierUnavailable));
    }
    return source_->Run<MemcachedConnection>([](MemcachedConnection& conn) {
        return conn.FlushAll();
    });
}

// The server expires keys on its own
StorageResult<std::size_t> MemcachedTier::CleanupExpired() { return std::size_t{0}; }

bool MemcachedTier::IsHealthy()
{
    if (!source_) {
        return false;
    }
    auto ping = source_->Run<MemcachedConnection>([](MemcachedConnection& conn) {
        return conn.Ping();
    });
    return ping.has_value();
}

nlohmann::json MemcachedTier::Stats() const
{
    nlohmann::json stats = {
        {   "host", settings_.host},
        {   "port", settings_.port},
        { "prefix",        prefix_},
        {"pooling",       pooling_},
    };
    stats["connections"] = ConnectionStats();
    if (source_) {
        auto server = source_->Run<MemcachedConnection>([](MemcachedConnection& conn) {
            return conn.ServerStats();
        });
        if (server) {
            stats["server"] = *server;
        } else {
            spdlog::debug("Memcached server stats unavailable: {}", server.error().message());
        }
    }
    return stats;
}

nlohmann::json MemcachedTier::ConnectionStats() const
{
    return source_ ? source_->Stats() : nlohmann::json::object();
}

std::size_t MemcachedTier::CleanupIdleConnections()
{
    return source_ ? source_->CleanupIdle() : 0;
}

//------------------------------------------------------------------------------//
// Batch Operations
//------------------------------------------------------------------------------//

StorageResult<std::vector<std::optional<TierEntry>>> MemcachedTier::GetMany(
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

    std::vector<std::string> stored;
    stored.reserve(keys.size());
    for (const auto& key : keys) {
        stored.push_back(StoredKey(key));
    }
    return source_->Run<MemcachedConnection>(
        [&](MemcachedConnection& conn) -> StorageResult<Entries> {
            auto values = conn.Get(stored);
            if (!values) {
                return std::unexpected(values.error());
            }

            const auto now = clock_->Now();
            Entries entries(keys.size());
            for (std::size_t i = 0; i < stored.size(); ++i) {
                auto it = values->find(stored[i]);
                if (it == values->end()) {
                    continue;
                }
                auto record = Storage::DecodeRecord(it->second);
                if (record && !Storage::IsExpired(*record->entry.expires_at, now)) {
                    entries[i] = std::move(record->entry);
                }
            }
            return entries;
        }
    );
}

StorageResult<void> MemcachedTier::PutMany(
    const std::vector<std::pair<std::string, CacheValue>>& items, std::int64_t ttl_seconds
)
{
    if (!source_) {
        return std::unexpected(make_error_code(StorageErrc::TierUnavailable));
    }
    const auto expires_at = Storage::ComputeExpiry(clock_->Now(), ttl_seconds);
    const auto exptime    = ExpirationTime(ttl_seconds);
    return source_->Run<MemcachedConnection>(
        [&](MemcachedConnection& conn) -> StorageResult<void> {
            for (const auto& [key, value] : items) {
                auto set = conn.Set(StoredKey(key), Storage::EncodeRecord(value, expires_at), exptime);
                if (!set) {
                    return set;
                }
            }
            return {};
        }
    );
}

StorageResult<std::size_t> MemcachedTier::RemoveMany(const std::vector<std::string>& keys)
{
    if (!source_) {
        return std::unexpected(make_error_code(StorageErrc::TierUnavailable));
    }
    return source_->Run<MemcachedConnection>(
        [&](MemcachedConnection& conn) -> StorageResult<std::size_t> {
            std::size_t removed = 0;
            for (const auto& key : keys) {
                auto deleted = conn.Delete(StoredKey(key));
                if (!deleted) {
                    return std::unexpected(deleted.error());
                }
                if (*deleted) {
                    removed++;
                }
            }
            return removed;
        }
    );
}

}  // namespace TierCache::Tiers
