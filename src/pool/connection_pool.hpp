#ifndef TIERCACHE_SRC_POOL_CONNECTION_POOL_HPP_
#define TIERCACHE_SRC_POOL_CONNECTION_POOL_HPP_

#include "config/config_types.hpp"
#include "net/i_network_connection.hpp"
#include "storage/storage_error.hpp"

#include "boost/multi_index/hashed_index.hpp"
#include "boost/multi_index/indexed_by.hpp"
#include "boost/multi_index/member.hpp"
#include "boost/multi_index/ordered_index.hpp"
#include "boost/multi_index_container.hpp"

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace TierCache::Pool
{

namespace bmi = boost::multi_index;

using Storage::StorageResult;
using ConnectionPtr     = std::shared_ptr<Net::INetworkConnection>;
using ConnectionFactory = std::function<StorageResult<ConnectionPtr>()>;
using SteadyClock       = std::chrono::steady_clock;

struct RetryPolicy {
    int attempts                    = Constants::DEFAULT_RETRY_ATTEMPTS;
    std::chrono::milliseconds delay = Constants::DEFAULT_RETRY_DELAY;

    static RetryPolicy FromSettings(const Config::NetworkSettings& settings)
    {
        return RetryPolicy{settings.retry_attempts, settings.retry_delay};
    }
};

/// Runs the factory up to max(1, attempts) times with a fixed pause and returns the first
/// connection that answers a ping.
StorageResult<ConnectionPtr> CreateWithRetry(
    const ConnectionFactory& factory, const RetryPolicy& policy, const std::string& backend
);

class ConnectionPool;

// Exclusive use of one pooled connection; returned to the pool on destruction
class ConnectionLease
{
    public:
    ConnectionLease(ConnectionPool* pool, std::uint64_t id, ConnectionPtr connection)
        : pool_(pool), id_(id), connection_(std::move(connection))
    {
    }
    ~ConnectionLease();

    ConnectionLease(const ConnectionLease&)            = delete;
    ConnectionLease& operator=(const ConnectionLease&) = delete;
    ConnectionLease(ConnectionLease&& other) noexcept;
    ConnectionLease& operator=(ConnectionLease&&) = delete;

    template <typename T>
    T& As()
    {
        return static_cast<T&>(*connection_);
    }

    /// The connection is closed instead of being kept idle.
    void MarkBroken() { broken_ = true; }

    std::uint64_t Id() const { return id_; }

    private:
    ConnectionPool* pool_;
    std::uint64_t id_;
    ConnectionPtr connection_;
    bool broken_ = false;
};

// Bounded set of reusable connections to one backend. Must outlive its leases.
class ConnectionPool
{
    private:
    //------------------------------------------------------------------------------//
    // Internal Types
    //------------------------------------------------------------------------------//
    struct IdleConnection {
        std::uint64_t id;
        ConnectionPtr connection;
        SteadyClock::time_point last_used;
    };

    // Index tags
    struct by_id {
    };
    struct by_last_used {
    };

    using IdleContainer = bmi::multi_index_container<
        IdleConnection,
        bmi::indexed_by<
            bmi::hashed_unique<
                bmi::tag<by_id>, bmi::member<IdleConnection, std::uint64_t, &IdleConnection::id>>,
            bmi::ordered_non_unique<
                bmi::tag<by_last_used>,
                bmi::member<IdleConnection, SteadyClock::time_point, &IdleConnection::last_used>>>>;

    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//
    ConnectionPool(
        std::string backend, const Config::PoolSettings& settings, RetryPolicy retry,
        ConnectionFactory factory
    );
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&)            = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;
    ConnectionPool(ConnectionPool&&)                 = delete;
    ConnectionPool& operator=(ConnectionPool&&)      = delete;

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//

    /// A healthy idle connection, or a new one while under max_connections.
    /// The first call also opens min_connections connections.
    StorageResult<ConnectionLease> Acquire();

    /// Closes idle connections unused for longer than idle_timeout.
    std::size_t CleanupIdle(SteadyClock::time_point now = SteadyClock::now());

    void CloseAll();

    nlohmann::json Stats() const;
    const std::string& Backend() const { return backend_; }
    std::size_t IdleCount() const;
    std::size_t ActiveCount() const;

    private:
    friend class ConnectionLease;

    //------------------------------------------------------------------------------//
    // Private Methods
    //------------------------------------------------------------------------------//
    void Release(std::uint64_t id, ConnectionPtr connection, bool broken);
    void WarmUp();
    std::size_t MaxIdle() const;

    //------------------------------------------------------------------------------//
    // Private Fields
    //------------------------------------------------------------------------------//
    const std::string backend_;
    const Config::PoolSettings settings_;
    const RetryPolicy retry_;
    ConnectionFactory factory_;

    mutable std::mutex mutex_;
    IdleContainer idle_;
    std::size_t open_    = 0;  ///< Idle plus active, including slots reserved for creation
    std::size_t active_  = 0;
    std::uint64_t next_id_ = 1;
    bool warmed_         = false;

    std::uint64_t total_created_   = 0;
    std::uint64_t total_reused_    = 0;
    std::uint64_t total_discarded_ = 0;
    std::uint64_t total_exhausted_ = 0;
};

}  // namespace TierCache::Pool

#endif  // TIERCACHE_SRC_POOL_CONNECTION_POOL_HPP_
