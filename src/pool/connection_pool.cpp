#include "pool/connection_pool.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>
#include <thread>
#include <utility>
#include <vector>

namespace TierCache::Pool
{

using Storage::make_error_code;
using Storage::StorageErrc;

StorageResult<ConnectionPtr> CreateWithRetry(
    const ConnectionFactory& factory, const RetryPolicy& policy, const std::string& backend
)
{
    const int attempts    = std::max(1, policy.attempts);
    std::error_code last = make_error_code(StorageErrc::ConnectionFailed);
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        auto connection = factory();
        if (connection) {
            auto ping = (*connection)->Ping();
            if (ping) {
                return connection;
            }
            last = ping.error();
            (*connection)->Close();
        } else {
            last = connection.error();
        }
        spdlog::debug(
            "Connection attempt {}/{} to {} failed: {}", attempt, attempts, backend, last.message()
        );
        if (attempt < attempts) {
            std::this_thread::sleep_for(policy.delay);
        }
    }
    return std::unexpected(last);
}

//------------------------------------------------------------------------------//
// ConnectionLease
//------------------------------------------------------------------------------//

ConnectionLease::ConnectionLease(ConnectionLease&& other) noexcept
    : pool_(std::exchange(other.pool_, nullptr)),
      id_(other.id_),
      connection_(std::move(other.connection_)),
      broken_(other.broken_)
{
}

ConnectionLease::~ConnectionLease()
{
    if (pool_ != nullptr && connection_) {
        pool_->Release(id_, std::move(connection_), broken_);
    }
}

//------------------------------------------------------------------------------//
// ConnectionPool
//------------------------------------------------------------------------------//

ConnectionPool::ConnectionPool(
    std::string backend, const Config::PoolSettings& settings, RetryPolicy retry,
    ConnectionFactory factory
)
    : backend_(std::move(backend)),
      settings_(settings),
      retry_(retry),
      factory_(std::move(factory))
{
}

ConnectionPool::~ConnectionPool() { CloseAll(); }

std::size_t ConnectionPool::MaxIdle() const
{
    return std::max<std::size_t>(1, settings_.max_connections / 2);
}

void ConnectionPool::WarmUp()
{
    std::size_t to_create = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (warmed_) {
            return;
        }
        warmed_ = true;
        const auto target = std::min(settings_.min_connections, settings_.max_connections);
        if (open_ < target) {
            to_create = target - open_;
            open_ += to_create;
        }
    }

    std::vector<ConnectionPtr> created;
    for (std::size_t i = 0; i < to_create; ++i) {
        auto connection = CreateWithRetry(factory_, retry_, backend_);
        if (!connection) {
            spdlog::debug("Pre-creating connections to {} stopped after {}", backend_, i);
            break;
        }
        created.push_back(std::move(*connection));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    open_ -= to_create - created.size();
    const auto now = SteadyClock::now();
    for (auto& connection : created) {
        idle_.insert(IdleConnection{next_id_++, std::move(connection), now});
        total_created_++;
    }
}

StorageResult<ConnectionLease> ConnectionPool::Acquire()
{
    WarmUp();

    while (true) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto& by_recency = idle_.get<by_last_used>();
        if (!by_recency.empty()) {
            auto newest           = std::prev(by_recency.end());
            const auto id         = newest->id;
            ConnectionPtr candidate = newest->connection;
            by_recency.erase(newest);
            active_++;
            lock.unlock();

            if (candidate->IsOpen() && candidate->Ping()) {
                std::lock_guard<std::mutex> relock(mutex_);
                total_reused_++;
                return ConnectionLease(this, id, std::move(candidate));
            }

            spdlog::debug("Discarding unhealthy idle connection {} to {}", id, backend_);
            candidate->Close();
            std::lock_guard<std::mutex> relock(mutex_);
            active_--;
            open_--;
            total_discarded_++;
            continue;
        }

        if (open_ >= settings_.max_connections) {
            total_exhausted_++;
            spdlog::warn(
                "Connection pool for {} exhausted ({} connections in use)", backend_, active_
            );
            return std::unexpected(make_error_code(StorageErrc::PoolExhausted));
        }

        // Reserve the slot before dropping the lock for the network round trips
        open_++;
        active_++;
        const auto id = next_id_++;
        lock.unlock();

        auto connection = CreateWithRetry(factory_, retry_, backend_);
        std::lock_guard<std::mutex> relock(mutex_);
        if (!connection) {
            open_--;
            active_--;
            return std::unexpected(connection.error());
        }
        total_created_++;
        return ConnectionLease(this, id, std::move(*connection));
    }
}

void ConnectionPool::Release(std::uint64_t id, ConnectionPtr connection, bool broken)
{
    bool keep = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_--;
        keep = !broken && connection->IsOpen() && idle_.size() < MaxIdle();
        if (keep) {
            idle_.insert(IdleConnection{id, connection, SteadyClock::now()});
        } else {
            open_--;
            if (broken) {
                total_discarded_++;
            }
        }
    }
    if (!keep) {
        connection->Close();
    }
}

std::size_t ConnectionPool::CleanupIdle(SteadyClock::time_point now)
{
    std::vector<ConnectionPtr> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& by_recency = idle_.get<by_last_used>();
        auto it          = by_recency.begin();
        while (it != by_recency.end() && now - it->last_used > settings_.idle_timeout) {
            expired.push_back(it->connection);
            it = by_recency.erase(it);
            open_--;
        }
    }
    for (auto& connection : expired) {
        connection->Close();
    }
    if (!expired.empty()) {
        spdlog::debug("Closed {} idle connections to {}", expired.size(), backend_);
    }
    return expired.size();
}

void ConnectionPool::CloseAll()
{
    std::vector<ConnectionPtr> idle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : idle_) {
            idle.push_back(entry.connection);
        }
        open_ -= idle_.size();
        idle_.clear();
        warmed_ = false;
    }
    for (auto& connection : idle) {
        connection->Close();
    }
}

std::size_t ConnectionPool::IdleCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

std::size_t ConnectionPool::ActiveCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

nlohmann::json ConnectionPool::Stats() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return {
        {            "backend",         backend_},
        {             "active",          active_},
        {               "idle",     idle_.size()},
        {    "max_connections", settings_.max_connections},
        {      "total_created",   total_created_},
        {       "total_reused",    total_reused_},
        {    "total_discarded", total_discarded_},
        {    "total_exhausted", total_exhausted_},
    };
}

}  // namespace TierCache::Pool
