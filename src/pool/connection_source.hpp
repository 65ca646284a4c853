#ifndef TIERCACHE_SRC_POOL_CONNECTION_SOURCE_HPP_
#define TIERCACHE_SRC_POOL_CONNECTION_SOURCE_HPP_

#include "config/config_types.hpp"
#include "pool/connection_pool.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <utility>

namespace TierCache::Pool
{

/// Errors after which a connection can no longer be trusted.
bool IsConnectionError(const std::error_code& ec);

// Where a network tier gets its connection from: a shared pool, or one lazily
// established direct connection when pooling is disabled.
class ConnectionSource
{
    public:
    ConnectionSource(
        std::string backend, const Config::NetworkSettings& settings, bool pooling,
        ConnectionFactory factory
    );
    ~ConnectionSource() { Close(); }

    ConnectionSource(const ConnectionSource&)            = delete;
    ConnectionSource& operator=(const ConnectionSource&) = delete;

    /// Runs fn with exclusive use of a connection of type Conn and hands the connection
    /// back afterwards. Connections that failed at the transport level are dropped.
    template <typename Conn, typename Fn>
    auto Run(Fn&& fn) -> std::invoke_result_t<Fn, Conn&>
    {
        using Result = std::invoke_result_t<Fn, Conn&>;

        if (pool_) {
            auto lease = pool_->Acquire();
            if (!lease) {
                return Result(std::unexpected(lease.error()));
            }
            Result result = fn(lease->template As<Conn>());
            if (!result && IsConnectionError(result.error())) {
                lease->MarkBroken();
            }
            return result;
        }

        std::lock_guard<std::mutex> lock(direct_mutex_);
        if (!direct_ || !direct_->IsOpen()) {
            auto connection = CreateWithRetry(factory_, retry_, backend_);
            if (!connection) {
                return Result(std::unexpected(connection.error()));
            }
            direct_ = std::move(*connection);
        }
        Result result = fn(static_cast<Conn&>(*direct_));
        if ((!result && IsConnectionError(result.error())) || !persistent_) {
            direct_->Close();
            direct_.reset();
        }
        return result;
    }

    void Close();
    std::size_t CleanupIdle();

    bool IsPooled() const { return static_cast<bool>(pool_); }
    nlohmann::json Stats() const;

    private:
    const std::string backend_;
    const RetryPolicy retry_;
    const bool persistent_;
    ConnectionFactory factory_;

    std::unique_ptr<ConnectionPool> pool_;

    std::mutex direct_mutex_;
    ConnectionPtr direct_;
};

}  // namespace TierCache::Pool

#endif  // TIERCACHE_SRC_POOL_CONNECTION_SOURCE_HPP_
