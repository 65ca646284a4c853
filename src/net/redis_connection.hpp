#ifndef TIERCACHE_SRC_NET_REDIS_CONNECTION_HPP_
#define TIERCACHE_SRC_NET_REDIS_CONNECTION_HPP_

#include "config/config_types.hpp"
#include "net/i_network_connection.hpp"
#include "net/redis_reply.hpp"

#include <memory>
#include <string>
#include <vector>

struct redisContext;
struct redisReply;

namespace TierCache::Net
{

// Key-value store connection on top of a hiredis context
class RedisConnection : public INetworkConnection
{
    public:
    using ContextPtr = std::unique_ptr<redisContext, void (*)(redisContext*)>;

    /// Connects, authenticates when a password is configured and selects the database.
    static StorageResult<std::unique_ptr<RedisConnection>> Open(
        const Config::NetworkSettings& settings
    );

    explicit RedisConnection(ContextPtr context);
    ~RedisConnection() override = default;

    RedisConnection(const RedisConnection&)            = delete;
    RedisConnection& operator=(const RedisConnection&) = delete;

    StorageResult<void> Ping() override;
    bool IsOpen() const override;
    void Close() override { context_.reset(); }

    /// One command and its reply. Error replies are returned as values.
    StorageResult<RespValue> Command(const std::vector<std::string>& args);

    /// Queues all commands in the output buffer and reads one reply per command.
    StorageResult<std::vector<RespValue>> Pipeline(
        const std::vector<std::vector<std::string>>& commands
    );

    private:
    StorageResult<void> Append(const std::vector<std::string>& args);
    StorageResult<RespValue> ReadReply();
    std::error_code ContextError();

    ContextPtr context_;
};

}  // namespace TierCache::Net

#endif  // TIERCACHE_SRC_NET_REDIS_CONNECTION_HPP_
