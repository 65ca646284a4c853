#ifndef TIERCACHE_SRC_NET_MEMCACHED_CONNECTION_HPP_
#define TIERCACHE_SRC_NET_MEMCACHED_CONNECTION_HPP_

#include "config/config_types.hpp"
#include "net/i_network_connection.hpp"
#include "net/tcp_socket.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace TierCache::Net
{

// Memcached text protocol client connection
class MemcachedConnection : public INetworkConnection
{
    public:
    static StorageResult<std::unique_ptr<MemcachedConnection>> Open(
        const Config::NetworkSettings& settings
    );

    explicit MemcachedConnection(TcpSocket socket) : socket_(std::move(socket)) {}
    ~MemcachedConnection() override = default;

    MemcachedConnection(const MemcachedConnection&)            = delete;
    MemcachedConnection& operator=(const MemcachedConnection&) = delete;

    StorageResult<void> Ping() override;
    bool IsOpen() const override { return socket_.IsOpen(); }
    void Close() override { socket_.Close(); }

    StorageResult<void> Set(
        const std::string& key, const std::string& data, std::int64_t exptime, std::uint32_t flags = 0
    );
    /// Values for the keys the server holds; absent keys are left out.
    StorageResult<std::map<std::string, std::string>> Get(const std::vector<std::string>& keys);
    /// True when the key existed.
    StorageResult<bool> Delete(const std::string& key);
    StorageResult<void> FlushAll();
    StorageResult<std::string> Version();
    StorageResult<std::map<std::string, std::string>> ServerStats();

    private:
    StorageResult<std::string> Request(const std::string& command);
    StorageResult<void> ExpectLine(const std::string& command, const std::string& expected);

    TcpSocket socket_;
};

}  // namespace TierCache::Net

#endif  // TIERCACHE_SRC_NET_MEMCACHED_CONNECTION_HPP_
