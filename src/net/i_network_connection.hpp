#ifndef TIERCACHE_SRC_NET_I_NETWORK_CONNECTION_HPP_
#define TIERCACHE_SRC_NET_I_NETWORK_CONNECTION_HPP_

#include "storage/storage_error.hpp"

namespace TierCache::Net
{

// A live connection to one network backend, as handed out by the connection pool
class INetworkConnection
{
    public:
    virtual ~INetworkConnection() = default;

    /// Cheap round trip used to validate idle connections.
    virtual Storage::StorageResult<void> Ping() = 0;

    virtual bool IsOpen() const = 0;
    virtual void Close()        = 0;
};

}  // namespace TierCache::Net

#endif  // TIERCACHE_SRC_NET_I_NETWORK_CONNECTION_HPP_
