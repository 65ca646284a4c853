#include "pool/connection_source.hpp"

namespace TierCache::Pool
{

using Storage::make_error_code;
using Storage::StorageErrc;

bool IsConnectionError(const std::error_code& ec)
{
    return ec == make_error_code(StorageErrc::ConnectionFailed) ||
           ec == make_error_code(StorageErrc::Timeout) ||
           ec == make_error_code(StorageErrc::ProtocolError);
}

ConnectionSource::ConnectionSource(
    std::string backend, const Config::NetworkSettings& settings, bool pooling,
    ConnectionFactory factory
)
    : backend_(std::move(backend)),
      retry_(RetryPolicy::FromSettings(settings)),
      persistent_(settings.persistent),
      factory_(std::move(factory))
{
    if (pooling) {
        pool_ = std::make_unique<ConnectionPool>(backend_, settings.pool, retry_, factory_);
    }
}

void ConnectionSource::Close()
{
    if (pool_) {
        pool_->CloseAll();
    }
    std::lock_guard<std::mutex> lock(direct_mutex_);
    if (direct_) {
        direct_->Close();
        direct_.reset();
    }
}

std::size_t ConnectionSource::CleanupIdle() { return pool_ ? pool_->CleanupIdle() : 0; }

nlohmann::json ConnectionSource::Stats() const
{
    if (pool_) {
        return pool_->Stats();
    }
    return {
        {   "backend",   backend_},
        {   "pooled",       false},
        {"persistent", persistent_},
    };
}

}  // namespace TierCache::Pool
