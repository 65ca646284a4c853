#ifndef TIERCACHE_SRC_CACHE_LAST_ERROR_HPP_
#define TIERCACHE_SRC_CACHE_LAST_ERROR_HPP_

#include <mutex>
#include <optional>
#include <string>

namespace TierCache::Cache
{

// Most recent failure message, overwritten by every new failure
class LastError
{
    public:
    void Set(std::string message)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        message_ = std::move(message);
    }

    std::optional<std::string> Get() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return message_;
    }

    void Clear()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        message_.reset();
    }

    private:
    mutable std::mutex mutex_;
    std::optional<std::string> message_;
};

}  // namespace TierCache::Cache

#endif  // TIERCACHE_SRC_CACHE_LAST_ERROR_HPP_
