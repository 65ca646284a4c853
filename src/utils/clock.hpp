#ifndef TIERCACHE_SRC_UTILS_CLOCK_HPP_
#define TIERCACHE_SRC_UTILS_CLOCK_HPP_

#include <atomic>
#include <chrono>
#include <ctime>
#include <memory>

namespace TierCache::Utils
{

// Wall clock used for every expiry decision, in unix seconds
class IClock
{
    public:
    virtual ~IClock()                 = default;
    virtual std::time_t Now() const = 0;
};

class SystemClock : public IClock
{
    public:
    std::time_t Now() const override
    {
        return std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    }
};

// Clock that only moves when told to
class ManualClock : public IClock
{
    public:
    explicit ManualClock(std::time_t start = std::time(nullptr)) : now_(start) {}

    std::time_t Now() const override { return now_.load(); }

    void Set(std::time_t now) { now_.store(now); }
    void Advance(std::chrono::seconds by) { now_ += static_cast<std::time_t>(by.count()); }

    private:
    std::atomic<std::time_t> now_;
};

inline std::shared_ptr<const IClock> DefaultClock()
{
    static const auto clock = std::make_shared<const SystemClock>();
    return clock;
}

}  // namespace TierCache::Utils

#endif  // TIERCACHE_SRC_UTILS_CLOCK_HPP_
