#ifndef TIERCACHE_SRC_ASYNC_SCHEDULER_HPP_
#define TIERCACHE_SRC_ASYNC_SCHEDULER_HPP_

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>

namespace TierCache::Async
{

// Runs deferred work on a later tick of the caller's loop
class IScheduler
{
    public:
    virtual ~IScheduler()                          = default;
    virtual void Defer(std::function<void()> task) = 0;
};

// Cooperative single-threaded loop. Nothing runs until the owner ticks it.
class EventLoop : public IScheduler
{
    public:
    EventLoop()           = default;
    ~EventLoop() override = default;

    EventLoop(const EventLoop&)            = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void Defer(std::function<void()> task) override;

    /// Runs the tasks queued before this call. Tasks they defer wait for the next tick.
    /// Returns the number of tasks run.
    std::size_t RunOnce();

    /// Ticks until the queue is empty or max_ticks ticks ran.
    std::size_t RunUntilIdle(std::size_t max_ticks = 1024);

    std::size_t Pending() const;

    private:
    mutable std::mutex queue_mutex_;
    std::deque<std::function<void()>> tasks_;
};

}  // namespace TierCache::Async

#endif  // TIERCACHE_SRC_ASYNC_SCHEDULER_HPP_
