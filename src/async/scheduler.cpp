#include "async/scheduler.hpp"

#include <spdlog/spdlog.h>
#include <exception>
#include <utility>

namespace TierCache::Async
{

void EventLoop::Defer(std::function<void()> task)
{
    std::lock_guard<std::mutex> lock(queue_mutex_);
    tasks_.emplace_back(std::move(task));
}

std::size_t EventLoop::RunOnce()
{
    std::deque<std::function<void()>> batch;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        batch.swap(tasks_);
    }

    std::size_t ran = 0;
    while (!batch.empty()) {
        auto task = std::move(batch.front());
        batch.pop_front();
        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("Deferred task failed: {}", e.what());
        } catch (...) {
            spdlog::error("Deferred task failed with a non-standard exception");
        }
        ++ran;
    }
    return ran;
}

std::size_t EventLoop::RunUntilIdle(std::size_t max_ticks)
{
    std::size_t ran = 0;
    for (std::size_t tick = 0; tick < max_ticks && Pending() > 0; ++tick) {
        ran += RunOnce();
    }
    return ran;
}

std::size_t EventLoop::Pending() const
{
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return tasks_.size();
}

}  // namespace TierCache::Async
