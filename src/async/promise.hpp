#ifndef TIERCACHE_SRC_ASYNC_PROMISE_HPP_
#define TIERCACHE_SRC_ASYNC_PROMISE_HPP_

#include "storage/storage_error.hpp"

#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

namespace TierCache::Async
{

enum class PromiseState { Pending, Fulfilled, Rejected };

/// Outcome of one promise as reported by AllSettled.
template <typename T>
struct Settlement {
    PromiseState state = PromiseState::Pending;
    std::optional<T> value;
    std::exception_ptr error;

    bool IsFulfilled() const { return state == PromiseState::Fulfilled; }
};

// Single-assignment result shared by every copy of the promise.
// Settles exactly once, callbacks run on the thread that settles it.
template <typename T>
class Promise
{
    static_assert(!std::is_void_v<T>, "use Promise<bool> for operations without a value");

    private:
    //------------------------------------------------------------------------------//
    // Internal Types
    //------------------------------------------------------------------------------//
    struct SharedState {
        std::mutex mutex;
        PromiseState state = PromiseState::Pending;
        std::optional<T> value;
        std::exception_ptr error;
        std::vector<std::function<void()>> callbacks;
    };

    public:
    using ValueType = T;

    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//
    Promise() : state_(std::make_shared<SharedState>()) {}

    static Promise Resolved(T value)
    {
        Promise promise;
        promise.Resolve(std::move(value));
        return promise;
    }

    static Promise Rejected(std::exception_ptr error)
    {
        Promise promise;
        promise.Reject(std::move(error));
        return promise;
    }

    static Promise Rejected(std::error_code ec)
    {
        return Rejected(std::make_exception_ptr(Storage::StorageException(ec)));
    }

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//

    /// Returns false when the promise had already settled.
    bool Resolve(T value) const
    {
        return Settle([&](SharedState& state) {
            state.state = PromiseState::Fulfilled;
            state.value = std::move(value);
        });
    }

    bool Reject(std::exception_ptr error) const
    {
        return Settle([&](SharedState& state) {
            state.state = PromiseState::Rejected;
            state.error = std::move(error);
        });
    }

    PromiseState State() const
    {
        std::lock_guard lock(state_->mutex);
        return state_->state;
    }
    bool IsPending() const { return State() == PromiseState::Pending; }
    bool IsFulfilled() const { return State() == PromiseState::Fulfilled; }
    bool IsRejected() const { return State() == PromiseState::Rejected; }
    bool IsSettled() const { return !IsPending(); }

    /// @throws std::logic_error when the promise is not fulfilled.
    T Value() const
    {
        std::lock_guard lock(state_->mutex);
        if (state_->state != PromiseState::Fulfilled) {
            throw std::logic_error("Promise is not fulfilled");
        }
        return *state_->value;
    }

    std::exception_ptr Error() const
    {
        std::lock_guard lock(state_->mutex);
        return state_->error;
    }

    /// Chains a transformation of the value. A rejection passes through untouched and
    /// an exception thrown by on_fulfilled rejects the returned promise.
    template <typename F>
    auto Then(F on_fulfilled) const -> Promise<std::invoke_result_t<F, const T&>>
    {
        using U = std::invoke_result_t<F, const T&>;
        Promise<U> next;
        auto self = *this;
        Subscribe([self, next, on_fulfilled = std::move(on_fulfilled)]() mutable {
            if (self.IsRejected()) {
                next.Reject(self.Error());
                return;
            }
            try {
                next.Resolve(on_fulfilled(self.Value()));
            } catch (...) {
                next.Reject(std::current_exception());
            }
        });
        return next;
    }

    /// Recovers from a rejection with a replacement value.
    template <typename F>
    Promise<T> Catch(F on_rejected) const
    {
        Promise<T> next;
        auto self = *this;
        Subscribe([self, next, on_rejected = std::move(on_rejected)]() mutable {
            if (self.IsFulfilled()) {
                next.Resolve(self.Value());
                return;
            }
            try {
                next.Resolve(on_rejected(self.Error()));
            } catch (...) {
                next.Reject(std::current_exception());
            }
        });
        return next;
    }

    /// Runs f on either outcome and passes the outcome on.
    template <typename F>
    Promise<T> Finally(F on_settled) const
    {
        Promise<T> next;
        auto self = *this;
        Subscribe([self, next, on_settled = std::move(on_settled)]() mutable {
            try {
                on_settled();
            } catch (...) {
                next.Reject(std::current_exception());
                return;
            }
            if (self.IsFulfilled()) {
                next.Resolve(self.Value());
            } else {
                next.Reject(self.Error());
            }
        });
        return next;
    }

    /// Runs callback once the promise settles, immediately when it already has.
    void Subscribe(std::function<void()> callback) const
    {
        {
            std::lock_guard lock(state_->mutex);
            if (state_->state == PromiseState::Pending) {
                state_->callbacks.push_back(std::move(callback));
                return;
            }
        }
        callback();
    }

    private:
    //------------------------------------------------------------------------------//
    // Private Methods
    //------------------------------------------------------------------------------//
    template <typename Assign>
    bool Settle(Assign assign) const
    {
        std::vector<std::function<void()>> callbacks;
        {
            std::lock_guard lock(state_->mutex);
            if (state_->state != PromiseState::Pending) {
                return false;
            }
            assign(*state_);
            callbacks.swap(state_->callbacks);
        }
        for (auto& callback : callbacks) {
            callback();
        }
        return true;
    }

    //------------------------------------------------------------------------------//
    // Private Fields
    //------------------------------------------------------------------------------//
    std::shared_ptr<SharedState> state_;
};

//------------------------------------------------------------------------------//
// Combinators
//------------------------------------------------------------------------------//

/// Fulfilled with every value in input order, or rejected with the first rejection.
template <typename T>
Promise<std::vector<T>> All(const std::vector<Promise<T>>& promises)
{
    Promise<std::vector<T>> combined;
    if (promises.empty()) {
        combined.Resolve({});
        return combined;
    }

    struct Collector {
        std::mutex mutex;
        std::vector<std::optional<T>> values;
        std::size_t remaining;
    };
    auto collector       = std::make_shared<Collector>();
    collector->values    = std::vector<std::optional<T>>(promises.size());
    collector->remaining = promises.size();

    for (std::size_t i = 0; i < promises.size(); ++i) {
        const auto promise = promises[i];
        promise.Subscribe([promise, combined, collector, i]() {
            if (promise.IsRejected()) {
                combined.Reject(promise.Error());
                return;
            }
            std::vector<T> results;
            {
                std::lock_guard lock(collector->mutex);
                collector->values[i] = promise.Value();
                if (--collector->remaining > 0) {
                    return;
                }
                results.reserve(collector->values.size());
                for (auto& value : collector->values) {
                    results.push_back(std::move(*value));
                }
            }
            combined.Resolve(std::move(results));
        });
    }
    return combined;
}

/// Settles like whichever promise settles first. An empty input never settles.
template <typename T>
Promise<T> Race(const std::vector<Promise<T>>& promises)
{
    Promise<T> first;
    for (const auto& promise : promises) {
        promise.Subscribe([promise, first]() {
            if (promise.IsFulfilled()) {
                first.Resolve(promise.Value());
            } else {
                first.Reject(promise.Error());
            }
        });
    }
    return first;
}

/// Fulfilled once every promise settled, with each outcome in input order.
template <typename T>
Promise<std::vector<Settlement<T>>> AllSettled(const std::vector<Promise<T>>& promises)
{
    Promise<std::vector<Settlement<T>>> combined;
    if (promises.empty()) {
        combined.Resolve({});
        return combined;
    }

    struct Collector {
        std::mutex mutex;
        std::vector<Settlement<T>> outcomes;
        std::size_t remaining;
    };
    auto collector       = std::make_shared<Collector>();
    collector->outcomes  = std::vector<Settlement<T>>(promises.size());
    collector->remaining = promises.size();

    for (std::size_t i = 0; i < promises.size(); ++i) {
        const auto promise = promises[i];
        promise.Subscribe([promise, combined, collector, i]() {
            Settlement<T> outcome;
            outcome.state = promise.State();
            if (promise.IsFulfilled()) {
                outcome.value = promise.Value();
            } else {
                outcome.error = promise.Error();
            }

            std::vector<Settlement<T>> results;
            {
                std::lock_guard lock(collector->mutex);
                collector->outcomes[i] = std::move(outcome);
                if (--collector->remaining > 0) {
                    return;
                }
                results = std::move(collector->outcomes);
            }
            combined.Resolve(std::move(results));
        });
    }
    return combined;
}

}  // namespace TierCache::Async

#endif  // TIERCACHE_SRC_ASYNC_PROMISE_HPP_
