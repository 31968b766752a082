#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "pool_cpp/error.hpp"
#include "pool_cpp/result.hpp"

namespace pool_cpp {

    /**
     * Fixed-capacity blocking queue of pre-created items.
     *
     * SAFETY:
     * - All public methods are thread-safe
     * - timed_pop() is the only call that can block
     *
     * INVARIANTS:
     * 1. Populated with exactly capacity() items by the constructor
     * 2. size() + items held by callers == capacity(), as long as callers
     *    only push back what they popped
     * 3. A timed out or refused timed_pop() leaves the queue unchanged
     *
     * No ownership check is made on push(). Pushing a foreign item breaks
     * invariant 2.
     */
    template <typename T>
    class TimedQueue {
       public:
        using value_type = T;
        using factory_type = std::function<T()>;

        /// @brief Create the queue and fill it by calling factory capacity
        /// times
        /// @throws PoolError InvalidConfiguration if capacity is 0 or
        /// factory is empty
        /// @note Exceptions thrown by factory propagate
        TimedQueue(std::size_t capacity, const factory_type& factory)
            : capacity_(capacity) {
            if (capacity_ == 0) {
                throw PoolError(Error{Error::Code::InvalidConfiguration,
                                      "queue capacity must be positive"});
            }
            if (!factory) {
                throw PoolError(Error{Error::Code::InvalidConfiguration,
                                      "queue requires a factory"});
            }
            for (std::size_t i = 0; i < capacity_; ++i) {
                items_.push_back(factory());
            }
        }

        TimedQueue(const TimedQueue&) = delete;
        TimedQueue& operator=(const TimedQueue&) = delete;

        /// @brief Take an item, waiting up to timeout for one to be pushed
        /// @return The item, or Timeout / Shutdown
        /// @note A zero timeout never waits. Timeouts past the clock's range
        /// wait until an item arrives or shutdown()
        Result<T> timed_pop(std::chrono::milliseconds timeout) {
            std::unique_lock<std::mutex> lk(mu_);

            if (items_.empty() && !shutdown_ && timeout.count() > 0) {
                ++waiting_;
                const bool ready =
                    cv_.wait_until(lk, deadline_(timeout), [this] {
                        return !items_.empty() || shutdown_;
                    });
                --waiting_;

                if (!ready) {
                    return Result<T>::err(Error::Code::Timeout,
                                          "Waited " +
                                              std::to_string(timeout.count()) +
                                              "ms for a pooled resource");
                }
            }

            if (shutdown_) {
                return Result<T>::err(Error::Code::Shutdown,
                                      "Pool is shut down");
            }

            if (items_.empty()) {
                return Result<T>::err(Error::Code::Timeout,
                                      "No pooled resource available");
            }

            T item = std::move(items_.front());
            items_.pop_front();
            return Result<T>::ok(std::move(item));
        }

        /// @brief Take an item if one is available right now
        std::optional<T> try_pop() {
            std::lock_guard<std::mutex> lk(mu_);
            if (shutdown_ || items_.empty()) return std::nullopt;

            T item = std::move(items_.front());
            items_.pop_front();
            return item;
        }

        /// @brief Hand an item back and wake one waiter
        /// @note Never blocks on availability; accepted after shutdown too
        void push(T item) {
            {
                std::lock_guard<std::mutex> lk(mu_);
                items_.push_back(std::move(item));
            }
            cv_.notify_one();
        }

        /// @brief Refuse further pops and wake every waiter
        void shutdown() {
            {
                std::lock_guard<std::mutex> lk(mu_);
                shutdown_ = true;
            }
            cv_.notify_all();
        }

        [[nodiscard]] bool is_shutdown() const {
            std::lock_guard<std::mutex> lk(mu_);
            return shutdown_;
        }

        /// @brief Number of items available right now
        [[nodiscard]] std::size_t size() const {
            std::lock_guard<std::mutex> lk(mu_);
            return items_.size();
        }

        /// @brief Number of threads blocked in timed_pop()
        [[nodiscard]] std::size_t waiting() const {
            std::lock_guard<std::mutex> lk(mu_);
            return waiting_;
        }

        [[nodiscard]] std::size_t capacity() const noexcept {
            return capacity_;
        }

       private:
        using clock_type = std::chrono::steady_clock;

        /// @brief now() + timeout, saturated at time_point::max()
        static clock_type::time_point deadline_(
            std::chrono::milliseconds timeout) {
            const auto now = clock_type::now();
            const auto headroom = std::chrono::duration_cast<
                std::chrono::milliseconds>(clock_type::time_point::max() - now);
            if (timeout >= headroom) return clock_type::time_point::max();
            return now + timeout;
        }

        const std::size_t capacity_;

        mutable std::mutex mu_;       ///< Guards everything below
        std::condition_variable cv_;  ///< Signalled on push and shutdown
        std::deque<T> items_;         ///< Available items
        std::size_t waiting_{0};      ///< Threads inside timed_pop()
        bool shutdown_{false};
    };

}  // namespace pool_cpp
