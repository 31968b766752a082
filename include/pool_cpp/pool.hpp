#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <new>
#include <spdlog/logger.h>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "pool_cpp/config.hpp"
#include "pool_cpp/error.hpp"
#include "pool_cpp/pool_types.hpp"
#include "pool_cpp/result.hpp"
#include "pool_cpp/timed_queue.hpp"

namespace pool_cpp {

    namespace detail {
        /// @brief Process-unique pool id, never reused
        std::uint64_t next_pool_id() noexcept;
    }  // namespace detail

    /**
     * Fixed-size pool of eagerly created resources shared between threads.
     *
     * SAFETY:
     * - All public methods are thread-safe
     * - The per-thread checkout stack is thread_local, so only the owning
     *   thread ever touches it
     *
     * INVARIANTS:
     * 1. The factory runs exactly size() times, all inside the constructor
     * 2. available() + resources held by threads == size()
     * 3. A thread holds at most one resource from a given pool; nested
     *    checkouts on that thread return the same resource
     * 4. A failed checkout leaves the container and the thread's stack
     *    untouched
     *
     * ERRORS:
     * - Timeout: every resource stayed checked out for the whole timeout
     * - Shutdown: shutdown() was called
     * - NotCheckedOut: checkin() without a matching checkout() (thrown)
     *
     * Usage:
     *   Pool<Redis> pool({.size = 4}, [] { return std::make_shared<Redis>(); });
     *   pool.with([](Redis& r) { r.lpop("my-list"); });
     */
    template <typename R>
    class Pool {
       public:
        using resource_type = R;
        using resource_ptr = std::shared_ptr<R>;
        using factory_type = std::function<resource_ptr()>;

       private:
        /// @brief State shared between the pool and its leases
        struct State {
            State(PoolConfiguration cfg_, const factory_type& factory)
                : id(detail::next_pool_id()),
                  cfg(std::move(cfg_)),
                  queue(cfg.size, [this, &factory]() -> resource_ptr {
                      resource_ptr r = factory();
                      if (!r) {
                          throw PoolError(
                              Error{Error::Code::InvalidConfiguration,
                                    "Resource factory returned null"});
                      }
                      metrics.resources_created.fetch_add(
                          1, std::memory_order_relaxed);
                      return r;
                  }) {}

            const std::uint64_t id;
            const PoolConfiguration cfg;
            PoolMetrics metrics;
            TimedQueue<resource_ptr> queue;
        };

       public:
        /**
         * RAII checkout. Destroying or reset()ing it performs the matching
         * checkin() exactly once.
         *
         * A lease must be released on the thread that acquired it. Releasing
         * it elsewhere is a NotCheckedOut misuse and terminates, since the
         * release runs in a noexcept path.
         */
        class Lease {
           public:
            Lease() = default;

            Lease(Lease&& other) noexcept
                : state_(std::move(other.state_)),
                  res_(std::move(other.res_)) {}

            Lease& operator=(Lease&& other) noexcept {
                if (this != &other) {
                    reset();
                    state_ = std::move(other.state_);
                    res_ = std::move(other.res_);
                }
                return *this;
            }

            Lease(Lease const&) = delete;
            Lease& operator=(Lease const&) = delete;

            ~Lease() { reset(); }

            R* operator->() const noexcept { return res_.get(); }

            R& operator*() const noexcept { return *res_; }

            /// @brief Get the held resource, or nullptr if inert
            R* get() const noexcept { return res_.get(); }

            /// @brief Shared handle to the held resource
            const resource_ptr& resource() const noexcept { return res_; }

            explicit operator bool() const noexcept {
                return static_cast<bool>(res_);
            }

            /// @brief Check the resource back in now
            void reset() noexcept {
                if (!state_) return;
                auto st = std::move(state_);
                res_.reset();
                Pool::checkin_(*st);
            }

           private:
            friend class Pool;

            Lease(std::shared_ptr<State> st, resource_ptr r) noexcept
                : state_(std::move(st)), res_(std::move(r)) {}

            std::shared_ptr<State> state_;
            resource_ptr res_;
        };

        /**
         * @brief Create the pool and all of its resources.
         * @param cfg Size, timeout and optional logger.
         * @param factory Called cfg.size times before the constructor
         * returns.
         * @throws PoolError InvalidConfiguration for a missing factory or an
         * invalid cfg
         */
        Pool(PoolConfiguration cfg, const factory_type& factory)
            : state_(make_state_(std::move(cfg), factory)) {
            if (auto& log = state_->cfg.logger) {
                log->info("pool {}: created {} resources, timeout {}ms",
                          state_->id, state_->cfg.size,
                          state_->cfg.timeout.count());
            }
        }

        Pool(const Pool&) = delete;
        Pool& operator=(const Pool&) = delete;

        /**
         * @brief Get a resource for the calling thread.
         *
         * If the thread already holds one from this pool, the same resource
         * is returned at once. Otherwise waits up to timeout() for one.
         * Every successful call must be paired with checkin().
         *
         * @return The resource, or Timeout / Shutdown.
         */
        Result<resource_ptr> checkout() { return checkout_(state_); }

        /**
         * @brief Undo the most recent checkout() on this thread.
         *
         * The resource goes back to the container once the outermost
         * checkout is undone.
         *
         * @throws PoolError NotCheckedOut if the thread holds nothing
         */
        void checkin() { checkin_(*state_); }

        /// @brief checkout() wrapped in an RAII Lease
        Result<Lease> lease() {
            auto r = checkout_(state_);
            if (r.has_error()) return Result<Lease>::err(std::move(r).error());
            return Result<Lease>::ok(Lease(state_, std::move(r).value()));
        }

        /**
         * @brief Run body with a checked out resource.
         *
         * Checkin happens on every exit path of body, before an exception
         * from body reaches the caller. Exceptions are never wrapped.
         *
         * @param body Invoked as body(R&).
         * @return Whatever body returns.
         * @throws PoolError Timeout or Shutdown if no resource was obtained;
         * body does not run in that case
         */
        template <typename F>
        decltype(auto) with(F&& body) {
            Lease held = lease().value_or_throw();
            return std::invoke(std::forward<F>(body), *held);
        }

        template <typename F>
        [[deprecated("Pool::with_connection is deprecated, use Pool::with")]]
        decltype(auto) with_connection(F&& body) {
            return with(std::forward<F>(body));
        }

        /// @brief Wake all waiters and refuse further checkouts
        /// @note Resources still held can be checked in afterwards
        void shutdown() {
            state_->queue.shutdown();
            if (auto& log = state_->cfg.logger) {
                log->info("pool {}: shut down, {} of {} resources in use",
                          state_->id, in_use(), state_->cfg.size);
            }
        }

        [[nodiscard]] bool is_shutdown() const {
            return state_->queue.is_shutdown();
        }

        [[nodiscard]] std::size_t size() const noexcept {
            return state_->cfg.size;
        }

        [[nodiscard]] std::chrono::milliseconds timeout() const noexcept {
            return state_->cfg.timeout;
        }

        /// @brief Resources sitting in the container right now
        [[nodiscard]] std::size_t available() const {
            return state_->queue.size();
        }

        [[nodiscard]] std::size_t in_use() const {
            return state_->cfg.size - state_->queue.size();
        }

        /// @brief Nesting depth of the calling thread's checkouts
        [[nodiscard]] std::size_t checked_out() const {
            auto& stacks = stacks_();
            auto it = stacks.find(state_->id);
            return it == stacks.end() ? 0 : it->second.size();
        }

        [[nodiscard]] PoolStats stats() const {
            PoolStats s;
            s.size = state_->cfg.size;
            s.available = state_->queue.size();
            s.in_use = s.size - s.available;
            s.waiters = state_->queue.waiting();
            return s;
        }

        PoolMetrics const& metrics() const noexcept { return state_->metrics; }

       private:
        using Stack = std::vector<resource_ptr>;

        static std::shared_ptr<State> make_state_(PoolConfiguration cfg,
                                                  const factory_type& factory) {
            if (!factory) {
                throw PoolError(Error{Error::Code::InvalidConfiguration,
                                      "Pool requires a resource factory"});
            }
            return std::make_shared<State>(validate(std::move(cfg)).value_or_throw(),
                                           factory);
        }

        /// @brief This thread's checkout stacks, keyed by pool id
        static std::unordered_map<std::uint64_t, Stack>& stacks_() {
            thread_local std::unordered_map<std::uint64_t, Stack> stacks;
            return stacks;
        }

        static Result<resource_ptr> checkout_(const std::shared_ptr<State>& st) {
            auto& stacks = stacks_();

            // Reentrant path: reuse what this thread already holds
            auto it = stacks.find(st->id);
            if (it != stacks.end() && !it->second.empty()) {
                resource_ptr r = it->second.back();
                it->second.push_back(r);
                st->metrics.reentrant_checkouts.fetch_add(
                    1, std::memory_order_relaxed);
                if (auto& log = st->cfg.logger) {
                    log->trace("pool {}: reentrant checkout, depth {}", st->id,
                               it->second.size());
                }
                return Result<resource_ptr>::ok(std::move(r));
            }

            auto popped = st->queue.timed_pop(st->cfg.timeout);
            if (popped.has_error()) {
                if (popped.is(Error::Code::Timeout)) {
                    st->metrics.timeouts.fetch_add(1, std::memory_order_relaxed);
                    if (auto& log = st->cfg.logger) {
                        log->warn("pool {}: checkout timed out after {}ms",
                                  st->id, st->cfg.timeout.count());
                    }
                } else if (popped.is(Error::Code::Shutdown)) {
                    st->metrics.shutdown_rejections.fetch_add(
                        1, std::memory_order_relaxed);
                }
                return popped;
            }

            resource_ptr r = std::move(popped).value();
            try {
                stacks[st->id].push_back(r);
            } catch (const std::bad_alloc&) {
                st->queue.push(std::move(r));
                throw;
            }

            st->metrics.checkouts.fetch_add(1, std::memory_order_relaxed);
            if (auto& log = st->cfg.logger) {
                log->trace("pool {}: checkout, {} left", st->id,
                           st->queue.size());
            }
            return Result<resource_ptr>::ok(std::move(r));
        }

        static void checkin_(State& st) {
            auto& stacks = stacks_();
            auto it = stacks.find(st.id);
            if (it == stacks.end() || it->second.empty()) {
                throw PoolError(
                    Error{Error::Code::NotCheckedOut,
                          "checkin() called without a matching checkout()"});
            }

            resource_ptr r = std::move(it->second.back());
            it->second.pop_back();
            if (!it->second.empty()) return;

            // Outermost checkin: hand the resource back
            stacks.erase(it);
            st.queue.push(std::move(r));
            st.metrics.checkins.fetch_add(1, std::memory_order_relaxed);
            if (auto& log = st.cfg.logger) {
                log->trace("pool {}: checkin", st.id);
            }
        }

        std::shared_ptr<State> state_;
    };

}  // namespace pool_cpp
