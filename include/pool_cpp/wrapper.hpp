#pragma once

#include <array>
#include <concepts>
#include <functional>
#include <string_view>
#include <utility>

#include "pool_cpp/config.hpp"
#include "pool_cpp/pool.hpp"

namespace pool_cpp {

    /**
     * @brief Customization point for Wrapper::responds_to().
     *
     * The default asks the resource through a member
     * `bool responds_to(std::string_view) const`, and answers false for
     * resource types without one. Specialize it to describe types you
     * cannot change.
     */
    template <typename R>
    struct ResourceTraits {
        static bool responds_to(R& resource, std::string_view name) {
            if constexpr (requires {
                              {
                                  resource.responds_to(name)
                              } -> std::convertible_to<bool>;
                          }) {
                return resource.responds_to(name);
            } else {
                (void)resource;
                (void)name;
                return false;
            }
        }
    };

    /**
     * Pool-backed stand-in for a single resource.
     *
     * Every call made through operator-> checks a resource out, forwards the
     * call and checks the resource back in at the end of the full
     * expression, also when the call throws:
     *
     *   auto redis = pool_cpp::wrap<Redis>({}, [] { return std::make_shared<Redis>(); });
     *   redis->lpop("my-list");   // one checkout/checkin cycle
     *
     * Nested use on one thread stays reentrant, so calls made inside with()
     * reuse the resource already held.
     */
    template <typename R>
    class Wrapper {
       public:
        using pool_type = Pool<R>;
        using factory_type = typename pool_type::factory_type;

        /// @brief Operations handled by the wrapper itself. The deprecated
        /// with_connection is left to the resource.
        static constexpr std::array<std::string_view, 1> native_operations{
            "with"};

        /// @brief Temporary returned by operator->, holds the lease for one
        /// call
        class CallProxy {
           public:
            explicit CallProxy(typename pool_type::Lease lease) noexcept
                : lease_(std::move(lease)) {}

            CallProxy(const CallProxy&) = delete;
            CallProxy& operator=(const CallProxy&) = delete;

            R* operator->() const noexcept { return lease_.get(); }

           private:
            typename pool_type::Lease lease_;
        };

        /// @throws PoolError InvalidConfiguration, as Pool does
        Wrapper(PoolConfiguration cfg, const factory_type& factory)
            : pool_(std::move(cfg), factory) {}

        Wrapper(const Wrapper&) = delete;
        Wrapper& operator=(const Wrapper&) = delete;

        /// @brief Same contract as Pool::with
        template <typename F>
        decltype(auto) with(F&& body) {
            return pool_.with(std::forward<F>(body));
        }

        template <typename F>
        [[deprecated("Wrapper::with_connection is deprecated, use Wrapper::with")]]
        decltype(auto) with_connection(F&& body) {
            return pool_.with(std::forward<F>(body));
        }

        /// @brief Forward one member call to a pooled resource
        /// @throws PoolError Timeout or Shutdown if no resource was obtained
        CallProxy operator->() { return CallProxy(pool_.lease().value_or_throw()); }

        /**
         * @brief Forward an invocable to a pooled resource.
         *
         * Runs std::invoke(f, resource, args...) inside one checkout/checkin
         * cycle. Works with member function pointers:
         *
         *   wrapper.call(&Redis::llen, "my-list");
         */
        template <typename F, typename... Args>
        decltype(auto) call(F&& f, Args&&... args) {
            return pool_.with([&](R& resource) -> decltype(auto) {
                return std::invoke(std::forward<F>(f), resource,
                                   std::forward<Args>(args)...);
            });
        }

        /**
         * @brief Ask whether an operation is available.
         *
         * Native operations are answered without touching the pool. Anything
         * else is answered by a checked out resource through ResourceTraits.
         *
         * @throws PoolError Timeout or Shutdown for non-native names
         */
        bool responds_to(std::string_view name) {
            for (auto op : native_operations) {
                if (op == name) return true;
            }
            return pool_.with([name](R& resource) {
                return ResourceTraits<R>::responds_to(resource, name);
            });
        }

        /// @brief The underlying pool, for checkout()/checkin() and stats
        pool_type& pool() noexcept { return pool_; }
        pool_type const& pool() const noexcept { return pool_; }

       private:
        pool_type pool_;
    };

    /// @brief Build a Wrapper, the pool-backed stand-in for one resource
    template <typename R>
    Wrapper<R> wrap(PoolConfiguration cfg,
                    const typename Wrapper<R>::factory_type& factory) {
        return Wrapper<R>(std::move(cfg), factory);
    }

}  // namespace pool_cpp
