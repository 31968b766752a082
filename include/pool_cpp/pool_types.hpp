#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace pool_cpp {

    /// @brief Counters for monitoring pool behavior
    /// @note All updates use relaxed ordering, values are for reporting only
    struct PoolMetrics {
        std::atomic<std::uint64_t> resources_created{
            0};  ///< Factory invocations
        std::atomic<std::uint64_t> checkouts{
            0};  ///< Resources taken from the container
        std::atomic<std::uint64_t> reentrant_checkouts{
            0};  ///< Nested checkouts served from the thread's stack
        std::atomic<std::uint64_t> checkins{
            0};  ///< Resources handed back to the container
        std::atomic<std::uint64_t> timeouts{0};  ///< Checkouts that timed out
        std::atomic<std::uint64_t> shutdown_rejections{
            0};  ///< Checkouts refused because the pool was shut down
    };

    /// @brief Point-in-time view of a pool
    struct PoolStats {
        std::size_t size = 0;       ///< Fixed number of resources
        std::size_t available = 0;  ///< Resources sitting in the container
        std::size_t in_use = 0;     ///< size - available
        std::size_t waiters = 0;    ///< Threads blocked in checkout
    };

}  // namespace pool_cpp
