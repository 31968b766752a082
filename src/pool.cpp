#include "pool_cpp/pool.hpp"

#include <atomic>

namespace pool_cpp::detail {

    std::uint64_t next_pool_id() noexcept {
        static std::atomic<std::uint64_t> next{1};
        return next.fetch_add(1, std::memory_order_relaxed);
    }

}  // namespace pool_cpp::detail
