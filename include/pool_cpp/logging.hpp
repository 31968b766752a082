#pragma once
#include <memory>
#include <spdlog/fwd.h>
#include <string>

namespace pool_cpp {
    /**
     * @brief Create a stderr color logger for use with
     * PoolConfiguration::logger.
     *
     * The logger is not registered with spdlog's global registry, so the
     * same name can be used by several pools.
     *
     * @param name Logger name shown in every line.
     * @param level spdlog level name ("trace", "debug", "info", "warn",
     * "err", "critical", "off"). Unknown names fall back to "info".
     */
    std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                                const std::string& level = "info");
}  // namespace pool_cpp
