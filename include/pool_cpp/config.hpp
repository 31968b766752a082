#pragma once
#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <spdlog/fwd.h>
#include <string>

#include "result.hpp"

namespace pool_cpp {
    /**
     * @brief Configuration for a resource pool.
     *
     * Unset fields keep their defaults. from_options() merges string
     * options over these defaults.
     */
    struct PoolConfiguration {
        /** @brief Default number of pooled resources. */
        static constexpr std::size_t default_size = 5;

        /** @brief Default time to wait for a resource. */
        static constexpr std::chrono::milliseconds default_timeout{5000};

        /** @brief Number of resources created up front. Must be positive. */
        std::size_t size{default_size};

        /** @brief How long checkout() waits when every resource is taken. */
        std::chrono::milliseconds timeout{default_timeout};

        /**
         * @brief Optional logger. When null the pool logs nothing.
         * @see make_logger()
         */
        std::shared_ptr<spdlog::logger> logger;

        /**
         * @brief Build a configuration from string options.
         *
         * Recognized keys: "size" (positive integer) and "timeout"
         * (seconds, fractions allowed, or a number with an "ms" or "s"
         * suffix). Missing keys keep the value from @p base.
         *
         * @param options Key/value options, e.g. parsed from a config file.
         * @param base Values used for keys that are not present.
         * @return The merged and validated configuration, or an
         * InvalidConfiguration error.
         */
        static Result<PoolConfiguration> from_options(
            const std::map<std::string, std::string>& options,
            PoolConfiguration base);

        /// @brief from_options() over a default configuration
        static Result<PoolConfiguration> from_options(
            const std::map<std::string, std::string>& options);
    };

    /**
     * @brief Check a configuration.
     * @return The configuration unchanged, or an InvalidConfiguration error
     * naming the offending field.
     */
    Result<PoolConfiguration> validate(PoolConfiguration config);

    /**
     * @brief Parse a timeout option ("2", "0.5", "250ms", "3s").
     * @return The timeout in milliseconds, or an InvalidConfiguration error.
     */
    Result<std::chrono::milliseconds> parse_timeout(const std::string& text);
}  // namespace pool_cpp
