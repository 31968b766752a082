#include "pool_cpp/logging.hpp"

#include <spdlog/logger.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace pool_cpp {

    std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                                const std::string& level) {
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v");

        auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));

        // from_str() maps unknown names to "off"
        auto lvl = spdlog::level::from_str(level);
        if (lvl == spdlog::level::off && level != "off") {
            lvl = spdlog::level::info;
        }
        logger->set_level(lvl);
        return logger;
    }

}  // namespace pool_cpp
