#include "stash/core/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace stash {

void init_logging(const config::LoggingConfig& config) {
    spdlog::drop("stash");
    auto logger = spdlog::stdout_color_mt("stash");
    logger->set_pattern(config.pattern);

    auto level = spdlog::level::from_str(config.level);
    // from_str maps unknown names to off
    if (level == spdlog::level::off && config.level != "off") {
        level = spdlog::level::info;
    }
    logger->set_level(level);

    spdlog::set_default_logger(std::move(logger));
    spdlog::flush_on(spdlog::level::warn);
}

void shutdown_logging() {
    spdlog::shutdown();
}

} // namespace stash
