#pragma once

#include "stash/config/config.hpp"

namespace stash {

/**
 * @brief Install the process-wide spdlog logger ("stash", stdout, colored)
 *
 * Unknown level names fall back to info. Safe to call more than once.
 */
void init_logging(const config::LoggingConfig& config);

void shutdown_logging();

} // namespace stash
