#pragma once

#include "config/config_types.hpp"

namespace apipipe::logging {

/**
 * @brief Apply [logging] settings to the logger hierarchy
 *
 * Resets every logger, sets the root level, attaches a stderr sink (and a
 * file sink when `file` is set) in the configured format, and installs
 * trace correlation on the root and on the application logger.
 *
 * @throws ConfigurationError on an unknown level or format
 * @throws std::runtime_error if the log file cannot be opened
 */
void configure_logging(const LoggingConfig& config);

} // namespace apipipe::logging
