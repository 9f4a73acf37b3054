// === Logging =================================================================
//
// One process-wide spdlog logger shared by every component: coloured console
// output plus a rotating JSON-line file in the configured log directory.

#pragma once

#include <memory>
#include <string>

#include <spdlog/logger.h>

namespace drone_gateway {

/** @brief Create the shared logger once; later calls return the same instance. */
std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

/** @throws std::runtime_error when initialize_logger() has not run. */
std::shared_ptr<spdlog::logger> get_logger();

/**
 * @brief Apply an spdlog level name ("trace" ... "off").
 *
 * @return false when the name is unknown and info was applied instead.
 */
bool set_log_level(const std::string& str_level);

}  // namespace drone_gateway
