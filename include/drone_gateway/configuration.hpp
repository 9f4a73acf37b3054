// === Configuration ===========================================================
//
// Exposes the strongly-typed configuration consumed by the gateway runtime.
// `ConfigurationLoader` translates environment variables into this structure
// so downstream modules never touch `std::getenv` directly.

#pragma once

#include <cstddef>
#include <string>

#include "drone_gateway/types.hpp"

namespace drone_gateway {

/**
 * @brief Immutable bundle of runtime knobs for the gateway.
 *
 * Every field is populated by ConfigurationLoader; consumers should treat the
 * values as authoritative.
 */
struct Configuration final {
    std::string log_directory{};                       /**< Destination directory for structured logs. */
    Duration liveness_timeout{Duration{5.0}};          /**< Silence tolerated before a session is evicted. */
    Duration command_ack_timeout{Duration{3.0}};       /**< Wait for a drone ack before a command times out. */
    std::size_t subscriber_buffer_capacity{256};       /**< Events buffered per operator before dropping the oldest. */
    Duration maintenance_interval{Duration{0.05}};     /**< Cadence of sweep/expiry/flush passes. */
    double ground_altitude_tolerance_m{0.3};           /**< Relative altitude treated as touchdown while Landing. */
    bool strict_command_ordering{true};                /**< Require operator-supplied ids to follow the queue head. */
    std::size_t flush_batch_size{64};                  /**< Max events written to one operator per flush. */
    std::string log_level{"info"};                     /**< spdlog level name applied by the loader. */
};

/**
 * @brief Utility responsible for hydrating Configuration from environment
 *        variables.
 */
class ConfigurationLoader final {
  public:
    static Configuration load();

  private:
    static Duration load_maintenance_interval();
};

}  // namespace drone_gateway
