#pragma once

#include <map>
#include <string>
#include <string_view>

#include "drone_gateway/types.hpp"

namespace drone_gateway {

/**
 * @brief Enumerates the flight phases tracked for every connected drone.
 */
enum class FlightPhase {
    Idle,     /**< On the ground, motors disarmed. */
    Armed,    /**< On the ground, motors armed. */
    Flying,   /**< Airborne. */
    Landing,  /**< Descending after an acknowledged Land command. */
    Fault     /**< Emergency stop or lost link; requires operator reset. */
};

[[nodiscard]] std::string_view to_string(FlightPhase phase) noexcept;

/** @brief True for phases in which the drone is off the ground. */
[[nodiscard]] bool is_airborne(FlightPhase phase) noexcept;

/**
 * @brief Last-known sensor readings reported by a drone.
 *
 * The gateway only interprets `relative_altitude_m` (for touchdown detection);
 * every other field is passed through to subscribers untouched.
 */
struct TelemetrySnapshot final {
    GeodeticCoordinate position{};            /**< Reported geodetic position. */
    double relative_altitude_m{};             /**< Height above ground in metres. */
    double battery_percent{};                 /**< Remaining battery percentage. */
    std::map<std::string, double> channels{}; /**< Opaque named sensor channels. */
};

/**
 * @brief Captures the authoritative state of a drone at a point in time.
 */
struct DroneState final {
    std::string identifier{};                       /**< Unique identifier for the drone. */
    FlightPhase phase{FlightPhase::Idle};           /**< Current flight phase. */
    TelemetrySnapshot telemetry{};                  /**< Latest applied telemetry snapshot. */
    TimePoint last_update_time{SteadyClock::now()}; /**< Timestamp of the most recent mutation. */
};

}  // namespace drone_gateway
