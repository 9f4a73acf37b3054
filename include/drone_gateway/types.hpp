// === Core Types ==============================================================
//
// Collects shared type aliases and lightweight structs used throughout the
// gateway (time primitives, identifiers, geodetic coordinates).

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace drone_gateway {

/**
 * @brief Alias for the steady clock used for liveness and ack deadlines.
 */
using SteadyClock = std::chrono::steady_clock;

/**
 * @brief Alias for timestamps captured from the steady clock.
 */
using TimePoint = std::chrono::time_point<SteadyClock>;

/**
 * @brief Alias for durations measured in seconds with double precision.
 */
using Duration = std::chrono::duration<double>;

/** @brief Identifier of a drone endpoint. */
using DroneId = std::string;

/** @brief Identifier of an operator (ground-control) endpoint. */
using OperatorId = std::string;

/** @brief Per-drone monotonic command identifier. */
using CommandId = std::uint64_t;

/** @brief Drone-assigned telemetry sequence number. */
using SequenceNumber = std::uint64_t;

/**
 * @brief Represents a latitude/longitude/altitude triplet in degrees/metres.
 */
struct GeodeticCoordinate final {
    double latitude_deg{};   /**< Latitude in decimal degrees. */
    double longitude_deg{};  /**< Longitude in decimal degrees. */
    double altitude_m{};     /**< Altitude in metres above mean sea level. */
};

/**
 * @brief Convert a steady-clock span into the gateway's double-second duration.
 */
inline Duration elapsed_between(TimePoint earlier, TimePoint later) {
    return std::chrono::duration_cast<Duration>(later - earlier);
}

}  // namespace drone_gateway
