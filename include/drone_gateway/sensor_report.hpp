// === Sensor Report Codec =====================================================
//
// Decodes the line-oriented report emitted by the drone's flight controller:
//
//   <SENSOR_DATA|MPU|ax|ay|az|gx|gy|gz|BMP|pressure|temperature[|altitude]>
//
// The IMU block carries accelerometer and gyroscope axes; the barometer block
// carries pressure (hPa), temperature (degC) and an optional altitude (m).

#pragma once

#include <optional>
#include <string_view>

#include "drone_gateway/drone_state.hpp"

namespace drone_gateway {

/** @brief Channel names populated by decode_sensor_report(). */
namespace sensor_channel {
inline constexpr char k_accel_x[] = "accelerometer.x";
inline constexpr char k_accel_y[] = "accelerometer.y";
inline constexpr char k_accel_z[] = "accelerometer.z";
inline constexpr char k_gyro_x[] = "gyroscope.x";
inline constexpr char k_gyro_y[] = "gyroscope.y";
inline constexpr char k_gyro_z[] = "gyroscope.z";
inline constexpr char k_baro_pressure[] = "barometer.pressure";
inline constexpr char k_baro_temperature[] = "barometer.temperature";
inline constexpr char k_baro_altitude[] = "barometer.altitude";
}  // namespace sensor_channel

/**
 * @brief Decode one sensor report line into a telemetry snapshot.
 *
 * @return nullopt when the line is not a sensor report at all (callers ignore
 *         it); the decoded snapshot otherwise.
 * @throws GatewayError MalformedPayload when a recognized report carries a
 *         field that is not a number.
 */
[[nodiscard]] std::optional<TelemetrySnapshot> decode_sensor_report(std::string_view line);

}  // namespace drone_gateway
