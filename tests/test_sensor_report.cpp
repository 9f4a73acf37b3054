#include <catch2/catch.hpp>

#include "drone_gateway/errors.hpp"
#include "drone_gateway/sensor_report.hpp"

using namespace drone_gateway;

TEST_CASE("Sensor report decodes IMU and barometer channels") {
    const auto snapshot = decode_sensor_report("<SENSOR_DATA|MPU|0.12|-0.05|9.81|1.5|-2.5|0.25|BMP|1013.25|22.4|118.6>\r\n");
    REQUIRE(snapshot.has_value());

    CHECK(snapshot->channels.at(sensor_channel::k_accel_x) == Approx(0.12));
    CHECK(snapshot->channels.at(sensor_channel::k_accel_y) == Approx(-0.05));
    CHECK(snapshot->channels.at(sensor_channel::k_accel_z) == Approx(9.81));
    CHECK(snapshot->channels.at(sensor_channel::k_gyro_x) == Approx(1.5));
    CHECK(snapshot->channels.at(sensor_channel::k_gyro_y) == Approx(-2.5));
    CHECK(snapshot->channels.at(sensor_channel::k_gyro_z) == Approx(0.25));
    CHECK(snapshot->channels.at(sensor_channel::k_baro_pressure) == Approx(1013.25));
    CHECK(snapshot->channels.at(sensor_channel::k_baro_temperature) == Approx(22.4));
    CHECK(snapshot->channels.at(sensor_channel::k_baro_altitude) == Approx(118.6));
    CHECK(snapshot->relative_altitude_m == Approx(118.6));
}

TEST_CASE("Sensor report altitude is optional") {
    const auto snapshot = decode_sensor_report("<SENSOR_DATA|MPU|0|0|9.8|0|0|0|BMP|1000|20>");
    REQUIRE(snapshot.has_value());
    CHECK(snapshot->channels.at(sensor_channel::k_baro_altitude) == Approx(0.0));
    CHECK(snapshot->relative_altitude_m == Approx(0.0));
}

TEST_CASE("Lines that are not sensor reports are ignored") {
    CHECK_FALSE(decode_sensor_report("").has_value());
    CHECK_FALSE(decode_sensor_report("boot ok").has_value());
    CHECK_FALSE(decode_sensor_report("<SENSOR_DATA|MPU|0|0|0>").has_value());
    CHECK_FALSE(decode_sensor_report("<SENSOR_DATA|GPS|0|0|0|0|0|0|BMP|1|2>").has_value());
    CHECK_FALSE(decode_sensor_report("SENSOR_DATA|MPU|0|0|0|0|0|0|BMP|1|2").has_value());
}

TEST_CASE("Non-numeric fields in a sensor report are malformed") {
    try {
        (void)decode_sensor_report("<SENSOR_DATA|MPU|0|0|0|0|0|0|BMP|high|20>");
        FAIL("malformed report decoded");
    } catch (const GatewayError& error) {
        CHECK(error.code() == ErrorCode::MalformedPayload);
    }
    CHECK_THROWS_AS(decode_sensor_report("<SENSOR_DATA|MPU|1.0x|0|0|0|0|0|BMP|1|2>"), GatewayError);
}
