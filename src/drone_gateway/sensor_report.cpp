#include "drone_gateway/sensor_report.hpp"

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "drone_gateway/errors.hpp"

namespace drone_gateway {

namespace {

constexpr std::string_view k_report_prefix{"<SENSOR_DATA|"};
constexpr std::string_view k_report_suffix{">"};
constexpr std::string_view k_report_tag{"SENSOR_DATA"};
constexpr std::string_view k_imu_marker{"MPU"};
constexpr std::string_view k_baro_marker{"BMP"};
constexpr std::size_t k_minimum_field_count{11};
constexpr std::size_t k_altitude_field_index{11};

std::string_view trim(std::string_view text) {
    constexpr std::string_view k_whitespace{" \t\r\n"};
    const std::size_t first = text.find_first_not_of(k_whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const std::size_t last = text.find_last_not_of(k_whitespace);
    return text.substr(first, last - first + 1);
}

std::vector<std::string_view> split_fields(std::string_view body) {
    std::vector<std::string_view> list_fields;
    std::size_t start = 0;
    while (true) {
        const std::size_t separator = body.find('|', start);
        if (separator == std::string_view::npos) {
            list_fields.push_back(body.substr(start));
            break;
        }
        list_fields.push_back(body.substr(start, separator - start));
        start = separator + 1;
    }
    return list_fields;
}

double parse_field(std::string_view field, std::size_t index) {
    const std::string str_field{field};
    try {
        std::size_t consumed = 0;
        const double value = std::stod(str_field, &consumed);
        if (consumed != str_field.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return value;
    } catch (const std::exception&) {
        throw GatewayError(ErrorCode::MalformedPayload,
                           fmt::format("sensor report field {} is not a number: '{}'", index, str_field));
    }
}

}  // namespace

std::optional<TelemetrySnapshot> decode_sensor_report(std::string_view line) {
    const std::string_view trimmed = trim(line);
    if (trimmed.size() < k_report_prefix.size() + k_report_suffix.size()
        || trimmed.substr(0, k_report_prefix.size()) != k_report_prefix
        || trimmed.substr(trimmed.size() - k_report_suffix.size()) != k_report_suffix) {
        return std::nullopt;
    }

    const std::string_view body = trimmed.substr(1, trimmed.size() - 2);
    const std::vector<std::string_view> list_fields = split_fields(body);
    if (list_fields.size() < k_minimum_field_count
        || list_fields[0] != k_report_tag
        || list_fields[1] != k_imu_marker
        || list_fields[8] != k_baro_marker) {
        return std::nullopt;
    }

    constexpr std::array<const char*, 6> k_imu_channels{
        sensor_channel::k_accel_x,
        sensor_channel::k_accel_y,
        sensor_channel::k_accel_z,
        sensor_channel::k_gyro_x,
        sensor_channel::k_gyro_y,
        sensor_channel::k_gyro_z,
    };

    TelemetrySnapshot snapshot{};
    for (std::size_t offset = 0; offset < k_imu_channels.size(); ++offset) {
        const std::size_t index = 2 + offset;
        snapshot.channels[k_imu_channels[offset]] = parse_field(list_fields[index], index);
    }
    snapshot.channels[sensor_channel::k_baro_pressure] = parse_field(list_fields[9], 9);
    snapshot.channels[sensor_channel::k_baro_temperature] = parse_field(list_fields[10], 10);

    double altitude_m = 0.0;
    if (list_fields.size() > k_altitude_field_index) {
        altitude_m = parse_field(list_fields[k_altitude_field_index], k_altitude_field_index);
    }
    snapshot.channels[sensor_channel::k_baro_altitude] = altitude_m;
    snapshot.relative_altitude_m = altitude_m;
    return snapshot;
}

}  // namespace drone_gateway
