// === Configuration Loader ====================================================
//
// Centralizes parsing and validation of environment-driven settings that feed
// the gateway runtime.
//
// Responsibilities
// - Enforce defaults and sane bounds for liveness, ack timeout, buffer
//   capacity and maintenance cadence.
// - Surface clear diagnostics via the logging subsystem whenever user input
//   cannot be parsed or violates expectations.
//
// Note: This file intentionally avoids reading from disk; the deployment is
// expected to populate the process environment ahead of time.

#include "drone_gateway/configuration.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <string_view>

#include "drone_gateway/logging.hpp"

namespace drone_gateway {

namespace {
constexpr double k_default_liveness_timeout_s{5.0};
constexpr double k_default_ack_timeout_s{3.0};
constexpr int k_default_subscriber_capacity{256};
constexpr double k_default_maintenance_hz{20.0};
constexpr double k_default_ground_tolerance_m{0.3};
constexpr std::string_view k_default_log_directory{"logs"};

double clamp_positive(double value, double fallback) {
    if (value <= 0.0) {
        return fallback;
    }
    return value;
}

double parse_double(const char* raw_value, double fallback) {
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const double parsed_value = std::stod(raw_value);
        return clamp_positive(parsed_value, fallback);
    } catch (const std::exception&) {
        auto logger = get_logger();
        logger->warn("Failed to parse double from environment; using fallback {}", fallback);
        return fallback;
    }
}

int parse_int(const char* raw_value, int fallback) {
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const int parsed_value = std::stoi(raw_value);
        return parsed_value <= 0 ? fallback : parsed_value;
    } catch (const std::exception&) {
        auto logger = get_logger();
        logger->warn("Failed to parse integer from environment; using fallback {}", fallback);
        return fallback;
    }
}

bool parse_bool(const char* raw_value, bool fallback) {
    if (raw_value == nullptr) {
        return fallback;
    }
    std::string str_value{raw_value};
    std::transform(str_value.begin(), str_value.end(), str_value.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    if (str_value == "1" || str_value == "true" || str_value == "yes" || str_value == "on") {
        return true;
    }
    if (str_value == "0" || str_value == "false" || str_value == "no" || str_value == "off") {
        return false;
    }
    auto logger = get_logger();
    logger->warn("Failed to parse boolean '{}' from environment; using fallback {}", str_value, fallback);
    return fallback;
}

std::string parse_log_level(const char* raw_level) {
    if (raw_level == nullptr || std::string_view{raw_level}.empty()) {
        return "info";
    }
    std::string str_level{raw_level};
    std::transform(str_level.begin(), str_level.end(), str_level.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return str_level;
}

std::string parse_log_directory() {
    const char* raw_directory = std::getenv("DRONE_GATEWAY_LOG_DIR");
    if (raw_directory == nullptr || std::string_view{raw_directory}.empty()) {
        return std::string{k_default_log_directory};
    }
    return std::string{raw_directory};
}

}  // namespace

Configuration ConfigurationLoader::load() {
    Configuration config{};
    config.log_directory = parse_log_directory();

    auto logger = initialize_logger(config.log_directory);
    logger->info("Loading configuration from environment");

    config.liveness_timeout = Duration{parse_double(std::getenv("DRONE_GATEWAY_LIVENESS_TIMEOUT_S"), k_default_liveness_timeout_s)};
    config.command_ack_timeout = Duration{parse_double(std::getenv("DRONE_GATEWAY_ACK_TIMEOUT_S"), k_default_ack_timeout_s)};
    config.subscriber_buffer_capacity = static_cast<std::size_t>(
        parse_int(std::getenv("DRONE_GATEWAY_SUBSCRIBER_CAPACITY"), k_default_subscriber_capacity)
    );
    config.maintenance_interval = load_maintenance_interval();
    config.ground_altitude_tolerance_m = parse_double(std::getenv("DRONE_GATEWAY_GROUND_TOLERANCE_M"), k_default_ground_tolerance_m);
    config.strict_command_ordering = parse_bool(std::getenv("DRONE_GATEWAY_STRICT_ORDERING"), true);
    const std::string requested_level = parse_log_level(std::getenv("DRONE_GATEWAY_LOG_LEVEL"));
    config.log_level = set_log_level(requested_level) ? requested_level : std::string{"info"};

    logger->info("Configuration loaded: liveness_timeout_s={} ack_timeout_s={} subscriber_capacity={} strict_ordering={} log_level={}",
                 config.liveness_timeout.count(),
                 config.command_ack_timeout.count(),
                 config.subscriber_buffer_capacity,
                 config.strict_command_ordering,
                 config.log_level);

    return config;
}

Duration ConfigurationLoader::load_maintenance_interval() {
    const double parsed_hz = parse_double(std::getenv("DRONE_GATEWAY_MAINTENANCE_HZ"), k_default_maintenance_hz);
    return Duration{1.0 / parsed_hz};
}

}  // namespace drone_gateway
