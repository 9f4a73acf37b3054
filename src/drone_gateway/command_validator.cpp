#include "drone_gateway/command_validator.hpp"

#include <cmath>
#include <utility>

#include <fmt/format.h>

#include "drone_gateway/drone_state_machine.hpp"

namespace drone_gateway {

namespace {

constexpr double k_max_latitude_deg{90.0};
constexpr double k_max_longitude_deg{180.0};

ValidationResult reject(ErrorCode code, std::string reason) {
    ValidationResult result{};
    result.rejection = code;
    result.reason = std::move(reason);
    return result;
}

std::optional<double> payload_value(const CommandPayload& payload, const std::string& key) {
    const auto iterator_value = payload.find(key);
    if (iterator_value == payload.end()) {
        return std::nullopt;
    }
    return iterator_value->second;
}

}  // namespace

CommandValidator::CommandValidator(bool strict_ordering)
    : strict_ordering_(strict_ordering) {}

bool CommandValidator::strict_ordering() const noexcept {
    return strict_ordering_;
}

ValidationResult CommandValidator::validate(const Command& command,
                                            const DroneState* current_state,
                                            CommandId expected_id) const {
    if (current_state == nullptr) {
        return reject(ErrorCode::UnknownDrone, fmt::format("drone {} is not connected", command.drone_id));
    }

    // A stop is never refused over its payload; only the issuer is required.
    if (command.kind == CommandKind::EmergencyStop) {
        if (command.operator_id.empty()) {
            return reject(ErrorCode::MalformedPayload, "command has no issuing operator");
        }
        return ValidationResult{};
    }

    ValidationResult payload_result = validate_payload(command);
    if (!payload_result.ok()) {
        return payload_result;
    }

    if (!is_command_permitted(current_state->phase, command.kind)) {
        return reject(ErrorCode::IllegalTransition,
                      fmt::format("{} not permitted while {}", to_string(command.kind), to_string(current_state->phase)));
    }

    if (strict_ordering_ && command.id != expected_id) {
        return reject(ErrorCode::StaleCommand,
                      fmt::format("command id {} does not follow queue head; expected {}", command.id, expected_id));
    }

    return ValidationResult{};
}

ValidationResult CommandValidator::validate_payload(const Command& command) const {
    if (command.operator_id.empty()) {
        return reject(ErrorCode::MalformedPayload, "command has no issuing operator");
    }

    for (const auto& [key, value] : command.payload) {
        if (!std::isfinite(value)) {
            return reject(ErrorCode::MalformedPayload, fmt::format("payload field {} is not finite", key));
        }
    }

    switch (command.kind) {
        case CommandKind::Takeoff: {
            const std::optional<double> altitude = payload_value(command.payload, "altitude_m");
            if (!altitude.has_value() || altitude.value() <= 0.0) {
                return reject(ErrorCode::MalformedPayload, "Takeoff requires a positive altitude_m");
            }
            break;
        }
        case CommandKind::Move: {
            const std::optional<double> latitude = payload_value(command.payload, "latitude_deg");
            const std::optional<double> longitude = payload_value(command.payload, "longitude_deg");
            if (!latitude.has_value() || !longitude.has_value()
                || !payload_value(command.payload, "altitude_m").has_value()) {
                return reject(ErrorCode::MalformedPayload, "Move requires latitude_deg, longitude_deg and altitude_m");
            }
            if (std::abs(latitude.value()) > k_max_latitude_deg || std::abs(longitude.value()) > k_max_longitude_deg) {
                return reject(ErrorCode::MalformedPayload, "Move target is outside geodetic bounds");
            }
            break;
        }
        case CommandKind::Arm:
        case CommandKind::Disarm:
        case CommandKind::Land:
        case CommandKind::EmergencyStop:
            break;
    }

    return ValidationResult{};
}

}  // namespace drone_gateway
