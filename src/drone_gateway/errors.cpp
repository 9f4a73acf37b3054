#include "drone_gateway/errors.hpp"

namespace drone_gateway {

std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::DuplicateSession:
            return "DuplicateSession";
        case ErrorCode::NotFound:
            return "NotFound";
        case ErrorCode::UnknownDrone:
            return "UnknownDrone";
        case ErrorCode::IllegalTransition:
            return "IllegalTransition";
        case ErrorCode::StaleCommand:
            return "StaleCommand";
        case ErrorCode::MalformedPayload:
            return "MalformedPayload";
        case ErrorCode::DroneUnreachable:
            return "DroneUnreachable";
        case ErrorCode::CommandTimedOut:
            return "CommandTimedOut";
        case ErrorCode::BufferOverflow:
            return "BufferOverflow";
    }
    return "Unknown";
}

GatewayError::GatewayError(ErrorCode code, const std::string& message)
    : std::runtime_error(message),
      code_(code) {}

ErrorCode GatewayError::code() const noexcept {
    return code_;
}

}  // namespace drone_gateway
