#include "drone_gateway/events.hpp"

namespace drone_gateway {

std::string_view to_string(StateChangeCause cause) noexcept {
    switch (cause) {
        case StateChangeCause::Command:
            return "command";
        case StateChangeCause::Telemetry:
            return "telemetry";
        case StateChangeCause::Timeout:
            return "timeout";
        case StateChangeCause::Disconnect:
            return "disconnect";
    }
    return "unknown";
}

std::string_view to_string(CommandStatus status) noexcept {
    switch (status) {
        case CommandStatus::Acknowledged:
            return "acknowledged";
        case CommandStatus::Nacked:
            return "nacked";
        case CommandStatus::TimedOut:
            return "timed_out";
        case CommandStatus::Unreachable:
            return "unreachable";
        case CommandStatus::Dropped:
            return "dropped";
    }
    return "unknown";
}

const DroneId& event_drone_id(const GatewayEvent& event) noexcept {
    return std::visit([](const auto& typed_event) -> const DroneId& { return typed_event.drone_id; }, event);
}

}  // namespace drone_gateway
