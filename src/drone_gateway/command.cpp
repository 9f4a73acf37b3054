#include "drone_gateway/command.hpp"

namespace drone_gateway {

std::string_view to_string(CommandKind kind) noexcept {
    switch (kind) {
        case CommandKind::Arm:
            return "Arm";
        case CommandKind::Disarm:
            return "Disarm";
        case CommandKind::Takeoff:
            return "Takeoff";
        case CommandKind::Land:
            return "Land";
        case CommandKind::Move:
            return "Move";
        case CommandKind::EmergencyStop:
            return "EmergencyStop";
    }
    return "Unknown";
}

}  // namespace drone_gateway
