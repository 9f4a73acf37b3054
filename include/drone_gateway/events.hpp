// === Events ==================================================================
//
// Messages flowing into the gateway from drones (`TelemetryFrame`) and out of
// it towards operators (`GatewayEvent`). Every outbound event names the drone
// it concerns so per-drone ordering can be checked by consumers.

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "drone_gateway/command.hpp"
#include "drone_gateway/drone_state.hpp"
#include "drone_gateway/types.hpp"

namespace drone_gateway {

/** @brief Sequenced sensor packet received from a drone. */
struct TelemetryFrame final {
    DroneId drone_id{};
    SequenceNumber sequence{};
    TelemetrySnapshot payload{};
    TimePoint received_at{SteadyClock::now()};
};

/** @brief Why a drone's phase changed or why it went offline. */
enum class StateChangeCause {
    Command,    /**< An acknowledged operator command. */
    Telemetry,  /**< A qualifying telemetry reading. */
    Timeout,    /**< Liveness timeout eviction. */
    Disconnect  /**< Transport reported the connection closed. */
};

[[nodiscard]] std::string_view to_string(StateChangeCause cause) noexcept;

/** @brief Final status of a command reported back to its issuer. */
enum class CommandStatus {
    Acknowledged,
    Nacked,
    TimedOut,
    Unreachable,
    Dropped
};

[[nodiscard]] std::string_view to_string(CommandStatus status) noexcept;

/** @brief Applied telemetry republished to subscribers. */
struct TelemetryEvent final {
    DroneId drone_id{};
    SequenceNumber sequence{};
    TelemetrySnapshot snapshot{};
    TimePoint received_at{};
};

/** @brief Flight-phase change notification. */
struct StateChangeEvent final {
    DroneId drone_id{};
    FlightPhase previous_phase{FlightPhase::Idle};
    FlightPhase new_phase{FlightPhase::Idle};
    StateChangeCause cause{StateChangeCause::Command};
    std::optional<CommandId> command_id{};
};

/** @brief The drone session was torn down. */
struct DroneOfflineEvent final {
    DroneId drone_id{};
    StateChangeCause cause{StateChangeCause::Disconnect};
};

/** @brief Outcome of a command, sent only to the operator that issued it. */
struct CommandResultEvent final {
    DroneId drone_id{};
    CommandId command_id{};
    CommandKind kind{CommandKind::Arm};
    CommandStatus status{CommandStatus::Acknowledged};
    std::optional<ErrorCode> error{};
    std::string reason{};
};

using GatewayEvent = std::variant<TelemetryEvent, StateChangeEvent, DroneOfflineEvent, CommandResultEvent>;

/** @brief Drone identifier carried by any outbound event. */
[[nodiscard]] const DroneId& event_drone_id(const GatewayEvent& event) noexcept;

}  // namespace drone_gateway
