#include "drone_gateway/drone_state_machine.hpp"

#include <array>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace drone_gateway {

namespace {

/** @brief One row of the command-driven transition table. */
struct PhaseTransition final {
    FlightPhase from;
    CommandKind trigger;
    FlightPhase to;
};

// EmergencyStop is legal from every phase and is handled outside the table.
constexpr std::array<PhaseTransition, 5> k_command_transitions{{
    {FlightPhase::Idle, CommandKind::Arm, FlightPhase::Armed},
    {FlightPhase::Armed, CommandKind::Disarm, FlightPhase::Idle},
    {FlightPhase::Armed, CommandKind::Takeoff, FlightPhase::Flying},
    {FlightPhase::Flying, CommandKind::Land, FlightPhase::Landing},
    {FlightPhase::Flying, CommandKind::Move, FlightPhase::Flying},
}};

}  // namespace

std::string_view to_string(FlightPhase phase) noexcept {
    switch (phase) {
        case FlightPhase::Idle:
            return "Idle";
        case FlightPhase::Armed:
            return "Armed";
        case FlightPhase::Flying:
            return "Flying";
        case FlightPhase::Landing:
            return "Landing";
        case FlightPhase::Fault:
            return "Fault";
    }
    return "Unknown";
}

bool is_airborne(FlightPhase phase) noexcept {
    return phase == FlightPhase::Flying || phase == FlightPhase::Landing;
}

std::optional<FlightPhase> phase_after_ack(FlightPhase from, CommandKind kind) noexcept {
    if (kind == CommandKind::EmergencyStop) {
        return FlightPhase::Fault;
    }
    for (const PhaseTransition& transition : k_command_transitions) {
        if (transition.from == from && transition.trigger == kind) {
            return transition.to;
        }
    }
    return std::nullopt;
}

bool is_command_permitted(FlightPhase from, CommandKind kind) noexcept {
    return phase_after_ack(from, kind).has_value();
}

DroneStateMachine::DroneStateMachine(std::string identifier, double ground_tolerance_m)
    : ground_tolerance_m_(ground_tolerance_m) {
    if (identifier.empty()) {
        throw std::invalid_argument("DroneStateMachine identifier cannot be empty");
    }
    if (ground_tolerance_m_ < 0.0) {
        throw std::invalid_argument("DroneStateMachine ground tolerance must not be negative");
    }
    struct_state_.identifier = std::move(identifier);
    struct_state_.phase = FlightPhase::Idle;
}

const DroneState& DroneStateMachine::state() const noexcept {
    return struct_state_;
}

FlightPhase DroneStateMachine::phase() const noexcept {
    return struct_state_.phase;
}

std::optional<StateChangeEvent> DroneStateMachine::apply_acknowledged(const Command& command, TimePoint now) {
    const std::optional<FlightPhase> optional_next = phase_after_ack(struct_state_.phase, command.kind);
    if (!optional_next.has_value()) {
        return std::nullopt;
    }
    std::optional<StateChangeEvent> change = transition_to(optional_next.value(), StateChangeCause::Command, now);
    if (change.has_value()) {
        change->command_id = command.id;
    }
    return change;
}

std::optional<StateChangeEvent> DroneStateMachine::apply_telemetry(const TelemetrySnapshot& snapshot, TimePoint now) {
    struct_state_.telemetry = snapshot;
    struct_state_.last_update_time = now;

    if (struct_state_.phase == FlightPhase::Landing && std::abs(snapshot.relative_altitude_m) <= ground_tolerance_m_) {
        return transition_to(FlightPhase::Idle, StateChangeCause::Telemetry, now);
    }
    return std::nullopt;
}

std::optional<StateChangeEvent> DroneStateMachine::force_fault(StateChangeCause cause, TimePoint now) {
    return transition_to(FlightPhase::Fault, cause, now);
}

std::optional<StateChangeEvent> DroneStateMachine::transition_to(FlightPhase next_phase, StateChangeCause cause, TimePoint now) {
    if (next_phase == struct_state_.phase) {
        return std::nullopt;
    }
    StateChangeEvent event{};
    event.drone_id = struct_state_.identifier;
    event.previous_phase = struct_state_.phase;
    event.new_phase = next_phase;
    event.cause = cause;

    struct_state_.phase = next_phase;
    struct_state_.last_update_time = now;
    return event;
}

}  // namespace drone_gateway
