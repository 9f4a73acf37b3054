// === Drone State Machine =====================================================
//
// Authoritative flight-phase tracking for a single drone. Legal transitions
// live in one explicit table; the validator consults the same table so a
// command is only ever accepted if its acknowledgement can be applied.

#pragma once

#include <optional>
#include <string>

#include "drone_gateway/command.hpp"
#include "drone_gateway/drone_state.hpp"
#include "drone_gateway/events.hpp"

namespace drone_gateway {

/** @brief Whether @p kind may be issued while the drone is in @p from. */
[[nodiscard]] bool is_command_permitted(FlightPhase from, CommandKind kind) noexcept;

/** @brief Phase reached once @p kind is acknowledged from @p from, if legal. */
[[nodiscard]] std::optional<FlightPhase> phase_after_ack(FlightPhase from, CommandKind kind) noexcept;

/**
 * @brief Owns a drone's DroneState and is its only writer.
 *
 * Not thread-safe on its own; callers hold the owning drone context's lock.
 */
class DroneStateMachine final {
  public:
    DroneStateMachine(std::string identifier, double ground_tolerance_m);

    [[nodiscard]] const DroneState& state() const noexcept;
    [[nodiscard]] FlightPhase phase() const noexcept;

    /**
     * @brief Apply the transition triggered by an acknowledged command.
     *
     * @return The phase change, or nullopt when the phase is unchanged (for
     *         example Move while Flying, or a command that became illegal
     *         between delivery and acknowledgement).
     */
    std::optional<StateChangeEvent> apply_acknowledged(const Command& command, TimePoint now);

    /**
     * @brief Store the snapshot and evaluate telemetry-driven transitions.
     */
    std::optional<StateChangeEvent> apply_telemetry(const TelemetrySnapshot& snapshot, TimePoint now);

    /** @brief Force the Fault phase (liveness loss or link teardown). */
    std::optional<StateChangeEvent> force_fault(StateChangeCause cause, TimePoint now);

  private:
    std::optional<StateChangeEvent> transition_to(FlightPhase next_phase, StateChangeCause cause, TimePoint now);

    DroneState struct_state_;
    double ground_tolerance_m_;
};

}  // namespace drone_gateway
