// === Command Validator =======================================================
//
// Stateless checks applied to every command before it reaches a drone queue:
// payload shape, phase legality against the transition table, and per-drone
// id ordering. EmergencyStop bypasses the payload, phase and ordering checks
// and only needs an issuing operator.

#pragma once

#include <optional>
#include <string>

#include "drone_gateway/command.hpp"
#include "drone_gateway/drone_state.hpp"
#include "drone_gateway/errors.hpp"

namespace drone_gateway {

/** @brief Ok, or the first rejection reason found. */
struct ValidationResult final {
    std::optional<ErrorCode> rejection{};
    std::string reason{};

    [[nodiscard]] bool ok() const noexcept {
        return !rejection.has_value();
    }
};

class CommandValidator final {
  public:
    explicit CommandValidator(bool strict_ordering);

    [[nodiscard]] bool strict_ordering() const noexcept;

    /**
     * @brief Validate @p command against the drone's current state.
     *
     * @param command Candidate command with its proposed id.
     * @param current_state Drone state, or nullptr when the drone is not connected.
     * @param expected_id Id the drone's queue expects next (last issued + 1).
     */
    [[nodiscard]] ValidationResult validate(const Command& command,
                                            const DroneState* current_state,
                                            CommandId expected_id) const;

    /** @brief Payload shape checks only. */
    [[nodiscard]] ValidationResult validate_payload(const Command& command) const;

  private:
    bool strict_ordering_;
};

}  // namespace drone_gateway
