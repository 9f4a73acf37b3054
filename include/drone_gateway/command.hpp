// === Commands ================================================================
//
// Operator command types as they travel through the gateway: the request an
// operator submits, the immutable `Command` created once validation succeeds,
// the delivery sent to the drone, and the drone's acknowledgement.

#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "drone_gateway/errors.hpp"
#include "drone_gateway/types.hpp"

namespace drone_gateway {

/** @brief Kinds of control commands an operator may issue. */
enum class CommandKind {
    Arm,
    Disarm,
    Takeoff,
    Land,
    Move,
    EmergencyStop
};

[[nodiscard]] std::string_view to_string(CommandKind kind) noexcept;

/** @brief Named numeric arguments forwarded to the drone. */
using CommandPayload = std::map<std::string, double>;

/**
 * @brief Command submission as received from an operator connection.
 *
 * `command_id` is optional: when absent the dispatcher assigns the next id
 * for the drone; when present and strict ordering is enabled it must equal
 * the drone's queue head plus one.
 */
struct CommandRequest final {
    DroneId drone_id{};
    OperatorId operator_id{};
    CommandKind kind{CommandKind::Arm};
    CommandPayload payload{};
    std::optional<CommandId> command_id{};
};

/** @brief Immutable command accepted for a drone. */
struct Command final {
    CommandId id{};
    DroneId drone_id{};
    OperatorId operator_id{};
    CommandKind kind{CommandKind::Arm};
    CommandPayload payload{};
    TimePoint issued_at{SteadyClock::now()};
};

/** @brief Wire-level delivery sent to the drone connection. */
struct CommandDelivery final {
    CommandId command_id{};
    CommandKind kind{CommandKind::Arm};
    CommandPayload payload{};
};

/** @brief Drone reply to a delivered command. */
enum class AckOutcome {
    Ack,
    Nack
};

/** @brief Acknowledgement received from the drone connection. */
struct CommandAck final {
    CommandId command_id{};
    AckOutcome outcome{AckOutcome::Ack};
    std::string reason{};
};

/**
 * @brief Synchronous answer returned to the submitting operator.
 */
struct SubmitResult final {
    std::optional<CommandId> command_id{}; /**< Assigned id when accepted. */
    std::optional<ErrorCode> error{};      /**< Rejection reason when refused. */
    std::string detail{};                  /**< Human-readable explanation. */

    [[nodiscard]] bool accepted() const noexcept {
        return !error.has_value();
    }
};

/** @brief Result of handing an acknowledgement to the dispatcher. */
enum class AckDisposition {
    Applied,        /**< Matched an in-flight command and was processed. */
    UnknownCommand, /**< No in-flight command with that id (late or duplicate ack). */
    UnknownDrone    /**< The drone is no longer connected. */
};

}  // namespace drone_gateway
