// === Command Dispatcher ======================================================
//
// Owns the lifecycle of a command from acceptance to acknowledgement:
//
//   submit -> validate (under the drone lock) -> queue -> deliver once
//          -> ack | nack | timeout -> state transition / issuer notification
//
// At most one regular command is in flight per drone; the next one is
// delivered only after the previous one resolves. EmergencyStop jumps the
// queue, is delivered immediately, and holds back regular commands until it
// resolves. Nothing is ever retried: operators resubmit explicitly.

#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "drone_gateway/broadcast_hub.hpp"
#include "drone_gateway/command.hpp"
#include "drone_gateway/command_validator.hpp"
#include "drone_gateway/logging.hpp"
#include "drone_gateway/session_registry.hpp"

namespace drone_gateway {

class CommandDispatcher final {
  public:
    CommandDispatcher(SessionRegistry& registry,
                      const CommandValidator& validator,
                      BroadcastHub& broadcast_hub,
                      Duration ack_timeout);

    /**
     * @brief Validate and enqueue a command, delivering it when the drone is free.
     *
     * Rejections (unknown operator, validator reasons, unreachable drone) are
     * returned synchronously and leave the drone's queue untouched.
     */
    SubmitResult submit(const CommandRequest& request, TimePoint now);

    /** @brief Resolve an in-flight command with the drone's reply. */
    AckDisposition acknowledge(const DroneId& drone_id, const CommandAck& ack, TimePoint now);

    /**
     * @brief Drop every delivered command whose ack deadline has passed.
     *
     * @return Number of commands that timed out across all drones.
     */
    std::size_t expire_overdue(TimePoint now);

    /**
     * @brief Drop all queued and in-flight commands of a session being torn down.
     *
     * Caller holds the drone's context lock.
     */
    void abandon_pending(DroneSession& session, StateChangeCause cause);

    [[nodiscard]] Duration ack_timeout() const noexcept;

  private:
    std::size_t expire_locked(DroneSession& session, TimePoint now);
    void pump_locked(DroneSession& session, TimePoint now);
    bool deliver_locked(DroneSession& session, PendingCommand& pending, TimePoint now);
    void notify_issuer(const Command& command,
                       CommandStatus status,
                       std::optional<ErrorCode> error,
                       std::string reason);

    SessionRegistry& registry_;
    const CommandValidator& validator_;
    BroadcastHub& broadcast_hub_;
    Duration ack_timeout_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace drone_gateway
