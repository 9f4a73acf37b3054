#include "drone_gateway/command_dispatcher.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "drone_gateway/drone_state_machine.hpp"

namespace drone_gateway {

namespace {

SubmitResult rejected(ErrorCode code, std::string detail) {
    SubmitResult result{};
    result.error = code;
    result.detail = std::move(detail);
    return result;
}

bool has_in_flight(const DroneSession& session) {
    return std::any_of(session.pending_commands.begin(), session.pending_commands.end(),
                       [](const PendingCommand& pending) { return pending.delivered; });
}

}  // namespace

CommandDispatcher::CommandDispatcher(SessionRegistry& registry,
                                     const CommandValidator& validator,
                                     BroadcastHub& broadcast_hub,
                                     Duration ack_timeout)
    : registry_(registry),
      validator_(validator),
      broadcast_hub_(broadcast_hub),
      ack_timeout_(ack_timeout),
      logger_(get_logger()) {
    if (ack_timeout_.count() <= 0.0) {
        throw std::invalid_argument("CommandDispatcher ack timeout must be positive");
    }
}

SubmitResult CommandDispatcher::submit(const CommandRequest& request, TimePoint now) {
    if (registry_.find_operator(request.operator_id) == nullptr) {
        return rejected(ErrorCode::NotFound, fmt::format("operator {} is not connected", request.operator_id));
    }

    Command command{};
    command.drone_id = request.drone_id;
    command.operator_id = request.operator_id;
    command.kind = request.kind;
    command.payload = request.payload;
    command.issued_at = now;

    const DroneContextPtr context = registry_.find_drone(request.drone_id);
    if (context == nullptr) {
        const ValidationResult result = validator_.validate(command, nullptr, 0);
        return rejected(result.rejection.value_or(ErrorCode::UnknownDrone), result.reason);
    }

    std::scoped_lock lock(context->mutex);
    if (!context->active) {
        const ValidationResult result = validator_.validate(command, nullptr, 0);
        return rejected(result.rejection.value_or(ErrorCode::UnknownDrone), result.reason);
    }

    DroneSession& session = context->session;
    const CommandId expected_id = session.last_issued_command_id + 1;
    const bool use_requested_id = command.kind != CommandKind::EmergencyStop
        && validator_.strict_ordering()
        && request.command_id.has_value();
    command.id = use_requested_id ? request.command_id.value() : expected_id;

    const ValidationResult validation = validator_.validate(command, &session.state_machine.state(), expected_id);
    if (!validation.ok()) {
        logger_->info(
            R"({{"component":"command_dispatcher","event":"rejected","drone":"{}","operator":"{}","kind":"{}","reason":"{}"}})",
            command.drone_id,
            command.operator_id,
            to_string(command.kind),
            to_string(validation.rejection.value())
        );
        return rejected(validation.rejection.value(), validation.reason);
    }

    if (session.connection == nullptr || !session.connection->is_open()) {
        return rejected(ErrorCode::DroneUnreachable, fmt::format("drone {} connection is unavailable", command.drone_id));
    }

    const bool jumps_queue = command.kind == CommandKind::EmergencyStop;
    const bool deliver_now = jumps_queue || !has_in_flight(session);

    PendingCommand pending{};
    pending.command = command;
    if (jumps_queue) {
        session.pending_commands.push_front(std::move(pending));
    } else {
        session.pending_commands.push_back(std::move(pending));
    }
    session.last_issued_command_id = command.id;

    if (deliver_now) {
        PendingCommand& slot = jumps_queue ? session.pending_commands.front() : session.pending_commands.back();
        if (!deliver_locked(session, slot, now)) {
            if (jumps_queue) {
                session.pending_commands.pop_front();
            } else {
                session.pending_commands.pop_back();
            }
            session.last_issued_command_id = expected_id - 1;
            return rejected(ErrorCode::DroneUnreachable, fmt::format("delivery to drone {} failed", command.drone_id));
        }
    }

    if (jumps_queue) {
        logger_->warn(
            R"({{"component":"command_dispatcher","event":"emergency_stop","drone":"{}","operator":"{}","queued_behind":{}}})",
            command.drone_id,
            command.operator_id,
            session.pending_commands.size() - 1
        );
    } else {
        logger_->info("Accepted {} #{} for {} from {}",
                      to_string(command.kind),
                      command.id,
                      command.drone_id,
                      command.operator_id);
    }

    SubmitResult result{};
    result.command_id = command.id;
    return result;
}

AckDisposition CommandDispatcher::acknowledge(const DroneId& drone_id, const CommandAck& ack, TimePoint now) {
    const DroneContextPtr context = registry_.find_drone(drone_id);
    if (context == nullptr) {
        return AckDisposition::UnknownDrone;
    }

    std::scoped_lock lock(context->mutex);
    if (!context->active) {
        return AckDisposition::UnknownDrone;
    }

    DroneSession& session = context->session;
    session.last_seen = std::max(session.last_seen, now);

    const auto iterator_pending = std::find_if(
        session.pending_commands.begin(),
        session.pending_commands.end(),
        [&ack](const PendingCommand& pending) { return pending.delivered && pending.command.id == ack.command_id; }
    );
    if (iterator_pending == session.pending_commands.end()) {
        logger_->warn("Ignoring ack for unknown or expired command #{} from {}", ack.command_id, drone_id);
        return AckDisposition::UnknownCommand;
    }

    const Command command = iterator_pending->command;
    session.pending_commands.erase(iterator_pending);

    if (ack.outcome == AckOutcome::Ack) {
        const std::optional<StateChangeEvent> phase_change = session.state_machine.apply_acknowledged(command, now);
        if (phase_change.has_value()) {
            logger_->info(
                R"({{"component":"command_dispatcher","drone":"{}","from":"{}","to":"{}","cause":"{}","command":{}}})",
                drone_id,
                to_string(phase_change->previous_phase),
                to_string(phase_change->new_phase),
                to_string(phase_change->cause),
                command.id
            );
            broadcast_hub_.publish(drone_id, phase_change.value());
        } else if (!phase_after_ack(session.state_machine.phase(), command.kind).has_value()) {
            logger_->warn("Ack for {} #{} on {} does not apply from {}",
                          to_string(command.kind),
                          command.id,
                          drone_id,
                          to_string(session.state_machine.phase()));
        }
        notify_issuer(command, CommandStatus::Acknowledged, std::nullopt, {});
    } else {
        logger_->info("Drone {} refused {} #{}: {}", drone_id, to_string(command.kind), command.id, ack.reason);
        notify_issuer(command, CommandStatus::Nacked, ErrorCode::CommandTimedOut, ack.reason);
    }

    pump_locked(session, now);
    return AckDisposition::Applied;
}

std::size_t CommandDispatcher::expire_overdue(TimePoint now) {
    std::size_t expired_count = 0;
    for (const DroneId& drone_id : registry_.drone_ids()) {
        const DroneContextPtr context = registry_.find_drone(drone_id);
        if (context == nullptr) {
            continue;
        }
        std::scoped_lock lock(context->mutex);
        if (!context->active) {
            continue;
        }
        expired_count += expire_locked(context->session, now);
    }
    return expired_count;
}

void CommandDispatcher::abandon_pending(DroneSession& session, StateChangeCause cause) {
    const std::string reason = fmt::format("drone session closed ({})", to_string(cause));
    for (const PendingCommand& pending : session.pending_commands) {
        notify_issuer(pending.command, CommandStatus::Dropped, ErrorCode::DroneUnreachable, reason);
    }
    if (!session.pending_commands.empty()) {
        logger_->info("Dropped {} pending commands for {}", session.pending_commands.size(), session.identifier);
    }
    session.pending_commands.clear();
}

Duration CommandDispatcher::ack_timeout() const noexcept {
    return ack_timeout_;
}

std::size_t CommandDispatcher::expire_locked(DroneSession& session, TimePoint now) {
    std::size_t expired_count = 0;
    auto iterator_pending = session.pending_commands.begin();
    while (iterator_pending != session.pending_commands.end()) {
        if (!iterator_pending->delivered || now <= iterator_pending->ack_deadline) {
            ++iterator_pending;
            continue;
        }
        const Command command = iterator_pending->command;
        iterator_pending = session.pending_commands.erase(iterator_pending);
        ++expired_count;

        logger_->warn(
            R"({{"component":"command_dispatcher","event":"{}","drone":"{}","command":{},"kind":"{}"}})",
            to_string(ErrorCode::CommandTimedOut),
            command.drone_id,
            command.id,
            to_string(command.kind)
        );
        notify_issuer(command, CommandStatus::TimedOut, ErrorCode::CommandTimedOut, "no acknowledgement before deadline");
    }
    if (expired_count > 0) {
        pump_locked(session, now);
    }
    return expired_count;
}

void CommandDispatcher::pump_locked(DroneSession& session, TimePoint now) {
    while (!session.pending_commands.empty() && !has_in_flight(session)) {
        PendingCommand& next = session.pending_commands.front();

        if (!is_command_permitted(session.state_machine.phase(), next.command.kind)) {
            notify_issuer(next.command,
                          CommandStatus::Dropped,
                          ErrorCode::IllegalTransition,
                          fmt::format("{} no longer permitted while {}",
                                      to_string(next.command.kind),
                                      to_string(session.state_machine.phase())));
            session.pending_commands.pop_front();
            continue;
        }

        if (!deliver_locked(session, next, now)) {
            notify_issuer(next.command, CommandStatus::Unreachable, ErrorCode::DroneUnreachable, "delivery failed");
            session.pending_commands.pop_front();
            continue;
        }
    }
}

bool CommandDispatcher::deliver_locked(DroneSession& session, PendingCommand& pending, TimePoint now) {
    if (session.connection == nullptr || !session.connection->is_open()) {
        return false;
    }

    CommandDelivery delivery{};
    delivery.command_id = pending.command.id;
    delivery.kind = pending.command.kind;
    delivery.payload = pending.command.payload;

    bool delivered = false;
    try {
        delivered = session.connection->deliver(delivery);
    } catch (const std::exception& exc) {
        logger_->error("Delivery of #{} to {} threw: {}", delivery.command_id, session.identifier, exc.what());
        delivered = false;
    }
    if (!delivered) {
        return false;
    }

    pending.delivered = true;
    pending.ack_deadline = now + std::chrono::duration_cast<SteadyClock::duration>(ack_timeout_);
    return true;
}

void CommandDispatcher::notify_issuer(const Command& command,
                                      CommandStatus status,
                                      std::optional<ErrorCode> error,
                                      std::string reason) {
    CommandResultEvent event{};
    event.drone_id = command.drone_id;
    event.command_id = command.id;
    event.kind = command.kind;
    event.status = status;
    event.error = error;
    event.reason = std::move(reason);
    if (!broadcast_hub_.deliver_to(command.operator_id, event)) {
        logger_->debug("Issuer {} of #{} is gone; result {} not delivered",
                       command.operator_id,
                       command.id,
                       to_string(status));
    }
}

}  // namespace drone_gateway
