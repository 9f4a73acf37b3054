#include "drone_gateway/gateway_runtime.hpp"

#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>

#include "drone_gateway/errors.hpp"
#include "drone_gateway/logging.hpp"
#include "drone_gateway/version.hpp"

namespace drone_gateway {

GatewayRuntime::GatewayRuntime(Configuration configuration)
    : configuration_(std::move(configuration)),
      logger_(get_logger()),
      started_at_(SteadyClock::now()),
      registry_(configuration_.liveness_timeout, configuration_.ground_altitude_tolerance_m),
      broadcast_hub_(configuration_.subscriber_buffer_capacity),
      validator_(configuration_.strict_command_ordering),
      telemetry_router_(registry_, broadcast_hub_),
      command_dispatcher_(registry_, validator_, broadcast_hub_, configuration_.command_ack_timeout) {
    if (configuration_.flush_batch_size == 0) {
        throw std::invalid_argument("GatewayRuntime flush batch size must be positive");
    }
    registry_.set_teardown_handlers(
        [this](DroneSession& session, StateChangeCause cause, TimePoint now) { teardown_drone(session, cause, now); },
        [this](OperatorSession& session, StateChangeCause cause, TimePoint now) { teardown_operator(session, cause, now); }
    );
    logger_->info("Drone gateway {} initialized", k_version);
}

GatewayRuntime::~GatewayRuntime() {
    shutdown();
}

void GatewayRuntime::register_drone(const DroneId& drone_id, DroneConnectionPtr connection, TimePoint now) {
    registry_.register_drone(drone_id, std::move(connection), now);
}

void GatewayRuntime::register_operator(const OperatorId& operator_id, OperatorConnectionPtr connection, TimePoint now) {
    registry_.register_operator(operator_id, std::move(connection), now);
    broadcast_hub_.attach_subscriber(operator_id);
}

bool GatewayRuntime::disconnect(const std::string& identifier, TimePoint now) {
    return registry_.unregister(identifier, now, StateChangeCause::Disconnect);
}

void GatewayRuntime::heartbeat(const std::string& identifier, TimePoint now) {
    registry_.heartbeat(identifier, now);
}

SubmitResult GatewayRuntime::submit_command(const CommandRequest& request, TimePoint now) {
    return command_dispatcher_.submit(request, now);
}

AckDisposition GatewayRuntime::acknowledge(const DroneId& drone_id, const CommandAck& ack, TimePoint now) {
    return command_dispatcher_.acknowledge(drone_id, ack, now);
}

IngestOutcome GatewayRuntime::ingest_telemetry(const TelemetryFrame& frame) {
    return telemetry_router_.ingest(frame);
}

IngestOutcome GatewayRuntime::ingest_sensor_report(const DroneId& drone_id,
                                                   SequenceNumber sequence,
                                                   std::string_view line,
                                                   TimePoint received_at) {
    return telemetry_router_.ingest_sensor_report(drone_id, sequence, line, received_at);
}

void GatewayRuntime::subscribe(const OperatorId& operator_id, const DroneId& drone_id) {
    const OperatorContextPtr context = registry_.lookup_operator(operator_id);
    std::scoped_lock lock(context->mutex);
    if (!context->active) {
        throw GatewayError(ErrorCode::NotFound, "operator " + operator_id + " disconnected");
    }
    broadcast_hub_.subscribe(operator_id, drone_id);
    context->session.set_subscriptions.insert(drone_id);
    logger_->debug("Operator {} subscribed to {}", operator_id, drone_id);
}

void GatewayRuntime::unsubscribe(const OperatorId& operator_id, const DroneId& drone_id) {
    const OperatorContextPtr context = registry_.lookup_operator(operator_id);
    std::scoped_lock lock(context->mutex);
    if (!context->active) {
        throw GatewayError(ErrorCode::NotFound, "operator " + operator_id + " disconnected");
    }
    broadcast_hub_.unsubscribe(operator_id, drone_id);
    context->session.set_subscriptions.erase(drone_id);
}

std::optional<DroneStatus> GatewayRuntime::drone_status(const DroneId& drone_id) const {
    const DroneContextPtr context = registry_.find_drone(drone_id);
    if (context == nullptr) {
        return std::nullopt;
    }
    std::scoped_lock lock(context->mutex);
    if (!context->active) {
        return std::nullopt;
    }

    const DroneSession& session = context->session;
    DroneStatus status{};
    status.state = session.state_machine.state();
    status.pending_commands = session.pending_commands.size();
    for (const PendingCommand& pending : session.pending_commands) {
        if (pending.delivered && pending.command.kind != CommandKind::EmergencyStop) {
            status.in_flight_command = pending.command.id;
        }
    }
    status.last_issued_command_id = session.last_issued_command_id;
    status.last_applied_sequence = session.last_applied_sequence;
    status.last_seen = session.last_seen;
    return status;
}

GatewayStatus GatewayRuntime::gateway_status(TimePoint now) const {
    GatewayStatus status{};
    status.version = std::string{k_version};
    status.uptime = elapsed_between(started_at_, now);
    status.connected_drones = registry_.drone_count();
    status.connected_operators = registry_.operator_count();
    status.dropped_events = broadcast_hub_.total_dropped_events();
    status.telemetry = telemetry_router_.counters();
    return status;
}

std::size_t GatewayRuntime::flush_operator(const OperatorId& operator_id) {
    const OperatorContextPtr context = registry_.find_operator(operator_id);
    if (context == nullptr) {
        return 0;
    }
    std::scoped_lock lock(context->mutex);
    OperatorSession& session = context->session;
    if (!context->active || session.connection == nullptr || !session.connection->is_open()) {
        return 0;
    }

    std::size_t sent_count = 0;
    std::size_t failed_count = 0;
    for (const GatewayEvent& event : broadcast_hub_.drain(operator_id, configuration_.flush_batch_size)) {
        if (session.connection->send(event)) {
            ++sent_count;
        } else {
            ++failed_count;
        }
    }
    if (failed_count > 0) {
        logger_->warn("Operator {} rejected {} events during flush", operator_id, failed_count);
    }
    return sent_count;
}

std::size_t GatewayRuntime::flush_all() {
    std::size_t sent_count = 0;
    for (const OperatorId& operator_id : registry_.operator_ids()) {
        sent_count += flush_operator(operator_id);
    }
    return sent_count;
}

void GatewayRuntime::tick(TimePoint now) {
    const std::size_t evicted_count = registry_.sweep(now);
    const std::size_t expired_count = command_dispatcher_.expire_overdue(now);
    flush_all();
    if (evicted_count > 0 || expired_count > 0) {
        logger_->debug("Maintenance evicted {} sessions and expired {} commands", evicted_count, expired_count);
    }
}

/**
 * @brief Start the background maintenance thread.
 */
void GatewayRuntime::run() {
    if (flag_shut_down_.load()) {
        logger_->warn("Ignoring run() on a gateway runtime that was already shut down");
        return;
    }
    if (flag_running_.exchange(true)) {
        return;
    }
    logger_->info("Starting gateway maintenance loop");
    maintenance_thread_ = std::thread(&GatewayRuntime::maintenance_loop, this);
}

/**
 * @brief Stop the maintenance thread if it runs, then close all sessions.
 *
 * Runtimes pumped through tick() never start the thread but still need their
 * sessions closed, so teardown does not depend on run() having been called.
 */
void GatewayRuntime::shutdown() {
    if (flag_shut_down_.exchange(true)) {
        return;
    }
    logger_->info("Shutting down gateway runtime");
    flag_running_.store(false);
    if (maintenance_thread_.joinable()) {
        maintenance_thread_.join();
    }

    const TimePoint now = SteadyClock::now();
    for (const DroneId& drone_id : registry_.drone_ids()) {
        registry_.unregister(drone_id, now, StateChangeCause::Disconnect);
    }
    flush_all();
    for (const OperatorId& operator_id : registry_.operator_ids()) {
        registry_.unregister(operator_id, now, StateChangeCause::Disconnect);
    }
    logger_->flush();
}

const Configuration& GatewayRuntime::configuration() const noexcept {
    return configuration_;
}

const BroadcastHub& GatewayRuntime::broadcast_hub() const noexcept {
    return broadcast_hub_;
}

/**
 * @brief Fixed-cadence loop running liveness, ack-timeout and flush passes.
 */
void GatewayRuntime::maintenance_loop() {
    const SteadyClock::duration steady_interval = std::chrono::duration_cast<SteadyClock::duration>(configuration_.maintenance_interval);
    auto next_tick = SteadyClock::now();
    while (flag_running_.load()) {
        const TimePoint now = SteadyClock::now();
        if (now < next_tick) {
            std::this_thread::sleep_for(next_tick - now);
            continue;
        }
        try {
            tick(now);
        } catch (const std::exception& exc) {
            logger_->error("Maintenance loop error: {}", exc.what());
        }
        next_tick = now + steady_interval;
    }
}

void GatewayRuntime::teardown_drone(DroneSession& session, StateChangeCause cause, TimePoint now) {
    command_dispatcher_.abandon_pending(session, cause);

    // A drone that vanishes while airborne must not look healthy to observers.
    if (is_airborne(session.state_machine.phase())) {
        if (const std::optional<StateChangeEvent> phase_change = session.state_machine.force_fault(cause, now); phase_change.has_value()) {
            logger_->warn(
                R"({{"component":"gateway","drone":"{}","from":"{}","to":"{}","cause":"{}"}})",
                session.identifier,
                to_string(phase_change->previous_phase),
                to_string(phase_change->new_phase),
                to_string(cause)
            );
            broadcast_hub_.publish(session.identifier, phase_change.value());
        }
    }

    DroneOfflineEvent offline_event{};
    offline_event.drone_id = session.identifier;
    offline_event.cause = cause;
    broadcast_hub_.publish(session.identifier, offline_event);
}

void GatewayRuntime::teardown_operator(OperatorSession& session, StateChangeCause, TimePoint) {
    broadcast_hub_.detach_subscriber(session.identifier);
}

}  // namespace drone_gateway
