#include "drone_gateway/telemetry_router.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

#include "drone_gateway/sensor_report.hpp"

namespace drone_gateway {

TelemetryRouter::TelemetryRouter(SessionRegistry& registry, BroadcastHub& broadcast_hub)
    : registry_(registry),
      broadcast_hub_(broadcast_hub),
      logger_(get_logger()) {}

IngestOutcome TelemetryRouter::ingest(const TelemetryFrame& frame) {
    const DroneContextPtr context = registry_.find_drone(frame.drone_id);
    if (context == nullptr) {
        unknown_drone_count_.fetch_add(1);
        logger_->debug("Dropping telemetry seq {} from unknown drone {}", frame.sequence, frame.drone_id);
        return IngestOutcome::UnknownDrone;
    }

    std::scoped_lock lock(context->mutex);
    if (!context->active) {
        unknown_drone_count_.fetch_add(1);
        return IngestOutcome::UnknownDrone;
    }

    DroneSession& session = context->session;
    session.last_seen = std::max(session.last_seen, frame.received_at);

    if (session.last_applied_sequence.has_value() && frame.sequence <= session.last_applied_sequence.value()) {
        discarded_count_.fetch_add(1);
        logger_->trace("Discarding telemetry seq {} for {} (last applied {})",
                       frame.sequence,
                       frame.drone_id,
                       session.last_applied_sequence.value());
        return IngestOutcome::Discarded;
    }
    session.last_applied_sequence = frame.sequence;

    const std::optional<StateChangeEvent> phase_change = session.state_machine.apply_telemetry(frame.payload, frame.received_at);

    TelemetryEvent telemetry_event{};
    telemetry_event.drone_id = frame.drone_id;
    telemetry_event.sequence = frame.sequence;
    telemetry_event.snapshot = frame.payload;
    telemetry_event.received_at = frame.received_at;
    broadcast_hub_.publish(frame.drone_id, telemetry_event);

    if (phase_change.has_value()) {
        logger_->info(
            R"({{"component":"telemetry_router","drone":"{}","from":"{}","to":"{}","cause":"{}"}})",
            frame.drone_id,
            to_string(phase_change->previous_phase),
            to_string(phase_change->new_phase),
            to_string(phase_change->cause)
        );
        broadcast_hub_.publish(frame.drone_id, phase_change.value());
    }

    applied_count_.fetch_add(1);
    return IngestOutcome::Applied;
}

IngestOutcome TelemetryRouter::ingest_sensor_report(const DroneId& drone_id,
                                                    SequenceNumber sequence,
                                                    std::string_view line,
                                                    TimePoint received_at) {
    std::optional<TelemetrySnapshot> optional_snapshot = decode_sensor_report(line);
    if (!optional_snapshot.has_value()) {
        logger_->debug("Ignoring unrecognized report from {}", drone_id);
        return IngestOutcome::Unrecognized;
    }

    TelemetryFrame frame{};
    frame.drone_id = drone_id;
    frame.sequence = sequence;
    frame.payload = std::move(optional_snapshot.value());
    frame.received_at = received_at;
    return ingest(frame);
}

TelemetryCounters TelemetryRouter::counters() const noexcept {
    TelemetryCounters counters{};
    counters.applied = applied_count_.load();
    counters.discarded = discarded_count_.load();
    counters.unknown_drone = unknown_drone_count_.load();
    return counters;
}

}  // namespace drone_gateway
