#include <vector>

#include <catch2/catch.hpp>

#include "drone_gateway/broadcast_hub.hpp"
#include "drone_gateway/errors.hpp"
#include "drone_gateway/session_registry.hpp"
#include "drone_gateway/telemetry_router.hpp"
#include "fake_connections.hpp"

using namespace drone_gateway;
using namespace drone_gateway::test;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    drone_gateway::test::ensure_logger_initialized();
    return true;
}();

/** @brief Registry, hub and router wired together with one drone and one watcher. */
struct RouterHarness final {
    SessionRegistry registry{Duration{5.0}, 0.3};
    BroadcastHub hub{64};
    TelemetryRouter router{registry, hub};
    TimePoint start{SteadyClock::now()};

    RouterHarness() {
        registry.register_drone("d1", make_drone_connection(std::make_shared<DroneLinkRecorder>()), start);
        hub.attach_subscriber("o1");
        hub.subscribe("o1", "d1");
    }

    TelemetryFrame frame(SequenceNumber sequence, double relative_altitude_m, double at_seconds) const {
        TelemetryFrame telemetry_frame{};
        telemetry_frame.drone_id = "d1";
        telemetry_frame.sequence = sequence;
        telemetry_frame.payload.relative_altitude_m = relative_altitude_m;
        telemetry_frame.received_at = seconds_after(start, at_seconds);
        return telemetry_frame;
    }

    void force_phase(FlightPhase target) {
        const DroneContextPtr context = registry.lookup_drone("d1");
        std::scoped_lock lock(context->mutex);
        Command command{};
        command.drone_id = "d1";
        command.operator_id = "o1";
        const std::vector<CommandKind> list_path = target == FlightPhase::Landing
            ? std::vector<CommandKind>{CommandKind::Arm, CommandKind::Takeoff, CommandKind::Land}
            : std::vector<CommandKind>{CommandKind::Arm, CommandKind::Takeoff};
        for (CommandKind kind : list_path) {
            command.kind = kind;
            (void)context->session.state_machine.apply_acknowledged(command, start);
        }
    }
};

}  // namespace

TEST_CASE("TelemetryRouter applies and republishes in-order frames") {
    RouterHarness harness;

    CHECK(harness.router.ingest(harness.frame(1, 0.0, 0.1)) == IngestOutcome::Applied);
    CHECK(harness.router.ingest(harness.frame(2, 0.0, 0.2)) == IngestOutcome::Applied);

    const std::vector<TelemetryEvent> list_events = events_of<TelemetryEvent>(harness.hub.drain("o1", 10));
    REQUIRE(list_events.size() == 2);
    CHECK(list_events[0].sequence == 1);
    CHECK(list_events[1].sequence == 2);
    CHECK(harness.router.counters().applied == 2);
}

TEST_CASE("TelemetryRouter treats stale and duplicate frames as no-ops") {
    RouterHarness harness;
    TelemetryFrame newest = harness.frame(7, 0.0, 0.1);
    newest.payload.battery_percent = 80.0;
    REQUIRE(harness.router.ingest(newest) == IngestOutcome::Applied);
    (void)harness.hub.drain("o1", 10);

    TelemetryFrame duplicate = harness.frame(7, 0.0, 0.2);
    duplicate.payload.battery_percent = 10.0;
    CHECK(harness.router.ingest(duplicate) == IngestOutcome::Discarded);
    CHECK(harness.router.ingest(harness.frame(3, 0.0, 0.3)) == IngestOutcome::Discarded);

    CHECK(harness.hub.pending_events("o1") == 0);
    CHECK(harness.router.counters().discarded == 2);

    const DroneContextPtr context = harness.registry.lookup_drone("d1");
    std::scoped_lock lock(context->mutex);
    CHECK(context->session.state_machine.state().telemetry.battery_percent == Approx(80.0));
    CHECK(context->session.last_applied_sequence == SequenceNumber{7});
}

TEST_CASE("Discarded frames still count as liveness") {
    RouterHarness harness;
    REQUIRE(harness.router.ingest(harness.frame(5, 0.0, 0.0)) == IngestOutcome::Applied);
    REQUIRE(harness.router.ingest(harness.frame(5, 0.0, 4.0)) == IngestOutcome::Discarded);

    CHECK(harness.registry.sweep(seconds_after(harness.start, 8.0)) == 0);
    CHECK(harness.registry.find_drone("d1") != nullptr);
}

TEST_CASE("Touchdown telemetry completes a landing") {
    RouterHarness harness;
    harness.force_phase(FlightPhase::Landing);

    REQUIRE(harness.router.ingest(harness.frame(1, 3.0, 0.1)) == IngestOutcome::Applied);
    REQUIRE(harness.router.ingest(harness.frame(2, 0.1, 0.2)) == IngestOutcome::Applied);

    const std::vector<GatewayEvent> list_events = harness.hub.drain("o1", 10);
    const std::vector<StateChangeEvent> list_changes = events_of<StateChangeEvent>(list_events);
    REQUIRE(list_changes.size() == 1);
    CHECK(list_changes[0].previous_phase == FlightPhase::Landing);
    CHECK(list_changes[0].new_phase == FlightPhase::Idle);
    CHECK(list_changes[0].cause == StateChangeCause::Telemetry);

    REQUIRE(list_events.size() == 3);
    CHECK(std::holds_alternative<TelemetryEvent>(list_events[1]));
    CHECK(std::holds_alternative<StateChangeEvent>(list_events[2]));
}

TEST_CASE("TelemetryRouter ignores frames from unknown drones") {
    RouterHarness harness;
    TelemetryFrame stray = harness.frame(1, 0.0, 0.1);
    stray.drone_id = "ghost";
    CHECK(harness.router.ingest(stray) == IngestOutcome::UnknownDrone);
    CHECK(harness.router.counters().unknown_drone == 1);
}

TEST_CASE("TelemetryRouter decodes sensor report lines") {
    RouterHarness harness;
    const TimePoint received_at = seconds_after(harness.start, 0.5);

    CHECK(harness.router.ingest_sensor_report("d1", 1, "<SENSOR_DATA|MPU|0.1|0.2|9.8|0|0|0|BMP|1013.2|21.5|12.0>", received_at)
          == IngestOutcome::Applied);
    CHECK(harness.router.ingest_sensor_report("d1", 2, "hello from the flight controller", received_at)
          == IngestOutcome::Unrecognized);
    CHECK_THROWS_AS(harness.router.ingest_sensor_report("d1", 3, "<SENSOR_DATA|MPU|x|0|0|0|0|0|BMP|1|2>", received_at),
                    GatewayError);

    const std::vector<TelemetryEvent> list_events = events_of<TelemetryEvent>(harness.hub.drain("o1", 10));
    REQUIRE(list_events.size() == 1);
    CHECK(list_events[0].snapshot.relative_altitude_m == Approx(12.0));
}
