#include <cstdint>
#include <string>
#include <thread>
#include <vector>

#include <catch2/catch.hpp>

#include "drone_gateway/broadcast_hub.hpp"
#include "drone_gateway/errors.hpp"
#include "drone_gateway/subscriber_channel.hpp"
#include "fake_connections.hpp"

using namespace drone_gateway;
using namespace drone_gateway::test;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    drone_gateway::test::ensure_logger_initialized();
    return true;
}();

TelemetryEvent make_telemetry(const DroneId& drone_id, SequenceNumber sequence) {
    TelemetryEvent event{};
    event.drone_id = drone_id;
    event.sequence = sequence;
    return event;
}

}  // namespace

TEST_CASE("SubscriberChannel keeps the most recent events when full") {
    SubscriberChannel channel{"o1", 3};
    for (SequenceNumber sequence = 1; sequence <= 5; ++sequence) {
        channel.publish(make_telemetry("d1", sequence));
    }

    CHECK(channel.size() == 3);
    CHECK(channel.dropped_count() == 2);

    const std::vector<TelemetryEvent> list_events = events_of<TelemetryEvent>(channel.drain(10));
    REQUIRE(list_events.size() == 3);
    CHECK(list_events[0].sequence == 3);
    CHECK(list_events[1].sequence == 4);
    CHECK(list_events[2].sequence == 5);
    CHECK_FALSE(channel.try_consume().has_value());
    CHECK(channel.dropped_count() == 2);
}

TEST_CASE("SubscriberChannel numbers each drop as it happens") {
    SubscriberChannel channel{"o1", 2};
    CHECK(channel.publish(make_telemetry("d1", 1)) == 0);
    CHECK(channel.publish(make_telemetry("d1", 2)) == 0);
    CHECK(channel.publish(make_telemetry("d1", 3)) == 1);
    CHECK(channel.publish(make_telemetry("d1", 4)) == 2);
    (void)channel.drain(10);
    CHECK(channel.publish(make_telemetry("d1", 5)) == 0);
}

TEST_CASE("Concurrent overflow counts every drop exactly once") {
    constexpr std::uint64_t k_publishes_per_thread = 1000;
    BroadcastHub hub{1};
    hub.attach_subscriber("slow");
    hub.subscribe("slow", "d1");
    hub.subscribe("slow", "d2");

    auto publish_all = [&hub](const DroneId& drone_id) {
        for (SequenceNumber sequence = 1; sequence <= k_publishes_per_thread; ++sequence) {
            hub.publish(drone_id, make_telemetry(drone_id, sequence));
        }
    };
    std::thread first_publisher(publish_all, "d1");
    std::thread second_publisher(publish_all, "d2");
    first_publisher.join();
    second_publisher.join();

    CHECK(hub.dropped_events("slow") == 2 * k_publishes_per_thread - 1);
    CHECK(hub.total_dropped_events() == 2 * k_publishes_per_thread - 1);
}

TEST_CASE("SubscriberChannel refuses zero capacity") {
    CHECK_THROWS_AS(SubscriberChannel("o1", 0), std::invalid_argument);
}

TEST_CASE("BroadcastHub fans out only to subscribers of the drone") {
    BroadcastHub hub{16};
    hub.attach_subscriber("o1");
    hub.attach_subscriber("o2");
    hub.attach_subscriber("o3");
    CHECK(hub.subscribe("o1", "d1"));
    CHECK(hub.subscribe("o2", "d1"));
    CHECK(hub.subscribe("o3", "d2"));
    CHECK_FALSE(hub.subscribe("o1", "d1"));

    CHECK(hub.publish("d1", make_telemetry("d1", 1)) == 2);
    CHECK(hub.publish("d-unwatched", make_telemetry("d-unwatched", 1)) == 0);

    CHECK(hub.pending_events("o1") == 1);
    CHECK(hub.pending_events("o2") == 1);
    CHECK(hub.pending_events("o3") == 0);

    CHECK(hub.unsubscribe("o2", "d1"));
    CHECK(hub.publish("d1", make_telemetry("d1", 2)) == 1);
    CHECK(hub.pending_events("o2") == 1);
}

TEST_CASE("BroadcastHub subscription requires an attached subscriber") {
    BroadcastHub hub{4};
    try {
        hub.subscribe("o1", "d1");
        FAIL("subscribe without attach succeeded");
    } catch (const GatewayError& error) {
        CHECK(error.code() == ErrorCode::NotFound);
    }

    hub.attach_subscriber("o1");
    CHECK_THROWS_AS(hub.attach_subscriber("o1"), GatewayError);
}

TEST_CASE("BroadcastHub detach removes the subscriber from every topic") {
    BroadcastHub hub{4};
    hub.attach_subscriber("o1");
    hub.subscribe("o1", "d1");
    hub.subscribe("o1", "d2");

    hub.detach_subscriber("o1");
    hub.detach_subscriber("o1");

    CHECK(hub.subscribers_of("d1").empty());
    CHECK(hub.subscribers_of("d2").empty());
    CHECK(hub.publish("d1", make_telemetry("d1", 1)) == 0);
    CHECK_FALSE(hub.deliver_to("o1", make_telemetry("d1", 1)));
}

TEST_CASE("BroadcastHub overflow drops oldest and counts monotonically") {
    BroadcastHub hub{2};
    hub.attach_subscriber("slow");
    hub.attach_subscriber("fast");
    hub.subscribe("slow", "d1");
    hub.subscribe("fast", "d1");

    std::uint64_t previous_dropped = 0;
    for (SequenceNumber sequence = 1; sequence <= 6; ++sequence) {
        hub.publish("d1", make_telemetry("d1", sequence));
        (void)hub.drain("fast", 10);
        const std::uint64_t dropped = hub.dropped_events("slow");
        CHECK(dropped >= previous_dropped);
        previous_dropped = dropped;
    }

    CHECK(hub.dropped_events("slow") == 4);
    CHECK(hub.dropped_events("fast") == 0);
    CHECK(hub.total_dropped_events() == 4);

    const std::vector<TelemetryEvent> list_events = events_of<TelemetryEvent>(hub.drain("slow", 10));
    REQUIRE(list_events.size() == 2);
    CHECK(list_events[0].sequence == 5);
    CHECK(list_events[1].sequence == 6);
}

TEST_CASE("Per-drone order is preserved under concurrent publishers") {
    constexpr SequenceNumber k_events_per_drone = 500;
    BroadcastHub hub{4 * k_events_per_drone};
    hub.attach_subscriber("o1");
    hub.subscribe("o1", "d1");
    hub.subscribe("o1", "d2");

    auto publish_all = [&hub](const DroneId& drone_id) {
        for (SequenceNumber sequence = 1; sequence <= k_events_per_drone; ++sequence) {
            hub.publish(drone_id, make_telemetry(drone_id, sequence));
        }
    };
    std::thread first_publisher(publish_all, "d1");
    std::thread second_publisher(publish_all, "d2");
    first_publisher.join();
    second_publisher.join();

    const std::vector<TelemetryEvent> list_events = events_of<TelemetryEvent>(hub.drain("o1", 4 * k_events_per_drone));
    REQUIRE(list_events.size() == 2 * k_events_per_drone);

    SequenceNumber last_d1 = 0;
    SequenceNumber last_d2 = 0;
    for (const TelemetryEvent& event : list_events) {
        SequenceNumber& last = event.drone_id == "d1" ? last_d1 : last_d2;
        CHECK(event.sequence == last + 1);
        last = event.sequence;
    }
    CHECK(last_d1 == k_events_per_drone);
    CHECK(last_d2 == k_events_per_drone);
}

TEST_CASE("BroadcastHub reclaims topics that lose their last subscriber") {
    BroadcastHub hub{4};
    hub.attach_subscriber("o1");
    hub.attach_subscriber("o2");

    for (int index = 0; index < 1000; ++index) {
        const DroneId drone_id = "ghost-" + std::to_string(index);
        hub.subscribe("o1", drone_id);
        hub.unsubscribe("o1", drone_id);
    }
    CHECK(hub.topic_count() == 0);

    hub.subscribe("o1", "d1");
    hub.subscribe("o2", "d1");
    hub.subscribe("o1", "d2");
    CHECK(hub.topic_count() == 2);

    hub.unsubscribe("o1", "d1");
    CHECK(hub.topic_count() == 2);

    hub.detach_subscriber("o1");
    CHECK(hub.topic_count() == 1);
    CHECK(hub.subscribers_of("d1") == std::vector<OperatorId>{"o2"});

    hub.unsubscribe("o2", "d1");
    CHECK(hub.topic_count() == 0);

    hub.subscribe("o2", "d1");
    CHECK(hub.publish("d1", make_telemetry("d1", 1)) == 1);
    CHECK(hub.pending_events("o2") == 1);
}

TEST_CASE("Subscriptions survive concurrent topic reclamation") {
    BroadcastHub hub{4};
    hub.attach_subscriber("churn");
    hub.attach_subscriber("steady");

    std::thread churner([&hub]() {
        for (int round = 0; round < 2000; ++round) {
            hub.subscribe("churn", "d1");
            hub.unsubscribe("churn", "d1");
        }
    });
    for (int round = 0; round < 2000; ++round) {
        hub.subscribe("steady", "d1");
        hub.unsubscribe("steady", "d1");
    }
    hub.subscribe("steady", "d1");
    churner.join();

    CHECK(hub.subscribers_of("d1") == std::vector<OperatorId>{"steady"});
    CHECK(hub.publish("d1", make_telemetry("d1", 1)) == 1);
}
