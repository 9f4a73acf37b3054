#include <vector>

#include <catch2/catch.hpp>

#include "drone_gateway/errors.hpp"
#include "drone_gateway/session_registry.hpp"
#include "fake_connections.hpp"

using namespace drone_gateway;
using namespace drone_gateway::test;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    drone_gateway::test::ensure_logger_initialized();
    return true;
}();
}  // namespace

TEST_CASE("SessionRegistry refuses a second session for the same identifier") {
    SessionRegistry registry{Duration{5.0}, 0.3};
    const TimePoint now = SteadyClock::now();
    auto first_recorder = std::make_shared<DroneLinkRecorder>();
    auto second_recorder = std::make_shared<DroneLinkRecorder>();

    registry.register_drone("d1", make_drone_connection(first_recorder), now);
    try {
        registry.register_drone("d1", make_drone_connection(second_recorder), now);
        FAIL("duplicate registration was accepted");
    } catch (const GatewayError& error) {
        CHECK(error.code() == ErrorCode::DuplicateSession);
    }

    CHECK(registry.drone_count() == 1);
    CHECK_FALSE(first_recorder->closed);
}

TEST_CASE("SessionRegistry validates registration arguments") {
    SessionRegistry registry{Duration{5.0}, 0.3};
    const TimePoint now = SteadyClock::now();
    CHECK_THROWS_AS(registry.register_drone("", make_drone_connection(std::make_shared<DroneLinkRecorder>()), now),
                    std::invalid_argument);
    CHECK_THROWS_AS(registry.register_operator("o1", nullptr, now), std::invalid_argument);
    CHECK_THROWS_AS(SessionRegistry(Duration{0.0}, 0.3), std::invalid_argument);
}

TEST_CASE("SessionRegistry unregister is idempotent and closes the connection") {
    SessionRegistry registry{Duration{5.0}, 0.3};
    const TimePoint now = SteadyClock::now();
    auto recorder = std::make_shared<DroneLinkRecorder>();
    std::vector<StateChangeCause> list_causes;
    registry.set_teardown_handlers(
        [&list_causes](DroneSession&, StateChangeCause cause, TimePoint) { list_causes.push_back(cause); },
        [](OperatorSession&, StateChangeCause, TimePoint) {}
    );

    registry.register_drone("d1", make_drone_connection(recorder), now);
    CHECK(registry.unregister("d1", now));
    CHECK_FALSE(registry.unregister("d1", now));
    CHECK_FALSE(registry.unregister("never-seen", now));

    CHECK(recorder->closed);
    CHECK(registry.drone_count() == 0);
    CHECK(registry.find_drone("d1") == nullptr);
    REQUIRE(list_causes.size() == 1);
    CHECK(list_causes.front() == StateChangeCause::Disconnect);
}

TEST_CASE("SessionRegistry lookups report missing sessions") {
    SessionRegistry registry{Duration{5.0}, 0.3};
    CHECK(registry.find_operator("o1") == nullptr);
    try {
        (void)registry.lookup_drone("d1");
        FAIL("lookup of a missing drone succeeded");
    } catch (const GatewayError& error) {
        CHECK(error.code() == ErrorCode::NotFound);
    }
}

TEST_CASE("Heartbeat refreshes liveness and rejects unknown sessions") {
    SessionRegistry registry{Duration{5.0}, 0.3};
    const TimePoint start = SteadyClock::now();
    registry.register_operator("o1", make_operator_connection(std::make_shared<OperatorLinkRecorder>()), start);

    registry.heartbeat("o1", seconds_after(start, 4.0));
    CHECK(registry.sweep(seconds_after(start, 8.0)) == 0);
    CHECK(registry.operator_count() == 1);

    try {
        registry.heartbeat("ghost", start);
        FAIL("heartbeat for an unknown session succeeded");
    } catch (const GatewayError& error) {
        CHECK(error.code() == ErrorCode::NotFound);
    }
}

TEST_CASE("Sweep evicts only sessions silent for longer than the timeout") {
    SessionRegistry registry{Duration{5.0}, 0.3};
    REQUIRE(registry.liveness_timeout().count() == Approx(5.0));
    const TimePoint start = SteadyClock::now();
    auto quiet_recorder = std::make_shared<DroneLinkRecorder>();
    auto chatty_recorder = std::make_shared<DroneLinkRecorder>();
    std::vector<StateChangeCause> list_causes;
    registry.set_teardown_handlers(
        [&list_causes](DroneSession&, StateChangeCause cause, TimePoint) { list_causes.push_back(cause); },
        [](OperatorSession&, StateChangeCause, TimePoint) {}
    );

    registry.register_drone("quiet", make_drone_connection(quiet_recorder), start);
    registry.register_drone("chatty", make_drone_connection(chatty_recorder), start);
    registry.heartbeat("chatty", seconds_after(start, 3.0));

    CHECK(registry.sweep(seconds_after(start, 5.0)) == 0);
    CHECK(registry.sweep(seconds_after(start, 6.0)) == 1);

    CHECK(registry.find_drone("quiet") == nullptr);
    CHECK(registry.find_drone("chatty") != nullptr);
    CHECK(quiet_recorder->closed);
    REQUIRE(list_causes.size() == 1);
    CHECK(list_causes.front() == StateChangeCause::Timeout);
}

TEST_CASE("A drone and an operator may share an identifier") {
    SessionRegistry registry{Duration{5.0}, 0.3};
    const TimePoint now = SteadyClock::now();
    registry.register_drone("shared", make_drone_connection(std::make_shared<DroneLinkRecorder>()), now);
    registry.register_operator("shared", make_operator_connection(std::make_shared<OperatorLinkRecorder>()), now);

    CHECK(registry.unregister("shared", now));
    CHECK(registry.drone_count() == 0);
    CHECK(registry.operator_count() == 0);
}
