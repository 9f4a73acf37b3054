// === Gateway Runtime =========================================================
//
// Wires the session registry, validator, dispatcher, telemetry router and
// broadcast hub together and exposes the plain function calls the transport
// layer invokes on connect, disconnect, inbound messages and status queries.
// A background maintenance thread runs the liveness sweep, command ack
// expiry and outbound flush at a fixed cadence.

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include "drone_gateway/broadcast_hub.hpp"
#include "drone_gateway/command_dispatcher.hpp"
#include "drone_gateway/command_validator.hpp"
#include "drone_gateway/configuration.hpp"
#include "drone_gateway/session_registry.hpp"
#include "drone_gateway/telemetry_router.hpp"

namespace drone_gateway {

/** @brief Point-in-time view of one drone for status queries. */
struct DroneStatus final {
    DroneState state{};
    std::size_t pending_commands{};
    std::optional<CommandId> in_flight_command{};
    CommandId last_issued_command_id{};
    std::optional<SequenceNumber> last_applied_sequence{};
    TimePoint last_seen{};
};

/** @brief Gateway-wide health summary. */
struct GatewayStatus final {
    std::string version{};
    Duration uptime{};
    std::size_t connected_drones{};
    std::size_t connected_operators{};
    std::uint64_t dropped_events{};
    TelemetryCounters telemetry{};
};

class GatewayRuntime final {
  public:
    explicit GatewayRuntime(Configuration configuration);
    ~GatewayRuntime();

    GatewayRuntime(const GatewayRuntime&) = delete;
    GatewayRuntime& operator=(const GatewayRuntime&) = delete;

    /** @throws GatewayError DuplicateSession */
    void register_drone(const DroneId& drone_id, DroneConnectionPtr connection, TimePoint now);
    /** @throws GatewayError DuplicateSession */
    void register_operator(const OperatorId& operator_id, OperatorConnectionPtr connection, TimePoint now);
    /** @brief Transport-reported disconnect. Idempotent. */
    bool disconnect(const std::string& identifier, TimePoint now);
    /** @throws GatewayError NotFound */
    void heartbeat(const std::string& identifier, TimePoint now);

    SubmitResult submit_command(const CommandRequest& request, TimePoint now);
    AckDisposition acknowledge(const DroneId& drone_id, const CommandAck& ack, TimePoint now);
    IngestOutcome ingest_telemetry(const TelemetryFrame& frame);
    IngestOutcome ingest_sensor_report(const DroneId& drone_id,
                                       SequenceNumber sequence,
                                       std::string_view line,
                                       TimePoint received_at);

    /** @throws GatewayError NotFound when the operator is not connected. */
    void subscribe(const OperatorId& operator_id, const DroneId& drone_id);
    /** @throws GatewayError NotFound when the operator is not connected. */
    void unsubscribe(const OperatorId& operator_id, const DroneId& drone_id);

    [[nodiscard]] std::optional<DroneStatus> drone_status(const DroneId& drone_id) const;
    [[nodiscard]] GatewayStatus gateway_status(TimePoint now) const;

    /** @brief Write buffered events to one operator connection. */
    std::size_t flush_operator(const OperatorId& operator_id);
    std::size_t flush_all();

    /** @brief One maintenance pass: liveness sweep, ack expiry, flush. */
    void tick(TimePoint now);

    /** @brief Start the background maintenance thread. */
    void run();
    /** @brief Stop the maintenance thread, if running, and close every session. Runs once. */
    void shutdown();

    [[nodiscard]] const Configuration& configuration() const noexcept;
    [[nodiscard]] const BroadcastHub& broadcast_hub() const noexcept;

  private:
    void maintenance_loop();
    void teardown_drone(DroneSession& session, StateChangeCause cause, TimePoint now);
    void teardown_operator(OperatorSession& session, StateChangeCause cause, TimePoint now);

    Configuration configuration_;
    std::shared_ptr<spdlog::logger> logger_;
    TimePoint started_at_;
    SessionRegistry registry_;
    BroadcastHub broadcast_hub_;
    CommandValidator validator_;
    TelemetryRouter telemetry_router_;
    CommandDispatcher command_dispatcher_;
    std::atomic<bool> flag_running_{false};
    std::atomic<bool> flag_shut_down_{false};
    std::thread maintenance_thread_;
};

}  // namespace drone_gateway
