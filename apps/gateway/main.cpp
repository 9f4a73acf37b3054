#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <deque>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <spdlog/spdlog.h>

#include "drone_gateway/configuration.hpp"
#include "drone_gateway/connection.hpp"
#include "drone_gateway/gateway_runtime.hpp"
#include "drone_gateway/logging.hpp"

namespace {
std::atomic<bool> should_terminate{false};

void handle_signal(int) {
    should_terminate.store(true);
}

constexpr char k_demo_drone_id[] = "demo-drone";
constexpr char k_demo_operator_id[] = "console";
constexpr std::chrono::milliseconds k_demo_step{250};
constexpr double k_cruise_altitude_m{20.0};
constexpr double k_vertical_step_m{2.5};

/** @brief Commands written to the simulated drone, shared with the demo loop. */
struct DeliveryInbox final {
    std::mutex mutex;
    std::deque<drone_gateway::CommandDelivery> queue_deliveries;
};

/** @brief In-process drone link that parks deliveries for the demo loop to ack. */
class LoopbackDroneConnection final : public drone_gateway::DroneConnection {
  public:
    explicit LoopbackDroneConnection(std::shared_ptr<DeliveryInbox> inbox) : inbox_(std::move(inbox)) {}

    bool is_open() const override {
        return open_.load();
    }

    bool deliver(const drone_gateway::CommandDelivery& delivery) override {
        std::scoped_lock lock(inbox_->mutex);
        inbox_->queue_deliveries.push_back(delivery);
        return true;
    }

    void close() override {
        open_.store(false);
    }

  private:
    std::shared_ptr<DeliveryInbox> inbox_;
    std::atomic<bool> open_{true};
};

/** @brief Operator link that writes every event to the shared logger. */
class LoggingOperatorConnection final : public drone_gateway::OperatorConnection {
  public:
    bool is_open() const override {
        return open_.load();
    }

    bool send(const drone_gateway::GatewayEvent& event) override {
        using namespace drone_gateway;
        auto logger = get_logger();
        std::visit(
            [&logger](const auto& typed_event) {
                using EventType = std::decay_t<decltype(typed_event)>;
                if constexpr (std::is_same_v<EventType, TelemetryEvent>) {
                    logger->debug("[console] telemetry {} seq={} alt={:.1f}m",
                                  typed_event.drone_id,
                                  typed_event.sequence,
                                  typed_event.snapshot.relative_altitude_m);
                } else if constexpr (std::is_same_v<EventType, StateChangeEvent>) {
                    logger->info("[console] {} {} -> {} ({})",
                                 typed_event.drone_id,
                                 to_string(typed_event.previous_phase),
                                 to_string(typed_event.new_phase),
                                 to_string(typed_event.cause));
                } else if constexpr (std::is_same_v<EventType, DroneOfflineEvent>) {
                    logger->info("[console] {} offline ({})", typed_event.drone_id, to_string(typed_event.cause));
                } else {
                    logger->info("[console] {} #{} {}: {}",
                                 to_string(typed_event.kind),
                                 typed_event.command_id,
                                 to_string(typed_event.status),
                                 typed_event.reason);
                }
            },
            event
        );
        return true;
    }

    void close() override {
        open_.store(false);
    }

  private:
    std::atomic<bool> open_{true};
};

/** @brief Next scripted command for the demo drone's current phase. */
std::optional<drone_gateway::CommandRequest> next_demo_command(drone_gateway::FlightPhase phase, double altitude_m) {
    using namespace drone_gateway;
    CommandRequest request{};
    request.drone_id = k_demo_drone_id;
    request.operator_id = k_demo_operator_id;
    switch (phase) {
        case FlightPhase::Idle:
            request.kind = CommandKind::Arm;
            return request;
        case FlightPhase::Armed:
            request.kind = CommandKind::Takeoff;
            request.payload["altitude_m"] = k_cruise_altitude_m;
            return request;
        case FlightPhase::Flying:
            if (altitude_m < k_cruise_altitude_m) {
                return std::nullopt;
            }
            request.kind = CommandKind::Land;
            return request;
        case FlightPhase::Landing:
        case FlightPhase::Fault:
            return std::nullopt;
    }
    return std::nullopt;
}

}  // namespace

int main() {
    using namespace drone_gateway;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        GatewayRuntime runtime{ConfigurationLoader::load()};
        runtime.run();

        auto inbox = std::make_shared<DeliveryInbox>();
        runtime.register_operator(k_demo_operator_id, std::make_unique<LoggingOperatorConnection>(), SteadyClock::now());
        runtime.register_drone(k_demo_drone_id, std::make_unique<LoopbackDroneConnection>(inbox), SteadyClock::now());
        runtime.subscribe(k_demo_operator_id, k_demo_drone_id);

        SequenceNumber sequence = 0;
        double altitude_m = 0.0;
        while (!should_terminate.load()) {
            const TimePoint now = SteadyClock::now();
            runtime.heartbeat(k_demo_operator_id, now);

            std::vector<CommandDelivery> list_deliveries;
            {
                std::scoped_lock lock(inbox->mutex);
                list_deliveries.assign(inbox->queue_deliveries.begin(), inbox->queue_deliveries.end());
                inbox->queue_deliveries.clear();
            }
            for (const CommandDelivery& delivery : list_deliveries) {
                runtime.acknowledge(k_demo_drone_id, CommandAck{delivery.command_id, AckOutcome::Ack, {}}, now);
            }

            const std::optional<DroneStatus> status = runtime.drone_status(k_demo_drone_id);
            if (!status.has_value()) {
                break;
            }
            const FlightPhase phase = status->state.phase;
            if (phase == FlightPhase::Flying && altitude_m < k_cruise_altitude_m) {
                altitude_m += k_vertical_step_m;
            } else if (phase == FlightPhase::Landing) {
                altitude_m = std::max(0.0, altitude_m - k_vertical_step_m);
            }

            TelemetryFrame frame{};
            frame.drone_id = k_demo_drone_id;
            frame.sequence = ++sequence;
            frame.payload.relative_altitude_m = altitude_m;
            frame.payload.battery_percent = 100.0 - static_cast<double>(sequence % 100);
            frame.received_at = now;
            runtime.ingest_telemetry(frame);

            if (status->pending_commands == 0) {
                if (std::optional<CommandRequest> request = next_demo_command(phase, altitude_m); request.has_value()) {
                    const SubmitResult result = runtime.submit_command(request.value(), now);
                    if (!result.accepted()) {
                        get_logger()->warn("Demo command rejected: {}", result.detail);
                    }
                }
            }

            std::this_thread::sleep_for(k_demo_step);
        }

        runtime.shutdown();
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
