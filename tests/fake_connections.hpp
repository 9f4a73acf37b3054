#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "drone_gateway/connection.hpp"
#include "logging_test_fixture.hpp"

namespace drone_gateway::test {

/** @brief Observable side of a FakeDroneConnection, kept by the test. */
struct DroneLinkRecorder final {
    std::mutex mutex;
    std::vector<CommandDelivery> list_deliveries;
    bool open{true};
    bool reject_deliveries{false};
    bool closed{false};

    std::vector<CommandDelivery> deliveries() {
        std::scoped_lock lock(mutex);
        return list_deliveries;
    }
};

class FakeDroneConnection final : public DroneConnection {
  public:
    explicit FakeDroneConnection(std::shared_ptr<DroneLinkRecorder> recorder) : recorder_(std::move(recorder)) {}

    bool is_open() const override {
        std::scoped_lock lock(recorder_->mutex);
        return recorder_->open;
    }

    bool deliver(const CommandDelivery& delivery) override {
        std::scoped_lock lock(recorder_->mutex);
        if (!recorder_->open || recorder_->reject_deliveries) {
            return false;
        }
        recorder_->list_deliveries.push_back(delivery);
        return true;
    }

    void close() override {
        std::scoped_lock lock(recorder_->mutex);
        recorder_->open = false;
        recorder_->closed = true;
    }

  private:
    std::shared_ptr<DroneLinkRecorder> recorder_;
};

/** @brief Observable side of a FakeOperatorConnection, kept by the test. */
struct OperatorLinkRecorder final {
    std::mutex mutex;
    std::vector<GatewayEvent> list_events;
    bool open{true};
    bool closed{false};

    std::vector<GatewayEvent> events() {
        std::scoped_lock lock(mutex);
        return list_events;
    }
};

class FakeOperatorConnection final : public OperatorConnection {
  public:
    explicit FakeOperatorConnection(std::shared_ptr<OperatorLinkRecorder> recorder) : recorder_(std::move(recorder)) {}

    bool is_open() const override {
        std::scoped_lock lock(recorder_->mutex);
        return recorder_->open;
    }

    bool send(const GatewayEvent& event) override {
        std::scoped_lock lock(recorder_->mutex);
        if (!recorder_->open) {
            return false;
        }
        recorder_->list_events.push_back(event);
        return true;
    }

    void close() override {
        std::scoped_lock lock(recorder_->mutex);
        recorder_->open = false;
        recorder_->closed = true;
    }

  private:
    std::shared_ptr<OperatorLinkRecorder> recorder_;
};

inline DroneConnectionPtr make_drone_connection(const std::shared_ptr<DroneLinkRecorder>& recorder) {
    return std::make_unique<FakeDroneConnection>(recorder);
}

inline OperatorConnectionPtr make_operator_connection(const std::shared_ptr<OperatorLinkRecorder>& recorder) {
    return std::make_unique<FakeOperatorConnection>(recorder);
}

/** @brief Events of one alternative, in the order they were buffered. */
template <typename EventType>
std::vector<EventType> events_of(const std::vector<GatewayEvent>& list_events) {
    std::vector<EventType> list_typed;
    for (const GatewayEvent& event : list_events) {
        if (const auto* typed_event = std::get_if<EventType>(&event); typed_event != nullptr) {
            list_typed.push_back(*typed_event);
        }
    }
    return list_typed;
}

inline TimePoint seconds_after(TimePoint origin, double seconds) {
    return origin + std::chrono::duration_cast<SteadyClock::duration>(Duration{seconds});
}

}  // namespace drone_gateway::test
