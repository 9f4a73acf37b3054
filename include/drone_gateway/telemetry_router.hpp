// === Telemetry Router ========================================================
//
// Applies drone telemetry in drone-assigned sequence order and republishes it
// through the BroadcastHub. Frames at or below the last applied sequence are
// retransmits and are discarded without error. Routing never waits on
// subscribers: the hub only buffers.

#pragma once

#include <atomic>
#include <cstdint>
#include <string_view>

#include "drone_gateway/broadcast_hub.hpp"
#include "drone_gateway/events.hpp"
#include "drone_gateway/logging.hpp"
#include "drone_gateway/session_registry.hpp"

namespace drone_gateway {

/** @brief What happened to an ingested frame. */
enum class IngestOutcome {
    Applied,       /**< Snapshot updated and republished. */
    Discarded,     /**< Duplicate or out-of-order retransmit. */
    UnknownDrone,  /**< No active session for the frame's drone. */
    Unrecognized   /**< Raw report was not a sensor report. */
};

/** @brief Monotonic router counters for status queries. */
struct TelemetryCounters final {
    std::uint64_t applied{};
    std::uint64_t discarded{};
    std::uint64_t unknown_drone{};
};

class TelemetryRouter final {
  public:
    TelemetryRouter(SessionRegistry& registry, BroadcastHub& broadcast_hub);

    /** @brief Apply @p frame if it is newer than the last applied frame. */
    IngestOutcome ingest(const TelemetryFrame& frame);

    /**
     * @brief Decode a raw flight-controller report and ingest it.
     *
     * @throws GatewayError MalformedPayload for recognized but unparsable reports.
     */
    IngestOutcome ingest_sensor_report(const DroneId& drone_id,
                                       SequenceNumber sequence,
                                       std::string_view line,
                                       TimePoint received_at);

    [[nodiscard]] TelemetryCounters counters() const noexcept;

  private:
    SessionRegistry& registry_;
    BroadcastHub& broadcast_hub_;
    std::atomic<std::uint64_t> applied_count_{0};
    std::atomic<std::uint64_t> discarded_count_{0};
    std::atomic<std::uint64_t> unknown_drone_count_{0};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace drone_gateway
