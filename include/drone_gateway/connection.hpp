// === Connections =============================================================
//
// Transport-facing interfaces. The WebSocket/HTTP layer implements these and
// hands ownership to the SessionRegistry on connect; nothing else in the
// gateway holds a connection directly.

#pragma once

#include <memory>

#include "drone_gateway/command.hpp"
#include "drone_gateway/events.hpp"

namespace drone_gateway {

/** @brief Outbound half of a drone's bidirectional stream. */
class DroneConnection {
  public:
    virtual ~DroneConnection() = default;

    /** @brief Whether the underlying stream can currently accept writes. */
    [[nodiscard]] virtual bool is_open() const = 0;

    /**
     * @brief Write a command to the drone exactly once.
     *
     * @return false when the write could not be performed.
     */
    virtual bool deliver(const CommandDelivery& delivery) = 0;

    /** @brief Close the stream; called once when the session is torn down. */
    virtual void close() = 0;
};

/** @brief Outbound half of an operator's bidirectional stream. */
class OperatorConnection {
  public:
    virtual ~OperatorConnection() = default;

    [[nodiscard]] virtual bool is_open() const = 0;

    /** @brief Write one event; returns false if the stream rejected it. */
    virtual bool send(const GatewayEvent& event) = 0;

    virtual void close() = 0;
};

using DroneConnectionPtr = std::unique_ptr<DroneConnection>;
using OperatorConnectionPtr = std::unique_ptr<OperatorConnection>;

}  // namespace drone_gateway
