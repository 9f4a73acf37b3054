// === Subscriber Channel ======================================================
//
// Bounded, thread-safe FIFO holding the events waiting to be written to one
// operator connection. When full, the oldest buffered event is discarded so
// the newest events always survive and publishers never block.

#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

#include "drone_gateway/events.hpp"

namespace drone_gateway {

class SubscriberChannel final {
  public:
    SubscriberChannel(OperatorId operator_id, std::size_t capacity);

    [[nodiscard]] const OperatorId& operator_id() const noexcept;
    [[nodiscard]] std::size_t capacity() const noexcept;

    /**
     * @brief Append an event, evicting the oldest buffered one when full.
     *
     * @return 0 when nothing was dropped; otherwise the channel's drop count
     *         including this drop, read under the same lock.
     */
    std::uint64_t publish(const GatewayEvent& event);
    /** @brief Attempt to consume a pending event without blocking. */
    [[nodiscard]] std::optional<GatewayEvent> try_consume();
    /** @brief Remove up to @p max_events events in publication order. */
    [[nodiscard]] std::vector<GatewayEvent> drain(std::size_t max_events);

    [[nodiscard]] std::size_t size() const;
    /** @brief Total events dropped because of overflow; never decreases. */
    [[nodiscard]] std::uint64_t dropped_count() const;

  private:
    OperatorId str_operator_id_;
    std::size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<GatewayEvent> queue_events_;
    std::uint64_t dropped_count_{0};
};

}  // namespace drone_gateway
