// === Broadcast Hub ===========================================================
//
// Per-drone subscriber sets and non-blocking fan-out. Each drone has its own
// topic lock, so publication for one drone never waits on another, and each
// operator has its own bounded SubscriberChannel, so one slow operator never
// delays the others.

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "drone_gateway/events.hpp"
#include "drone_gateway/logging.hpp"
#include "drone_gateway/subscriber_channel.hpp"

namespace drone_gateway {

class BroadcastHub final {
  public:
    explicit BroadcastHub(std::size_t subscriber_capacity);

    /** @brief Create the outbound buffer for a newly connected operator. */
    void attach_subscriber(const OperatorId& operator_id);
    /** @brief Drop an operator's buffer and every subscription it held. Idempotent. */
    void detach_subscriber(const OperatorId& operator_id);

    /**
     * @brief Add @p operator_id to the subscriber set of @p drone_id.
     *
     * @throws GatewayError NotFound when the operator has no attached buffer.
     * @return false when the subscription already existed.
     */
    bool subscribe(const OperatorId& operator_id, const DroneId& drone_id);
    /**
     * @brief Remove a subscription; returns false if it did not exist.
     *
     * A drone left without subscribers loses its topic entry.
     */
    bool unsubscribe(const OperatorId& operator_id, const DroneId& drone_id);

    /**
     * @brief Fan @p event out to every current subscriber of @p drone_id.
     *
     * Events published for the same drone reach each subscriber in
     * publication order. Never blocks on a subscriber.
     *
     * @return Number of subscribers the event was buffered for.
     */
    std::size_t publish(const DroneId& drone_id, const GatewayEvent& event);
    /** @brief Buffer @p event for a single operator (command results). */
    bool deliver_to(const OperatorId& operator_id, const GatewayEvent& event);
    /** @brief Take up to @p max_events buffered events for @p operator_id. */
    [[nodiscard]] std::vector<GatewayEvent> drain(const OperatorId& operator_id, std::size_t max_events);

    [[nodiscard]] std::vector<OperatorId> subscribers_of(const DroneId& drone_id) const;
    [[nodiscard]] std::size_t pending_events(const OperatorId& operator_id) const;
    [[nodiscard]] std::uint64_t dropped_events(const OperatorId& operator_id) const;
    [[nodiscard]] std::uint64_t total_dropped_events() const noexcept;
    [[nodiscard]] std::size_t subscriber_capacity() const noexcept;
    /** @brief Drones that currently have at least one subscriber. */
    [[nodiscard]] std::size_t topic_count() const;

  private:
    /** @brief Subscriber set for one drone guarded by its own lock. */
    struct Topic final {
        std::mutex mutex;
        std::set<OperatorId> set_subscribers;
        bool retired{false}; /**< Set once erased from the map; never reused. */
    };

    std::shared_ptr<Topic> find_topic(const DroneId& drone_id) const;
    std::shared_ptr<Topic> find_or_create_topic(const DroneId& drone_id);
    /** @brief Erase @p topic if it is still mapped for @p drone_id and has no subscribers. */
    void release_topic_if_empty(const DroneId& drone_id, const std::shared_ptr<Topic>& topic);
    std::shared_ptr<SubscriberChannel> find_channel(const OperatorId& operator_id) const;
    bool push_to_channel(SubscriberChannel& channel, const GatewayEvent& event);

    std::size_t subscriber_capacity_;
    mutable std::shared_mutex topics_mutex_;
    std::unordered_map<DroneId, std::shared_ptr<Topic>> map_topics_;
    mutable std::shared_mutex channels_mutex_;
    std::unordered_map<OperatorId, std::shared_ptr<SubscriberChannel>> map_channels_;
    std::atomic<std::uint64_t> total_dropped_{0};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace drone_gateway
