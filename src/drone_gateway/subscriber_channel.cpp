#include "drone_gateway/subscriber_channel.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace drone_gateway {

SubscriberChannel::SubscriberChannel(OperatorId operator_id, std::size_t capacity)
    : str_operator_id_(std::move(operator_id)),
      capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("SubscriberChannel capacity must be positive");
    }
}

const OperatorId& SubscriberChannel::operator_id() const noexcept {
    return str_operator_id_;
}

std::size_t SubscriberChannel::capacity() const noexcept {
    return capacity_;
}

std::uint64_t SubscriberChannel::publish(const GatewayEvent& event) {
    std::scoped_lock lock(mutex_);
    std::uint64_t drop_ordinal = 0;
    if (queue_events_.size() >= capacity_) {
        queue_events_.pop_front();
        drop_ordinal = ++dropped_count_;
    }
    queue_events_.push_back(event);
    return drop_ordinal;
}

std::optional<GatewayEvent> SubscriberChannel::try_consume() {
    std::scoped_lock lock(mutex_);
    if (queue_events_.empty()) {
        return std::nullopt;
    }
    GatewayEvent event = std::move(queue_events_.front());
    queue_events_.pop_front();
    return event;
}

std::vector<GatewayEvent> SubscriberChannel::drain(std::size_t max_events) {
    std::scoped_lock lock(mutex_);
    std::vector<GatewayEvent> list_events;
    const std::size_t count = std::min(max_events, queue_events_.size());
    list_events.reserve(count);
    for (std::size_t index = 0; index < count; ++index) {
        list_events.push_back(std::move(queue_events_.front()));
        queue_events_.pop_front();
    }
    return list_events;
}

std::size_t SubscriberChannel::size() const {
    std::scoped_lock lock(mutex_);
    return queue_events_.size();
}

std::uint64_t SubscriberChannel::dropped_count() const {
    std::scoped_lock lock(mutex_);
    return dropped_count_;
}

}  // namespace drone_gateway
