#include "drone_gateway/broadcast_hub.hpp"

#include <stdexcept>
#include <utility>

#include "drone_gateway/errors.hpp"

namespace drone_gateway {

BroadcastHub::BroadcastHub(std::size_t subscriber_capacity)
    : subscriber_capacity_(subscriber_capacity),
      logger_(get_logger()) {
    if (subscriber_capacity_ == 0) {
        throw std::invalid_argument("BroadcastHub subscriber capacity must be positive");
    }
}

void BroadcastHub::attach_subscriber(const OperatorId& operator_id) {
    std::unique_lock lock(channels_mutex_);
    const auto [iterator_channel, inserted] = map_channels_.try_emplace(operator_id, nullptr);
    if (!inserted) {
        throw GatewayError(ErrorCode::DuplicateSession, "subscriber " + operator_id + " already attached");
    }
    iterator_channel->second = std::make_shared<SubscriberChannel>(operator_id, subscriber_capacity_);
}

void BroadcastHub::detach_subscriber(const OperatorId& operator_id) {
    {
        std::unique_lock lock(channels_mutex_);
        if (map_channels_.erase(operator_id) == 0) {
            return;
        }
    }

    std::vector<std::pair<DroneId, std::shared_ptr<Topic>>> list_topics;
    {
        std::shared_lock lock(topics_mutex_);
        list_topics.assign(map_topics_.begin(), map_topics_.end());
    }
    for (const auto& [drone_id, topic] : list_topics) {
        bool now_empty = false;
        {
            std::scoped_lock topic_lock(topic->mutex);
            now_empty = topic->set_subscribers.erase(operator_id) > 0 && topic->set_subscribers.empty();
        }
        if (now_empty) {
            release_topic_if_empty(drone_id, topic);
        }
    }
    logger_->debug("Detached subscriber {}", operator_id);
}

bool BroadcastHub::subscribe(const OperatorId& operator_id, const DroneId& drone_id) {
    if (find_channel(operator_id) == nullptr) {
        throw GatewayError(ErrorCode::NotFound, "subscriber " + operator_id + " is not attached");
    }
    // A topic emptied and erased between lookup and lock is retired; retry on a fresh one.
    while (true) {
        const std::shared_ptr<Topic> topic = find_or_create_topic(drone_id);
        std::scoped_lock lock(topic->mutex);
        if (topic->retired) {
            continue;
        }
        return topic->set_subscribers.insert(operator_id).second;
    }
}

bool BroadcastHub::unsubscribe(const OperatorId& operator_id, const DroneId& drone_id) {
    const std::shared_ptr<Topic> topic = find_topic(drone_id);
    if (topic == nullptr) {
        return false;
    }
    bool removed = false;
    bool now_empty = false;
    {
        std::scoped_lock lock(topic->mutex);
        removed = topic->set_subscribers.erase(operator_id) > 0;
        now_empty = topic->set_subscribers.empty();
    }
    if (now_empty) {
        release_topic_if_empty(drone_id, topic);
    }
    return removed;
}

std::size_t BroadcastHub::publish(const DroneId& drone_id, const GatewayEvent& event) {
    const std::shared_ptr<Topic> topic = find_topic(drone_id);
    if (topic == nullptr) {
        return 0;
    }

    // The topic lock stays held for the whole fan-out so two publications
    // for the same drone can never interleave in any subscriber's buffer.
    std::scoped_lock lock(topic->mutex);
    std::size_t delivered_count = 0;
    for (const OperatorId& operator_id : topic->set_subscribers) {
        const std::shared_ptr<SubscriberChannel> channel = find_channel(operator_id);
        if (channel == nullptr) {
            continue;
        }
        push_to_channel(*channel, event);
        ++delivered_count;
    }
    return delivered_count;
}

bool BroadcastHub::deliver_to(const OperatorId& operator_id, const GatewayEvent& event) {
    const std::shared_ptr<SubscriberChannel> channel = find_channel(operator_id);
    if (channel == nullptr) {
        return false;
    }
    push_to_channel(*channel, event);
    return true;
}

std::vector<GatewayEvent> BroadcastHub::drain(const OperatorId& operator_id, std::size_t max_events) {
    const std::shared_ptr<SubscriberChannel> channel = find_channel(operator_id);
    if (channel == nullptr) {
        return {};
    }
    return channel->drain(max_events);
}

std::vector<OperatorId> BroadcastHub::subscribers_of(const DroneId& drone_id) const {
    const std::shared_ptr<Topic> topic = find_topic(drone_id);
    if (topic == nullptr) {
        return {};
    }
    std::scoped_lock lock(topic->mutex);
    return std::vector<OperatorId>(topic->set_subscribers.begin(), topic->set_subscribers.end());
}

std::size_t BroadcastHub::pending_events(const OperatorId& operator_id) const {
    const std::shared_ptr<SubscriberChannel> channel = find_channel(operator_id);
    return channel == nullptr ? 0 : channel->size();
}

std::uint64_t BroadcastHub::dropped_events(const OperatorId& operator_id) const {
    const std::shared_ptr<SubscriberChannel> channel = find_channel(operator_id);
    return channel == nullptr ? 0 : channel->dropped_count();
}

std::uint64_t BroadcastHub::total_dropped_events() const noexcept {
    return total_dropped_.load();
}

std::size_t BroadcastHub::topic_count() const {
    std::shared_lock lock(topics_mutex_);
    return map_topics_.size();
}

std::size_t BroadcastHub::subscriber_capacity() const noexcept {
    return subscriber_capacity_;
}

std::shared_ptr<BroadcastHub::Topic> BroadcastHub::find_topic(const DroneId& drone_id) const {
    std::shared_lock lock(topics_mutex_);
    const auto iterator_topic = map_topics_.find(drone_id);
    if (iterator_topic == map_topics_.end()) {
        return nullptr;
    }
    return iterator_topic->second;
}

std::shared_ptr<BroadcastHub::Topic> BroadcastHub::find_or_create_topic(const DroneId& drone_id) {
    if (std::shared_ptr<Topic> existing = find_topic(drone_id); existing != nullptr) {
        return existing;
    }
    std::unique_lock lock(topics_mutex_);
    std::shared_ptr<Topic>& topic = map_topics_[drone_id];
    if (topic == nullptr) {
        topic = std::make_shared<Topic>();
    }
    return topic;
}

void BroadcastHub::release_topic_if_empty(const DroneId& drone_id, const std::shared_ptr<Topic>& topic) {
    std::unique_lock lock(topics_mutex_);
    const auto iterator_topic = map_topics_.find(drone_id);
    if (iterator_topic == map_topics_.end() || iterator_topic->second != topic) {
        return;
    }
    std::scoped_lock topic_lock(topic->mutex);
    if (!topic->set_subscribers.empty()) {
        return;
    }
    topic->retired = true;
    map_topics_.erase(iterator_topic);
}

std::shared_ptr<SubscriberChannel> BroadcastHub::find_channel(const OperatorId& operator_id) const {
    std::shared_lock lock(channels_mutex_);
    const auto iterator_channel = map_channels_.find(operator_id);
    if (iterator_channel == map_channels_.end()) {
        return nullptr;
    }
    return iterator_channel->second;
}

bool BroadcastHub::push_to_channel(SubscriberChannel& channel, const GatewayEvent& event) {
    const std::uint64_t drop_ordinal = channel.publish(event);
    if (drop_ordinal == 0) {
        return true;
    }
    total_dropped_.fetch_add(1);
    if (drop_ordinal == 1) {
        logger_->warn(
            R"({{"component":"broadcast_hub","event":"{}","operator":"{}","capacity":{}}})",
            to_string(ErrorCode::BufferOverflow),
            channel.operator_id(),
            channel.capacity()
        );
    } else {
        logger_->debug("Subscriber {} dropped oldest event ({} total)", channel.operator_id(), drop_ordinal);
    }
    return false;
}

}  // namespace drone_gateway
