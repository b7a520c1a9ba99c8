#include "bus/message_bus.hpp"

#include <algorithm>
#include <utility>

namespace crew::bus {

using core::errors::CrewError;
using core::errors::ErrorCategory;

namespace {

constexpr std::chrono::milliseconds kCancelPollInterval{50};

}  // namespace

std::string to_string(const Channel channel) {
    switch (channel) {
        case Channel::Status:
            return "status";
        case Channel::Alert:
            return "alert";
        case Channel::Plan:
            return "plan";
        case Channel::Artifact:
            return "artifact";
        case Channel::Heartbeat:
            return "heartbeat";
        default:
            return "unknown";
    }
}

core::errors::Result<Channel> parse_channel(const std::string& name) {
    for (const Channel channel : kAllChannels) {
        if (to_string(channel) == name) {
            return channel;
        }
    }
    return CrewError{ErrorCategory::Input, "Unknown channel: '" + name + "'",
                     "unknown_channel"};
}

void MessageBus::publish(const Message& message) {
    std::vector<std::shared_ptr<SubscriberQueue>> queues;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        auto it = subscribers_.find(message.channel);
        if (it == subscribers_.end()) {
            return;
        }
        queues = it->second;
    }

    for (const auto& queue : queues) {
        {
            std::lock_guard<std::mutex> lock(queue->mutex);
            queue->pending.push_back(message);
        }
        queue->cv.notify_one();
    }
}

std::unique_ptr<Subscription> MessageBus::subscribe(const Channel channel) {
    auto queue = std::make_shared<SubscriberQueue>();
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        subscribers_[channel].push_back(queue);
    }
    return std::make_unique<Subscription>(Subscription::Key(), *this, channel, std::move(queue));
}

std::vector<Message> MessageBus::snapshot(const Channel channel) const {
    std::vector<std::shared_ptr<SubscriberQueue>> queues;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        auto it = subscribers_.find(channel);
        if (it == subscribers_.end()) {
            return {};
        }
        queues = it->second;
    }

    std::vector<Message> messages;
    for (const auto& queue : queues) {
        std::lock_guard<std::mutex> lock(queue->mutex);
        messages.insert(messages.end(), queue->pending.begin(), queue->pending.end());
    }
    return messages;
}

std::size_t MessageBus::subscriber_count(const Channel channel) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = subscribers_.find(channel);
    return it == subscribers_.end() ? 0 : it->second.size();
}

void MessageBus::unregister(const Channel channel,
                            const std::shared_ptr<SubscriberQueue>& queue) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = subscribers_.find(channel);
    if (it == subscribers_.end()) {
        return;
    }
    auto& queues = it->second;
    queues.erase(std::remove(queues.begin(), queues.end(), queue), queues.end());
}

Subscription::Subscription(Key, MessageBus& bus, const Channel channel,
                           std::shared_ptr<MessageBus::SubscriberQueue> queue)
    : bus_(bus), channel_(channel), queue_(std::move(queue)) {}

Subscription::~Subscription() {
    bus_.unregister(channel_, queue_);
}

std::optional<Message> Subscription::pop_locked() {
    if (queue_->pending.empty()) {
        return std::nullopt;
    }
    Message message = std::move(queue_->pending.front());
    queue_->pending.pop_front();
    return message;
}

std::optional<Message> Subscription::next(const core::sync::CancelToken& cancel_token) {
    std::unique_lock<std::mutex> lock(queue_->mutex);
    while (true) {
        if (auto message = pop_locked()) {
            return message;
        }
        if (core::sync::is_cancelled(cancel_token)) {
            return std::nullopt;
        }
        queue_->cv.wait_for(lock, kCancelPollInterval,
                            [this]() { return !queue_->pending.empty(); });
    }
}

std::optional<Message> Subscription::next_for(const std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(queue_->mutex);
    queue_->cv.wait_for(lock, timeout, [this]() { return !queue_->pending.empty(); });
    return pop_locked();
}

std::optional<Message> Subscription::try_next() {
    std::lock_guard<std::mutex> lock(queue_->mutex);
    return pop_locked();
}

}  // namespace crew::bus
