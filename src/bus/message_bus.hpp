#pragma once

#include <array>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/crew_errors.hpp"
#include "core/sync/cancel_token.hpp"

namespace crew::bus {

// Wire names are fixed: status, alert, plan, artifact, heartbeat.
enum class Channel {
    Status,
    Alert,
    Plan,
    Artifact,
    Heartbeat
};

inline constexpr std::array<Channel, 5> kAllChannels = {
    Channel::Status, Channel::Alert, Channel::Plan, Channel::Artifact,
    Channel::Heartbeat};

std::string to_string(Channel channel);
core::errors::Result<Channel> parse_channel(const std::string& name);

struct Message {
    Channel channel;
    std::string sender;
    nlohmann::json payload;
};

class Subscription;

// In-process publish/subscribe bus. Each subscriber owns an unbounded FIFO;
// publish copies the message into every queue registered on the channel.
class MessageBus {
public:
    MessageBus() = default;

    MessageBus(const MessageBus&) = delete;
    MessageBus& operator=(const MessageBus&) = delete;

    void publish(const Message& message);

    // The returned subscription must not outlive the bus. Messages published
    // before this call are never delivered to it.
    std::unique_ptr<Subscription> subscribe(Channel channel);

    // Undelivered messages across all current subscribers of `channel`.
    std::vector<Message> snapshot(Channel channel) const;

    std::size_t subscriber_count(Channel channel) const;

private:
    friend class Subscription;

    struct SubscriberQueue {
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<Message> pending;
    };

    void unregister(Channel channel, const std::shared_ptr<SubscriberQueue>& queue);

    mutable std::mutex registry_mutex_;
    std::map<Channel, std::vector<std::shared_ptr<SubscriberQueue>>> subscribers_;
};

class Subscription {
public:
    // Only MessageBus can mint a key, so subscriptions come from subscribe().
    class Key {
        friend class MessageBus;
        Key() {}
    };

    Subscription(Key key, MessageBus& bus, Channel channel,
                 std::shared_ptr<MessageBus::SubscriberQueue> queue);
    ~Subscription();

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    Channel channel() const { return channel_; }

    // Blocks until a message arrives. Returns nullopt once the token is
    // cancelled.
    std::optional<Message> next(const core::sync::CancelToken& cancel_token);

    std::optional<Message> next_for(std::chrono::milliseconds timeout);
    std::optional<Message> try_next();

private:
    std::optional<Message> pop_locked();

    MessageBus& bus_;
    Channel channel_;
    std::shared_ptr<MessageBus::SubscriberQueue> queue_;
};

}  // namespace crew::bus
