#include <chrono>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>
#include <gtest/gtest.h>
#include "bus/message_bus.hpp"

namespace {

using crew::bus::Channel;
using crew::bus::Message;
using crew::bus::MessageBus;
using crew::core::errors::get_error;
using crew::core::errors::get_value;
using crew::core::errors::is_error;

Message make_message(Channel channel, const std::string& sender, int seq) {
    return Message{channel, sender, {{"seq", seq}}};
}

TEST(MessageBusTest, ChannelNamesRoundTrip) {
    for (const Channel channel : crew::bus::kAllChannels) {
        auto parsed = crew::bus::parse_channel(crew::bus::to_string(channel));
        ASSERT_FALSE(is_error(parsed));
        EXPECT_EQ(get_value(parsed), channel);
    }
    EXPECT_EQ(crew::bus::to_string(Channel::Heartbeat), "heartbeat");
}

TEST(MessageBusTest, UnknownChannelIsTypedError) {
    auto parsed = crew::bus::parse_channel("metrics");
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).category, crew::core::errors::ErrorCategory::Input);
    EXPECT_EQ(get_error(parsed).code, "unknown_channel");
}

TEST(MessageBusTest, EachSubscriberSeesPublishOrder) {
    MessageBus bus;
    auto first = bus.subscribe(Channel::Status);
    auto second = bus.subscribe(Channel::Status);

    for (int i = 0; i < 5; ++i) {
        bus.publish(make_message(Channel::Status, "worker", i));
    }

    for (int i = 0; i < 5; ++i) {
        auto a = first->try_next();
        ASSERT_TRUE(a.has_value());
        EXPECT_EQ(a->payload["seq"], i);
    }
    // The second subscriber is still at the start of its own queue.
    for (int i = 0; i < 5; ++i) {
        auto b = second->try_next();
        ASSERT_TRUE(b.has_value());
        EXPECT_EQ(b->payload["seq"], i);
        EXPECT_EQ(b->sender, "worker");
    }
    EXPECT_FALSE(first->try_next().has_value());
}

TEST(MessageBusTest, LateSubscriberMissesEarlierMessages) {
    MessageBus bus;
    auto early = bus.subscribe(Channel::Alert);
    bus.publish(make_message(Channel::Alert, "worker", 1));

    auto late = bus.subscribe(Channel::Alert);
    EXPECT_FALSE(late->try_next().has_value());

    bus.publish(make_message(Channel::Alert, "worker", 2));
    auto seen = late->try_next();
    ASSERT_TRUE(seen.has_value());
    EXPECT_EQ(seen->payload["seq"], 2);
    EXPECT_EQ(early->try_next()->payload["seq"], 1);
}

TEST(MessageBusTest, ChannelsAreIsolated) {
    MessageBus bus;
    auto status = bus.subscribe(Channel::Status);
    bus.publish(make_message(Channel::Artifact, "worker", 1));
    EXPECT_FALSE(status->try_next().has_value());
}

TEST(MessageBusTest, DestroyingSubscriptionUnregisters) {
    MessageBus bus;
    {
        auto subscription = bus.subscribe(Channel::Plan);
        EXPECT_EQ(bus.subscriber_count(Channel::Plan), 1u);
    }
    EXPECT_EQ(bus.subscriber_count(Channel::Plan), 0u);
    bus.publish(make_message(Channel::Plan, "orchestrator", 1));
    EXPECT_TRUE(bus.snapshot(Channel::Plan).empty());
}

TEST(MessageBusTest, SubscriptionsOnlyComeFromTheBus) {
    static_assert(!std::is_default_constructible<crew::bus::Subscription::Key>::value,
                  "only the bus can create subscriptions");
    static_assert(!std::is_copy_constructible<crew::bus::Subscription>::value,
                  "subscriptions own their queue");

    MessageBus bus;
    auto subscription = bus.subscribe(Channel::Heartbeat);
    ASSERT_NE(subscription, nullptr);
    EXPECT_EQ(subscription->channel(), Channel::Heartbeat);
    EXPECT_EQ(bus.subscriber_count(Channel::Heartbeat), 1u);
}

TEST(MessageBusTest, SnapshotIsNonDestructive) {
    MessageBus bus;
    auto first = bus.subscribe(Channel::Status);
    auto second = bus.subscribe(Channel::Status);
    bus.publish(make_message(Channel::Status, "worker", 7));

    EXPECT_EQ(bus.snapshot(Channel::Status).size(), 2u);
    EXPECT_EQ(bus.snapshot(Channel::Status).size(), 2u);

    ASSERT_TRUE(first->try_next().has_value());
    EXPECT_EQ(bus.snapshot(Channel::Status).size(), 1u);
}

TEST(MessageBusTest, NextBlocksUntilPublish) {
    MessageBus bus;
    auto subscription = bus.subscribe(Channel::Heartbeat);
    auto token = crew::core::sync::make_cancel_token();

    std::thread publisher([&bus]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        bus.publish(make_message(Channel::Heartbeat, "worker", 42));
    });

    auto message = subscription->next(token);
    publisher.join();
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(message->payload["seq"], 42);
}

TEST(MessageBusTest, NextReturnsOnCancel) {
    MessageBus bus;
    auto subscription = bus.subscribe(Channel::Status);
    auto token = crew::core::sync::make_cancel_token();

    std::thread canceller([token]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        crew::core::sync::cancel(token);
    });

    EXPECT_FALSE(subscription->next(token).has_value());
    canceller.join();
}

TEST(MessageBusTest, NextForTimesOut) {
    MessageBus bus;
    auto subscription = bus.subscribe(Channel::Status);
    EXPECT_FALSE(subscription->next_for(std::chrono::milliseconds(20)).has_value());
}

TEST(MessageBusTest, ConcurrentPublishersDeliverEverything) {
    MessageBus bus;
    auto subscription = bus.subscribe(Channel::Artifact);

    std::vector<std::thread> publishers;
    for (int p = 0; p < 4; ++p) {
        publishers.emplace_back([&bus, p]() {
            for (int i = 0; i < 50; ++i) {
                bus.publish(make_message(Channel::Artifact, "worker-" + std::to_string(p), i));
            }
        });
    }
    for (auto& publisher : publishers) {
        publisher.join();
    }

    // Per sender, order is preserved.
    std::vector<int> last_seen(4, -1);
    int received = 0;
    while (auto message = subscription->try_next()) {
        const int sender = message->sender.back() - '0';
        const int seq = message->payload["seq"].get<int>();
        EXPECT_GT(seq, last_seen[sender]);
        last_seen[sender] = seq;
        ++received;
    }
    EXPECT_EQ(received, 200);
}

}  // namespace
