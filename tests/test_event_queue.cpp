#include <gtest/gtest.h>

#include <thread>

#include "core/event_queue.hpp"

using namespace extender::core;
using namespace std::chrono_literals;

TEST(EventQueueTest, PreservesOrder)
{
    EventQueue queue;
    queue.enqueue(ExtenderEvent::goal_changed(ExtenderGoal::EXTENDING));
    queue.enqueue(ExtenderEvent::scan_requested());
    queue.enqueue(ExtenderEvent::manual_retry());

    EXPECT_EQ(queue.total_enqueued(), 3u);
    EXPECT_EQ(queue.try_dequeue()->type, ExtenderEventType::GOAL_CHANGED);
    EXPECT_EQ(queue.try_dequeue()->type, ExtenderEventType::SCAN_REQUESTED);
    EXPECT_EQ(queue.try_dequeue()->type, ExtenderEventType::MANUAL_RETRY);
    EXPECT_FALSE(queue.try_dequeue().has_value());
    EXPECT_EQ(queue.total_dequeued(), 3u);
}

TEST(EventQueueTest, BoundedQueueDropsWhenFull)
{
    EventQueue queue(2);

    EXPECT_TRUE(queue.enqueue(ExtenderEvent::scan_requested()));
    EXPECT_TRUE(queue.enqueue(ExtenderEvent::scan_requested()));
    EXPECT_FALSE(queue.enqueue(ExtenderEvent::scan_requested()));
    EXPECT_EQ(queue.total_dropped(), 1u);
}

TEST(EventQueueTest, DequeueForTimesOut)
{
    EventQueue queue;

    auto started = std::chrono::steady_clock::now();
    auto event = queue.dequeue_for(20ms);

    EXPECT_FALSE(event.has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - started, 15ms);
}

TEST(EventQueueTest, StopWakesBlockedConsumerAndRejectsProducers)
{
    EventQueue queue;

    std::thread consumer([&queue]
                         { EXPECT_FALSE(queue.dequeue_for(5s).has_value()); });
    std::this_thread::sleep_for(10ms);
    queue.stop();
    consumer.join();

    EXPECT_TRUE(queue.is_stopped());
    EXPECT_FALSE(queue.enqueue(ExtenderEvent::manual_retry()));

    queue.restart();
    EXPECT_TRUE(queue.enqueue(ExtenderEvent::manual_retry()));
}

TEST(EventQueueTest, CarriesPayload)
{
    EventQueue queue;
    UpstreamProfile profile;
    profile.ssid = "HomeNetwork";
    profile.security = SecurityType::WPA2_PSK;
    profile.passphrase = "correct horse";
    queue.enqueue(ExtenderEvent::upstream_profile_supplied(profile));

    auto event = queue.dequeue_for(10ms);
    ASSERT_TRUE(event.has_value());
    const auto &data = std::get<UpstreamProfileData>(event->data);
    EXPECT_EQ(data.profile.ssid, "HomeNetwork");
    EXPECT_EQ(event->type_name(), "UPSTREAM_PROFILE_SUPPLIED");
}
