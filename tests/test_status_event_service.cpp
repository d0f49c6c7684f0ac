#include <gtest/gtest.h>

#include "services/status_event_service.hpp"
#include "support/fake_system.hpp"

using namespace extender;
using namespace extender::services;
using extender::testing::TempDir;

namespace
{
    std::shared_ptr<db::Storage> open_journal(const TempDir &dir)
    {
        auto storage = std::make_shared<db::Storage>(db::initStorage((dir / "events.db").string()));
        storage->sync_schema();
        return storage;
    }
}

TEST(StatusEventServiceTest, NumbersEventsConsecutively)
{
    StatusEventService service;

    auto first = service.publish(StatusEventType::GOAL_CHANGED, core::ReasonCode::OPERATOR_REQUEST,
                                 {{"goal", "extending"}});
    auto second = service.publish(StatusEventType::OVERALL_STATE_CHANGED, core::ReasonCode::NONE,
                                  {{"state", "Initializing"}});

    EXPECT_EQ(first.sequence, 1u);
    EXPECT_EQ(second.sequence, 2u);
    EXPECT_EQ(first.type, "GoalChanged");
    EXPECT_EQ(second.type, "OverallStateChanged");
    EXPECT_GT(first.timestamp_ms, 0);
    EXPECT_EQ(service.last_sequence(), 2u);

    auto json = first.to_json();
    EXPECT_EQ(json["reason"], "OperatorRequest");
    EXPECT_EQ(json["details"]["goal"], "extending");
}

TEST(StatusEventServiceTest, EventsSinceHonoursCursorAndLimit)
{
    StatusEventService service;
    for (int i = 0; i < 5; ++i)
    {
        service.publish(StatusEventType::CLIENT_JOINED, core::ReasonCode::NONE, {{"index", i}});
    }

    auto events = service.events_since(2, 2);

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].sequence, 3u);
    EXPECT_EQ(events[1].sequence, 4u);
    EXPECT_TRUE(service.events_since(5).empty());
    EXPECT_TRUE(service.events_since(0, 0).empty());
}

TEST(StatusEventServiceTest, WindowWithoutJournalKeepsOnlyNewest)
{
    StatusEventService service(nullptr, 3);
    for (int i = 0; i < 10; ++i)
    {
        service.publish(StatusEventType::LINK_QUALITY_SAMPLED, core::ReasonCode::NONE);
    }

    auto events = service.events_since(0);

    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events.front().sequence, 8u);
    EXPECT_EQ(events.back().sequence, 10u);
}

TEST(StatusEventServiceTest, SubscribersSeeEventsInOrder)
{
    StatusEventService service;
    std::vector<uint64_t> seen;
    service.subscribe([](const StatusEvent &)
                      { throw std::runtime_error("subscriber bug"); });
    service.subscribe([&seen](const StatusEvent &event)
                      { seen.push_back(event.sequence); });

    service.publish(StatusEventType::BRIDGE_ACTIVE, core::ReasonCode::NONE);
    service.publish(StatusEventType::BRIDGE_INACTIVE, core::ReasonCode::OPERATOR_REQUEST);

    EXPECT_EQ(seen, (std::vector<uint64_t>{1, 2}));
}

TEST(StatusEventServiceTest, JournalServesEventsOlderThanWindow)
{
    TempDir dir;
    auto storage = open_journal(dir);
    StatusEventService service(storage, 2);
    service.start();

    for (int i = 0; i < 6; ++i)
    {
        service.publish(StatusEventType::CLIENT_UPDATED, core::ReasonCode::NONE, {{"index", i}});
    }
    service.flush();

    auto events = service.events_since(0, 10);

    ASSERT_EQ(events.size(), 6u);
    EXPECT_EQ(events[0].sequence, 1u);
    EXPECT_EQ(events[0].type, "ClientUpdated");
    EXPECT_EQ(events[0].details["index"], 0);
    EXPECT_EQ(events[5].sequence, 6u);
    service.stop();
}

TEST(StatusEventServiceTest, NumberingContinuesAcrossRestarts)
{
    TempDir dir;
    {
        StatusEventService service(open_journal(dir));
        service.publish(StatusEventType::UNRECOVERABLE, core::ReasonCode::UPSTREAM_UNRECOVERABLE);
        service.publish(StatusEventType::GOAL_CHANGED, core::ReasonCode::OPERATOR_REQUEST);
    }

    StatusEventService restarted(open_journal(dir));
    auto event = restarted.publish(StatusEventType::GOAL_CHANGED, core::ReasonCode::OPERATOR_REQUEST);

    EXPECT_EQ(event.sequence, 3u);

    auto history = restarted.events_since(0);
    ASSERT_EQ(history.size(), 3u);
    EXPECT_EQ(history[0].reason, core::ReasonCode::UPSTREAM_UNRECOVERABLE);
}
