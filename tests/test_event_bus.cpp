#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "engine/core/EventBus.hpp"

using engine::core::Event;
using engine::core::EventBus;

TEST(EventBus, PublishIsDeliveredOnDispatch)
{
    EventBus bus;
    std::vector<std::string> received;
    bus.Subscribe("score_changed", [&received](const Event& event) { received = event.args; });

    bus.Publish(Event{"score_changed", {"3", "30"}});
    EXPECT_TRUE(received.empty());
    EXPECT_EQ(bus.PendingCount(), 1U);

    bus.DispatchQueued();
    ASSERT_EQ(received.size(), 2U);
    EXPECT_EQ(received[0], "3");
    EXPECT_EQ(received[1], "30");
    EXPECT_EQ(bus.PendingCount(), 0U);
}

TEST(EventBus, UnsubscribeStopsDelivery)
{
    EventBus bus;
    int calls = 0;
    const auto id = bus.Subscribe("player_died", [&calls](const Event&) { ++calls; });
    EXPECT_EQ(bus.HandlerCount("player_died"), 1U);

    bus.Unsubscribe(id);
    bus.Publish(Event{"player_died", {}});
    bus.DispatchQueued();

    EXPECT_EQ(calls, 0);
    EXPECT_EQ(bus.HandlerCount("player_died"), 0U);
}

TEST(EventBus, EmptyHandlerIsRejected)
{
    EventBus bus;
    EXPECT_EQ(bus.Subscribe("session_started", EventBus::Handler{}), 0U);
    EXPECT_EQ(bus.HandlerCount("session_started"), 0U);
}

TEST(EventBus, EventsPublishedDuringDispatchAreDelivered)
{
    EventBus bus;
    int followUps = 0;
    bus.Subscribe("session_ended", [&bus](const Event&) { bus.Publish(Event{"input_enabled", {"0"}}); });
    bus.Subscribe("input_enabled", [&followUps](const Event&) { ++followUps; });

    bus.Publish(Event{"session_ended", {}});
    bus.DispatchQueued();

    EXPECT_EQ(followUps, 1);
}

TEST(EventBus, ClearQueuedDropsPendingEvents)
{
    EventBus bus;
    int calls = 0;
    bus.Subscribe("session_paused", [&calls](const Event&) { ++calls; });

    bus.Publish(Event{"session_paused", {}});
    bus.ClearQueued();
    bus.DispatchQueued();

    EXPECT_EQ(calls, 0);
}
