// =============================================================================
// Unit tests for EventBus (src/event_bus.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include "event_bus.hpp"

using namespace autolink;

// ---------------------------------------------------------------------------
// Basic subscribe + publish
// ---------------------------------------------------------------------------
TEST(EventBusTest, SubscribeAndPublish) {
    EventBus bus;
    int received_count = 0;
    std::string received_id;

    auto sub = bus.subscribe<DeviceAttachedEvent>(
        [&](const DeviceAttachedEvent& e) {
            received_count++;
            received_id = e.session.device_id;
        });

    DeviceAttachedEvent ev;
    ev.session.device_id = "R58M12345";
    ev.session.display_name = "samsung SM_G973N (R58M12345)";
    ev.session.type = SessionType::ServerOverAdb;
    bus.publish(ev);

    EXPECT_EQ(received_count, 1);
    EXPECT_EQ(received_id, "R58M12345");
}

// ---------------------------------------------------------------------------
// Multiple subscribers for the same event
// ---------------------------------------------------------------------------
TEST(EventBusTest, MultipleSubscribers) {
    EventBus bus;
    int count_a = 0;
    int count_b = 0;

    auto sub_a = bus.subscribe<IngestReadyEvent>(
        [&](const IngestReadyEvent&) { count_a++; });
    auto sub_b = bus.subscribe<IngestReadyEvent>(
        [&](const IngestReadyEvent&) { count_b++; });

    bus.publish(IngestReadyEvent{});

    EXPECT_EQ(count_a, 1);
    EXPECT_EQ(count_b, 1);
}

// ---------------------------------------------------------------------------
// Unsubscribe via RAII handle destruction
// ---------------------------------------------------------------------------
TEST(EventBusTest, UnsubscribeOnHandleDestruction) {
    EventBus bus;
    int count = 0;

    {
        auto sub = bus.subscribe<ExecRequestEvent>(
            [&](const ExecRequestEvent&) { count++; });
        bus.publish(ExecRequestEvent{});
        EXPECT_EQ(count, 1);
    }

    bus.publish(ExecRequestEvent{});
    EXPECT_EQ(count, 1);
}

TEST(EventBusTest, HasSubscribers) {
    EventBus bus;
    EXPECT_FALSE(bus.has_subscribers<ExecRequestEvent>());

    {
        auto sub = bus.subscribe<ExecRequestEvent>(
            [](const ExecRequestEvent&) {});
        EXPECT_TRUE(bus.has_subscribers<ExecRequestEvent>());
    }

    EXPECT_FALSE(bus.has_subscribers<ExecRequestEvent>());
}

// ---------------------------------------------------------------------------
// Different event types are independent
// ---------------------------------------------------------------------------
TEST(EventBusTest, EventTypeIsolation) {
    EventBus bus;
    int attach_count = 0;
    int detach_count = 0;

    auto sub1 = bus.subscribe<DeviceAttachedEvent>(
        [&](const DeviceAttachedEvent&) { attach_count++; });
    auto sub2 = bus.subscribe<DeviceDetachedEvent>(
        [&](const DeviceDetachedEvent&) { detach_count++; });

    DeviceAttachedEvent ev;
    ev.session.device_id = "d1";
    bus.publish(ev);

    EXPECT_EQ(attach_count, 1);
    EXPECT_EQ(detach_count, 0);
}

TEST(EventBusTest, ReleaseKeepsSubscription) {
    EventBus bus;
    int count = 0;

    {
        auto sub = bus.subscribe<IngestErrorEvent>(
            [&](const IngestErrorEvent&) { count++; });
        sub.release();
    }

    bus.publish(IngestErrorEvent{});
    EXPECT_EQ(count, 1);
}

// ---------------------------------------------------------------------------
// Handler exception does not reach the publisher or other handlers
// ---------------------------------------------------------------------------
TEST(EventBusTest, HandlerExceptionIsCaught) {
    EventBus bus;
    int good_count = 0;

    auto sub1 = bus.subscribe<ExecRequestEvent>(
        [](const ExecRequestEvent&) { throw std::runtime_error("boom"); });
    auto sub2 = bus.subscribe<ExecRequestEvent>(
        [&](const ExecRequestEvent&) { good_count++; });

    EXPECT_NO_THROW(bus.publish(ExecRequestEvent{}));
    EXPECT_EQ(good_count, 1);
}

TEST(EventBusTest, HandleMoveSemantic) {
    EventBus bus;
    int count = 0;

    SubscriptionHandle outer;
    {
        auto inner = bus.subscribe<DeviceLogEvent>(
            [&](const DeviceLogEvent&) { count++; });
        outer = std::move(inner);
    }

    bus.publish(DeviceLogEvent{});
    EXPECT_EQ(count, 1);
}

// ---------------------------------------------------------------------------
// A handler may unsubscribe itself while being delivered
// ---------------------------------------------------------------------------
TEST(EventBusTest, UnsubscribeInsideHandler) {
    EventBus bus;
    int count = 0;
    SubscriptionHandle self;

    self = bus.subscribe<ExecRequestEvent>([&](const ExecRequestEvent&) {
        count++;
        self = SubscriptionHandle();
    });

    bus.publish(ExecRequestEvent{});
    bus.publish(ExecRequestEvent{});
    EXPECT_EQ(count, 1);
}

TEST(EventBusTest, SessionTypeNames) {
    EXPECT_STREQ(sessionTypeName(SessionType::ClientOverLan), "client-over-lan");
    EXPECT_STREQ(sessionTypeName(SessionType::ServerOverLan), "server-over-lan");
    EXPECT_STREQ(sessionTypeName(SessionType::ServerOverAdb), "server-over-adb");
    EXPECT_EQ(static_cast<int>(SessionType::ServerOverAdb), 2);
}
