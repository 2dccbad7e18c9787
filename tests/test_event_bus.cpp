// =============================================================================
// Unit tests for EventBus (src/event_bus.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include <thread>
#include <atomic>
#include "event_bus.hpp"

using namespace c64view;

// ---------------------------------------------------------------------------
// Basic subscribe + publish
// ---------------------------------------------------------------------------
TEST(EventBusTest, SubscribeAndPublish) {
    EventBus bus;
    int received_count = 0;
    StreamState received_state = StreamState::Waiting;

    auto sub = bus.subscribe<StreamStateEvent>(
        [&](const StreamStateEvent& e) {
            received_count++;
            received_state = e.new_state;
        });

    StreamStateEvent ev;
    ev.old_state = StreamState::Streaming;
    ev.new_state = StreamState::Stalled;
    ev.stalled_ms = 600;
    bus.publish(ev);

    EXPECT_EQ(received_count, 1);
    EXPECT_EQ(received_state, StreamState::Stalled);
}

// ---------------------------------------------------------------------------
// Multiple subscribers for the same event
// ---------------------------------------------------------------------------
TEST(EventBusTest, MultipleSubscribers) {
    EventBus bus;
    int count_a = 0;
    int count_b = 0;

    auto sub_a = bus.subscribe<ShutdownEvent>(
        [&](const ShutdownEvent&) { count_a++; });
    auto sub_b = bus.subscribe<ShutdownEvent>(
        [&](const ShutdownEvent&) { count_b++; });

    bus.publish(ShutdownEvent{});

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
        auto sub = bus.subscribe<ShutdownEvent>(
            [&](const ShutdownEvent&) { count++; });
        bus.publish(ShutdownEvent{});
        EXPECT_EQ(count, 1);
    }

    bus.publish(ShutdownEvent{});
    EXPECT_EQ(count, 1);
}

// ---------------------------------------------------------------------------
// has_subscribers reflects current state
// ---------------------------------------------------------------------------
TEST(EventBusTest, HasSubscribers) {
    EventBus bus;
    EXPECT_FALSE(bus.has_subscribers<FrameDroppedEvent>());

    {
        auto sub = bus.subscribe<FrameDroppedEvent>(
            [](const FrameDroppedEvent&) {});
        EXPECT_TRUE(bus.has_subscribers<FrameDroppedEvent>());
    }

    EXPECT_FALSE(bus.has_subscribers<FrameDroppedEvent>());
}

// ---------------------------------------------------------------------------
// Different event types are independent
// ---------------------------------------------------------------------------
TEST(EventBusTest, EventTypeIsolation) {
    EventBus bus;
    int state_count = 0;
    int drop_count = 0;

    auto sub1 = bus.subscribe<StreamStateEvent>(
        [&](const StreamStateEvent&) { state_count++; });
    auto sub2 = bus.subscribe<FrameDroppedEvent>(
        [&](const FrameDroppedEvent&) { drop_count++; });

    FrameDroppedEvent fe;
    fe.reason = FrameDroppedEvent::Reason::Pacing;
    fe.frame_seq = 12;
    bus.publish(fe);

    EXPECT_EQ(state_count, 0);
    EXPECT_EQ(drop_count, 1);
}

// ---------------------------------------------------------------------------
// Two buses never see each other's events (one bus per stream context)
// ---------------------------------------------------------------------------
TEST(EventBusTest, BusesAreIndependent) {
    EventBus a;
    EventBus b;
    int count_a = 0;

    auto sub = a.subscribe<ShutdownEvent>([&](const ShutdownEvent&) { count_a++; });
    b.publish(ShutdownEvent{});
    EXPECT_EQ(count_a, 0);

    a.publish(ShutdownEvent{});
    EXPECT_EQ(count_a, 1);
}

// ---------------------------------------------------------------------------
// release() keeps subscription alive after handle destruction
// ---------------------------------------------------------------------------
TEST(EventBusTest, ReleaseKeepsSubscription) {
    EventBus bus;
    int count = 0;

    {
        auto sub = bus.subscribe<ShutdownEvent>(
            [&](const ShutdownEvent&) { count++; });
        sub.release();
    }

    bus.publish(ShutdownEvent{});
    EXPECT_EQ(count, 1);
}

// ---------------------------------------------------------------------------
// Handler exception does not crash bus or prevent other handlers
// ---------------------------------------------------------------------------
TEST(EventBusTest, HandlerExceptionIsCaught) {
    EventBus bus;
    int good_count = 0;

    auto sub1 = bus.subscribe<ShutdownEvent>(
        [](const ShutdownEvent&) { throw std::runtime_error("boom"); });
    auto sub2 = bus.subscribe<ShutdownEvent>(
        [&](const ShutdownEvent&) { good_count++; });

    EXPECT_NO_THROW(bus.publish(ShutdownEvent{}));
    EXPECT_EQ(good_count, 1);
}

// ---------------------------------------------------------------------------
// Move semantics for SubscriptionHandle
// ---------------------------------------------------------------------------
TEST(EventBusTest, HandleMoveSemantic) {
    EventBus bus;
    int count = 0;

    SubscriptionHandle outer;
    {
        auto inner = bus.subscribe<ShutdownEvent>(
            [&](const ShutdownEvent&) { count++; });
        outer = std::move(inner);
    }

    bus.publish(ShutdownEvent{});
    EXPECT_EQ(count, 1);
}

// ---------------------------------------------------------------------------
// Concurrent publishers (receive thread + presentation thread)
// ---------------------------------------------------------------------------
TEST(EventBusTest, ConcurrentPublish) {
    EventBus bus;
    std::atomic<int> count{0};
    auto sub = bus.subscribe<FrameDroppedEvent>(
        [&](const FrameDroppedEvent&) { count++; });

    auto worker = [&] {
        for (int i = 0; i < 1000; i++) bus.publish(FrameDroppedEvent{});
    };
    std::thread t1(worker);
    std::thread t2(worker);
    t1.join();
    t2.join();

    EXPECT_EQ(count.load(), 2000);
}

TEST(EventBusTest, StateNames) {
    EXPECT_STREQ(streamStateName(StreamState::Waiting), "waiting");
    EXPECT_STREQ(streamStateName(StreamState::Streaming), "streaming");
    EXPECT_STREQ(streamStateName(StreamState::Stalled), "stalled");
    EXPECT_STREQ(streamStateName(StreamState::Recovered), "recovered");
}
