#include <gtest/gtest.h>
#include "strata/events/event_bus.hpp"
#include "strata/events/events.hpp"

#include <stdexcept>
#include <string>

using namespace strata::events;

// Test event types
struct TestEvent {
    int value;
    std::string message;
};

struct AnotherEvent {
    double data;
};

TEST(EventBus, SubscribeAndEmit) {
    EventBus bus;

    int received_value = 0;
    bus.subscribe<TestEvent>([&](const TestEvent& e) {
        received_value = e.value;
    });

    bus.emit(TestEvent{42, "test"});

    EXPECT_EQ(received_value, 42);
}

TEST(EventBus, DispatchesByEventType) {
    EventBus bus;

    int test_count = 0;
    int another_count = 0;
    bus.subscribe<TestEvent>([&](const TestEvent&) { test_count++; });
    bus.subscribe<AnotherEvent>([&](const AnotherEvent&) { another_count++; });

    bus.emit(TestEvent{1, "test"});
    bus.emit(AnotherEvent{3.14});
    bus.emit(TestEvent{2, "test2"});

    EXPECT_EQ(test_count, 2);
    EXPECT_EQ(another_count, 1);
}

TEST(EventBus, Unsubscribe) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<TestEvent>([&](const TestEvent&) { count++; });
    EXPECT_EQ(bus.subscriber_count<TestEvent>(), 1u);

    bus.emit(TestEvent{1, "test"});
    bus.unsubscribe<TestEvent>(id);
    bus.emit(TestEvent{2, "test"});

    EXPECT_EQ(count, 1);
    EXPECT_EQ(bus.subscriber_count<TestEvent>(), 0u);
}

TEST(EventBus, NoSubscribers) {
    EventBus bus;
    EXPECT_NO_THROW(bus.emit(SegmentSkippedEvent{"chunk_1_000.dat", "bad"}));
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;

    int reached = 0;
    bus.subscribe<BackupFailedEvent>([](const BackupFailedEvent&) {
        throw std::runtime_error("handler failure");
    });
    bus.subscribe<BackupFailedEvent>([&](const BackupFailedEvent&) { reached++; });

    EXPECT_NO_THROW(bus.emit(BackupFailedEvent{"write", "disk full"}));
    EXPECT_EQ(reached, 1);
}

TEST(EventBus, HandlerMaySubscribeDuringEmit) {
    EventBus bus;

    int late_calls = 0;
    bus.subscribe<TestEvent>([&](const TestEvent&) {
        bus.subscribe<TestEvent>([&](const TestEvent&) { late_calls++; });
    });

    bus.emit(TestEvent{1, "first"});
    EXPECT_EQ(late_calls, 0);
    bus.emit(TestEvent{2, "second"});
    EXPECT_EQ(late_calls, 1);
}
