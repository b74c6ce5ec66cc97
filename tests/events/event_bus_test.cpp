#include <gtest/gtest.h>
#include "dxfer/events/event_bus.hpp"
#include "dxfer/events/events.hpp"
#include <stdexcept>
#include <string>
#include <vector>

using namespace dxfer::events;

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

    bool handler_called = false;
    int received_value = 0;

    bus.subscribe<TestEvent>([&](const TestEvent& e) {
        handler_called = true;
        received_value = e.value;
    });

    bus.emit(TestEvent{42, "test"});

    EXPECT_TRUE(handler_called);
    EXPECT_EQ(received_value, 42);
}

TEST(EventBus, HandlersRunInSubscriptionOrder) {
    EventBus bus;

    std::vector<int> order;

    bus.subscribe<TestEvent>([&](const TestEvent&) { order.push_back(1); });
    bus.subscribe<TestEvent>([&](const TestEvent&) { order.push_back(2); });
    bus.subscribe<TestEvent>([&](const TestEvent&) { order.push_back(3); });

    bus.emit(TestEvent{1, "test"});

    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(EventBus, DifferentEventTypes) {
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

    bus.emit(TestEvent{1, "test"});
    EXPECT_EQ(count, 1);

    bus.unsubscribe<TestEvent>(id);

    bus.emit(TestEvent{2, "test"});
    EXPECT_EQ(count, 1);  // Still 1, handler was removed
}

TEST(EventBus, NoSubscribers) {
    EventBus bus;

    EXPECT_NO_THROW(bus.emit(TestEvent{1, "test"}));
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;

    int count = 0;
    bus.subscribe<TestEvent>([](const TestEvent&) { throw std::runtime_error("boom"); });
    bus.subscribe<TestEvent>([&](const TestEvent&) { count++; });

    EXPECT_NO_THROW(bus.emit(TestEvent{1, "test"}));
    EXPECT_EQ(count, 1);
}

TEST(EventBus, HandlerMayUnsubscribeItselfDuringEmit) {
    EventBus bus;

    int count = 0;
    std::size_t id = 0;
    id = bus.subscribe<TestEvent>([&](const TestEvent&) {
        count++;
        bus.unsubscribe<TestEvent>(id);
    });

    bus.emit(TestEvent{1, "first"});
    bus.emit(TestEvent{2, "second"});

    EXPECT_EQ(count, 1);
    EXPECT_EQ(bus.subscriber_count<TestEvent>(), 0u);
}

TEST(EventBus, SubscriberCount) {
    EventBus bus;

    EXPECT_EQ(bus.subscriber_count<TestEvent>(), 0u);

    auto id1 = bus.subscribe<TestEvent>([](const TestEvent&) {});
    EXPECT_EQ(bus.subscriber_count<TestEvent>(), 1u);

    bus.subscribe<TestEvent>([](const TestEvent&) {});
    EXPECT_EQ(bus.subscriber_count<TestEvent>(), 2u);

    bus.unsubscribe<TestEvent>(id1);
    EXPECT_EQ(bus.subscriber_count<TestEvent>(), 1u);
}

TEST(EventBus, Clear) {
    EventBus bus;

    bus.subscribe<TransferCompletedEvent>([](const TransferCompletedEvent&) {});
    bus.subscribe<TransferFailedEvent>([](const TransferFailedEvent&) {});

    EXPECT_EQ(bus.subscriber_count<TransferCompletedEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<TransferFailedEvent>(), 1u);

    bus.clear();

    EXPECT_EQ(bus.subscriber_count<TransferCompletedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<TransferFailedEvent>(), 0u);
}
