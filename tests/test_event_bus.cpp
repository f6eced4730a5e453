#include "downqueue/event_bus.hpp"

#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace downqueue {
namespace {

JobEvent makeEvent(const std::string& id, EventKind kind) {
    JobEvent event;
    event.job_id = id;
    event.kind = kind;
    return event;
}

TEST(EventBus, DeliversToEverySubscriberUntilUnsubscribed) {
    EventBus bus;
    std::vector<std::string> first;
    std::vector<std::string> second;
    const auto a = bus.subscribe([&](const JobEvent& e) { first.push_back(e.job_id); });
    bus.subscribe([&](const JobEvent& e) { second.push_back(e.job_id); });

    bus.publish(makeEvent("one", EventKind::Queued));
    bus.unsubscribe(a);
    bus.publish(makeEvent("two", EventKind::Progress));

    EXPECT_EQ(first, std::vector<std::string>{"one"});
    EXPECT_EQ(second, (std::vector<std::string>{"one", "two"}));
}

TEST(EventBus, FailingHandlerDoesNotStopOthers) {
    EventBus bus;
    int delivered = 0;
    bus.subscribe([](const JobEvent&) { throw std::runtime_error("observer bug"); });
    bus.subscribe([&](const JobEvent&) { ++delivered; });

    EXPECT_NO_THROW(bus.publish(makeEvent("x", EventKind::Status)));
    EXPECT_EQ(delivered, 1);
}

TEST(EventBus, HandlerMayUnsubscribeDuringPublish) {
    EventBus bus;
    int calls = 0;
    EventBus::SubscriptionId self = 0;
    self = bus.subscribe([&](const JobEvent&) {
        ++calls;
        bus.unsubscribe(self);
    });

    bus.publish(makeEvent("x", EventKind::Status));
    bus.publish(makeEvent("x", EventKind::Status));
    EXPECT_EQ(calls, 1);
}

TEST(EventQueue, PopAllDrainsInOrder) {
    EventBus bus;
    EventQueue queue;
    bus.subscribe([&](const JobEvent& e) { queue.push(e); });

    bus.publish(makeEvent("a", EventKind::Queued));
    bus.publish(makeEvent("a", EventKind::Completed));

    const auto events = queue.popAll();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].kind, EventKind::Queued);
    EXPECT_EQ(events[1].kind, EventKind::Completed);
    EXPECT_TRUE(queue.popAll().empty());
}

} // namespace
} // namespace downqueue
