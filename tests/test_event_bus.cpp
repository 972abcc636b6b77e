/**
 * test_event_bus.cpp
 */

#include "core/EventBus.hpp"
#include "core/EventConsumer.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace interlink::core;

class EventBusTest : public ::testing::Test {
protected:
    static EventPtr makeLog(const std::string& message) {
        auto event = std::make_shared<LogEvent>();
        event->message = message;
        return event;
    }

    std::shared_ptr<DroppedEventCounter> dropped = std::make_shared<DroppedEventCounter>();
};

TEST_F(EventBusTest, TypedSubscriberReceivesOnlyItsType) {
    EventBus bus(10, dropped);
    auto logs = bus.subscribe(EventType::Log);
    auto progress = bus.subscribe(EventType::Progress);

    bus.publish(makeLog("hello"));

    auto event = logs->tryPop();
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ((*event)->type(), EventType::Log);
    EXPECT_EQ(static_cast<const LogEvent&>(**event).message, "hello");
    EXPECT_FALSE(progress->tryPop().has_value());
}

TEST_F(EventBusTest, CatchAllSubscriberReceivesEverything) {
    EventBus bus(10, dropped);
    auto all = bus.subscribeAll();

    bus.publishLog(Severity::Info, "one", "upload", "job");
    bus.publishProgress("job", "upload", 0.5, "half");
    bus.publishStateChange("job", "queued", "running", "upload", "id-1", "");

    EXPECT_EQ(all->size(), 3u);
    EXPECT_EQ((*all->tryPop())->type(), EventType::Log);
    EXPECT_EQ((*all->tryPop())->type(), EventType::Progress);
    EXPECT_EQ((*all->tryPop())->type(), EventType::StateChange);
}

TEST_F(EventBusTest, FullSubscriberDropsAndCounts) {
    EventBus bus(2, dropped);
    auto logs = bus.subscribe(EventType::Log);

    for (int i = 0; i < 10; ++i) {
        bus.publish(makeLog("event " + std::to_string(i)));
    }

    EXPECT_EQ(logs->size(), 2u);
    EXPECT_EQ(bus.getDroppedEventCount(), 8);
    EXPECT_EQ(static_cast<const LogEvent&>(**logs->tryPop()).message, "event 0");
    EXPECT_EQ(static_cast<const LogEvent&>(**logs->tryPop()).message, "event 1");

    EXPECT_EQ(bus.resetDroppedEventCount(), 8);
    EXPECT_EQ(bus.getDroppedEventCount(), 0);
}

TEST_F(EventBusTest, SharedCounterSeesDropsFromEveryBus) {
    EventBus first(1, dropped);
    EventBus second(1, dropped);
    auto a = first.subscribeAll();
    auto b = second.subscribeAll();

    for (int i = 0; i < 3; ++i) {
        first.publish(makeLog("a"));
        second.publish(makeLog("b"));
    }

    EXPECT_EQ(dropped->load(), 4);
}

TEST_F(EventBusTest, PublishNeverBlocksWithoutConsumer) {
    EventBus bus(1, dropped);
    auto logs = bus.subscribe(EventType::Log);

    auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < 1000; ++i) {
        bus.publish(makeLog("x"));
    }
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, std::chrono::seconds(1));
    EXPECT_EQ(bus.getDroppedEventCount(), 999);
}

TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
    EventBus bus(10, dropped);
    auto logs = bus.subscribe(EventType::Log);
    bus.unsubscribe(EventType::Log, logs);

    bus.publish(makeLog("ignored"));
    EXPECT_EQ(logs->size(), 0u);
}

TEST_F(EventBusTest, UnsubscribeAllRemovesEveryRegistration) {
    EventBus bus(10, dropped);
    auto all = bus.subscribeAll();
    bus.unsubscribeAll(all);

    bus.publish(makeLog("ignored"));
    EXPECT_EQ(all->size(), 0u);
}

TEST_F(EventBusTest, CloseIsFinal) {
    EventBus bus(10, dropped);
    auto logs = bus.subscribe(EventType::Log);
    bus.publish(makeLog("before"));

    bus.close();
    bus.close();

    EXPECT_TRUE(bus.isClosed());
    EXPECT_TRUE(logs->isClosed());

    // Buffered events stay readable, then the channel reports the end
    ASSERT_TRUE(logs->pop().has_value());
    EXPECT_FALSE(logs->pop().has_value());

    bus.publish(makeLog("after"));
    EXPECT_EQ(bus.getDroppedEventCount(), 0);

    auto late = bus.subscribeAll();
    EXPECT_TRUE(late->isClosed());
    EXPECT_FALSE(late->pop().has_value());
}

TEST_F(EventBusTest, CloseWakesBlockedConsumer) {
    EventBus bus(10, dropped);
    auto all = bus.subscribeAll();

    std::thread consumer([&all] {
        while (all->pop()) {
        }
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    bus.close();
    consumer.join();
    SUCCEED();
}

TEST_F(EventBusTest, BufferSizeIsClamped) {
    EXPECT_EQ(EventBus(0, dropped).bufferSize(), EventBus::DefaultBufferSize);
    EXPECT_EQ(EventBus(100000, dropped).bufferSize(), EventBus::MaxBufferSize);
}

TEST_F(EventBusTest, ConfigChangedCarriesSourceAndEmail) {
    EventBus bus(10, dropped);
    auto changes = bus.subscribe(EventType::ConfigChanged);

    bus.publishConfigChanged(config_source::EnvVar, "user@example.com");

    auto event = changes->tryPop();
    ASSERT_TRUE(event.has_value());
    const auto& changed = static_cast<const ConfigChangedEvent&>(**event);
    EXPECT_EQ(changed.source, "env_var");
    EXPECT_EQ(changed.email, "user@example.com");
}

TEST_F(EventBusTest, TransferEventSerializesType) {
    TransferEvent event(EventType::TransferCompleted);
    event.taskId = "task-1";
    event.name = "file.bin";

    auto j = event.toJson();
    EXPECT_EQ(j["type"], "transfer_completed");
}

// ========== EventConsumer ==========

TEST_F(EventBusTest, ConsumerDrainsBufferedEventsOnDestruction) {
    auto bus = std::make_shared<EventBus>(10, dropped);
    std::vector<std::string> seen;
    {
        EventConsumer consumer(bus, [&seen](const Event& e) {
            seen.push_back(static_cast<const LogEvent&>(e).message);
        });
        bus->publish(makeLog("a"));
        bus->publish(makeLog("b"));
    }

    EXPECT_EQ(seen, (std::vector<std::string>{"a", "b"}));

    // Only the consumer's own subscription was closed
    auto later = bus->subscribeAll();
    bus->publish(makeLog("c"));
    EXPECT_EQ(later->size(), 1u);
}

TEST_F(EventBusTest, ConsumerJoinsDuringUnwinding) {
    auto bus = std::make_shared<EventBus>(10, dropped);

    EXPECT_THROW({
        EventConsumer consumer(bus, [](const Event&) {});
        bus->publish(makeLog("a"));
        throw std::runtime_error("setup failed");
    }, std::runtime_error);

    EXPECT_NO_THROW(bus->publish(makeLog("b")));
}

TEST_F(EventBusTest, ConsumerSurvivesThrowingHandler) {
    auto bus = std::make_shared<EventBus>(10, dropped);
    std::vector<std::string> seen;
    {
        EventConsumer consumer(bus, [&seen](const Event& e) {
            const auto& message = static_cast<const LogEvent&>(e).message;
            if (message == "bad") {
                throw std::runtime_error("cannot render");
            }
            seen.push_back(message);
        });
        bus->publish(makeLog("bad"));
        bus->publish(makeLog("good"));
        bus->close();
    }

    EXPECT_EQ(seen, std::vector<std::string>{"good"});
}
