#pragma once

/**
 * EventBus.hpp
 *
 * Thread-safe event bus for decoupled communication between the transfer
 * core and its observers (CLI progress output, GUI panels).
 * Subscribers receive events through bounded channels; publishing never
 * blocks, and events that do not fit are dropped and counted.
 */

#include "EventChannel.hpp"
#include "Events.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace interlink::core {

using EventQueue = EventChannel<EventPtr>;
using SubscriptionPtr = std::shared_ptr<EventQueue>;

/**
 * Count of events dropped because a subscriber queue was full.
 * Owned explicitly so independent buses (and tests) do not share state
 * unless they are handed the same counter.
 */
class DroppedEventCounter {
public:
    int64_t increment() { return ++m_count; }
    int64_t load() const { return m_count.load(); }
    int64_t exchangeZero() { return m_count.exchange(0); }

private:
    std::atomic<int64_t> m_count{0};
};

/**
 * EventBus - publish/subscribe hub
 *
 * Features:
 * - Per-type and catch-all subscriptions
 * - Non-blocking publish with drop accounting
 * - Idempotent close that closes every live subscription once
 */
class EventBus {
public:
    static constexpr size_t DefaultBufferSize = 1000;
    static constexpr size_t MaxBufferSize = 5000;

    /**
     * Constructor
     * @param bufferSize Per-subscription capacity (0 = default, clamped to MaxBufferSize)
     * @param droppedCounter Counter to record drops in (a private one if null)
     */
    explicit EventBus(size_t bufferSize = DefaultBufferSize,
                      std::shared_ptr<DroppedEventCounter> droppedCounter = nullptr);

    ~EventBus();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * Subscribe to one event type
     * @return New subscription queue (already closed if the bus is closed)
     */
    SubscriptionPtr subscribe(EventType type);

    /**
     * Subscribe to every event type
     * @return New subscription queue (already closed if the bus is closed)
     */
    SubscriptionPtr subscribeAll();

    /**
     * Deliver an event to every matching subscriber without blocking.
     * No-op after close().
     */
    void publish(EventPtr event);

    /**
     * Remove a subscription registered for one type
     */
    void unsubscribe(EventType type, const SubscriptionPtr& subscription);

    /**
     * Remove a subscription from every type and from the catch-all list
     */
    void unsubscribeAll(const SubscriptionPtr& subscription);

    /**
     * Close the bus and every live subscription. Idempotent.
     */
    void close();

    bool isClosed() const;

    size_t bufferSize() const { return m_bufferSize; }

    int64_t getDroppedEventCount() const;

    /**
     * Reset the dropped counter
     * @return Count before the reset
     */
    int64_t resetDroppedEventCount();

    // Convenience publishers

    void publishLog(Severity level, const std::string& message, const std::string& stage,
                    const std::string& jobName, std::optional<std::string> error = std::nullopt);

    void publishProgress(const std::string& jobName, const std::string& stage,
                         double progress, const std::string& message);

    void publishStateChange(const std::string& jobName, const std::string& oldStatus,
                            const std::string& newStatus, const std::string& stage,
                            const std::string& jobId, const std::string& errorMessage);

    void publishConfigChanged(const std::string& source, const std::string& email);

private:
    SubscriptionPtr makeClosedQueue() const;
    void deliver(const SubscriptionPtr& queue, const EventPtr& event);
    static bool removeFrom(std::vector<SubscriptionPtr>& queues, const SubscriptionPtr& subscription);

private:
    const size_t m_bufferSize;
    std::shared_ptr<DroppedEventCounter> m_dropped;

    mutable std::shared_mutex m_mutex;
    std::unordered_map<EventType, std::vector<SubscriptionPtr>> m_subscribers;
    std::vector<SubscriptionPtr> m_all;
    bool m_closed{false};
};

} // namespace interlink::core
