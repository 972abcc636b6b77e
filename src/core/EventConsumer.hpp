#pragma once

/**
 * EventConsumer.hpp
 *
 * Background thread that hands every bus event to a handler.
 */

#include "EventBus.hpp"
#include "Logger.hpp"

#include <functional>
#include <memory>
#include <thread>

namespace interlink::core {

/**
 * EventConsumer - owns a subscribeAll() queue and the thread draining it
 *
 * The thread ends when the bus closes or the consumer is destroyed. The
 * destructor unsubscribes, lets the thread drain what is already buffered
 * and joins it, so a consumer going out of scope during unwinding is safe.
 */
class EventConsumer {
public:
    using Handler = std::function<void(const Event&)>;

    EventConsumer(std::shared_ptr<EventBus> bus, Handler handler)
        : m_bus(std::move(bus))
        , m_subscription(m_bus->subscribeAll())
        , m_thread([subscription = m_subscription, handler = std::move(handler)]() {
            while (auto event = subscription->pop()) {
                try {
                    handler(**event);
                } catch (const std::exception& e) {
                    Logger::instance().warn("Event handler threw: {}", e.what());
                }
            }
        }) {
    }

    ~EventConsumer() {
        m_bus->unsubscribeAll(m_subscription);
        m_subscription->close();
        if (m_thread.joinable()) {
            m_thread.join();
        }
    }

    EventConsumer(const EventConsumer&) = delete;
    EventConsumer& operator=(const EventConsumer&) = delete;

private:
    std::shared_ptr<EventBus> m_bus;
    SubscriptionPtr m_subscription;
    std::thread m_thread;
};

} // namespace interlink::core
