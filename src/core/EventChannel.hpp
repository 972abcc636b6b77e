#pragma once

/**
 * EventChannel.hpp
 *
 * Bounded multi-producer/multi-consumer queue used as an EventBus
 * subscription. Producers never block: tryPush() fails when full.
 * Consumers block in pop() until an item arrives or the channel closes.
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace interlink::core {

template<typename T>
class EventChannel {
public:
    explicit EventChannel(size_t capacity)
        : m_capacity(capacity) {}

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    /**
     * Enqueue without blocking
     * @return false if the channel is full or closed
     */
    bool tryPush(T item) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed || m_items.size() >= m_capacity) {
                return false;
            }
            m_items.push_back(std::move(item));
        }
        m_condition.notify_one();
        return true;
    }

    /**
     * Block until an item is available
     * @return Item, or nullopt once the channel is closed and drained
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_condition.wait(lock, [this] { return m_closed || !m_items.empty(); });
        return takeLocked();
    }

    /**
     * Block up to timeout for an item
     * @return Item, or nullopt on timeout or closed-and-drained
     */
    template<typename Rep, typename Period>
    std::optional<T> popFor(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_condition.wait_for(lock, timeout, [this] { return m_closed || !m_items.empty(); });
        return takeLocked();
    }

    /**
     * Dequeue without blocking
     */
    std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return takeLocked();
    }

    /**
     * Close the channel. Buffered items stay readable. Idempotent.
     * @return true if this call closed it
     */
    bool close() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed) {
                return false;
            }
            m_closed = true;
        }
        m_condition.notify_all();
        return true;
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_items.size();
    }

    size_t capacity() const { return m_capacity; }

private:
    std::optional<T> takeLocked() {
        if (m_items.empty()) {
            return std::nullopt;
        }
        T item = std::move(m_items.front());
        m_items.pop_front();
        return item;
    }

    const size_t m_capacity;
    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    std::deque<T> m_items;
    bool m_closed{false};
};

} // namespace interlink::core
