/**
 * EventBus.cpp
 *
 * Implementation of the publish/subscribe hub.
 */

#include "EventBus.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <mutex>

namespace interlink::core {

namespace {

size_t clampBufferSize(size_t bufferSize) {
    if (bufferSize == 0) {
        return EventBus::DefaultBufferSize;
    }
    return std::min(bufferSize, EventBus::MaxBufferSize);
}

} // namespace

EventBus::EventBus(size_t bufferSize, std::shared_ptr<DroppedEventCounter> droppedCounter)
    : m_bufferSize(clampBufferSize(bufferSize))
    , m_dropped(droppedCounter ? std::move(droppedCounter)
                               : std::make_shared<DroppedEventCounter>()) {
}

EventBus::~EventBus() {
    close();
}

SubscriptionPtr EventBus::subscribe(EventType type) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);

    if (m_closed) {
        return makeClosedQueue();
    }

    auto queue = std::make_shared<EventQueue>(m_bufferSize);
    m_subscribers[type].push_back(queue);
    return queue;
}

SubscriptionPtr EventBus::subscribeAll() {
    std::unique_lock<std::shared_mutex> lock(m_mutex);

    if (m_closed) {
        return makeClosedQueue();
    }

    auto queue = std::make_shared<EventQueue>(m_bufferSize);
    m_all.push_back(queue);
    return queue;
}

void EventBus::publish(EventPtr event) {
    if (!event) return;

    std::shared_lock<std::shared_mutex> lock(m_mutex);

    if (m_closed) {
        return;
    }

    auto it = m_subscribers.find(event->type());
    if (it != m_subscribers.end()) {
        for (const auto& queue : it->second) {
            deliver(queue, event);
        }
    }

    for (const auto& queue : m_all) {
        deliver(queue, event);
    }
}

void EventBus::unsubscribe(EventType type, const SubscriptionPtr& subscription) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);

    if (m_closed) {
        return;
    }

    auto it = m_subscribers.find(type);
    if (it != m_subscribers.end()) {
        removeFrom(it->second, subscription);
    }
}

void EventBus::unsubscribeAll(const SubscriptionPtr& subscription) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);

    if (m_closed) {
        return;
    }

    for (auto& [type, queues] : m_subscribers) {
        removeFrom(queues, subscription);
    }
    removeFrom(m_all, subscription);
}

void EventBus::close() {
    std::unique_lock<std::shared_mutex> lock(m_mutex);

    if (m_closed) {
        return;
    }
    m_closed = true;

    // A queue may appear under several types; EventChannel::close is idempotent
    for (auto& [type, queues] : m_subscribers) {
        for (auto& queue : queues) {
            queue->close();
        }
    }
    for (auto& queue : m_all) {
        queue->close();
    }

    m_subscribers.clear();
    m_all.clear();
}

bool EventBus::isClosed() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_closed;
}

int64_t EventBus::getDroppedEventCount() const {
    return m_dropped->load();
}

int64_t EventBus::resetDroppedEventCount() {
    return m_dropped->exchangeZero();
}

void EventBus::publishLog(Severity level, const std::string& message, const std::string& stage,
                          const std::string& jobName, std::optional<std::string> error) {
    auto event = std::make_shared<LogEvent>();
    event->level = level;
    event->message = message;
    event->stage = stage;
    event->jobName = jobName;
    event->error = std::move(error);
    publish(std::move(event));
}

void EventBus::publishProgress(const std::string& jobName, const std::string& stage,
                               double progress, const std::string& message) {
    auto event = std::make_shared<ProgressEvent>();
    event->jobName = jobName;
    event->stage = stage;
    event->progress = progress;
    event->message = message;
    publish(std::move(event));
}

void EventBus::publishStateChange(const std::string& jobName, const std::string& oldStatus,
                                  const std::string& newStatus, const std::string& stage,
                                  const std::string& jobId, const std::string& errorMessage) {
    auto event = std::make_shared<StateChangeEvent>();
    event->jobName = jobName;
    event->oldStatus = oldStatus;
    event->newStatus = newStatus;
    event->stage = stage;
    event->jobId = jobId;
    event->errorMessage = errorMessage;
    publish(std::move(event));
}

void EventBus::publishConfigChanged(const std::string& source, const std::string& email) {
    auto event = std::make_shared<ConfigChangedEvent>();
    event->source = source;
    event->email = email;
    publish(std::move(event));
}

SubscriptionPtr EventBus::makeClosedQueue() const {
    auto queue = std::make_shared<EventQueue>(0);
    queue->close();
    return queue;
}

void EventBus::deliver(const SubscriptionPtr& queue, const EventPtr& event) {
    if (queue->tryPush(event)) {
        return;
    }

    int64_t dropped = m_dropped->increment();
    if (dropped % 100 == 0) {
        Logger::instance().warn("EventBus dropped {} events (subscriber buffers full)", dropped);
    }
}

bool EventBus::removeFrom(std::vector<SubscriptionPtr>& queues, const SubscriptionPtr& subscription) {
    auto it = std::find(queues.begin(), queues.end(), subscription);
    if (it == queues.end()) {
        return false;
    }
    // Swap with last and truncate
    *it = std::move(queues.back());
    queues.pop_back();
    return true;
}

} // namespace interlink::core
