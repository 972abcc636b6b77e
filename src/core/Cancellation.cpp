/**
 * Cancellation.cpp
 *
 * Implementation of cancellation sources and tokens.
 */

#include "Cancellation.hpp"
#include "Errors.hpp"
#include "Logger.hpp"

#include <atomic>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace interlink::core {

namespace detail {

class CancellationState {
public:
    explicit CancellationState(std::optional<SteadyClock::time_point> deadline)
        : m_deadline(deadline) {}

    bool isCancelled() const {
        return m_cancelled.load() || deadlinePassed();
    }

    CancelReason reason() const {
        if (m_cancelled.load()) return CancelReason::Cancelled;
        if (deadlinePassed()) return CancelReason::DeadlineExceeded;
        return CancelReason::None;
    }

    std::optional<SteadyClock::time_point> deadline() const { return m_deadline; }

    void cancel() {
        std::vector<std::function<void()>> callbacks;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_cancelled.exchange(true)) {
                return;
            }
            callbacks.reserve(m_callbacks.size());
            for (auto& [id, callback] : m_callbacks) {
                callbacks.push_back(std::move(callback));
            }
            m_callbacks.clear();
        }

        // Run outside the lock; callbacks may take other locks
        for (auto& callback : callbacks) {
            invoke(callback);
        }
    }

    CancellationToken::CallbackId add(std::function<void()> callback) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_cancelled.load()) {
                auto id = m_nextId++;
                m_callbacks.emplace(id, std::move(callback));
                return id;
            }
        }
        invoke(callback);
        return 0;
    }

    void remove(CancellationToken::CallbackId id) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_callbacks.erase(id);
    }

private:
    bool deadlinePassed() const {
        return m_deadline && SteadyClock::now() >= *m_deadline;
    }

    static void invoke(const std::function<void()>& callback) {
        try {
            callback();
        } catch (const std::exception& e) {
            Logger::instance().warn("Cancellation callback threw: {}", e.what());
        }
    }

    const std::optional<SteadyClock::time_point> m_deadline;
    std::atomic<bool> m_cancelled{false};
    std::mutex m_mutex;
    std::unordered_map<CancellationToken::CallbackId, std::function<void()>> m_callbacks;
    CancellationToken::CallbackId m_nextId{1};
};

} // namespace detail

// -- CancellationToken --

bool CancellationToken::isCancelled() const {
    return m_state && m_state->isCancelled();
}

CancelReason CancellationToken::reason() const {
    return m_state ? m_state->reason() : CancelReason::None;
}

std::optional<SteadyClock::time_point> CancellationToken::deadline() const {
    return m_state ? m_state->deadline() : std::nullopt;
}

void CancellationToken::throwIfCancelled() const {
    switch (reason()) {
        case CancelReason::Cancelled:        throw OperationCancelledError();
        case CancelReason::DeadlineExceeded: throw DeadlineExceededError();
        case CancelReason::None:             break;
    }
}

CancellationToken::CallbackId CancellationToken::onCancel(std::function<void()> callback) const {
    if (!m_state) {
        return 0;
    }
    return m_state->add(std::move(callback));
}

void CancellationToken::removeCallback(CallbackId id) const {
    if (m_state && id != 0) {
        m_state->remove(id);
    }
}

// -- CancellationSource --

CancellationSource::CancellationSource()
    : m_state(std::make_shared<detail::CancellationState>(std::nullopt)) {
}

CancellationSource::CancellationSource(const CancellationToken& parent,
                                       std::optional<SteadyClock::time_point> deadline)
    : m_parent(parent) {
    auto parentDeadline = parent.deadline();
    if (parentDeadline && (!deadline || *parentDeadline < *deadline)) {
        deadline = parentDeadline;
    }
    m_state = std::make_shared<detail::CancellationState>(deadline);

    std::weak_ptr<detail::CancellationState> weak = m_state;
    m_parentRegistration = m_parent.onCancel([weak]() {
        if (auto state = weak.lock()) {
            state->cancel();
        }
    });
}

CancellationSource::~CancellationSource() {
    detach();
}

CancellationSource::CancellationSource(CancellationSource&& other) noexcept
    : m_state(std::move(other.m_state))
    , m_parent(std::move(other.m_parent))
    , m_parentRegistration(other.m_parentRegistration) {
    other.m_parentRegistration = 0;
}

CancellationSource& CancellationSource::operator=(CancellationSource&& other) noexcept {
    if (this != &other) {
        detach();
        m_state = std::move(other.m_state);
        m_parent = std::move(other.m_parent);
        m_parentRegistration = other.m_parentRegistration;
        other.m_parentRegistration = 0;
    }
    return *this;
}

CancellationSource CancellationSource::withTimeout(const CancellationToken& parent,
                                                   SteadyClock::duration timeout) {
    return CancellationSource(parent, SteadyClock::now() + timeout);
}

CancellationToken CancellationSource::token() const {
    return CancellationToken(m_state);
}

void CancellationSource::cancel() {
    if (m_state) {
        m_state->cancel();
    }
}

bool CancellationSource::isCancelled() const {
    return m_state && m_state->isCancelled();
}

void CancellationSource::detach() {
    if (m_parentRegistration != 0) {
        m_parent.removeCallback(m_parentRegistration);
        m_parentRegistration = 0;
    }
}

} // namespace interlink::core
