/**
 * AdmissionGate.cpp
 */

#include "AdmissionGate.hpp"

#include <algorithm>

namespace interlink::core::transfer {

AdmissionGate::Slot& AdmissionGate::Slot::operator=(Slot&& other) noexcept {
    if (this != &other) {
        release();
        m_gate = other.m_gate;
        other.m_gate = nullptr;
    }
    return *this;
}

void AdmissionGate::Slot::release() {
    if (m_gate) {
        m_gate->release();
        m_gate = nullptr;
    }
}

AdmissionGate::AdmissionGate(size_t capacity)
    : m_capacity(std::max<size_t>(capacity, 1)) {
}

std::optional<AdmissionGate::Slot> AdmissionGate::acquire(const CancellationToken& token) {
    // Registered before taking m_mutex: onCancel may run the callback inline
    auto registration = token.onCancel([this]() {
        { std::lock_guard<std::mutex> lock(m_mutex); }
        m_condition.notify_all();
    });

    bool admitted = false;
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        auto ready = [this, &token] {
            return token.isCancelled() || m_inUse < m_capacity;
        };

        if (auto deadline = token.deadline()) {
            m_condition.wait_until(lock, *deadline, ready);
        } else {
            m_condition.wait(lock, ready);
        }

        if (!token.isCancelled() && m_inUse < m_capacity) {
            ++m_inUse;
            admitted = true;
        }
    }

    token.removeCallback(registration);

    if (!admitted) {
        return std::nullopt;
    }
    return Slot(this);
}

std::optional<AdmissionGate::Slot> AdmissionGate::tryAcquire() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_inUse >= m_capacity) {
        return std::nullopt;
    }
    ++m_inUse;
    return Slot(this);
}

size_t AdmissionGate::inUse() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_inUse;
}

void AdmissionGate::release() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_inUse > 0) {
            --m_inUse;
        }
    }
    // All waiters: a woken waiter whose token is cancelled leaves without the slot
    m_condition.notify_all();
}

} // namespace interlink::core::transfer
