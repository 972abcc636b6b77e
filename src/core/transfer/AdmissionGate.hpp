#pragma once

/**
 * AdmissionGate.hpp
 *
 * Capacity-bounded gate enforcing the global transfer concurrency ceiling.
 * Shared by uploads and downloads.
 */

#include "../Cancellation.hpp"

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>

namespace interlink::core::transfer {

class AdmissionGate {
public:
    /**
     * Slot - one admitted unit of concurrency
     *
     * Move-only; released when destroyed or on release().
     */
    class Slot {
    public:
        Slot(Slot&& other) noexcept : m_gate(other.m_gate) { other.m_gate = nullptr; }
        Slot& operator=(Slot&& other) noexcept;
        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;
        ~Slot() { release(); }

        /**
         * Return the slot to the gate. Idempotent.
         */
        void release();

    private:
        friend class AdmissionGate;
        explicit Slot(AdmissionGate* gate) : m_gate(gate) {}

        AdmissionGate* m_gate;
    };

    /**
     * @param capacity Maximum concurrent holders (at least 1)
     */
    explicit AdmissionGate(size_t capacity);

    AdmissionGate(const AdmissionGate&) = delete;
    AdmissionGate& operator=(const AdmissionGate&) = delete;

    /**
     * Wait for a free slot
     * @param token Aborts the wait on cancellation or deadline
     * @return Slot, or nullopt if the token stopped first (see token.reason())
     */
    std::optional<Slot> acquire(const CancellationToken& token);

    /**
     * Take a slot only if one is free right now
     */
    std::optional<Slot> tryAcquire();

    size_t capacity() const { return m_capacity; }

    size_t inUse() const;

private:
    void release();

    const size_t m_capacity;
    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    size_t m_inUse{0};
};

} // namespace interlink::core::transfer
