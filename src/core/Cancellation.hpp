#pragma once

/**
 * Cancellation.hpp
 *
 * Cooperative cancellation: a CancellationSource owns the right to cancel,
 * CancellationTokens observe it. Sources can be linked to a parent token so
 * that cancelling the parent cancels every child, while cancelling a child
 * never touches its parent or siblings. Deadlines are inherited downwards.
 */

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace interlink::core {

namespace detail { class CancellationState; }

using SteadyClock = std::chrono::steady_clock;

/**
 * Why a token stopped being live
 */
enum class CancelReason {
    None,
    Cancelled,
    DeadlineExceeded
};

/**
 * CancellationToken - read-only view of a cancellation state
 *
 * Cheap to copy. A default-constructed token is never cancelled and has
 * no deadline.
 */
class CancellationToken {
public:
    using CallbackId = uint64_t;

    CancellationToken() = default;

    /**
     * @return true once cancelled or past the deadline
     */
    bool isCancelled() const;

    /**
     * @return Cancellation reason, explicit cancel taking precedence
     */
    CancelReason reason() const;

    /**
     * @return Effective deadline, if any
     */
    std::optional<SteadyClock::time_point> deadline() const;

    /**
     * Throw OperationCancelledError or DeadlineExceededError if not live
     */
    void throwIfCancelled() const;

    /**
     * Register a callback run once on explicit cancellation.
     * Runs immediately on the calling thread if already cancelled.
     * Deadline expiry does not trigger callbacks; waiters use deadline().
     * @return Id for removeCallback (0 if the token can never be cancelled)
     */
    CallbackId onCancel(std::function<void()> callback) const;

    /**
     * Remove a callback registered with onCancel
     */
    void removeCallback(CallbackId id) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : m_state(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> m_state;
};

/**
 * CancellationSource - owner of a cancellation state
 *
 * Move-only. Destroying a linked source detaches it from its parent.
 */
class CancellationSource {
public:
    /**
     * Root source without a deadline
     */
    CancellationSource();

    /**
     * Source linked to a parent token
     * @param parent Parent token; its cancellation propagates to this source
     * @param deadline Optional own deadline (the earlier of this and the parent's wins)
     */
    explicit CancellationSource(const CancellationToken& parent,
                                std::optional<SteadyClock::time_point> deadline = std::nullopt);

    ~CancellationSource();

    CancellationSource(CancellationSource&& other) noexcept;
    CancellationSource& operator=(CancellationSource&& other) noexcept;
    CancellationSource(const CancellationSource&) = delete;
    CancellationSource& operator=(const CancellationSource&) = delete;

    /**
     * Source that expires after a timeout
     */
    static CancellationSource withTimeout(const CancellationToken& parent,
                                          SteadyClock::duration timeout);

    CancellationToken token() const;

    /**
     * Request cancellation. Idempotent.
     */
    void cancel();

    bool isCancelled() const;

private:
    void detach();

    std::shared_ptr<detail::CancellationState> m_state;
    CancellationToken m_parent;
    CancellationToken::CallbackId m_parentRegistration{0};
};

} // namespace interlink::core
