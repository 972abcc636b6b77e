#pragma once

/**
 * Errors.hpp
 *
 * Exception types reported by the transfer core.
 */

#include <stdexcept>
#include <string>

namespace interlink::core {

/**
 * Base error for transfer operations (unknown task, illegal transition,
 * missing storage client, failed storage call).
 */
class TransferError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Thrown when an operation observes its cancellation token.
 * Not a failure: the task is Cancelled, never Failed.
 */
class OperationCancelledError : public TransferError {
public:
    OperationCancelledError() : TransferError("operation was cancelled") {}
};

/**
 * Thrown when an operation outlives the deadline of its token.
 */
class DeadlineExceededError : public TransferError {
public:
    DeadlineExceededError() : TransferError("deadline exceeded") {}
};

} // namespace interlink::core
