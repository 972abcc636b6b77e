#pragma once

/**
 * TransferQueue.hpp
 *
 * Authoritative registry of transfer tasks and their state machine.
 * The queue does not move bytes: callers track a task, drive it through
 * activate/startTransfer/updateProgress and finish it with complete, fail
 * or cancel. Every change is published on the EventBus.
 */

#include "TransferTask.hpp"
#include "../Cancellation.hpp"
#include "../EventBus.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace interlink::core::transfer {

/**
 * RetryExecutor - re-dispatches a task reset by TransferQueue::retry
 *
 * executeRetry is called on the retrying thread and must not block; the
 * implementation is expected to hand the work to its own workers, which
 * then drive the task through the queue again under the same ID.
 */
class RetryExecutor {
public:
    virtual ~RetryExecutor() = default;
    virtual void executeRetry(const TransferTask& task) = 0;
};

/**
 * Number of tasks per state
 */
struct QueueStats {
    int queued{0};
    int initializing{0};
    int active{0};
    int paused{0};
    int completed{0};
    int failed{0};
    int cancelled{0};

    int total() const {
        return queued + initializing + active + paused + completed + failed + cancelled;
    }
};

/**
 * Aggregate view of all tasks sharing a batch ID
 */
struct BatchStats {
    std::string batchId;
    std::string batchLabel;
    std::string direction;      // "upload" or "download"
    std::string sourceLabel;
    int total{0};
    int queued{0};              // Queued + Initializing
    int active{0};
    int completed{0};
    int failed{0};
    int cancelled{0};
    int64_t totalBytes{0};
    double progress{0.0};       // Byte-weighted 0.0 - 1.0
    double speed{0.0};          // Sum over Active members

    bool isFinished() const { return queued == 0 && active == 0; }
};

/**
 * TransferQueue - task registry
 *
 * Thread-safe. Registry access is a short critical section under one
 * shared mutex; events, cancel handles and the retry executor are always
 * invoked after the lock is released.
 */
class TransferQueue {
public:
    /**
     * @param eventBus Bus to publish lifecycle events on (may be null)
     */
    explicit TransferQueue(std::shared_ptr<EventBus> eventBus);
    ~TransferQueue();

    TransferQueue(const TransferQueue&) = delete;
    TransferQueue& operator=(const TransferQueue&) = delete;

    /**
     * Register the executor used by retry(). Pass nullptr to clear.
     * The executor must outlive its registration.
     */
    void setRetryExecutor(RetryExecutor* executor);

    // ========== Tracking ==========

    /**
     * Create a Queued task and publish transfer_queued
     * @return Snapshot of the new task
     */
    TransferTask trackTransfer(const std::string& name, int64_t size, TaskType type,
                               const std::string& source, const std::string& dest);

    TransferTask trackTransferWithLabel(const std::string& name, int64_t size, TaskType type,
                                        const std::string& source, const std::string& dest,
                                        const std::string& sourceLabel);

    TransferTask trackTransferWithBatch(const std::string& name, int64_t size, TaskType type,
                                        const std::string& source, const std::string& dest,
                                        const std::string& sourceLabel,
                                        const std::string& batchId,
                                        const std::string& batchLabel);

    // ========== Transitions ==========
    //
    // Workers pass the handle they registered with setCancel as `attempt`.
    // A call whose attempt is no longer the task's registered handle comes
    // from a run that was cancelled or superseded by retry() and is ignored.
    // nullptr skips the check.

    /**
     * Queued -> Initializing, once a worker holds an admission slot
     * @return false if the task is unknown, already left Queued, or the attempt is stale
     */
    bool activate(const std::string& taskId, const CancellationSource* attempt = nullptr);

    /**
     * Initializing -> Active. Idempotent; only the first call stamps startedAt.
     */
    void startTransfer(const std::string& taskId, const CancellationSource* attempt = nullptr);

    /**
     * Record progress (clamped to [0, 1]) and update the smoothed speed.
     * Ignored unless the task is Active.
     */
    void updateProgress(const std::string& taskId, double progress,
                        const CancellationSource* attempt = nullptr);

    /**
     * Correct the byte size once the real size is known
     */
    void updateSize(const std::string& taskId, int64_t size, const CancellationSource* attempt = nullptr);

    /**
     * Initializing | Active -> Completed; progress becomes 1.0
     */
    void complete(const std::string& taskId, const CancellationSource* attempt = nullptr);

    /**
     * Queued | Initializing | Active -> Failed.
     * Never overwrites a terminal state, so a cancel always beats a late failure.
     */
    void fail(const std::string& taskId, const std::string& error,
              const CancellationSource* attempt = nullptr);

    /**
     * Mark a task Cancelled and fire its cancellation handle
     * @throws TransferError if the task is unknown, already terminal, or the attempt is stale
     */
    void cancel(const std::string& taskId, const CancellationSource* attempt = nullptr);

    /**
     * Cancel every non-terminal task, best-effort
     */
    void cancelAll();

    /**
     * Register the handle that stops this task's in-flight work
     */
    void setCancel(const std::string& taskId, std::shared_ptr<CancellationSource> handle);

    /**
     * Failed | Cancelled -> Queued and hand the task to the RetryExecutor
     * @return The task ID (unchanged)
     * @throws TransferError if the task is unknown, not retryable, or no executor is set
     */
    std::string retry(const std::string& taskId);

    // ========== Queries ==========

    QueueStats getStats() const;

    /**
     * @return Copies of all tasks in creation order
     */
    std::vector<TransferTask> getTasks() const;

    std::optional<TransferTask> getTask(const std::string& taskId) const;

    /**
     * Drop every terminal task from the registry
     */
    void clearCompleted();

    // ========== Batches ==========

    /**
     * @return One entry per distinct batch ID, in first-seen order
     */
    std::vector<BatchStats> getAllBatchStats() const;

    /**
     * @return Page [offset, offset + limit) of a batch's tasks
     */
    std::vector<TransferTask> getBatchTasks(const std::string& batchId,
                                            size_t offset, size_t limit) const;

    /**
     * @return Tasks that belong to no batch
     */
    std::vector<TransferTask> getUngroupedTasks() const;

    /**
     * Cancel every non-terminal member of a batch, Queued ones included
     */
    void cancelBatch(const std::string& batchId);

    /**
     * Retry every Failed member of a batch; individual failures are skipped
     */
    void retryFailedInBatch(const std::string& batchId);

private:
    struct Entry {
        TransferTask task;
        std::shared_ptr<CancellationSource> cancelHandle;
        SteadyClock::time_point lastUpdate{};
    };
    using EntryPtr = std::shared_ptr<Entry>;

    static bool isCurrentAttempt(const Entry& entry, const CancellationSource* attempt);
    void publishTransferEvent(EventType type, const TransferTask& task);
    void publishBatchProgress(const std::vector<BatchStats>& stats);
    bool hasUnfinishedBatch() const;

    void ensureBatchTicker();
    void batchTickerLoop();
    void stopBatchTicker();

private:
    std::shared_ptr<EventBus> m_eventBus;

    mutable std::shared_mutex m_mutex;
    std::vector<EntryPtr> m_tasks;                          // Creation order
    std::unordered_map<std::string, EntryPtr> m_tasksById;
    RetryExecutor* m_retryExecutor{nullptr};

    // Batch progress ticker
    std::mutex m_tickerMutex;
    std::condition_variable m_tickerCondition;
    std::thread m_ticker;
    bool m_tickerRunning{false};
    bool m_tickerStop{false};
};

} // namespace interlink::core::transfer
