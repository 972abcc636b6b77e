/**
 * TransferQueue.cpp
 *
 * Implementation of the transfer task registry.
 */

#include "TransferQueue.hpp"
#include "../Errors.hpp"
#include "../Logger.hpp"

#include <algorithm>
#include <unordered_set>

namespace interlink::core::transfer {

namespace {

constexpr auto BatchTickInterval = std::chrono::seconds(1);

// Speed smoothing
constexpr double MinSampleSeconds = 0.3;
constexpr double MinProgressDelta = 0.001;
constexpr double MinPlausibleRate = 1024.0;                       // 1 KiB/s
constexpr double MaxPlausibleRate = 1024.0 * 1024.0 * 1024.0;     // 1 GiB/s
constexpr double SpeedAlpha = 0.1;

} // namespace

TransferQueue::TransferQueue(std::shared_ptr<EventBus> eventBus)
    : m_eventBus(std::move(eventBus)) {
}

TransferQueue::~TransferQueue() {
    stopBatchTicker();
}

void TransferQueue::setRetryExecutor(RetryExecutor* executor) {
    std::unique_lock lock(m_mutex);
    m_retryExecutor = executor;
}

// ========== Tracking ==========

TransferTask TransferQueue::trackTransfer(const std::string& name, int64_t size, TaskType type,
                                          const std::string& source, const std::string& dest) {
    return trackTransferWithBatch(name, size, type, source, dest, "", "", "");
}

TransferTask TransferQueue::trackTransferWithLabel(const std::string& name, int64_t size, TaskType type,
                                                   const std::string& source, const std::string& dest,
                                                   const std::string& sourceLabel) {
    return trackTransferWithBatch(name, size, type, source, dest, sourceLabel, "", "");
}

TransferTask TransferQueue::trackTransferWithBatch(const std::string& name, int64_t size, TaskType type,
                                                   const std::string& source, const std::string& dest,
                                                   const std::string& sourceLabel,
                                                   const std::string& batchId,
                                                   const std::string& batchLabel) {
    auto entry = std::make_shared<Entry>();
    entry->task.id = generateTaskId();
    entry->task.type = type;
    entry->task.name = name;
    entry->task.source = source;
    entry->task.dest = dest;
    entry->task.size = size;
    entry->task.sourceLabel = sourceLabel;
    entry->task.batchId = batchId;
    entry->task.batchLabel = batchLabel;
    entry->task.state = TaskState::Queued;
    entry->task.createdAt = std::chrono::system_clock::now();

    TransferTask snapshot = entry->task;
    {
        std::unique_lock lock(m_mutex);
        m_tasks.push_back(entry);
        m_tasksById.emplace(snapshot.id, std::move(entry));
    }

    publishTransferEvent(EventType::TransferQueued, snapshot);

    if (!batchId.empty()) {
        ensureBatchTicker();
    }
    return snapshot;
}

// ========== Transitions ==========

bool TransferQueue::isCurrentAttempt(const Entry& entry, const CancellationSource* attempt) {
    return attempt == nullptr || entry.cancelHandle.get() == attempt;
}

bool TransferQueue::activate(const std::string& taskId, const CancellationSource* attempt) {
    TransferTask snapshot;
    {
        std::unique_lock lock(m_mutex);
        auto it = m_tasksById.find(taskId);
        if (it == m_tasksById.end() || it->second->task.state != TaskState::Queued ||
            !isCurrentAttempt(*it->second, attempt)) {
            return false;
        }
        it->second->task.state = TaskState::Initializing;
        it->second->lastUpdate = SteadyClock::now();
        snapshot = it->second->task;
    }

    publishTransferEvent(EventType::TransferInitializing, snapshot);
    return true;
}

void TransferQueue::startTransfer(const std::string& taskId, const CancellationSource* attempt) {
    TransferTask snapshot;
    {
        std::unique_lock lock(m_mutex);
        auto it = m_tasksById.find(taskId);
        if (it == m_tasksById.end() || it->second->task.state != TaskState::Initializing ||
            !isCurrentAttempt(*it->second, attempt)) {
            return;
        }
        auto& entry = *it->second;
        entry.task.state = TaskState::Active;
        entry.task.startedAt = std::chrono::system_clock::now();
        entry.lastUpdate = SteadyClock::now();
        snapshot = entry.task;
    }

    publishTransferEvent(EventType::TransferStarted, snapshot);
}

void TransferQueue::updateProgress(const std::string& taskId, double progress,
                                   const CancellationSource* attempt) {
    progress = std::clamp(progress, 0.0, 1.0);

    TransferTask snapshot;
    {
        std::unique_lock lock(m_mutex);
        auto it = m_tasksById.find(taskId);
        if (it == m_tasksById.end() || it->second->task.state != TaskState::Active ||
            !isCurrentAttempt(*it->second, attempt)) {
            return;
        }
        auto& entry = *it->second;
        auto now = SteadyClock::now();
        double elapsed = std::chrono::duration<double>(now - entry.lastUpdate).count();
        double delta = progress - entry.task.progress;

        if (elapsed >= MinSampleSeconds && delta > MinProgressDelta) {
            double rate = delta * static_cast<double>(entry.task.size) / elapsed;
            if (rate < MinPlausibleRate) {
                rate = 0.0;
            } else if (rate > MaxPlausibleRate) {
                rate = entry.task.speed;
            }

            if (rate > 0.0) {
                entry.task.speed = entry.task.speed == 0.0
                    ? rate
                    : SpeedAlpha * rate + (1.0 - SpeedAlpha) * entry.task.speed;
            }
        }

        entry.task.progress = progress;
        entry.lastUpdate = now;
        snapshot = entry.task;
    }

    publishTransferEvent(EventType::TransferProgress, snapshot);
}

void TransferQueue::updateSize(const std::string& taskId, int64_t size, const CancellationSource* attempt) {
    std::unique_lock lock(m_mutex);
    auto it = m_tasksById.find(taskId);
    if (it != m_tasksById.end() && isCurrentAttempt(*it->second, attempt)) {
        it->second->task.size = size;
    }
}

void TransferQueue::complete(const std::string& taskId, const CancellationSource* attempt) {
    TransferTask snapshot;
    {
        std::unique_lock lock(m_mutex);
        auto it = m_tasksById.find(taskId);
        if (it == m_tasksById.end()) {
            return;
        }
        auto& entry = *it->second;
        if (!isCurrentAttempt(entry, attempt)) {
            LOG_DEBUG("Ignoring complete for task {} from a superseded attempt", taskId);
            return;
        }
        if (entry.task.state != TaskState::Initializing && entry.task.state != TaskState::Active) {
            LOG_DEBUG("Ignoring complete for task {} in state {}", taskId, toString(entry.task.state));
            return;
        }
        auto now = std::chrono::system_clock::now();
        if (!entry.task.startedAt) {
            entry.task.startedAt = now;
        }
        entry.task.state = TaskState::Completed;
        entry.task.progress = 1.0;
        entry.task.completedAt = now;
        entry.cancelHandle.reset();
        snapshot = entry.task;
    }

    publishTransferEvent(EventType::TransferCompleted, snapshot);
}

void TransferQueue::fail(const std::string& taskId, const std::string& error,
                         const CancellationSource* attempt) {
    TransferTask snapshot;
    {
        std::unique_lock lock(m_mutex);
        auto it = m_tasksById.find(taskId);
        if (it == m_tasksById.end()) {
            return;
        }
        auto& entry = *it->second;
        if (!isCurrentAttempt(entry, attempt)) {
            LOG_DEBUG("Ignoring failure for task {} from a superseded attempt: {}", taskId, error);
            return;
        }
        if (entry.task.isTerminal()) {
            LOG_DEBUG("Ignoring failure for task {} in state {}: {}",
                      taskId, toString(entry.task.state), error);
            return;
        }
        entry.task.state = TaskState::Failed;
        entry.task.error = error;
        entry.task.completedAt = std::chrono::system_clock::now();
        entry.cancelHandle.reset();
        snapshot = entry.task;
    }

    publishTransferEvent(EventType::TransferFailed, snapshot);
}

void TransferQueue::cancel(const std::string& taskId, const CancellationSource* attempt) {
    TransferTask snapshot;
    std::shared_ptr<CancellationSource> handle;
    {
        std::unique_lock lock(m_mutex);
        auto it = m_tasksById.find(taskId);
        if (it == m_tasksById.end()) {
            throw TransferError("task not found: " + taskId);
        }
        auto& entry = *it->second;
        if (entry.task.isTerminal()) {
            throw TransferError("task already " + std::string(toString(entry.task.state)) + ": " + taskId);
        }
        if (!isCurrentAttempt(entry, attempt)) {
            throw TransferError("attempt superseded: " + taskId);
        }
        // State first: a failure reported by the interrupted worker must find it terminal
        entry.task.state = TaskState::Cancelled;
        entry.task.completedAt = std::chrono::system_clock::now();
        handle = std::move(entry.cancelHandle);
        snapshot = entry.task;
    }

    if (handle) {
        handle->cancel();
    }

    publishTransferEvent(EventType::TransferCancelled, snapshot);
}

void TransferQueue::cancelAll() {
    std::vector<std::string> ids;
    {
        std::shared_lock lock(m_mutex);
        for (const auto& entry : m_tasks) {
            if (!entry->task.isTerminal()) {
                ids.push_back(entry->task.id);
            }
        }
    }

    for (const auto& id : ids) {
        try {
            cancel(id);
        } catch (const TransferError& e) {
            // Finished between the scan and the cancel
            LOG_DEBUG("cancelAll skipped {}: {}", id, e.what());
        }
    }
}

void TransferQueue::setCancel(const std::string& taskId, std::shared_ptr<CancellationSource> handle) {
    {
        std::unique_lock lock(m_mutex);
        auto it = m_tasksById.find(taskId);
        if (it != m_tasksById.end() && !it->second->task.isTerminal()) {
            it->second->cancelHandle = std::move(handle);
            return;
        }
    }

    // Already cancelled (or gone): stop the new work right away
    if (handle) {
        handle->cancel();
    }
}

std::string TransferQueue::retry(const std::string& taskId) {
    TransferTask snapshot;
    RetryExecutor* executor = nullptr;
    {
        std::unique_lock lock(m_mutex);
        auto it = m_tasksById.find(taskId);
        if (it == m_tasksById.end()) {
            throw TransferError("task not found: " + taskId);
        }
        auto& entry = *it->second;
        if (!entry.task.canRetry()) {
            throw TransferError("task cannot be retried while " +
                                std::string(toString(entry.task.state)) + ": " + taskId);
        }
        if (!m_retryExecutor) {
            throw TransferError("no retry executor registered");
        }
        executor = m_retryExecutor;

        entry.task.state = TaskState::Queued;
        entry.task.progress = 0.0;
        entry.task.speed = 0.0;
        entry.task.error.reset();
        entry.task.startedAt.reset();
        entry.task.completedAt.reset();
        entry.cancelHandle.reset();
        entry.lastUpdate = SteadyClock::time_point{};
        snapshot = entry.task;
    }

    LOG_INFO("Retrying {} {} ({})", toString(snapshot.type), snapshot.name, snapshot.id);
    publishTransferEvent(EventType::TransferQueued, snapshot);

    if (!snapshot.batchId.empty()) {
        ensureBatchTicker();
    }

    executor->executeRetry(snapshot);
    return snapshot.id;
}

// ========== Queries ==========

QueueStats TransferQueue::getStats() const {
    QueueStats stats;
    std::shared_lock lock(m_mutex);
    for (const auto& entry : m_tasks) {
        switch (entry->task.state) {
            case TaskState::Queued:       ++stats.queued; break;
            case TaskState::Initializing: ++stats.initializing; break;
            case TaskState::Active:       ++stats.active; break;
            case TaskState::Paused:       ++stats.paused; break;
            case TaskState::Completed:    ++stats.completed; break;
            case TaskState::Failed:       ++stats.failed; break;
            case TaskState::Cancelled:    ++stats.cancelled; break;
        }
    }
    return stats;
}

std::vector<TransferTask> TransferQueue::getTasks() const {
    std::shared_lock lock(m_mutex);
    std::vector<TransferTask> result;
    result.reserve(m_tasks.size());
    for (const auto& entry : m_tasks) {
        result.push_back(entry->task);
    }
    return result;
}

std::optional<TransferTask> TransferQueue::getTask(const std::string& taskId) const {
    std::shared_lock lock(m_mutex);
    auto it = m_tasksById.find(taskId);
    if (it == m_tasksById.end()) {
        return std::nullopt;
    }
    return it->second->task;
}

void TransferQueue::clearCompleted() {
    std::unique_lock lock(m_mutex);
    auto removed = std::remove_if(m_tasks.begin(), m_tasks.end(), [this](const EntryPtr& entry) {
        if (entry->task.isTerminal()) {
            m_tasksById.erase(entry->task.id);
            return true;
        }
        return false;
    });
    m_tasks.erase(removed, m_tasks.end());
}

// ========== Batches ==========

std::vector<BatchStats> TransferQueue::getAllBatchStats() const {
    std::vector<BatchStats> result;
    std::unordered_map<std::string, size_t> index;
    std::vector<double> transferred;

    std::shared_lock lock(m_mutex);
    for (const auto& entry : m_tasks) {
        const auto& task = entry->task;
        if (task.batchId.empty()) {
            continue;
        }

        auto [it, inserted] = index.emplace(task.batchId, result.size());
        if (inserted) {
            BatchStats stats;
            stats.batchId = task.batchId;
            stats.batchLabel = task.batchLabel;
            stats.direction = toString(task.type);
            stats.sourceLabel = task.sourceLabel;
            result.push_back(std::move(stats));
            transferred.push_back(0.0);
        }

        auto& stats = result[it->second];
        ++stats.total;
        stats.totalBytes += task.size;
        transferred[it->second] += task.progress * static_cast<double>(task.size);

        switch (task.state) {
            case TaskState::Queued:
            case TaskState::Initializing:
                ++stats.queued;
                break;
            case TaskState::Active:
                ++stats.active;
                stats.speed += task.speed;
                break;
            case TaskState::Completed:
                ++stats.completed;
                break;
            case TaskState::Failed:
                ++stats.failed;
                break;
            case TaskState::Cancelled:
                ++stats.cancelled;
                break;
            case TaskState::Paused:
                break;
        }
    }

    for (size_t i = 0; i < result.size(); ++i) {
        auto& stats = result[i];
        if (stats.totalBytes > 0) {
            stats.progress = transferred[i] / static_cast<double>(stats.totalBytes);
        } else if (stats.total > 0) {
            // No size information: count finished files
            stats.progress = static_cast<double>(stats.completed) / stats.total;
        }
    }
    return result;
}

std::vector<TransferTask> TransferQueue::getBatchTasks(const std::string& batchId,
                                                       size_t offset, size_t limit) const {
    std::vector<TransferTask> result;
    size_t seen = 0;

    std::shared_lock lock(m_mutex);
    for (const auto& entry : m_tasks) {
        if (entry->task.batchId != batchId) {
            continue;
        }
        if (seen++ < offset) {
            continue;
        }
        if (result.size() >= limit) {
            break;
        }
        result.push_back(entry->task);
    }
    return result;
}

std::vector<TransferTask> TransferQueue::getUngroupedTasks() const {
    std::vector<TransferTask> result;
    std::shared_lock lock(m_mutex);
    for (const auto& entry : m_tasks) {
        if (entry->task.batchId.empty()) {
            result.push_back(entry->task);
        }
    }
    return result;
}

void TransferQueue::cancelBatch(const std::string& batchId) {
    std::vector<std::string> ids;
    {
        std::shared_lock lock(m_mutex);
        for (const auto& entry : m_tasks) {
            if (entry->task.batchId == batchId && !entry->task.isTerminal()) {
                ids.push_back(entry->task.id);
            }
        }
    }

    LOG_INFO("Cancelling batch {} ({} tasks)", batchId, ids.size());
    for (const auto& id : ids) {
        try {
            cancel(id);
        } catch (const TransferError& e) {
            LOG_DEBUG("cancelBatch skipped {}: {}", id, e.what());
        }
    }
}

void TransferQueue::retryFailedInBatch(const std::string& batchId) {
    std::vector<std::string> ids;
    {
        std::shared_lock lock(m_mutex);
        for (const auto& entry : m_tasks) {
            if (entry->task.batchId == batchId && entry->task.state == TaskState::Failed) {
                ids.push_back(entry->task.id);
            }
        }
    }

    for (const auto& id : ids) {
        try {
            retry(id);
        } catch (const TransferError& e) {
            LOG_WARN("Retry of {} in batch {} skipped: {}", id, batchId, e.what());
        }
    }
}

// ========== Events ==========

void TransferQueue::publishTransferEvent(EventType type, const TransferTask& task) {
    if (!m_eventBus) {
        return;
    }

    // Batched tasks report progress through the batch ticker
    if (type == EventType::TransferProgress && !task.batchId.empty()) {
        return;
    }

    auto event = std::make_shared<TransferEvent>(type);
    event->taskId = task.id;
    event->taskType = toString(task.type);
    event->name = task.name;
    event->size = task.size;
    event->progress = task.progress;
    event->speed = task.speed;
    event->error = task.error;
    m_eventBus->publish(std::move(event));
}

void TransferQueue::publishBatchProgress(const std::vector<BatchStats>& stats) {
    if (!m_eventBus) {
        return;
    }

    for (const auto& batch : stats) {
        auto event = std::make_shared<BatchProgressEvent>();
        event->batchId = batch.batchId;
        event->label = batch.batchLabel;
        event->direction = batch.direction;
        event->total = batch.total;
        event->completed = batch.completed;
        event->failed = batch.failed;
        event->progress = batch.progress;
        event->speed = batch.speed;
        m_eventBus->publish(std::move(event));
    }
}

bool TransferQueue::hasUnfinishedBatch() const {
    std::shared_lock lock(m_mutex);
    return std::any_of(m_tasks.begin(), m_tasks.end(), [](const EntryPtr& entry) {
        return !entry->task.batchId.empty() && !entry->task.isTerminal();
    });
}

// ========== Batch ticker ==========

void TransferQueue::ensureBatchTicker() {
    std::lock_guard<std::mutex> lock(m_tickerMutex);
    if (m_tickerRunning || m_tickerStop) {
        return;
    }
    // A previous ticker has already left its loop
    if (m_ticker.joinable()) {
        m_ticker.join();
    }
    m_tickerRunning = true;
    m_ticker = std::thread([this] { batchTickerLoop(); });
}

void TransferQueue::batchTickerLoop() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(m_tickerMutex);
            if (m_tickerCondition.wait_for(lock, BatchTickInterval, [this] { return m_tickerStop; })) {
                m_tickerRunning = false;
                return;
            }
        }

        auto stats = getAllBatchStats();
        publishBatchProgress(stats);

        bool finished = std::all_of(stats.begin(), stats.end(),
                                    [](const BatchStats& batch) { return batch.isFinished(); });
        if (!finished) {
            continue;
        }

        // Re-check under the ticker lock so a batch tracked meanwhile keeps a ticker
        std::lock_guard<std::mutex> lock(m_tickerMutex);
        if (!hasUnfinishedBatch()) {
            m_tickerRunning = false;
            return;
        }
    }
}

void TransferQueue::stopBatchTicker() {
    {
        std::lock_guard<std::mutex> lock(m_tickerMutex);
        m_tickerStop = true;
    }
    m_tickerCondition.notify_all();
    if (m_ticker.joinable()) {
        m_ticker.join();
    }
}

} // namespace interlink::core::transfer
