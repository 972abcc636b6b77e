#pragma once

/**
 * TransferService.hpp
 *
 * Admission control and dispatch for uploads and downloads.
 * Requests become queue tasks immediately; workers hosted by a thread pool
 * wait on one admission gate shared by both directions, then call the
 * storage provider while reporting through the TransferQueue.
 */

#include "TransferTypes.hpp"
#include "../core/Cancellation.hpp"
#include "../core/EventBus.hpp"
#include "../core/ThreadPool.hpp"
#include "../core/resources/TransferManager.hpp"
#include "../core/storage/CloudTransfer.hpp"
#include "../core/transfer/AdmissionGate.hpp"
#include "../core/transfer/TransferQueue.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace interlink::services {

/**
 * TransferService - transfer orchestration front end
 *
 * Features:
 * - Global concurrency ceiling across uploads and downloads
 * - Per-task cancellation linked to the caller's token
 * - Retry under the same task ID
 * - Panic containment at the worker boundary
 * - Tags applied after upload
 */
class TransferService : public core::transfer::RetryExecutor {
public:
    /**
     * Constructor
     * @param eventBus Bus the queue publishes on (may be null)
     * @param config Service settings
     * @param client Storage provider (may be set later)
     */
    TransferService(std::shared_ptr<core::EventBus> eventBus,
                    const TransferServiceConfig& config,
                    std::shared_ptr<core::storage::CloudTransfer> client = nullptr);

    /**
     * Destructor - cancels outstanding transfers and joins the workers
     */
    ~TransferService() override;

    TransferService(const TransferService&) = delete;
    TransferService& operator=(const TransferService&) = delete;

    /**
     * Swap the storage provider and announce the identity change
     * @param source One of core::config_source::*
     */
    void setCloudTransfer(std::shared_ptr<core::storage::CloudTransfer> client,
                          const std::string& source = core::config_source::ConfigUpdate);

    std::shared_ptr<core::storage::CloudTransfer> cloudTransfer() const;

    /**
     * Track every request as a Queued task and dispatch one worker per request.
     * Returns without waiting for the transfers.
     * @param token Caller token; cancelling it cancels every task of this call
     * @throws TransferError if no storage provider is configured
     */
    void startTransfers(const core::CancellationToken& token,
                        const std::vector<TransferRequest>& requests);

    /**
     * Upload on the calling thread, visible in the queue and bound by the
     * same admission gate
     * @param extraProgress Additional progress observer (may be null)
     * @return Uploaded file
     * @throws TransferError (or a cancellation error) on failure
     */
    core::storage::CloudFile uploadFileSync(const core::CancellationToken& token,
                                            const TransferRequest& request,
                                            core::storage::ProgressCallback extraProgress = nullptr);

    // ========== Queue delegations ==========

    /**
     * @throws TransferError if the task is unknown or already terminal
     */
    void cancelTransfer(const std::string& taskId);

    void cancelAll();

    /**
     * @return The task ID (unchanged by retry)
     * @throws TransferError if the task is unknown or not retryable
     */
    std::string retryTransfer(const std::string& taskId);

    TransferStats getStats() const;
    std::vector<core::transfer::TransferTask> getTasks() const;
    std::optional<core::transfer::TransferTask> getTask(const std::string& taskId) const;
    void clearCompleted();

    std::vector<core::transfer::BatchStats> getAllBatchStats() const;
    std::vector<core::transfer::TransferTask> getBatchTasks(const std::string& batchId,
                                                            size_t offset, size_t limit) const;
    std::vector<core::transfer::TransferTask> getUngroupedTasks() const;
    void cancelBatch(const std::string& batchId);
    void retryFailedInBatch(const std::string& batchId);

    /**
     * Block until every dispatched worker (retries included) has finished
     */
    void waitForAll();

    core::transfer::TransferQueue& queue() { return *m_queue; }

    size_t maxConcurrent() const { return m_gate.capacity(); }

    size_t activeSlots() const { return m_gate.inUse(); }

    core::resources::TransferManager& transferManager() { return m_transferManager; }

    /**
     * Re-dispatch a task reset by the queue. Never blocks.
     */
    void executeRetry(const core::transfer::TransferTask& task) override;

private:
    struct DispatchGroup;

    struct Job {
        std::string taskId;
        TransferRequest request;
        std::shared_ptr<core::CancellationSource> cancel;
        std::shared_ptr<DispatchGroup> group;
    };

    class SlotLease;

    Job trackJob(const TransferRequest& request, const core::CancellationToken& parent);
    void dispatch(Job job);

    void runJob(const Job& job);
    void runTransfer(const Job& job);
    void finishJob(const Job& job);

    std::optional<SlotLease> admit(const Job& job, const core::CancellationToken& token);

    core::storage::CloudFile performUpload(const Job& job,
                                           const core::CancellationToken& token,
                                           core::storage::CloudTransfer& client,
                                           const core::storage::ProgressCallback& extraProgress);
    void performDownload(const Job& job,
                         const core::CancellationToken& token,
                         core::storage::CloudTransfer& client);

    void applyTags(const core::CancellationToken& token, core::storage::CloudTransfer& client,
                   const std::string& fileId, const std::vector<std::string>& tags,
                   const std::string& name);

    /**
     * Record how a worker stopped: cancellation leaves the task Cancelled,
     * anything else fails it. Every queue call is scoped to the job's attempt.
     */
    void settleFailure(const Job& job, const core::CancellationToken& token, const std::exception& error);
    void settleStopped(const Job& job, const core::CancellationToken& token);
    void settleCancelled(const Job& job);

    void warmCredentialsInBackground();

    TransferRequest normalizeRequest(const TransferRequest& request) const;

private:
    std::shared_ptr<core::EventBus> m_eventBus;
    TransferServiceConfig m_config;

    std::shared_ptr<core::transfer::TransferQueue> m_queue;
    core::transfer::AdmissionGate m_gate;
    core::resources::TransferManager m_transferManager;

    mutable std::mutex m_mutex;
    std::shared_ptr<core::storage::CloudTransfer> m_client;
    std::unordered_map<std::string, std::vector<std::string>> m_taskTags;

    std::atomic<bool> m_credentialsWarm{false};

    // Last member: destroyed (joined) first
    std::unique_ptr<core::ThreadPool> m_threadPool;
};

} // namespace interlink::services
