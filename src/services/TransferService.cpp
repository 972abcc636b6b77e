/**
 * TransferService.cpp
 *
 * Implementation of transfer admission and dispatch.
 */

#include "TransferService.hpp"
#include "../core/Errors.hpp"
#include "../core/Logger.hpp"
#include "../utils/StringUtils.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <utility>

namespace interlink::services {

namespace fs = std::filesystem;

using core::CancellationSource;
using core::CancellationToken;
using core::CancelReason;
using core::Logger;
using core::TransferError;
using core::storage::CloudFile;
using core::storage::CloudTransfer;
using core::storage::ProgressCallback;
using core::transfer::TaskState;
using core::transfer::TransferTask;

namespace {

std::string directionName(TransferType type) {
    return utils::StringUtils::toUpper(core::transfer::toString(type));
}

} // namespace

/**
 * Workers started by one startTransfers call for one direction
 */
struct TransferService::DispatchGroup {
    TransferType type{TransferType::Upload};
    int total{0};
    std::atomic<int> remaining{0};
    std::atomic<int> succeeded{0};
    std::atomic<int> failed{0};
    core::SteadyClock::time_point startedAt{core::SteadyClock::now()};
};

/**
 * Admission slot held by a worker; logs acquisition and release
 */
class TransferService::SlotLease {
public:
    SlotLease(core::transfer::AdmissionGate::Slot slot, const core::transfer::AdmissionGate& gate,
              std::string direction, std::string name)
        : m_slot(std::move(slot)), m_gate(&gate)
        , m_direction(std::move(direction)), m_name(std::move(name)) {
        Logger::instance().debug("[SLOT] {} {}: ACQUIRED (active={}/{})",
                                 m_direction, m_name, m_gate->inUse(), m_gate->capacity());
    }

    SlotLease(SlotLease&& other) noexcept
        : m_slot(std::move(other.m_slot)), m_gate(std::exchange(other.m_gate, nullptr))
        , m_direction(std::move(other.m_direction)), m_name(std::move(other.m_name)) {
    }

    SlotLease(const SlotLease&) = delete;
    SlotLease& operator=(const SlotLease&) = delete;
    SlotLease& operator=(SlotLease&&) = delete;

    ~SlotLease() {
        m_slot.release();
        if (m_gate) {
            Logger::instance().debug("[SLOT] {} {}: RELEASED (active={}/{})",
                                     m_direction, m_name, m_gate->inUse(), m_gate->capacity());
        }
    }

private:
    core::transfer::AdmissionGate::Slot m_slot;
    const core::transfer::AdmissionGate* m_gate;
    std::string m_direction;
    std::string m_name;
};

TransferService::TransferService(std::shared_ptr<core::EventBus> eventBus,
                                 const TransferServiceConfig& config,
                                 std::shared_ptr<CloudTransfer> client)
    : m_eventBus(std::move(eventBus))
    , m_config(config)
    , m_queue(std::make_shared<core::transfer::TransferQueue>(m_eventBus))
    , m_gate(config.maxConcurrent > 0 ? config.maxConcurrent : TransferServiceConfig::DefaultMaxConcurrent)
    , m_transferManager(std::make_shared<core::resources::ResourceManager>(config.resources))
    , m_client(std::move(client)) {

    if (m_config.defaultSourceLabel.empty()) {
        m_config.defaultSourceLabel = source_label::FileBrowser;
    }

    size_t workers = m_config.workerThreads > 0 ? m_config.workerThreads : m_gate.capacity() * 2;
    m_threadPool = std::make_unique<core::ThreadPool>(workers);

    m_queue->setRetryExecutor(this);

    Logger::instance().info("TransferService initialized (max concurrent: {}, workers: {})",
                            m_gate.capacity(), workers);
}

TransferService::~TransferService() {
    Logger::instance().info("Shutting down TransferService");

    m_queue->setRetryExecutor(nullptr);
    m_queue->cancelAll();

    m_threadPool.reset();
}

void TransferService::setCloudTransfer(std::shared_ptr<CloudTransfer> client, const std::string& source) {
    std::string email;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_client = std::move(client);
        if (m_client) {
            email = m_client->accountEmail();
        }
    }
    m_credentialsWarm = false;

    Logger::instance().info("Storage client changed (source: {})", source);
    if (m_eventBus) {
        m_eventBus->publishConfigChanged(source, email);
    }
}

std::shared_ptr<CloudTransfer> TransferService::cloudTransfer() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_client;
}

// ========== Dispatch ==========

void TransferService::startTransfers(const CancellationToken& token,
                                     const std::vector<TransferRequest>& requests) {
    if (requests.empty()) {
        return;
    }

    if (!cloudTransfer()) {
        throw TransferError("storage client not configured");
    }

    warmCredentialsInBackground();

    std::vector<TransferRequest> uploads;
    std::vector<TransferRequest> downloads;
    for (const auto& request : requests) {
        if (request.type == TransferType::Upload) {
            uploads.push_back(request);
        } else {
            downloads.push_back(request);
        }
    }

    for (auto* batch : {&uploads, &downloads}) {
        if (batch->empty()) {
            continue;
        }

        auto group = std::make_shared<DispatchGroup>();
        group->type = batch->front().type;
        group->total = static_cast<int>(batch->size());
        group->remaining = group->total;

        Logger::instance().info("[BATCH] Starting {} batch: {} files (active={}/{})",
                                directionName(group->type), group->total,
                                m_gate.inUse(), m_gate.capacity());

        // Track everything first so every request is visible before any worker runs
        std::vector<Job> jobs;
        jobs.reserve(batch->size());
        for (const auto& request : *batch) {
            auto job = trackJob(request, token);
            job.group = group;
            jobs.push_back(std::move(job));
        }

        for (auto& job : jobs) {
            dispatch(std::move(job));
        }
    }
}

TransferService::Job TransferService::trackJob(const TransferRequest& request, const CancellationToken& parent) {
    Job job;
    job.request = normalizeRequest(request);
    const auto& r = job.request;

    TransferTask task = r.batchId.empty()
        ? m_queue->trackTransferWithLabel(r.name, r.size, r.type, r.source, r.dest, r.sourceLabel)
        : m_queue->trackTransferWithBatch(r.name, r.size, r.type, r.source, r.dest,
                                          r.sourceLabel, r.batchId, r.batchLabel);
    job.taskId = task.id;

    if (!r.tags.empty()) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_taskTags[job.taskId] = r.tags;
    }

    job.cancel = std::make_shared<CancellationSource>(parent);
    m_queue->setCancel(job.taskId, job.cancel);
    return job;
}

void TransferService::dispatch(Job job) {
    Job rejected;
    rejected.taskId = job.taskId;
    rejected.cancel = job.cancel;
    rejected.group = job.group;
    try {
        m_threadPool->submit([this, job = std::move(job)]() {
            runJob(job);
        });
    } catch (const std::runtime_error& e) {
        Logger::instance().error("Cannot dispatch {}: {}", rejected.taskId, e.what());
        m_queue->fail(rejected.taskId, e.what(), rejected.cancel.get());
        finishJob(rejected);
    }
}

void TransferService::runJob(const Job& job) {
    try {
        runTransfer(job);
    } catch (const std::exception& e) {
        Logger::instance().error("PANIC in {} for {}: {}",
                                 core::transfer::toString(job.request.type), job.request.name, e.what());
        m_queue->fail(job.taskId, std::string("panic: ") + e.what(), job.cancel.get());
    } catch (...) {
        Logger::instance().error("PANIC in {} for {}: unknown exception",
                                 core::transfer::toString(job.request.type), job.request.name);
        m_queue->fail(job.taskId, "panic: unknown exception", job.cancel.get());
    }

    finishJob(job);
}

void TransferService::runTransfer(const Job& job) {
    const auto token = job.cancel->token();
    const auto* attempt = job.cancel.get();

    auto lease = admit(job, token);
    if (!lease) {
        return;
    }

    // False when the task was cancelled or retried while waiting for the slot
    if (!m_queue->activate(job.taskId, attempt)) {
        return;
    }

    if (token.isCancelled()) {
        settleStopped(job, token);
        return;
    }

    auto client = cloudTransfer();
    if (!client) {
        m_queue->fail(job.taskId, "storage client not configured", attempt);
        return;
    }

    try {
        if (job.request.type == TransferType::Upload) {
            CloudFile file = performUpload(job, token, *client, nullptr);
            Logger::instance().info("File uploaded: {} -> {}", job.request.source, file.id);
        } else {
            performDownload(job, token, *client);
            Logger::instance().info("File downloaded: {} -> {}", job.request.source, job.request.dest);
        }
        m_queue->complete(job.taskId, attempt);
    } catch (const core::OperationCancelledError& e) {
        settleFailure(job, token, e);
    } catch (const core::DeadlineExceededError& e) {
        settleFailure(job, token, e);
    } catch (const TransferError& e) {
        Logger::instance().error("{} failed for {}: {}",
                                 directionName(job.request.type), job.request.name, e.what());
        settleFailure(job, token, e);
    } catch (const std::filesystem::filesystem_error& e) {
        Logger::instance().error("{} failed for {}: {}",
                                 directionName(job.request.type), job.request.name, e.what());
        settleFailure(job, token, e);
    }
}

void TransferService::finishJob(const Job& job) {
    auto group = job.group;
    if (!group) {
        return;
    }

    auto task = m_queue->getTask(job.taskId);
    if (task && task->state == TaskState::Completed) {
        ++group->succeeded;
    } else if (task && task->state == TaskState::Failed) {
        ++group->failed;
    }

    if (--group->remaining > 0) {
        return;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        core::SteadyClock::now() - group->startedAt);
    Logger::instance().info("[BATCH] {} batch complete: {} files ({} ok, {} failed, {})",
                            directionName(group->type), group->total,
                            group->succeeded.load(), group->failed.load(),
                            utils::StringUtils::formatDuration(
                                std::chrono::duration_cast<std::chrono::seconds>(elapsed)));

    if (m_eventBus) {
        auto event = std::make_shared<core::CompleteEvent>();
        event->totalJobs = group->total;
        event->successJobs = group->succeeded.load();
        event->failedJobs = group->failed.load();
        event->duration = elapsed;
        m_eventBus->publish(std::move(event));
    }
}

std::optional<TransferService::SlotLease> TransferService::admit(const Job& job, const CancellationToken& token) {
    auto direction = directionName(job.request.type);
    Logger::instance().debug("[SLOT] {} {}: waiting (active={}/{})",
                             direction, job.request.name, m_gate.inUse(), m_gate.capacity());

    auto slot = m_gate.acquire(token);
    if (!slot) {
        settleStopped(job, token);
        return std::nullopt;
    }
    return SlotLease(std::move(*slot), m_gate, std::move(direction), job.request.name);
}

// ========== Transfers ==========

CloudFile TransferService::performUpload(const Job& job,
                                         const CancellationToken& token,
                                         CloudTransfer& client,
                                         const ProgressCallback& extraProgress) {
    const auto& request = job.request;

    std::error_code ec;
    auto size = fs::file_size(request.source, ec);
    if (ec) {
        throw TransferError("failed to stat file: " + ec.message());
    }
    if (size > 0) {
        m_queue->updateSize(job.taskId, static_cast<int64_t>(size), job.cancel.get());
    }

    auto handle = m_transferManager.allocateTransfer(static_cast<int64_t>(size), 1);

    core::storage::UploadParams params;
    params.localPath = request.source;
    params.folderId = request.dest;
    params.handle = &handle;
    params.progress = [this, &job, &extraProgress](double fraction) {
        m_queue->startTransfer(job.taskId, job.cancel.get());
        m_queue->updateProgress(job.taskId, fraction, job.cancel.get());
        if (extraProgress) {
            extraProgress(fraction);
        }
    };

    CloudFile file = client.upload(token, params);
    handle.complete();

    std::vector<std::string> tags;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_taskTags.find(job.taskId);
        if (it != m_taskTags.end()) {
            tags = it->second;
        }
    }
    applyTags(token, client, file.id, tags, request.name);
    return file;
}

void TransferService::performDownload(const Job& job, const CancellationToken& token, CloudTransfer& client) {
    const auto& request = job.request;

    int64_t size = request.size;
    if (size <= 0) {
        size = client.getFileInfo(token, request.source).size;
        m_queue->updateSize(job.taskId, size, job.cancel.get());
    }

    auto handle = m_transferManager.allocateTransfer(size, 1);

    // A directory destination receives the file under its display name
    fs::path localPath = request.dest.empty() ? fs::path(request.name) : fs::path(request.dest);
    std::error_code ec;
    if (!request.dest.empty() && fs::is_directory(localPath, ec)) {
        localPath /= request.name;
        Logger::instance().debug("Dest {} is a directory, downloading to {}", request.dest, localPath.string());
    }

    core::storage::DownloadParams params;
    params.fileId = request.source;
    params.localPath = localPath.string();
    params.handle = &handle;
    params.progress = [this, &job](double fraction) {
        m_queue->startTransfer(job.taskId, job.cancel.get());
        m_queue->updateProgress(job.taskId, fraction, job.cancel.get());
    };

    client.download(token, params);
}

void TransferService::applyTags(const CancellationToken& token, CloudTransfer& client,
                                const std::string& fileId, const std::vector<std::string>& tags,
                                const std::string& name) {
    auto normalized = utils::StringUtils::normalizeTags(tags);
    if (normalized.empty()) {
        return;
    }

    try {
        client.addFileTags(token, fileId, normalized);
        Logger::instance().info("Tags applied to {}: {}", name, utils::StringUtils::join(normalized, ", "));
    } catch (const std::exception& e) {
        Logger::instance().warn("Failed to apply tags to {} ({}): {} (non-fatal)", name, fileId, e.what());
    }
}

// ========== Outcomes ==========

void TransferService::settleFailure(const Job& job, const CancellationToken& token, const std::exception& error) {
    if (dynamic_cast<const core::OperationCancelledError*>(&error) ||
        token.reason() == CancelReason::Cancelled) {
        settleCancelled(job);
        return;
    }
    m_queue->fail(job.taskId, error.what(), job.cancel.get());
}

void TransferService::settleStopped(const Job& job, const CancellationToken& token) {
    if (token.reason() == CancelReason::DeadlineExceeded) {
        m_queue->fail(job.taskId, core::DeadlineExceededError().what(), job.cancel.get());
        return;
    }
    settleCancelled(job);
}

void TransferService::settleCancelled(const Job& job) {
    // A cancel through the queue unregisters the handle, so this only lands
    // when the caller's token stopped the job
    try {
        m_queue->cancel(job.taskId, job.cancel.get());
    } catch (const TransferError& e) {
        Logger::instance().debug("Task {} already settled: {}", job.taskId, e.what());
    }
}

void TransferService::warmCredentialsInBackground() {
    if (m_credentialsWarm.exchange(true)) {
        return;
    }

    auto client = cloudTransfer();
    if (!client) {
        m_credentialsWarm = false;
        return;
    }

    try {
        m_threadPool->submit([this, client]() {
            try {
                client->warmCredentials(CancellationToken{});
            } catch (const std::exception& e) {
                Logger::instance().debug("Credential warm-up failed: {}", e.what());
                m_credentialsWarm = false;
            }
        });
    } catch (const std::runtime_error& e) {
        Logger::instance().debug("Credential warm-up skipped: {}", e.what());
        m_credentialsWarm = false;
    }
}

TransferRequest TransferService::normalizeRequest(const TransferRequest& request) const {
    TransferRequest result = request;
    if (result.name.empty()) {
        if (result.type == TransferType::Upload) {
            result.name = fs::path(result.source).filename().string();
        } else {
            result.name = result.source;
            Logger::instance().warn("Download of {} has no name, using the file ID", result.source);
        }
    }
    if (result.sourceLabel.empty()) {
        result.sourceLabel = m_config.defaultSourceLabel;
    }
    return result;
}

// ========== Synchronous upload ==========

CloudFile TransferService::uploadFileSync(const CancellationToken& token,
                                          const TransferRequest& request,
                                          ProgressCallback extraProgress) {
    auto client = cloudTransfer();
    if (!client) {
        throw TransferError("storage client not configured");
    }

    TransferRequest upload = request;
    upload.type = TransferType::Upload;
    Job job = trackJob(upload, token);
    const auto jobToken = job.cancel->token();

    auto lease = admit(job, jobToken);
    if (!lease) {
        jobToken.throwIfCancelled();
        throw core::OperationCancelledError();
    }

    if (!m_queue->activate(job.taskId, job.cancel.get())) {
        throw core::OperationCancelledError();
    }

    try {
        CloudFile file = performUpload(job, jobToken, *client, extraProgress);
        m_queue->complete(job.taskId, job.cancel.get());
        return file;
    } catch (const std::exception& e) {
        settleFailure(job, jobToken, e);
        throw;
    }
}

// ========== Retry ==========

void TransferService::executeRetry(const TransferTask& task) {
    Job job;
    job.taskId = task.id;
    job.request.type = task.type;
    job.request.source = task.source;
    job.request.dest = task.dest;
    job.request.name = task.name;
    job.request.size = task.size;
    job.request.sourceLabel = task.sourceLabel;
    job.request.batchId = task.batchId;
    job.request.batchLabel = task.batchLabel;

    if (!cloudTransfer()) {
        m_queue->fail(task.id, "storage client not configured");
        return;
    }

    job.cancel = std::make_shared<CancellationSource>();
    m_queue->setCancel(job.taskId, job.cancel);

    Logger::instance().debug("Re-dispatching {} {}", core::transfer::toString(task.type), task.name);
    dispatch(std::move(job));
}

// ========== Queue delegations ==========

void TransferService::cancelTransfer(const std::string& taskId) {
    m_queue->cancel(taskId);
}

void TransferService::cancelAll() {
    m_queue->cancelAll();
}

std::string TransferService::retryTransfer(const std::string& taskId) {
    return m_queue->retry(taskId);
}

TransferStats TransferService::getStats() const {
    return TransferStats::fromQueue(m_queue->getStats());
}

std::vector<TransferTask> TransferService::getTasks() const {
    return m_queue->getTasks();
}

std::optional<TransferTask> TransferService::getTask(const std::string& taskId) const {
    return m_queue->getTask(taskId);
}

void TransferService::clearCompleted() {
    m_queue->clearCompleted();

    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto it = m_taskTags.begin(); it != m_taskTags.end();) {
        if (!m_queue->getTask(it->first)) {
            it = m_taskTags.erase(it);
        } else {
            ++it;
        }
    }
}

std::vector<core::transfer::BatchStats> TransferService::getAllBatchStats() const {
    return m_queue->getAllBatchStats();
}

std::vector<TransferTask> TransferService::getBatchTasks(const std::string& batchId,
                                                         size_t offset, size_t limit) const {
    return m_queue->getBatchTasks(batchId, offset, limit);
}

std::vector<TransferTask> TransferService::getUngroupedTasks() const {
    return m_queue->getUngroupedTasks();
}

void TransferService::cancelBatch(const std::string& batchId) {
    m_queue->cancelBatch(batchId);
}

void TransferService::retryFailedInBatch(const std::string& batchId) {
    m_queue->retryFailedInBatch(batchId);
}

void TransferService::waitForAll() {
    m_threadPool->waitAll();
}

} // namespace interlink::services
