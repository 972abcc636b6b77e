/**
 * test_transfer_service.cpp
 */

#include "core/Errors.hpp"
#include "core/storage/LocalCloudTransfer.hpp"
#include "services/TransferService.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace interlink::core;
using namespace interlink::core::storage;
using namespace interlink::core::transfer;
using namespace interlink::services;

namespace fs = std::filesystem;

namespace {

/**
 * Storage provider that counts concurrent uploads and can be held,
 * failed or made to throw on demand
 */
class FakeCloudTransfer : public CloudTransfer {
public:
    CloudFile upload(const CancellationToken& token, const UploadParams& params) override {
        ++uploads;
        int now = ++active;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }

        struct Leave {
            std::atomic<int>& counter;
            ~Leave() { --counter; }
        } leave{active};

        std::string name = fs::path(params.localPath).filename().string();
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            started.push_back(name);
        }
        m_condition.notify_all();

        if (throwLogicError) {
            throw std::logic_error("bad state");
        }
        if (failuresLeft.fetch_sub(1) > 0) {
            throw TransferError("network down");
        }

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            while (blocked && !token.isCancelled()) {
                m_condition.wait_for(lock, std::chrono::milliseconds(5));
            }
        }
        throwIfCancelled(token);

        auto until = std::chrono::steady_clock::now() + delay;
        while (std::chrono::steady_clock::now() < until) {
            throwIfCancelled(token);
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }

        if (params.progress) {
            params.progress(0.5);
            params.progress(1.0);
        }

        CloudFile file;
        file.name = name;
        file.folderId = params.folderId;
        file.id = params.folderId.empty() ? name : params.folderId + "/" + name;
        file.size = static_cast<int64_t>(fs::file_size(params.localPath));
        return file;
    }

    void download(const CancellationToken& token, const DownloadParams&) override {
        token.throwIfCancelled();
        ++downloads;
    }

    CloudFile getFileInfo(const CancellationToken&, const std::string& fileId) override {
        CloudFile file;
        file.id = fileId;
        file.name = fileId;
        file.size = 64;
        return file;
    }

    void addFileTags(const CancellationToken&, const std::string&,
                     const std::vector<std::string>& tags) override {
        if (failTags) {
            throw TransferError("tag service unavailable");
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        taggedWith = tags;
    }

    void warmCredentials(const CancellationToken&) override {
        ++warmups;
    }

    std::string accountEmail() const override { return "fake@example.com"; }

    void release() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            blocked = false;
        }
        m_condition.notify_all();
    }

    bool waitForStarted(size_t count) {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_condition.wait_for(lock, std::chrono::seconds(5),
                                    [this, count] { return started.size() >= count; });
    }

    std::vector<std::string> startedNames() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return started;
    }

    std::atomic<int> uploads{0};
    std::atomic<int> downloads{0};
    std::atomic<int> warmups{0};
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    std::atomic<int> failuresLeft{0};
    bool throwLogicError{false};
    bool failTags{false};
    bool blocked{false};
    std::chrono::milliseconds delay{0};
    // How long a cancelled upload keeps running before it throws
    std::chrono::milliseconds lingerAfterCancel{0};
    std::vector<std::string> taggedWith;

private:
    void throwIfCancelled(const CancellationToken& token) const {
        if (token.isCancelled() && lingerAfterCancel.count() > 0) {
            std::this_thread::sleep_for(lingerAfterCancel);
        }
        token.throwIfCancelled();
    }

    std::mutex m_mutex;
    std::condition_variable m_condition;
    std::vector<std::string> started;
};

} // namespace

class TransferServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        baseDir = fs::temp_directory_path() / ("interlink_service_test_" + std::to_string(stamp));
        fs::create_directories(baseDir / "local");

        bus = std::make_shared<EventBus>(EventBus::MaxBufferSize);
        fake = std::make_shared<FakeCloudTransfer>();
    }

    void TearDown() override {
        service.reset();
        std::error_code ec;
        fs::remove_all(baseDir, ec);
    }

    void createService(size_t maxConcurrent, std::shared_ptr<CloudTransfer> client) {
        TransferServiceConfig config;
        config.maxConcurrent = maxConcurrent;
        config.resources.cpuCores = 4;
        config.resources.availableMemory = 8LL * 1024 * 1024 * 1024;
        service = std::make_unique<TransferService>(bus, config, std::move(client));
    }

    fs::path writeFile(const std::string& name, size_t bytes = 100) {
        fs::path path = baseDir / "local" / name;
        std::ofstream out(path, std::ios::binary);
        out << std::string(bytes, 'x');
        return path;
    }

    TransferRequest uploadRequest(const std::string& name) {
        TransferRequest request;
        request.type = TransferType::Upload;
        request.source = writeFile(name).string();
        request.dest = "remote";
        return request;
    }

    TaskState stateOf(const std::string& name) const {
        for (const auto& task : service->getTasks()) {
            if (task.name == name) {
                return task.state;
            }
        }
        ADD_FAILURE() << "no task named " << name;
        return TaskState::Paused;
    }

    fs::path baseDir;
    std::shared_ptr<EventBus> bus;
    std::shared_ptr<FakeCloudTransfer> fake;
    std::unique_ptr<TransferService> service;
    CancellationSource root;
};

TEST_F(TransferServiceTest, ConcurrencyNeverExceedsCeiling) {
    createService(3, fake);
    fake->delay = std::chrono::milliseconds(20);

    std::vector<TransferRequest> requests;
    for (int i = 0; i < 10; ++i) {
        requests.push_back(uploadRequest("file" + std::to_string(i) + ".bin"));
    }

    service->startTransfers(root.token(), requests);
    service->waitForAll();

    EXPECT_EQ(fake->uploads.load(), 10);
    EXPECT_LE(fake->peak.load(), 3);
    EXPECT_GE(fake->peak.load(), 1);
    EXPECT_EQ(service->activeSlots(), 0u);

    auto stats = service->getStats();
    EXPECT_EQ(stats.completed, 10);
    EXPECT_EQ(stats.total(), 10);
}

TEST_F(TransferServiceTest, EveryRequestIsTrackedBeforeReturning) {
    createService(1, fake);
    fake->blocked = true;

    service->startTransfers(root.token(), {uploadRequest("a.bin"), uploadRequest("b.bin")});
    EXPECT_EQ(service->getTasks().size(), 2u);

    fake->release();
    service->waitForAll();
}

TEST_F(TransferServiceTest, CancelBeforeAdmission) {
    createService(1, fake);
    fake->blocked = true;

    service->startTransfers(root.token(), {uploadRequest("a.bin"), uploadRequest("b.bin")});
    ASSERT_TRUE(fake->waitForStarted(1));

    auto running = fake->startedNames().front();
    std::string waiting = running == "a.bin" ? "b.bin" : "a.bin";
    for (const auto& task : service->getTasks()) {
        if (task.name == waiting) {
            EXPECT_EQ(task.state, TaskState::Queued);
            service->cancelTransfer(task.id);
        }
    }

    fake->release();
    service->waitForAll();

    EXPECT_EQ(fake->uploads.load(), 1);
    EXPECT_EQ(stateOf(running), TaskState::Completed);
    EXPECT_EQ(stateOf(waiting), TaskState::Cancelled);
}

TEST_F(TransferServiceTest, CallerTokenCancelsEverything) {
    createService(1, fake);
    fake->blocked = true;

    service->startTransfers(root.token(),
                            {uploadRequest("a.bin"), uploadRequest("b.bin"), uploadRequest("c.bin")});
    ASSERT_TRUE(fake->waitForStarted(1));

    root.cancel();
    service->waitForAll();

    auto stats = service->getStats();
    EXPECT_EQ(stats.cancelled, 3);
    EXPECT_EQ(stats.failed, 0);
}

TEST_F(TransferServiceTest, CancellingOneTaskLeavesOthers) {
    createService(2, fake);
    fake->blocked = true;

    service->startTransfers(root.token(), {uploadRequest("a.bin"), uploadRequest("b.bin")});
    ASSERT_TRUE(fake->waitForStarted(2));

    auto tasks = service->getTasks();
    service->cancelTransfer(tasks[0].id);
    fake->release();
    service->waitForAll();

    EXPECT_EQ(service->getTask(tasks[0].id)->state, TaskState::Cancelled);
    EXPECT_EQ(service->getTask(tasks[1].id)->state, TaskState::Completed);
}

TEST_F(TransferServiceTest, RetryReusesTaskId) {
    createService(2, fake);
    fake->failuresLeft = 1;

    service->startTransfers(root.token(), {uploadRequest("flaky.bin")});
    service->waitForAll();

    auto tasks = service->getTasks();
    ASSERT_EQ(tasks.size(), 1u);
    EXPECT_EQ(tasks[0].state, TaskState::Failed);
    ASSERT_TRUE(tasks[0].error.has_value());
    EXPECT_EQ(*tasks[0].error, "network down");

    EXPECT_EQ(service->retryTransfer(tasks[0].id), tasks[0].id);
    service->waitForAll();

    auto retried = service->getTasks();
    ASSERT_EQ(retried.size(), 1u);
    EXPECT_EQ(retried[0].id, tasks[0].id);
    EXPECT_EQ(retried[0].state, TaskState::Completed);
    EXPECT_FALSE(retried[0].error.has_value());
    EXPECT_EQ(fake->uploads.load(), 2);
}

TEST_F(TransferServiceTest, RetryRejectsCompletedTask) {
    createService(2, fake);
    service->startTransfers(root.token(), {uploadRequest("ok.bin")});
    service->waitForAll();

    auto task = service->getTasks().at(0);
    EXPECT_THROW(service->retryTransfer(task.id), TransferError);
    EXPECT_THROW(service->cancelTransfer(task.id), TransferError);
}

TEST_F(TransferServiceTest, CancelledWorkerDoesNotTouchRetriedAttempt) {
    createService(2, fake);
    fake->blocked = true;
    fake->delay = std::chrono::milliseconds(300);
    fake->lingerAfterCancel = std::chrono::milliseconds(150);

    service->startTransfers(root.token(), {uploadRequest("slow.bin")});
    ASSERT_TRUE(fake->waitForStarted(1));

    auto id = service->getTasks().at(0).id;
    service->cancelTransfer(id);
    EXPECT_EQ(service->retryTransfer(id), id);
    fake->release();

    // The first worker settles while the second attempt is still uploading
    ASSERT_TRUE(fake->waitForStarted(2));
    service->waitForAll();

    auto task = service->getTask(id);
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(task->state, TaskState::Completed);
    EXPECT_FALSE(task->error.has_value());
    EXPECT_DOUBLE_EQ(task->progress, 1.0);
    EXPECT_EQ(fake->uploads.load(), 2);
    EXPECT_EQ(service->activeSlots(), 0u);
}

TEST_F(TransferServiceTest, DeadlineWhileWaitingForSlotFails) {
    createService(1, fake);
    fake->blocked = true;

    service->startTransfers(root.token(), {uploadRequest("holder.bin")});
    ASSERT_TRUE(fake->waitForStarted(1));

    auto deadline = CancellationSource::withTimeout(root.token(), std::chrono::milliseconds(100));
    service->startTransfers(deadline.token(), {uploadRequest("late.bin")});

    // Give the waiter time to expire while the slot is held
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    fake->release();
    service->waitForAll();

    EXPECT_EQ(stateOf("holder.bin"), TaskState::Completed);
    EXPECT_EQ(stateOf("late.bin"), TaskState::Failed);
    for (const auto& task : service->getTasks()) {
        if (task.name == "late.bin") {
            ASSERT_TRUE(task.error.has_value());
            EXPECT_EQ(*task.error, "deadline exceeded");
        }
    }
    EXPECT_EQ(fake->uploads.load(), 1);
}

TEST_F(TransferServiceTest, DeadlineDuringUploadFails) {
    createService(2, fake);
    fake->delay = std::chrono::seconds(2);

    auto deadline = CancellationSource::withTimeout(root.token(), std::chrono::milliseconds(100));
    service->startTransfers(deadline.token(), {uploadRequest("slow.bin")});
    service->waitForAll();

    auto task = service->getTasks().at(0);
    EXPECT_EQ(task.state, TaskState::Failed);
    ASSERT_TRUE(task.error.has_value());
    EXPECT_EQ(*task.error, "deadline exceeded");
    EXPECT_EQ(fake->uploads.load(), 1);
}

TEST_F(TransferServiceTest, MissingClientThrows) {
    createService(2, nullptr);
    EXPECT_THROW(service->startTransfers(root.token(), {uploadRequest("a.bin")}), TransferError);
    EXPECT_TRUE(service->getTasks().empty());
}

TEST_F(TransferServiceTest, EmptyRequestListIsNoOp) {
    createService(2, nullptr);
    EXPECT_NO_THROW(service->startTransfers(root.token(), {}));
    EXPECT_EQ(service->getStats().total(), 0);
}

TEST_F(TransferServiceTest, PanicIsContained) {
    createService(2, fake);
    fake->throwLogicError = true;

    service->startTransfers(root.token(), {uploadRequest("boom.bin"), uploadRequest("boom2.bin")});
    service->waitForAll();

    for (const auto& task : service->getTasks()) {
        EXPECT_EQ(task.state, TaskState::Failed);
        ASSERT_TRUE(task.error.has_value());
        EXPECT_EQ(task.error->rfind("panic: ", 0), 0u);
    }
    EXPECT_EQ(service->activeSlots(), 0u);
}

TEST_F(TransferServiceTest, MissingLocalFileFails) {
    createService(2, fake);

    TransferRequest request;
    request.type = TransferType::Upload;
    request.source = (baseDir / "local" / "absent.bin").string();
    service->startTransfers(root.token(), {request});
    service->waitForAll();

    auto task = service->getTasks().at(0);
    EXPECT_EQ(task.state, TaskState::Failed);
    ASSERT_TRUE(task.error.has_value());
    EXPECT_EQ(task.error->rfind("failed to stat file", 0), 0u);
    EXPECT_EQ(fake->uploads.load(), 0);
}

TEST_F(TransferServiceTest, RequestDefaultsAreFilledIn) {
    createService(2, fake);
    service->startTransfers(root.token(), {uploadRequest("named.bin")});
    service->waitForAll();

    auto task = service->getTasks().at(0);
    EXPECT_EQ(task.name, "named.bin");
    EXPECT_EQ(task.sourceLabel, source_label::FileBrowser);
    EXPECT_EQ(task.size, 100);
}

TEST_F(TransferServiceTest, TagsAppliedAfterUpload) {
    createService(2, fake);
    auto request = uploadRequest("tagged.bin");
    request.tags = {" render ", "render", "", "final"};

    service->startTransfers(root.token(), {request});
    service->waitForAll();

    EXPECT_EQ(fake->taggedWith, (std::vector<std::string>{"render", "final"}));
}

TEST_F(TransferServiceTest, TagFailureIsNotFatal) {
    createService(2, fake);
    fake->failTags = true;
    auto request = uploadRequest("tagged.bin");
    request.tags = {"render"};

    service->startTransfers(root.token(), {request});
    service->waitForAll();

    EXPECT_EQ(service->getTasks().at(0).state, TaskState::Completed);
}

TEST_F(TransferServiceTest, CompleteEventSummarizesDirection) {
    createService(2, fake);
    fake->failuresLeft = 1;
    auto completions = bus->subscribe(EventType::Complete);

    service->startTransfers(root.token(), {uploadRequest("a.bin"), uploadRequest("b.bin")});
    service->waitForAll();

    auto event = completions->tryPop();
    ASSERT_TRUE(event.has_value());
    const auto& summary = static_cast<const CompleteEvent&>(**event);
    EXPECT_EQ(summary.totalJobs, 2);
    EXPECT_EQ(summary.successJobs, 1);
    EXPECT_EQ(summary.failedJobs, 1);
}

TEST_F(TransferServiceTest, UploadsAndDownloadsShareTheCeiling) {
    createService(2, fake);

    TransferRequest download;
    download.type = TransferType::Download;
    download.source = "remote/object.bin";
    download.dest = (baseDir / "out.bin").string();

    service->startTransfers(root.token(), {uploadRequest("a.bin"), download});
    service->waitForAll();

    EXPECT_EQ(fake->uploads.load(), 1);
    EXPECT_EQ(fake->downloads.load(), 1);

    auto tasks = service->getTasks();
    ASSERT_EQ(tasks.size(), 2u);
    for (const auto& task : tasks) {
        EXPECT_EQ(task.state, TaskState::Completed);
        if (task.type == TaskType::Download) {
            // Unknown size resolved through getFileInfo
            EXPECT_EQ(task.size, 64);
            EXPECT_EQ(task.name, "remote/object.bin");
        }
    }
}

TEST_F(TransferServiceTest, CredentialsWarmedOnce) {
    createService(2, fake);
    service->startTransfers(root.token(), {uploadRequest("a.bin")});
    service->waitForAll();
    service->startTransfers(root.token(), {uploadRequest("b.bin")});
    service->waitForAll();

    EXPECT_EQ(fake->warmups.load(), 1);
}

TEST_F(TransferServiceTest, SetCloudTransferAnnouncesIdentity) {
    createService(2, nullptr);
    auto changes = bus->subscribe(EventType::ConfigChanged);

    service->setCloudTransfer(fake, config_source::DirectInput);

    EXPECT_EQ(service->cloudTransfer(), fake);
    auto event = changes->tryPop();
    ASSERT_TRUE(event.has_value());
    const auto& changed = static_cast<const ConfigChangedEvent&>(**event);
    EXPECT_EQ(changed.source, config_source::DirectInput);
    EXPECT_EQ(changed.email, "fake@example.com");
}

TEST_F(TransferServiceTest, UploadFileSyncReportsProgress) {
    createService(2, fake);

    std::vector<double> seen;
    auto file = service->uploadFileSync(root.token(), uploadRequest("sync.bin"),
                                        [&seen](double fraction) { seen.push_back(fraction); });

    EXPECT_EQ(file.id, "remote/sync.bin");
    EXPECT_EQ(seen, (std::vector<double>{0.5, 1.0}));
    EXPECT_EQ(service->getTasks().at(0).state, TaskState::Completed);
}

TEST_F(TransferServiceTest, UploadFileSyncRethrowsFailure) {
    createService(2, fake);
    fake->failuresLeft = 1;

    EXPECT_THROW(service->uploadFileSync(root.token(), uploadRequest("sync.bin")), TransferError);
    EXPECT_EQ(service->getTasks().at(0).state, TaskState::Failed);
}

TEST_F(TransferServiceTest, BatchOperations) {
    createService(2, fake);
    fake->failuresLeft = 2;

    std::vector<TransferRequest> requests;
    for (int i = 0; i < 3; ++i) {
        auto request = uploadRequest("b" + std::to_string(i) + ".bin");
        request.batchId = "batch-1";
        request.batchLabel = "Renders";
        requests.push_back(request);
    }
    auto loose = uploadRequest("loose.bin");
    requests.push_back(loose);

    service->startTransfers(root.token(), requests);
    service->waitForAll();

    EXPECT_EQ(service->getBatchTasks("batch-1", 0, 10).size(), 3u);
    EXPECT_EQ(service->getUngroupedTasks().size(), 1u);

    service->retryFailedInBatch("batch-1");
    service->waitForAll();

    auto batches = service->getAllBatchStats();
    ASSERT_EQ(batches.size(), 1u);
    EXPECT_EQ(batches[0].batchLabel, "Renders");
    EXPECT_EQ(batches[0].total, 3);
    EXPECT_TRUE(batches[0].isFinished());

    // The two failures may have hit the loose file; only batch members are retried
    int failed = service->getStats().failed;
    EXPECT_LE(failed, 1);
}

TEST_F(TransferServiceTest, ClearCompletedKeepsPending) {
    createService(1, fake);
    service->startTransfers(root.token(), {uploadRequest("done.bin")});
    service->waitForAll();

    fake->blocked = true;
    service->startTransfers(root.token(), {uploadRequest("pending.bin")});
    ASSERT_TRUE(fake->waitForStarted(2));

    service->clearCompleted();
    auto tasks = service->getTasks();
    ASSERT_EQ(tasks.size(), 1u);
    EXPECT_EQ(tasks[0].name, "pending.bin");

    fake->release();
    service->waitForAll();
}

// ========== Against the local store ==========

class TransferServiceLocalStoreTest : public TransferServiceTest {
protected:
    void SetUp() override {
        TransferServiceTest::SetUp();
        store = std::make_shared<LocalCloudTransfer>(baseDir / "store");
        createService(2, store);
    }

    std::shared_ptr<LocalCloudTransfer> store;
};

TEST_F(TransferServiceLocalStoreTest, DownloadIntoDirectoryUsesName) {
    auto uploaded = service->uploadFileSync(root.token(), uploadRequest("photo.jpg"));
    EXPECT_EQ(uploaded.id, "remote/photo.jpg");

    fs::create_directories(baseDir / "downloads");
    TransferRequest download;
    download.type = TransferType::Download;
    download.source = uploaded.id;
    download.name = "photo.jpg";
    download.dest = (baseDir / "downloads").string();

    service->startTransfers(root.token(), {download});
    service->waitForAll();

    EXPECT_TRUE(fs::is_regular_file(baseDir / "downloads" / "photo.jpg"));
    for (const auto& task : service->getTasks()) {
        EXPECT_EQ(task.state, TaskState::Completed);
        EXPECT_EQ(task.size, 100);
    }
}

TEST_F(TransferServiceLocalStoreTest, RetriedDownloadIntoDirectoryUsesName) {
    fs::create_directories(baseDir / "downloads");
    TransferRequest download;
    download.type = TransferType::Download;
    download.source = "remote/photo.jpg";
    download.name = "photo.jpg";
    download.dest = (baseDir / "downloads").string();

    // Not uploaded yet: the first attempt fails
    service->startTransfers(root.token(), {download});
    service->waitForAll();

    auto failed = service->getTasks().at(0);
    ASSERT_EQ(failed.state, TaskState::Failed);

    service->uploadFileSync(root.token(), uploadRequest("photo.jpg"));
    EXPECT_EQ(service->retryTransfer(failed.id), failed.id);
    service->waitForAll();

    EXPECT_EQ(service->getTask(failed.id)->state, TaskState::Completed);
    EXPECT_TRUE(fs::is_regular_file(baseDir / "downloads" / "photo.jpg"));
}

TEST_F(TransferServiceLocalStoreTest, TagsPersistInStore) {
    auto request = uploadRequest("tagged.bin");
    request.tags = {"alpha", " beta "};

    service->startTransfers(root.token(), {request});
    service->waitForAll();

    EXPECT_EQ(store->getFileTags("remote/tagged.bin"), (std::vector<std::string>{"alpha", "beta"}));
}

TEST_F(TransferServiceLocalStoreTest, DownloadOfMissingObjectFails) {
    TransferRequest download;
    download.type = TransferType::Download;
    download.source = "remote/missing.bin";
    download.dest = (baseDir / "missing.bin").string();

    service->startTransfers(root.token(), {download});
    service->waitForAll();

    auto task = service->getTasks().at(0);
    EXPECT_EQ(task.state, TaskState::Failed);
    ASSERT_TRUE(task.error.has_value());
    EXPECT_NE(task.error->find("object not found"), std::string::npos);
}
