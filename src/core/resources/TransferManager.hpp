#pragma once

/**
 * TransferManager.hpp
 *
 * Hands out scoped thread grants from the ResourceManager.
 */

#include "ResourceManager.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace interlink::core::resources {

/**
 * TransferHandle - thread grant for one transfer
 *
 * Move-only. complete() returns the grant exactly once; the destructor
 * calls it, so every exit path releases.
 */
class TransferHandle {
public:
    TransferHandle(std::string id, int64_t fileSize, int threads, ResourceManager* manager);
    ~TransferHandle();

    TransferHandle(TransferHandle&& other) noexcept;
    TransferHandle& operator=(TransferHandle&& other) noexcept;
    TransferHandle(const TransferHandle&) = delete;
    TransferHandle& operator=(const TransferHandle&) = delete;

    const std::string& id() const { return m_id; }
    int threads() const { return m_threads; }
    int64_t fileSize() const { return m_fileSize; }
    bool isCompleted() const { return m_manager == nullptr; }

    /**
     * Feed a throughput sample to the manager's monitor
     */
    void recordThroughput(double bytesPerSecond);

    /**
     * Release the grant. Idempotent.
     */
    void complete();

    std::string toString() const;

private:
    std::string m_id;
    int64_t m_fileSize;
    int m_threads;
    ResourceManager* m_manager;
};

struct TransferManagerStats {
    int totalThreads{0};
    int activeThreads{0};
    int availableThreads{0};
    int activeTransfers{0};
};

/**
 * TransferManager - allocation front end used by transfer workers
 */
class TransferManager {
public:
    explicit TransferManager(std::shared_ptr<ResourceManager> resources);

    /**
     * Allocate threads for a transfer
     * @param fileSize Bytes to move
     * @param totalFiles Files sharing the pool in the same operation
     */
    TransferHandle allocateTransfer(int64_t fileSize, int totalFiles = 1);

    TransferManagerStats getStats() const;

    ResourceManager& resources() { return *m_resources; }

private:
    std::shared_ptr<ResourceManager> m_resources;
};

} // namespace interlink::core::resources
