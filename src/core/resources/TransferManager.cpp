/**
 * TransferManager.cpp
 */

#include "TransferManager.hpp"

#include <atomic>
#include <utility>

#include <spdlog/fmt/fmt.h>

namespace interlink::core::resources {

namespace {

std::string generateTransferId() {
    static std::atomic<uint64_t> counter{0};
    return "transfer-" + std::to_string(++counter);
}

} // namespace

// ========== TransferHandle ==========

TransferHandle::TransferHandle(std::string id, int64_t fileSize, int threads, ResourceManager* manager)
    : m_id(std::move(id)), m_fileSize(fileSize), m_threads(threads), m_manager(manager) {
}

TransferHandle::~TransferHandle() {
    complete();
}

TransferHandle::TransferHandle(TransferHandle&& other) noexcept
    : m_id(std::move(other.m_id))
    , m_fileSize(other.m_fileSize)
    , m_threads(other.m_threads)
    , m_manager(std::exchange(other.m_manager, nullptr)) {
}

TransferHandle& TransferHandle::operator=(TransferHandle&& other) noexcept {
    if (this != &other) {
        complete();
        m_id = std::move(other.m_id);
        m_fileSize = other.m_fileSize;
        m_threads = other.m_threads;
        m_manager = std::exchange(other.m_manager, nullptr);
    }
    return *this;
}

void TransferHandle::recordThroughput(double bytesPerSecond) {
    if (m_manager) {
        m_manager->recordThroughput(m_id, bytesPerSecond);
    }
}

void TransferHandle::complete() {
    if (m_manager) {
        m_manager->releaseTransfer(m_id);
        m_manager = nullptr;
    }
}

std::string TransferHandle::toString() const {
    return fmt::format("Transfer[id={} threads={} size={} completed={}]",
                       m_id, m_threads, m_fileSize, isCompleted());
}

// ========== TransferManager ==========

TransferManager::TransferManager(std::shared_ptr<ResourceManager> resources)
    : m_resources(std::move(resources)) {
}

TransferHandle TransferManager::allocateTransfer(int64_t fileSize, int totalFiles) {
    auto id = generateTransferId();
    int threads = m_resources->allocateForTransfer(id, fileSize, totalFiles);
    return TransferHandle(std::move(id), fileSize, threads, m_resources.get());
}

TransferManagerStats TransferManager::getStats() const {
    auto stats = m_resources->getStats();
    TransferManagerStats result;
    result.totalThreads = stats.totalThreads;
    result.activeThreads = stats.activeThreads;
    result.availableThreads = stats.availableThreads;
    result.activeTransfers = stats.activeTransfers;
    return result;
}

} // namespace interlink::core::resources
