#pragma once

/**
 * ResourceManager.hpp
 *
 * Shared thread budget for file transfers. Each transfer is granted a
 * number of parallel streams sized by its byte count and by how many
 * files share the pool; the grant is returned when the transfer ends.
 */

#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

namespace interlink::core {
class Config;
}

namespace interlink::core::resources {

constexpr int64_t MiB = 1024 * 1024;
constexpr int64_t GiB = 1024 * MiB;

// Thread pool limits
constexpr int AbsoluteMaxThreads = 32;
constexpr int MaxBaselineThreads = 16;
constexpr int MinThreadsPerFile = 1;
constexpr int MaxThreadsPerFile = 16;
constexpr int64_t MemoryPerThread = 128 * MiB;

// Size tiers
constexpr int64_t SmallFileThreshold = 100 * MiB;
constexpr int64_t MediumFileThreshold = 500 * MiB;
constexpr int64_t LargeFile1GB = 1 * GiB;
constexpr int64_t LargeFile5GB = 5 * GiB;
constexpr int64_t LargeFile10GB = 10 * GiB;

/**
 * Allocator settings
 */
struct ResourceConfig {
    // User cap on the pool (0 = derive from cores and memory)
    int maxThreads{0};

    bool autoScale{true};

    // Multiply grants for files at or above aggressiveThreshold
    bool aggressiveMode{true};
    int64_t aggressiveThreshold{SmallFileThreshold};

    // Host overrides (0 = detect)
    int cpuCores{0};
    int64_t availableMemory{0};

    /**
     * Read the "resources" section of the application config
     */
    static ResourceConfig fromConfig(const Config& config);
};

/**
 * Snapshot of the pool
 */
struct ResourceStats {
    int totalThreads{0};
    int availableThreads{0};
    int activeThreads{0};
    int activeTransfers{0};
    int baselineThreads{0};
    int memoryLimit{0};
    bool autoScaleEnabled{false};
};

/**
 * ThroughputMonitor - recent throughput samples per transfer
 *
 * Detects saturation (high, stable throughput: room for more streams)
 * and degradation (recent samples well below the previous ones).
 */
class ThroughputMonitor {
public:
    static constexpr size_t MaxSamples = 10;
    static constexpr double MinScaleUpMBps = 10.0;
    static constexpr double MaxScaleUpVarianceMBps = 2.0;
    static constexpr double ScaleDownRatio = 0.8;

    void record(const std::string& transferId, double bytesPerSecond);

    /**
     * Mean above 10 MB/s with variance below 2 MB/s (needs 3 samples)
     */
    bool shouldScaleUp(const std::string& transferId) const;

    /**
     * Mean of the last 3 samples below 80% of the 3 before (needs 6 samples)
     */
    bool shouldScaleDown(const std::string& transferId) const;

    void cleanup(const std::string& transferId);

private:
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::deque<double>> m_samples;
};

/**
 * ResourceManager - thread budget shared by all transfers
 */
class ResourceManager {
public:
    explicit ResourceManager(const ResourceConfig& config = ResourceConfig{});

    ResourceManager(const ResourceManager&) = delete;
    ResourceManager& operator=(const ResourceManager&) = delete;

    /**
     * Grant threads to a transfer: the desired count for its size, limited by
     * what is left in the pool but never below one
     * @param transferId Key for the later release
     * @param fileSize Bytes to transfer
     * @param totalFiles Files sharing the pool in the same operation
     * @return Number of threads granted
     */
    int allocateForTransfer(const std::string& transferId, int64_t fileSize, int totalFiles);

    /**
     * Return a transfer's grant. Unknown IDs are ignored.
     */
    void releaseTransfer(const std::string& transferId);

    int getAvailableThreads() const;
    int getTotalThreads() const;
    ResourceStats getStats() const;

    /**
     * Desired thread count for a file, before pool availability
     */
    int calculateDesiredThreads(int64_t fileSize, int totalFiles) const;

    // Throughput feedback
    void recordThroughput(const std::string& transferId, double bytesPerSecond);
    bool shouldScaleUp(const std::string& transferId) const;
    bool shouldScaleDown(const std::string& transferId) const;

    std::string toString() const;

private:
    int m_totalThreads;
    int m_availableThreads;
    int m_baselineThreads;
    int m_memoryLimit;
    int m_cpuCores;
    bool m_autoScale;
    bool m_aggressiveMode;
    int64_t m_aggressiveThreshold;

    std::unordered_map<std::string, int> m_allocations;
    mutable std::mutex m_mutex;

    ThroughputMonitor m_monitor;
};

} // namespace interlink::core::resources
