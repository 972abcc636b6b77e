/**
 * ResourceManager.cpp
 */

#include "ResourceManager.hpp"
#include "../Config.hpp"
#include "../Logger.hpp"
#include "../../utils/PlatformUtils.hpp"

#include <algorithm>
#include <numeric>

#include <spdlog/fmt/fmt.h>

namespace interlink::core::resources {

namespace {

constexpr int ThreadsWithoutAutoScaleSmall = 1;     // < 500 MiB
constexpr int ThreadsWithoutAutoScaleMedium = 2;    // < 1 GiB
constexpr int ThreadsWithoutAutoScaleLarge = 3;

constexpr int ThreadsFor500MBto1GB = 4;
constexpr int ThreadsFor1GBto5GB = 8;
constexpr int ThreadsFor5GBto10GB = 12;
constexpr int ThreadsFor10GBPlus = 16;

double mean(std::deque<double>::const_iterator first, std::deque<double>::const_iterator last) {
    auto count = std::distance(first, last);
    if (count == 0) {
        return 0.0;
    }
    return std::accumulate(first, last, 0.0) / static_cast<double>(count);
}

} // namespace

ResourceConfig ResourceConfig::fromConfig(const Config& config) {
    ResourceConfig result;
    result.maxThreads = config.get<int>("resources.maxThreads", 0);
    result.autoScale = config.get<bool>("resources.autoScale", true);
    result.aggressiveMode = config.get<bool>("resources.aggressiveMode", true);
    result.aggressiveThreshold = config.get<int64_t>("resources.aggressiveThreshold", SmallFileThreshold);
    return result;
}

// ========== ThroughputMonitor ==========

void ThroughputMonitor::record(const std::string& transferId, double bytesPerSecond) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto& samples = m_samples[transferId];
    samples.push_back(bytesPerSecond);
    while (samples.size() > MaxSamples) {
        samples.pop_front();
    }
}

bool ThroughputMonitor::shouldScaleUp(const std::string& transferId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_samples.find(transferId);
    if (it == m_samples.end() || it->second.size() < 3) {
        return false;
    }

    const auto& samples = it->second;
    double avg = mean(samples.begin(), samples.end());
    double variance = 0.0;
    for (double sample : samples) {
        variance += (sample - avg) * (sample - avg);
    }
    variance /= static_cast<double>(samples.size());

    return avg / MiB > MinScaleUpMBps && variance / MiB < MaxScaleUpVarianceMBps;
}

bool ThroughputMonitor::shouldScaleDown(const std::string& transferId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_samples.find(transferId);
    if (it == m_samples.end() || it->second.size() < 6) {
        return false;
    }

    const auto& samples = it->second;
    double recent = mean(samples.end() - 3, samples.end());
    double older = mean(samples.end() - 6, samples.end() - 3);
    return recent < older * ScaleDownRatio;
}

void ThroughputMonitor::cleanup(const std::string& transferId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_samples.erase(transferId);
}

// ========== ResourceManager ==========

ResourceManager::ResourceManager(const ResourceConfig& config)
    : m_autoScale(config.autoScale)
    , m_aggressiveMode(config.aggressiveMode)
    , m_aggressiveThreshold(config.aggressiveThreshold > 0 ? config.aggressiveThreshold : SmallFileThreshold) {

    m_cpuCores = config.cpuCores > 0 ? config.cpuCores : utils::PlatformUtils::getCPUCores();
    int64_t memory = config.availableMemory > 0
        ? config.availableMemory
        : utils::PlatformUtils::getAvailableMemory();

    m_baselineThreads = std::min(m_cpuCores * 2, MaxBaselineThreads);
    m_memoryLimit = static_cast<int>(std::min<int64_t>(memory / MemoryPerThread, AbsoluteMaxThreads));

    int total = std::min(m_baselineThreads, m_memoryLimit);
    if (config.maxThreads > 0) {
        total = config.maxThreads;
    }
    m_totalThreads = std::clamp(total, MinThreadsPerFile, AbsoluteMaxThreads);
    m_availableThreads = m_totalThreads;

    LOG_DEBUG("Resource pool: {} threads (baseline {}, memory limit {}, cores {})",
              m_totalThreads, m_baselineThreads, m_memoryLimit, m_cpuCores);
}

int ResourceManager::allocateForTransfer(const std::string& transferId, int64_t fileSize, int totalFiles) {
    std::lock_guard<std::mutex> lock(m_mutex);

    // Re-allocating under the same ID returns the previous grant first
    auto previous = m_allocations.find(transferId);
    if (previous != m_allocations.end()) {
        m_availableThreads += previous->second;
    }

    int desired = calculateDesiredThreads(fileSize, totalFiles);
    int allocated = std::max(std::min(desired, m_availableThreads), MinThreadsPerFile);

    m_availableThreads -= allocated;
    m_allocations[transferId] = allocated;
    return allocated;
}

void ResourceManager::releaseTransfer(const std::string& transferId) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_allocations.find(transferId);
        if (it == m_allocations.end()) {
            return;
        }
        m_availableThreads += it->second;
        m_allocations.erase(it);
    }
    m_monitor.cleanup(transferId);
}

int ResourceManager::getAvailableThreads() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_availableThreads;
}

int ResourceManager::getTotalThreads() const {
    return m_totalThreads;
}

ResourceStats ResourceManager::getStats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    ResourceStats stats;
    stats.totalThreads = m_totalThreads;
    stats.availableThreads = m_availableThreads;
    stats.activeThreads = m_totalThreads - m_availableThreads;
    stats.activeTransfers = static_cast<int>(m_allocations.size());
    stats.baselineThreads = m_baselineThreads;
    stats.memoryLimit = m_memoryLimit;
    stats.autoScaleEnabled = m_autoScale;
    return stats;
}

int ResourceManager::calculateDesiredThreads(int64_t fileSize, int totalFiles) const {
    if (fileSize < SmallFileThreshold) {
        return MinThreadsPerFile;
    }

    if (!m_autoScale) {
        if (fileSize < MediumFileThreshold) return ThreadsWithoutAutoScaleSmall;
        if (fileSize < LargeFile1GB) return ThreadsWithoutAutoScaleMedium;
        return ThreadsWithoutAutoScaleLarge;
    }

    int poolShare = m_totalThreads;
    if (totalFiles > 1) {
        poolShare = std::max(m_totalThreads / totalFiles, MinThreadsPerFile);
    }

    int desired = MinThreadsPerFile;
    if (fileSize >= LargeFile10GB) {
        desired = ThreadsFor10GBPlus;
    } else if (fileSize >= LargeFile5GB) {
        desired = ThreadsFor5GBto10GB;
    } else if (fileSize >= LargeFile1GB) {
        desired = ThreadsFor1GBto5GB;
    } else if (fileSize >= MediumFileThreshold) {
        desired = ThreadsFor500MBto1GB;
    }

    if (m_aggressiveMode && fileSize >= m_aggressiveThreshold) {
        if (fileSize >= LargeFile10GB) {
            desired = desired * 2;
        } else if (fileSize >= LargeFile5GB) {
            desired = desired * 7 / 4;
        } else if (fileSize >= LargeFile1GB) {
            desired = desired * 3 / 2;
        }
    }

    desired = std::min(desired, poolShare);
    desired = std::min(desired, MaxThreadsPerFile);
    desired = std::min(desired, m_cpuCores);
    return std::max(desired, MinThreadsPerFile);
}

void ResourceManager::recordThroughput(const std::string& transferId, double bytesPerSecond) {
    m_monitor.record(transferId, bytesPerSecond);
}

bool ResourceManager::shouldScaleUp(const std::string& transferId) const {
    return m_autoScale && m_monitor.shouldScaleUp(transferId);
}

bool ResourceManager::shouldScaleDown(const std::string& transferId) const {
    return m_autoScale && m_monitor.shouldScaleDown(transferId);
}

std::string ResourceManager::toString() const {
    auto stats = getStats();
    return fmt::format("ResourceManager[total={} available={} active={} transfers={} autoscale={}]",
                       stats.totalThreads, stats.availableThreads, stats.activeThreads,
                       stats.activeTransfers, stats.autoScaleEnabled);
}

} // namespace interlink::core::resources
