#pragma once

/**
 * TransferTypes.hpp
 *
 * Front-end facing types of the transfer service, shared by the CLI and
 * GUI bindings.
 */

#include "../core/Config.hpp"
#include "../core/resources/ResourceManager.hpp"
#include "../core/transfer/TransferQueue.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace interlink::services {

using TransferType = core::transfer::TaskType;

/**
 * Origin labels shown next to a transfer
 */
namespace source_label {
constexpr const char* PUR         = "PUR";
constexpr const char* SingleJob   = "SingleJob";
constexpr const char* FileBrowser = "FileBrowser";
} // namespace source_label

/**
 * One transfer to execute
 */
struct TransferRequest {
    TransferType type{TransferType::Upload};

    // Upload: local file path. Download: remote file ID.
    std::string source;

    // Upload: remote folder ID (empty = store root). Download: local file or directory.
    std::string dest;

    // Display name (defaults to the file name, or the file ID for downloads)
    std::string name;

    int64_t size{0};

    // "PUR", "SingleJob", "FileBrowser", ... (defaults to the configured label)
    std::string sourceLabel;

    std::string batchId;
    std::string batchLabel;

    // Applied after a successful upload; failures are only logged
    std::vector<std::string> tags;
};

/**
 * Number of tracked transfers per state
 */
struct TransferStats {
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

    static TransferStats fromQueue(const core::transfer::QueueStats& stats) {
        TransferStats result;
        result.queued = stats.queued;
        result.initializing = stats.initializing;
        result.active = stats.active;
        result.paused = stats.paused;
        result.completed = stats.completed;
        result.failed = stats.failed;
        result.cancelled = stats.cancelled;
        return result;
    }
};

/**
 * Transfer service settings
 */
struct TransferServiceConfig {
    static constexpr size_t DefaultMaxConcurrent = 5;

    // Admission gate capacity shared by uploads and downloads
    size_t maxConcurrent{DefaultMaxConcurrent};

    // Worker threads hosting transfers (0 = 2 x maxConcurrent)
    size_t workerThreads{0};

    std::string defaultSourceLabel{source_label::FileBrowser};

    core::resources::ResourceConfig resources;

    static TransferServiceConfig fromConfig(const core::Config& config) {
        TransferServiceConfig result;
        int maxConcurrent = config.get<int>("transfers.maxConcurrent", static_cast<int>(DefaultMaxConcurrent));
        result.maxConcurrent = maxConcurrent > 0 ? static_cast<size_t>(maxConcurrent) : DefaultMaxConcurrent;
        int workers = config.get<int>("transfers.workerThreads", 0);
        result.workerThreads = workers > 0 ? static_cast<size_t>(workers) : 0;
        result.defaultSourceLabel = config.get<std::string>("transfers.defaultSourceLabel",
                                                            source_label::FileBrowser);
        if (result.defaultSourceLabel.empty()) {
            result.defaultSourceLabel = source_label::FileBrowser;
        }
        result.resources = core::resources::ResourceConfig::fromConfig(config);
        return result;
    }
};

} // namespace interlink::services
