#pragma once

/**
 * TransferTask.hpp
 *
 * Represents a single upload or download tracked by the TransferQueue.
 */

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace interlink::core::transfer {

using json = nlohmann::json;
using TimePoint = std::chrono::system_clock::time_point;

/**
 * Transfer direction
 */
enum class TaskType {
    Upload,
    Download
};

/**
 * Transfer task state
 *
 * Queued -> Initializing -> Active -> Completed
 * Queued | Initializing | Active -> Failed | Cancelled
 * Failed | Cancelled -> Queued (retry)
 * Paused is reserved and never entered.
 */
enum class TaskState {
    Queued,
    Initializing,
    Active,
    Paused,
    Completed,
    Failed,
    Cancelled
};

const char* toString(TaskType type);
const char* toString(TaskState state);

std::optional<TaskType> parseTaskType(const std::string& name);

inline bool isTerminal(TaskState state) {
    return state == TaskState::Completed ||
           state == TaskState::Failed ||
           state == TaskState::Cancelled;
}

inline bool canRetry(TaskState state) {
    return state == TaskState::Failed || state == TaskState::Cancelled;
}

/**
 * TransferTask - point-in-time copy of a tracked transfer
 *
 * The queue owns the live record; everything handed out is a copy.
 */
struct TransferTask {
    // Unique, stable across retries
    std::string id;

    TaskType type{TaskType::Upload};

    // Display name (usually the file name)
    std::string name;

    // Local path (upload) or remote object ID (download)
    std::string source;

    // Remote folder ID (upload) or local path (download)
    std::string dest;

    // Total bytes (may be corrected after tracking)
    int64_t size{0};

    // Origin tag, e.g. "FileBrowser"
    std::string sourceLabel;

    // Optional grouping key and its display name
    std::string batchId;
    std::string batchLabel;

    TaskState state{TaskState::Queued};

    // 0.0 - 1.0
    double progress{0.0};

    // Smoothed bytes/sec
    double speed{0.0};

    // Set only while Failed
    std::optional<std::string> error;

    TimePoint createdAt{};
    std::optional<TimePoint> startedAt;
    std::optional<TimePoint> completedAt;

    bool isTerminal() const { return transfer::isTerminal(state); }
    bool canRetry() const { return transfer::canRetry(state); }
    bool isSuccess() const { return state == TaskState::Completed; }
};

void to_json(json& j, const TransferTask& task);

/**
 * Generate a process-unique task ID ("task-<unix-nanos>-<counter>")
 */
std::string generateTaskId();

} // namespace interlink::core::transfer
