/**
 * TransferTask.cpp
 */

#include "TransferTask.hpp"

#include <atomic>

namespace interlink::core::transfer {

namespace {

json toJsonTime(const std::optional<TimePoint>& time) {
    if (!time) {
        return nullptr;
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        time->time_since_epoch()).count();
}

} // namespace

const char* toString(TaskType type) {
    switch (type) {
        case TaskType::Upload:   return "upload";
        case TaskType::Download: return "download";
    }
    return "unknown";
}

const char* toString(TaskState state) {
    switch (state) {
        case TaskState::Queued:       return "queued";
        case TaskState::Initializing: return "initializing";
        case TaskState::Active:       return "active";
        case TaskState::Paused:       return "paused";
        case TaskState::Completed:    return "completed";
        case TaskState::Failed:       return "failed";
        case TaskState::Cancelled:    return "cancelled";
    }
    return "unknown";
}

std::optional<TaskType> parseTaskType(const std::string& name) {
    if (name == "upload") return TaskType::Upload;
    if (name == "download") return TaskType::Download;
    return std::nullopt;
}

void to_json(json& j, const TransferTask& task) {
    j = json{
        {"id", task.id},
        {"type", toString(task.type)},
        {"name", task.name},
        {"source", task.source},
        {"dest", task.dest},
        {"size", task.size},
        {"sourceLabel", task.sourceLabel},
        {"batchId", task.batchId},
        {"batchLabel", task.batchLabel},
        {"state", toString(task.state)},
        {"progress", task.progress},
        {"speed", task.speed},
        {"error", task.error ? json(*task.error) : json(nullptr)},
        {"createdAt", toJsonTime(task.createdAt)},
        {"startedAt", toJsonTime(task.startedAt)},
        {"completedAt", toJsonTime(task.completedAt)}
    };
}

std::string generateTaskId() {
    static std::atomic<uint64_t> counter{0};
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "task-" + std::to_string(nanos) + "-" + std::to_string(++counter);
}

} // namespace interlink::core::transfer
