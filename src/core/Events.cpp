/**
 * Events.cpp
 *
 * Event type names and JSON serialization.
 */

#include "Events.hpp"

namespace interlink::core {

const char* toString(EventType type) {
    switch (type) {
        case EventType::Progress:             return "progress";
        case EventType::Log:                  return "log";
        case EventType::StateChange:          return "state_change";
        case EventType::Error:                return "error";
        case EventType::Complete:             return "complete";
        case EventType::TransferQueued:       return "transfer_queued";
        case EventType::TransferInitializing: return "transfer_initializing";
        case EventType::TransferStarted:      return "transfer_started";
        case EventType::TransferProgress:     return "transfer_progress";
        case EventType::TransferCompleted:    return "transfer_completed";
        case EventType::TransferFailed:       return "transfer_failed";
        case EventType::TransferCancelled:    return "transfer_cancelled";
        case EventType::BatchProgress:        return "batch_progress";
        case EventType::ConfigChanged:        return "config_changed";
    }
    return "unknown";
}

const char* toString(Severity severity) {
    switch (severity) {
        case Severity::Debug: return "DEBUG";
        case Severity::Info:  return "INFO";
        case Severity::Warn:  return "WARN";
        case Severity::Error: return "ERROR";
    }
    return "UNKNOWN";
}

json Event::toJson() const {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        m_timestamp.time_since_epoch()).count();
    return {
        {"type", toString(m_type)},
        {"timestamp", millis}
    };
}

json ProgressEvent::toJson() const {
    json j = Event::toJson();
    j["jobName"] = jobName;
    j["stage"] = stage;
    j["progress"] = progress;
    j["bytesCurrent"] = bytesCurrent;
    j["bytesTotal"] = bytesTotal;
    j["message"] = message;
    j["rate"] = rate;
    j["etaMs"] = eta.count();
    return j;
}

json LogEvent::toJson() const {
    json j = Event::toJson();
    j["level"] = toString(level);
    j["message"] = message;
    j["stage"] = stage;
    j["jobName"] = jobName;
    j["error"] = error ? json(*error) : json(nullptr);
    return j;
}

json StateChangeEvent::toJson() const {
    json j = Event::toJson();
    j["jobName"] = jobName;
    j["oldStatus"] = oldStatus;
    j["newStatus"] = newStatus;
    j["stage"] = stage;
    j["jobId"] = jobId;
    j["errorMessage"] = errorMessage;
    j["uploadProgress"] = uploadProgress ? json(*uploadProgress) : json(nullptr);
    return j;
}

json ErrorEvent::toJson() const {
    json j = Event::toJson();
    j["jobName"] = jobName;
    j["stage"] = stage;
    j["error"] = error;
    j["retryable"] = retryable;
    return j;
}

json CompleteEvent::toJson() const {
    json j = Event::toJson();
    j["totalJobs"] = totalJobs;
    j["successJobs"] = successJobs;
    j["failedJobs"] = failedJobs;
    j["durationMs"] = duration.count();
    return j;
}

json TransferEvent::toJson() const {
    json j = Event::toJson();
    j["taskId"] = taskId;
    j["taskType"] = taskType;
    j["name"] = name;
    j["size"] = size;
    j["progress"] = progress;
    j["speed"] = speed;
    j["error"] = error ? json(*error) : json(nullptr);
    return j;
}

json BatchProgressEvent::toJson() const {
    json j = Event::toJson();
    j["batchId"] = batchId;
    j["label"] = label;
    j["direction"] = direction;
    j["total"] = total;
    j["completed"] = completed;
    j["failed"] = failed;
    j["progress"] = progress;
    j["speed"] = speed;
    return j;
}

json ConfigChangedEvent::toJson() const {
    json j = Event::toJson();
    j["source"] = source;
    j["email"] = email;
    return j;
}

} // namespace interlink::core
