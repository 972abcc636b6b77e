#pragma once

/**
 * Events.hpp
 *
 * Typed events carried by the EventBus. Every event has a type tag and a
 * creation timestamp; toJson() gives the payload in the shape front ends
 * (CLI printer, GUI bridge) consume.
 */

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace interlink::core {

using json = nlohmann::json;

/**
 * Event discriminant
 */
enum class EventType {
    Progress,
    Log,
    StateChange,
    Error,
    Complete,

    // Transfer queue lifecycle
    TransferQueued,
    TransferInitializing,
    TransferStarted,
    TransferProgress,
    TransferCompleted,
    TransferFailed,
    TransferCancelled,

    BatchProgress,

    // Identity-related configuration changed; caches must be invalidated
    ConfigChanged
};

/**
 * Wire name of an event type ("progress", "transfer_queued", ...)
 */
const char* toString(EventType type);

/**
 * Severity carried by LogEvent
 */
enum class Severity {
    Debug,
    Info,
    Warn,
    Error
};

const char* toString(Severity severity);

/**
 * Source tags for ConfigChangedEvent
 */
namespace config_source {
constexpr const char* DirectInput  = "direct_input";
constexpr const char* EnvVar       = "env_var";
constexpr const char* TokenFile    = "token_file";
constexpr const char* ConfigUpdate = "config_update";
} // namespace config_source

/**
 * Event - base of all bus events
 */
class Event {
public:
    explicit Event(EventType type)
        : m_type(type), m_timestamp(std::chrono::system_clock::now()) {}

    virtual ~Event() = default;

    EventType type() const { return m_type; }
    std::chrono::system_clock::time_point timestamp() const { return m_timestamp; }

    /**
     * Serialize to JSON; subclasses extend the base object
     */
    virtual json toJson() const;

private:
    EventType m_type;
    std::chrono::system_clock::time_point m_timestamp;
};

using EventPtr = std::shared_ptr<const Event>;

struct ProgressEvent : Event {
    ProgressEvent() : Event(EventType::Progress) {}

    std::string jobName;
    std::string stage;          // "tar", "upload", "create", "submit", "overall"
    double progress{0.0};       // 0.0 to 1.0
    int64_t bytesCurrent{0};
    int64_t bytesTotal{0};
    std::string message;
    double rate{0.0};           // bytes/sec
    std::chrono::milliseconds eta{0};

    json toJson() const override;
};

struct LogEvent : Event {
    LogEvent() : Event(EventType::Log) {}

    Severity level{Severity::Info};
    std::string message;
    std::string stage;
    std::string jobName;
    std::optional<std::string> error;

    json toJson() const override;
};

struct StateChangeEvent : Event {
    StateChangeEvent() : Event(EventType::StateChange) {}

    std::string jobName;
    std::string oldStatus;
    std::string newStatus;
    std::string stage;
    std::string jobId;
    std::string errorMessage;
    std::optional<double> uploadProgress;

    json toJson() const override;
};

struct ErrorEvent : Event {
    ErrorEvent() : Event(EventType::Error) {}

    std::string jobName;
    std::string stage;
    std::string error;
    bool retryable{false};

    json toJson() const override;
};

/**
 * Batch-completion summary
 */
struct CompleteEvent : Event {
    CompleteEvent() : Event(EventType::Complete) {}

    int totalJobs{0};
    int successJobs{0};
    int failedJobs{0};
    std::chrono::milliseconds duration{0};

    json toJson() const override;
};

/**
 * Transfer lifecycle event; type is one of the Transfer* kinds
 */
struct TransferEvent : Event {
    explicit TransferEvent(EventType type) : Event(type) {}

    std::string taskId;
    std::string taskType;       // "upload" or "download"
    std::string name;
    int64_t size{0};
    double progress{0.0};
    double speed{0.0};
    std::optional<std::string> error;

    json toJson() const override;
};

struct BatchProgressEvent : Event {
    BatchProgressEvent() : Event(EventType::BatchProgress) {}

    std::string batchId;
    std::string label;
    std::string direction;
    int total{0};
    int completed{0};
    int failed{0};
    double progress{0.0};
    double speed{0.0};

    json toJson() const override;
};

struct ConfigChangedEvent : Event {
    ConfigChangedEvent() : Event(EventType::ConfigChanged) {}

    std::string source;         // one of config_source::*
    std::string email;          // empty if authentication failed

    json toJson() const override;
};

} // namespace interlink::core
