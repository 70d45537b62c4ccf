#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

enum class TaskStatus {
    Pending,
    Processing,
    Completed,
    Failed,
    Cancelled,
};

// Numeric values are persisted; higher dispatches first.
enum class TaskPriority : int {
    Low = 1,
    Normal = 2,
    High = 3,
    Urgent = 4,
};

// Microseconds since the Unix epoch, UTC.
using Timestamp = std::int64_t;

struct Task {
    std::string id;
    std::optional<std::string> source_agent; // empty for externally submitted tasks
    std::string target_agent;
    std::string operation;
    nlohmann::json parameters = nlohmann::json::object();
    TaskStatus status{TaskStatus::Pending};
    TaskPriority priority{TaskPriority::Normal};
    std::optional<nlohmann::json> result;     // set iff status == Completed
    std::optional<std::string> error_message; // last failure, kept across retries
    int retry_count{0};
    int max_retries{3};
    Timestamp created_at{0};
    std::optional<Timestamp> started_at;   // first claim
    std::optional<Timestamp> claimed_at;   // latest claim
    std::optional<Timestamp> completed_at; // terminal transition
    std::optional<Timestamp> not_before;   // retry backoff gate
    std::optional<std::string> worker_id;
    std::optional<long> process_id;
};

struct EnqueueOptions {
    TaskPriority priority{TaskPriority::Normal};
    std::optional<std::string> source_agent;
    int max_retries{3};
};

const char* to_string(TaskStatus status);
const char* to_string(TaskPriority priority);
TaskStatus parse_status(const std::string& s);
TaskPriority parse_priority(const std::string& s);
bool is_terminal(TaskStatus status);

// Result envelope of one operation invocation: {"ok": result} | {"error": message, "retry": bool}.
class TaskOutcome {
public:
    static TaskOutcome success(nlohmann::json result);
    static TaskOutcome failure(std::string message, bool retryable = true);
    static TaskOutcome from_json(const nlohmann::json& j);

    bool ok() const { return ok_; }
    bool retryable() const { return retryable_; }
    const nlohmann::json& result() const { return result_; }
    const std::string& error() const { return error_; }
    nlohmann::json to_json() const;

private:
    TaskOutcome() = default;

    bool ok_{false};
    bool retryable_{true};
    nlohmann::json result_;
    std::string error_;
};

// Objects pass through untouched; anything else is wrapped as {"result": value}.
nlohmann::json normalize_result(nlohmann::json value);
