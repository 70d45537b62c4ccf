#include "../include/task.hpp"
#include <stdexcept>

using json = nlohmann::json;

const char* to_string(TaskStatus status) {
    switch (status) {
    case TaskStatus::Pending: return "pending";
    case TaskStatus::Processing: return "processing";
    case TaskStatus::Completed: return "completed";
    case TaskStatus::Failed: return "failed";
    case TaskStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

const char* to_string(TaskPriority priority) {
    switch (priority) {
    case TaskPriority::Low: return "low";
    case TaskPriority::Normal: return "normal";
    case TaskPriority::High: return "high";
    case TaskPriority::Urgent: return "urgent";
    }
    return "unknown";
}

TaskStatus parse_status(const std::string& s) {
    if (s == "pending") return TaskStatus::Pending;
    if (s == "processing") return TaskStatus::Processing;
    if (s == "completed") return TaskStatus::Completed;
    if (s == "failed") return TaskStatus::Failed;
    if (s == "cancelled") return TaskStatus::Cancelled;
    throw std::invalid_argument("unknown task status: " + s);
}

TaskPriority parse_priority(const std::string& s) {
    if (s == "low") return TaskPriority::Low;
    if (s == "normal") return TaskPriority::Normal;
    if (s == "high") return TaskPriority::High;
    if (s == "urgent") return TaskPriority::Urgent;
    throw std::invalid_argument("unknown task priority: " + s);
}

bool is_terminal(TaskStatus status) {
    return status == TaskStatus::Completed || status == TaskStatus::Failed || status == TaskStatus::Cancelled;
}

TaskOutcome TaskOutcome::success(json result) {
    TaskOutcome o;
    o.ok_ = true;
    o.result_ = normalize_result(std::move(result));
    return o;
}

TaskOutcome TaskOutcome::failure(std::string message, bool retryable) {
    TaskOutcome o;
    o.ok_ = false;
    o.retryable_ = retryable;
    o.error_ = std::move(message);
    return o;
}

TaskOutcome TaskOutcome::from_json(const json& j) {
    if (!j.is_object()) throw std::invalid_argument("outcome must be a JSON object");
    if (j.contains("ok")) return success(j.at("ok"));
    if (j.contains("error")) {
        return failure(j.at("error").get<std::string>(), j.value("retry", true));
    }
    throw std::invalid_argument("outcome needs an \"ok\" or \"error\" member");
}

json TaskOutcome::to_json() const {
    if (ok_) return json{{"ok", result_}};
    return json{{"error", error_}, {"retry", retryable_}};
}

json normalize_result(json value) {
    if (value.is_object()) return value;
    return json{{"result", std::move(value)}};
}
