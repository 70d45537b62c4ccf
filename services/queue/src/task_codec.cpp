#include "../include/task_codec.hpp"
#include "../include/timestamp.hpp"

using json = nlohmann::json;

static json opt_time(const std::optional<Timestamp>& ts) {
    return ts ? json(format_iso8601(*ts)) : json(nullptr);
}

static std::optional<Timestamp> read_time(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return parse_iso8601(j.at(key).get<std::string>());
}

static std::optional<std::string> read_string(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return j.at(key).get<std::string>();
}

json task_to_json(const Task& t) {
    return json{
        {"id", t.id},
        {"source_agent", t.source_agent ? json(*t.source_agent) : json(nullptr)},
        {"target_agent", t.target_agent},
        {"operation", t.operation},
        {"parameters", t.parameters},
        {"status", to_string(t.status)},
        {"priority", to_string(t.priority)},
        {"result", t.result ? *t.result : json(nullptr)},
        {"error_message", t.error_message ? json(*t.error_message) : json(nullptr)},
        {"retry_count", t.retry_count},
        {"max_retries", t.max_retries},
        {"created_at", format_iso8601(t.created_at)},
        {"started_at", opt_time(t.started_at)},
        {"claimed_at", opt_time(t.claimed_at)},
        {"completed_at", opt_time(t.completed_at)},
        {"not_before", opt_time(t.not_before)},
        {"worker_id", t.worker_id ? json(*t.worker_id) : json(nullptr)},
        {"process_id", t.process_id ? json(*t.process_id) : json(nullptr)},
    };
}

Task task_from_json(const json& j) {
    Task t;
    t.id = j.at("id").get<std::string>();
    t.source_agent = read_string(j, "source_agent");
    t.target_agent = j.at("target_agent").get<std::string>();
    t.operation = j.at("operation").get<std::string>();
    t.parameters = j.value("parameters", json::object());
    t.status = parse_status(j.value("status", std::string("pending")));
    t.priority = parse_priority(j.value("priority", std::string("normal")));
    if (j.contains("result") && !j.at("result").is_null()) t.result = j.at("result");
    t.error_message = read_string(j, "error_message");
    t.retry_count = j.value("retry_count", 0);
    t.max_retries = j.value("max_retries", 3);
    auto created = read_time(j, "created_at");
    t.created_at = created ? *created : 0;
    t.started_at = read_time(j, "started_at");
    t.claimed_at = read_time(j, "claimed_at");
    t.completed_at = read_time(j, "completed_at");
    t.not_before = read_time(j, "not_before");
    t.worker_id = read_string(j, "worker_id");
    if (j.contains("process_id") && !j.at("process_id").is_null()) t.process_id = j.at("process_id").get<long>();
    return t;
}
