#include "../include/http_api.hpp"
#include "../include/errors.hpp"
#include "../include/log.hpp"
#include "../include/task_codec.hpp"
#include "../include/timestamp.hpp"
#include <limits>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {
HttpReply reply(int status, const json& body) {
    return HttpReply{status, body.dump(), "application/json"};
}

HttpReply no_content() {
    return HttpReply{204, "", "text/plain"};
}

HttpReply error(int status, const std::string& msg) {
    return reply(status, json{{"error", msg}});
}

std::optional<std::string> query_value(const HttpRequest& req, const char* key) {
    auto it = req.query.find(key);
    if (it == req.query.end() || it->second.empty()) return std::nullopt;
    return it->second;
}

// Whole-number age in units of unit_seconds; rejects negatives and values the seconds clock cannot hold.
long long age_value(const HttpRequest& req, const char* key, const std::string& def, long long unit_seconds) {
    std::string raw = query_value(req, key).value_or(def);
    std::size_t used = 0;
    long long v = std::stoll(raw, &used);
    if (used != raw.size()) throw std::invalid_argument(std::string(key) + " must be an integer");
    if (v < 0) throw std::invalid_argument(std::string(key) + " must be >= 0");
    if (v > std::numeric_limits<long long>::max() / 1000000 / unit_seconds) {
        throw std::invalid_argument(std::string(key) + " is out of range");
    }
    return v;
}

std::string target_of(const json& j) {
    if (j.contains("target_agent")) return j.at("target_agent").get<std::string>();
    return j.at("agent").get<std::string>(); // older clients
}
}

QueueHttpApi::QueueHttpApi(QueueManager& queue, int default_max_retries, std::chrono::minutes stuck_after)
    : queue_(queue), default_max_retries_(default_max_retries), stuck_after_(stuck_after) {}

EnqueueOptions QueueHttpApi::options_from(const json& j) const {
    EnqueueOptions opts;
    opts.priority = parse_priority(j.value("priority", std::string("normal")));
    if (j.contains("source_agent") && !j.at("source_agent").is_null()) {
        opts.source_agent = j.at("source_agent").get<std::string>();
    }
    opts.max_retries = j.value("max_retries", default_max_retries_);
    return opts;
}

HttpReply QueueHttpApi::handle(const HttpRequest& req) {
    const std::string& path = req.path;
    try {
        if (req.method == "POST" && path == "/enqueue") {
            auto j = json::parse(req.body);
            auto id = queue_.enqueue(target_of(j), j.at("operation").get<std::string>(),
                                     j.value("parameters", json::object()), options_from(j));
            return reply(200, json{{"id", id}});
        }
        if (req.method == "POST" && path == "/enqueue_batch") {
            auto j = json::parse(req.body);
            std::vector<json> params = j.at("parameter_list").get<std::vector<json>>();
            auto ids = queue_.enqueue_batch(target_of(j), j.at("operation").get<std::string>(), params, options_from(j));
            return reply(200, json{{"ids", ids}});
        }
        if (req.method == "GET" && (path == "/dequeue" || path == "/peek")) {
            auto agent = query_value(req, "agent");
            if (!agent) return error(400, "agent query parameter required");
            auto task = path == "/dequeue" ? queue_.claim(*agent) : queue_.peek(*agent);
            if (!task) return no_content();
            return reply(200, task_to_json(*task));
        }
        if (req.method == "POST" && path.rfind("/complete/", 0) == 0) {
            std::string id = path.substr(std::string("/complete/").size());
            if (id.empty()) return error(400, "id required");
            auto j = json::parse(req.body);
            auto outcome = TaskOutcome::from_json(j);
            std::optional<Timestamp> claimed_at;
            if (j.contains("claimed_at") && !j.at("claimed_at").is_null()) {
                claimed_at = parse_iso8601(j.at("claimed_at").get<std::string>());
            }
            return reply(200, json{{"applied", queue_.apply(id, claimed_at, outcome)}});
        }
        if (req.method == "GET" && path.rfind("/tasks/", 0) == 0) {
            std::string id = path.substr(std::string("/tasks/").size());
            auto task = queue_.get(id);
            if (!task) return error(404, "no task " + id);
            return reply(200, task_to_json(*task));
        }
        if (req.method == "GET" && path == "/stats") {
            return reply(200, queue_.stats(query_value(req, "agent")).to_json());
        }
        if (req.method == "GET" && path == "/health") {
            return reply(200, queue_.health(stuck_after_).to_json());
        }
        if (req.method == "POST" && path == "/cleanup") {
            long long hours = age_value(req, "older_than_hours", "24", 3600);
            auto removed = queue_.cleanup(std::chrono::hours(hours));
            return reply(200, json{{"removed", removed}});
        }
        if (req.method == "DELETE" && path == "/jobs") {
            auto agent = query_value(req, "agent");
            if (!agent) return error(400, "agent query parameter required");
            auto cancelled = queue_.cancel(*agent, query_value(req, "source"));
            return reply(200, json{{"cancelled", cancelled}});
        }
        if (req.method == "POST" && path == "/recover") {
            std::size_t recovered = 0;
            if (query_value(req, "stuck_minutes")) {
                long long minutes = age_value(req, "stuck_minutes", "0", 60);
                bool mark_failed = query_value(req, "mark_failed").value_or("0") == "1";
                recovered = queue_.recover_stuck(std::chrono::minutes(minutes), mark_failed);
            } else {
                recovered = queue_.recover_orphaned();
            }
            return reply(200, json{{"recovered", recovered}});
        }
        if (req.method == "POST" && (path == "/control/pause" || path == "/control/resume")) {
            auto agent = query_value(req, "agent");
            if (!agent) return error(400, "agent query parameter required");
            if (path == "/control/pause") queue_.pause(*agent);
            else queue_.resume(*agent);
            return reply(200, json{{"ok", true}});
        }
        if (req.method == "GET" && path == "/control/state") {
            return reply(200, json{{"paused", queue_.paused_agents()}});
        }
        return error(404, "not found");
    } catch (const StorageError& e) {
        log_error("queue", std::string("storage failure on ") + req.method + " " + path + ": " + e.what());
        return error(500, e.what());
    } catch (const std::exception& e) {
        // Malformed JSON, missing fields, bad enum names, non-numeric query values.
        return error(400, e.what());
    }
}
