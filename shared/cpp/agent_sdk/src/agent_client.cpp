#include "../include/agent_client.hpp"
#include "../../../../services/queue/include/task_codec.hpp"
#include "../../../../services/queue/include/timestamp.hpp"
#include <curl/curl.h>
#include <stdexcept>

using json = nlohmann::json;

namespace {
static size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

struct CurlHandle {
    CURL* h{nullptr};
    CurlHandle() { h = curl_easy_init(); if (!h) throw std::runtime_error("curl_easy_init failed"); }
    ~CurlHandle() { if (h) curl_easy_cleanup(h); }
};

struct HeaderList {
    struct curl_slist* list{nullptr};
    ~HeaderList() { if (list) curl_slist_free_all(list); }
};

std::string escape(CURL* h, const std::string& s) {
    char* out = curl_easy_escape(h, s.c_str(), (int)s.size());
    if (!out) return s;
    std::string r(out);
    curl_free(out);
    return r;
}
}

AgentQueueClient::AgentQueueClient(std::string base_url, long timeout_ms)
    : base_(std::move(base_url)), timeout_ms_(timeout_ms) {
    if (!base_.empty() && base_.back() == '/') base_.pop_back();
}

std::optional<AgentQueueClient::Response> AgentQueueClient::request(const char* method, const std::string& path,
                                                                    const std::string* body) {
    CurlHandle c;
    std::string url = base_ + path;
    std::string buf;
    HeaderList headers;
    curl_easy_setopt(c.h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c.h, CURLOPT_CUSTOMREQUEST, method);
    curl_easy_setopt(c.h, CURLOPT_TIMEOUT_MS, timeout_ms_);
    if (body) {
        headers.list = curl_slist_append(headers.list, "Content-Type: application/json");
        curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, headers.list);
        curl_easy_setopt(c.h, CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(c.h, CURLOPT_POSTFIELDSIZE, (long)body->size());
    }
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &buf);
    CURLcode code = curl_easy_perform(c.h);
    if (code != CURLE_OK) {
        last_error_ = std::string(method) + " " + url + ": " + curl_easy_strerror(code);
        return std::nullopt;
    }
    Response r;
    curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &r.status);
    r.body = std::move(buf);
    if (r.status >= 400) {
        last_error_ = std::string(method) + " " + url + ": HTTP " + std::to_string(r.status) + " " + r.body;
    }
    return r;
}

std::optional<Task> AgentQueueClient::dequeue(const std::string& agent) {
    CurlHandle c;
    auto r = request("GET", "/dequeue?agent=" + escape(c.h, agent), nullptr);
    if (!r || r->status == 204) return std::nullopt;
    if (r->status < 200 || r->status >= 300) return std::nullopt;
    try {
        return task_from_json(json::parse(r->body));
    } catch (const std::exception& e) {
        last_error_ = std::string("bad task payload: ") + e.what();
        return std::nullopt;
    }
}

namespace {
std::string outcome_body(const TaskOutcome& outcome, const std::optional<Timestamp>& claimed_at) {
    json j = outcome.to_json();
    if (claimed_at) j["claimed_at"] = format_iso8601(*claimed_at);
    try {
        return j.dump();
    } catch (const json::exception& e) {
        // Invalid UTF-8 in the result: report a permanent failure instead.
        json f = TaskOutcome::failure(std::string("result not serializable: ") + e.what(), false).to_json();
        if (claimed_at) f["claimed_at"] = format_iso8601(*claimed_at);
        return f.dump();
    }
}
}

bool AgentQueueClient::complete(const std::string& id, const TaskOutcome& outcome) {
    return post_outcome(id, outcome_body(outcome, std::nullopt));
}

bool AgentQueueClient::complete(const Task& claimed, const TaskOutcome& outcome) {
    return post_outcome(claimed.id, outcome_body(outcome, claimed.claimed_at));
}

bool AgentQueueClient::post_outcome(const std::string& id, const std::string& body_str) {
    auto r = request("POST", "/complete/" + id, &body_str);
    if (!r || r->status < 200 || r->status >= 300) return false;
    try {
        return json::parse(r->body).value("applied", false);
    } catch (const std::exception& e) {
        last_error_ = std::string("bad complete reply: ") + e.what();
        return false;
    }
}

std::optional<std::string> AgentQueueClient::enqueue(const std::string& target_agent,
                                                     const std::string& operation,
                                                     const json& parameters,
                                                     const EnqueueOptions& opts) {
    json j = {
        {"target_agent", target_agent},
        {"operation", operation},
        {"parameters", parameters.is_null() ? json::object() : parameters},
        {"priority", to_string(opts.priority)},
        {"max_retries", opts.max_retries},
    };
    if (opts.source_agent) j["source_agent"] = *opts.source_agent;
    std::string body_str = j.dump();
    auto r = request("POST", "/enqueue", &body_str);
    if (!r || r->status < 200 || r->status >= 300) return std::nullopt;
    try {
        return json::parse(r->body).at("id").get<std::string>();
    } catch (const std::exception& e) {
        last_error_ = std::string("bad enqueue reply: ") + e.what();
        return std::nullopt;
    }
}

std::optional<Task> AgentQueueClient::get(const std::string& id) {
    auto r = request("GET", "/tasks/" + id, nullptr);
    if (!r || r->status != 200) return std::nullopt;
    try {
        return task_from_json(json::parse(r->body));
    } catch (const std::exception& e) {
        last_error_ = std::string("bad task payload: ") + e.what();
        return std::nullopt;
    }
}

std::optional<json> AgentQueueClient::stats(const std::optional<std::string>& agent) {
    std::string path = "/stats";
    if (agent) {
        CurlHandle c;
        path += "?agent=" + escape(c.h, *agent);
    }
    auto r = request("GET", path, nullptr);
    if (!r || r->status != 200) return std::nullopt;
    try {
        return json::parse(r->body);
    } catch (const std::exception& e) {
        last_error_ = std::string("bad stats reply: ") + e.what();
        return std::nullopt;
    }
}
