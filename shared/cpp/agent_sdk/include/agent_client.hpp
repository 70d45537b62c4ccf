#pragma once
#include <string>
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>
#include "../../../../services/queue/include/task.hpp"

// HTTP client for the agentq_queue daemon. Transport or protocol failures come back as
// empty optionals / false rather than exceptions, so a polling agent keeps running.
class AgentQueueClient {
public:
    explicit AgentQueueClient(std::string base_url, long timeout_ms = 10000);

    std::optional<Task> dequeue(const std::string& agent);
    bool complete(const std::string& id, const TaskOutcome& outcome);
    // Pins the report to this claim; the daemon ignores it once the task was recovered and re-claimed.
    bool complete(const Task& claimed, const TaskOutcome& outcome);
    std::optional<std::string> enqueue(const std::string& target_agent,
                                       const std::string& operation,
                                       const nlohmann::json& parameters,
                                       const EnqueueOptions& opts = {});
    std::optional<Task> get(const std::string& id);
    std::optional<nlohmann::json> stats(const std::optional<std::string>& agent = std::nullopt);

    const std::string& last_error() const { return last_error_; }

private:
    struct Response {
        long status{0};
        std::string body;
    };

    std::optional<Response> request(const char* method, const std::string& path, const std::string* body);
    bool post_outcome(const std::string& id, const std::string& body_str);

    std::string base_;
    long timeout_ms_;
    std::string last_error_;
};
