#pragma once
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "queue_manager.hpp"

// Facade an agent uses to hand work to other agents (or to itself). A client built
// without a queue is detached: submissions return nothing and waits return empty.
class TaskClient {
public:
    TaskClient(QueueManager* queue, std::string agent_type,
               std::chrono::milliseconds poll_interval = std::chrono::milliseconds(200));

    bool attached() const { return queue_ != nullptr; }
    const std::string& agent_type() const { return agent_type_; }

    // target_agent defaults to this client's own agent type.
    std::optional<std::string> submit(const std::string& operation,
                                      const nlohmann::json& parameters,
                                      const std::optional<std::string>& target_agent = std::nullopt,
                                      EnqueueOptions opts = {});
    std::optional<std::vector<std::string>> submit_batch(const std::string& operation,
                                                         const std::vector<nlohmann::json>& parameter_list,
                                                         const std::optional<std::string>& target_agent = std::nullopt,
                                                         EnqueueOptions opts = {});

    // Latest snapshot of every known id once all are terminal or the timeout passes.
    // A timeout does not cancel anything; callers inspect each task's status.
    std::map<std::string, Task> wait_for_completion(const std::vector<std::string>& ids,
                                                    std::chrono::milliseconds timeout);
    // As wait_for_completion, but throws TimeoutError unless every id is terminal.
    std::map<std::string, Task> await_all(const std::vector<std::string>& ids,
                                          std::chrono::milliseconds timeout);

    std::optional<Task> status(const std::string& id);
    std::optional<QueueStats> queue_stats(const std::optional<std::string>& target_agent = std::nullopt);

private:
    QueueManager* queue_;
    std::string agent_type_;
    std::chrono::milliseconds poll_interval_;
};
