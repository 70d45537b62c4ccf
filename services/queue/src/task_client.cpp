#include "../include/task_client.hpp"
#include "../include/errors.hpp"
#include "../include/log.hpp"
#include <algorithm>
#include <thread>

using json = nlohmann::json;

TaskClient::TaskClient(QueueManager* queue, std::string agent_type, std::chrono::milliseconds poll_interval)
    : queue_(queue), agent_type_(std::move(agent_type)), poll_interval_(poll_interval) {}

std::optional<std::string> TaskClient::submit(const std::string& operation,
                                              const json& parameters,
                                              const std::optional<std::string>& target_agent,
                                              EnqueueOptions opts) {
    if (!queue_) {
        log_warn(agent_type_, "No queue configured - cannot submit " + operation);
        return std::nullopt;
    }
    if (!opts.source_agent) opts.source_agent = agent_type_;
    return queue_->enqueue(target_agent.value_or(agent_type_), operation, parameters, opts);
}

std::optional<std::vector<std::string>> TaskClient::submit_batch(const std::string& operation,
                                                                 const std::vector<json>& parameter_list,
                                                                 const std::optional<std::string>& target_agent,
                                                                 EnqueueOptions opts) {
    if (!queue_) {
        log_warn(agent_type_, "No queue configured - cannot submit batch " + operation);
        return std::nullopt;
    }
    if (!opts.source_agent) opts.source_agent = agent_type_;
    return queue_->enqueue_batch(target_agent.value_or(agent_type_), operation, parameter_list, opts);
}

std::map<std::string, Task> TaskClient::wait_for_completion(const std::vector<std::string>& ids,
                                                            std::chrono::milliseconds timeout) {
    std::map<std::string, Task> snapshot;
    if (!queue_) return snapshot;
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + timeout;
    while (true) {
        bool all_terminal = true;
        for (const auto& id : ids) {
            auto it = snapshot.find(id);
            if (it != snapshot.end() && is_terminal(it->second.status)) continue;
            auto t = queue_->get(id);
            if (!t) continue; // unknown or purged
            if (!is_terminal(t->status)) all_terminal = false;
            snapshot[id] = std::move(*t);
        }
        auto now = clock::now();
        if (all_terminal || now >= deadline) break;
        std::this_thread::sleep_for(std::min(poll_interval_,
                                             std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now)));
    }
    return snapshot;
}

std::map<std::string, Task> TaskClient::await_all(const std::vector<std::string>& ids,
                                                  std::chrono::milliseconds timeout) {
    auto snapshot = wait_for_completion(ids, timeout);
    if (!queue_) return snapshot;
    std::size_t pending = 0;
    for (const auto& id : ids) {
        auto it = snapshot.find(id);
        if (it == snapshot.end() || !is_terminal(it->second.status)) ++pending;
    }
    if (pending) {
        throw TimeoutError(std::to_string(pending) + " of " + std::to_string(ids.size()) +
                           " tasks still unfinished after " + std::to_string(timeout.count()) + " ms");
    }
    return snapshot;
}

std::optional<Task> TaskClient::status(const std::string& id) {
    if (!queue_) return std::nullopt;
    return queue_->get(id);
}

std::optional<QueueStats> TaskClient::queue_stats(const std::optional<std::string>& target_agent) {
    if (!queue_) return std::nullopt;
    return queue_->stats(target_agent);
}
