#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "agent_registry.hpp"
#include "queue_manager.hpp"

struct ProgressEvent {
    std::string type; // task_started | task_completed | task_failed
    std::string message;
    nlohmann::json data;
};

using ProgressCallback = std::function<void(const ProgressEvent&)>;

struct WorkerPoolOptions {
    std::chrono::milliseconds poll_interval{1000};
    std::chrono::milliseconds error_backoff{2000}; // after a storage error in the loop
};

// One polling thread per registered agent type. Shutdown is cooperative: stop() lets each
// loop finish the task it holds and then joins it.
class WorkerPool {
public:
    WorkerPool(QueueManager& queue, AgentRegistry& registry, WorkerPoolOptions opts = {});
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void add_progress_callback(ProgressCallback cb);

    void start();
    void stop();
    bool running() const { return running_; }
    std::size_t thread_count() const;

    // One claim cycle on the calling thread; true if a task was claimed and resolved.
    bool run_once(const std::string& agent_type);
    // Runs cycles until nothing is claimable for any registered agent; returns tasks processed.
    std::size_t drain();

    nlohmann::json stats();

private:
    void worker_loop(const std::string& agent_type);
    void process(const Task& task, const AgentHandler* handler);
    void notify(const std::string& type, const std::string& message, const nlohmann::json& data);
    void sleep_for(std::chrono::milliseconds d);

    QueueManager& queue_;
    AgentRegistry& registry_;
    WorkerPoolOptions opts_;

    std::mutex callbacks_mtx_;
    std::vector<ProgressCallback> callbacks_;

    mutable std::mutex threads_mtx_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
    std::mutex wake_mtx_;
    std::condition_variable wake_cv_;
};
