#include "../include/worker_pool.hpp"
#include "../include/errors.hpp"
#include "../include/log.hpp"

using json = nlohmann::json;

static const char* kTag = "worker";

WorkerPool::WorkerPool(QueueManager& queue, AgentRegistry& registry, WorkerPoolOptions opts)
    : queue_(queue), registry_(registry), opts_(opts) {}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::add_progress_callback(ProgressCallback cb) {
    std::lock_guard<std::mutex> lock(callbacks_mtx_);
    callbacks_.push_back(std::move(cb));
}

void WorkerPool::notify(const std::string& type, const std::string& message, const json& data) {
    std::vector<ProgressCallback> cbs;
    {
        std::lock_guard<std::mutex> lock(callbacks_mtx_);
        cbs = callbacks_;
    }
    for (auto& cb : cbs) {
        try {
            cb(ProgressEvent{type, message, data});
        } catch (const std::exception& e) {
            log_warn(kTag, std::string("Progress callback error: ") + e.what());
        }
    }
}

void WorkerPool::start() {
    std::lock_guard<std::mutex> lock(threads_mtx_);
    if (!threads_.empty()) {
        log_warn(kTag, "Processing already started");
        return;
    }
    stopping_ = false;
    for (const auto& agent_type : registry_.agent_types()) {
        threads_.emplace_back(&WorkerPool::worker_loop, this, agent_type);
    }
    running_ = true;
    log_info(kTag, "Started " + std::to_string(threads_.size()) + " agent processing threads");
}

void WorkerPool::stop() {
    std::lock_guard<std::mutex> lock(threads_mtx_);
    if (threads_.empty()) return;
    {
        std::lock_guard<std::mutex> wake(wake_mtx_);
        stopping_ = true;
    }
    wake_cv_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
    running_ = false;
    log_info(kTag, "Stopped agent processing");
}

std::size_t WorkerPool::thread_count() const {
    std::lock_guard<std::mutex> lock(threads_mtx_);
    return threads_.size();
}

void WorkerPool::sleep_for(std::chrono::milliseconds d) {
    std::unique_lock<std::mutex> lock(wake_mtx_);
    wake_cv_.wait_for(lock, d, [this]() { return stopping_.load(); });
}

void WorkerPool::worker_loop(const std::string& agent_type) {
    log_info(kTag, "Started processing tasks for agent: " + agent_type);
    while (!stopping_) {
        try {
            if (!run_once(agent_type)) sleep_for(opts_.poll_interval);
        } catch (const std::exception& e) {
            log_error(kTag, "Error in task processing loop for " + agent_type + ": " + e.what());
            sleep_for(opts_.error_backoff);
        }
    }
    log_info(kTag, "Stopped processing tasks for agent: " + agent_type);
}

bool WorkerPool::run_once(const std::string& agent_type) {
    auto handler = registry_.find(agent_type);
    if (!handler) return false;
    auto task = queue_.claim(agent_type);
    if (!task) return false;
    process(*task, handler.get());
    return true;
}

std::size_t WorkerPool::drain() {
    std::size_t processed = 0;
    bool progressed = true;
    while (progressed) {
        progressed = false;
        for (const auto& agent_type : registry_.agent_types()) {
            while (run_once(agent_type)) {
                ++processed;
                progressed = true;
            }
        }
    }
    return processed;
}

void WorkerPool::process(const Task& task, const AgentHandler* handler) {
    notify("task_started", "Processing task " + task.id,
           json{{"task_id", task.id}, {"agent_type", task.target_agent}, {"operation", task.operation}});

    const Operation* op = handler->resolve_operation(task.operation);
    if (!op) {
        ConfigurationError err("Operation '" + task.operation + "' not found on agent '" + task.target_agent + "'");
        log_error(kTag, err.what());
        queue_.fail(task, err.what(), false);
        notify("task_failed", "Task " + task.id + " failed",
               json{{"task_id", task.id}, {"agent_type", task.target_agent}, {"error", err.what()}, {"retry", false}});
        return;
    }

    TaskOutcome outcome = TaskOutcome::failure("unknown error");
    try {
        outcome = TaskOutcome::success((*op)(task.parameters));
    } catch (const HandlerError& e) {
        outcome = TaskOutcome::failure(e.what(), e.retryable());
    } catch (const std::exception& e) {
        outcome = TaskOutcome::failure(e.what(), true);
    } catch (...) {
        outcome = TaskOutcome::failure("non-standard exception from operation " + task.operation, true);
    }

    if (outcome.ok()) {
        try {
            (void)outcome.result().dump();
        } catch (const json::exception& e) {
            outcome = TaskOutcome::failure(std::string("result not serializable: ") + e.what(), false);
        }
    }

    if (!queue_.apply(task, outcome)) {
        log_warn(kTag, "Task " + task.id + " was resolved elsewhere; dropping this outcome");
        return;
    }
    if (outcome.ok()) {
        notify("task_completed", "Task " + task.id + " completed",
               json{{"task_id", task.id}, {"agent_type", task.target_agent}, {"result", outcome.result()}});
    } else {
        log_error(kTag, "Task " + task.id + " failed: " + outcome.error());
        notify("task_failed", "Task " + task.id + " failed",
               json{{"task_id", task.id}, {"agent_type", task.target_agent}, {"error", outcome.error()},
                    {"retry", outcome.retryable()}});
    }
}

json WorkerPool::stats() {
    json by_agent = json::object();
    for (const auto& agent_type : registry_.agent_types()) {
        by_agent[agent_type] = queue_.stats(agent_type).to_json();
    }
    return json{
        {"overall", queue_.stats().to_json()},
        {"by_agent", by_agent},
        {"registered_agents", registry_.size()},
        {"processing_threads", thread_count()},
    };
}
