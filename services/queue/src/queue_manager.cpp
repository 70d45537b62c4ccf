#include "../include/queue_manager.hpp"
#include "../include/log.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

using json = nlohmann::json;

static const char* kTag = "queue";
static const char* kStuckMessage = "Task stuck in processing (process terminated or timeout)";

// now minus a non-negative age given in units of unit_micros.
static Timestamp cutoff_before(long long count, long long unit_micros, const char* what) {
    if (count < 0) throw std::invalid_argument(std::string(what) + " must be >= 0");
    if (count > std::numeric_limits<Timestamp>::max() / 2 / unit_micros) {
        throw std::invalid_argument(std::string(what) + " is out of range");
    }
    return now_micros() - static_cast<Timestamp>(count) * unit_micros;
}

std::chrono::milliseconds RetryPolicy::delay_for(int retry_count, double unit_random) const {
    if (base_delay.count() <= 0 || retry_count <= 0) return std::chrono::milliseconds(0);
    double delay = static_cast<double>(base_delay.count()) * std::pow(2.0, retry_count - 1);
    delay = std::min(delay, static_cast<double>(max_delay.count()));
    double factor = 1.0 + jitter * (2.0 * unit_random - 1.0);
    delay = std::min(delay * factor, static_cast<double>(max_delay.count()));
    return std::chrono::milliseconds(static_cast<long long>(std::max(0.0, delay)));
}

json QueueHealth::to_json() const {
    auto ts = [](const std::optional<Timestamp>& t) { return t ? json(format_iso8601(*t)) : json(nullptr); };
    return json{
        {"status_counts", counts.to_json()},
        {"stuck_tasks", stuck},
        {"orphaned_tasks", orphaned},
        {"active_tasks", active},
        {"oldest_pending_task", ts(oldest_pending)},
        {"newest_task", ts(newest_active)},
        {"current_process_id", process_id},
        {"queue_database", database},
    };
}

QueueManager::QueueManager(const std::string& db_path, RetryPolicy retry)
    : store_(std::make_unique<TaskStore>(db_path)),
      retry_(retry),
      process_id_(current_process_id()),
      rng_(std::random_device{}()) {}

Task QueueManager::make_task(const std::string& target_agent,
                             const std::string& operation,
                             const json& parameters,
                             const EnqueueOptions& opts) const {
    if (target_agent.empty()) throw std::invalid_argument("target_agent is required");
    if (operation.empty()) throw std::invalid_argument("operation is required");
    if (!parameters.is_null() && !parameters.is_object()) {
        throw std::invalid_argument("parameters must be a JSON object");
    }
    if (opts.max_retries < 0) throw std::invalid_argument("max_retries must be >= 0");
    Task t;
    t.id = gen_uuid();
    t.source_agent = opts.source_agent;
    t.target_agent = target_agent;
    t.operation = operation;
    t.parameters = parameters.is_null() ? json::object() : parameters;
    t.priority = opts.priority;
    t.max_retries = opts.max_retries;
    t.created_at = now_micros();
    return t;
}

std::string QueueManager::enqueue(const std::string& target_agent,
                                  const std::string& operation,
                                  const json& parameters,
                                  const EnqueueOptions& opts) {
    Task t = make_task(target_agent, operation, parameters, opts);
    store_->insert(t);
    log_debug(kTag, "enqueued " + t.id + " for " + target_agent + "." + operation);
    return t.id;
}

std::vector<std::string> QueueManager::enqueue_batch(const std::string& target_agent,
                                                     const std::string& operation,
                                                     const std::vector<json>& parameter_list,
                                                     const EnqueueOptions& opts) {
    std::vector<Task> tasks;
    tasks.reserve(parameter_list.size());
    for (const auto& p : parameter_list) tasks.push_back(make_task(target_agent, operation, p, opts));
    if (tasks.empty()) return {};
    auto ids = store_->insert_batch(tasks);
    log_debug(kTag, "enqueued batch of " + std::to_string(ids.size()) + " for " + target_agent + "." + operation);
    return ids;
}

std::optional<Task> QueueManager::claim(const std::string& target_agent) {
    if (is_paused(target_agent)) return std::nullopt;
    std::shared_lock<std::shared_mutex> sweep(sweep_mtx_);
    auto task = store_->claim_next(target_agent, current_worker_id(), process_id_);
    if (task) {
        std::lock_guard<std::mutex> lock(state_mtx_);
        inflight_[task->id] = task->claimed_at.value_or(0);
    }
    return task;
}

std::vector<Task> QueueManager::claim_batch(const std::string& target_agent, std::size_t max_tasks) {
    std::vector<Task> out;
    while (out.size() < max_tasks) {
        auto t = claim(target_agent);
        if (!t) break;
        out.push_back(std::move(*t));
    }
    return out;
}

std::optional<Task> QueueManager::peek(const std::string& target_agent) {
    return store_->peek_next(target_agent);
}

void QueueManager::untrack(const std::string& id, std::optional<Timestamp> claimed_at) {
    std::lock_guard<std::mutex> lock(state_mtx_);
    auto it = inflight_.find(id);
    if (it == inflight_.end()) return;
    if (claimed_at && it->second != *claimed_at) return; // a newer claim of the same task
    inflight_.erase(it);
}

double QueueManager::next_unit_random() {
    std::lock_guard<std::mutex> lock(state_mtx_);
    return std::uniform_real_distribution<double>(0.0, 1.0)(rng_);
}

bool QueueManager::complete(const std::string& id, const json& result) {
    return complete_claim(id, std::nullopt, result);
}

bool QueueManager::complete(const Task& claimed, const json& result) {
    if (!claimed.claimed_at) throw std::invalid_argument("task " + claimed.id + " carries no claim");
    return complete_claim(claimed.id, claimed.claimed_at, result);
}

bool QueueManager::complete_claim(const std::string& id, std::optional<Timestamp> claimed_at, const json& result) {
    TaskTransition tr;
    tr.status = TaskStatus::Completed;
    tr.result = normalize_result(result);
    try {
        (void)tr.result->dump();
    } catch (const json::exception& e) {
        log_error(kTag, "task " + id + " produced a result that cannot be stored: " + e.what());
        fail_claim(id, claimed_at, std::string("result not serializable: ") + e.what(), false);
        return false;
    }

    auto current = store_->get(id);
    if (!current || current->status != TaskStatus::Processing) {
        log_debug(kTag, "complete ignored for " + id + " (not processing)");
        untrack(id, claimed_at);
        return false;
    }
    if (claimed_at && current->claimed_at != claimed_at) {
        log_warn(kTag, "complete ignored for " + id + " (claim superseded)");
        untrack(id, claimed_at);
        return false;
    }
    ClaimScope scope(*this, id, current->claimed_at);
    tr.retry_count = current->retry_count;
    return store_->update_terminal(id, current->retry_count, current->claimed_at, tr);
}

FailDisposition QueueManager::fail(const std::string& id, const std::string& error_message, bool retry) {
    return fail_claim(id, std::nullopt, error_message, retry);
}

FailDisposition QueueManager::fail(const Task& claimed, const std::string& error_message, bool retry) {
    if (!claimed.claimed_at) throw std::invalid_argument("task " + claimed.id + " carries no claim");
    return fail_claim(claimed.id, claimed.claimed_at, error_message, retry);
}

FailDisposition QueueManager::fail_claim(const std::string& id, std::optional<Timestamp> claimed_at,
                                         const std::string& error_message, bool retry) {
    auto current = store_->get(id);
    if (!current || current->status != TaskStatus::Processing) {
        log_debug(kTag, "fail ignored for " + id + " (not processing)");
        untrack(id, claimed_at);
        return FailDisposition::Ignored;
    }
    if (claimed_at && current->claimed_at != claimed_at) {
        log_warn(kTag, "fail ignored for " + id + " (claim superseded)");
        untrack(id, claimed_at);
        return FailDisposition::Ignored;
    }
    ClaimScope scope(*this, id, current->claimed_at);
    TaskTransition tr;
    tr.error_message = error_message;
    FailDisposition disposition;
    if (retry && current->retry_count < current->max_retries) {
        tr.status = TaskStatus::Pending;
        tr.retry_count = current->retry_count + 1;
        auto delay = retry_.delay_for(tr.retry_count, next_unit_random());
        if (delay.count() > 0) tr.not_before = now_micros() + delay.count() * 1000;
        disposition = FailDisposition::Retrying;
    } else {
        tr.status = TaskStatus::Failed;
        tr.retry_count = current->retry_count;
        disposition = FailDisposition::Failed;
    }
    if (!store_->update_terminal(id, current->retry_count, current->claimed_at, tr)) return FailDisposition::Ignored;
    if (disposition == FailDisposition::Retrying) {
        log_warn(kTag, "task " + id + " failed, retry " + std::to_string(tr.retry_count) + "/" +
                       std::to_string(current->max_retries) + ": " + error_message);
    } else {
        log_error(kTag, "task " + id + " failed permanently: " + error_message);
    }
    return disposition;
}

bool QueueManager::apply(const std::string& id, const TaskOutcome& outcome) {
    return apply(id, std::nullopt, outcome);
}

bool QueueManager::apply(const Task& claimed, const TaskOutcome& outcome) {
    if (!claimed.claimed_at) throw std::invalid_argument("task " + claimed.id + " carries no claim");
    return apply(claimed.id, claimed.claimed_at, outcome);
}

bool QueueManager::apply(const std::string& id, std::optional<Timestamp> claimed_at, const TaskOutcome& outcome) {
    if (outcome.ok()) return complete_claim(id, claimed_at, outcome.result());
    return fail_claim(id, claimed_at, outcome.error(), outcome.retryable()) != FailDisposition::Ignored;
}

std::optional<Task> QueueManager::get(const std::string& id) {
    return store_->get(id);
}

QueueStats QueueManager::stats(const std::optional<std::string>& target_agent) {
    return store_->stats(target_agent);
}

std::size_t QueueManager::cleanup(std::chrono::seconds older_than) {
    Timestamp cutoff = cutoff_before(older_than.count(), 1000000, "cleanup age");
    auto removed = store_->purge_completed(cutoff);
    if (removed) log_info(kTag, "purged " + std::to_string(removed) + " finished tasks");
    return removed;
}

std::size_t QueueManager::cancel(const std::optional<std::string>& target_agent,
                                 const std::optional<std::string>& source_agent) {
    auto cancelled = store_->cancel_pending(target_agent, source_agent);
    if (cancelled) log_info(kTag, "cancelled " + std::to_string(cancelled) + " pending tasks");
    return cancelled;
}

bool QueueManager::is_orphaned(const Task& task) const {
    if (!task.process_id) return true;
    if (*task.process_id == process_id_) {
        std::lock_guard<std::mutex> lock(state_mtx_);
        auto it = inflight_.find(task.id);
        return it == inflight_.end() || it->second != task.claimed_at.value_or(0);
    }
    return !process_alive(*task.process_id);
}

std::size_t QueueManager::recover_orphaned() {
    std::unique_lock<std::shared_mutex> sweep(sweep_mtx_);
    std::size_t recovered = 0;
    for (const auto& t : store_->list_processing()) {
        if (!is_orphaned(t)) continue;
        if (store_->release(t.id, t.claimed_at, std::nullopt)) ++recovered;
    }
    if (recovered) log_info(kTag, "recovered " + std::to_string(recovered) + " orphaned tasks");
    return recovered;
}

std::size_t QueueManager::recover_stuck(std::chrono::minutes timeout, bool mark_failed) {
    Timestamp cutoff = cutoff_before(timeout.count(), 60LL * 1000000, "stuck timeout");
    std::size_t recovered = 0;
    for (const auto& t : store_->list_processing()) {
        Timestamp claimed = t.claimed_at ? *t.claimed_at : t.started_at.value_or(0);
        if (claimed >= cutoff) continue;
        auto msg = mark_failed ? std::optional<std::string>(kStuckMessage) : std::nullopt;
        if (store_->release(t.id, t.claimed_at, msg)) {
            untrack(t.id, t.claimed_at);
            ++recovered;
        }
    }
    if (recovered) {
        log_warn(kTag, std::string(mark_failed ? "failed " : "reset ") + std::to_string(recovered) + " stuck tasks");
    }
    return recovered;
}

QueueHealth QueueManager::health(std::chrono::minutes stuck_after) {
    Timestamp cutoff = cutoff_before(stuck_after.count(), 60LL * 1000000, "stuck threshold");
    std::unique_lock<std::shared_mutex> sweep(sweep_mtx_);
    QueueHealth h;
    h.counts = store_->stats();
    for (const auto& t : store_->list_processing()) {
        Timestamp claimed = t.claimed_at ? *t.claimed_at : t.started_at.value_or(0);
        if (claimed < cutoff) ++h.stuck;
        if (is_orphaned(t)) ++h.orphaned;
    }
    auto active = store_->active_summary();
    h.active = active.active;
    h.oldest_pending = active.oldest_pending;
    h.newest_active = active.newest_active;
    h.process_id = process_id_;
    h.database = store_->path();
    return h;
}

void QueueManager::pause(const std::string& agent_type) {
    std::lock_guard<std::mutex> lock(state_mtx_);
    paused_.insert(agent_type);
    log_info(kTag, "paused " + agent_type);
}

void QueueManager::resume(const std::string& agent_type) {
    std::lock_guard<std::mutex> lock(state_mtx_);
    paused_.erase(agent_type);
    log_info(kTag, "resumed " + agent_type);
}

bool QueueManager::is_paused(const std::string& agent_type) const {
    std::lock_guard<std::mutex> lock(state_mtx_);
    return paused_.count(agent_type) > 0;
}

std::vector<std::string> QueueManager::paused_agents() const {
    std::lock_guard<std::mutex> lock(state_mtx_);
    return std::vector<std::string>(paused_.begin(), paused_.end());
}
