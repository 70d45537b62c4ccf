#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "task.hpp"
#include "task_store.hpp"

// Bounded exponential backoff applied before a failed task becomes claimable again.
struct RetryPolicy {
    std::chrono::milliseconds base_delay{0};
    std::chrono::milliseconds max_delay{30000};
    double jitter{0.2}; // +/- fraction of the computed delay

    // retry_count is the value after the increment (1 for the first retry).
    std::chrono::milliseconds delay_for(int retry_count, double unit_random) const;
};

enum class FailDisposition {
    Retrying, // back to PENDING
    Failed,   // terminal
    Ignored,  // unknown id or not PROCESSING
};

struct QueueHealth {
    QueueStats counts;
    int stuck{0};
    int orphaned{0};
    int active{0};
    std::optional<Timestamp> oldest_pending;
    std::optional<Timestamp> newest_active;
    long process_id{0};
    std::string database;

    nlohmann::json to_json() const;
};

class QueueManager {
public:
    explicit QueueManager(const std::string& db_path, RetryPolicy retry = {});

    QueueManager(const QueueManager&) = delete;
    QueueManager& operator=(const QueueManager&) = delete;

    TaskStore& store() { return *store_; }
    const RetryPolicy& retry_policy() const { return retry_; }

    std::string enqueue(const std::string& target_agent,
                        const std::string& operation,
                        const nlohmann::json& parameters,
                        const EnqueueOptions& opts = {});
    std::vector<std::string> enqueue_batch(const std::string& target_agent,
                                           const std::string& operation,
                                           const std::vector<nlohmann::json>& parameter_list,
                                           const EnqueueOptions& opts = {});

    std::optional<Task> claim(const std::string& target_agent);
    std::vector<Task> claim_batch(const std::string& target_agent, std::size_t max_tasks);
    std::optional<Task> peek(const std::string& target_agent);

    // false when the task is not PROCESSING (already terminal, unknown, or never claimed).
    // The Task overloads resolve only the claim they were handed; a task that was recovered
    // and claimed again since then is left to its new owner.
    bool complete(const std::string& id, const nlohmann::json& result);
    bool complete(const Task& claimed, const nlohmann::json& result);
    FailDisposition fail(const std::string& id, const std::string& error_message, bool retry = true);
    FailDisposition fail(const Task& claimed, const std::string& error_message, bool retry = true);
    bool apply(const std::string& id, const TaskOutcome& outcome);
    bool apply(const Task& claimed, const TaskOutcome& outcome);
    // Same as apply(id, ...) but pinned to the claim stamped claimed_at.
    bool apply(const std::string& id, std::optional<Timestamp> claimed_at, const TaskOutcome& outcome);

    std::optional<Task> get(const std::string& id);
    QueueStats stats(const std::optional<std::string>& target_agent = std::nullopt);
    // Negative ages and ages beyond the microsecond clock range throw std::invalid_argument.
    std::size_t cleanup(std::chrono::seconds older_than);
    std::size_t cancel(const std::optional<std::string>& target_agent,
                       const std::optional<std::string>& source_agent = std::nullopt);

    // Startup sweep: PROCESSING tasks with no live owner go back to PENDING.
    std::size_t recover_orphaned();
    std::size_t recover_stuck(std::chrono::minutes timeout, bool mark_failed = false);
    QueueHealth health(std::chrono::minutes stuck_after = std::chrono::minutes(30));

    void pause(const std::string& agent_type);
    void resume(const std::string& agent_type);
    bool is_paused(const std::string& agent_type) const;
    std::vector<std::string> paused_agents() const;

private:
    // Drops the in-flight entry for one claim when the resolving call returns or throws.
    class ClaimScope {
    public:
        ClaimScope(QueueManager& queue, std::string id, std::optional<Timestamp> claimed_at)
            : queue_(queue), id_(std::move(id)), claimed_at_(claimed_at) {}
        ~ClaimScope() { queue_.untrack(id_, claimed_at_); }
        ClaimScope(const ClaimScope&) = delete;
        ClaimScope& operator=(const ClaimScope&) = delete;

    private:
        QueueManager& queue_;
        std::string id_;
        std::optional<Timestamp> claimed_at_;
    };

    // claimed_at unset means "whatever claim the row currently holds".
    bool complete_claim(const std::string& id, std::optional<Timestamp> claimed_at, const nlohmann::json& result);
    FailDisposition fail_claim(const std::string& id, std::optional<Timestamp> claimed_at,
                               const std::string& error_message, bool retry);
    Task make_task(const std::string& target_agent,
                   const std::string& operation,
                   const nlohmann::json& parameters,
                   const EnqueueOptions& opts) const;
    bool is_orphaned(const Task& task) const;
    void untrack(const std::string& id, std::optional<Timestamp> claimed_at);
    double next_unit_random();

    std::unique_ptr<TaskStore> store_;
    RetryPolicy retry_;
    long process_id_;

    // Claims hold it shared until the claim is recorded in inflight_; orphan sweeps hold it exclusively.
    std::shared_mutex sweep_mtx_;
    mutable std::mutex state_mtx_;
    std::unordered_map<std::string, Timestamp> inflight_; // id -> claimed_at, claimed here and not yet resolved
    std::set<std::string> paused_;
    std::mt19937_64 rng_;
};
