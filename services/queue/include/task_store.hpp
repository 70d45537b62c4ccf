#pragma once
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "task.hpp"

struct QueueStats {
    int pending{0};
    int processing{0};
    int completed{0};
    int failed{0};
    int cancelled{0};

    int count(TaskStatus status) const;
    int total() const { return pending + processing + completed + failed + cancelled; }
    nlohmann::json to_json() const;
};

// Fields written when a task leaves PROCESSING.
struct TaskTransition {
    TaskStatus status{TaskStatus::Completed};
    std::optional<nlohmann::json> result;
    std::optional<std::string> error_message;
    int retry_count{0};
    std::optional<Timestamp> not_before;
};

struct ActiveSummary {
    int active{0}; // pending + processing
    std::optional<Timestamp> oldest_pending;
    std::optional<Timestamp> newest_active;
};

// SQLite-backed durable task table. Every public call is one transaction; claims use
// BEGIN IMMEDIATE so separate connections on the same file never claim the same row.
class TaskStore {
public:
    explicit TaskStore(const std::string& db_path);
    ~TaskStore();

    TaskStore(const TaskStore&) = delete;
    TaskStore& operator=(const TaskStore&) = delete;

    const std::string& path() const { return path_; }

    std::string insert(const Task& task);
    std::vector<std::string> insert_batch(const std::vector<Task>& tasks);

    std::optional<Task> claim_next(const std::string& target_agent, const std::string& worker_id, long process_id);
    std::optional<Task> peek_next(const std::string& target_agent);

    // Compare-and-set: applies only while the row is PROCESSING under the same claim
    // (claimed_at) and retry_count. Throws before touching the row if the result cannot be encoded.
    bool update_terminal(const std::string& id, int expected_retry_count,
                         std::optional<Timestamp> expected_claimed_at, const TaskTransition& transition);

    std::optional<Task> get(const std::string& id);
    QueueStats stats(const std::optional<std::string>& target_agent = std::nullopt);
    std::size_t purge_completed(Timestamp older_than);
    std::size_t cancel_pending(const std::optional<std::string>& target_agent,
                               const std::optional<std::string>& source_agent);

    std::vector<Task> list_processing();
    // Moves a PROCESSING task back to PENDING, or to FAILED when fail_message is set.
    // Only the claim identified by expected_claimed_at is released.
    bool release(const std::string& id, std::optional<Timestamp> expected_claimed_at,
                 const std::optional<std::string>& fail_message);
    ActiveSummary active_summary();

private:
    void init();
    void exec(const std::string& sql);
    void prepare_statements();
    void close_statements();
    void insert_locked(const Task& task);
    std::optional<Task> select_next_locked(const std::string& target_agent, Timestamp now);
    [[noreturn]] void fail(const std::string& what);

    std::string path_;
    std::mutex mtx_;
    Timestamp last_claim_{0}; // claimed_at values handed out by this store strictly increase
    struct sqlite3* db_ {nullptr};
    struct sqlite3_stmt* insert_stmt_ {nullptr};
    struct sqlite3_stmt* next_stmt_ {nullptr};
    struct sqlite3_stmt* claim_stmt_ {nullptr};
    struct sqlite3_stmt* get_stmt_ {nullptr};
    struct sqlite3_stmt* update_stmt_ {nullptr};
};
