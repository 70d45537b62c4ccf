#include "../include/task_store.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <sqlite3.h>
#include <algorithm>
#include <filesystem>

using json = nlohmann::json;

namespace {
const char* kColumns =
    "id, source_agent, target_agent, operation, parameters, status, priority, result, error_message, "
    "retry_count, max_retries, created_at, started_at, claimed_at, completed_at, not_before, "
    "worker_id, process_id";

void bind_text(sqlite3_stmt* st, int idx, const std::string& v) {
    sqlite3_bind_text(st, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
}

void bind_opt_text(sqlite3_stmt* st, int idx, const std::optional<std::string>& v) {
    if (v) bind_text(st, idx, *v);
    else sqlite3_bind_null(st, idx);
}

void bind_opt_int64(sqlite3_stmt* st, int idx, const std::optional<Timestamp>& v) {
    if (v) sqlite3_bind_int64(st, idx, *v);
    else sqlite3_bind_null(st, idx);
}

std::optional<std::string> column_opt_text(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return std::string(reinterpret_cast<const char*>(sqlite3_column_text(st, col)));
}

std::optional<Timestamp> column_opt_int64(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_int64(st, col);
}

Task row_to_task(sqlite3_stmt* st) {
    Task t;
    try {
        t.id = *column_opt_text(st, 0);
        t.source_agent = column_opt_text(st, 1);
        t.target_agent = *column_opt_text(st, 2);
        t.operation = *column_opt_text(st, 3);
        t.parameters = json::parse(*column_opt_text(st, 4));
        t.status = parse_status(*column_opt_text(st, 5));
        t.priority = static_cast<TaskPriority>(sqlite3_column_int(st, 6));
        if (auto r = column_opt_text(st, 7)) t.result = json::parse(*r);
        t.error_message = column_opt_text(st, 8);
        t.retry_count = sqlite3_column_int(st, 9);
        t.max_retries = sqlite3_column_int(st, 10);
        t.created_at = sqlite3_column_int64(st, 11);
        t.started_at = column_opt_int64(st, 12);
        t.claimed_at = column_opt_int64(st, 13);
        t.completed_at = column_opt_int64(st, 14);
        t.not_before = column_opt_int64(st, 15);
        t.worker_id = column_opt_text(st, 16);
        if (auto pid = column_opt_int64(st, 17)) t.process_id = static_cast<long>(*pid);
    } catch (const std::exception& e) {
        throw StorageError(std::string("corrupt task row: ") + e.what());
    }
    return t;
}

// Resets a long-lived prepared statement on every exit path.
struct StmtReset {
    sqlite3_stmt* st;
    ~StmtReset() {
        sqlite3_reset(st);
        sqlite3_clear_bindings(st);
    }
};

// Statement prepared for a single call.
struct Stmt {
    sqlite3_stmt* st{nullptr};
    Stmt(sqlite3* db, const std::string& sql) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
            throw StorageError(std::string("prepare failed: ") + sqlite3_errmsg(db));
        }
    }
    ~Stmt() { if (st) sqlite3_finalize(st); }
    Stmt(const Stmt&) = delete;
    Stmt& operator=(const Stmt&) = delete;
};

class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) { run("BEGIN IMMEDIATE;"); }
    ~Transaction() {
        if (!done_) sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    }
    void commit() {
        run("COMMIT;");
        done_ = true;
    }

private:
    void run(const char* sql) {
        char* err = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
            std::string msg = err ? err : sqlite3_errmsg(db_);
            sqlite3_free(err);
            throw StorageError(std::string(sql) + " failed: " + msg);
        }
    }

    sqlite3* db_;
    bool done_{false};
};
}

int QueueStats::count(TaskStatus status) const {
    switch (status) {
    case TaskStatus::Pending: return pending;
    case TaskStatus::Processing: return processing;
    case TaskStatus::Completed: return completed;
    case TaskStatus::Failed: return failed;
    case TaskStatus::Cancelled: return cancelled;
    }
    return 0;
}

json QueueStats::to_json() const {
    return json{
        {"pending", pending},
        {"processing", processing},
        {"completed", completed},
        {"failed", failed},
        {"cancelled", cancelled},
        {"total", total()},
    };
}

TaskStore::TaskStore(const std::string& db_path) : path_(db_path) {
    if (db_path != ":memory:") {
        auto parent = std::filesystem::path(db_path).parent_path();
        std::error_code ec;
        if (!parent.empty()) std::filesystem::create_directories(parent, ec);
    }
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(db_path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError("Failed to open SQLite DB " + db_path + ": " + msg);
    }
    try {
        init();
        prepare_statements();
    } catch (...) {
        close_statements();
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

TaskStore::~TaskStore() {
    close_statements();
    if (db_) sqlite3_close(db_);
}

void TaskStore::init() {
    sqlite3_busy_timeout(db_, 5000);
    exec("PRAGMA journal_mode=WAL;");
    exec("CREATE TABLE IF NOT EXISTS tasks (\n"
         "  seq INTEGER PRIMARY KEY AUTOINCREMENT,\n"
         "  id TEXT NOT NULL UNIQUE,\n"
         "  source_agent TEXT,\n"
         "  target_agent TEXT NOT NULL,\n"
         "  operation TEXT NOT NULL,\n"
         "  parameters TEXT NOT NULL,\n"
         "  status TEXT NOT NULL,\n"
         "  priority INTEGER NOT NULL,\n"
         "  result TEXT,\n"
         "  error_message TEXT,\n"
         "  retry_count INTEGER NOT NULL DEFAULT 0,\n"
         "  max_retries INTEGER NOT NULL DEFAULT 3,\n"
         "  created_at INTEGER NOT NULL,\n"
         "  started_at INTEGER,\n"
         "  claimed_at INTEGER,\n"
         "  completed_at INTEGER,\n"
         "  not_before INTEGER,\n"
         "  worker_id TEXT,\n"
         "  process_id INTEGER\n"
         ");");
    exec("CREATE INDEX IF NOT EXISTS idx_tasks_claim "
         "ON tasks(target_agent, status, priority DESC, created_at ASC);");
    exec("CREATE INDEX IF NOT EXISTS idx_tasks_completed ON tasks(status, completed_at);");
}

void TaskStore::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        throw StorageError("SQLite error: " + msg);
    }
}

void TaskStore::fail(const std::string& what) {
    throw StorageError(what + ": " + sqlite3_errmsg(db_));
}

void TaskStore::prepare_statements() {
    const std::string ins = "INSERT INTO tasks \n"
                            "(id, source_agent, target_agent, operation, parameters, status, priority, \n"
                            " retry_count, max_retries, created_at) \n"
                            "VALUES (?, ?, ?, ?, ?, 'pending', ?, 0, ?, ?);";
    if (sqlite3_prepare_v2(db_, ins.c_str(), -1, &insert_stmt_, nullptr) != SQLITE_OK) {
        fail("prepare insert failed");
    }
    const std::string next = std::string("SELECT ") + kColumns + " FROM tasks \n"
                             "WHERE target_agent = ? AND status = 'pending' \n"
                             "  AND (not_before IS NULL OR not_before <= ?) \n"
                             "ORDER BY priority DESC, created_at ASC, seq ASC LIMIT 1;";
    if (sqlite3_prepare_v2(db_, next.c_str(), -1, &next_stmt_, nullptr) != SQLITE_OK) {
        fail("prepare select next failed");
    }
    const char* claim = "UPDATE tasks SET status = 'processing', started_at = COALESCE(started_at, ?1), \n"
                        "  claimed_at = ?1, worker_id = ?2, process_id = ?3 \n"
                        "WHERE id = ?4 AND status = 'pending';";
    if (sqlite3_prepare_v2(db_, claim, -1, &claim_stmt_, nullptr) != SQLITE_OK) {
        fail("prepare claim failed");
    }
    const std::string get = std::string("SELECT ") + kColumns + " FROM tasks WHERE id = ?;";
    if (sqlite3_prepare_v2(db_, get.c_str(), -1, &get_stmt_, nullptr) != SQLITE_OK) {
        fail("prepare get failed");
    }
    const char* upd = "UPDATE tasks SET status = ?1, result = ?2, error_message = COALESCE(?3, error_message), \n"
                      "  retry_count = ?4, not_before = ?5, completed_at = ?6, \n"
                      "  claimed_at = NULL, worker_id = NULL, process_id = NULL \n"
                      "WHERE id = ?7 AND status = 'processing' AND retry_count = ?8 AND claimed_at IS ?9;";
    if (sqlite3_prepare_v2(db_, upd, -1, &update_stmt_, nullptr) != SQLITE_OK) {
        fail("prepare update failed");
    }
}

void TaskStore::close_statements() {
    if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
    if (next_stmt_) { sqlite3_finalize(next_stmt_); next_stmt_ = nullptr; }
    if (claim_stmt_) { sqlite3_finalize(claim_stmt_); claim_stmt_ = nullptr; }
    if (get_stmt_) { sqlite3_finalize(get_stmt_); get_stmt_ = nullptr; }
    if (update_stmt_) { sqlite3_finalize(update_stmt_); update_stmt_ = nullptr; }
}

void TaskStore::insert_locked(const Task& task) {
    StmtReset guard{insert_stmt_};
    bind_text(insert_stmt_, 1, task.id);
    bind_opt_text(insert_stmt_, 2, task.source_agent);
    bind_text(insert_stmt_, 3, task.target_agent);
    bind_text(insert_stmt_, 4, task.operation);
    bind_text(insert_stmt_, 5, task.parameters.dump());
    sqlite3_bind_int(insert_stmt_, 6, static_cast<int>(task.priority));
    sqlite3_bind_int(insert_stmt_, 7, task.max_retries);
    sqlite3_bind_int64(insert_stmt_, 8, task.created_at);
    if (sqlite3_step(insert_stmt_) != SQLITE_DONE) {
        fail("insert task " + task.id + " failed");
    }
}

std::string TaskStore::insert(const Task& task) {
    std::lock_guard<std::mutex> lock(mtx_);
    Transaction tx(db_);
    insert_locked(task);
    tx.commit();
    return task.id;
}

std::vector<std::string> TaskStore::insert_batch(const std::vector<Task>& tasks) {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<std::string> ids;
    ids.reserve(tasks.size());
    Transaction tx(db_);
    for (const auto& t : tasks) {
        insert_locked(t);
        ids.push_back(t.id);
    }
    tx.commit();
    return ids;
}

std::optional<Task> TaskStore::select_next_locked(const std::string& target_agent, Timestamp now) {
    StmtReset guard{next_stmt_};
    bind_text(next_stmt_, 1, target_agent);
    sqlite3_bind_int64(next_stmt_, 2, now);
    int rc = sqlite3_step(next_stmt_);
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) fail("select next task failed");
    return row_to_task(next_stmt_);
}

std::optional<Task> TaskStore::claim_next(const std::string& target_agent, const std::string& worker_id, long process_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    Transaction tx(db_);
    Timestamp now = std::max(now_micros(), last_claim_ + 1);
    auto task = select_next_locked(target_agent, now);
    if (!task) {
        tx.commit();
        return std::nullopt;
    }
    {
        StmtReset guard{claim_stmt_};
        sqlite3_bind_int64(claim_stmt_, 1, now);
        bind_text(claim_stmt_, 2, worker_id);
        sqlite3_bind_int64(claim_stmt_, 3, process_id);
        bind_text(claim_stmt_, 4, task->id);
        if (sqlite3_step(claim_stmt_) != SQLITE_DONE) fail("claim task " + task->id + " failed");
        if (sqlite3_changes(db_) != 1) {
            // Unreachable under BEGIN IMMEDIATE; treat as nothing claimable.
            tx.commit();
            return std::nullopt;
        }
    }
    tx.commit();
    last_claim_ = now;
    task->status = TaskStatus::Processing;
    if (!task->started_at) task->started_at = now;
    task->claimed_at = now;
    task->worker_id = worker_id;
    task->process_id = process_id;
    return task;
}

std::optional<Task> TaskStore::peek_next(const std::string& target_agent) {
    std::lock_guard<std::mutex> lock(mtx_);
    return select_next_locked(target_agent, now_micros());
}

bool TaskStore::update_terminal(const std::string& id, int expected_retry_count,
                                std::optional<Timestamp> expected_claimed_at, const TaskTransition& tr) {
    // Encoded before the transaction opens; dump() throws on invalid UTF-8.
    std::optional<std::string> result_text;
    if (tr.result) result_text = tr.result->dump();
    std::lock_guard<std::mutex> lock(mtx_);
    Transaction tx(db_);
    bool applied = false;
    {
        StmtReset guard{update_stmt_};
        bind_text(update_stmt_, 1, to_string(tr.status));
        bind_opt_text(update_stmt_, 2, result_text);
        bind_opt_text(update_stmt_, 3, tr.error_message);
        sqlite3_bind_int(update_stmt_, 4, tr.retry_count);
        bind_opt_int64(update_stmt_, 5, tr.not_before);
        if (is_terminal(tr.status)) sqlite3_bind_int64(update_stmt_, 6, now_micros());
        else sqlite3_bind_null(update_stmt_, 6);
        bind_text(update_stmt_, 7, id);
        sqlite3_bind_int(update_stmt_, 8, expected_retry_count);
        bind_opt_int64(update_stmt_, 9, expected_claimed_at);
        if (sqlite3_step(update_stmt_) != SQLITE_DONE) fail("update task " + id + " failed");
        applied = sqlite3_changes(db_) == 1;
    }
    tx.commit();
    return applied;
}

std::optional<Task> TaskStore::get(const std::string& id) {
    std::lock_guard<std::mutex> lock(mtx_);
    StmtReset guard{get_stmt_};
    bind_text(get_stmt_, 1, id);
    int rc = sqlite3_step(get_stmt_);
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) fail("get task " + id + " failed");
    return row_to_task(get_stmt_);
}

QueueStats TaskStore::stats(const std::optional<std::string>& target_agent) {
    std::lock_guard<std::mutex> lock(mtx_);
    std::string sql = "SELECT status, COUNT(*) FROM tasks ";
    if (target_agent) sql += "WHERE target_agent = ? ";
    sql += "GROUP BY status;";
    Stmt s(db_, sql);
    if (target_agent) bind_text(s.st, 1, *target_agent);
    QueueStats out;
    int rc;
    while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) {
        std::string status = reinterpret_cast<const char*>(sqlite3_column_text(s.st, 0));
        int n = sqlite3_column_int(s.st, 1);
        TaskStatus parsed = TaskStatus::Pending;
        try {
            parsed = parse_status(status);
        } catch (const std::exception& e) {
            throw StorageError(std::string("corrupt status in tasks table: ") + e.what());
        }
        switch (parsed) {
        case TaskStatus::Pending: out.pending = n; break;
        case TaskStatus::Processing: out.processing = n; break;
        case TaskStatus::Completed: out.completed = n; break;
        case TaskStatus::Failed: out.failed = n; break;
        case TaskStatus::Cancelled: out.cancelled = n; break;
        }
    }
    if (rc != SQLITE_DONE) fail("stats query failed");
    return out;
}

std::size_t TaskStore::purge_completed(Timestamp older_than) {
    std::lock_guard<std::mutex> lock(mtx_);
    Transaction tx(db_);
    Stmt s(db_, "DELETE FROM tasks WHERE status IN ('completed', 'failed', 'cancelled') AND completed_at <= ?;");
    sqlite3_bind_int64(s.st, 1, older_than);
    if (sqlite3_step(s.st) != SQLITE_DONE) fail("purge failed");
    auto removed = static_cast<std::size_t>(sqlite3_changes(db_));
    tx.commit();
    return removed;
}

std::size_t TaskStore::cancel_pending(const std::optional<std::string>& target_agent,
                                      const std::optional<std::string>& source_agent) {
    std::lock_guard<std::mutex> lock(mtx_);
    std::string sql = "UPDATE tasks SET status = 'cancelled', completed_at = ? WHERE status = 'pending'";
    if (target_agent) sql += " AND target_agent = ?";
    if (source_agent) sql += " AND source_agent = ?";
    sql += ";";
    Transaction tx(db_);
    Stmt s(db_, sql);
    int idx = 1;
    sqlite3_bind_int64(s.st, idx++, now_micros());
    if (target_agent) bind_text(s.st, idx++, *target_agent);
    if (source_agent) bind_text(s.st, idx++, *source_agent);
    if (sqlite3_step(s.st) != SQLITE_DONE) fail("cancel failed");
    auto cancelled = static_cast<std::size_t>(sqlite3_changes(db_));
    tx.commit();
    return cancelled;
}

std::vector<Task> TaskStore::list_processing() {
    std::lock_guard<std::mutex> lock(mtx_);
    Stmt s(db_, std::string("SELECT ") + kColumns + " FROM tasks WHERE status = 'processing' ORDER BY seq ASC;");
    std::vector<Task> out;
    int rc;
    while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) out.push_back(row_to_task(s.st));
    if (rc != SQLITE_DONE) fail("list processing failed");
    return out;
}

bool TaskStore::release(const std::string& id, std::optional<Timestamp> expected_claimed_at,
                        const std::optional<std::string>& fail_message) {
    std::lock_guard<std::mutex> lock(mtx_);
    Transaction tx(db_);
    std::string sql = fail_message
        ? "UPDATE tasks SET status = 'failed', error_message = ?, completed_at = ?, \n"
          "  claimed_at = NULL, worker_id = NULL, process_id = NULL \n"
          "WHERE id = ? AND status = 'processing' AND claimed_at IS ?;"
        : "UPDATE tasks SET status = 'pending', claimed_at = NULL, worker_id = NULL, process_id = NULL \n"
          "WHERE id = ? AND status = 'processing' AND claimed_at IS ?;";
    Stmt s(db_, sql);
    int idx = 1;
    if (fail_message) {
        bind_text(s.st, idx++, *fail_message);
        sqlite3_bind_int64(s.st, idx++, now_micros());
    }
    bind_text(s.st, idx++, id);
    bind_opt_int64(s.st, idx, expected_claimed_at);
    if (sqlite3_step(s.st) != SQLITE_DONE) fail("release task " + id + " failed");
    bool applied = sqlite3_changes(db_) == 1;
    tx.commit();
    return applied;
}

ActiveSummary TaskStore::active_summary() {
    std::lock_guard<std::mutex> lock(mtx_);
    Stmt s(db_,
           "SELECT COUNT(*), \n"
           "  MIN(CASE WHEN status = 'pending' THEN created_at END), \n"
           "  MAX(created_at) \n"
           "FROM tasks WHERE status IN ('pending', 'processing');");
    if (sqlite3_step(s.st) != SQLITE_ROW) fail("active summary failed");
    ActiveSummary out;
    out.active = sqlite3_column_int(s.st, 0);
    out.oldest_pending = column_opt_int64(s.st, 1);
    out.newest_active = column_opt_int64(s.st, 2);
    return out;
}
