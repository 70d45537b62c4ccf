#include <algorithm>
#include <atomic>
#include <filesystem>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include "../include/errors.hpp"
#include "../include/task_store.hpp"
#include "../include/util.hpp"
#include "test_support.hpp"

using json = nlohmann::json;

namespace {

Task make_task(const std::string& agent, int n, TaskPriority priority = TaskPriority::Normal) {
    Task t;
    t.id = gen_uuid();
    t.target_agent = agent;
    t.operation = "score";
    t.parameters = json{{"n", n}};
    t.priority = priority;
    t.created_at = now_micros();
    return t;
}

// Drains target_agent from `store` on `threads` threads and returns every claimed id.
std::vector<std::string> claim_all(std::vector<TaskStore*> stores, const std::string& agent, int threads) {
    std::mutex mtx;
    std::vector<std::string> claimed;
    std::vector<std::thread> pool;
    for (int i = 0; i < threads; ++i) {
        TaskStore* store = stores[static_cast<std::size_t>(i) % stores.size()];
        pool.emplace_back([&, store, i]() {
            const std::string worker = "w" + std::to_string(i);
            while (auto t = store->claim_next(agent, worker, current_process_id())) {
                std::lock_guard<std::mutex> lock(mtx);
                claimed.push_back(t->id);
            }
        });
    }
    for (auto& t : pool) t.join();
    return claimed;
}

TEST(TaskStore, CreatesParentDirectories) {
    TempDb tmp;
    auto nested = (std::filesystem::path(tmp.dir()) / "a" / "b" / "tasks.db").string();
    TaskStore store(nested);
    EXPECT_TRUE(std::filesystem::exists(nested));
    EXPECT_EQ(store.path(), nested);
}

TEST(TaskStore, InsertAndGet) {
    TempDb tmp;
    TaskStore store(tmp.path());
    auto t = make_task("scorer", 1, TaskPriority::High);
    t.source_agent = "orchestrator";
    t.max_retries = 5;
    store.insert(t);

    auto got = store.get(t.id);
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->status, TaskStatus::Pending);
    EXPECT_EQ(got->priority, TaskPriority::High);
    EXPECT_EQ(got->source_agent, std::optional<std::string>("orchestrator"));
    EXPECT_EQ(got->parameters, (json{{"n", 1}}));
    EXPECT_EQ(got->max_retries, 5);
    EXPECT_EQ(got->retry_count, 0);
    EXPECT_EQ(got->created_at, t.created_at);
    EXPECT_FALSE(got->started_at.has_value());
    EXPECT_FALSE(store.get("missing").has_value());
}

TEST(TaskStore, SurvivesReopen) {
    TempDb tmp;
    std::string id;
    {
        TaskStore store(tmp.path());
        id = store.insert(make_task("scorer", 1));
    }
    TaskStore reopened(tmp.path());
    auto got = reopened.get(id);
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->target_agent, "scorer");
    EXPECT_EQ(reopened.stats().pending, 1);
}

TEST(TaskStore, InsertBatchIsOneUnit) {
    TempDb tmp;
    TaskStore store(tmp.path());
    std::vector<Task> batch;
    for (int i = 0; i < 10; ++i) batch.push_back(make_task("scorer", i));
    auto ids = store.insert_batch(batch);
    ASSERT_EQ(ids.size(), 10u);
    EXPECT_EQ(ids.front(), batch.front().id);
    EXPECT_EQ(store.stats("scorer").pending, 10);

    // A duplicate id aborts the whole batch.
    std::vector<Task> bad{make_task("scorer", 100), batch[3]};
    EXPECT_THROW(store.insert_batch(bad), StorageError);
    EXPECT_EQ(store.stats("scorer").total(), 10);
}

TEST(TaskStore, ClaimStampsOwnership) {
    TempDb tmp;
    TaskStore store(tmp.path());
    auto id = store.insert(make_task("scorer", 1));
    auto t = store.claim_next("scorer", "worker-a", 4242);
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->id, id);
    EXPECT_EQ(t->status, TaskStatus::Processing);
    EXPECT_EQ(t->worker_id, std::optional<std::string>("worker-a"));
    EXPECT_EQ(t->process_id, std::optional<long>(4242));
    ASSERT_TRUE(t->started_at.has_value());

    auto stored = store.get(id);
    EXPECT_EQ(stored->status, TaskStatus::Processing);
    EXPECT_EQ(stored->claimed_at, t->claimed_at);
    EXPECT_FALSE(store.claim_next("scorer", "worker-b", 4242).has_value());
    EXPECT_FALSE(store.claim_next("other", "worker-b", 4242).has_value());
}

TEST(TaskStore, UpdateIsCompareAndSet) {
    TempDb tmp;
    TaskStore store(tmp.path());
    auto id = store.insert(make_task("scorer", 1));
    auto claimed = store.claim_next("scorer", "w", 1);
    ASSERT_TRUE(claimed.has_value());
    ASSERT_TRUE(claimed->claimed_at.has_value());

    TaskTransition done;
    done.status = TaskStatus::Completed;
    done.result = json{{"score", 10}};
    EXPECT_FALSE(store.update_terminal(id, 1, claimed->claimed_at, done)); // stale retry_count
    EXPECT_FALSE(store.update_terminal(id, 0, *claimed->claimed_at - 1, done)); // someone else's claim
    EXPECT_FALSE(store.update_terminal(id, 0, std::nullopt, done));
    EXPECT_TRUE(store.update_terminal(id, 0, claimed->claimed_at, done));
    EXPECT_FALSE(store.update_terminal(id, 0, claimed->claimed_at, done)); // no longer processing

    auto t = store.get(id);
    EXPECT_EQ(t->status, TaskStatus::Completed);
    EXPECT_EQ(t->result, std::optional<json>(json{{"score", 10}}));
    EXPECT_TRUE(t->completed_at.has_value());
    EXPECT_FALSE(t->worker_id.has_value());
}

TEST(TaskStore, UnencodableResultLeavesRowUntouched) {
    TempDb tmp;
    TaskStore store(tmp.path());
    auto id = store.insert(make_task("scorer", 1));
    auto claimed = store.claim_next("scorer", "w", 1);
    ASSERT_TRUE(claimed.has_value());

    TaskTransition done;
    done.status = TaskStatus::Completed;
    done.result = json{{"text", std::string("caf\xe9")}}; // Latin-1, not UTF-8
    EXPECT_THROW(store.update_terminal(id, 0, claimed->claimed_at, done), json::exception);

    // The store is still usable and the claim can still be resolved.
    EXPECT_EQ(store.get(id)->status, TaskStatus::Processing);
    done.result = json{{"text", "cafe"}};
    EXPECT_TRUE(store.update_terminal(id, 0, claimed->claimed_at, done));
}

TEST(TaskStore, ReclaimGetsAFreshClaimStamp) {
    TempDb tmp;
    TaskStore store(tmp.path());
    auto id = store.insert(make_task("scorer", 1));
    auto first = store.claim_next("scorer", "w", 1);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(store.release(id, first->claimed_at, std::nullopt));
    auto second = store.claim_next("scorer", "w", 1);
    ASSERT_TRUE(second.has_value());
    EXPECT_GT(*second->claimed_at, *first->claimed_at);
    EXPECT_EQ(second->started_at, first->started_at);
}

TEST(TaskStore, CorruptStatusIsAStorageError) {
    TempDb tmp;
    TaskStore store(tmp.path());
    store.insert(make_task("scorer", 1));

    sqlite3* raw = nullptr;
    ASSERT_EQ(sqlite3_open(tmp.path().c_str(), &raw), SQLITE_OK);
    sqlite3_busy_timeout(raw, 5000);
    EXPECT_EQ(sqlite3_exec(raw, "UPDATE tasks SET status = 'exploded';", nullptr, nullptr, nullptr), SQLITE_OK);
    sqlite3_close(raw);

    EXPECT_THROW(store.stats(), StorageError);
    EXPECT_THROW(store.stats(std::string("scorer")), StorageError);
}

TEST(TaskStore, ConcurrentClaimsOnOneConnection) {
    TempDb tmp;
    TaskStore store(tmp.path());
    std::vector<Task> batch;
    for (int i = 0; i < 60; ++i) batch.push_back(make_task("scorer", i));
    store.insert_batch(batch);

    auto claimed = claim_all({&store}, "scorer", 8);
    std::set<std::string> unique(claimed.begin(), claimed.end());
    EXPECT_EQ(claimed.size(), 60u);
    EXPECT_EQ(unique.size(), 60u);
    EXPECT_EQ(store.stats().processing, 60);
}

TEST(TaskStore, MoreClaimersThanTasks) {
    TempDb tmp;
    TaskStore store(tmp.path());
    for (int i = 0; i < 3; ++i) store.insert(make_task("scorer", i));

    std::atomic<int> winners{0};
    std::atomic<int> losers{0};
    std::vector<std::thread> claimers;
    for (int i = 0; i < 10; ++i) {
        claimers.emplace_back([&]() {
            if (store.claim_next("scorer", "w", current_process_id())) ++winners;
            else ++losers;
        });
    }
    for (auto& t : claimers) t.join();
    EXPECT_EQ(winners.load(), 3);
    EXPECT_EQ(losers.load(), 7);
    EXPECT_EQ(store.stats().processing, 3);
}

TEST(TaskStore, ConcurrentClaimsAcrossConnections) {
    TempDb tmp;
    TaskStore first(tmp.path());
    TaskStore second(tmp.path());
    std::vector<Task> batch;
    for (int i = 0; i < 40; ++i) batch.push_back(make_task("scorer", i));
    first.insert_batch(batch);

    auto claimed = claim_all({&first, &second}, "scorer", 6);
    std::set<std::string> unique(claimed.begin(), claimed.end());
    EXPECT_EQ(claimed.size(), 40u);
    EXPECT_EQ(unique.size(), 40u);
    EXPECT_EQ(second.stats().pending, 0);
}

TEST(TaskStore, ReleaseAndListProcessing) {
    TempDb tmp;
    TaskStore store(tmp.path());
    auto a = store.insert(make_task("scorer", 1));
    auto b = store.insert(make_task("scorer", 2));
    auto ca = store.claim_next("scorer", "w", 1);
    auto cb = store.claim_next("scorer", "w", 1);
    ASSERT_TRUE(ca && cb);
    ASSERT_EQ(ca->id, a);
    ASSERT_EQ(store.list_processing().size(), 2u);

    EXPECT_FALSE(store.release(a, cb->claimed_at, std::nullopt)); // wrong claim
    EXPECT_TRUE(store.release(a, ca->claimed_at, std::nullopt));
    EXPECT_TRUE(store.release(b, cb->claimed_at, std::string("gone")));
    EXPECT_FALSE(store.release(a, ca->claimed_at, std::nullopt));

    auto ta = store.get(a);
    EXPECT_EQ(ta->status, TaskStatus::Pending);
    EXPECT_FALSE(ta->process_id.has_value());
    auto tb = store.get(b);
    EXPECT_EQ(tb->status, TaskStatus::Failed);
    EXPECT_EQ(tb->error_message, std::optional<std::string>("gone"));
    EXPECT_TRUE(store.list_processing().empty());
}

TEST(TaskStore, ActiveSummary) {
    TempDb tmp;
    TaskStore store(tmp.path());
    auto empty = store.active_summary();
    EXPECT_EQ(empty.active, 0);
    EXPECT_FALSE(empty.oldest_pending.has_value());

    auto first = make_task("scorer", 1);
    store.insert(first);
    auto second = make_task("scorer", 2);
    second.created_at = first.created_at + 10;
    store.insert(second);
    store.claim_next("scorer", "w", 1); // claims `first`

    auto s = store.active_summary();
    EXPECT_EQ(s.active, 2);
    EXPECT_EQ(s.oldest_pending, std::optional<Timestamp>(second.created_at));
    EXPECT_EQ(s.newest_active, std::optional<Timestamp>(second.created_at));
}

}
