#include <chrono>
#include <string>
#include <thread>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "../include/http_api.hpp"
#include "test_support.hpp"

using json = nlohmann::json;

namespace {

class HttpApiTest : public ::testing::Test {
protected:
    HttpReply call(const std::string& method, const std::string& path,
                   std::map<std::string, std::string> query = {}, const std::string& body = "") {
        return api_.handle(HttpRequest{method, path, std::move(query), body});
    }

    std::string enqueue(const json& body) {
        auto r = call("POST", "/enqueue", {}, body.dump());
        EXPECT_EQ(r.status, 200) << r.body;
        return json::parse(r.body).at("id").get<std::string>();
    }

    TempDb tmp_;
    QueueManager queue_{tmp_.path()};
    QueueHttpApi api_{queue_, 5};
};

TEST_F(HttpApiTest, EnqueueDequeueComplete) {
    auto id = enqueue(json{{"target_agent", "scorer"}, {"operation", "score"},
                           {"parameters", {{"doc_id", 3}}}, {"priority", "high"}});
    auto stored = queue_.get(id);
    EXPECT_EQ(stored->priority, TaskPriority::High);
    EXPECT_EQ(stored->max_retries, 5);

    auto r = call("GET", "/dequeue", {{"agent", "scorer"}});
    ASSERT_EQ(r.status, 200);
    auto task = json::parse(r.body);
    EXPECT_EQ(task.at("id"), id);
    EXPECT_EQ(task.at("status"), "processing");
    EXPECT_EQ(task.at("parameters").at("doc_id"), 3);

    EXPECT_EQ(call("GET", "/dequeue", {{"agent", "scorer"}}).status, 204);

    r = call("POST", "/complete/" + id, {}, json{{"ok", {{"score", 30}}}}.dump());
    ASSERT_EQ(r.status, 200);
    EXPECT_EQ(json::parse(r.body).at("applied"), true);
    r = call("POST", "/complete/" + id, {}, json{{"ok", {{"score", 99}}}}.dump());
    EXPECT_EQ(json::parse(r.body).at("applied"), false);

    r = call("GET", "/tasks/" + id);
    ASSERT_EQ(r.status, 200);
    auto done = json::parse(r.body);
    EXPECT_EQ(done.at("status"), "completed");
    EXPECT_EQ(done.at("result").at("score"), 30);
}

TEST_F(HttpApiTest, FailureEnvelope) {
    auto id = enqueue(json{{"agent", "scorer"}, {"operation", "score"}});
    call("GET", "/dequeue", {{"agent", "scorer"}});
    auto r = call("POST", "/complete/" + id, {}, json{{"error", "bad doc"}, {"retry", false}}.dump());
    EXPECT_EQ(json::parse(r.body).at("applied"), true);
    auto t = queue_.get(id);
    EXPECT_EQ(t->status, TaskStatus::Failed);
    EXPECT_EQ(t->error_message, std::optional<std::string>("bad doc"));
}

TEST_F(HttpApiTest, BatchStatsAndPeek) {
    auto r = call("POST", "/enqueue_batch", {},
                  json{{"target_agent", "scorer"}, {"operation", "score"},
                       {"parameter_list", {{{"doc_id", 1}}, {{"doc_id", 2}}}}}.dump());
    ASSERT_EQ(r.status, 200) << r.body;
    auto ids = json::parse(r.body).at("ids");
    ASSERT_EQ(ids.size(), 2u);

    r = call("GET", "/peek", {{"agent", "scorer"}});
    ASSERT_EQ(r.status, 200);
    EXPECT_EQ(json::parse(r.body).at("id"), ids[0]);

    r = call("GET", "/stats", {{"agent", "scorer"}});
    auto stats = json::parse(r.body);
    EXPECT_EQ(stats.at("pending"), 2);
    EXPECT_EQ(stats.at("total"), 2);
    EXPECT_EQ(json::parse(call("GET", "/stats", {{"agent", "citer"}}).body).at("total"), 0);
}

TEST_F(HttpApiTest, ControlAndCancel) {
    enqueue(json{{"target_agent", "scorer"}, {"operation", "score"}});
    enqueue(json{{"target_agent", "scorer"}, {"operation", "score"}, {"source_agent", "bot"}});

    EXPECT_EQ(call("POST", "/control/pause", {{"agent", "scorer"}}).status, 200);
    EXPECT_EQ(json::parse(call("GET", "/control/state").body).at("paused"), json::array({"scorer"}));
    EXPECT_EQ(call("GET", "/dequeue", {{"agent", "scorer"}}).status, 204);
    call("POST", "/control/resume", {{"agent", "scorer"}});
    EXPECT_TRUE(json::parse(call("GET", "/control/state").body).at("paused").empty());

    auto r = call("DELETE", "/jobs", {{"agent", "scorer"}, {"source", "bot"}});
    EXPECT_EQ(json::parse(r.body).at("cancelled"), 1);
    r = call("DELETE", "/jobs", {{"agent", "scorer"}});
    EXPECT_EQ(json::parse(r.body).at("cancelled"), 1);
    EXPECT_EQ(queue_.stats().cancelled, 2);
}

TEST_F(HttpApiTest, HealthCleanupRecover) {
    auto r = call("GET", "/health");
    ASSERT_EQ(r.status, 200);
    EXPECT_TRUE(json::parse(r.body).contains("status_counts"));

    r = call("POST", "/cleanup", {{"older_than_hours", "1"}});
    EXPECT_EQ(json::parse(r.body).at("removed"), 0);
    r = call("POST", "/recover");
    EXPECT_EQ(json::parse(r.body).at("recovered"), 0);
    r = call("POST", "/recover", {{"stuck_minutes", "10"}, {"mark_failed", "1"}});
    EXPECT_EQ(json::parse(r.body).at("recovered"), 0);
}

TEST_F(HttpApiTest, RecoverRejectsBadAges) {
    auto id = enqueue(json{{"target_agent", "scorer"}, {"operation", "score"}});
    ASSERT_EQ(call("GET", "/dequeue", {{"agent", "scorer"}}).status, 200);

    EXPECT_EQ(call("POST", "/recover", {{"stuck_minutes", "-1"}}).status, 400);
    EXPECT_EQ(call("POST", "/recover", {{"stuck_minutes", "-1"}, {"mark_failed", "1"}}).status, 400);
    EXPECT_EQ(call("POST", "/recover", {{"stuck_minutes", "9223372036854775807"}}).status, 400);
    EXPECT_EQ(call("POST", "/recover", {{"stuck_minutes", "99999999999999999999999"}}).status, 400);
    EXPECT_EQ(call("POST", "/recover", {{"stuck_minutes", "5m"}}).status, 400);

    // The claim survived every rejected sweep.
    EXPECT_EQ(queue_.get(id)->status, TaskStatus::Processing);
    EXPECT_EQ(call("GET", "/dequeue", {{"agent", "scorer"}}).status, 204);
}

TEST_F(HttpApiTest, CleanupRejectsBadAges) {
    auto id = enqueue(json{{"target_agent", "scorer"}, {"operation", "score"}});
    call("GET", "/dequeue", {{"agent", "scorer"}});
    call("POST", "/complete/" + id, {}, json{{"ok", {{"score", 1}}}}.dump());

    EXPECT_EQ(call("POST", "/cleanup", {{"older_than_hours", "-1"}}).status, 400);
    EXPECT_EQ(call("POST", "/cleanup", {{"older_than_hours", "9223372036854775807"}}).status, 400);
    EXPECT_EQ(call("POST", "/cleanup", {{"older_than_hours", "2562047788015"}}).status, 400);
    EXPECT_TRUE(queue_.get(id).has_value());

    auto r = call("POST", "/cleanup", {{"older_than_hours", "0"}});
    ASSERT_EQ(r.status, 200);
    EXPECT_EQ(json::parse(r.body).at("removed"), 1);
}

TEST_F(HttpApiTest, CompletePinnedToClaim) {
    auto id = enqueue(json{{"target_agent", "scorer"}, {"operation", "score"}});
    auto first = json::parse(call("GET", "/dequeue", {{"agent", "scorer"}}).body);
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    ASSERT_EQ(json::parse(call("POST", "/recover", {{"stuck_minutes", "0"}}).body).at("recovered"), 1);
    auto second = json::parse(call("GET", "/dequeue", {{"agent", "scorer"}}).body);
    ASSERT_EQ(second.at("id"), id);

    auto r = call("POST", "/complete/" + id, {},
                  json{{"ok", {{"who", "first"}}}, {"claimed_at", first.at("claimed_at")}}.dump());
    ASSERT_EQ(r.status, 200);
    EXPECT_EQ(json::parse(r.body).at("applied"), false);

    r = call("POST", "/complete/" + id, {},
             json{{"ok", {{"who", "second"}}}, {"claimed_at", second.at("claimed_at")}}.dump());
    EXPECT_EQ(json::parse(r.body).at("applied"), true);
    EXPECT_EQ(queue_.get(id)->result->at("who"), "second");

    EXPECT_EQ(call("POST", "/complete/" + id, {}, json{{"ok", 1}, {"claimed_at", "yesterday"}}.dump()).status, 400);
}

TEST_F(HttpApiTest, BadRequests) {
    EXPECT_EQ(call("POST", "/enqueue", {}, "{not json").status, 400);
    EXPECT_EQ(call("POST", "/enqueue", {}, json{{"operation", "score"}}.dump()).status, 400);
    EXPECT_EQ(call("POST", "/enqueue", {}, json{{"target_agent", "s"}, {"operation", "o"}, {"priority", "critical"}}.dump()).status, 400);
    EXPECT_EQ(call("POST", "/enqueue", {}, json{{"target_agent", "s"}, {"operation", "o"}, {"parameters", {1, 2}}}.dump()).status, 400);
    EXPECT_EQ(call("GET", "/dequeue").status, 400);
    EXPECT_EQ(call("POST", "/complete/abc", {}, json{{"status", "ok"}}.dump()).status, 400);
    EXPECT_EQ(call("POST", "/cleanup", {{"older_than_hours", "soon"}}).status, 400);
    EXPECT_EQ(call("GET", "/tasks/does-not-exist").status, 404);
    EXPECT_EQ(call("GET", "/nowhere").status, 404);
    EXPECT_EQ(call("PUT", "/enqueue").status, 404);
    EXPECT_EQ(queue_.stats().total(), 0);
}

}
