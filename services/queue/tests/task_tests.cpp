#include <stdexcept>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "../include/queue_manager.hpp"
#include "../include/task.hpp"
#include "../include/task_codec.hpp"
#include "../include/util.hpp"

using json = nlohmann::json;

namespace {

TEST(TaskModel, StatusNamesRoundTrip) {
    for (auto s : {TaskStatus::Pending, TaskStatus::Processing, TaskStatus::Completed,
                   TaskStatus::Failed, TaskStatus::Cancelled}) {
        EXPECT_EQ(parse_status(to_string(s)), s);
    }
    EXPECT_STREQ(to_string(TaskStatus::Processing), "processing");
    EXPECT_THROW(parse_status("done"), std::invalid_argument);
}

TEST(TaskModel, PriorityOrderingAndNames) {
    EXPECT_LT(static_cast<int>(TaskPriority::Low), static_cast<int>(TaskPriority::Normal));
    EXPECT_LT(static_cast<int>(TaskPriority::Normal), static_cast<int>(TaskPriority::High));
    EXPECT_LT(static_cast<int>(TaskPriority::High), static_cast<int>(TaskPriority::Urgent));
    EXPECT_EQ(parse_priority("urgent"), TaskPriority::Urgent);
    EXPECT_STREQ(to_string(TaskPriority::Low), "low");
    EXPECT_THROW(parse_priority("critical"), std::invalid_argument);
}

TEST(TaskModel, TerminalStatuses) {
    EXPECT_FALSE(is_terminal(TaskStatus::Pending));
    EXPECT_FALSE(is_terminal(TaskStatus::Processing));
    EXPECT_TRUE(is_terminal(TaskStatus::Completed));
    EXPECT_TRUE(is_terminal(TaskStatus::Failed));
    EXPECT_TRUE(is_terminal(TaskStatus::Cancelled));
}

TEST(TaskOutcome, SuccessWrapsNonObjectResults) {
    auto o = TaskOutcome::success(42);
    EXPECT_TRUE(o.ok());
    EXPECT_EQ(o.result(), (json{{"result", 42}}));
    EXPECT_EQ(normalize_result(json{{"score", 3}}), (json{{"score", 3}}));
    EXPECT_EQ(normalize_result(json::array({1, 2})), (json{{"result", json::array({1, 2})}}));
}

TEST(TaskOutcome, EnvelopeParsing) {
    auto ok = TaskOutcome::from_json(json{{"ok", {{"score", 10}}}});
    EXPECT_TRUE(ok.ok());
    EXPECT_EQ(ok.result().at("score"), 10);

    auto err = TaskOutcome::from_json(json{{"error", "boom"}, {"retry", false}});
    EXPECT_FALSE(err.ok());
    EXPECT_FALSE(err.retryable());
    EXPECT_EQ(err.error(), "boom");
    EXPECT_EQ(err.to_json(), (json{{"error", "boom"}, {"retry", false}}));

    EXPECT_TRUE(TaskOutcome::from_json(json{{"error", "x"}}).retryable());
    EXPECT_THROW(TaskOutcome::from_json(json{{"status", "done"}}), std::invalid_argument);
    EXPECT_THROW(TaskOutcome::from_json(json::array()), std::invalid_argument);
}

TEST(Timestamps, Iso8601Format) {
    EXPECT_EQ(format_iso8601(0), "1970-01-01T00:00:00.000000Z");
    const std::string s = "2024-03-01T12:30:45.123456Z";
    EXPECT_EQ(format_iso8601(parse_iso8601(s)), s);
    EXPECT_EQ(parse_iso8601("2024-03-01T12:30:45Z") % 1000000, 0);
    EXPECT_THROW(parse_iso8601("yesterday"), std::invalid_argument);
    EXPECT_THROW(parse_iso8601("2024-03-01T12:30:45+02:00"), std::invalid_argument);
}

TEST(Util, UuidShape) {
    auto a = gen_uuid();
    auto b = gen_uuid();
    ASSERT_EQ(a.size(), 36u);
    EXPECT_EQ(a[8], '-');
    EXPECT_EQ(a[14], '4');
    EXPECT_NE(a, b);
}

TEST(TaskCodec, WireFormat) {
    Task t;
    t.id = "t-1";
    t.target_agent = "scorer";
    t.operation = "score";
    t.parameters = json{{"doc_id", 7}};
    t.status = TaskStatus::Processing;
    t.priority = TaskPriority::High;
    t.created_at = parse_iso8601("2024-01-02T03:04:05.000006Z");
    t.claimed_at = t.created_at + 1000;
    t.worker_id = "w";
    t.process_id = 1234;

    json j = task_to_json(t);
    EXPECT_EQ(j.at("status"), "processing");
    EXPECT_EQ(j.at("priority"), "high");
    EXPECT_EQ(j.at("created_at"), "2024-01-02T03:04:05.000006Z");
    EXPECT_TRUE(j.at("source_agent").is_null());
    EXPECT_TRUE(j.at("result").is_null());

    Task back = task_from_json(j);
    EXPECT_EQ(back.id, t.id);
    EXPECT_EQ(back.priority, TaskPriority::High);
    EXPECT_EQ(back.created_at, t.created_at);
    EXPECT_EQ(back.claimed_at, t.claimed_at);
    EXPECT_EQ(back.process_id, t.process_id);
    EXPECT_FALSE(back.source_agent.has_value());
}

TEST(RetryPolicy, BoundedExponentialDelay) {
    RetryPolicy p;
    p.base_delay = std::chrono::milliseconds(500);
    p.max_delay = std::chrono::milliseconds(1500);
    p.jitter = 0.0;
    EXPECT_EQ(p.delay_for(1, 0.5).count(), 500);
    EXPECT_EQ(p.delay_for(2, 0.5).count(), 1000);
    EXPECT_EQ(p.delay_for(3, 0.5).count(), 1500);
    EXPECT_EQ(p.delay_for(10, 0.5).count(), 1500);

    p.jitter = 0.2;
    EXPECT_NEAR(p.delay_for(1, 0.0).count(), 400, 1);
    EXPECT_NEAR(p.delay_for(1, 1.0).count(), 600, 1);

    RetryPolicy immediate;
    EXPECT_EQ(immediate.delay_for(3, 0.7).count(), 0);
}

}
