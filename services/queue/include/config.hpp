#pragma once
#include <chrono>
#include <string>
#include "log.hpp"
#include "queue_manager.hpp"

struct QueueConfig {
    std::string db_path{"./data/agent_queue.db"};
    int port{7000};
    std::chrono::milliseconds poll_interval{1000};
    int default_max_retries{3};
    std::chrono::milliseconds retry_base{500};
    std::chrono::milliseconds retry_max{30000};
    std::chrono::minutes stuck_after{30};
    LogLevel log_level{LogLevel::Info};

    // Throws ConfigurationError naming the variable on a malformed value.
    static QueueConfig from_env();

    RetryPolicy retry_policy() const;
};
