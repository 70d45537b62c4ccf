#include "../include/config.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <cstdlib>

static long getenv_long(const char* key, long def) {
    const char* v = std::getenv(key);
    if (!v || !*v) return def;
    char* end = nullptr;
    long n = std::strtol(v, &end, 10);
    if (*end != '\0' || n < 0) {
        throw ConfigurationError(std::string(key) + " must be a non-negative integer, got '" + v + "'");
    }
    return n;
}

QueueConfig QueueConfig::from_env() {
    QueueConfig c;
    c.db_path = getenv_or("AGENTQ_DB_PATH", c.db_path);
    c.port = static_cast<int>(getenv_long("QUEUE_PORT", c.port));
    c.poll_interval = std::chrono::milliseconds(getenv_long("AGENTQ_POLL_MS", c.poll_interval.count()));
    c.default_max_retries = static_cast<int>(getenv_long("AGENTQ_MAX_RETRIES", c.default_max_retries));
    c.retry_base = std::chrono::milliseconds(getenv_long("AGENTQ_RETRY_BASE_MS", c.retry_base.count()));
    c.retry_max = std::chrono::milliseconds(getenv_long("AGENTQ_RETRY_MAX_MS", c.retry_max.count()));
    c.stuck_after = std::chrono::minutes(getenv_long("AGENTQ_STUCK_MINUTES", c.stuck_after.count()));
    std::string level = getenv_or("AGENTQ_LOG_LEVEL", "info");
    try {
        c.log_level = parse_log_level(level);
    } catch (const std::invalid_argument& e) {
        throw ConfigurationError(std::string("AGENTQ_LOG_LEVEL: ") + e.what());
    }
    return c;
}

RetryPolicy QueueConfig::retry_policy() const {
    RetryPolicy p;
    p.base_delay = retry_base;
    p.max_delay = retry_max;
    return p;
}
