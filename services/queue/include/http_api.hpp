#pragma once
#include <chrono>
#include <map>
#include <string>
#include "queue_manager.hpp"

struct HttpRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> query;
    std::string body;
};

struct HttpReply {
    int status{200};
    std::string body;
    std::string content_type{"application/json"};
};

// Routes daemon requests onto a QueueManager. Socket-free so it can be driven directly.
class QueueHttpApi {
public:
    QueueHttpApi(QueueManager& queue, int default_max_retries = 3,
                 std::chrono::minutes stuck_after = std::chrono::minutes(30));

    HttpReply handle(const HttpRequest& req);

private:
    EnqueueOptions options_from(const nlohmann::json& j) const;

    QueueManager& queue_;
    int default_max_retries_;
    std::chrono::minutes stuck_after_;
};
