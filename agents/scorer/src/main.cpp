#include <iostream>
#include <thread>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <nlohmann/json.hpp>
#include "../../../shared/cpp/agent_sdk/include/agent_client.hpp"
#include "../../../services/queue/include/agent_registry.hpp"
#include "../../../services/queue/include/errors.hpp"

using json = nlohmann::json;

static volatile std::sig_atomic_t g_stop = 0;

static std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : def;
}

static json score(const json& params) {
    if (!params.contains("doc_id")) throw HandlerError("missing doc_id", false);
    long doc_id = params.at("doc_id").get<long>();
    return json{{"score", doc_id * 10}};
}

static TaskOutcome process_task(const AgentHandler& handler, const Task& t) {
    const Operation* op = handler.resolve_operation(t.operation);
    if (!op) {
        return TaskOutcome::failure("Operation '" + t.operation + "' not found on agent 'scorer'", false);
    }
    try {
        return TaskOutcome::success((*op)(t.parameters));
    } catch (const HandlerError& e) {
        return TaskOutcome::failure(e.what(), e.retryable());
    } catch (const std::exception& e) {
        return TaskOutcome::failure(e.what());
    }
}

int main(int argc, char** argv) {
    const std::string agent = "scorer";
    const std::string queue_url = getenv_or("QUEUE_URL", "http://localhost:7000");
    int poll_ms = 1000;
    bool once = false;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--once") once = true;
        else if (a == "--poll-ms" && i + 1 < argc) poll_ms = std::stoi(argv[++i]);
    }

    std::signal(SIGTERM, [](int){ g_stop = 1; });
    std::signal(SIGINT, [](int){ g_stop = 1; });

    OperationTable scorer;
    scorer.add("score", score);

    AgentQueueClient client(queue_url);
    std::cout << "[scorer] Starting. QUEUE_URL=" << queue_url << " poll_ms=" << poll_ms << (once?" once":" loop") << std::endl;
    do {
        if (auto t = client.dequeue(agent)) {
            auto outcome = process_task(scorer, *t);
            if (!client.complete(*t, outcome)) {
                std::cerr << "[scorer] Could not report task " << t->id << ": " << client.last_error() << std::endl;
            } else if (!outcome.ok()) {
                std::cerr << "[scorer] Task " << t->id << " failed: " << outcome.error() << std::endl;
            }
        } else if (!once) {
            std::this_thread::sleep_for(std::chrono::milliseconds(poll_ms));
        }
    } while (!once && !g_stop);
    return 0;
}
