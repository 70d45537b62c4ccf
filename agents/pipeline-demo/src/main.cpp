#include <iostream>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "../../../services/queue/include/agent_registry.hpp"
#include "../../../services/queue/include/config.hpp"
#include "../../../services/queue/include/errors.hpp"
#include "../../../services/queue/include/worker_pool.hpp"
#include "../../../services/queue/include/workflow.hpp"

using json = nlohmann::json;

// Toy stand-ins for the query, scoring, citation and reporting agents.
static void register_agents(AgentRegistry& registry) {
    auto query = std::make_shared<OperationTable>();
    query->add("generate", [](const json& p) {
        std::string question = p.value("question", std::string());
        return json{{"query", "\"" + question + "\" AND humans[mesh]"}, {"doc_ids", {1, 2, 3}}};
    });
    registry.register_agent("query", query);

    auto scorer = std::make_shared<OperationTable>();
    scorer->add("score_all", [](const json& p) {
        json scores = json::object();
        for (const auto& id : p.at("query_result").at("doc_ids")) {
            scores[std::to_string(id.get<int>())] = id.get<int>() * 10;
        }
        return json{{"scores", scores}};
    });
    registry.register_agent("scorer", scorer);

    auto citer = std::make_shared<OperationTable>();
    citer->add("extract", [](const json& p) {
        json citations = json::array();
        for (const auto& kv : p.at("score_result").at("scores").items()) {
            if (kv.value().get<int>() >= p.value("min_score", 0)) citations.push_back("doc " + kv.key());
        }
        return json{{"citations", citations}};
    });
    registry.register_agent("citer", citer);

    auto reporter = std::make_shared<OperationTable>();
    reporter->add("synthesize", [](const json& p) {
        const auto& cites = p.at("cite_result").at("citations");
        if (cites.empty()) throw HandlerError("nothing to report", false);
        return json{{"report", "Report on " + p.value("question", std::string()) + " citing " +
                               std::to_string(cites.size()) + " documents"}};
    });
    registry.register_agent("reporter", reporter);
}

int main(int argc, char** argv) {
    QueueConfig cfg;
    std::string question = "statins and myopathy";
    try {
        cfg = QueueConfig::from_env();
        cfg.db_path = ":memory:";
        cfg.poll_interval = std::chrono::milliseconds(50);
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--db" && i + 1 < argc) cfg.db_path = argv[++i];
            else if (a == "--question" && i + 1 < argc) question = argv[++i];
        }
        set_log_level(cfg.log_level);

        QueueManager queue(cfg.db_path, cfg.retry_policy());
        queue.recover_orphaned();
        AgentRegistry registry;
        register_agents(registry);
        WorkerPoolOptions wopts;
        wopts.poll_interval = cfg.poll_interval;
        WorkerPool pool(queue, registry, wopts);

        Workflow wf("literature-review", {
            {"query", "query", "generate", json::object(), {}},
            {"score", "scorer", "score_all", json::object(), {"query"}},
            {"cite", "citer", "extract", json{{"min_score", 20}}, {"score"}},
            {"report", "reporter", "synthesize", json::object(), {"cite"}},
        });
        WorkflowEngine engine(queue, wf, json{{"question", question}});

        pool.start();
        WorkflowSummary summary;
        try {
            summary = engine.run_to_completion(cfg.poll_interval, std::chrono::seconds(30));
        } catch (const TimeoutError& e) {
            std::cerr << "[pipeline] " << e.what() << "\n";
            summary = engine.summary();
        }
        pool.stop();

        std::cout << summary.to_json().dump(2) << "\n";
        return summary.succeeded() ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}
