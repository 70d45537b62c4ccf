#pragma once
#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "queue_manager.hpp"
#include "task.hpp"

struct WorkflowStep {
    std::string name;
    std::string target_agent;
    std::string operation;
    nlohmann::json parameters = nlohmann::json::object();
    std::vector<std::string> depends_on;
    TaskPriority priority{TaskPriority::Normal};
    int max_retries{3};
};

enum class StepState {
    NotReady,
    Ready,
    Submitted,
    Completed,
    Failed,
    Skipped, // a transitive dependency failed
};

const char* to_string(StepState state);

// A validated DAG of steps plus the completed/failed bookkeeping. Not persisted.
class Workflow {
public:
    // Throws ConfigurationError on duplicate names, unknown dependencies, or cycles.
    Workflow(std::string name, std::vector<WorkflowStep> steps);

    const std::string& name() const { return name_; }
    const std::vector<WorkflowStep>& steps() const { return steps_; }
    const WorkflowStep& step(const std::string& name) const;
    bool has_step(const std::string& name) const { return index_.count(name) > 0; }

    // Steps in declaration order that are neither completed nor failed and whose
    // dependencies are all completed.
    std::vector<std::string> ready_steps() const;

    // false if the step already reached completed or failed.
    bool mark_completed(const std::string& name);
    bool mark_failed(const std::string& name);

    const std::set<std::string>& completed_steps() const { return completed_; }
    const std::set<std::string>& failed_steps() const { return failed_; }

    // The failed step that transitively blocks `name`, if any.
    std::optional<std::string> blocked_by(const std::string& name) const;
    std::vector<std::string> skipped_steps() const;

    // Every step is completed, failed, or blocked by a failure.
    bool is_finished() const;

private:
    void validate() const;

    std::string name_;
    std::vector<WorkflowStep> steps_;
    std::map<std::string, std::size_t> index_;
    std::set<std::string> completed_;
    std::set<std::string> failed_;
};

struct StepReport {
    std::string name;
    StepState state{StepState::NotReady};
    std::optional<std::string> task_id;
    std::optional<nlohmann::json> result;
    std::optional<std::string> error;
    std::optional<std::string> blocked_by;
};

struct WorkflowSummary {
    std::string workflow;
    std::vector<StepReport> steps;

    bool succeeded() const;
    std::vector<std::string> names_in(StepState state) const;
    nlohmann::json to_json() const;
};

// Drives a Workflow through the queue: submits ready steps once, polls their tasks,
// and records outcomes until nothing more can run.
class WorkflowEngine {
public:
    WorkflowEngine(QueueManager& queue,
                   Workflow& workflow,
                   nlohmann::json initial_parameters = nlohmann::json::object(),
                   std::string source_agent = "orchestrator");

    // Non-blocking pass. Returns the number of steps newly submitted.
    std::size_t advance();

    // Throws TimeoutError if the budget elapses first; summary() still reflects progress.
    WorkflowSummary run_to_completion(std::chrono::milliseconds poll_interval, std::chrono::milliseconds timeout);

    StepState state(const std::string& step) const;
    std::optional<std::string> task_id(const std::string& step) const;
    const std::map<std::string, nlohmann::json>& results() const { return results_; }
    WorkflowSummary summary() const;

private:
    nlohmann::json step_parameters(const WorkflowStep& step) const;
    bool collect();

    QueueManager& queue_;
    Workflow& workflow_;
    nlohmann::json initial_parameters_;
    std::string source_agent_;
    std::map<std::string, std::string> submitted_; // step -> task id
    std::map<std::string, nlohmann::json> results_;
    std::map<std::string, std::string> errors_;
};
