#include "../include/workflow.hpp"
#include "../include/errors.hpp"
#include "../include/log.hpp"
#include <algorithm>
#include <thread>

using json = nlohmann::json;

static const char* kTag = "workflow";

const char* to_string(StepState state) {
    switch (state) {
    case StepState::NotReady: return "not_ready";
    case StepState::Ready: return "ready";
    case StepState::Submitted: return "submitted";
    case StepState::Completed: return "completed";
    case StepState::Failed: return "failed";
    case StepState::Skipped: return "skipped";
    }
    return "unknown";
}

Workflow::Workflow(std::string name, std::vector<WorkflowStep> steps)
    : name_(std::move(name)), steps_(std::move(steps)) {
    for (std::size_t i = 0; i < steps_.size(); ++i) {
        const auto& s = steps_[i];
        if (s.name.empty()) throw ConfigurationError("workflow " + name_ + ": step without a name");
        if (!index_.emplace(s.name, i).second) {
            throw ConfigurationError("workflow " + name_ + ": duplicate step " + s.name);
        }
    }
    validate();
}

void Workflow::validate() const {
    for (const auto& s : steps_) {
        if (s.target_agent.empty() || s.operation.empty()) {
            throw ConfigurationError("workflow " + name_ + ": step " + s.name + " needs a target agent and operation");
        }
        if (!s.parameters.is_object()) {
            throw ConfigurationError("workflow " + name_ + ": step " + s.name + " parameters must be an object");
        }
        for (const auto& dep : s.depends_on) {
            if (!index_.count(dep)) {
                throw ConfigurationError("workflow " + name_ + ": step " + s.name + " depends on unknown step " + dep);
            }
        }
    }

    // Kahn's algorithm; anything left with unresolved in-degree sits on a cycle.
    std::vector<int> indegree(steps_.size(), 0);
    std::vector<std::vector<std::size_t>> dependents(steps_.size());
    for (std::size_t i = 0; i < steps_.size(); ++i) {
        for (const auto& dep : steps_[i].depends_on) {
            ++indegree[i];
            dependents[index_.at(dep)].push_back(i);
        }
    }
    std::vector<std::size_t> frontier;
    for (std::size_t i = 0; i < steps_.size(); ++i) {
        if (indegree[i] == 0) frontier.push_back(i);
    }
    std::size_t visited = 0;
    while (!frontier.empty()) {
        std::size_t n = frontier.back();
        frontier.pop_back();
        ++visited;
        for (auto d : dependents[n]) {
            if (--indegree[d] == 0) frontier.push_back(d);
        }
    }
    if (visited != steps_.size()) {
        std::string cyclic;
        for (std::size_t i = 0; i < steps_.size(); ++i) {
            if (indegree[i] > 0) cyclic += (cyclic.empty() ? "" : ", ") + steps_[i].name;
        }
        throw ConfigurationError("workflow " + name_ + ": dependency cycle through " + cyclic);
    }
}

const WorkflowStep& Workflow::step(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) throw std::invalid_argument("workflow " + name_ + " has no step " + name);
    return steps_[it->second];
}

std::vector<std::string> Workflow::ready_steps() const {
    std::vector<std::string> ready;
    for (const auto& s : steps_) {
        if (completed_.count(s.name) || failed_.count(s.name)) continue;
        bool deps_done = std::all_of(s.depends_on.begin(), s.depends_on.end(),
                                     [this](const std::string& d) { return completed_.count(d) > 0; });
        if (deps_done) ready.push_back(s.name);
    }
    return ready;
}

bool Workflow::mark_completed(const std::string& name) {
    step(name);
    if (completed_.count(name) || failed_.count(name)) return false;
    completed_.insert(name);
    return true;
}

bool Workflow::mark_failed(const std::string& name) {
    step(name);
    if (completed_.count(name) || failed_.count(name)) return false;
    failed_.insert(name);
    return true;
}

std::optional<std::string> Workflow::blocked_by(const std::string& name) const {
    if (completed_.count(name) || failed_.count(name)) return std::nullopt;
    std::vector<std::string> stack{name};
    std::set<std::string> seen{name};
    while (!stack.empty()) {
        std::string cur = stack.back();
        stack.pop_back();
        for (const auto& dep : step(cur).depends_on) {
            if (failed_.count(dep)) return dep;
            if (seen.insert(dep).second) stack.push_back(dep);
        }
    }
    return std::nullopt;
}

std::vector<std::string> Workflow::skipped_steps() const {
    std::vector<std::string> out;
    for (const auto& s : steps_) {
        if (blocked_by(s.name)) out.push_back(s.name);
    }
    return out;
}

bool Workflow::is_finished() const {
    for (const auto& s : steps_) {
        if (completed_.count(s.name) || failed_.count(s.name)) continue;
        if (!blocked_by(s.name)) return false;
    }
    return true;
}

bool WorkflowSummary::succeeded() const {
    return std::all_of(steps.begin(), steps.end(),
                       [](const StepReport& r) { return r.state == StepState::Completed; });
}

std::vector<std::string> WorkflowSummary::names_in(StepState state) const {
    std::vector<std::string> out;
    for (const auto& r : steps) {
        if (r.state == state) out.push_back(r.name);
    }
    return out;
}

json WorkflowSummary::to_json() const {
    json arr = json::array();
    for (const auto& r : steps) {
        arr.push_back(json{
            {"name", r.name},
            {"state", to_string(r.state)},
            {"task_id", r.task_id ? json(*r.task_id) : json(nullptr)},
            {"result", r.result ? *r.result : json(nullptr)},
            {"error", r.error ? json(*r.error) : json(nullptr)},
            {"blocked_by", r.blocked_by ? json(*r.blocked_by) : json(nullptr)},
        });
    }
    return json{
        {"workflow", workflow},
        {"steps", arr},
        {"completed", names_in(StepState::Completed)},
        {"failed", names_in(StepState::Failed)},
        {"skipped", names_in(StepState::Skipped)},
        {"succeeded", succeeded()},
    };
}

WorkflowEngine::WorkflowEngine(QueueManager& queue, Workflow& workflow, json initial_parameters, std::string source_agent)
    : queue_(queue),
      workflow_(workflow),
      initial_parameters_(initial_parameters.is_null() ? json::object() : std::move(initial_parameters)),
      source_agent_(std::move(source_agent)) {
    if (!initial_parameters_.is_object()) throw std::invalid_argument("initial parameters must be a JSON object");
}

json WorkflowEngine::step_parameters(const WorkflowStep& step) const {
    json p = initial_parameters_;
    p.update(step.parameters);
    for (const auto& dep : step.depends_on) {
        auto it = results_.find(dep);
        if (it != results_.end()) p[dep + "_result"] = it->second;
    }
    return p;
}

bool WorkflowEngine::collect() {
    bool changed = false;
    for (const auto& kv : submitted_) {
        const std::string& name = kv.first;
        if (workflow_.completed_steps().count(name) || workflow_.failed_steps().count(name)) continue;
        auto task = queue_.get(kv.second);
        if (!task) {
            errors_[name] = "task " + kv.second + " no longer exists";
            workflow_.mark_failed(name);
            log_error(kTag, workflow_.name() + ": step " + name + " lost its task " + kv.second);
            changed = true;
            continue;
        }
        if (task->status == TaskStatus::Completed) {
            results_[name] = task->result.value_or(json::object());
            workflow_.mark_completed(name);
            log_info(kTag, workflow_.name() + ": step " + name + " completed");
            changed = true;
        } else if (task->status == TaskStatus::Failed || task->status == TaskStatus::Cancelled) {
            errors_[name] = task->error_message.value_or(to_string(task->status));
            workflow_.mark_failed(name);
            log_error(kTag, workflow_.name() + ": step " + name + " failed: " + errors_[name]);
            changed = true;
        }
    }
    return changed;
}

std::size_t WorkflowEngine::advance() {
    std::size_t submitted = 0;
    do {
        for (const auto& name : workflow_.ready_steps()) {
            if (submitted_.count(name)) continue;
            const auto& step = workflow_.step(name);
            EnqueueOptions opts;
            opts.priority = step.priority;
            opts.source_agent = source_agent_;
            opts.max_retries = step.max_retries;
            submitted_[name] = queue_.enqueue(step.target_agent, step.operation, step_parameters(step), opts);
            log_info(kTag, workflow_.name() + ": submitted step " + name + " as task " + submitted_[name]);
            ++submitted;
        }
    } while (collect());
    return submitted;
}

WorkflowSummary WorkflowEngine::run_to_completion(std::chrono::milliseconds poll_interval,
                                                  std::chrono::milliseconds timeout) {
    using clock = std::chrono::steady_clock;
    const bool bounded = timeout.count() > 0;
    const auto deadline = clock::now() + timeout;
    log_info(kTag, "Starting workflow: " + workflow_.name());
    while (true) {
        advance();
        if (workflow_.is_finished()) break;
        auto now = clock::now();
        if (bounded && now >= deadline) {
            throw TimeoutError("workflow " + workflow_.name() + " did not finish within " +
                               std::to_string(timeout.count()) + " ms");
        }
        auto wait = poll_interval;
        if (bounded) {
            wait = std::min(wait, std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
        }
        std::this_thread::sleep_for(wait);
    }
    auto s = summary();
    log_info(kTag, "Workflow " + workflow_.name() + " finished: " +
                   std::to_string(s.names_in(StepState::Completed).size()) + " completed, " +
                   std::to_string(s.names_in(StepState::Failed).size()) + " failed, " +
                   std::to_string(s.names_in(StepState::Skipped).size()) + " skipped");
    return s;
}

StepState WorkflowEngine::state(const std::string& step) const {
    const auto& s = workflow_.step(step);
    if (workflow_.completed_steps().count(step)) return StepState::Completed;
    if (workflow_.failed_steps().count(step)) return StepState::Failed;
    if (workflow_.blocked_by(step)) return StepState::Skipped;
    if (submitted_.count(step)) return StepState::Submitted;
    bool deps_done = std::all_of(s.depends_on.begin(), s.depends_on.end(),
                                 [this](const std::string& d) { return workflow_.completed_steps().count(d) > 0; });
    return deps_done ? StepState::Ready : StepState::NotReady;
}

std::optional<std::string> WorkflowEngine::task_id(const std::string& step) const {
    auto it = submitted_.find(step);
    if (it == submitted_.end()) return std::nullopt;
    return it->second;
}

WorkflowSummary WorkflowEngine::summary() const {
    WorkflowSummary out;
    out.workflow = workflow_.name();
    for (const auto& s : workflow_.steps()) {
        StepReport r;
        r.name = s.name;
        r.state = state(s.name);
        r.task_id = task_id(s.name);
        auto res = results_.find(s.name);
        if (res != results_.end()) r.result = res->second;
        auto err = errors_.find(s.name);
        if (err != errors_.end()) r.error = err->second;
        r.blocked_by = workflow_.blocked_by(s.name);
        if (r.blocked_by) r.error = "skipped: dependency " + *r.blocked_by + " failed";
        out.steps.push_back(std::move(r));
    }
    return out;
}
