#include "../include/agent_registry.hpp"
#include "../include/log.hpp"
#include <stdexcept>

OperationTable& OperationTable::add(const std::string& name, Operation op) {
    if (name.empty()) throw std::invalid_argument("operation name is required");
    if (!op) throw std::invalid_argument("operation " + name + " has no callable");
    ops_[name] = std::move(op);
    return *this;
}

const Operation* OperationTable::resolve_operation(const std::string& name) const {
    auto it = ops_.find(name);
    return it == ops_.end() ? nullptr : &it->second;
}

std::vector<std::string> OperationTable::operation_names() const {
    std::vector<std::string> names;
    names.reserve(ops_.size());
    for (const auto& kv : ops_) names.push_back(kv.first);
    return names;
}

void AgentRegistry::register_agent(const std::string& agent_type, std::shared_ptr<AgentHandler> handler) {
    if (agent_type.empty()) throw std::invalid_argument("agent_type is required");
    if (!handler) throw std::invalid_argument("handler for " + agent_type + " is null");
    std::lock_guard<std::mutex> lock(mtx_);
    agents_[agent_type] = std::move(handler);
    log_info("registry", "Registered agent: " + agent_type);
}

bool AgentRegistry::unregister_agent(const std::string& agent_type) {
    std::lock_guard<std::mutex> lock(mtx_);
    return agents_.erase(agent_type) > 0;
}

std::shared_ptr<AgentHandler> AgentRegistry::find(const std::string& agent_type) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = agents_.find(agent_type);
    return it == agents_.end() ? nullptr : it->second;
}

std::vector<std::string> AgentRegistry::agent_types() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<std::string> out;
    out.reserve(agents_.size());
    for (const auto& kv : agents_) out.push_back(kv.first);
    return out;
}

std::size_t AgentRegistry::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return agents_.size();
}
