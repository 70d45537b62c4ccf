#pragma once
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// One named operation of an agent. Throws (HandlerError or any std::exception) on failure.
using Operation = std::function<nlohmann::json(const nlohmann::json& parameters)>;

// Capability interface: anything that can look up an operation by name.
class AgentHandler {
public:
    virtual ~AgentHandler() = default;
    // nullptr when the agent has no such operation.
    virtual const Operation* resolve_operation(const std::string& name) const = 0;
};

// AgentHandler backed by an explicit name -> operation table.
class OperationTable : public AgentHandler {
public:
    OperationTable& add(const std::string& name, Operation op);
    const Operation* resolve_operation(const std::string& name) const override;
    std::vector<std::string> operation_names() const;

private:
    std::map<std::string, Operation> ops_;
};

class AgentRegistry {
public:
    // Replaces any handler already registered under agent_type.
    void register_agent(const std::string& agent_type, std::shared_ptr<AgentHandler> handler);
    bool unregister_agent(const std::string& agent_type);
    std::shared_ptr<AgentHandler> find(const std::string& agent_type) const;
    std::vector<std::string> agent_types() const;
    std::size_t size() const;

private:
    mutable std::mutex mtx_;
    std::map<std::string, std::shared_ptr<AgentHandler>> agents_;
};
