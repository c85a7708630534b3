/**
 * @file InMemoryWorkflowInstanceStore.hpp
 * @brief Thread-safe in-memory store of current node and variables per workflow.
 */

#pragma once

#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include "domain/workflow/repositories/IWorkflowInstanceStore.hpp"

namespace waypoint::infrastructure::workflow {

using namespace waypoint::domain::workflow;

/**
 * @class InMemoryWorkflowInstanceStore
 * @brief Two-level locking: a map lock guards the set of ids, and each
 *        instance carries its own lock for its node pointer and variables.
 *
 * Creation of an instance entry is always an insert-if-absent performed under
 * the exclusive map lock, so concurrent first writers share the same entry.
 */
class InMemoryWorkflowInstanceStore : public IWorkflowInstanceStore {
public:
    std::string getOrInitCurrentNode(const std::string& workflowId, const std::string& initialNodeId) override;
    std::optional<std::string> findCurrentNode(const std::string& workflowId) const override;
    void setCurrentNode(const std::string& workflowId, const std::string& nodeId) override;

    std::string getVariable(const std::string& workflowId, const std::string& key) const override;
    void setVariable(const std::string& workflowId, const std::string& key, const std::string& value) override;
    void mergeVariables(const std::string& workflowId, const VariableMap& values) override;
    VariableMap getAllVariables(const std::string& workflowId) const override;

    bool exists(const std::string& workflowId) const override;
    std::vector<std::string> list() const override;
    void remove(const std::string& workflowId) override;

private:
    struct InstanceState {
        mutable std::shared_mutex mutex;
        std::optional<std::string> currentNodeId;
        VariableMap variables;
    };

    std::shared_ptr<InstanceState> getOrCreate(const std::string& workflowId);
    std::shared_ptr<InstanceState> find(const std::string& workflowId) const;

    std::unordered_map<std::string, std::shared_ptr<InstanceState>> m_instances;
    mutable std::shared_mutex m_mutex;
};

} // namespace waypoint::infrastructure::workflow
