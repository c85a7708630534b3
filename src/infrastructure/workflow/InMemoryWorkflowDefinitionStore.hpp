/**
 * @file InMemoryWorkflowDefinitionStore.hpp
 * @brief Thread-safe in-memory registry of workflow definitions.
 */

#pragma once

#include <shared_mutex>
#include <unordered_map>
#include "domain/workflow/repositories/IWorkflowDefinitionStore.hpp"

namespace waypoint::infrastructure::workflow {

using namespace waypoint::domain::workflow;

/**
 * @class InMemoryWorkflowDefinitionStore
 * @brief Reader/writer locked map of id -> shared immutable definition.
 *
 * Definitions are swapped in as whole shared_ptr<const> values, so readers
 * holding an older pointer keep a complete old definition.
 */
class InMemoryWorkflowDefinitionStore : public IWorkflowDefinitionStore {
public:
    void registerDefinition(WorkflowDefinition definition) override;
    std::shared_ptr<const WorkflowDefinition> get(const std::string& workflowId) const override;
    std::shared_ptr<const WorkflowDefinition> find(const std::string& workflowId) const override;
    bool exists(const std::string& workflowId) const override;
    std::vector<std::string> list() const override;
    bool remove(const std::string& workflowId) override;

private:
    std::unordered_map<std::string, std::shared_ptr<const WorkflowDefinition>> m_definitions;
    mutable std::shared_mutex m_mutex;
};

} // namespace waypoint::infrastructure::workflow
