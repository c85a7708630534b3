/**
 * @file IWorkflowDefinitionStore.hpp
 * @brief Interface for the registry of published workflow definitions.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>
#include "../WorkflowDefinition.hpp"

namespace waypoint::domain::workflow {

class IWorkflowDefinitionStore {
public:
    virtual ~IWorkflowDefinitionStore() = default;

    // Validates and stores (or replaces) the definition under its id
    virtual void registerDefinition(WorkflowDefinition definition) = 0;

    // Throws UnknownWorkflowError when absent
    virtual std::shared_ptr<const WorkflowDefinition> get(const std::string& workflowId) const = 0;

    // Null when absent
    virtual std::shared_ptr<const WorkflowDefinition> find(const std::string& workflowId) const = 0;

    virtual bool exists(const std::string& workflowId) const = 0;

    // Snapshot of registered ids, sorted
    virtual std::vector<std::string> list() const = 0;

    virtual bool remove(const std::string& workflowId) = 0;
};

} // namespace waypoint::domain::workflow
