/**
 * @file IWorkflowInstanceStore.hpp
 * @brief Interface for per-workflow mutable state (current node + variables).
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "../VariableMap.hpp"

namespace waypoint::domain::workflow {

class IWorkflowInstanceStore {
public:
    virtual ~IWorkflowInstanceStore() = default;

    // Returns the stored node, or atomically stores and returns initialNodeId
    virtual std::string getOrInitCurrentNode(const std::string& workflowId, const std::string& initialNodeId) = 0;

    // Read without creating state
    virtual std::optional<std::string> findCurrentNode(const std::string& workflowId) const = 0;

    virtual void setCurrentNode(const std::string& workflowId, const std::string& nodeId) = 0;

    // Empty string when unset
    virtual std::string getVariable(const std::string& workflowId, const std::string& key) const = 0;

    virtual void setVariable(const std::string& workflowId, const std::string& key, const std::string& value) = 0;

    // Applies all entries under one lock
    virtual void mergeVariables(const std::string& workflowId, const VariableMap& values) = 0;

    virtual VariableMap getAllVariables(const std::string& workflowId) const = 0;

    virtual bool exists(const std::string& workflowId) const = 0;

    virtual std::vector<std::string> list() const = 0;

    virtual void remove(const std::string& workflowId) = 0;
};

} // namespace waypoint::domain::workflow
