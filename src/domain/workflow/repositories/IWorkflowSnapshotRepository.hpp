/**
 * @file IWorkflowSnapshotRepository.hpp
 * @brief Interface for durable copies of workflow definitions and their instance state.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "../WorkflowDefinition.hpp"
#include "../VariableMap.hpp"

namespace waypoint::domain::workflow {

/**
 * @struct WorkflowSnapshot
 * @brief Everything needed to bring a workflow back after a restart.
 */
struct WorkflowSnapshot {
    WorkflowDefinition definition;
    std::string currentNodeId;
    VariableMap variables;
    std::chrono::system_clock::time_point createdAt;
    std::chrono::system_clock::time_point updatedAt;
};

class IWorkflowSnapshotRepository {
public:
    virtual ~IWorkflowSnapshotRepository() = default;

    // Creates or replaces the snapshot stored under definition id
    virtual void save(const WorkflowSnapshot& snapshot) = 0;

    virtual std::optional<WorkflowSnapshot> findById(const std::string& workflowId) = 0;

    virtual std::vector<std::string> listIds() = 0;

    virtual void remove(const std::string& workflowId) = 0;
};

} // namespace waypoint::domain::workflow
