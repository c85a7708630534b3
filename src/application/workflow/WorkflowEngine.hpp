/**
 * @file WorkflowEngine.hpp
 * @brief Application service that drives workflow instances through their definitions.
 */

#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "application/workflow/ActionExecutor.hpp"
#include "domain/workflow/repositories/IWorkflowDefinitionStore.hpp"
#include "domain/workflow/repositories/IWorkflowInstanceStore.hpp"
#include "domain/workflow/repositories/IWorkflowSnapshotRepository.hpp"

namespace waypoint::application::workflow {

using namespace waypoint::domain::workflow;

/**
 * @struct WorkflowStatePayload
 * @brief What a presentation layer needs to render the current step.
 */
struct WorkflowStatePayload {
    std::string workflowId;
    std::string nodeId;
    NodeKind kind = NodeKind::Prompt;
    std::string displayText;
    std::vector<ChoiceOption> choices;
    bool isTerminal = false;
    VariableMap variables;
};

/**
 * @struct AdvanceResult
 * @brief Outcome of one advance() call.
 */
struct AdvanceResult {
    bool advanced = false; ///< False when no transition matched; nothing was changed then.
    std::string currentNodeId; ///< Node the instance points at after the call.
    std::optional<ActionOutcome> actionOutcome; ///< Set when the target node ran an action.
};

/**
 * @class WorkflowEngine
 * @brief Implements the advancement protocol over the injected stores.
 *
 * One call to advance() follows at most one edge and runs the action of the
 * target node at most once. Concurrent advances of the same workflow are
 * last-writer-wins on the node pointer.
 */
class WorkflowEngine {
public:
    using Clock = std::chrono::system_clock;

    WorkflowEngine(std::shared_ptr<IWorkflowDefinitionStore> definitions,
                   std::shared_ptr<IWorkflowInstanceStore> instances,
                   std::shared_ptr<ActionExecutor> executor,
                   std::shared_ptr<IWorkflowSnapshotRepository> snapshots = nullptr);

    /**
     * @brief Registers (or replaces) a definition and positions a fresh instance on its first start point.
     *
     * When the start node is an action node, its action runs once the
     * initial variables are in place.
     *
     * @param definition Graph to publish; validated before anything is stored.
     * @param initialVariables Variables the new instance starts with.
     * @param createdAt Creation time recorded for the instance.
     * @return The state of the new instance.
     * @throws MalformedDefinitionError when the graph is invalid.
     */
    WorkflowStatePayload importDefinition(WorkflowDefinition definition,
                                          const VariableMap& initialVariables = {},
                                          Clock::time_point createdAt = Clock::now(),
                                          const CancellationToken& cancellation = {});

    /**
     * @brief Makes sure an instance exists, restoring it from the snapshot repository when possible.
     * @throws UnknownWorkflowError when neither a definition nor a snapshot exists.
     */
    WorkflowStatePayload startInstance(const std::string& workflowId);

    /**
     * @brief Follows one transition and runs the target's action, if any.
     * @param workflowId Registered workflow.
     * @param choiceValue Guard to match; nullopt follows the unconditional edge.
     * @param cancellation Forwarded to the action handler.
     * @throws UnknownWorkflowError when no definition is registered under workflowId.
     */
    AdvanceResult advance(const std::string& workflowId,
                          const std::optional<std::string>& choiceValue = std::nullopt,
                          const CancellationToken& cancellation = {});

    /** @brief Moves the instance back to the first start point and reruns its action. Variables are kept. */
    WorkflowStatePayload restartInstance(const std::string& workflowId, const CancellationToken& cancellation = {});

    WorkflowStatePayload getCurrentState(const std::string& workflowId);

    std::string getVariable(const std::string& workflowId, const std::string& key) const;
    void setVariable(const std::string& workflowId, const std::string& key, const std::string& value);
    void setVariables(const std::string& workflowId, const VariableMap& values);
    VariableMap getVariables(const std::string& workflowId) const;

    /** @brief Creation time of the instance, from memory or from its snapshot. */
    std::optional<Clock::time_point> getCreatedAt(const std::string& workflowId) const;

    bool workflowExists(const std::string& workflowId) const;
    std::vector<std::string> listWorkflows() const;

    /** @brief Drops definition, instance state and snapshot. Returns false if nothing was registered. */
    bool removeWorkflow(const std::string& workflowId);

private:
    WorkflowStatePayload buildState(const WorkflowDefinition& definition, const std::string& nodeId) const;
    std::string currentNodeOf(const WorkflowDefinition& definition);
    std::optional<ActionOutcome> runNodeAction(const WorkflowDefinition& definition,
                                               const std::string& nodeId,
                                               const CancellationToken& cancellation);
    bool restoreFromSnapshot(const std::string& workflowId);
    void persist(const std::string& workflowId);

    std::shared_ptr<IWorkflowDefinitionStore> m_definitions;
    std::shared_ptr<IWorkflowInstanceStore> m_instances;
    std::shared_ptr<ActionExecutor> m_executor;
    std::shared_ptr<IWorkflowSnapshotRepository> m_snapshots;

    std::unordered_map<std::string, Clock::time_point> m_createdAt;
    mutable std::mutex m_createdAtMutex;
    std::mutex m_persistMutex; ///< Orders snapshot writes against removeWorkflow().
};

} // namespace waypoint::application::workflow
