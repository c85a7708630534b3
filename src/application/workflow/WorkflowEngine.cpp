/**
 * @file WorkflowEngine.cpp
 * @brief Implementation of WorkflowEngine.
 */

#include "application/workflow/WorkflowEngine.hpp"
#include "domain/workflow/WorkflowErrors.hpp"

#include <iostream>

namespace waypoint::application::workflow {

namespace {
    void RequireId(const std::string& workflowId) {
        if (workflowId.empty()) {
            throw InvalidWorkflowInputError("Workflow id must not be empty.");
        }
    }
}

WorkflowEngine::WorkflowEngine(std::shared_ptr<IWorkflowDefinitionStore> definitions,
                               std::shared_ptr<IWorkflowInstanceStore> instances,
                               std::shared_ptr<ActionExecutor> executor,
                               std::shared_ptr<IWorkflowSnapshotRepository> snapshots)
    : m_definitions(std::move(definitions)),
      m_instances(std::move(instances)),
      m_executor(std::move(executor)),
      m_snapshots(std::move(snapshots)) {
    if (!m_definitions || !m_instances || !m_executor) {
        throw std::invalid_argument("WorkflowEngine requires definition store, instance store and executor.");
    }
}

WorkflowStatePayload WorkflowEngine::importDefinition(WorkflowDefinition definition,
                                                      const VariableMap& initialVariables,
                                                      Clock::time_point createdAt,
                                                      const CancellationToken& cancellation) {
    std::string workflowId = definition.getId();
    m_definitions->registerDefinition(std::move(definition));

    auto registered = m_definitions->get(workflowId);
    std::string startNode = registered->defaultStartNode();

    // A re-import replaces the instance as a whole.
    m_instances->remove(workflowId);
    m_instances->setCurrentNode(workflowId, startNode);
    if (!initialVariables.empty()) {
        m_instances->mergeVariables(workflowId, initialVariables);
    }
    {
        std::lock_guard<std::mutex> lock(m_createdAtMutex);
        m_createdAt[workflowId] = createdAt;
    }

    std::cout << "[WorkflowEngine] Imported workflow '" << workflowId << "' ("
              << registered->getNodes().size() << " nodes, start=" << startNode << ")" << std::endl;

    runNodeAction(*registered, startNode, cancellation);
    persist(workflowId);
    return buildState(*registered, startNode);
}

WorkflowStatePayload WorkflowEngine::startInstance(const std::string& workflowId) {
    RequireId(workflowId);

    if (!m_instances->findCurrentNode(workflowId) && restoreFromSnapshot(workflowId)) {
        std::cout << "[WorkflowEngine] Restored workflow '" << workflowId << "' from snapshot." << std::endl;
    }

    auto definition = m_definitions->get(workflowId);
    std::string nodeId = currentNodeOf(*definition);
    return buildState(*definition, nodeId);
}

AdvanceResult WorkflowEngine::advance(const std::string& workflowId,
                                      const std::optional<std::string>& choiceValue,
                                      const CancellationToken& cancellation) {
    RequireId(workflowId);
    auto definition = m_definitions->get(workflowId);
    std::string current = currentNodeOf(*definition);

    AdvanceResult result;
    result.currentNodeId = current;

    const Transition* transition = definition->resolveTransition(current, choiceValue);
    if (!transition) {
        return result;
    }

    const std::string& target = transition->toNodeId;
    m_instances->setCurrentNode(workflowId, target);
    result.advanced = true;
    result.currentNodeId = target;

    result.actionOutcome = runNodeAction(*definition, target, cancellation);

    persist(workflowId);
    return result;
}

WorkflowStatePayload WorkflowEngine::restartInstance(const std::string& workflowId,
                                                     const CancellationToken& cancellation) {
    RequireId(workflowId);
    auto definition = m_definitions->get(workflowId);
    std::string startNode = definition->defaultStartNode();
    m_instances->setCurrentNode(workflowId, startNode);

    std::cout << "[WorkflowEngine] Restarted workflow '" << workflowId << "' at " << startNode << std::endl;
    runNodeAction(*definition, startNode, cancellation);
    persist(workflowId);
    return buildState(*definition, startNode);
}

WorkflowStatePayload WorkflowEngine::getCurrentState(const std::string& workflowId) {
    RequireId(workflowId);
    auto definition = m_definitions->get(workflowId);
    return buildState(*definition, currentNodeOf(*definition));
}

std::string WorkflowEngine::getVariable(const std::string& workflowId, const std::string& key) const {
    RequireId(workflowId);
    return m_instances->getVariable(workflowId, key);
}

void WorkflowEngine::setVariable(const std::string& workflowId, const std::string& key, const std::string& value) {
    RequireId(workflowId);
    m_instances->setVariable(workflowId, key, value);
    persist(workflowId);
}

void WorkflowEngine::setVariables(const std::string& workflowId, const VariableMap& values) {
    RequireId(workflowId);
    m_instances->mergeVariables(workflowId, values);
    persist(workflowId);
}

VariableMap WorkflowEngine::getVariables(const std::string& workflowId) const {
    RequireId(workflowId);
    return m_instances->getAllVariables(workflowId);
}

std::optional<WorkflowEngine::Clock::time_point> WorkflowEngine::getCreatedAt(const std::string& workflowId) const {
    RequireId(workflowId);
    {
        std::lock_guard<std::mutex> lock(m_createdAtMutex);
        auto it = m_createdAt.find(workflowId);
        if (it != m_createdAt.end()) return it->second;
    }

    if (m_snapshots) {
        if (auto snapshot = m_snapshots->findById(workflowId)) {
            return snapshot->createdAt;
        }
    }
    return std::nullopt;
}

bool WorkflowEngine::workflowExists(const std::string& workflowId) const {
    return m_definitions->exists(workflowId);
}

std::vector<std::string> WorkflowEngine::listWorkflows() const {
    return m_definitions->list();
}

bool WorkflowEngine::removeWorkflow(const std::string& workflowId) {
    RequireId(workflowId);

    // Held across the removal so an in-flight persist() cannot queue a write after it.
    std::lock_guard<std::mutex> persistLock(m_persistMutex);
    bool removed = m_definitions->remove(workflowId);
    m_instances->remove(workflowId);
    {
        std::lock_guard<std::mutex> lock(m_createdAtMutex);
        m_createdAt.erase(workflowId);
    }
    if (m_snapshots) {
        m_snapshots->remove(workflowId);
    }
    if (removed) {
        std::cout << "[WorkflowEngine] Removed workflow '" << workflowId << "'" << std::endl;
    }
    return removed;
}

WorkflowStatePayload WorkflowEngine::buildState(const WorkflowDefinition& definition, const std::string& nodeId) const {
    WorkflowStatePayload state;
    state.workflowId = definition.getId();
    state.nodeId = nodeId;
    state.variables = m_instances->getAllVariables(definition.getId());

    if (const WorkflowNode* node = definition.findNode(nodeId)) {
        state.kind = node->kind;
        state.displayText = node->displayText;
        state.choices = node->choices;
        state.isTerminal = node->kind == NodeKind::Terminal;
    }
    return state;
}

std::string WorkflowEngine::currentNodeOf(const WorkflowDefinition& definition) {
    const std::string& workflowId = definition.getId();
    std::string nodeId = m_instances->getOrInitCurrentNode(workflowId, definition.defaultStartNode());

    // The definition may have been replaced since the pointer was stored.
    if (!definition.hasNode(nodeId)) {
        std::cerr << "[WorkflowEngine] Node '" << nodeId << "' no longer exists in workflow '"
                  << workflowId << "', resetting to start." << std::endl;
        nodeId = definition.defaultStartNode();
        m_instances->setCurrentNode(workflowId, nodeId);
    }
    return nodeId;
}

std::optional<ActionOutcome> WorkflowEngine::runNodeAction(const WorkflowDefinition& definition,
                                                           const std::string& nodeId,
                                                           const CancellationToken& cancellation) {
    const WorkflowNode* node = definition.findNode(nodeId);
    if (!node || node->kind != NodeKind::Action || !node->actionName) {
        return std::nullopt;
    }

    const std::string& workflowId = definition.getId();
    ActionOutcome outcome = m_executor->execute(*node->actionName,
                                                workflowId,
                                                node->id,
                                                m_instances->getAllVariables(workflowId),
                                                node->actionParams,
                                                cancellation);
    if (outcome.isCancelled()) {
        std::cout << "[WorkflowEngine] Action '" << *node->actionName << "' cancelled for " << workflowId << std::endl;
        return outcome;
    }

    VariableMap updates = outcome.variables;
    updates["status"] = outcome.status;
    if (!outcome.isSuccess() && !outcome.message.empty()) {
        updates["error"] = outcome.message;
    }
    m_instances->mergeVariables(workflowId, updates);
    return outcome;
}

bool WorkflowEngine::restoreFromSnapshot(const std::string& workflowId) {
    if (!m_snapshots) return false;

    auto snapshot = m_snapshots->findById(workflowId);
    if (!snapshot) return false;

    try {
        if (!m_definitions->exists(workflowId)) {
            m_definitions->registerDefinition(snapshot->definition);
        }
    } catch (const MalformedDefinitionError& e) {
        std::cerr << "[WorkflowEngine] Snapshot of '" << workflowId << "' holds an invalid definition: "
                  << e.what() << std::endl;
        return false;
    }

    auto definition = m_definitions->get(workflowId);
    std::string nodeId = definition->hasNode(snapshot->currentNodeId)
        ? snapshot->currentNodeId
        : definition->defaultStartNode();

    m_instances->setCurrentNode(workflowId, nodeId);
    m_instances->mergeVariables(workflowId, snapshot->variables);
    {
        std::lock_guard<std::mutex> lock(m_createdAtMutex);
        m_createdAt[workflowId] = snapshot->createdAt;
    }
    return true;
}

void WorkflowEngine::persist(const std::string& workflowId) {
    if (!m_snapshots) return;

    std::lock_guard<std::mutex> persistLock(m_persistMutex);
    auto definition = m_definitions->find(workflowId);
    if (!definition) return;

    WorkflowSnapshot snapshot;
    snapshot.definition = *definition;
    snapshot.currentNodeId = m_instances->findCurrentNode(workflowId).value_or(definition->defaultStartNode());
    snapshot.variables = m_instances->getAllVariables(workflowId);
    snapshot.updatedAt = Clock::now();
    {
        std::lock_guard<std::mutex> lock(m_createdAtMutex);
        auto it = m_createdAt.find(workflowId);
        snapshot.createdAt = it != m_createdAt.end() ? it->second : snapshot.updatedAt;
    }

    try {
        m_snapshots->save(snapshot);
    } catch (const std::exception& e) {
        std::cerr << "[WorkflowEngine] Failed to persist snapshot of '" << workflowId << "': " << e.what() << std::endl;
    }
}

} // namespace waypoint::application::workflow
