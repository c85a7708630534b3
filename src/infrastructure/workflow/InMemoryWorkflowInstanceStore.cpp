/**
 * @file InMemoryWorkflowInstanceStore.cpp
 * @brief Implementation of InMemoryWorkflowInstanceStore.
 */

#include "infrastructure/workflow/InMemoryWorkflowInstanceStore.hpp"
#include "domain/workflow/WorkflowErrors.hpp"

#include <algorithm>
#include <mutex>

namespace waypoint::infrastructure::workflow {

namespace {
    void RequireId(const std::string& workflowId) {
        if (workflowId.empty()) {
            throw InvalidWorkflowInputError("Workflow id must not be empty.");
        }
    }

    void RequireKey(const std::string& key) {
        if (key.empty()) {
            throw InvalidWorkflowInputError("Variable key must not be empty.");
        }
    }
}

std::shared_ptr<InMemoryWorkflowInstanceStore::InstanceState>
InMemoryWorkflowInstanceStore::find(const std::string& workflowId) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_instances.find(workflowId);
    return it != m_instances.end() ? it->second : nullptr;
}

std::shared_ptr<InMemoryWorkflowInstanceStore::InstanceState>
InMemoryWorkflowInstanceStore::getOrCreate(const std::string& workflowId) {
    if (auto existing = find(workflowId)) {
        return existing;
    }

    // Slow path: insert-if-absent under the exclusive lock. try_emplace leaves
    // an entry created by a racing thread untouched.
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    auto [it, inserted] = m_instances.try_emplace(workflowId, nullptr);
    if (inserted) {
        it->second = std::make_shared<InstanceState>();
    }
    return it->second;
}

std::string InMemoryWorkflowInstanceStore::getOrInitCurrentNode(const std::string& workflowId,
                                                                const std::string& initialNodeId) {
    RequireId(workflowId);
    auto state = getOrCreate(workflowId);

    {
        std::shared_lock<std::shared_mutex> lock(state->mutex);
        if (state->currentNodeId) return *state->currentNodeId;
    }

    std::unique_lock<std::shared_mutex> lock(state->mutex);
    if (!state->currentNodeId) {
        state->currentNodeId = initialNodeId;
    }
    return *state->currentNodeId;
}

std::optional<std::string> InMemoryWorkflowInstanceStore::findCurrentNode(const std::string& workflowId) const {
    auto state = find(workflowId);
    if (!state) return std::nullopt;

    std::shared_lock<std::shared_mutex> lock(state->mutex);
    return state->currentNodeId;
}

void InMemoryWorkflowInstanceStore::setCurrentNode(const std::string& workflowId, const std::string& nodeId) {
    RequireId(workflowId);
    auto state = getOrCreate(workflowId);

    std::unique_lock<std::shared_mutex> lock(state->mutex);
    state->currentNodeId = nodeId;
}

std::string InMemoryWorkflowInstanceStore::getVariable(const std::string& workflowId, const std::string& key) const {
    auto state = find(workflowId);
    if (!state) return {};

    std::shared_lock<std::shared_mutex> lock(state->mutex);
    auto it = state->variables.find(key);
    return it != state->variables.end() ? it->second : std::string();
}

void InMemoryWorkflowInstanceStore::setVariable(const std::string& workflowId,
                                                const std::string& key,
                                                const std::string& value) {
    RequireId(workflowId);
    RequireKey(key);
    auto state = getOrCreate(workflowId);

    std::unique_lock<std::shared_mutex> lock(state->mutex);
    state->variables[key] = value;
}

void InMemoryWorkflowInstanceStore::mergeVariables(const std::string& workflowId, const VariableMap& values) {
    RequireId(workflowId);
    for (const auto& [key, value] : values) {
        RequireKey(key);
    }
    auto state = getOrCreate(workflowId);

    std::unique_lock<std::shared_mutex> lock(state->mutex);
    for (const auto& [key, value] : values) {
        state->variables[key] = value;
    }
}

VariableMap InMemoryWorkflowInstanceStore::getAllVariables(const std::string& workflowId) const {
    auto state = find(workflowId);
    if (!state) return {};

    std::shared_lock<std::shared_mutex> lock(state->mutex);
    return state->variables;
}

bool InMemoryWorkflowInstanceStore::exists(const std::string& workflowId) const {
    return find(workflowId) != nullptr;
}

std::vector<std::string> InMemoryWorkflowInstanceStore::list() const {
    std::vector<std::string> ids;
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        ids.reserve(m_instances.size());
        for (const auto& [id, state] : m_instances) {
            ids.push_back(id);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

void InMemoryWorkflowInstanceStore::remove(const std::string& workflowId) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_instances.erase(workflowId);
}

} // namespace waypoint::infrastructure::workflow
