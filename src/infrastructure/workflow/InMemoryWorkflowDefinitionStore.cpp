/**
 * @file InMemoryWorkflowDefinitionStore.cpp
 * @brief Implementation of InMemoryWorkflowDefinitionStore.
 */

#include "infrastructure/workflow/InMemoryWorkflowDefinitionStore.hpp"
#include "domain/workflow/WorkflowErrors.hpp"

#include <algorithm>
#include <mutex>

namespace waypoint::infrastructure::workflow {

void InMemoryWorkflowDefinitionStore::registerDefinition(WorkflowDefinition definition) {
    definition.validate();

    // Build the shared copy outside the lock; the write itself is a pointer swap.
    auto shared = std::make_shared<const WorkflowDefinition>(std::move(definition));
    std::string id = shared->getId();

    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_definitions[id] = std::move(shared);
}

std::shared_ptr<const WorkflowDefinition> InMemoryWorkflowDefinitionStore::get(const std::string& workflowId) const {
    auto definition = find(workflowId);
    if (!definition) {
        throw UnknownWorkflowError(workflowId);
    }
    return definition;
}

std::shared_ptr<const WorkflowDefinition> InMemoryWorkflowDefinitionStore::find(const std::string& workflowId) const {
    if (workflowId.empty()) return nullptr;

    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_definitions.find(workflowId);
    return it != m_definitions.end() ? it->second : nullptr;
}

bool InMemoryWorkflowDefinitionStore::exists(const std::string& workflowId) const {
    if (workflowId.empty()) return false;

    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_definitions.find(workflowId) != m_definitions.end();
}

std::vector<std::string> InMemoryWorkflowDefinitionStore::list() const {
    std::vector<std::string> ids;
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        ids.reserve(m_definitions.size());
        for (const auto& [id, definition] : m_definitions) {
            ids.push_back(id);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

bool InMemoryWorkflowDefinitionStore::remove(const std::string& workflowId) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    return m_definitions.erase(workflowId) > 0;
}

} // namespace waypoint::infrastructure::workflow
