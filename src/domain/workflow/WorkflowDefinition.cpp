/**
 * @file WorkflowDefinition.cpp
 * @brief Implementation of WorkflowDefinition graph queries and validation.
 */

#include "domain/workflow/WorkflowDefinition.hpp"
#include "domain/workflow/WorkflowErrors.hpp"

#include <cctype>
#include <set>
#include <unordered_set>

namespace waypoint::domain::workflow {

namespace {
    std::string ToLower(const std::string& value) {
        std::string out;
        out.reserve(value.size());
        for (char ch : value) {
            out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
        }
        return out;
    }
}

std::string NodeKindToString(NodeKind kind) {
    switch (kind) {
        case NodeKind::Prompt: return "prompt";
        case NodeKind::Choice: return "choice";
        case NodeKind::Action: return "action";
        case NodeKind::Terminal: return "terminal";
    }
    return "prompt";
}

std::optional<NodeKind> NodeKindFromString(const std::string& value) {
    std::string token = ToLower(value);
    if (token == "prompt") return NodeKind::Prompt;
    if (token == "choice") return NodeKind::Choice;
    if (token == "action") return NodeKind::Action;
    if (token == "terminal") return NodeKind::Terminal;
    return std::nullopt;
}

WorkflowDefinition::WorkflowDefinition(std::string id, std::string name)
    : m_id(std::move(id)), m_name(std::move(name)) {}

void WorkflowDefinition::addNode(WorkflowNode node) {
    std::string nodeId = node.id;
    auto [it, inserted] = m_nodes.emplace(nodeId, std::move(node));
    if (!inserted) {
        throw MalformedDefinitionError("Duplicate node id: " + nodeId);
    }
}

void WorkflowDefinition::addTransition(Transition transition) {
    m_transitions.push_back(std::move(transition));
}

void WorkflowDefinition::addStartPoint(const std::string& nodeId) {
    m_startPoints.push_back(nodeId);
}

const WorkflowNode* WorkflowDefinition::findNode(const std::string& nodeId) const {
    auto it = m_nodes.find(nodeId);
    return it != m_nodes.end() ? &it->second : nullptr;
}

bool WorkflowDefinition::hasNode(const std::string& nodeId) const {
    return m_nodes.find(nodeId) != m_nodes.end();
}

std::string WorkflowDefinition::defaultStartNode() const {
    return m_startPoints.empty() ? std::string() : m_startPoints.front();
}

std::vector<const Transition*> WorkflowDefinition::outgoing(const std::string& nodeId) const {
    std::vector<const Transition*> result;
    for (const auto& t : m_transitions) {
        if (t.fromNodeId == nodeId) result.push_back(&t);
    }
    return result;
}

const Transition* WorkflowDefinition::resolveTransition(const std::string& nodeId,
                                                        const std::optional<std::string>& choiceValue) const {
    const WorkflowNode* node = findNode(nodeId);
    if (!node || node->kind == NodeKind::Terminal) {
        return nullptr;
    }

    for (const auto& t : m_transitions) {
        if (t.fromNodeId != nodeId) continue;
        if (choiceValue) {
            if (t.guardValue && *t.guardValue == *choiceValue) return &t;
        } else if (t.isUnconditional()) {
            return &t;
        }
    }
    return nullptr;
}

void WorkflowDefinition::validate() const {
    if (m_id.empty()) {
        throw MalformedDefinitionError("Workflow definition has an empty id.");
    }
    if (m_nodes.empty()) {
        throw MalformedDefinitionError("Workflow '" + m_id + "' has no nodes.");
    }
    if (m_startPoints.empty()) {
        throw MalformedDefinitionError("Workflow '" + m_id + "' has no start point.");
    }

    for (const auto& [key, node] : m_nodes) {
        if (node.id.empty() || node.id != key) {
            throw MalformedDefinitionError("Workflow '" + m_id + "' has a node with an empty or mismatched id.");
        }
        bool isAction = node.kind == NodeKind::Action;
        bool hasAction = node.actionName.has_value() && !node.actionName->empty();
        if (isAction != hasAction) {
            throw MalformedDefinitionError("Node '" + node.id + "': action name must be set if and only if the node is an action.");
        }
    }

    for (const auto& start : m_startPoints) {
        if (!hasNode(start)) {
            throw MalformedDefinitionError("Start point references unknown node: " + start);
        }
    }

    std::unordered_set<std::string> unconditionalSources;
    std::set<std::pair<std::string, std::string>> guards;
    for (const auto& t : m_transitions) {
        if (!hasNode(t.fromNodeId)) {
            throw MalformedDefinitionError("Transition source references unknown node: " + t.fromNodeId);
        }
        if (!hasNode(t.toNodeId)) {
            throw MalformedDefinitionError("Transition target references unknown node: " + t.toNodeId);
        }
        if (findNode(t.fromNodeId)->kind == NodeKind::Terminal) {
            throw MalformedDefinitionError("Terminal node '" + t.fromNodeId + "' cannot have outgoing transitions.");
        }
        if (t.isUnconditional()) {
            if (!unconditionalSources.insert(t.fromNodeId).second) {
                throw MalformedDefinitionError("Node '" + t.fromNodeId + "' has more than one unconditional transition.");
            }
        } else if (!guards.emplace(t.fromNodeId, *t.guardValue).second) {
            throw MalformedDefinitionError("Node '" + t.fromNodeId + "' has duplicate guard value '" + *t.guardValue + "'.");
        }
    }
}

} // namespace waypoint::domain::workflow
