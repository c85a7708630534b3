/**
 * @file WorkflowDefinition.hpp
 * @brief Immutable node/transition graph of a conversational workflow.
 */

#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "domain/workflow/VariableMap.hpp"

namespace waypoint::domain::workflow {

    /**
     * @enum NodeKind
     * @brief What a node asks of the user or the engine.
     */
    enum class NodeKind {
        Prompt,   ///< Display only; advanced with no choice.
        Choice,   ///< Offers options; advanced with one of the option values.
        Action,   ///< Triggers a named side-effecting handler on entry.
        Terminal  ///< End of the conversation, no outgoing transitions.
    };

    std::string NodeKindToString(NodeKind kind);

    /** @brief Parses "prompt", "choice", "action" or "terminal" (any case). */
    std::optional<NodeKind> NodeKindFromString(const std::string& value);

    /**
     * @struct ChoiceOption
     * @brief One selectable option of a Choice node.
     */
    struct ChoiceOption {
        std::string label; ///< Text shown to the user.
        std::string value; ///< Value passed back to advance(); matches a transition guard.
    };

    /**
     * @struct WorkflowNode
     * @brief A single state of the workflow graph.
     */
    struct WorkflowNode {
        std::string id;
        NodeKind kind = NodeKind::Prompt;
        std::string displayText;
        std::optional<std::string> actionName; ///< Set iff kind == Action.
        ParameterMap actionParams; ///< May contain {{variable}} templates.
        std::vector<ChoiceOption> choices; ///< Only meaningful for kind == Choice.
    };

    /**
     * @struct Transition
     * @brief Directed edge between two nodes.
     */
    struct Transition {
        std::string fromNodeId;
        std::string toNodeId;
        std::optional<std::string> guardValue; ///< Absent means unconditional.

        bool isUnconditional() const { return !guardValue.has_value(); }
    };

/**
 * @class WorkflowDefinition
 * @brief Graph of nodes, transitions and start points registered under an id.
 *
 * Instances are treated as immutable once handed to the definition store;
 * the store only ever shares them as pointers to const.
 */
class WorkflowDefinition {
public:
    WorkflowDefinition() = default;
    WorkflowDefinition(std::string id, std::string name);

    // --- Building ---
    void addNode(WorkflowNode node);
    void addTransition(Transition transition);
    void addStartPoint(const std::string& nodeId);
    void setId(std::string id) { m_id = std::move(id); }
    void setName(std::string name) { m_name = std::move(name); }

    // --- Accessors ---
    const std::string& getId() const { return m_id; }
    const std::string& getName() const { return m_name; }
    const std::unordered_map<std::string, WorkflowNode>& getNodes() const { return m_nodes; }
    const std::vector<Transition>& getTransitions() const { return m_transitions; }
    const std::vector<std::string>& getStartPoints() const { return m_startPoints; }

    const WorkflowNode* findNode(const std::string& nodeId) const;
    bool hasNode(const std::string& nodeId) const;

    /** @brief First start point; empty when the definition has none. */
    std::string defaultStartNode() const;

    /** @brief Outgoing transitions of a node, in declaration order. */
    std::vector<const Transition*> outgoing(const std::string& nodeId) const;

    /**
     * @brief Picks the edge to follow from a node.
     * @param nodeId Current node.
     * @param choiceValue Guard to match; nullopt selects the unconditional edge.
     * @return The transition, or nullptr when nothing matches.
     */
    const Transition* resolveTransition(const std::string& nodeId,
                                        const std::optional<std::string>& choiceValue) const;

    /**
     * @brief Checks the referential invariants of the graph.
     * @throws MalformedDefinitionError describing the first violation found.
     */
    void validate() const;

private:
    std::string m_id;
    std::string m_name;
    std::unordered_map<std::string, WorkflowNode> m_nodes;
    std::vector<Transition> m_transitions;
    std::vector<std::string> m_startPoints;
};

} // namespace waypoint::domain::workflow
