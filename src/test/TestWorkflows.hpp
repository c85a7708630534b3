// Shared fixtures for the workflow tests.
#pragma once

#include <memory>
#include <string>

#include "application/workflow/ActionExecutor.hpp"
#include "application/workflow/WorkflowEngine.hpp"
#include "domain/workflow/WorkflowDefinition.hpp"
#include "infrastructure/workflow/InMemoryWorkflowDefinitionStore.hpp"
#include "infrastructure/workflow/InMemoryWorkflowInstanceStore.hpp"

namespace waypoint::test {

using namespace waypoint::domain::workflow;

inline WorkflowNode MakeNode(const std::string& id, NodeKind kind, const std::string& text = "") {
    WorkflowNode node;
    node.id = id;
    node.kind = kind;
    node.displayText = text.empty() ? id : text;
    return node;
}

inline WorkflowNode MakeActionNode(const std::string& id, const std::string& action, ParameterMap params = {}) {
    WorkflowNode node = MakeNode(id, NodeKind::Action);
    node.actionName = action;
    node.actionParams = std::move(params);
    return node;
}

inline Transition Edge(const std::string& from, const std::string& to) {
    return Transition{from, to, std::nullopt};
}

inline Transition Guarded(const std::string& from, const std::string& to, const std::string& guard) {
    return Transition{from, to, guard};
}

/**
 * ask (choice yes/no) --yes--> fetch (action "fetch") --> done (terminal)
 *                     --no---> bye (terminal)
 */
inline WorkflowDefinition MakeSurvey(const std::string& id) {
    WorkflowDefinition def(id, "Survey");
    WorkflowNode ask = MakeNode("ask", NodeKind::Choice, "Continue?");
    ask.choices = {{"Yes", "yes"}, {"No", "no"}};
    def.addNode(ask);
    def.addNode(MakeActionNode("fetch", "fetch", {{"who", "{{user}}"}}));
    def.addNode(MakeNode("done", NodeKind::Terminal));
    def.addNode(MakeNode("bye", NodeKind::Terminal));
    def.addTransition(Guarded("ask", "fetch", "yes"));
    def.addTransition(Guarded("ask", "bye", "no"));
    def.addTransition(Edge("fetch", "done"));
    def.addStartPoint("ask");
    return def;
}

/** @brief In-memory stores, an executor and an engine wired together. */
struct EngineFixture {
    std::shared_ptr<infrastructure::workflow::InMemoryWorkflowDefinitionStore> definitions =
        std::make_shared<infrastructure::workflow::InMemoryWorkflowDefinitionStore>();
    std::shared_ptr<infrastructure::workflow::InMemoryWorkflowInstanceStore> instances =
        std::make_shared<infrastructure::workflow::InMemoryWorkflowInstanceStore>();
    std::shared_ptr<application::workflow::ActionExecutor> executor =
        std::make_shared<application::workflow::ActionExecutor>();
    std::shared_ptr<application::workflow::WorkflowEngine> engine =
        std::make_shared<application::workflow::WorkflowEngine>(definitions, instances, executor);
};

} // namespace waypoint::test
