/**
 * @file ActionExecutor.hpp
 * @brief Name-keyed registry and invoker of workflow action handlers.
 */

#pragma once

#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include "domain/workflow/ActionHandler.hpp"

namespace waypoint::application::workflow {

using namespace waypoint::domain::workflow;

/**
 * @struct ActionExecutorOptions
 * @brief Tunables read from configuration.
 */
struct ActionExecutorOptions {
    bool logExecutionTime = false; ///< Print the duration of every handler call.
};

/**
 * @class FunctionActionHandler
 * @brief Adapts a plain callable to the ActionHandler interface.
 */
class FunctionActionHandler : public ActionHandler {
public:
    using Function = std::function<ActionOutcome(const ActionContext&, const CancellationToken&)>;

    FunctionActionHandler(std::string name, Function fn);

    std::string name() const override { return m_name; }
    ActionOutcome handle(const ActionContext& context, const CancellationToken& cancellation) override;

private:
    std::string m_name;
    Function m_fn;
};

/**
 * @class ActionExecutor
 * @brief Dispatches action tags to handlers and turns every failure into an outcome.
 *
 * Nothing thrown by a handler escapes execute(): exceptions become an "error"
 * outcome and cancellation becomes a "cancelled" outcome with no variables.
 * Handlers can be registered while other threads execute.
 */
class ActionExecutor {
public:
    explicit ActionExecutor(ActionExecutorOptions options = {});

    /** @brief Registers or replaces the handler for handler->name(). */
    void registerHandler(std::shared_ptr<ActionHandler> handler);
    void registerHandler(const std::string& name, FunctionActionHandler::Function fn);

    bool hasHandler(const std::string& actionName) const;
    std::vector<std::string> handlerNames() const;

    /**
     * @brief Runs the handler registered for an action.
     * @param actionName Tag taken from the node (case-insensitive).
     * @param workflowId Owning workflow, forwarded to the handler.
     * @param nodeId Node that triggered the action.
     * @param variables Snapshot of the instance variables.
     * @param parameters Raw node parameters; {{name}} templates are resolved against variables.
     * @param cancellation Cooperative cancellation signal.
     */
    ActionOutcome execute(const std::string& actionName,
                          const std::string& workflowId,
                          const std::string& nodeId,
                          const VariableMap& variables,
                          const ParameterMap& parameters,
                          const CancellationToken& cancellation = {}) const;

    /**
     * @brief Replaces every {{ name }} with the matching variable.
     *
     * Unknown names resolve to an empty string. Names may contain letters,
     * digits, '_' and '.'.
     */
    static std::string ResolveTemplate(const std::string& text, const VariableMap& variables);
    static ParameterMap ResolveParameters(const ParameterMap& parameters, const VariableMap& variables);

private:
    std::shared_ptr<ActionHandler> findHandler(const std::string& actionName) const;

    ActionExecutorOptions m_options;
    std::map<std::string, std::shared_ptr<ActionHandler>, CaseInsensitiveLess> m_handlers;
    mutable std::shared_mutex m_mutex;
};

} // namespace waypoint::application::workflow
