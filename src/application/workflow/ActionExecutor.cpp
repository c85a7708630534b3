/**
 * @file ActionExecutor.cpp
 * @brief Implementation of ActionExecutor.
 */

#include "application/workflow/ActionExecutor.hpp"
#include "domain/workflow/WorkflowErrors.hpp"

#include <chrono>
#include <iostream>
#include <mutex>
#include <regex>

namespace waypoint::application::workflow {

namespace {
    const std::regex kTemplatePattern(R"(\{\{\s*([a-zA-Z0-9_.]+)\s*\}\})");
}

FunctionActionHandler::FunctionActionHandler(std::string name, Function fn)
    : m_name(std::move(name)), m_fn(std::move(fn)) {}

ActionOutcome FunctionActionHandler::handle(const ActionContext& context, const CancellationToken& cancellation) {
    return m_fn(context, cancellation);
}

ActionExecutor::ActionExecutor(ActionExecutorOptions options)
    : m_options(options) {}

void ActionExecutor::registerHandler(std::shared_ptr<ActionHandler> handler) {
    if (!handler) {
        throw InvalidWorkflowInputError("Action handler must not be null.");
    }
    std::string name = handler->name();
    if (name.empty()) {
        throw InvalidWorkflowInputError("Action handler name must not be empty.");
    }

    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_handlers[name] = std::move(handler);
}

void ActionExecutor::registerHandler(const std::string& name, FunctionActionHandler::Function fn) {
    if (!fn) {
        throw InvalidWorkflowInputError("Action function for '" + name + "' must not be empty.");
    }
    registerHandler(std::make_shared<FunctionActionHandler>(name, std::move(fn)));
}

bool ActionExecutor::hasHandler(const std::string& actionName) const {
    return findHandler(actionName) != nullptr;
}

std::vector<std::string> ActionExecutor::handlerNames() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    std::vector<std::string> names;
    names.reserve(m_handlers.size());
    for (const auto& [name, handler] : m_handlers) {
        names.push_back(name);
    }
    return names;
}

std::shared_ptr<ActionHandler> ActionExecutor::findHandler(const std::string& actionName) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_handlers.find(actionName);
    return it != m_handlers.end() ? it->second : nullptr;
}

std::string ActionExecutor::ResolveTemplate(const std::string& text, const VariableMap& variables) {
    if (text.find("{{") == std::string::npos) {
        return text;
    }

    std::string result;
    auto begin = std::sregex_iterator(text.begin(), text.end(), kTemplatePattern);
    auto end = std::sregex_iterator();
    std::size_t last = 0;
    for (auto it = begin; it != end; ++it) {
        const std::smatch& match = *it;
        result.append(text, last, static_cast<std::size_t>(match.position(0)) - last);
        auto var = variables.find(match[1].str());
        if (var != variables.end()) {
            result += var->second;
        }
        last = static_cast<std::size_t>(match.position(0) + match.length(0));
    }
    result.append(text, last, std::string::npos);
    return result;
}

ParameterMap ActionExecutor::ResolveParameters(const ParameterMap& parameters, const VariableMap& variables) {
    ParameterMap resolved;
    for (const auto& [key, value] : parameters) {
        resolved[key] = ResolveTemplate(value, variables);
    }
    return resolved;
}

ActionOutcome ActionExecutor::execute(const std::string& actionName,
                                      const std::string& workflowId,
                                      const std::string& nodeId,
                                      const VariableMap& variables,
                                      const ParameterMap& parameters,
                                      const CancellationToken& cancellation) const {
    auto handler = findHandler(actionName);
    if (!handler) {
        std::cerr << "[ActionExecutor] No handler registered for action '" << actionName
                  << "' (workflow " << workflowId << ")." << std::endl;
        return ActionOutcome::Error("No handler registered for action '" + actionName + "'");
    }

    if (cancellation.isCancellationRequested()) {
        return ActionOutcome::Cancelled();
    }

    ActionContext context;
    context.workflowId = workflowId;
    context.nodeId = nodeId;
    context.variables = variables;
    context.parameters = ResolveParameters(parameters, variables);

    auto started = std::chrono::steady_clock::now();
    ActionOutcome outcome;
    try {
        outcome = handler->handle(context, cancellation);
    } catch (const OperationCancelled&) {
        outcome = ActionOutcome::Cancelled();
    } catch (const std::exception& e) {
        std::cerr << "[ActionExecutor] Handler '" << actionName << "' failed: " << e.what() << std::endl;
        outcome = ActionOutcome::Error(e.what());
    } catch (...) {
        std::cerr << "[ActionExecutor] Handler '" << actionName << "' threw a non-standard exception." << std::endl;
        outcome = ActionOutcome::Error("Unknown exception in action handler");
    }

    // The instance store rejects empty variable names.
    auto unnamed = outcome.variables.find(std::string());
    if (unnamed != outcome.variables.end()) {
        std::cerr << "[ActionExecutor] Handler '" << actionName
                  << "' returned a variable with an empty name; dropping it." << std::endl;
        outcome.variables.erase(unnamed);
    }

    if (m_options.logExecutionTime) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();
        std::cout << "[ActionExecutor] " << actionName << " took " << elapsed << " ms (status="
                  << outcome.status << ")" << std::endl;
    }

    if (!outcome.isCancelled() && cancellation.isCancellationRequested()) {
        outcome = ActionOutcome::Cancelled();
    }
    if (outcome.isCancelled()) {
        outcome.variables.clear();
    }
    return outcome;
}

} // namespace waypoint::application::workflow
