/**
 * @file ActionHandler.hpp
 * @brief Contract between the engine and named side-effecting actions.
 */

#pragma once

#include <string>

#include "domain/workflow/Cancellation.hpp"
#include "domain/workflow/VariableMap.hpp"

namespace waypoint::domain::workflow {

/**
 * @struct ActionOutcome
 * @brief Result of one handler invocation. Not persisted on its own.
 */
struct ActionOutcome {
    static constexpr const char* kStatusOk = "ok";
    static constexpr const char* kStatusSuccess = "success";
    static constexpr const char* kStatusError = "error";
    static constexpr const char* kStatusCancelled = "cancelled";

    std::string status = kStatusOk;
    VariableMap variables; ///< Merged into the instance variables by the engine.
    std::string message; ///< Human readable detail, mainly for failures.

    bool isSuccess() const { return status == kStatusOk || status == kStatusSuccess; }
    bool isCancelled() const { return status == kStatusCancelled; }

    static ActionOutcome Error(const std::string& message) {
        ActionOutcome outcome;
        outcome.status = kStatusError;
        outcome.message = message;
        return outcome;
    }

    static ActionOutcome Cancelled() {
        ActionOutcome outcome;
        outcome.status = kStatusCancelled;
        outcome.message = "Operation cancelled";
        return outcome;
    }
};

/**
 * @struct ActionContext
 * @brief Read-only view a handler gets of the workflow it runs for.
 */
struct ActionContext {
    std::string workflowId;
    std::string nodeId;
    VariableMap variables; ///< Snapshot taken before the handler runs.
    ParameterMap parameters; ///< Node parameters with templates already resolved.
};

/**
 * @class ActionHandler
 * @brief Abstract interface for actions such as "get_nearby_businesses".
 *
 * Handlers may block on I/O and should poll the token between steps.
 * Throwing is allowed; the executor converts exceptions into an error outcome.
 */
class ActionHandler {
public:
    virtual ~ActionHandler() = default;

    /** @brief Action tag this handler answers to (compared case-insensitively). */
    virtual std::string name() const = 0;

    virtual ActionOutcome handle(const ActionContext& context, const CancellationToken& cancellation) = 0;
};

} // namespace waypoint::domain::workflow
