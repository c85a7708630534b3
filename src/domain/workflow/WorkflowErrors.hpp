/**
 * @file WorkflowErrors.hpp
 * @brief Exception types raised by the workflow engine.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace waypoint::domain::workflow {

/**
 * @class UnknownWorkflowError
 * @brief No definition is registered under the requested workflow id.
 */
class UnknownWorkflowError : public std::runtime_error {
public:
    explicit UnknownWorkflowError(const std::string& workflowId)
        : std::runtime_error("Unknown workflow id: " + workflowId), m_workflowId(workflowId) {}

    const std::string& workflowId() const { return m_workflowId; }

private:
    std::string m_workflowId;
};

/**
 * @class InvalidWorkflowInputError
 * @brief Caller passed an empty workflow id, key or similar programming error.
 */
class InvalidWorkflowInputError : public std::invalid_argument {
public:
    explicit InvalidWorkflowInputError(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @class MalformedDefinitionError
 * @brief A definition violates the graph invariants (dangling references, duplicate guards...).
 */
class MalformedDefinitionError : public std::invalid_argument {
public:
    explicit MalformedDefinitionError(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @class DefinitionFormatError
 * @brief A definition document could not be read or is not valid JSON.
 */
class DefinitionFormatError : public std::runtime_error {
public:
    explicit DefinitionFormatError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace waypoint::domain::workflow
