/**
 * @file JsonDefinitionCodec.hpp
 * @brief Reads and writes workflow definitions as JSON documents.
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "domain/workflow/WorkflowDefinition.hpp"

namespace waypoint::infrastructure::workflow {

using namespace waypoint::domain::workflow;

/**
 * @class JsonDefinitionCodec
 * @brief Static utility mapping WorkflowDefinition to and from its JSON form.
 *
 * Document shape:
 * @code
 * { "id": "...", "name": "...", "startPoints": ["a"],
 *   "nodes": [ {"id": "a", "kind": "choice", "text": "...", "choices": [{"label": "Yes", "value": "yes"}]},
 *              {"id": "b", "kind": "action", "text": "...", "action": "get_nearby_businesses", "params": {"radius": "500"}} ],
 *   "transitions": [ {"from": "a", "to": "b", "guard": "yes"} ] }
 * @endcode
 */
class JsonDefinitionCodec {
public:
    /**
     * @brief Parses and validates a definition document.
     * @throws DefinitionFormatError on invalid JSON or wrongly typed fields.
     * @throws MalformedDefinitionError when the graph breaks an invariant.
     */
    static WorkflowDefinition Parse(const std::string& text);

    /** @brief Reads a document from disk, then behaves like Parse(). */
    static WorkflowDefinition LoadFile(const std::string& path);

    static WorkflowDefinition FromJson(const nlohmann::json& document);
    static nlohmann::json ToJson(const WorkflowDefinition& definition);

    static std::string Serialize(const WorkflowDefinition& definition);
};

} // namespace waypoint::infrastructure::workflow
