/**
 * @file JsonDefinitionCodec.cpp
 * @brief Implementation of JsonDefinitionCodec.
 */

#include "infrastructure/workflow/JsonDefinitionCodec.hpp"
#include "domain/workflow/WorkflowErrors.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace waypoint::infrastructure::workflow {

using json = nlohmann::json;

namespace {

std::string RequireString(const json& object, const char* key, const std::string& where) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        throw DefinitionFormatError(where + ": field '" + key + "' must be a string.");
    }
    return it->get<std::string>();
}

// Parameters are strings in the document, but plain numbers and booleans are accepted.
std::string ScalarToString(const json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_null()) return {};
    return value.dump();
}

WorkflowNode ParseNode(const json& j) {
    if (!j.is_object()) {
        throw DefinitionFormatError("Every entry of 'nodes' must be an object.");
    }

    WorkflowNode node;
    node.id = RequireString(j, "id", "node");
    std::string where = "node '" + node.id + "'";

    std::string kind = j.value("kind", std::string("prompt"));
    auto parsedKind = NodeKindFromString(kind);
    if (!parsedKind) {
        throw DefinitionFormatError(where + ": unknown kind '" + kind + "'.");
    }
    node.kind = *parsedKind;
    node.displayText = j.value("text", std::string());

    if (j.contains("action") && !j["action"].is_null()) {
        node.actionName = RequireString(j, "action", where);
    }

    if (j.contains("params")) {
        const auto& params = j["params"];
        if (!params.is_object()) {
            throw DefinitionFormatError(where + ": 'params' must be an object.");
        }
        for (const auto& [key, value] : params.items()) {
            node.actionParams[key] = ScalarToString(value);
        }
    }

    if (j.contains("choices")) {
        const auto& choices = j["choices"];
        if (!choices.is_array()) {
            throw DefinitionFormatError(where + ": 'choices' must be an array.");
        }
        for (const auto& c : choices) {
            ChoiceOption option;
            if (c.is_string()) {
                option.label = c.get<std::string>();
                option.value = option.label;
            } else if (c.is_object()) {
                option.value = RequireString(c, "value", where + " choice");
                option.label = c.value("label", option.value);
            } else {
                throw DefinitionFormatError(where + ": a choice must be a string or an object.");
            }
            node.choices.push_back(std::move(option));
        }
    }
    return node;
}

Transition ParseTransition(const json& j) {
    if (!j.is_object()) {
        throw DefinitionFormatError("Every entry of 'transitions' must be an object.");
    }

    Transition t;
    t.fromNodeId = RequireString(j, "from", "transition");
    t.toNodeId = RequireString(j, "to", "transition " + t.fromNodeId);
    if (j.contains("guard") && !j["guard"].is_null()) {
        t.guardValue = RequireString(j, "guard", "transition " + t.fromNodeId + " -> " + t.toNodeId);
    }
    return t;
}

WorkflowDefinition BuildDefinition(const json& document) {
    if (!document.is_object()) {
        throw DefinitionFormatError("Workflow document must be a JSON object.");
    }

    WorkflowDefinition definition(RequireString(document, "id", "workflow"),
                                  document.value("name", std::string()));

    if (!document.contains("nodes") || !document["nodes"].is_array()) {
        throw DefinitionFormatError("Workflow document must contain a 'nodes' array.");
    }
    for (const auto& n : document["nodes"]) {
        definition.addNode(ParseNode(n));
    }

    if (document.contains("transitions")) {
        if (!document["transitions"].is_array()) {
            throw DefinitionFormatError("'transitions' must be an array.");
        }
        for (const auto& t : document["transitions"]) {
            definition.addTransition(ParseTransition(t));
        }
    }

    if (document.contains("startPoints")) {
        if (!document["startPoints"].is_array()) {
            throw DefinitionFormatError("'startPoints' must be an array.");
        }
        for (const auto& s : document["startPoints"]) {
            if (!s.is_string()) {
                throw DefinitionFormatError("'startPoints' entries must be strings.");
            }
            definition.addStartPoint(s.get<std::string>());
        }
    }

    return definition;
}

} // namespace

WorkflowDefinition JsonDefinitionCodec::FromJson(const json& document) {
    WorkflowDefinition definition;
    try {
        definition = BuildDefinition(document);
    } catch (const json::exception& e) {
        throw DefinitionFormatError(std::string("Invalid workflow document: ") + e.what());
    }
    definition.validate();
    return definition;
}

WorkflowDefinition JsonDefinitionCodec::Parse(const std::string& text) {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& e) {
        throw DefinitionFormatError(std::string("Invalid workflow JSON: ") + e.what());
    }
    return FromJson(document);
}

WorkflowDefinition JsonDefinitionCodec::LoadFile(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw DefinitionFormatError("Workflow file not found: " + path);
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw DefinitionFormatError("Could not open workflow file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return Parse(buffer.str());
}

json JsonDefinitionCodec::ToJson(const WorkflowDefinition& definition) {
    json document;
    document["id"] = definition.getId();
    document["name"] = definition.getName();
    document["startPoints"] = definition.getStartPoints();

    // Stable output: nodes sorted by id.
    std::vector<const WorkflowNode*> nodes;
    for (const auto& [id, node] : definition.getNodes()) {
        nodes.push_back(&node);
    }
    std::sort(nodes.begin(), nodes.end(), [](const WorkflowNode* a, const WorkflowNode* b) {
        return a->id < b->id;
    });

    json nodeArray = json::array();
    for (const WorkflowNode* node : nodes) {
        json n = {
            {"id", node->id},
            {"kind", NodeKindToString(node->kind)},
            {"text", node->displayText}
        };
        if (node->actionName) {
            n["action"] = *node->actionName;
        }
        if (!node->actionParams.empty()) {
            json params = json::object();
            for (const auto& [key, value] : node->actionParams) {
                params[key] = value;
            }
            n["params"] = params;
        }
        if (!node->choices.empty()) {
            json choices = json::array();
            for (const auto& c : node->choices) {
                choices.push_back({{"label", c.label}, {"value", c.value}});
            }
            n["choices"] = choices;
        }
        nodeArray.push_back(n);
    }
    document["nodes"] = nodeArray;

    json transitions = json::array();
    for (const auto& t : definition.getTransitions()) {
        json entry = {{"from", t.fromNodeId}, {"to", t.toNodeId}};
        if (t.guardValue) {
            entry["guard"] = *t.guardValue;
        }
        transitions.push_back(entry);
    }
    document["transitions"] = transitions;
    return document;
}

std::string JsonDefinitionCodec::Serialize(const WorkflowDefinition& definition) {
    return ToJson(definition).dump(4);
}

} // namespace waypoint::infrastructure::workflow
