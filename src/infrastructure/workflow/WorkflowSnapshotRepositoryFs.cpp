/**
 * @file WorkflowSnapshotRepositoryFs.cpp
 * @brief Implementation of WorkflowSnapshotRepositoryFs.
 */

#include "infrastructure/workflow/WorkflowSnapshotRepositoryFs.hpp"
#include "infrastructure/workflow/JsonDefinitionCodec.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace waypoint::infrastructure::workflow {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {
    long long ToMillis(std::chrono::system_clock::time_point tp) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    }

    std::chrono::system_clock::time_point FromMillis(long long ms) {
        return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
    }
}

WorkflowSnapshotRepositoryFs::WorkflowSnapshotRepositoryFs(std::string dataRoot,
                                                           std::shared_ptr<PersistenceService> persistence)
    : m_dataRoot(std::move(dataRoot)), m_persistence(std::move(persistence)) {
    if (!m_persistence) {
        throw std::invalid_argument("WorkflowSnapshotRepositoryFs requires a PersistenceService.");
    }
}

std::string WorkflowSnapshotRepositoryFs::FileNameFor(const std::string& workflowId) {
    std::string name;
    name.reserve(workflowId.size() + 5);
    for (char ch : workflowId) {
        unsigned char c = static_cast<unsigned char>(ch);
        name.push_back(std::isalnum(c) || ch == '-' || ch == '.' ? ch : '_');
    }
    return name + ".json";
}

std::string WorkflowSnapshotRepositoryFs::getSnapshotPath(const std::string& workflowId) const {
    // Structure: <root>/workflows/<sanitized id>.json
    return (fs::path(m_dataRoot) / "workflows" / FileNameFor(workflowId)).string();
}

void WorkflowSnapshotRepositoryFs::save(const WorkflowSnapshot& snapshot) {
    json variables = json::object();
    for (const auto& [key, value] : snapshot.variables) {
        variables[key] = value;
    }

    json j = {
        {"workflowId", snapshot.definition.getId()},
        {"definition", JsonDefinitionCodec::ToJson(snapshot.definition)},
        {"currentNodeId", snapshot.currentNodeId},
        {"variables", variables},
        {"createdAt", ToMillis(snapshot.createdAt)},
        {"updatedAt", ToMillis(snapshot.updatedAt)}
    };

    m_persistence->saveTextAsync(getSnapshotPath(snapshot.definition.getId()), j.dump(4));
}

std::optional<WorkflowSnapshot> WorkflowSnapshotRepositoryFs::readFile(const std::string& path) const {
    std::ifstream file(path);
    if (!file.is_open()) return std::nullopt;

    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        auto j = json::parse(buffer.str());

        WorkflowSnapshot snapshot;
        snapshot.definition = JsonDefinitionCodec::FromJson(j.at("definition"));
        snapshot.currentNodeId = j.value("currentNodeId", std::string());
        if (j.contains("variables") && j["variables"].is_object()) {
            for (const auto& [key, value] : j["variables"].items()) {
                if (key.empty()) {
                    std::cerr << "[WorkflowSnapshotRepositoryFs] Skipping unnamed variable in " << path << std::endl;
                    continue;
                }
                snapshot.variables[key] = value.is_string() ? value.get<std::string>() : value.dump();
            }
        }
        snapshot.createdAt = FromMillis(j.value("createdAt", 0LL));
        snapshot.updatedAt = FromMillis(j.value("updatedAt", 0LL));
        return snapshot;
    } catch (const std::exception& e) {
        std::cerr << "[WorkflowSnapshotRepositoryFs] Error reading " << path << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

std::optional<WorkflowSnapshot> WorkflowSnapshotRepositoryFs::findById(const std::string& workflowId) {
    if (workflowId.empty()) return std::nullopt;

    m_persistence->flush();
    std::string path = getSnapshotPath(workflowId);
    if (!fs::exists(path)) return std::nullopt;

    auto snapshot = readFile(path);
    // Two ids can sanitize to the same file name; only an exact id match counts.
    if (snapshot && snapshot->definition.getId() != workflowId) {
        return std::nullopt;
    }
    return snapshot;
}

std::vector<std::string> WorkflowSnapshotRepositoryFs::listIds() {
    m_persistence->flush();

    std::vector<std::string> ids;
    fs::path dir = fs::path(m_dataRoot) / "workflows";
    std::error_code ec;
    if (!fs::exists(dir, ec)) return ids;

    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;
        if (auto snapshot = readFile(entry.path().string())) {
            ids.push_back(snapshot->definition.getId());
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

void WorkflowSnapshotRepositoryFs::remove(const std::string& workflowId) {
    if (workflowId.empty()) return;
    m_persistence->removeAsync(getSnapshotPath(workflowId));
}

} // namespace waypoint::infrastructure::workflow
