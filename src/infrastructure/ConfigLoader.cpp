/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace waypoint::infrastructure {

namespace {

// Returns the value of key when present with the right type; logs and keeps the fallback otherwise.
template <typename T>
T ReadOr(const nlohmann::json& j, const char* key, T fallback) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return fallback;
    try {
        return it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring invalid value for '" << key << "': " << e.what() << std::endl;
        return fallback;
    }
}

} // namespace

EngineConfig ConfigLoader::Load(const std::string& configDir) {
    EngineConfig config;
    std::filesystem::path configPath = std::filesystem::path(configDir) / "settings.json";
    if (!std::filesystem::exists(configPath)) {
        return config;
    }

    nlohmann::json j;
    try {
        std::ifstream f(configPath);
        f >> j;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
        return config;
    }
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] settings.json is not a JSON object, using defaults." << std::endl;
        return config;
    }

    config.dataDir = ReadOr(j, "data_dir", config.dataDir);
    config.resumptionWindowHours = ReadOr(j, "resumption_window_hours", config.resumptionWindowHours);
    config.resumptionDomain = ReadOr(j, "resumption_domain", config.resumptionDomain);
    config.logActionTiming = ReadOr(j, "log_action_timing", config.logActionTiming);
    config.defaultSearchRadiusMeters = ReadOr(j, "default_search_radius_m", config.defaultSearchRadiusMeters);

    if (j.contains("location_api") && j["location_api"].is_object()) {
        const auto& api = j["location_api"];
        config.locationApiHost = ReadOr(api, "host", config.locationApiHost);
        config.locationApiPort = ReadOr(api, "port", config.locationApiPort);
        config.locationApiTimeoutSeconds = ReadOr(api, "timeout_seconds", config.locationApiTimeoutSeconds);
    }

    if (config.resumptionWindowHours <= 0) {
        std::cerr << "[ConfigLoader] resumption_window_hours must be positive, using 24." << std::endl;
        config.resumptionWindowHours = 24;
    }
    if (config.resumptionDomain.empty()) {
        config.resumptionDomain = "location";
    }
    return config;
}

void ConfigLoader::Save(const std::string& configDir, const EngineConfig& config) {
    std::filesystem::path configPath = std::filesystem::path(configDir) / "settings.json";
    nlohmann::json j = nlohmann::json::object();

    // Load existing to preserve other settings
    if (std::filesystem::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            f >> j;
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Overwriting unreadable settings.json: " << e.what() << std::endl;
            j = nlohmann::json::object();
        }
        if (!j.is_object()) j = nlohmann::json::object();
    }

    j["data_dir"] = config.dataDir;
    j["resumption_window_hours"] = config.resumptionWindowHours;
    j["resumption_domain"] = config.resumptionDomain;
    j["log_action_timing"] = config.logActionTiming;
    j["default_search_radius_m"] = config.defaultSearchRadiusMeters;
    j["location_api"] = {
        {"host", config.locationApiHost},
        {"port", config.locationApiPort},
        {"timeout_seconds", config.locationApiTimeoutSeconds}
    };

    try {
        std::filesystem::create_directories(configDir);
        std::ofstream f(configPath);
        f << j.dump(4);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error writing settings.json: " << e.what() << std::endl;
    }
}

} // namespace waypoint::infrastructure
