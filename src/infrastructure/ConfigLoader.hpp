/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving engine configuration (settings.json).
 *
 * Keeps JSON parsing of settings in one place instead of scattering it
 * across the engine, the resumption service and the HTTP client.
 */

#pragma once

#include <string>

namespace waypoint::infrastructure {

/**
 * @struct EngineConfig
 * @brief Every tunable of the engine, with defaults used when a key is missing.
 */
struct EngineConfig {
    std::string dataDir;                     ///< Where snapshots are stored. Empty = XDG data dir.
    int resumptionWindowHours = 24;          ///< Age limit of a resumable workflow.
    std::string resumptionDomain = "location"; ///< Prefix of resumption workflow ids.
    bool logActionTiming = false;

    std::string locationApiHost = "localhost";
    int locationApiPort = 4748;
    int locationApiTimeoutSeconds = 30;
    int defaultSearchRadiusMeters = 1000;
};

class ConfigLoader {
public:
    /**
     * @brief Reads <configDir>/settings.json.
     * @param configDir Directory holding settings.json.
     * @return The configuration; defaults for a missing file, missing keys or unreadable content.
     */
    static EngineConfig Load(const std::string& configDir);

    /**
     * @brief Writes the configuration to <configDir>/settings.json, preserving unknown keys.
     */
    static void Save(const std::string& configDir, const EngineConfig& config);
};

} // namespace waypoint::infrastructure
