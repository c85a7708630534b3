/**
 * @file WaypointApp.hpp
 * @brief Console front end: resumes or starts a workflow for an address and walks it interactively.
 */

#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "application/EngineServices.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace waypoint::app {

/**
 * @struct LaunchOptions
 * @brief Command line of the waypoint executable.
 */
struct LaunchOptions {
    std::string workflowPath;    ///< --workflow: JSON definition used as the template.
    std::string address;         ///< --address: key of the workflow to resume or start.
    std::string previousAddress; ///< --previous
    std::optional<double> latitude;  ///< --lat
    std::optional<double> longitude; ///< --lon
    std::string configDir;       ///< --config-dir, defaults to the XDG config dir.
    std::string dataDir;         ///< --data-dir, overrides settings.json.
    bool initConfig = false;     ///< --init-config: write settings.json with defaults and exit.
    bool listWorkflows = false;  ///< --list: print persisted workflows and exit.
    std::string removeId;        ///< --remove <id>: delete a persisted workflow and exit.
    bool showHelp = false;
};

/**
 * @class WaypointApp
 * @brief Orchestrates the application lifecycle: composition, the conversation loop and shutdown.
 */
class WaypointApp {
public:
    WaypointApp(std::istream& in, std::ostream& out);

    /**
     * @brief Runs the application.
     * @param args Arguments without the program name.
     * @return Exit code (0 for success).
     */
    int Run(const std::vector<std::string>& args);

    /**
     * @brief Parses the command line.
     * @param error Receives a message when parsing fails.
     * @return The options, or nullopt on a usage error.
     */
    static std::optional<LaunchOptions> ParseArguments(const std::vector<std::string>& args, std::string& error);

    static void PrintUsage(std::ostream& out);

private:
    /**
     * @brief Loads settings and wires stores, executor, engine and handlers.
     * @return True if initialization succeeded.
     */
    bool Init(const LaunchOptions& options);

    /**
     * @brief Flushes pending snapshot writes and releases the services.
     */
    void Shutdown();

    int Converse(const application::workflow::ResumptionDecision& decision);
    void Render(const application::workflow::WorkflowStatePayload& state);
    std::optional<std::string> MatchChoice(const application::workflow::WorkflowStatePayload& state,
                                           const std::string& input) const;

    std::istream& m_in;
    std::ostream& m_out;
    infrastructure::EngineConfig m_config;
    application::EngineServices m_services;
};

} // namespace waypoint::app
