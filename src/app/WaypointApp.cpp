/**
 * @file WaypointApp.cpp
 * @brief Implementation of the WaypointApp class.
 */
#include "app/WaypointApp.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

#include "application/actions/NearbyBusinessesActionHandler.hpp"
#include "domain/workflow/WorkflowErrors.hpp"
#include "infrastructure/LocationApiClient.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/workflow/InMemoryWorkflowDefinitionStore.hpp"
#include "infrastructure/workflow/InMemoryWorkflowInstanceStore.hpp"
#include "infrastructure/workflow/JsonDefinitionCodec.hpp"
#include "infrastructure/workflow/WorkflowSnapshotRepositoryFs.hpp"

namespace waypoint::app {

using application::workflow::ResumptionContext;
using application::workflow::ResumptionDecision;
using application::workflow::WorkflowStatePayload;
using domain::workflow::NodeKind;

namespace {

std::string ToLower(const std::string& value) {
    std::string out = value;
    for (auto& ch : out) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return out;
}

std::string Trim(const std::string& value) {
    std::size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return {};
    std::size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

std::optional<double> ParseDouble(const std::string& text) {
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (text.empty() || end == text.c_str() || *end != '\0') return std::nullopt;
    return value;
}

} // namespace

WaypointApp::WaypointApp(std::istream& in, std::ostream& out)
    : m_in(in), m_out(out) {}

void WaypointApp::PrintUsage(std::ostream& out) {
    out << "Usage: waypoint --workflow <file.json> --address <text> [options]\n"
        << "       waypoint --list | --remove <workflow-id> | --init-config\n\n"
        << "Options:\n"
        << "  --previous <text>     Address of the previous visit\n"
        << "  --lat <deg>           Latitude of the current position\n"
        << "  --lon <deg>           Longitude of the current position\n"
        << "  --config-dir <dir>    Directory holding settings.json\n"
        << "  --data-dir <dir>      Directory for persisted workflows\n"
        << "  -h, --help            Show this help\n";
}

std::optional<LaunchOptions> WaypointApp::ParseArguments(const std::vector<std::string>& args, std::string& error) {
    LaunchOptions options;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto next = [&](std::string& target) {
            if (i + 1 >= args.size()) {
                error = "Missing value for " + arg;
                return false;
            }
            target = args[++i];
            return true;
        };

        if (arg == "-h" || arg == "--help") {
            options.showHelp = true;
        } else if (arg == "--workflow") {
            if (!next(options.workflowPath)) return std::nullopt;
        } else if (arg == "--address") {
            if (!next(options.address)) return std::nullopt;
        } else if (arg == "--previous") {
            if (!next(options.previousAddress)) return std::nullopt;
        } else if (arg == "--lat" || arg == "--lon") {
            std::string raw;
            if (!next(raw)) return std::nullopt;
            auto value = ParseDouble(raw);
            if (!value) {
                error = "Invalid number for " + arg + ": " + raw;
                return std::nullopt;
            }
            (arg == "--lat" ? options.latitude : options.longitude) = *value;
        } else if (arg == "--config-dir") {
            if (!next(options.configDir)) return std::nullopt;
        } else if (arg == "--data-dir") {
            if (!next(options.dataDir)) return std::nullopt;
        } else if (arg == "--init-config") {
            options.initConfig = true;
        } else if (arg == "--list") {
            options.listWorkflows = true;
        } else if (arg == "--remove") {
            if (!next(options.removeId)) return std::nullopt;
        } else {
            error = "Unknown argument: " + arg;
            return std::nullopt;
        }
    }

    bool maintenance = options.showHelp || options.initConfig || options.listWorkflows || !options.removeId.empty();
    if (!maintenance && (options.workflowPath.empty() || options.address.empty())) {
        error = "Both --workflow and --address are required.";
        return std::nullopt;
    }
    return options;
}

bool WaypointApp::Init(const LaunchOptions& options) {
    std::string configDir = options.configDir.empty()
        ? infrastructure::PathUtils::GetWaypointConfigDir().string()
        : options.configDir;
    m_config = infrastructure::ConfigLoader::Load(configDir);
    if (!options.dataDir.empty()) {
        m_config.dataDir = options.dataDir;
    }
    if (m_config.dataDir.empty()) {
        m_config.dataDir = infrastructure::PathUtils::GetWaypointDataDir().string();
    }
    std::cout << "[WaypointApp] Data directory: " << m_config.dataDir << std::endl;

    // Dependency Injection / Composition Root
    m_services.persistenceService = std::make_shared<infrastructure::PersistenceService>();
    m_services.definitionStore = std::make_shared<infrastructure::workflow::InMemoryWorkflowDefinitionStore>();
    m_services.instanceStore = std::make_shared<infrastructure::workflow::InMemoryWorkflowInstanceStore>();
    m_services.snapshotRepository = std::make_shared<infrastructure::workflow::WorkflowSnapshotRepositoryFs>(
        m_config.dataDir, m_services.persistenceService);
    m_services.locationService = std::make_shared<infrastructure::LocationApiClient>(
        m_config.locationApiHost, m_config.locationApiPort, m_config.locationApiTimeoutSeconds);

    application::workflow::ActionExecutorOptions executorOptions;
    executorOptions.logExecutionTime = m_config.logActionTiming;
    m_services.actionExecutor = std::make_shared<application::workflow::ActionExecutor>(executorOptions);
    m_services.actionExecutor->registerHandler(std::make_shared<application::actions::NearbyBusinessesActionHandler>(
        m_services.locationService, m_config.defaultSearchRadiusMeters));

    m_services.engine = std::make_shared<application::workflow::WorkflowEngine>(
        m_services.definitionStore, m_services.instanceStore, m_services.actionExecutor, m_services.snapshotRepository);

    if (!options.workflowPath.empty()) {
        try {
            auto definition = infrastructure::workflow::JsonDefinitionCodec::LoadFile(options.workflowPath);
            m_services.resumptionService = std::make_unique<application::workflow::ResumptionService>(
                m_services.engine,
                std::move(definition),
                std::chrono::hours(m_config.resumptionWindowHours),
                m_config.resumptionDomain);
        } catch (const std::exception& e) {
            std::cerr << "[WaypointApp] Failed to load workflow " << options.workflowPath << ": " << e.what() << std::endl;
            return false;
        }
    }
    return true;
}

void WaypointApp::Shutdown() {
    if (m_services.persistenceService) {
        m_services.persistenceService->flush();
        m_services.persistenceService->stop();
    }
    m_services.resumptionService.reset();
    m_services.engine.reset();
}

void WaypointApp::Render(const WorkflowStatePayload& state) {
    std::string text = application::workflow::ActionExecutor::ResolveTemplate(state.displayText, state.variables);
    m_out << "\n== " << (text.empty() ? state.nodeId : text) << "\n";

    if (state.kind == NodeKind::Choice) {
        for (std::size_t i = 0; i < state.choices.size(); ++i) {
            m_out << "  " << (i + 1) << ") " << state.choices[i].label << "\n";
        }
        m_out << "Choose (number, value or 'quit'): " << std::flush;
    } else if (!state.isTerminal) {
        m_out << "[Enter to continue, 'restart' or 'quit'] " << std::flush;
    }
}

std::optional<std::string> WaypointApp::MatchChoice(const WorkflowStatePayload& state, const std::string& input) const {
    std::string wanted = ToLower(input);
    for (std::size_t i = 0; i < state.choices.size(); ++i) {
        const auto& choice = state.choices[i];
        if (wanted == std::to_string(i + 1) || wanted == ToLower(choice.value) || wanted == ToLower(choice.label)) {
            return choice.value;
        }
    }
    return std::nullopt;
}

int WaypointApp::Converse(const ResumptionDecision& decision) {
    auto& engine = *m_services.engine;
    const std::string& workflowId = decision.workflowId;
    WorkflowStatePayload state = decision.state;

    m_out << (decision.resumed ? "Resuming " : "Starting ") << workflowId << "\n";

    while (!state.isTerminal) {
        Render(state);

        std::string line;
        if (!std::getline(m_in, line)) {
            m_out << "\n";
            break;
        }
        line = Trim(line);

        if (line == "quit") break;
        if (line == "restart") {
            state = engine.restartInstance(workflowId);
            continue;
        }

        std::optional<std::string> choice;
        if (state.kind == NodeKind::Choice) {
            choice = MatchChoice(state, line);
            if (!choice) {
                m_out << "Not a valid choice.\n";
                continue;
            }
        }

        auto result = engine.advance(workflowId, choice);
        if (!result.advanced) {
            m_out << "There is no way forward from here.\n";
            break;
        }
        if (result.actionOutcome && !result.actionOutcome->isSuccess()) {
            m_out << "(" << result.actionOutcome->status << ": " << result.actionOutcome->message << ")\n";
        }
        state = engine.getCurrentState(workflowId);
    }

    if (state.isTerminal) {
        Render(state);
        m_out << "Workflow complete.\n";
    }
    return 0;
}

int WaypointApp::Run(const std::vector<std::string>& args) {
    std::string error;
    auto options = ParseArguments(args, error);
    if (!options) {
        std::cerr << "[WaypointApp] " << error << std::endl;
        PrintUsage(std::cerr);
        return 2;
    }
    if (options->showHelp) {
        PrintUsage(m_out);
        return 0;
    }

    if (options->initConfig) {
        std::string configDir = options->configDir.empty()
            ? infrastructure::PathUtils::GetWaypointConfigDir().string()
            : options->configDir;
        infrastructure::ConfigLoader::Save(configDir, infrastructure::ConfigLoader::Load(configDir));
        m_out << "Wrote " << (std::filesystem::path(configDir) / "settings.json").string() << "\n";
        return 0;
    }

    if (!Init(*options)) {
        Shutdown();
        return 1;
    }

    int exitCode = 0;
    try {
        if (options->listWorkflows) {
            for (const auto& id : m_services.snapshotRepository->listIds()) {
                auto snapshot = m_services.snapshotRepository->findById(id);
                m_out << id << "  node=" << (snapshot ? snapshot->currentNodeId : std::string("?")) << "\n";
            }
        } else if (!options->removeId.empty()) {
            m_services.engine->startInstance(options->removeId);
            m_services.engine->removeWorkflow(options->removeId);
            m_out << "Removed " << options->removeId << "\n";
        } else {
            ResumptionContext context;
            context.address = options->address;
            context.previousAddress = options->previousAddress;
            context.latitude = options->latitude;
            context.longitude = options->longitude;
            exitCode = Converse(m_services.resumptionService->resumeOrStart(context));
        }
    } catch (const domain::workflow::UnknownWorkflowError& e) {
        std::cerr << "[WaypointApp] " << e.what() << std::endl;
        exitCode = 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[WaypointApp] Invalid input: " << e.what() << std::endl;
        exitCode = 2;
    }

    Shutdown();
    return exitCode;
}

} // namespace waypoint::app
