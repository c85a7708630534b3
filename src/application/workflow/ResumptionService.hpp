/**
 * @file ResumptionService.hpp
 * @brief Maps an external context (an address) to a stable workflow id and decides resume vs. fresh start.
 */

#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "application/workflow/WorkflowEngine.hpp"

namespace waypoint::application::workflow {

/**
 * @struct ResumptionContext
 * @brief External facts that identify (and seed) a workflow.
 */
struct ResumptionContext {
    std::string address;
    std::string previousAddress;
    std::optional<double> latitude;
    std::optional<double> longitude;
    std::chrono::system_clock::time_point observedAt = std::chrono::system_clock::now();
};

/**
 * @struct ResumptionDecision
 */
struct ResumptionDecision {
    std::string workflowId;
    bool resumed = false; ///< True when an existing instance inside the window was reused.
    WorkflowStatePayload state;
};

/**
 * @class ResumptionService
 * @brief One definition/instance pair per derived key, reused inside a trailing time window.
 *
 * Textual variants of the same address produce different keys.
 */
class ResumptionService {
public:
    static constexpr const char* kDefaultDomain = "location";

    /**
     * @param engine Engine that owns the definitions and instances.
     * @param templateDefinition Graph copied under each derived id.
     * @param window Maximum age of a resumable instance (inclusive).
     * @param domain Prefix of the composed id.
     */
    ResumptionService(std::shared_ptr<WorkflowEngine> engine,
                      WorkflowDefinition templateDefinition,
                      std::chrono::seconds window = std::chrono::hours(24),
                      std::string domain = kDefaultDomain);

    /** @brief Trim, collapse inner whitespace and lower-case. */
    static std::string NormalizeKey(const std::string& raw);

    /** @brief First 16 lower-case hex chars of SHA-256 over the normalized address. */
    static std::string DeriveKey(const std::string& address);
    static std::string DeriveKey(const ResumptionContext& context);

    static std::string ComposeWorkflowId(const std::string& domain, const std::string& token);

    /**
     * @brief Resumes the keyed workflow when it is recent enough, otherwise starts it fresh.
     * @throws InvalidWorkflowInputError when the address is blank.
     */
    ResumptionDecision resumeOrStart(const ResumptionContext& context);

    std::string workflowIdFor(const std::string& address) const;

private:
    std::shared_ptr<WorkflowEngine> m_engine;
    WorkflowDefinition m_template;
    std::chrono::seconds m_window;
    std::string m_domain;
    std::mutex m_mutex;
};

} // namespace waypoint::application::workflow
