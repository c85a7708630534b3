/**
 * @file ResumptionService.cpp
 * @brief Implementation of ResumptionService.
 */

#include "application/workflow/ResumptionService.hpp"
#include "domain/workflow/WorkflowErrors.hpp"

#include <openssl/evp.h>

#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace waypoint::application::workflow {

namespace {

constexpr std::size_t kTokenLength = 16;

std::string Sha256Hex(const std::string& input) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLength = 0;

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx ||
        EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digestLength) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    std::ostringstream hex;
    hex << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digestLength; ++i) {
        hex << std::setw(2) << static_cast<int>(digest[i]);
    }
    return hex.str();
}

std::string FormatTimestamp(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buffer;
}

std::string FormatCoordinate(double value) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.6f", value);
    return buffer;
}

} // namespace

ResumptionService::ResumptionService(std::shared_ptr<WorkflowEngine> engine,
                                     WorkflowDefinition templateDefinition,
                                     std::chrono::seconds window,
                                     std::string domain)
    : m_engine(std::move(engine)),
      m_template(std::move(templateDefinition)),
      m_window(window),
      m_domain(domain.empty() ? std::string(kDefaultDomain) : std::move(domain)) {
    if (!m_engine) {
        throw std::invalid_argument("ResumptionService requires an engine.");
    }
    // Fail early rather than on the first visit.
    WorkflowDefinition sample = m_template;
    sample.setId(ComposeWorkflowId(m_domain, "sample"));
    sample.validate();
}

std::string ResumptionService::NormalizeKey(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    bool pendingSpace = false;
    for (char ch : raw) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isspace(c)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

std::string ResumptionService::DeriveKey(const std::string& address) {
    std::string normalized = NormalizeKey(address);
    if (normalized.empty()) {
        throw InvalidWorkflowInputError("Cannot derive a workflow key from an empty address.");
    }
    return Sha256Hex(normalized).substr(0, kTokenLength);
}

std::string ResumptionService::DeriveKey(const ResumptionContext& context) {
    return DeriveKey(context.address);
}

std::string ResumptionService::ComposeWorkflowId(const std::string& domain, const std::string& token) {
    return domain + ":" + token;
}

std::string ResumptionService::workflowIdFor(const std::string& address) const {
    return ComposeWorkflowId(m_domain, DeriveKey(address));
}

ResumptionDecision ResumptionService::resumeOrStart(const ResumptionContext& context) {
    std::string workflowId = workflowIdFor(context.address);

    std::lock_guard<std::mutex> lock(m_mutex);

    ResumptionDecision decision;
    decision.workflowId = workflowId;

    auto createdAt = m_engine->getCreatedAt(workflowId);
    if (createdAt && context.observedAt - *createdAt <= m_window) {
        if (!m_engine->workflowExists(workflowId)) {
            // Known only from a snapshot; bring it back.
            try {
                decision.state = m_engine->startInstance(workflowId);
                decision.resumed = true;
            } catch (const UnknownWorkflowError& e) {
                std::cerr << "[ResumptionService] Could not restore " << workflowId << ": " << e.what() << std::endl;
            }
        } else {
            decision.state = m_engine->getCurrentState(workflowId);
            decision.resumed = true;
        }
    }

    if (decision.resumed) {
        std::cout << "[ResumptionService] Resuming " << workflowId << std::endl;
        return decision;
    }

    VariableMap seed;
    seed["address"] = context.address;
    seed["previous_address"] = context.previousAddress;
    seed["latitude"] = context.latitude ? FormatCoordinate(*context.latitude) : std::string();
    seed["longitude"] = context.longitude ? FormatCoordinate(*context.longitude) : std::string();
    seed["timestamp"] = FormatTimestamp(context.observedAt);
    seed["is_first_visit"] = NormalizeKey(context.previousAddress).empty() ? "true" : "false";

    WorkflowDefinition fresh = m_template;
    fresh.setId(workflowId);
    decision.state = m_engine->importDefinition(std::move(fresh), seed, context.observedAt);

    std::cout << "[ResumptionService] Started " << workflowId << " for '" << context.address << "'" << std::endl;
    return decision;
}

} // namespace waypoint::application::workflow
