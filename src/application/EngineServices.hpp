/**
 * @file EngineServices.hpp
 * @brief Container for engine-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/workflow/ActionExecutor.hpp"
#include "application/workflow/ResumptionService.hpp"
#include "application/workflow/WorkflowEngine.hpp"
#include "domain/location/LocationService.hpp"
#include "domain/workflow/repositories/IWorkflowDefinitionStore.hpp"
#include "domain/workflow/repositories/IWorkflowInstanceStore.hpp"
#include "domain/workflow/repositories/IWorkflowSnapshotRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace waypoint::application {

struct EngineServices {
    std::shared_ptr<infrastructure::PersistenceService> persistenceService;
    std::shared_ptr<domain::workflow::IWorkflowDefinitionStore> definitionStore;
    std::shared_ptr<domain::workflow::IWorkflowInstanceStore> instanceStore;
    std::shared_ptr<domain::workflow::IWorkflowSnapshotRepository> snapshotRepository;
    std::shared_ptr<domain::location::LocationService> locationService;
    std::shared_ptr<workflow::ActionExecutor> actionExecutor;
    std::shared_ptr<workflow::WorkflowEngine> engine;
    std::unique_ptr<workflow::ResumptionService> resumptionService;
};

} // namespace waypoint::application
