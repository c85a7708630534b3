/**
 * @file WorkflowSnapshotRepositoryFs.hpp
 * @brief File system implementation of the workflow snapshot repository.
 */

#pragma once

#include <memory>
#include <string>

#include "domain/workflow/repositories/IWorkflowSnapshotRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace waypoint::infrastructure::workflow {

using namespace waypoint::domain::workflow;

/**
 * @class WorkflowSnapshotRepositoryFs
 * @brief One JSON document per workflow under <root>/workflows/.
 *
 * Writes go through the shared PersistenceService; reads flush it first so a
 * caller always sees its own earlier saves.
 */
class WorkflowSnapshotRepositoryFs : public IWorkflowSnapshotRepository {
public:
    WorkflowSnapshotRepositoryFs(std::string dataRoot, std::shared_ptr<PersistenceService> persistence);

    void save(const WorkflowSnapshot& snapshot) override;
    std::optional<WorkflowSnapshot> findById(const std::string& workflowId) override;
    std::vector<std::string> listIds() override;
    void remove(const std::string& workflowId) override;

    /** @brief Maps an id such as "location:ab12" to a safe file name. */
    static std::string FileNameFor(const std::string& workflowId);

private:
    std::string getSnapshotPath(const std::string& workflowId) const;
    std::optional<WorkflowSnapshot> readFile(const std::string& path) const;

    std::string m_dataRoot;
    std::shared_ptr<PersistenceService> m_persistence;
};

} // namespace waypoint::infrastructure::workflow
