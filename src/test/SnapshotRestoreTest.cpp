#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "application/workflow/ResumptionService.hpp"
#include "domain/workflow/WorkflowErrors.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/workflow/JsonDefinitionCodec.hpp"
#include "infrastructure/workflow/WorkflowSnapshotRepositoryFs.hpp"
#include "test/TestWorkflows.hpp"

using namespace waypoint::application::workflow;
using namespace waypoint::domain::workflow;
using namespace waypoint::infrastructure;
using namespace waypoint::infrastructure::workflow;
using namespace waypoint::test;
using namespace std::chrono_literals;

namespace {

// One process lifetime: fresh stores over a shared data directory.
struct Session {
    std::shared_ptr<PersistenceService> persistence = std::make_shared<PersistenceService>();
    std::shared_ptr<WorkflowSnapshotRepositoryFs> snapshots;
    std::shared_ptr<WorkflowEngine> engine;

    explicit Session(const std::string& root) {
        snapshots = std::make_shared<WorkflowSnapshotRepositoryFs>(root, persistence);
        auto executor = std::make_shared<ActionExecutor>();
        executor->registerHandler("fetch", [](const ActionContext& ctx, const CancellationToken&) {
            ActionOutcome outcome;
            outcome.variables["greeting"] = "hello " + ctx.parameters.at("who");
            return outcome;
        });
        engine = std::make_shared<WorkflowEngine>(std::make_shared<InMemoryWorkflowDefinitionStore>(),
                                                  std::make_shared<InMemoryWorkflowInstanceStore>(),
                                                  executor,
                                                  snapshots);
    }

    ~Session() {
        persistence->flush();
        persistence->stop();
    }
};

void TestFileNames() {
    assert(WorkflowSnapshotRepositoryFs::FileNameFor("location:5bd72764c0124039") == "location_5bd72764c0124039.json");
    assert(WorkflowSnapshotRepositoryFs::FileNameFor("../etc/passwd") == ".._etc_passwd.json");
    std::cout << "[PASS] Workflow ids map to safe file names." << std::endl;
}

void TestRestoreAcrossSessions(const std::string& root) {
    // Whole seconds survive the millisecond encoding exactly.
    auto createdAt = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));
    {
        Session first(root);
        first.engine->importDefinition(MakeSurvey("survey"), {{"user", "dee"}}, createdAt);
        first.engine->advance("survey", std::string("yes"));
        first.engine->setVariable("survey", "note", "from session one");
    }

    {
        Session second(root);
        assert(!second.engine->workflowExists("survey"));
        assert(second.engine->getCreatedAt("survey") == createdAt && "createdAt is read from the snapshot");

        auto state = second.engine->startInstance("survey");
        assert(state.nodeId == "fetch");
        assert(state.variables.at("greeting") == "hello dee");
        assert(state.variables.at("note") == "from session one");
        assert(second.engine->workflowExists("survey"));

        auto done = second.engine->advance("survey");
        assert(done.currentNodeId == "done");

        auto ids = second.snapshots->listIds();
        assert(ids.size() == 1 && ids[0] == "survey");
    }

    {
        Session third(root);
        assert(third.engine->startInstance("survey").isTerminal);
        assert(third.engine->removeWorkflow("survey"));
        assert(!third.snapshots->findById("survey"));
    }

    {
        Session fourth(root);
        assert(!fourth.snapshots->findById("survey"));
        assert(fourth.snapshots->listIds().empty());
    }
    std::cout << "[PASS] Node, variables and creation time survive a restart." << std::endl;
}

void TestResumptionAcrossSessions(const std::string& root) {
    auto t0 = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));
    ResumptionContext visit;
    visit.address = "123 Main St, Springfield";
    visit.observedAt = t0;

    std::string workflowId;
    {
        Session first(root);
        ResumptionService service(first.engine, MakeSurvey("template"));
        auto decision = service.resumeOrStart(visit);
        assert(!decision.resumed);
        workflowId = decision.workflowId;
        first.engine->advance(workflowId, std::string("no"));
    }

    {
        Session second(root);
        ResumptionService service(second.engine, MakeSurvey("template"));
        visit.observedAt = t0 + 2h;
        auto decision = service.resumeOrStart(visit);
        assert(decision.resumed);
        assert(decision.workflowId == workflowId);
        assert(decision.state.nodeId == "bye");
        assert(decision.state.variables.at("address") == "123 Main St, Springfield");
    }

    {
        Session third(root);
        ResumptionService service(third.engine, MakeSurvey("template"));
        visit.observedAt = t0 + 25h;
        auto decision = service.resumeOrStart(visit);
        assert(!decision.resumed);
        assert(decision.state.nodeId == "ask");
        assert(third.snapshots->findById(workflowId)->createdAt == t0 + 25h);
    }
    std::cout << "[PASS] Resumption consults persisted snapshots." << std::endl;
}

void TestCorruptSnapshotIsIgnored(const std::string& root) {
    auto dir = std::filesystem::path(root) / "workflows";
    std::filesystem::create_directories(dir);
    {
        std::ofstream out(dir / "broken.json");
        out << "{ not json";
    }
    Session session(root);
    assert(!session.snapshots->findById("broken"));
    for (const auto& id : session.snapshots->listIds()) {
        assert(id != "broken");
    }
    std::cout << "[PASS] Unreadable snapshot files are skipped." << std::endl;
}

void TestUnnamedSnapshotVariableIsSkipped(const std::string& root) {
    auto dir = std::filesystem::path(root) / "workflows";
    std::filesystem::create_directories(dir);
    nlohmann::json doc = {
        {"workflowId", "odd"},
        {"definition", JsonDefinitionCodec::ToJson(MakeSurvey("odd"))},
        {"currentNodeId", "bye"},
        {"variables", {{"", "x"}, {"kept", "yes"}}},
        {"createdAt", 1700000000000LL},
        {"updatedAt", 1700000000000LL}
    };
    {
        std::ofstream out(dir / WorkflowSnapshotRepositoryFs::FileNameFor("odd"));
        out << doc.dump(4);
    }

    Session session(root);
    auto state = session.engine->startInstance("odd");
    assert(state.nodeId == "bye");
    assert(state.variables.size() == 1);
    assert(state.variables.at("kept") == "yes");
    std::cout << "[PASS] A snapshot with an unnamed variable still restores." << std::endl;
}

void TestRemovalIsNotUndoneByInFlightWrites(const std::string& root) {
    const int ROUNDS = 20;
    for (int round = 0; round < ROUNDS; ++round) {
        Session session(root);
        session.engine->importDefinition(MakeSurvey("busy"));

        std::atomic<bool> started{false};
        std::thread walker([&]() {
            try {
                for (int i = 0; i < 1000; ++i) {
                    session.engine->setVariable("busy", "step", std::to_string(i));
                    session.engine->restartInstance("busy");
                    session.engine->advance("busy", std::string(i % 2 == 0 ? "yes" : "no"));
                    started = true;
                }
            } catch (const UnknownWorkflowError&) {
                // The workflow was removed underneath us.
            }
        });

        while (!started) std::this_thread::yield();
        assert(session.engine->removeWorkflow("busy"));
        walker.join();

        assert(!session.snapshots->findById("busy") && "A removed workflow must stay removed on disk");
        assert(!std::filesystem::exists(std::filesystem::path(root) / "workflows" /
                                        WorkflowSnapshotRepositoryFs::FileNameFor("busy")));
    }
    std::cout << "[PASS] Removal wins over writes racing with it (" << ROUNDS << " rounds)." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Snapshot Restore Test..." << std::endl;
    auto root = std::filesystem::temp_directory_path() / "waypoint_snapshot_test";
    std::filesystem::remove_all(root);

    TestFileNames();
    TestRestoreAcrossSessions((root / "restore").string());
    TestResumptionAcrossSessions((root / "resume").string());
    TestCorruptSnapshotIsIgnored((root / "corrupt").string());
    TestUnnamedSnapshotVariableIsSkipped((root / "unnamed").string());
    TestRemovalIsNotUndoneByInFlightWrites((root / "race").string());

    std::filesystem::remove_all(root);
    std::cout << "[PASS] Snapshot Restore Test." << std::endl;
    return 0;
}
