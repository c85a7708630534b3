#include <atomic>
#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "domain/workflow/WorkflowErrors.hpp"
#include "test/TestWorkflows.hpp"

using namespace waypoint::application::workflow;
using namespace waypoint::domain::workflow;
using namespace waypoint::test;

namespace {

void RegisterFetch(EngineFixture& fx, std::atomic<int>& calls) {
    fx.executor->registerHandler("fetch", [&calls](const ActionContext& ctx, const CancellationToken&) {
        calls++;
        ActionOutcome outcome;
        outcome.variables["greeting"] = "hello " + ctx.parameters.at("who");
        return outcome;
    });
}

void TestChoiceRouting() {
    EngineFixture fx;
    std::atomic<int> calls{0};
    RegisterFetch(fx, calls);

    auto state = fx.engine->importDefinition(MakeSurvey("survey"), {{"user", "ana"}});
    assert(state.nodeId == "ask");
    assert(state.kind == NodeKind::Choice);
    assert(state.choices.size() == 2);
    assert(!state.isTerminal);

    // A prompt-less advance on a choice node has no unconditional edge to take.
    auto stay = fx.engine->advance("survey");
    assert(!stay.advanced);
    assert(stay.currentNodeId == "ask");

    auto unknownChoice = fx.engine->advance("survey", std::string("maybe"));
    assert(!unknownChoice.advanced);
    assert(fx.engine->getCurrentState("survey").nodeId == "ask");

    auto yes = fx.engine->advance("survey", std::string("yes"));
    assert(yes.advanced);
    assert(yes.currentNodeId == "fetch");
    assert(yes.actionOutcome && yes.actionOutcome->isSuccess());
    assert(calls == 1);
    assert(fx.engine->getVariable("survey", "greeting") == "hello ana");
    assert(fx.engine->getVariable("survey", "status") == "ok");

    auto done = fx.engine->advance("survey");
    assert(done.advanced && done.currentNodeId == "done");
    assert(!done.actionOutcome);
    assert(fx.engine->getCurrentState("survey").isTerminal);

    auto past = fx.engine->advance("survey");
    assert(!past.advanced && past.currentNodeId == "done");
    std::cout << "[PASS] Choices route along guarded edges; terminals never advance." << std::endl;
}

void TestNoChoiceBranch() {
    EngineFixture fx;
    std::atomic<int> calls{0};
    RegisterFetch(fx, calls);

    fx.engine->importDefinition(MakeSurvey("survey"));
    auto no = fx.engine->advance("survey", std::string("no"));
    assert(no.advanced && no.currentNodeId == "bye");
    assert(calls == 0);
    assert(fx.engine->getCurrentState("survey").isTerminal);
    std::cout << "[PASS] The 'no' branch skips the action." << std::endl;
}

void TestUnknownWorkflow() {
    EngineFixture fx;
    bool threw = false;
    try {
        fx.engine->advance("ghost");
    } catch (const UnknownWorkflowError& e) {
        threw = true;
        assert(e.workflowId() == "ghost");
    }
    assert(threw);

    threw = false;
    try {
        fx.engine->startInstance("");
    } catch (const InvalidWorkflowInputError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Unknown and empty workflow ids are reported." << std::endl;
}

void TestFailingActionRecordsError() {
    EngineFixture fx;
    fx.executor->registerHandler("fetch", [](const ActionContext&, const CancellationToken&) -> ActionOutcome {
        throw std::runtime_error("backend down");
    });

    fx.engine->importDefinition(MakeSurvey("survey"));
    auto result = fx.engine->advance("survey", std::string("yes"));
    assert(result.advanced);
    assert(result.actionOutcome && !result.actionOutcome->isSuccess());
    assert(fx.engine->getVariable("survey", "status") == "error");
    assert(fx.engine->getVariable("survey", "error") == "backend down");

    // The failure does not block the walk.
    assert(fx.engine->advance("survey").currentNodeId == "done");
    std::cout << "[PASS] A throwing handler leaves status and error variables." << std::endl;
}

void TestMissingHandlerRecordsError() {
    EngineFixture fx;
    fx.engine->importDefinition(MakeSurvey("survey"));
    auto result = fx.engine->advance("survey", std::string("yes"));
    assert(result.advanced);
    assert(fx.engine->getVariable("survey", "status") == "error");
    assert(fx.engine->getVariable("survey", "error").find("fetch") != std::string::npos);
    std::cout << "[PASS] An unregistered action is reported as an error outcome." << std::endl;
}

void TestCancelledAdvance() {
    EngineFixture fx;
    std::atomic<int> calls{0};
    RegisterFetch(fx, calls);

    fx.engine->importDefinition(MakeSurvey("survey"));
    CancellationSource source;
    source.cancel();
    auto result = fx.engine->advance("survey", std::string("yes"), source.token());
    assert(result.advanced && result.currentNodeId == "fetch");
    assert(result.actionOutcome && result.actionOutcome->isCancelled());
    assert(calls == 0);
    assert(fx.engine->getVariable("survey", "greeting").empty());
    assert(fx.engine->getVariable("survey", "status").empty());
    std::cout << "[PASS] A cancelled action merges no variables." << std::endl;
}

void TestRestartKeepsVariables() {
    EngineFixture fx;
    std::atomic<int> calls{0};
    RegisterFetch(fx, calls);

    fx.engine->importDefinition(MakeSurvey("survey"), {{"user", "bo"}});
    fx.engine->advance("survey", std::string("yes"));
    fx.engine->setVariable("survey", "note", "kept");

    auto state = fx.engine->restartInstance("survey");
    assert(state.nodeId == "ask");
    assert(state.variables.at("note") == "kept");
    assert(state.variables.at("greeting") == "hello bo");
    std::cout << "[PASS] Restart returns to the start node and keeps variables." << std::endl;
}

void TestStartNodeActionRunsOnImport() {
    EngineFixture fx;
    std::atomic<int> calls{0};
    RegisterFetch(fx, calls);

    WorkflowDefinition def("auto", "Auto");
    def.addNode(MakeActionNode("lookup", "fetch", {{"who", "{{user}}"}}));
    def.addNode(MakeNode("end", NodeKind::Terminal));
    def.addTransition(Edge("lookup", "end"));
    def.addStartPoint("lookup");

    auto state = fx.engine->importDefinition(def, {{"user", "cy"}});
    assert(calls == 1);
    assert(state.nodeId == "lookup");
    assert(state.variables.at("greeting") == "hello cy");

    fx.engine->restartInstance("auto");
    assert(calls == 2);
    std::cout << "[PASS] An action start node runs on import and on restart." << std::endl;
}

void TestReimportResetsInstance() {
    EngineFixture fx;
    fx.engine->importDefinition(MakeSurvey("survey"), {{"user", "old"}});
    fx.engine->advance("survey", std::string("no"));

    auto state = fx.engine->importDefinition(MakeSurvey("survey"));
    assert(state.nodeId == "ask");
    assert(state.variables.empty());
    std::cout << "[PASS] Re-import replaces the instance state." << std::endl;
}

void TestStaleNodeIsReset() {
    EngineFixture fx;
    fx.engine->importDefinition(MakeSurvey("survey"));
    fx.engine->advance("survey", std::string("no"));

    // Replace the definition behind the engine's back with one lacking "bye".
    WorkflowDefinition smaller("survey", "Smaller");
    smaller.addNode(MakeNode("ask", NodeKind::Prompt));
    smaller.addNode(MakeNode("done", NodeKind::Terminal));
    smaller.addTransition(Edge("ask", "done"));
    smaller.addStartPoint("ask");
    fx.definitions->registerDefinition(smaller);

    auto state = fx.engine->getCurrentState("survey");
    assert(state.nodeId == "ask");
    std::cout << "[PASS] A pointer to a vanished node falls back to the start node." << std::endl;
}

void TestConcurrentWorkflows() {
    EngineFixture fx;
    std::atomic<int> calls{0};
    RegisterFetch(fx, calls);

    const int NUM_THREADS = 50;
    std::vector<std::thread> threads;
    for (int i = 0; i < NUM_THREADS; ++i) {
        threads.emplace_back([&fx, i]() {
            std::string id = "survey-" + std::to_string(i);
            fx.engine->importDefinition(MakeSurvey(id), {{"user", std::to_string(i)}});
            fx.engine->advance(id, std::string(i % 2 == 0 ? "yes" : "no"));
        });
    }
    for (auto& t : threads) t.join();

    assert(calls == NUM_THREADS / 2);
    assert(fx.engine->listWorkflows().size() == static_cast<size_t>(NUM_THREADS));
    for (int i = 0; i < NUM_THREADS; ++i) {
        std::string id = "survey-" + std::to_string(i);
        auto state = fx.engine->getCurrentState(id);
        if (i % 2 == 0) {
            assert(state.nodeId == "fetch");
            assert(state.variables.at("greeting") == "hello " + std::to_string(i));
        } else {
            assert(state.nodeId == "bye");
            assert(state.variables.count("greeting") == 0);
        }
    }
    std::cout << "[PASS] " << NUM_THREADS << " workflows advanced concurrently without crosstalk." << std::endl;
}

void TestRemoveWorkflow() {
    EngineFixture fx;
    fx.engine->importDefinition(MakeSurvey("survey"));
    assert(fx.engine->workflowExists("survey"));
    assert(fx.engine->getCreatedAt("survey"));

    assert(fx.engine->removeWorkflow("survey"));
    assert(!fx.engine->workflowExists("survey"));
    assert(!fx.engine->getCreatedAt("survey"));
    assert(fx.engine->getVariables("survey").empty());
    assert(!fx.engine->removeWorkflow("survey"));
    std::cout << "[PASS] Removal clears definition, instance and creation time." << std::endl;
}

void TestGuardedEdgeBeatsUnconditional() {
    EngineFixture fx;
    auto makeFork = [] {
        WorkflowDefinition def("fork", "Fork");
        def.addNode(MakeNode("a", NodeKind::Prompt));
        def.addNode(MakeNode("b", NodeKind::Terminal));
        def.addNode(MakeNode("c", NodeKind::Terminal));
        def.addTransition(Edge("a", "c"));
        def.addTransition(Guarded("a", "b", "yes"));
        def.addStartPoint("a");
        return def;
    };

    fx.engine->importDefinition(makeFork());
    auto yes = fx.engine->advance("fork", std::string("yes"));
    assert(yes.advanced && yes.currentNodeId == "b");

    fx.engine->importDefinition(makeFork());
    auto plain = fx.engine->advance("fork");
    assert(plain.advanced && plain.currentNodeId == "c");

    fx.engine->importDefinition(makeFork());
    auto no = fx.engine->advance("fork", std::string("no"));
    assert(!no.advanced && no.currentNodeId == "a");
    assert(fx.engine->getCurrentState("fork").nodeId == "a");
    std::cout << "[PASS] A matching guard wins over the unconditional edge." << std::endl;
}

void TestUnnamedOutcomeVariableIsDropped() {
    EngineFixture fx;
    fx.executor->registerHandler("fetch", [](const ActionContext&, const CancellationToken&) {
        ActionOutcome outcome;
        outcome.variables[""] = "x";
        outcome.variables["foo"] = "bar";
        return outcome;
    });

    fx.engine->importDefinition(MakeSurvey("survey"));
    auto result = fx.engine->advance("survey", std::string("yes"));
    assert(result.advanced && result.currentNodeId == "fetch");
    assert(result.actionOutcome && result.actionOutcome->isSuccess());
    assert(result.actionOutcome->variables.count("") == 0);
    assert(fx.engine->getVariable("survey", "foo") == "bar");
    assert(fx.engine->getVariable("survey", "status") == "ok");
    std::cout << "[PASS] A handler's unnamed variable cannot abort the advance." << std::endl;
}

void TestEmptyIdIsInvalidInput() {
    EngineFixture fx;
    auto throwsInvalid = [](auto fn) {
        try {
            fn();
        } catch (const InvalidWorkflowInputError&) {
            return true;
        }
        return false;
    };
    assert(throwsInvalid([&] { fx.engine->advance(""); }));
    assert(throwsInvalid([&] { fx.engine->getCurrentState(""); }));
    assert(throwsInvalid([&] { fx.engine->restartInstance(""); }));
    assert(throwsInvalid([&] { fx.engine->startInstance(""); }));
    assert(throwsInvalid([&] { fx.engine->setVariable("", "k", "v"); }));
    assert(throwsInvalid([&] { fx.engine->getVariables(""); }));
    assert(throwsInvalid([&] { fx.engine->removeWorkflow(""); }));
    std::cout << "[PASS] An empty workflow id is rejected as invalid input everywhere." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Advancement Test..." << std::endl;
    TestChoiceRouting();
    TestNoChoiceBranch();
    TestUnknownWorkflow();
    TestFailingActionRecordsError();
    TestMissingHandlerRecordsError();
    TestCancelledAdvance();
    TestRestartKeepsVariables();
    TestStartNodeActionRunsOnImport();
    TestReimportResetsInstance();
    TestStaleNodeIsReset();
    TestConcurrentWorkflows();
    TestRemoveWorkflow();
    TestGuardedEdgeBeatsUnconditional();
    TestUnnamedOutcomeVariableIsDropped();
    TestEmptyIdIsInvalidInput();
    std::cout << "[PASS] Advancement Test." << std::endl;
    return 0;
}
