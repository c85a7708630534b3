#include <atomic>
#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "domain/workflow/WorkflowErrors.hpp"
#include "infrastructure/workflow/InMemoryWorkflowDefinitionStore.hpp"
#include "test/TestWorkflows.hpp"

using namespace waypoint::domain::workflow;
using namespace waypoint::infrastructure::workflow;
using namespace waypoint::test;

namespace {

template <typename Fn>
bool ThrowsMalformed(Fn fn) {
    try {
        fn();
    } catch (const MalformedDefinitionError&) {
        return true;
    }
    return false;
}

void TestRegisterAndLookup() {
    InMemoryWorkflowDefinitionStore store;
    assert(!store.exists("survey"));
    assert(store.find("survey") == nullptr);
    assert(store.find("") == nullptr);

    store.registerDefinition(MakeSurvey("survey"));
    assert(store.exists("survey"));
    auto def = store.get("survey");
    assert(def->getName() == "Survey");
    assert(def->getNodes().size() == 4);
    assert(def->defaultStartNode() == "ask");

    bool threw = false;
    try {
        store.get("missing");
    } catch (const UnknownWorkflowError& e) {
        threw = true;
        assert(e.workflowId() == "missing");
    }
    assert(threw && "get() on an unknown id must throw UnknownWorkflowError");

    store.registerDefinition(MakeSurvey("alpha"));
    auto ids = store.list();
    assert(ids.size() == 2);
    assert(ids[0] == "alpha" && ids[1] == "survey");

    assert(store.remove("alpha"));
    assert(!store.remove("alpha"));
    assert(store.list().size() == 1);
    std::cout << "[PASS] Register, get, list and remove." << std::endl;
}

void TestValidation() {
    InMemoryWorkflowDefinitionStore store;

    assert(ThrowsMalformed([&] {
        WorkflowDefinition def = MakeSurvey("dangling");
        def.addTransition(Edge("done", "nowhere"));
        store.registerDefinition(def);
    }));

    assert(ThrowsMalformed([&] {
        WorkflowDefinition def = MakeSurvey("dup-guard");
        def.addTransition(Guarded("ask", "done", "yes"));
        store.registerDefinition(def);
    }));

    assert(ThrowsMalformed([&] {
        WorkflowDefinition def("two-unconditional", "x");
        def.addNode(MakeNode("a", NodeKind::Prompt));
        def.addNode(MakeNode("b", NodeKind::Terminal));
        def.addNode(MakeNode("c", NodeKind::Terminal));
        def.addTransition(Edge("a", "b"));
        def.addTransition(Edge("a", "c"));
        def.addStartPoint("a");
        store.registerDefinition(def);
    }));

    assert(ThrowsMalformed([&] {
        WorkflowDefinition def("terminal-out", "x");
        def.addNode(MakeNode("a", NodeKind::Terminal));
        def.addNode(MakeNode("b", NodeKind::Prompt));
        def.addTransition(Edge("a", "b"));
        def.addStartPoint("a");
        store.registerDefinition(def);
    }));

    assert(ThrowsMalformed([&] {
        WorkflowDefinition def("action-without-name", "x");
        def.addNode(MakeNode("a", NodeKind::Action));
        def.addStartPoint("a");
        store.registerDefinition(def);
    }));

    assert(ThrowsMalformed([&] {
        WorkflowDefinition def("bad-start", "x");
        def.addNode(MakeNode("a", NodeKind::Terminal));
        def.addStartPoint("zzz");
        store.registerDefinition(def);
    }));

    assert(ThrowsMalformed([&] {
        WorkflowDefinition def("dup-node", "x");
        def.addNode(MakeNode("a", NodeKind::Terminal));
        def.addNode(MakeNode("a", NodeKind::Prompt));
    }));

    assert(store.list().empty() && "Rejected definitions must not be stored");
    std::cout << "[PASS] Malformed definitions are rejected." << std::endl;
}

void TestConcurrentRegistrations() {
    InMemoryWorkflowDefinitionStore store;
    const int NUM_THREADS = 16;
    const int PER_THREAD = 25;

    std::vector<std::thread> threads;
    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([&store, t]() {
            for (int i = 0; i < PER_THREAD; ++i) {
                store.registerDefinition(MakeSurvey("wf-" + std::to_string(t) + "-" + std::to_string(i)));
            }
        });
    }
    for (auto& th : threads) th.join();

    assert(store.list().size() == static_cast<size_t>(NUM_THREADS * PER_THREAD));
    for (int t = 0; t < NUM_THREADS; ++t) {
        for (int i = 0; i < PER_THREAD; ++i) {
            assert(store.exists("wf-" + std::to_string(t) + "-" + std::to_string(i)));
        }
    }
    std::cout << "[PASS] " << NUM_THREADS * PER_THREAD << " concurrent registrations all visible." << std::endl;
}

void TestReplacementIsAtomic() {
    InMemoryWorkflowDefinitionStore store;

    // v1 has 4 nodes; v2 has an extra prompt, so 5.
    auto makeV2 = [] {
        WorkflowDefinition def = MakeSurvey("live");
        def.setName("Survey v2");
        def.addNode(MakeNode("extra", NodeKind::Prompt));
        def.addTransition(Edge("extra", "done"));
        return def;
    };
    store.registerDefinition(MakeSurvey("live"));

    std::atomic<bool> stop{false};
    std::atomic<int> torn{0};
    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&]() {
            while (!stop) {
                auto def = store.get("live");
                bool v1 = def->getName() == "Survey" && def->getNodes().size() == 4;
                bool v2 = def->getName() == "Survey v2" && def->getNodes().size() == 5;
                if (!v1 && !v2) torn++;
            }
        });
    }

    for (int i = 0; i < 200; ++i) {
        store.registerDefinition(i % 2 == 0 ? makeV2() : MakeSurvey("live"));
    }
    stop = true;
    for (auto& th : readers) th.join();

    assert(torn == 0 && "Readers must see either the old or the new definition");
    std::cout << "[PASS] Re-registration is observed atomically." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Definition Store Test..." << std::endl;
    TestRegisterAndLookup();
    TestValidation();
    TestConcurrentRegistrations();
    TestReplacementIsAtomic();
    std::cout << "[PASS] Definition Store Test." << std::endl;
    return 0;
}
