// tests/test_orchestrator.cpp
//
// DecisionOrchestrator against the in-process fakes. The pattern throughout is
// Tick (dispatch) -> WaitIdle (requests finish) -> Tick (results applied).

#include <doctest/doctest.h>

#include "test_support/FakeBrain.h"

#include <algorithm>
#include <set>

using namespace promenade;
using testing::FakeBrainClient;
using testing::FakeDirectory;

namespace {

brain::OrchestratorParams Params(float jitterMin = 3.0f, float jitterMax = 7.0f)
{
    brain::OrchestratorParams p;
    p.batchSize = 32;
    p.maxQps = 4.0f;
    p.jitterMin = jitterMin;
    p.jitterMax = jitterMax;
    p.ioWorkers = 2;
    return p;
}

// Each call reads one second later, so the QPS window never holds a batch back.
brain::PaceClock Unpaced()
{
    return [t = 0.0]() mutable { return t += 1.0; };
}

void Populate(brain::DecisionOrchestrator& orch, FakeDirectory& dir, brain::AgentId count)
{
    for (brain::AgentId id = 1; id <= count; ++id) {
        dir.Add(id, static_cast<float>(id), 0.f);
        orch.Register(id);
    }
}

} // namespace

TEST_CASE("Orchestrator/pacing caps batches for a simultaneously ready crowd")
{
    FakeBrainClient client;
    FakeDirectory dir;
    // Zero cooldown keeps every agent ready again as soon as its answer lands.
    // The pace clock follows the tick time here, as in a realtime run.
    double now = 0.0;
    brain::DecisionOrchestrator orch(client, dir, Params(0.0f, 0.0f), rng::Pcg32(1),
                                     [&now] { return now; });
    orch.SetRunId("run-1");
    Populate(orch, dir, 100);
    orch.Prime(0.0);

    std::vector<double> dispatchTimes;
    for (int i = 0; i < 40; ++i) {
        now = i * 0.05;
        const auto before = orch.stats().batchesDispatched;
        orch.Tick(now);
        if (orch.stats().batchesDispatched != before)
            dispatchTimes.push_back(now);
    }
    orch.WaitIdle();

    CHECK(dispatchTimes.size() <= 8u);
    CHECK(dispatchTimes.size() >= 4u);
    for (std::size_t i = 1; i < dispatchTimes.size(); ++i)
        CHECK(dispatchTimes[i] - dispatchTimes[i - 1] >= 0.25 - 1e-9);

    for (const auto& batch : client.batches) {
        CHECK(batch.size() <= 32u);
        CHECK_FALSE(batch.empty());
    }
    CHECK(client.wrongRunIds == 0);
}

TEST_CASE("Orchestrator/first batch takes the earliest due agents by id")
{
    FakeBrainClient client;
    FakeDirectory dir;
    brain::DecisionOrchestrator orch(client, dir, Params(), rng::Pcg32(2), Unpaced());
    orch.SetRunId("run-1");
    Populate(orch, dir, 40);
    orch.Prime(0.0);
    CHECK(orch.ScheduleAt(40, -1.0));

    orch.Tick(0.0);
    orch.WaitIdle();
    REQUIRE(client.batches.size() == 1u);
    const auto& first = client.batches.front();
    REQUIRE(first.size() == 32u);
    CHECK(first.front() == 40u);
    CHECK(first[1] == 1u);
    CHECK(first.back() == 31u);
    CHECK(orch.InFlightCount() == 32u);
    CHECK(orch.ScheduledCount() == 8u);
}

TEST_CASE("Orchestrator/applied decisions reschedule with a cooldown")
{
    FakeBrainClient client;
    FakeDirectory dir;
    brain::DecisionOrchestrator orch(client, dir, Params(3.0f, 7.0f), rng::Pcg32(3), Unpaced());
    orch.SetRunId("run-1");
    Populate(orch, dir, 3);
    orch.Prime(0.0);

    orch.Tick(0.0);
    orch.WaitIdle();
    orch.Tick(0.5);

    CHECK(dir.applied.size() == 3u);
    CHECK(orch.stats().decisionsApplied == 3u);
    for (brain::AgentId id = 1; id <= 3; ++id) {
        CHECK_FALSE(orch.IsInFlight(id));
        const auto due = orch.DueTime(id);
        REQUIRE(due.has_value());
        CHECK(*due >= 3.5);
        CHECK(*due <= 7.5);
    }
    CHECK(dir.applied.front().intent.category == "cafe");
    CHECK(dir.applied.front().thought == "coffee time");
}

TEST_CASE("Orchestrator/decisions for unknown agents change nothing")
{
    FakeBrainClient client;
    client.reply = [](const std::vector<brain::AgentSnapshot>& agents) {
        nlohmann::json body = FakeBrainClient::AllToCafe(agents);
        body["decisions"].push_back({ { "id", "A999" }, { "next_intent", { { "category", "cafe" } } } });
        body["decisions"].push_back({ { "id", "A1" } });
        return body;
    };
    FakeDirectory dir;
    brain::DecisionOrchestrator orch(client, dir, Params(), rng::Pcg32(4), Unpaced());
    orch.SetRunId("run-1");
    Populate(orch, dir, 2);
    orch.Prime(0.0);

    orch.Tick(0.0);
    orch.WaitIdle();
    orch.Tick(0.1);

    CHECK(dir.applied.size() == 2u);
    CHECK(orch.stats().unknownIgnored == 1u);
    CHECK(orch.stats().malformedSkipped == 1u);
    CHECK_FALSE(orch.IsRegistered(999));
    CHECK_FALSE(orch.IsScheduled(999));
}

TEST_CASE("Orchestrator/agents the service skipped come back on the next pass")
{
    FakeBrainClient client;
    client.reply = [](const std::vector<brain::AgentSnapshot>& agents) {
        std::vector<brain::AgentSnapshot> firstOnly(agents.begin(), agents.begin() + 1);
        return FakeBrainClient::AllToCafe(firstOnly);
    };
    FakeDirectory dir;
    brain::DecisionOrchestrator orch(client, dir, Params(), rng::Pcg32(5), Unpaced());
    orch.SetRunId("run-1");
    Populate(orch, dir, 2);
    orch.Prime(0.0);

    orch.Tick(0.0);
    orch.WaitIdle();
    orch.Tick(0.1);
    CHECK(orch.IsScheduled(1));
    CHECK_FALSE(orch.IsScheduled(2));
    CHECK_FALSE(orch.IsInFlight(2));

    orch.Tick(0.2);
    CHECK(orch.IsScheduled(2));
    CHECK(*orch.DueTime(2) >= 3.2);
}

TEST_CASE("Orchestrator/failed batch leaves agents to the rescheduling pass")
{
    FakeBrainClient client;
    client.reply = [](const std::vector<brain::AgentSnapshot>&) -> nlohmann::json {
        throw brain::BrainError(brain::BrainError::Kind::Timeout, "timed out");
    };
    FakeDirectory dir;
    brain::DecisionOrchestrator orch(client, dir, Params(), rng::Pcg32(6), Unpaced());
    orch.SetRunId("run-1");
    Populate(orch, dir, 4);
    orch.Prime(0.0);

    orch.Tick(0.0);
    CHECK(orch.InFlightCount() == 4u);
    orch.WaitIdle();
    orch.Tick(1.0);

    CHECK(orch.stats().failures == 1u);
    CHECK(orch.InFlightCount() == 0u);
    CHECK(orch.ScheduledCount() == 0u);
    CHECK(dir.applied.empty());

    orch.Tick(2.0);
    CHECK(orch.ScheduledCount() == 4u);
    for (brain::AgentId id = 1; id <= 4; ++id)
        CHECK(*orch.DueTime(id) >= 5.0);
}

TEST_CASE("Orchestrator/malformed response body counts as a failure")
{
    FakeBrainClient client;
    client.reply = [](const std::vector<brain::AgentSnapshot>&) {
        return nlohmann::json{ { "oops", true } };
    };
    FakeDirectory dir;
    brain::DecisionOrchestrator orch(client, dir, Params(), rng::Pcg32(7), Unpaced());
    orch.SetRunId("run-1");
    Populate(orch, dir, 1);
    orch.Prime(0.0);

    orch.Tick(0.0);
    orch.WaitIdle();
    orch.Tick(0.1);
    CHECK(orch.stats().failures == 1u);
    CHECK_FALSE(orch.IsInFlight(1));
}

TEST_CASE("Orchestrator/an agent is never in two requests at once")
{
    FakeBrainClient client;
    client.CloseGate();
    FakeDirectory dir;
    brain::DecisionOrchestrator orch(client, dir, Params(0.0f, 0.0f), rng::Pcg32(8), Unpaced());
    orch.SetRunId("run-1");
    Populate(orch, dir, 2);
    orch.Prime(0.0);

    orch.Tick(0.0);
    CHECK(orch.IsInFlight(1));
    CHECK_FALSE(orch.ScheduleAt(1, 0.0));
    orch.Prime(0.5);
    CHECK_FALSE(orch.IsScheduled(1));

    for (int i = 1; i <= 20; ++i)
        orch.Tick(i * 0.5);
    CHECK(orch.stats().batchesDispatched == 1u);

    client.OpenGate();
    orch.WaitIdle();
    orch.Tick(11.0);
    orch.WaitIdle();
    orch.Tick(12.0);
    orch.WaitIdle();

    std::multiset<brain::AgentId> seen;
    for (const auto& batch : client.batches) {
        const std::set<brain::AgentId> unique(batch.begin(), batch.end());
        CHECK(unique.size() == batch.size());
        seen.insert(batch.begin(), batch.end());
    }
    CHECK(seen.count(1) == client.batches.size());
}

TEST_CASE("Orchestrator/meetings wait for in-flight agents and request chat")
{
    FakeBrainClient client;
    client.CloseGate();
    FakeDirectory dir;
    brain::DecisionOrchestrator orch(client, dir, Params(), rng::Pcg32(9), Unpaced());
    orch.SetRunId("run-1");
    brain::DecisionContext ctx;
    ctx.scenarioId = "new_cafe";
    orch.SetContext(ctx);
    Populate(orch, dir, 3);

    // Only agents 1 and 2 go out.
    orch.ScheduleAt(1, 0.0);
    orch.ScheduleAt(2, 0.0);
    orch.ScheduleAt(3, 100.0);
    orch.Tick(0.0);
    REQUIRE(orch.IsInFlight(1));
    REQUIRE(orch.IsInFlight(2));

    orch.OnMeetings({ { 1, 3 } }, 0.3);
    CHECK_FALSE(orch.IsScheduled(1));
    CHECK(orch.DueTime(3) == 0.3);

    client.OpenGate();
    orch.WaitIdle();
    orch.Tick(1.0);

    // The pending meeting made agent 1 due at once; agent 2 got a cooldown.
    CHECK(client.BatchCount() >= 1u);
    CHECK(dir.chats.size() == 1u);
    CHECK(dir.chats.front().a == 1u);
    CHECK(dir.chats.front().b == 3u);
    CHECK(dir.chats.front().aLine == "hey");
    CHECK(orch.stats().chatLines == 1u);
    CHECK(orch.IsInFlight(1));
    CHECK(orch.IsInFlight(3));
    CHECK_FALSE(orch.IsInFlight(2));
    CHECK(*orch.DueTime(2) >= 4.0);

    orch.WaitIdle();
    REQUIRE(client.chatContexts.size() == 1u);
    CHECK(client.chatContexts.front().meeting);
    CHECK(client.chatContexts.front().scenarioId == "new_cafe");
    for (const auto& c : client.decideContexts)
        CHECK_FALSE(c.meeting);
}

TEST_CASE("Orchestrator/agents that disappear are dropped")
{
    FakeBrainClient client;
    FakeDirectory dir;
    brain::DecisionOrchestrator orch(client, dir, Params(), rng::Pcg32(10), Unpaced());
    orch.SetRunId("run-1");
    Populate(orch, dir, 3);
    dir.agents.erase(2);
    orch.Prime(0.0);

    orch.Tick(0.0);
    orch.WaitIdle();
    CHECK_FALSE(orch.IsRegistered(2));
    REQUIRE(client.batches.size() == 1u);
    CHECK(client.batches.front() == std::vector<brain::AgentId>{ 1, 3 });
}

TEST_CASE("Orchestrator/pacing follows the wall clock when simulated time races ahead")
{
    FakeBrainClient client;
    FakeDirectory dir;
    double wall = 0.0;
    brain::DecisionOrchestrator orch(client, dir, Params(0.0f, 0.0f), rng::Pcg32(11),
                                     [&wall] { return wall; });
    orch.SetRunId("run-1");
    Populate(orch, dir, 100);
    orch.Prime(0.0);

    // Hundreds of simulated seconds inside one wall-clock instant.
    for (int i = 0; i < 50; ++i) {
        orch.Tick(i * 10.0);
        orch.WaitIdle();
    }
    CHECK(orch.stats().batchesDispatched == 1u);

    wall = 0.2;
    orch.Tick(600.0);
    CHECK(orch.stats().batchesDispatched == 1u);

    wall = 0.25;
    orch.Tick(610.0);
    CHECK(orch.stats().batchesDispatched == 2u);
    orch.WaitIdle();
}
