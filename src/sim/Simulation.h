// src/sim/Simulation.h
#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

#include <entt/entt.hpp>

#include "brain/DecisionOrchestrator.h"
#include "brain/RunSession.h"
#include "core/Config.h"
#include "core/Rng.h"
#include "nav/PathService.h"
#include "sim/ActivityFeed.h"
#include "sim/Components.h"
#include "sim/MeetingDetector.h"
#include "sim/MovementSystem.h"
#include "sim/NeedsSystem.h"
#include "sim/TripStats.h"
#include "world/NavGrid.h"
#include "world/ScenarioAssets.h"

namespace promenade::sim {

// Everything one run owns: grid, POIs, agents, pathfinder, meeting clocks and,
// once connected, the reasoning-service session. Several instances may live
// in one process. All methods run on the owning thread; background work only
// touches this object through Poll()/Tick() on that thread.
class Simulation final : public brain::IAgentDirectory {
public:
    Simulation(const core::SimConfig& cfg, world::NavGrid grid, world::ScenarioAssets scenario);
    ~Simulation() override;

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    // Places an agent at the centre of `cell` (snapped to walkable). Needs
    // default to the role's initial sample.
    AgentId AddAgent(Role role, pf::IVec2 cell, float speed, bool eligible,
                     std::optional<NeedVector> needs = std::nullopt);

    // Roles by sampling weight, cells jittered around `centre` (grid centre by
    // default), speed U[0.9,1.5). The first eligibleFraction of the population
    // (capped at maxEligibleAgents) is eligible.
    void SpawnPopulation(int count, std::optional<pf::IVec2> centre = std::nullopt);

    // start_run + register eligible agents + prime round. Returns false when
    // the service is unreachable; the run then continues without it.
    bool ConnectBrain(brain::IBrainClient& client, const brain::RunInfo& run);

    // Final metrics flush and end_run. Safe without a connection.
    void EndRun();

    // One cooperative tick: path results, needs, movement, meetings,
    // decisions, metrics. Never throws for runtime conditions.
    void Step(float dt);

    // Replaces the POI set. Every goal, path and open trip is dropped and
    // pending path results are invalidated.
    void SwitchScenario(world::ScenarioAssets scenario);

    // Requests a path to `poi` from the agent's current cell. Any earlier
    // outstanding request for that agent is superseded. A walking agent stops
    // until the answer lands; its open trip carries over to the new path.
    bool RequestPathTo(AgentId id, world::PoiId poi, std::optional<Need> need);

    // Blocks until background searches and reasoning calls have finished.
    // Their results are applied by the next Step().
    void WaitForBackground();

    // IAgentDirectory
    std::optional<brain::AgentSnapshot> Snapshot(brain::AgentId id) const override;
    bool ApplyDecision(const brain::Decision& d) override;
    void ApplyChat(const brain::ChatLine& line) override;

    [[nodiscard]] std::optional<entt::entity> Find(AgentId id) const;
    [[nodiscard]] entt::registry& registry() noexcept { return registry_; }
    [[nodiscard]] const entt::registry& registry() const noexcept { return registry_; }
    [[nodiscard]] double now() const noexcept { return now_; }
    [[nodiscard]] std::size_t AgentCount() const noexcept { return byId_.size(); }
    [[nodiscard]] const world::NavGrid& grid() const noexcept { return grid_; }
    [[nodiscard]] const world::ScenarioAssets& scenario() const noexcept { return scenario_; }
    [[nodiscard]] const TripStats& trip_stats() const noexcept { return tripStats_; }
    [[nodiscard]] const ActivityFeed& feed() const noexcept { return feed_; }
    [[nodiscard]] std::size_t MeetingCount() const noexcept { return meetings_; }
    [[nodiscard]] brain::DecisionOrchestrator* orchestrator() noexcept { return orchestrator_.get(); }
    [[nodiscard]] nav::PathService& paths() noexcept { return *paths_; }

private:
    void Replan(entt::entity e);
    void OnPathResult(entt::entity e, std::uint64_t version, world::PoiId poi,
                      world::PoiCategory category, std::optional<Need> need,
                      const pf::PathOutcome& outcome);
    void DetectMeetings(float dt);
    std::vector<brain::AgentSnapshot> EligibleSnapshots() const;
    brain::DecisionContext MakeContext() const;

    core::SimConfig cfg_;
    world::NavGrid grid_;
    world::ScenarioAssets scenario_;

    entt::registry registry_;
    std::unordered_map<AgentId, entt::entity> byId_;
    AgentId nextId_ = 1;
    double now_ = 0.0;

    rng::Pcg32 spawnRng_;
    rng::Pcg32 replanRng_;

    NeedsParams needsParams_;
    MovementParams moveParams_;
    MeetingDetector meetingDetector_;
    std::size_t meetings_ = 0;

    TripStats tripStats_;
    ActivityFeed feed_;

    std::unique_ptr<nav::PathService> paths_;
    std::unique_ptr<brain::RunSession> session_;
    std::unique_ptr<brain::DecisionOrchestrator> orchestrator_;
};

} // namespace promenade::sim
