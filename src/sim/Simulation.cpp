// src/sim/Simulation.cpp
#include "sim/Simulation.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace promenade::sim {

namespace {

constexpr std::uint64_t kSpawnStream  = 1;
constexpr std::uint64_t kReplanStream = 2;
constexpr std::uint64_t kJitterStream = 3;

constexpr int kSpawnSpread = 10;   // cells around the spawn centre

} // namespace

Simulation::Simulation(const core::SimConfig& cfg, world::NavGrid grid, world::ScenarioAssets scenario)
    : cfg_(cfg)
    , grid_(std::move(grid))
    , scenario_(std::move(scenario))
    , spawnRng_(rng::make_rng(cfg.seed, kSpawnStream))
    , replanRng_(rng::make_rng(cfg.seed, kReplanStream))
    , meetingDetector_(cfg.meetDistance, cfg.meetSeconds, static_cast<std::size_t>(std::max(0, cfg.maxEligibleAgents)))
    , paths_(std::make_unique<nav::PathService>(grid_.map(), static_cast<std::size_t>(std::max(1, cfg.pathWorkers))))
{
    needsParams_.evalPeriod = cfg.needEvalPeriod;
    needsParams_.rateScale = cfg.needRateScale;
    needsParams_.threshold = cfg.activationThreshold;
    needsParams_.decrement = cfg.satisfyDecrement;

    moveParams_.speedMultiplier = cfg.speedMultiplier;
    moveParams_.idleReplanSeconds = cfg.idleReplanSeconds;
    moveParams_.satisfyDecrement = cfg.satisfyDecrement;
    moveParams_.cellMeters = grid_.cell_meters();

    spdlog::info("Simulation: {}x{} grid, scenario '{}' with {} POIs",
                 grid_.width(), grid_.height(), scenario_.id, scenario_.pois.size());
}

Simulation::~Simulation() = default;

AgentId Simulation::AddAgent(Role role, pf::IVec2 cell, float speed, bool eligible, std::optional<NeedVector> needs)
{
    const AgentId id = nextId_++;
    const pf::IVec2 c = grid_.NearestWalkable(cell);

    const entt::entity e = registry_.create();
    registry_.emplace<AgentInfo>(e, AgentInfo{ id, role, eligible, speed });
    registry_.emplace<Position>(e, Position{ static_cast<float>(c.x) + 0.5f, static_cast<float>(c.y) + 0.5f, 0.f });
    registry_.emplace<Needs>(e, Needs{ needs ? *needs : InitialNeeds(role, spawnRng_), 0.f });
    registry_.emplace<PathTicket>(e);
    registry_.emplace<Idle>(e);
    registry_.emplace<Thoughts>(e);
    byId_.emplace(id, e);

    if (eligible && orchestrator_) {
        orchestrator_->Register(id);
        orchestrator_->ScheduleAt(id, now_);
    }
    return id;
}

void Simulation::SpawnPopulation(int count, std::optional<pf::IVec2> centre)
{
    if (count <= 0)
        return;

    const pf::IVec2 mid = grid_.NearestWalkable(centre ? *centre : pf::IVec2{ grid_.width() / 2, grid_.height() / 2 });
    const int eligibleCount = std::min(cfg_.maxEligibleAgents,
                                       static_cast<int>(std::floor(static_cast<float>(count) * cfg_.eligibleFraction)));

    for (int i = 0; i < count; ++i) {
        const Role role = SampleRole(spawnRng_);
        const pf::IVec2 cell{
            mid.x + static_cast<int>(std::lround(spawnRng_.uniform(-kSpawnSpread, kSpawnSpread))),
            mid.y + static_cast<int>(std::lround(spawnRng_.uniform(-kSpawnSpread, kSpawnSpread))),
        };
        const float speed = spawnRng_.uniform(0.9f, 1.5f);
        AddAgent(role, cell, speed, i < eligibleCount);
    }
    spdlog::info("Spawned {} agents around ({}, {}), {} eligible", count, mid.x, mid.y, std::max(0, eligibleCount));
}

std::optional<entt::entity> Simulation::Find(AgentId id) const
{
    auto it = byId_.find(id);
    if (it == byId_.end()) return std::nullopt;
    return it->second;
}

// ---------------------------------------------------------------------------
// Reasoning service
// ---------------------------------------------------------------------------

std::vector<brain::AgentSnapshot> Simulation::EligibleSnapshots() const
{
    std::vector<brain::AgentSnapshot> out;
    for (auto [e, info] : registry_.view<AgentInfo>().each()) {
        if (!info.eligible) continue;
        if (auto s = Snapshot(info.id)) out.push_back(*s);
    }
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
    return out;
}

brain::DecisionContext Simulation::MakeContext() const
{
    brain::DecisionContext ctx;
    ctx.scenarioId = scenario_.id;
    ctx.biases = scenario_.biases;
    return ctx;
}

bool Simulation::ConnectBrain(brain::IBrainClient& client, const brain::RunInfo& run)
{
    const auto eligible = EligibleSnapshots();

    auto session = std::make_unique<brain::RunSession>(client, cfg_.metricsFlushSeconds);
    if (!session->Start(run, eligible))
        return false;

    brain::OrchestratorParams params;
    params.batchSize = static_cast<std::size_t>(std::max(1, cfg_.batchSize));
    params.maxQps = cfg_.maxQps;
    params.jitterMin = cfg_.jitterMinSeconds;
    params.jitterMax = cfg_.jitterMaxSeconds;

    auto orch = std::make_unique<brain::DecisionOrchestrator>(
        client, *this, params, rng::make_rng(cfg_.seed, kJitterStream));
    orch->SetRunId(session->run_id());
    orch->SetContext(MakeContext());
    for (const auto& s : eligible)
        orch->Register(s.id);
    orch->Prime(now_);

    session_ = std::move(session);
    orchestrator_ = std::move(orch);
    return true;
}

void Simulation::EndRun()
{
    if (orchestrator_) {
        orchestrator_->Drain(now_);
        const auto& st = orchestrator_->stats();
        spdlog::info("Decisions: {} batches, {} applied, {} failed requests, {} chats",
                     st.batchesDispatched, st.decisionsApplied, st.failures, st.chatsRequested);
    }
    if (session_)
        session_->End();
}

std::optional<brain::AgentSnapshot> Simulation::Snapshot(brain::AgentId id) const
{
    const auto e = Find(id);
    if (!e) return std::nullopt;

    const auto& [info, pos, needs] = registry_.get<AgentInfo, Position, Needs>(*e);
    brain::AgentSnapshot s;
    s.id = info.id;
    s.role = info.role;
    s.x = pos.x;
    s.y = pos.y;
    s.needs = needs.values;
    return s;
}

bool Simulation::ApplyDecision(const brain::Decision& d)
{
    const auto e = Find(d.id);
    if (!e) return false;

    auto& thoughts = registry_.get<Thoughts>(*e);
    thoughts.lastThought = d.thought;
    thoughts.lastIntent = d.intent.name.empty() ? d.intent.category : d.intent.category + ": " + d.intent.name;
    feed_.AddDecision(now_, d.id, d.thought, thoughts.lastIntent);

    const auto category = world::parse_category(d.intent.category);
    if (!category)
        return true;

    const auto& pos = registry_.get<Position>(*e);
    const auto poi = scenario_.pois.NearestOfCategory(*category, pos.x, pos.y);
    if (!poi)
        return true;

    const auto& needs = registry_.get<Needs>(*e);
    RequestPathTo(d.id, *poi, MostUrgentSatisfiedBy(needs.values, *category));
    return true;
}

void Simulation::ApplyChat(const brain::ChatLine& line)
{
    feed_.AddChat(now_, line.a, line.b, line.aLine, line.bLine);
}

// ---------------------------------------------------------------------------
// Paths
// ---------------------------------------------------------------------------

bool Simulation::RequestPathTo(AgentId id, world::PoiId poi, std::optional<Need> need)
{
    const auto found = Find(id);
    if (!found || !scenario_.pois.contains(poi))
        return false;
    const entt::entity e = *found;

    const auto& pos = registry_.get<Position>(e);
    const pf::IVec2 start = grid_.NearestWalkable(grid_.WorldToCell(pos.x, pos.y));
    const world::Poi& target = scenario_.pois.at(poi);
    const pf::IVec2 goal = grid_.NearestWalkable(target.cell);

    auto& ticket = registry_.get<PathTicket>(e);
    const std::uint64_t version = ++ticket.version;
    ticket.pending = true;

    // A walking agent halts where it stands; the new path starts from this cell.
    registry_.remove<PathFollow>(e);

    const world::PoiCategory category = target.category;

    paths_->Request(start, goal, [this, e, version, poi, category, need](const pf::PathOutcome& out) {
        OnPathResult(e, version, poi, category, need, out);
    });
    return true;
}

void Simulation::OnPathResult(entt::entity e, std::uint64_t version, world::PoiId poi,
                              world::PoiCategory category, std::optional<Need> need,
                              const pf::PathOutcome& outcome)
{
    if (!registry_.valid(e))
        return;
    auto& ticket = registry_.get<PathTicket>(e);
    if (ticket.version != version)
        return; // superseded
    ticket.pending = false;

    const AgentId id = registry_.get<AgentInfo>(e).id;
    if (!outcome.ok()) {
        spdlog::debug("A{}: no path to POI {} ({})", id, poi, pf::to_string(outcome.status));
        registry_.remove<Goal, OpenTrip>(e);
        return;
    }

    auto& idle = registry_.get<Idle>(e);
    idle.seconds = 0.f;

    // Already standing on the goal: arrive without a trip.
    if (outcome.path.length() == 1) {
        if (need)
            SatisfyNeed(registry_.get<Needs>(e).values, *need, cfg_.satisfyDecrement);
        registry_.remove<PathFollow, Goal, OpenTrip>(e);
        return;
    }

    // A re-routed walker keeps its trip running toward the new destination.
    OpenTrip trip{ now_, 0.f, 0.f, {} };
    if (const auto* open = registry_.try_get<OpenTrip>(e))
        trip = *open;
    trip.category = std::string(world::to_string(category));

    registry_.emplace_or_replace<PathFollow>(e, PathFollow{ outcome.path.points, 0.f });
    registry_.emplace_or_replace<Goal>(e, Goal{ poi, category, need });
    registry_.emplace_or_replace<OpenTrip>(e, std::move(trip));

    auto& pos = registry_.get<Position>(e);
    pos = SampleOnPath(outcome.path.points, 0.f, pos.heading);
}

void Simulation::Replan(entt::entity e)
{
    const AgentId id = registry_.get<AgentInfo>(e).id;
    const auto& pos = registry_.get<Position>(e);
    const auto& needs = registry_.get<Needs>(e);

    const pf::IVec2 cell = grid_.WorldToCell(pos.x, pos.y);
    if (auto choice = SelectGoal(needs.values, cell, scenario_.pois, needsParams_.threshold)) {
        RequestPathTo(id, choice->poi, choice->need);
        return;
    }
    if (scenario_.pois.empty())
        return;

    const auto pick = static_cast<world::PoiId>(replanRng_.next_bounded(static_cast<std::uint32_t>(scenario_.pois.size())));
    RequestPathTo(id, pick, std::nullopt);
}

// ---------------------------------------------------------------------------
// Tick
// ---------------------------------------------------------------------------

void Simulation::DetectMeetings(float dt)
{
    std::vector<MeetingSample> samples;
    for (auto [e, info, pos] : registry_.view<AgentInfo, Position>().each()) {
        if (info.eligible)
            samples.push_back({ info.id, pos.x, pos.y });
    }
    std::sort(samples.begin(), samples.end(), [](const auto& a, const auto& b) { return a.id < b.id; });

    const auto events = meetingDetector_.Update(samples, dt);
    if (events.empty())
        return;

    meetings_ += events.size();
    std::vector<brain::ChatPair> pairs;
    pairs.reserve(events.size());
    for (const MeetingEvent& ev : events) {
        spdlog::debug("Meeting: A{} and A{} at t={:.2f}", ev.a, ev.b, now_);
        pairs.push_back({ ev.a, ev.b });
    }
    if (orchestrator_)
        orchestrator_->OnMeetings(pairs, now_);
}

void Simulation::Step(float dt)
{
    if (dt <= 0.f)
        return;
    now_ += dt;

    paths_->Poll();

    UpdateNeeds(registry_, dt, needsParams_);

    MovementResult moved = UpdateMovement(registry_, dt, now_, moveParams_);
    for (entt::entity e : moved.replan)
        Replan(e);
    if (!moved.trips.empty()) {
        tripStats_.Add(moved.trips);
        if (session_)
            session_->Record(moved.trips);
        for (const TripSample& t : moved.trips)
            spdlog::debug("Trip: A{} {} {:.1f}s {:.1f}m", t.agent, t.category, t.durationSeconds, t.distanceMeters);
    }

    DetectMeetings(dt);

    if (orchestrator_)
        orchestrator_->Tick(now_);
    if (session_)
        session_->Tick(now_);
}

void Simulation::SwitchScenario(world::ScenarioAssets scenario)
{
    scenario_ = std::move(scenario);

    std::size_t cleared = 0;
    for (auto [e, ticket, idle] : registry_.view<PathTicket, Idle>().each()) {
        if (registry_.all_of<Goal>(e) || registry_.all_of<PathFollow>(e))
            ++cleared;
        ++ticket.version;
        ticket.pending = false;
        idle.seconds = 0.f;
    }
    registry_.clear<PathFollow>();
    registry_.clear<Goal>();
    registry_.clear<OpenTrip>();

    if (orchestrator_)
        orchestrator_->SetContext(MakeContext());

    spdlog::info("Scenario switched to '{}' ({} POIs), {} goals cleared",
                 scenario_.id, scenario_.pois.size(), cleared);
}

void Simulation::WaitForBackground()
{
    paths_->WaitIdle();
    if (orchestrator_)
        orchestrator_->WaitIdle();
}

} // namespace promenade::sim
