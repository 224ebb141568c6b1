// src/brain/DecisionOrchestrator.h
#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include <taskflow/taskflow.hpp>

#include "brain/IBrainClient.h"
#include "core/Rng.h"

namespace promenade::brain {

// Simulation-side view used by the orchestrator. All calls happen on the
// thread that calls DecisionOrchestrator::Tick().
class IAgentDirectory {
public:
    virtual ~IAgentDirectory() = default;

    // nullopt for agents that no longer exist.
    virtual std::optional<AgentSnapshot> Snapshot(AgentId id) const = 0;

    // Returns false (and changes nothing) for unknown ids.
    virtual bool ApplyDecision(const Decision& d) = 0;

    virtual void ApplyChat(const ChatLine& line) = 0;
};

// Seconds on a monotonic clock. Dispatch pacing reads this, never the
// simulation clock, so a run stepped faster than real time still respects
// max_qps toward the service.
using PaceClock = std::function<double()>;

// std::chrono::steady_clock in seconds.
PaceClock SteadyPaceClock();

struct OrchestratorParams {
    std::size_t batchSize = 32;
    float       maxQps = 4.0f;        // <= 0: unpaced
    float       jitterMin = 3.0f;     // seconds
    float       jitterMax = 7.0f;
    std::size_t ioWorkers = 2;
};

// Schedules /decide calls for registered agents.
//
// Per agent: idle -> scheduled (entry in the cooldown map) -> in flight
// (removed from the map) -> scheduled again once the response is applied.
// An agent is never part of two outstanding requests. Requests run on a
// private executor; their results queue up and are applied by the next Tick().
class DecisionOrchestrator {
public:
    struct Stats {
        std::size_t batchesDispatched = 0;
        std::size_t decisionsApplied = 0;
        std::size_t unknownIgnored = 0;
        std::size_t malformedSkipped = 0;
        std::size_t failures = 0;
        std::size_t chatsRequested = 0;
        std::size_t chatLines = 0;
    };

    DecisionOrchestrator(IBrainClient& client, IAgentDirectory& agents,
                         OrchestratorParams params, rng::Pcg32 rng,
                         PaceClock clock = SteadyPaceClock());
    ~DecisionOrchestrator();

    DecisionOrchestrator(const DecisionOrchestrator&) = delete;
    DecisionOrchestrator& operator=(const DecisionOrchestrator&) = delete;

    void SetRunId(std::string runId) { runId_ = std::move(runId); }
    void SetContext(DecisionContext ctx) { context_ = std::move(ctx); }
    [[nodiscard]] const DecisionContext& context() const noexcept { return context_; }

    // Registered agents are kept scheduled by the periodic pass.
    void Register(AgentId id) { registered_.insert(id); }
    [[nodiscard]] bool IsRegistered(AgentId id) const { return registered_.count(id) != 0; }

    // Makes every registered agent that is not in flight due at `now`.
    void Prime(double now);

    // Returns false when the agent is in flight (nothing changes).
    bool ScheduleAt(AgentId id, double due);

    // Both participants of every pair become due at `now` (deferred until the
    // response lands for an agent in flight), then one unpaced /chat request
    // is issued for all pairs.
    void OnMeetings(const std::vector<ChatPair>& pairs, double now);

    // Reschedules registered agents that are neither scheduled nor in flight
    // (this is how failed agents come back), applies finished responses, then
    // dispatches at most one batch if the QPS window allows. Due times use
    // `now`; the QPS window uses the pace clock.
    void Tick(double now);

    // Blocks until every outstanding request has finished (results still need Tick()).
    void WaitIdle();

    // Waits for outstanding requests and applies their results without
    // dispatching anything new. Used at run end.
    void Drain(double now);

    [[nodiscard]] bool IsScheduled(AgentId id) const { return cooldown_.count(id) != 0; }
    [[nodiscard]] bool IsInFlight(AgentId id) const { return inFlight_.count(id) != 0; }
    [[nodiscard]] std::optional<double> DueTime(AgentId id) const;
    [[nodiscard]] std::size_t ScheduledCount() const noexcept { return cooldown_.size(); }
    [[nodiscard]] std::size_t InFlightCount() const noexcept { return inFlight_.size(); }
    [[nodiscard]] const Stats& stats() const noexcept { return stats_; }

private:
    struct InFlight {
        std::uint64_t seq = 0;
        bool eventPending = false;   // a meeting arrived while waiting
    };

    struct DecideDone {
        std::uint64_t seq = 0;
        std::vector<AgentId> ids;
        std::optional<DecodedDecisions> result;   // empty on failure
        std::string error;
    };

    struct ChatDone {
        std::vector<ChatLine> lines;
        std::string error;
        bool ok = false;
    };

    void DrainInbox(double now);
    void ApplyDecideDone(DecideDone& done, double now);
    void RescheduleIdle(double now);
    void Dispatch(double now);
    double Jitter();

    IBrainClient&    client_;
    IAgentDirectory& agents_;
    OrchestratorParams params_;
    rng::Pcg32       rng_;
    PaceClock        clock_;

    std::string     runId_;
    DecisionContext context_;

    std::set<AgentId>                      registered_;
    std::map<AgentId, double>              cooldown_;    // id -> due time
    std::unordered_map<AgentId, InFlight>  inFlight_;
    std::uint64_t nextSeq_ = 1;
    std::optional<double> lastDispatch_;   // pace clock

    Stats stats_;

    std::mutex inboxMutex_;
    std::vector<DecideDone> decideInbox_;
    std::vector<ChatDone>   chatInbox_;

    // Declared last so outstanding requests finish before the inbox goes away.
    tf::Executor io_;
};

} // namespace promenade::brain
