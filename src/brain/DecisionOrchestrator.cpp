// src/brain/DecisionOrchestrator.cpp
#include "brain/DecisionOrchestrator.h"
#include "brain/BrainError.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <utility>

namespace promenade::brain {

PaceClock SteadyPaceClock()
{
    return [] {
        using namespace std::chrono;
        return duration<double>(steady_clock::now().time_since_epoch()).count();
    };
}

DecisionOrchestrator::DecisionOrchestrator(IBrainClient& client, IAgentDirectory& agents,
                                           OrchestratorParams params, rng::Pcg32 rng,
                                           PaceClock clock)
    : client_(client)
    , agents_(agents)
    , params_(params)
    , rng_(rng)
    , clock_(clock ? std::move(clock) : SteadyPaceClock())
    , io_(std::max<std::size_t>(1, params.ioWorkers))
{
    if (params_.batchSize == 0)
        params_.batchSize = 1;
    if (params_.jitterMax < params_.jitterMin)
        std::swap(params_.jitterMin, params_.jitterMax);
}

DecisionOrchestrator::~DecisionOrchestrator()
{
    io_.wait_for_all();
}

double DecisionOrchestrator::Jitter()
{
    return rng_.uniform(params_.jitterMin, params_.jitterMax);
}

std::optional<double> DecisionOrchestrator::DueTime(AgentId id) const
{
    auto it = cooldown_.find(id);
    if (it == cooldown_.end()) return std::nullopt;
    return it->second;
}

void DecisionOrchestrator::Prime(double now)
{
    for (AgentId id : registered_) {
        if (!IsInFlight(id))
            cooldown_[id] = now;
    }
    spdlog::info("Decision prime: {} agents due at t={:.2f}", cooldown_.size(), now);
}

bool DecisionOrchestrator::ScheduleAt(AgentId id, double due)
{
    if (IsInFlight(id))
        return false;
    cooldown_[id] = due;
    return true;
}

void DecisionOrchestrator::OnMeetings(const std::vector<ChatPair>& pairs, double now)
{
    if (pairs.empty())
        return;

    for (const ChatPair& p : pairs) {
        for (AgentId id : { p.a, p.b }) {
            if (auto it = inFlight_.find(id); it != inFlight_.end())
                it->second.eventPending = true;
            else
                cooldown_[id] = now;
        }
    }

    ++stats_.chatsRequested;
    DecisionContext ctx = context_;
    ctx.meeting = true;

    io_.silent_async([this, runId = runId_, pairs, ctx = std::move(ctx)] {
        ChatDone done;
        try {
            done.lines = client_.Chat(runId, pairs, ctx);
            done.ok = true;
        } catch (const BrainError& e) {
            done.error = std::string(to_string(e.kind())) + ": " + e.what();
        } catch (const std::exception& e) {
            done.error = e.what();
        }
        std::lock_guard<std::mutex> lock(inboxMutex_);
        chatInbox_.push_back(std::move(done));
    });
}

void DecisionOrchestrator::Tick(double now)
{
    RescheduleIdle(now);
    DrainInbox(now);
    Dispatch(now);
}

void DecisionOrchestrator::WaitIdle()
{
    io_.wait_for_all();
}

void DecisionOrchestrator::Drain(double now)
{
    io_.wait_for_all();
    DrainInbox(now);
}

void DecisionOrchestrator::RescheduleIdle(double now)
{
    for (AgentId id : registered_) {
        if (cooldown_.count(id) || inFlight_.count(id))
            continue;
        cooldown_[id] = now + Jitter();
    }
}

void DecisionOrchestrator::DrainInbox(double now)
{
    std::vector<DecideDone> decides;
    std::vector<ChatDone> chats;
    {
        std::lock_guard<std::mutex> lock(inboxMutex_);
        decides.swap(decideInbox_);
        chats.swap(chatInbox_);
    }

    for (DecideDone& d : decides)
        ApplyDecideDone(d, now);

    for (const ChatDone& c : chats) {
        if (!c.ok) {
            ++stats_.failures;
            spdlog::warn("Chat request failed: {}", c.error);
            continue;
        }
        for (const ChatLine& line : c.lines) {
            agents_.ApplyChat(line);
            ++stats_.chatLines;
        }
    }
}

void DecisionOrchestrator::ApplyDecideDone(DecideDone& done, double now)
{
    // Only agents still waiting on this very batch are touched.
    auto ownsAgent = [&](AgentId id) {
        auto it = inFlight_.find(id);
        return it != inFlight_.end() && it->second.seq == done.seq;
    };

    if (!done.result) {
        ++stats_.failures;
        spdlog::warn("Decide batch #{} ({} agents) failed: {}", done.seq, done.ids.size(), done.error);
        for (AgentId id : done.ids) {
            if (!ownsAgent(id)) continue;
            const bool event = inFlight_[id].eventPending;
            inFlight_.erase(id);
            if (event) cooldown_[id] = now;
        }
        return;
    }

    stats_.malformedSkipped += done.result->skipped;

    for (const Decision& dec : done.result->decisions) {
        if (!ownsAgent(dec.id)) {
            ++stats_.unknownIgnored;
            spdlog::debug("Decide batch #{}: ignoring decision for A{}", done.seq, dec.id);
            continue;
        }
        const bool event = inFlight_[dec.id].eventPending;
        inFlight_.erase(dec.id);

        if (agents_.ApplyDecision(dec))
            ++stats_.decisionsApplied;
        else
            ++stats_.unknownIgnored;

        cooldown_[dec.id] = event ? now : now + Jitter();
    }

    // Agents the service did not answer for wait for the rescheduling pass.
    for (AgentId id : done.ids) {
        if (!ownsAgent(id)) continue;
        const bool event = inFlight_[id].eventPending;
        inFlight_.erase(id);
        if (event) cooldown_[id] = now;
    }
}

void DecisionOrchestrator::Dispatch(double now)
{
    const double wall = clock_();
    if (params_.maxQps > 0.0f && lastDispatch_ &&
        wall - *lastDispatch_ < 1.0 / static_cast<double>(params_.maxQps))
        return;

    std::vector<std::pair<double, AgentId>> ready;
    for (const auto& [id, due] : cooldown_) {
        if (due <= now) ready.emplace_back(due, id);
    }
    if (ready.empty())
        return;
    std::sort(ready.begin(), ready.end());
    if (ready.size() > params_.batchSize)
        ready.resize(params_.batchSize);

    const std::uint64_t seq = nextSeq_++;
    std::vector<AgentSnapshot> snaps;
    std::vector<AgentId> ids;
    snaps.reserve(ready.size());
    for (const auto& [due, id] : ready) {
        cooldown_.erase(id);
        auto snap = agents_.Snapshot(id);
        if (!snap) {
            registered_.erase(id);
            continue;
        }
        inFlight_[id] = InFlight{ seq, false };
        ids.push_back(id);
        snaps.push_back(std::move(*snap));
    }
    if (snaps.empty())
        return;

    lastDispatch_ = wall;
    ++stats_.batchesDispatched;
    spdlog::debug("Decide batch #{}: {} agents at t={:.2f}", seq, snaps.size(), now);

    io_.silent_async([this, seq, runId = runId_, ctx = context_, ids = std::move(ids), snaps = std::move(snaps)]() mutable {
        DecideDone done;
        done.seq = seq;
        done.ids = std::move(ids);
        try {
            done.result = client_.Decide(runId, snaps, ctx);
        } catch (const BrainError& e) {
            done.error = std::string(to_string(e.kind())) + ": " + e.what();
        } catch (const std::exception& e) {
            done.error = e.what();
        }
        std::lock_guard<std::mutex> lock(inboxMutex_);
        decideInbox_.push_back(std::move(done));
    });
}

} // namespace promenade::brain
