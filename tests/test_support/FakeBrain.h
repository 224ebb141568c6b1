#pragma once
//
// In-process stand-ins for the reasoning service and the agent directory.
// FakeBrainClient is safe to call from the orchestrator's I/O threads; its
// decide/chat replies are built as JSON and go through the real decoders.
//
#include "brain/BrainError.h"
#include "brain/DecisionOrchestrator.h"

#include <nlohmann/json.hpp>

#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace promenade::testing {

class FakeBrainClient final : public brain::IBrainClient {
public:
    using DecideReply = std::function<nlohmann::json(const std::vector<brain::AgentSnapshot>&)>;

    // Default reply: every agent in the batch heads for a cafe.
    static nlohmann::json AllToCafe(const std::vector<brain::AgentSnapshot>& agents)
    {
        nlohmann::json list = nlohmann::json::array();
        for (const auto& a : agents) {
            list.push_back({
                { "id", brain::FormatAgentId(a.id) },
                { "thought", "coffee time" },
                { "next_intent", { { "category", "cafe" }, { "name", "Bean" } } },
            });
        }
        return { { "decisions", list } };
    }

    std::string StartRun(const brain::RunInfo& run) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failStart)
            throw brain::BrainError(brain::BrainError::Kind::Network, "connection refused");
        startedWith.push_back(run);
        return "run-1";
    }

    void RegisterAgents(const std::string& runId, const std::vector<brain::AgentSnapshot>& agents) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        CheckRun(runId);
        for (const auto& a : agents) registered.push_back(a.id);
    }

    brain::DecodedDecisions Decide(const std::string& runId, const std::vector<brain::AgentSnapshot>& agents,
                                   const brain::DecisionContext& ctx) override
    {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            gateCv_.wait(lock, [this] { return gateOpen_; });
            CheckRun(runId);
            std::vector<brain::AgentId> ids;
            for (const auto& a : agents) ids.push_back(a.id);
            batches.push_back(std::move(ids));
            decideContexts.push_back(ctx);
        }
        const nlohmann::json body = reply ? reply(agents) : AllToCafe(agents);
        return brain::DecodeDecisions(body);
    }

    std::vector<brain::ChatLine> Chat(const std::string& runId, const std::vector<brain::ChatPair>& pairs,
                                      const brain::DecisionContext& ctx) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        CheckRun(runId);
        chatContexts.push_back(ctx);
        nlohmann::json list = nlohmann::json::array();
        for (const auto& p : pairs) {
            list.push_back({
                { "aId", brain::FormatAgentId(p.a) },
                { "bId", brain::FormatAgentId(p.b) },
                { "a_line", "hey" },
                { "b_line", "hi there" },
            });
        }
        return brain::DecodeChat({ { "pairs", list } });
    }

    void SendMetrics(const std::string& runId, const std::vector<brain::MetricSample>& samples) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        CheckRun(runId);
        if (failMetrics)
            throw brain::BrainError(brain::BrainError::Kind::Http, "HTTP 503", 503);
        metrics.insert(metrics.end(), samples.begin(), samples.end());
        ++metricPosts;
    }

    void EndRun(const std::string& runId) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        CheckRun(runId);
        ++endRuns;
    }

    // While closed, Decide() blocks; open it before the orchestrator is destroyed.
    void CloseGate()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        gateOpen_ = false;
    }

    void OpenGate()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            gateOpen_ = true;
        }
        gateCv_.notify_all();
    }

    std::size_t BatchCount()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return batches.size();
    }

    // Set before use; read after the orchestrator is idle.
    DecideReply reply;
    bool failStart = false;
    bool failMetrics = false;

    std::vector<brain::RunInfo> startedWith;
    std::vector<brain::AgentId> registered;
    std::vector<std::vector<brain::AgentId>> batches;
    std::vector<brain::DecisionContext> decideContexts;
    std::vector<brain::DecisionContext> chatContexts;
    std::vector<brain::MetricSample> metrics;
    int metricPosts = 0;
    int endRuns = 0;
    int wrongRunIds = 0;

private:
    void CheckRun(const std::string& runId)
    {
        if (runId != "run-1") ++wrongRunIds;
    }

    std::mutex mutex_;
    std::condition_variable gateCv_;
    bool gateOpen_ = true;
};

class FakeDirectory final : public brain::IAgentDirectory {
public:
    void Add(brain::AgentId id, float x = 0.f, float y = 0.f)
    {
        brain::AgentSnapshot s;
        s.id = id;
        s.x = x;
        s.y = y;
        agents[id] = s;
    }

    std::optional<brain::AgentSnapshot> Snapshot(brain::AgentId id) const override
    {
        auto it = agents.find(id);
        if (it == agents.end()) return std::nullopt;
        return it->second;
    }

    bool ApplyDecision(const brain::Decision& d) override
    {
        if (!agents.count(d.id)) return false;
        applied.push_back(d);
        return true;
    }

    void ApplyChat(const brain::ChatLine& line) override { chats.push_back(line); }

    std::map<brain::AgentId, brain::AgentSnapshot> agents;
    std::vector<brain::Decision> applied;
    std::vector<brain::ChatLine> chats;
};

} // namespace promenade::testing
