// src/brain/IBrainClient.h
#pragma once
#include <string>
#include <vector>

#include "brain/BrainProtocol.h"

namespace promenade::brain {

// Blocking transport to the reasoning service. Every call may throw
// BrainError; implementations must be safe to call from several threads.
class IBrainClient {
public:
    virtual ~IBrainClient() = default;

    virtual std::string StartRun(const RunInfo& run) = 0;
    virtual void RegisterAgents(const std::string& runId, const std::vector<AgentSnapshot>& agents) = 0;
    virtual DecodedDecisions Decide(const std::string& runId, const std::vector<AgentSnapshot>& agents,
                                    const DecisionContext& ctx) = 0;
    virtual std::vector<ChatLine> Chat(const std::string& runId, const std::vector<ChatPair>& pairs,
                                       const DecisionContext& ctx) = 0;
    virtual void SendMetrics(const std::string& runId, const std::vector<MetricSample>& samples) = 0;
    virtual void EndRun(const std::string& runId) = 0;
};

} // namespace promenade::brain
