// src/brain/BrainProtocol.h
#pragma once
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "brain/BrainTypes.h"

namespace promenade::brain {

std::string FormatAgentId(AgentId id);

// Accepts "A12", "12" or 12.
std::optional<AgentId> ParseAgentId(const nlohmann::json& j);

nlohmann::json EncodeContext(const DecisionContext& ctx);

nlohmann::json EncodeStartRun(const RunInfo& run);
// Throws BrainError(Malformed) without a string runId.
std::string DecodeStartRun(const nlohmann::json& body);

nlohmann::json EncodeRegisterAgents(const std::string& runId, const std::vector<AgentSnapshot>& agents);

nlohmann::json EncodeDecide(const std::string& runId, const std::vector<AgentSnapshot>& agents,
                            const DecisionContext& ctx);

struct DecodedDecisions {
    std::vector<Decision> decisions;
    std::size_t skipped = 0;    // entries without a usable id or category
};

// Throws BrainError(Malformed) when `decisions` is missing or not an array;
// bad entries are skipped and counted.
DecodedDecisions DecodeDecisions(const nlohmann::json& body);

nlohmann::json EncodeChat(const std::string& runId, const std::vector<ChatPair>& pairs,
                          const DecisionContext& ctx);

// Throws BrainError(Malformed) when `pairs` is missing; bad entries are dropped.
std::vector<ChatLine> DecodeChat(const nlohmann::json& body);

nlohmann::json EncodeMetrics(const std::string& runId, const std::vector<MetricSample>& samples);
nlohmann::json EncodeEndRun(const std::string& runId);

} // namespace promenade::brain
