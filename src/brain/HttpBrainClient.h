// src/brain/HttpBrainClient.h
#pragma once
#include <string>

#include <nlohmann/json.hpp>

#include "brain/IBrainClient.h"

namespace promenade::brain {

// libcurl transport: one easy handle per call, JSON over HTTP POST.
class HttpBrainClient final : public IBrainClient {
public:
    explicit HttpBrainClient(std::string baseUrl, long timeoutMs = 15000);

    std::string StartRun(const RunInfo& run) override;
    void RegisterAgents(const std::string& runId, const std::vector<AgentSnapshot>& agents) override;
    DecodedDecisions Decide(const std::string& runId, const std::vector<AgentSnapshot>& agents,
                            const DecisionContext& ctx) override;
    std::vector<ChatLine> Chat(const std::string& runId, const std::vector<ChatPair>& pairs,
                               const DecisionContext& ctx) override;
    void SendMetrics(const std::string& runId, const std::vector<MetricSample>& samples) override;
    void EndRun(const std::string& runId) override;

    [[nodiscard]] const std::string& base_url() const noexcept { return baseUrl_; }

private:
    // POSTs `body` to baseUrl + path and parses the reply. Throws BrainError.
    nlohmann::json PostJson(const std::string& path, const nlohmann::json& body) const;

    std::string baseUrl_;
    long timeoutMs_;
};

} // namespace promenade::brain
