// src/brain/HttpBrainClient.cpp
#include "brain/HttpBrainClient.h"
#include "brain/BrainError.h"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>

namespace promenade::brain {

using nlohmann::json;

namespace {

constexpr long kConnectTimeoutMs = 3000;

std::once_flag g_curlInit;

size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp)
{
    const size_t total = size * nmemb;
    static_cast<std::string*>(userp)->append(static_cast<const char*>(contents), total);
    return total;
}

struct CurlDeleter {
    void operator()(CURL* c) const noexcept { curl_easy_cleanup(c); }
};
struct SlistDeleter {
    void operator()(curl_slist* s) const noexcept { curl_slist_free_all(s); }
};

} // namespace

HttpBrainClient::HttpBrainClient(std::string baseUrl, long timeoutMs)
    : baseUrl_(std::move(baseUrl)), timeoutMs_(timeoutMs)
{
    while (!baseUrl_.empty() && baseUrl_.back() == '/')
        baseUrl_.pop_back();
    std::call_once(g_curlInit, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

json HttpBrainClient::PostJson(const std::string& path, const json& body) const
{
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl)
        throw BrainError(BrainError::Kind::Network, "curl_easy_init failed");

    const std::string url = baseUrl_ + path;
    const std::string payload = body.dump();
    std::string response;

    std::unique_ptr<curl_slist, SlistDeleter> headers(
        curl_slist_append(nullptr, "Content-Type: application/json"));

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, kConnectTimeoutMs);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeoutMs_);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    const CURLcode res = curl_easy_perform(curl.get());
    if (res == CURLE_OPERATION_TIMEDOUT)
        throw BrainError(BrainError::Kind::Timeout, path + ": " + curl_easy_strerror(res));
    if (res != CURLE_OK)
        throw BrainError(BrainError::Kind::Network, path + ": " + curl_easy_strerror(res));

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300)
        throw BrainError(BrainError::Kind::Http, path + ": HTTP " + std::to_string(status), status);

    if (response.empty())
        return json::object();
    try {
        return json::parse(response);
    } catch (const json::parse_error& e) {
        throw BrainError(BrainError::Kind::Malformed, path + ": " + e.what(), status);
    }
}

std::string HttpBrainClient::StartRun(const RunInfo& run)
{
    return DecodeStartRun(PostJson("/start_run", EncodeStartRun(run)));
}

void HttpBrainClient::RegisterAgents(const std::string& runId, const std::vector<AgentSnapshot>& agents)
{
    PostJson("/register_agents", EncodeRegisterAgents(runId, agents));
}

DecodedDecisions HttpBrainClient::Decide(const std::string& runId, const std::vector<AgentSnapshot>& agents,
                                         const DecisionContext& ctx)
{
    return DecodeDecisions(PostJson("/decide", EncodeDecide(runId, agents, ctx)));
}

std::vector<ChatLine> HttpBrainClient::Chat(const std::string& runId, const std::vector<ChatPair>& pairs,
                                            const DecisionContext& ctx)
{
    return DecodeChat(PostJson("/chat", EncodeChat(runId, pairs, ctx)));
}

void HttpBrainClient::SendMetrics(const std::string& runId, const std::vector<MetricSample>& samples)
{
    const json reply = PostJson("/metrics", EncodeMetrics(runId, samples));
    if (!reply.value("ok", true))
        spdlog::warn("metrics: service rejected {} samples for run {}", samples.size(), runId);
}

void HttpBrainClient::EndRun(const std::string& runId)
{
    PostJson("/end_run", EncodeEndRun(runId));
}

} // namespace promenade::brain
