// src/brain/BrainProtocol.cpp
#include "brain/BrainProtocol.h"
#include "brain/BrainError.h"

#include <spdlog/spdlog.h>

#include <charconv>

namespace promenade::brain {

using nlohmann::json;

std::string FormatAgentId(AgentId id)
{
    return "A" + std::to_string(id);
}

std::optional<AgentId> ParseAgentId(const json& j)
{
    if (j.is_number_unsigned())
        return j.get<AgentId>();
    if (j.is_number_integer()) {
        const auto v = j.get<long long>();
        if (v < 0) return std::nullopt;
        return static_cast<AgentId>(v);
    }
    if (!j.is_string())
        return std::nullopt;

    std::string_view s = j.get_ref<const std::string&>();
    if (!s.empty() && (s.front() == 'A' || s.front() == 'a'))
        s.remove_prefix(1);
    if (s.empty())
        return std::nullopt;

    AgentId id = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), id);
    if (ec != std::errc{} || ptr != s.data() + s.size())
        return std::nullopt;
    return id;
}

namespace {

json NeedsToJson(const sim::NeedVector& needs)
{
    json out = json::object();
    for (sim::Need n : sim::kAllNeeds)
        out[std::string(sim::to_string(n))] = sim::at(needs, n);
    return out;
}

json SnapshotToJson(const AgentSnapshot& a)
{
    return {
        { "id", FormatAgentId(a.id) },
        { "role", std::string(sim::to_string(a.role)) },
        { "pos", json::array({ a.x, a.y }) },
        { "needs", NeedsToJson(a.needs) },
    };
}

} // namespace

json EncodeContext(const DecisionContext& ctx)
{
    json out = json::object();
    if (!ctx.scenarioId.empty() && ctx.scenarioId != "baseline")
        out["scenario_id"] = ctx.scenarioId;
    out["biases"] = ctx.biases;
    if (ctx.meeting)
        out["meeting"] = true;
    return out;
}

json EncodeStartRun(const RunInfo& run)
{
    return { { "hypothesisId", run.hypothesisId }, { "seed", run.seed }, { "speed", run.speed } };
}

std::string DecodeStartRun(const json& body)
{
    if (!body.is_object() || !body.contains("runId") || !body["runId"].is_string())
        throw BrainError(BrainError::Kind::Malformed, "start_run: response has no runId");
    return body["runId"].get<std::string>();
}

json EncodeRegisterAgents(const std::string& runId, const std::vector<AgentSnapshot>& agents)
{
    json list = json::array();
    for (const AgentSnapshot& a : agents)
        list.push_back({ { "id", FormatAgentId(a.id) }, { "role", std::string(sim::to_string(a.role)) } });
    return { { "runId", runId }, { "agents", std::move(list) } };
}

json EncodeDecide(const std::string& runId, const std::vector<AgentSnapshot>& agents, const DecisionContext& ctx)
{
    json list = json::array();
    for (const AgentSnapshot& a : agents)
        list.push_back(SnapshotToJson(a));
    return { { "runId", runId }, { "agents", std::move(list) }, { "context", EncodeContext(ctx) } };
}

DecodedDecisions DecodeDecisions(const json& body)
{
    if (!body.is_object() || !body.contains("decisions") || !body["decisions"].is_array())
        throw BrainError(BrainError::Kind::Malformed, "decide: response has no decisions array");

    DecodedDecisions out;
    for (const json& d : body["decisions"]) {
        if (!d.is_object()) { ++out.skipped; continue; }

        const auto id = d.contains("id") ? ParseAgentId(d["id"]) : std::nullopt;
        const json* intent = d.contains("next_intent") && d["next_intent"].is_object() ? &d["next_intent"] : nullptr;
        if (!id || !intent || !intent->contains("category") || !(*intent)["category"].is_string()) {
            spdlog::warn("decide: skipping malformed decision {}", d.dump());
            ++out.skipped;
            continue;
        }

        Decision dec;
        dec.id = *id;
        dec.intent.category = (*intent)["category"].get<std::string>();
        if (intent->contains("name") && (*intent)["name"].is_string())
            dec.intent.name = (*intent)["name"].get<std::string>();
        if (d.contains("thought") && d["thought"].is_string())
            dec.thought = d["thought"].get<std::string>();
        out.decisions.push_back(std::move(dec));
    }
    return out;
}

json EncodeChat(const std::string& runId, const std::vector<ChatPair>& pairs, const DecisionContext& ctx)
{
    json list = json::array();
    for (const ChatPair& p : pairs)
        list.push_back({ { "aId", FormatAgentId(p.a) }, { "bId", FormatAgentId(p.b) } });
    return { { "runId", runId }, { "pairs", std::move(list) }, { "context", EncodeContext(ctx) } };
}

std::vector<ChatLine> DecodeChat(const json& body)
{
    if (!body.is_object() || !body.contains("pairs") || !body["pairs"].is_array())
        throw BrainError(BrainError::Kind::Malformed, "chat: response has no pairs array");

    std::vector<ChatLine> out;
    for (const json& p : body["pairs"]) {
        if (!p.is_object()) continue;
        const auto a = p.contains("aId") ? ParseAgentId(p["aId"]) : std::nullopt;
        const auto b = p.contains("bId") ? ParseAgentId(p["bId"]) : std::nullopt;
        if (!a || !b) continue;
        out.push_back({ *a, *b, p.value("a_line", std::string{}), p.value("b_line", std::string{}) });
    }
    return out;
}

json EncodeMetrics(const std::string& runId, const std::vector<MetricSample>& samples)
{
    json list = json::array();
    for (const MetricSample& s : samples) {
        list.push_back({
            { "kind", "trip" },
            { "agent", FormatAgentId(s.agent) },
            { "role", std::string(sim::to_string(s.role)) },
            { "cat", s.category },
            { "ms", s.durationMs },
            { "dist_m", s.distanceM },
        });
    }
    return { { "runId", runId }, { "samples", std::move(list) } };
}

json EncodeEndRun(const std::string& runId)
{
    return { { "runId", runId } };
}

} // namespace promenade::brain
