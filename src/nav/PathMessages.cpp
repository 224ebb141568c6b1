#include "nav/PathMessages.h"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace promenade::nav {

using nlohmann::json;

namespace {

// Wire cells are [row, column].
json CellToJson(pf::IVec2 c) { return json::array({ c.y, c.x }); }

pf::IVec2 CellFromJson(const json& j)
{
    if (!j.is_array() || j.size() != 2)
        throw std::runtime_error("cell must be [iy, ix]");
    return { j[1].get<int>(), j[0].get<int>() };
}

json ErrorMessage(const std::string& what)
{
    return { { "type", "error" }, { "message", what } };
}

} // namespace

pf::PathOutcome PathWorker::Compute(pf::IVec2 start, pf::IVec2 goal) const
{
    if (!grid_)
        return pf::PathOutcome::failure(pf::PathStatus::NoRoute);
    pf::AStar search(*grid_);
    return search.find_path(start, goal);
}

json PathWorker::HandleMessage(const json& msg)
{
    const std::string type = msg.value("type", std::string{});
    try {
        if (type == "init") {
            const int h = msg.at("H").get<int>();
            const int w = msg.at("W").get<int>();
            auto walkable = msg.at("walkable").get<std::vector<pf::u8>>();
            std::vector<pf::u8> cost;
            if (msg.contains("cost") && msg["cost"].is_array())
                cost = msg["cost"].get<std::vector<pf::u8>>();
            grid_.emplace(w, h, std::move(walkable), std::move(cost));
            return { { "type", "ready" } };
        }
        if (type == "path") {
            const RequestId id = msg.at("id").get<RequestId>();
            const pf::IVec2 start = CellFromJson(msg.at("start"));
            const pf::IVec2 goal = CellFromJson(msg.at("goal"));
            return EncodePathResponse(id, Compute(start, goal));
        }
    } catch (const std::exception& e) {
        spdlog::warn("path worker: bad '{}' message: {}", type, e.what());
        return ErrorMessage(e.what());
    }
    return ErrorMessage("unknown message type '" + type + "'");
}

json EncodeInit(const pf::GridMap& grid)
{
    return {
        { "type", "init" },
        { "H", grid.height() },
        { "W", grid.width() },
        { "walkable", grid.walkable_cells() },
        { "cost", grid.cost_cells() },
    };
}

json EncodePathRequest(RequestId id, pf::IVec2 start, pf::IVec2 goal)
{
    return { { "type", "path" }, { "id", id }, { "start", CellToJson(start) }, { "goal", CellToJson(goal) } };
}

json EncodePathResponse(RequestId id, const pf::PathOutcome& outcome)
{
    json out = { { "type", "path" }, { "id", id }, { "ok", outcome.ok() } };
    if (outcome.ok()) {
        json pts = json::array();
        for (const pf::IVec2& p : outcome.path.points)
            pts.push_back(CellToJson(p));
        out["path"] = std::move(pts);
    } else {
        out["reason"] = std::string(pf::to_string(outcome.status));
    }
    return out;
}

PathResponse DecodePathResponse(const json& msg)
{
    if (msg.value("type", std::string{}) != "path")
        throw std::runtime_error("not a path response");

    PathResponse r;
    r.id = msg.at("id").get<RequestId>();
    r.ok = msg.value("ok", false);
    if (r.ok) {
        for (const json& c : msg.at("path"))
            r.points.push_back(CellFromJson(c));
    }
    return r;
}

} // namespace promenade::nav
