#include "world/NavGrid.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace promenade::world {

using nlohmann::json;

NavGrid::NavGrid(pf::GridMap map, std::optional<GeoBox> bbox, float cellMeters)
    : map_(std::move(map)), bbox_(bbox), cellMeters_(cellMeters)
{
    if (map_.width() <= 0 || map_.height() <= 0)
        throw std::invalid_argument("NavGrid: empty grid");
}

NavGrid NavGrid::FromJson(const json& j, float defaultCellMeters)
{
    const int h = j.at("H").get<int>();
    const int w = j.at("W").get<int>();
    auto walkable = j.at("walkable").get<std::vector<pf::u8>>();
    std::vector<pf::u8> cost;
    if (j.contains("cost") && !j["cost"].is_null())
        cost = j["cost"].get<std::vector<pf::u8>>();

    std::optional<GeoBox> bbox;
    if (j.contains("bbox") && j["bbox"].is_array()) {
        const auto& b = j["bbox"];
        if (b.size() != 4)
            throw std::runtime_error("grid bbox must be [south, west, north, east]");
        bbox = GeoBox{ b[0].get<double>(), b[1].get<double>(), b[2].get<double>(), b[3].get<double>() };
    }

    const float cellM = j.value("cell_m", defaultCellMeters);
    return NavGrid(pf::GridMap(w, h, std::move(walkable), std::move(cost)), bbox, cellM);
}

NavGrid NavGrid::LoadFile(const std::filesystem::path& path, float defaultCellMeters)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw std::runtime_error("Failed to open grid: " + path.string());

    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Malformed grid " + path.string() + ": " + e.what());
    }
    return FromJson(j, defaultCellMeters);
}

pf::IVec2 NavGrid::WorldToCell(float x, float y) const noexcept
{
    const pf::IVec2 c{ static_cast<int>(std::floor(x)), static_cast<int>(std::floor(y)) };
    return Clamp(c);
}

std::optional<pf::IVec2> NavGrid::LonLatToCell(double lon, double lat) const noexcept
{
    if (!bbox_)
        return std::nullopt;
    const GeoBox& b = *bbox_;
    if (b.east == b.west || b.north == b.south)
        return std::nullopt;

    const double fx = (lon - b.west) / (b.east - b.west) * width();
    const double fy = (lat - b.south) / (b.north - b.south) * height();
    const double cx = std::clamp(fx, 0.0, static_cast<double>(width() - 1));
    const double cy = std::clamp(fy, 0.0, static_cast<double>(height() - 1));
    return pf::IVec2{ static_cast<int>(cx), static_cast<int>(cy) };
}

pf::IVec2 NavGrid::NearestWalkable(pf::IVec2 seed, int maxRadius) const
{
    const pf::IVec2 origin = Clamp(seed);
    if (IsWalkable(origin))
        return origin;

    for (int r = 1; r <= maxRadius; ++r) {
        const int y0 = origin.y - r, y1 = origin.y + r;
        const int x0 = origin.x - r, x1 = origin.x + r;

        std::optional<pf::IVec2> best;
        int bestD2 = std::numeric_limits<int>::max();
        auto consider = [&](int x, int y) {
            if (!map_.passable(x, y)) return;
            const int dx = x - origin.x, dy = y - origin.y;
            const int d2 = dx * dx + dy * dy;
            if (d2 < bestD2) { bestD2 = d2; best = pf::IVec2{ x, y }; }
        };

        // Ring perimeter in row-major order.
        for (int y = y0; y <= y1; ++y) {
            if (y == y0 || y == y1) {
                for (int x = x0; x <= x1; ++x) consider(x, y);
            } else {
                consider(x0, y);
                consider(x1, y);
            }
        }
        if (best)
            return *best;
    }
    return origin;
}

} // namespace promenade::world
