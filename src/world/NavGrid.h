#pragma once
#include <promenade/pathfinding/GridMap.hpp>

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <optional>

namespace promenade::world {

// Geographic extent of the grid: row 0 at `south`, column 0 at `west`.
struct GeoBox {
    double south = 0.0, west = 0.0, north = 0.0, east = 0.0;
};

// Immutable per-run navigability model. Agent positions are continuous
// coordinates in cell units: cell (ix, iy) spans [ix, ix+1) x [iy, iy+1).
class NavGrid {
public:
    static constexpr int kDefaultSnapRadius = 30;

    NavGrid() = default;
    explicit NavGrid(pf::GridMap map, std::optional<GeoBox> bbox = std::nullopt, float cellMeters = 1.5f);

    // {"H":..,"W":..,"walkable":[..],"cost":[..],"bbox":[s,w,n,e],"cell_m":..}
    // "cell_m" falls back to `defaultCellMeters`.
    // Throws std::runtime_error / std::invalid_argument on malformed input.
    static NavGrid FromJson(const nlohmann::json& j, float defaultCellMeters = 1.5f);
    static NavGrid LoadFile(const std::filesystem::path& path, float defaultCellMeters = 1.5f);

    [[nodiscard]] const pf::GridMap& map() const noexcept { return map_; }
    [[nodiscard]] int width() const noexcept { return map_.width(); }
    [[nodiscard]] int height() const noexcept { return map_.height(); }
    [[nodiscard]] float cell_meters() const noexcept { return cellMeters_; }
    [[nodiscard]] const std::optional<GeoBox>& bbox() const noexcept { return bbox_; }

    [[nodiscard]] bool InBounds(pf::IVec2 c) const noexcept { return map_.bounds().contains(c); }
    [[nodiscard]] bool IsWalkable(pf::IVec2 c) const { return map_.passable(c); }
    [[nodiscard]] pf::IVec2 Clamp(pf::IVec2 c) const noexcept { return map_.bounds().clamp(c); }

    // Continuous position -> containing cell, clamped to the grid.
    [[nodiscard]] pf::IVec2 WorldToCell(float x, float y) const noexcept;

    // Requires a bounding box; nullopt otherwise. Result is clamped to the grid.
    [[nodiscard]] std::optional<pf::IVec2> LonLatToCell(double lon, double lat) const noexcept;

    // Nearest walkable cell to `seed`, searching square rings of growing radius
    // up to `maxRadius`. Within a ring the closest cell (Euclidean) wins, ties
    // in row-major order. Falls back to the clamped seed.
    [[nodiscard]] pf::IVec2 NearestWalkable(pf::IVec2 seed, int maxRadius = kDefaultSnapRadius) const;

private:
    pf::GridMap map_;
    std::optional<GeoBox> bbox_;
    float cellMeters_ = 1.5f;
};

} // namespace promenade::world
