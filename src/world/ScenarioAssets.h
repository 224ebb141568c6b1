#pragma once
#include "world/NavGrid.h"
#include "world/Poi.h"

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <map>
#include <string>

namespace promenade::world {

// category name -> weight in [0,1]; forwarded to the reasoning service as
// decision context.
using NeedBiases = std::map<std::string, float>;

struct ScenarioAssets {
    std::string id = "baseline";
    PoiRegistry pois;
    NeedBiases  biases;
};

// Parses a POI collection: either a bare array of {type, ix, iy, name?, added?}
// or an object {pois:[...], tags:{bias:{...}}}. Unknown types become
// PoiCategory::Other; every position is snapped to a walkable cell of `grid`.
// Entries without integer ix/iy are skipped with a warning. Throws
// std::runtime_error when the document has neither shape.
ScenarioAssets ParseScenario(const nlohmann::json& doc, const NavGrid& grid, std::string id);

ScenarioAssets LoadScenario(const std::filesystem::path& poisFile, const NavGrid& grid, std::string id);

// Explicit tag biases win; otherwise every category that has scenario-added
// POIs gets max(0.2, bias + 0.2). Values are clamped to [0,1].
NeedBiases BuildNeedBiases(const PoiRegistry& pois, const NeedBiases& tagged);

} // namespace promenade::world
