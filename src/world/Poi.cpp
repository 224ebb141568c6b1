#include "world/Poi.h"

#include <promenade/pathfinding/Heuristic.hpp>

#include <limits>

namespace promenade::world {

std::string_view to_string(PoiCategory c) noexcept
{
    switch (c) {
    case PoiCategory::Grocery:    return "grocery";
    case PoiCategory::Pharmacy:   return "pharmacy";
    case PoiCategory::Cafe:       return "cafe";
    case PoiCategory::Restaurant: return "restaurant";
    case PoiCategory::Transit:    return "transit";
    case PoiCategory::Education:  return "education";
    case PoiCategory::Health:     return "health";
    case PoiCategory::Retail:     return "retail";
    case PoiCategory::Other:      return "other";
    }
    return "other";
}

std::optional<PoiCategory> parse_category(std::string_view name) noexcept
{
    for (PoiCategory c : kAllPoiCategories) {
        if (to_string(c) == name)
            return c;
    }
    return std::nullopt;
}

std::optional<PoiId> PoiRegistry::NearestManhattan(pf::IVec2 from,
                                                   const std::function<bool(const Poi&)>& pred) const
{
    std::optional<PoiId> best;
    int bestDist = std::numeric_limits<int>::max();
    for (PoiId i = 0; i < pois_.size(); ++i) {
        const Poi& p = pois_[i];
        if (!pred(p))
            continue;
        const int d = pf::manhattan(from, p.cell);
        if (d < bestDist) {   // strict: first index wins ties
            bestDist = d;
            best = i;
        }
    }
    return best;
}

std::optional<PoiId> PoiRegistry::NearestOfCategory(PoiCategory category, float x, float y) const
{
    std::optional<PoiId> best;
    float bestD2 = std::numeric_limits<float>::max();
    for (PoiId i = 0; i < pois_.size(); ++i) {
        const Poi& p = pois_[i];
        if (p.category != category)
            continue;
        const float dx = (static_cast<float>(p.cell.x) + 0.5f) - x;
        const float dy = (static_cast<float>(p.cell.y) + 0.5f) - y;
        const float d2 = dx * dx + dy * dy;
        if (d2 < bestD2) {
            bestD2 = d2;
            best = i;
        }
    }
    return best;
}

std::size_t PoiRegistry::CountOf(PoiCategory category) const noexcept
{
    std::size_t n = 0;
    for (const Poi& p : pois_)
        if (p.category == category) ++n;
    return n;
}

} // namespace promenade::world
