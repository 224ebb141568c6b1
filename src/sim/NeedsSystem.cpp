// src/sim/NeedsSystem.cpp
#include "sim/NeedsSystem.h"
#include "sim/Components.h"

#include <algorithm>

namespace promenade::sim {

void ApplyNeedGrowth(NeedVector& needs, Role role, float elapsed, float rateScale)
{
    const RoleProfile& p = profile(role);
    for (Need n : kAllNeeds) {
        const std::size_t i = static_cast<std::size_t>(n);
        needs[i] = std::clamp(needs[i] + base_rate(n) * p.weights[i] * rateScale * elapsed, 0.0f, 1.0f);
    }
}

std::size_t UpdateNeeds(entt::registry& r, float dt, const NeedsParams& p)
{
    std::size_t evaluated = 0;
    for (auto [e, info, needs] : r.view<AgentInfo, Needs>().each()) {
        needs.sinceEval += dt;
        if (needs.sinceEval < p.evalPeriod)
            continue;
        ApplyNeedGrowth(needs.values, info.role, needs.sinceEval, p.rateScale);
        needs.sinceEval = 0.f;
        ++evaluated;
    }
    return evaluated;
}

std::optional<Need> MostPressingNeed(const NeedVector& needs, float threshold)
{
    std::optional<Need> best;
    for (Need n : kAllNeeds) {
        const float v = at(needs, n);
        if (v < threshold) continue;
        if (!best || v > at(needs, *best))
            best = n;
    }
    return best;
}

std::optional<GoalChoice> SelectGoal(const NeedVector& needs, pf::IVec2 cell,
                                     const world::PoiRegistry& pois, float threshold)
{
    const auto need = MostPressingNeed(needs, threshold);
    if (!need)
        return std::nullopt;

    const auto poi = pois.NearestManhattan(cell, [n = *need](const world::Poi& p) {
        return satisfies(p.category, n);
    });
    if (!poi)
        return std::nullopt;
    return GoalChoice{ *poi, *need };
}

void SatisfyNeed(NeedVector& needs, Need n, float decrement)
{
    float& v = at(needs, n);
    v = std::max(0.0f, v - decrement);
}

} // namespace promenade::sim
