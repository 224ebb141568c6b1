// src/sim/NeedsSystem.h
#pragma once
#include <cstddef>
#include <optional>

#include <entt/entt.hpp>

#include "sim/Needs.h"
#include "world/Poi.h"

namespace promenade::sim {

struct NeedsParams {
    float evalPeriod  = 2.0f;
    float rateScale   = 1.0f;
    float threshold   = 0.3f;
    float decrement   = 0.4f;
};

// needs += base_rate * role weight * rateScale * elapsed, clamped to [0,1].
void ApplyNeedGrowth(NeedVector& needs, Role role, float elapsed, float rateScale);

// Accumulates dt on every agent and applies growth once evalPeriod has
// elapsed for it. Returns the number of agents evaluated this call.
std::size_t UpdateNeeds(entt::registry& r, float dt, const NeedsParams& p);

// Highest need at or above `threshold`; ties go to enum order.
std::optional<Need> MostPressingNeed(const NeedVector& needs, float threshold);

struct GoalChoice {
    world::PoiId poi = 0;
    Need need = Need::Hunger;
};

// Most pressing need, then the Manhattan-nearest POI satisfying it (ties to
// the lower registry index). nullopt when no need is active or no POI fits.
std::optional<GoalChoice> SelectGoal(const NeedVector& needs, pf::IVec2 cell,
                                     const world::PoiRegistry& pois, float threshold);

void SatisfyNeed(NeedVector& needs, Need n, float decrement);

} // namespace promenade::sim
