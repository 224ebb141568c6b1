#include "sim/Needs.h"

#include <algorithm>

namespace promenade::sim {

using world::PoiCategory;

std::string_view to_string(Need n) noexcept
{
    switch (n) {
    case Need::Hunger:    return "hunger";
    case Need::Caffeine:  return "caffeine";
    case Need::Groceries: return "groceries";
    case Need::Health:    return "health";
    case Need::Education: return "education";
    case Need::Leisure:   return "leisure";
    case Need::Social:    return "social";
    }
    return "hunger";
}

std::optional<Need> parse_need(std::string_view name) noexcept
{
    for (Need n : kAllNeeds)
        if (to_string(n) == name) return n;
    return std::nullopt;
}

float base_rate(Need n) noexcept
{
    static constexpr NeedVector kRates = { 0.3f, 0.5f, 0.1f, 0.05f, 0.08f, 0.2f, 0.15f };
    return kRates[static_cast<std::size_t>(n)];
}

std::string_view to_string(Role r) noexcept
{
    switch (r) {
    case Role::Student:  return "student";
    case Role::Resident: return "resident";
    case Role::Worker:   return "worker";
    case Role::Visitor:  return "visitor";
    }
    return "student";
}

std::optional<Role> parse_role(std::string_view name) noexcept
{
    for (Role r : kAllRoles)
        if (to_string(r) == name) return r;
    return std::nullopt;
}

const RoleProfile& profile(Role r) noexcept
{
    //                          hun   caf   gro   hea   edu   lei   soc
    static const RoleProfile kStudent  { 0.65f, { 1.2f, 1.5f, 0.8f, 0.9f, 1.8f, 1.1f, 1.3f } };
    static const RoleProfile kResident { 0.20f, { 1.0f, 1.0f, 1.5f, 1.2f, 0.3f, 1.0f, 1.0f } };
    static const RoleProfile kWorker   { 0.10f, { 1.1f, 1.8f, 1.2f, 1.0f, 0.5f, 0.7f, 0.8f } };
    static const RoleProfile kVisitor  { 0.05f, { 1.3f, 1.2f, 0.3f, 0.8f, 0.8f, 1.6f, 1.4f } };

    switch (r) {
    case Role::Student:  return kStudent;
    case Role::Resident: return kResident;
    case Role::Worker:   return kWorker;
    case Role::Visitor:  return kVisitor;
    }
    return kStudent;
}

bool satisfies(PoiCategory category, Need n) noexcept
{
    switch (category) {
    case PoiCategory::Grocery:    return n == Need::Hunger || n == Need::Groceries;
    case PoiCategory::Pharmacy:   return n == Need::Health;
    case PoiCategory::Cafe:       return n == Need::Caffeine || n == Need::Social;
    case PoiCategory::Restaurant: return n == Need::Hunger || n == Need::Social;
    case PoiCategory::Transit:    return false;
    case PoiCategory::Education:  return n == Need::Education;
    case PoiCategory::Health:     return n == Need::Health;
    case PoiCategory::Retail:     return n == Need::Leisure;
    case PoiCategory::Other:      return n == Need::Leisure;
    }
    return false;
}

std::optional<Need> MostUrgentSatisfiedBy(const NeedVector& needs, PoiCategory category) noexcept
{
    std::optional<Need> best;
    for (Need n : kAllNeeds) {
        if (!satisfies(category, n)) continue;
        if (!best || at(needs, n) > at(needs, *best))
            best = n;
    }
    return best;
}

Role SampleRole(rng::Pcg32& rng)
{
    float total = 0.0f;
    for (Role r : kAllRoles) total += profile(r).samplingWeight;

    float pick = rng.next_float01() * total;
    for (Role r : kAllRoles) {
        pick -= profile(r).samplingWeight;
        if (pick < 0.0f) return r;
    }
    return kAllRoles.back();
}

NeedVector InitialNeeds(Role role, rng::Pcg32& rng)
{
    const RoleProfile& p = profile(role);
    NeedVector v{};
    for (std::size_t i = 0; i < kNeedCount; ++i)
        v[i] = std::clamp(rng.next_float01() * 0.6f * p.weights[i], 0.0f, 1.0f);
    return v;
}

} // namespace promenade::sim
