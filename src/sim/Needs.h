#pragma once
#include "core/Rng.h"
#include "world/Poi.h"

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace promenade::sim {

enum class Need : std::uint8_t {
    Hunger,
    Caffeine,
    Groceries,
    Health,
    Education,
    Leisure,
    Social,
};

inline constexpr std::size_t kNeedCount = 7;

inline constexpr std::array<Need, kNeedCount> kAllNeeds = {
    Need::Hunger, Need::Caffeine, Need::Groceries, Need::Health,
    Need::Education, Need::Leisure, Need::Social,
};

// Indexed by Need; every value stays in [0,1].
using NeedVector = std::array<float, kNeedCount>;

inline float& at(NeedVector& v, Need n) { return v[static_cast<std::size_t>(n)]; }
inline float  at(const NeedVector& v, Need n) { return v[static_cast<std::size_t>(n)]; }

std::string_view to_string(Need n) noexcept;
std::optional<Need> parse_need(std::string_view name) noexcept;

// Growth per second before role weighting.
float base_rate(Need n) noexcept;

enum class Role : std::uint8_t {
    Student,
    Resident,
    Worker,
    Visitor,
};

inline constexpr std::array<Role, 4> kAllRoles = {
    Role::Student, Role::Resident, Role::Worker, Role::Visitor,
};

std::string_view to_string(Role r) noexcept;
std::optional<Role> parse_role(std::string_view name) noexcept;

struct RoleProfile {
    float      samplingWeight;
    NeedVector weights;
};

const RoleProfile& profile(Role r) noexcept;

// POI category -> needs it satisfies (grocery: hunger+groceries, transit: none, ...).
bool satisfies(world::PoiCategory category, Need n) noexcept;

// Highest-valued need that `category` satisfies; ties go to enum order.
// nullopt when the category satisfies nothing.
std::optional<Need> MostUrgentSatisfiedBy(const NeedVector& needs, world::PoiCategory category) noexcept;

// Role drawn by sampling weight.
Role SampleRole(rng::Pcg32& rng);

// U[0,1) * 0.6 * role weight, clamped to [0,1].
NeedVector InitialNeeds(Role role, rng::Pcg32& rng);

} // namespace promenade::sim
