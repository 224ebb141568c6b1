#pragma once
#include <promenade/pathfinding/GridTypes.hpp>

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace promenade::world {

enum class PoiCategory : std::uint8_t {
    Grocery,
    Pharmacy,
    Cafe,
    Restaurant,
    Transit,
    Education,
    Health,
    Retail,
    Other,
};

inline constexpr std::size_t kPoiCategoryCount = 9;

inline constexpr std::array<PoiCategory, kPoiCategoryCount> kAllPoiCategories = {
    PoiCategory::Grocery, PoiCategory::Pharmacy, PoiCategory::Cafe,
    PoiCategory::Restaurant, PoiCategory::Transit, PoiCategory::Education,
    PoiCategory::Health, PoiCategory::Retail, PoiCategory::Other,
};

std::string_view to_string(PoiCategory c) noexcept;

// Exact, lower-case wire names ("grocery", "cafe", ...).
std::optional<PoiCategory> parse_category(std::string_view name) noexcept;

using PoiId = std::uint32_t;

struct Poi {
    PoiCategory  category = PoiCategory::Other;
    pf::IVec2    cell{};
    std::string  name;
    bool         added = false;   // injected by the scenario rather than part of the baseline
};

// Ordered POI list for one scenario. Order is significant: it breaks distance
// ties in goal selection. Replaced wholesale on scenario switch.
class PoiRegistry {
public:
    PoiRegistry() = default;
    explicit PoiRegistry(std::vector<Poi> pois) : pois_(std::move(pois)) {}

    [[nodiscard]] std::size_t size() const noexcept { return pois_.size(); }
    [[nodiscard]] bool empty() const noexcept { return pois_.empty(); }
    [[nodiscard]] const Poi& at(PoiId id) const { return pois_.at(id); }
    [[nodiscard]] bool contains(PoiId id) const noexcept { return id < pois_.size(); }

    [[nodiscard]] auto begin() const noexcept { return pois_.begin(); }
    [[nodiscard]] auto end() const noexcept { return pois_.end(); }

    // Nearest POI accepted by `pred`, by Manhattan distance; ties go to the
    // lower registry index.
    [[nodiscard]] std::optional<PoiId> NearestManhattan(pf::IVec2 from,
                                                        const std::function<bool(const Poi&)>& pred) const;

    // Nearest POI of `category` to a continuous position, by squared
    // Euclidean distance to the cell centre; ties go to the lower index.
    [[nodiscard]] std::optional<PoiId> NearestOfCategory(PoiCategory category, float x, float y) const;

    [[nodiscard]] std::size_t CountOf(PoiCategory category) const noexcept;

private:
    std::vector<Poi> pois_;
};

} // namespace promenade::world
