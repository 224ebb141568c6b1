// tests/test_nav_grid.cpp
#include <doctest/doctest.h>

#include "world/NavGrid.h"
#include "world/ScenarioAssets.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>

using namespace promenade;
using nlohmann::json;

namespace promenade_nav_grid_test {

world::NavGrid MakeGrid(int w, int h)
{
    return world::NavGrid(pf::GridMap(w, h));
}

std::filesystem::path TempFile(const std::string& name)
{
    const auto stamp = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    return std::filesystem::temp_directory_path() / ("promenade_" + std::to_string(stamp) + "_" + name);
}

} // namespace promenade_nav_grid_test

using namespace promenade_nav_grid_test;

TEST_CASE("NavGrid/FromJson reads the grid file shape")
{
    const json j = {
        { "H", 2 }, { "W", 3 },
        { "walkable", { 1, 1, 0, 1, 1, 1 } },
        { "cost", { 1, 2, 1, 1, 1, 5 } },
        { "bbox", { 43.0, -80.0, 43.1, -79.9 } },
        { "cell_m", 2.0 },
    };
    const auto g = world::NavGrid::FromJson(j);
    CHECK(g.width() == 3);
    CHECK(g.height() == 2);
    CHECK(g.cell_meters() == doctest::Approx(2.0));
    CHECK(g.IsWalkable({0,0}));
    CHECK_FALSE(g.IsWalkable({2,0}));
    CHECK(g.map().tile_cost(2, 1) == 5);
    REQUIRE(g.bbox().has_value());
    CHECK(g.bbox()->north == doctest::Approx(43.1));
}

TEST_CASE("NavGrid/FromJson rejects malformed grids")
{
    CHECK_THROWS(world::NavGrid::FromJson(json{ { "H", 2 } }));
    CHECK_THROWS(world::NavGrid::FromJson(json{ { "H", 2 }, { "W", 2 }, { "walkable", { 1, 1, 1 } } }));
    CHECK_THROWS(world::NavGrid::FromJson(json{ { "H", 1 }, { "W", 1 }, { "walkable", json::array({ 1 }) }, { "bbox", json::array({ 1, 2 }) } }));
}

TEST_CASE("NavGrid/LoadFile reports missing and corrupt files")
{
    CHECK_THROWS_AS(world::NavGrid::LoadFile(TempFile("does_not_exist.json")), std::runtime_error);

    const auto p = TempFile("corrupt_grid.json");
    {
        std::ofstream f(p);
        f << "{ not json";
    }
    CHECK_THROWS_AS(world::NavGrid::LoadFile(p), std::runtime_error);
    std::filesystem::remove(p);
}

TEST_CASE("NavGrid/WorldToCell floors and clamps")
{
    const auto g = MakeGrid(10, 5);
    CHECK(g.WorldToCell(3.7f, 2.2f) == pf::IVec2{3,2});
    CHECK(g.WorldToCell(-4.0f, 2.0f) == pf::IVec2{0,2});
    CHECK(g.WorldToCell(25.0f, 99.0f) == pf::IVec2{9,4});
}

TEST_CASE("NavGrid/LonLatToCell needs a bounding box")
{
    const auto plain = MakeGrid(10, 10);
    CHECK_FALSE(plain.LonLatToCell(1.0, 1.0).has_value());

    const world::NavGrid geo(pf::GridMap(10, 10), world::GeoBox{ 0.0, 0.0, 1.0, 2.0 });
    const auto c = geo.LonLatToCell(1.0, 0.25);
    REQUIRE(c.has_value());
    CHECK(*c == pf::IVec2{5,2});
    CHECK(*geo.LonLatToCell(-5.0, 7.0) == pf::IVec2{0,9});
}

TEST_CASE("NavGrid/NearestWalkable searches outward rings")
{
    pf::GridMap m(9, 9, std::vector<pf::u8>(81, 0), {});
    m.set_walkable(6, 4, 1);   // distance 2 straight
    m.set_walkable(2, 2, 1);   // distance 2 diagonal, farther
    const world::NavGrid g(std::move(m));

    CHECK(g.NearestWalkable({4,4}) == pf::IVec2{6,4});
    CHECK(g.NearestWalkable({6,4}) == pf::IVec2{6,4});
    // Out-of-range seed is clamped first.
    CHECK(g.NearestWalkable({40,4}) == pf::IVec2{6,4});
    // Radius too small: falls back to the clamped seed.
    CHECK(g.NearestWalkable({4,4}, 1) == pf::IVec2{4,4});
}

TEST_CASE("NavGrid/NearestWalkable breaks ties in row-major order")
{
    pf::GridMap m(5, 5, std::vector<pf::u8>(25, 0), {});
    m.set_walkable(2, 3, 1);
    m.set_walkable(2, 1, 1);
    const world::NavGrid g(std::move(m));
    CHECK(g.NearestWalkable({2,2}) == pf::IVec2{2,1});
}

TEST_CASE("ScenarioAssets/parses array form, snaps and maps unknown types")
{
    pf::GridMap m(6, 6);
    m.set_walkable(3, 3, 0);
    const world::NavGrid g(std::move(m));

    const json doc = json::array({
        { { "type", "cafe" }, { "ix", 3 }, { "iy", 3 }, { "name", "Corner Cafe" } },
        { { "type", "bowling" }, { "ix", 1 }, { "iy", 1 } },
        { { "type", "grocery" }, { "name", "No position" } },
    });
    const auto s = world::ParseScenario(doc, g, "baseline");

    REQUIRE(s.pois.size() == 2);
    CHECK(s.pois.at(0).category == world::PoiCategory::Cafe);
    CHECK(s.pois.at(0).name == "Corner Cafe");
    CHECK(g.IsWalkable(s.pois.at(0).cell));
    CHECK(s.pois.at(1).category == world::PoiCategory::Other);
    CHECK(s.biases.empty());
}

TEST_CASE("ScenarioAssets/tag biases win over inferred ones")
{
    const auto g = MakeGrid(4, 4);
    const json tagged = {
        { "pois", json::array({ { { "type", "cafe" }, { "ix", 0 }, { "iy", 0 }, { "added", true } } }) },
        { "tags", { { "bias", { { "grocery", 0.5 }, { "cafe", 1.7 } } } } },
    };
    const auto s = world::ParseScenario(tagged, g, "h001");
    CHECK(s.id == "h001");
    CHECK(s.biases.size() == 2);
    CHECK(s.biases.at("grocery") == doctest::Approx(0.5));
    CHECK(s.biases.at("cafe") == doctest::Approx(1.0)); // clamped
}

TEST_CASE("ScenarioAssets/infers biases from added POIs")
{
    const auto g = MakeGrid(4, 4);
    const json doc = { { "pois", json::array({
        { { "type", "cafe" }, { "ix", 0 }, { "iy", 0 }, { "added", true } },
        { { "type", "cafe" }, { "ix", 1 }, { "iy", 0 }, { "added", true } },
        { { "type", "pharmacy" }, { "ix", 2 }, { "iy", 0 }, { "added", true } },
        { { "type", "grocery" }, { "ix", 3 }, { "iy", 0 } },
    }) } };
    const auto s = world::ParseScenario(doc, g, "h002");
    CHECK(s.biases.at("cafe") == doctest::Approx(0.4));
    CHECK(s.biases.at("pharmacy") == doctest::Approx(0.2));
    CHECK(s.biases.count("grocery") == 0);
}

TEST_CASE("ScenarioAssets/rejects documents of the wrong shape")
{
    const auto g = MakeGrid(2, 2);
    CHECK_THROWS_AS(world::ParseScenario(json{ { "foo", 1 } }, g, "x"), std::runtime_error);
    CHECK_THROWS_AS(world::ParseScenario(json(42), g, "x"), std::runtime_error);
}

TEST_CASE("PoiRegistry/nearest lookups prefer the earlier entry on ties")
{
    world::PoiRegistry reg({
        { world::PoiCategory::Cafe, {4,0}, "east", false },
        { world::PoiCategory::Cafe, {0,4}, "south", false },
        { world::PoiCategory::Grocery, {1,0}, "shop", false },
    });

    const auto m = reg.NearestManhattan({0,0}, [](const world::Poi& p) {
        return p.category == world::PoiCategory::Cafe;
    });
    REQUIRE(m.has_value());
    CHECK(*m == 0u);

    const auto e = reg.NearestOfCategory(world::PoiCategory::Cafe, 0.5f, 0.5f);
    REQUIRE(e.has_value());
    CHECK(*e == 0u);

    CHECK_FALSE(reg.NearestOfCategory(world::PoiCategory::Transit, 0.f, 0.f).has_value());
    CHECK(reg.CountOf(world::PoiCategory::Cafe) == 2u);
    CHECK(world::parse_category("restaurant") == world::PoiCategory::Restaurant);
    CHECK_FALSE(world::parse_category("Restaurant").has_value());
}
