// tests/test_movement.cpp
#include <doctest/doctest.h>

#include "sim/MovementSystem.h"
#include "sim/TripStats.h"

#include <cmath>

using namespace promenade;
using pf::IVec2;

namespace {

entt::entity MakeWalker(entt::registry& r, sim::AgentId id, std::vector<IVec2> points, float speed,
                        std::optional<sim::Need> need = sim::Need::Hunger)
{
    const auto e = r.create();
    r.emplace<sim::AgentInfo>(e, sim::AgentInfo{ id, sim::Role::Student, true, speed });
    r.emplace<sim::Position>(e, sim::Position{ points.front().x + 0.5f, points.front().y + 0.5f, 0.f });
    sim::Needs needs;
    needs.values.fill(0.1f);
    sim::at(needs.values, sim::Need::Hunger) = 0.9f;
    r.emplace<sim::Needs>(e, needs);
    r.emplace<sim::Idle>(e);
    r.emplace<sim::PathFollow>(e, sim::PathFollow{ std::move(points), 0.f });
    r.emplace<sim::Goal>(e, sim::Goal{ 0, world::PoiCategory::Restaurant, need });
    r.emplace<sim::OpenTrip>(e, sim::OpenTrip{ 0.0, 0.f, 0.f, "restaurant" });
    return e;
}

} // namespace

TEST_CASE("Movement/advance integrates distance per segment")
{
    const std::vector<IVec2> pts = { { 0, 0 }, { 1, 1 }, { 2, 1 } };

    const auto half = sim::AdvanceAlongPath(pts, 0.f, 0.5f);
    CHECK(half.progress == doctest::Approx(0.5f));
    CHECK(half.distance == doctest::Approx(std::sqrt(2.0f) * 0.5f));
    CHECK_FALSE(half.arrived);

    const auto across = sim::AdvanceAlongPath(pts, 0.5f, 1.0f);
    CHECK(across.progress == doctest::Approx(1.5f));
    CHECK(across.distance == doctest::Approx(std::sqrt(2.0f) * 0.5f + 0.5f));

    const auto overshoot = sim::AdvanceAlongPath(pts, 1.5f, 10.f);
    CHECK(overshoot.progress == doctest::Approx(2.0f));
    CHECK(overshoot.distance == doctest::Approx(0.5f));
    CHECK(overshoot.arrived);
}

TEST_CASE("Movement/single point path arrives immediately")
{
    const auto adv = sim::AdvanceAlongPath({ { 3, 3 } }, 0.f, 0.1f);
    CHECK(adv.arrived);
    CHECK(adv.distance == 0.f);
}

TEST_CASE("Movement/position sits on cell centres")
{
    const std::vector<IVec2> pts = { { 2, 2 }, { 3, 2 } };
    const auto start = sim::SampleOnPath(pts, 0.f, 1.0f);
    CHECK(start.x == doctest::Approx(2.5f));
    CHECK(start.y == doctest::Approx(2.5f));
    CHECK(start.heading == doctest::Approx(0.0f));

    const auto mid = sim::SampleOnPath(pts, 0.5f, 1.0f);
    CHECK(mid.x == doctest::Approx(3.0f));

    const auto end = sim::SampleOnPath(pts, 1.0f, 1.0f);
    CHECK(end.x == doctest::Approx(3.5f));
}

TEST_CASE("Movement/arrival closes the trip and satisfies the goal need")
{
    entt::registry r;
    const auto e = MakeWalker(r, 7, { { 5, 5 }, { 5, 6 } }, 1.0f);

    sim::MovementParams p;
    auto first = sim::UpdateMovement(r, 0.5f, 0.5, p);
    CHECK(first.trips.empty());
    CHECK(first.moved == 1u);
    CHECK(r.all_of<sim::PathFollow, sim::Goal, sim::OpenTrip>(e));
    CHECK(r.get<sim::PathFollow>(e).progress == doctest::Approx(0.5f));

    auto second = sim::UpdateMovement(r, 0.5f, 1.0, p);
    REQUIRE(second.trips.size() == 1u);
    const sim::TripSample& t = second.trips.front();
    CHECK(t.agent == 7u);
    CHECK(t.category == "restaurant");
    CHECK(t.durationSeconds == doctest::Approx(1.0f));
    CHECK(t.distanceCells == doctest::Approx(1.0f));
    CHECK(t.distanceMeters == doctest::Approx(1.5f));
    CHECK(t.endedAt == doctest::Approx(1.0));

    CHECK_FALSE(r.any_of<sim::PathFollow, sim::Goal, sim::OpenTrip>(e));
    CHECK(sim::at(r.get<sim::Needs>(e).values, sim::Need::Hunger) == doctest::Approx(0.5f));
    CHECK(r.get<sim::Idle>(e).seconds == 0.f);

    const auto& pos = r.get<sim::Position>(e);
    CHECK(pos.x == doctest::Approx(5.5f));
    CHECK(pos.y == doctest::Approx(6.5f));
}

TEST_CASE("Movement/goal without a need leaves needs untouched")
{
    entt::registry r;
    const auto e = MakeWalker(r, 1, { { 0, 0 }, { 1, 0 } }, 4.0f, std::nullopt);
    const auto before = r.get<sim::Needs>(e).values;

    sim::UpdateMovement(r, 0.5f, 0.5, sim::MovementParams{});
    CHECK(r.get<sim::Needs>(e).values == before);
    CHECK_FALSE(r.all_of<sim::PathFollow>(e));
}

TEST_CASE("Movement/progress never passes the last waypoint")
{
    entt::registry r;
    const auto e = MakeWalker(r, 1, { { 0, 0 }, { 1, 0 }, { 2, 0 }, { 3, 0 } }, 1.3f);
    sim::MovementParams p;
    p.speedMultiplier = 2.0f;

    for (int i = 0; i < 20 && r.all_of<sim::PathFollow>(e); ++i) {
        const auto& f = r.get<sim::PathFollow>(e);
        CHECK(f.progress <= 3.0f);
        sim::UpdateMovement(r, 0.1f, 0.1 * (i + 1), p);
    }
    CHECK_FALSE(r.all_of<sim::PathFollow>(e));
}

TEST_CASE("Movement/idle agents are replanned in id order")
{
    entt::registry r;
    for (sim::AgentId id : { 5u, 2u, 9u }) {
        const auto e = r.create();
        r.emplace<sim::AgentInfo>(e, sim::AgentInfo{ id, sim::Role::Worker, false, 1.0f });
        r.emplace<sim::Position>(e);
        r.emplace<sim::Idle>(e);
    }

    sim::MovementParams p;
    p.idleReplanSeconds = 1.2f;
    CHECK(sim::UpdateMovement(r, 0.5f, 0.5, p).replan.empty());
    CHECK(sim::UpdateMovement(r, 0.5f, 1.0, p).replan.empty());

    const auto res = sim::UpdateMovement(r, 0.5f, 1.5, p);
    REQUIRE(res.replan.size() == 3u);
    CHECK(r.get<sim::AgentInfo>(res.replan[0]).id == 2u);
    CHECK(r.get<sim::AgentInfo>(res.replan[1]).id == 5u);
    CHECK(r.get<sim::AgentInfo>(res.replan[2]).id == 9u);
    for (auto e : res.replan)
        CHECK(r.get<sim::Idle>(e).seconds == 0.f);
}

TEST_CASE("Movement/no idle replan while a path request is outstanding")
{
    entt::registry r;
    const auto e = r.create();
    r.emplace<sim::AgentInfo>(e, sim::AgentInfo{ 1, sim::Role::Worker, false, 1.0f });
    r.emplace<sim::Position>(e);
    r.emplace<sim::Idle>(e);
    r.emplace<sim::PathTicket>(e, sim::PathTicket{ 1, true });

    sim::MovementParams p;
    p.idleReplanSeconds = 0.5f;
    for (int i = 0; i < 100; ++i)
        CHECK(sim::UpdateMovement(r, 0.1f, 0.1 * (i + 1), p).replan.empty());
    CHECK(r.get<sim::Idle>(e).seconds == 0.f);

    r.get<sim::PathTicket>(e).pending = false;
    std::size_t replans = 0;
    for (int i = 0; i < 7; ++i)
        replans += sim::UpdateMovement(r, 0.1f, 10.0 + 0.1 * i, p).replan.size();
    CHECK(replans == 1u);
}

TEST_CASE("TripStats/aggregates")
{
    sim::TripStats stats;
    CHECK(stats.Count() == 0u);
    CHECK(stats.MeanDurationSeconds() == 0.0);

    sim::TripSample a;
    a.category = "cafe";
    a.durationSeconds = 10.f;
    a.distanceMeters = 30.f;
    sim::TripSample b = a;
    b.category = "grocery";
    b.durationSeconds = 20.f;
    b.distanceMeters = 60.f;

    stats.Add(std::vector<sim::TripSample>{ a, b, a });
    CHECK(stats.Count() == 3u);
    CHECK(stats.MeanDurationSeconds() == doctest::Approx(40.0 / 3.0));
    CHECK(stats.MeanDistanceMeters() == doctest::Approx(40.0));
    CHECK(stats.ByCategory().at("cafe") == 2u);
    CHECK(stats.ByCategory().at("grocery") == 1u);
}

TEST_CASE("TripStats/keeps only the most recent samples")
{
    sim::TripStats stats;
    for (sim::AgentId id = 1; id <= 40; ++id) {
        sim::TripSample t;
        t.agent = id;
        t.category = "cafe";
        stats.Add(t);
    }
    CHECK(stats.Count() == 40u);
    REQUIRE(stats.Recent().size() == sim::TripStats::kRecentCapacity);
    CHECK(stats.Recent().front().agent == 9u);
    CHECK(stats.Recent().back().agent == 40u);
}
