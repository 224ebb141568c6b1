// src/sim/MovementSystem.cpp
#include "sim/MovementSystem.h"
#include "sim/NeedsSystem.h"

#include <algorithm>
#include <cmath>

namespace promenade::sim {

namespace {

float SegmentLength(pf::IVec2 a, pf::IVec2 b)
{
    const float dx = static_cast<float>(b.x - a.x);
    const float dy = static_cast<float>(b.y - a.y);
    return std::sqrt(dx * dx + dy * dy);
}

} // namespace

PathAdvance AdvanceAlongPath(const std::vector<pf::IVec2>& points, float progress, float step)
{
    PathAdvance out;
    if (points.empty())
        return out;

    const float last = static_cast<float>(points.size() - 1);
    const float from = std::clamp(progress, 0.0f, last);
    const float to = std::clamp(from + std::max(0.0f, step), 0.0f, last);

    // Sum segment length * fraction of the segment covered between `from` and `to`.
    float cursor = from;
    while (cursor < to) {
        const std::size_t seg = static_cast<std::size_t>(std::floor(cursor));
        if (seg + 1 >= points.size()) break;
        const float segEnd = std::min(static_cast<float>(seg + 1), to);
        out.distance += (segEnd - cursor) * SegmentLength(points[seg], points[seg + 1]);
        cursor = segEnd;
    }

    out.progress = to;
    out.arrived = to >= last;
    return out;
}

Position SampleOnPath(const std::vector<pf::IVec2>& points, float progress, float fallbackHeading)
{
    Position pos;
    pos.heading = fallbackHeading;
    if (points.empty())
        return pos;

    const std::size_t last = points.size() - 1;
    const float t = std::clamp(progress, 0.0f, static_cast<float>(last));
    std::size_t i = static_cast<std::size_t>(std::floor(t));
    if (i >= last && last > 0) i = last - 1;

    const pf::IVec2 a = points[i];
    const pf::IVec2 b = points[std::min(i + 1, last)];
    const float frac = t - static_cast<float>(i);

    pos.x = static_cast<float>(a.x) + 0.5f + (static_cast<float>(b.x - a.x)) * frac;
    pos.y = static_cast<float>(a.y) + 0.5f + (static_cast<float>(b.y - a.y)) * frac;
    if (a != b)
        pos.heading = std::atan2(static_cast<float>(b.y - a.y), static_cast<float>(b.x - a.x));
    return pos;
}

MovementResult UpdateMovement(entt::registry& r, float dt, double now, const MovementParams& p)
{
    MovementResult res;
    std::vector<entt::entity> arrived;

    for (auto [e, info, pos, follow] : r.view<AgentInfo, Position, PathFollow>().each()) {
        const float step = info.speed * p.speedMultiplier * dt;
        const PathAdvance adv = AdvanceAlongPath(follow.points, follow.progress, step);
        follow.progress = adv.progress;
        pos = SampleOnPath(follow.points, follow.progress, pos.heading);
        ++res.moved;

        if (auto* trip = r.try_get<OpenTrip>(e)) {
            trip->elapsed += dt;
            trip->distance += adv.distance;
        }
        if (adv.arrived)
            arrived.push_back(e);
    }

    for (entt::entity e : arrived) {
        const auto& info = r.get<AgentInfo>(e);

        if (const auto* goal = r.try_get<Goal>(e); goal && goal->need) {
            if (auto* needs = r.try_get<Needs>(e))
                SatisfyNeed(needs->values, *goal->need, p.satisfyDecrement);
        }

        if (const auto* trip = r.try_get<OpenTrip>(e)) {
            TripSample s;
            s.agent = info.id;
            s.role = info.role;
            s.category = trip->category;
            s.durationSeconds = trip->elapsed;
            s.distanceCells = trip->distance;
            s.distanceMeters = trip->distance * p.cellMeters;
            s.endedAt = now;
            res.trips.push_back(std::move(s));
        }

        r.remove<PathFollow, Goal, OpenTrip>(e);
        r.get_or_emplace<Idle>(e).seconds = 0.f;
    }

    for (auto [e, idle] : r.view<Idle>(entt::exclude<PathFollow>).each()) {
        if (std::find(arrived.begin(), arrived.end(), e) != arrived.end())
            continue;
        if (const auto* ticket = r.try_get<PathTicket>(e); ticket && ticket->pending)
            continue;
        idle.seconds += dt;
        if (idle.seconds >= p.idleReplanSeconds) {
            idle.seconds = 0.f;
            res.replan.push_back(e);
        }
    }

    // Stable order for the seeded replan draws.
    std::sort(res.replan.begin(), res.replan.end(), [&r](entt::entity a, entt::entity b) {
        return r.get<AgentInfo>(a).id < r.get<AgentInfo>(b).id;
    });
    return res;
}

} // namespace promenade::sim
