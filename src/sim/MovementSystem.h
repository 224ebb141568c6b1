// src/sim/MovementSystem.h
#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include <entt/entt.hpp>

#include "sim/Components.h"

namespace promenade::sim {

struct MovementParams {
    float speedMultiplier   = 1.0f;
    float idleReplanSeconds = 1.2f;
    float satisfyDecrement  = 0.4f;
    float cellMeters        = 1.5f;
};

// Emitted once per completed trip; never modified afterwards.
struct TripSample {
    AgentId     agent = 0;
    Role        role = Role::Student;
    std::string category;
    float       durationSeconds = 0.f;
    float       distanceCells = 0.f;
    float       distanceMeters = 0.f;
    double      endedAt = 0.0;
};

struct PathAdvance {
    float progress = 0.f;   // new cursor, clamped to points.size() - 1
    float distance = 0.f;   // cells covered, integrated per segment
    bool  arrived = false;
};

// Moves a cursor `step` waypoints forward along `points` (size >= 1).
PathAdvance AdvanceAlongPath(const std::vector<pf::IVec2>& points, float progress, float step);

// Cell-centre interpolation at a fractional waypoint index.
Position SampleOnPath(const std::vector<pf::IVec2>& points, float progress, float fallbackHeading);

struct MovementResult {
    std::vector<TripSample>   trips;
    std::vector<entt::entity> replan;   // idle long enough to pick a new destination
    std::size_t               moved = 0;
};

// One tick for every agent: walkers advance (closing trips and satisfying the
// goal need on arrival), idlers accrue idle time. Arrival removes PathFollow,
// Goal and OpenTrip together.
MovementResult UpdateMovement(entt::registry& r, float dt, double now, const MovementParams& p);

} // namespace promenade::sim
