// src/sim/Components.h
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <promenade/pathfinding/GridTypes.hpp>

#include "sim/Needs.h"
#include "world/Poi.h"

#include <entt/entt.hpp> // required

namespace promenade::sim {

using AgentId = std::uint32_t;

struct AgentInfo {
    AgentId id = 0;
    Role    role = Role::Student;
    bool    eligible = false;   // enrolled with the reasoning service
    float   speed = 1.0f;       // cells per second
};

// Continuous position in cell units; heading in radians.
struct Position {
    float x = 0.f, y = 0.f;
    float heading = 0.f;
};

struct Needs {
    NeedVector values{};
    float sinceEval = 0.f;      // seconds since the last decay evaluation
};

// Present only while the agent walks. progress is a fractional waypoint index
// in [0, points.size() - 1].
struct PathFollow {
    std::vector<pf::IVec2> points;
    float progress = 0.f;
};

// Bumped on every new path request; results carrying an older value are dropped.
// `pending` is set while the current request has not been answered; idle time
// does not accrue meanwhile.
struct PathTicket {
    std::uint64_t version = 0;
    bool          pending = false;
};

struct Goal {
    world::PoiId       poi = 0;
    world::PoiCategory category = world::PoiCategory::Other;
    std::optional<Need> need;   // decremented on arrival when set
};

struct OpenTrip {
    double      startedAt = 0.0;   // simulation clock
    float       elapsed = 0.f;
    float       distance = 0.f;    // cells
    std::string category;
};

struct Idle {
    float seconds = 0.f;
};

// Display only.
struct Thoughts {
    std::string lastThought;
    std::string lastIntent;
};

} // namespace promenade::sim
