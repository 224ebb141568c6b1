#pragma once
#include "GridTypes.hpp"
#include <algorithm>
#include <string_view>
#include <vector>

namespace promenade::pf {

struct Path {
    std::vector<IVec2> points;
    [[nodiscard]] bool empty() const noexcept { return points.empty(); }
    [[nodiscard]] size_t length() const noexcept { return points.size(); }
};

enum class PathStatus : u8 {
    Found,
    OutOfBounds,
    StartBlocked,
    GoalBlocked,
    NoRoute,
};

inline std::string_view to_string(PathStatus s) {
    switch (s) {
    case PathStatus::Found:        return "found";
    case PathStatus::OutOfBounds:  return "out-of-bounds";
    case PathStatus::StartBlocked: return "start-blocked";
    case PathStatus::GoalBlocked:  return "goal-blocked";
    case PathStatus::NoRoute:      return "no-route";
    }
    return "unknown";
}

// Either a complete path from start to goal, or a failure reason with no points.
struct PathOutcome {
    PathStatus status = PathStatus::NoRoute;
    Path path;

    [[nodiscard]] bool ok() const noexcept { return status == PathStatus::Found; }

    static PathOutcome failure(PathStatus s) { return { s, {} }; }
};

inline Path reconstruct(NodeId goal, NodeId start, int w, const std::vector<StepCost>& cost) {
    Path out;
    if (goal == kInvalid) return out;
    NodeId cur = goal;
    while (cur != kInvalid) {
        auto p = from_id(cur, w);
        out.points.push_back(p);
        if (cur == start) break;
        cur = cost[cur].parent;
    }
    std::reverse(out.points.begin(), out.points.end());
    return out;
}

} // namespace promenade::pf
