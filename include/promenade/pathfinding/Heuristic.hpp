#pragma once
#include "GridTypes.hpp"
#include <cmath>

namespace promenade::pf {

// Octile distance: admissible/consistent for 8-dir grids with costs 1, √2
inline float octile(int dx, int dy, float D=1.0f, float D2=1.41421356237f) {
    dx = std::abs(dx); dy = std::abs(dy);
    const int m = (dx < dy ? dx : dy);
    const int M = (dx < dy ? dy : dx);
    return D * float(M - m) + D2 * float(m);
}

inline float octile(IVec2 a, IVec2 b) { return octile(b.x - a.x, b.y - a.y); }

inline float octile(NodeId a, NodeId b, int w) {
    return octile(from_id(a, w), from_id(b, w));
}

inline int manhattan(IVec2 a, IVec2 b) {
    return std::abs(a.x - b.x) + std::abs(a.y - b.y);
}

} // namespace promenade::pf
