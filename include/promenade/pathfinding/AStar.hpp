#pragma once
#include "GridMap.hpp"
#include "Heuristic.hpp"
#include "Path.hpp"
#include <queue>
#include <vector>

namespace promenade::pf {

struct AStarConfig {
    bool allow_diagonals = true;
    bool cut_corners     = true;  // diagonal moves past a blocked orthogonal neighbour
};

// Grid A*. Not thread-safe per instance (scratch buffers are reused); give
// each worker its own AStar over a shared immutable GridMap.
class AStar {
public:
    explicit AStar(const GridMap& map, AStarConfig cfg = {}) : _m(map), _cfg(cfg) {}

    PathOutcome find_path(IVec2 start, IVec2 goal) {
        const int w = _m.width(), h = _m.height();
        if (!_m.bounds().contains(start) || !_m.bounds().contains(goal))
            return PathOutcome::failure(PathStatus::OutOfBounds);
        if (!_m.passable(start)) return PathOutcome::failure(PathStatus::StartBlocked);
        if (!_m.passable(goal))  return PathOutcome::failure(PathStatus::GoalBlocked);

        const NodeId sid = to_id(start.x, start.y, w);
        const NodeId gid = to_id(goal.x,  goal.y,  w);

        _cost.assign(static_cast<size_t>(w) * h, StepCost{});
        _state.assign(static_cast<size_t>(w) * h, 0); // 0=unseen,1=open,2=closed

        // Equal f: earlier insertion wins, so results are reproducible run to run.
        struct QN {
            float f; u32 seq; NodeId id;
            bool operator<(const QN& o) const { return f > o.f || (f == o.f && seq > o.seq); }
        };
        std::priority_queue<QN> open;
        u32 seq = 0;

        _cost[sid].g = 0.0f;
        _cost[sid].f = octile(sid, gid, w);
        _cost[sid].parent = kInvalid;
        open.push({ _cost[sid].f, seq++, sid });
        _state[sid] = 1;

        constexpr int DIRS = 8;
        static const int dx[DIRS] = { 1,-1,0,0,  1, 1,-1,-1 };
        static const int dy[DIRS] = { 0,0,1,-1,  1,-1, 1,-1  };

        while (!open.empty()) {
            const auto [f, s, cur] = open.top(); open.pop();
            (void)s;
            if (_state[cur] == 2) continue; // skip stale
            if (f > _cost[cur].f) continue;
            _state[cur] = 2;
            if (cur == gid) return { PathStatus::Found, reconstruct(gid, sid, w, _cost) };

            const auto C = from_id(cur, w);

            for (int dir = 0; dir < DIRS; ++dir) {
                if (!_cfg.allow_diagonals && dir >= 4) break; // limit to 4-dir
                const int nx = C.x + dx[dir], ny = C.y + dy[dir];
                if (!_m.can_step(C.x, C.y, dx[dir], dy[dir], _cfg.cut_corners)) continue;

                const NodeId nid = to_id(nx, ny, w);
                if (_state[nid] == 2) continue;

                const float g_new = _cost[cur].g + _m.step_cost(C.x, C.y, dx[dir], dy[dir]);

                if (_state[nid] != 1 || g_new < _cost[nid].g) {
                    _cost[nid].g = g_new;
                    _cost[nid].f = g_new + octile(nid, gid, w);
                    _cost[nid].parent = cur;
                    open.push({ _cost[nid].f, seq++, nid });
                    _state[nid] = 1;
                }
            }
        }
        return PathOutcome::failure(PathStatus::NoRoute);
    }

private:
    const GridMap& _m;
    AStarConfig _cfg;
    std::vector<StepCost> _cost;
    std::vector<u8> _state;
};

// Sum of step costs along a path, using the same cost model as the search.
inline float path_cost(const GridMap& m, const Path& p) {
    float total = 0.0f;
    for (size_t i = 1; i < p.points.size(); ++i) {
        const IVec2 a = p.points[i - 1], b = p.points[i];
        total += m.step_cost(a.x, a.y, b.x - a.x, b.y - a.y);
    }
    return total;
}

} // namespace promenade::pf
