#pragma once
#include "GridTypes.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace promenade::pf {

// Walkable bitmap + integer cost map, 8-direction movement.
// Each cell has: 0 = blocked, 1 = free; cost is an integer weight where
// anything below 1 counts as 1.
class GridMap {
public:
    GridMap() = default;
    GridMap(int w, int h)
        : _b{w, h}, _walkable(static_cast<size_t>(w) * h, 1), _cost(static_cast<size_t>(w) * h, 1) {}

    // Takes ownership of row-major arrays of size w*h.
    GridMap(int w, int h, std::vector<u8> walkable, std::vector<u8> cost)
        : _b{w, h}, _walkable(std::move(walkable)), _cost(std::move(cost))
    {
        const size_t n = static_cast<size_t>(w) * static_cast<size_t>(h);
        if (w <= 0 || h <= 0)
            throw std::invalid_argument("GridMap: dimensions must be positive");
        if (_walkable.size() != n)
            throw std::invalid_argument("GridMap: walkable has " + std::to_string(_walkable.size()) +
                                        " cells, expected " + std::to_string(n));
        if (_cost.empty())
            _cost.assign(n, 1);
        else if (_cost.size() != n)
            throw std::invalid_argument("GridMap: cost has " + std::to_string(_cost.size()) +
                                        " cells, expected " + std::to_string(n));
    }

    [[nodiscard]] const Bounds& bounds() const noexcept { return _b; }
    [[nodiscard]] int width()  const noexcept { return _b.w; }
    [[nodiscard]] int height() const noexcept { return _b.h; }

    // 0 = blocked, 1 = walkable
    void set_walkable(int x, int y, u8 v) { _walkable[to_id(x,y,_b.w)] = v; }
    [[nodiscard]] u8  walkable(int x, int y) const { return _walkable[to_id(x,y,_b.w)]; }

    void set_tile_cost(int x, int y, u8 c) { _cost[to_id(x,y,_b.w)] = c; }
    [[nodiscard]] u8 tile_cost(int x, int y) const { return _cost[to_id(x,y,_b.w)]; }

    [[nodiscard]] const std::vector<u8>& walkable_cells() const noexcept { return _walkable; }
    [[nodiscard]] const std::vector<u8>& cost_cells() const noexcept { return _cost; }

    [[nodiscard]] bool passable(int x, int y) const {
        return _b.contains(x,y) && _walkable[to_id(x,y,_b.w)] != 0;
    }
    [[nodiscard]] bool passable(IVec2 c) const { return passable(c.x, c.y); }

    // Diagonal steps may cut corners unless the caller asks otherwise.
    [[nodiscard]] bool can_step(int x, int y, int dx, int dy, bool cut_corners = true) const {
        const int nx = x + dx, ny = y + dy;
        if (!passable(nx, ny)) return false;
        if (!cut_corners && dx != 0 && dy != 0) {
            if (!passable(x + dx, y) || !passable(x, y + dy)) return false;
        }
        return true;
    }

    // Step length (cardinal=1, diagonal=√2) times max(1, cost of the destination cell).
    [[nodiscard]] float step_cost(int x, int y, int dx, int dy) const {
        const float base = (dx == 0 || dy == 0) ? 1.0f : 1.41421356237f;
        const u8 c = tile_cost(x+dx, y+dy);
        return base * static_cast<float>(c < 1 ? 1 : c);
    }

private:
    Bounds _b{};
    std::vector<u8> _walkable;
    std::vector<u8> _cost;
};

} // namespace promenade::pf
