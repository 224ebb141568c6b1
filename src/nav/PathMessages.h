#pragma once
#include <promenade/pathfinding/AStar.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace promenade::nav {

using RequestId = std::uint64_t;

// Owns the pathfinder's private copy of the grid. Compute() is const and
// builds its own search scratch, so one worker may serve several threads.
class PathWorker {
public:
    PathWorker() = default;
    explicit PathWorker(pf::GridMap grid) : grid_(std::move(grid)) {}

    [[nodiscard]] bool ready() const noexcept { return grid_.has_value(); }
    [[nodiscard]] const pf::GridMap& grid() const { return grid_.value(); }

    // Failure is reported as PathStatus; never a partial path.
    [[nodiscard]] pf::PathOutcome Compute(pf::IVec2 start, pf::IVec2 goal) const;

    // Message endpoint:
    //   {"type":"init",H,W,walkable,cost}       -> {"type":"ready"}
    //   {"type":"path",id,start:[iy,ix],goal}   -> {"type":"path",id,ok,path?}
    // Anything else yields {"type":"error",message}.
    nlohmann::json HandleMessage(const nlohmann::json& msg);

private:
    std::optional<pf::GridMap> grid_;
};

// Decoded {"type":"path"} response.
struct PathResponse {
    RequestId id = 0;
    bool ok = false;
    std::vector<pf::IVec2> points;
};

nlohmann::json EncodeInit(const pf::GridMap& grid);
nlohmann::json EncodePathRequest(RequestId id, pf::IVec2 start, pf::IVec2 goal);
nlohmann::json EncodePathResponse(RequestId id, const pf::PathOutcome& outcome);

// Throws std::runtime_error when the message is not a path response.
PathResponse DecodePathResponse(const nlohmann::json& msg);

} // namespace promenade::nav
