#pragma once
#include "nav/PathMessages.h"

#include <taskflow/taskflow.hpp>

#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace promenade::nav {

using PathCallback = std::function<void(const pf::PathOutcome&)>;

// Asynchronous pathfinding. Searches run on a private Taskflow executor over
// a copy of the grid taken at construction; finished results wait in a queue
// until the owning thread calls Poll(), which is the only place callbacks run.
// There is no cancellation: callers drop stale results themselves.
class PathService {
public:
    explicit PathService(const pf::GridMap& grid, std::size_t workers = 1);
    ~PathService();

    PathService(const PathService&) = delete;
    PathService& operator=(const PathService&) = delete;

    // Ids are strictly increasing, starting at 1.
    RequestId Request(pf::IVec2 start, pf::IVec2 goal, PathCallback onDone);

    // Runs the callbacks of every finished search, in completion order.
    // Returns how many ran.
    std::size_t Poll();

    // Blocks until every submitted search has finished (callbacks still need Poll()).
    void WaitIdle();

    // Requests whose callback has not run yet.
    [[nodiscard]] std::size_t in_flight() const noexcept { return pending_.size(); }

    [[nodiscard]] const PathWorker& worker() const noexcept { return *worker_; }

private:
    std::shared_ptr<const PathWorker> worker_;
    RequestId nextId_ = 1;
    std::unordered_map<RequestId, PathCallback> pending_;

    std::mutex doneMutex_;
    std::vector<std::pair<RequestId, pf::PathOutcome>> done_;

    // Declared last so in-flight searches drain before the queue they push to goes away.
    tf::Executor executor_;
};

} // namespace promenade::nav
