#include "nav/PathService.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace promenade::nav {

PathService::PathService(const pf::GridMap& grid, std::size_t workers)
    : worker_(std::make_shared<const PathWorker>(grid))
    , executor_(std::max<std::size_t>(1, workers))
{
    spdlog::debug("PathService: {}x{} grid, {} worker(s)", grid.width(), grid.height(), executor_.num_workers());
}

PathService::~PathService()
{
    executor_.wait_for_all();
}

RequestId PathService::Request(pf::IVec2 start, pf::IVec2 goal, PathCallback onDone)
{
    const RequestId id = nextId_++;
    pending_.emplace(id, std::move(onDone));

    executor_.silent_async([this, worker = worker_, id, start, goal] {
        pf::PathOutcome out = worker->Compute(start, goal);
        std::lock_guard<std::mutex> lock(doneMutex_);
        done_.emplace_back(id, std::move(out));
    });
    return id;
}

std::size_t PathService::Poll()
{
    std::vector<std::pair<RequestId, pf::PathOutcome>> ready;
    {
        std::lock_guard<std::mutex> lock(doneMutex_);
        ready.swap(done_);
    }

    std::size_t ran = 0;
    for (auto& [id, outcome] : ready) {
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            spdlog::warn("PathService: result for unknown request {}", id);
            continue;
        }
        PathCallback cb = std::move(it->second);
        pending_.erase(it);
        if (cb) {
            cb(outcome);
            ++ran;
        }
    }
    return ran;
}

void PathService::WaitIdle()
{
    executor_.wait_for_all();
}

} // namespace promenade::nav
