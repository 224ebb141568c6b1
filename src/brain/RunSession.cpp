// src/brain/RunSession.cpp
#include "brain/RunSession.h"
#include "brain/BrainError.h"

#include <spdlog/spdlog.h>

#include <cmath>

namespace promenade::brain {

MetricSample ToMetricSample(const sim::TripSample& trip)
{
    MetricSample s;
    s.agent = trip.agent;
    s.role = trip.role;
    s.category = trip.category;
    s.durationMs = std::llround(static_cast<double>(trip.durationSeconds) * 1000.0);
    s.distanceM = std::llround(static_cast<double>(trip.distanceMeters));
    return s;
}

RunSession::RunSession(IBrainClient& client, float flushSeconds)
    : client_(client), flushSeconds_(flushSeconds)
{
}

RunSession::~RunSession()
{
    io_.wait_for_all();
}

bool RunSession::Start(const RunInfo& run, const std::vector<AgentSnapshot>& eligible)
{
    try {
        std::string id = client_.StartRun(run);
        client_.RegisterAgents(id, eligible);
        spdlog::info("Run {} started (hypothesis '{}', seed {}, {} agents registered)",
                     id, run.hypothesisId, run.seed, eligible.size());
        runId_ = std::move(id);
        return true;
    } catch (const BrainError& e) {
        spdlog::warn("Reasoning service unavailable ({}): {}", to_string(e.kind()), e.what());
    } catch (const std::exception& e) {
        spdlog::warn("Reasoning service unavailable: {}", e.what());
    }
    runId_.reset();
    return false;
}

void RunSession::Record(const sim::TripSample& trip)
{
    if (active())
        buffer_.push_back(ToMetricSample(trip));
}

void RunSession::Record(const std::vector<sim::TripSample>& trips)
{
    for (const auto& t : trips) Record(t);
}

void RunSession::Tick(double now)
{
    if (!active() || now - lastFlush_ < flushSeconds_)
        return;
    lastFlush_ = now;
    FlushAsync();
}

void RunSession::FlushAsync()
{
    if (buffer_.empty())
        return;

    io_.silent_async([this, runId = *runId_, batch = std::move(buffer_)] {
        try {
            client_.SendMetrics(runId, batch);
            sent_ += batch.size();
        } catch (const std::exception& e) {
            ++failures_;
            spdlog::warn("Metrics flush of {} samples failed: {}", batch.size(), e.what());
        }
    });
    buffer_.clear();
}

void RunSession::End()
{
    if (!active())
        return;

    FlushAsync();
    io_.wait_for_all();

    const std::string id = *runId_;
    runId_.reset();
    try {
        client_.EndRun(id);
        spdlog::info("Run {} ended ({} metric samples sent)", id, sent_.load());
    } catch (const std::exception& e) {
        spdlog::warn("end_run for {} failed: {}", id, e.what());
    }
}

} // namespace promenade::brain
