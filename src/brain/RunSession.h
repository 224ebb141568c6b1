// src/brain/RunSession.h
#pragma once
#include <atomic>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <taskflow/taskflow.hpp>

#include "brain/IBrainClient.h"
#include "sim/MovementSystem.h"

namespace promenade::brain {

MetricSample ToMetricSample(const sim::TripSample& trip);

// Run lifecycle against the reasoning service: start_run + register_agents,
// trip metrics buffered and flushed periodically in the background, then a
// final flush and end_run. Failures are logged and leave the session inactive;
// they never reach the caller.
class RunSession {
public:
    explicit RunSession(IBrainClient& client, float flushSeconds = 8.0f);
    ~RunSession();

    RunSession(const RunSession&) = delete;
    RunSession& operator=(const RunSession&) = delete;

    // Blocking. Returns false (and stays inactive) if the service is unreachable.
    bool Start(const RunInfo& run, const std::vector<AgentSnapshot>& eligible);

    [[nodiscard]] bool active() const noexcept { return runId_.has_value(); }
    [[nodiscard]] const std::string& run_id() const { return runId_.value(); }

    void Record(const sim::TripSample& trip);
    void Record(const std::vector<sim::TripSample>& trips);

    // Sends buffered samples once `flushSeconds` have passed since the last send.
    void Tick(double now);

    // Final flush and end_run. Safe to call more than once.
    void End();

    [[nodiscard]] std::size_t Buffered() const noexcept { return buffer_.size(); }
    [[nodiscard]] std::size_t SamplesSent() const noexcept { return sent_.load(); }
    [[nodiscard]] std::size_t FlushFailures() const noexcept { return failures_.load(); }

private:
    void FlushAsync();

    IBrainClient& client_;
    float flushSeconds_;
    std::optional<std::string> runId_;
    std::vector<MetricSample> buffer_;
    double lastFlush_ = 0.0;

    std::atomic<std::size_t> sent_{ 0 };
    std::atomic<std::size_t> failures_{ 0 };

    tf::Executor io_{ 1 };
};

} // namespace promenade::brain
