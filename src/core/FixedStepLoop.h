#pragma once
#include <cstdint>
#include <functional>

namespace promenade::core {

struct FixedStepConfig {
    double fixed_dt = 1.0 / 30.0;   // simulation step (seconds)
    double max_frame_dt = 0.25;     // clamp large wall-clock deltas (seconds)
    int    max_steps_per_frame = 8; // back-pressure guard
    bool   realtime = false;        // false: step as fast as possible (headless batch runs)
};

// Drives the cooperative simulation tick. In realtime mode wall-clock time is
// accumulated and consumed in fixed steps; otherwise steps run back to back.
class FixedStepLoop {
public:
    std::function<void(double)>  UpdateFixed;   // simulate one tick of length fixed_dt
    std::function<bool()>        IsRunning;     // check quit flag

    void Run(const FixedStepConfig& cfg);

    std::uint64_t StepId() const { return step_id_; }
    double FixedDt() const { return fixed_dt_; }

private:
    double accumulator_ = 0.0;
    double fixed_dt_ = 1.0 / 30.0;
    std::uint64_t step_id_ = 0;
};

} // namespace promenade::core
