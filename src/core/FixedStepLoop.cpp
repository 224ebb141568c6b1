#include "core/FixedStepLoop.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <thread>

namespace promenade::core {

void FixedStepLoop::Run(const FixedStepConfig& cfg) {
    fixed_dt_ = cfg.fixed_dt;
    accumulator_ = 0.0;

    if (!cfg.realtime) {
        while (IsRunning && IsRunning()) {
            if (UpdateFixed) UpdateFixed(fixed_dt_);
            ++step_id_;
        }
        return;
    }

    using clock = std::chrono::steady_clock;
    auto last = clock::now();

    while (IsRunning && IsRunning()) {
        const auto now = clock::now();
        double frame_dt = std::chrono::duration<double>(now - last).count();
        last = now;

        // Clamp spikes (debugger pauses, suspend/resume).
        frame_dt = std::clamp(frame_dt, 0.0, cfg.max_frame_dt);
        accumulator_ += frame_dt;

        int steps_this_frame = 0;
        while (accumulator_ >= fixed_dt_ && steps_this_frame < cfg.max_steps_per_frame) {
            if (UpdateFixed) UpdateFixed(fixed_dt_);
            accumulator_ -= fixed_dt_;
            ++step_id_;
            ++steps_this_frame;
        }

        // Still behind after the step cap: drop the excess instead of spiralling.
        if (accumulator_ > fixed_dt_ * cfg.max_steps_per_frame) {
            accumulator_ = std::fmod(accumulator_, fixed_dt_);
        }

        if (steps_this_frame == 0) {
            std::this_thread::sleep_for(std::chrono::duration<double>(fixed_dt_ - accumulator_));
        }
    }
}

} // namespace promenade::core
