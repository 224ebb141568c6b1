// src/sim/TripStats.h
#pragma once
#include <cstddef>
#include <deque>
#include <map>
#include <string>
#include <vector>

#include "sim/MovementSystem.h"

namespace promenade::sim {

// Running aggregates over every trip closed in a run, plus the last few
// samples.
class TripStats {
public:
    static constexpr std::size_t kRecentCapacity = 32;

    void Add(const TripSample& s);
    void Add(const std::vector<TripSample>& samples);

    [[nodiscard]] std::size_t Count() const noexcept { return count_; }
    [[nodiscard]] double MeanDurationSeconds() const noexcept;
    [[nodiscard]] double MeanDistanceMeters() const noexcept;
    [[nodiscard]] const std::map<std::string, std::size_t>& ByCategory() const noexcept { return byCategory_; }

    // Oldest first, at most kRecentCapacity entries.
    [[nodiscard]] const std::deque<TripSample>& Recent() const noexcept { return recent_; }

private:
    std::size_t count_ = 0;
    double totalDuration_ = 0.0;
    double totalMeters_ = 0.0;
    std::map<std::string, std::size_t> byCategory_;
    std::deque<TripSample> recent_;
};

} // namespace promenade::sim
