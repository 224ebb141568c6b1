// src/sim/TripStats.cpp
#include "sim/TripStats.h"

namespace promenade::sim {

void TripStats::Add(const TripSample& s)
{
    ++count_;
    totalDuration_ += s.durationSeconds;
    totalMeters_ += s.distanceMeters;
    ++byCategory_[s.category];

    recent_.push_back(s);
    if (recent_.size() > kRecentCapacity)
        recent_.pop_front();
}

void TripStats::Add(const std::vector<TripSample>& samples)
{
    for (const TripSample& s : samples) Add(s);
}

double TripStats::MeanDurationSeconds() const noexcept
{
    return count_ ? totalDuration_ / static_cast<double>(count_) : 0.0;
}

double TripStats::MeanDistanceMeters() const noexcept
{
    return count_ ? totalMeters_ / static_cast<double>(count_) : 0.0;
}

} // namespace promenade::sim
