// src/sim/MeetingDetector.cpp
#include "sim/MeetingDetector.h"

#include <algorithm>

namespace promenade::sim {

MeetingDetector::MeetingDetector(float distance, float seconds, std::size_t maxAgents)
    : distance_(distance), seconds_(seconds), maxAgents_(maxAgents)
{
}

std::uint64_t MeetingDetector::Key(AgentId a, AgentId b) noexcept
{
    const AgentId lo = std::min(a, b), hi = std::max(a, b);
    return (static_cast<std::uint64_t>(lo) << 32) | hi;
}

std::vector<MeetingEvent> MeetingDetector::Update(const std::vector<MeetingSample>& samples, float dt)
{
    std::vector<MeetingEvent> events;
    const std::size_t n = std::min(samples.size(), maxAgents_);
    const float d2max = distance_ * distance_;

    // Pairs absent from `next` (apart, or no longer sampled) lose their clock.
    std::unordered_map<std::uint64_t, float> next;
    for (std::size_t i = 0; i < n; ++i) {
        for (std::size_t j = i + 1; j < n; ++j) {
            const MeetingSample& a = samples[i];
            const MeetingSample& b = samples[j];
            const float dx = a.x - b.x, dy = a.y - b.y;
            if (dx * dx + dy * dy > d2max)
                continue;

            const std::uint64_t key = Key(a.id, b.id);
            auto it = clock_.find(key);
            float t = (it != clock_.end() ? it->second : 0.f) + dt;
            if (t >= seconds_) {
                events.push_back({ std::min(a.id, b.id), std::max(a.id, b.id) });
                t = 0.f;
            }
            next[key] = t;
        }
    }
    clock_.swap(next);
    return events;
}

float MeetingDetector::DwellOf(AgentId a, AgentId b) const
{
    auto it = clock_.find(Key(a, b));
    return it != clock_.end() ? it->second : 0.f;
}

} // namespace promenade::sim
