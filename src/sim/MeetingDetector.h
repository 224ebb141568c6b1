// src/sim/MeetingDetector.h
#pragma once
#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

#include "sim/Components.h"

namespace promenade::sim {

struct MeetingSample {
    AgentId id = 0;
    float x = 0.f, y = 0.f;
};

// Unordered pair, stored with a < b.
struct MeetingEvent {
    AgentId a = 0, b = 0;
    bool operator==(const MeetingEvent&) const = default;
};

// Pairwise dwell clock. A pair accumulates time while within `distance` cells;
// separating drops its clock. Reaching `seconds` emits one event and restarts
// the clock at zero. Only the first `maxAgents` samples take part.
class MeetingDetector {
public:
    MeetingDetector(float distance = 6.0f, float seconds = 0.5f, std::size_t maxAgents = 64);

    std::vector<MeetingEvent> Update(const std::vector<MeetingSample>& samples, float dt);

    [[nodiscard]] float DwellOf(AgentId a, AgentId b) const;
    [[nodiscard]] std::size_t TrackedPairs() const noexcept { return clock_.size(); }
    void Reset() { clock_.clear(); }

private:
    static std::uint64_t Key(AgentId a, AgentId b) noexcept;

    float distance_;
    float seconds_;
    std::size_t maxAgents_;
    std::unordered_map<std::uint64_t, float> clock_;
};

} // namespace promenade::sim
