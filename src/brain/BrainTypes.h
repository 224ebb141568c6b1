// src/brain/BrainTypes.h
#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "sim/Needs.h"

namespace promenade::brain {

using AgentId = std::uint32_t;

// Outbound view of one agent. Wire id is "A<id>".
struct AgentSnapshot {
    AgentId         id = 0;
    sim::Role       role = sim::Role::Student;
    float           x = 0.f, y = 0.f;
    sim::NeedVector needs{};
};

struct Intent {
    std::string category;   // POI category name; may be one the run does not know
    std::string name;
};

struct Decision {
    AgentId     id = 0;
    std::string thought;
    Intent      intent;
};

struct ChatPair {
    AgentId a = 0, b = 0;
};

struct ChatLine {
    AgentId     a = 0, b = 0;
    std::string aLine, bLine;
};

// Per-request context forwarded verbatim to the service.
struct DecisionContext {
    std::string scenarioId;                   // omitted when "baseline" or empty
    std::map<std::string, float> biases;
    bool meeting = false;
};

struct RunInfo {
    std::string   hypothesisId = "base";
    std::uint64_t seed = 0;
    float         speed = 1.0f;
};

// One closed trip as reported to /metrics.
struct MetricSample {
    AgentId     agent = 0;
    sim::Role   role = sim::Role::Student;
    std::string category;
    long long   durationMs = 0;
    long long   distanceM = 0;
};

} // namespace promenade::brain
