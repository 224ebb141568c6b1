#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

namespace promenade::core {

// Tunables for one simulation run. Defaults match the shipped promenade.ini.
struct SimConfig {
    std::uint64_t seed = 12345;

    // Population
    int   agents              = 50;
    float eligibleFraction    = 0.3f;   // share of agents enrolled with the reasoning service
    int   maxEligibleAgents   = 64;     // hard cap; meeting detection is O(n^2) over these
    float speedMultiplier     = 1.0f;

    // Needs
    float needEvalPeriod      = 2.0f;   // seconds between decay evaluations
    float needRateScale       = 1.0f;
    float activationThreshold = 0.3f;
    float satisfyDecrement    = 0.4f;

    // Movement
    float idleReplanSeconds   = 1.2f;
    float cellMeters          = 1.5f;
    int   pathWorkers         = 1;

    // Meetings
    float meetDistance        = 6.0f;   // cells
    float meetSeconds         = 0.5f;

    // Reasoning service
    bool        brainEnabled    = true;
    std::string brainUrl        = "http://127.0.0.1:9000";
    int         brainTimeoutMs  = 15000;
    int         batchSize       = 32;
    float       maxQps          = 4.0f;
    float       jitterMinSeconds = 3.0f;
    float       jitterMaxSeconds = 7.0f;
    float       metricsFlushSeconds = 8.0f;
};

// Tiny INI-style reader: key=value lines, '#'/';' comments. Unknown keys and
// unparseable values are ignored (the field keeps its current value).
// Returns false only when the file cannot be read.
bool LoadConfig(SimConfig& cfg, const std::filesystem::path& file);
bool SaveConfig(const SimConfig& cfg, const std::filesystem::path& file);

// Applies a single key=value pair; returns false for unknown keys or bad values.
bool ApplyConfigValue(SimConfig& cfg, std::string_view key, std::string_view value);

} // namespace promenade::core
