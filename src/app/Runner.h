#pragma once

#include "app/CommandLineArgs.h"
#include "core/Config.h"

#include <string>

namespace promenade::app {

struct RunOptions {
    core::SimConfig config;
    std::string gridPath;
    std::string poisPath;
    std::string scenarioId = "baseline";
    double duration = 120.0;
    double dt = 1.0 / 30.0;
    bool realtime = false;
};

// Config file first (explicit --config, else ./promenade.ini when present),
// then command-line overrides. Throws std::runtime_error for a missing
// --grid/--pois or an unreadable explicit config file.
RunOptions ResolveRunOptions(const CommandLineArgs& args);

// Loads assets, runs the fixed-step loop for `duration` simulated seconds and
// logs a summary. Returns the process exit code.
int Run(const RunOptions& opts);

} // namespace promenade::app
