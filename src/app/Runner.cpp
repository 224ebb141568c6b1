#include "app/Runner.h"

#include "brain/HttpBrainClient.h"
#include "core/FixedStepLoop.h"
#include "sim/Simulation.h"
#include "world/NavGrid.h"
#include "world/ScenarioAssets.h"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <stdexcept>

namespace promenade::app {

RunOptions ResolveRunOptions(const CommandLineArgs& args)
{
    RunOptions o;

    if (args.configPath) {
        if (!core::LoadConfig(o.config, *args.configPath))
            throw std::runtime_error("Cannot read config " + *args.configPath);
    } else if (std::filesystem::exists("promenade.ini")) {
        core::LoadConfig(o.config, "promenade.ini");
    }

    if (!args.gridPath || !args.poisPath)
        throw std::runtime_error("--grid and --pois are required (see --help)");
    o.gridPath = *args.gridPath;
    o.poisPath = *args.poisPath;

    if (args.scenarioId) o.scenarioId = *args.scenarioId;
    if (args.duration)   o.duration = *args.duration;
    if (args.dt && *args.dt > 0.0) o.dt = *args.dt;
    if (args.agents)     o.config.agents = *args.agents;
    if (args.seed)       o.config.seed = *args.seed;
    if (args.speed)      o.config.speedMultiplier = *args.speed;
    if (args.brainUrl)   o.config.brainUrl = *args.brainUrl;
    if (args.noBrain)    o.config.brainEnabled = false;
    o.realtime = args.realtime;
    return o;
}

int Run(const RunOptions& opts)
{
    // Load-time failures throw before the loop starts.
    world::NavGrid grid = world::NavGrid::LoadFile(opts.gridPath, opts.config.cellMeters);
    world::ScenarioAssets scenario = world::LoadScenario(opts.poisPath, grid, opts.scenarioId);

    // The client outlives the simulation that borrows it.
    std::unique_ptr<brain::HttpBrainClient> client;
    sim::Simulation simulation(opts.config, std::move(grid), std::move(scenario));
    simulation.SpawnPopulation(opts.config.agents);

    if (opts.config.brainEnabled) {
        client = std::make_unique<brain::HttpBrainClient>(opts.config.brainUrl, opts.config.brainTimeoutMs);
        brain::RunInfo run;
        run.hypothesisId = opts.scenarioId;
        run.seed = opts.config.seed;
        run.speed = opts.config.speedMultiplier;
        if (!simulation.ConnectBrain(*client, run))
            spdlog::warn("Continuing without the reasoning service ({})", opts.config.brainUrl);
    }

    core::FixedStepLoop loop;
    loop.UpdateFixed = [&](double dt) { simulation.Step(static_cast<float>(dt)); };
    loop.IsRunning = [&] { return simulation.now() < opts.duration; };

    core::FixedStepConfig stepCfg;
    stepCfg.fixed_dt = opts.dt;
    stepCfg.realtime = opts.realtime;

    spdlog::info("Running {:.0f}s of simulated time at dt={:.4f}{}", opts.duration, opts.dt,
                 opts.realtime ? " (realtime)" : "");
    loop.Run(stepCfg);

    simulation.EndRun();

    const auto& stats = simulation.trip_stats();
    spdlog::info("Done after {} steps: {} trips, mean {:.1f}s / {:.1f}m, {} meetings",
                 loop.StepId(), stats.Count(), stats.MeanDurationSeconds(), stats.MeanDistanceMeters(),
                 simulation.MeetingCount());
    for (const auto& [category, n] : stats.ByCategory())
        spdlog::info("  {:<12} {}", category, n);
    return 0;
}

} // namespace promenade::app
