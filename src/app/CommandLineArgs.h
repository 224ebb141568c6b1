#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace promenade::app {

// Parsed command line for the promenade runner. Values given here override
// the INI file.
//
// Notes:
//   - Option names are case-insensitive; values keep their case.
//   - Both "--flag=value" and "--flag value" forms are supported.
struct CommandLineArgs
{
    bool showHelp = false;                  // --help / -h

    std::optional<std::string> configPath;  // --config <file>
    std::optional<std::string> gridPath;    // --grid <file>
    std::optional<std::string> poisPath;    // --pois <file>
    std::optional<std::string> scenarioId;  // --scenario <id>
    std::optional<std::string> logDir;      // --log-dir <dir>
    std::optional<std::string> logLevel;    // --log-level <name>
    std::optional<std::string> brainUrl;    // --brain-url <url>

    std::optional<double> duration;         // --duration <seconds>
    std::optional<double> dt;               // --dt <seconds>
    std::optional<int> agents;              // --agents <n>
    std::optional<std::uint64_t> seed;      // --seed <n>
    std::optional<float> speed;             // --speed <multiplier>

    bool noBrain = false;                   // --no-brain
    bool realtime = false;                  // --realtime

    // Unknown options and options with bad or missing values, in order.
    std::vector<std::string> unknown;
};

[[nodiscard]] CommandLineArgs ParseCommandLineArgsFromArgv(const std::vector<std::string_view>& argv);
[[nodiscard]] CommandLineArgs ParseCommandLineArgs(int argc, const char* const* argv);

[[nodiscard]] std::string BuildCommandLineHelpText();

} // namespace promenade::app
