#include "app/CommandLineArgs.h"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <limits>
#include <sstream>

namespace promenade::app {

namespace {

[[nodiscard]] std::string ToLower(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

template <typename Int>
[[nodiscard]] std::optional<Int> ParseInt(std::string_view s)
{
    if (!s.empty() && s.front() == '+')
        s.remove_prefix(1);
    if (s.empty())
        return std::nullopt;

    Int v{};
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size())
        return std::nullopt;
    return v;
}

[[nodiscard]] std::optional<double> ParseDouble(std::string_view s)
{
    if (s.empty())
        return std::nullopt;
    const std::string tmp(s);
    char* end = nullptr;
    const double v = std::strtod(tmp.c_str(), &end);
    if (end != tmp.c_str() + tmp.size())
        return std::nullopt;
    return v;
}

} // namespace

CommandLineArgs ParseCommandLineArgsFromArgv(const std::vector<std::string_view>& argv)
{
    CommandLineArgs out;
    const std::size_t argc = argv.size();

    for (std::size_t i = 1; i < argc; ++i)
    {
        const std::string_view raw = argv[i];
        if (raw.empty())
            continue;

        // Split "--name=value"; only the name is case-folded.
        std::optional<std::string_view> inlineValue;
        std::string_view name = raw;
        if (const auto eq = raw.find('='); eq != std::string_view::npos && raw.rfind("-", 0) == 0) {
            name = raw.substr(0, eq);
            inlineValue = raw.substr(eq + 1);
        }
        const std::string arg = ToLower(name);

        auto addUnknown = [&] { out.unknown.emplace_back(raw); };

        // Help
        if (arg == "--help" || arg == "-h" || arg == "-?") { out.showHelp = true; continue; }

        // Simple flags
        if (arg == "--no-brain" || arg == "--nobrain") { out.noBrain = true; continue; }
        if (arg == "--realtime") { out.realtime = true; continue; }

        // Options with values: inline, or the next argument.
        const auto value = [&]() -> std::optional<std::string_view> {
            if (inlineValue)
                return inlineValue;
            if (i + 1 >= argc)
                return std::nullopt;
            return argv[++i];
        };

        const auto takeString = [&](std::optional<std::string>& dst) {
            const auto v = value();
            if (!v || v->empty()) { addUnknown(); return; }
            dst = std::string(*v);
        };

        const auto takeDouble = [&](std::optional<double>& dst) {
            const auto v = value();
            const auto parsed = v ? ParseDouble(*v) : std::nullopt;
            if (!parsed) { addUnknown(); return; }
            dst = *parsed;
        };

        if (arg == "--config" || arg == "-c")  { takeString(out.configPath); continue; }
        if (arg == "--grid")                   { takeString(out.gridPath); continue; }
        if (arg == "--pois")                   { takeString(out.poisPath); continue; }
        if (arg == "--scenario")               { takeString(out.scenarioId); continue; }
        if (arg == "--log-dir")                { takeString(out.logDir); continue; }
        if (arg == "--log-level")              { takeString(out.logLevel); continue; }
        if (arg == "--brain-url")              { takeString(out.brainUrl); continue; }

        if (arg == "--duration")               { takeDouble(out.duration); continue; }
        if (arg == "--dt")                     { takeDouble(out.dt); continue; }

        if (arg == "--speed") {
            std::optional<double> d;
            takeDouble(d);
            if (d) out.speed = static_cast<float>(*d);
            continue;
        }
        if (arg == "--agents" || arg == "-n") {
            const auto v = value();
            const auto parsed = v ? ParseInt<int>(*v) : std::nullopt;
            if (!parsed || *parsed < 0) addUnknown(); else out.agents = *parsed;
            continue;
        }
        if (arg == "--seed") {
            const auto v = value();
            const auto parsed = v ? ParseInt<std::uint64_t>(*v) : std::nullopt;
            if (!parsed) addUnknown(); else out.seed = *parsed;
            continue;
        }

        // Anything else is unknown.
        addUnknown();
    }

    return out;
}

CommandLineArgs ParseCommandLineArgs(int argc, const char* const* argv)
{
    std::vector<std::string_view> v;
    v.reserve(argc > 0 ? static_cast<std::size_t>(argc) : 0);
    for (int i = 0; i < argc; ++i)
        v.emplace_back(argv[i] ? argv[i] : "");
    return ParseCommandLineArgsFromArgv(v);
}

std::string BuildCommandLineHelpText()
{
    std::ostringstream oss;
    oss << "promenade - pedestrian needs simulation\n\n";
    oss << "Inputs\n";
    oss << "  --grid <file>            Navigation grid JSON (required)\n";
    oss << "  --pois <file>            POI collection JSON (required)\n";
    oss << "  --scenario <id>          Scenario id sent as decision context (default: baseline)\n";
    oss << "  --config <file>          INI settings (default: promenade.ini if present)\n\n";

    oss << "Run\n";
    oss << "  --duration <s>           Simulated seconds to run (default: 120)\n";
    oss << "  --dt <s>                 Fixed tick length (default: 1/30)\n";
    oss << "  --agents <n>             Population size\n";
    oss << "  --seed <n>               RNG seed\n";
    oss << "  --speed <x>              Global walking speed multiplier\n";
    oss << "  --realtime               Pace ticks against the wall clock\n\n";

    oss << "Reasoning service\n";
    oss << "  --no-brain               Run without the reasoning service\n";
    oss << "  --brain-url <url>        Service base URL\n\n";

    oss << "Logging\n";
    oss << "  --log-dir <dir>          Rotating log file directory (default: logs)\n";
    oss << "  --log-level <name>       trace|debug|info|warn|error (default: info)\n\n";

    oss << "Misc\n";
    oss << "  --help, -h               Show this help\n\n";

    oss << "Examples\n";
    oss << "  promenade --grid data/grid.json --pois data/pois.json --no-brain --duration 300\n";
    oss << "  promenade --grid data/grid.json --pois data/h001/pois.json --scenario h001 --realtime\n";
    return oss.str();
}

} // namespace promenade::app
