// tests/test_command_line_args.cpp
//
// Regression coverage for src/app/CommandLineArgs.{h,cpp}.
//
// Goals:
//   - Options are case-insensitive, values are not
//   - Both "--opt value" and "--opt=value" are supported
//   - Unknown options and bad values are reported in a predictable order

#include <doctest/doctest.h>

#include "app/CommandLineArgs.h"

#include <initializer_list>
#include <string_view>
#include <vector>

namespace {

[[nodiscard]] promenade::app::CommandLineArgs Parse(std::initializer_list<std::string_view> argv)
{
    std::vector<std::string_view> v;
    v.reserve(argv.size());
    for (const auto& a : argv)
        v.push_back(a);
    return promenade::app::ParseCommandLineArgsFromArgv(v);
}

} // namespace

TEST_CASE("CommandLineArgs parses basic flags (case-insensitive)")
{
    const auto args = Parse({ "promenade", "--NO-BRAIN", "--Realtime" });

    CHECK(args.noBrain);
    CHECK(args.realtime);
    CHECK_FALSE(args.showHelp);
    CHECK(args.unknown.empty());
}

TEST_CASE("CommandLineArgs accepts = and separate values")
{
    const auto args = Parse({
        "promenade",
        "--grid=Data/Grid.json",
        "--pois", "data/pois.json",
        "--Scenario=H001",
        "--duration", "300",
        "--dt=0.05",
        "-n", "75",
        "--seed=18446744073709551615",
        "--speed", "1.5",
        "--brain-url=http://localhost:9000",
    });

    CHECK(args.unknown.empty());
    CHECK(args.gridPath == "Data/Grid.json");
    CHECK(args.poisPath == "data/pois.json");
    CHECK(args.scenarioId == "H001");
    CHECK(args.duration == 300.0);
    REQUIRE(args.dt);
    CHECK(*args.dt == doctest::Approx(0.05));
    CHECK(args.agents == 75);
    CHECK(args.seed == 18446744073709551615ull);
    REQUIRE(args.speed);
    CHECK(*args.speed == doctest::Approx(1.5f));
    CHECK(args.brainUrl == "http://localhost:9000");
}

TEST_CASE("CommandLineArgs reports unknown options and bad values in order")
{
    const auto args = Parse({
        "promenade",
        "--wat",
        "--agents=-3",
        "--dt", "fast",
        "--seed=12",
        "--grid",
    });

    REQUIRE(args.unknown.size() == 4);
    CHECK(args.unknown[0] == "--wat");
    CHECK(args.unknown[1] == "--agents=-3");
    CHECK(args.unknown[2] == "--dt");
    CHECK(args.unknown[3] == "--grid");
    CHECK_FALSE(args.agents);
    CHECK_FALSE(args.dt);
    CHECK_FALSE(args.gridPath);
    CHECK(args.seed == 12u);
}

TEST_CASE("CommandLineArgs help aliases")
{
    CHECK(Parse({ "promenade", "-h" }).showHelp);
    CHECK(Parse({ "promenade", "-?" }).showHelp);
    CHECK(Parse({ "promenade", "--HELP" }).showHelp);
    CHECK_FALSE(Parse({ "promenade" }).showHelp);
}

TEST_CASE("CommandLineArgs argc/argv entry point skips the program name")
{
    const char* argv[] = { "--agents", "--config", "run.ini" };
    const auto args = promenade::app::ParseCommandLineArgs(3, argv);
    CHECK(args.configPath == "run.ini");
    CHECK(args.unknown.empty());
    CHECK_FALSE(args.agents);
}

TEST_CASE("CommandLineArgs help text lists the required inputs")
{
    const std::string help = promenade::app::BuildCommandLineHelpText();
    CHECK(help.find("--grid") != std::string::npos);
    CHECK(help.find("--pois") != std::string::npos);
    CHECK(help.find("--no-brain") != std::string::npos);
}
