#include "app/CommandLineArgs.h"
#include "app/Runner.h"
#include "core/Log.h"

#include <spdlog/spdlog.h>

#include <exception>
#include <iostream>

int main(int argc, char** argv)
{
    using namespace promenade;

    const app::CommandLineArgs args = app::ParseCommandLineArgs(argc, argv);
    if (args.showHelp) {
        std::cout << app::BuildCommandLineHelpText();
        return 0;
    }

    logsys::init(args.logDir.value_or("logs"),
                 logsys::parse_level(args.logLevel.value_or("info")));

    for (const auto& u : args.unknown)
        spdlog::warn("Ignoring unknown or malformed option '{}'", u);

    int rc = 1;
    try {
        rc = app::Run(app::ResolveRunOptions(args));
    } catch (const std::exception& e) {
        spdlog::critical("{}", e.what());
        std::cerr << "promenade: " << e.what() << "\n";
    }

    logsys::shutdown();
    return rc;
}
