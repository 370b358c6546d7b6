#include "core/Common.hpp"
#include "core/Log.hpp"
#include "Viewer/core.hpp"
#include "app/CommandLineArgs.hpp"

#include <iostream>

// Interactive viewer: same options as stara_maze, output options ignored.
int main(int argc, char** argv)
{
    const CommandLineArgs args = ParseCommandLineArgs(argc, argv);

    if (args.showHelp)
    {
        std::cout << BuildCommandLineHelpText()
                  << "\nviewer keys: N next seed, B previous seed, S toggle solution, Esc quit\n";
        return 0;
    }

    logsys::Init(args.verbose ? spdlog::level::debug : spdlog::level::info);

    if (!args.ok())
    {
        for (const auto& u : args.unknown)
            spdlog::error("unknown option: {}", u);
        for (const auto& e : args.errors)
            spdlog::error("{}", e);
        return 2;
    }

    MazeRequest request;
    request.seed = args.seed;
    request.size = args.size;
    request.start = args.start;
    request.goal = ResolveGoal(args);
    request.minValidPaths = args.minValidPaths;
    request.settings.maxAttempts = args.maxAttempts;

    try
    {
        Viewer::getInstance().run(request);
    }
    catch (const std::exception& e)
    {
        spdlog::error("{}", e.what());
        return 1;
    }

    return 0;
}
