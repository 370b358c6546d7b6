#include "core/Common.hpp"
#include "core/Log.hpp"
#include "core/Errors.hpp"
#include "core/Maze.hpp"
#include "core/MazeExporter.hpp"
#include "app/CommandLineArgs.hpp"

#include <iostream>

int main(int argc, char** argv)
{
    const CommandLineArgs args = ParseCommandLineArgs(argc, argv);

    if (args.showHelp)
    {
        std::cout << BuildCommandLineHelpText();
        return 0;
    }

    logsys::Init(args.verbose ? spdlog::level::debug : spdlog::level::info);

    if (!args.ok())
    {
        for (const auto& u : args.unknown)
            spdlog::error("unknown option: {}", u);
        for (const auto& e : args.errors)
            spdlog::error("{}", e);
        std::cerr << BuildCommandLineHelpText();
        return 2;
    }

    const PathAlgo algo = PathAlgo::BFS;
    const Position goal = ResolveGoal(args);
    const auto output = args.output
        ? *args.output
        : DefaultOutputPath(args.size, args.seed, args.minValidPaths, algo);

    try
    {
        Maze maze(args.seed, args.size, args.start, goal, args.minValidPaths);

        BuilderSettings settings;
        settings.maxAttempts = args.maxAttempts;

        const auto startTime = std::chrono::high_resolution_clock::now();
        maze.GenerateMaze(algo, settings);
        const auto endTime = std::chrono::high_resolution_clock::now();

        const auto path = maze.FindPath();
        if (path)
            spdlog::info("{}, len(path): {}", ToString(algo), path->size());
        else
            spdlog::info("{}, len(path): No path found", ToString(algo));

        const std::chrono::duration<double> took = endTime - startTime;
        spdlog::info("Time taken: {:.2f} seconds", took.count());

        MazeExporter::ExportHtml(maze, output, args.drawSolution);
        spdlog::info("Maze exported to {}", output.string());
    }
    catch (const MazeGenerationError& e)
    {
        spdlog::error("generation failed: {}", e.what());
        return 1;
    }
    catch (const std::exception& e)
    {
        spdlog::error("{}", e.what());
        return 1;
    }

    return 0;
}
