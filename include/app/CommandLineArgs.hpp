#pragma once
#include "core/Common.hpp"
#include "core/DataStruct.hpp"
#include "core/PathFinder.hpp"

#include <filesystem>
#include <string>
#include <string_view>

// Options of the stara_maze executable.
//
//   - Both "--opt value" and "--opt=value" are accepted.
//   - Two-value options take "--start ROW COL" or "--start=ROW,COL".
//   - Unknown options and bad values are collected, never thrown.
struct CommandLineArgs
{
    bool showHelp = false;          // --help / -h
    bool drawSolution = false;      // --draw-solution
    bool verbose = false;           // --verbose / -v

    int32_t size = 40;              // --size N
    int32_t seed = 42;              // --seed N
    Position start{ 1, 1 };         // --start ROW COL
    std::optional<Position> goal;   // --goal ROW COL (default size-2, size-2)
    int32_t minValidPaths = kDefaultMinValidPaths; // --min-valid-paths N
    int32_t maxAttempts = 8;        // --max-attempts N

    std::optional<std::filesystem::path> output; // --output FILE

    std::vector<std::string> unknown;
    std::vector<std::string> errors;

    bool ok() const { return unknown.empty() && errors.empty(); }
};

// argv[0] is the program name and is skipped.
[[nodiscard]] CommandLineArgs ParseCommandLineArgs(const std::vector<std::string_view>& argv);
[[nodiscard]] CommandLineArgs ParseCommandLineArgs(int argc, char** argv);

[[nodiscard]] std::string BuildCommandLineHelpText();

// goal, or (size-2, size-2) when none was given
[[nodiscard]] Position ResolveGoal(const CommandLineArgs& args);

// {size}x{size}_seed{seed}_paths{min}_{ALGO}_maze.html
[[nodiscard]] std::filesystem::path DefaultOutputPath(int32_t size,
                                                      int32_t seed,
                                                      int32_t minValidPaths,
                                                      PathAlgo algo);
