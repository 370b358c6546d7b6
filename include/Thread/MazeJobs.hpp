#pragma once
#include "core/Common.hpp"
#include "core/Maze.hpp"
#include "Thread/ThreadPool.hpp"

// Everything needed to build one maze away from the caller's thread.
struct MazeRequest
{
    int32_t seed{0};
    int32_t size{kMinMazeSize};
    Position start{ 1, 1 };
    Position goal{ kMinMazeSize - 2, kMinMazeSize - 2 };
    int32_t minValidPaths{kDefaultMinValidPaths};
    PathAlgo algo{PathAlgo::BFS};
    BuilderSettings settings{};
};

// `seed` moved by `step`, wrapping from INT32_MAX to INT32_MIN and back.
int32_t StepSeed(int32_t seed, int32_t step);

// Generates the maze and caches its shortest path. Errors propagate.
std::unique_ptr<Maze> BuildMaze(const MazeRequest& request);

// Each maze owns its grid and generator, so requests never share state.
std::future<std::unique_ptr<Maze>> SubmitBuild(ThreadPool& pool, const MazeRequest& request);
