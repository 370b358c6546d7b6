#pragma once
#include "core/Common.hpp"
#include "core/Grid.hpp"
#include "core/PathFinder.hpp"

class Maze;

struct BuilderSettings
{
    // full re-carves before giving up
    int32_t maxAttempts{8};

    // tunnels carved per attempt; 0 picks 4 * minValidPaths + 8
    int32_t maxRepairRounds{0};
};

struct RouteCount
{
    int32_t routes{0};

    // one interior-disjoint start-to-goal route per count
    std::vector<Path> paths{};
};

class MazeBuilder
{
public:
    // Carves maze.grid from maze.seed so that at least maze.minValidPaths
    // routes join start and goal. Throws MazeGenerationError when the
    // attempt budget runs out; maze.grid is only replaced on success.
    static void Build(Maze& maze, PathAlgo algo, const BuilderSettings& settings = {});

    // Counts interior-disjoint routes, stopping at `limit`. The finder's
    // routes are taken first with each interior walled off in turn; the set
    // is then rerouted until no further route fits, so the count is exact.
    // A route with no interior (start next to goal) cannot be cut and
    // counts as `limit` routes. Walled endpoints give zero.
    static RouteCount CountRoutes(const PathFinder& finder,
                                  const Grid& grid,
                                  const Position& start,
                                  const Position& goal,
                                  int32_t limit);

    // Walls off every cell of `path` except its two ends.
    static void BlockInterior(Grid& grid, const Path& path);
};
