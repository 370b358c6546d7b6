#pragma once
#include "core/Common.hpp"
#include "core/DataStruct.hpp"
#include "core/Grid.hpp"
#include "core/MazeBuilder.hpp"
#include "core/PathFinder.hpp"

#include <ostream>
#include <string>

// A square maze: its grid, endpoints, seed, route constraint and the path
// cached by the last successful search.
//
// Endpoints are not range-checked here. The first grid access that touches
// them (GenerateMaze, FindPath) throws std::out_of_range.
class Maze
{
public:
    Maze(int32_t seed,
         int32_t size,
         const Position& start,
         const Position& goal,
         int32_t minValidPaths = kDefaultMinValidPaths,
         PathAlgo pathfindingAlgorithm = PathAlgo::BFS);

    void GenerateMaze(PathAlgo algo = PathAlgo::BFS, const BuilderSettings& settings = {});

    std::optional<Path> FindPath();

    Neighbours GetCellNeighbours(int32_t row, int32_t col) const
    {
        return grid.GetCellNeighbours(row, col);
    }

    std::string ToString() const;

    int32_t rows;
    int32_t cols;
    int32_t seed;
    Position start;
    Position goal;
    int32_t minValidPaths;
    PathAlgo pathfindingAlgorithm;
    Grid grid;
    std::optional<Path> path;
};

std::ostream& operator<<(std::ostream& os, const Maze& maze);
