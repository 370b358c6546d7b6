#include "core/PathFinder.hpp"
#include "core/BFS.hpp"
#include "core/Errors.hpp"
#include "core/Maze.hpp"

std::string ToString(PathAlgo algo)
{
    switch (algo)
    {
    case PathAlgo::BFS: return "BFS";
    }
    return "Unknown";
}

PathFinder::PathFinder(Maze& maze)
    : maze_(maze)
{
}

std::optional<Path> PathFinder::FindPath(const Position& start, const Position& goal)
{
    std::optional<Path> found = Search(maze_.grid, start, goal);
    maze_.path = found;
    return found;
}

std::optional<Path> PathFinder::Search(const Grid& /*grid*/,
                                       const Position& /*start*/,
                                       const Position& /*goal*/) const
{
    throw NotImplementedError("PathFinder::Search has no algorithm; use a concrete path finder");
}

std::unique_ptr<PathFinder> MakePathFinder(PathAlgo algo, Maze& maze)
{
    switch (algo)
    {
    case PathAlgo::BFS: return std::make_unique<BFSPathFinder>(maze);
    }
    throw std::invalid_argument("unknown path finding algorithm");
}
