#include "core/Maze.hpp"

#include <sstream>

Maze::Maze(int32_t seed,
           int32_t size,
           const Position& start,
           const Position& goal,
           int32_t minValidPaths,
           PathAlgo pathfindingAlgorithm)
    : rows(size),
      cols(size),
      seed(seed),
      start(start),
      goal(goal),
      minValidPaths(minValidPaths),
      pathfindingAlgorithm(pathfindingAlgorithm)
{
    if (size < kMinMazeSize)
        throw std::invalid_argument("size must be at least " + std::to_string(kMinMazeSize));
    if (minValidPaths < 1)
        throw std::invalid_argument("min_valid_paths must be at least 1");
    if (start == goal)
        throw std::invalid_argument("start and goal must be different cells");

    grid = Grid(rows, cols, Cell::Wall);
}

void Maze::GenerateMaze(PathAlgo algo, const BuilderSettings& settings)
{
    MazeBuilder::Build(*this, algo, settings);
    pathfindingAlgorithm = algo;
}

std::optional<Path> Maze::FindPath()
{
    auto finder = MakePathFinder(pathfindingAlgorithm, *this);
    return finder->FindPath(start, goal);
}

std::string Maze::ToString() const
{
    std::ostringstream os;
    os << "Maze(rows=" << rows << ", cols=" << cols
       << ", start=" << start << ", goal=" << goal << ")";
    return os.str();
}

std::ostream& operator<<(std::ostream& os, const Maze& maze)
{
    return os << maze.ToString();
}
