#pragma once
#include "core/Common.hpp"
#include "core/DataStruct.hpp"
#include "core/Grid.hpp"

#include <string>

class Maze;

enum class PathAlgo : int
{
    BFS = 0,
};

std::string ToString(PathAlgo algo);

// Search strategy bound to one maze.
//
// FindPath() both answers the query and caches the answer on the maze:
// a found path is written to maze.path, a failed search resets maze.path
// so an old route is never presented as current.
class PathFinder
{
public:
    explicit PathFinder(Maze& maze);
    virtual ~PathFinder() = default;

    PathFinder(const PathFinder&) = delete;
    PathFinder& operator=(const PathFinder&) = delete;

    Maze& GetMaze() const noexcept { return maze_; }

    std::optional<Path> FindPath(const Position& start, const Position& goal);

    // Algorithm seam. Reads `grid` only; nullopt when goal is unreachable.
    virtual std::optional<Path> Search(const Grid& grid,
                                       const Position& start,
                                       const Position& goal) const;

private:
    Maze& maze_;
};

std::unique_ptr<PathFinder> MakePathFinder(PathAlgo algo, Maze& maze);
