#include <gtest/gtest.h>

#include "core/BFS.hpp"
#include "core/Errors.hpp"
#include "core/Maze.hpp"
#include "core/MazeBuilder.hpp"

#include <cstdlib>
#include <set>
#include <utility>

namespace {

std::set<std::pair<int32_t, int32_t>> Interior(const Path& path)
{
    std::set<std::pair<int32_t, int32_t>> out;
    for (size_t i = 1; i + 1 < path.size(); ++i)
        out.insert({ path[i].row, path[i].col });
    return out;
}

void ExpectDisjointRoutes(const Grid& grid, const std::vector<Path>& routes,
                          const Position& start, const Position& goal)
{
    std::set<std::pair<int32_t, int32_t>> seen;
    for (const Path& route : routes)
    {
        ASSERT_GE(route.size(), 2u);
        EXPECT_EQ(route.front(), start);
        EXPECT_EQ(route.back(), goal);
        for (size_t i = 0; i < route.size(); ++i)
        {
            EXPECT_TRUE(grid.IsPassable(route[i]));
            if (i + 1 < route.size())
            {
                const int32_t step = std::abs(route[i].row - route[i + 1].row) +
                                     std::abs(route[i].col - route[i + 1].col);
                EXPECT_EQ(step, 1);
            }
        }
        for (const auto& cell : Interior(route))
            EXPECT_TRUE(seen.insert(cell).second) << "cell shared by two routes";
    }
}

} // namespace

TEST(mazeBuilderTest, BlockingInteriorFindsDisjointAlternate)
{
    Maze maze(42, 4, { 0, 0 }, { 3, 3 }, 1);
    maze.grid.Fill(Cell::Passage);
    BFSPathFinder bfs(maze);

    const auto first = bfs.Search(maze.grid, maze.start, maze.goal);
    ASSERT_TRUE(first.has_value());

    Grid blocked = maze.grid;
    MazeBuilder::BlockInterior(blocked, *first);
    EXPECT_TRUE(blocked.IsPassable(maze.start));
    EXPECT_TRUE(blocked.IsPassable(maze.goal));

    const auto second = bfs.Search(blocked, maze.start, maze.goal);
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(*first, *second);

    const Path expected{ { 0, 0 }, { 0, 1 }, { 1, 1 }, { 2, 1 }, { 2, 2 }, { 2, 3 }, { 3, 3 } };
    EXPECT_EQ(*second, expected);

    for (const auto& cell : Interior(*second))
        EXPECT_EQ(Interior(*first).count(cell), 0u);

    // both neighbours of the corner start are used up now
    MazeBuilder::BlockInterior(blocked, *second);
    EXPECT_FALSE(bfs.Search(blocked, maze.start, maze.goal).has_value());
}

TEST(mazeBuilderTest, BlockingSoleRouteLeavesNoPath)
{
    Maze maze(42, 4, { 0, 0 }, { 3, 3 }, 1);
    maze.grid = Grid::FromRows({
        { 1, 1, 1, 1 },
        { 0, 0, 1, 1 },
        { 1, 1, 1, 0 },
        { 1, 0, 1, 1 },
    });
    BFSPathFinder bfs(maze);

    const auto route = bfs.Search(maze.grid, maze.start, maze.goal);
    ASSERT_TRUE(route.has_value());

    Grid blocked = maze.grid;
    MazeBuilder::BlockInterior(blocked, *route);
    EXPECT_FALSE(bfs.Search(blocked, maze.start, maze.goal).has_value());
}

TEST(mazeBuilderTest, CountRoutesOnOpenGrid)
{
    Maze maze(42, 4, { 0, 0 }, { 3, 3 }, 1);
    maze.grid.Fill(Cell::Passage);
    BFSPathFinder bfs(maze);

    EXPECT_EQ(MazeBuilder::CountRoutes(bfs, maze.grid, maze.start, maze.goal, 1).routes, 1);
    EXPECT_EQ(MazeBuilder::CountRoutes(bfs, maze.grid, maze.start, maze.goal, 5).routes, 2);

    // counting works on a copy
    EXPECT_EQ(maze.grid.CountPassable(), 16u);
}

TEST(mazeBuilderTest, CountRoutesReroutesAroundShortcut)
{
    // the shortest route takes the top exit of S and the bottom entry of G,
    // cutting both perimeter routes when walled off
    Maze maze(42, 7, { 3, 0 }, { 3, 6 }, 1);
    maze.grid = Grid::FromRows({
        { 1, 1, 1, 1, 1, 1, 1 },
        { 1, 0, 0, 0, 0, 0, 1 },
        { 1, 1, 1, 0, 0, 0, 1 },
        { 1, 0, 1, 1, 1, 0, 1 },
        { 1, 0, 0, 0, 1, 1, 1 },
        { 1, 0, 0, 0, 0, 0, 1 },
        { 1, 1, 1, 1, 1, 1, 1 },
    });
    BFSPathFinder bfs(maze);

    const auto shortcut = bfs.Search(maze.grid, maze.start, maze.goal);
    ASSERT_TRUE(shortcut.has_value());
    EXPECT_EQ(shortcut->size(), 11u);

    Grid blocked = maze.grid;
    MazeBuilder::BlockInterior(blocked, *shortcut);
    EXPECT_FALSE(bfs.Search(blocked, maze.start, maze.goal).has_value());

    const RouteCount count = MazeBuilder::CountRoutes(bfs, maze.grid, maze.start, maze.goal, 3);
    EXPECT_EQ(count.routes, 2);
    ASSERT_EQ(count.paths.size(), 2u);
    ExpectDisjointRoutes(maze.grid, count.paths, maze.start, maze.goal);
}

TEST(mazeBuilderTest, CountRoutesWithoutPath)
{
    Maze maze(42, 4, { 0, 0 }, { 3, 3 }, 1);
    BFSPathFinder bfs(maze);
    EXPECT_EQ(MazeBuilder::CountRoutes(bfs, maze.grid, maze.start, maze.goal, 3).routes, 0);
}

TEST(mazeBuilderTest, AdjacentEndpointsSatisfyAnyCount)
{
    Maze maze(42, 4, { 0, 0 }, { 0, 1 }, 1);
    maze.grid.Fill(Cell::Passage);
    BFSPathFinder bfs(maze);
    EXPECT_EQ(MazeBuilder::CountRoutes(bfs, maze.grid, maze.start, maze.goal, 4).routes, 4);
}

TEST(mazeBuilderTest, GeneratedMazeMeetsRouteCount)
{
    for (int32_t seed = 10; seed < 14; ++seed)
    {
        Maze maze(seed, 20, { 1, 1 }, { 18, 18 }, 3);
        maze.GenerateMaze();

        BFSPathFinder bfs(maze);
        const RouteCount count = MazeBuilder::CountRoutes(bfs, maze.grid, maze.start, maze.goal, 3);
        EXPECT_GE(count.routes, 3) << "seed " << seed;
    }
}

TEST(mazeBuilderTest, FourRoutesFromInteriorEndpoints)
{
    for (int32_t size : { 10, 40 })
    {
        for (int32_t seed = 1; seed <= 10; ++seed)
        {
            Maze maze(seed, size, { 1, 1 }, { size - 2, size - 2 }, 4);
            ASSERT_NO_THROW(maze.GenerateMaze()) << "size " << size << " seed " << seed;

            BFSPathFinder bfs(maze);
            const RouteCount count = MazeBuilder::CountRoutes(bfs, maze.grid, maze.start, maze.goal, 4);
            EXPECT_EQ(count.routes, 4) << "size " << size << " seed " << seed;
            ExpectDisjointRoutes(maze.grid, count.paths, maze.start, maze.goal);
        }
    }
}

TEST(mazeBuilderTest, CornerEndpointsAreConnected)
{
    Maze maze(5, 8, { 0, 0 }, { 7, 7 }, 1);
    maze.GenerateMaze();

    const auto path = maze.FindPath();
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->front(), maze.start);
    EXPECT_EQ(path->back(), maze.goal);
}

TEST(mazeBuilderTest, UnsatisfiableConstraintThrowsAndKeepsGrid)
{
    // a corner cell has two neighbours, so three disjoint routes cannot exist
    Maze maze(7, 6, { 0, 0 }, { 5, 5 }, 3);

    BuilderSettings settings;
    settings.maxAttempts = 3;
    EXPECT_THROW(MazeBuilder::Build(maze, PathAlgo::BFS, settings), MazeGenerationError);

    EXPECT_EQ(maze.grid.CountPassable(), 0u);
    EXPECT_FALSE(maze.path.has_value());
}

TEST(mazeBuilderTest, ZeroAttemptsThrows)
{
    Maze maze(7, 6, { 1, 1 }, { 4, 4 }, 1);

    BuilderSettings settings;
    settings.maxAttempts = 0;
    EXPECT_THROW(maze.GenerateMaze(PathAlgo::BFS, settings), MazeGenerationError);
}

TEST(mazeBuilderTest, StartAndGoalArePassage)
{
    Maze maze(3, 9, { 2, 3 }, { 7, 1 }, 1);
    maze.GenerateMaze();
    EXPECT_TRUE(maze.grid.IsPassable(maze.start));
    EXPECT_TRUE(maze.grid.IsPassable(maze.goal));
}
