#include <gtest/gtest.h>

#include "Viewer/Mesh.hpp"

#include <limits>

namespace {

// colour of the first vertex of cell (row, col)
Rgb ColorAt(const std::vector<Vertex>& verts, int cols, int row, int col)
{
    const Vertex& v = verts[((size_t)row * (size_t)cols + (size_t)col) * 6];
    return { v.r, v.g, v.b };
}

void ExpectColor(const Rgb& got, const Rgb& want)
{
    EXPECT_FLOAT_EQ(got.r, want.r);
    EXPECT_FLOAT_EQ(got.g, want.g);
    EXPECT_FLOAT_EQ(got.b, want.b);
}

Maze SampleMaze()
{
    Maze maze(42, 4, { 0, 0 }, { 3, 3 }, 1);
    maze.grid = Grid::FromRows({
        { 1, 1, 1, 1 },
        { 0, 0, 1, 1 },
        { 1, 1, 1, 0 },
        { 1, 0, 1, 1 },
    });
    return maze;
}

} // namespace

TEST(viewerMeshTest, TwoTrianglesPerCellInCellUnits)
{
    const Maze maze = SampleMaze();
    const auto verts = BuildMazeMesh(maze, false);
    ASSERT_EQ(verts.size(), 16u * 6u);

    // cell (2, 1) spans x 1..2, y 2..3
    const size_t base = (2u * 4u + 1u) * 6u;
    float minX = 1e9f, maxX = -1e9f, minY = 1e9f, maxY = -1e9f;
    for (size_t i = base; i < base + 6; ++i)
    {
        minX = std::min(minX, verts[i].x);
        maxX = std::max(maxX, verts[i].x);
        minY = std::min(minY, verts[i].y);
        maxY = std::max(maxY, verts[i].y);
    }
    EXPECT_FLOAT_EQ(minX, 1.0f);
    EXPECT_FLOAT_EQ(maxX, 2.0f);
    EXPECT_FLOAT_EQ(minY, 2.0f);
    EXPECT_FLOAT_EQ(maxY, 3.0f);
}

TEST(viewerMeshTest, ColoursFollowCellsAndEndpoints)
{
    Maze maze = SampleMaze();
    maze.FindPath();
    ASSERT_TRUE(maze.path.has_value());

    const auto hidden = BuildMazeMesh(maze, false);
    ExpectColor(ColorAt(hidden, 4, 0, 0), kStartColor);
    ExpectColor(ColorAt(hidden, 4, 3, 3), kGoalColor);
    ExpectColor(ColorAt(hidden, 4, 1, 0), kWallColor);
    ExpectColor(ColorAt(hidden, 4, 0, 2), kPassageColor);

    // (0, 2) lies on the only route
    const auto shown = BuildMazeMesh(maze, true);
    ExpectColor(ColorAt(shown, 4, 0, 2), kPathColor);
    ExpectColor(ColorAt(shown, 4, 2, 0), kPassageColor);
    ExpectColor(ColorAt(shown, 4, 0, 0), kStartColor);
}

TEST(viewerMeshTest, WindowSideScalesWithMazeSize)
{
    EXPECT_EQ(WindowSideFor(4), 320);
    EXPECT_EQ(WindowSideFor(40), 640);
    EXPECT_EQ(WindowSideFor(200), 960);
    EXPECT_EQ(WindowSideFor(std::numeric_limits<int32_t>::max()), 960);
}
