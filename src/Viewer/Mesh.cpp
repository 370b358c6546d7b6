#include "Viewer/Mesh.hpp"

std::vector<Vertex> BuildMazeMesh(const Maze& m, bool showSolution)
{
    const Grid& grid = m.grid;
    const int rows = grid.Rows();
    const int cols = grid.Cols();

    std::vector<Vertex> verts;
    if (rows <= 0 || cols <= 0) return verts;

    std::vector<uint8_t> onPath((size_t)rows * (size_t)cols, 0);
    if (showSolution && m.path)
    {
        for (const auto& p : *m.path)
            if (grid.InBounds(p)) onPath[(size_t)p.row * (size_t)cols + (size_t)p.col] = 1;
    }

    verts.reserve((size_t)rows * (size_t)cols * 6);
    for (int r = 0; r < rows; ++r)
    {
        for (int c = 0; c < cols; ++c)
        {
            const Position p{ r, c };

            Rgb color = grid.At(p) == Cell::Passage ? kPassageColor : kWallColor;
            if (onPath[(size_t)r * (size_t)cols + (size_t)c]) color = kPathColor;
            if (p == m.start) color = kStartColor;
            if (p == m.goal)  color = kGoalColor;

            PushCell(verts, r, c, color);
        }
    }
    return verts;
}
