#pragma once
#include "core/Common.hpp"
#include "core/Maze.hpp"

// one corner of a cell quad, in cell units
struct Vertex
{
    float x, y;
    float r, g, b;
};

struct Rgb
{
    float r, g, b;
};

// same palette as MazeExporter's stylesheet
constexpr Rgb kWallColor    { 0.05f, 0.05f, 0.05f };
constexpr Rgb kPassageColor { 0.95f, 0.95f, 0.95f };
constexpr Rgb kPathColor    { 0.20f, 0.55f, 1.00f };
constexpr Rgb kStartColor   { 0.20f, 0.85f, 0.25f };
constexpr Rgb kGoalColor    { 0.95f, 0.20f, 0.20f };

// 向顶点数组添加一个格子（两个三角形）
inline void PushCell(std::vector<Vertex>& out, int row, int col, const Rgb& c)
{
    const float x0 = (float)col, x1 = (float)(col + 1);
    const float y0 = (float)row, y1 = (float)(row + 1);

    out.push_back({x0, y0, c.r, c.g, c.b});
    out.push_back({x1, y0, c.r, c.g, c.b});
    out.push_back({x1, y1, c.r, c.g, c.b});

    out.push_back({x0, y0, c.r, c.g, c.b});
    out.push_back({x1, y1, c.r, c.g, c.b});
    out.push_back({x0, y1, c.r, c.g, c.b});
}

// Two triangles per cell, row-major, coloured wall/passage, then path (when
// shown and cached), then start and goal on top.
std::vector<Vertex> BuildMazeMesh(const Maze& m, bool showSolution);

// Initial window side: 16 px per cell, kept between 320 and 960 px.
inline int WindowSideFor(int32_t mazeSize)
{
    return std::clamp(mazeSize, 20, 60) * 16;
}
