#pragma once
#include "core/Common.hpp"

#include <filesystem>
#include <string>

class Maze;

class MazeExporter
{
public:
    // Self-contained HTML page: one element per cell tagged cell-wall or
    // cell-passage, plus cell-start, cell-goal and (with drawSolution and a
    // cached path) cell-path. Title and heading read "Maze #<seed>".
    static std::string RenderHtml(const Maze& maze, bool drawSolution = false);

    // Throws std::runtime_error when the file cannot be written.
    static void ExportHtml(const Maze& maze,
                           const std::filesystem::path& file,
                           bool drawSolution = false);
};
