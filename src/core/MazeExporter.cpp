#include "core/MazeExporter.hpp"
#include "core/Maze.hpp"

#include <fstream>
#include <sstream>

namespace
{

// wall / passage / start / goal / path, same palette as the viewer
constexpr const char* kStyle = R"CSS(
    body { background: #141417; color: #f2f2f2; font-family: sans-serif; }
    h1 { font-size: 1.4em; }
    .maze { display: grid; gap: 0; width: min(90vmin, 900px); }
    .cell { aspect-ratio: 1 / 1; }
    .cell-wall { background: #0d0d0d; }
    .cell-passage { background: #f2f2f2; }
    .cell-path { background: #338cff; }
    .cell-start { background: #33d940; }
    .cell-goal { background: #f23333; }
)CSS";

} // namespace

std::string MazeExporter::RenderHtml(const Maze& maze, bool drawSolution)
{
    const Grid& grid = maze.grid;
    const int32_t H = grid.Rows();
    const int32_t W = grid.Cols();

    std::vector<uint8_t> onPath((size_t)W * (size_t)H, 0);
    if (drawSolution && maze.path)
    {
        for (const auto& p : *maze.path)
            if (grid.InBounds(p)) onPath[(size_t)p.row * (size_t)W + (size_t)p.col] = 1;
    }

    const std::string title = "Maze #" + std::to_string(maze.seed);

    std::ostringstream html;
    html << "<!DOCTYPE html>\n"
         << "<html>\n"
         << "<head>\n"
         << "<meta charset=\"utf-8\">\n"
         << "<title>" << title << "</title>\n"
         << "<style>" << kStyle << "    .maze { grid-template-columns: repeat(" << W << ", 1fr); }\n"
         << "</style>\n"
         << "</head>\n"
         << "<body>\n"
         << "<h1>" << title << "</h1>\n"
         << "<p>" << maze.rows << "x" << maze.cols
         << ", start " << maze.start << ", goal " << maze.goal;
    if (maze.path)
        html << ", path length " << maze.path->size();
    html << "</p>\n"
         << "<div class=\"maze\">\n";

    for (int32_t r = 0; r < H; ++r)
    {
        for (int32_t c = 0; c < W; ++c)
        {
            const Position p{ r, c };

            html << "<div class=\"cell "
                 << (grid.At(p) == Cell::Passage ? "cell-passage" : "cell-wall");

            if (onPath[(size_t)r * (size_t)W + (size_t)c])
                html << " cell-path";
            if (p == maze.start)
                html << " cell-start";
            if (p == maze.goal)
                html << " cell-goal";

            html << "\" data-row=\"" << r << "\" data-col=\"" << c << "\"></div>\n";
        }
    }

    html << "</div>\n"
         << "</body>\n"
         << "</html>\n";
    return html.str();
}

void MazeExporter::ExportHtml(const Maze& maze,
                              const std::filesystem::path& file,
                              bool drawSolution)
{
    std::ofstream out(file, std::ios::out | std::ios::trunc);
    if (!out)
        throw std::runtime_error("cannot open " + file.string() + " for writing");

    out << RenderHtml(maze, drawSolution);
    out.flush();
    if (!out)
        throw std::runtime_error("failed writing " + file.string());
}
