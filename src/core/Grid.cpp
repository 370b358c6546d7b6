#include "core/Grid.hpp"

#include <string>

Grid::Grid(int32_t rows, int32_t cols, Cell fill)
    : rows_(rows), cols_(cols)
{
    if (rows < 0 || cols < 0)
        throw std::invalid_argument("grid dimensions must be non-negative");

    cells_.assign((size_t)rows * (size_t)cols, fill);
}

Grid Grid::FromRows(std::initializer_list<std::initializer_list<int>> rows)
{
    const int32_t h = (int32_t)rows.size();
    const int32_t w = (h > 0) ? (int32_t)rows.begin()->size() : 0;

    Grid g(h, w);
    int32_t r = 0;
    for (const auto& line : rows)
    {
        if ((int32_t)line.size() != w)
            throw std::invalid_argument("grid rows must all have the same length");

        int32_t c = 0;
        for (int v : line)
        {
            g.Set(r, c, v != 0 ? Cell::Passage : Cell::Wall);
            ++c;
        }
        ++r;
    }
    return g;
}

size_t Grid::index_(int32_t row, int32_t col) const
{
    if (!InBounds(row, col))
    {
        throw std::out_of_range(
            "cell (" + std::to_string(row) + ", " + std::to_string(col) +
            ") is outside a " + std::to_string(rows_) + "x" + std::to_string(cols_) + " grid");
    }
    return (size_t)row * (size_t)cols_ + (size_t)col;
}

Cell Grid::At(int32_t row, int32_t col) const
{
    return cells_[index_(row, col)];
}

void Grid::Set(int32_t row, int32_t col, Cell cell)
{
    cells_[index_(row, col)] = cell;
}

void Grid::Fill(Cell cell)
{
    std::fill(cells_.begin(), cells_.end(), cell);
}

size_t Grid::CountPassable() const
{
    return (size_t)std::count(cells_.begin(), cells_.end(), Cell::Passage);
}

Neighbours Grid::GetCellNeighbours(int32_t row, int32_t col) const
{
    // the queried cell itself has to exist
    (void)index_(row, col);

    Neighbours out{};
    for (int dir = 0; dir < 4; ++dir)
    {
        const int32_t nr = row + kDirRow[dir];
        const int32_t nc = col + kDirCol[dir];
        if (!InBounds(nr, nc)) continue;

        out[dir] = Neighbour{ nr, nc, At(nr, nc) };
    }
    return out;
}
