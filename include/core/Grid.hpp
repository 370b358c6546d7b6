#pragma once
#include "core/Common.hpp"
#include "core/DataStruct.hpp"

#include <initializer_list>

class Grid
{
public:
    Grid() = default;
    Grid(int32_t rows, int32_t cols, Cell fill = Cell::Wall);

    // Stage a layout from literal rows, 1 = passage and 0 = wall.
    static Grid FromRows(std::initializer_list<std::initializer_list<int>> rows);

    int32_t Rows() const noexcept { return rows_; }
    int32_t Cols() const noexcept { return cols_; }

    bool InBounds(int32_t row, int32_t col) const noexcept
    {
        return row >= 0 && col >= 0 && row < rows_ && col < cols_;
    }
    bool InBounds(const Position& p) const noexcept { return InBounds(p.row, p.col); }

    // Throws std::out_of_range outside the grid.
    Cell At(int32_t row, int32_t col) const;
    Cell At(const Position& p) const { return At(p.row, p.col); }

    void Set(int32_t row, int32_t col, Cell cell);
    void Set(const Position& p, Cell cell) { Set(p.row, p.col, cell); }

    bool IsPassable(const Position& p) const { return At(p) == Cell::Passage; }

    void Fill(Cell cell);
    size_t CountPassable() const;

    // Up, down, left, right. nullopt where the neighbour falls outside.
    Neighbours GetCellNeighbours(int32_t row, int32_t col) const;

    bool operator==(const Grid& other) const
    {
        return rows_ == other.rows_ && cols_ == other.cols_ && cells_ == other.cells_;
    }
    bool operator!=(const Grid& other) const { return !(*this == other); }

private:
    size_t index_(int32_t row, int32_t col) const;

    int32_t rows_{0};
    int32_t cols_{0};
    std::vector<Cell> cells_{};
};
