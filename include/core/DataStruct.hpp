#pragma once
#include "core/Common.hpp"

#include <ostream>

enum class Cell : uint8_t
{
    Wall = 0,
    Passage = 1,
};

struct Position
{
    int32_t row;
    int32_t col;

    bool operator==(const Position& other) const
    {
        return row == other.row && col == other.col;
    }

    bool operator!=(const Position& other) const
    {
        return !(*this == other);
    }
};

inline std::ostream& operator<<(std::ostream& os, const Position& p)
{
    return os << "(" << p.row << ", " << p.col << ")";
}

using Path = std::vector<Position>;

// index into Neighbours; order is up, down, left, right
enum Direction : int
{
    Up = 0,
    Down = 1,
    Left = 2,
    Right = 3,
};

constexpr int kDirRow[4] = { -1, 1, 0, 0 };
constexpr int kDirCol[4] = { 0, 0, -1, 1 };

struct Neighbour
{
    int32_t row;
    int32_t col;
    Cell cell;

    bool operator==(const Neighbour& other) const
    {
        return row == other.row && col == other.col && cell == other.cell;
    }
};

using Neighbours = std::array<std::optional<Neighbour>, 4>;
