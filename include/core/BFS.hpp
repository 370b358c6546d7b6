#pragma once
#include "core/PathFinder.hpp"

// Breadth-first search over the 4-connected passage graph.
// Neighbours are expanded up, down, left, right, which fixes which of
// several equally short paths is returned.
class BFSPathFinder : public PathFinder
{
public:
    using PathFinder::PathFinder;

    std::optional<Path> Search(const Grid& grid,
                               const Position& start,
                               const Position& goal) const override;
};
