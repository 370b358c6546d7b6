#include "core/BFS.hpp"

#include <queue>
#include <vector>

std::optional<Path> BFSPathFinder::Search(const Grid& grid,
                                          const Position& start,
                                          const Position& goal) const
{
    // both endpoints are bounds-checked before either is tested
    const Cell from = grid.At(start);
    const Cell to = grid.At(goal);
    if (from != Cell::Passage || to != Cell::Passage)
        return std::nullopt;

    if (start == goal)
        return Path{ start };

    const int32_t W = grid.Cols();
    const size_t N = (size_t)grid.Rows() * (size_t)W;

    auto key = [&](const Position& p) {
        return (size_t)p.row * (size_t)W + (size_t)p.col;
    };

    constexpr size_t kNone = (size_t)-1;
    std::vector<bool> visited(N, false);
    std::vector<size_t> parent(N, kNone);

    std::queue<Position> q;
    q.push(start);
    visited[key(start)] = true;

    bool found = false;
    while (!q.empty())
    {
        const Position cur = q.front();
        q.pop();

        if (cur == goal)
        {
            found = true;
            break;
        }

        const Neighbours next = grid.GetCellNeighbours(cur.row, cur.col);
        for (const auto& n : next)
        {
            if (!n || n->cell != Cell::Passage) continue;

            const Position np{ n->row, n->col };
            const size_t k = key(np);
            if (visited[k]) continue;

            // mark on enqueue so no cell is queued twice
            visited[k] = true;
            parent[k] = key(cur);
            q.push(np);
        }
    }

    if (!found)
        return std::nullopt;

    Path path;
    for (size_t k = key(goal); k != kNone; k = parent[k])
        path.push_back({ (int32_t)(k / (size_t)W), (int32_t)(k % (size_t)W) });

    std::reverse(path.begin(), path.end());
    return path;
}
