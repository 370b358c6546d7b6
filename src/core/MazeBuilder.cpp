#include "core/MazeBuilder.hpp"
#include "core/Errors.hpp"
#include "core/Maze.hpp"

#include <spdlog/spdlog.h>

#include <deque>
#include <limits>
#include <random>
#include <string>

namespace
{

size_t KeyOf(const Grid& g, int32_t row, int32_t col)
{
    return (size_t)row * (size_t)g.Cols() + (size_t)col;
}

int CountOpenNeighbours(const Grid& g, const Position& p)
{
    int open = 0;
    for (const auto& n : g.GetCellNeighbours(p.row, p.col))
        if (n && n->cell == Cell::Passage) ++open;
    return open;
}

// Randomized Prim over cells: a frontier wall is opened only while it touches
// exactly one passage, so the carved region stays a tree rooted at start.
void CarveSpanningTree(Grid& g, const Position& start, std::mt19937& rng)
{
    g.Fill(Cell::Wall);
    g.Set(start, Cell::Passage);

    std::vector<Position> frontier;
    std::vector<uint8_t> queued((size_t)g.Rows() * (size_t)g.Cols(), 0);
    queued[KeyOf(g, start.row, start.col)] = 1;

    auto pushNeighbours = [&](const Position& p) {
        for (const auto& n : g.GetCellNeighbours(p.row, p.col))
        {
            if (!n || n->cell == Cell::Passage) continue;

            const size_t k = KeyOf(g, n->row, n->col);
            if (queued[k]) continue;

            queued[k] = 1;
            frontier.push_back({ n->row, n->col });
        }
    };

    pushNeighbours(start);

    while (!frontier.empty())
    {
        std::uniform_int_distribution<size_t> pick(0, frontier.size() - 1);
        const size_t i = pick(rng);

        const Position cell = frontier[i];
        frontier[i] = frontier.back();
        frontier.pop_back();

        if (CountOpenNeighbours(g, cell) != 1) continue;

        g.Set(cell, Cell::Passage);
        pushNeighbours(cell);
    }
}

int DirTo(const Position& from, const Position& to)
{
    for (int d = 0; d < 4; ++d)
        if (from.row + kDirRow[d] == to.row && from.col + kDirCol[d] == to.col)
            return d;
    return -1;
}

// Routes held as unit flow over split cells. Every cell other than start and
// goal has an in side and an out side joined by a single unit, so no two
// routes share a cell. Augmenting searches may run routes backwards to
// reroute them, which finds the maximum number of disjoint routes.
class RouteFlow
{
public:
    RouteFlow(const Grid& grid, const Position& start, const Position& goal)
        : grid_(grid)
        , start_(start)
        , goal_(goal)
        , used_((size_t)grid.Rows() * (size_t)grid.Cols(), 0)
        , sent_((size_t)grid.Rows() * (size_t)grid.Cols(), std::array<uint8_t, 4>{})
    {
    }

    void AddRoute(const Path& path)
    {
        for (size_t i = 0; i + 1 < path.size(); ++i)
        {
            const int d = DirTo(path[i], path[i + 1]);
            if (d < 0)
                throw std::invalid_argument("route cells must be neighbours");

            sent_[Key(path[i])][d] = 1;
            if (i > 0) used_[Key(path[i])] = 1;
        }
    }

    // One more route through the residual graph, cheapest first. Wall cells
    // are closed unless `throughWalls`, then each one crossed costs one.
    // On success the route set is updated and the walls crossed are
    // returned; nullopt when no further route exists.
    std::optional<std::vector<Position>> Augment(bool throughWalls, const std::array<int, 4>& dirs)
    {
        const size_t N = used_.size();
        constexpr int32_t kInf = std::numeric_limits<int32_t>::max();
        constexpr size_t kNone = (size_t)-1;

        // state = cell * 2 + side, side 0 = in, 1 = out
        std::vector<int32_t> cost(2 * N, kInf);
        std::vector<size_t> parent(2 * N, kNone);
        std::deque<size_t> dq;

        const size_t source = Key(start_) * 2 + 1;
        const size_t sink = Key(goal_) * 2;
        cost[source] = 0;
        dq.push_back(source);

        auto relax = [&](size_t from, size_t to, int32_t step) {
            if (cost[from] + step >= cost[to]) return;
            cost[to] = cost[from] + step;
            parent[to] = from;
            if (step == 0) dq.push_front(to);
            else           dq.push_back(to);
        };

        while (!dq.empty())
        {
            const size_t cur = dq.front();
            dq.pop_front();
            if (cur == sink) break;

            const size_t k = cur / 2;
            const Position p = PosOf(k);
            const bool out = (cur % 2) == 1;

            if (out && k != Key(start_) && used_[k])
                relax(cur, k * 2, 0);
            if (!out && !used_[k])
                relax(cur, k * 2 + 1, 0);

            for (int d : dirs)
            {
                const Position np{ p.row + kDirRow[d], p.col + kDirCol[d] };
                if (!grid_.InBounds(np) || np == start_) continue;

                const size_t nk = Key(np);
                if (out)
                {
                    if (sent_[k][d]) continue;

                    int32_t step = 0;
                    if (grid_.At(np) == Cell::Wall)
                    {
                        if (!throughWalls) continue;
                        step = 1;
                    }
                    relax(cur, nk * 2, step);
                }
                else if (sent_[nk][DirTo(np, p)])
                {
                    // walk an existing route backwards
                    relax(cur, nk * 2 + 1, 0);
                }
            }
        }

        if (cost[sink] == kInf)
            return std::nullopt;

        std::vector<Position> walls;
        for (size_t s = sink; parent[s] != kNone; s = parent[s])
        {
            const size_t from = parent[s];
            const size_t fk = from / 2;
            const size_t sk = s / 2;

            if (fk == sk)
            {
                used_[sk] = (s % 2) == 1 ? 1 : 0;
                continue;
            }

            if (from % 2 == 1)
            {
                sent_[fk][DirTo(PosOf(fk), PosOf(sk))] = 1;
                if (grid_.At(PosOf(sk)) == Cell::Wall)
                    walls.push_back(PosOf(sk));
            }
            else
            {
                sent_[sk][DirTo(PosOf(sk), PosOf(fk))] = 0;
            }
        }
        return walls;
    }

    std::vector<Path> Routes() const
    {
        std::vector<Path> routes;
        for (int d = 0; d < 4; ++d)
        {
            if (!sent_[Key(start_)][d]) continue;

            Path route{ start_, { start_.row + kDirRow[d], start_.col + kDirCol[d] } };
            while (route.back() != goal_ && route.size() <= used_.size())
            {
                const size_t k = Key(route.back());
                int next = -1;
                for (int e = 0; e < 4 && next < 0; ++e)
                    if (sent_[k][e]) next = e;
                if (next < 0) break;

                route.push_back({ route.back().row + kDirRow[next], route.back().col + kDirCol[next] });
            }
            routes.push_back(std::move(route));
        }
        return routes;
    }

private:
    size_t Key(const Position& p) const { return KeyOf(grid_, p.row, p.col); }

    Position PosOf(size_t k) const
    {
        return { (int32_t)(k / (size_t)grid_.Cols()), (int32_t)(k % (size_t)grid_.Cols()) };
    }

    const Grid& grid_;
    Position start_;
    Position goal_;
    std::vector<uint8_t> used_;
    std::vector<std::array<uint8_t, 4>> sent_;
};

constexpr std::array<int, 4> kFixedDirs = { Up, Down, Left, Right };

// Carves the fewest walls that let one more disjoint route through, given
// the current maximal route set. False when even an open grid has no room.
bool OpenTunnel(Grid& grid,
                const RouteCount& count,
                const Position& start,
                const Position& goal,
                std::mt19937& rng)
{
    std::array<int, 4> dirs = kFixedDirs;
    std::shuffle(dirs.begin(), dirs.end(), rng);

    RouteFlow flow(grid, start, goal);
    for (const Path& route : count.paths)
        flow.AddRoute(route);

    const auto walls = flow.Augment(true, dirs);
    if (!walls)
        return false;

    for (const Position& p : *walls)
        grid.Set(p, Cell::Passage);

    spdlog::debug("tunnel opened {} wall cell(s)", walls->size());
    return true;
}

} // namespace

void MazeBuilder::BlockInterior(Grid& grid, const Path& path)
{
    if (path.size() <= 2) return;

    for (size_t i = 1; i + 1 < path.size(); ++i)
        grid.Set(path[i], Cell::Wall);
}

RouteCount MazeBuilder::CountRoutes(const PathFinder& finder,
                                    const Grid& grid,
                                    const Position& start,
                                    const Position& goal,
                                    int32_t limit)
{
    RouteCount out;
    if (grid.At(start) != Cell::Passage || grid.At(goal) != Cell::Passage)
        return out;

    Grid blocked = grid;
    RouteFlow flow(grid, start, goal);

    // cheap first pass with the maze's own strategy
    while (out.routes < limit)
    {
        const std::optional<Path> route = finder.Search(blocked, start, goal);
        if (!route) break;

        if (route->size() <= 2)
        {
            out.routes = limit;
            out.paths = { *route };
            return out;
        }
        BlockInterior(blocked, *route);
        flow.AddRoute(*route);
        ++out.routes;
    }

    // then reroute until no more fit
    while (out.routes < limit && flow.Augment(false, kFixedDirs))
        ++out.routes;

    out.paths = flow.Routes();
    return out;
}

void MazeBuilder::Build(Maze& maze, PathAlgo algo, const BuilderSettings& settings)
{
    Grid scratch(maze.rows, maze.cols, Cell::Wall);

    // endpoints outside the grid fail here, before any carving
    (void)scratch.At(maze.start);
    (void)scratch.At(maze.goal);

    const int32_t want = maze.minValidPaths;
    const int32_t rounds = settings.maxRepairRounds > 0
        ? settings.maxRepairRounds
        : 4 * want + 8;

    std::mt19937 rng((uint32_t)maze.seed);
    const auto finder = MakePathFinder(algo, maze);

    int32_t attempt = 0;
    bool roomLeft = true;
    while (roomLeft && attempt < settings.maxAttempts)
    {
        ++attempt;
        CarveSpanningTree(scratch, maze.start, rng);

        RouteCount count = CountRoutes(*finder, scratch, maze.start, maze.goal, want);
        int32_t round = 0;
        while (count.routes < want && round < rounds)
        {
            if (!OpenTunnel(scratch, count, maze.start, maze.goal, rng))
            {
                roomLeft = false;
                break;
            }

            ++round;
            count = CountRoutes(*finder, scratch, maze.start, maze.goal, want);
        }

        if (count.routes >= want)
        {
            spdlog::debug("seed {}: {} route(s) after attempt {} ({} tunnel(s), {} passage cells)",
                          maze.seed, count.routes, attempt, round, scratch.CountPassable());

            maze.grid = std::move(scratch);
            maze.path.reset();
            return;
        }

        spdlog::debug("seed {}: attempt {}/{} reached {} of {} route(s)",
                      maze.seed, attempt, settings.maxAttempts, count.routes, want);
    }

    if (!roomLeft)
        spdlog::warn("seed {}: {} disjoint route(s) do not fit between start and goal",
                     maze.seed, want);
    else
        spdlog::warn("seed {}: giving up after {} attempt(s)", maze.seed, attempt);

    throw MazeGenerationError(
        "could not carve " + std::to_string(want) + " route(s) between " +
        "start and goal in a " + std::to_string(maze.rows) + "x" + std::to_string(maze.cols) +
        " maze with seed " + std::to_string(maze.seed) +
        " after " + std::to_string(attempt) + " attempt(s)");
}
