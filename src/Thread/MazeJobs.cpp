#include "Thread/MazeJobs.hpp"

#include <limits>

int32_t StepSeed(int32_t seed, int32_t step)
{
    const uint32_t raw = (uint32_t)seed + (uint32_t)step;
    if (raw <= (uint32_t)std::numeric_limits<int32_t>::max())
        return (int32_t)raw;
    return -(int32_t)(~raw) - 1;
}

std::unique_ptr<Maze> BuildMaze(const MazeRequest& request)
{
    auto maze = std::make_unique<Maze>(request.seed,
                                       request.size,
                                       request.start,
                                       request.goal,
                                       request.minValidPaths,
                                       request.algo);
    maze->GenerateMaze(request.algo, request.settings);
    maze->FindPath();
    return maze;
}

std::future<std::unique_ptr<Maze>> SubmitBuild(ThreadPool& pool, const MazeRequest& request)
{
    return pool.enqueue([request]() { return BuildMaze(request); });
}
