#include "Viewer/core.hpp"
#include "Viewer/ViewerInternal.hpp"
#include "core/Errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

Viewer& Viewer::getInstance()
{
    static Viewer inst;
    return inst;
}

Viewer::Viewer() = default;

Viewer::~Viewer()
{
    pool.shutdown();
    shutdownGL();
}

void Viewer::run(const MazeRequest& first)
{
    request = first;

    initWindow(request.size);
    initMazePipeline();
    initInputCallbacks();
    updateWindowTitle();

    // 初始生成一个迷宫，避免空白
    requestBuild(request.seed);

    auto* win = static_cast<GLFWwindow*>(window);
    while (win && !glfwWindowShouldClose(win))
    {
        collectBuild();

        glClearColor(0.08f, 0.08f, 0.09f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);

        drawMaze();

        glfwSwapBuffers(win);
        glfwPollEvents();
    }

    // let an in-flight build finish before the window goes away
    if (building.valid()) building.wait();

    shutdownGL();
}

void Viewer::updateWindowTitle()
{
    if (!window) return;

    std::string title = "Maze #" + std::to_string(request.seed);
    if (building.valid())
        title += "  |  building seed=" + std::to_string(buildingSeed) + "...";
    else if (!lastError.empty())
        title += "  |  " + lastError;
    else if (maze && maze->path)
        title += "  |  path=" + std::to_string(maze->path->size());
    else if (maze)
        title += "  |  no path";

    if (!showSolution) title += "  (solution hidden)";

    glfwSetWindowTitle(static_cast<GLFWwindow*>(window), title.c_str());
}

void Viewer::requestBuild(int32_t seed)
{
    // one build at a time; extra key presses are dropped
    if (building.valid()) return;

    MazeRequest next = request;
    next.seed = seed;

    buildingSeed = seed;
    building = SubmitBuild(pool, next);
    updateWindowTitle();
}

void Viewer::collectBuild()
{
    if (!building.valid()) return;
    if (building.wait_for(std::chrono::seconds(0)) != std::future_status::ready) return;

    try
    {
        maze = building.get();
        request.seed = maze->seed;
        lastError.clear();
        mazeDirty = true;
        spdlog::info("seed {}: {}", maze->seed,
                     maze->path ? "path length " + std::to_string(maze->path->size())
                                : std::string("no path"));
    }
    catch (const MazeGenerationError& e)
    {
        // keep showing the previous maze
        lastError = "seed " + std::to_string(buildingSeed) + " failed";
        spdlog::warn("{}", e.what());
    }

    updateWindowTitle();
}

void Viewer::onKey(int key)
{
    switch (key)
    {
    case GLFW_KEY_ESCAPE:
        glfwSetWindowShouldClose(static_cast<GLFWwindow*>(window), GLFW_TRUE);
        break;
    case GLFW_KEY_N:
        requestBuild(StepSeed(request.seed, 1));
        break;
    case GLFW_KEY_B:
        requestBuild(StepSeed(request.seed, -1));
        break;
    case GLFW_KEY_S:
        showSolution = !showSolution;
        mazeDirty = true;
        updateWindowTitle();
        break;
    default:
        break;
    }
}

void Viewer::onFramebufferResized(int width, int height)
{
    fbW = std::max(1, width);
    fbH = std::max(1, height);
    // 不需要在这里 rebuild mesh；drawMaze() 每帧都会按 fbW/fbH 设 viewport
}
