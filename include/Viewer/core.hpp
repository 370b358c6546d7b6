#pragma once

#include "core/Common.hpp"
#include "core/Maze.hpp"
#include "Thread/MazeJobs.hpp"
#include "Thread/ThreadPool.hpp"

class Viewer {
public:
    static Viewer& getInstance();

    // Opens the window and renders until it is closed. `first` is built
    // before the first frame; N/B step its seed.
    void run(const MazeRequest& first);

    void onFramebufferResized(int width, int height);
    void onKey(int key);

private:
    Viewer();
    ~Viewer();

private:
    // window/gl
    void initWindow(int32_t mazeSize);
    void shutdownGL();
    void initInputCallbacks();
    void updateWindowTitle();

    // render
    void initMazePipeline();
    void releaseMazePipeline();
    void drawMaze();
    void rebuildMeshFromMaze(const Maze& m);
    void rebuildMeshIfDirty();

    // work
    void requestBuild(int32_t seed);
    void collectBuild();

private:
    // -------- window / gl state --------
    void* window = nullptr; // actually GLFWwindow*
    int fbW = 900;
    int fbH = 900;

    uint32_t program = 0;
    uint32_t vao = 0;
    uint32_t vbo = 0;
    int32_t gridLoc = -1;
    int vertexCount = 0;
    int meshRows = 0;
    int meshCols = 0;

    // -------- maze state --------
    ThreadPool pool{1};
    MazeRequest request{};
    std::future<std::unique_ptr<Maze>> building;
    int32_t buildingSeed = 0;

    std::unique_ptr<Maze> maze;
    bool mazeDirty = false;
    bool showSolution = true;
    std::string lastError;
};
