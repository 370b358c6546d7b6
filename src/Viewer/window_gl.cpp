#include "Viewer/core.hpp"
#include "Viewer/ViewerInternal.hpp"

#include <spdlog/spdlog.h>

void Viewer::initWindow(int32_t mazeSize)
{
    glfwSetErrorCallback([](int code, const char* what) {
        spdlog::error("glfw error {}: {}", code, what);
    });

    if (!glfwInit())
        throw std::runtime_error("glfwInit failed");

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
#if defined(__APPLE__)
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
#endif

    // square window, a whole number of pixels per cell
    const int side = WindowSideFor(mazeSize);
    GLFWwindow* win = glfwCreateWindow(side, side, "Maze", nullptr, nullptr);
    if (!win)
    {
        glfwTerminate();
        throw std::runtime_error("glfwCreateWindow failed");
    }

    window = win;
    glfwMakeContextCurrent(win);
    glfwSwapInterval(1);

    if (!gladLoadGLLoader((GLADloadproc)glfwGetProcAddress))
    {
        shutdownGL();
        throw std::runtime_error("gladLoadGLLoader failed");
    }

    int w = side, h = side;
    glfwGetFramebufferSize(win, &w, &h);
    onFramebufferResized(w, h);

    spdlog::debug("window {}x{} px for a {}x{} maze, GL {}", w, h, mazeSize, mazeSize,
                  reinterpret_cast<const char*>(glGetString(GL_VERSION)));
}

void Viewer::shutdownGL()
{
    if (!window) return;

    releaseMazePipeline();

    glfwDestroyWindow(static_cast<GLFWwindow*>(window));
    window = nullptr;
    glfwTerminate();
}
