#include "Viewer/core.hpp"
#include "Viewer/ViewerInternal.hpp"

namespace
{

Viewer* ViewerOf(GLFWwindow* w)
{
    return static_cast<Viewer*>(glfwGetWindowUserPointer(w));
}

} // namespace

void Viewer::initInputCallbacks()
{
    GLFWwindow *win = static_cast<GLFWwindow *>(window);
    glfwSetWindowUserPointer(win, this);

    glfwSetKeyCallback(win, [](GLFWwindow *w, int key, int /*scancode*/, int action, int /*mods*/)
    {
        if (action != GLFW_PRESS) return;
        if (Viewer* self = ViewerOf(w)) self->onKey(key);
    });

    // only records the size; drawMaze() applies it to the viewport
    glfwSetFramebufferSizeCallback(win, [](GLFWwindow *w, int width, int height)
    {
        if (Viewer* self = ViewerOf(w)) self->onFramebufferResized(width, height);
    });
}
