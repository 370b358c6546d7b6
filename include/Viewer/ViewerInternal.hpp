#pragma once
#include "core/Common.hpp"
#include "Viewer/Mesh.hpp"

#include <glad/glad.h>
#include <GLFW/glfw3.h>
