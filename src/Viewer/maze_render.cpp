#include "Viewer/core.hpp"
#include "Viewer/ViewerInternal.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>

namespace
{

// Vertices arrive in cell units (x = column, y = row, both growing away from
// the top-left corner); uGrid maps them onto the square viewport.
const char* kCellVs = R"GLSL(
    #version 330 core
    layout(location = 0) in vec2 aCell;
    layout(location = 1) in vec3 aColor;
    uniform vec2 uGrid;
    out vec3 vColor;
    void main() {
        vec2 ndc = vec2(aCell.x / uGrid.x * 2.0 - 1.0, 1.0 - aCell.y / uGrid.y * 2.0);
        vColor = aColor;
        gl_Position = vec4(ndc, 0.0, 1.0);
    }
)GLSL";

const char* kCellFs = R"GLSL(
    #version 330 core
    in vec3 vColor;
    out vec4 FragColor;
    void main() {
        FragColor = vec4(vColor, 1.0);
    }
)GLSL";

std::string InfoLog(GLuint object, bool isProgram)
{
    GLint len = 0;
    if (isProgram) glGetProgramiv(object, GL_INFO_LOG_LENGTH, &len);
    else           glGetShaderiv(object, GL_INFO_LOG_LENGTH, &len);

    std::string log((size_t)std::max(len, 1), '\0');
    if (isProgram) glGetProgramInfoLog(object, len, nullptr, &log[0]);
    else           glGetShaderInfoLog(object, len, nullptr, &log[0]);
    return log;
}

// Compiles and links one vertex/fragment pair; throws with the driver's log.
GLuint BuildProgram(const char* vsSrc, const char* fsSrc)
{
    GLuint stages[2] = { glCreateShader(GL_VERTEX_SHADER), glCreateShader(GL_FRAGMENT_SHADER) };
    const char* sources[2] = { vsSrc, fsSrc };

    GLuint prog = glCreateProgram();
    std::string failure;

    for (int i = 0; i < 2 && failure.empty(); ++i)
    {
        glShaderSource(stages[i], 1, &sources[i], nullptr);
        glCompileShader(stages[i]);

        GLint ok = 0;
        glGetShaderiv(stages[i], GL_COMPILE_STATUS, &ok);
        if (!ok)
            failure = (i == 0 ? "vertex shader: " : "fragment shader: ") + InfoLog(stages[i], false);
        else
            glAttachShader(prog, stages[i]);
    }

    if (failure.empty())
    {
        glLinkProgram(prog);

        GLint ok = 0;
        glGetProgramiv(prog, GL_LINK_STATUS, &ok);
        if (!ok) failure = "link: " + InfoLog(prog, true);
    }

    glDeleteShader(stages[0]);
    glDeleteShader(stages[1]);

    if (!failure.empty())
    {
        glDeleteProgram(prog);
        spdlog::error("maze shader: {}", failure);
        throw std::runtime_error("maze shader failed to build");
    }
    return prog;
}

} // namespace

void Viewer::initMazePipeline()
{
    program = BuildProgram(kCellVs, kCellFs);
    gridLoc = glGetUniformLocation(program, "uGrid");

    // cell2 + rgb3, one triangle list for the whole grid
    glGenVertexArrays(1, &vao);
    glGenBuffers(1, &vbo);

    glBindVertexArray(vao);
    glBindBuffer(GL_ARRAY_BUFFER, vbo);

    glEnableVertexAttribArray(0);
    glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, sizeof(Vertex), (void*)offsetof(Vertex, x));
    glEnableVertexAttribArray(1);
    glVertexAttribPointer(1, 3, GL_FLOAT, GL_FALSE, sizeof(Vertex), (void*)offsetof(Vertex, r));

    glBindVertexArray(0);
    glBindBuffer(GL_ARRAY_BUFFER, 0);
}

void Viewer::releaseMazePipeline()
{
    if (program) { glDeleteProgram(program); program = 0; }
    if (vbo) { glDeleteBuffers(1, &vbo); vbo = 0; }
    if (vao) { glDeleteVertexArrays(1, &vao); vao = 0; }
    vertexCount = 0;
}

void Viewer::rebuildMeshIfDirty()
{
    if (!maze || !mazeDirty) return;

    mazeDirty = false;
    rebuildMeshFromMaze(*maze);
}

void Viewer::rebuildMeshFromMaze(const Maze& m)
{
    const std::vector<Vertex> verts = BuildMazeMesh(m, showSolution);

    glBindBuffer(GL_ARRAY_BUFFER, vbo);
    glBufferData(GL_ARRAY_BUFFER, (GLsizeiptr)(verts.size() * sizeof(Vertex)), verts.data(), GL_DYNAMIC_DRAW);
    glBindBuffer(GL_ARRAY_BUFFER, 0);

    vertexCount = (int)verts.size();
    meshRows = m.grid.Rows();
    meshCols = m.grid.Cols();
}

void Viewer::drawMaze()
{
    rebuildMeshIfDirty();

    if (vertexCount <= 0) return;

    // square viewport centred in the framebuffer
    const int sidePx = std::min(fbW, fbH);
    glViewport((fbW - sidePx) / 2, (fbH - sidePx) / 2, sidePx, sidePx);

    glUseProgram(program);
    glUniform2f(gridLoc, (float)meshCols, (float)meshRows);
    glBindVertexArray(vao);
    glDrawArrays(GL_TRIANGLES, 0, vertexCount);
    glBindVertexArray(0);
    glUseProgram(0);
}
