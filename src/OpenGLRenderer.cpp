#include "OpenGLRenderer.h"

#include <cstring>
#include <fstream>
#include <glm/gtc/type_ptr.hpp>
#include <iostream>

OpenGLRenderer::OpenGLRenderer()
    : m_BatchVAO(0)              // VAO for batched circles
    , m_BatchVBO(0)              // VBO for circle vertices
    , m_ShaderProgram(0)         // Flake shader
    , m_Projection(1.0f)         // Identity until the host sets one
    , m_ProjectionLoc(-1)        // Orthographic projection matrix
{
    m_BatchVertices.reserve(MAX_BATCH_VERTICES);
    m_RimScratch.reserve(MAX_CIRCLE_SEGMENTS + 1);
}

OpenGLRenderer::~OpenGLRenderer()
{
    Shutdown();
}

void OpenGLRenderer::Shutdown()
{
    // Delete all GL resources and reset handles to 0 to prevent double-deletion
    if (m_BatchVAO != 0)
    {
        glDeleteVertexArrays(1, &m_BatchVAO);
        m_BatchVAO = 0;
    }
    if (m_BatchVBO != 0)
    {
        glDeleteBuffers(1, &m_BatchVBO);
        m_BatchVBO = 0;
    }
    if (m_ShaderProgram != 0)
    {
        glDeleteProgram(m_ShaderProgram);
        m_ShaderProgram = 0;
    }

    m_BatchVertices.clear();
}

std::string OpenGLRenderer::LoadShaderFromFile(const std::string &filepath)
{
    std::ifstream file(filepath);
    if (!file.is_open())
    {
        // Try parent directory
        std::string parentPath = "../" + filepath;
        file.open(parentPath);
        if (!file.is_open())
        {
            std::cerr << "ERROR: Could not open shader file: " << filepath << " or " << parentPath << std::endl;
            return "";
        }
    }

    std::string source((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return source;
}

bool OpenGLRenderer::Init()
{
    SetupBatchBuffers();

    if (!BuildShaderProgram())
    {
        Shutdown();
        return false;
    }

    m_ProjectionLoc = glGetUniformLocation(m_ShaderProgram, "projection");

    glEnable(GL_BLEND);
    glBlendFuncSeparate(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA, GL_ONE, GL_ONE_MINUS_SRC_ALPHA);
    glDisable(GL_DEPTH_TEST);

    std::cout << "OpenGL renderer initialized: " << glGetString(GL_VERSION) << std::endl;
    return true;
}

bool OpenGLRenderer::BuildShaderProgram()
{
    std::string vertexShaderSource = LoadShaderFromFile("shaders/flake.vert");
    std::string fragmentShaderSource = LoadShaderFromFile("shaders/flake.frag");

    if (vertexShaderSource.empty() || fragmentShaderSource.empty())
    {
        std::cerr << "ERROR: Failed to load shader files!" << std::endl;
        return false;
    }

    int success;
    char infoLog[512];

    // Compile vertex shader
    unsigned int vertexShader = glCreateShader(GL_VERTEX_SHADER);
    const char *vertexSourcePtr = vertexShaderSource.c_str();
    glShaderSource(vertexShader, 1, &vertexSourcePtr, nullptr);
    glCompileShader(vertexShader);

    glGetShaderiv(vertexShader, GL_COMPILE_STATUS, &success);
    if (!success)
    {
        glGetShaderInfoLog(vertexShader, 512, nullptr, infoLog);
        std::cerr << "Vertex shader compilation failed: " << infoLog << std::endl;
        glDeleteShader(vertexShader);
        return false;
    }

    // Compile fragment shader
    unsigned int fragmentShader = glCreateShader(GL_FRAGMENT_SHADER);
    const char *fragmentSourcePtr = fragmentShaderSource.c_str();
    glShaderSource(fragmentShader, 1, &fragmentSourcePtr, nullptr);
    glCompileShader(fragmentShader);

    glGetShaderiv(fragmentShader, GL_COMPILE_STATUS, &success);
    if (!success)
    {
        glGetShaderInfoLog(fragmentShader, 512, nullptr, infoLog);
        std::cerr << "Fragment shader compilation failed: " << infoLog << std::endl;
        glDeleteShader(vertexShader);
        glDeleteShader(fragmentShader);
        return false;
    }

    // Link shader program
    m_ShaderProgram = glCreateProgram();
    glAttachShader(m_ShaderProgram, vertexShader);
    glAttachShader(m_ShaderProgram, fragmentShader);
    glLinkProgram(m_ShaderProgram);

    glDeleteShader(vertexShader);
    glDeleteShader(fragmentShader);

    glGetProgramiv(m_ShaderProgram, GL_LINK_STATUS, &success);
    if (!success)
    {
        glGetProgramInfoLog(m_ShaderProgram, 512, nullptr, infoLog);
        std::cerr << "Shader program linking failed: " << infoLog << std::endl;
        return false;
    }

    return true;
}

void OpenGLRenderer::SetupBatchBuffers()
{
    glGenVertexArrays(1, &m_BatchVAO);
    glGenBuffers(1, &m_BatchVBO);

    glBindVertexArray(m_BatchVAO);
    glBindBuffer(GL_ARRAY_BUFFER, m_BatchVBO);

    size_t bufferSize = MAX_BATCH_VERTICES * sizeof(ColoredVertex);
    glBufferData(GL_ARRAY_BUFFER, bufferSize, nullptr, GL_DYNAMIC_DRAW);

    // Position
    glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, sizeof(ColoredVertex), (void *)0);
    glEnableVertexAttribArray(0);
    // Color
    glVertexAttribPointer(1, 4, GL_FLOAT, GL_FALSE, sizeof(ColoredVertex), (void *)(2 * sizeof(float)));
    glEnableVertexAttribArray(1);

    glBindBuffer(GL_ARRAY_BUFFER, 0);
    glBindVertexArray(0);
}

void OpenGLRenderer::BeginFrame()
{
    m_BatchVertices.clear();
    m_DrawCallCount = 0;
}

void OpenGLRenderer::EndFrame()
{
    FlushBatch();
}

void OpenGLRenderer::Clear(float r, float g, float b, float a)
{
    // Anything batched before the clear belongs under it
    FlushBatch();

    glClearColor(r, g, b, a);
    glClear(GL_COLOR_BUFFER_BIT);
}

void OpenGLRenderer::SetProjection(glm::mat4 projection)
{
    // Pending circles were built for the old projection
    FlushBatch();
    m_Projection = projection;
}

void OpenGLRenderer::SetViewport(int x, int y, int width, int height)
{
    FlushBatch();
    glViewport(x, y, width, height);
}

void OpenGLRenderer::DrawFilledCircle(glm::vec2 center, float radius, glm::vec4 color)
{
    if (radius <= 0.0f || color.a <= 0.0f)
        return;

    int segments = CircleSegments(radius);
    size_t needed = static_cast<size_t>(segments) * 3;
    if (m_BatchVertices.size() + needed > MAX_BATCH_VERTICES)
    {
        FlushBatch();
    }

    TessellateCircle(center, radius, segments, m_RimScratch);

    // One triangle per segment: center, rim[i], rim[i + 1]
    for (int i = 0; i < segments; ++i)
    {
        const glm::vec2 &a = m_RimScratch[i];
        const glm::vec2 &b = m_RimScratch[i + 1];
        m_BatchVertices.push_back({center.x, center.y, color.r, color.g, color.b, color.a});
        m_BatchVertices.push_back({a.x, a.y, color.r, color.g, color.b, color.a});
        m_BatchVertices.push_back({b.x, b.y, color.r, color.g, color.b, color.a});
    }
}

void OpenGLRenderer::DrawColoredRect(glm::vec2 position, glm::vec2 size, glm::vec4 color)
{
    if (size.x <= 0.0f || size.y <= 0.0f || color.a <= 0.0f)
        return;

    if (m_BatchVertices.size() + 6 > MAX_BATCH_VERTICES)
    {
        FlushBatch();
    }

    float x0 = position.x;
    float y0 = position.y;
    float x1 = position.x + size.x;
    float y1 = position.y + size.y;
    float r = color.r, g = color.g, b = color.b, a = color.a;

    m_BatchVertices.push_back({x0, y0, r, g, b, a});
    m_BatchVertices.push_back({x1, y1, r, g, b, a});
    m_BatchVertices.push_back({x0, y1, r, g, b, a});

    m_BatchVertices.push_back({x0, y0, r, g, b, a});
    m_BatchVertices.push_back({x1, y0, r, g, b, a});
    m_BatchVertices.push_back({x1, y1, r, g, b, a});
}

void OpenGLRenderer::FlushBatch()
{
    if (m_BatchVertices.empty() || m_ShaderProgram == 0)
    {
        m_BatchVertices.clear();
        return;
    }

    glUseProgram(m_ShaderProgram);
    glUniformMatrix4fv(m_ProjectionLoc, 1, GL_FALSE, glm::value_ptr(m_Projection));

    // Upload with buffer orphaning to avoid GPU sync stall
    size_t dataSize = m_BatchVertices.size() * sizeof(ColoredVertex);
    glBindBuffer(GL_ARRAY_BUFFER, m_BatchVBO);
    void *ptr = glMapBufferRange(GL_ARRAY_BUFFER, 0, dataSize,
                                 GL_MAP_WRITE_BIT | GL_MAP_INVALIDATE_BUFFER_BIT);
    if (ptr)
    {
        std::memcpy(ptr, m_BatchVertices.data(), dataSize);
        glUnmapBuffer(GL_ARRAY_BUFFER);
    }

    glBindVertexArray(m_BatchVAO);
    glDrawArrays(GL_TRIANGLES, 0, static_cast<GLsizei>(m_BatchVertices.size()));
    glBindVertexArray(0);
    ++m_DrawCallCount;

    m_BatchVertices.clear();
}
