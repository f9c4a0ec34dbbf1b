#pragma once

#include "IRenderer.h"

#include <glad/glad.h>
#include <string>
#include <vector>

/**
 * @class OpenGLRenderer
 * @brief OpenGL 3.3 core implementation of the IRenderer interface.
 * @ingroup Rendering
 *
 * Draws every flake as a CPU-tessellated triangle fan with per-vertex
 * RGBA (and scene panels as two triangles), collected in a single dynamic vertex buffer and submitted in as
 * few draw calls as possible.
 *
 * @section gl_features OpenGL Features Used
 * | Feature              | Version | Usage                          |
 * |----------------------|---------|--------------------------------|
 * | Core Profile         | 3.3     | Modern pipeline                |
 * | VAO/VBO              | 3.0+    | Batched circle geometry        |
 * | Shaders              | 3.3     | GLSL 330 core                  |
 * | Map Buffer Range     | 3.0+    | Orphaned per-frame uploads     |
 * | Alpha Blending       | 1.0+    | Flake opacity                  |
 *
 * @section gl_batching Circle Batching
 * A few hundred flakes at up to 32 triangles each would cost one draw call
 * per flake if drawn individually. Instead each DrawFilledCircle() appends
 * its triangles to m_BatchVertices, and the batch is flushed when:
 * - **Frame ends**: EndFrame() flushes the remaining geometry
 * - **Buffer full**: the next circle would exceed MAX_BATCH_VERTICES
 * - **Projection changes**: SetProjection() flushes first
 *
 * @par Batch Flow
 * @htmlonly
 * <pre class="mermaid">
 * flowchart TD
 * classDef add fill:#134e3a,stroke:#10b981,color:#e2e8f0
 * classDef flush fill:#7f1d1d,stroke:#ef4444,color:#e2e8f0
 * classDef check fill:#1e3a5f,stroke:#3b82f6,color:#e2e8f0
 *
 * A["DrawFilledCircle()"]:::add --> B{Room in batch?}:::check
 * B -->|Yes| C["Append fan triangles"]:::add
 * B -->|No| D["FlushBatch()"]:::flush
 * D --> C
 * G["EndFrame()"]:::flush --> H["FlushBatch()"]:::flush
 * </pre>
 * @endhtmlonly
 *
 * @section gl_blend Blending
 * Color uses standard alpha blending; the alpha channel is accumulated
 * with @f$ (1, 1 - \alpha_{src}) @f$ so a transparent overlay framebuffer
 * ends up with correct coverage for the compositor.
 *
 * @section gl_shaders Shaders
 * Loaded from `shaders/flake.vert` and `shaders/flake.frag` (or the same
 * paths one directory up, for runs from a build folder).
 */
class OpenGLRenderer : public IRenderer
{
public:
    OpenGLRenderer();
    ~OpenGLRenderer() override;

    bool Init() override;
    void Shutdown() override;

    void BeginFrame() override;
    void EndFrame() override;
    void Clear(float r, float g, float b, float a) override;

    void DrawFilledCircle(glm::vec2 center, float radius, glm::vec4 color) override;
    void DrawColoredRect(glm::vec2 position, glm::vec2 size, glm::vec4 color) override;

    void SetProjection(glm::mat4 projection) override;
    void SetViewport(int x, int y, int width, int height) override;

    int GetDrawCallCount() const override { return m_DrawCallCount; }

private:
    /// @name Initialization Helpers
    /// @{

    /// @brief Create the VAO/VBO for batched circles.
    void SetupBatchBuffers();

    /// @brief Compile and link the flake shader program.
    bool BuildShaderProgram();

    /// @brief Read a shader source file, trying the parent directory too.
    std::string LoadShaderFromFile(const std::string &filepath);

    /// @}

    /// @name Circle Batching
    /// @{

    /// @brief Maximum vertices held before an automatic flush.
    static constexpr size_t MAX_BATCH_VERTICES = 65536;

    /// @brief Vertex format with per-vertex RGBA color.
    struct ColoredVertex
    {
        float x, y;        ///< Screen position.
        float r, g, b, a;  ///< Per-vertex color.
    };

    std::vector<ColoredVertex> m_BatchVertices;  ///< Accumulated circle geometry.
    std::vector<glm::vec2> m_RimScratch;         ///< Reused rim buffer for tessellation.
    unsigned int m_BatchVAO, m_BatchVBO;         ///< Circle batch buffers.

    /// @brief Submit accumulated circles to the GPU and reset the batch.
    void FlushBatch();

    /// @}

    /// @name Core OpenGL Objects
    /// @{

    unsigned int m_ShaderProgram;  ///< Flake shader.
    glm::mat4 m_Projection;        ///< Current orthographic projection.
    GLint m_ProjectionLoc;         ///< Cached `projection` uniform location.

    /// @}

    int m_DrawCallCount = 0;  ///< Draw calls since BeginFrame().
};
