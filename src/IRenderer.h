#pragma once

#include <glm/glm.hpp>
#include <vector>

/**
 * @class IRenderer
 * @brief Abstract drawable surface for the snow overlay.
 * @ingroup Rendering
 *
 * IRenderer is the only thing the simulation knows about drawing. The
 * simulation hands it one filled circle per flake per frame; how the
 * circles reach the screen is up to the backend.
 *
 * @section renderer_pattern Design Pattern
 * Implements the **Strategy Pattern**: SnowSystem renders through this
 * interface, OpenGLRenderer draws for real, and tests plug in a recorder.
 *
 * @htmlonly
 * <pre class="mermaid">
 * classDiagram
 * class IRenderer:::abstract {
 *     <<interface>>
 *     +Init()
 *     +Shutdown()
 *     +BeginFrame()
 *     +EndFrame()
 *     +DrawFilledCircle()
 *     +DrawColoredRect()
 * }
 * class OpenGLRenderer:::opengl {
 *     +Init()
 *     +DrawFilledCircle()
 * }
 * IRenderer <|-- OpenGLRenderer
 * style IRenderer fill:#1e3a5f,stroke:#3b82f6,color:#e2e8f0
 * style OpenGLRenderer fill:#134e3a,stroke:#10b981,color:#e2e8f0
 * </pre>
 * @endhtmlonly
 *
 * @section coord_systems Coordinate System
 * Screen space, origin at the top-left of the surface, x to the right and
 * y downward, in pixels. The host sets an orthographic projection
 * @f$ (0, width, height, 0) @f$ so flake positions map 1:1 to pixels.
 *
 * @section renderer_pipeline Rendering Pipeline
 * @code
 * renderer->BeginFrame();
 * renderer->Clear(0.0f, 0.0f, 0.0f, 0.0f);
 * renderer->DrawFilledCircle({120.0f, 40.0f}, 2.4f, {1.0f, 1.0f, 1.0f, 0.6f});
 * renderer->EndFrame();
 * @endcode
 *
 * @section renderer_circles Circle Tessellation
 * Backends that only draw triangles approximate circles with a fan of
 * @f$ n @f$ triangles around the center, where
 * @f[
 * n = clamp(\lceil 2\pi r / 2 \rceil, 8, 32)
 * @f]
 * keeps each edge around 2px long. TessellateCircle() produces the rim.
 *
 * @see OpenGLRenderer
 */
class IRenderer
{
public:
    /// @brief Minimum triangles per circle.
    static constexpr int MIN_CIRCLE_SEGMENTS = 8;
    /// @brief Maximum triangles per circle.
    static constexpr int MAX_CIRCLE_SEGMENTS = 32;

    /**
     * @brief Virtual destructor for proper polymorphic cleanup.
     */
    virtual ~IRenderer() = default;

    /**
     * @brief Initialize the renderer.
     *
     * Creates GPU resources and compiles shaders. Must be called after the
     * graphics context exists and before any drawing.
     *
     * @return `false` if a required resource could not be created.
     */
    virtual bool Init() = 0;

    /**
     * @brief Release all GPU resources. Safe to call more than once.
     */
    virtual void Shutdown() = 0;

    /**
     * @brief Begin a new frame; resets batches and counters.
     */
    virtual void BeginFrame() = 0;

    /**
     * @brief Submit everything drawn since BeginFrame().
     */
    virtual void EndFrame() = 0;

    /**
     * @brief Clear the whole surface.
     *
     * Alpha matters for transparent overlay windows: clearing to
     * @f$ \alpha = 0 @f$ leaves the desktop visible behind the snow.
     */
    virtual void Clear(float r, float g, float b, float a) = 0;

    /**
     * @brief Draw a filled circle.
     *
     * @param center Circle center in screen pixels.
     * @param radius Radius in pixels. Non-positive radii draw nothing.
     * @param color  RGBA color; alpha is the flake opacity.
     */
    virtual void DrawFilledCircle(glm::vec2 center, float radius, glm::vec4 color) = 0;

    /**
     * @brief Draw a solid axis-aligned rectangle.
     *
     * Used by the host to show page elements under the snow.
     *
     * @param position Top-left corner in screen pixels.
     * @param size     Width and height in pixels.
     * @param color    RGBA color.
     */
    virtual void DrawColoredRect(glm::vec2 position, glm::vec2 size, glm::vec4 color) = 0;

    /**
     * @brief Set the projection matrix.
     *
     * Flushes pending geometry first so it is drawn with the old matrix.
     *
     * @param projection 4x4 projection matrix.
     */
    virtual void SetProjection(glm::mat4 projection) = 0;

    /**
     * @brief Set the viewport rectangle in framebuffer pixels.
     */
    virtual void SetViewport(int x, int y, int width, int height) = 0;

    /// @brief Draw calls issued in the last completed frame.
    virtual int GetDrawCallCount() const = 0;

    /**
     * @brief Number of fan triangles used for a circle of @p radius.
     */
    static int CircleSegments(float radius);

    /**
     * @brief Compute the rim points of a circle.
     *
     * Produces `segments + 1` points, starting at angle 0 and ending back
     * on the first point so consecutive pairs form the fan edges.
     *
     * @param center   Circle center.
     * @param radius   Circle radius.
     * @param segments Number of fan triangles.
     * @param[out] rim Receives the rim points (cleared first).
     */
    static void TessellateCircle(glm::vec2 center, float radius, int segments, std::vector<glm::vec2> &rim);
};
