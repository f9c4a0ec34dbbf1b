#pragma once

#include "AppConfig.h"
#include "OpenGLRenderer.h"
#include "SceneGeometry.h"
#include "SnowSystem.h"

#include <GLFW/glfw3.h>
#include <glm/glm.hpp>
#include <memory>

/**
 * @class SnowApp
 * @brief Desktop host: owns the window, renderer, scene and snow.
 * @ingroup Platform
 *
 * SnowApp binds SnowSystem to a GLFW window. It feeds the pointer, window
 * size and scroll position into the simulation and calls OnFrame() once per
 * display frame.
 *
 * @par Frame Loop
 * @code
 * while (!shouldClose && snow.IsRunning()) {
 *     ProcessInput();        // pointer, R / Escape keys
 *     RenderFrame(timeMs);   // SnowSystem::OnFrame(), then swap
 *     glfwPollEvents();
 *     LimitFrameRate();
 * }
 * @endcode
 *
 * @par Frame Cadence
 * Every per-frame constant in the simulation (gravity, wind, melt speed)
 * is expressed per animation frame, so the loop is capped at
 * `window.targetFps` (60 by default). A limit of 0 runs uncapped.
 *
 * @par Overlay Mode
 * With `window.overlay` the window covers the primary monitor with a
 * transparent framebuffer, no decorations, always on top and mouse
 * passthrough. The cursor is then polled every frame since enter and leave
 * events are not delivered to passthrough windows.
 *
 * | Input          | Effect                                    |
 * |----------------|-------------------------------------------|
 * | Cursor move    | SnowSystem::SetPointer()                  |
 * | Cursor outside | SnowSystem::ClearPointer()                |
 * | Scroll wheel   | Scroll the scene, refresh obstacles       |
 * | R              | Refresh obstacles                         |
 * | Escape         | Stop the simulation and exit              |
 * | Window resize  | Viewport, projection, SnowSystem::Resize()|
 *
 * @par Lifecycle
 * @code
 * SnowApp app;
 * app.Initialize(config);  // Create window, load scene, start snow
 * app.Run();               // Blocks until the window closes or snow stops
 * app.Shutdown();          // Release resources
 * @endcode
 *
 * @see SnowSystem, OpenGLRenderer, SceneGeometry
 */
class SnowApp
{
public:
    SnowApp();

    /**
     * @brief Destructor calls Shutdown() if not already called.
     */
    ~SnowApp();

    /**
     * @brief Create the window and every subsystem, then start the snow.
     *
     * A missing or broken scene file is not fatal: the snow runs without
     * obstacles.
     *
     * @return `false` if GLFW, the window, GL loading or the renderer fail.
     */
    bool Initialize(const AppConfig &config);

    /**
     * @brief Run the frame loop until the window closes or snow stops.
     */
    void Run();

    /**
     * @brief Release the renderer and window. Safe to call twice.
     */
    void Shutdown();

private:
    /// @brief Scroll distance per wheel notch (px).
    static constexpr float SCROLL_STEP = 40.0f;
    /// @brief Seconds between FPS lines on the console.
    static constexpr float FPS_LOG_INTERVAL = 5.0f;

    void ProcessInput();
    void RenderFrame(double timeMs);
    void LimitFrameRate(double frameStartTime) const;
    void UpdateProjection();
    void DrawScene(IRenderer &renderer) const;

    void OnWindowResized(int width, int height);
    void OnFramebufferResized(int width, int height);

    static void WindowSizeCallback(GLFWwindow *window, int width, int height);
    static void FramebufferSizeCallback(GLFWwindow *window, int width, int height);
    static void ScrollCallback(GLFWwindow *window, double xoffset, double yoffset);

    AppConfig m_Config;                          ///< Configuration used at Initialize().
    GLFWwindow *m_Window;                        ///< Host window.
    std::unique_ptr<OpenGLRenderer> m_Renderer;  ///< Drawing backend.
    SceneGeometry m_Scene;                       ///< Page elements snow lands on.
    SnowSystem m_Snow;                           ///< The simulation.

    int m_WindowWidth;    ///< Window size in screen coordinates.
    int m_WindowHeight;
    double m_StartTime;   ///< glfwGetTime() at the start of Run().

    bool m_RefreshKeyDown;  ///< Edge detection for R.

    float m_FpsTimer;     ///< Time since the last FPS line.
    int m_FrameCount;     ///< Frames since the last FPS line.
};
