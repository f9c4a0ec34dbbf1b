#include "SnowApp.h"

#include <glad/glad.h>
#include <GLFW/glfw3.h>

#include <chrono>
#include <iostream>
#include <thread>

#include <glm/gtc/matrix_transform.hpp>

SnowApp::SnowApp()
    : m_Window(nullptr)
    , m_WindowWidth(0)
    , m_WindowHeight(0)
    , m_StartTime(0.0)
    , m_RefreshKeyDown(false)
    , m_FpsTimer(0.0f)
    , m_FrameCount(0)
{
}

SnowApp::~SnowApp()
{
    Shutdown();
}

bool SnowApp::Initialize(const AppConfig &config)
{
    m_Config = config;
    const WindowConfig &windowConfig = m_Config.window;

    if (!glfwInit())
    {
        std::cerr << "Failed to initialize GLFW" << std::endl;
        return false;
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
#ifdef __APPLE__
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
#endif

    m_WindowWidth = windowConfig.width;
    m_WindowHeight = windowConfig.height;

    if (windowConfig.overlay)
    {
        // Cover the primary monitor with a see-through, click-through layer
        glfwWindowHint(GLFW_TRANSPARENT_FRAMEBUFFER, GLFW_TRUE);
        glfwWindowHint(GLFW_DECORATED, GLFW_FALSE);
        glfwWindowHint(GLFW_FLOATING, GLFW_TRUE);
#ifdef GLFW_MOUSE_PASSTHROUGH
        glfwWindowHint(GLFW_MOUSE_PASSTHROUGH, GLFW_TRUE);
#else
        std::cerr << "WARNING: GLFW older than 3.4, overlay will capture the mouse" << std::endl;
#endif

        if (GLFWmonitor *monitor = glfwGetPrimaryMonitor())
        {
            if (const GLFWvidmode *mode = glfwGetVideoMode(monitor))
            {
                m_WindowWidth = mode->width;
                m_WindowHeight = mode->height;
            }
        }
    }

    m_Window = glfwCreateWindow(m_WindowWidth, m_WindowHeight, windowConfig.title.c_str(), nullptr, nullptr);
    if (!m_Window)
    {
        std::cerr << "Failed to create GLFW window" << std::endl;
        glfwTerminate();
        return false;
    }

    if (windowConfig.overlay)
    {
        glfwSetWindowPos(m_Window, 0, 0);
    }

    // Store SnowApp instance pointer in window for callbacks
    glfwSetWindowUserPointer(m_Window, this);
    glfwSetWindowSizeCallback(m_Window, WindowSizeCallback);
    glfwSetFramebufferSizeCallback(m_Window, FramebufferSizeCallback);
    glfwSetScrollCallback(m_Window, ScrollCallback);

    glfwMakeContextCurrent(m_Window);
    if (!gladLoadGLLoader((GLADloadproc)glfwGetProcAddress))
    {
        std::cerr << "Failed to initialize GLAD" << std::endl;
        return false;
    }

    // The limiter paces frames; vsync would fight it on 120Hz+ displays
    glfwSwapInterval(0);

    std::cout << "OpenGL: " << glGetString(GL_VERSION) << std::endl;
    std::cout << "GLSL: " << glGetString(GL_SHADING_LANGUAGE_VERSION) << std::endl;

    m_Renderer = std::make_unique<OpenGLRenderer>();
    if (!m_Renderer->Init())
    {
        std::cerr << "Failed to initialize renderer" << std::endl;
        m_Renderer.reset();
        return false;
    }

    // Window size can differ from the request (tiling WMs, overlay sizing)
    glfwGetWindowSize(m_Window, &m_WindowWidth, &m_WindowHeight);
    int framebufferWidth = 0;
    int framebufferHeight = 0;
    glfwGetFramebufferSize(m_Window, &framebufferWidth, &framebufferHeight);
    m_Renderer->SetViewport(0, 0, framebufferWidth, framebufferHeight);
    UpdateProjection();

    if (!m_Config.scenePath.empty())
    {
        if (!m_Scene.LoadFromFile(m_Config.scenePath) && !m_Scene.LoadFromFile("../" + m_Config.scenePath))
        {
            std::cerr << "WARNING: No scene loaded, snow will not collect anywhere" << std::endl;
        }
    }
    m_Scene.SetViewHeight(static_cast<float>(m_WindowHeight));

    // Overlays stay see-through; windowed mode shows the page under the snow
    if (windowConfig.overlay)
    {
        m_Snow.SetClearColor(glm::vec4(0.0f));
    }
    else
    {
        m_Snow.SetClearColor(windowConfig.clearColor);
        m_Snow.SetBackdrop([this](IRenderer &renderer) { DrawScene(renderer); });
    }

    glm::vec2 viewSize(static_cast<float>(m_WindowWidth), static_cast<float>(m_WindowHeight));
    if (!m_Snow.Start(m_Config.snow, viewSize, m_Renderer.get(), &m_Scene))
    {
        std::cerr << "Failed to start snow" << std::endl;
        return false;
    }

    std::cout << "Window: " << m_WindowWidth << "x" << m_WindowHeight
              << (windowConfig.overlay ? " (overlay)" : "") << std::endl;
    std::cout << "Controls: scroll to move the page, R to refresh obstacles, Escape to quit" << std::endl;
    return true;
}

void SnowApp::Run()
{
    m_StartTime = glfwGetTime();
    double lastFrameTime = m_StartTime;

    try
    {
        while (!glfwWindowShouldClose(m_Window) && m_Snow.IsRunning())
        {
            double frameStartTime = glfwGetTime();
            float deltaTime = static_cast<float>(frameStartTime - lastFrameTime);
            lastFrameTime = frameStartTime;

            try
            {
                ProcessInput();
                RenderFrame((frameStartTime - m_StartTime) * 1000.0);
            }
            catch (const std::exception &e)
            {
                std::cerr << "Exception in frame loop: " << e.what() << std::endl;
                std::cerr.flush();
                break;
            }

            glfwPollEvents();

            m_FpsTimer += deltaTime;
            ++m_FrameCount;
            if (m_FpsTimer >= FPS_LOG_INTERVAL)
            {
                std::cout << "FPS: " << static_cast<int>(m_FrameCount / m_FpsTimer)
                          << ", draw calls: " << m_Renderer->GetDrawCallCount() << std::endl;
                m_FpsTimer = 0.0f;
                m_FrameCount = 0;
            }

            LimitFrameRate(frameStartTime);
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "Exception in Run(): " << e.what() << std::endl;
        std::cerr.flush();
    }

    m_Snow.Stop();
}

void SnowApp::ProcessInput()
{
    // Polled rather than event-driven so passthrough overlays still track it
    double cursorX = 0.0;
    double cursorY = 0.0;
    glfwGetCursorPos(m_Window, &cursorX, &cursorY);

    bool inside = cursorX >= 0.0 && cursorY >= 0.0 &&
                  cursorX < static_cast<double>(m_WindowWidth) &&
                  cursorY < static_cast<double>(m_WindowHeight);
    if (inside)
    {
        m_Snow.SetPointer(glm::vec2(static_cast<float>(cursorX), static_cast<float>(cursorY)));
    }
    else
    {
        m_Snow.ClearPointer();
    }

    if (glfwGetKey(m_Window, GLFW_KEY_ESCAPE) == GLFW_PRESS)
    {
        std::cout << "Escape pressed, stopping" << std::endl;
        m_Snow.Stop();
    }

    if (glfwGetKey(m_Window, GLFW_KEY_R) == GLFW_PRESS && !m_RefreshKeyDown)
    {
        m_RefreshKeyDown = true;
        m_Snow.RefreshObstacles();
        std::cout << "Obstacles refreshed: " << m_Snow.GetObstacles().Size() << std::endl;
    }
    if (glfwGetKey(m_Window, GLFW_KEY_R) == GLFW_RELEASE)
    {
        m_RefreshKeyDown = false;
    }
}

void SnowApp::RenderFrame(double timeMs)
{
    m_Snow.OnFrame(timeMs);
    glfwSwapBuffers(m_Window);
}

void SnowApp::DrawScene(IRenderer &renderer) const
{
    // Page elements as faint panels so collected snow has something to sit on
    const float scroll = m_Scene.GetScroll();
    const float viewHeight = static_cast<float>(m_WindowHeight);
    for (const SceneElement &element : m_Scene.GetElements())
    {
        if (element.hidden)
            continue;

        float top = element.y - scroll;
        if (top > viewHeight || top + element.height < 0.0f)
            continue;

        renderer.DrawColoredRect(glm::vec2(element.x, top), glm::vec2(element.width, element.height),
                                 glm::vec4(0.35f, 0.45f, 0.6f, 0.35f));
    }
}

void SnowApp::LimitFrameRate(double frameStartTime) const
{
    if (m_Config.window.targetFps <= 0.0f)
        return;

    double targetFrameTime = 1.0 / static_cast<double>(m_Config.window.targetFps);
    double elapsed = glfwGetTime() - frameStartTime;

    // Sleep off most of the wait, then spin for sub-millisecond accuracy
    constexpr double SPIN_MARGIN = 0.002;
    if (targetFrameTime - elapsed > SPIN_MARGIN)
    {
        std::this_thread::sleep_for(std::chrono::duration<double>(targetFrameTime - elapsed - SPIN_MARGIN));
    }

    while (glfwGetTime() - frameStartTime < targetFrameTime)
    {
    }
}

void SnowApp::UpdateProjection()
{
    // Top-left origin, one unit per window pixel
    glm::mat4 projection = glm::ortho(0.0f, static_cast<float>(m_WindowWidth),
                                      static_cast<float>(m_WindowHeight), 0.0f, -1.0f, 1.0f);
    m_Renderer->SetProjection(projection);
}

void SnowApp::OnWindowResized(int width, int height)
{
    // Minimized windows report 0x0; keep the last real size
    if (width <= 0 || height <= 0)
        return;

    m_WindowWidth = width;
    m_WindowHeight = height;

    if (m_Renderer)
    {
        UpdateProjection();
    }

    m_Scene.SetViewHeight(static_cast<float>(height));
    m_Snow.Resize(glm::vec2(static_cast<float>(width), static_cast<float>(height)));
}

void SnowApp::OnFramebufferResized(int width, int height)
{
    if (width <= 0 || height <= 0 || !m_Renderer)
        return;

    m_Renderer->SetViewport(0, 0, width, height);
}

void SnowApp::WindowSizeCallback(GLFWwindow *window, int width, int height)
{
    SnowApp *app = static_cast<SnowApp *>(glfwGetWindowUserPointer(window));
    if (app)
    {
        app->OnWindowResized(width, height);
    }
}

void SnowApp::FramebufferSizeCallback(GLFWwindow *window, int width, int height)
{
    SnowApp *app = static_cast<SnowApp *>(glfwGetWindowUserPointer(window));
    if (app)
    {
        app->OnFramebufferResized(width, height);
    }
}

void SnowApp::ScrollCallback(GLFWwindow *window, double /*xoffset*/, double yoffset)
{
    SnowApp *app = static_cast<SnowApp *>(glfwGetWindowUserPointer(window));
    if (!app)
        return;

    // Wheel up moves the page down, like a browser
    app->m_Scene.ScrollBy(static_cast<float>(-yoffset) * SCROLL_STEP);
    app->m_Snow.RefreshObstacles();
}

void SnowApp::Shutdown()
{
    m_Snow.Stop();
    m_Snow.SetBackdrop(nullptr);

    if (m_Renderer)
    {
        m_Renderer->Shutdown();
        m_Renderer.reset();
    }

    if (m_Window)
    {
        glfwDestroyWindow(m_Window);
        m_Window = nullptr;
        glfwTerminate();
    }
}
