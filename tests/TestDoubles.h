#pragma once

#include "../src/IGeometryProvider.h"
#include "../src/IRenderer.h"
#include "../src/RandomSource.h"

#include <map>
#include <string>
#include <utility>
#include <vector>

// Replays a fixed list of values, wrapping around at the end
class SequenceRandomSource : public IRandomSource
{
public:
    explicit SequenceRandomSource(std::vector<float> values)
        : m_Values(std::move(values))
    {
    }

    float NextFloat() override
    {
        if (m_Values.empty())
            return 0.0f;

        float value = m_Values[m_Index % m_Values.size()];
        ++m_Index;
        return value;
    }

    size_t GetDrawCount() const { return m_Index; }

private:
    std::vector<float> m_Values;
    size_t m_Index = 0;
};

// Selector -> rectangles lookup; selectors starting with '!' are invalid
class FakeGeometry : public IGeometryProvider
{
public:
    void Add(const std::string &selector, ElementRect rect)
    {
        m_Rects[selector].push_back(rect);
    }

    bool ResolveSelector(const std::string &selector, std::vector<ElementRect> &out) const override
    {
        ++m_ResolveCount;
        if (!selector.empty() && selector[0] == '!')
            return false;

        auto it = m_Rects.find(selector);
        if (it != m_Rects.end())
        {
            out.insert(out.end(), it->second.begin(), it->second.end());
        }
        return true;
    }

    mutable int m_ResolveCount = 0;

private:
    std::map<std::string, std::vector<ElementRect>> m_Rects;
};

// Records every call instead of drawing
class RecordingRenderer : public IRenderer
{
public:
    struct Circle
    {
        glm::vec2 center;
        float radius;
        glm::vec4 color;
    };

    bool Init() override { return true; }
    void Shutdown() override {}
    // Circles are kept per frame, like a batch that is flushed at EndFrame
    void BeginFrame() override
    {
        ++beginCount;
        circles.clear();
        calls.push_back('B');
    }

    void EndFrame() override
    {
        ++endCount;
        calls.push_back('E');
    }

    void Clear(float r, float g, float b, float a) override
    {
        ++clearCount;
        lastClear = glm::vec4(r, g, b, a);
        calls.push_back('C');
    }

    void DrawFilledCircle(glm::vec2 center, float radius, glm::vec4 color) override
    {
        circles.push_back({center, radius, color});
        calls.push_back('o');
    }

    void DrawColoredRect(glm::vec2, glm::vec2, glm::vec4) override
    {
        ++rectCount;
        calls.push_back('R');
    }

    void SetProjection(glm::mat4) override {}
    void SetViewport(int, int, int, int) override {}
    int GetDrawCallCount() const override { return 0; }

    std::vector<Circle> circles;
    glm::vec4 lastClear = glm::vec4(-1.0f);
    int clearCount = 0;
    int rectCount = 0;
    int beginCount = 0;
    int endCount = 0;
    std::string calls; ///< B begin, C clear, R rect, o circle, E end
};

inline ElementRect MakeRect(int id, float left, float top, float width, float height)
{
    ElementRect rect;
    rect.elementId = id;
    rect.left = left;
    rect.top = top;
    rect.width = width;
    rect.height = height;
    return rect;
}
