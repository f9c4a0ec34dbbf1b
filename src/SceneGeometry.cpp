#include "SceneGeometry.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <utility>

namespace
{
bool IsIdentStart(char c)
{
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

bool IsIdentChar(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

// Reads an identifier starting at pos; returns false if none is present
bool ReadIdent(const std::string &text, size_t &pos, std::string &out)
{
    if (pos >= text.size() || !IsIdentStart(text[pos]))
        return false;

    size_t start = pos;
    while (pos < text.size() && IsIdentChar(text[pos]))
        ++pos;

    out = text.substr(start, pos - start);
    return true;
}

std::string ToLower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string Trim(const std::string &s)
{
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin])))
        ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])))
        --end;
    return s.substr(begin, end - begin);
}
} // namespace

bool SimpleSelector::Parse(const std::string &text, SimpleSelector &out)
{
    out = SimpleSelector();
    std::string source = Trim(text);
    if (source.empty())
        return false;

    size_t pos = 0;

    // Optional type selector
    if (source[0] == '*')
    {
        ++pos;
    }
    else if (std::isalpha(static_cast<unsigned char>(source[0])))
    {
        size_t start = pos;
        while (pos < source.size() &&
               (std::isalnum(static_cast<unsigned char>(source[pos])) || source[pos] == '-'))
            ++pos;
        out.tag = ToLower(source.substr(start, pos - start));
    }

    while (pos < source.size())
    {
        char marker = source[pos++];
        std::string ident;
        if (marker != '#' && marker != '.')
            return false;
        if (!ReadIdent(source, pos, ident))
            return false;

        if (marker == '#')
            out.ids.push_back(std::move(ident));
        else
            out.classes.push_back(std::move(ident));
    }

    return true;
}

bool SimpleSelector::Matches(const SceneElement &element) const
{
    if (element.hidden)
        return false;

    if (!tag.empty() && tag != ToLower(element.tag))
        return false;

    for (const std::string &id : ids)
    {
        if (element.id != id)
            return false;
    }

    for (const std::string &cls : classes)
    {
        if (std::find(element.classes.begin(), element.classes.end(), cls) == element.classes.end())
            return false;
    }

    return true;
}

SceneGeometry::SceneGeometry()
    : m_ViewHeight(0.0f)
    , m_Scroll(0.0f)
{
}

bool SceneGeometry::LoadFromFile(const std::string &path)
{
    using json = nlohmann::json;

    std::ifstream file(path);
    if (!file.is_open())
    {
        std::cerr << "ERROR: Could not open scene file: " << path << std::endl;
        return false;
    }

    json scene;
    try
    {
        file >> scene;
    }
    catch (const json::parse_error &e)
    {
        std::cerr << "ERROR: Failed to parse scene JSON: " << e.what() << std::endl;
        return false;
    }

    return LoadFromJSON(scene);
}

bool SceneGeometry::LoadFromJSON(const nlohmann::json &scene)
{
    if (!scene.is_object() || !scene.contains("elements") || !scene["elements"].is_array())
    {
        std::cerr << "ERROR: Scene has no \"elements\" array" << std::endl;
        return false;
    }

    Clear();

    for (const auto &entry : scene["elements"])
    {
        if (!entry.is_object())
        {
            std::cerr << "WARNING: Skipping scene element that is not an object" << std::endl;
            continue;
        }

        SceneElement element;
        try
        {
            element.id = entry.value("id", std::string());
            element.tag = entry.value("tag", std::string("div"));
            element.x = entry.value("x", 0.0f);
            element.y = entry.value("y", 0.0f);
            element.width = entry.value("width", 0.0f);
            element.height = entry.value("height", 0.0f);
            element.hidden = entry.value("hidden", false);
            if (entry.contains("classes"))
            {
                element.classes = entry["classes"].get<std::vector<std::string>>();
            }
        }
        catch (const nlohmann::json::type_error &e)
        {
            std::cerr << "WARNING: Skipping malformed scene element: " << e.what() << std::endl;
            continue;
        }

        AddElement(std::move(element));
    }

    std::cout << "Scene loaded: " << m_Elements.size() << " elements, page height "
              << GetPageHeight() << std::endl;
    return true;
}

void SceneGeometry::AddElement(SceneElement element)
{
    element.uid = static_cast<int>(m_Elements.size());
    m_Elements.push_back(std::move(element));
}

void SceneGeometry::Clear()
{
    m_Elements.clear();
    m_Scroll = 0.0f;
}

void SceneGeometry::SetViewHeight(float height)
{
    m_ViewHeight = height;
    SetScroll(m_Scroll);
}

void SceneGeometry::SetScroll(float offset)
{
    float maxScroll = std::max(0.0f, GetPageHeight() - m_ViewHeight);
    m_Scroll = std::clamp(offset, 0.0f, maxScroll);
}

float SceneGeometry::GetPageHeight() const
{
    float pageHeight = 0.0f;
    for (const SceneElement &element : m_Elements)
    {
        pageHeight = std::max(pageHeight, element.y + element.height);
    }
    return pageHeight;
}

bool SceneGeometry::ResolveSelector(const std::string &selector, std::vector<ElementRect> &out) const
{
    SimpleSelector parsed;
    if (!SimpleSelector::Parse(selector, parsed))
        return false;

    for (const SceneElement &element : m_Elements)
    {
        if (!parsed.Matches(element))
            continue;

        ElementRect rect;
        rect.elementId = element.uid;
        rect.left = element.x;
        rect.top = element.y - m_Scroll;
        rect.width = element.width;
        rect.height = element.height;
        out.push_back(rect);
    }

    return true;
}
