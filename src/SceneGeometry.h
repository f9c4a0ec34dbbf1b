#pragma once

#include "IGeometryProvider.h"

#include <nlohmann/json_fwd.hpp>

#include <string>
#include <vector>

/**
 * @struct SceneElement
 * @brief A named rectangle on the page snow can collect on.
 * @ingroup Platform
 */
struct SceneElement
{
    int uid = -1;                        ///< Index assigned on load, unique per scene.
    std::string id;                      ///< Matched by `#id`.
    std::string tag;                     ///< Matched by a leading tag name.
    std::vector<std::string> classes;    ///< Matched by `.class`.
    float x = 0.0f;                      ///< Page-space left (px).
    float y = 0.0f;                      ///< Page-space top (px).
    float width = 0.0f;                  ///< Width (px).
    float height = 0.0f;                 ///< Height (px).
    bool hidden = false;                 ///< Hidden elements never match.
};

/**
 * @struct SimpleSelector
 * @brief Parsed compound selector such as `div.card#hero`.
 * @ingroup Platform
 *
 * @par Grammar
 * @code
 * selector := [ tag | '*' ] ( '#' ident | '.' ident )*
 * tag      := [A-Za-z] [A-Za-z0-9-]*
 * ident    := [A-Za-z_-] [A-Za-z0-9_-]*
 * @endcode
 * Leading and trailing whitespace is ignored. Combinators, attribute
 * selectors, pseudo-classes and selector lists are not supported and make
 * the selector invalid, as does an empty selector.
 *
 * Tag names compare case-insensitively; ids and classes are case-sensitive.
 */
struct SimpleSelector
{
    std::string tag;                   ///< Lowercase tag, empty for any.
    std::vector<std::string> ids;      ///< Required ids.
    std::vector<std::string> classes;  ///< Required classes.

    /**
     * @brief Parse @p text.
     * @param text Selector source.
     * @param[out] out Parsed selector; unspecified on failure.
     * @return `false` if @p text is not a valid selector.
     */
    static bool Parse(const std::string &text, SimpleSelector &out);

    /// @brief True when @p element satisfies every part of the selector.
    bool Matches(const SceneElement &element) const;
};

/**
 * @class SceneGeometry
 * @brief IGeometryProvider backed by a JSON description of a page.
 * @ingroup Platform
 *
 * The scene is a scrollable page of rectangular elements. Elements are
 * stored in page coordinates; ResolveSelector() returns them in viewport
 * coordinates by subtracting the current scroll offset.
 *
 * @par Scene File
 * @code{.json}
 * {
 *   "elements": [
 *     { "id": "nav", "tag": "nav", "classes": ["bar"],
 *       "x": 0, "y": 0, "width": 1280, "height": 64 },
 *     { "tag": "div", "classes": ["card"],
 *       "x": 120, "y": 300, "width": 320, "height": 200 }
 *   ]
 * }
 * @endcode
 *
 * @par Scrolling
 * | Quantity   | Value                                   |
 * |------------|-----------------------------------------|
 * | pageHeight | max(y + height) over all elements       |
 * | maxScroll  | max(0, pageHeight - viewHeight)         |
 * | scroll     | clamped to [0, maxScroll]               |
 *
 * @see SnowSystem::RefreshObstacles
 */
class SceneGeometry : public IGeometryProvider
{
public:
    SceneGeometry();

    /**
     * @brief Load elements from a scene file, replacing current ones.
     * @return `false` if the file cannot be opened or parsed.
     */
    bool LoadFromFile(const std::string &path);

    /**
     * @brief Load elements from an already-parsed scene object.
     *
     * Malformed element entries are skipped with a warning.
     *
     * @return `false` if @p scene has no `elements` array.
     */
    bool LoadFromJSON(const nlohmann::json &scene);

    /// @brief Append one element; its uid is assigned here.
    void AddElement(SceneElement element);

    /// @brief Remove every element and reset scrolling.
    void Clear();

    /// @brief Set the viewport height used for scroll clamping.
    void SetViewHeight(float height);

    /// @brief Scroll to an absolute offset (clamped).
    void SetScroll(float offset);

    /// @brief Scroll by a relative amount (clamped).
    void ScrollBy(float delta) { SetScroll(m_Scroll + delta); }

    float GetScroll() const { return m_Scroll; }
    float GetPageHeight() const;
    const std::vector<SceneElement> &GetElements() const { return m_Elements; }

    bool ResolveSelector(const std::string &selector, std::vector<ElementRect> &out) const override;

private:
    std::vector<SceneElement> m_Elements;  ///< Page elements in load order.
    float m_ViewHeight;                    ///< Viewport height (px).
    float m_Scroll;                        ///< Vertical scroll offset (px).
};
