#pragma once

#include "ObstacleSet.h"

#include <string>
#include <vector>

/**
 * @class IGeometryProvider
 * @brief Resolves element selectors to on-screen rectangles.
 * @ingroup Simulation
 *
 * SnowSystem asks the provider for every selector in
 * SnowConfig::collectSelectors whenever obstacles are refreshed. The
 * provider owns the notion of "elements" and how they are laid out; the
 * simulation only sees the resulting rectangles.
 *
 * @par Coordinate Space
 * Rectangles are returned in viewport space, already adjusted for any
 * scroll offset, with the origin at the top-left of the drawable surface.
 *
 * @par Invalid Selectors
 * A selector that cannot be parsed is reported by returning `false`. The
 * caller logs it and continues with the remaining selectors. A valid
 * selector that matches nothing returns `true` with no rectangles.
 *
 * @see SceneGeometry
 */
class IGeometryProvider
{
public:
    virtual ~IGeometryProvider() = default;

    /**
     * @brief Append the rectangles of all visible elements matching @p selector.
     *
     * @param selector Selector string (syntax defined by the provider).
     * @param[out] out Receives matching rectangles; existing entries are kept.
     * @return `false` if the selector is invalid.
     */
    virtual bool ResolveSelector(const std::string &selector, std::vector<ElementRect> &out) const = 0;
};
