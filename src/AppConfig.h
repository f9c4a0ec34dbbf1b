#pragma once

#include "SnowConfig.h"

#include <glm/glm.hpp>
#include <nlohmann/json_fwd.hpp>

#include <string>

/**
 * @struct WindowConfig
 * @brief Host window options from the `window` section of config.json.
 * @ingroup Platform
 *
 * | Option       | Default            | Notes                                  |
 * |--------------|--------------------|----------------------------------------|
 * | `width`      | 1280               | px                                     |
 * | `height`     | 720                | px                                     |
 * | `title`      | "flurry"           |                                        |
 * | `overlay`    | false              | transparent, floating, click-through   |
 * | `targetFps`  | 60                 | 0 disables the limiter                 |
 * | `clearColor` | [0.05,0.07,0.12,1] | RGBA; ignored in overlay mode          |
 */
struct WindowConfig
{
    int width = 1280;
    int height = 720;
    std::string title = "flurry";
    bool overlay = false;
    float targetFps = 60.0f;
    glm::vec4 clearColor = glm::vec4(0.05f, 0.07f, 0.12f, 1.0f);
};

/**
 * @struct AppConfig
 * @brief Everything config.json configures.
 * @ingroup Platform
 *
 * @par File Layout
 * @code{.json}
 * {
 *   "snow":   { "flakeCount": 300, "collectSelectors": [".card", "nav"] },
 *   "window": { "width": 1280, "height": 720, "overlay": false },
 *   "scene":  "assets/scene.json"
 * }
 * @endcode
 *
 * Every section is optional. Missing keys keep their defaults.
 */
struct AppConfig
{
    SnowConfig snow;
    WindowConfig window;
    std::string scenePath = "assets/scene.json";

    /**
     * @brief Overlay the sections of @p root onto this configuration.
     */
    void Merge(const nlohmann::json &root);

    /**
     * @brief Load and merge a config file.
     *
     * On failure the configuration is left as it was.
     *
     * @return `false` if the file is missing or is not valid JSON.
     */
    bool LoadFromFile(const std::string &path);
};
