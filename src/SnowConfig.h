#pragma once

#include <nlohmann/json_fwd.hpp>

#include <string>
#include <vector>

/**
 * @struct SnowConfig
 * @brief Tunable options for a snow simulation run.
 * @ingroup Simulation
 *
 * A flat set of named options. Every field carries its default, so a
 * default-constructed SnowConfig is a complete configuration; user options
 * are layered on top with Merge().
 *
 * | Option                 | Default | Units / Range                      |
 * |------------------------|---------|------------------------------------|
 * | `flakeCount`           | 400     | particles                          |
 * | `gravity`              | 0.7     | px/frame at depth 1                |
 * | `wind`                 | 0.5     | px/frame at depth 1                |
 * | `sizeBase`             | 3       | px radius at depth 1               |
 * | `stickiness`           | 0.9     | probability 0-1                    |
 * | `meltSpeed`            | 0.005   | opacity lost per frame             |
 * | `collectSelectors`     | []      | element selectors                  |
 * | `mouseInteraction`     | true    | pointer repulsion on/off           |
 * | `mouseRepulsionRadius` | 150     | px                                 |
 * | `midFieldFraction`     | 1.0     | share of first population in-field |
 *
 * @par Validation
 * Values are not range-checked. Out-of-range values behave as their usage
 * implies, e.g. a negative stickiness never sticks and a zero radius
 * disables repulsion.
 *
 * The configuration is copied into SnowSystem at Start() and stays fixed
 * for the lifetime of that run.
 */
struct SnowConfig
{
    int flakeCount = 400;
    float gravity = 0.7f;
    float wind = 0.5f;
    float sizeBase = 3.0f;
    float stickiness = 0.9f;
    float meltSpeed = 0.005f;
    std::vector<std::string> collectSelectors;
    bool mouseInteraction = true;
    float mouseRepulsionRadius = 150.0f;
    float midFieldFraction = 1.0f;

    /**
     * @brief Overlay user options onto this configuration.
     *
     * Only keys present in @p options are changed. Unknown keys are ignored.
     * A known key holding the wrong JSON type is skipped with a warning on
     * stderr and the current value is kept.
     *
     * @param options JSON object of named options. Non-objects are ignored.
     */
    void Merge(const nlohmann::json &options);

    /**
     * @brief Build a configuration from defaults plus @p options.
     */
    static SnowConfig FromJSON(const nlohmann::json &options);
};
