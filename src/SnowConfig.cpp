#include "SnowConfig.h"

#include <nlohmann/json.hpp>

#include <iostream>

namespace
{
using json = nlohmann::json;

void WarnWrongType(const char *key, const char *expected)
{
    std::cerr << "WARNING: Snow option \"" << key << "\" must be " << expected
              << ", keeping default" << std::endl;
}

void ReadFloat(const json &options, const char *key, float &target)
{
    auto it = options.find(key);
    if (it == options.end())
        return;

    if (!it->is_number())
    {
        WarnWrongType(key, "a number");
        return;
    }
    target = it->get<float>();
}

void ReadInt(const json &options, const char *key, int &target)
{
    auto it = options.find(key);
    if (it == options.end())
        return;

    if (!it->is_number())
    {
        WarnWrongType(key, "a number");
        return;
    }
    // Fractional counts truncate, as they would when used as a loop bound
    target = static_cast<int>(it->get<double>());
}

void ReadBool(const json &options, const char *key, bool &target)
{
    auto it = options.find(key);
    if (it == options.end())
        return;

    if (!it->is_boolean())
    {
        WarnWrongType(key, "true or false");
        return;
    }
    target = it->get<bool>();
}

void ReadStringList(const json &options, const char *key, std::vector<std::string> &target)
{
    auto it = options.find(key);
    if (it == options.end())
        return;

    if (!it->is_array())
    {
        WarnWrongType(key, "an array of strings");
        return;
    }

    target.clear();
    for (const auto &entry : *it)
    {
        if (!entry.is_string())
        {
            std::cerr << "WARNING: Skipping non-string entry in \"" << key << "\"" << std::endl;
            continue;
        }
        target.push_back(entry.get<std::string>());
    }
}
} // namespace

void SnowConfig::Merge(const nlohmann::json &options)
{
    if (!options.is_object())
        return;

    ReadInt(options, "flakeCount", flakeCount);
    ReadFloat(options, "gravity", gravity);
    ReadFloat(options, "wind", wind);
    ReadFloat(options, "sizeBase", sizeBase);
    ReadFloat(options, "stickiness", stickiness);
    ReadFloat(options, "meltSpeed", meltSpeed);
    ReadStringList(options, "collectSelectors", collectSelectors);
    ReadBool(options, "mouseInteraction", mouseInteraction);
    ReadFloat(options, "mouseRepulsionRadius", mouseRepulsionRadius);
    ReadFloat(options, "midFieldFraction", midFieldFraction);
}

SnowConfig SnowConfig::FromJSON(const nlohmann::json &options)
{
    SnowConfig config;
    config.Merge(options);
    return config;
}
