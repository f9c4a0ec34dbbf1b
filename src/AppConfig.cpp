#include "AppConfig.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>

namespace
{
using json = nlohmann::json;

void WarnWrongType(const char *key, const char *expected)
{
    std::cerr << "WARNING: Window option \"" << key << "\" must be " << expected
              << ", keeping default" << std::endl;
}

void ReadPositiveInt(const json &section, const char *key, int &target)
{
    auto it = section.find(key);
    if (it == section.end())
        return;

    if (!it->is_number_integer() || it->get<int>() <= 0)
    {
        WarnWrongType(key, "a positive integer");
        return;
    }
    target = it->get<int>();
}

void MergeWindow(const json &section, WindowConfig &window)
{
    if (!section.is_object())
        return;

    ReadPositiveInt(section, "width", window.width);
    ReadPositiveInt(section, "height", window.height);

    if (auto it = section.find("title"); it != section.end())
    {
        if (it->is_string())
            window.title = it->get<std::string>();
        else
            WarnWrongType("title", "a string");
    }

    if (auto it = section.find("overlay"); it != section.end())
    {
        if (it->is_boolean())
            window.overlay = it->get<bool>();
        else
            WarnWrongType("overlay", "true or false");
    }

    if (auto it = section.find("targetFps"); it != section.end())
    {
        if (it->is_number() && it->get<float>() >= 0.0f)
            window.targetFps = it->get<float>();
        else
            WarnWrongType("targetFps", "a non-negative number");
    }

    if (auto it = section.find("clearColor"); it != section.end())
    {
        bool valid = it->is_array() && (it->size() == 3 || it->size() == 4);
        for (size_t i = 0; valid && i < it->size(); ++i)
        {
            valid = (*it)[i].is_number();
        }

        if (!valid)
        {
            WarnWrongType("clearColor", "an array of 3 or 4 numbers");
            return;
        }

        window.clearColor = glm::vec4((*it)[0].get<float>(), (*it)[1].get<float>(), (*it)[2].get<float>(),
                                      it->size() == 4 ? (*it)[3].get<float>() : 1.0f);
    }
}
} // namespace

void AppConfig::Merge(const nlohmann::json &root)
{
    if (!root.is_object())
    {
        std::cerr << "WARNING: Config root is not an object, using defaults" << std::endl;
        return;
    }

    if (root.contains("snow"))
    {
        snow.Merge(root["snow"]);
    }
    if (root.contains("window"))
    {
        MergeWindow(root["window"], window);
    }
    if (auto it = root.find("scene"); it != root.end())
    {
        if (it->is_string())
            scenePath = it->get<std::string>();
        else
            std::cerr << "WARNING: Config \"scene\" must be a path string" << std::endl;
    }
}

bool AppConfig::LoadFromFile(const std::string &path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        std::cerr << "WARNING: Could not open config file: " << path << std::endl;
        return false;
    }

    json root;
    try
    {
        file >> root;
    }
    catch (const json::parse_error &e)
    {
        std::cerr << "ERROR: Failed to parse config JSON: " << e.what() << std::endl;
        return false;
    }

    Merge(root);
    std::cout << "Config loaded from " << path << std::endl;
    return true;
}
