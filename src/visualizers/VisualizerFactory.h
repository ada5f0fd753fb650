#pragma once

#include "Visualizer.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

/**
 * VisualizerFactory - creates renderers by type name
 *
 * Renderer types register themselves during static initialization with a
 * registrar object in their own .cpp file.
 */
class VisualizerFactory {
public:
    using VisualizerCreator = std::function<std::unique_ptr<Visualizer>()>;

    static void registerVisualizerType(const std::string& typeName, VisualizerCreator creator);
    static bool isVisualizerTypeRegistered(const std::string& typeName);
    static std::vector<std::string> getRegisteredTypes();

    // nullptr for unknown types
    static std::unique_ptr<Visualizer> create(const std::string& typeName);
    // Creates the "type" named in json and applies the rest of it
    static std::unique_ptr<Visualizer> createFromJson(const ofJson& json);
};
