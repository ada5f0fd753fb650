#include "VisualizerFactory.h"
#include "ofLog.h"
#include <map>

// Function-local static so registrars in other translation units never see it uninitialized
static std::map<std::string, VisualizerFactory::VisualizerCreator>& getVisualizerCreators() {
    static std::map<std::string, VisualizerFactory::VisualizerCreator> creators;
    return creators;
}

//--------------------------------------------------------------
void VisualizerFactory::registerVisualizerType(const std::string& typeName, VisualizerCreator creator) {
    auto& creators = getVisualizerCreators();
    if (creators.find(typeName) != creators.end()) {
        ofLogWarning("VisualizerFactory") << "Visualizer type '" << typeName << "' already registered, overwriting";
    }
    creators[typeName] = creator;
    ofLogVerbose("VisualizerFactory") << "Registered visualizer type: " << typeName;
}

bool VisualizerFactory::isVisualizerTypeRegistered(const std::string& typeName) {
    auto& creators = getVisualizerCreators();
    return creators.find(typeName) != creators.end();
}

std::vector<std::string> VisualizerFactory::getRegisteredTypes() {
    std::vector<std::string> types;
    for (const auto& pair : getVisualizerCreators()) {
        types.push_back(pair.first);
    }
    return types;
}

//--------------------------------------------------------------
std::unique_ptr<Visualizer> VisualizerFactory::create(const std::string& typeName) {
    auto& creators = getVisualizerCreators();
    auto it = creators.find(typeName);
    if (it == creators.end()) {
        ofLogError("VisualizerFactory") << "Unknown visualizer type: " << typeName;
        return nullptr;
    }
    return it->second();
}

std::unique_ptr<Visualizer> VisualizerFactory::createFromJson(const ofJson& json) {
    if (!json.is_object() || !json.contains("type") || !json["type"].is_string()) {
        ofLogError("VisualizerFactory") << "Visualizer json has no type";
        return nullptr;
    }
    auto visualizer = create(json["type"].get<std::string>());
    if (visualizer) {
        visualizer->fromJson(json);
    }
    return visualizer;
}
