#include "Oscilloscope.h"
#include "VisualizerFactory.h"
#include "config/ColorUtils.h"
#include "ofLog.h"
#include <algorithm>

Oscilloscope::Oscilloscope()
    : Visualizer("Oscilloscope") {
}

Oscilloscope::Oscilloscope(const Options& options)
    : Visualizer("Oscilloscope") {
    setOptions(options);
}

void Oscilloscope::setOptions(const Options& options) {
    options_ = options;
    options_.style.lineWidth = std::max(0.5f, options_.style.lineWidth);
    options_.style.sensitivity = std::max(0.0f, options_.style.sensitivity);
    options_.style.fillOpacity = std::max(0.0f, std::min(1.0f, options_.style.fillOpacity));
    options_.targetFps = std::max(0.0f, options_.targetFps);
    updateCadence();
}

void Oscilloscope::cycleMode() {
    int next = (static_cast<int>(options_.mode) + 1) % TraceDrawing::NUM_TRACE_MODES;
    options_.mode = static_cast<TraceDrawing::TraceMode>(next);
    ofLogNotice("Oscilloscope") << "Mode: " << TraceDrawing::toString(options_.mode);
}

void Oscilloscope::setSensitivity(float sensitivity) {
    options_.style.sensitivity = std::max(0.0f, sensitivity);
}

//--------------------------------------------------------------
bool Oscilloscope::render(SignalAcquisition& acquisition, DrawSurface& surface) {
    const std::vector<float>* samples = acquisition.pullTimeDomain();
    if (!samples || samples->empty()) {
        return false;
    }

    surface.clear(options_.backgroundColor);
    lastPointCount_ = TraceDrawing::drawTrace(surface, *samples, options_.mode, options_.style);
    return true;
}

//--------------------------------------------------------------
ofJson Oscilloscope::toJson() const {
    ofJson json;
    json["type"] = getTypeName();
    json["drawMode"] = TraceDrawing::toString(options_.mode);
    json["lineColor"] = colorToString(options_.style.lineColor);
    json["lineWidth"] = options_.style.lineWidth;
    json["sensitivity"] = options_.style.sensitivity;
    json["invertY"] = options_.style.invertY;
    json["fillColor"] = colorToString(options_.style.fillColor);
    json["fillOpacity"] = options_.style.fillOpacity;
    json["backgroundColor"] = colorToString(options_.backgroundColor);
    json["targetFps"] = options_.targetFps;
    json["dashPattern"] = ofJson::array();
    for (float length : options_.style.dashPattern) {
        json["dashPattern"].push_back(length);
    }
    return json;
}

void Oscilloscope::fromJson(const ofJson& json) {
    Options options = options_;
    try {
        if (json.contains("drawMode")) {
            options.mode = TraceDrawing::modeFromString(json["drawMode"].get<std::string>());
        }
        if (json.contains("lineColor")) {
            parseColor(json["lineColor"].get<std::string>(), options.style.lineColor);
        }
        options.style.lineWidth = json.value("lineWidth", options.style.lineWidth);
        options.style.sensitivity = json.value("sensitivity", options.style.sensitivity);
        options.style.invertY = json.value("invertY", options.style.invertY);
        if (json.contains("fillColor")) {
            parseColor(json["fillColor"].get<std::string>(), options.style.fillColor);
        }
        options.style.fillOpacity = json.value("fillOpacity", options.style.fillOpacity);
        if (json.contains("backgroundColor")) {
            parseColor(json["backgroundColor"].get<std::string>(), options.backgroundColor);
        }
        options.targetFps = json.value("targetFps", options.targetFps);
        if (json.contains("dashPattern") && json["dashPattern"].is_array()) {
            options.style.dashPattern.clear();
            for (const auto& length : json["dashPattern"]) {
                if (length.is_number()) {
                    options.style.dashPattern.push_back(length.get<float>());
                }
            }
        }
    } catch (const std::exception& e) {
        ofLogError("Oscilloscope") << "Invalid oscilloscope settings: " << e.what();
        return;
    }
    setOptions(options);
}

//--------------------------------------------------------------
namespace {
    struct OscilloscopeRegistrar {
        OscilloscopeRegistrar() {
            VisualizerFactory::registerVisualizerType("Oscilloscope",
                []() -> std::unique_ptr<Visualizer> {
                    return std::make_unique<Oscilloscope>();
                });
        }
    };
    static OscilloscopeRegistrar g_oscilloscopeRegistrar;
}
