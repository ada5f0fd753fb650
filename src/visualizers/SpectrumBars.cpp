#include "SpectrumBars.h"
#include "VisualizerFactory.h"
#include "config/ColorUtils.h"
#include "ofLog.h"
#include <algorithm>
#include <cmath>

SpectrumBars::SpectrumBars()
    : Visualizer("SpectrumBars") {
}

SpectrumBars::SpectrumBars(const Options& options)
    : Visualizer("SpectrumBars") {
    setOptions(options);
}

void SpectrumBars::setOptions(const Options& options) {
    options_ = options;
    options_.barCount = std::max(1, options_.barCount);
    options_.smoothingFactor = std::max(0.0f, std::min(0.99f, options_.smoothingFactor));
    options_.capFallSpeed = std::max(0.0f, std::min(0.999f, options_.capFallSpeed));
    options_.targetFps = std::max(0.0f, options_.targetFps);
    updateCadence();
}

void SpectrumBars::setPrecomputedEnvelope(const PeakEnvelope& envelope) {
    precomputed_ = envelope;
}

void SpectrumBars::clearPrecomputedEnvelope() {
    precomputed_.clear();
}

void SpectrumBars::resetState() {
    smoothed_.clear();
    barHeights_.clear();
    caps_.clear();
}

//--------------------------------------------------------------
void SpectrumBars::updateFromEnvelope() {
    const size_t barCount = static_cast<size_t>(options_.barCount);
    if (smoothed_.size() != barCount) {
        smoothed_.assign(barCount, 0.0f);
    }
    const float factor = options_.smoothingFactor;
    for (size_t i = 0; i < barCount; i++) {
        size_t index = i * precomputed_.size() / barCount;
        float value = precomputed_[std::min(index, precomputed_.size() - 1)] * 255.0f;
        smoothed_[i] = factor * smoothed_[i] + (1.0f - factor) * value;
    }
}

bool SpectrumBars::render(SignalAcquisition& acquisition, DrawSurface& surface) {
    if (!precomputed_.empty()) {
        updateFromEnvelope();
    } else {
        const std::vector<float>* frequencyData = acquisition.pullFrequency();
        if (!frequencyData || frequencyData->empty()) {
            return false;
        }

        const int bufferLength = static_cast<int>(frequencyData->size());
        const float sampleRate = acquisition.getSampleRate();
        if (!bandSet_.matches(bufferLength, options_.barCount, sampleRate, options_.maxFrequency)) {
            bandSet_ = FrequencyBanding::computeBands(bufferLength, options_.barCount, sampleRate, options_.maxFrequency);
            bandSetComputeCount_++;
            ofLogVerbose("SpectrumBars") << "Band layout: " << bandSet_.size() << " bands over "
                                         << bufferLength << " bins @ " << sampleRate << "Hz";
        }
        if (bandSet_.empty()) {
            return false;
        }
        FrequencyBanding::updateBands(*frequencyData, bandSet_, smoothed_, options_.smoothingFactor);
    }

    const float height = static_cast<float>(surface.getHeight());
    barHeights_.resize(smoothed_.size());
    for (size_t i = 0; i < smoothed_.size(); i++) {
        barHeights_[i] = (smoothed_[i] / 255.0f) * height * 0.8f;
    }
    TraceDrawing::updateCaps(barHeights_, caps_, options_.capFallSpeed);

    surface.clear(options_.backgroundColor);
    TraceDrawing::drawBars(surface, barHeights_, caps_, options_.style);
    return true;
}

//--------------------------------------------------------------
ofJson SpectrumBars::toJson() const {
    ofJson json;
    json["type"] = getTypeName();
    json["barCount"] = options_.barCount;
    json["barColor"] = colorToString(options_.style.barColor);
    json["barSpacing"] = options_.style.barSpacing;
    json["capColor"] = colorToString(options_.style.capColor);
    json["capHeight"] = options_.style.capHeight;
    json["capFallSpeed"] = options_.capFallSpeed;
    json["maxFrequency"] = options_.maxFrequency;
    json["smoothingFactor"] = options_.smoothingFactor;
    json["targetFps"] = options_.targetFps;
    json["backgroundColor"] = colorToString(options_.backgroundColor);
    return json;
}

void SpectrumBars::fromJson(const ofJson& json) {
    Options options = options_;
    try {
        options.barCount = json.value("barCount", options.barCount);
        options.style.barSpacing = std::max(0.0f, json.value("barSpacing", options.style.barSpacing));
        options.style.capHeight = std::max(0.0f, json.value("capHeight", options.style.capHeight));
        options.capFallSpeed = json.value("capFallSpeed", options.capFallSpeed);
        options.maxFrequency = std::max(FrequencyBanding::MIN_FREQUENCY + 1.0f, json.value("maxFrequency", options.maxFrequency));
        options.smoothingFactor = json.value("smoothingFactor", options.smoothingFactor);
        options.targetFps = std::max(0.0f, json.value("targetFps", options.targetFps));
        if (json.contains("barColor")) {
            parseColor(json["barColor"].get<std::string>(), options.style.barColor);
        }
        if (json.contains("capColor")) {
            parseColor(json["capColor"].get<std::string>(), options.style.capColor);
        }
        if (json.contains("backgroundColor")) {
            parseColor(json["backgroundColor"].get<std::string>(), options.backgroundColor);
        }
    } catch (const std::exception& e) {
        ofLogError("SpectrumBars") << "Invalid spectrum settings: " << e.what();
        return;
    }
    setOptions(options);
}

//--------------------------------------------------------------
namespace {
    struct SpectrumBarsRegistrar {
        SpectrumBarsRegistrar() {
            VisualizerFactory::registerVisualizerType("SpectrumBars",
                []() -> std::unique_ptr<Visualizer> {
                    return std::make_unique<SpectrumBars>();
                });
        }
    };
    static SpectrumBarsRegistrar g_spectrumBarsRegistrar;
}
