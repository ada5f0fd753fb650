#include "VisualizerSettings.h"
#include "visualizers/Visualizer.h"
#include "ofFileUtils.h"
#include "ofLog.h"
#include "ofUtils.h"
#include <algorithm>
#include <cstdint>

namespace {
    const char* SETTINGS_VERSION = "1.0";

    // Read signed so a negative value clamps to 0 instead of wrapping
    uint64_t readMilliseconds(const ofJson& json, const std::string& key, uint64_t fallback) {
        if (!json.contains(key)) {
            return fallback;
        }
        int64_t ms = json.at(key).get<int64_t>();
        if (ms < 0) {
            ofLogWarning("VisualizerSettings") << key << " " << ms << " is negative, using 0";
            return 0;
        }
        return static_cast<uint64_t>(ms);
    }
}

//--------------------------------------------------------------
bool VisualizerSettings::load(const std::string& path) {
    std::string filePath = ofToDataPath(path, true);
    if (!ofFile::doesFileExist(filePath)) {
        ofLogNotice("VisualizerSettings") << "No settings at " << filePath << ", using defaults";
        return false;
    }

    ofFile file(filePath, ofFile::ReadOnly);
    if (!file.is_open()) {
        ofLogError("VisualizerSettings") << "Failed to open file for reading: " << filePath;
        return false;
    }
    std::string jsonString = file.readToBuffer().getText();
    file.close();

    ofJson json;
    try {
        json = ofJson::parse(jsonString);
    } catch (const std::exception& e) {
        ofLogError("VisualizerSettings") << "Ignoring malformed settings file " << filePath << ": " << e.what();
        return false;
    }
    if (!json.is_object()) {
        ofLogError("VisualizerSettings") << "Ignoring settings file " << filePath << ": expected object";
        return false;
    }

    fromJson(json);
    ofLogNotice("VisualizerSettings") << "Loaded settings from " << filePath;
    return true;
}

bool VisualizerSettings::save(const std::string& path) const {
    std::string filePath = ofToDataPath(path, true);
    try {
        ofFile file(filePath, ofFile::WriteOnly);
        if (!file.is_open()) {
            ofLogError("VisualizerSettings") << "Failed to open file for writing: " << filePath;
            return false;
        }
        file << toJson().dump(4);
        file.close();
        ofLogNotice("VisualizerSettings") << "Settings saved to " << filePath;
        return true;
    } catch (const std::exception& e) {
        ofLogError("VisualizerSettings") << "Exception while saving settings: " << e.what();
        return false;
    }
}

//--------------------------------------------------------------
ofJson VisualizerSettings::toJson() const {
    ofJson json;
    json["version"] = SETTINGS_VERSION;
    json["lowPowerMode"] = lowPowerMode;

    json["analyser"]["fftSize"] = analyser.fftSize;
    json["analyser"]["smoothingTimeConstant"] = analyser.smoothingTimeConstant;
    json["analyser"]["minDecibels"] = analyser.minDecibels;
    json["analyser"]["maxDecibels"] = analyser.maxDecibels;

    json["waveform"]["targetPointCount"] = waveform.targetPointCount;
    json["waveform"]["analysisTimeoutMs"] = waveform.analysisTimeoutMs;
    json["waveform"]["retryCooldownMs"] = waveform.retryCooldownMs;
    json["waveform"]["cacheFile"] = waveform.cacheFile;

    json["lifecycle"]["resumeThresholdMs"] = resumeThresholdMs;

    json["renderers"] = renderers_;
    return json;
}

void VisualizerSettings::fromJson(const ofJson& json) {
    if (!json.is_object()) {
        ofLogWarning("VisualizerSettings") << "Settings must be an object, keeping current values";
        return;
    }

    std::string version = json.value("version", std::string(SETTINGS_VERSION));
    if (version != SETTINGS_VERSION) {
        ofLogWarning("VisualizerSettings") << "Settings version mismatch: " << version
                                           << " (expected " << SETTINGS_VERSION << ")";
    }

    try {
        lowPowerMode = json.value("lowPowerMode", lowPowerMode);

        if (json.contains("analyser") && json["analyser"].is_object()) {
            const ofJson& a = json["analyser"];
            analyser.fftSize = a.value("fftSize", analyser.fftSize);
            analyser.smoothingTimeConstant = std::max(0.0f, std::min(1.0f,
                a.value("smoothingTimeConstant", analyser.smoothingTimeConstant)));
            float minDb = a.value("minDecibels", analyser.minDecibels);
            float maxDb = a.value("maxDecibels", analyser.maxDecibels);
            if (minDb < maxDb) {
                analyser.minDecibels = minDb;
                analyser.maxDecibels = maxDb;
            } else {
                ofLogWarning("VisualizerSettings") << "Ignoring decibel range " << minDb << ".." << maxDb;
            }
        }

        if (json.contains("waveform") && json["waveform"].is_object()) {
            const ofJson& w = json["waveform"];
            waveform.targetPointCount = std::max(1, w.value("targetPointCount", waveform.targetPointCount));
            waveform.analysisTimeoutMs = readMilliseconds(w, "analysisTimeoutMs", waveform.analysisTimeoutMs);
            waveform.retryCooldownMs = readMilliseconds(w, "retryCooldownMs", waveform.retryCooldownMs);
            waveform.cacheFile = w.value("cacheFile", waveform.cacheFile);
        }

        if (json.contains("lifecycle") && json["lifecycle"].is_object()) {
            resumeThresholdMs = readMilliseconds(json["lifecycle"], "resumeThresholdMs", resumeThresholdMs);
        }

        if (json.contains("renderers") && json["renderers"].is_object()) {
            for (auto it = json["renderers"].begin(); it != json["renderers"].end(); ++it) {
                if (it.value().is_object()) {
                    renderers_[it.key()] = it.value();
                }
            }
        }
    } catch (const std::exception& e) {
        ofLogError("VisualizerSettings") << "Invalid settings value: " << e.what();
    }
}

//--------------------------------------------------------------
ofJson VisualizerSettings::getRendererJson(const std::string& typeName) const {
    ofJson json = renderers_.contains(typeName) ? renderers_[typeName] : ofJson::object();
    if (!lowPowerMode) {
        return json;
    }

    if (typeName == "Spectrogram") {
        json["targetFps"] = LOW_POWER_SPECTROGRAM_FPS;
    } else {
        float fps = json.value("targetFps", 0.0f);
        json["targetFps"] = (fps <= 0.0f) ? LOW_POWER_FPS : std::min(fps, LOW_POWER_FPS);
    }
    if (typeName == "SpectrumBars") {
        json["barCount"] = LOW_POWER_BAR_COUNT;
    }
    return json;
}

void VisualizerSettings::applyTo(Visualizer& visualizer) const {
    ofJson json = getRendererJson(visualizer.getTypeName());
    if (json.empty()) {
        return;
    }
    visualizer.fromJson(json);
}

void VisualizerSettings::captureFrom(const Visualizer& visualizer) {
    const std::string& typeName = visualizer.getTypeName();
    ofJson json = visualizer.toJson();

    if (lowPowerMode) {
        // Keep the stored full-power values for the overridden keys
        const ofJson previous = renderers_.contains(typeName) ? renderers_[typeName] : ofJson::object();
        for (const char* key : {"targetFps", "barCount"}) {
            if (previous.contains(key)) {
                json[key] = previous[key];
            } else {
                json.erase(key);
            }
        }
    }
    renderers_[typeName] = json;
}
