#pragma once

#include "audio/SoundStreamPipeline.h"
#include "ofJson.h"
#include <cstdint>
#include <string>

class Visualizer;

struct WaveformSettings {
    int targetPointCount = 1000;
    uint64_t analysisTimeoutMs = 30000;
    uint64_t retryCooldownMs = 30000;
    std::string cacheFile = "waveform_cache.json";
};

/**
 * VisualizerSettings - every tunable of the app, persisted as one ofJson file
 *
 * Renderer options are kept in each renderer's own toJson() format under
 * "renderers" and handed back through fromJson(), so adding an option to a
 * renderer needs no change here.
 *
 * Missing keys keep their defaults. A malformed file is logged and ignored.
 *
 * Low power mode caps live renderers at 20 fps (spectrogram 15) and uses
 * 32 spectrum bars. The overrides are applied on top of the stored options
 * and never written back into them.
 *
 * File format:
 * ```json
 * {
 *   "version": "1.0",
 *   "lowPowerMode": false,
 *   "analyser": { "fftSize": 2048, "smoothingTimeConstant": 0.8, ... },
 *   "waveform": { "targetPointCount": 1000, ... },
 *   "lifecycle": { "resumeThresholdMs": 10000 },
 *   "renderers": { "Oscilloscope": { ... }, "SpectrumBars": { ... } }
 * }
 * ```
 */
class VisualizerSettings {
public:
    static constexpr const char* DEFAULT_FILE = "settings.json";
    static constexpr float LOW_POWER_FPS = 20.0f;
    static constexpr float LOW_POWER_SPECTROGRAM_FPS = 15.0f;
    static constexpr int LOW_POWER_BAR_COUNT = 32;

    AnalyserSettings analyser;
    WaveformSettings waveform;
    uint64_t resumeThresholdMs = 10000;
    bool lowPowerMode = false;

    // Path relative to the data folder
    bool load(const std::string& path = DEFAULT_FILE);
    bool save(const std::string& path = DEFAULT_FILE) const;

    ofJson toJson() const;
    void fromJson(const ofJson& json);

    // Stored options for a renderer type, with low power overrides applied
    ofJson getRendererJson(const std::string& typeName) const;
    void applyTo(Visualizer& visualizer) const;
    void captureFrom(const Visualizer& visualizer);

private:
    ofJson renderers_ = ofJson::object();
};
