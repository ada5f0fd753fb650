#include "Spectrogram.h"
#include "VisualizerFactory.h"
#include "config/ColorUtils.h"
#include "ofLog.h"
#include "ofUtils.h"
#include <algorithm>
#include <cmath>

Spectrogram::Spectrogram()
    : Visualizer("Spectrogram") {
    lut_.build(options_.colorMap);
}

Spectrogram::Spectrogram(const Options& options)
    : Visualizer("Spectrogram") {
    setOptions(options);
}

void Spectrogram::setOptions(const Options& options) {
    options_ = options;
    options_.targetFps = std::max(0.0f, options_.targetFps);
    options_.maxFrequency = std::max(1.0f, options_.maxFrequency);
    lut_.build(options_.colorMap);
    updateCadence();
}

void Spectrogram::setColorMap(ColorMaps::Type colorMap) {
    if (options_.colorMap != colorMap || lut_.getType() != colorMap) {
        options_.colorMap = colorMap;
        lut_.build(colorMap);
    }
}

void Spectrogram::cycleColorMap() {
    int next = (static_cast<int>(options_.colorMap) + 1) % ColorMaps::NUM_TYPES;
    setColorMap(static_cast<ColorMaps::Type>(next));
    ofLogNotice("Spectrogram") << "Color map: " << ColorMaps::toString(options_.colorMap);
}

void Spectrogram::setUseLogScale(bool useLogScale) {
    if (options_.useLogScale == useLogScale) {
        return;
    }
    options_.useLogScale = useLogScale;
    // Columns drawn on the other scale no longer line up
    resetState();
    ofLogNotice("Spectrogram") << "Frequency scale: " << (useLogScale ? "log" : "linear");
}

void Spectrogram::resetState() {
    if (scroll_) {
        scroll_->clear(options_.backgroundColor);
    }
}

//--------------------------------------------------------------
int Spectrogram::maxBinIndex(int binCount, float sampleRate, float maxFrequency) {
    if (binCount <= 0) {
        return 0;
    }
    float nyquist = sampleRate / 2.0f;
    if (nyquist <= 0.0f) {
        return binCount;
    }
    int maxBin = static_cast<int>(std::floor(maxFrequency / nyquist * binCount));
    return std::max(1, std::min(binCount, maxBin));
}

std::vector<int> Spectrogram::computeLogRowBins(int height, int binCount, float sampleRate, float maxFrequency) {
    std::vector<int> rowBins;
    const int maxBin = maxBinIndex(binCount, sampleRate, maxFrequency);
    if (height <= 0 || maxBin <= 0) {
        return rowBins;
    }
    rowBins.resize(height);
    for (int y = 0; y < height; y++) {
        // Inverse of rowFromBottom = log10(1 + 9 * bin / maxBin) * height
        float fromBottom = static_cast<float>(height - 1 - y) / height;
        int bin = static_cast<int>(std::floor((std::pow(10.0f, fromBottom) - 1.0f) / 9.0f * maxBin));
        rowBins[y] = std::max(0, std::min(maxBin - 1, bin));
    }
    return rowBins;
}

std::string Spectrogram::formatFrequency(float hz) {
    if (hz >= 1000.0f) {
        return ofToString(static_cast<int>(std::round(hz / 1000.0f))) + " kHz";
    }
    return ofToString(static_cast<int>(std::round(hz))) + " Hz";
}

std::vector<Spectrogram::FrequencyLabel> Spectrogram::computeFrequencyLabels(int height, int binCount, float sampleRate) const {
    static const std::vector<float> LOG_LABELS = {20000.0f, 10000.0f, 5000.0f, 2000.0f, 1000.0f, 500.0f, 200.0f, 50.0f};
    static const std::vector<float> LINEAR_LABELS = {20000.0f, 15000.0f, 10000.0f, 5000.0f, 2000.0f, 500.0f};

    std::vector<FrequencyLabel> labels;
    const float nyquist = sampleRate / 2.0f;
    if (height <= 0 || binCount <= 0 || nyquist <= 0.0f) {
        return labels;
    }

    const float h = static_cast<float>(height);
    const int maxBin = maxBinIndex(binCount, sampleRate, options_.maxFrequency);
    const float sliceHeight = std::max(1.0f, h / binCount);

    for (float frequency : options_.useLogScale ? LOG_LABELS : LINEAR_LABELS) {
        float bin = frequency / nyquist * binCount;
        float y;
        if (options_.useLogScale) {
            if (bin >= maxBin) {
                continue;
            }
            y = h - 1.0f - std::log10(1.0f + 9.0f * bin / maxBin) * h;
        } else {
            y = h - bin * sliceHeight;
        }
        if (y < LABEL_SPACING || y > h) {
            continue;
        }
        if (!labels.empty() && y - labels.back().y < LABEL_SPACING) {
            continue;
        }
        labels.push_back({formatFrequency(frequency), y});
    }
    return labels;
}

//--------------------------------------------------------------
void Spectrogram::ensureScrollLayer(const DrawSurface& target) {
    const int width = target.getWidth();
    const int height = target.getHeight();
    if (scroll_ && scroll_->getWidth() == width && scroll_->getHeight() == height) {
        return;
    }
    scroll_ = target.createLayer(width, height);
    scroll_->clear(options_.backgroundColor);
    ofLogVerbose("Spectrogram") << "Scroll layer " << width << "x" << height;
}

void Spectrogram::drawLinearColumn(const std::vector<float>& frequencyData) {
    const float height = static_cast<float>(scroll_->getHeight());
    const float x = static_cast<float>(scroll_->getWidth() - 1);
    const size_t bufferLength = frequencyData.size();
    const float sliceHeight = std::max(1.0f, height / static_cast<float>(bufferLength));

    for (size_t i = 0; i < bufferLength; i++) {
        float y = height - i * sliceHeight - sliceHeight;
        if (y + sliceHeight <= 0.0f) {
            break;
        }
        scroll_->fillRect(x, y, 1.0f, sliceHeight, lut_.lookup(frequencyData[i]));
    }
}

void Spectrogram::drawLogColumn(const std::vector<float>& frequencyData, float sampleRate) {
    const int height = scroll_->getHeight();
    const int binCount = static_cast<int>(frequencyData.size());
    if (!rowMap_.matches(height, binCount, sampleRate, options_.maxFrequency)) {
        rowMap_.height = height;
        rowMap_.binCount = binCount;
        rowMap_.sampleRate = sampleRate;
        rowMap_.maxFrequency = options_.maxFrequency;
        rowMap_.rowBins = computeLogRowBins(height, binCount, sampleRate, options_.maxFrequency);
        rowMapComputeCount_++;
        ofLogVerbose("Spectrogram") << "Log row map: " << height << " rows over "
                                    << maxBinIndex(binCount, sampleRate, options_.maxFrequency) << " bins";
    }
    const std::vector<int>& rowBins = rowMap_.rowBins;
    if (rowBins.empty()) {
        return;
    }

    // Adjacent rows showing the same bin become one rect
    const float x = static_cast<float>(scroll_->getWidth() - 1);
    int runStart = 0;
    for (int y = 1; y <= height; y++) {
        if (y == height || rowBins[y] != rowBins[runStart]) {
            const ofColor& color = lut_.lookup(frequencyData[rowBins[runStart]]);
            scroll_->fillRect(x, static_cast<float>(runStart), 1.0f, static_cast<float>(y - runStart), color);
            runStart = y;
        }
    }
}

void Spectrogram::drawFrequencyLabels(DrawSurface& surface, int binCount, float sampleRate) {
    for (const auto& label : computeFrequencyLabels(surface.getHeight(), binCount, sampleRate)) {
        surface.drawText(label.text, LABEL_X, label.y, options_.labelColor);
    }
}

bool Spectrogram::render(SignalAcquisition& acquisition, DrawSurface& surface) {
    const std::vector<float>* frequencyData = acquisition.pullFrequency();
    if (!frequencyData || frequencyData->empty()) {
        return false;
    }
    const float sampleRate = acquisition.getSampleRate();
    const int binCount = static_cast<int>(frequencyData->size());

    ensureScrollLayer(surface);
    scroll_->beginFrame();
    scroll_->shiftLeft(1);
    if (options_.useLogScale) {
        drawLogColumn(*frequencyData, sampleRate);
    } else {
        drawLinearColumn(*frequencyData);
    }
    scroll_->endFrame();

    surface.clear(options_.backgroundColor);
    surface.drawLayer(*scroll_, 0.0f, 0.0f);
    if (options_.showLabels) {
        drawFrequencyLabels(surface, binCount, sampleRate);
    }
    return true;
}

//--------------------------------------------------------------
ofJson Spectrogram::toJson() const {
    ofJson json;
    json["type"] = getTypeName();
    json["colorMap"] = ColorMaps::toString(options_.colorMap);
    json["backgroundColor"] = colorToString(options_.backgroundColor);
    json["targetFps"] = options_.targetFps;
    json["useLogScale"] = options_.useLogScale;
    json["maxFrequency"] = options_.maxFrequency;
    json["showLabels"] = options_.showLabels;
    json["labelColor"] = colorToString(options_.labelColor);
    return json;
}

void Spectrogram::fromJson(const ofJson& json) {
    Options options = options_;
    try {
        if (json.contains("colorMap")) {
            options.colorMap = ColorMaps::fromString(json["colorMap"].get<std::string>());
        }
        if (json.contains("backgroundColor")) {
            parseColor(json["backgroundColor"].get<std::string>(), options.backgroundColor);
        }
        options.targetFps = json.value("targetFps", options.targetFps);
        options.useLogScale = json.value("useLogScale", options.useLogScale);
        options.maxFrequency = json.value("maxFrequency", options.maxFrequency);
        options.showLabels = json.value("showLabels", options.showLabels);
        if (json.contains("labelColor")) {
            parseColor(json["labelColor"].get<std::string>(), options.labelColor);
        }
    } catch (const std::exception& e) {
        ofLogError("Spectrogram") << "Invalid spectrogram settings: " << e.what();
        return;
    }
    setOptions(options);
}

//--------------------------------------------------------------
namespace {
    struct SpectrogramRegistrar {
        SpectrogramRegistrar() {
            VisualizerFactory::registerVisualizerType("Spectrogram",
                []() -> std::unique_ptr<Visualizer> {
                    return std::make_unique<Spectrogram>();
                });
        }
    };
    static SpectrogramRegistrar g_spectrogramRegistrar;
}
