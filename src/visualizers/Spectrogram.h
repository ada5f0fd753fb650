#pragma once

#include "Visualizer.h"
#include "dsp/ColorMaps.h"
#include <memory>
#include <string>
#include <vector>

/**
 * Spectrogram - left-scrolling time/frequency heatmap
 *
 * Keeps its own scroll layer the size of the target surface. Each frame
 * the layer moves left by one column and the newest spectrum is drawn in
 * the rightmost column, low frequencies at the bottom, then the layer is
 * composited onto the target with the frequency labels on top. One column
 * per drawn frame: a dropped frame is a missing column, nothing is
 * stretched.
 *
 * Linear scale: bin i fills a slice of max(1, height / binCount) rows from
 * the bottom. Log scale: rows up to maxFrequency follow
 * log10(1 + 9 * bin / maxBin), through a row-to-bin map cached per
 * (height, binCount, sampleRate, maxFrequency).
 */
class Spectrogram : public Visualizer {
public:
    struct Options {
        ColorMaps::Type colorMap = ColorMaps::Type::RAINBOW;
        ofColor backgroundColor = ofColor(0, 0, 0, 255);
        float targetFps = 20.0f;
        bool useLogScale = false;
        // Top of the log scale
        float maxFrequency = 15000.0f;
        bool showLabels = true;
        ofColor labelColor = ofColor(255, 255, 255, 178);
    };

    struct FrequencyLabel {
        std::string text;
        float y;
    };

    static constexpr float LABEL_X = 5.0f;
    // Bitmap font line height; labels closer than this are dropped
    static constexpr float LABEL_SPACING = 12.0f;

    Spectrogram();
    explicit Spectrogram(const Options& options);

    const Options& getOptions() const { return options_; }
    void setOptions(const Options& options);

    void setColorMap(ColorMaps::Type colorMap);
    ColorMaps::Type getColorMap() const { return options_.colorMap; }
    void cycleColorMap();

    void setUseLogScale(bool useLogScale);
    bool getUseLogScale() const { return options_.useLogScale; }

    float getTargetFps() const override { return options_.targetFps; }

    const DrawSurface* getScrollLayer() const { return scroll_.get(); }
    size_t getRowMapComputeCount() const { return rowMapComputeCount_; }

    // Highest bin shown on the log scale, within [1, binCount]
    static int maxBinIndex(int binCount, float sampleRate, float maxFrequency);
    // Bin shown on each row of a log-scale column, row 0 at the top
    static std::vector<int> computeLogRowBins(int height, int binCount, float sampleRate, float maxFrequency);
    // Label baselines for the current scale, top to bottom
    std::vector<FrequencyLabel> computeFrequencyLabels(int height, int binCount, float sampleRate) const;
    static std::string formatFrequency(float hz);

    ofJson toJson() const override;
    void fromJson(const ofJson& json) override;

protected:
    bool render(SignalAcquisition& acquisition, DrawSurface& surface) override;
    void resetState() override;

private:
    struct LogRowMap {
        int height = 0;
        int binCount = 0;
        float sampleRate = 0.0f;
        float maxFrequency = 0.0f;
        std::vector<int> rowBins;

        bool matches(int h, int bins, float rate, float maxFreq) const {
            return !rowBins.empty() && height == h && binCount == bins
                && sampleRate == rate && maxFrequency == maxFreq;
        }
    };

    void ensureScrollLayer(const DrawSurface& target);
    void drawLinearColumn(const std::vector<float>& frequencyData);
    void drawLogColumn(const std::vector<float>& frequencyData, float sampleRate);
    void drawFrequencyLabels(DrawSurface& surface, int binCount, float sampleRate);

    Options options_;
    ColorLut lut_;
    std::unique_ptr<DrawSurface> scroll_;
    LogRowMap rowMap_;
    size_t rowMapComputeCount_ = 0;
};
