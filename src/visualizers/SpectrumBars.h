#pragma once

#include "Visualizer.h"
#include "dsp/FrequencyBanding.h"
#include "dsp/TraceDrawing.h"
#include "waveform/WaveformExtractor.h"

/**
 * SpectrumBars - log-banded spectrum with falling peak caps
 *
 * Per frame: band averages are smoothed, scaled to 80% of the surface
 * height, and each cap follows max(barHeight, cap * capFallSpeed).
 * The BandSet is recomputed only when bin count, bar count, sample rate
 * or max frequency change.
 *
 * With a precomputed envelope set, bars show the track's peak envelope
 * instead of the live spectrum, through the same smoothing and caps.
 */
class SpectrumBars : public Visualizer {
public:
    struct Options {
        int barCount = 64;
        float maxFrequency = 15000.0f;
        float smoothingFactor = 0.7f;
        float capFallSpeed = 0.8f;
        float targetFps = 30.0f;
        TraceDrawing::BarStyle style;
        ofColor backgroundColor = ofColor(0, 0, 0, 0);
    };

    SpectrumBars();
    explicit SpectrumBars(const Options& options);

    const Options& getOptions() const { return options_; }
    void setOptions(const Options& options);

    void setPrecomputedEnvelope(const PeakEnvelope& envelope);
    void clearPrecomputedEnvelope();
    bool hasPrecomputedEnvelope() const { return !precomputed_.empty(); }

    float getTargetFps() const override { return options_.targetFps; }

    const BandSet& getBandSet() const { return bandSet_; }
    size_t getBandSetComputeCount() const { return bandSetComputeCount_; }
    const std::vector<float>& getSmoothedValues() const { return smoothed_; }
    const std::vector<float>& getBarHeights() const { return barHeights_; }
    const std::vector<float>& getCaps() const { return caps_; }

    ofJson toJson() const override;
    void fromJson(const ofJson& json) override;

protected:
    bool render(SignalAcquisition& acquisition, DrawSurface& surface) override;
    void resetState() override;

private:
    void updateFromEnvelope();

    Options options_;
    BandSet bandSet_;
    size_t bandSetComputeCount_ = 0;
    std::vector<float> smoothed_;
    std::vector<float> barHeights_;
    std::vector<float> caps_;
    PeakEnvelope precomputed_;
};
