#pragma once

#include "Visualizer.h"
#include "dsp/TraceDrawing.h"

/**
 * Oscilloscope - decimated time-domain trace
 *
 * Modes: LINE (optionally dashed, with an alpha fill under the curve),
 * DOTS and BARS from the centre line. Draws at every display refresh
 * unless a target fps is set.
 */
class Oscilloscope : public Visualizer {
public:
    struct Options {
        TraceDrawing::TraceMode mode = TraceDrawing::TraceMode::LINE;
        TraceDrawing::TraceStyle style;
        ofColor backgroundColor = ofColor(0, 0, 0, 0);
        float targetFps = 0.0f;
    };

    Oscilloscope();
    explicit Oscilloscope(const Options& options);

    const Options& getOptions() const { return options_; }
    void setOptions(const Options& options);

    void setMode(TraceDrawing::TraceMode mode) { options_.mode = mode; }
    TraceDrawing::TraceMode getMode() const { return options_.mode; }
    void cycleMode();

    void setSensitivity(float sensitivity);

    float getTargetFps() const override { return options_.targetFps; }
    size_t getLastPointCount() const { return lastPointCount_; }

    ofJson toJson() const override;
    void fromJson(const ofJson& json) override;

protected:
    bool render(SignalAcquisition& acquisition, DrawSurface& surface) override;
    void resetState() override { lastPointCount_ = 0; }

private:
    Options options_;
    size_t lastPointCount_ = 0;
};
