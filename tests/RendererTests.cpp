#include "visualizers/Oscilloscope.h"
#include "visualizers/Spectrogram.h"
#include "visualizers/SpectrumBars.h"
#include "visualizers/VisualizerFactory.h"
#include "TestDoubles.h"
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>

using Op = RecordingSurface::Op;

namespace {

class RendererTest : public ::testing::Test {
protected:
    ManualFrameRequester requester;
    FrameScheduler scheduler{&requester};
    FakeAnalysisNode node{2048, 44100.0f};
    SignalAcquisition acquisition{&node};
    double now = 0.0;

    void tick() {
        requester.fire(now);
        now += 1000.0;
    }
};

//--------------------------------------------------------------
// Visualizer base
//--------------------------------------------------------------
TEST_F(RendererTest, AttachAndDetachAreIdempotent) {
    Oscilloscope scope;
    scope.attach(&acquisition, scheduler);
    scope.attach(&acquisition, scheduler);
    EXPECT_TRUE(scope.isAttached());
    EXPECT_EQ(scheduler.getNumRegistrations(), 1u);

    scope.detach();
    scope.detach();
    EXPECT_FALSE(scope.isAttached());
    EXPECT_EQ(scheduler.getNumRegistrations(), 0u);
    EXPECT_FALSE(scheduler.isLoopActive());
}

TEST_F(RendererTest, DestructionDetaches) {
    {
        Oscilloscope scope;
        scope.attach(&acquisition, scheduler);
        EXPECT_TRUE(scheduler.isLoopActive());
    }
    EXPECT_EQ(scheduler.getNumRegistrations(), 0u);
    EXPECT_FALSE(scheduler.isLoopActive());
}

TEST_F(RendererTest, SkipsFramesWithoutSurfaceOrSignal) {
    Oscilloscope scope;
    scope.attach(&acquisition, scheduler);
    tick();
    EXPECT_EQ(scope.getFramesDrawn(), 0u);
    EXPECT_EQ(scope.getFramesSkipped(), 1u);

    RecordingSurface surface(300, 100);
    scope.setSurface(&surface);
    acquisition.setAnalysisNode(nullptr);
    tick();
    EXPECT_EQ(scope.getFramesDrawn(), 0u);
    EXPECT_TRUE(surface.calls.empty());

    acquisition.setAnalysisNode(&node);
    tick();
    EXPECT_EQ(scope.getFramesDrawn(), 1u);
}

TEST_F(RendererTest, DisabledRendererStaysRegisteredButSkips) {
    RecordingSurface surface(300, 100);
    Oscilloscope scope;
    scope.setSurface(&surface);
    scope.attach(&acquisition, scheduler);
    scope.setEnabled(false);

    tick();
    EXPECT_TRUE(scheduler.isRegistered(&scope));
    EXPECT_TRUE(surface.calls.empty());

    scope.setEnabled(true);
    tick();
    EXPECT_EQ(scope.getFramesDrawn(), 1u);
}

TEST_F(RendererTest, SeveralRenderersShareOneLoop) {
    RecordingSurface scopeSurface(300, 100);
    RecordingSurface barsSurface(640, 100);
    Oscilloscope scope;
    SpectrumBars bars;
    scope.setSurface(&scopeSurface);
    bars.setSurface(&barsSurface);
    scope.attach(&acquisition, scheduler);
    bars.attach(&acquisition, scheduler);

    EXPECT_EQ(requester.numRequests, 1u);
    tick();
    EXPECT_EQ(scope.getFramesDrawn(), 1u);
    EXPECT_EQ(bars.getFramesDrawn(), 1u);
    EXPECT_EQ(requester.getNumPending(), 1u);
}

//--------------------------------------------------------------
// Oscilloscope
//--------------------------------------------------------------
TEST_F(RendererTest, OscilloscopeClearsAndDecimatesPerMode) {
    RecordingSurface surface(300, 100);
    Oscilloscope scope;
    scope.setSurface(&surface);
    scope.attach(&acquisition, scheduler);

    tick();
    EXPECT_EQ(surface.calls.front().op, Op::CLEAR);
    EXPECT_EQ(surface.calls.front().color.a, 0);
    EXPECT_EQ(scope.getLastPointCount(), 342u);

    scope.cycleMode();
    EXPECT_EQ(scope.getMode(), TraceDrawing::TraceMode::DOTS);
    tick();
    EXPECT_EQ(scope.getLastPointCount(), 103u);

    scope.cycleMode();
    tick();
    EXPECT_EQ(scope.getLastPointCount(), 76u);

    scope.cycleMode();
    EXPECT_EQ(scope.getMode(), TraceDrawing::TraceMode::LINE);
}

TEST_F(RendererTest, OscilloscopeRestoresGlobalAlphaAfterFill) {
    RecordingSurface surface(300, 100);
    Oscilloscope scope;
    scope.setSurface(&surface);
    scope.attach(&acquisition, scheduler);
    std::fill(node.timeDomain.begin(), node.timeDomain.end(), 0.5f);

    tick();
    auto alphaChanges = surface.callsOf(Op::SET_GLOBAL_ALPHA);
    ASSERT_EQ(alphaChanges.size(), 2u);
    EXPECT_FLOAT_EQ(alphaChanges[0].args[0], 0.2f);
    EXPECT_FLOAT_EQ(alphaChanges[1].args[0], 1.0f);
    EXPECT_FLOAT_EQ(surface.getGlobalAlpha(), 1.0f);
}

TEST_F(RendererTest, OscilloscopeOptionsSurviveJson) {
    Oscilloscope scope;
    ofJson json = scope.toJson();
    EXPECT_EQ(json["type"], "Oscilloscope");
    EXPECT_EQ(json["lineColor"], "#34c759");
    EXPECT_EQ(json["drawMode"], "line");

    json["drawMode"] = "bars";
    json["lineColor"] = "rgba(255,0,0,0.5)";
    json["sensitivity"] = 2.5f;
    json["dashPattern"] = {6, 3};

    Oscilloscope restored;
    restored.fromJson(json);
    EXPECT_EQ(restored.getMode(), TraceDrawing::TraceMode::BARS);
    EXPECT_EQ(restored.getOptions().style.lineColor, ofColor(255, 0, 0, 128));
    EXPECT_FLOAT_EQ(restored.getOptions().style.sensitivity, 2.5f);
    EXPECT_EQ(restored.getOptions().style.dashPattern, std::vector<float>({6.0f, 3.0f}));
}

TEST_F(RendererTest, OscilloscopeIgnoresMalformedJson) {
    Oscilloscope scope;
    scope.fromJson({{"drawMode", "dots"}, {"lineWidth", 4.0f}, {"lineColor", 5}});
    EXPECT_EQ(scope.getMode(), TraceDrawing::TraceMode::LINE);
    EXPECT_FLOAT_EQ(scope.getOptions().style.lineWidth, 2.0f);

    scope.fromJson({{"lineWidth", 0.1f}, {"fillOpacity", 3.0f}, {"sensitivity", -1.0f}});
    EXPECT_FLOAT_EQ(scope.getOptions().style.lineWidth, 0.5f);
    EXPECT_FLOAT_EQ(scope.getOptions().style.fillOpacity, 1.0f);
    EXPECT_FLOAT_EQ(scope.getOptions().style.sensitivity, 0.0f);
}

TEST_F(RendererTest, OscilloscopeCyclesEveryTraceMode) {
    Oscilloscope scope;
    for (int i = 0; i < TraceDrawing::NUM_TRACE_MODES; i++) {
        EXPECT_EQ(static_cast<int>(scope.getMode()), i);
        scope.cycleMode();
    }
    EXPECT_EQ(scope.getMode(), TraceDrawing::TraceMode::LINE);
}

TEST_F(RendererTest, ChangingTargetFpsUpdatesRegistration) {
    Oscilloscope scope;
    scope.attach(&acquisition, scheduler);
    EXPECT_FLOAT_EQ(scheduler.getTargetFps(&scope), 0.0f);

    Oscilloscope::Options options = scope.getOptions();
    options.targetFps = 30.0f;
    scope.setOptions(options);
    EXPECT_FLOAT_EQ(scheduler.getTargetFps(&scope), 30.0f);

    SpectrumBars bars;
    bars.attach(&acquisition, scheduler);
    bars.fromJson({{"targetFps", 12}});
    EXPECT_FLOAT_EQ(scheduler.getTargetFps(&bars), 12.0f);

    // Not attached: nothing to update
    scope.detach();
    options.targetFps = 10.0f;
    scope.setOptions(options);
    EXPECT_FLOAT_EQ(scheduler.getTargetFps(&scope), 0.0f);
}

//--------------------------------------------------------------
// SpectrumBars
//--------------------------------------------------------------
TEST_F(RendererTest, SpectrumBarsReusesBandSetUntilLayoutChanges) {
    RecordingSurface surface(640, 100);
    SpectrumBars bars;
    bars.setSurface(&surface);
    bars.attach(&acquisition, scheduler);

    for (int i = 0; i < 5; i++) {
        tick();
    }
    EXPECT_EQ(bars.getFramesDrawn(), 5u);
    EXPECT_EQ(bars.getBandSetComputeCount(), 1u);
    EXPECT_EQ(bars.getBandSet().size(), 64u);

    node.setFftSize(4096);
    tick();
    EXPECT_EQ(bars.getBandSetComputeCount(), 2u);
    EXPECT_EQ(bars.getBandSet().bufferLength, 2048);
}

TEST_F(RendererTest, SpectrumBarsScaleToEightyPercentAndCapsFall) {
    RecordingSurface surface(640, 100);
    SpectrumBars::Options options;
    options.smoothingFactor = 0.0f;
    options.targetFps = 0.0f;
    SpectrumBars bars(options);
    bars.setSurface(&surface);
    bars.attach(&acquisition, scheduler);

    std::fill(node.frequency.begin(), node.frequency.end(), 255.0f);
    tick();
    ASSERT_EQ(bars.getBarHeights().size(), 64u);
    EXPECT_FLOAT_EQ(bars.getBarHeights()[10], 80.0f);
    EXPECT_FLOAT_EQ(bars.getCaps()[10], 80.0f);

    std::fill(node.frequency.begin(), node.frequency.end(), 0.0f);
    for (int n = 1; n <= 5; n++) {
        tick();
        EXPECT_FLOAT_EQ(bars.getBarHeights()[10], 0.0f);
        EXPECT_NEAR(bars.getCaps()[10], 80.0f * std::pow(0.8f, n), 1e-3f);
    }
}

TEST_F(RendererTest, SpectrumBarsDrawAtComputedPositions) {
    RecordingSurface surface(640, 100);
    SpectrumBars::Options options;
    options.smoothingFactor = 0.0f;
    options.targetFps = 0.0f;
    SpectrumBars bars(options);
    bars.setSurface(&surface);
    bars.attach(&acquisition, scheduler);

    std::fill(node.frequency.begin(), node.frequency.end(), 255.0f);
    tick();

    auto rects = surface.callsOf(Op::FILL_RECT);
    ASSERT_EQ(rects.size(), 128u);
    // Bar 1 then cap 1
    EXPECT_FLOAT_EQ(rects[2].args[0], 10.0f);
    EXPECT_FLOAT_EQ(rects[2].args[1], 20.0f);
    EXPECT_FLOAT_EQ(rects[2].args[2], 8.0f);
    EXPECT_FLOAT_EQ(rects[3].args[1], 100.0f - 80.0f - 2.0f);
}

TEST_F(RendererTest, SpectrumBarsDetachResetsState) {
    RecordingSurface surface(640, 100);
    SpectrumBars bars;
    bars.setSurface(&surface);
    bars.attach(&acquisition, scheduler);
    std::fill(node.frequency.begin(), node.frequency.end(), 200.0f);
    tick();
    EXPECT_FALSE(bars.getCaps().empty());

    bars.detach();
    EXPECT_TRUE(bars.getCaps().empty());
    EXPECT_TRUE(bars.getSmoothedValues().empty());
}

TEST_F(RendererTest, SpectrumBarsCanShowPrecomputedEnvelope) {
    RecordingSurface surface(320, 100);
    SpectrumBars::Options options;
    options.barCount = 4;
    options.smoothingFactor = 0.0f;
    options.targetFps = 0.0f;
    SpectrumBars bars(options);
    bars.setSurface(&surface);
    bars.setPrecomputedEnvelope({0.0f, 0.25f, 0.5f, 0.75f, 1.0f, 1.0f, 1.0f, 1.0f});
    bars.attach(&acquisition, scheduler);

    // Live data is not consulted
    acquisition.setAnalysisNode(nullptr);
    tick();
    ASSERT_EQ(bars.getSmoothedValues().size(), 4u);
    EXPECT_FLOAT_EQ(bars.getSmoothedValues()[0], 0.0f);
    EXPECT_FLOAT_EQ(bars.getSmoothedValues()[1], 0.5f * 255.0f);
    EXPECT_FLOAT_EQ(bars.getSmoothedValues()[2], 255.0f);

    bars.clearPrecomputedEnvelope();
    EXPECT_FALSE(bars.hasPrecomputedEnvelope());
    tick();
    EXPECT_EQ(bars.getFramesDrawn(), 1u);
}

TEST_F(RendererTest, SpectrumBarsClampOptions) {
    SpectrumBars::Options options;
    options.barCount = 0;
    options.smoothingFactor = 1.5f;
    options.capFallSpeed = 2.0f;
    SpectrumBars bars(options);
    EXPECT_EQ(bars.getOptions().barCount, 1);
    EXPECT_LT(bars.getOptions().smoothingFactor, 1.0f);
    EXPECT_LT(bars.getOptions().capFallSpeed, 1.0f);
}

//--------------------------------------------------------------
// Spectrogram
//--------------------------------------------------------------
class SpectrogramTest : public RendererTest {
protected:
    void SetUp() override {
        node.setFftSize(16);
        spectrogram.setSurface(&target);
        spectrogram.attach(&acquisition, scheduler);
    }

    const RecordingSurface& layer() const {
        const auto* recording = dynamic_cast<const RecordingSurface*>(spectrogram.getScrollLayer());
        EXPECT_NE(recording, nullptr);
        return *recording;
    }

    RecordingSurface target{4, 8};
    Spectrogram spectrogram;
};

TEST_F(SpectrogramTest, NewestColumnIsRightmostWithLowFrequenciesAtBottom) {
    node.frequency[0] = 255.0f;
    tick();

    auto rects = layer().callsOf(Op::FILL_RECT);
    ASSERT_EQ(rects.size(), 8u);
    EXPECT_EQ(rects[0].args, std::vector<float>({3.0f, 7.0f, 1.0f, 1.0f}));
    EXPECT_EQ(rects[0].color, ofColor(255, 0, 0));
    EXPECT_EQ(rects[7].args, std::vector<float>({3.0f, 0.0f, 1.0f, 1.0f}));
    EXPECT_NE(rects[7].color, ofColor(255, 0, 0));
}

TEST_F(SpectrogramTest, CompositesLayerOntoClearedTarget) {
    tick();

    ASSERT_GE(target.calls.size(), 2u);
    EXPECT_EQ(target.calls[0].op, Op::CLEAR);
    EXPECT_EQ(target.calls[0].color, ofColor(0, 0, 0, 255));
    EXPECT_EQ(target.calls[1].op, Op::DRAW_LAYER);
    EXPECT_EQ(target.calls[1].args, std::vector<float>({0.0f, 0.0f, 4.0f, 8.0f}));
    EXPECT_EQ(target.frameDepth, 0);
    EXPECT_EQ(layer().frameDepth, 0);
}

TEST_F(SpectrogramTest, ScrollsOneColumnPerFrame) {
    std::fill(node.frequency.begin(), node.frequency.end(), 255.0f);
    tick();
    std::fill(node.frequency.begin(), node.frequency.end(), 60.0f);
    tick();

    const RecordingSurface& scroll = layer();
    EXPECT_EQ(scroll.calls.front().op, Op::CLEAR);
    auto shifts = scroll.callsOf(Op::SHIFT_LEFT);
    ASSERT_EQ(shifts.size(), 2u);
    EXPECT_FLOAT_EQ(shifts[0].args[0], 1.0f);

    auto rects = scroll.callsOf(Op::FILL_RECT);
    ASSERT_EQ(rects.size(), 16u);
    EXPECT_EQ(rects.back().color, ColorMaps::rainbow(60));
    EXPECT_FLOAT_EQ(rects.back().args[0], 3.0f);
}

TEST_F(SpectrogramTest, SkippedFrameDropsColumn) {
    std::fill(node.frequency.begin(), node.frequency.end(), 255.0f);
    tick();

    acquisition.setAnalysisNode(nullptr);
    tick();
    EXPECT_EQ(spectrogram.getFramesSkipped(), 1u);
    EXPECT_EQ(layer().count(Op::SHIFT_LEFT), 1u);
    EXPECT_EQ(layer().count(Op::FILL_RECT), 8u);
}

TEST_F(SpectrogramTest, ResizedTargetRecreatesScrollLayer) {
    tick();
    EXPECT_EQ(spectrogram.getScrollLayer()->getWidth(), 4);

    target.resize(6, 8);
    tick();
    ASSERT_NE(spectrogram.getScrollLayer(), nullptr);
    EXPECT_EQ(spectrogram.getScrollLayer()->getWidth(), 6);
    // A fresh layer starts from the background
    EXPECT_EQ(layer().calls.front().op, Op::CLEAR);
    EXPECT_EQ(layer().count(Op::SHIFT_LEFT), 1u);
    EXPECT_FLOAT_EQ(layer().callsOf(Op::FILL_RECT).front().args[0], 5.0f);

    tick();
    EXPECT_EQ(layer().count(Op::SHIFT_LEFT), 2u);
}

TEST_F(SpectrogramTest, ColorMapCyclesThroughAllMaps) {
    EXPECT_EQ(spectrogram.getColorMap(), ColorMaps::Type::RAINBOW);
    spectrogram.cycleColorMap();
    EXPECT_EQ(spectrogram.getColorMap(), ColorMaps::Type::GRADIENT);
    for (int i = 1; i < ColorMaps::NUM_TYPES; i++) {
        spectrogram.cycleColorMap();
    }
    EXPECT_EQ(spectrogram.getColorMap(), ColorMaps::Type::RAINBOW);

    spectrogram.setColorMap(ColorMaps::Type::INFERNO);
    node.frequency[0] = 255.0f;
    tick();
    EXPECT_EQ(layer().callsOf(Op::FILL_RECT).front().color, ColorMaps::inferno(1.0f));
}

TEST_F(SpectrogramTest, LogRowsMapTopRowsToHigherBins) {
    EXPECT_EQ(Spectrogram::maxBinIndex(8, 44100.0f, 15000.0f), 5);
    EXPECT_EQ(Spectrogram::maxBinIndex(8, 44100.0f, 30000.0f), 8);
    EXPECT_EQ(Spectrogram::maxBinIndex(8, 44100.0f, 1.0f), 1);
    EXPECT_EQ(Spectrogram::maxBinIndex(8, 0.0f, 15000.0f), 8);

    EXPECT_EQ(Spectrogram::computeLogRowBins(8, 8, 44100.0f, 15000.0f),
              std::vector<int>({3, 2, 1, 1, 0, 0, 0, 0}));

    auto rows = Spectrogram::computeLogRowBins(200, 1024, 44100.0f, 15000.0f);
    ASSERT_EQ(rows.size(), 200u);
    for (size_t y = 1; y < rows.size(); y++) {
        EXPECT_LE(rows[y], rows[y - 1]);
    }
    EXPECT_EQ(rows.back(), 0);
    EXPECT_LT(rows.front(), 696);
    EXPECT_TRUE(Spectrogram::computeLogRowBins(0, 8, 44100.0f, 15000.0f).empty());
}

TEST_F(SpectrogramTest, LogColumnFillsOneRectPerBinRun) {
    spectrogram.setUseLogScale(true);
    node.frequency[3] = 255.0f;
    tick();

    auto rects = layer().callsOf(Op::FILL_RECT);
    ASSERT_EQ(rects.size(), 4u);
    EXPECT_EQ(rects[0].args, std::vector<float>({3.0f, 0.0f, 1.0f, 1.0f}));
    EXPECT_EQ(rects[0].color, ofColor(255, 0, 0));
    EXPECT_EQ(rects[2].args, std::vector<float>({3.0f, 2.0f, 1.0f, 2.0f}));
    EXPECT_EQ(rects[3].args, std::vector<float>({3.0f, 4.0f, 1.0f, 4.0f}));
}

TEST_F(SpectrogramTest, LogRowMapIsCachedUntilLayoutChanges) {
    spectrogram.setUseLogScale(true);
    tick();
    tick();
    EXPECT_EQ(spectrogram.getRowMapComputeCount(), 1u);

    target.resize(4, 16);
    tick();
    EXPECT_EQ(spectrogram.getRowMapComputeCount(), 2u);

    Spectrogram::Options options = spectrogram.getOptions();
    options.maxFrequency = 8000.0f;
    spectrogram.setOptions(options);
    tick();
    EXPECT_EQ(spectrogram.getRowMapComputeCount(), 3u);
}

TEST_F(SpectrogramTest, SwitchingScaleClearsHistory) {
    tick();
    spectrogram.setUseLogScale(true);
    EXPECT_TRUE(spectrogram.getUseLogScale());
    EXPECT_EQ(layer().calls.back().op, Op::CLEAR);

    spectrogram.setUseLogScale(true);
    EXPECT_EQ(layer().count(Op::CLEAR), 2u);
}

TEST_F(SpectrogramTest, LabelsAreDrawnOverTheLayer) {
    node.setFftSize(2048);
    target.resize(100, 200);
    tick();

    auto labels = target.callsOf(Op::DRAW_TEXT);
    ASSERT_EQ(labels.size(), 2u);
    EXPECT_EQ(labels[0].text, "2 kHz");
    EXPECT_EQ(labels[1].text, "500 Hz");
    EXPECT_FLOAT_EQ(labels[0].args[0], Spectrogram::LABEL_X);
    EXPECT_LT(labels[0].args[1], labels[1].args[1]);
    EXPECT_EQ(labels[0].color, ofColor(255, 255, 255, 178));
    EXPECT_EQ(target.calls.back().op, Op::DRAW_TEXT);
    // Labels never reach the scrolling layer
    EXPECT_EQ(layer().count(Op::DRAW_TEXT), 0u);
}

TEST_F(SpectrogramTest, LogLabelsStayBelowMaxFrequencyAndApart) {
    spectrogram.setUseLogScale(true);
    auto labels = spectrogram.computeFrequencyLabels(200, 1024, 44100.0f);
    ASSERT_EQ(labels.size(), 6u);
    EXPECT_EQ(labels.front().text, "10 kHz");
    EXPECT_EQ(labels[1].text, "5 kHz");
    EXPECT_EQ(labels.back().text, "200 Hz");
    for (size_t i = 1; i < labels.size(); i++) {
        EXPECT_GE(labels[i].y - labels[i - 1].y, Spectrogram::LABEL_SPACING);
    }
    // Too short for any label
    EXPECT_TRUE(spectrogram.computeFrequencyLabels(8, 8, 44100.0f).empty());
}

TEST_F(SpectrogramTest, HiddenLabelsAreNotDrawn) {
    Spectrogram::Options options = spectrogram.getOptions();
    options.showLabels = false;
    spectrogram.setOptions(options);
    node.setFftSize(2048);
    target.resize(100, 200);
    tick();
    EXPECT_EQ(target.count(Op::DRAW_TEXT), 0u);
}

TEST_F(SpectrogramTest, FormatsFrequencies) {
    EXPECT_EQ(Spectrogram::formatFrequency(50.0f), "50 Hz");
    EXPECT_EQ(Spectrogram::formatFrequency(1000.0f), "1 kHz");
    EXPECT_EQ(Spectrogram::formatFrequency(20000.0f), "20 kHz");
}

TEST_F(SpectrogramTest, ScaleOptionsSurviveJson) {
    ofJson json = spectrogram.toJson();
    EXPECT_EQ(json["useLogScale"], false);
    EXPECT_EQ(json["showLabels"], true);

    json["useLogScale"] = true;
    json["maxFrequency"] = 8000.0f;
    json["showLabels"] = false;
    json["labelColor"] = "#ff0000";

    Spectrogram restored;
    restored.fromJson(json);
    EXPECT_TRUE(restored.getUseLogScale());
    EXPECT_FLOAT_EQ(restored.getOptions().maxFrequency, 8000.0f);
    EXPECT_FALSE(restored.getOptions().showLabels);
    EXPECT_EQ(restored.getOptions().labelColor, ofColor(255, 0, 0));

    restored.fromJson({{"maxFrequency", -10.0f}});
    EXPECT_FLOAT_EQ(restored.getOptions().maxFrequency, 1.0f);
}

//--------------------------------------------------------------
// Factory
//--------------------------------------------------------------
TEST(VisualizerFactoryTest, BuiltInTypesAreRegistered) {
    EXPECT_TRUE(VisualizerFactory::isVisualizerTypeRegistered("Oscilloscope"));
    EXPECT_TRUE(VisualizerFactory::isVisualizerTypeRegistered("SpectrumBars"));
    EXPECT_TRUE(VisualizerFactory::isVisualizerTypeRegistered("Spectrogram"));
    EXPECT_GE(VisualizerFactory::getRegisteredTypes().size(), 3u);
}

TEST(VisualizerFactoryTest, CreatesByTypeName) {
    auto visualizer = VisualizerFactory::create("Spectrogram");
    ASSERT_NE(visualizer, nullptr);
    EXPECT_EQ(visualizer->getTypeName(), "Spectrogram");
    EXPECT_EQ(VisualizerFactory::create("Waterfall"), nullptr);
}

TEST(VisualizerFactoryTest, CreateFromJsonAppliesOptions) {
    ofJson json = {{"type", "SpectrumBars"}, {"barCount", 16}, {"targetFps", 24}};
    auto visualizer = VisualizerFactory::createFromJson(json);
    ASSERT_NE(visualizer, nullptr);
    auto* bars = dynamic_cast<SpectrumBars*>(visualizer.get());
    ASSERT_NE(bars, nullptr);
    EXPECT_EQ(bars->getOptions().barCount, 16);
    EXPECT_FLOAT_EQ(bars->getTargetFps(), 24.0f);

    EXPECT_EQ(VisualizerFactory::createFromJson(ofJson::array()), nullptr);
}

} // namespace
