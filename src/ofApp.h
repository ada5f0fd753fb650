//
//  ofApp.h
//
//  trackScope - live audio visualizers + track peak envelope
//

#pragma once

#include "ofMain.h"
#include "audio/SignalAcquisition.h"
#include "audio/SoundStreamPipeline.h"
#include "audio/TrackPlayer.h"
#include "config/VisualizerSettings.h"
#include "core/LifecycleCoordinator.h"
#include "core/Notices.h"
#include "core/VisibilitySource.h"
#include "render/FboSurface.h"
#include "visualizers/Visualizer.h"
#include "waveform/WaveformAnalysisService.h"
#include "waveform/WaveformCache.h"
#include <memory>
#include <string>
#include <vector>

class ofApp : public ofBaseApp {
public:
    explicit ofApp(const std::string& initialTrack = "");
    ~ofApp() noexcept;

    void setup();
    void update();
    void draw();
    void exit();

    void keyPressed(ofKeyEventArgs& keyEvent);
    void windowResized(int w, int h);
    void dragEvent(ofDragInfo dragInfo);

private:
    // One stacked renderer row
    struct RendererSlot {
        std::unique_ptr<Visualizer> visualizer;
        FboSurface surface;
        ofRectangle bounds;
        bool shown = true;
    };

    void setupRenderers();
    void setupWaveformAnalysis();
    void layoutRenderers(int width, int height);
    void toggleRenderer(size_t index);
    // Attaches shown renderers while the lifecycle is READY, detaches all otherwise
    void setRenderersActive(bool active);
    // Live spectrum while the track plays, its peak envelope otherwise
    void updateBarsSource();
    void togglePlayback();
    bool loadTrack(const std::string& path);
    void onWaveformResult(const WaveformResult& result);
    void onLifecycleStateChanged(LifecycleState& state);

    void drawEnvelopeStrip(const ofRectangle& bounds);
    void drawNotices();
    void updateWindowTitle();

    template<typename T>
    T* findRenderer() {
        for (auto& slot : renderers_) {
            if (auto* renderer = dynamic_cast<T*>(slot.visualizer.get())) {
                return renderer;
            }
        }
        return nullptr;
    }

    std::string initialTrack_;
    VisualizerSettings settings_;

    // Audio
    TrackPlayer player_;
    SoundStreamPipeline pipeline_;
    SignalAcquisition acquisition_;

    // Lifecycle
    WindowVisibilitySource visibility_;
    NoticeBoard notices_;
    std::unique_ptr<LifecycleCoordinator> lifecycle_;

    // Renderers, top to bottom
    std::vector<RendererSlot> renderers_;
    bool renderersActive_ = true;

    // Peak envelope of the loaded track
    WaveformCache waveformCache_;
    std::unique_ptr<WaveformAnalysisService> waveformAnalysis_;
    std::shared_ptr<bool> envelopeOwner_;
    PeakEnvelope envelope_;
    bool envelopeSynthetic_ = false;
    ofRectangle envelopeBounds_;

    static constexpr float ENVELOPE_STRIP_HEIGHT = 80.0f;
};
