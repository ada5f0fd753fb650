//
//  ofApp.cpp
//
//  trackScope - live audio visualizers + track peak envelope
//

#include "ofApp.h"
#include "visualizers/Oscilloscope.h"
#include "visualizers/Spectrogram.h"
#include "visualizers/SpectrumBars.h"
#include "visualizers/VisualizerFactory.h"
#include "ofLog.h"
#include <algorithm>

namespace {
    const std::vector<std::string> RENDERER_TYPES = {"Oscilloscope", "SpectrumBars", "Spectrogram"};
    const float NOTICE_WIDTH = 360.0f;
    const float NOTICE_HEIGHT = 48.0f;
}

//--------------------------------------------------------------
ofApp::ofApp(const std::string& initialTrack)
    : initialTrack_(initialTrack)
    , pipeline_(player_) {
}

//--------------------------------------------------------------
ofApp::~ofApp() noexcept {
    // Renderers unregister from the scheduler in their destructors
}

//--------------------------------------------------------------
void ofApp::setup() {
    ofSetFrameRate(60);
    ofSetVerticalSync(true);
    ofSetEscapeQuitsApp(false);
    ofBackground(0);

    settings_.load();

    pipeline_.applyAnalyserSettings(settings_.analyser);
    player_.setLoop(true);

    lifecycle_ = std::make_unique<LifecycleCoordinator>(pipeline_, player_, visibility_);
    lifecycle_->setResumeThresholdMs(settings_.resumeThresholdMs);
    lifecycle_->setNoticeSink(&notices_);
    ofAddListener(lifecycle_->stateChanged, this, &ofApp::onLifecycleStateChanged);

    setupRenderers();
    setupWaveformAnalysis();
    layoutRenderers(ofGetWidth(), ofGetHeight());

    if (!initialTrack_.empty()) {
        loadTrack(initialTrack_);
    }
    updateWindowTitle();
}

//--------------------------------------------------------------
void ofApp::setupRenderers() {
    for (const auto& type : RENDERER_TYPES) {
        RendererSlot slot;
        slot.visualizer = VisualizerFactory::create(type);
        if (!slot.visualizer) {
            ofLogError("ofApp") << "Renderer type not registered: " << type;
            continue;
        }
        settings_.applyTo(*slot.visualizer);
        renderers_.push_back(std::move(slot));
    }

    // Surfaces are assigned in layoutRenderers(); vector storage is stable from here on
    for (auto& slot : renderers_) {
        slot.visualizer->setSurface(&slot.surface);
        slot.visualizer->attach(&acquisition_);
    }
    ofLogNotice("ofApp") << "Attached " << renderers_.size() << " renderer(s)";
}

//--------------------------------------------------------------
void ofApp::setupWaveformAnalysis() {
    auto keyValueStore = std::make_shared<JsonFileKeyValueStore>(settings_.waveform.cacheFile);
    auto durable = std::make_shared<CompositeWaveformStore>();
    durable->addStore(std::make_shared<LocalWaveformStore>(keyValueStore));
    waveformCache_.setDurableStore(durable);

    waveformAnalysis_ = std::make_unique<WaveformAnalysisService>(
        waveformCache_,
        std::make_shared<UrlAudioFetcher>(),
        std::make_shared<SoundFileDecoder>());
    waveformAnalysis_->setTargetPointCount(settings_.waveform.targetPointCount);
    waveformAnalysis_->setTimeoutMs(settings_.waveform.analysisTimeoutMs);
    waveformAnalysis_->setRetryCooldownMs(settings_.waveform.retryCooldownMs);
    waveformAnalysis_->setNoticeSink(&notices_);
}

//--------------------------------------------------------------
void ofApp::update() {
    if (waveformAnalysis_) {
        waveformAnalysis_->update();
    }
}

//--------------------------------------------------------------
void ofApp::draw() {
    ofClear(0, 0, 0, 255);

    // Surfaces hold what the scheduler drew at the end of the previous frame
    for (auto& slot : renderers_) {
        if (!slot.shown || !slot.surface.isAllocated()) {
            continue;
        }
        ofSetColor(255);
        slot.surface.draw(slot.bounds);
    }

    drawEnvelopeStrip(envelopeBounds_);
    drawNotices();

    if (lifecycle_ && lifecycle_->getState() == LifecycleState::UNINITIALIZED) {
        ofSetColor(200);
        ofDrawBitmapString("Press space to start audio", 20, 30);
    }
}

//--------------------------------------------------------------
void ofApp::drawEnvelopeStrip(const ofRectangle& bounds) {
    ofSetColor(20);
    ofDrawRectangle(bounds);
    if (envelope_.empty()) {
        return;
    }

    float centerY = bounds.getCenter().y;
    float halfHeight = bounds.getHeight() * 0.45f;
    float step = bounds.getWidth() / envelope_.size();

    if (envelopeSynthetic_) {
        ofSetColor(110, 110, 130);
    } else {
        ofSetColor(155, 135, 245);
    }
    for (size_t i = 0; i < envelope_.size(); i++) {
        float x = bounds.x + i * step;
        float extent = envelope_[i] * halfHeight;
        ofDrawRectangle(x, centerY - extent, std::max(1.0f, step - 1.0f), extent * 2.0f);
    }

    // Playhead
    float position = ofClamp(player_.getPosition(), 0.0f, 1.0f);
    ofSetColor(255, 0, 0);
    float playheadX = bounds.x + position * bounds.getWidth();
    ofDrawLine(playheadX, bounds.y, playheadX, bounds.getBottom());
}

//--------------------------------------------------------------
void ofApp::drawNotices() {
    std::vector<Notice> active = notices_.getActiveNotices(ofGetElapsedTimeMillis());
    float x = ofGetWidth() - NOTICE_WIDTH - 16.0f;
    float y = 16.0f;
    for (const auto& notice : active) {
        ofSetColor(notice.recoverable ? ofColor(60, 60, 20, 230) : ofColor(90, 20, 20, 230));
        ofDrawRectangle(x, y, NOTICE_WIDTH, NOTICE_HEIGHT);
        ofSetColor(255);
        ofDrawBitmapString(notice.title, x + 10, y + 18);
        ofSetColor(200);
        ofDrawBitmapString(notice.message, x + 10, y + 36);
        y += NOTICE_HEIGHT + 8.0f;
    }
}

//--------------------------------------------------------------
void ofApp::exit() {
    ofLogNotice("ofApp") << "Exiting application...";

    for (auto& slot : renderers_) {
        settings_.captureFrom(*slot.visualizer);
        slot.visualizer->detach();
    }
    settings_.save();

    if (envelopeOwner_ && waveformAnalysis_) {
        waveformAnalysis_->cancel(envelopeOwner_);
    }
    envelopeOwner_.reset();

    if (lifecycle_) {
        ofRemoveListener(lifecycle_->stateChanged, this, &ofApp::onLifecycleStateChanged);
    }
    acquisition_.setAnalysisNode(nullptr);
    pipeline_.close();

    // Blocks on any running fetch/decode
    if (waveformAnalysis_) {
        waveformAnalysis_->waitForWorkers();
    }

    ofLogNotice("ofApp") << "Exit cleanup complete";
}

//--------------------------------------------------------------
void ofApp::keyPressed(ofKeyEventArgs& keyEvent) {
    switch (keyEvent.key) {
        case ' ':
            togglePlayback();
            break;
        case '1':
        case '2':
        case '3':
            toggleRenderer(keyEvent.key - '1');
            break;
        case 'm':
            if (auto* oscilloscope = findRenderer<Oscilloscope>()) {
                oscilloscope->cycleMode();
            }
            break;
        case 'c':
            if (auto* spectrogram = findRenderer<Spectrogram>()) {
                spectrogram->cycleColorMap();
            }
            break;
        case 'l':
            if (auto* spectrogram = findRenderer<Spectrogram>()) {
                spectrogram->setUseLogScale(!spectrogram->getUseLogScale());
            }
            break;
        default:
            break;
    }
}

//--------------------------------------------------------------
void ofApp::togglePlayback() {
    lifecycle_->onUserGesture();

    if (!player_.hasData()) {
        ofLogNotice("ofApp") << "No track loaded, drop an audio file on the window";
        return;
    }

    if (player_.isPaused()) {
        if (pipeline_.isInitialized() && !pipeline_.isRunning()) {
            pipeline_.resume();
        }
        bool started = player_.play();
        lifecycle_->setPlaying(started);
        if (!started) {
            ofLogWarning("ofApp") << "Playback did not start";
        }
    } else {
        player_.pause();
        lifecycle_->setPlaying(false);
    }
    updateBarsSource();
}

//--------------------------------------------------------------
void ofApp::toggleRenderer(size_t index) {
    if (index >= renderers_.size()) {
        return;
    }
    RendererSlot& slot = renderers_[index];
    slot.shown = !slot.shown;
    if (slot.shown && renderersActive_) {
        slot.visualizer->attach(&acquisition_);
    } else {
        slot.visualizer->detach();
    }
    ofLogNotice("ofApp") << slot.visualizer->getTypeName() << (slot.shown ? " shown" : " hidden");
    layoutRenderers(ofGetWidth(), ofGetHeight());
}

//--------------------------------------------------------------
void ofApp::setRenderersActive(bool active) {
    if (renderersActive_ == active) {
        return;
    }
    renderersActive_ = active;
    for (auto& slot : renderers_) {
        if (active && slot.shown) {
            slot.visualizer->attach(&acquisition_);
        } else {
            slot.visualizer->detach();
        }
    }
    ofLogNotice("ofApp") << "Renderers " << (active ? "resumed" : "paused");
}

//--------------------------------------------------------------
void ofApp::layoutRenderers(int width, int height) {
    envelopeBounds_.set(0, height - ENVELOPE_STRIP_HEIGHT, width, ENVELOPE_STRIP_HEIGHT);

    size_t numShown = std::count_if(renderers_.begin(), renderers_.end(),
                                    [](const RendererSlot& slot) { return slot.shown; });
    if (numShown == 0 || width <= 0 || height <= ENVELOPE_STRIP_HEIGHT) {
        return;
    }

    int rowHeight = static_cast<int>((height - ENVELOPE_STRIP_HEIGHT) / numShown);
    int y = 0;
    for (auto& slot : renderers_) {
        if (!slot.shown) {
            continue;
        }
        slot.bounds.set(0, y, width, rowHeight);
        slot.surface.allocate(width, rowHeight);
        y += rowHeight;
    }
}

//--------------------------------------------------------------
void ofApp::windowResized(int w, int h) {
    layoutRenderers(w, h);
    ofLogVerbose("ofApp") << "Window resized to " << w << "x" << h;
}

//--------------------------------------------------------------
void ofApp::dragEvent(ofDragInfo dragInfo) {
    if (dragInfo.files.empty()) {
        return;
    }
    loadTrack(dragInfo.files.front());
}

//--------------------------------------------------------------
bool ofApp::loadTrack(const std::string& path) {
    if (!player_.load(path)) {
        ofLogError("ofApp") << "Could not load track: " << path;
        return false;
    }
    ofLogNotice("ofApp") << "Loaded track: " << path;
    lifecycle_->setPlaying(false);
    lifecycle_->onMediaDataReady();

    // Drop callbacks for the previous track
    if (envelopeOwner_) {
        waveformAnalysis_->cancel(envelopeOwner_);
    }
    envelopeOwner_ = std::make_shared<bool>(true);
    envelope_.clear();
    envelopeSynthetic_ = false;

    updateBarsSource();

    WaveformRequest request;
    request.audioUrl = player_.getPath();
    auto outcome = waveformAnalysis_->request(request, envelopeOwner_,
        [this](const WaveformResult& result) { onWaveformResult(result); });
    if (outcome == WaveformAnalysisService::RequestOutcome::INVALID) {
        ofLogWarning("ofApp") << "Waveform analysis not possible for " << path;
    }

    updateWindowTitle();
    return true;
}

//--------------------------------------------------------------
void ofApp::onWaveformResult(const WaveformResult& result) {
    envelope_ = result.envelope;
    envelopeSynthetic_ = result.synthetic;
    ofLogNotice("ofApp") << "Peak envelope ready: " << envelope_.size() << " points"
                         << (envelopeSynthetic_ ? " (approximate)" : "");
    updateBarsSource();
}

//--------------------------------------------------------------
void ofApp::updateBarsSource() {
    auto* bars = findRenderer<SpectrumBars>();
    if (!bars) {
        return;
    }
    if (envelope_.empty() || (lifecycle_ && lifecycle_->hasLiveSignal())) {
        bars->clearPrecomputedEnvelope();
    } else {
        bars->setPrecomputedEnvelope(envelope_);
    }
}

//--------------------------------------------------------------
void ofApp::onLifecycleStateChanged(LifecycleState& state) {
    switch (state) {
        case LifecycleState::READY:
            acquisition_.setAnalysisNode(pipeline_.getAnalysisNode());
            setRenderersActive(true);
            break;
        case LifecycleState::SUSPENDED:
            // Nothing is on screen to draw into
            setRenderersActive(false);
            break;
        case LifecycleState::UNINITIALIZED:
        case LifecycleState::ERRORED:
            acquisition_.setAnalysisNode(nullptr);
            setRenderersActive(true);
            break;
        default:
            break;
    }
    updateBarsSource();
    updateWindowTitle();
}

//--------------------------------------------------------------
void ofApp::updateWindowTitle() {
    std::string title = "trackScope";
    if (player_.hasData()) {
        title += " - " + ofFilePath::getFileName(player_.getPath());
    }
    if (lifecycle_) {
        title += std::string(" [") + toString(lifecycle_->getState()) + "]";
    }
    ofSetWindowTitle(title);
}
