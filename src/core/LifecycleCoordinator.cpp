#include "LifecycleCoordinator.h"
#include "ofLog.h"
#include "ofUtils.h"

const char* toString(LifecycleState state) {
    switch (state) {
        case LifecycleState::UNINITIALIZED: return "Uninitialized";
        case LifecycleState::INITIALIZING: return "Initializing";
        case LifecycleState::READY: return "Ready";
        case LifecycleState::SUSPENDED: return "Suspended";
        case LifecycleState::ERRORED: return "Errored";
    }
    return "Unknown";
}

//--------------------------------------------------------------
LifecycleCoordinator::LifecycleCoordinator(AudioPipeline& pipeline, PlaybackTarget& playback,
                                           VisibilitySource& visibility)
    : pipeline_(pipeline)
    , playback_(playback)
    , visibility_(visibility)
    , timeSource_([]() { return ofGetElapsedTimeMillis(); }) {
    ofAddListener(visibility_.visibilityChanged, this, &LifecycleCoordinator::onVisibilityChanged);
}

LifecycleCoordinator::~LifecycleCoordinator() {
    ofRemoveListener(visibility_.visibilityChanged, this, &LifecycleCoordinator::onVisibilityChanged);
}

void LifecycleCoordinator::setTimeSource(TimeSource timeSource) {
    if (timeSource) {
        timeSource_ = std::move(timeSource);
    }
}

//--------------------------------------------------------------
void LifecycleCoordinator::onUserGesture() {
    lastInteractionMs_ = timeSource_();
    if (state_ == LifecycleState::UNINITIALIZED) {
        initialize();
    }
}

void LifecycleCoordinator::onMediaDataReady() {
    if (state_ == LifecycleState::UNINITIALIZED) {
        initialize();
    }
}

bool LifecycleCoordinator::initializeIfMediaReady() {
    if (state_ != LifecycleState::UNINITIALIZED || !playback_.hasData()) {
        return false;
    }
    return initialize();
}

bool LifecycleCoordinator::initialize() {
    setState(LifecycleState::INITIALIZING);

    bool success = false;
    try {
        success = pipeline_.initialize();
    } catch (const std::exception& e) {
        ofLogError("LifecycleCoordinator") << "Audio pipeline threw during initialization: " << e.what();
    }

    if (!success) {
        ofLogError("LifecycleCoordinator") << "Audio pipeline initialization failed, visualizer disabled";
        setState(LifecycleState::ERRORED);
        if (noticeSink_) {
            Notice notice;
            notice.error = VisualizerError::LIFECYCLE_INIT_FAILURE;
            notice.title = "Visualizer unavailable";
            notice.message = "Audio playback will continue normally.";
            notice.recoverable = false;
            notice.timestampMs = timeSource_();
            noticeSink_->post(notice);
        }
        return false;
    }

    setState(visibility_.isVisible() ? LifecycleState::READY : LifecycleState::SUSPENDED);
    return true;
}

void LifecycleCoordinator::reset() {
    pipeline_.close();
    wasPlaying_ = false;
    setState(LifecycleState::UNINITIALIZED);
}

//--------------------------------------------------------------
void LifecycleCoordinator::onVisibilityChanged(bool& visible) {
    if (visible) {
        handleVisible();
    } else {
        handleHidden();
    }
}

void LifecycleCoordinator::handleHidden() {
    wasPlaying_ = playing_;
    lastInteractionMs_ = timeSource_();
    if (state_ != LifecycleState::READY) {
        return;
    }
    if (!playing_ && pipeline_.isRunning() && !pipeline_.suspend()) {
        ofLogWarning("LifecycleCoordinator") << "Audio pipeline did not suspend";
    }
    setState(LifecycleState::SUSPENDED);
}

void LifecycleCoordinator::handleVisible() {
    if (state_ == LifecycleState::SUSPENDED) {
        if (pipeline_.isInitialized() && !pipeline_.isRunning() && !pipeline_.resume()) {
            ofLogWarning("LifecycleCoordinator") << "Audio pipeline did not resume";
        }
        setState(LifecycleState::READY);
    }

    uint64_t now = timeSource_();
    uint64_t elapsed = now >= lastInteractionMs_ ? now - lastInteractionMs_ : 0;
    if (!wasPlaying_ || !playback_.isPaused() || elapsed <= resumeThresholdMs_) {
        return;
    }

    ofLogNotice("LifecycleCoordinator") << "Resuming playback after " << elapsed << "ms hidden";
    bool resumed = false;
    try {
        resumed = playback_.play();
    } catch (const std::exception& e) {
        ofLogWarning("LifecycleCoordinator") << "Resume threw: " << e.what();
    }
    if (!resumed) {
        ofLogWarning("LifecycleCoordinator") << "Could not resume playback";
        playing_ = false;
    }
    wasPlaying_ = false;
}

void LifecycleCoordinator::setState(LifecycleState state) {
    if (state_ == state) {
        return;
    }
    // ERRORED sticks until reset()
    if (state_ == LifecycleState::ERRORED && state != LifecycleState::UNINITIALIZED) {
        return;
    }
    ofLogNotice("LifecycleCoordinator") << toString(state_) << " -> " << toString(state);
    state_ = state;
    ofNotifyEvent(stateChanged, state_, this);
}
