#include "Visualizer.h"
#include "ofLog.h"

Visualizer::Visualizer(const std::string& typeName)
    : typeName_(typeName) {
}

Visualizer::~Visualizer() {
    detach();
}

void Visualizer::attach(SignalAcquisition* acquisition, FrameScheduler& scheduler) {
    acquisition_ = acquisition;
    if (scheduler_ == &scheduler) {
        return;
    }
    if (scheduler_) {
        scheduler_->unregisterCallback(this);
    }
    scheduler_ = &scheduler;
    scheduler_->registerCallback(this, [this]() { drawFrame(); }, getTargetFps());
    ofLogVerbose("Visualizer") << typeName_ << " attached";
}

void Visualizer::detach() {
    if (!scheduler_) {
        return;
    }
    scheduler_->unregisterCallback(this);
    scheduler_ = nullptr;
    acquisition_ = nullptr;
    resetState();
    ofLogVerbose("Visualizer") << typeName_ << " detached";
}

void Visualizer::updateCadence() {
    if (scheduler_) {
        scheduler_->setTargetFps(this, getTargetFps());
    }
}

bool Visualizer::drawFrame() {
    if (!enabled_ || !acquisition_ || !surface_ || surface_->getWidth() <= 0 || surface_->getHeight() <= 0) {
        framesSkipped_++;
        return false;
    }
    surface_->beginFrame();
    bool drawn = render(*acquisition_, *surface_);
    surface_->endFrame();
    if (!drawn) {
        framesSkipped_++;
        return false;
    }
    framesDrawn_++;
    return true;
}
