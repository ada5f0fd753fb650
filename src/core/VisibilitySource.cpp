#include "VisibilitySource.h"
#include "ofLog.h"

void VisibilitySource::notifyVisibility(bool visible) {
    ofNotifyEvent(visibilityChanged, visible, this);
}

//--------------------------------------------------------------
StaticVisibilitySource::StaticVisibilitySource(bool visible)
    : visible_(visible) {
}

void StaticVisibilitySource::setVisible(bool visible) {
    if (visible_ == visible) {
        return;
    }
    visible_ = visible;
    notifyVisibility(visible_);
}

//--------------------------------------------------------------
WindowVisibilitySource::WindowVisibilitySource() {
    ofAddListener(ofEvents().windowResized, this, &WindowVisibilitySource::onWindowResized);
}

WindowVisibilitySource::~WindowVisibilitySource() {
    ofRemoveListener(ofEvents().windowResized, this, &WindowVisibilitySource::onWindowResized);
}

void WindowVisibilitySource::onWindowResized(ofResizeEventArgs& args) {
    setHidden(args.width <= 0 || args.height <= 0);
}

void WindowVisibilitySource::setHidden(bool hidden) {
    bool visible = !hidden;
    if (visible_ == visible) {
        return;
    }
    visible_ = visible;
    ofLogNotice("WindowVisibilitySource") << (visible_ ? "Window visible" : "Window hidden");
    notifyVisibility(visible_);
}
