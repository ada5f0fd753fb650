#include "FrameRequester.h"
#include "ofEvents.h"
#include "ofUtils.h"

OfFrameRequester::OfFrameRequester() {
    ofAddListener(ofEvents().draw, this, &OfFrameRequester::onDraw, OF_EVENT_ORDER_AFTER_APP);
}

OfFrameRequester::~OfFrameRequester() {
    ofRemoveListener(ofEvents().draw, this, &OfFrameRequester::onDraw, OF_EVENT_ORDER_AFTER_APP);
}

FrameRequester::RequestId OfFrameRequester::requestFrame(FrameHandler handler) {
    RequestId id = nextId_++;
    pending_[id] = std::move(handler);
    return id;
}

void OfFrameRequester::cancelFrame(RequestId id) {
    pending_.erase(id);
}

void OfFrameRequester::onDraw(ofEventArgs& args) {
    if (pending_.empty()) {
        return;
    }
    std::map<RequestId, FrameHandler> due;
    due.swap(pending_);

    double timestampMs = ofGetElapsedTimef() * 1000.0;
    for (auto& pair : due) {
        if (pair.second) {
            pair.second(timestampMs);
        }
    }
}
