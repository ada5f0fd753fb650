#include "FrameScheduler.h"
#include "ofLog.h"
#include <algorithm>

FrameScheduler* FrameScheduler::injectedInstance_ = nullptr;

//--------------------------------------------------------------
FrameScheduler& FrameScheduler::getInstance() {
    if (injectedInstance_) {
        return *injectedInstance_;
    }
    static OfFrameRequester defaultRequester;
    static FrameScheduler defaultScheduler(&defaultRequester);
    return defaultScheduler;
}

void FrameScheduler::setInstance(FrameScheduler* instance) {
    injectedInstance_ = instance;
}

//--------------------------------------------------------------
FrameScheduler::FrameScheduler(FrameRequester* requester)
    : requester_(requester)
    , alive_(std::make_shared<bool>(true)) {
}

FrameScheduler::~FrameScheduler() {
    stopLoop();
    if (injectedInstance_ == this) {
        injectedInstance_ = nullptr;
    }
}

void FrameScheduler::setFrameRequester(FrameRequester* requester) {
    stopLoop();
    requester_ = requester;
    if (!registrations_.empty()) {
        startLoop();
    }
}

//--------------------------------------------------------------
bool FrameScheduler::registerCallback(const void* owner, FrameCallback callback, float targetFps) {
    if (owner == nullptr || !callback) {
        ofLogWarning("FrameScheduler") << "Ignoring registration without owner or callback";
        return false;
    }
    if (isRegistered(owner)) {
        return false;
    }

    registrations_.push_back({owner, std::move(callback), std::max(0.0f, targetFps), -1.0});
    ofLogVerbose("FrameScheduler") << "Callback registered (total: " << registrations_.size() << ")";

    if (state_ == LoopState::STOPPED) {
        startLoop();
    }
    return true;
}

bool FrameScheduler::unregisterCallback(const void* owner) {
    auto it = std::find_if(registrations_.begin(), registrations_.end(),
                           [owner](const Registration& r) { return r.owner == owner; });
    if (it == registrations_.end()) {
        return false;
    }
    registrations_.erase(it);
    ofLogVerbose("FrameScheduler") << "Callback unregistered (total: " << registrations_.size() << ")";

    if (registrations_.empty()) {
        stopLoop();
    }
    return true;
}

bool FrameScheduler::isRegistered(const void* owner) const {
    return std::any_of(registrations_.begin(), registrations_.end(),
                       [owner](const Registration& r) { return r.owner == owner; });
}

bool FrameScheduler::setTargetFps(const void* owner, float targetFps) {
    auto it = std::find_if(registrations_.begin(), registrations_.end(),
                           [owner](const Registration& r) { return r.owner == owner; });
    if (it == registrations_.end()) {
        return false;
    }
    it->targetFps = std::max(0.0f, targetFps);
    return true;
}

float FrameScheduler::getTargetFps(const void* owner) const {
    auto it = std::find_if(registrations_.begin(), registrations_.end(),
                           [owner](const Registration& r) { return r.owner == owner; });
    return it == registrations_.end() ? 0.0f : it->targetFps;
}

//--------------------------------------------------------------
void FrameScheduler::startLoop() {
    if (!requester_) {
        ofLogWarning("FrameScheduler") << "No frame requester, loop cannot start";
        return;
    }
    state_ = LoopState::RUNNING;
    scheduleNext();
    ofLogVerbose("FrameScheduler") << "Loop started";
}

void FrameScheduler::stopLoop() {
    if (pendingRequest_ != 0 && requester_) {
        requester_->cancelFrame(pendingRequest_);
    }
    pendingRequest_ = 0;
    if (state_ == LoopState::RUNNING) {
        state_ = LoopState::STOPPED;
        ofLogVerbose("FrameScheduler") << "Loop stopped";
    }
}

void FrameScheduler::scheduleNext() {
    if (pendingRequest_ != 0 || !requester_) {
        return;
    }
    std::weak_ptr<bool> alive = alive_;
    pendingRequest_ = requester_->requestFrame([this, alive](double timestampMs) {
        if (alive.expired()) {
            return;
        }
        onFrame(timestampMs);
    });
}

void FrameScheduler::onFrame(double timestampMs) {
    // This request has fired
    pendingRequest_ = 0;
    if (state_ != LoopState::RUNNING) {
        return;
    }

    // Callbacks may register or unregister while we iterate
    std::vector<const void*> owners;
    owners.reserve(registrations_.size());
    for (const auto& registration : registrations_) {
        owners.push_back(registration.owner);
    }

    for (const void* owner : owners) {
        auto it = std::find_if(registrations_.begin(), registrations_.end(),
                               [owner](const Registration& r) { return r.owner == owner; });
        if (it == registrations_.end()) {
            continue;
        }
        if (it->targetFps > 0.0f && it->lastRunMs >= 0.0) {
            // 1ms slack: 30fps on a 60Hz display runs every other frame
            double interval = 1000.0 / it->targetFps - 1.0;
            if (timestampMs - it->lastRunMs < interval) {
                continue;
            }
        }
        it->lastRunMs = timestampMs;
        FrameCallback callback = it->callback;
        callback();
    }

    lastFrameTimeMs_ = timestampMs;
    frameCount_++;

    if (state_ == LoopState::RUNNING && !registrations_.empty()) {
        scheduleNext();
    }
}
