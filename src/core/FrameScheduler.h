#pragma once

#include "FrameRequester.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

/**
 * FrameScheduler - the single render loop shared by all visualizers
 *
 * Each visualizer registers one callback under its own address. The loop
 * runs only while at least one registration exists: the first registration
 * requests a frame, the last unregistration cancels the outstanding
 * request and returns the loop to STOPPED.
 *
 * Per frame every registration is invoked once, in registration order
 * (callers must not rely on it). A registration with a target fps is
 * skipped until 1000/targetFps ms have elapsed since its last run.
 * Registrations added during a pass first run on the next frame; owners
 * removed during a pass are not invoked afterwards in that pass.
 *
 * getInstance() returns the process-wide scheduler, driven by
 * OfFrameRequester. Tests construct their own with a manual requester, or
 * swap the shared one with setInstance().
 *
 * Usage:
 * ```cpp
 * FrameScheduler::getInstance().registerCallback(this, [this]() { drawFrame(); }, 30.0f);
 * ...
 * FrameScheduler::getInstance().unregisterCallback(this);
 * ```
 */
class FrameScheduler {
public:
    using FrameCallback = std::function<void()>;

    enum class LoopState {
        STOPPED,
        RUNNING
    };

    static FrameScheduler& getInstance();
    // nullptr restores the default instance
    static void setInstance(FrameScheduler* instance);

    explicit FrameScheduler(FrameRequester* requester = nullptr);
    ~FrameScheduler();

    FrameScheduler(const FrameScheduler&) = delete;
    FrameScheduler& operator=(const FrameScheduler&) = delete;

    // Stops the loop if it runs; the new requester is used from the next start
    void setFrameRequester(FrameRequester* requester);

    // false if owner is already registered (the existing registration is kept)
    bool registerCallback(const void* owner, FrameCallback callback, float targetFps = 0.0f);
    // false if owner was not registered
    bool unregisterCallback(const void* owner);

    bool isRegistered(const void* owner) const;
    // Changes the cadence of an existing registration; false if owner is not registered
    bool setTargetFps(const void* owner, float targetFps);
    // 0 when owner is not registered
    float getTargetFps(const void* owner) const;
    size_t getNumRegistrations() const { return registrations_.size(); }

    LoopState getLoopState() const { return state_; }
    bool isLoopActive() const { return state_ == LoopState::RUNNING; }
    bool hasPendingFrame() const { return pendingRequest_ != 0; }

    double getLastFrameTime() const { return lastFrameTimeMs_; }
    uint64_t getFrameCount() const { return frameCount_; }

private:
    struct Registration {
        const void* owner;
        FrameCallback callback;
        float targetFps;
        double lastRunMs;
    };

    void startLoop();
    void stopLoop();
    void scheduleNext();
    void onFrame(double timestampMs);

    FrameRequester* requester_ = nullptr;
    std::vector<Registration> registrations_;
    LoopState state_ = LoopState::STOPPED;
    FrameRequester::RequestId pendingRequest_ = 0;
    double lastFrameTimeMs_ = 0.0;
    uint64_t frameCount_ = 0;

    // Invalidates handlers of requests that outlive this scheduler
    std::shared_ptr<bool> alive_;

    static FrameScheduler* injectedInstance_;
};
