#pragma once

#include "audio/SignalAcquisition.h"
#include "core/FrameScheduler.h"
#include "render/DrawSurface.h"
#include "ofJson.h"
#include <cstdint>
#include <string>

/**
 * Visualizer - base of the live renderers
 *
 * attach() registers one frame callback with the scheduler and binds the
 * signal source; detach() unregisters it and resets renderer state. Both
 * are idempotent and the destructor detaches. The owner (ofApp) decides
 * when a renderer is visible and supplies the surface it draws on.
 *
 * Subclasses implement render(): pull a buffer, return false if there is
 * nothing to draw yet. They never hold a pulled buffer past the call.
 */
class Visualizer {
public:
    explicit Visualizer(const std::string& typeName);
    virtual ~Visualizer();

    Visualizer(const Visualizer&) = delete;
    Visualizer& operator=(const Visualizer&) = delete;

    const std::string& getTypeName() const { return typeName_; }

    void attach(SignalAcquisition* acquisition, FrameScheduler& scheduler = FrameScheduler::getInstance());
    void detach();
    bool isAttached() const { return scheduler_ != nullptr; }

    void setSurface(DrawSurface* surface) { surface_ = surface; }
    DrawSurface* getSurface() const { return surface_; }

    // Disabled renderers stay registered but skip their frames
    void setEnabled(bool enabled) { enabled_ = enabled; }
    bool isEnabled() const { return enabled_; }

    // Runs one frame; false when it was skipped
    bool drawFrame();

    uint64_t getFramesDrawn() const { return framesDrawn_; }
    uint64_t getFramesSkipped() const { return framesSkipped_; }

    // 0 = every display refresh
    virtual float getTargetFps() const { return 0.0f; }

    virtual ofJson toJson() const = 0;
    virtual void fromJson(const ofJson& json) = 0;

protected:
    // Subclasses call this when getTargetFps() changes while attached
    void updateCadence();

    virtual bool render(SignalAcquisition& acquisition, DrawSurface& surface) = 0;
    // Drops smoothing/cap/scroll state
    virtual void resetState() {}

private:
    std::string typeName_;
    SignalAcquisition* acquisition_ = nullptr;
    FrameScheduler* scheduler_ = nullptr;
    DrawSurface* surface_ = nullptr;
    bool enabled_ = true;
    uint64_t framesDrawn_ = 0;
    uint64_t framesSkipped_ = 0;
};
