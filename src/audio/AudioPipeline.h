#pragma once

#include "AnalysisNode.h"

/**
 * AudioPipeline - the one audio graph the visualizers observe
 *
 * Only LifecycleCoordinator starts, suspends or resumes it.
 */
class AudioPipeline {
public:
    virtual ~AudioPipeline() = default;

    // false when the device/stream cannot be opened
    virtual bool initialize() = 0;
    virtual bool isInitialized() const = 0;
    // false while suspended, by us or by the host
    virtual bool isRunning() const = 0;
    virtual bool suspend() = 0;
    virtual bool resume() = 0;
    virtual void close() = 0;

    // nullptr until initialized
    virtual AnalysisNode* getAnalysisNode() = 0;
};

/**
 * PlaybackTarget - the media element whose playback the pipeline carries
 */
class PlaybackTarget {
public:
    virtual ~PlaybackTarget() = default;

    virtual bool hasData() const = 0;
    virtual bool isPaused() const = 0;
    // false when playback could not start
    virtual bool play() = 0;
    virtual void pause() = 0;
};
