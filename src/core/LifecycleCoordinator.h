#pragma once

#include "Notices.h"
#include "VisibilitySource.h"
#include "audio/AudioPipeline.h"
#include "ofEvents.h"
#include <cstdint>
#include <functional>

enum class LifecycleState {
    UNINITIALIZED,
    INITIALIZING,
    READY,
    SUSPENDED,
    ERRORED
};

const char* toString(LifecycleState state);

/**
 * LifecycleCoordinator - owns start-up and suspend/resume of the audio pipeline
 *
 * States:
 *   UNINITIALIZED -> INITIALIZING -> READY
 *   READY <-> SUSPENDED         (window hidden / visible)
 *   any -> ERRORED              (initialization failed, until reset())
 *
 * The pipeline starts only from a user gesture or once the media reports
 * it has data. Failure posts a "visualizer unavailable" notice; playback
 * itself is never blocked.
 *
 * On hide it remembers whether playback was running and suspends the
 * pipeline if nothing is playing. On show it resumes a suspended pipeline, and if playback had been running, the media
 * is now paused and more than resumeThresholdMs passed since the last
 * interaction, it calls play(). A failed play() clears the local playing
 * flag.
 */
class LifecycleCoordinator {
public:
    using TimeSource = std::function<uint64_t()>;

    static constexpr uint64_t DEFAULT_RESUME_THRESHOLD_MS = 10000;

    LifecycleCoordinator(AudioPipeline& pipeline, PlaybackTarget& playback, VisibilitySource& visibility);
    ~LifecycleCoordinator();

    LifecycleCoordinator(const LifecycleCoordinator&) = delete;
    LifecycleCoordinator& operator=(const LifecycleCoordinator&) = delete;

    // Triggers
    void onUserGesture();
    void onMediaDataReady();
    // Initializes only if the media already has data
    bool initializeIfMediaReady();

    void reset();

    LifecycleState getState() const { return state_; }
    bool isReady() const { return state_ == LifecycleState::READY; }

    // Local view of playback, updated by the UI and by failed resumes
    void setPlaying(bool playing) { playing_ = playing; }
    bool isPlaying() const { return playing_; }
    // Ready and playing: the analysis node carries the track's audio
    bool hasLiveSignal() const { return state_ == LifecycleState::READY && playing_; }
    bool getWasPlayingWhenHidden() const { return wasPlaying_; }
    uint64_t getLastInteractionTime() const { return lastInteractionMs_; }

    void setResumeThresholdMs(uint64_t thresholdMs) { resumeThresholdMs_ = thresholdMs; }
    void setTimeSource(TimeSource timeSource);
    void setNoticeSink(NoticeSink* sink) { noticeSink_ = sink; }

    ofEvent<LifecycleState> stateChanged;

private:
    bool initialize();
    void setState(LifecycleState state);
    void onVisibilityChanged(bool& visible);
    void handleHidden();
    void handleVisible();

    AudioPipeline& pipeline_;
    PlaybackTarget& playback_;
    VisibilitySource& visibility_;
    NoticeSink* noticeSink_ = nullptr;
    TimeSource timeSource_;

    LifecycleState state_ = LifecycleState::UNINITIALIZED;
    bool playing_ = false;
    bool wasPlaying_ = false;
    uint64_t lastInteractionMs_ = 0;
    uint64_t resumeThresholdMs_ = DEFAULT_RESUME_THRESHOLD_MS;
};
