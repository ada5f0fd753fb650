#pragma once

#include "AudioAnalyser.h"
#include "AudioPipeline.h"
#include "TrackPlayer.h"
#include "ofSoundStream.h"
#include "ofSoundBuffer.h"
#include "ofSoundBaseTypes.h"

struct AnalyserSettings {
    int fftSize = 2048;
    float smoothingTimeConstant = 0.8f;
    float minDecibels = -100.0f;
    float maxDecibels = -30.0f;
};

/**
 * SoundStreamPipeline - ofSoundStream output driving player -> analyser
 *
 * The stream's output callback pulls the chain from the analyser end, so
 * every buffer the device plays has passed through the analyser first.
 *
 * Architecture:
 *   ofSoundStream --audioOut--> AudioAnalyser <-- TrackPlayer
 */
class SoundStreamPipeline : public AudioPipeline, public ofBaseSoundOutput {
public:
    SoundStreamPipeline(TrackPlayer& player, const AnalyserSettings& analyserSettings = AnalyserSettings());
    ~SoundStreamPipeline();

    bool initialize() override;
    bool isInitialized() const override { return initialized_; }
    bool isRunning() const override { return initialized_ && running_; }
    bool suspend() override;
    bool resume() override;
    void close() override;

    AnalysisNode* getAnalysisNode() override;
    AudioAnalyser& getAnalyser() { return analyser_; }

    void applyAnalyserSettings(const AnalyserSettings& settings);

    // Audio thread
    void audioOut(ofSoundBuffer& buffer) override;

    void setSampleRate(int sampleRate) { sampleRate_ = sampleRate; }
    void setBufferSize(int bufferSize) { bufferSize_ = bufferSize; }

private:
    TrackPlayer& player_;
    AudioAnalyser analyser_;
    ofSoundStream soundStream_;
    int sampleRate_ = 44100;
    int bufferSize_ = 512;
    bool initialized_ = false;
    bool running_ = false;
};
