#pragma once

#include "AnalysisNode.h"
#include "ofxSoundObjects.h"
#include "ofxFft.h"
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

/**
 * AudioAnalyser - pass-through sound object with an FFT tap
 *
 * Sits in the playback chain (player -> analyser -> output). The audio
 * thread mixes each buffer down to mono into a ring of fftSize samples;
 * the main thread reads snapshots from it.
 *
 * Frequency data follows analyser-node conventions: Hann window,
 * magnitude / fftSize, per-bin smoothing with smoothingTimeConstant,
 * then dB mapped linearly from [minDecibels, maxDecibels] to [0,255].
 * One analysis per audio buffer written: pulls between two writes return
 * the same frame, so several renderers can read it in one tick.
 *
 * Usage:
 * ```cpp
 * player.connectTo(analyser);
 * analyser.setFftSize(2048);
 * std::vector<float> bins;
 * analyser.getByteFrequencyData(bins);
 * ```
 */
class AudioAnalyser : public ofxSoundObject, public AnalysisNode {
public:
    static constexpr int MIN_FFT_SIZE = 32;
    static constexpr int MAX_FFT_SIZE = 32768;

    AudioAnalyser();

    // Audio thread
    void process(ofSoundBuffer& input, ofSoundBuffer& output) override;

    int getFftSize() const override { return fftSize_; }
    int getFrequencyBinCount() const override { return fftSize_ / 2; }
    float getSampleRate() const override;

    void getFloatTimeDomainData(std::vector<float>& out) override;
    void getByteFrequencyData(std::vector<float>& out) override;

    // Rounded to a power of two within [32, 32768]
    void setFftSize(int fftSize);
    void setSmoothingTimeConstant(float smoothing);
    float getSmoothingTimeConstant() const { return smoothingTimeConstant_; }
    // Ignored unless minDecibels < maxDecibels
    void setDecibelRange(float minDecibels, float maxDecibels);
    float getMinDecibels() const { return minDecibels_; }
    float getMaxDecibels() const { return maxDecibels_; }

    // Clears the ring and smoothing history (new track)
    void reset();

    // Audio buffers written since the last reset or size change
    uint64_t getWriteCount() const;
    // FFT passes run so far
    size_t getNumAnalyses() const { return numAnalyses_; }

private:
    // Returns the write count the copy belongs to
    uint64_t copyWindow(std::vector<float>& out);
    // FFT + smoothing of the current window, once per write
    void analyse();
    void mapToBytes();
    static int roundFftSize(int fftSize);

    int fftSize_ = 2048;
    float smoothingTimeConstant_ = 0.8f;
    float minDecibels_ = -100.0f;
    float maxDecibels_ = -30.0f;
    float sampleRate_ = 44100.0f;

    // Audio thread writes, main thread reads
    std::vector<float> ring_;
    size_t writeIndex_ = 0;
    uint64_t writeCount_ = 0;
    mutable std::mutex ringMutex_;

    // Main thread only
    std::shared_ptr<ofxFft> fft_;
    std::vector<float> fftInput_;
    std::vector<float> smoothedMagnitudes_;
    std::vector<float> byteFrequency_;
    uint64_t analysedWriteCount_ = 0;
    bool smoothedValid_ = false;
    bool bytesValid_ = false;
    size_t numAnalyses_ = 0;
};
