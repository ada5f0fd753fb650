#include "AudioAnalyser.h"
#include "ofLog.h"
#include <algorithm>
#include <cmath>

AudioAnalyser::AudioAnalyser() {
    setName("Audio Analyser");
    setFftSize(fftSize_);
}

int AudioAnalyser::roundFftSize(int fftSize) {
    int size = MIN_FFT_SIZE;
    while (size < fftSize && size < MAX_FFT_SIZE) {
        size *= 2;
    }
    return size;
}

void AudioAnalyser::setFftSize(int fftSize) {
    int rounded = roundFftSize(fftSize);
    if (rounded != fftSize) {
        ofLogWarning("AudioAnalyser") << "FFT size " << fftSize << " rounded to " << rounded;
    }

    {
        std::lock_guard<std::mutex> lock(ringMutex_);
        fftSize_ = rounded;
        ring_.assign(fftSize_, 0.0f);
        writeIndex_ = 0;
        writeCount_ = 0;
    }
    fft_ = std::shared_ptr<ofxFft>(ofxFft::create(fftSize_, OF_FFT_WINDOW_HANN));
    fftInput_.assign(fftSize_, 0.0f);
    smoothedMagnitudes_.assign(fftSize_ / 2, 0.0f);
    byteFrequency_.assign(fftSize_ / 2, 0.0f);
    smoothedValid_ = false;
    bytesValid_ = false;
    ofLogVerbose("AudioAnalyser") << "FFT size set to " << fftSize_;
}

void AudioAnalyser::setSmoothingTimeConstant(float smoothing) {
    smoothingTimeConstant_ = std::max(0.0f, std::min(1.0f, smoothing));
}

void AudioAnalyser::setDecibelRange(float minDecibels, float maxDecibels) {
    if (minDecibels >= maxDecibels) {
        ofLogWarning("AudioAnalyser") << "Ignoring decibel range [" << minDecibels << ", " << maxDecibels << "]";
        return;
    }
    minDecibels_ = minDecibels;
    maxDecibels_ = maxDecibels;
    bytesValid_ = false;
}

float AudioAnalyser::getSampleRate() const {
    std::lock_guard<std::mutex> lock(ringMutex_);
    return sampleRate_;
}

void AudioAnalyser::reset() {
    {
        std::lock_guard<std::mutex> lock(ringMutex_);
        std::fill(ring_.begin(), ring_.end(), 0.0f);
        writeIndex_ = 0;
        writeCount_ = 0;
    }
    std::fill(smoothedMagnitudes_.begin(), smoothedMagnitudes_.end(), 0.0f);
    std::fill(byteFrequency_.begin(), byteFrequency_.end(), 0.0f);
    smoothedValid_ = false;
    bytesValid_ = false;
}

uint64_t AudioAnalyser::getWriteCount() const {
    std::lock_guard<std::mutex> lock(ringMutex_);
    return writeCount_;
}

//--------------------------------------------------------------
void AudioAnalyser::process(ofSoundBuffer& input, ofSoundBuffer& output) {
    // Monitoring only, audio passes through unchanged
    input.copyTo(output);

    size_t numFrames = input.getNumFrames();
    size_t numChannels = input.getNumChannels();
    if (numFrames == 0 || numChannels == 0) {
        return;
    }

    std::lock_guard<std::mutex> lock(ringMutex_);
    if (input.getSampleRate() > 0) {
        sampleRate_ = static_cast<float>(input.getSampleRate());
    }
    if (ring_.empty()) {
        return;
    }
    for (size_t i = 0; i < numFrames; i++) {
        float sample = 0.0f;
        for (size_t ch = 0; ch < numChannels; ch++) {
            sample += input.getSample(i, ch);
        }
        ring_[writeIndex_] = sample / numChannels;
        writeIndex_ = (writeIndex_ + 1) % ring_.size();
    }
    writeCount_++;
}

//--------------------------------------------------------------
uint64_t AudioAnalyser::copyWindow(std::vector<float>& out) {
    std::lock_guard<std::mutex> lock(ringMutex_);
    if (out.size() != ring_.size()) {
        out.resize(ring_.size());
    }
    // writeIndex_ points at the oldest sample
    size_t tail = ring_.size() - writeIndex_;
    std::copy(ring_.begin() + writeIndex_, ring_.end(), out.begin());
    std::copy(ring_.begin(), ring_.begin() + writeIndex_, out.begin() + tail);
    return writeCount_;
}

void AudioAnalyser::getFloatTimeDomainData(std::vector<float>& out) {
    copyWindow(out);
}

void AudioAnalyser::getByteFrequencyData(std::vector<float>& out) {
    if (!smoothedValid_ || getWriteCount() != analysedWriteCount_) {
        analyse();
        bytesValid_ = false;
    }
    if (!bytesValid_) {
        mapToBytes();
    }
    out = byteFrequency_;
}

void AudioAnalyser::analyse() {
    const int binCount = getFrequencyBinCount();
    if (static_cast<int>(smoothedMagnitudes_.size()) != binCount) {
        smoothedMagnitudes_.assign(binCount, 0.0f);
    }
    analysedWriteCount_ = copyWindow(fftInput_);
    smoothedValid_ = true;
    if (!fft_) {
        std::fill(smoothedMagnitudes_.begin(), smoothedMagnitudes_.end(), 0.0f);
        return;
    }

    fft_->setSignal(fftInput_.data());
    float* amplitudes = fft_->getAmplitude();
    int available = std::min(binCount, fft_->getBinSize());
    numAnalyses_++;

    const float scale = 1.0f / static_cast<float>(fftSize_);
    for (int i = 0; i < binCount; i++) {
        float magnitude = i < available ? amplitudes[i] * scale : 0.0f;
        float& smoothed = smoothedMagnitudes_[i];
        smoothed = smoothingTimeConstant_ * smoothed + (1.0f - smoothingTimeConstant_) * magnitude;
    }
}

void AudioAnalyser::mapToBytes() {
    byteFrequency_.resize(smoothedMagnitudes_.size());
    const float range = maxDecibels_ - minDecibels_;
    for (size_t i = 0; i < smoothedMagnitudes_.size(); i++) {
        float smoothed = smoothedMagnitudes_[i];
        if (smoothed <= 0.0f || !std::isfinite(smoothed)) {
            byteFrequency_[i] = 0.0f;
            continue;
        }
        float db = 20.0f * std::log10(smoothed);
        float byteValue = std::floor(255.0f / range * (db - minDecibels_));
        byteFrequency_[i] = std::max(0.0f, std::min(255.0f, byteValue));
    }
    bytesValid_ = true;
}
