#include "SoundStreamPipeline.h"
#include "ofLog.h"

SoundStreamPipeline::SoundStreamPipeline(TrackPlayer& player, const AnalyserSettings& analyserSettings)
    : player_(player) {
    applyAnalyserSettings(analyserSettings);
    player_.getSoundObject().connectTo(analyser_);
}

SoundStreamPipeline::~SoundStreamPipeline() {
    close();
}

void SoundStreamPipeline::applyAnalyserSettings(const AnalyserSettings& settings) {
    analyser_.setFftSize(settings.fftSize);
    analyser_.setSmoothingTimeConstant(settings.smoothingTimeConstant);
    analyser_.setDecibelRange(settings.minDecibels, settings.maxDecibels);
}

//--------------------------------------------------------------
bool SoundStreamPipeline::initialize() {
    if (initialized_) {
        return true;
    }

    auto devices = soundStream_.getDeviceList();
    const ofSoundDevice* outputDevice = nullptr;
    for (const auto& device : devices) {
        if (device.outputChannels > 0 && (device.isDefaultOutput || outputDevice == nullptr)) {
            outputDevice = &device;
            if (device.isDefaultOutput) {
                break;
            }
        }
    }
    if (outputDevice == nullptr) {
        ofLogError("SoundStreamPipeline") << "No audio output device available";
        return false;
    }

    ofSoundStreamSettings settings;
    settings.setOutListener(this);
    settings.setOutDevice(*outputDevice);
    settings.sampleRate = sampleRate_;
    settings.numOutputChannels = 2;
    settings.numInputChannels = 0;
    settings.bufferSize = bufferSize_;

    bool setupSuccess = soundStream_.setup(settings);
    if (!setupSuccess || soundStream_.getNumOutputChannels() == 0) {
        ofLogError("SoundStreamPipeline") << "Audio stream setup failed on " << outputDevice->name;
        soundStream_.close();
        return false;
    }

    initialized_ = true;
    running_ = true;
    ofLogNotice("SoundStreamPipeline") << "Audio stream running on " << outputDevice->name
                                       << " (SR: " << soundStream_.getSampleRate()
                                       << ", channels: " << soundStream_.getNumOutputChannels()
                                       << ", buffer size: " << soundStream_.getBufferSize() << ")";
    return true;
}

bool SoundStreamPipeline::suspend() {
    if (!initialized_) {
        return false;
    }
    if (running_) {
        soundStream_.stop();
        running_ = false;
        ofLogNotice("SoundStreamPipeline") << "Audio stream suspended";
    }
    return true;
}

bool SoundStreamPipeline::resume() {
    if (!initialized_) {
        return false;
    }
    if (!running_) {
        soundStream_.start();
        running_ = true;
        ofLogNotice("SoundStreamPipeline") << "Audio stream resumed";
    }
    return true;
}

void SoundStreamPipeline::close() {
    if (!initialized_) {
        return;
    }
    soundStream_.close();
    initialized_ = false;
    running_ = false;
    ofLogNotice("SoundStreamPipeline") << "Audio stream closed";
}

AnalysisNode* SoundStreamPipeline::getAnalysisNode() {
    return initialized_ ? &analyser_ : nullptr;
}

//--------------------------------------------------------------
void SoundStreamPipeline::audioOut(ofSoundBuffer& buffer) {
    analyser_.audioOut(buffer);
}
