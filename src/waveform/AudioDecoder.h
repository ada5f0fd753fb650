#pragma once

#include "core/VisualizerErrors.h"
#include "ofFileUtils.h"
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

struct DecodedAudio {
    std::vector<std::vector<float>> channels;
    float sampleRate = 0.0f;

    size_t getNumFrames() const { return channels.empty() ? 0 : channels[0].size(); }
    bool empty() const { return getNumFrames() == 0; }
};

/**
 * Fetch and decode collaborators of the waveform analysis service
 *
 * Both run on the analysis worker thread and report failures by throwing
 * DecodeError.
 */
class AudioFetcher {
public:
    virtual ~AudioFetcher() = default;
    virtual ofBuffer fetch(const std::string& audioUrl) = 0;
    // Upper bound for a single fetch, 0 for none; may be called while a fetch runs
    virtual void setTimeoutMs(uint64_t) {}
};

class AudioDecoder {
public:
    virtual ~AudioDecoder() = default;
    // nameHint carries the file extension for container detection
    virtual DecodedAudio decode(const ofBuffer& encoded, const std::string& nameHint) = 0;
};

// http(s) URLs through ofURLFileLoader, anything else as a local file
class UrlAudioFetcher : public AudioFetcher {
public:
    ofBuffer fetch(const std::string& audioUrl) override;
    void setTimeoutMs(uint64_t timeoutMs) override { timeoutMs_ = timeoutMs; }
    uint64_t getTimeoutMs() const { return timeoutMs_; }

    static bool isRemoteUrl(const std::string& audioUrl);
    // Whole seconds for ofHttpRequest, rounded up; 0 stays 0
    static int toTimeoutSeconds(uint64_t timeoutMs);

private:
    std::atomic<uint64_t> timeoutMs_{0};
};

// Decodes through ofxSoundFile via a temporary file
class SoundFileDecoder : public AudioDecoder {
public:
    explicit SoundFileDecoder(const std::string& scratchDirectory = "scratch");

    DecodedAudio decode(const ofBuffer& encoded, const std::string& nameHint) override;

private:
    std::string scratchDirectory_;
};
