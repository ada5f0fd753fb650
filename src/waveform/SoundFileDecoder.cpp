#include "AudioDecoder.h"
#include "ofxSoundFile.h"
#include "ofSoundBuffer.h"
#include "ofURLFileLoader.h"
#include "ofLog.h"
#include "ofUtils.h"
#include <algorithm>
#include <atomic>
#include <limits>

//--------------------------------------------------------------
bool UrlAudioFetcher::isRemoteUrl(const std::string& audioUrl) {
    std::string lower = ofToLower(audioUrl);
    return ofIsStringInString(lower, "http://") || ofIsStringInString(lower, "https://");
}

int UrlAudioFetcher::toTimeoutSeconds(uint64_t timeoutMs) {
    uint64_t seconds = (timeoutMs + 999) / 1000;
    return static_cast<int>(std::min<uint64_t>(seconds, std::numeric_limits<int>::max()));
}

ofBuffer UrlAudioFetcher::fetch(const std::string& audioUrl) {
    if (audioUrl.empty()) {
        throw DecodeError("no audio url");
    }

    if (isRemoteUrl(audioUrl)) {
        ofHttpRequest request(audioUrl, audioUrl);
        request.timeoutSeconds = toTimeoutSeconds(timeoutMs_);
        ofURLFileLoader loader;
        ofHttpResponse response = loader.handleRequest(request);
        if (response.status < 200 || response.status >= 300) {
            throw DecodeError("HTTP " + ofToString(response.status) + " fetching " + audioUrl
                              + (response.error.empty() ? "" : ": " + response.error));
        }
        ofLogVerbose("UrlAudioFetcher") << "Fetched " << response.data.size() << " bytes from " << audioUrl;
        return response.data;
    }

    std::string path = ofToDataPath(audioUrl, true);
    if (!ofFile::doesFileExist(path, false)) {
        throw DecodeError("audio file not found: " + path);
    }
    ofBuffer buffer = ofBufferFromFile(path, true);
    if (buffer.size() == 0) {
        throw DecodeError("audio file is empty: " + path);
    }
    return buffer;
}

//--------------------------------------------------------------
SoundFileDecoder::SoundFileDecoder(const std::string& scratchDirectory)
    : scratchDirectory_(scratchDirectory) {
}

DecodedAudio SoundFileDecoder::decode(const ofBuffer& encoded, const std::string& nameHint) {
    if (encoded.size() == 0) {
        throw DecodeError("no encoded audio data");
    }

    static std::atomic<uint64_t> scratchCounter(0);
    std::string extension = ofFilePath::getFileExt(nameHint);
    std::string scratchName = "decode_" + ofToString(ofGetUnixTime()) + "_"
                            + ofToString(scratchCounter++) + (extension.empty() ? "" : "." + extension);

    std::string directory = ofToDataPath(scratchDirectory_, true);
    if (!ofDirectory::doesDirectoryExist(directory, false)) {
        ofDirectory::createDirectory(directory, false, true);
    }
    std::string scratchPath = ofFilePath::join(directory, scratchName);

    if (!ofBufferToFile(scratchPath, encoded, true)) {
        throw DecodeError("failed to write scratch file " + scratchPath);
    }

    DecodedAudio decoded;
    ofxSoundFile soundFile;
    bool loaded = soundFile.load(scratchPath);
    if (loaded) {
        const ofSoundBuffer& buffer = soundFile.getBuffer();
        size_t numChannels = buffer.getNumChannels();
        size_t numFrames = buffer.getNumFrames();
        decoded.sampleRate = static_cast<float>(buffer.getSampleRate());
        decoded.channels.assign(numChannels, std::vector<float>(numFrames));
        for (size_t frame = 0; frame < numFrames; frame++) {
            for (size_t ch = 0; ch < numChannels; ch++) {
                decoded.channels[ch][frame] = buffer.getSample(frame, ch);
            }
        }
    }
    ofFile::removeFile(scratchPath, false);

    if (!loaded) {
        throw DecodeError("unsupported or corrupt audio: " + nameHint);
    }
    if (decoded.empty()) {
        throw DecodeError("decoded audio has no samples: " + nameHint);
    }
    ofLogVerbose("SoundFileDecoder") << "Decoded " << decoded.getNumFrames() << " frames x "
                                     << decoded.channels.size() << " channels @ " << decoded.sampleRate;
    return decoded;
}
