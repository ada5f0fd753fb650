#pragma once

#include "AudioPipeline.h"
#include "ofxSoundObjects.h"
#include <string>

/**
 * TrackPlayer - ofxSoundPlayerObject wrapper used as the playback target
 */
class TrackPlayer : public PlaybackTarget {
public:
    TrackPlayer();

    bool load(const std::string& audioPath);
    void unload();
    const std::string& getPath() const { return path_; }

    bool hasData() const override;
    bool isPaused() const override;
    bool play() override;
    void pause() override;

    void setLoop(bool loop);
    float getPosition() const;

    ofxSoundPlayerObject& getSoundObject() { return player_; }

private:
    // ofxSoundPlayerObject queries are not const
    mutable ofxSoundPlayerObject player_;
    std::string path_;
    bool started_ = false;
};
