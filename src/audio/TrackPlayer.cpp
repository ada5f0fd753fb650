#include "TrackPlayer.h"
#include "ofLog.h"
#include "ofUtils.h"

TrackPlayer::TrackPlayer() {
    player_.setName("Track Player");
}

bool TrackPlayer::load(const std::string& audioPath) {
    unload();
    std::string path = ofToDataPath(audioPath, true);
    if (!player_.load(path)) {
        ofLogError("TrackPlayer") << "Failed to load audio: " << path;
        return false;
    }
    path_ = path;
    ofLogNotice("TrackPlayer") << "Loaded " << path;
    return true;
}

void TrackPlayer::unload() {
    if (player_.isLoaded()) {
        player_.stop();
        player_.unload();
    }
    path_.clear();
    started_ = false;
}

bool TrackPlayer::hasData() const {
    return player_.isLoaded();
}

bool TrackPlayer::isPaused() const {
    return !player_.isPlaying();
}

bool TrackPlayer::play() {
    if (!player_.isLoaded()) {
        ofLogWarning("TrackPlayer") << "Cannot play: nothing loaded";
        return false;
    }
    if (started_) {
        player_.setPaused(false);
    } else {
        player_.play();
        started_ = true;
    }
    return player_.isPlaying();
}

void TrackPlayer::pause() {
    if (player_.isLoaded()) {
        player_.setPaused(true);
    }
}

void TrackPlayer::setLoop(bool loop) {
    player_.setLoop(loop);
}

float TrackPlayer::getPosition() const {
    return player_.isLoaded() ? player_.getPosition() : 0.0f;
}
