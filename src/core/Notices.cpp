#include "Notices.h"
#include "ofLog.h"

//--------------------------------------------------------------
void LogNoticeSink::post(const Notice& notice) {
    ofLogWarning("Notice") << "[" << toString(notice.error) << "] "
                           << notice.title << ": " << notice.message;
}

//--------------------------------------------------------------
NoticeBoard::NoticeBoard(size_t capacity, uint64_t lifetimeMs)
    : capacity_(capacity > 0 ? capacity : 1)
    , lifetimeMs_(lifetimeMs) {
}

void NoticeBoard::post(const Notice& notice) {
    ofLogNotice("NoticeBoard") << notice.title << ": " << notice.message;

    std::lock_guard<std::mutex> lock(mutex_);
    notices_.push_back(notice);
    while (notices_.size() > capacity_) {
        notices_.pop_front();
    }
    numPosted_++;
}

std::vector<Notice> NoticeBoard::getActiveNotices(uint64_t nowMs) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Notice> active;
    for (const auto& notice : notices_) {
        if (nowMs < notice.timestampMs + lifetimeMs_) {
            active.push_back(notice);
        }
    }
    return active;
}

void NoticeBoard::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    notices_.clear();
}
