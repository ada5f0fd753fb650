#pragma once

#include "VisualizerErrors.h"
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

/**
 * Notice - a user-visible message (toast) raised by the engine
 */
struct Notice {
    VisualizerError error;
    std::string title;
    std::string message;
    bool recoverable = true;
    uint64_t timestampMs = 0;
};

/**
 * NoticeSink - outward call for user-visible notices
 *
 * The engine never renders notices itself; the hosting UI decides how to
 * show them. LogNoticeSink only writes them to the log, NoticeBoard keeps
 * the most recent ones so ofApp can draw them.
 */
class NoticeSink {
public:
    virtual ~NoticeSink() = default;
    virtual void post(const Notice& notice) = 0;
};

class LogNoticeSink : public NoticeSink {
public:
    void post(const Notice& notice) override;
};

class NoticeBoard : public NoticeSink {
public:
    explicit NoticeBoard(size_t capacity = 4, uint64_t lifetimeMs = 6000);

    void post(const Notice& notice) override;

    // Notices younger than the lifetime, oldest first
    std::vector<Notice> getActiveNotices(uint64_t nowMs) const;
    size_t getNumPosted() const { return numPosted_; }
    void clear();

private:
    size_t capacity_;
    uint64_t lifetimeMs_;
    size_t numPosted_ = 0;
    std::deque<Notice> notices_;
    mutable std::mutex mutex_;
};
