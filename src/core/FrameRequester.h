#pragma once

#include <cstdint>
#include <functional>
#include <map>

class ofEventArgs;

/**
 * FrameRequester - one-shot "call me on the next display refresh"
 *
 * Each request fires at most once; cancelFrame() on a fired or unknown id
 * is a no-op. Handlers receive the frame timestamp in milliseconds.
 */
class FrameRequester {
public:
    using FrameHandler = std::function<void(double timestampMs)>;
    using RequestId = uint64_t;

    virtual ~FrameRequester() = default;

    virtual RequestId requestFrame(FrameHandler handler) = 0;
    virtual void cancelFrame(RequestId id) = 0;
};

/**
 * OfFrameRequester - dispatches requests on ofEvents().draw
 *
 * Requests made while dispatching wait for the following frame.
 */
class OfFrameRequester : public FrameRequester {
public:
    OfFrameRequester();
    ~OfFrameRequester();

    RequestId requestFrame(FrameHandler handler) override;
    void cancelFrame(RequestId id) override;

    size_t getNumPending() const { return pending_.size(); }

private:
    void onDraw(ofEventArgs& args);

    std::map<RequestId, FrameHandler> pending_;
    RequestId nextId_ = 1;
};
