#pragma once

#include "audio/AnalysisNode.h"
#include "audio/AudioPipeline.h"
#include "core/FrameRequester.h"
#include "render/DrawSurface.h"
#include "waveform/AudioDecoder.h"
#include <atomic>
#include <future>
#include <map>
#include <memory>
#include <string>
#include <vector>

//--------------------------------------------------------------
// Fires frame requests only when the test says so
class ManualFrameRequester : public FrameRequester {
public:
    RequestId requestFrame(FrameHandler handler) override {
        RequestId id = nextId_++;
        pending_[id] = std::move(handler);
        numRequests++;
        return id;
    }

    void cancelFrame(RequestId id) override {
        if (pending_.erase(id) > 0) {
            numCancelled++;
        }
    }

    // Runs every request pending before the call; returns how many ran
    size_t fire(double timestampMs) {
        std::map<RequestId, FrameHandler> due;
        due.swap(pending_);
        for (auto& pair : due) {
            pair.second(timestampMs);
        }
        return due.size();
    }

    size_t getNumPending() const { return pending_.size(); }

    size_t numRequests = 0;
    size_t numCancelled = 0;

private:
    std::map<RequestId, FrameHandler> pending_;
    RequestId nextId_ = 1;
};

//--------------------------------------------------------------
// Records every drawing call together with the alpha/dash state it ran with
class RecordingSurface : public DrawSurface {
public:
    enum class Op {
        CLEAR,
        FILL_RECT,
        FILL_CIRCLE,
        STROKE_PATH,
        FILL_PATH,
        DRAW_TEXT,
        SHIFT_LEFT,
        DRAW_LAYER,
        SET_GLOBAL_ALPHA,
        SET_LINE_DASH
    };

    struct Call {
        Op op;
        std::vector<float> args;
        std::vector<glm::vec2> points;
        ofColor color;
        float globalAlpha;
        std::vector<float> dash;
        std::string text;
    };

    RecordingSurface(int width, int height)
        : width_(width), height_(height) {}

    int getWidth() const override { return width_; }
    int getHeight() const override { return height_; }
    void resize(int width, int height) { width_ = width; height_ = height; }

    void beginFrame() override { frameDepth++; }
    void endFrame() override { frameDepth--; }

    void clear(const ofColor& color) override { record(Op::CLEAR, {}, {}, color); }
    void fillRect(float x, float y, float width, float height, const ofColor& color) override {
        record(Op::FILL_RECT, {x, y, width, height}, {}, color);
    }
    void fillCircle(float centerX, float centerY, float radius, const ofColor& color) override {
        record(Op::FILL_CIRCLE, {centerX, centerY, radius}, {}, color);
    }
    void strokePath(const std::vector<glm::vec2>& points, float lineWidth, const ofColor& color) override {
        record(Op::STROKE_PATH, {lineWidth}, points, color);
    }
    void fillPath(const std::vector<glm::vec2>& points, const ofColor& color) override {
        record(Op::FILL_PATH, {}, points, color);
    }
    void drawText(const std::string& text, float x, float y, const ofColor& color) override {
        record(Op::DRAW_TEXT, {x, y}, {}, color);
        calls.back().text = text;
    }
    void shiftLeft(int pixels) override { record(Op::SHIFT_LEFT, {static_cast<float>(pixels)}, {}, ofColor()); }
    std::unique_ptr<DrawSurface> createLayer(int width, int height) const override {
        return std::make_unique<RecordingSurface>(width, height);
    }
    void drawLayer(const DrawSurface& layer, float x, float y) override {
        record(Op::DRAW_LAYER, {x, y, static_cast<float>(layer.getWidth()), static_cast<float>(layer.getHeight())},
               {}, ofColor());
    }
    void setGlobalAlpha(float alpha) override {
        globalAlpha_ = alpha;
        record(Op::SET_GLOBAL_ALPHA, {alpha}, {}, ofColor());
    }
    float getGlobalAlpha() const override { return globalAlpha_; }
    void setLineDash(const std::vector<float>& pattern) override {
        dash_ = pattern;
        record(Op::SET_LINE_DASH, pattern, {}, ofColor());
    }

    std::vector<Call> callsOf(Op op) const {
        std::vector<Call> matching;
        for (const auto& call : calls) {
            if (call.op == op) {
                matching.push_back(call);
            }
        }
        return matching;
    }

    size_t count(Op op) const { return callsOf(op).size(); }
    void reset() { calls.clear(); }

    std::vector<Call> calls;
    int frameDepth = 0;

private:
    void record(Op op, std::vector<float> args, const std::vector<glm::vec2>& points, const ofColor& color) {
        calls.push_back({op, std::move(args), points, color, globalAlpha_, dash_, ""});
    }

    int width_;
    int height_;
    float globalAlpha_ = 1.0f;
    std::vector<float> dash_;
};

//--------------------------------------------------------------
// Analysis node serving whatever buffers the test puts in it
class FakeAnalysisNode : public AnalysisNode {
public:
    explicit FakeAnalysisNode(int fftSize = 2048, float sampleRate = 44100.0f)
        : sampleRate(sampleRate) {
        setFftSize(fftSize);
    }

    void setFftSize(int size) {
        fftSize = size;
        timeDomain.assign(fftSize, 0.0f);
        frequency.assign(fftSize / 2, 0.0f);
    }

    int getFftSize() const override { return fftSize; }
    int getFrequencyBinCount() const override { return fftSize / 2; }
    float getSampleRate() const override { return sampleRate; }

    void getFloatTimeDomainData(std::vector<float>& out) override {
        numTimeDomainPulls++;
        copyInto(timeDomain, out);
    }

    void getByteFrequencyData(std::vector<float>& out) override {
        numFrequencyPulls++;
        copyInto(frequency, out);
    }

    int fftSize = 0;
    float sampleRate;
    std::vector<float> timeDomain;
    std::vector<float> frequency;
    size_t numTimeDomainPulls = 0;
    size_t numFrequencyPulls = 0;

private:
    static void copyInto(const std::vector<float>& source, std::vector<float>& out) {
        for (size_t i = 0; i < out.size(); i++) {
            out[i] = i < source.size() ? source[i] : 0.0f;
        }
    }
};

//--------------------------------------------------------------
// Serves bytes, or throws; can block until released to keep a job pending
class FakeAudioFetcher : public AudioFetcher {
public:
    FakeAudioFetcher()
        : gate_(release_.get_future().share()) {}

    ~FakeAudioFetcher() {
        release();
    }

    ofBuffer fetch(const std::string& audioUrl) override {
        numFetches++;
        if (blocking) {
            gate_.wait();
        }
        if (failWith.size() > 0) {
            throw DecodeError(failWith);
        }
        ofBuffer buffer;
        buffer.set("RIFF" + audioUrl);
        return buffer;
    }

    void setTimeoutMs(uint64_t ms) override { timeoutMs = ms; }

    void release() {
        if (!released_) {
            released_ = true;
            release_.set_value();
        }
    }

    std::atomic<bool> blocking{false};
    std::string failWith;
    std::atomic<int> numFetches{0};
    std::atomic<uint64_t> timeoutMs{0};

private:
    std::promise<void> release_;
    std::shared_future<void> gate_;
    bool released_ = false;
};

class FakeAudioDecoder : public AudioDecoder {
public:
    DecodedAudio decode(const ofBuffer& encoded, const std::string& nameHint) override {
        numDecodes++;
        if (failWith.size() > 0) {
            throw DecodeError(failWith);
        }
        return decoded;
    }

    DecodedAudio decoded;
    std::string failWith;
    std::atomic<int> numDecodes{0};
};

//--------------------------------------------------------------
class FakePipeline : public AudioPipeline {
public:
    bool initialize() override {
        numInitializeCalls++;
        if (!initializeSucceeds) {
            return false;
        }
        initialized = true;
        running = true;
        return true;
    }
    bool isInitialized() const override { return initialized; }
    bool isRunning() const override { return initialized && running; }
    bool suspend() override {
        numSuspendCalls++;
        running = false;
        return true;
    }
    bool resume() override {
        numResumeCalls++;
        running = true;
        return true;
    }
    void close() override {
        initialized = false;
        running = false;
    }
    AnalysisNode* getAnalysisNode() override { return initialized ? &node : nullptr; }

    bool initializeSucceeds = true;
    bool initialized = false;
    bool running = false;
    int numInitializeCalls = 0;
    int numSuspendCalls = 0;
    int numResumeCalls = 0;
    FakeAnalysisNode node;
};

class FakePlayback : public PlaybackTarget {
public:
    bool hasData() const override { return dataLoaded; }
    bool isPaused() const override { return paused; }
    bool play() override {
        numPlayCalls++;
        if (playSucceeds) {
            paused = false;
        }
        return playSucceeds;
    }
    void pause() override { paused = true; }

    bool dataLoaded = false;
    bool paused = true;
    bool playSucceeds = true;
    int numPlayCalls = 0;
};
