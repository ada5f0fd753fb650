#pragma once

#include "AnalysisNode.h"
#include <cstddef>
#include <vector>

/**
 * SignalAcquisition - per-frame snapshots of the live analysis node
 *
 * Renderers pull the current time-domain or frequency buffer once per
 * frame. The returned pointer refers to a buffer owned here and reused
 * across frames; it is only valid until the next pull of the same domain.
 * nullptr means no pipeline yet (nothing to draw).
 *
 * Buffers are only reallocated when the analysis resolution changes.
 */
class SignalAcquisition {
public:
    explicit SignalAcquisition(AnalysisNode* node = nullptr);

    void setAnalysisNode(AnalysisNode* node);
    AnalysisNode* getAnalysisNode() const { return node_; }
    bool isAvailable() const { return node_ != nullptr; }

    const std::vector<float>* pullTimeDomain();
    const std::vector<float>* pullFrequency();

    float getSampleRate() const;
    int getFrequencyBinCount() const;

    // Number of times a buffer had to be resized
    size_t getReallocationCount() const { return reallocations_; }

private:
    void ensureSize(std::vector<float>& buffer, int size);

    AnalysisNode* node_ = nullptr;
    std::vector<float> timeDomain_;
    std::vector<float> frequency_;
    size_t reallocations_ = 0;
};
