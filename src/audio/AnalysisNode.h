#pragma once

#include <vector>

/**
 * AnalysisNode - live analysis tap on the playback chain
 *
 * getFloatTimeDomainData() fills fftSize samples in [-1,1], oldest first.
 * getByteFrequencyData() fills frequencyBinCount magnitudes mapped from
 * [minDecibels, maxDecibels] to [0,255].
 * Both resize the output vector only when its size is wrong.
 */
class AnalysisNode {
public:
    virtual ~AnalysisNode() = default;

    virtual int getFftSize() const = 0;
    virtual int getFrequencyBinCount() const = 0;
    virtual float getSampleRate() const = 0;

    virtual void getFloatTimeDomainData(std::vector<float>& out) = 0;
    virtual void getByteFrequencyData(std::vector<float>& out) = 0;
};
