#include "WaveformExtractor.h"
#include <algorithm>
#include <cmath>

PeakEnvelope WaveformExtractor::extractPeaks(const float* samples, size_t numSamples,
                                             int targetPointCount) {
    if (targetPointCount <= 0) {
        return PeakEnvelope();
    }

    PeakEnvelope peaks(targetPointCount, 0.0f);
    if (samples == nullptr || numSamples == 0) {
        return peaks;
    }

    const size_t blockSize = std::max<size_t>(1, numSamples / static_cast<size_t>(targetPointCount));
    float globalMax = 0.0f;

    for (int i = 0; i < targetPointCount; i++) {
        size_t start = static_cast<size_t>(i) * blockSize;
        if (start >= numSamples) {
            break;
        }
        size_t end = std::min(start + blockSize, numSamples);

        float peak = 0.0f;
        for (size_t j = start; j < end; j++) {
            float magnitude = std::fabs(samples[j]);
            // NaN compares false and is skipped
            if (magnitude > peak && std::isfinite(magnitude)) {
                peak = magnitude;
            }
        }
        peaks[i] = peak;
        globalMax = std::max(globalMax, peak);
    }

    if (globalMax > 0.0f) {
        for (auto& value : peaks) {
            value /= globalMax;
        }
    }
    return peaks;
}

PeakEnvelope WaveformExtractor::extractPeaks(const std::vector<float>& samples, int targetPointCount) {
    return extractPeaks(samples.data(), samples.size(), targetPointCount);
}

bool WaveformExtractor::isValidEnvelope(const PeakEnvelope& envelope) {
    if (envelope.empty()) {
        return false;
    }
    return std::all_of(envelope.begin(), envelope.end(), [](float value) {
        return std::isfinite(value) && value >= 0.0f && value <= 1.0f;
    });
}
