#pragma once

#include <cstddef>
#include <vector>

// Normalized [0,1] amplitude summary of a whole track
using PeakEnvelope = std::vector<float>;

/**
 * WaveformExtractor - full decoded track to fixed-length peak envelope
 *
 * Splits the signal into targetPointCount blocks of floor(len / target)
 * samples (at least 1), keeps the largest absolute sample of each block,
 * then divides by the global maximum. Silence stays all-zero and blocks
 * beyond the end of a short signal are 0.
 */
class WaveformExtractor {
public:
    static constexpr int DEFAULT_POINT_COUNT = 1000;

    static PeakEnvelope extractPeaks(const float* samples, size_t numSamples,
                                     int targetPointCount = DEFAULT_POINT_COUNT);
    static PeakEnvelope extractPeaks(const std::vector<float>& samples,
                                     int targetPointCount = DEFAULT_POINT_COUNT);

    // Same shape rules as a cached envelope: non-empty, finite, within [0,1]
    static bool isValidEnvelope(const PeakEnvelope& envelope);
};
