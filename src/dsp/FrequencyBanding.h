#pragma once

#include <cstddef>
#include <vector>

/**
 * FrequencyBanding - linear FFT bins to log-spaced display bands
 *
 * Band edges are spaced logarithmically from 20 Hz to maxFrequency:
 *   freq(i) = exp(ln(20) + (ln(maxFrequency) - ln(20)) * i / bandCount)
 * and converted to bin indices with floor(freq / nyquist * bufferLength),
 * clamped to [0, floor(maxFrequency / nyquist * bufferLength)].
 *
 * A BandSet is computed once per layout and reused every frame; callers
 * check matches() before recomputing.
 *
 * Usage:
 * ```cpp
 * if (!bands_.matches(binCount, 64, sampleRate, 15000.0f)) {
 *     bands_ = FrequencyBanding::computeBands(binCount, 64, sampleRate, 15000.0f);
 * }
 * FrequencyBanding::updateBands(frequencyData, bands_, smoothed_, 0.7f);
 * ```
 */

// Inclusive [startBin, endBin] range of frequency bins
struct Band {
    int startBin = 0;
    int endBin = 0;
};

struct BandSet {
    std::vector<Band> bands;

    // Layout the set was computed for
    int bufferLength = 0;
    int bandCount = 0;
    float sampleRate = 0.0f;
    float maxFrequency = 0.0f;

    bool matches(int bufferLength, int bandCount, float sampleRate, float maxFrequency) const;
    bool empty() const { return bands.empty(); }
    size_t size() const { return bands.size(); }
};

namespace FrequencyBanding {
    constexpr float MIN_FREQUENCY = 20.0f;

    // Empty set for non-positive inputs
    BandSet computeBands(int bufferLength, int bandCount, float sampleRate, float maxFrequency);

    // Highest bin a band may reach for this layout
    int maxBinIndex(int bufferLength, float sampleRate, float maxFrequency);

    // Mean of the bins in range, 0 when no bin of the range is in the buffer
    float bandAverage(const std::vector<float>& frequencyData, const Band& band);

    // One-pole smoothing of each band average into smoothedValues
    void updateBands(const std::vector<float>& frequencyData,
                     const BandSet& bandSet,
                     std::vector<float>& smoothedValues,
                     float smoothingFactor);
}
