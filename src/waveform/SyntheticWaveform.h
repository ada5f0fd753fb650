#pragma once

#include "WaveformExtractor.h"
#include <cstdint>
#include <string>

/**
 * SyntheticWaveform - plausible stand-in envelope when analysis fails
 *
 * A quiet "verse" at 0.3 with louder "chorus" sections (0.5 between 20% and
 * 40% of the track, 0.6 between 60% and 80%), plus three-sine jitter,
 * clamped to [0.05, 0.9]. A seeded variance factor then roughens it,
 * clamped to [0.01, 0.95]. Same seed, same envelope.
 */
class SyntheticWaveform {
public:
    static constexpr int DEFAULT_SEGMENTS = 250;
    static constexpr float DEFAULT_VARIANCE = 0.6f;

    static PeakEnvelope generate(int segments, uint32_t seed, float variance = DEFAULT_VARIANCE);

    // Seed derived from a cache key or track id
    static uint32_t seedFromKey(const std::string& key);

private:
    static float baseAmplitude(int index, int segments);
};
