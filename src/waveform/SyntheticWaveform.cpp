#include "SyntheticWaveform.h"
#include <algorithm>
#include <cmath>
#include <random>

float SyntheticWaveform::baseAmplitude(int index, int segments) {
    float position = static_cast<float>(index) / static_cast<float>(segments);

    float amplitude = 0.3f;
    if (position > 0.2f && position < 0.4f) {
        amplitude = 0.5f;
    } else if (position > 0.6f && position < 0.8f) {
        amplitude = 0.6f;
    }

    float variation = 0.2f * (std::sin(index * 0.1f) + std::sin(index * 0.17f) + std::sin(index * 0.23f));
    return std::max(0.05f, std::min(0.9f, amplitude + variation));
}

PeakEnvelope SyntheticWaveform::generate(int segments, uint32_t seed, float variance) {
    if (segments <= 0) {
        return PeakEnvelope();
    }

    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> unit(0.0f, 1.0f);

    PeakEnvelope envelope(segments);
    for (int i = 0; i < segments; i++) {
        float factor = 1.0f + (unit(rng) * variance - variance / 2.0f);
        envelope[i] = std::max(0.01f, std::min(0.95f, baseAmplitude(i, segments) * factor));
    }
    return envelope;
}

uint32_t SyntheticWaveform::seedFromKey(const std::string& key) {
    // FNV-1a, stable across runs and platforms
    uint32_t hash = 2166136261u;
    for (unsigned char c : key) {
        hash ^= c;
        hash *= 16777619u;
    }
    return hash;
}
