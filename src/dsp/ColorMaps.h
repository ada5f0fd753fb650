#pragma once

#include "ofColor.h"
#include <array>
#include <string>

/**
 * ColorMaps - byte magnitude (0-255) to color lookup
 *
 * RAINBOW is the 6-stop spectrogram ramp (blue, cyan, green, yellow, red).
 * GRADIENT interpolates three user colors (start, mid, end).
 * INFERNO / MAGMA / TURBO are interpolated perceptual palettes.
 *
 * ColorLut caches all 256 entries so per-pixel lookups are an index.
 */
namespace ColorMaps {
    enum class Type {
        RAINBOW = 0,
        GRADIENT = 1,
        INFERNO = 2,
        MAGMA = 3,
        TURBO = 4
    };
    constexpr int NUM_TYPES = static_cast<int>(Type::TURBO) + 1;

    ofColor rainbow(int value);
    ofColor inferno(float normalized);
    ofColor magma(float normalized);
    ofColor turbo(float normalized);
    ofColor gradient(const ofColor& start, const ofColor& mid, const ofColor& end, float normalized);

    std::string toString(Type type);
    // Unknown names map to RAINBOW
    Type fromString(const std::string& name);
}

class ColorLut {
public:
    ColorLut();

    void build(ColorMaps::Type type,
               const ofColor& gradientStart = ofColor(0x00, 0x00, 0x33),
               const ofColor& gradientMid = ofColor(0x9b, 0x87, 0xf5),
               const ofColor& gradientEnd = ofColor(0xff, 0x00, 0x00));

    const ofColor& lookup(float value) const;
    ColorMaps::Type getType() const { return type_; }

private:
    std::array<ofColor, 256> colors_;
    ColorMaps::Type type_ = ColorMaps::Type::RAINBOW;
};
