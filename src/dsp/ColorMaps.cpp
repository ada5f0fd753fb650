#include "ColorMaps.h"
#include <algorithm>
#include <cmath>

namespace {
    using PaletteEntry = std::array<unsigned char, 3>;

    const PaletteEntry INFERNO_PALETTE[] = {
        {0, 0, 4}, {31, 12, 72}, {85, 15, 109}, {136, 34, 106},
        {186, 54, 85}, {227, 89, 51}, {249, 140, 10}, {249, 201, 50}, {252, 255, 164}
    };

    const PaletteEntry MAGMA_PALETTE[] = {
        {0, 0, 4}, {28, 16, 68}, {79, 18, 123}, {129, 37, 129},
        {181, 54, 122}, {229, 80, 100}, {251, 135, 97}, {254, 194, 135}, {252, 253, 191}
    };

    const PaletteEntry TURBO_PALETTE[] = {
        {48, 18, 59}, {70, 45, 129}, {63, 81, 181}, {43, 116, 202},
        {32, 149, 218}, {34, 181, 229}, {68, 209, 209}, {121, 231, 155},
        {174, 240, 98}, {222, 238, 35}, {249, 189, 0}, {249, 140, 0}, {227, 69, 14}, {180, 0, 0}
    };

    template<size_t N>
    ofColor interpolatePalette(const PaletteEntry (&palette)[N], float value) {
        if (value <= 0.0f) {
            return ofColor(palette[0][0], palette[0][1], palette[0][2]);
        }
        if (value >= 1.0f) {
            return ofColor(palette[N - 1][0], palette[N - 1][1], palette[N - 1][2]);
        }
        float segment = value * (N - 1);
        size_t index = static_cast<size_t>(std::floor(segment));
        float fraction = segment - index;
        if (fraction == 0.0f || index >= N - 1) {
            return ofColor(palette[index][0], palette[index][1], palette[index][2]);
        }
        auto channel = [&](int c) {
            float a = palette[index][c];
            float b = palette[index + 1][c];
            return static_cast<unsigned char>(std::round(a + fraction * (b - a)));
        };
        return ofColor(channel(0), channel(1), channel(2));
    }

    unsigned char channelFloor(float value) {
        return static_cast<unsigned char>(std::max(0.0f, std::min(255.0f, std::floor(value))));
    }
}

namespace ColorMaps {

//--------------------------------------------------------------
ofColor rainbow(int value) {
    float v = static_cast<float>(std::max(0, std::min(255, value)));
    if (v < 40) {
        return ofColor(0, 0, channelFloor(v * 6.375f));
    } else if (v < 80) {
        return ofColor(0, channelFloor((v - 40) * 6.375f), 255);
    } else if (v < 120) {
        return ofColor(0, 255, channelFloor(255 - (v - 80) * 6.375f));
    } else if (v < 170) {
        return ofColor(channelFloor((v - 120) * 5.1f), 255, 0);
    } else if (v < 210) {
        return ofColor(255, channelFloor(255 - (v - 170) * 6.375f), 0);
    }
    return ofColor(255, 0, 0);
}

ofColor inferno(float normalized) {
    return interpolatePalette(INFERNO_PALETTE, normalized);
}

ofColor magma(float normalized) {
    return interpolatePalette(MAGMA_PALETTE, normalized);
}

ofColor turbo(float normalized) {
    return interpolatePalette(TURBO_PALETTE, normalized);
}

ofColor gradient(const ofColor& start, const ofColor& mid, const ofColor& end, float normalized) {
    normalized = std::max(0.0f, std::min(1.0f, normalized));
    const ofColor& from = normalized < 0.5f ? start : mid;
    const ofColor& to = normalized < 0.5f ? mid : end;
    float t = normalized < 0.5f ? normalized * 2.0f : (normalized - 0.5f) * 2.0f;
    auto channel = [&](float a, float b) {
        return static_cast<unsigned char>(std::round(a + t * (b - a)));
    };
    return ofColor(channel(from.r, to.r), channel(from.g, to.g), channel(from.b, to.b));
}

std::string toString(Type type) {
    switch (type) {
        case Type::RAINBOW: return "rainbow";
        case Type::GRADIENT: return "gradient";
        case Type::INFERNO: return "inferno";
        case Type::MAGMA: return "magma";
        case Type::TURBO: return "turbo";
    }
    return "rainbow";
}

Type fromString(const std::string& name) {
    if (name == "gradient" || name == "default") return Type::GRADIENT;
    if (name == "inferno") return Type::INFERNO;
    if (name == "magma") return Type::MAGMA;
    if (name == "turbo") return Type::TURBO;
    return Type::RAINBOW;
}

} // namespace ColorMaps

//--------------------------------------------------------------
ColorLut::ColorLut() {
    build(ColorMaps::Type::RAINBOW);
}

void ColorLut::build(ColorMaps::Type type, const ofColor& gradientStart,
                     const ofColor& gradientMid, const ofColor& gradientEnd) {
    type_ = type;
    for (int i = 0; i < 256; i++) {
        float normalized = i / 255.0f;
        switch (type) {
            case ColorMaps::Type::RAINBOW:
                colors_[i] = ColorMaps::rainbow(i);
                break;
            case ColorMaps::Type::GRADIENT:
                colors_[i] = ColorMaps::gradient(gradientStart, gradientMid, gradientEnd, normalized);
                break;
            case ColorMaps::Type::INFERNO:
                colors_[i] = ColorMaps::inferno(normalized);
                break;
            case ColorMaps::Type::MAGMA:
                colors_[i] = ColorMaps::magma(normalized);
                break;
            case ColorMaps::Type::TURBO:
                colors_[i] = ColorMaps::turbo(normalized);
                break;
        }
    }
}

const ofColor& ColorLut::lookup(float value) const {
    int index = std::isfinite(value) ? static_cast<int>(value) : 0;
    index = std::max(0, std::min(255, index));
    return colors_[index];
}
