#include "ColorUtils.h"
#include "ofUtils.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <exception>
#include <vector>

namespace {
    bool parseHexByte(const std::string& text, size_t offset, unsigned char& out) {
        if (offset + 2 > text.size() || !std::isxdigit(static_cast<unsigned char>(text[offset]))
            || !std::isxdigit(static_cast<unsigned char>(text[offset + 1]))) {
            return false;
        }
        out = static_cast<unsigned char>(std::stoi(text.substr(offset, 2), nullptr, 16));
        return true;
    }
}

bool parseColor(const std::string& input, ofColor& out) {
    std::string text = ofToLower(ofTrim(input));
    if (text == "transparent") {
        out.set(0, 0, 0, 0);
        return true;
    }

    if (!text.empty() && text[0] == '#') {
        unsigned char r, g, b, a = 255;
        if (text.size() != 7 && text.size() != 9) {
            return false;
        }
        if (!parseHexByte(text, 1, r) || !parseHexByte(text, 3, g) || !parseHexByte(text, 5, b)) {
            return false;
        }
        if (text.size() == 9 && !parseHexByte(text, 7, a)) {
            return false;
        }
        out.set(r, g, b, a);
        return true;
    }

    bool hasAlpha = text.rfind("rgba(", 0) == 0;
    if ((hasAlpha || text.rfind("rgb(", 0) == 0) && text.back() == ')') {
        size_t open = text.find('(');
        std::vector<std::string> parts = ofSplitString(text.substr(open + 1, text.size() - open - 2), ",", true, true);
        if (parts.size() != (hasAlpha ? 4u : 3u)) {
            return false;
        }
        try {
            auto channel = [](const std::string& part) {
                return static_cast<unsigned char>(std::max(0, std::min(255, std::stoi(part))));
            };
            float alpha = hasAlpha ? std::stof(parts[3]) : 1.0f;
            alpha = std::max(0.0f, std::min(1.0f, alpha));
            out.set(channel(parts[0]), channel(parts[1]), channel(parts[2]),
                    static_cast<unsigned char>(std::round(alpha * 255.0f)));
        } catch (const std::exception&) {
            return false;
        }
        return true;
    }
    return false;
}

std::string colorToString(const ofColor& color) {
    char buffer[10];
    if (color.a == 255) {
        std::snprintf(buffer, sizeof(buffer), "#%02x%02x%02x", color.r, color.g, color.b);
    } else {
        std::snprintf(buffer, sizeof(buffer), "#%02x%02x%02x%02x", color.r, color.g, color.b, color.a);
    }
    return buffer;
}
