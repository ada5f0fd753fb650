#include "TraceDrawing.h"
#include <algorithm>
#include <cmath>
#include <glm/geometric.hpp>

namespace TraceDrawing {

//--------------------------------------------------------------
int minStride(TraceMode mode) {
    switch (mode) {
        case TraceMode::LINE: return 1;
        case TraceMode::DOTS: return 2;
        case TraceMode::BARS: return 4;
    }
    return 1;
}

int targetPointCount(TraceMode mode) {
    switch (mode) {
        case TraceMode::LINE: return 300;
        case TraceMode::DOTS: return 100;
        case TraceMode::BARS: return 75;
    }
    return 300;
}

int decimationStride(size_t length, TraceMode mode) {
    int byLength = static_cast<int>(length / static_cast<size_t>(targetPointCount(mode)));
    return std::max(minStride(mode), byLength);
}

float traceY(float value, float height, float sensitivity, bool invertY) {
    float sign = invertY ? -1.0f : 1.0f;
    return height / 2.0f - sign * value * height * 0.4f * sensitivity;
}

//--------------------------------------------------------------
std::vector<std::vector<glm::vec2>> splitDashes(const std::vector<glm::vec2>& points,
                                                const std::vector<float>& pattern) {
    std::vector<std::vector<glm::vec2>> runs;
    if (points.size() < 2) {
        return runs;
    }

    std::vector<float> dashes = pattern;
    if (dashes.size() % 2 == 1) {
        dashes.insert(dashes.end(), pattern.begin(), pattern.end());
    }
    float total = 0.0f;
    bool valid = true;
    for (float length : dashes) {
        if (!std::isfinite(length) || length < 0.0f) {
            valid = false;
        }
        total += length;
    }
    if (dashes.empty() || !valid || total <= 0.0f) {
        runs.push_back(points);
        return runs;
    }

    size_t dashIndex = 0;
    float remaining = dashes[0];
    bool on = true;
    std::vector<glm::vec2> current{points[0]};
    for (size_t i = 1; i < points.size(); i++) {
        glm::vec2 a = points[i - 1];
        const glm::vec2& b = points[i];
        float segmentLength = glm::distance(a, b);
        while (segmentLength > remaining) {
            glm::vec2 split = a + (b - a) * (remaining / segmentLength);
            if (on) {
                current.push_back(split);
                if (current.size() > 1) {
                    runs.push_back(current);
                }
                current.clear();
            } else {
                current.assign(1, split);
            }
            segmentLength -= remaining;
            a = split;
            dashIndex = (dashIndex + 1) % dashes.size();
            remaining = dashes[dashIndex];
            on = !on;
        }
        remaining -= segmentLength;
        if (on) {
            current.push_back(b);
        }
    }
    if (on && current.size() > 1) {
        runs.push_back(current);
    }
    return runs;
}

//--------------------------------------------------------------
size_t drawTrace(DrawSurface& surface, const std::vector<float>& samples,
                 TraceMode mode, const TraceStyle& style) {
    if (samples.empty()) {
        return 0;
    }

    const float width = static_cast<float>(surface.getWidth());
    const float height = static_cast<float>(surface.getHeight());
    const float sliceWidth = width / static_cast<float>(samples.size());
    const int stride = decimationStride(samples.size(), mode);
    const float centerY = height / 2.0f;

    std::vector<glm::vec2> points;
    points.reserve(samples.size() / stride + 1);
    for (size_t i = 0; i < samples.size(); i += stride) {
        float value = std::isfinite(samples[i]) ? samples[i] : 0.0f;
        points.emplace_back(i * sliceWidth, traceY(value, height, style.sensitivity, style.invertY));
    }

    switch (mode) {
        case TraceMode::LINE: {
            surface.setLineDash(style.dashPattern);
            surface.strokePath(points, style.lineWidth, style.lineColor);
            surface.setLineDash({});

            if (style.fillColor.a > 0 && style.fillOpacity > 0.0f && points.size() > 1) {
                std::vector<glm::vec2> area = points;
                area.emplace_back(width, height);
                area.emplace_back(0.0f, height);
                surface.setGlobalAlpha(style.fillOpacity);
                surface.fillPath(area, style.fillColor);
                surface.setGlobalAlpha(1.0f);
            }
            break;
        }
        case TraceMode::DOTS:
            for (const auto& p : points) {
                surface.fillCircle(p.x, p.y, style.lineWidth, style.lineColor);
            }
            break;
        case TraceMode::BARS:
            for (const auto& p : points) {
                surface.fillRect(p.x - style.lineWidth / 2.0f, std::min(p.y, centerY),
                                 style.lineWidth, std::abs(p.y - centerY), style.lineColor);
            }
            break;
    }
    return points.size();
}

//--------------------------------------------------------------
float barWidth(int surfaceWidth, int barCount, float barSpacing) {
    if (barCount <= 0) {
        return 1.0f;
    }
    float width = std::floor(static_cast<float>(surfaceWidth) / barCount) - barSpacing;
    return std::max(1.0f, width);
}

void updateCaps(const std::vector<float>& barHeights, std::vector<float>& caps, float capFallSpeed) {
    if (caps.size() != barHeights.size()) {
        caps.assign(barHeights.size(), 0.0f);
    }
    for (size_t i = 0; i < barHeights.size(); i++) {
        caps[i] = std::max(barHeights[i], caps[i] * capFallSpeed);
    }
}

void drawBars(DrawSurface& surface, const std::vector<float>& barHeights,
              const std::vector<float>& caps, const BarStyle& style) {
    const float height = static_cast<float>(surface.getHeight());
    const float width = barWidth(surface.getWidth(), static_cast<int>(barHeights.size()), style.barSpacing);

    for (size_t i = 0; i < barHeights.size(); i++) {
        float x = i * (width + style.barSpacing);
        float barHeight = barHeights[i];
        if (barHeight > 0.0f) {
            surface.fillRect(x, height - barHeight, width, barHeight, style.barColor);
        }
        if (i < caps.size() && style.capHeight > 0.0f) {
            surface.fillRect(x, height - caps[i] - style.capHeight, width, style.capHeight, style.capColor);
        }
    }
}

//--------------------------------------------------------------
TraceMode modeFromString(const std::string& name) {
    if (name == "dots") return TraceMode::DOTS;
    if (name == "bars") return TraceMode::BARS;
    return TraceMode::LINE;
}

std::string toString(TraceMode mode) {
    switch (mode) {
        case TraceMode::LINE: return "line";
        case TraceMode::DOTS: return "dots";
        case TraceMode::BARS: return "bars";
    }
    return "line";
}

} // namespace TraceDrawing
