#pragma once

#include "render/DrawSurface.h"
#include "ofColor.h"
#include <string>
#include <vector>

/**
 * TraceDrawing - decimated time-domain traces and capped bar graphs
 *
 * Traces draw at most ~300 (line), ~100 (dots) or ~75 (bars) points per
 * frame whatever the buffer length: stride = max(minStride, floor(length / target)).
 *
 * Bar caps rise instantly and fall geometrically:
 *   cap = max(barHeight, cap * capFallSpeed)
 */
namespace TraceDrawing {
    enum class TraceMode {
        LINE = 0,
        DOTS = 1,
        BARS = 2
    };
    constexpr int NUM_TRACE_MODES = static_cast<int>(TraceMode::BARS) + 1;

    struct TraceStyle {
        ofColor lineColor = ofColor(0x34, 0xc7, 0x59);
        float lineWidth = 2.0f;
        float sensitivity = 1.0f;
        bool invertY = false;
        std::vector<float> dashPattern;
        // Fill under the line (LINE mode only)
        ofColor fillColor = ofColor(52, 199, 89, 26);
        float fillOpacity = 0.2f;
    };

    struct BarStyle {
        ofColor barColor = ofColor(0x9b, 0x87, 0xf5);
        ofColor capColor = ofColor(0xd9, 0x46, 0xef);
        float barSpacing = 2.0f;
        float capHeight = 2.0f;
    };

    int minStride(TraceMode mode);
    int targetPointCount(TraceMode mode);
    int decimationStride(size_t length, TraceMode mode);

    // Vertical position of a [-1,1] sample, centre line at height / 2
    float traceY(float value, float height, float sensitivity, bool invertY);

    // "On" runs of an open polyline under a canvas-style dash pattern: an odd
    // count is repeated once, an empty, negative or all-zero pattern is solid
    std::vector<std::vector<glm::vec2>> splitDashes(const std::vector<glm::vec2>& points,
                                                    const std::vector<float>& pattern);

    // Returns the number of points drawn
    size_t drawTrace(DrawSurface& surface, const std::vector<float>& samples,
                     TraceMode mode, const TraceStyle& style);

    // floor(width / barCount) - spacing, never below 1px
    float barWidth(int surfaceWidth, int barCount, float barSpacing);

    void updateCaps(const std::vector<float>& barHeights, std::vector<float>& caps, float capFallSpeed);

    void drawBars(DrawSurface& surface, const std::vector<float>& barHeights,
                  const std::vector<float>& caps, const BarStyle& style);

    TraceMode modeFromString(const std::string& name);
    std::string toString(TraceMode mode);
}
