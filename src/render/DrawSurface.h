#pragma once

#include "ofColor.h"
#include <glm/vec2.hpp>
#include <memory>
#include <string>
#include <vector>

/**
 * DrawSurface - 2D target the renderers draw on
 *
 * Colors are blended source-over using their alpha multiplied by the
 * surface's global alpha. clear() and shiftLeft() replace pixels without
 * blending.
 *
 * FboSurface is the ofFbo implementation used by the app; tests use a
 * recording implementation.
 */
class DrawSurface {
public:
    virtual ~DrawSurface() = default;

    virtual int getWidth() const = 0;
    virtual int getHeight() const = 0;

    // Brackets a run of drawing calls; calls outside a frame bind on their own
    virtual void beginFrame() {}
    virtual void endFrame() {}

    virtual void clear(const ofColor& color) = 0;
    virtual void fillRect(float x, float y, float width, float height, const ofColor& color) = 0;
    virtual void fillCircle(float centerX, float centerY, float radius, const ofColor& color) = 0;
    // Open polyline; honours the current dash pattern
    virtual void strokePath(const std::vector<glm::vec2>& points, float lineWidth, const ofColor& color) = 0;
    // Closed polygon, even-odd fill
    virtual void fillPath(const std::vector<glm::vec2>& points, const ofColor& color) = 0;
    // y is the text baseline
    virtual void drawText(const std::string& text, float x, float y, const ofColor& color) = 0;

    // Moves the whole image left by pixels columns, the vacated columns become transparent
    virtual void shiftLeft(int pixels) = 0;

    // Off-screen surface of the same kind, cleared to transparent
    virtual std::unique_ptr<DrawSurface> createLayer(int width, int height) const = 0;
    // Composites a layer made by createLayer() onto this surface
    virtual void drawLayer(const DrawSurface& layer, float x, float y) = 0;

    virtual void setGlobalAlpha(float alpha) = 0;
    virtual float getGlobalAlpha() const = 0;
    // Alternating on/off lengths in pixels, empty for solid lines
    virtual void setLineDash(const std::vector<float>& pattern) = 0;
};
