#pragma once

#include "DrawSurface.h"
#include "ofFbo.h"
#include "ofRectangle.h"

/**
 * FboSurface - DrawSurface over an RGBA ofFbo
 *
 * Shapes go through ofDrawRectangle / ofDrawCircle, strokes through
 * ofPolyline and fills through ofPath, with alpha blending enabled.
 * shiftLeft() redraws the image through a second FBO offset by the shift.
 *
 * Drawing calls between beginFrame() and endFrame() share one bind of the
 * FBO; a call outside a frame binds and unbinds on its own.
 *
 * Needs a GL context: allocate from setup() or later.
 */
class FboSurface : public DrawSurface {
public:
    FboSurface() = default;
    FboSurface(int width, int height);

    // Reallocates and clears to transparent when the size changes
    void allocate(int width, int height);
    bool isAllocated() const { return fbo_.isAllocated(); }

    int getWidth() const override { return width_; }
    int getHeight() const override { return height_; }

    void beginFrame() override;
    void endFrame() override;

    void clear(const ofColor& color) override;
    void fillRect(float x, float y, float width, float height, const ofColor& color) override;
    void fillCircle(float centerX, float centerY, float radius, const ofColor& color) override;
    void strokePath(const std::vector<glm::vec2>& points, float lineWidth, const ofColor& color) override;
    void fillPath(const std::vector<glm::vec2>& points, const ofColor& color) override;
    void drawText(const std::string& text, float x, float y, const ofColor& color) override;

    void shiftLeft(int pixels) override;

    std::unique_ptr<DrawSurface> createLayer(int width, int height) const override;
    void drawLayer(const DrawSurface& layer, float x, float y) override;

    void setGlobalAlpha(float alpha) override;
    float getGlobalAlpha() const override { return globalAlpha_; }
    void setLineDash(const std::vector<float>& pattern) override { dashPattern_ = pattern; }

    // Screen output
    void draw(const ofRectangle& bounds) const;
    const ofFbo& getFbo() const { return fbo_; }

private:
    class ScopedFrame {
    public:
        explicit ScopedFrame(FboSurface& surface) : surface_(surface) { surface_.beginFrame(); }
        ~ScopedFrame() { surface_.endFrame(); }
    private:
        FboSurface& surface_;
    };

    static void allocateFbo(ofFbo& fbo, int width, int height);
    ofColor withGlobalAlpha(const ofColor& color) const;

    ofFbo fbo_;
    ofFbo shiftFbo_;
    int width_ = 0;
    int height_ = 0;
    int frameDepth_ = 0;
    float globalAlpha_ = 1.0f;
    std::vector<float> dashPattern_;
};
