#include "FboSurface.h"
#include "dsp/TraceDrawing.h"
#include "ofGraphics.h"
#include "ofPath.h"
#include "ofPolyline.h"
#include "ofLog.h"
#include <algorithm>
#include <cmath>

FboSurface::FboSurface(int width, int height) {
    allocate(width, height);
}

void FboSurface::allocateFbo(ofFbo& fbo, int width, int height) {
    ofFbo::Settings settings;
    settings.width = width;
    settings.height = height;
    settings.internalformat = GL_RGBA;
    settings.useDepth = false;
    settings.useStencil = false;
    fbo.allocate(settings);

    fbo.begin();
    ofClear(0, 0, 0, 0);
    fbo.end();
}

void FboSurface::allocate(int width, int height) {
    if (isAllocated() && width_ == width && height_ == height) {
        return;
    }
    if (frameDepth_ > 0) {
        ofLogWarning("FboSurface") << "Reallocating inside a frame";
        frameDepth_ = 1;
        endFrame();
    }

    width_ = std::max(0, width);
    height_ = std::max(0, height);
    if (width_ == 0 || height_ == 0) {
        fbo_.clear();
        shiftFbo_.clear();
        return;
    }
    allocateFbo(fbo_, width_, height_);
    allocateFbo(shiftFbo_, width_, height_);
    ofLogVerbose("FboSurface") << "Allocated " << width_ << "x" << height_;
}

//--------------------------------------------------------------
void FboSurface::beginFrame() {
    if (!isAllocated()) {
        return;
    }
    if (frameDepth_++ == 0) {
        fbo_.begin();
        ofPushStyle();
        ofEnableAlphaBlending();
        ofFill();
    }
}

void FboSurface::endFrame() {
    if (frameDepth_ == 0) {
        return;
    }
    if (--frameDepth_ == 0) {
        ofPopStyle();
        fbo_.end();
    }
}

ofColor FboSurface::withGlobalAlpha(const ofColor& color) const {
    ofColor blended = color;
    blended.a = static_cast<unsigned char>(std::round(color.a * globalAlpha_));
    return blended;
}

void FboSurface::setGlobalAlpha(float alpha) {
    globalAlpha_ = std::max(0.0f, std::min(1.0f, alpha));
}

//--------------------------------------------------------------
void FboSurface::clear(const ofColor& color) {
    if (!isAllocated()) {
        return;
    }
    ScopedFrame frame(*this);
    ofClear(color.r, color.g, color.b, color.a);
}

void FboSurface::fillRect(float x, float y, float width, float height, const ofColor& color) {
    if (!isAllocated() || width <= 0.0f || height <= 0.0f) {
        return;
    }
    ScopedFrame frame(*this);
    ofFill();
    ofSetColor(withGlobalAlpha(color));
    ofDrawRectangle(x, y, width, height);
}

void FboSurface::fillCircle(float centerX, float centerY, float radius, const ofColor& color) {
    if (!isAllocated() || radius <= 0.0f) {
        return;
    }
    ScopedFrame frame(*this);
    ofFill();
    ofSetColor(withGlobalAlpha(color));
    ofDrawCircle(centerX, centerY, radius);
}

void FboSurface::strokePath(const std::vector<glm::vec2>& points, float lineWidth, const ofColor& color) {
    if (!isAllocated() || points.size() < 2) {
        return;
    }
    ScopedFrame frame(*this);
    ofNoFill();
    ofSetLineWidth(lineWidth);
    ofSetColor(withGlobalAlpha(color));
    for (const auto& run : TraceDrawing::splitDashes(points, dashPattern_)) {
        ofPolyline line;
        for (const auto& point : run) {
            line.addVertex(point.x, point.y);
        }
        line.draw();
    }
    ofFill();
}

void FboSurface::fillPath(const std::vector<glm::vec2>& points, const ofColor& color) {
    if (!isAllocated() || points.size() < 3) {
        return;
    }
    ofPath path;
    path.setPolyWindingMode(OF_POLY_WINDING_ODD);
    path.setFilled(true);
    path.setFillColor(withGlobalAlpha(color));
    path.moveTo(points[0].x, points[0].y);
    for (size_t i = 1; i < points.size(); i++) {
        path.lineTo(points[i].x, points[i].y);
    }
    path.close();

    ScopedFrame frame(*this);
    path.draw();
}

void FboSurface::drawText(const std::string& text, float x, float y, const ofColor& color) {
    if (!isAllocated() || text.empty()) {
        return;
    }
    ScopedFrame frame(*this);
    ofSetColor(withGlobalAlpha(color));
    ofDrawBitmapString(text, x, y);
}

//--------------------------------------------------------------
void FboSurface::shiftLeft(int pixels) {
    if (!isAllocated() || pixels <= 0) {
        return;
    }

    // The image cannot be read while it is the bound target
    const bool bound = frameDepth_ > 0;
    if (bound) {
        ofPopStyle();
        fbo_.end();
    }

    const bool keepsImage = pixels < width_;
    if (keepsImage) {
        shiftFbo_.begin();
        ofClear(0, 0, 0, 0);
        ofPushStyle();
        ofDisableAlphaBlending();
        ofSetColor(255);
        fbo_.draw(-pixels, 0);
        ofPopStyle();
        shiftFbo_.end();
    }

    fbo_.begin();
    ofClear(0, 0, 0, 0);
    if (keepsImage) {
        ofPushStyle();
        ofDisableAlphaBlending();
        ofSetColor(255);
        shiftFbo_.draw(0, 0);
        ofPopStyle();
    }
    fbo_.end();

    if (bound) {
        fbo_.begin();
        ofPushStyle();
        ofEnableAlphaBlending();
        ofFill();
    }
}

//--------------------------------------------------------------
std::unique_ptr<DrawSurface> FboSurface::createLayer(int width, int height) const {
    return std::make_unique<FboSurface>(width, height);
}

void FboSurface::drawLayer(const DrawSurface& layer, float x, float y) {
    const auto* source = dynamic_cast<const FboSurface*>(&layer);
    if (!source || !source->isAllocated()) {
        ofLogWarning("FboSurface") << "Layer is not an allocated FBO surface";
        return;
    }
    if (!isAllocated()) {
        return;
    }
    ScopedFrame frame(*this);
    ofSetColor(255, 255, 255, static_cast<int>(std::round(255.0f * globalAlpha_)));
    source->getFbo().draw(x, y);
}

void FboSurface::draw(const ofRectangle& bounds) const {
    if (!isAllocated()) {
        return;
    }
    fbo_.draw(bounds.x, bounds.y, bounds.width, bounds.height);
}
