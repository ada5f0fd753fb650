#pragma once

#include "ofEvents.h"

/**
 * VisibilitySource - "is the app visible" signal
 *
 * visibilityChanged fires only on transitions, with the new state.
 */
class VisibilitySource {
public:
    virtual ~VisibilitySource() = default;

    virtual bool isVisible() const = 0;

    ofEvent<bool> visibilityChanged;

protected:
    void notifyVisibility(bool visible);
};

// Always-visible by default; tests flip it by hand
class StaticVisibilitySource : public VisibilitySource {
public:
    explicit StaticVisibilitySource(bool visible = true);

    bool isVisible() const override { return visible_; }
    void setVisible(bool visible);

private:
    bool visible_;
};

/**
 * WindowVisibilitySource - window minimized (0x0) counts as hidden
 */
class WindowVisibilitySource : public VisibilitySource {
public:
    WindowVisibilitySource();
    ~WindowVisibilitySource();

    bool isVisible() const override { return visible_; }

    // Explicit hide/show (e.g. from a key binding)
    void setHidden(bool hidden);

private:
    void onWindowResized(ofResizeEventArgs& args);

    bool visible_ = true;
};
