#pragma once

#include "ofColor.h"
#include <string>

// "#rrggbb", "#rrggbbaa", "rgb(r,g,b)", "rgba(r,g,b,a)" with a in [0,1], or "transparent"
bool parseColor(const std::string& text, ofColor& out);
// "#rrggbb" when opaque, "#rrggbbaa" otherwise
std::string colorToString(const ofColor& color);
