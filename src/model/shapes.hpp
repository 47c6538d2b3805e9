#pragma once
#include <string>
#include "common.hpp"
#include "../graphics/color.hpp"

namespace viewidget {

// ============================================================================
// CANVAS ITEMS
// ============================================================================
// Plain records of what a widget puts on its canvas. The models compute them
// once (or on every state change); the ui layer only replays them with NanoVG.

struct Oval {
    BBox box;
    float width = 1.f;
    graphics::Color fill;
    graphics::Color outline;
    bool filled = true;

    Oval() {}
    Oval(BBox box, float width, graphics::Color fill, graphics::Color outline, bool filled = true)
        : box(box), width(width), fill(fill), outline(outline), filled(filled) {}
};

// Open arc on the ellipse inscribed in box; angles in degrees, CCW from +x
struct Arc {
    BBox box;
    float start = 0.f;
    float extent = 0.f;
    float width = 1.f;
    graphics::Color color;
    bool visible = true;
};

struct Line {
    Vec from;
    Vec to;
    float width = 1.f;
};

// Centered text item; fontSize follows the canvas font convention (points)
struct Label {
    Vec pos;
    std::string text;
    int fontSize = 0;
    bool bold = false;
};

} // namespace viewidget
