#pragma once
#include <rack.hpp>
#include <nanovg.h>
#include <cmath>
#include <string>
#include "color.hpp"
#include "../model/shapes.hpp"

using namespace rack;

namespace viewidget {
namespace graphics {

// ============================================================================
// CANVAS ITEM DRAWING
// ============================================================================
// Replays model canvas items with NanoVG. Coordinates are canvas units; the
// calling widget sets up any scaling beforehand.

// Filled ellipse inscribed in the item box, stroked with its outline color
void drawOval(const widget::Widget::DrawArgs& args, const Oval& oval);

/**
 * Open arc of the item. Angles are canvas degrees (counter-clockwise from +x,
 * screen y pointing down), so they are negated for NanoVG. Only circular
 * boxes are supported; the radius is half the box width.
 */
void drawArc(const widget::Widget::DrawArgs& args, const Arc& arc);

void drawLine(const widget::Widget::DrawArgs& args, const Line& line, Color color);

// Closed polygon; outlineWidth <= 0 skips the stroke
void drawPolygon(const widget::Widget::DrawArgs& args, const Polygon& points,
                 Color fill, Color outline, float outlineWidth);

void drawRect(const widget::Widget::DrawArgs& args, float x, float y, float w, float h, Color fill);

// Canvas font sizes are points; 0 or less selects the default size
float labelPixelSize(int fontSize);

// Text centered on label.pos
void drawLabel(const widget::Widget::DrawArgs& args, std::shared_ptr<window::Font> font,
               const Label& label, Color color);
void drawLabelAt(const widget::Widget::DrawArgs& args, std::shared_ptr<window::Font> font,
                 const Label& label, Vec pos, Color color);

// Advance width of text at the label's size; 0 when no font is loaded
float labelWidth(NVGcontext* vg, std::shared_ptr<window::Font> font, int fontSize, const std::string& text);

}} // namespace viewidget::graphics
