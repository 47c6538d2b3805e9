// Canvas item drawing implementation
#include "drawing.hpp"

namespace viewidget {
namespace graphics {

namespace {

const float kPointsToPixels = 96.f / 72.f;
const float kDefaultFontPixels = 12.f;

} // namespace

void drawOval(const widget::Widget::DrawArgs& args, const Oval& oval) {
    Vec c = oval.box.center();
    float rx = oval.box.width() * 0.5f;
    float ry = oval.box.height() * 0.5f;
    if (rx <= 0.f || ry <= 0.f) return;

    nvgSave(args.vg);
    nvgBeginPath(args.vg);
    nvgEllipse(args.vg, c.x, c.y, rx, ry);
    if (oval.filled) {
        nvgFillColor(args.vg, oval.fill.toNVG());
        nvgFill(args.vg);
    }
    if (oval.width > 0.f) {
        nvgStrokeColor(args.vg, oval.outline.toNVG());
        nvgStrokeWidth(args.vg, oval.width);
        nvgStroke(args.vg);
    }
    nvgRestore(args.vg);
}

void drawArc(const widget::Widget::DrawArgs& args, const Arc& arc) {
    if (!arc.visible || arc.width <= 0.f) return;
    Vec c = arc.box.center();
    float r = arc.box.width() * 0.5f;
    if (r <= 0.f) return;

    nvgSave(args.vg);
    nvgBeginPath(args.vg);
    if (std::fabs(arc.extent) >= 360.f) {
        nvgCircle(args.vg, c.x, c.y, r);
    } else {
        float a0 = -deg2rad(arc.start);
        float a1 = -deg2rad(arc.start + arc.extent);
        nvgArc(args.vg, c.x, c.y, r, a0, a1, arc.extent > 0.f ? NVG_CCW : NVG_CW);
    }
    nvgStrokeColor(args.vg, arc.color.toNVG());
    nvgStrokeWidth(args.vg, arc.width);
    nvgStroke(args.vg);
    nvgRestore(args.vg);
}

void drawLine(const widget::Widget::DrawArgs& args, const Line& line, Color color) {
    nvgSave(args.vg);
    nvgBeginPath(args.vg);
    nvgMoveTo(args.vg, line.from.x, line.from.y);
    nvgLineTo(args.vg, line.to.x, line.to.y);
    nvgStrokeColor(args.vg, color.toNVG());
    nvgStrokeWidth(args.vg, line.width);
    nvgLineCap(args.vg, NVG_BUTT);
    nvgStroke(args.vg);
    nvgRestore(args.vg);
}

void drawPolygon(const widget::Widget::DrawArgs& args, const Polygon& points,
                 Color fill, Color outline, float outlineWidth) {
    if (points.size() < 3) return;

    nvgSave(args.vg);
    nvgBeginPath(args.vg);
    nvgMoveTo(args.vg, points[0].x, points[0].y);
    for (size_t i = 1; i < points.size(); ++i) {
        nvgLineTo(args.vg, points[i].x, points[i].y);
    }
    nvgClosePath(args.vg);
    nvgFillColor(args.vg, fill.toNVG());
    nvgFill(args.vg);
    if (outlineWidth > 0.f) {
        nvgStrokeColor(args.vg, outline.toNVG());
        nvgStrokeWidth(args.vg, outlineWidth);
        nvgLineJoin(args.vg, NVG_MITER);
        nvgStroke(args.vg);
    }
    nvgRestore(args.vg);
}

void drawRect(const widget::Widget::DrawArgs& args, float x, float y, float w, float h, Color fill) {
    nvgBeginPath(args.vg);
    nvgRect(args.vg, x, y, w, h);
    nvgFillColor(args.vg, fill.toNVG());
    nvgFill(args.vg);
}

float labelPixelSize(int fontSize) {
    if (fontSize <= 0) return kDefaultFontPixels;
    return fontSize * kPointsToPixels;
}

void drawLabelAt(const widget::Widget::DrawArgs& args, std::shared_ptr<window::Font> font,
                 const Label& label, Vec pos, Color color) {
    if (label.text.empty() || !font || font->handle < 0) return;

    nvgSave(args.vg);
    nvgFontFaceId(args.vg, font->handle);
    nvgFontSize(args.vg, labelPixelSize(label.fontSize));
    nvgTextAlign(args.vg, NVG_ALIGN_CENTER | NVG_ALIGN_MIDDLE);
    nvgFillColor(args.vg, color.toNVG());
    nvgText(args.vg, pos.x, pos.y, label.text.c_str(), nullptr);
    nvgRestore(args.vg);
}

void drawLabel(const widget::Widget::DrawArgs& args, std::shared_ptr<window::Font> font,
               const Label& label, Color color) {
    drawLabelAt(args, font, label, label.pos, color);
}

float labelWidth(NVGcontext* vg, std::shared_ptr<window::Font> font, int fontSize, const std::string& text) {
    if (text.empty() || !font || font->handle < 0) return 0.f;

    nvgSave(vg);
    nvgFontFaceId(vg, font->handle);
    nvgFontSize(vg, labelPixelSize(fontSize));
    float width = nvgTextBounds(vg, 0, 0, text.c_str(), NULL, NULL);
    nvgRestore(vg);
    return width;
}

}} // namespace viewidget::graphics
