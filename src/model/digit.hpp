#pragma once
#include <rack.hpp>
#include <jansson.h>
#include <string>
#include <vector>
#include "common.hpp"
#include "../graphics/color.hpp"

using namespace rack;

namespace viewidget {

struct DigitOptions {
    float size = 100.f;         // Height; the width is 2/3 of it
    int value = 0;              // 0-15; out of range leaves every segment lit
    bool blank = false;         // Overrides value
    std::string background = "black";
    std::string foreground = "red";

    // "value" may be a number, a one-character string or null (blank)
    static DigitOptions fromJson(json_t* rootJ);
    json_t* toJson() const;
};

/**
 * Single seven-segment digit showing 0-9 and A-F.
 *
 * Segment i is lit when bit i of the mask is set: 0 top, 1 bottom,
 * 2 upper left, 3 upper right, 4 lower left, 5 lower right, 6 middle.
 */
class Digit {
public:
    static const int SEGMENT_COUNT = 7;
    static const int BLANK = -1;
    static const int INVALID = -2;

    // Mask for 0-15, or -1 when value has no glyph
    static int maskFor(int value);
    // '0'-'9', 'a'-'f', 'A'-'F' to 0-15; INVALID otherwise
    static int symbolValue(char symbol);

    explicit Digit(const DigitOptions& options = DigitOptions());

    // Returns false (and changes nothing) for values without a glyph
    bool setValue(int value);
    bool setValue(char symbol);
    void clear();
    void setMask(int mask);

    void changeColor(graphics::Color fg, graphics::Color bg);
    void changeForeground(graphics::Color fg);
    void changeBackground(graphics::Color bg);

    int getValue() const { return value; }
    bool isBlank() const { return value == BLANK; }
    int getMask() const { return mask; }
    bool segmentLit(int index) const { return (mask >> index) & 1; }

    float getSize() const { return size; }
    float width() const { return size * 2.f / 3.f; }
    float height() const { return size; }
    float outlineWidth() const { return outline; }

    const std::vector<Polygon>& segments() const { return segmentShapes; }
    graphics::Color foreground() const { return fg; }
    graphics::Color background() const { return bg; }

private:
    void buildSegments();

    float size = 100.f;
    float outline = 1.f;
    std::vector<Polygon> segmentShapes;
    graphics::Color fg;
    graphics::Color bg;
    // 8 until a valid value arrives
    int value = 8;
    int mask = 0x7F;
};

} // namespace viewidget
