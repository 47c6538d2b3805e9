#include "digit.hpp"
#include "json_options.hpp"
#include <cmath>

namespace viewidget {

namespace {

const int kMasks[16] = {
    0x3F, 0x28, 0x5B, 0x6B, 0x6C, 0x67, 0x77, 0x29,
    0x7F, 0x6F, 0x7D, 0x76, 0x17, 0x7A, 0x57, 0x55,
};

} // namespace

const int Digit::SEGMENT_COUNT;
const int Digit::BLANK;
const int Digit::INVALID;

// ============================================================================
// OPTIONS
// ============================================================================

DigitOptions DigitOptions::fromJson(json_t* rootJ) {
    DigitOptions options;
    const char* key;
    json_t* valueJ;
    json_object_foreach(rootJ, key, valueJ) {
        std::string k = key;
        if (k == "size") {
            options.size = (float) json::getNumber(valueJ, "Digit", key);
        } else if (k == "value") {
            options.blank = false;
            if (json_is_null(valueJ)) {
                options.blank = true;
            } else if (json_is_string(valueJ) && json_string_length(valueJ) == 1) {
                options.value = Digit::symbolValue(json_string_value(valueJ)[0]);
            } else if (json_is_number(valueJ)) {
                double v = json_number_value(valueJ);
                options.value = (v == std::floor(v)) ? (int) v : Digit::INVALID;
            } else {
                options.value = Digit::INVALID;
            }
        } else if (k == "background" || k == "bg") {
            options.background = json::getString(valueJ, "Digit", key);
        } else if (k == "foreground" || k == "fg") {
            options.foreground = json::getString(valueJ, "Digit", key);
        } else {
            json::unknownKey("Digit", key);
        }
    }
    return options;
}

json_t* DigitOptions::toJson() const {
    json_t* rootJ = json_object();
    json_object_set_new(rootJ, "size", json_real(size));
    json_object_set_new(rootJ, "value", blank ? json_null() : json_integer(value));
    json_object_set_new(rootJ, "background", json_string(background.c_str()));
    json_object_set_new(rootJ, "foreground", json_string(foreground.c_str()));
    return rootJ;
}

// ============================================================================
// DIGIT
// ============================================================================

int Digit::maskFor(int value) {
    if (value < 0 || value > 15) return -1;
    return kMasks[value];
}

int Digit::symbolValue(char symbol) {
    if (symbol >= '0' && symbol <= '9') return symbol - '0';
    if (symbol >= 'a' && symbol <= 'f') return symbol - 'a' + 10;
    if (symbol >= 'A' && symbol <= 'F') return symbol - 'A' + 10;
    return INVALID;
}

Digit::Digit(const DigitOptions& options) {
    if (!(options.size > 0.f)) {
        throw Error("Digit size must be greater than zero");
    }
    size = options.size;
    fg = graphics::parseColor(options.foreground);
    bg = graphics::parseColor(options.background);
    buildSegments();

    if (options.blank) {
        clear();
    } else {
        setValue(options.value);
    }
}

void Digit::buildSegments() {
    float x1 = size * 9.f / 100.f;
    float y1 = x1;
    float x2 = size * 57.f / 100.f;
    float y2 = size * 89.f / 100.f;
    float y3 = size * 49.f / 100.f;
    float tenth = size / 10.f;
    float twentieth = size / 20.f;
    outline = std::max(std::floor(size / 175.f), 1.f);

    segmentShapes.clear();

    Polygon top;
    top.push_back(Vec(x1, y1));
    top.push_back(Vec(x2, y1));
    top.push_back(Vec(x2 - tenth, y1 + tenth));
    top.push_back(Vec(x1 + tenth, y1 + tenth));
    segmentShapes.push_back(top);

    Polygon bottom;
    bottom.push_back(Vec(x1, y2));
    bottom.push_back(Vec(x2, y2));
    bottom.push_back(Vec(x2 - tenth, y2 - tenth));
    bottom.push_back(Vec(x1 + tenth, y2 - tenth));
    segmentShapes.push_back(bottom);

    // Verticals, one per outer corner, each pointing toward the middle bar
    Vec corners[4] = {Vec(x1, y1), Vec(x2, y1), Vec(x1, y2), Vec(x2, y2)};
    for (int i = 0; i < 4; ++i) {
        float x = corners[i].x;
        float y = corners[i].y;
        float xdir = (x == x1) ? 1.f : -1.f;
        float ydir = (y == y1) ? -1.f : 1.f;
        Polygon side;
        side.push_back(Vec(x, y));
        side.push_back(Vec(x, y3 + ydir * twentieth));
        side.push_back(Vec(x + xdir * twentieth, y3));
        side.push_back(Vec(x + xdir * tenth, y3 + ydir * twentieth));
        side.push_back(Vec(x + xdir * tenth, y - ydir * tenth));
        segmentShapes.push_back(side);
    }

    Polygon middle;
    middle.push_back(Vec(x1 + twentieth, y3));
    middle.push_back(Vec(x1 + tenth, y3 - twentieth));
    middle.push_back(Vec(x2 - tenth, y3 - twentieth));
    middle.push_back(Vec(x2 - twentieth, y3));
    middle.push_back(Vec(x2 - tenth, y3 + twentieth));
    middle.push_back(Vec(x1 + tenth, y3 + twentieth));
    segmentShapes.push_back(middle);
}

bool Digit::setValue(int newValue) {
    int m = maskFor(newValue);
    if (m < 0) return false;
    setMask(m);
    value = newValue;
    return true;
}

bool Digit::setValue(char symbol) {
    return setValue(symbolValue(symbol));
}

void Digit::clear() {
    setMask(0);
    value = BLANK;
}

void Digit::setMask(int newMask) {
    mask = newMask & 0x7F;
}

void Digit::changeColor(graphics::Color newFg, graphics::Color newBg) {
    fg = newFg;
    bg = newBg;
}

void Digit::changeForeground(graphics::Color newFg) {
    fg = newFg;
}

void Digit::changeBackground(graphics::Color newBg) {
    bg = newBg;
}

} // namespace viewidget
