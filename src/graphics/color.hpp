#pragma once
#include <rack.hpp>
#include <cstdint>
#include <string>
#include "../model/common.hpp"

using namespace rack;

namespace viewidget {
namespace graphics {

// ============================================================================
// COLOR UTILITIES
// ============================================================================

// Hue/luminance/saturation triple, every component in [0, 1]
struct HLS {
    double h, l, s;

    HLS(double hue = 0.0, double lum = 0.0, double sat = 0.0) : h(hue), l(lum), s(sat) {}
};

// Resolved toolkit color with 16 bits per channel
struct Color {
    uint16_t r, g, b;

    Color(uint16_t red = 0, uint16_t green = 0, uint16_t blue = 0) : r(red), g(green), b(blue) {}

    static Color fromUnit(double red, double green, double blue);

    double rf() const { return r / 65535.0; }
    double gf() const { return g / 65535.0; }
    double bf() const { return b / 65535.0; }

    NVGcolor toNVG(float alpha = 1.f) const {
        return nvgRGBAf((float) rf(), (float) gf(), (float) bf(), alpha);
    }

    // "#rrrrggggbbbb"
    std::string hex() const;

    // Channel-wise bitwise AND: the bulb filters the diode light
    Color filter(const Color& other) const {
        return Color(r & other.r, g & other.g, b & other.b);
    }

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
    bool operator!=(const Color& other) const {
        return !(*this == other);
    }
};

/**
 * Resolve a color string the way the canvas does: "#rgb" through
 * "#rrrrggggbbbb", X11 names (case and spaces ignored) and the grayN ramp.
 * Throws viewidget::Error for anything else.
 */
Color parseColor(const std::string& spec);

HLS rgbToHls(double r, double g, double b);
HLS rgbToHls(const Color& color);
Color hlsToRgb(const HLS& hls);

// Same hue and saturation, luminance scaled
inline Color scaleLuminance(const Color& color, double factor) {
    HLS hls = rgbToHls(color);
    return hlsToRgb(HLS(hls.h, factor * hls.l, hls.s));
}

namespace Colors {
    inline Color white() { return Color(0xffff, 0xffff, 0xffff); }
    inline Color black() { return Color(0, 0, 0); }
    inline Color red() { return Color(0xffff, 0, 0); }
}

}} // namespace viewidget::graphics
