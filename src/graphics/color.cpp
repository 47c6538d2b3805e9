#include "color.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>

namespace viewidget {
namespace graphics {

namespace {

struct NamedColor {
    const char* name;
    uint8_t r, g, b;
};

// X11 names, stored lowercase without spaces
const NamedColor kNamedColors[] = {
    {"aliceblue", 240, 248, 255},
    {"antiquewhite", 250, 235, 215},
    {"aqua", 0, 255, 255},
    {"aquamarine", 127, 255, 212},
    {"azure", 240, 255, 255},
    {"beige", 245, 245, 220},
    {"bisque", 255, 228, 196},
    {"black", 0, 0, 0},
    {"blanchedalmond", 255, 235, 205},
    {"blue", 0, 0, 255},
    {"blueviolet", 138, 43, 226},
    {"brown", 165, 42, 42},
    {"burlywood", 222, 184, 135},
    {"cadetblue", 95, 158, 160},
    {"chartreuse", 127, 255, 0},
    {"chocolate", 210, 105, 30},
    {"coral", 255, 127, 80},
    {"cornflowerblue", 100, 149, 237},
    {"cornsilk", 255, 248, 220},
    {"crimson", 220, 20, 60},
    {"cyan", 0, 255, 255},
    {"darkblue", 0, 0, 139},
    {"darkcyan", 0, 139, 139},
    {"darkgoldenrod", 184, 134, 11},
    {"darkgray", 169, 169, 169},
    {"darkgreen", 0, 100, 0},
    {"darkgrey", 169, 169, 169},
    {"darkkhaki", 189, 183, 107},
    {"darkmagenta", 139, 0, 139},
    {"darkolivegreen", 85, 107, 47},
    {"darkorange", 255, 140, 0},
    {"darkorchid", 153, 50, 204},
    {"darkred", 139, 0, 0},
    {"darksalmon", 233, 150, 122},
    {"darkseagreen", 143, 188, 143},
    {"darkslateblue", 72, 61, 139},
    {"darkslategray", 47, 79, 79},
    {"darkslategrey", 47, 79, 79},
    {"darkturquoise", 0, 206, 209},
    {"darkviolet", 148, 0, 211},
    {"deeppink", 255, 20, 147},
    {"deepskyblue", 0, 191, 255},
    {"dimgray", 105, 105, 105},
    {"dimgrey", 105, 105, 105},
    {"dodgerblue", 30, 144, 255},
    {"firebrick", 178, 34, 34},
    {"floralwhite", 255, 250, 240},
    {"forestgreen", 34, 139, 34},
    {"fuchsia", 255, 0, 255},
    {"gainsboro", 220, 220, 220},
    {"ghostwhite", 248, 248, 255},
    {"gold", 255, 215, 0},
    {"goldenrod", 218, 165, 32},
    {"gray", 190, 190, 190},
    {"green", 0, 255, 0},
    {"greenyellow", 173, 255, 47},
    {"grey", 190, 190, 190},
    {"honeydew", 240, 255, 240},
    {"hotpink", 255, 105, 180},
    {"indianred", 205, 92, 92},
    {"indigo", 75, 0, 130},
    {"ivory", 255, 255, 240},
    {"khaki", 240, 230, 140},
    {"lavender", 230, 230, 250},
    {"lavenderblush", 255, 240, 245},
    {"lawngreen", 124, 252, 0},
    {"lemonchiffon", 255, 250, 205},
    {"lightblue", 173, 216, 230},
    {"lightcoral", 240, 128, 128},
    {"lightcyan", 224, 255, 255},
    {"lightgoldenrodyellow", 250, 250, 210},
    {"lightgray", 211, 211, 211},
    {"lightgreen", 144, 238, 144},
    {"lightgrey", 211, 211, 211},
    {"lightpink", 255, 182, 193},
    {"lightsalmon", 255, 160, 122},
    {"lightseagreen", 32, 178, 170},
    {"lightskyblue", 135, 206, 250},
    {"lightslategray", 119, 136, 153},
    {"lightslategrey", 119, 136, 153},
    {"lightsteelblue", 176, 196, 222},
    {"lightyellow", 255, 255, 224},
    {"lime", 0, 255, 0},
    {"limegreen", 50, 205, 50},
    {"linen", 250, 240, 230},
    {"magenta", 255, 0, 255},
    {"maroon", 176, 48, 96},
    {"mediumaquamarine", 102, 205, 170},
    {"mediumblue", 0, 0, 205},
    {"mediumorchid", 186, 85, 211},
    {"mediumpurple", 147, 112, 219},
    {"mediumseagreen", 60, 179, 113},
    {"mediumslateblue", 123, 104, 238},
    {"mediumspringgreen", 0, 250, 154},
    {"mediumturquoise", 72, 209, 204},
    {"mediumvioletred", 199, 21, 133},
    {"midnightblue", 25, 25, 112},
    {"mintcream", 245, 255, 250},
    {"mistyrose", 255, 228, 225},
    {"moccasin", 255, 228, 181},
    {"navajowhite", 255, 222, 173},
    {"navy", 0, 0, 128},
    {"navyblue", 0, 0, 128},
    {"oldlace", 253, 245, 230},
    {"olive", 128, 128, 0},
    {"olivedrab", 107, 142, 35},
    {"orange", 255, 165, 0},
    {"orangered", 255, 69, 0},
    {"orchid", 218, 112, 214},
    {"palegoldenrod", 238, 232, 170},
    {"palegreen", 152, 251, 152},
    {"paleturquoise", 175, 238, 238},
    {"palevioletred", 219, 112, 147},
    {"papayawhip", 255, 239, 213},
    {"peachpuff", 255, 218, 185},
    {"peru", 205, 133, 63},
    {"pink", 255, 192, 203},
    {"plum", 221, 160, 221},
    {"powderblue", 176, 224, 230},
    {"purple", 160, 32, 240},
    {"red", 255, 0, 0},
    {"rosybrown", 188, 143, 143},
    {"royalblue", 65, 105, 225},
    {"saddlebrown", 139, 69, 19},
    {"salmon", 250, 128, 114},
    {"sandybrown", 244, 164, 96},
    {"seagreen", 46, 139, 87},
    {"seashell", 255, 245, 238},
    {"sienna", 160, 82, 45},
    {"silver", 192, 192, 192},
    {"skyblue", 135, 206, 235},
    {"slateblue", 106, 90, 205},
    {"slategray", 112, 128, 144},
    {"slategrey", 112, 128, 144},
    {"snow", 255, 250, 250},
    {"springgreen", 0, 255, 127},
    {"steelblue", 70, 130, 180},
    {"tan", 210, 180, 140},
    {"teal", 0, 128, 128},
    {"thistle", 216, 191, 216},
    {"tomato", 255, 99, 71},
    {"turquoise", 64, 224, 208},
    {"violet", 238, 130, 238},
    {"violetred", 208, 32, 144},
    {"wheat", 245, 222, 179},
    {"white", 255, 255, 255},
    {"whitesmoke", 245, 245, 245},
    {"yellow", 255, 255, 0},
    {"yellowgreen", 154, 205, 50},
};

uint16_t expand8(uint8_t v) {
    return (uint16_t) (v * 257);
}

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Scale an n-digit hex channel to 16 bits by repeating its bit pattern
uint16_t scaleChannel(unsigned value, int digits) {
    int bits = digits * 4;
    unsigned out = 0;
    int filled = 0;
    while (filled < 16) {
        out = (out << bits) | value;
        filled += bits;
    }
    return (uint16_t) (out >> (filled - 16));
}

bool parseHex(const std::string& spec, Color& out) {
    size_t len = spec.size() - 1;
    if (len == 0 || len % 3 != 0 || len > 12) return false;
    int digits = (int) (len / 3);
    unsigned channels[3] = {};
    for (int c = 0; c < 3; ++c) {
        for (int i = 0; i < digits; ++i) {
            int d = hexDigit(spec[1 + c * digits + i]);
            if (d < 0) return false;
            channels[c] = (channels[c] << 4) | (unsigned) d;
        }
    }
    out = Color(scaleChannel(channels[0], digits), scaleChannel(channels[1], digits), scaleChannel(channels[2], digits));
    return true;
}

std::string normalizeName(const std::string& spec) {
    std::string name;
    for (char c : spec) {
        if (std::isspace((unsigned char) c)) continue;
        name += (char) std::tolower((unsigned char) c);
    }
    return name;
}

// gray0..gray100 / grey0..grey100
bool parseGrayRamp(const std::string& name, Color& out) {
    if (name.size() <= 4) return false;
    std::string prefix = name.substr(0, 4);
    if (prefix != "gray" && prefix != "grey") return false;
    std::string digits = name.substr(4);
    if (digits.size() > 3) return false;
    int level = 0;
    for (char c : digits) {
        if (!std::isdigit((unsigned char) c)) return false;
        level = level * 10 + (c - '0');
    }
    if (level > 100) return false;
    uint8_t v = (uint8_t) ((level * 255 + 50) / 100);
    out = Color(expand8(v), expand8(v), expand8(v));
    return true;
}

double hueComponent(double m1, double m2, double hue) {
    hue = std::fmod(hue, 1.0);
    if (hue < 0.0) hue += 1.0;
    if (hue < 1.0 / 6.0) return m1 + (m2 - m1) * hue * 6.0;
    if (hue < 0.5) return m2;
    if (hue < 2.0 / 3.0) return m1 + (m2 - m1) * (2.0 / 3.0 - hue) * 6.0;
    return m1;
}

} // namespace

Color Color::fromUnit(double red, double green, double blue) {
    auto channel = [](double v) {
        long scaled = (long) std::nearbyint(v * 65535.0);
        return (uint16_t) std::max(0L, std::min(65535L, scaled));
    };
    return Color(channel(red), channel(green), channel(blue));
}

std::string Color::hex() const {
    return string::f("#%04x%04x%04x", r, g, b);
}

Color parseColor(const std::string& spec) {
    Color color;
    if (!spec.empty() && spec[0] == '#') {
        if (parseHex(spec, color)) return color;
        throw Error(string::f("invalid color name \"%s\"", spec.c_str()));
    }

    std::string name = normalizeName(spec);
    for (const NamedColor& named : kNamedColors) {
        if (name == named.name) {
            return Color(expand8(named.r), expand8(named.g), expand8(named.b));
        }
    }
    if (parseGrayRamp(name, color)) return color;

    throw Error(string::f("unknown color name \"%s\"", spec.c_str()));
}

HLS rgbToHls(double r, double g, double b) {
    double maxc = std::max(r, std::max(g, b));
    double minc = std::min(r, std::min(g, b));
    double sumc = maxc + minc;
    double rangec = maxc - minc;
    double l = sumc / 2.0;
    if (minc == maxc) {
        return HLS(0.0, l, 0.0);
    }

    double s = (l <= 0.5) ? rangec / sumc : rangec / (2.0 - sumc);
    double rc = (maxc - r) / rangec;
    double gc = (maxc - g) / rangec;
    double bc = (maxc - b) / rangec;
    double h;
    if (r == maxc) {
        h = bc - gc;
    } else if (g == maxc) {
        h = 2.0 + rc - bc;
    } else {
        h = 4.0 + gc - rc;
    }
    h = std::fmod(h / 6.0, 1.0);
    if (h < 0.0) h += 1.0;
    return HLS(h, l, s);
}

HLS rgbToHls(const Color& color) {
    return rgbToHls(color.rf(), color.gf(), color.bf());
}

Color hlsToRgb(const HLS& hls) {
    if (hls.s == 0.0) {
        return Color::fromUnit(hls.l, hls.l, hls.l);
    }
    double m2 = (hls.l <= 0.5) ? hls.l * (1.0 + hls.s) : hls.l + hls.s - hls.l * hls.s;
    double m1 = 2.0 * hls.l - m2;
    return Color::fromUnit(
        hueComponent(m1, m2, hls.h + 1.0 / 3.0),
        hueComponent(m1, m2, hls.h),
        hueComponent(m1, m2, hls.h - 1.0 / 3.0));
}

}} // namespace viewidget::graphics
