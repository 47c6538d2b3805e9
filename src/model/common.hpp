#pragma once
#include <rack.hpp>
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

using namespace rack;

namespace viewidget {

// ============================================================================
// ERRORS AND WARNINGS
// ============================================================================

// Thrown when a construction option or setter argument is unusable
struct Error : rack::Exception {
    explicit Error(const std::string& msg) : rack::Exception(msg) {}
};

// Non-fatal alerts collected while validating options. Models never log;
// the owning widget forwards these to WARN().
typedef std::vector<std::string> Warnings;

// ============================================================================
// SHARED GEOMETRY TYPES
// ============================================================================

typedef std::vector<Vec> Polygon;

// Axis-aligned bounding box in the Tk canvas convention (x1,y1)-(x2,y2)
struct BBox {
    float x1 = 0.f, y1 = 0.f, x2 = 0.f, y2 = 0.f;

    BBox() {}
    BBox(float x1, float y1, float x2, float y2) : x1(x1), y1(y1), x2(x2), y2(y2) {}

    Vec center() const { return Vec((x1 + x2) * 0.5f, (y1 + y2) * 0.5f); }
    float width() const { return x2 - x1; }
    float height() const { return y2 - y1; }
    BBox offset(float dx, float dy) const { return BBox(x1 + dx, y1 + dy, x2 + dx, y2 + dy); }
};

// 3D bevel shared by the Dial and LED bodies: highlight above, shadow below
struct Bevel {
    int shadow = 0;
    int light = 0;

    static Bevel forSize(float size) {
        Bevel b;
        b.shadow = (int) std::floor(std::log10(2.f * size));
        b.light = (int) std::ceil(b.shadow / 2.f);
        return b;
    }
};

// ============================================================================
// MATH HELPERS
// ============================================================================

// Average of the values, 0 for an empty sequence
template <typename Container>
double mean(const Container& values) {
    double sum = 0.0;
    size_t count = 0;
    for (double v : values) {
        sum += v;
        count++;
    }
    return sum / (double) std::max<size_t>(count, 1);
}

inline float deg2rad(float deg) {
    return deg * (float) M_PI / 180.f;
}

// Point on a circle in screen coordinates (y grows downward, angles CCW)
inline Vec polar(Vec center, float radius, float angleDeg) {
    float a = deg2rad(angleDeg);
    return Vec(center.x + radius * std::cos(a), center.y - radius * std::sin(a));
}

// Case border must stay within a tenth of the widget size
inline float checkCaseWidth(const char* widgetName, float size, float casewidth, Warnings& warnings) {
    if (casewidth != 0.f && size / casewidth < 10.f) {
        warnings.push_back(string::f("%s casewidth must be less than or equal to 1/10 the size", widgetName));
        return size / 10.f;
    }
    return casewidth;
}

} // namespace viewidget
