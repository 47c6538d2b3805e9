#pragma once
#include <rack.hpp>
#include <jansson.h>
#include <string>
#include <vector>
#include "common.hpp"
#include "shapes.hpp"
#include "../graphics/color.hpp"

using namespace rack;

namespace viewidget {

// ============================================================================
// DIAL OPTIONS
// ============================================================================

struct DialOptions {
    float size = 300.f;            // Face box; > 0
    float casewidth = 15.f;        // Case border; >= 0
    float start = 225.f;           // Degrees CCW from +x; |start| < 360
    float extent = -270.f;         // Sweep in degrees; |extent| <= 360
    double min = 60.0;
    double max = 220.0;
    double majorscale = 20.0;      // Numbered long ticks; > 0
    double semimajorscale = 10.0;  // Long ticks without number; 0 disables
    double minorscale = 2.0;       // Short ticks; 0 disables
    std::string unit;              // "deg" becomes a degree sign
    bool withdisplay = true;

    // Optional entries: unset means "derive from the other options"
    bool hasValue = false;
    double value = 0.0;
    bool hasBound = false;
    bool bound = true;

    DialOptions& initialValue(double v) {
        hasValue = true;
        value = v;
        return *this;
    }

    DialOptions& hardStops(bool b) {
        hasBound = true;
        bound = b;
        return *this;
    }

    // Unknown keys and mistyped values throw viewidget::Error
    static DialOptions fromJson(json_t* rootJ);
    json_t* toJson() const;
};

// ============================================================================
// DIAL MODEL
// ============================================================================

/**
 * Circular dial gauge: case, face, tick scale, numbered labels, optional
 * readout, and a needle rotated about the pin.
 *
 * All geometry is in canvas units with the origin at the top left of a square
 * canvas of side length(). Angles follow the canvas convention: degrees,
 * counter-clockwise from the positive x axis.
 */
class Dial {
public:
    enum TickKind {
        MINOR_TICK,
        SEMIMAJOR_TICK,
        MAJOR_TICK
    };

    struct Tick {
        TickKind kind;
        Line line;
        float angle;
    };

    explicit Dial(const DialOptions& options = DialOptions());

    // Point the needle at value; unchanged values are ignored
    void setValue(double value);
    // Back to the scale minimum
    void resetValue();

    void setDisplayColors(graphics::Color normal, graphics::Color alert);
    // Decimal places on the readout; 0 shows a rounded integer
    void setDisplayPrecision(int digits);

    const Warnings& getWarnings() const { return warnings; }

    // Layout
    float length() const { return canvasLength; }
    float getSize() const { return size; }
    float getCaseWidth() const { return casewidth; }
    Vec center() const { return centerPos; }
    float radius() const { return dialrad; }
    float arcOffset() const { return arcoffset; }
    float pinRadius() const { return pinrad; }
    Bevel bevel() const { return bevel3D; }

    const std::vector<Oval>& bodyOvals() const { return body; }
    const std::vector<Oval>& pinOvals() const { return pin; }
    const std::vector<Tick>& ticks() const { return scaleTicks; }
    const std::vector<Label>& scaleLabels() const { return labels; }
    const Arc& scaleArc() const { return arc; }
    bool scaleIsFullCircle() const { return fullCircle; }

    bool hasReadout() const { return withdisplay; }
    const Label& readout() const { return readoutLabel; }
    graphics::Color readoutColor() const { return displayColors[outOfBounds ? 1 : 0]; }
    const Label& unitLabel() const { return unit; }
    // Unit text sits right of the widest scale end when the readout is shown
    Vec unitPosition(float minTextWidth, float maxTextWidth) const;
    std::string minText() const { return formatScaleValue(min); }
    std::string maxText() const { return formatScaleValue(max); }

    // State
    double getValue() const { return value; }
    float getAngle() const { return angle; }
    bool isOutOfBounds() const { return outOfBounds; }
    bool isBound() const { return bound; }
    int countDirection() const { return direction; }
    float startAngle() const { return start; }
    float endAngle() const { return end; }
    double getMin() const { return min; }
    double getMax() const { return max; }
    double getMajorScale() const { return majorscale; }
    double getSemimajorScale() const { return semimajorscale; }
    double getMinorScale() const { return minorscale; }
    const Polygon& needle() const { return needlePolygon; }
    const Polygon& restingNeedle() const { return needleBase; }

    static std::string formatScaleValue(double v);

private:
    void validate(const DialOptions& options);
    void buildBody();
    void buildScale();
    void buildReadout(const DialOptions& options);
    void buildNeedle();
    void addTicks(TickKind kind, double step, int count, float tickLength, float width);
    void updateReadout();

    Warnings warnings;

    float size = 300.f;
    float casewidth = 15.f;
    float start = 225.f;
    float extent = -270.f;
    float end = -45.f;
    double min = 60.0;
    double max = 220.0;
    double majorscale = 20.0;
    double semimajorscale = 10.0;
    double minorscale = 2.0;
    bool bound = true;
    bool withdisplay = true;
    int direction = 1;

    float canvasLength = 0.f;
    Bevel bevel3D;
    Vec centerPos;
    float dialrad = 0.f;
    float arcoffset = 0.f;
    float pinrad = 0.f;

    std::vector<Oval> body;
    std::vector<Oval> pin;
    std::vector<Tick> scaleTicks;
    std::vector<Label> labels;
    Arc arc;
    bool fullCircle = false;
    Label readoutLabel;
    Label unit;
    Polygon needleBase;
    Polygon needlePolygon;

    bool hasValue = false;
    double value = 0.0;
    float angle = 0.f;
    bool outOfBounds = false;
    graphics::Color displayColors[2];
    int displayRoundTo = 1;
};

} // namespace viewidget
