#pragma once
#include <rack.hpp>
#include <jansson.h>
#include <deque>
#include <string>
#include <vector>
#include "common.hpp"
#include "scheduler.hpp"
#include "shapes.hpp"
#include "../graphics/color.hpp"

using namespace rack;

namespace viewidget {

// ============================================================================
// LED OPTIONS
// ============================================================================

// Reflection style flags
enum ReflectStyle {
    REFLECT_VISIBLE = 0x1,
    REFLECT_COLORED = 0x2,   // Unset: monotone (gray) reflection
    REFLECT_QUADRATIC = 0x4  // Unset: reflection brightens linearly
};

struct LedOptions {
    float size = 100.f;
    float casewidth = 10.f;
    bool state = false;
    std::string diodecolor = "white";
    std::string bulbcolor = "white";
    // Must hold an integer; anything else is reported and the default kept
    double reflectstyle = 0x7;
    double faderate = 0.0;    // ms from off to full brightness
    double blinkrate = 0.0;   // ms between toggles, 0 disables

    static LedOptions fromJson(json_t* rootJ);
    json_t* toJson() const;
};

// ============================================================================
// LED MODEL
// ============================================================================

/**
 * Indicator lamp: 3D case, lamp oval and a reflection glint.
 *
 * The lamp color is the diode color filtered (bitwise AND) by the bulb color.
 * Brightness runs from 0 (off colors) to 1 (on colors); fades and blinking
 * are driven by timers on the supplied Scheduler, which must outlive the LED.
 */
class Led {
public:
    static constexpr double FADE_TIME_STEP = 20.0;
    static constexpr size_t LATENCY_WINDOW = 10;

    Led(Scheduler& scheduler, const LedOptions& options = LedOptions());
    ~Led();

    void turn(bool on);
    void turnOn() { turn(true); }
    void turnOff() { turn(false); }
    void toggle() { turn(!state); }

    void changeColor(graphics::Color diode, graphics::Color bulb);
    void changeDiodeColor(graphics::Color diode);
    void changeBulbColor(graphics::Color bulb);

    void setBrightness(double level);
    void setBlinkRate(double rateMs);
    void setFadeRate(double rateMs);

    void blink();
    void cancelBlink();
    void fade(bool on);

    const Warnings& getWarnings() const { return warnings; }

    bool getState() const { return state; }
    double getBrightness() const { return brightness; }
    bool isBlinking() const { return blinking; }
    int getBlinkRate() const { return blinkrate; }
    int getFadeRate() const { return faderate; }
    bool isFading() const { return fadeId != Scheduler::NO_TIMER; }

    graphics::Color lampColor() const { return body[2].fill; }
    graphics::Color reflectionColor() const { return reflection.color; }
    bool reflectionVisible() const { return reflection.visible; }
    bool monotoneReflection() const { return monotone; }
    bool quadraticReflection() const { return quadratic; }

    graphics::Color offLampColor() const { return offLamp; }
    graphics::Color onLampColor() const { return onLamp; }

    float length() const { return canvasLength; }
    float getSize() const { return size; }
    float getCaseWidth() const { return casewidth; }
    Bevel bevel() const { return bevel3D; }
    // Highlight, shadow, lamp
    const std::vector<Oval>& bodyOvals() const { return body; }
    const Arc& reflectionArc() const { return reflection; }

private:
    void validate(const LedOptions& options);
    void buildBody();
    void applyColors(graphics::Color lamp, graphics::Color glint, double level);
    void updateColors();
    void fadeStep(double remainMs);

    Scheduler& scheduler;
    Warnings warnings;

    float size = 100.f;
    float casewidth = 10.f;
    int reflectstyle = 0x7;
    bool monotone = false;
    bool quadratic = true;

    float canvasLength = 0.f;
    Bevel bevel3D;
    std::vector<Oval> body;
    Arc reflection;

    graphics::Color diode;
    graphics::Color bulb;
    graphics::HLS bulbHls;
    graphics::HLS onHls;
    graphics::Color offLamp, offReflection;
    graphics::Color onLamp, onReflection;

    bool state = false;
    double brightness = 0.0;
    int faderate = 0;
    int blinkrate = 0;
    bool blinking = false;
    Scheduler::TimerId blinkId = Scheduler::NO_TIMER;
    Scheduler::TimerId fadeId = Scheduler::NO_TIMER;

    // Running fade
    double fadeTarget = 0.0;
    double fadeTotal = 0.0;
    double fadeStart = 0.0;
    std::deque<double> latency;
};

} // namespace viewidget
