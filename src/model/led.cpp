#include "led.hpp"
#include "json_options.hpp"
#include <cmath>

namespace viewidget {

constexpr double Led::FADE_TIME_STEP;
constexpr size_t Led::LATENCY_WINDOW;

// ============================================================================
// OPTIONS
// ============================================================================

LedOptions LedOptions::fromJson(json_t* rootJ) {
    LedOptions options;
    const char* key;
    json_t* valueJ;
    json_object_foreach(rootJ, key, valueJ) {
        std::string k = key;
        if (k == "size") {
            options.size = (float) json::getNumber(valueJ, "LED", key);
        } else if (k == "casewidth") {
            options.casewidth = (float) json::getNumber(valueJ, "LED", key);
        } else if (k == "state") {
            options.state = json::getBool(valueJ, "LED", key);
        } else if (k == "diodecolor") {
            if (!json_is_null(valueJ))
                options.diodecolor = json::getString(valueJ, "LED", key);
        } else if (k == "bulbcolor") {
            if (!json_is_null(valueJ))
                options.bulbcolor = json::getString(valueJ, "LED", key);
        } else if (k == "reflectstyle") {
            options.reflectstyle = json::getNumber(valueJ, "LED", key);
        } else if (k == "faderate") {
            options.faderate = json::getNumber(valueJ, "LED", key);
        } else if (k == "blinkrate") {
            options.blinkrate = json::getNumber(valueJ, "LED", key);
        } else {
            json::unknownKey("LED", key);
        }
    }
    return options;
}

json_t* LedOptions::toJson() const {
    json_t* rootJ = json_object();
    json_object_set_new(rootJ, "size", json_real(size));
    json_object_set_new(rootJ, "casewidth", json_real(casewidth));
    json_object_set_new(rootJ, "state", json_boolean(state));
    json_object_set_new(rootJ, "diodecolor", json_string(diodecolor.c_str()));
    json_object_set_new(rootJ, "bulbcolor", json_string(bulbcolor.c_str()));
    if (reflectstyle == std::floor(reflectstyle)) {
        json_object_set_new(rootJ, "reflectstyle", json_integer((json_int_t) reflectstyle));
    } else {
        json_object_set_new(rootJ, "reflectstyle", json_real(reflectstyle));
    }
    json_object_set_new(rootJ, "faderate", json_real(faderate));
    json_object_set_new(rootJ, "blinkrate", json_real(blinkrate));
    return rootJ;
}

// ============================================================================
// CONSTRUCTION
// ============================================================================

Led::Led(Scheduler& scheduler, const LedOptions& options) : scheduler(scheduler) {
    validate(options);
    buildBody();

    graphics::Color diodeColor = graphics::parseColor(options.diodecolor);
    graphics::Color bulbColor = graphics::parseColor(options.bulbcolor);
    brightness = 0.0;
    changeColor(diodeColor, bulbColor);

    turn(options.state);
}

Led::~Led() {
    scheduler.cancel(blinkId);
    scheduler.cancel(fadeId);
}

void Led::validate(const LedOptions& options) {
    if (!(options.size > 0.f)) {
        throw Error("LED size must be greater than zero");
    }
    if (!(options.casewidth >= 0.f)) {
        throw Error("LED casewidth must be greater than or equal to zero");
    }
    size = options.size;

    if (std::isfinite(options.reflectstyle) && options.reflectstyle == std::floor(options.reflectstyle)) {
        reflectstyle = (int) options.reflectstyle;
    } else {
        warnings.push_back("LED could not set reflectionsytle: must be an integer");
    }
    monotone = !(reflectstyle & REFLECT_COLORED);
    quadratic = (reflectstyle & REFLECT_QUADRATIC) != 0;

    setFadeRate(options.faderate);
    setBlinkRate(options.blinkrate);

    casewidth = checkCaseWidth("LED", size, options.casewidth, warnings);
}

void Led::buildBody() {
    bevel3D = Bevel::forSize(size);
    canvasLength = size + casewidth + bevel3D.shadow;

    BBox lamp(casewidth, casewidth, size, size);
    graphics::Color white = graphics::Colors::white();
    graphics::Color gray5 = graphics::parseColor("gray5");
    body.clear();
    body.push_back(Oval(lamp.offset(0.f, (float) -bevel3D.light), casewidth, white, white));
    body.push_back(Oval(lamp.offset(0.f, (float) bevel3D.shadow), casewidth, gray5, gray5));
    body.push_back(Oval(lamp, casewidth, graphics::Colors::black(), graphics::parseColor("gray60")));

    float inset = (size - casewidth) / 6.f;
    float lo = inset + casewidth;
    float hi = size - inset;
    reflection.box = BBox(lo, lo, hi, hi);
    reflection.start = 90.f;
    reflection.extent = 90.f;
    reflection.width = (size - casewidth) / 20.f;
    reflection.visible = (reflectstyle & REFLECT_VISIBLE) != 0;
}

// ============================================================================
// COLOR
// ============================================================================

void Led::changeColor(graphics::Color diodeColor, graphics::Color bulbColor) {
    diode = diodeColor;
    bulb = bulbColor;
    updateColors();
}

void Led::changeDiodeColor(graphics::Color diodeColor) {
    diode = diodeColor;
    updateColors();
}

void Led::changeBulbColor(graphics::Color bulbColor) {
    bulb = bulbColor;
    updateColors();
}

void Led::updateColors() {
    // Off: the bulb alone, dimmed
    bulbHls = graphics::rgbToHls(bulb);
    offLamp = graphics::hlsToRgb(graphics::HLS(bulbHls.h, 0.25 * bulbHls.l, bulbHls.s));
    offReflection = graphics::hlsToRgb(graphics::HLS(bulbHls.h, 0.5 * bulbHls.l, monotone ? 0.0 : bulbHls.s));

    // On: the diode seen through the bulb
    onLamp = diode.filter(bulb);
    onReflection = graphics::Colors::white();
    onHls = graphics::rgbToHls(onLamp);

    setBrightness(brightness);
}

void Led::applyColors(graphics::Color lamp, graphics::Color glint, double level) {
    body[2].fill = lamp;
    reflection.color = glint;
    brightness = level;
}

void Led::setBrightness(double level) {
    if (level <= 0.0) {
        applyColors(offLamp, offReflection, 0.0);
        return;
    }
    // An LED that is off can only get dimmer
    if (!state && level >= brightness) return;

    if (level >= 1.0) {
        applyColors(onLamp, onReflection, 1.0);
        return;
    }

    double lum = onHls.l * (0.75 * level + 0.25);
    if (lum < 0.2 * bulbHls.l) {
        applyColors(offLamp, offReflection, level);
        return;
    }
    graphics::Color lamp = graphics::hlsToRgb(graphics::HLS(onHls.h, lum, onHls.s));

    double sat = monotone ? 0.0 : onHls.s;
    double target = monotone ? bulbHls.l : onHls.l;
    double power = quadratic ? 2.0 : 1.0;
    double glintLum = (1.0 - 0.5 * target) * std::pow(level, power) + 0.5 * target;
    graphics::Color glint = graphics::hlsToRgb(graphics::HLS(onHls.h, glintLum, sat));

    applyColors(lamp, glint, level);
}

// ============================================================================
// STATE, BLINK AND FADE
// ============================================================================

void Led::setBlinkRate(double rateMs) {
    if (!(rateMs >= 0.0)) {
        throw Error("LED blinkrate must be greater than or equal to zero");
    }
    blinkrate = (int) std::nearbyint(rateMs);
    if (blinkrate && state && !blinking) {
        blink();
    } else if (blinkrate == 0 && blinking) {
        cancelBlink();
        turnOn();
    }
}

void Led::setFadeRate(double rateMs) {
    if (!(rateMs >= 0.0)) {
        throw Error("LED faderate must be greater than or equal to zero");
    }
    faderate = (int) std::nearbyint(rateMs);
}

void Led::turn(bool on) {
    if (!on) {
        cancelBlink();
        if (state) {
            fade(false);
        }
    } else if (!state && !blinking) {
        if (blinkrate) {
            blinkId = scheduler.after(blinkrate, [this]() { blink(); });
            blinking = true;
        }
        fade(true);
    }
}

void Led::cancelBlink() {
    if (blinkId != Scheduler::NO_TIMER) {
        scheduler.cancel(blinkId);
        blinkId = Scheduler::NO_TIMER;
        blinking = false;
    }
}

void Led::blink() {
    cancelBlink();
    if (!blinkrate) return;
    toggle();
    // Turning on arms the next toggle itself; the off phase has to be timed here
    if (!state) {
        blinkId = scheduler.after(blinkrate, [this]() { blink(); });
        blinking = true;
    }
}

void Led::fade(bool on) {
    if (fadeId != Scheduler::NO_TIMER) {
        scheduler.cancel(fadeId);
        fadeId = Scheduler::NO_TIMER;
    }
    latency.clear();

    state = on;
    fadeTarget = on ? 1.0 : 0.0;
    fadeTotal = std::fabs(fadeTarget - brightness) * faderate;
    fadeStart = scheduler.now();
    fadeStep(fadeTotal);
}

void Led::fadeStep(double remainMs) {
    fadeId = Scheduler::NO_TIMER;
    if (remainMs <= FADE_TIME_STEP) {
        setBrightness(fadeTarget);
        return;
    }

    if (latency.size() > LATENCY_WINDOW) {
        latency.pop_front();
    }
    // Steps that ran late carry a bigger share of the remaining change
    double delta = ((fadeTarget - brightness) / remainMs) * (FADE_TIME_STEP + mean(latency));
    setBrightness(brightness + delta);

    double lastRemain = remainMs;
    remainMs = fadeTotal - (scheduler.now() - fadeStart);
    latency.push_back(lastRemain - remainMs);

    double next = remainMs - FADE_TIME_STEP;
    fadeId = scheduler.after(FADE_TIME_STEP, [this, next]() { fadeStep(next); });
}

} // namespace viewidget
