#include "dial.hpp"
#include "json_options.hpp"
#include <algorithm>
#include <cmath>

namespace viewidget {

namespace {

const char* kDegreeSign = "\xC2\xB0";

std::string replaceAll(std::string text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

} // namespace

// ============================================================================
// OPTIONS
// ============================================================================

DialOptions DialOptions::fromJson(json_t* rootJ) {
    DialOptions options;
    const char* key;
    json_t* valueJ;
    json_object_foreach(rootJ, key, valueJ) {
        std::string k = key;
        if (k == "size") {
            options.size = (float) json::getNumber(valueJ, "Dial", key);
        } else if (k == "casewidth") {
            options.casewidth = (float) json::getNumber(valueJ, "Dial", key);
        } else if (k == "start") {
            options.start = (float) json::getNumber(valueJ, "Dial", key);
        } else if (k == "extent") {
            options.extent = (float) json::getNumber(valueJ, "Dial", key);
        } else if (k == "min") {
            options.min = json::getNumber(valueJ, "Dial", key);
        } else if (k == "max") {
            options.max = json::getNumber(valueJ, "Dial", key);
        } else if (k == "majorscale") {
            options.majorscale = json::getNumber(valueJ, "Dial", key);
        } else if (k == "semimajorscale") {
            options.semimajorscale = json::getNumber(valueJ, "Dial", key);
        } else if (k == "minorscale") {
            options.minorscale = json::getNumber(valueJ, "Dial", key);
        } else if (k == "unit") {
            options.unit = json_is_null(valueJ) ? std::string() : json::getString(valueJ, "Dial", key);
        } else if (k == "value") {
            if (!json_is_null(valueJ)) {
                options.initialValue(json::getNumber(valueJ, "Dial", key));
            }
        } else if (k == "bound") {
            options.hardStops(json::getBool(valueJ, "Dial", key));
        } else if (k == "withdisplay") {
            options.withdisplay = json::getBool(valueJ, "Dial", key);
        } else {
            json::unknownKey("Dial", key);
        }
    }
    return options;
}

json_t* DialOptions::toJson() const {
    json_t* rootJ = json_object();
    json_object_set_new(rootJ, "size", json_real(size));
    json_object_set_new(rootJ, "casewidth", json_real(casewidth));
    json_object_set_new(rootJ, "start", json_real(start));
    json_object_set_new(rootJ, "extent", json_real(extent));
    json_object_set_new(rootJ, "min", json_real(min));
    json_object_set_new(rootJ, "max", json_real(max));
    json_object_set_new(rootJ, "majorscale", json_real(majorscale));
    json_object_set_new(rootJ, "semimajorscale", json_real(semimajorscale));
    json_object_set_new(rootJ, "minorscale", json_real(minorscale));
    json_object_set_new(rootJ, "unit", json_string(unit.c_str()));
    json_object_set_new(rootJ, "withdisplay", json_boolean(withdisplay));
    if (hasValue) {
        json_object_set_new(rootJ, "value", json_real(value));
    }
    if (hasBound) {
        json_object_set_new(rootJ, "bound", json_boolean(bound));
    }
    return rootJ;
}

// ============================================================================
// CONSTRUCTION
// ============================================================================

Dial::Dial(const DialOptions& options) {
    displayColors[0] = graphics::Colors::black();
    displayColors[1] = graphics::Colors::red();

    validate(options);
    buildBody();
    buildScale();
    buildReadout(options);
    buildNeedle();

    if (options.hasValue) {
        setValue(options.value);
    } else {
        resetValue();
    }
}

void Dial::validate(const DialOptions& options) {
    if (!(options.size > 0.f)) {
        throw Error("Dial size must be greater than zero");
    }
    if (!(options.casewidth >= 0.f)) {
        throw Error("Dial casewidth must be greater than or equal to zero");
    }
    if (!(std::fabs(options.start) < 360.f)) {
        throw Error("Dial start angle must be smaller than +/-360 degrees");
    }
    if (!(std::fabs(options.extent) <= 360.f)) {
        throw Error("Dial extent angle must be smaller than or equal to +/-360 degrees");
    }
    if (!(options.majorscale > 0.0)) {
        throw Error("Dial majorscale must be greater than zero");
    }
    if (!(options.semimajorscale >= 0.0)) {
        throw Error("Dial semimajorscale must be greater than or equal to zero");
    }
    if (!(options.minorscale >= 0.0)) {
        throw Error("Dial minorscale must be greater than or equal to zero");
    }

    size = options.size;
    start = options.start;
    extent = options.extent;
    end = start + extent;
    min = options.min;
    max = options.max;
    majorscale = options.majorscale;
    semimajorscale = options.semimajorscale;
    minorscale = options.minorscale;
    withdisplay = options.withdisplay;

    // A full sweep has nowhere to stop unless asked to
    fullCircle = std::fabs(extent) == 360.f;
    bound = options.hasBound ? options.bound : !fullCircle;

    if (min == max) {
        throw Error("Dial min cannot be equal to the max");
    } else if (min > max) {
        warnings.push_back("Dial min is greater than the max");
        direction = -1;
    } else {
        direction = 1;
    }

    if (semimajorscale != 0.0) {
        if (semimajorscale >= majorscale) {
            warnings.push_back("Dial semimajorscale greater than or equal to majorscale");
            semimajorscale = 0.0;
        } else if (std::fmod(majorscale, semimajorscale) != 0.0) {
            warnings.push_back("Dial semimajorscale must be a factor of the majorscale");
            semimajorscale = 0.0;
        }
    }

    casewidth = checkCaseWidth("Dial", size, options.casewidth, warnings);
}

void Dial::buildBody() {
    bevel3D = Bevel::forSize(size);
    canvasLength = size + casewidth + bevel3D.shadow;

    BBox face(casewidth, casewidth, size, size);
    graphics::Color white = graphics::Colors::white();
    graphics::Color gray5 = graphics::parseColor("gray5");
    body.clear();
    body.push_back(Oval(face.offset(0.f, (float) -bevel3D.light), casewidth, white, white));
    body.push_back(Oval(face.offset(0.f, (float) bevel3D.shadow), casewidth, gray5, gray5));
    body.push_back(Oval(face, casewidth, white, graphics::parseColor("gray60")));

    float mid = (size + casewidth) / 2.f;
    centerPos = Vec(mid, mid);
    dialrad = (size - casewidth) / 2.f;
    arcoffset = dialrad / 3.f;
}

void Dial::addTicks(TickKind kind, double step, int count, float tickLength, float width) {
    double absdiff = std::fabs(max - min);
    float inner = dialrad - arcoffset;
    for (int n = 0; n < count; ++n) {
        Tick tick;
        tick.kind = kind;
        tick.angle = (float) (start + n * extent * step / absdiff);
        tick.line.from = polar(centerPos, inner, tick.angle);
        tick.line.to = polar(centerPos, inner + tickLength, tick.angle);
        tick.line.width = width;
        scaleTicks.push_back(tick);
    }
}

void Dial::buildScale() {
    double absdiff = std::fabs(max - min);
    scaleTicks.clear();
    labels.clear();

    if (minorscale != 0.0) {
        int count = (int) (absdiff / minorscale) + 1;
        addTicks(MINOR_TICK, minorscale, count, arcoffset / 5.f, 1.f);
    }

    if (semimajorscale != 0.0) {
        int count = (int) (absdiff / semimajorscale) + 1;
        addTicks(SEMIMAJOR_TICK, semimajorscale, count, arcoffset / 3.f, 1.f);
    }

    // A full circle would draw the last major tick on top of the first
    int majorCount = (int) (absdiff / majorscale) + (fullCircle ? 0 : 1);
    size_t firstMajor = scaleTicks.size();
    addTicks(MAJOR_TICK, majorscale, majorCount, arcoffset / 3.f, 3.f);

    float textRadius = dialrad - arcoffset / 2.5f;
    int fontSize = (int) (arcoffset / 5.f);
    for (int n = 0; n < majorCount; ++n) {
        Label label;
        label.pos = polar(centerPos, textRadius, scaleTicks[firstMajor + n].angle);
        label.text = formatScaleValue(min + n * majorscale * direction);
        label.fontSize = fontSize;
        label.bold = true;
        labels.push_back(label);
    }

    float lo = arcoffset + casewidth;
    float hi = size - arcoffset;
    arc.box = BBox(lo, lo, hi, hi);
    arc.start = start;
    arc.extent = fullCircle ? 360.f : extent;
    arc.width = 2.f;
    arc.color = graphics::Colors::black();
}

void Dial::buildReadout(const DialOptions& options) {
    int fontSize = (int) (arcoffset / 3.f);
    Vec pos = Vec(centerPos.x, centerPos.y + arcoffset * 4.f / 3.f);

    readoutLabel.pos = pos;
    readoutLabel.fontSize = fontSize;
    readoutLabel.bold = true;

    unit.pos = pos;
    unit.text = replaceAll(options.unit, "deg", kDegreeSign);
    unit.fontSize = fontSize;
    unit.bold = true;
}

void Dial::buildNeedle() {
    pinrad = size / 25.f;
    float xm = centerPos.x;
    float ym = centerPos.y;

    // Resting needle points along +x (0 degrees)
    needleBase.clear();
    needleBase.push_back(Vec(xm + 2.5f * arcoffset, ym));
    needleBase.push_back(Vec(xm - arcoffset, ym + 0.75f * pinrad));
    needleBase.push_back(Vec(xm - arcoffset, ym - 0.75f * pinrad));
    needlePolygon = needleBase;

    BBox pinBox(xm - pinrad, ym - pinrad, xm + pinrad, ym + pinrad);
    graphics::Color gray95 = graphics::parseColor("gray95");
    graphics::Color gray5 = graphics::parseColor("gray5");
    pin.clear();
    pin.push_back(Oval(pinBox.offset(0.f, (float) -bevel3D.light), 1.f, gray95, gray95));
    pin.push_back(Oval(pinBox.offset(0.f, (float) bevel3D.shadow), 1.f, gray5, gray5));
    pin.push_back(Oval(pinBox, 1.f, graphics::parseColor("gray70"), graphics::parseColor("#DDDDDD")));
}

// ============================================================================
// STATE
// ============================================================================

void Dial::setValue(double newValue) {
    if (hasValue && newValue == value) return;
    hasValue = true;
    value = newValue;

    float a = (float) ((value - min) * (end - start) / (max - min) + start);

    outOfBounds = false;
    if (bound) {
        bool belowStart = (min < max) ? value < min : value > min;
        bool pastEnd = (min < max) ? value > max : value < max;
        if (belowStart) {
            a = start;
            outOfBounds = true;
        } else if (pastEnd) {
            a = end;
            outOfBounds = true;
        }
    }
    angle = a;

    // Rotate about the pin; negative because canvas y grows downward
    float radians = -deg2rad(angle);
    needlePolygon.resize(needleBase.size());
    for (size_t i = 0; i < needleBase.size(); ++i) {
        needlePolygon[i] = needleBase[i].minus(centerPos).rotate(radians).plus(centerPos);
    }

    updateReadout();
}

void Dial::resetValue() {
    setValue(min);
}

void Dial::setDisplayColors(graphics::Color normal, graphics::Color alert) {
    displayColors[0] = normal;
    displayColors[1] = alert;
}

void Dial::setDisplayPrecision(int digits) {
    if (digits < 0) {
        throw Error("Dial display precision must be greater than or equal to zero");
    }
    displayRoundTo = digits;
    updateReadout();
}

void Dial::updateReadout() {
    if (!withdisplay) {
        readoutLabel.text.clear();
        return;
    }
    if (displayRoundTo > 0) {
        readoutLabel.text = string::f("%.*f", displayRoundTo, value);
    } else {
        // Halves round to even
        readoutLabel.text = string::f("%.0f", std::nearbyint(value));
    }
}

Vec Dial::unitPosition(float minTextWidth, float maxTextWidth) const {
    if (!withdisplay) return unit.pos;
    return Vec(centerPos.x + std::max(minTextWidth, maxTextWidth) + 2.f, unit.pos.y);
}

std::string Dial::formatScaleValue(double v) {
    if (v == std::floor(v) && std::fabs(v) < 1e15) {
        return string::f("%.0f", v);
    }
    return string::f("%g", v);
}

} // namespace viewidget
