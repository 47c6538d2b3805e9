#pragma once
#include <rack.hpp>
#include <nanovg.h>
#include <algorithm>
#include <cmath>
#include <memory>
#include "../graphics/drawing.hpp"
#include "../model/dial.hpp"
#include "../model/led.hpp"
#include "../model/digit.hpp"
#include "../model/scheduler.hpp"

using namespace rack;

namespace viewidget {
namespace ui {

// ============================================================================
// CANVAS DISPLAY BASE
// ============================================================================

/**
 * Hosts one widget model and draws its canvas scaled to fit box.size.
 * The canvas keeps its aspect ratio and is centered in the box.
 */
struct CanvasDisplay : widget::TransparentWidget {
    std::shared_ptr<window::Font> font;

    virtual Vec canvasSize() const = 0;
    virtual void drawCanvas(const DrawArgs& args) = 0;

    void draw(const DrawArgs& args) override {
        Vec canvas = canvasSize();
        if (canvas.x <= 0.f || canvas.y <= 0.f) return;
        ensureFont();

        float scale = std::min(box.size.x / canvas.x, box.size.y / canvas.y);
        nvgSave(args.vg);
        nvgTranslate(args.vg, (box.size.x - canvas.x * scale) * 0.5f, (box.size.y - canvas.y * scale) * 0.5f);
        nvgScale(args.vg, scale, scale);
        nvgIntersectScissor(args.vg, 0.f, 0.f, canvas.x, canvas.y);
        drawCanvas(args);
        nvgRestore(args.vg);

        Widget::draw(args);
    }

protected:
    void ensureFont() {
        if (!font && APP && APP->window) {
            font = APP->window->loadFont(asset::system("res/fonts/DejaVuSans.ttf"));
        }
    }

    static void logWarnings(const Warnings& warnings) {
        for (const std::string& w : warnings) {
            WARN("%s", w.c_str());
        }
    }
};

// ============================================================================
// DIAL DISPLAY
// ============================================================================

struct DialDisplay : CanvasDisplay {
    std::unique_ptr<Dial> dial;

    explicit DialDisplay(const DialOptions& options = DialOptions()) {
        rebuild(options);
    }

    // Invalid options keep the current dial
    void rebuild(const DialOptions& options) {
        try {
            dial.reset(new Dial(options));
            logWarnings(dial->getWarnings());
        }
        catch (const Error& e) {
            WARN("Dial options rejected: %s", e.what());
            if (!dial) {
                dial.reset(new Dial());
            }
        }
    }

    void setValue(double value) {
        dial->setValue(value);
    }

    Vec canvasSize() const override {
        return Vec(dial->length(), dial->length());
    }

    void drawCanvas(const DrawArgs& args) override {
        for (const Oval& oval : dial->bodyOvals()) {
            graphics::drawOval(args, oval);
        }

        graphics::Color ink = graphics::Colors::black();
        for (const Dial::Tick& tick : dial->ticks()) {
            graphics::drawLine(args, tick.line, ink);
        }
        for (const Label& label : dial->scaleLabels()) {
            graphics::drawLabel(args, font, label, ink);
        }
        graphics::drawArc(args, dial->scaleArc());

        if (dial->hasReadout()) {
            graphics::drawLabel(args, font, dial->readout(), dial->readoutColor());
        }
        const Label& unit = dial->unitLabel();
        if (!unit.text.empty()) {
            float minWidth = graphics::labelWidth(args.vg, font, unit.fontSize, dial->minText());
            float maxWidth = graphics::labelWidth(args.vg, font, unit.fontSize, dial->maxText());
            graphics::drawLabelAt(args, font, unit, dial->unitPosition(minWidth, maxWidth), ink);
        }

        graphics::drawPolygon(args, dial->needle(), ink, ink, 0.f);
        for (const Oval& oval : dial->pinOvals()) {
            graphics::drawOval(args, oval);
        }
    }
};

// ============================================================================
// LED DISPLAY
// ============================================================================

/**
 * Owns the timer queue that animates its LED. The queue is advanced from
 * step() on the UI thread, so fades and blinks run at frame granularity.
 */
struct LedDisplay : CanvasDisplay {
    Scheduler scheduler;
    std::unique_ptr<Led> led;
    double epoch = 0.0;
    bool requested = false;

    explicit LedDisplay(const LedOptions& options = LedOptions()) {
        epoch = system::getTime();
        rebuild(options);
    }

    void rebuild(const LedOptions& options) {
        try {
            std::unique_ptr<Led> fresh(new Led(scheduler, options));
            logWarnings(fresh->getWarnings());
            led = std::move(fresh);
            requested = options.state;
        }
        catch (const Error& e) {
            WARN("LED options rejected: %s", e.what());
            if (!led) {
                led.reset(new Led(scheduler));
                requested = false;
            }
        }
    }

    // Blinking flips the LED by itself, so track the request separately
    void request(bool on) {
        if (on == requested) return;
        requested = on;
        led->turn(on);
    }

    void setBlinkRate(float ms) {
        if ((int) std::round(ms) != led->getBlinkRate()) {
            led->setBlinkRate(ms);
        }
    }

    void setFadeRate(float ms) {
        if ((int) std::round(ms) != led->getFadeRate()) {
            led->setFadeRate(ms);
        }
    }

    void step() override {
        scheduler.advanceTo((system::getTime() - epoch) * 1000.0);
        CanvasDisplay::step();
    }

    Vec canvasSize() const override {
        return Vec(led->length(), led->length());
    }

    void drawCanvas(const DrawArgs& args) override {
        for (const Oval& oval : led->bodyOvals()) {
            graphics::drawOval(args, oval);
        }
        graphics::drawArc(args, led->reflectionArc());
    }
};

// ============================================================================
// DIGIT DISPLAY
// ============================================================================

struct DigitDisplay : CanvasDisplay {
    std::unique_ptr<Digit> digit;

    explicit DigitDisplay(const DigitOptions& options = DigitOptions()) {
        rebuild(options);
    }

    void rebuild(const DigitOptions& options) {
        try {
            digit.reset(new Digit(options));
        }
        catch (const Error& e) {
            WARN("Digit options rejected: %s", e.what());
            if (!digit) {
                digit.reset(new Digit());
            }
        }
    }

    void show(int value, bool blank) {
        if (blank) {
            if (!digit->isBlank()) digit->clear();
        } else if (digit->getValue() != value) {
            digit->setValue(value);
        }
    }

    Vec canvasSize() const override {
        return Vec(digit->width(), digit->height());
    }

    void drawCanvas(const DrawArgs& args) override {
        graphics::drawRect(args, 0.f, 0.f, digit->getSize(), digit->getSize(), digit->background());
        const std::vector<Polygon>& segments = digit->segments();
        for (int i = 0; i < (int) segments.size(); ++i) {
            if (!digit->segmentLit(i)) continue;
            graphics::drawPolygon(args, segments[i], digit->foreground(), digit->background(),
                                  digit->outlineWidth());
        }
    }
};

}} // namespace viewidget::ui
