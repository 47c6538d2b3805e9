#include "plugin.hpp"

#include <algorithm>
#include <cmath>

using viewidget::DialOptions;
using viewidget::LedOptions;
using viewidget::DigitOptions;

struct Viewidgets : Module {
    enum ParamIds {
        DIAL_PARAM,
        LED_PARAM,
        BLINK_PARAM,
        FADE_PARAM,
        DIGIT_PARAM,
        BLANK_PARAM,
        NUM_PARAMS
    };
    enum InputIds {
        DIAL_CV_INPUT,
        LED_GATE_INPUT,
        DIGIT_CV_INPUT,
        NUM_INPUTS
    };
    enum OutputIds {
        NUM_OUTPUTS
    };
    enum LightIds {
        NUM_LIGHTS
    };

    static constexpr float MAX_RATE_MS = 2000.f;

    // Widget options, persisted with the patch. The panel rebuilds its
    // displays whenever the revision changes.
    DialOptions dialOptions;
    LedOptions ledOptions;
    DigitOptions digitOptions;
    int optionsRevision = 0;

    // Latest control state, read by the panel on the UI thread
    double dialValue = 0.0;
    bool ledOn = false;
    float blinkRate = 0.f;
    float fadeRate = 0.f;
    int digitValue = 0;
    bool digitBlank = false;

    Viewidgets() {
        config(NUM_PARAMS, NUM_INPUTS, NUM_OUTPUTS, NUM_LIGHTS);

        dialOptions.unit = "deg";
        ledOptions.bulbcolor = "red";
        ledOptions.faderate = 250.0;

        configParam(DIAL_PARAM, 0.f, 1.f, 0.f, "Dial value", "%", 0.f, 100.f);
        configSwitch(LED_PARAM, 0.f, 1.f, 0.f, "LED", {"Off", "On"});
        configParam(BLINK_PARAM, 0.f, MAX_RATE_MS, 0.f, "Blink rate", " ms");
        configParam(FADE_PARAM, 0.f, MAX_RATE_MS, 250.f, "Fade rate", " ms");
        configParam(DIGIT_PARAM, 0.f, 15.f, 0.f, "Digit value");
        paramQuantities[DIGIT_PARAM]->snapEnabled = true;
        configSwitch(BLANK_PARAM, 0.f, 1.f, 0.f, "Digit", {"Shown", "Blank"});

        configInput(DIAL_CV_INPUT, "Dial CV (0-10 V spans the scale)");
        configInput(LED_GATE_INPUT, "LED gate");
        configInput(DIGIT_CV_INPUT, "Digit CV (0-10 V)");
    }

    void process(const ProcessArgs& args) override {
        double lo = dialOptions.min;
        double hi = dialOptions.max;
        if (inputs[DIAL_CV_INPUT].isConnected()) {
            // Unclamped so the dial can be driven past its stops
            dialValue = lo + (hi - lo) * inputs[DIAL_CV_INPUT].getVoltage() / 10.0;
        } else {
            dialValue = lo + (hi - lo) * params[DIAL_PARAM].getValue();
        }

        bool gate = inputs[LED_GATE_INPUT].getVoltage() >= 1.f;
        ledOn = params[LED_PARAM].getValue() > 0.5f || gate;
        blinkRate = params[BLINK_PARAM].getValue();
        fadeRate = params[FADE_PARAM].getValue();

        if (inputs[DIGIT_CV_INPUT].isConnected()) {
            float v = inputs[DIGIT_CV_INPUT].getVoltage() * 15.f / 10.f;
            digitValue = clamp((int) std::round(v), 0, 15);
        } else {
            digitValue = clamp((int) std::round(params[DIGIT_PARAM].getValue()), 0, 15);
        }
        digitBlank = params[BLANK_PARAM].getValue() > 0.5f;
    }

    void setBulbColor(const std::string& color) {
        ledOptions.bulbcolor = color;
        optionsRevision++;
    }

    void setDigitForeground(const std::string& color) {
        digitOptions.foreground = color;
        optionsRevision++;
    }

    json_t* dataToJson() override {
        json_t* rootJ = json_object();
        json_object_set_new(rootJ, "dial", dialOptions.toJson());
        json_object_set_new(rootJ, "led", ledOptions.toJson());
        json_object_set_new(rootJ, "digit", digitOptions.toJson());
        return rootJ;
    }

    void dataFromJson(json_t* rootJ) override {
        // Each block is parsed on its own; a bad block keeps the current options
        json_t* dialJ = json_object_get(rootJ, "dial");
        if (dialJ) {
            try {
                dialOptions = DialOptions::fromJson(dialJ);
            }
            catch (const viewidget::Error& e) {
                WARN("Viewidgets: ignoring saved dial options: %s", e.what());
            }
        }
        json_t* ledJ = json_object_get(rootJ, "led");
        if (ledJ) {
            try {
                ledOptions = LedOptions::fromJson(ledJ);
            }
            catch (const viewidget::Error& e) {
                WARN("Viewidgets: ignoring saved LED options: %s", e.what());
            }
        }
        json_t* digitJ = json_object_get(rootJ, "digit");
        if (digitJ) {
            try {
                digitOptions = DigitOptions::fromJson(digitJ);
            }
            catch (const viewidget::Error& e) {
                WARN("Viewidgets: ignoring saved digit options: %s", e.what());
            }
        }
        optionsRevision++;
    }
};

constexpr float Viewidgets::MAX_RATE_MS;

struct ViewidgetsWidget : ModuleWidget {
    viewidget::ui::DialDisplay* dialDisplay = nullptr;
    viewidget::ui::LedDisplay* ledDisplay = nullptr;
    viewidget::ui::DigitDisplay* digitDisplay = nullptr;
    int seenRevision = -1;

    ViewidgetsWidget(Viewidgets* module) {
        setModule(module);
        setPanel(createPanel(asset::plugin(pluginInstance, "res/panels/Viewidgets.svg")));

        using viewidget::ui::PanelLayout;
        PanelLayout::addScrews<ScrewBlack>(this);
        PanelLayout::PanelSvg svg(asset::plugin(pluginInstance, "res/panels/Viewidgets.svg"));

        DialOptions dialOptions;
        LedOptions ledOptions;
        DigitOptions digitOptions;
        if (module) {
            dialOptions = module->dialOptions;
            ledOptions = module->ledOptions;
            digitOptions = module->digitOptions;
            seenRevision = module->optionsRevision;
        }

        dialDisplay = new viewidget::ui::DialDisplay(dialOptions);
        placeDisplay(dialDisplay, svg.rectPx("dial_display", Rect(Vec(5.f, 14.f), Vec(60.f, 60.f))));
        ledDisplay = new viewidget::ui::LedDisplay(ledOptions);
        placeDisplay(ledDisplay, svg.rectPx("led_display", Rect(Vec(70.f, 16.f), Vec(26.f, 26.f))));
        digitDisplay = new viewidget::ui::DigitDisplay(digitOptions);
        placeDisplay(digitDisplay, svg.rectPx("digit_display", Rect(Vec(72.f, 48.f), Vec(22.f, 33.f))));

        addParam(createParamCentered<RoundBlackKnob>(svg.centerPx("dial_knob", 12.f, 92.f), module, Viewidgets::DIAL_PARAM));
        addInput(createInputCentered<PJ301MPort>(svg.centerPx("dial_cv", 12.f, 110.f), module, Viewidgets::DIAL_CV_INPUT));

        addParam(createParamCentered<VCVLatch>(svg.centerPx("led_button", 30.f, 92.f), module, Viewidgets::LED_PARAM));
        addInput(createInputCentered<PJ301MPort>(svg.centerPx("led_gate", 30.f, 110.f), module, Viewidgets::LED_GATE_INPUT));
        addParam(createParamCentered<RoundSmallBlackKnob>(svg.centerPx("blink_knob", 46.f, 92.f), module, Viewidgets::BLINK_PARAM));
        addParam(createParamCentered<RoundSmallBlackKnob>(svg.centerPx("fade_knob", 46.f, 110.f), module, Viewidgets::FADE_PARAM));

        addParam(createParamCentered<RoundBlackSnapKnob>(svg.centerPx("digit_knob", 70.f, 92.f), module, Viewidgets::DIGIT_PARAM));
        addInput(createInputCentered<PJ301MPort>(svg.centerPx("digit_cv", 70.f, 110.f), module, Viewidgets::DIGIT_CV_INPUT));
        addParam(createParamCentered<CKSS>(svg.centerPx("digit_blank", 88.f, 92.f), module, Viewidgets::BLANK_PARAM));
    }

    void placeDisplay(widget::Widget* display, Rect rect) {
        display->box = rect;
        addChild(display);
    }

    void step() override {
        Viewidgets* module = dynamic_cast<Viewidgets*>(this->module);
        if (module) {
            if (module->optionsRevision != seenRevision) {
                seenRevision = module->optionsRevision;
                dialDisplay->rebuild(module->dialOptions);
                ledDisplay->rebuild(module->ledOptions);
                digitDisplay->rebuild(module->digitOptions);
            }
            dialDisplay->setValue(module->dialValue);
            ledDisplay->setFadeRate(module->fadeRate);
            ledDisplay->setBlinkRate(module->blinkRate);
            ledDisplay->request(module->ledOn);
            digitDisplay->show(module->digitValue, module->digitBlank);
        }
        ModuleWidget::step();
    }

    void appendContextMenu(Menu* menu) override {
        Viewidgets* module = dynamic_cast<Viewidgets*>(this->module);
        if (!module)
            return;

        static const char* const kColors[] = {"white", "red", "green", "blue", "yellow", "orange", "cyan", "magenta"};

        struct BulbColorItem : MenuItem {
            Viewidgets* module;
            std::string color;
            void onAction(const event::Action& e) override {
                module->setBulbColor(color);
            }
            void step() override {
                rightText = CHECKMARK(module->ledOptions.bulbcolor == color);
                MenuItem::step();
            }
        };

        struct DigitColorItem : MenuItem {
            Viewidgets* module;
            std::string color;
            void onAction(const event::Action& e) override {
                module->setDigitForeground(color);
            }
            void step() override {
                rightText = CHECKMARK(module->digitOptions.foreground == color);
                MenuItem::step();
            }
        };

        menu->addChild(new MenuSeparator);
        menu->addChild(createMenuLabel("LED bulb color"));
        for (const char* color : kColors) {
            menu->addChild(construct<BulbColorItem>(&MenuItem::text, color, &BulbColorItem::module, module,
                                                    &BulbColorItem::color, std::string(color)));
        }

        menu->addChild(new MenuSeparator);
        menu->addChild(createMenuLabel("Digit color"));
        for (const char* color : kColors) {
            menu->addChild(construct<DigitColorItem>(&MenuItem::text, color, &DigitColorItem::module, module,
                                                     &DigitColorItem::color, std::string(color)));
        }
    }
};

Model* modelViewidgets = createModel<Viewidgets, ViewidgetsWidget>("Viewidgets");
