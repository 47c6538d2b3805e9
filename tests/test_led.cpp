#include <gtest/gtest.h>
#include <memory>
#include "model/led.hpp"

using namespace viewidget;
using graphics::Color;

class LedTest : public ::testing::Test {
protected:
    Scheduler scheduler;

    std::unique_ptr<Led> make(const LedOptions& options = LedOptions()) {
        return std::unique_ptr<Led>(new Led(scheduler, options));
    }

    static LedOptions redBulb() {
        LedOptions options;
        options.bulbcolor = "red";
        return options;
    }
};

TEST_F(LedTest, DefaultLayout) {
    std::unique_ptr<Led> led = make();
    EXPECT_EQ(2, led->bevel().shadow);
    EXPECT_EQ(1, led->bevel().light);
    EXPECT_FLOAT_EQ(112.f, led->length());
    ASSERT_EQ(3u, led->bodyOvals().size());
    EXPECT_EQ(graphics::parseColor("gray60"), led->bodyOvals()[2].outline);

    const Arc& glint = led->reflectionArc();
    EXPECT_FLOAT_EQ(25.f, glint.box.x1);
    EXPECT_FLOAT_EQ(85.f, glint.box.x2);
    EXPECT_FLOAT_EQ(90.f, glint.start);
    EXPECT_FLOAT_EQ(90.f, glint.extent);
    EXPECT_FLOAT_EQ(4.5f, glint.width);
    EXPECT_TRUE(led->reflectionVisible());
    EXPECT_TRUE(led->getWarnings().empty());
}

TEST_F(LedTest, StartsOffWithDimmedBulb) {
    std::unique_ptr<Led> led = make();
    EXPECT_FALSE(led->getState());
    EXPECT_DOUBLE_EQ(0.0, led->getBrightness());
    EXPECT_EQ(Color(16384, 16384, 16384), led->lampColor());
    EXPECT_EQ(Color(32768, 32768, 32768), led->reflectionColor());
}

TEST_F(LedTest, TurnOnWithoutFade) {
    std::unique_ptr<Led> led = make(redBulb());
    EXPECT_EQ(Color(16384, 0, 0), led->lampColor());

    led->turnOn();
    EXPECT_TRUE(led->getState());
    EXPECT_DOUBLE_EQ(1.0, led->getBrightness());
    EXPECT_EQ(Color(0xffff, 0, 0), led->lampColor());
    EXPECT_EQ(graphics::Colors::white(), led->reflectionColor());

    led->turnOff();
    EXPECT_FALSE(led->getState());
    EXPECT_DOUBLE_EQ(0.0, led->getBrightness());
    EXPECT_EQ(Color(16384, 0, 0), led->lampColor());
}

TEST_F(LedTest, InitialStateOn) {
    LedOptions options;
    options.state = true;
    std::unique_ptr<Led> led = make(options);
    EXPECT_TRUE(led->getState());
    EXPECT_DOUBLE_EQ(1.0, led->getBrightness());
}

TEST_F(LedTest, ToggleFlipsState) {
    std::unique_ptr<Led> led = make();
    led->toggle();
    EXPECT_TRUE(led->getState());
    led->toggle();
    EXPECT_FALSE(led->getState());
}

TEST_F(LedTest, BulbFiltersDiode) {
    LedOptions options;
    options.diodecolor = "yellow";
    options.bulbcolor = "magenta";
    std::unique_ptr<Led> led = make(options);
    EXPECT_EQ(Color(0xffff, 0, 0), led->onLampColor());

    led->turnOn();
    led->changeColor(graphics::parseColor("green"), graphics::Colors::white());
    EXPECT_EQ(Color(0, 0xffff, 0), led->lampColor());
}

TEST_F(LedTest, PartialBrightnessWhenOn) {
    std::unique_ptr<Led> led = make(redBulb());
    led->turnOn();
    led->setBrightness(0.5);
    EXPECT_DOUBLE_EQ(0.5, led->getBrightness());
    EXPECT_EQ(Color(40959, 0, 0), led->lampColor());
    // Colored reflection, quadratic ramp
    EXPECT_EQ(Color(57343, 0, 0), led->reflectionColor());
}

TEST_F(LedTest, MonotoneLinearReflection) {
    LedOptions options = redBulb();
    options.reflectstyle = 0x1;
    std::unique_ptr<Led> led = make(options);
    EXPECT_TRUE(led->monotoneReflection());
    EXPECT_FALSE(led->quadraticReflection());
    EXPECT_EQ(Color(16384, 16384, 16384), led->reflectionColor());

    led->turnOn();
    led->setBrightness(0.5);
    // (1 - 0.25) * 0.5 + 0.25
    EXPECT_EQ(Color::fromUnit(0.625, 0.625, 0.625), led->reflectionColor());
}

TEST_F(LedTest, OffLedCannotBrighten) {
    std::unique_ptr<Led> led = make(redBulb());
    led->setBrightness(0.5);
    EXPECT_DOUBLE_EQ(0.0, led->getBrightness());
    EXPECT_EQ(Color(16384, 0, 0), led->lampColor());
}

TEST_F(LedTest, VeryDimLevelsUseOffColors) {
    LedOptions options;
    options.diodecolor = "blue";
    std::unique_ptr<Led> led = make(options);
    led->turnOn();
    led->setBrightness(0.1);
    EXPECT_DOUBLE_EQ(0.1, led->getBrightness());
    EXPECT_EQ(led->offLampColor(), led->lampColor());
}

TEST_F(LedTest, ReflectStyleMustBeInteger) {
    LedOptions options;
    options.reflectstyle = 2.5;
    std::unique_ptr<Led> led = make(options);
    ASSERT_EQ(1u, led->getWarnings().size());
    EXPECT_EQ("LED could not set reflectionsytle: must be an integer", led->getWarnings()[0]);
    EXPECT_TRUE(led->reflectionVisible());
    EXPECT_FALSE(led->monotoneReflection());
}

TEST_F(LedTest, HiddenReflection) {
    LedOptions options;
    options.reflectstyle = 0;
    std::unique_ptr<Led> led = make(options);
    EXPECT_FALSE(led->reflectionVisible());
}

TEST_F(LedTest, WideCaseIsShrunk) {
    LedOptions options;
    options.casewidth = 20.f;
    std::unique_ptr<Led> led = make(options);
    EXPECT_FLOAT_EQ(10.f, led->getCaseWidth());
    ASSERT_EQ(1u, led->getWarnings().size());
    EXPECT_EQ("LED casewidth must be less than or equal to 1/10 the size", led->getWarnings()[0]);
}

TEST_F(LedTest, InvalidOptionsThrow) {
    LedOptions options;
    options.size = -1.f;
    EXPECT_THROW(make(options), Error);

    options = LedOptions();
    options.casewidth = -1.f;
    EXPECT_THROW(make(options), Error);

    options = LedOptions();
    options.blinkrate = -10.0;
    EXPECT_THROW(make(options), Error);

    options = LedOptions();
    options.faderate = -10.0;
    EXPECT_THROW(make(options), Error);

    options = LedOptions();
    options.bulbcolor = "nope";
    EXPECT_THROW(make(options), Error);
}

TEST_F(LedTest, RatesRoundToWholeMilliseconds) {
    std::unique_ptr<Led> led = make();
    led->setFadeRate(10.5);
    EXPECT_EQ(10, led->getFadeRate());
    led->setFadeRate(11.5);
    EXPECT_EQ(12, led->getFadeRate());
    EXPECT_THROW(led->setFadeRate(-1.0), Error);
    EXPECT_THROW(led->setBlinkRate(-1.0), Error);
}

// ============================================================================
// FADE
// ============================================================================

TEST_F(LedTest, FadeStepsEveryTwentyMilliseconds) {
    LedOptions options;
    options.faderate = 200.0;
    std::unique_ptr<Led> led = make(options);

    led->turnOn();
    EXPECT_TRUE(led->getState());
    EXPECT_TRUE(led->isFading());
    EXPECT_NEAR(0.1, led->getBrightness(), 1e-9);

    scheduler.advanceBy(20);
    EXPECT_NEAR(0.2, led->getBrightness(), 1e-9);

    for (int i = 0; i < 7; ++i) {
        scheduler.advanceBy(20);
    }
    EXPECT_NEAR(0.9, led->getBrightness(), 1e-9);
    EXPECT_TRUE(led->isFading());

    scheduler.advanceBy(20);
    EXPECT_DOUBLE_EQ(1.0, led->getBrightness());
    EXPECT_FALSE(led->isFading());
    EXPECT_EQ(0u, scheduler.pending());
}

TEST_F(LedTest, FadeOutFromFullBrightness) {
    LedOptions options;
    options.faderate = 100.0;
    options.state = true;
    std::unique_ptr<Led> led = make(options);
    for (int i = 0; i < 5; ++i) {
        scheduler.advanceBy(20);
    }
    ASSERT_DOUBLE_EQ(1.0, led->getBrightness());

    led->turnOff();
    EXPECT_FALSE(led->getState());
    EXPECT_NEAR(0.8, led->getBrightness(), 1e-9);
    for (int i = 0; i < 4; ++i) {
        scheduler.advanceBy(20);
    }
    EXPECT_DOUBLE_EQ(0.0, led->getBrightness());
    EXPECT_FALSE(led->isFading());
}

TEST_F(LedTest, LateFrameFinishesFadeOnNextStep) {
    LedOptions options;
    options.faderate = 200.0;
    std::unique_ptr<Led> led = make(options);
    led->turnOn();

    // One long frame: a single step runs and the remaining time goes negative
    scheduler.advanceBy(1000);
    EXPECT_NEAR(0.2, led->getBrightness(), 1e-9);
    EXPECT_TRUE(led->isFading());

    scheduler.advanceBy(20);
    EXPECT_DOUBLE_EQ(1.0, led->getBrightness());
}

TEST_F(LedTest, ReversingMidFadeStartsFromCurrentBrightness) {
    LedOptions options;
    options.faderate = 200.0;
    std::unique_ptr<Led> led = make(options);
    led->turnOn();
    scheduler.advanceBy(20);
    ASSERT_NEAR(0.2, led->getBrightness(), 1e-9);

    led->turnOff();
    EXPECT_FALSE(led->getState());
    // 0.2 of the way takes 40 ms: one 20 ms step, then the final one
    EXPECT_NEAR(0.1, led->getBrightness(), 1e-9);
    scheduler.advanceBy(20);
    EXPECT_DOUBLE_EQ(0.0, led->getBrightness());
    EXPECT_EQ(0u, scheduler.pending());
}

// ============================================================================
// BLINK
// ============================================================================

TEST_F(LedTest, BlinkTogglesAtRate) {
    LedOptions options;
    options.blinkrate = 100.0;
    std::unique_ptr<Led> led = make(options);

    led->turnOn();
    EXPECT_TRUE(led->getState());
    EXPECT_TRUE(led->isBlinking());

    scheduler.advanceBy(100);
    EXPECT_FALSE(led->getState());
    EXPECT_TRUE(led->isBlinking());

    scheduler.advanceBy(100);
    EXPECT_TRUE(led->getState());
    EXPECT_TRUE(led->isBlinking());

    scheduler.advanceBy(100);
    EXPECT_FALSE(led->getState());
}

TEST_F(LedTest, TurnOffStopsBlinking) {
    LedOptions options;
    options.blinkrate = 100.0;
    std::unique_ptr<Led> led = make(options);
    led->turnOn();
    led->turnOff();
    EXPECT_FALSE(led->getState());
    EXPECT_FALSE(led->isBlinking());
    EXPECT_EQ(0u, scheduler.pending());

    scheduler.advanceBy(500);
    EXPECT_FALSE(led->getState());
}

TEST_F(LedTest, BlinkRateOnLitLedStartsBlinking) {
    std::unique_ptr<Led> led = make();
    led->turnOn();
    led->setBlinkRate(50.0);
    EXPECT_EQ(50, led->getBlinkRate());
    EXPECT_TRUE(led->isBlinking());
    EXPECT_FALSE(led->getState());

    scheduler.advanceBy(50);
    EXPECT_TRUE(led->getState());
}

TEST_F(LedTest, ZeroBlinkRateLeavesLedOn) {
    LedOptions options;
    options.blinkrate = 100.0;
    std::unique_ptr<Led> led = make(options);
    led->turnOn();
    scheduler.advanceBy(100);
    ASSERT_FALSE(led->getState());

    led->setBlinkRate(0.0);
    EXPECT_FALSE(led->isBlinking());
    EXPECT_TRUE(led->getState());
    EXPECT_EQ(0u, scheduler.pending());
}

TEST_F(LedTest, BlinkRateOnDarkLedWaitsForTurnOn) {
    std::unique_ptr<Led> led = make();
    led->setBlinkRate(100.0);
    EXPECT_FALSE(led->isBlinking());
    EXPECT_EQ(0u, scheduler.pending());
}

TEST_F(LedTest, DestructionCancelsTimers) {
    LedOptions options;
    options.blinkrate = 100.0;
    options.faderate = 500.0;
    options.state = true;
    {
        std::unique_ptr<Led> led = make(options);
        EXPECT_EQ(2u, scheduler.pending());
    }
    EXPECT_EQ(0u, scheduler.pending());
    scheduler.advanceBy(1000);
}
