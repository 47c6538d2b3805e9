#include <gtest/gtest.h>
#include "model/digit.hpp"

using namespace viewidget;

class DigitTest : public ::testing::Test {
protected:
    Digit digit;
};

TEST_F(DigitTest, Defaults) {
    EXPECT_EQ(0, digit.getValue());
    EXPECT_EQ(0x3F, digit.getMask());
    EXPECT_FLOAT_EQ(100.f, digit.height());
    EXPECT_NEAR(66.6667f, digit.width(), 1e-3);
    EXPECT_FLOAT_EQ(1.f, digit.outlineWidth());
    EXPECT_EQ(graphics::Colors::red(), digit.foreground());
    EXPECT_EQ(graphics::Colors::black(), digit.background());
    EXPECT_EQ(Digit::SEGMENT_COUNT, (int) digit.segments().size());
}

TEST_F(DigitTest, OneLightsRightSide) {
    ASSERT_TRUE(digit.setValue(1));
    EXPECT_EQ(0x28, digit.getMask());
    EXPECT_FALSE(digit.segmentLit(0));
    EXPECT_TRUE(digit.segmentLit(3));
    EXPECT_TRUE(digit.segmentLit(5));
    EXPECT_FALSE(digit.segmentLit(6));
}

TEST_F(DigitTest, HexSymbols) {
    ASSERT_TRUE(digit.setValue('b'));
    EXPECT_EQ(11, digit.getValue());
    EXPECT_EQ(0x76, digit.getMask());

    ASSERT_TRUE(digit.setValue('F'));
    EXPECT_EQ(15, digit.getValue());
    EXPECT_EQ(0x55, digit.getMask());

    ASSERT_TRUE(digit.setValue('7'));
    EXPECT_EQ(7, digit.getValue());
    EXPECT_EQ(0x29, digit.getMask());
}

TEST_F(DigitTest, MaskTable) {
    const int expected[16] = {
        0x3F, 0x28, 0x5B, 0x6B, 0x6C, 0x67, 0x77, 0x29,
        0x7F, 0x6F, 0x7D, 0x76, 0x17, 0x7A, 0x57, 0x55,
    };
    for (int v = 0; v < 16; ++v) {
        EXPECT_EQ(expected[v], Digit::maskFor(v)) << "value " << v;
    }
    EXPECT_EQ(-1, Digit::maskFor(16));
    EXPECT_EQ(-1, Digit::maskFor(-1));
}

TEST_F(DigitTest, InvalidValuesAreIgnored) {
    digit.setValue(4);
    EXPECT_FALSE(digit.setValue(16));
    EXPECT_FALSE(digit.setValue('g'));
    EXPECT_FALSE(digit.setValue(' '));
    EXPECT_EQ(4, digit.getValue());
    EXPECT_EQ(0x6C, digit.getMask());
}

TEST_F(DigitTest, ClearBlanksEverySegment) {
    digit.clear();
    EXPECT_TRUE(digit.isBlank());
    EXPECT_EQ(0, digit.getMask());
    for (int i = 0; i < Digit::SEGMENT_COUNT; ++i) {
        EXPECT_FALSE(digit.segmentLit(i));
    }
    digit.setValue(2);
    EXPECT_FALSE(digit.isBlank());
}

TEST_F(DigitTest, SetMaskDrivesSegmentsDirectly) {
    digit.setMask(0x41);
    EXPECT_TRUE(digit.segmentLit(0));
    EXPECT_TRUE(digit.segmentLit(6));
    EXPECT_FALSE(digit.segmentLit(1));
    digit.setMask(0x1FF);
    EXPECT_EQ(0x7F, digit.getMask());
}

TEST_F(DigitTest, SegmentGeometry) {
    const std::vector<Polygon>& segs = digit.segments();

    const Polygon& top = segs[0];
    ASSERT_EQ(4u, top.size());
    EXPECT_FLOAT_EQ(9.f, top[0].x);
    EXPECT_FLOAT_EQ(9.f, top[0].y);
    EXPECT_FLOAT_EQ(57.f, top[1].x);
    EXPECT_FLOAT_EQ(47.f, top[2].x);
    EXPECT_FLOAT_EQ(19.f, top[2].y);
    EXPECT_FLOAT_EQ(19.f, top[3].x);

    const Polygon& bottom = segs[1];
    EXPECT_FLOAT_EQ(89.f, bottom[0].y);
    EXPECT_FLOAT_EQ(79.f, bottom[2].y);

    const Polygon& upperLeft = segs[2];
    ASSERT_EQ(5u, upperLeft.size());
    EXPECT_FLOAT_EQ(9.f, upperLeft[1].x);
    EXPECT_FLOAT_EQ(44.f, upperLeft[1].y);
    EXPECT_FLOAT_EQ(14.f, upperLeft[2].x);
    EXPECT_FLOAT_EQ(49.f, upperLeft[2].y);
    EXPECT_FLOAT_EQ(19.f, upperLeft[4].x);
    EXPECT_FLOAT_EQ(19.f, upperLeft[4].y);

    const Polygon& lowerRight = segs[5];
    EXPECT_FLOAT_EQ(57.f, lowerRight[0].x);
    EXPECT_FLOAT_EQ(89.f, lowerRight[0].y);
    EXPECT_FLOAT_EQ(54.f, lowerRight[1].y);
    EXPECT_FLOAT_EQ(52.f, lowerRight[2].x);
    EXPECT_FLOAT_EQ(47.f, lowerRight[4].x);
    EXPECT_FLOAT_EQ(79.f, lowerRight[4].y);

    const Polygon& middle = segs[6];
    ASSERT_EQ(6u, middle.size());
    EXPECT_FLOAT_EQ(14.f, middle[0].x);
    EXPECT_FLOAT_EQ(49.f, middle[0].y);
    EXPECT_FLOAT_EQ(52.f, middle[3].x);
    EXPECT_FLOAT_EQ(54.f, middle[5].y);
}

TEST_F(DigitTest, ColorChanges) {
    digit.changeColor(graphics::parseColor("green"), graphics::parseColor("gray10"));
    EXPECT_EQ(graphics::parseColor("green"), digit.foreground());
    EXPECT_EQ(graphics::parseColor("gray10"), digit.background());

    digit.changeForeground(graphics::Colors::white());
    EXPECT_EQ(graphics::Colors::white(), digit.foreground());
    EXPECT_EQ(graphics::parseColor("gray10"), digit.background());
}

TEST(DigitOptionsTest, LargeDigitHasThickerOutline) {
    DigitOptions options;
    options.size = 350.f;
    Digit digit(options);
    EXPECT_FLOAT_EQ(2.f, digit.outlineWidth());
}

TEST(DigitOptionsTest, InvalidInitialValueShowsEight) {
    DigitOptions options;
    options.value = 42;
    Digit digit(options);
    EXPECT_EQ(8, digit.getValue());
    EXPECT_EQ(0x7F, digit.getMask());
}

TEST(DigitOptionsTest, BlankInitialValue) {
    DigitOptions options;
    options.blank = true;
    Digit digit(options);
    EXPECT_TRUE(digit.isBlank());
}

TEST(DigitOptionsTest, SizeMustBePositive) {
    DigitOptions options;
    options.size = 0.f;
    try {
        Digit digit(options);
        FAIL() << "expected viewidget::Error";
    }
    catch (const Error& e) {
        EXPECT_STREQ("Digit size must be greater than zero", e.what());
    }
}

TEST(DigitOptionsTest, ColorsAreParsed) {
    DigitOptions options;
    options.foreground = "#0f0";
    options.background = "navy";
    Digit digit(options);
    EXPECT_EQ(graphics::Color(0, 0xffff, 0), digit.foreground());
    EXPECT_EQ(graphics::parseColor("navy"), digit.background());

    options.foreground = "sparkly";
    EXPECT_THROW(Digit bad(options), Error);
}
