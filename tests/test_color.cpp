#include <gtest/gtest.h>
#include "color.hpp"
#include "vec2.hpp"

using namespace pixstitch;

TEST(ColorTest, MakeAndSplitChannels) {
    ColorKey c = make_color(0x12, 0x34, 0x56);
    EXPECT_EQ(c, 0x123456u);
    EXPECT_EQ(red(c), 0x12);
    EXPECT_EQ(green(c), 0x34);
    EXPECT_EQ(blue(c), 0x56);
    EXPECT_NE(make_color(255, 255, 255), EMPTY_COLOR);
}

TEST(ColorTest, HexRoundTrip) {
    EXPECT_EQ(to_hex(make_color(255, 0, 0)), "#ff0000");
    EXPECT_EQ(to_hex(make_color(0, 10, 171)), "#000aab");
    EXPECT_EQ(from_hex("#FF0000"), make_color(255, 0, 0));
    EXPECT_EQ(from_hex("00ff00"), make_color(0, 255, 0));
}

TEST(ColorTest, InvalidHexThrows) {
    EXPECT_THROW(from_hex("#ff00"), std::invalid_argument);
    EXPECT_THROW(from_hex("#gg0000"), std::invalid_argument);
    EXPECT_THROW(from_hex(""), std::invalid_argument);
}

TEST(ColorTest, LabOfWhiteAndBlack) {
    Lab white = srgb_to_lab(make_color(255, 255, 255));
    EXPECT_NEAR(white.l, 100.0, 0.01);
    EXPECT_NEAR(white.a, 0.0, 0.05);
    EXPECT_NEAR(white.b, 0.0, 0.05);

    Lab black = srgb_to_lab(make_color(0, 0, 0));
    EXPECT_NEAR(black.l, 0.0, 1e-9);
}

TEST(ColorTest, DeltaE2000ReferencePair) {
    // First pair of the Sharma, Wu & Dalal CIEDE2000 test data
    Lab a{50.0, 2.6772, -79.7751};
    Lab b{50.0, 0.0, -82.7485};
    EXPECT_NEAR(delta_e_2000(a, b), 2.0425, 1e-4);
}

TEST(ColorTest, DeltaE2000HueWrap) {
    // Pair 17 of the same data set, hue angles on both sides of 0 degrees
    Lab a{50.0, 2.5, 0.0};
    Lab b{73.0, 25.0, -18.0};
    EXPECT_NEAR(delta_e_2000(a, b), 27.1492, 1e-4);
}

TEST(ColorTest, DeltaE2000IsSymmetricAndZeroForEqual) {
    ColorKey c1 = make_color(200, 30, 40);
    ColorKey c2 = make_color(20, 130, 240);
    EXPECT_DOUBLE_EQ(delta_e_2000(c1, c1), 0.0);
    EXPECT_NEAR(delta_e_2000(c1, c2), delta_e_2000(c2, c1), 1e-9);
    EXPECT_GT(delta_e_2000(c1, c2), 10.0);
}

TEST(Vec2Test, RotatedBounds) {
    Vec2 same = rotated_bounds(10.0, 4.0, 0.0);
    EXPECT_NEAR(same.x, 10.0, 1e-9);
    EXPECT_NEAR(same.y, 4.0, 1e-9);

    Vec2 quarter = rotated_bounds(10.0, 4.0, 90.0);
    EXPECT_NEAR(quarter.x, 4.0, 1e-9);
    EXPECT_NEAR(quarter.y, 10.0, 1e-9);

    Vec2 diagonal = rotated_bounds(10.0, 10.0, 45.0);
    EXPECT_NEAR(diagonal.x, 10.0 * std::sqrt(2.0), 1e-9);
}
