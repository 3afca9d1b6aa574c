#include <spanned-html-cpp/color.hpp>

#include <gtest/gtest.h>

#include <cstdint>

using namespace spanned_html_cpp;

TEST(Color, argb_packs_alpha_into_top_byte) {
    EXPECT_EQ(argb(0x00, 0x12, 0x34, 0x56), 0x00123456);
    EXPECT_EQ(argb(0x7F, 0x00, 0x00, 0x00), 0x7F000000);
}

TEST(Color, opaque_colors_are_negative) {
    EXPECT_EQ(argb(0xFF, 0x00, 0xFF, 0x00), -16711936);
    EXPECT_EQ(rgb(0, 255, 0), -16711936);
    EXPECT_EQ(rgb(255, 255, 255), -1);
}

TEST(Color, component_accessors) {
    constexpr auto c = argb(0x80, 0x11, 0x22, 0x33);
    static_assert(alpha(c) == 0x80);

    EXPECT_EQ(alpha(c), 0x80);
    EXPECT_EQ(red(c), 0x11);
    EXPECT_EQ(green(c), 0x22);
    EXPECT_EQ(blue(c), 0x33);
}

TEST(Color, accessors_are_unsigned_for_opaque_colors) {
    const auto c = rgb(200, 150, 100);
    EXPECT_EQ(alpha(c), 255);
    EXPECT_EQ(red(c), 200);
    EXPECT_EQ(green(c), 150);
    EXPECT_EQ(blue(c), 100);
}
