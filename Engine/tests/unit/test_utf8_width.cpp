/**
 * @file test_utf8_width.cpp
 * @brief Unit tests for the lead-byte width table and continuation ranges
 */

#include <gtest/gtest.h>
#include <unicode/utf8_width.hpp>

using namespace Runestream;

static_assert(utf8_width(0x41) == 1, "ASCII is width 1");
static_assert(utf8_width(0xF4) == 4, "F4 leads a 4-byte sequence");
static_assert(utf8_width(0xF5) == 0, "F5 is never a lead byte");

TEST(Utf8WidthTest, FullTable) {
    for (int b = 0; b < 256; ++b) {
        size_t expected = 0;
        if (b <= 0x7F) expected = 1;
        else if (b >= 0xC2 && b <= 0xDF) expected = 2;
        else if (b >= 0xE0 && b <= 0xEF) expected = 3;
        else if (b >= 0xF0 && b <= 0xF4) expected = 4;
        EXPECT_EQ(utf8_width(static_cast<uint8_t>(b)), expected) << "byte " << b;
    }
}

TEST(Utf8WidthTest, Predicates) {
    EXPECT_TRUE(is_width_1(0x00));
    EXPECT_TRUE(is_width_1(0x7F));
    EXPECT_TRUE(is_width_2(0xC2));
    EXPECT_TRUE(is_width_3(0xED));
    EXPECT_TRUE(is_width_4(0xF0));

    EXPECT_TRUE(is_width_0(0x80));
    EXPECT_TRUE(is_width_0(0xBF));
    EXPECT_TRUE(is_width_0(0xC0));
    EXPECT_TRUE(is_width_0(0xC1));
    EXPECT_TRUE(is_width_0(0xFF));
    EXPECT_FALSE(is_width_0(0xC3));
}

TEST(Utf8WidthTest, ContinuationPattern) {
    for (int b = 0; b < 256; ++b) {
        EXPECT_EQ(is_continuation(static_cast<uint8_t>(b)), b >= 0x80 && b <= 0xBF);
    }
}

TEST(Utf8WidthTest, SecondByteRangesDependOnLead) {
    // E0: A0..BF
    EXPECT_FALSE(is_valid_continuation(0xE0, 1, 0x9F));
    EXPECT_TRUE(is_valid_continuation(0xE0, 1, 0xA0));
    // ED: 80..9F
    EXPECT_TRUE(is_valid_continuation(0xED, 1, 0x9F));
    EXPECT_FALSE(is_valid_continuation(0xED, 1, 0xA0));
    // F0: 90..BF
    EXPECT_FALSE(is_valid_continuation(0xF0, 1, 0x8F));
    EXPECT_TRUE(is_valid_continuation(0xF0, 1, 0x90));
    // F4: 80..8F
    EXPECT_TRUE(is_valid_continuation(0xF4, 1, 0x8F));
    EXPECT_FALSE(is_valid_continuation(0xF4, 1, 0x90));
    // Other leads: plain 80..BF
    EXPECT_TRUE(is_valid_continuation(0xE4, 1, 0x80));
    EXPECT_TRUE(is_valid_continuation(0xC3, 1, 0xBF));
    EXPECT_FALSE(is_valid_continuation(0xC3, 1, 0xC0));
}

TEST(Utf8WidthTest, LaterBytesIgnoreLead) {
    EXPECT_TRUE(is_valid_continuation(0xE0, 2, 0x80));
    EXPECT_TRUE(is_valid_continuation(0xF4, 3, 0xBF));
    EXPECT_FALSE(is_valid_continuation(0xF0, 2, 0x7F));
}
