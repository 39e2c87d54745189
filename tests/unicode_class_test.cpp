#include <gtest/gtest.h>

#include "dat/UnicodeClass.hpp"

using namespace dat;

TEST(UnicodeClass, WordCharacters) {
    EXPECT_TRUE(is_word_char('a'));
    EXPECT_TRUE(is_word_char('Z'));
    EXPECT_TRUE(is_word_char('7'));
    EXPECT_TRUE(is_word_char('_'));
    EXPECT_TRUE(is_word_char(0x3042));  // hiragana a
    EXPECT_TRUE(is_word_char(0x6F22));  // kanji
    EXPECT_TRUE(is_word_char(0x0661));  // Arabic-Indic one
    EXPECT_TRUE(is_word_char(0x3005));  // iteration mark
}

TEST(UnicodeClass, NonWordCharacters) {
    EXPECT_FALSE(is_word_char(' '));
    EXPECT_FALSE(is_word_char('-'));
    EXPECT_FALSE(is_word_char(0x00A0));  // no-break space
    EXPECT_FALSE(is_word_char(0x3000));  // ideographic space
    EXPECT_FALSE(is_word_char(0x300C));  // left corner bracket
    EXPECT_FALSE(is_word_char(0xFF01));  // full-width '!'
    EXPECT_FALSE(is_word_char(0xFFFD));
}

TEST(UnicodeClass, DecimalDigits) {
    EXPECT_EQ(decimal_digit_value('0'), 0);
    EXPECT_EQ(decimal_digit_value('9'), 9);
    EXPECT_EQ(decimal_digit_value(0xFF11), 1);  // full-width 1
    EXPECT_EQ(decimal_digit_value(0x0662), 2);  // Arabic-Indic 2
    EXPECT_EQ(decimal_digit_value(0x0967), 1);  // Devanagari 1
    EXPECT_EQ(decimal_digit_value('a'), -1);
    EXPECT_EQ(decimal_digit_value(0x2460), -1);  // circled 1 is not Nd
    EXPECT_EQ(decimal_digit_value(0x4E00), -1);  // kanji one
}
