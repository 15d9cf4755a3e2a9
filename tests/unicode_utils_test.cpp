#include "yomikata/unicode_utils.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace yomikata::unicode;

namespace {

TEST(UnicodeUtilsTest, CharacterSlicing) {
    EXPECT_EQ(char_count("漢字かな"), 4u);
    EXPECT_EQ(split_chars("時々"), (std::vector<std::string>{"時", "々"}));
    EXPECT_EQ(prefix("べんきょう", 2), "べん");
    EXPECT_EQ(suffix("べんきょう", 3), "きょう");
    EXPECT_EQ(substr_from_char("しません", 1), "ません");
    EXPECT_EQ(char_at("漢字", 1), "字");
    EXPECT_EQ(first_char("読む"), "読");
    EXPECT_EQ(last_char("読む"), "む");
    EXPECT_EQ(drop_last("まれた"), "まれ");
}

TEST(UnicodeUtilsTest, CharacterClasses) {
    EXPECT_TRUE(is_kanji_char("漢"));
    EXPECT_FALSE(is_kanji_char("か"));
    EXPECT_TRUE(is_repeater_char("々"));
    EXPECT_TRUE(is_digit_char("7"));
    EXPECT_TRUE(is_digit_char("７"));
    EXPECT_TRUE(is_word_char("々"));
    EXPECT_FALSE(is_word_char("ー"));
    EXPECT_TRUE(is_digit_str("１０"));
    EXPECT_FALSE(is_digit_str("10分"));
}

TEST(UnicodeUtilsTest, KanaClasses) {
    EXPECT_TRUE(is_hiragana_char("ゖ"));
    EXPECT_FALSE(is_hiragana_char("カ"));
    EXPECT_TRUE(is_katakana_char("ヺ"));
    EXPECT_FALSE(is_katakana_char("ー"));
    EXPECT_TRUE(is_kana_str("らーめん"));
    EXPECT_FALSE(is_kana_str("ラーメン屋"));
    EXPECT_TRUE(contains_kana("sound:か"));
    EXPECT_FALSE(contains_kana("ー"));
    EXPECT_TRUE(is_katakana_str("カンジ"));
    EXPECT_FALSE(is_katakana_str("カんじ"));
    EXPECT_FALSE(is_katakana_str("ー"));
}

TEST(UnicodeUtilsTest, KanaConversion) {
    EXPECT_EQ(to_hiragana("カンジー"), "かんじー");
    EXPECT_EQ(to_katakana("きょう"), "キョウ");
    EXPECT_EQ(to_katakana("漢字"), "漢字");
    EXPECT_EQ(to_hiragana(to_katakana("ぢゃっ")), "ぢゃっ");
}

TEST(UnicodeUtilsTest, SanitizeReplacesInvalidBytes) {
    EXPECT_EQ(sanitize_utf8("漢字"), "漢字");
    EXPECT_EQ(sanitize_utf8("a\xff"), "a\xEF\xBF\xBD");
}

} // namespace
