#include "yomikata/exceptions.h"

#include "test_support.h"

#include <gtest/gtest.h>

using namespace yomikata;

namespace {

TEST(ExceptionDictionaryTest, BuiltInEntries) {
    ExceptionDictionary exceptions;
    const ExceptionEntry* entry = exceptions.find_exact("風邪", "かぜ");
    ASSERT_NE(entry, nullptr);
    ASSERT_EQ(entry->parts.size(), 2u);
    EXPECT_EQ(entry->parts[0].mora, "か");
    EXPECT_EQ(entry->parts[1].match_type, MatchType::Jukujikun);

    entry = exceptions.find_exact("蝶々", "ちょうちょ");
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->parts[1].mora, "ちょ");

    EXPECT_EQ(exceptions.find_exact("風邪", "ふうじゃ"), nullptr);
}

TEST(ExceptionDictionaryTest, FindWithinALongerWord) {
    ExceptionDictionary exceptions;
    const ExceptionEntry* entry = exceptions.find_within("風邪薬", "かぜぐすり");
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->word, "風邪");
    EXPECT_EQ(exceptions.find_within("風邪薬", "ふうじゃやく"), nullptr);
    EXPECT_EQ(exceptions.find_within("漢字", "かんじ"), nullptr);
}

TEST(ExceptionDictionaryTest, LoadFromFile) {
    ExceptionDictionary exceptions;
    const std::size_t builtin = exceptions.size();
    ASSERT_TRUE(exceptions.load(test::data_path("exceptions.json")));
    EXPECT_EQ(exceptions.size(), builtin + 2);

    const ExceptionEntry* entry = exceptions.find_exact("明日", "あした");
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->parts[1].mora, "した");
    EXPECT_EQ(entry->parts[1].match_type, MatchType::Jukujikun);
}

TEST(ExceptionDictionaryTest, LoadedEntryReplacesTheSameKey) {
    ExceptionDictionary exceptions;
    const std::size_t builtin = exceptions.size();
    ASSERT_TRUE(exceptions.load_from_string(
        R"({"尻尾_しっぽ": [{"type": "onyomi", "mora": "しっ"}, {"type": "onyomi", "mora": "ぽ"}]})"));
    EXPECT_EQ(exceptions.size(), builtin);
    EXPECT_EQ(exceptions.find_exact("尻尾", "しっぽ")->parts[0].match_type, MatchType::Onyomi);
}

TEST(ExceptionDictionaryTest, RejectsBadInput) {
    ExceptionDictionary exceptions;
    const std::size_t builtin = exceptions.size();
    EXPECT_FALSE(exceptions.load_from_string("{not json"));
    EXPECT_FALSE(exceptions.load_from_string("[1, 2]"));
    EXPECT_FALSE(exceptions.load_from_string(R"({"三日月_みかづき": [{"type": "jukujikun", "mora": "み"}]})"));
    EXPECT_FALSE(exceptions.load_from_string(R"({"nokey": []})"));
    EXPECT_FALSE(exceptions.load("/nonexistent/exceptions.json"));
    EXPECT_EQ(exceptions.size(), builtin);
}

TEST(ExceptionDictionaryTest, AddChecksThePartCount) {
    ExceptionDictionary exceptions;
    ExceptionEntry entry;
    entry.word = "紅葉";
    entry.furigana = "もみじ";
    entry.parts = {{MatchType::Jukujikun, "もみじ"}};
    EXPECT_FALSE(exceptions.add(entry));
    entry.parts = {{MatchType::Jukujikun, "もみ"}, {MatchType::Jukujikun, "じ"}};
    EXPECT_TRUE(exceptions.add(entry));
    EXPECT_NE(exceptions.find_exact("紅葉", "もみじ"), nullptr);
}

TEST(ExceptionDictionaryTest, AlignmentFromExceptionIsComplete) {
    ExceptionDictionary exceptions;
    MoraAlignment alignment = alignment_from_exception(*exceptions.find_exact("真面目", "まじめ"));
    EXPECT_TRUE(alignment.is_complete);
    ASSERT_EQ(alignment.per_kanji.size(), 3u);
    EXPECT_EQ(match_of(alignment.per_kanji[1])->kanji, "面");
    EXPECT_EQ(match_of(alignment.per_kanji[2])->match_type, MatchType::Kunyomi);
    EXPECT_EQ(alignment.full_reading(), "まじめ");
}

} // namespace
