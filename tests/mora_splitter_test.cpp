#include "yomikata/mora_splitter.h"
#include "yomikata/partitions.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace yomikata;

namespace {

using Mora = std::vector<std::string>;

TEST(MoraSplitterTest, PalatalizedMoraStayTogether) {
    EXPECT_EQ(split_mora("きょう", 1).mora, (Mora{"きょ", "う"}));
    EXPECT_EQ(split_mora("しちょうしゃ", 3).mora, (Mora{"し", "ちょ", "う", "しゃ"}));
}

TEST(MoraSplitterTest, SmallTsuJoinsThePrecedingMora) {
    EXPECT_EQ(split_mora("かっこう", 2).mora, (Mora{"かっ", "こ", "う"}));
    EXPECT_EQ(split_mora("じゅっぷん", 2).mora, (Mora{"じゅっ", "ぷん"}));
}

TEST(MoraSplitterTest, FoldsNOnlyWhenThereAreMoreMoraThanKanji) {
    EXPECT_EQ(split_mora("かんじ", 2).mora, (Mora{"かん", "じ"}));
    EXPECT_EQ(split_mora("ほん", 2).mora, (Mora{"ほ", "ん"}));
    EXPECT_EQ(split_mora("いっけん", 2).mora, (Mora{"いっ", "けん"}));
}

TEST(MoraSplitterTest, KatakanaIsNormalizedToHiragana) {
    MoraSplit split = split_mora("カンジ", 2);
    EXPECT_TRUE(split.was_katakana);
    EXPECT_EQ(split.mora, (Mora{"かん", "じ"}));
    EXPECT_FALSE(split_mora("かんじ", 2).was_katakana);
}

TEST(MoraSplitterTest, LongVowelMarkExpandsWhenMoraAreShort) {
    EXPECT_EQ(split_mora("らー", 1).mora, (Mora{"らー"}));
    EXPECT_EQ(split_mora("らー", 2).mora, (Mora{"ら", "あ"}));
}

TEST(MoraSplitterTest, JoiningGivesBackTheReading) {
    for (const std::string reading : {"べんきょう", "ときどき", "ひゃくにじゅうさん", "かぜぐすり", "ちゃっかり"}) {
        EXPECT_EQ(join_mora(split_mora(reading, 2).mora), reading);
    }
    EXPECT_TRUE(split_mora("", 1).mora.empty());
}

TEST(PartitionGeneratorTest, LeftmostCutsComeFirst) {
    PartitionGenerator generator({"a", "b", "c", "d"}, 2);
    std::vector<std::vector<std::string>> partition;

    ASSERT_TRUE(generator.next(partition));
    EXPECT_EQ(partition, (std::vector<Mora>{{"a"}, {"b", "c", "d"}}));
    ASSERT_TRUE(generator.next(partition));
    EXPECT_EQ(partition, (std::vector<Mora>{{"a", "b"}, {"c", "d"}}));
    ASSERT_TRUE(generator.next(partition));
    EXPECT_EQ(partition, (std::vector<Mora>{{"a", "b", "c"}, {"d"}}));
    EXPECT_FALSE(generator.next(partition));
    EXPECT_EQ(generator.produced(), 3u);
}

TEST(PartitionGeneratorTest, CountsMatchBinomialCoefficients) {
    PartitionGenerator generator({"1", "2", "3", "4", "5", "6"}, 4);
    std::vector<std::vector<std::string>> partition;
    while (generator.next(partition)) {
        ASSERT_EQ(partition.size(), 4u);
        for (const auto& group : partition) {
            EXPECT_FALSE(group.empty());
        }
    }
    // C(5, 3)
    EXPECT_EQ(generator.produced(), 10u);
}

TEST(PartitionGeneratorTest, DegenerateGroupCounts) {
    std::vector<std::vector<std::string>> partition;

    PartitionGenerator single({"a", "b"}, 1);
    ASSERT_TRUE(single.next(partition));
    EXPECT_EQ(partition, (std::vector<Mora>{{"a", "b"}}));
    EXPECT_FALSE(single.next(partition));

    PartitionGenerator too_many({"a"}, 2);
    EXPECT_FALSE(too_many.next(partition));

    PartitionGenerator none({"a"}, 0);
    EXPECT_FALSE(none.next(partition));
}

} // namespace
