#include "yomikata/engine.h"

#include "test_support.h"

#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace yomikata;

namespace {

WithTagsDef tags(bool with_tags, bool merge) {
    WithTagsDef out;
    out.with_tags = with_tags;
    out.merge_consecutive = merge;
    out.onyomi_to_katakana = true;
    out.include_suru_okuri = false;
    return out;
}

class EngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto exceptions = std::make_shared<ExceptionDictionary>();
        if (!exceptions->load(test::data_path("exceptions.json"))) {
            throw std::runtime_error("Cannot load test exceptions");
        }
        engine_ = std::make_unique<FuriganaEngine>(test::load_test_dictionary(), exceptions);
    }

    std::string render(const std::string& text, const std::optional<std::string>& kanji,
                       RenderMode mode = RenderMode::Furigana, bool with_tags = true, bool merge = true) const {
        return engine_->highlight_text(text, kanji, mode, tags(with_tags, merge));
    }

    std::unique_ptr<FuriganaEngine> engine_;
};

TEST(ExpandNumeralsTest, DigitRunsBecomeKanjiPositions) {
    ExpandedWord expanded = expand_numerals("10分");
    EXPECT_EQ(expanded.kanji, (std::vector<std::string>{"十", "分"}));
    EXPECT_EQ(expanded.numeral, (std::vector<bool>{true, false}));
    ASSERT_EQ(expanded.units.size(), 2u);
    EXPECT_EQ(expanded.units[0].surface, "10");
    EXPECT_TRUE(expanded.units[0].numeral);
    EXPECT_EQ(expanded.units[1].first, 1u);

    expanded = expand_numerals("123");
    EXPECT_EQ(expanded.kanji, (std::vector<std::string>{"百", "二", "十", "三"}));
    ASSERT_EQ(expanded.units.size(), 1u);
    EXPECT_EQ(expanded.units[0].count, 4u);

    expanded = expand_numerals("漢字");
    EXPECT_EQ(expanded.kanji.size(), 2u);
    EXPECT_FALSE(expanded.numeral[0]);
}

TEST(IsWholeWordTest, KanjiAloneOrRepeated) {
    WordToken token;
    token.word = "時々";
    EXPECT_TRUE(is_whole_word(token));

    token.word = "時";
    EXPECT_FALSE(is_whole_word(token));
    token.kanji_to_highlight = "時";
    EXPECT_TRUE(is_whole_word(token));

    token.word = "人人";
    token.kanji_to_highlight = "人";
    EXPECT_TRUE(is_whole_word(token));

    token.word = "漢字";
    token.kanji_to_highlight = "漢";
    EXPECT_FALSE(is_whole_word(token));
}

TEST(EngineConstructionTest, NeedsADictionary) {
    EXPECT_THROW(FuriganaEngine(nullptr), std::invalid_argument);
}

TEST(EngineConstructionTest, TokenPatternFindsEveryToken) {
    std::unique_ptr<FuriganaEngine> engine;
    ASSERT_NO_THROW(engine = std::make_unique<FuriganaEngine>(test::load_test_dictionary()));
    EXPECT_EQ(engine->highlight_text("漢字[かんじ]と字[じ]", std::nullopt, RenderMode::Furigana, tags(true, true)),
              "<on> 漢字[カンジ]</on>と<on> 字[ジ]</on>");
}

TEST_F(EngineTest, SentenceWithoutHighlight) {
    const std::string text = "漢字[かんじ]の読[よ]み方[かた]を学[まな]ぶ。";
    EXPECT_EQ(render(text, std::nullopt),
              "<on> 漢字[カンジ]</on>の<kun> 読[よ]</kun><oku>み</oku><kun> 方[かた]</kun>を<kun> 学[まな]</kun>"
              "<oku>ぶ</oku>。");
    EXPECT_EQ(render(text, std::nullopt, RenderMode::Furigana, true, false),
              "<on> 漢[カン]</on><on> 字[ジ]</on>の<kun> 読[よ]</kun><oku>み</oku><kun> 方[かた]</kun>を"
              "<kun> 学[まな]</kun><oku>ぶ</oku>。");
    EXPECT_EQ(render(text, std::nullopt, RenderMode::Furigana, false), " 漢字[カンジ]の 読[よ]み 方[かた]を 学[まな]ぶ。");
    EXPECT_EQ(render(text, std::nullopt, RenderMode::Furikanji, false),
              " カンジ[漢字]の よ[読]み かた[方]を まな[学]ぶ。");
    EXPECT_EQ(render(text, std::nullopt, RenderMode::KanaOnly, false), "カンジのよみかたをまなぶ。");
}

TEST_F(EngineTest, RepeatedOnyomi) {
    const std::string text = "悠々[ゆうゆう]とした時間[じかん]。";
    EXPECT_EQ(render(text, "悠", RenderMode::Furigana, true, false),
              "<b><on> 悠々[ユウユウ]</on></b>とした<on> 時[ジ]</on><on> 間[カン]</on>。");
    EXPECT_EQ(render(text, "悠"), "<b><on> 悠々[ユウユウ]</on></b>とした<on> 時間[ジカン]</on>。");
    EXPECT_EQ(render(text, "悠", RenderMode::KanaOnly, true, false),
              "<b><on>ユウユウ</on></b>とした<on>ジ</on><on>カン</on>。");
}

TEST_F(EngineTest, HighlightInsideACompound) {
    EXPECT_EQ(render("行儀[ぎょうぎ]", "儀"), "<on> 行[ギョウ]</on><b><on> 儀[ギ]</on></b>");

    EXPECT_EQ(render("視聴者[しちょうしゃ]", "視", RenderMode::Furigana, true, false),
              "<b><on> 視[シ]</on></b><on> 聴[チョウ]</on><on> 者[シャ]</on>");
    EXPECT_EQ(render("視聴者[しちょうしゃ]", "視"), "<b><on> 視[シ]</on></b><on> 聴者[チョウシャ]</on>");
    EXPECT_EQ(render("視聴者[しちょうしゃ]", "視", RenderMode::KanaOnly, false), "<b>シ</b>チョウシャ");
}

TEST_F(EngineTest, KunyomiWithOkurigana) {
    EXPECT_EQ(render("嗜[たしな]まれたことは？", "嗜"), "<b><kun> 嗜[たしな]</kun><oku>まれた</oku></b>ことは？");
}

TEST_F(EngineTest, CompoundReadingAndSpacedToken) {
    const std::string text = "大人[おとな]は 大[おお]きいですね";
    EXPECT_EQ(render(text, "大"),
              "<b><juk> 大[おと]</juk></b><juk> 人[な]</juk>は<b><kun> 大[おお]</kun><oku>きい</oku></b>ですね");
    EXPECT_EQ(render(text, "大", RenderMode::KanaOnly),
              "<b><juk>おと</juk></b><juk>な</juk>は <b><kun>おお</kun><oku>きい</oku></b>ですね");
}

TEST_F(EngineTest, KanaOnlyKeepsTheLeadingSpace) {
    const std::string text = "これは 漢字[かんじ]です";
    EXPECT_EQ(render(text, std::nullopt, RenderMode::KanaOnly, false), "これは カンジです");
    EXPECT_EQ(render(text, std::nullopt, RenderMode::KanaOnly), "これは <on>カンジ</on>です");
    // The furigana modes put their own space before the kanji
    EXPECT_EQ(render(text, std::nullopt, RenderMode::Furigana, false), "これは 漢字[カンジ]です");
    EXPECT_EQ(render(text, std::nullopt, RenderMode::Furikanji, false), "これは カンジ[漢字]です");
    EXPECT_EQ(render("漢字[かんじ]です", std::nullopt, RenderMode::KanaOnly, false), "カンジです");
}

TEST_F(EngineTest, SoundChanges) {
    EXPECT_EQ(render("一見[いっけん]", "一"), "<b><on> 一[イッ]</on></b><on> 見[ケン]</on>");
    EXPECT_EQ(render("時々[ときどき]", "時"), "<b><kun> 時々[ときどき]</kun></b>");
}

TEST_F(EngineTest, ExceptionWords) {
    EXPECT_EQ(render("尻尾[しっぽ]", "尻"), "<b><kun> 尻[しっ]</kun></b><kun> 尾[ぽ]</kun>");
    EXPECT_EQ(render("風邪[かぜ]", "風"), "<b><juk> 風[か]</juk></b><juk> 邪[ぜ]</juk>");
    EXPECT_EQ(render("今日[きょう]は", std::nullopt), "<juk> 今日[きょう]</juk>は");
}

TEST_F(EngineTest, ExceptionInsideALongerWord) {
    const std::string text = "風邪薬[かぜぐすり]を買[か]った";
    EXPECT_EQ(render(text, "買"),
              "<juk> 風邪[かぜ]</juk><kun> 薬[ぐすり]</kun>を<b><kun> 買[か]</kun><oku>った</oku></b>");
    EXPECT_EQ(render(text, "買", RenderMode::Furigana, true, false),
              "<juk> 風[か]</juk><juk> 邪[ぜ]</juk><kun> 薬[ぐすり]</kun>を<b><kun> 買[か]</kun><oku>った</oku></b>");
}

TEST_F(EngineTest, RepeatedExceptionWord) {
    EXPECT_EQ(render("風邪風邪[かぜかぜ]", std::nullopt, RenderMode::Furigana, true, false),
              "<juk> 風[か]</juk><juk> 邪[ぜ]</juk><juk> 風[か]</juk><juk> 邪[ぜ]</juk>");
    EXPECT_EQ(render("風邪風邪[かぜかぜ]", std::nullopt), "<juk> 風邪風邪[かぜかぜ]</juk>");
}

TEST_F(EngineTest, SuruVerbOkuriganaStaysOutside) {
    const std::string text = "勉強[べんきょう]しません";
    EXPECT_EQ(render(text, "強"), "<on> 勉[ベン]</on><b><on> 強[キョウ]</on></b><oku>しません</oku>");
    EXPECT_EQ(render(text, "強", RenderMode::Furigana, false), " 勉[ベン]<b> 強[キョウ]</b>しません");
}

TEST_F(EngineTest, Numbers) {
    EXPECT_EQ(render("10分[じゅっぷん]", "分"), "<on> 10[ジュッ]</on><b><on> 分[プン]</on></b>");
    EXPECT_EQ(render("123[ひゃくにじゅうさん]", std::nullopt), "<mix> 123[ヒャクニジュウサン]</mix>");

    WordToken digits;
    digits.word = "１０分";
    digits.reading = "じゅっぷん";
    WordToken kanji = digits;
    kanji.word = "十分";
    MoraAlignment from_digits = engine_->align(digits);
    MoraAlignment from_kanji = engine_->align(kanji);
    ASSERT_TRUE(from_digits.is_complete);
    ASSERT_TRUE(from_kanji.is_complete);
    EXPECT_EQ(match_of(from_digits.per_kanji[0])->matched_mora, "じゅっ");
    EXPECT_EQ(match_of(from_digits.per_kanji[1])->matched_mora, "ぷん");
    EXPECT_EQ(match_of(from_kanji.per_kanji[0])->matched_mora, "じゅっ");
}

TEST_F(EngineTest, RealigningTheJoinedReadingGivesTheSameSplit) {
    for (const auto& [word, reading] : std::vector<std::pair<std::string, std::string>>{
             {"視聴者", "しちょうしゃ"}, {"大人", "おとな"}, {"風邪薬", "かぜぐすり"}, {"時々", "ときどき"}}) {
        WordToken token;
        token.word = word;
        token.reading = reading;
        MoraAlignment first = engine_->align(token);
        token.reading = first.full_reading();
        MoraAlignment second = engine_->align(token);
        ASSERT_EQ(first.per_kanji.size(), second.per_kanji.size()) << word;
        for (std::size_t i = 0; i < first.per_kanji.size(); ++i) {
            EXPECT_EQ(first.joined_mora(static_cast<int>(i)), second.joined_mora(static_cast<int>(i))) << word;
        }
        EXPECT_EQ(token.reading, reading);
    }
}

TEST_F(EngineTest, ReadingsWithoutKanaAreErrors) {
    EXPECT_EQ(render("漢字[]", std::nullopt), "<err> 漢字[？]</err>");
    EXPECT_EQ(render("漢字[]", std::nullopt, RenderMode::KanaOnly), "<err>？</err>");
    EXPECT_EQ(render("漢字[abc]", std::nullopt), "<err> 漢字[abc]</err>");
}

TEST_F(EngineTest, OtherTextIsCopied) {
    EXPECT_EQ(render("音[sound:x.mp3]", std::nullopt), "音[sound:x.mp3]");
    EXPECT_EQ(render("これは 漢字[かんじ]です", std::nullopt), "これは<on> 漢字[カンジ]</on>です");
    EXPECT_EQ(render("ただのテキスト", "漢"), "ただのテキスト");
    EXPECT_EQ(render("", std::nullopt), "");
}

TEST(EngineAnalyzerTest, AnalyzerFailureKeepsTheRestOfTheText) {
    auto analyzer = std::make_shared<test::FailingAnalyzer>();
    FuriganaEngine engine(test::load_test_dictionary(), std::make_shared<ExceptionDictionary>(), analyzer);
    std::string out;
    EXPECT_NO_THROW(out = engine.highlight_text("時間[じかん]さえ。読[よ]みかた", std::nullopt, RenderMode::Furigana,
                                                tags(true, true)));
    EXPECT_EQ(out.find("<on> 時間[ジカン]</on>"), 0u);
    EXPECT_NE(out.find("読[よ]"), std::string::npos);
    EXPECT_NE(out.find("かた"), std::string::npos);
}

TEST_F(EngineTest, KatakanaReadingStaysKatakana) {
    WithTagsDef hiragana_onyomi = tags(true, true);
    hiragana_onyomi.onyomi_to_katakana = false;
    EXPECT_EQ(engine_->highlight_text("漢字[かんじ]", std::nullopt, RenderMode::Furigana, hiragana_onyomi),
              "<on> 漢字[かんじ]</on>");
    EXPECT_EQ(engine_->highlight_text("漢字[カンジ]", std::nullopt, RenderMode::Furigana, hiragana_onyomi),
              "<on> 漢字[カンジ]</on>");
}

} // namespace
