#include "yomikata/settings.h"

#include "test_support.h"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace yomikata;

namespace {

EngineSettings parse(std::vector<std::string> args) {
    args.insert(args.begin(), "yomikata");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(&arg[0]);
    }
    return parse_arguments(static_cast<int>(argv.size()), argv.data());
}

TEST(ParseArgumentsTest, KeyValueAndFlags) {
    EngineSettings settings = parse({"--kanji=dict.json", "--mode=furikanji", "--verbose", "stray", "--with-tags"});
    EXPECT_EQ(settings.kanji_file, "dict.json");
    EXPECT_EQ(settings.mode, "furikanji");
    EXPECT_TRUE(settings.verbose);
    EXPECT_FALSE(settings.debug);
    EXPECT_TRUE(settings.get_bool("with-tags", false));
    EXPECT_EQ(settings.options.count("stray"), 0u);
}

TEST(ParseArgumentsTest, MecabArguments) {
    EngineSettings settings = parse({"--mecab"});
    EXPECT_TRUE(settings.use_mecab);
    EXPECT_EQ(settings.mecab_args, "");

    settings = parse({"--mecab=-d /x"});
    EXPECT_TRUE(settings.use_mecab);
    EXPECT_EQ(settings.mecab_args, "-d /x");

    EXPECT_FALSE(parse({}).use_mecab);
}

TEST(ParseArgumentsTest, RejectsInvalidUtf8) {
    EXPECT_THROW(parse({"--highlight=\xff"}), std::invalid_argument);
}

TEST(EngineSettingsTest, TypedGetters) {
    EngineSettings settings = parse({"--max-partitions=42", "--merge=yes", "--katakana=0"});
    EXPECT_EQ(settings.get_int("max-partitions", 7), 42);
    EXPECT_EQ(settings.get_int("missing", 7), 7);
    EXPECT_TRUE(settings.get_bool("merge", false));
    EXPECT_FALSE(settings.get_bool("katakana", true));
    EXPECT_TRUE(settings.get_bool("missing", true));
    EXPECT_EQ(settings.get("missing", "x"), "x");
}

TEST(EngineSettingsTest, NonNumericIntegerThrows) {
    EngineSettings settings = parse({"--max-partitions=many", "--limit=12x", "--empty="});
    EXPECT_THROW(settings.get_int("max-partitions", 0), std::invalid_argument);
    EXPECT_THROW(settings.get_int("limit", 0), std::invalid_argument);
    EXPECT_THROW(settings.get_int("empty", 0), std::invalid_argument);
}

TEST(LoadSettingsTest, NamedParameterSet) {
    EngineSettings base = parse({"--settings=" + test::data_path("settings.xml"), "--pid=anki"});
    EngineSettings settings = load_settings(base);
    EXPECT_EQ(settings.mode, "kana_only");
    EXPECT_EQ(settings.highlight, "読");
    EXPECT_TRUE(settings.get_bool("with-tags", false));
    // Inherited from the root element, next to the settings file
    EXPECT_EQ(settings.kanji_file, test::data_path("kanji_readings.json"));
    EXPECT_EQ(settings.get_int("max-partitions", 0), 500);
}

TEST(LoadSettingsTest, CommandLineWins) {
    EngineSettings base =
        parse({"--settings=" + test::data_path("settings.xml"), "--pid=anki", "--mode=furikanji"});
    EXPECT_EQ(load_settings(base).mode, "furikanji");

    // A path from the command line is taken as it is
    base = parse({"--settings=" + test::data_path("settings.xml"), "--kanji=my_kanji.json"});
    EXPECT_EQ(load_settings(base).kanji_file, "my_kanji.json");
}

TEST(LoadSettingsTest, FirstItemWithoutPid) {
    EngineSettings settings = load_settings(parse({"--settings=" + test::data_path("settings.xml")}));
    EXPECT_EQ(settings.pid, "anki");
}

TEST(LoadSettingsTest, RootValuesFillTheGaps) {
    EngineSettings settings =
        load_settings(parse({"--settings=" + test::data_path("settings.xml"), "--pid=plain"}));
    EXPECT_EQ(settings.mode, "furigana");
    EXPECT_TRUE(settings.get_bool("katakana", false));
}

TEST(LoadSettingsTest, Failures) {
    EXPECT_THROW(load_settings(EngineSettings()), std::runtime_error);
    EXPECT_THROW(load_settings(parse({"--settings=/nonexistent/settings.xml"})), std::runtime_error);
    EXPECT_THROW(load_settings(parse({"--settings=" + test::data_path("settings.xml"), "--pid=missing"})),
                 std::runtime_error);
    // Parameter sets are only read from a <yomikata> root
    EXPECT_THROW(load_settings(parse({"--settings=" + test::data_path("other_root.xml")})), std::runtime_error);
}

TEST(RenderModeTest, FromString) {
    EXPECT_EQ(render_mode_from_string(""), RenderMode::Furigana);
    EXPECT_EQ(render_mode_from_string("furigana"), RenderMode::Furigana);
    EXPECT_EQ(render_mode_from_string("furikanji"), RenderMode::Furikanji);
    EXPECT_EQ(render_mode_from_string("kana_only"), RenderMode::KanaOnly);
    EXPECT_THROW(render_mode_from_string("romaji"), std::invalid_argument);
}

TEST(WithTagsTest, FromSettings) {
    WithTagsDef tags = with_tags_from_settings(parse({"--with-tags", "--merge=1", "--suru-okuri=true"}));
    EXPECT_TRUE(tags.with_tags);
    EXPECT_TRUE(tags.merge_consecutive);
    EXPECT_FALSE(tags.onyomi_to_katakana);
    EXPECT_TRUE(tags.include_suru_okuri);

    tags = with_tags_from_settings(EngineSettings());
    EXPECT_FALSE(tags.with_tags);
}

} // namespace
