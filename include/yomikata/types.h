#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace yomikata {

enum class MatchType {
    Onyomi,
    Kunyomi,
    Jukujikun
};

enum class ReadingVariant {
    Plain,
    Rendaku,
    SmallTsu,
    RendakuSmallTsu,
    VowelChange,
    NChange,
    UDropped
};

// Reading class of a rendered span; Mixed covers numeral runs mixing classes
enum class ReadingClass {
    On,
    Kun,
    Juku,
    Mixed
};

enum class RenderMode {
    Furigana,
    Furikanji,
    KanaOnly
};

struct ReadingMatchInfo {
    std::string matched_mora;
    std::string dict_form;       // dictionary reading, kunyomi keeps its "." marker
    MatchType match_type = MatchType::Onyomi;
    ReadingVariant variant = ReadingVariant::Plain;
    std::string kanji;
    std::string okurigana;
    std::string rest_kana;
};

struct Unmatched {};

// One kanji position of an alignment
using PositionResult = std::variant<Unmatched, ReadingMatchInfo>;

inline bool is_matched(const PositionResult& position) {
    return std::holds_alternative<ReadingMatchInfo>(position);
}

inline const ReadingMatchInfo* match_of(const PositionResult& position) {
    return std::get_if<ReadingMatchInfo>(&position);
}

struct MoraAlignment {
    std::vector<PositionResult> per_kanji;
    std::vector<std::vector<std::string>> mora_partition;
    std::vector<int> unmatched_positions;
    bool is_complete = false;
    std::string trailing_okurigana;
    std::string trailing_rest;
    bool verb_like = false;

    // Returns a copy with one position filled in and the unmatched set kept consistent
    MoraAlignment with_position(int index, const ReadingMatchInfo& match) const;
    // Returns a copy with one position marked unmatched
    MoraAlignment without_position(int index) const;
    // Returns a copy with the trailing okurigana and rest replaced
    MoraAlignment with_trailing(const std::string& okurigana, const std::string& rest, bool verb_like) const;

    std::string joined_mora(int index) const;
    std::string full_reading() const;
};

struct WordToken {
    std::string word;
    std::string reading;
    std::string trailing_kana;
    std::optional<std::string> kanji_to_highlight;
};

struct RenderEntry {
    std::string surface_kanji;
    std::string furigana;
    ReadingClass reading_class = ReadingClass::On;
    bool is_numeral = false;
    bool is_highlighted = false;
};

struct WithTagsDef {
    bool with_tags = true;
    bool merge_consecutive = true;
    bool onyomi_to_katakana = true;
    bool include_suru_okuri = false;
};

enum class OkuriKind {
    None,      // no okurigana in the trailing kana
    Full,      // complete inflected form
    Empty,     // the bare stem is a valid form, nothing follows it
    Detected   // found by the morphological analyzer
};

struct OkuriResult {
    std::string okurigana;
    std::string rest;
    OkuriKind kind = OkuriKind::None;
    bool verb_like = false;
};

struct ExceptionPart {
    MatchType match_type = MatchType::Jukujikun;
    std::string mora;
};

const char* to_string(MatchType type);
const char* to_string(ReadingVariant variant);
const char* to_string(ReadingClass reading_class);
const char* to_string(RenderMode mode);
ReadingClass reading_class_of(MatchType type);

} // namespace yomikata
