#include "yomikata/types.h"

#include <algorithm>

namespace yomikata {

MoraAlignment MoraAlignment::with_position(int index, const ReadingMatchInfo& match) const {
    MoraAlignment copy = *this;
    if (index < 0 || index >= static_cast<int>(copy.per_kanji.size())) {
        return copy;
    }
    copy.per_kanji[index] = match;
    copy.unmatched_positions.erase(
        std::remove(copy.unmatched_positions.begin(), copy.unmatched_positions.end(), index),
        copy.unmatched_positions.end());
    copy.is_complete = copy.unmatched_positions.empty();
    return copy;
}

MoraAlignment MoraAlignment::without_position(int index) const {
    MoraAlignment copy = *this;
    if (index < 0 || index >= static_cast<int>(copy.per_kanji.size())) {
        return copy;
    }
    copy.per_kanji[index] = Unmatched{};
    if (std::find(copy.unmatched_positions.begin(), copy.unmatched_positions.end(), index) ==
        copy.unmatched_positions.end()) {
        copy.unmatched_positions.push_back(index);
        std::sort(copy.unmatched_positions.begin(), copy.unmatched_positions.end());
    }
    copy.is_complete = false;
    return copy;
}

MoraAlignment MoraAlignment::with_trailing(const std::string& okurigana, const std::string& rest,
                                           bool verb_like) const {
    MoraAlignment copy = *this;
    copy.trailing_okurigana = okurigana;
    copy.trailing_rest = rest;
    copy.verb_like = verb_like;
    return copy;
}

std::string MoraAlignment::joined_mora(int index) const {
    std::string joined;
    if (index < 0 || index >= static_cast<int>(mora_partition.size())) {
        return joined;
    }
    for (const auto& mora : mora_partition[index]) {
        joined += mora;
    }
    return joined;
}

std::string MoraAlignment::full_reading() const {
    std::string joined;
    for (const auto& group : mora_partition) {
        for (const auto& mora : group) {
            joined += mora;
        }
    }
    return joined;
}

const char* to_string(MatchType type) {
    switch (type) {
        case MatchType::Onyomi: return "onyomi";
        case MatchType::Kunyomi: return "kunyomi";
        case MatchType::Jukujikun: return "jukujikun";
    }
    return "none";
}

const char* to_string(ReadingVariant variant) {
    switch (variant) {
        case ReadingVariant::Plain: return "plain";
        case ReadingVariant::Rendaku: return "rendaku";
        case ReadingVariant::SmallTsu: return "small_tsu";
        case ReadingVariant::RendakuSmallTsu: return "rendaku_small_tsu";
        case ReadingVariant::VowelChange: return "vowel_change";
        case ReadingVariant::NChange: return "n_change";
        case ReadingVariant::UDropped: return "u_dropped";
    }
    return "none";
}

const char* to_string(ReadingClass reading_class) {
    switch (reading_class) {
        case ReadingClass::On: return "on";
        case ReadingClass::Kun: return "kun";
        case ReadingClass::Juku: return "juk";
        case ReadingClass::Mixed: return "mix";
    }
    return "mix";
}

const char* to_string(RenderMode mode) {
    switch (mode) {
        case RenderMode::Furigana: return "furigana";
        case RenderMode::Furikanji: return "furikanji";
        case RenderMode::KanaOnly: return "kana_only";
    }
    return "furigana";
}

ReadingClass reading_class_of(MatchType type) {
    switch (type) {
        case MatchType::Onyomi: return ReadingClass::On;
        case MatchType::Kunyomi: return ReadingClass::Kun;
        case MatchType::Jukujikun: return ReadingClass::Juku;
    }
    return ReadingClass::Juku;
}

} // namespace yomikata
