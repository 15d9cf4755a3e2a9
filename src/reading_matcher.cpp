#include "yomikata/reading_matcher.h"
#include "yomikata/conjugation.h"
#include "yomikata/phonetic_rules.h"
#include "yomikata/unicode_utils.h"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace yomikata {

namespace {
using yomikata::unicode::char_at;
using yomikata::unicode::char_count;
using yomikata::unicode::drop_last;
using yomikata::unicode::first_char;
using yomikata::unicode::last_char;
using yomikata::unicode::starts_with;
using yomikata::unicode::substr_from_char;
using yomikata::unicode::to_hiragana;

const std::string kSmallTsu = "っ";

// reading with its second kana written small (しよう → しょう); empty when not applicable
std::string yoon_contracted(const std::string& reading) {
    if (char_count(reading) < 2) {
        return "";
    }
    std::string small = rules::small_yoon(char_at(reading, 1));
    if (small.empty()) {
        return "";
    }
    return first_char(reading) + small + substr_from_char(reading, 2);
}

ReadingMatchInfo make_match(const std::string& kanji, const std::string& mora, const std::string& dict_form,
                            MatchType type, ReadingVariant variant) {
    ReadingMatchInfo match;
    match.matched_mora = mora;
    match.dict_form = dict_form;
    match.match_type = type;
    match.variant = variant;
    match.kanji = kanji;
    return match;
}

} // namespace

std::optional<ReadingVariant> check_reading_match(const std::string& reading, const std::string& mora,
                                                  const std::string& okurigana) {
    if (reading.empty()) {
        return std::nullopt;
    }
    if (reading == mora) {
        return ReadingVariant::Plain;
    }

    const std::string head = first_char(reading);
    const std::string tail = substr_from_char(reading, 1);
    const std::string last = last_char(reading);

    std::vector<std::string> rendaku;
    for (const auto& voiced : rules::rendaku_variants(head)) {
        rendaku.push_back(voiced + tail);
    }
    for (const auto& candidate : rendaku) {
        if (candidate == mora) {
            return ReadingVariant::Rendaku;
        }
    }

    if (rules::can_become_small_tsu(last) && drop_last(reading) + kSmallTsu == mora) {
        return ReadingVariant::SmallTsu;
    }

    for (const auto& changed : rules::vowel_change_variants(head)) {
        if (changed + tail == mora) {
            return ReadingVariant::VowelChange;
        }
    }

    // Yōon contraction, also on the voiced forms
    std::string contracted = yoon_contracted(reading);
    if (!contracted.empty() && contracted == mora) {
        return ReadingVariant::VowelChange;
    }
    for (const auto& candidate : rendaku) {
        contracted = yoon_contracted(candidate);
        if (!contracted.empty() && contracted == mora) {
            return ReadingVariant::VowelChange;
        }
    }

    for (const auto& candidate : rendaku) {
        if (rules::can_become_small_tsu(last_char(candidate)) && drop_last(candidate) + kSmallTsu == mora) {
            return ReadingVariant::RendakuSmallTsu;
        }
    }

    // 言う read い before って
    if (starts_with(okurigana, kSmallTsu) && last == "う") {
        if (drop_last(reading) == mora) {
            return ReadingVariant::UDropped;
        }
        for (const auto& candidate : rendaku) {
            if (last_char(candidate) == "う" && drop_last(candidate) == mora) {
                return ReadingVariant::UDropped;
            }
        }
    }

    if (rules::can_become_n(last) && drop_last(reading) + "ん" == mora) {
        return ReadingVariant::NChange;
    }
    return std::nullopt;
}

std::vector<KunyomiCandidate> kunyomi_candidates(const std::string& kunyomi) {
    std::vector<KunyomiCandidate> candidates;
    const std::string reading = to_hiragana(clean_reading(kunyomi));
    if (reading.empty()) {
        return candidates;
    }

    std::string stem = reading;
    std::string okuri;
    std::size_t dot = reading.find('.');
    if (dot != std::string::npos) {
        stem = reading.substr(0, dot);
        okuri = reading.substr(dot + 1);
    }
    const std::string full = stem + okuri;

    candidates.push_back({stem, reading});
    if (!okuri.empty()) {
        std::string noun_okuri = noun_form_okuri(okuri);
        if (!noun_okuri.empty() && stem + noun_okuri != full) {
            candidates.push_back({stem + noun_okuri, reading});
        }
    }
    if (full != stem) {
        bool tried = std::any_of(candidates.begin(), candidates.end(),
                                 [&full](const KunyomiCandidate& c) { return c.surface == full; });
        if (!tried) {
            candidates.push_back({full, reading});
        }
    }
    return candidates;
}

ReadingMatcher::ReadingMatcher(std::shared_ptr<const KanjiDictionary> dictionary,
                               std::shared_ptr<const OkuriganaDetector> okurigana)
    : dictionary_(std::move(dictionary)), okurigana_(std::move(okurigana)) {
    if (!dictionary_ || !okurigana_) {
        throw std::invalid_argument("ReadingMatcher needs a kanji dictionary and an okurigana detector");
    }
}

std::optional<ReadingMatchInfo> ReadingMatcher::match_onyomi(const std::string& kanji, const std::string& mora,
                                                             const std::string& okurigana, bool is_last) const {
    const KanjiReadingData* data = dictionary_->find(kanji);
    if (!data) {
        return std::nullopt;
    }
    for (const auto& onyomi : data->onyomi) {
        const std::string dict_form = clean_reading(onyomi);
        const std::string reading = to_hiragana(dict_form);
        if (reading.empty()) {
            continue;
        }
        std::optional<ReadingVariant> variant = check_reading_match(reading, mora, is_last ? okurigana : "");
        if (variant) {
            return make_match(kanji, mora, dict_form, MatchType::Onyomi, *variant);
        }
    }
    return std::nullopt;
}

std::optional<ReadingMatchInfo> ReadingMatcher::match_kunyomi(const std::string& kanji, const std::string& mora,
                                                              const std::string& okurigana, bool is_last) const {
    const KanjiReadingData* data = dictionary_->find(kanji);
    if (!data || data->kunyomi.empty()) {
        return std::nullopt;
    }

    // 為 read し or さ is a conjugated stem of する
    if (kanji == "為" && (mora == "し" || mora == "さ")) {
        return make_match(kanji, mora, "す.る", MatchType::Kunyomi, ReadingVariant::Plain);
    }

    const bool scoring = is_last && !okurigana.empty();
    std::optional<ReadingMatchInfo> best;
    int best_score = -1;

    for (const auto& kunyomi : data->kunyomi) {
        for (const auto& candidate : kunyomi_candidates(kunyomi)) {
            std::optional<ReadingVariant> variant =
                check_reading_match(candidate.surface, mora, is_last ? okurigana : "");
            if (!variant) {
                continue;
            }
            ReadingMatchInfo match = make_match(kanji, mora, candidate.dict_form, MatchType::Kunyomi, *variant);
            if (!scoring) {
                return match;
            }

            std::size_t dot = candidate.dict_form.find('.');
            if (dot == std::string::npos) {
                // Without a marker the reading can only stand in until a better one is found
                if (!best) {
                    best = match;
                    best_score = std::max(best_score, 0);
                }
                continue;
            }
            OkuriResult result = okurigana_->check_inflection(candidate.dict_form.substr(dot + 1), kanji, mora,
                                                              okurigana);
            if (result.kind == OkuriKind::Full) {
                return match;
            }
            int score = static_cast<int>(char_count(result.okurigana));
            if (debug_) {
                std::cerr << "[yomikata] " << kanji << " " << candidate.dict_form << " covers " << score
                          << " kana of " << okurigana << "\n";
            }
            if (score > best_score) {
                best = match;
                best_score = score;
            }
        }
    }
    return best;
}

std::optional<ReadingMatchInfo> ReadingMatcher::match(const std::string& kanji, const std::string& mora,
                                                      const std::string& okurigana, bool is_last,
                                                      bool prefer_kunyomi) const {
    if (prefer_kunyomi) {
        if (auto kunyomi = match_kunyomi(kanji, mora, okurigana, is_last)) {
            return kunyomi;
        }
        return match_onyomi(kanji, mora, okurigana, is_last);
    }
    if (auto onyomi = match_onyomi(kanji, mora, okurigana, is_last)) {
        return onyomi;
    }
    return match_kunyomi(kanji, mora, okurigana, is_last);
}

} // namespace yomikata
