#include "yomikata/okurigana.h"
#include "yomikata/conjugation.h"
#include "yomikata/phonetic_rules.h"
#include "yomikata/unicode_utils.h"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace yomikata {

namespace {
using yomikata::unicode::char_count;
using yomikata::unicode::drop_last;
using yomikata::unicode::ends_with;
using yomikata::unicode::first_char;
using yomikata::unicode::starts_with;
using yomikata::unicode::substr_from_char;

OkuriResult no_okurigana(const std::string& trailing) {
    OkuriResult result;
    result.rest = trailing;
    return result;
}

OkuriResult make_result(const std::string& okurigana, const std::string& rest, OkuriKind kind,
                        bool verb_like = false) {
    OkuriResult result;
    result.okurigana = okurigana;
    result.rest = rest;
    result.kind = kind;
    result.verb_like = verb_like;
    return result;
}

// Kana after the first `okurigana` characters of `trailing`
std::string rest_after(const std::string& trailing, const std::string& okurigana) {
    return substr_from_char(trailing, char_count(okurigana));
}

bool is_stop_word(const std::string& surface) {
    return surface == "だろう" || surface == "でしょう" || surface == "なら" || surface == "から";
}

bool is_te_or_de(const std::string& surface) {
    return surface == "て" || surface == "で";
}

// Cases the analyzer is known to split wrongly
bool known_exception(const std::string& word, const std::string& reading, const std::string& trailing,
                     OkuriResult& result) {
    if (word == "久" && reading == "ひさ" && starts_with(trailing, "しぶり")) {
        result = make_result("し", rest_after(trailing, "し"), OkuriKind::Detected);
        return true;
    }
    if (word == "仄々" && reading == "ほのぼの") {
        for (const char* okurigana : {"した", "しい", "し"}) {
            if (starts_with(trailing, okurigana)) {
                result = make_result(okurigana, rest_after(trailing, okurigana), OkuriKind::Detected);
                return true;
            }
        }
    }
    return false;
}

} // namespace

bool head_type_of(const MorphToken& token, HeadType& type) {
    if (token.pos == PartOfSpeech::IAdjective ||
        (token.pos == PartOfSpeech::Adverb && ends_with(token.surface, "く"))) {
        // An i-adjective in its く form is tagged as an adverb
        type = HeadType::IAdjective;
        return true;
    }
    if (token.pos == PartOfSpeech::Noun && ends_with(token.surface, "か")) {
        type = HeadType::NaAdjective;
        return true;
    }
    switch (token.pos) {
        case PartOfSpeech::Verb:
            type = HeadType::Verb;
            return true;
        case PartOfSpeech::Adverb:
            type = HeadType::Adverb;
            return true;
        case PartOfSpeech::Noun:
            type = HeadType::Noun;
            return true;
        default:
            return false;
    }
}

bool continues_verb(const std::vector<MorphToken>& tokens, std::size_t index) {
    const MorphToken& token = tokens[index];
    const MorphToken* prev = index > 0 ? &tokens[index - 1] : nullptr;
    const MorphToken* prev_prev = index > 1 ? &tokens[index - 2] : nullptr;
    const MorphToken* next = index + 1 < tokens.size() ? &tokens[index + 1] : nullptr;

    // ている, でいる
    if (token.pos == PartOfSpeech::Particle &&
        (token.surface == "て" || (token.surface == "で" && next && next->headword == "いる"))) {
        return true;
    }
    // いる after て, but not in ないでいる
    if (token.pos == PartOfSpeech::Verb && token.headword == "いる" && prev && is_te_or_de(prev->surface) &&
        (!prev_prev || prev_prev->headword != "ない")) {
        return true;
    }
    // passive, causative and contracted ている
    if (token.pos == PartOfSpeech::Verb &&
        (token.headword == "れる" || token.headword == "られる" || token.headword == "せる" ||
         token.headword == "させる" || token.headword == "てる")) {
        return true;
    }
    if (token.pos == PartOfSpeech::BoundAuxiliary && token.headword == "ない") {
        return true;
    }
    // ないで, なくて
    return token.pos == PartOfSpeech::Particle && is_te_or_de(token.surface) && prev &&
           prev->headword == "ない";
}

bool continues_inflection(const std::vector<MorphToken>& tokens, std::size_t index, HeadType type,
                          bool& suru) {
    suru = false;
    const MorphToken& token = tokens[index];
    if (is_stop_word(token.surface)) {
        return false;
    }
    switch (type) {
        case HeadType::Verb: {
            bool add = (token.pos == PartOfSpeech::BoundAuxiliary && token.inflection != InflectionForm::None &&
                        token.headword != "だ" && token.headword != "です") ||
                       continues_verb(tokens, index);
            if (add && token.headword == "する") {
                suru = true;
            }
            return add;
        }
        case HeadType::IAdjective:
            return (token.pos == PartOfSpeech::BoundAuxiliary &&
                    (token.inflection == InflectionForm::ContinuativeTa ||
                     token.inflection == InflectionForm::ContinuativeTe ||
                     token.inflection == InflectionForm::Hypothetical || token.surface == "た" ||
                     token.surface == "ない")) ||
                   (token.pos == PartOfSpeech::Particle && (token.surface == "て" || token.surface == "ば")) ||
                   token.surface == "さ" ||
                   (token.pos == PartOfSpeech::BoundAuxiliary && token.headword == "う");
        case HeadType::NaAdjective:
            return token.surface == "な";
        case HeadType::Adverb:
        case HeadType::Noun: {
            bool add = (token.pos == PartOfSpeech::Verb && token.headword == "する") ||
                       (token.pos == PartOfSpeech::BoundAuxiliary && token.headword != "だ") ||
                       continues_verb(tokens, index) ||
                       (token.pos == PartOfSpeech::Particle && token.surface == "って");
            if (add && token.headword == "する") {
                suru = true;
            }
            return add;
        }
    }
    return false;
}

OkuriganaDetector::OkuriganaDetector(std::shared_ptr<const MorphAnalyzer> analyzer,
                                     std::shared_ptr<const KanjiDictionary> dictionary)
    : analyzer_(std::move(analyzer)), dictionary_(std::move(dictionary)) {
    if (!analyzer_) {
        throw std::invalid_argument("OkuriganaDetector needs a morphological analyzer");
    }
}

OkuriResult OkuriganaDetector::detect(const std::string& word, const std::string& reading,
                                      const std::string& trailing, ParseStrategy strategy) const {
    if (trailing.empty()) {
        return OkuriResult();
    }
    if ((word == "為" && reading == "し") || word == "抉") {
        strategy = ParseStrategy::Reading;
    }

    OkuriResult result;
    if (known_exception(word, reading, trailing, result)) {
        return result;
    }

    // At most one retry with the other strategy
    for (int attempt = 0; attempt < 2; ++attempt) {
        std::string head;
        if (strategy == ParseStrategy::Word) {
            head = word.empty() ? reading : word;
            if (word.empty()) {
                strategy = ParseStrategy::Reading;
            }
        } else {
            head = reading.empty() ? word : reading;
            if (reading.empty()) {
                strategy = ParseStrategy::Word;
            }
        }
        if (head.empty()) {
            if (debug_) {
                std::cerr << "[yomikata] No text to analyze before okurigana " << trailing << "\n";
            }
            return no_okurigana(trailing);
        }

        std::vector<MorphToken> tokens;
        try {
            tokens = analyzer_->parse(head + trailing);
        } catch (const std::exception& ex) {
            std::cerr << "[yomikata] Cannot analyze " << head << trailing << ": " << ex.what() << "\n";
            return no_okurigana(trailing);
        }
        if (tokens.empty()) {
            return no_okurigana(trailing);
        }
        if (debug_) {
            std::cerr << "[yomikata] Analyzed " << head << trailing << ":";
            for (const auto& token : tokens) {
                std::cerr << " " << token.surface << "/" << to_string(token.pos);
            }
            std::cerr << "\n";
        }

        HeadType type;
        if (!head_type_of(tokens.front(), type)) {
            if (strategy == ParseStrategy::Word && attempt == 0 && !reading.empty()) {
                strategy = ParseStrategy::Reading;
                continue;
            }
            return no_okurigana(trailing);
        }

        // The first token still holds the head text
        const std::string& first = tokens.front().surface;
        std::string conjugated = substr_from_char(first, char_count(head));
        if (type == HeadType::Noun && ends_with(first, "げ")) {
            // 恥ずかしげ: the げ is a suffix, not part of the inflection
            conjugated = drop_last(conjugated);
            return make_result(conjugated, rest_after(trailing, conjugated), OkuriKind::Full);
        }

        std::string rest = rest_after(trailing, conjugated);
        bool verb_like = false;
        std::vector<MorphToken> rest_tokens(tokens.begin() + 1, tokens.end());
        for (std::size_t i = 0; i < rest_tokens.size(); ++i) {
            bool suru = false;
            if (!continues_inflection(rest_tokens, i, type, suru)) {
                break;
            }
            conjugated += rest_tokens[i].surface;
            rest = substr_from_char(rest, char_count(rest_tokens[i].surface));
            verb_like = verb_like || suru;
        }
        return make_result(conjugated, rest, OkuriKind::Detected, verb_like);
    }
    return no_okurigana(trailing);
}

OkuriResult OkuriganaDetector::check_inflection(const std::string& reading_okuri, const std::string& kanji,
                                                const std::string& kana_reading,
                                                const std::string& trailing) const {
    if (trailing.empty() || reading_okuri.empty()) {
        return no_okurigana(trailing);
    }
    if (reading_okuri == trailing) {
        return make_result(reading_okuri, "", OkuriKind::Full);
    }

    std::optional<std::string> stem = conjugatable_stem(reading_okuri);
    if (stem && *stem == trailing) {
        return make_result(*stem, "", OkuriKind::Full);
    }
    if (!stem || !starts_with(trailing, *stem)) {
        // Not an inflecting word, or the stem is not there: only the literal okurigana counts
        if (starts_with(trailing, reading_okuri)) {
            return make_result(reading_okuri, trailing.substr(reading_okuri.size()), OkuriKind::Full);
        }
        return no_okurigana(trailing);
    }

    const std::string trimmed = trailing.substr(stem->size());
    OkuriResult table = longest_conjugation(trimmed, reading_okuri, kanji, kana_reading);
    if (debug_) {
        std::cerr << "[yomikata] Inflection of " << kanji << " (" << reading_okuri << ") in " << trailing
                  << ": " << table.okurigana << "\n";
    }
    if (table.kind == OkuriKind::Full) {
        return make_result(*stem + table.okurigana, table.rest, OkuriKind::Full, table.verb_like);
    }

    OkuriResult detected = detect(kanji, kana_reading, trailing);
    if (!detected.okurigana.empty() && starts_with(detected.okurigana, *stem)) {
        detected.kind = OkuriKind::Detected;
        return detected;
    }
    if (starts_with(trailing, reading_okuri)) {
        return make_result(reading_okuri, trailing.substr(reading_okuri.size()), OkuriKind::Full);
    }
    if (table.kind == OkuriKind::Empty) {
        return make_result(*stem, trimmed, OkuriKind::Empty);
    }
    return no_okurigana(trailing);
}

OkuriResult OkuriganaDetector::extract_for_match(const ReadingMatchInfo& match, const std::string& trailing,
                                                 const std::string& word,
                                                 const std::string& word_reading) const {
    if (trailing.empty()) {
        return OkuriResult();
    }
    switch (match.match_type) {
        case MatchType::Onyomi:
            return onyomi_okurigana(match, trailing, word, word_reading);
        case MatchType::Kunyomi:
            return kunyomi_okurigana(match, trailing);
        case MatchType::Jukujikun:
            break;
    }
    return no_okurigana(trailing);
}

OkuriResult OkuriganaDetector::onyomi_okurigana(const ReadingMatchInfo& match, const std::string& trailing,
                                                const std::string& word,
                                                const std::string& word_reading) const {
    if (!rules::is_godan_su_first_kana(first_char(trailing))) {
        return no_okurigana(trailing);
    }
    if (starts_with(trailing, "する")) {
        return make_result("する", rest_after(trailing, "する"), OkuriKind::Full, true);
    }

    // Onyomi verbs are godan す verbs (呈す) or する compounds; keep the longer reading
    OkuriResult godan = check_inflection("す", match.kanji, match.matched_mora, trailing);
    OkuriResult suru = longest_suru_conjugation(trailing);
    const OkuriResult& best = godan.okurigana.size() > suru.okurigana.size() ? godan : suru;
    if (best.kind != OkuriKind::None && !best.okurigana.empty()) {
        return best;
    }

    OkuriResult detected = word.empty() ? detect(match.kanji, match.matched_mora, trailing)
                                        : detect(word, word_reading, trailing);
    if (!detected.okurigana.empty()) {
        return detected;
    }
    return no_okurigana(trailing);
}

OkuriResult OkuriganaDetector::kunyomi_okurigana(const ReadingMatchInfo& match,
                                                 const std::string& trailing) const {
    std::string reading_okuri;
    std::size_t dot = match.dict_form.find('.');
    if (dot != std::string::npos) {
        reading_okuri = match.dict_form.substr(dot + 1);
    } else {
        // Matched a reading without okurigana; look for a dotted reading with the same stem
        const KanjiReadingData* data = dictionary_ ? dictionary_->find(match.kanji) : nullptr;
        if (data) {
            for (const auto& reading : data->kunyomi) {
                std::size_t marker = reading.find('.');
                if (marker == std::string::npos) {
                    continue;
                }
                std::string stem = reading.substr(0, marker);
                std::string okuri = reading.substr(marker + 1);
                if (match.dict_form == stem || match.dict_form == stem + okuri) {
                    reading_okuri = okuri;
                    break;
                }
            }
        }
        if (reading_okuri.empty()) {
            return no_okurigana(trailing);
        }
    }
    return check_inflection(reading_okuri, match.kanji, match.matched_mora, trailing);
}

} // namespace yomikata
