#include "yomikata/engine.h"
#include "yomikata/mora_splitter.h"
#include "yomikata/number_to_kanji.h"
#include "yomikata/unicode_utils.h"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace yomikata {

namespace {
using yomikata::unicode::contains_kana;
using yomikata::unicode::from_unicode_string;
using yomikata::unicode::is_digit_char;
using yomikata::unicode::is_katakana_str;
using yomikata::unicode::is_repeater_char;
using yomikata::unicode::split_chars;
using yomikata::unicode::starts_with;
using yomikata::unicode::to_hiragana;
using yomikata::unicode::to_katakana;
using yomikata::unicode::to_unicode_string;

// word[reading]kana with an optional leading space
const char* kTokenPattern = " ?([\\d\\x{3005}\\p{Han}]+)\\[([^\\]]*)\\]([\\x{3041}-\\x{3093}\\x{30A1}-\\x{30F3}\\x{30FC}]*)";
const char* kEmptyReading = "？";

ReadingClass class_at(const MoraAlignment& alignment, std::size_t pos) {
    if (const ReadingMatchInfo* match = match_of(alignment.per_kanji[pos])) {
        return reading_class_of(match->match_type);
    }
    return ReadingClass::Juku;
}

std::string furigana_at(const MoraAlignment& alignment, std::size_t pos) {
    if (const ReadingMatchInfo* match = match_of(alignment.per_kanji[pos])) {
        return match->matched_mora;
    }
    return alignment.joined_mora(static_cast<int>(pos));
}

} // namespace

ExpandedWord expand_numerals(const std::string& word) {
    ExpandedWord expanded;
    std::vector<std::string> chars = split_chars(word);
    std::size_t i = 0;
    while (i < chars.size()) {
        WrittenUnit unit;
        unit.first = expanded.kanji.size();
        if (!is_digit_char(chars[i])) {
            unit.surface = chars[i];
            expanded.kanji.push_back(chars[i]);
            expanded.numeral.push_back(false);
            expanded.units.push_back(unit);
            ++i;
            continue;
        }
        while (i < chars.size() && is_digit_char(chars[i])) {
            unit.surface += chars[i++];
        }
        std::vector<std::string> spelled = split_chars(number_to_kanji(unit.surface));
        unit.count = spelled.size();
        unit.numeral = true;
        for (const auto& ch : spelled) {
            expanded.kanji.push_back(ch);
            expanded.numeral.push_back(true);
        }
        expanded.units.push_back(unit);
    }
    return expanded;
}

bool is_whole_word(const WordToken& token) {
    std::vector<std::string> chars = split_chars(token.word);
    if (chars.size() == 2 && is_repeater_char(chars[1])) {
        return true;
    }
    if (!token.kanji_to_highlight || token.kanji_to_highlight->empty()) {
        return false;
    }
    const std::string& kanji = *token.kanji_to_highlight;
    return token.word == kanji || token.word == kanji + "々" || token.word == kanji + kanji;
}

FuriganaEngine::FuriganaEngine(std::shared_ptr<const KanjiDictionary> dictionary,
                               std::shared_ptr<const ExceptionDictionary> exceptions,
                               std::shared_ptr<const MorphAnalyzer> analyzer)
    : dictionary_(std::move(dictionary)), exceptions_(std::move(exceptions)), analyzer_(std::move(analyzer)) {
    if (!dictionary_) {
        throw std::invalid_argument("FuriganaEngine needs a kanji dictionary");
    }
    if (!exceptions_) {
        exceptions_ = std::make_shared<ExceptionDictionary>();
    }
    if (!analyzer_) {
        analyzer_ = std::make_shared<NullAnalyzer>();
    }
    okurigana_ = std::make_shared<OkuriganaDetector>(analyzer_, dictionary_);
    matcher_ = std::make_shared<ReadingMatcher>(dictionary_, okurigana_);
    search_ = std::make_shared<AlignmentSearch>(matcher_, okurigana_);
    jukujikun_ = std::make_shared<JukujikunProcessor>(exceptions_, dictionary_, okurigana_);

    UErrorCode status = U_ZERO_ERROR;
    UParseError parse_error;
    token_pattern_.reset(icu::RegexPattern::compile(to_unicode_string(kTokenPattern), 0, parse_error, status));
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string("Cannot compile token pattern: ") + u_errorName(status));
    }
}

void FuriganaEngine::set_debug(bool debug) {
    debug_ = debug;
    okurigana_->set_debug(debug);
    matcher_->set_debug(debug);
    search_->set_debug(debug);
    jukujikun_->set_debug(debug);
    reconstructor_.set_debug(debug);
}

MoraAlignment FuriganaEngine::align_exception(const ExceptionEntry& entry, const ExpandedWord& expanded,
                                              const std::string& trailing) const {
    MoraAlignment alignment = alignment_from_exception(entry);
    if (trailing.empty() || alignment.per_kanji.empty()) {
        return alignment.with_trailing("", trailing, false);
    }
    const std::size_t last = alignment.per_kanji.size() - 1;
    const ReadingMatchInfo* match = match_of(alignment.per_kanji[last]);
    if (!match) {
        return alignment.with_trailing("", trailing, false);
    }

    OkuriResult okuri;
    if (match->match_type == MatchType::Jukujikun) {
        std::string head = expanded.kanji[last];
        std::string reading = match->matched_mora;
        if (is_repeater_char(head) && last > 0) {
            head = expanded.kanji[last - 1] + head;
            reading = alignment.joined_mora(static_cast<int>(last - 1)) + reading;
        }
        okuri = jukujikun_->jukujikun_okurigana(head, reading, trailing);
    } else {
        okuri = okurigana_->extract_for_match(*match, trailing, entry.word, entry.furigana);
    }
    ReadingMatchInfo updated = *match;
    updated.okurigana = okuri.okurigana;
    updated.rest_kana = okuri.rest;
    return alignment.with_position(static_cast<int>(last), updated)
        .with_trailing(okuri.okurigana, okuri.rest, okuri.verb_like);
}

MoraAlignment FuriganaEngine::align_expanded(const WordToken& token, const ExpandedWord& expanded) const {
    const std::string reading = to_hiragana(token.reading);
    if (const ExceptionEntry* entry = exceptions_->find_exact(token.word, reading)) {
        if (entry->parts.size() == expanded.kanji.size()) {
            if (debug_) {
                std::cerr << "[yomikata] Exception alignment for " << token.word << "[" << reading << "]\n";
            }
            return align_exception(*entry, expanded, token.trailing_kana);
        }
    }

    MoraSplit split = split_mora(reading, expanded.kanji.size());
    MoraAlignment alignment =
        search_->find_alignment(expanded.kanji, split.mora, token.trailing_kana, is_whole_word(token));
    if (alignment.is_complete) {
        return alignment;
    }
    if (debug_) {
        std::cerr << "[yomikata] " << alignment.unmatched_positions.size() << " positions of " << token.word
                  << " read as a compound\n";
    }
    return jukujikun_->process(expanded.kanji, alignment, token.trailing_kana, expanded.numeral);
}

MoraAlignment FuriganaEngine::align(const WordToken& token) const {
    return align_expanded(token, expand_numerals(token.word));
}

WordRendering FuriganaEngine::lower(const WordToken& token, const ExpandedWord& expanded,
                                    const MoraAlignment& alignment, const WithTagsDef& tags) const {
    WordRendering word;
    word.okurigana = alignment.trailing_okurigana;
    word.rest = alignment.trailing_rest;
    if (word.okurigana.empty() && word.rest.empty()) {
        word.rest = token.trailing_kana;
    }

    const bool was_katakana = is_katakana_str(token.reading);
    auto kana_for = [&](std::size_t pos) {
        std::string kana = furigana_at(alignment, pos);
        if (was_katakana || (tags.onyomi_to_katakana && class_at(alignment, pos) == ReadingClass::On)) {
            kana = to_katakana(kana);
        }
        return kana;
    };

    // The first occurrence of the highlighted kanji, together with a repeat that follows it
    std::vector<bool> highlighted(expanded.units.size(), false);
    if (token.kanji_to_highlight && !token.kanji_to_highlight->empty()) {
        const std::string& target = *token.kanji_to_highlight;
        for (std::size_t u = 0; u < expanded.units.size(); ++u) {
            if (expanded.units[u].surface != target) {
                continue;
            }
            highlighted[u] = true;
            if (u + 1 < expanded.units.size() &&
                (is_repeater_char(expanded.units[u + 1].surface) || expanded.units[u + 1].surface == target)) {
                highlighted[u + 1] = true;
            }
            break;
        }
    }

    for (std::size_t u = 0; u < expanded.units.size(); ++u) {
        const WrittenUnit& unit = expanded.units[u];
        if (unit.first + unit.count > alignment.per_kanji.size()) {
            break;
        }
        if (highlighted[u] && !word.highlight_class) {
            word.highlight_class = class_at(alignment, unit.first);
        }
        if (!unit.numeral) {
            RenderEntry entry;
            entry.surface_kanji = unit.surface;
            entry.furigana = kana_for(unit.first);
            entry.reading_class = class_at(alignment, unit.first);
            entry.is_highlighted = highlighted[u];
            word.entries.push_back(entry);
            continue;
        }

        bool same_class = true;
        for (std::size_t pos = unit.first + 1; pos < unit.first + unit.count; ++pos) {
            same_class = same_class && class_at(alignment, pos) == class_at(alignment, unit.first);
        }
        if (same_class) {
            RenderEntry entry;
            entry.surface_kanji = unit.surface;
            for (std::size_t pos = unit.first; pos < unit.first + unit.count; ++pos) {
                entry.furigana += kana_for(pos);
            }
            entry.reading_class = class_at(alignment, unit.first);
            entry.is_numeral = true;
            entry.is_highlighted = highlighted[u];
            word.entries.push_back(entry);
            continue;
        }
        // Mixed readings keep one entry per numeral, the digits sit on the first
        for (std::size_t pos = unit.first; pos < unit.first + unit.count; ++pos) {
            RenderEntry entry;
            entry.surface_kanji = pos == unit.first ? unit.surface : "";
            entry.furigana = kana_for(pos);
            entry.reading_class = class_at(alignment, pos);
            entry.is_numeral = true;
            entry.is_highlighted = highlighted[u];
            word.entries.push_back(entry);
        }
    }
    return word;
}

std::string FuriganaEngine::render_error(const WordToken& token, RenderMode mode) const {
    const std::string reading = token.reading.empty() ? kEmptyReading : token.reading;
    std::string body;
    switch (mode) {
        case RenderMode::Furigana:
            body = " " + token.word + "[" + reading + "]";
            break;
        case RenderMode::Furikanji:
            body = " " + reading + "[" + token.word + "]";
            break;
        case RenderMode::KanaOnly:
            body = reading;
            break;
    }
    return "<err>" + body + "</err>" + token.trailing_kana;
}

std::string FuriganaEngine::render_word(const WordToken& token, RenderMode mode, const WithTagsDef& tags) const {
    if (token.reading.empty() || !contains_kana(token.reading)) {
        if (debug_) {
            std::cerr << "[yomikata] No kana in reading of " << token.word << "[" << token.reading << "]\n";
        }
        return render_error(token, mode);
    }
    ExpandedWord expanded = expand_numerals(token.word);
    MoraAlignment alignment = align_expanded(token, expanded);
    return reconstructor_.reconstruct(lower(token, expanded, alignment, tags), mode, tags);
}

std::string FuriganaEngine::highlight_text(const std::string& text, const std::optional<std::string>& kanji,
                                           RenderMode mode, const WithTagsDef& tags) const {
    icu::UnicodeString input = to_unicode_string(text);
    UErrorCode status = U_ZERO_ERROR;
    std::unique_ptr<icu::RegexMatcher> matcher(token_pattern_->matcher(input, status));
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string("Cannot scan text: ") + u_errorName(status));
    }

    std::string out;
    int32_t copied = 0;
    while (matcher->find(status) && U_SUCCESS(status)) {
        const int32_t start = matcher->start(status);
        const int32_t end = matcher->end(status);
        out += from_unicode_string(input.tempSubStringBetween(copied, start));
        copied = end;

        const std::string whole = from_unicode_string(matcher->group(0, status));
        WordToken token;
        token.word = from_unicode_string(matcher->group(1, status));
        token.reading = from_unicode_string(matcher->group(2, status));
        token.trailing_kana = from_unicode_string(matcher->group(3, status));
        token.kanji_to_highlight = kanji;
        if (U_FAILURE(status)) {
            throw std::runtime_error(std::string("Cannot read token: ") + u_errorName(status));
        }

        if (starts_with(token.reading, "sound:")) {
            out += whole;
            continue;
        }
        // Kana-only output has no space of its own, so the one before the token stays
        if (mode == RenderMode::KanaOnly && starts_with(whole, " ")) {
            out += " ";
        }
        out += render_word(token, mode, tags);
    }
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string("Cannot scan text: ") + u_errorName(status));
    }
    out += from_unicode_string(input.tempSubStringBetween(copied));
    return out;
}

} // namespace yomikata
