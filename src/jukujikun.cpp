#include "yomikata/jukujikun.h"
#include "yomikata/mora_splitter.h"
#include "yomikata/phonetic_rules.h"
#include "yomikata/unicode_utils.h"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace yomikata {

namespace {
using yomikata::unicode::char_count;
using yomikata::unicode::first_char;
using yomikata::unicode::is_digit_char;
using yomikata::unicode::is_repeater_char;
using yomikata::unicode::to_hiragana;

std::vector<std::string> mora_of(const std::string& text) {
    if (text.empty()) {
        return {};
    }
    return split_mora(text, char_count(text)).mora;
}

std::string join_range(const MoraAlignment& alignment, std::size_t begin, std::size_t end) {
    std::string joined;
    for (std::size_t i = begin; i < end; ++i) {
        joined += alignment.joined_mora(static_cast<int>(i));
    }
    return joined;
}

// Assign text to positions [begin, end) when their groups no longer spell it
void resplit_range(MoraAlignment& alignment, std::size_t begin, std::size_t end, const std::string& text) {
    if (begin >= end || join_range(alignment, begin, end) == text) {
        return;
    }
    std::vector<std::string> groups = distribute_mora(split_mora(text, end - begin).mora, end - begin);
    for (std::size_t i = begin; i < end; ++i) {
        alignment.mora_partition[i] = mora_of(groups[i - begin]);
        alignment = alignment.without_position(static_cast<int>(i));
    }
}

ReadingMatchInfo compound_match(const std::string& kanji, const std::string& mora, MatchType type) {
    ReadingMatchInfo match;
    match.kanji = kanji;
    match.matched_mora = mora;
    match.dict_form = mora;
    match.match_type = type;
    return match;
}

} // namespace

std::vector<std::string> distribute_mora(const std::vector<std::string>& mora, std::size_t count) {
    std::vector<std::string> groups(count);
    if (count == 0) {
        return groups;
    }
    const std::size_t base = mora.size() / count;
    const std::size_t extra = mora.size() % count;
    std::size_t next = 0;
    for (std::size_t i = 0; i < count; ++i) {
        std::size_t take = base + (i < extra ? 1 : 0);
        for (std::size_t j = 0; j < take && next < mora.size(); ++j) {
            groups[i] += mora[next++];
        }
    }
    return groups;
}

JukujikunProcessor::JukujikunProcessor(std::shared_ptr<const ExceptionDictionary> exceptions,
                                       std::shared_ptr<const KanjiDictionary> dictionary,
                                       std::shared_ptr<const OkuriganaDetector> okurigana)
    : exceptions_(std::move(exceptions)), dictionary_(std::move(dictionary)), okurigana_(std::move(okurigana)) {
    if (!exceptions_ || !dictionary_ || !okurigana_) {
        throw std::invalid_argument("JukujikunProcessor needs exceptions, a kanji dictionary and an okurigana detector");
    }
}

ReadingMatchInfo JukujikunProcessor::synthesize(const std::string& kanji, const std::string& mora) const {
    MatchType type = MatchType::Onyomi;
    if (const KanjiReadingData* data = dictionary_->find(kanji)) {
        bool onyomi = std::any_of(data->onyomi.begin(), data->onyomi.end(), [&mora](const std::string& on) {
            return to_hiragana(clean_reading(on)) == mora;
        });
        if (!onyomi) {
            for (const auto& kun : data->kunyomi) {
                std::string reading = to_hiragana(clean_reading(kun));
                if (reading.substr(0, reading.find('.')) == mora) {
                    type = MatchType::Kunyomi;
                    break;
                }
            }
        }
    }
    return compound_match(kanji, mora, type);
}

bool JukujikunProcessor::apply_exception(const std::vector<std::string>& kanji, MoraAlignment& alignment,
                                         std::vector<bool>& compound) const {
    std::string word;
    for (const auto& k : kanji) {
        word += k;
    }
    const std::string full = alignment.full_reading();
    const ExceptionEntry* entry = exceptions_->find_within(word, full);
    if (!entry) {
        return false;
    }

    if (debug_) {
        std::cerr << "[yomikata] Exception " << entry->word << "[" << entry->furigana << "] inside " << word
                  << "[" << full << "]\n";
    }

    // Every occurrence takes the entry's parts; the text between occurrences is resplit
    std::vector<bool> assigned(kanji.size(), false);
    std::size_t word_from = 0;
    std::size_t reading_from = 0;
    std::size_t previous_end = 0;
    bool applied = false;
    while (true) {
        const std::size_t word_at = word.find(entry->word, word_from);
        const std::size_t furigana_at = full.find(entry->furigana, reading_from);
        if (word_at == std::string::npos || furigana_at == std::string::npos) {
            break;
        }
        const std::size_t start = char_count(word.substr(0, word_at));
        const std::size_t end = start + entry->parts.size();
        if (end > kanji.size()) {
            break;
        }
        for (std::size_t i = start; i < end; ++i) {
            const ExceptionPart& part = entry->parts[i - start];
            alignment =
                alignment.with_position(static_cast<int>(i), compound_match(kanji[i], part.mora, part.match_type));
            alignment.mora_partition[i] = mora_of(part.mora);
            compound[i] = part.match_type == MatchType::Jukujikun;
            assigned[i] = true;
        }
        resplit_range(alignment, previous_end, start, full.substr(reading_from, furigana_at - reading_from));

        previous_end = end;
        word_from = word_at + entry->word.size();
        reading_from = furigana_at + entry->furigana.size();
        applied = true;
    }
    if (!applied) {
        return false;
    }
    resplit_range(alignment, previous_end, kanji.size(), full.substr(reading_from));

    for (std::size_t i = 0; i < kanji.size(); ++i) {
        if (assigned[i] || is_matched(alignment.per_kanji[i])) {
            continue;
        }
        const std::string mora = alignment.joined_mora(static_cast<int>(i));
        if (!mora.empty()) {
            alignment = alignment.with_position(static_cast<int>(i), synthesize(kanji[i], mora));
        }
    }
    return true;
}

void JukujikunProcessor::redistribute(const std::vector<std::string>& kanji, MoraAlignment& alignment,
                                      const std::vector<bool>& numeral, std::vector<bool>& compound) const {
    const std::vector<int> positions = alignment.unmatched_positions;
    if (positions.empty()) {
        return;
    }
    std::string unassigned;
    for (int pos : positions) {
        unassigned += alignment.joined_mora(pos);
    }
    std::vector<std::string> mora = split_mora(unassigned, positions.size()).mora;
    if (mora.empty()) {
        return;
    }
    std::vector<std::string> groups = distribute_mora(mora, positions.size());

    for (std::size_t idx = 0; idx < positions.size(); ++idx) {
        const std::size_t pos = static_cast<std::size_t>(positions[idx]);
        const std::string& portion = groups[idx];
        const bool is_numeral = pos < numeral.size() ? numeral[pos] : is_digit_char(kanji[pos]);
        // 為 read し or さ inflects like any kunyomi
        const bool suru = kanji[pos] == "為" && (portion == "し" || portion == "さ");
        const MatchType type = (is_numeral || suru) ? MatchType::Kunyomi : MatchType::Jukujikun;
        if (debug_) {
            std::cerr << "[yomikata] " << kanji[pos] << " takes " << portion << " as " << to_string(type) << "\n";
        }
        alignment = alignment.with_position(static_cast<int>(pos), compound_match(kanji[pos], portion, type));
        alignment.mora_partition[pos] = mora_of(portion);
        compound[pos] = true;
    }
}

OkuriResult JukujikunProcessor::jukujikun_okurigana(const std::string& kanji, const std::string& reading,
                                                    const std::string& trailing) const {
    OkuriResult result;
    result.rest = trailing;
    if (trailing.empty()) {
        return result;
    }
    result = okurigana_->detect(kanji, reading, trailing, ParseStrategy::Reading);
    if (result.okurigana.empty()) {
        result.rest = trailing;
        if (char_count(trailing) > 1 && !rules::is_particle_head(first_char(trailing))) {
            result.okurigana = trailing;
            result.rest.clear();
            result.kind = OkuriKind::Full;
        }
    }
    return result;
}

MoraAlignment JukujikunProcessor::process(const std::vector<std::string>& kanji, const MoraAlignment& alignment,
                                          const std::string& trailing, const std::vector<bool>& numeral) const {
    if (alignment.unmatched_positions.empty() || kanji.empty() || alignment.per_kanji.size() != kanji.size()) {
        return alignment;
    }
    const std::size_t last = kanji.size() - 1;
    const bool last_was_unmatched = !is_matched(alignment.per_kanji[last]);

    MoraAlignment result = alignment;
    std::vector<bool> compound(kanji.size(), false);
    apply_exception(kanji, result, compound);
    if (!result.unmatched_positions.empty()) {
        redistribute(kanji, result, numeral, compound);
    }

    const ReadingMatchInfo* last_match = match_of(result.per_kanji[last]);
    if (!last_was_unmatched || !last_match) {
        return result;
    }

    OkuriResult okuri;
    if (compound[last]) {
        std::string head = kanji[last];
        std::string reading = last_match->matched_mora;
        if (is_repeater_char(head) && last > 0) {
            head = kanji[last - 1] + head;
            reading = result.joined_mora(static_cast<int>(last - 1)) + reading;
        }
        okuri = jukujikun_okurigana(head, reading, trailing);
    } else {
        std::string word;
        for (const auto& k : kanji) {
            word += k;
        }
        okuri = okurigana_->extract_for_match(*last_match, trailing, word, result.full_reading());
    }

    ReadingMatchInfo updated = *last_match;
    updated.okurigana = okuri.okurigana;
    updated.rest_kana = okuri.rest;
    return result.with_position(static_cast<int>(last), updated)
        .with_trailing(okuri.okurigana, okuri.rest, okuri.verb_like);
}

} // namespace yomikata
