#include "yomikata/alignment.h"
#include "yomikata/mora_splitter.h"
#include "yomikata/partitions.h"
#include "yomikata/phonetic_rules.h"
#include "yomikata/unicode_utils.h"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace yomikata {

namespace {
using yomikata::unicode::char_at;
using yomikata::unicode::char_count;
using yomikata::unicode::first_char;
using yomikata::unicode::is_repeater_char;
using yomikata::unicode::starts_with;
using yomikata::unicode::substr_from_char;

using Partition = std::vector<std::vector<std::string>>;

std::string join_kanji(const std::vector<std::string>& kanji) {
    std::string word;
    for (const auto& k : kanji) {
        word += k;
    }
    return word;
}

std::size_t matched_chars(const MoraAlignment& alignment) {
    std::size_t chars = 0;
    for (const auto& position : alignment.per_kanji) {
        if (const ReadingMatchInfo* match = match_of(position)) {
            chars += char_count(match->matched_mora);
        }
    }
    return chars;
}

// Whether second repeats first with a voiced first kana (時々 ときどき)
bool is_voiced_repeat(const std::string& first, const std::string& second) {
    if (first.empty() || second.empty()) {
        return false;
    }
    const std::string rest = substr_from_char(first, 1);
    for (const auto& voiced : rules::rendaku_variants(first_char(first))) {
        if (starts_with(second, voiced + rest)) {
            return true;
        }
    }
    return false;
}

// Every position unmatched, mora spread front-first
MoraAlignment all_unmatched(std::size_t kanji_count, const std::vector<std::string>& mora,
                            const std::string& trailing) {
    MoraAlignment alignment;
    alignment.per_kanji.assign(kanji_count, Unmatched{});
    alignment.mora_partition.assign(kanji_count, {});
    const std::size_t base = mora.size() / kanji_count;
    const std::size_t extra = mora.size() % kanji_count;
    std::size_t next = 0;
    for (std::size_t i = 0; i < kanji_count; ++i) {
        std::size_t take = base + (i < extra ? 1 : 0);
        for (std::size_t j = 0; j < take && next < mora.size(); ++j) {
            alignment.mora_partition[i].push_back(mora[next++]);
        }
        alignment.unmatched_positions.push_back(static_cast<int>(i));
    }
    alignment.trailing_rest = trailing;
    return alignment;
}

} // namespace

bool is_repeat_position(const std::vector<std::string>& kanji, std::size_t index) {
    if (index == 0 || index >= kanji.size()) {
        return false;
    }
    return is_repeater_char(kanji[index]) || kanji[index] == kanji[index - 1];
}

bool valid_repeater_split(const std::vector<std::string>& kanji, const Partition& partition) {
    for (std::size_t i = 1; i < kanji.size() && i < partition.size(); ++i) {
        if (is_repeat_position(kanji, i) && partition[i].size() != partition[i - 1].size()) {
            return false;
        }
    }
    return true;
}

AlignmentSearch::AlignmentSearch(std::shared_ptr<const ReadingMatcher> matcher,
                                 std::shared_ptr<const OkuriganaDetector> okurigana)
    : matcher_(std::move(matcher)), okurigana_(std::move(okurigana)) {
    if (!matcher_ || !okurigana_) {
        throw std::invalid_argument("AlignmentSearch needs a reading matcher and an okurigana detector");
    }
}

OkuriResult AlignmentSearch::okurigana_for(const ReadingMatchInfo& match, const std::string& kanji,
                                           const std::string& trailing, const std::string& word,
                                           const std::string& word_reading) const {
    ReadingMatchInfo lookup = match;
    lookup.kanji = kanji;
    return okurigana_->extract_for_match(lookup, trailing, word, word_reading);
}

MoraAlignment AlignmentSearch::try_partition(const std::vector<std::string>& kanji, const Partition& partition,
                                             const std::string& trailing, bool whole_word, bool check_yoon,
                                             std::vector<Partition>& yoon_partitions) const {
    const std::size_t count = kanji.size();
    const std::string word = join_kanji(kanji);
    std::string word_reading;
    for (const auto& group : partition) {
        word_reading += join_mora(group);
    }

    MoraAlignment alignment;
    alignment.per_kanji.assign(count, Unmatched{});
    alignment.mora_partition = partition;

    std::size_t i = 0;
    while (i < count) {
        const std::string& current = kanji[i];
        const bool is_last = i + 1 == count;
        const bool next_repeats = is_repeat_position(kanji, i + 1);
        const bool takes_okurigana = is_last && !next_repeats;
        const std::string mora = join_mora(partition[i]);
        const std::string okurigana = takes_okurigana ? trailing : "";

        std::optional<ReadingMatchInfo> match = matcher_->match(current, mora, okurigana, takes_okurigana, whole_word);

        // A yōon mora may belong half to the previous kanji (書生 しょせい vs 読書 どくしょ)
        if (check_yoon && !next_repeats && i > 0 && char_count(mora) == 2 &&
            rules::is_small_yoon(char_at(mora, 1))) {
            const std::string small = char_at(mora, 1);
            if (matcher_->match(current, small, okurigana, takes_okurigana, whole_word)) {
                Partition shifted = partition;
                shifted[i - 1].push_back(first_char(mora));
                shifted[i] = {small};
                yoon_partitions.push_back(std::move(shifted));
                if (debug_) {
                    std::cerr << "[yomikata] Queued yoon split for " << current << " (" << small << ")\n";
                }
            }
        }

        if (!match) {
            alignment.unmatched_positions.push_back(static_cast<int>(i));
            if (next_repeats) {
                alignment.unmatched_positions.push_back(static_cast<int>(i + 1));
                i += 2;
                continue;
            }
            ++i;
            continue;
        }

        if (next_repeats) {
            // The repeat reuses the reading; a mismatch is accepted as a repetition as well
            ReadingMatchInfo repeat = *match;
            repeat.matched_mora = join_mora(partition[i + 1]);
            repeat.kanji = kanji[i + 1];
            if (repeat.matched_mora != mora && is_voiced_repeat(mora, repeat.matched_mora)) {
                repeat.variant = ReadingVariant::Rendaku;
            }
            if (i + 2 == count) {
                OkuriResult okuri = okurigana_for(repeat, current, trailing, word, word_reading);
                repeat.okurigana = okuri.okurigana;
                repeat.rest_kana = okuri.rest;
                alignment.trailing_okurigana = okuri.okurigana;
                alignment.trailing_rest = okuri.rest;
                alignment.verb_like = okuri.verb_like;
            }
            alignment.per_kanji[i] = *match;
            alignment.per_kanji[i + 1] = repeat;
            i += 2;
            continue;
        }

        if (is_last) {
            OkuriResult okuri = okurigana_for(*match, current, trailing, word, word_reading);
            match->okurigana = okuri.okurigana;
            match->rest_kana = okuri.rest;
            alignment.trailing_okurigana = okuri.okurigana;
            alignment.trailing_rest = okuri.rest;
            alignment.verb_like = okuri.verb_like;
        }
        alignment.per_kanji[i] = *match;
        ++i;
    }

    alignment.is_complete = alignment.unmatched_positions.empty();
    if (!alignment.is_complete || alignment.trailing_okurigana.empty()) {
        if (alignment.trailing_okurigana.empty() && alignment.trailing_rest.empty()) {
            alignment.trailing_rest = trailing;
        }
    }

    const ReadingMatchInfo* last = count > 0 ? match_of(alignment.per_kanji[count - 1]) : nullptr;
    if (last && alignment.trailing_okurigana.empty() && !trailing.empty()) {
        // Repeat positions look up okurigana through the kanji they repeat
        std::string last_kanji = kanji[count - 1];
        if (is_repeater_char(last_kanji) && count > 1) {
            last_kanji = kanji[count - 2];
        }
        OkuriResult okuri = okurigana_for(*last, last_kanji, trailing, word, word_reading);
        alignment.trailing_okurigana = okuri.okurigana;
        alignment.trailing_rest = okuri.rest;
        alignment.verb_like = okuri.verb_like;
    }
    return alignment;
}

MoraAlignment AlignmentSearch::find_alignment(const std::vector<std::string>& kanji,
                                              const std::vector<std::string>& mora, const std::string& trailing,
                                              bool whole_word) const {
    const std::size_t count = kanji.size();
    if (count == 0) {
        MoraAlignment empty;
        empty.is_complete = true;
        empty.trailing_rest = trailing;
        return empty;
    }

    std::optional<MoraAlignment> best;
    std::size_t best_unmatched = count + 1;
    std::size_t best_chars = 0;
    auto keep_if_better = [&](const MoraAlignment& alignment) {
        const std::size_t unmatched = alignment.unmatched_positions.size();
        const std::size_t chars = matched_chars(alignment);
        if ((unmatched < best_unmatched && chars >= best_chars) ||
            (unmatched <= best_unmatched && chars > best_chars)) {
            best = alignment;
            best_unmatched = unmatched;
            best_chars = chars;
        }
    };

    std::vector<Partition> yoon_partitions;
    PartitionGenerator generator(mora, count);
    Partition partition;
    std::size_t tried = 0;
    while (generator.next(partition)) {
        if (!valid_repeater_split(kanji, partition)) {
            continue;
        }
        if (max_partitions_ > 0 && tried >= max_partitions_) {
            if (debug_) {
                std::cerr << "[yomikata] Partition limit reached for " << join_kanji(kanji) << "\n";
            }
            break;
        }
        ++tried;
        MoraAlignment alignment = try_partition(kanji, partition, trailing, whole_word, true, yoon_partitions);
        if (alignment.is_complete) {
            return alignment;
        }
        keep_if_better(alignment);
    }

    std::vector<Partition> unused;
    for (const auto& shifted : yoon_partitions) {
        MoraAlignment alignment = try_partition(kanji, shifted, trailing, whole_word, false, unused);
        if (alignment.is_complete) {
            return alignment;
        }
        keep_if_better(alignment);
    }

    if (best) {
        if (debug_) {
            std::cerr << "[yomikata] Partial alignment for " << join_kanji(kanji) << " leaves "
                      << best_unmatched << " unmatched\n";
        }
        return *best;
    }
    return all_unmatched(count, mora, trailing);
}

} // namespace yomikata
