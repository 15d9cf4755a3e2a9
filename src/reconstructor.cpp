#include "yomikata/reconstructor.h"
#include "yomikata/number_to_kanji.h"
#include "yomikata/unicode_utils.h"

#include <iostream>

namespace yomikata {

namespace {
using yomikata::unicode::char_count;
using yomikata::unicode::is_digit_str;

RenderEntry joined(const RenderEntry& cur, const RenderEntry& next, ReadingClass reading_class, bool is_numeral) {
    RenderEntry out;
    out.surface_kanji = cur.surface_kanji + next.surface_kanji;
    out.furigana = cur.furigana + next.furigana;
    out.reading_class = reading_class;
    out.is_numeral = is_numeral;
    out.is_highlighted = cur.is_highlighted;
    return out;
}

// Decide whether next joins cur; on success merged holds the joined span
bool try_merge(const RenderEntry& cur, const RenderEntry& next, bool next_is_last, RenderMode mode,
               bool merge_consecutive, RenderEntry& merged) {
    const bool same_class = cur.reading_class == next.reading_class;
    const bool same_highlight = cur.is_highlighted == next.is_highlighted;
    const bool kana_only = mode == RenderMode::KanaOnly;

    // Repeated kanji or 々
    if ((next.surface_kanji == cur.surface_kanji || next.surface_kanji == "々") && same_class && same_highlight &&
        (merge_consecutive || !(cur.is_numeral && next.is_numeral)) &&
        (merge_consecutive || !cur.surface_kanji.empty() || !next.surface_kanji.empty())) {
        merged = joined(cur, next, cur.reading_class, cur.is_numeral && next.is_numeral);
        return true;
    }
    if (merge_consecutive && same_class && same_highlight) {
        // A number next to a counter keeps its boundary when either side is highlighted
        if (cur.is_numeral != next.is_numeral && (cur.is_highlighted || next.is_highlighted)) {
            return false;
        }
        merged = joined(cur, next, cur.reading_class, cur.is_numeral && next.is_numeral);
        return true;
    }
    // Placeholder positions of an expanded number fold into it
    if (!kana_only && cur.is_numeral && next.surface_kanji.empty() && same_highlight) {
        merged = joined(cur, next, ReadingClass::Mixed, true);
        return true;
    }
    if (!kana_only && cur.is_numeral && next.is_numeral && same_highlight) {
        merged = joined(cur, next, same_class ? cur.reading_class : ReadingClass::Mixed, true);
        return true;
    }
    if (merge_consecutive && mode == RenderMode::Furikanji && cur.is_numeral && !next.is_numeral) {
        if (next_is_last && same_class) {
            merged = joined(cur, next, cur.reading_class, false);
            return true;
        }
        return false;
    }
    if (next.furigana.empty()) {
        merged = joined(cur, next, cur.reading_class, cur.is_numeral);
        return true;
    }
    return false;
}

} // namespace

const char* tag_name(ReadingClass reading_class) {
    return to_string(reading_class);
}

std::vector<RenderEntry> merge_entries(const std::vector<RenderEntry>& entries, RenderMode mode,
                                       bool merge_consecutive) {
    std::vector<RenderEntry> out;
    std::size_t index = 0;
    while (index < entries.size()) {
        RenderEntry cur = entries[index];
        while (index + 1 < entries.size()) {
            RenderEntry merged;
            const bool next_is_last = index + 2 >= entries.size();
            if (!try_merge(cur, entries[index + 1], next_is_last, mode, merge_consecutive, merged)) {
                break;
            }
            cur = merged;
            ++index;
        }
        // Long numbers read with several classes show as mixed
        if (cur.is_numeral && mode != RenderMode::KanaOnly && cur.reading_class != ReadingClass::Mixed &&
            is_digit_str(cur.surface_kanji) && char_count(number_to_kanji(cur.surface_kanji)) >= 3) {
            cur.reading_class = ReadingClass::Mixed;
        }
        out.push_back(cur);
        ++index;
    }
    return out;
}

bool okurigana_outside_highlight(const WordRendering& word, const WithTagsDef& tags) {
    if (tags.include_suru_okuri || !word.highlight_class) {
        return false;
    }
    if (*word.highlight_class != ReadingClass::On && *word.highlight_class != ReadingClass::Juku) {
        return false;
    }
    std::size_t length = 0;
    for (const auto& entry : word.entries) {
        length += char_count(entry.surface_kanji);
    }
    return length > 1 || word.okurigana == "する";
}

std::string Reconstructor::render_span(const RenderEntry& entry, RenderMode mode, bool with_tags) const {
    std::string base;
    switch (mode) {
        case RenderMode::Furigana:
            base = " " + entry.surface_kanji + "[" + entry.furigana + "]";
            break;
        case RenderMode::Furikanji:
            base = " " + entry.furigana + "[" + entry.surface_kanji + "]";
            break;
        case RenderMode::KanaOnly:
            base = entry.furigana;
            break;
    }
    if (!with_tags) {
        return base;
    }
    const std::string tag = tag_name(entry.reading_class);
    return "<" + tag + ">" + base + "</" + tag + ">";
}

std::string Reconstructor::reconstruct(const WordRendering& word, RenderMode mode, const WithTagsDef& tags) const {
    std::vector<RenderEntry> spans;
    if (tags.with_tags) {
        spans = merge_entries(word.entries, mode, tags.merge_consecutive);
    } else {
        // Without tags the class boundaries are invisible, so only the highlight splits the word
        for (const auto& entry : word.entries) {
            if (!spans.empty() && spans.back().is_highlighted == entry.is_highlighted) {
                spans.back().surface_kanji += entry.surface_kanji;
                spans.back().furigana += entry.furigana;
                continue;
            }
            spans.push_back(entry);
        }
    }

    const bool outside = okurigana_outside_highlight(word, tags);
    std::string okurigana = word.okurigana;
    if (tags.with_tags && !okurigana.empty()) {
        okurigana = "<oku>" + okurigana + "</oku>";
    }

    std::string out;
    bool in_highlight = false;
    for (const auto& span : spans) {
        if (mode != RenderMode::KanaOnly && span.surface_kanji.empty()) {
            continue;
        }
        if (span.is_highlighted && !in_highlight) {
            out += "<b>";
            in_highlight = true;
        } else if (!span.is_highlighted && in_highlight) {
            out += "</b>";
            in_highlight = false;
        }
        out += render_span(span, mode, tags.with_tags);
    }
    if (in_highlight) {
        if (!outside) {
            out += okurigana;
            okurigana.clear();
        }
        out += "</b>";
    }
    out += okurigana;
    out += word.rest;

    if (debug_) {
        std::cerr << "[yomikata] Rendered " << spans.size() << " spans as " << to_string(mode) << ": " << out << "\n";
    }
    return out;
}

} // namespace yomikata
