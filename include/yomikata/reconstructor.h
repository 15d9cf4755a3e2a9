#pragma once

#include <optional>
#include <string>
#include <vector>

#include "yomikata/types.h"

namespace yomikata {

// Everything needed to render one word token
struct WordRendering {
    std::vector<RenderEntry> entries;   // one per kanji position, in order
    std::string okurigana;
    std::string rest;
    // Reading class of the highlighted kanji; empty when nothing is highlighted
    std::optional<ReadingClass> highlight_class;
};

// Tag name used in the output markup: on, kun, juk or mix
const char* tag_name(ReadingClass reading_class);

// Join adjacent entries into spans. Repeats of the same kanji always join; with merge_consecutive
// entries of the same class and highlight join too. Numeral runs join outside kana-only mode.
std::vector<RenderEntry> merge_entries(const std::vector<RenderEntry>& entries, RenderMode mode,
                                       bool merge_consecutive);

// Whether the okurigana stays outside a highlighted verbal noun (勉強<b>…</b>しません).
// A single kanji keeps any other inflection inside the highlight.
bool okurigana_outside_highlight(const WordRendering& word, const WithTagsDef& tags);

class Reconstructor {
public:
    Reconstructor() = default;

    void set_debug(bool debug) { debug_ = debug; }

    std::string reconstruct(const WordRendering& word, RenderMode mode, const WithTagsDef& tags) const;

private:
    bool debug_ = false;

    std::string render_span(const RenderEntry& entry, RenderMode mode, bool with_tags) const;
};

} // namespace yomikata
