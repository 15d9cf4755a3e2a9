#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <unicode/regex.h>

#include "yomikata/alignment.h"
#include "yomikata/exceptions.h"
#include "yomikata/jukujikun.h"
#include "yomikata/kanji_dictionary.h"
#include "yomikata/morph_analyzer.h"
#include "yomikata/okurigana.h"
#include "yomikata/reading_matcher.h"
#include "yomikata/reconstructor.h"
#include "yomikata/types.h"

namespace yomikata {

// A written unit of a word: one kanji or 々, or a whole digit run
struct WrittenUnit {
    std::string surface;
    std::size_t first = 0;   // first alignment position it covers
    std::size_t count = 1;
    bool numeral = false;
};

// A word with its digit runs spelled out as kanji numerals
struct ExpandedWord {
    std::vector<std::string> kanji;   // positions the alignment works on
    std::vector<bool> numeral;
    std::vector<WrittenUnit> units;
};

ExpandedWord expand_numerals(const std::string& word);

// Whether the word is read as a unit around the highlighted kanji (kanji alone, kanji々, kanji twice)
bool is_whole_word(const WordToken& token);

class FuriganaEngine {
public:
    // A null analyzer is replaced by NullAnalyzer, a null exception table by the built-in one
    FuriganaEngine(std::shared_ptr<const KanjiDictionary> dictionary,
                   std::shared_ptr<const ExceptionDictionary> exceptions = nullptr,
                   std::shared_ptr<const MorphAnalyzer> analyzer = nullptr);

    void set_debug(bool debug);
    void set_max_partitions(std::size_t limit) { search_->set_max_partitions(limit); }

    // Split the reading over the kanji of the word, filling compound readings
    MoraAlignment align(const WordToken& token) const;

    // Render one token; the output starts with the space the furigana modes put before kanji
    std::string render_word(const WordToken& token, RenderMode mode, const WithTagsDef& tags) const;

    // Render every word[reading]kana token of text, leaving the rest as it is
    std::string highlight_text(const std::string& text, const std::optional<std::string>& kanji,
                               RenderMode mode, const WithTagsDef& tags) const;

    const KanjiDictionary& dictionary() const { return *dictionary_; }
    const ExceptionDictionary& exceptions() const { return *exceptions_; }

private:
    std::shared_ptr<const KanjiDictionary> dictionary_;
    std::shared_ptr<const ExceptionDictionary> exceptions_;
    std::shared_ptr<const MorphAnalyzer> analyzer_;
    std::shared_ptr<OkuriganaDetector> okurigana_;
    std::shared_ptr<ReadingMatcher> matcher_;
    std::shared_ptr<AlignmentSearch> search_;
    std::shared_ptr<JukujikunProcessor> jukujikun_;
    Reconstructor reconstructor_;
    std::unique_ptr<icu::RegexPattern> token_pattern_;
    bool debug_ = false;

    MoraAlignment align_expanded(const WordToken& token, const ExpandedWord& expanded) const;
    MoraAlignment align_exception(const ExceptionEntry& entry, const ExpandedWord& expanded,
                                  const std::string& trailing) const;
    WordRendering lower(const WordToken& token, const ExpandedWord& expanded, const MoraAlignment& alignment,
                        const WithTagsDef& tags) const;
    std::string render_error(const WordToken& token, RenderMode mode) const;
};

} // namespace yomikata
