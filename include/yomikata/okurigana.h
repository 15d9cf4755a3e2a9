#pragma once

#include <memory>
#include <string>
#include <vector>

#include "yomikata/kanji_dictionary.h"
#include "yomikata/morph_analyzer.h"
#include "yomikata/types.h"

namespace yomikata {

// Which text heads the string handed to the analyzer
enum class ParseStrategy {
    Word,      // the kanji as written
    Reading    // the kana reading of the kanji
};

enum class HeadType {
    IAdjective,
    NaAdjective,
    Verb,
    Adverb,
    Noun
};

class OkuriganaDetector {
public:
    OkuriganaDetector(std::shared_ptr<const MorphAnalyzer> analyzer,
                      std::shared_ptr<const KanjiDictionary> dictionary);

    void set_debug(bool debug) { debug_ = debug; }

    // Longest inflected tail of word (read as reading) at the start of trailing.
    // Retries once with the other parse strategy when the head does not inflect.
    OkuriResult detect(const std::string& word, const std::string& reading, const std::string& trailing,
                       ParseStrategy strategy = ParseStrategy::Word) const;

    // Match the trailing kana against the inflections of a dictionary okurigana.
    // kana_reading is the kana the kanji was matched with.
    OkuriResult check_inflection(const std::string& reading_okuri, const std::string& kanji,
                                 const std::string& kana_reading, const std::string& trailing) const;

    // Okurigana after the last kanji of a word, given how that kanji was matched.
    // word and word_reading are the whole word, used for verbal nouns.
    OkuriResult extract_for_match(const ReadingMatchInfo& match, const std::string& trailing,
                                  const std::string& word, const std::string& word_reading) const;

    const MorphAnalyzer& analyzer() const { return *analyzer_; }

private:
    std::shared_ptr<const MorphAnalyzer> analyzer_;
    std::shared_ptr<const KanjiDictionary> dictionary_;
    bool debug_ = false;

    OkuriResult onyomi_okurigana(const ReadingMatchInfo& match, const std::string& trailing,
                                 const std::string& word, const std::string& word_reading) const;
    OkuriResult kunyomi_okurigana(const ReadingMatchInfo& match, const std::string& trailing) const;
};

// Coarse class of the first token of an analyzed word; false when it cannot inflect
bool head_type_of(const MorphToken& token, HeadType& type);

// Whether the token at index continues the inflected tail of a verb-like head
bool continues_verb(const std::vector<MorphToken>& tokens, std::size_t index);

// Whether the token at index continues the tail of a head of the given type;
// suru is set when the token is a form of する
bool continues_inflection(const std::vector<MorphToken>& tokens, std::size_t index, HeadType type,
                          bool& suru);

} // namespace yomikata
