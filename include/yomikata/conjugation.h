#pragma once

#include <optional>
#include <string>
#include <vector>

#include "yomikata/types.h"

namespace yomikata {

// Dictionary okurigana minus the final kana that carries the conjugation
// (う く ぐ す つ ぬ ぶ む る い). nullopt when the okurigana does not conjugate.
std::optional<std::string> conjugatable_stem(const std::string& okurigana);

// Okurigana of the continuative (noun) form: 引.く gives き, 晴.れる gives れ.
// Empty when the word has no such form.
std::string noun_form_okuri(const std::string& okurigana);

// Inflected endings that may follow the conjugatable stem of a word whose
// dictionary okurigana ends in the given kana. For 為 the endings are given
// relative to the already matched mora (し, さ or す).
std::vector<std::string> conjugation_forms(const std::string& okurigana, const std::string& kanji,
                                           const std::string& matched_mora);

// Inflected forms of する, dictionary form first
const std::vector<std::string>& suru_forms();

// Longest form at the start of text. The result is Full with the form as okurigana,
// Empty when only the bare stem is valid (ichidan verbs and i-adjectives), or None.
OkuriResult longest_conjugation(const std::string& text, const std::string& okurigana,
                                const std::string& kanji, const std::string& matched_mora);

// Same search over the forms of する
OkuriResult longest_suru_conjugation(const std::string& text);

} // namespace yomikata
