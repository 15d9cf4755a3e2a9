#pragma once

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace yomikata {
namespace rules {

// Voiced forms a kana takes as the second element of a compound (か→が, は→ば/ぱ)
const std::vector<std::string>& rendaku_variants(const std::string& kana);

// True when the kana is the voiced form of some plain kana
bool is_rendaku_kana(const std::string& kana);

// Final kana that can be replaced by っ (つ ち く き り ん う)
bool can_become_small_tsu(const std::string& kana);

// First-kana contractions: あ→や/ゃ, お→よ/ょ, う→ゆ/ゅ
const std::vector<std::string>& vowel_change_variants(const std::string& kana);

// や→ゃ, ゆ→ゅ, よ→ょ; empty for other kana
std::string small_yoon(const std::string& kana);

bool is_small_yoon(const std::string& kana);

// Final kana that may be pronounced ん in compounds (の, に)
bool can_become_n(const std::string& kana);

// Vowel kana a long vowel mark after this kana stands for; empty when unknown
std::string long_vowel_of(const std::string& kana);

// Known mora shapes, with and without a following っ
bool is_mora_pattern(const std::string& kana);

// First kana of a trailing text that can start a godan す or する inflection
bool is_godan_su_first_kana(const std::string& kana);

// Kana that normally start a particle rather than an inflected tail
bool is_particle_head(const std::string& kana);

// Vowel row of a kana ('a', 'i', 'u', 'e', 'o'), or 0 when unknown
char kana_row(const std::string& kana);

// Kana in the same consonant column on another vowel row (く + 'i' → き)
std::string shift_row(const std::string& kana, char row);

} // namespace rules
} // namespace yomikata
