#pragma once

#include <string>

namespace yomikata {

// Spell a run of ASCII or full-width digits as kanji numerals (1234 → 千二百三十四).
// Text that is not made only of digits, or does not fit 64 bits, comes back unchanged.
std::string number_to_kanji(const std::string& text);

} // namespace yomikata
