#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace yomikata {

struct MoraSplit {
    std::vector<std::string> mora;   // hiragana-normalized
    bool was_katakana = false;
};

// Segment a kana reading into mora for a word of kanji_count kanji.
// Palatalized, elongated and っ-final mora are matched before single kana;
// characters that are no known mora come back as singletons.
// A standalone ん is folded into its predecessor when there are more mora than kanji.
MoraSplit split_mora(const std::string& reading, std::size_t kanji_count);

std::string join_mora(const std::vector<std::string>& mora);

} // namespace yomikata
