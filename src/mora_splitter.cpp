#include "yomikata/mora_splitter.h"
#include "yomikata/phonetic_rules.h"
#include "yomikata/unicode_utils.h"

#include <algorithm>

namespace yomikata {

namespace {
using yomikata::unicode::is_katakana_str;
using yomikata::unicode::split_chars;
using yomikata::unicode::to_hiragana;

constexpr std::size_t kLongestMora = 3;
const std::string kLongVowelMark = "ー";

std::vector<std::string> greedy_split(const std::vector<std::string>& chars) {
    std::vector<std::string> mora;
    std::size_t i = 0;
    while (i < chars.size()) {
        std::size_t taken = 1;
        for (std::size_t len = std::min(kLongestMora, chars.size() - i); len > 1; --len) {
            std::string candidate;
            for (std::size_t j = i; j < i + len; ++j) {
                candidate += chars[j];
            }
            if (rules::is_mora_pattern(candidate)) {
                taken = len;
                break;
            }
        }
        std::string unit;
        for (std::size_t j = i; j < i + taken; ++j) {
            unit += chars[j];
        }
        mora.push_back(std::move(unit));
        i += taken;
    }
    return mora;
}

std::vector<std::string> merge_n(const std::vector<std::string>& mora) {
    std::vector<std::string> merged;
    for (const auto& unit : mora) {
        if (unit == "ん" && !merged.empty()) {
            merged.back() += unit;
        } else {
            merged.push_back(unit);
        }
    }
    return merged;
}

std::vector<std::string> expand_long_vowels(const std::vector<std::string>& mora) {
    std::vector<std::string> expanded;
    for (const auto& unit : mora) {
        auto chars = split_chars(unit);
        if (chars.size() >= 2 && chars.back() == kLongVowelMark) {
            std::string vowel = rules::long_vowel_of(chars[chars.size() - 2]);
            if (!vowel.empty()) {
                expanded.push_back(unit.substr(0, unit.size() - kLongVowelMark.size()));
                expanded.push_back(vowel);
                continue;
            }
        }
        expanded.push_back(unit);
    }
    return expanded;
}

} // namespace

MoraSplit split_mora(const std::string& reading, std::size_t kanji_count) {
    MoraSplit result;
    result.was_katakana = is_katakana_str(reading);
    std::string hiragana = to_hiragana(reading);

    result.mora = greedy_split(split_chars(hiragana));

    bool has_n = std::find(result.mora.begin(), result.mora.end(), "ん") != result.mora.end();
    if (has_n && result.mora.size() > kanji_count) {
        result.mora = merge_n(result.mora);
    }

    if (hiragana.find(kLongVowelMark) != std::string::npos && result.mora.size() < kanji_count) {
        result.mora = expand_long_vowels(result.mora);
    }
    return result;
}

std::string join_mora(const std::vector<std::string>& mora) {
    std::string joined;
    for (const auto& unit : mora) {
        joined += unit;
    }
    return joined;
}

} // namespace yomikata
