#include "yomikata/number_to_kanji.h"
#include "yomikata/unicode_utils.h"

#include <array>
#include <cstdint>
#include <limits>
#include <vector>

namespace yomikata {

namespace {
using yomikata::unicode::first_code_point;
using yomikata::unicode::is_digit_char;
using yomikata::unicode::split_chars;

const std::array<const char*, 10> kDigits = {"零", "一", "二", "三", "四", "五", "六", "七", "八", "九"};
const std::array<const char*, 4> kSmallUnits = {"", "十", "百", "千"};
const std::array<const char*, 5> kMyriadUnits = {"", "万", "億", "兆", "京"};

int digit_value(const std::string& ch) {
    UChar32 c = first_code_point(ch);
    if (c >= 0xFF10) {
        return static_cast<int>(c - 0xFF10);
    }
    return static_cast<int>(c - '0');
}

// 0 < group < 10000; a 一 before 十 百 千 is left out
std::string group_to_kanji(int group) {
    std::string out;
    for (int place = 3; place >= 0; --place) {
        int divisor = 1;
        for (int i = 0; i < place; ++i) {
            divisor *= 10;
        }
        int digit = (group / divisor) % 10;
        if (digit == 0) {
            continue;
        }
        if (digit != 1 || place == 0) {
            out += kDigits[digit];
        }
        out += kSmallUnits[place];
    }
    return out;
}

} // namespace

std::string number_to_kanji(const std::string& text) {
    std::vector<std::string> chars = split_chars(text);
    if (chars.empty()) {
        return text;
    }
    std::uint64_t value = 0;
    const std::uint64_t max = std::numeric_limits<std::uint64_t>::max();
    for (const auto& ch : chars) {
        if (!is_digit_char(ch)) {
            return text;
        }
        const std::uint64_t digit = static_cast<std::uint64_t>(digit_value(ch));
        if (value > (max - digit) / 10) {
            return text;
        }
        value = value * 10 + digit;
    }
    if (value == 0) {
        return kDigits[0];
    }

    std::array<int, 5> groups{};
    std::uint64_t remaining = value;
    for (std::size_t i = 0; i < groups.size(); ++i) {
        groups[i] = static_cast<int>(remaining % 10000);
        remaining /= 10000;
    }

    std::string out;
    for (std::size_t i = groups.size(); i-- > 0;) {
        if (groups[i] == 0) {
            continue;
        }
        if (!(groups[i] == 1 && i > 0)) {
            out += group_to_kanji(groups[i]);
        }
        out += kMyriadUnits[i];
    }
    return out;
}

} // namespace yomikata
