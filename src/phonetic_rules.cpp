#include "yomikata/phonetic_rules.h"

#include <array>

namespace yomikata {
namespace rules {

namespace {

const std::vector<std::string> kEmpty;

const std::unordered_map<std::string, std::vector<std::string>>& rendaku_table() {
    static const std::unordered_map<std::string, std::vector<std::string>> table = {
        {"か", {"が"}}, {"き", {"ぎ"}}, {"く", {"ぐ"}}, {"け", {"げ"}}, {"こ", {"ご"}},
        {"さ", {"ざ"}}, {"し", {"じ"}}, {"す", {"ず"}}, {"せ", {"ぜ"}}, {"そ", {"ぞ"}},
        {"た", {"だ"}}, {"ち", {"ぢ"}}, {"つ", {"づ"}}, {"て", {"で"}}, {"と", {"ど"}},
        {"は", {"ば", "ぱ"}}, {"ひ", {"び", "ぴ"}}, {"ふ", {"ぶ", "ぷ"}},
        {"へ", {"べ", "ぺ"}}, {"ほ", {"ぼ", "ぽ"}},
        {"う", {"ぬ"}},
    };
    return table;
}

const std::unordered_map<std::string, std::vector<std::string>>& vowel_change_table() {
    static const std::unordered_map<std::string, std::vector<std::string>> table = {
        {"お", {"よ", "ょ"}},
        {"あ", {"や", "ゃ"}},
        {"う", {"ゆ", "ゅ"}},
    };
    return table;
}

using Column = std::array<const char*, 5>;

// Gojuon columns ordered a, i, u, e, o; empty slots are ""
const std::vector<Column>& gojuon() {
    static const std::vector<Column> columns = {
        {"あ", "い", "う", "え", "お"},
        {"か", "き", "く", "け", "こ"},
        {"が", "ぎ", "ぐ", "げ", "ご"},
        {"さ", "し", "す", "せ", "そ"},
        {"ざ", "じ", "ず", "ぜ", "ぞ"},
        {"た", "ち", "つ", "て", "と"},
        {"だ", "ぢ", "づ", "で", "ど"},
        {"な", "に", "ぬ", "ね", "の"},
        {"は", "ひ", "ふ", "へ", "ほ"},
        {"ば", "び", "ぶ", "べ", "ぼ"},
        {"ぱ", "ぴ", "ぷ", "ぺ", "ぽ"},
        {"ま", "み", "む", "め", "も"},
        {"や", "", "ゆ", "", "よ"},
        {"ら", "り", "る", "れ", "ろ"},
        {"わ", "ゐ", "", "ゑ", "を"},
        {"ぁ", "ぃ", "ぅ", "ぇ", "ぉ"},
        {"ゃ", "", "ゅ", "", "ょ"},
        {"ゔ", "", "", "", ""},
    };
    return columns;
}

constexpr std::array<char, 5> kRows = {'a', 'i', 'u', 'e', 'o'};

int row_index(char row) {
    for (std::size_t i = 0; i < kRows.size(); ++i) {
        if (kRows[i] == row) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

const std::unordered_set<std::string>& mora_patterns() {
    static const std::unordered_set<std::string> patterns = [] {
        const std::vector<std::string> palatalized = {
            "くぃ", "きゃ", "きゅ", "きぇ", "きょ", "ぐぃ", "ぎゃ", "ぎゅ", "ぎぇ", "ぎょ",
            "すぃ", "しゃ", "しゅ", "しぇ", "しょ", "ずぃ", "じゃ", "じゅ", "じぇ", "じょ",
            "てぃ", "とぅ", "ちゃ", "ちゅ", "ちぇ", "ちょ", "でぃ", "どぅ", "ぢゃ", "でゅ",
            "ぢゅ", "ぢぇ", "ぢょ", "つぁ", "つぃ", "つぇ", "つぉ", "づぁ", "づぃ", "づぇ",
            "づぉ", "ひぃ", "ほぅ", "ひゃ", "ひゅ", "ひぇ", "ひょ", "びぃ", "びゃ", "びゅ",
            "びぇ", "びょ", "ぴぃ", "ぴゃ", "ぴゅ", "ぴぇ", "ぴょ", "ふぁ", "ふぃ", "ふぇ",
            "ふぉ", "ゔぁ", "ゔぃ", "ゔぇ", "ゔぉ", "ぬぃ", "にゃ", "にゅ", "にぇ", "にょ",
            "むぃ", "みゃ", "みゅ", "みぇ", "みょ", "るぃ", "りゃ", "りゅ", "りぇ", "りょ",
            "いぇ",
        };
        const std::vector<std::string> single = {
            "か", "く", "け", "こ", "き", "が", "ぐ", "げ", "ご", "ぎ",
            "さ", "す", "せ", "そ", "し", "ざ", "ず", "づ", "ぜ", "ぞ", "じ", "ぢ",
            "た", "と", "て", "ち", "だ", "で", "ど", "つ",
            "は", "へ", "ほ", "ひ", "ば", "ぶ", "べ", "ぼ", "び", "ぱ", "ぷ", "ぽ", "ぴ", "ふ", "ゔ",
            "な", "ぬ", "ね", "の", "に", "ま", "む", "め", "も", "み",
            "ら", "る", "れ", "ろ", "り", "あ", "い", "う", "え", "お",
            "や", "ゆ", "よ", "わ", "ゐ", "ゑ", "を",
        };
        std::unordered_set<std::string> all;
        for (const auto& mora : palatalized) {
            all.insert(mora);
        }
        for (const auto& mora : single) {
            all.insert(mora);
            all.insert(mora + "ー");
        }
        all.insert("ん");
        std::vector<std::string> base(all.begin(), all.end());
        for (const auto& mora : base) {
            all.insert(mora + "っ");
        }
        return all;
    }();
    return patterns;
}

} // namespace

const std::vector<std::string>& rendaku_variants(const std::string& kana) {
    const auto& table = rendaku_table();
    auto it = table.find(kana);
    return it == table.end() ? kEmpty : it->second;
}

bool is_rendaku_kana(const std::string& kana) {
    for (const auto& [plain, voiced] : rendaku_table()) {
        for (const auto& v : voiced) {
            if (v == kana) {
                return true;
            }
        }
    }
    return false;
}

bool can_become_small_tsu(const std::string& kana) {
    static const std::unordered_set<std::string> endings = {"つ", "ち", "く", "き", "り", "ん", "う"};
    return endings.count(kana) > 0;
}

const std::vector<std::string>& vowel_change_variants(const std::string& kana) {
    const auto& table = vowel_change_table();
    auto it = table.find(kana);
    return it == table.end() ? kEmpty : it->second;
}

std::string small_yoon(const std::string& kana) {
    if (kana == "や") return "ゃ";
    if (kana == "ゆ") return "ゅ";
    if (kana == "よ") return "ょ";
    return "";
}

bool is_small_yoon(const std::string& kana) {
    return kana == "ゃ" || kana == "ゅ" || kana == "ょ";
}

bool can_become_n(const std::string& kana) {
    return kana == "の" || kana == "に";
}

std::string long_vowel_of(const std::string& kana) {
    char row = kana_row(kana);
    switch (row) {
        case 'a': return "あ";
        case 'i': return "い";
        case 'u': return "う";
        case 'e': return "え";
        case 'o': return "お";
        default: return "";
    }
}

bool is_mora_pattern(const std::string& kana) {
    return mora_patterns().count(kana) > 0;
}

bool is_godan_su_first_kana(const std::string& kana) {
    return kana == "さ" || kana == "し" || kana == "す" || kana == "せ" || kana == "そ";
}

bool is_particle_head(const std::string& kana) {
    static const std::unordered_set<std::string> heads = {
        "を", "は", "が", "に", "で", "と", "も", "へ", "の", "や", "か"};
    return heads.count(kana) > 0;
}

char kana_row(const std::string& kana) {
    if (kana.empty()) {
        return 0;
    }
    for (const auto& column : gojuon()) {
        for (std::size_t i = 0; i < column.size(); ++i) {
            if (kana == column[i]) {
                return kRows[i];
            }
        }
    }
    return 0;
}

std::string shift_row(const std::string& kana, char row) {
    int target = row_index(row);
    if (target < 0 || kana.empty()) {
        return "";
    }
    for (const auto& column : gojuon()) {
        for (const char* slot : column) {
            if (kana == slot) {
                return column[static_cast<std::size_t>(target)];
            }
        }
    }
    return "";
}

} // namespace rules
} // namespace yomikata
