#include "yomikata/conjugation.h"
#include "yomikata/phonetic_rules.h"
#include "yomikata/unicode_utils.h"

#include <unordered_set>

namespace yomikata {

namespace {
using yomikata::unicode::char_count;
using yomikata::unicode::drop_last;
using yomikata::unicode::last_char;
using yomikata::unicode::starts_with;

const std::string kSuruKanji = "為";

bool is_godan_ending(const std::string& kana) {
    static const std::unordered_set<std::string> endings = {
        "う", "く", "ぐ", "す", "つ", "ぬ", "ぶ", "む", "る"};
    return endings.count(kana) > 0;
}

void append_all(std::vector<std::string>& forms, const std::string& head,
                const std::vector<std::string>& tails) {
    if (head.empty()) {
        return;
    }
    for (const auto& tail : tails) {
        forms.push_back(head + tail);
    }
}

// Sound-changed stem used before て and た
std::string onbin_of(const std::string& ending, const std::string& kanji) {
    if (ending == "く" && kanji == "行") {
        return "っ";
    }
    if (ending == "う" || ending == "つ" || ending == "る") return "っ";
    if (ending == "く" || ending == "ぐ") return "い";
    if (ending == "ぬ" || ending == "ぶ" || ending == "む") return "ん";
    if (ending == "す") return "し";
    return "";
}

bool voiced_te(const std::string& ending) {
    return ending == "ぐ" || ending == "ぬ" || ending == "ぶ" || ending == "む";
}

std::vector<std::string> godan_forms(const std::string& ending, const std::string& kanji) {
    std::vector<std::string> forms;
    forms.push_back(ending);

    append_all(forms, rules::shift_row(ending, 'i'),
               {"", "ます", "ました", "ません", "ませんでした", "ましょう", "たい", "たくない",
                "たかった", "ながら", "そう"});

    const std::string a_row = ending == "う" ? "わ" : rules::shift_row(ending, 'a');
    append_all(forms, a_row,
               {"ない", "なかった", "なくて", "なければ", "ないで", "ず", "れる", "れた", "れない",
                "せる", "せた", "せない", "れます", "せます"});

    append_all(forms, rules::shift_row(ending, 'e'), {"", "ば", "る", "た", "ない", "ます", "ません"});
    append_all(forms, rules::shift_row(ending, 'o'), {"う"});

    const std::string onbin = onbin_of(ending, kanji);
    if (voiced_te(ending)) {
        append_all(forms, onbin, {"で", "だ", "でも", "だら", "だり", "でる", "だろう"});
    } else {
        append_all(forms, onbin, {"て", "た", "ても", "たら", "たり", "てる", "たろう"});
    }
    return forms;
}

const std::vector<std::string>& ichidan_forms() {
    static const std::vector<std::string> forms = {
        "る", "れば", "ろ", "よう", "ない", "なかった", "なくて", "なければ", "ないで", "ず",
        "ます", "ました", "ません", "ませんでした", "ましょう", "て", "た", "たら", "たり",
        "ても", "てる", "たい", "たくない", "たかった", "られる", "られた", "られない", "させる",
        "させた", "させない", "ながら", "そう"};
    return forms;
}

const std::vector<std::string>& adjective_forms() {
    static const std::vector<std::string> forms = {
        "い", "く", "くて", "くない", "くなかった", "くなる", "くても", "かった", "かったら",
        "ければ", "かろう", "さ", "そう"};
    return forms;
}

// Forms of する written after the kana already read for 為
std::vector<std::string> suru_forms_after(const std::string& matched_mora) {
    std::vector<std::string> forms;
    for (const auto& form : suru_forms()) {
        if (!matched_mora.empty() && starts_with(form, matched_mora)) {
            std::string tail = form.substr(matched_mora.size());
            if (!tail.empty()) {
                forms.push_back(tail);
            }
        }
    }
    return forms;
}

OkuriResult longest_of(const std::string& text, const std::vector<std::string>& forms, bool empty_allowed) {
    OkuriResult result;
    result.rest = text;
    for (const auto& form : forms) {
        if (form.empty() || !starts_with(text, form)) {
            continue;
        }
        if (form.size() > result.okurigana.size()) {
            result.okurigana = form;
        }
    }
    if (!result.okurigana.empty()) {
        result.kind = OkuriKind::Full;
        result.rest = text.substr(result.okurigana.size());
    } else if (empty_allowed) {
        result.kind = OkuriKind::Empty;
    }
    return result;
}

} // namespace

std::optional<std::string> conjugatable_stem(const std::string& okurigana) {
    if (okurigana.empty()) {
        return std::nullopt;
    }
    const std::string ending = last_char(okurigana);
    if (is_godan_ending(ending) || ending == "い") {
        return drop_last(okurigana);
    }
    return std::nullopt;
}

std::string noun_form_okuri(const std::string& okurigana) {
    if (okurigana.empty()) {
        return "";
    }
    const std::string ending = last_char(okurigana);
    if (ending == "い") {
        return "";
    }
    if (ending == "る" && char_count(okurigana) > 1) {
        const std::string stem = drop_last(okurigana);
        char row = rules::kana_row(last_char(stem));
        if (row == 'e' || row == 'i') {
            return stem;
        }
    }
    if (is_godan_ending(ending)) {
        return drop_last(okurigana) + rules::shift_row(ending, 'i');
    }
    return "";
}

const std::vector<std::string>& suru_forms() {
    static const std::vector<std::string> forms = {
        "する", "すれば", "しろ", "せよ", "しよう", "しない", "しなかった", "しなくて",
        "しなければ", "します", "しました", "しません", "しませんでした", "しましょう", "して",
        "した", "したら", "したり", "しても", "してる", "したい", "される", "された", "されない",
        "させる", "させた", "させない", "させられる", "せず"};
    return forms;
}

std::vector<std::string> conjugation_forms(const std::string& okurigana, const std::string& kanji,
                                           const std::string& matched_mora) {
    std::vector<std::string> forms;
    if (okurigana.empty()) {
        return forms;
    }
    const std::string ending = last_char(okurigana);
    if (ending == "い") {
        return adjective_forms();
    }
    if (!is_godan_ending(ending)) {
        return forms;
    }
    if (kanji == kSuruKanji && ending == "る") {
        return suru_forms_after(matched_mora);
    }
    forms = godan_forms(ending, kanji);
    if (ending == "る") {
        // Godan and ichidan る verbs share the dictionary ending
        forms.insert(forms.end(), ichidan_forms().begin(), ichidan_forms().end());
    }
    return forms;
}

OkuriResult longest_conjugation(const std::string& text, const std::string& okurigana,
                                const std::string& kanji, const std::string& matched_mora) {
    if (text.empty() || okurigana.empty()) {
        OkuriResult none;
        none.rest = text;
        return none;
    }
    const std::string ending = last_char(okurigana);
    const bool empty_allowed = ending == "い" || (ending == "る" && kanji != kSuruKanji);
    return longest_of(text, conjugation_forms(okurigana, kanji, matched_mora), empty_allowed);
}

OkuriResult longest_suru_conjugation(const std::string& text) {
    OkuriResult result = longest_of(text, suru_forms(), false);
    result.verb_like = result.kind == OkuriKind::Full;
    return result;
}

} // namespace yomikata
