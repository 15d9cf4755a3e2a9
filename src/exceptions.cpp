#include "yomikata/exceptions.h"
#include "yomikata/unicode_utils.h"

#include <fstream>
#include <initializer_list>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace yomikata {

namespace {
using yomikata::unicode::char_count;
using yomikata::unicode::split_chars;

const std::string kKeySeparator = "_";

std::string key_of(const std::string& word, const std::string& furigana) {
    return word + kKeySeparator + furigana;
}

MatchType match_type_from_string(const std::string& text) {
    if (text == "onyomi") {
        return MatchType::Onyomi;
    }
    if (text == "kunyomi") {
        return MatchType::Kunyomi;
    }
    // Unknown types are read as jukujikun
    return MatchType::Jukujikun;
}

ExceptionEntry make_entry(const std::string& word, const std::string& furigana,
                          std::initializer_list<ExceptionPart> parts) {
    ExceptionEntry entry;
    entry.word = word;
    entry.furigana = furigana;
    entry.parts = parts;
    return entry;
}

std::vector<ExceptionEntry> builtin_entries() {
    const MatchType on = MatchType::Onyomi;
    const MatchType kun = MatchType::Kunyomi;
    const MatchType juk = MatchType::Jukujikun;
    return {
        make_entry("麻雀", "まーじゃん", {{juk, "まー"}, {juk, "じゃん"}}),
        make_entry("菠薐草", "ほうれんそう", {{juk, "ほう"}, {juk, "れん"}, {on, "そう"}}),
        make_entry("菠薐", "ほうれん", {{juk, "ほう"}, {juk, "れん"}}),
        make_entry("清々", "すがすが", {{juk, "すが"}, {juk, "すが"}}),
        make_entry("田圃", "たんぼ", {{juk, "たん"}, {on, "ぼ"}}),
        make_entry("袋小路", "ふくろこうじ", {{kun, "ふくろ"}, {juk, "こう"}, {kun, "じ"}}),
        make_entry("尻尾", "しっぽ", {{kun, "しっ"}, {kun, "ぽ"}}),
        make_entry("風邪", "かぜ", {{juk, "か"}, {juk, "ぜ"}}),
        make_entry("薔薇", "ばら", {{juk, "ば"}, {juk, "ら"}}),
        make_entry("真面目", "まじめ", {{juk, "ま"}, {juk, "じ"}, {kun, "め"}}),
        make_entry("蕎麦", "そば", {{juk, "そ"}, {juk, "ば"}}),
        make_entry("襤褸", "ぼろ", {{juk, "ぼ"}, {juk, "ろ"}}),
        // 愈 repeated keeps its full kunyomi
        make_entry("愈々", "いよいよ", {{kun, "いよ"}, {kun, "いよ"}}),
        // shortened repetition of ちょう
        make_entry("蝶々", "ちょうちょ", {{on, "ちょう"}, {on, "ちょ"}}),
    };
}

} // namespace

ExceptionDictionary::ExceptionDictionary() {
    for (const auto& entry : builtin_entries()) {
        add(entry);
    }
}

bool ExceptionDictionary::add(const ExceptionEntry& entry) {
    if (entry.word.empty() || entry.parts.size() != char_count(entry.word)) {
        std::cerr << "[yomikata] Exception for " << entry.word << "[" << entry.furigana << "] has "
                  << entry.parts.size() << " parts for " << char_count(entry.word) << " kanji\n";
        return false;
    }
    const std::string key = key_of(entry.word, entry.furigana);
    auto it = index_.find(key);
    if (it != index_.end()) {
        entries_[it->second] = entry;
        return true;
    }
    index_.emplace(key, entries_.size());
    entries_.push_back(entry);
    return true;
}

bool ExceptionDictionary::load(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        std::cerr << "[yomikata] Cannot open exception file: " << path << "\n";
        return false;
    }
    std::stringstream buffer;
    buffer << input.rdbuf();
    return load_text(buffer.str(), path);
}

bool ExceptionDictionary::load_from_string(const std::string& json_text) {
    return load_text(json_text, "<string>");
}

bool ExceptionDictionary::load_text(const std::string& json_text, const std::string& source) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& ex) {
        std::cerr << "[yomikata] Malformed exception file " << source << ": " << ex.what() << "\n";
        return false;
    }
    if (!root.is_object()) {
        std::cerr << "[yomikata] Exception file " << source << " is not a JSON object\n";
        return false;
    }

    bool all_ok = true;
    std::size_t loaded = 0;
    for (const auto& [key, value] : root.items()) {
        std::size_t sep = key.find(kKeySeparator);
        if (sep == std::string::npos || !value.is_array()) {
            std::cerr << "[yomikata] Skipping exception key " << key << " in " << source << "\n";
            all_ok = false;
            continue;
        }
        ExceptionEntry entry;
        entry.word = key.substr(0, sep);
        entry.furigana = key.substr(sep + kKeySeparator.size());
        for (const auto& item : value) {
            if (!item.is_object()) {
                continue;
            }
            ExceptionPart part;
            part.match_type = match_type_from_string(item.value("type", std::string("jukujikun")));
            part.mora = item.value("mora", std::string());
            entry.parts.push_back(part);
        }
        if (add(entry)) {
            ++loaded;
        } else {
            all_ok = false;
        }
    }
    if (debug_) {
        std::cerr << "[yomikata] Loaded " << loaded << " exceptions from " << source << "\n";
    }
    return all_ok;
}

const ExceptionEntry* ExceptionDictionary::find_exact(const std::string& word,
                                                      const std::string& furigana) const {
    auto it = index_.find(key_of(word, furigana));
    if (it == index_.end()) {
        return nullptr;
    }
    return &entries_[it->second];
}

const ExceptionEntry* ExceptionDictionary::find_within(const std::string& word,
                                                       const std::string& reading) const {
    for (const auto& entry : entries_) {
        if (word.find(entry.word) != std::string::npos && reading.find(entry.furigana) != std::string::npos) {
            return &entry;
        }
    }
    return nullptr;
}

MoraAlignment alignment_from_exception(const ExceptionEntry& entry) {
    MoraAlignment alignment;
    std::vector<std::string> kanji = split_chars(entry.word);
    for (std::size_t i = 0; i < entry.parts.size() && i < kanji.size(); ++i) {
        const ExceptionPart& part = entry.parts[i];
        ReadingMatchInfo match;
        match.matched_mora = part.mora;
        match.dict_form = part.mora;
        match.match_type = part.match_type;
        match.kanji = kanji[i];
        alignment.per_kanji.push_back(match);
        alignment.mora_partition.push_back({part.mora});
    }
    alignment.is_complete = true;
    return alignment;
}

} // namespace yomikata
