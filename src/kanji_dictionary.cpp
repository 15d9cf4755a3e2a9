#include "yomikata/kanji_dictionary.h"
#include "yomikata/unicode_utils.h"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace yomikata {

namespace {
using yomikata::unicode::split_chars;

const std::string kReadingSeparator = "、";

std::string trim(const std::string& text) {
    const char* spaces = " \t\r\n";
    std::size_t start = text.find_first_not_of(spaces);
    if (start == std::string::npos) {
        return "";
    }
    std::size_t end = text.find_last_not_of(spaces);
    return text.substr(start, end - start + 1);
}

std::vector<std::string> split_joined(const std::string& joined) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true) {
        std::size_t pos = joined.find(kReadingSeparator, start);
        if (pos == std::string::npos) {
            parts.push_back(joined.substr(start));
            break;
        }
        parts.push_back(joined.substr(start, pos - start));
        start = pos + kReadingSeparator.size();
    }
    return parts;
}

std::vector<std::string> read_readings(const nlohmann::json& value) {
    std::vector<std::string> raw;
    if (value.is_string()) {
        raw = split_joined(value.get<std::string>());
    } else if (value.is_array()) {
        for (const auto& item : value) {
            if (item.is_string()) {
                raw.push_back(item.get<std::string>());
            }
        }
    }
    std::vector<std::string> cleaned;
    for (const auto& reading : raw) {
        std::string clean = clean_reading(reading);
        if (!clean.empty() && std::find(cleaned.begin(), cleaned.end(), clean) == cleaned.end()) {
            cleaned.push_back(clean);
        }
    }
    return cleaned;
}

void append_unique(std::vector<std::string>& target, const std::vector<std::string>& extra) {
    for (const auto& reading : extra) {
        if (std::find(target.begin(), target.end(), reading) == target.end()) {
            target.push_back(reading);
        }
    }
}

} // namespace

std::string clean_reading(const std::string& raw) {
    std::string reading = raw;
    std::size_t paren = reading.find('(');
    if (paren != std::string::npos) {
        reading = reading.substr(0, paren);
    }
    reading = trim(reading);
    while (!reading.empty() && reading.front() == '-') {
        reading.erase(0, 1);
    }
    while (!reading.empty() && reading.back() == '-') {
        reading.pop_back();
    }
    return trim(reading);
}

bool KanjiDictionary::load(const std::string& path, bool merge) {
    std::ifstream input(path);
    if (!input) {
        std::cerr << "[yomikata] Cannot open kanji dictionary: " << path << "\n";
        return false;
    }
    std::stringstream buffer;
    buffer << input.rdbuf();
    return load_text(buffer.str(), path, merge);
}

bool KanjiDictionary::load_from_string(const std::string& json_text, bool merge) {
    return load_text(json_text, "<string>", merge);
}

bool KanjiDictionary::load_text(const std::string& json_text, const std::string& source, bool merge) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& ex) {
        std::cerr << "[yomikata] Malformed kanji dictionary " << source << ": " << ex.what() << "\n";
        return false;
    }
    if (!root.is_object()) {
        std::cerr << "[yomikata] Kanji dictionary " << source << " is not a JSON object\n";
        return false;
    }

    if (!merge) {
        entries_.clear();
    }

    std::size_t skipped = 0;
    for (const auto& [kanji, value] : root.items()) {
        if (split_chars(kanji).size() != 1 || !value.is_object()) {
            ++skipped;
            continue;
        }
        KanjiReadingData data;
        if (value.contains("onyomi")) {
            data.onyomi = read_readings(value["onyomi"]);
        }
        if (value.contains("kunyomi")) {
            data.kunyomi = read_readings(value["kunyomi"]);
        }
        add(kanji, data, merge);
    }

    if (debug_) {
        std::cerr << "[yomikata] Loaded " << entries_.size() << " kanji from " << source;
        if (skipped > 0) {
            std::cerr << " (" << skipped << " entries skipped)";
        }
        std::cerr << "\n";
    }
    return true;
}

void KanjiDictionary::add(const std::string& kanji, const KanjiReadingData& data, bool merge) {
    auto it = entries_.find(kanji);
    if (it == entries_.end() || !merge) {
        entries_[kanji] = data;
        return;
    }
    append_unique(it->second.onyomi, data.onyomi);
    append_unique(it->second.kunyomi, data.kunyomi);
}

const KanjiReadingData* KanjiDictionary::find(const std::string& kanji) const {
    auto it = entries_.find(kanji);
    if (it == entries_.end()) {
        return nullptr;
    }
    return &it->second;
}

} // namespace yomikata
