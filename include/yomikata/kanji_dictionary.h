#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace yomikata {

struct KanjiReadingData {
    std::vector<std::string> onyomi;
    std::vector<std::string> kunyomi;   // okurigana boundary marked with "."
};

// Strip annotations from a raw dictionary reading: everything from "(" on,
// surrounding whitespace and a leading or trailing "-"
std::string clean_reading(const std::string& raw);

class KanjiDictionary {
public:
    KanjiDictionary() = default;

    void set_debug(bool debug) { debug_ = debug; }

    // Load a JSON object keyed by kanji; readings may be arrays or "、"-joined strings.
    // In merge mode readings are appended to existing entries.
    bool load(const std::string& path, bool merge = false);
    bool load_from_string(const std::string& json_text, bool merge = false);

    void add(const std::string& kanji, const KanjiReadingData& data, bool merge = false);

    // nullptr when the kanji has no recorded readings
    const KanjiReadingData* find(const std::string& kanji) const;

    std::size_t size() const { return entries_.size(); }

private:
    std::unordered_map<std::string, KanjiReadingData> entries_;
    bool debug_ = false;

    bool load_text(const std::string& json_text, const std::string& source, bool merge);
};

} // namespace yomikata
