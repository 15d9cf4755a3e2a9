#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "yomikata/types.h"

namespace yomikata {

// Hand-assigned per-kanji reading of a word the general search cannot split
struct ExceptionEntry {
    std::string word;
    std::string furigana;
    std::vector<ExceptionPart> parts;   // one per kanji of word
};

class ExceptionDictionary {
public:
    // Starts out with the built-in table
    ExceptionDictionary();

    void set_debug(bool debug) { debug_ = debug; }

    // Merge entries from JSON: {"word_furigana": [{"type": "...", "mora": "..."}, ...]}.
    // Returns false on unreadable or malformed input, or when an entry is rejected.
    bool load(const std::string& path);
    bool load_from_string(const std::string& json_text);

    // Replaces an entry with the same word and furigana. Rejects entries
    // whose part count differs from the character count of the word.
    bool add(const ExceptionEntry& entry);

    const ExceptionEntry* find_exact(const std::string& word, const std::string& furigana) const;

    // First entry whose word occurs inside word and whose furigana occurs inside reading
    const ExceptionEntry* find_within(const std::string& word, const std::string& reading) const;

    const std::vector<ExceptionEntry>& entries() const { return entries_; }
    std::size_t size() const { return entries_.size(); }

private:
    std::vector<ExceptionEntry> entries_;
    std::unordered_map<std::string, std::size_t> index_;
    bool debug_ = false;

    bool load_text(const std::string& json_text, const std::string& source);
};

// Complete alignment that assigns every part of the entry verbatim
MoraAlignment alignment_from_exception(const ExceptionEntry& entry);

} // namespace yomikata
