#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "yomikata/kanji_dictionary.h"
#include "yomikata/okurigana.h"
#include "yomikata/types.h"

namespace yomikata {

// Which sound change, if any, turns the dictionary reading (hiragana) into mora.
// okurigana is the kana after the kanji; it only matters for a dropped う before っ.
std::optional<ReadingVariant> check_reading_match(const std::string& reading, const std::string& mora,
                                                  const std::string& okurigana = "");

// A kunyomi surface to try against the mora, with its dictionary reading
struct KunyomiCandidate {
    std::string surface;
    std::string dict_form;
};

// Stem, then noun form, then the whole reading without its "." marker
std::vector<KunyomiCandidate> kunyomi_candidates(const std::string& kunyomi);

class ReadingMatcher {
public:
    ReadingMatcher(std::shared_ptr<const KanjiDictionary> dictionary,
                   std::shared_ptr<const OkuriganaDetector> okurigana);

    void set_debug(bool debug) { debug_ = debug; }

    std::optional<ReadingMatchInfo> match_onyomi(const std::string& kanji, const std::string& mora,
                                                 const std::string& okurigana, bool is_last) const;

    // When this is the last kanji and kana follows, readings are ranked by how much of
    // that kana their okurigana accounts for; a complete okurigana match wins outright
    std::optional<ReadingMatchInfo> match_kunyomi(const std::string& kanji, const std::string& mora,
                                                  const std::string& okurigana, bool is_last) const;

    // Onyomi first unless prefer_kunyomi
    std::optional<ReadingMatchInfo> match(const std::string& kanji, const std::string& mora,
                                          const std::string& okurigana, bool is_last,
                                          bool prefer_kunyomi = false) const;

    const KanjiDictionary& dictionary() const { return *dictionary_; }

private:
    std::shared_ptr<const KanjiDictionary> dictionary_;
    std::shared_ptr<const OkuriganaDetector> okurigana_;
    bool debug_ = false;
};

} // namespace yomikata
