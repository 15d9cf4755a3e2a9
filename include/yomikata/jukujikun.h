#pragma once

#include <memory>
#include <string>
#include <vector>

#include "yomikata/exceptions.h"
#include "yomikata/kanji_dictionary.h"
#include "yomikata/okurigana.h"
#include "yomikata/types.h"

namespace yomikata {

// Split mora over count positions, floor each, the first (size mod count) positions get one more
std::vector<std::string> distribute_mora(const std::vector<std::string>& mora, std::size_t count);

class JukujikunProcessor {
public:
    JukujikunProcessor(std::shared_ptr<const ExceptionDictionary> exceptions,
                       std::shared_ptr<const KanjiDictionary> dictionary,
                       std::shared_ptr<const OkuriganaDetector> okurigana);

    void set_debug(bool debug) { debug_ = debug; }

    // Fill the unmatched positions of alignment. numeral marks positions that came from digits.
    // Returns the alignment unchanged when nothing is unmatched.
    MoraAlignment process(const std::vector<std::string>& kanji, const MoraAlignment& alignment,
                          const std::string& trailing, const std::vector<bool>& numeral = {}) const;

    // Okurigana after a kanji read by a compound reading. Parses by reading; when that finds
    // nothing, trailing kana that does not open with a particle is taken whole.
    OkuriResult jukujikun_okurigana(const std::string& kanji, const std::string& reading,
                                    const std::string& trailing) const;

private:
    std::shared_ptr<const ExceptionDictionary> exceptions_;
    std::shared_ptr<const KanjiDictionary> dictionary_;
    std::shared_ptr<const OkuriganaDetector> okurigana_;
    bool debug_ = false;

    // compound marks the positions whose okurigana follows the compound reading rule
    bool apply_exception(const std::vector<std::string>& kanji, MoraAlignment& alignment,
                         std::vector<bool>& compound) const;
    void redistribute(const std::vector<std::string>& kanji, MoraAlignment& alignment,
                      const std::vector<bool>& numeral, std::vector<bool>& compound) const;
    ReadingMatchInfo synthesize(const std::string& kanji, const std::string& mora) const;
};

} // namespace yomikata
