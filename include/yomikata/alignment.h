#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "yomikata/okurigana.h"
#include "yomikata/reading_matcher.h"
#include "yomikata/types.h"

namespace yomikata {

// True when position index repeats the kanji before it (々 or the same kanji twice)
bool is_repeat_position(const std::vector<std::string>& kanji, std::size_t index);

// A repeat position must take as many mora as the kanji it repeats
bool valid_repeater_split(const std::vector<std::string>& kanji,
                          const std::vector<std::vector<std::string>>& partition);

class AlignmentSearch {
public:
    AlignmentSearch(std::shared_ptr<const ReadingMatcher> matcher,
                    std::shared_ptr<const OkuriganaDetector> okurigana);

    void set_debug(bool debug) { debug_ = debug; }

    // Upper bound on partitions tried per word; 0 means no limit
    void set_max_partitions(std::size_t limit) { max_partitions_ = limit; }

    // Split mora over the kanji positions (digits already spelled as kanji numerals).
    // Returns the first partition where every position matches, otherwise the partial
    // alignment with the fewest unmatched positions and, on a tie, the most matched kana.
    MoraAlignment find_alignment(const std::vector<std::string>& kanji, const std::vector<std::string>& mora,
                                 const std::string& trailing, bool whole_word) const;

private:
    std::shared_ptr<const ReadingMatcher> matcher_;
    std::shared_ptr<const OkuriganaDetector> okurigana_;
    std::size_t max_partitions_ = 0;
    bool debug_ = false;

    MoraAlignment try_partition(const std::vector<std::string>& kanji,
                                const std::vector<std::vector<std::string>>& partition,
                                const std::string& trailing, bool whole_word, bool check_yoon,
                                std::vector<std::vector<std::vector<std::string>>>& yoon_partitions) const;

    OkuriResult okurigana_for(const ReadingMatchInfo& match, const std::string& kanji, const std::string& trailing,
                              const std::string& word, const std::string& word_reading) const;
};

} // namespace yomikata
