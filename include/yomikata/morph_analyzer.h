#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace yomikata {

enum class PartOfSpeech {
    Noun,
    Verb,
    IAdjective,
    Adverb,
    Particle,
    BoundAuxiliary,
    Other
};

enum class InflectionForm {
    None,            // token does not inflect
    ContinuativeTa,
    ContinuativeTe,
    Hypothetical,
    Other
};

struct MorphToken {
    std::string surface;
    std::string headword;
    PartOfSpeech pos = PartOfSpeech::Other;
    InflectionForm inflection = InflectionForm::None;
};

// Tokenizer used to find where an inflected tail ends
class MorphAnalyzer {
public:
    virtual ~MorphAnalyzer() = default;
    virtual std::vector<MorphToken> parse(const std::string& text) const = 0;
};

// Analyzer that never finds anything; okurigana falls back to dictionary rules
class NullAnalyzer : public MorphAnalyzer {
public:
    std::vector<MorphToken> parse(const std::string& text) const override;
};

// Memoizes another analyzer's results per input text. The cache is emptied
// when it reaches max_entries; 0 means no limit.
class CachingAnalyzer : public MorphAnalyzer {
public:
    static constexpr std::size_t kDefaultMaxEntries = 10000;

    explicit CachingAnalyzer(std::shared_ptr<const MorphAnalyzer> inner,
                             std::size_t max_entries = kDefaultMaxEntries);

    std::vector<MorphToken> parse(const std::string& text) const override;

    std::size_t cache_size() const;
    std::size_t max_entries() const { return max_entries_; }

private:
    std::shared_ptr<const MorphAnalyzer> inner_;
    std::size_t max_entries_;
    mutable std::mutex mutex_;
    mutable std::unordered_map<std::string, std::vector<MorphToken>> cache_;
};

// Token from an IPADIC feature line: column 0 is the part of speech, 5 the inflection
// form and 6 the headword ("*" falls back to the surface)
MorphToken token_from_feature(const std::string& surface, const std::string& feature);

const char* to_string(PartOfSpeech pos);

} // namespace yomikata
