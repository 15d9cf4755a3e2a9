#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "yomikata/morph_analyzer.h"

namespace MeCab {
class Tagger;
}

namespace yomikata {

// MorphAnalyzer backed by a MeCab tagger with an IPADIC-style dictionary
class MecabAnalyzer : public MorphAnalyzer {
public:
    // args are passed to MeCab::createTagger; throws std::runtime_error when it fails
    explicit MecabAnalyzer(const std::string& args = "");
    ~MecabAnalyzer() override;

    MecabAnalyzer(const MecabAnalyzer&) = delete;
    MecabAnalyzer& operator=(const MecabAnalyzer&) = delete;

    std::vector<MorphToken> parse(const std::string& text) const override;

private:
    struct TaggerDeleter {
        void operator()(MeCab::Tagger* tagger) const;
    };
    std::unique_ptr<MeCab::Tagger, TaggerDeleter> tagger_;
    // A tagger is not safe to share between threads
    mutable std::mutex mutex_;
};

} // namespace yomikata
