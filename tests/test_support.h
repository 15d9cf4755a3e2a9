#pragma once

#include "yomikata/kanji_dictionary.h"
#include "yomikata/morph_analyzer.h"

#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace yomikata {
namespace test {

inline std::string data_path(const std::string& name) {
    return std::string(YOMIKATA_TEST_DATA_DIR) + "/" + name;
}

inline std::shared_ptr<KanjiDictionary> load_test_dictionary() {
    auto dictionary = std::make_shared<KanjiDictionary>();
    if (!dictionary->load(data_path("kanji_readings.json"))) {
        throw std::runtime_error("Cannot load test kanji dictionary");
    }
    return dictionary;
}

inline MorphToken token(const std::string& surface, PartOfSpeech pos, const std::string& headword = "",
                        InflectionForm inflection = InflectionForm::None) {
    MorphToken out;
    out.surface = surface;
    out.headword = headword.empty() ? surface : headword;
    out.pos = pos;
    out.inflection = inflection;
    return out;
}

// Returns canned tokens per input text; unknown text gives no tokens
class ScriptedAnalyzer : public MorphAnalyzer {
public:
    void script(const std::string& text, std::vector<MorphToken> tokens) {
        scripts_[text] = std::move(tokens);
    }

    std::vector<MorphToken> parse(const std::string& text) const override {
        ++calls_;
        auto it = scripts_.find(text);
        return it == scripts_.end() ? std::vector<MorphToken>() : it->second;
    }

    int calls() const { return calls_; }

private:
    std::map<std::string, std::vector<MorphToken>> scripts_;
    mutable int calls_ = 0;
};

// Fails every parse the way MeCab does when parseToNode returns null
class FailingAnalyzer : public MorphAnalyzer {
public:
    std::vector<MorphToken> parse(const std::string&) const override {
        ++calls_;
        throw std::runtime_error("MeCab parsing failed");
    }

    int calls() const { return calls_; }

private:
    mutable int calls_ = 0;
};

// Token lists as MeCab with IPADIC splits them
inline std::shared_ptr<ScriptedAnalyzer> make_scripted_analyzer() {
    using P = PartOfSpeech;
    using I = InflectionForm;
    auto analyzer = std::make_shared<ScriptedAnalyzer>();
    analyzer->script("勉強している", {token("勉強", P::Noun), token("し", P::Verb, "する", I::Other),
                                       token("て", P::Particle), token("いる", P::Verb, "いる", I::Other)});
    analyzer->script("しなかった", {token("し", P::Verb, "する", I::Other),
                                     token("なかっ", P::BoundAuxiliary, "ない", I::ContinuativeTa),
                                     token("た", P::BoundAuxiliary, "た", I::Other)});
    analyzer->script("行ったらいくかも", {token("行っ", P::Verb, "行く", I::ContinuativeTa),
                                          token("たら", P::BoundAuxiliary, "た", I::Hypothetical),
                                          token("いく", P::Verb, "いく", I::Other), token("か", P::Particle),
                                          token("も", P::Particle)});
    analyzer->script("静かなあおさ", {token("静か", P::Noun), token("な", P::BoundAuxiliary, "だ", I::Other),
                                      token("あお", P::Noun), token("さ", P::Other)});
    analyzer->script("高めるから", {token("高める", P::Verb, "高める", I::Other), token("から", P::Particle)});
    analyzer->script("恥ずかしげなかおで", {token("恥ずかしげ", P::Noun), token("な", P::BoundAuxiliary, "だ", I::Other),
                                            token("かお", P::Noun), token("で", P::Particle)});
    analyzer->script("食べたくない", {token("食べ", P::Verb, "食べる", I::Other),
                                      token("たく", P::BoundAuxiliary, "たい", I::Other),
                                      token("ない", P::BoundAuxiliary, "ない", I::Other)});
    analyzer->script("強くて", {token("強く", P::IAdjective, "強い", I::Other), token("て", P::Particle)});
    return analyzer;
}

} // namespace test
} // namespace yomikata
