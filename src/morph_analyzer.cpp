#include "yomikata/morph_analyzer.h"

#include <stdexcept>
#include <utility>

namespace yomikata {

std::vector<MorphToken> NullAnalyzer::parse(const std::string& /*text*/) const {
    return {};
}

CachingAnalyzer::CachingAnalyzer(std::shared_ptr<const MorphAnalyzer> inner, std::size_t max_entries)
    : inner_(std::move(inner)), max_entries_(max_entries) {
    if (!inner_) {
        throw std::invalid_argument("CachingAnalyzer needs an analyzer to wrap");
    }
}

std::vector<MorphToken> CachingAnalyzer::parse(const std::string& text) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(text);
        if (it != cache_.end()) {
            return it->second;
        }
    }
    std::vector<MorphToken> tokens = inner_->parse(text);
    std::lock_guard<std::mutex> lock(mutex_);
    if (max_entries_ > 0 && cache_.size() >= max_entries_) {
        cache_.clear();
    }
    cache_.emplace(text, tokens);
    return tokens;
}

std::size_t CachingAnalyzer::cache_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

namespace {

std::vector<std::string> split_feature(const std::string& feature) {
    std::vector<std::string> columns;
    std::string current;
    for (char ch : feature) {
        if (ch == ',') {
            columns.push_back(current);
            current.clear();
        } else {
            current += ch;
        }
    }
    columns.push_back(current);
    return columns;
}

PartOfSpeech pos_from_column(const std::string& column) {
    if (column == "名詞") {
        return PartOfSpeech::Noun;
    }
    if (column == "動詞") {
        return PartOfSpeech::Verb;
    }
    if (column == "形容詞") {
        return PartOfSpeech::IAdjective;
    }
    if (column == "副詞") {
        return PartOfSpeech::Adverb;
    }
    if (column == "助詞") {
        return PartOfSpeech::Particle;
    }
    if (column == "助動詞") {
        return PartOfSpeech::BoundAuxiliary;
    }
    return PartOfSpeech::Other;
}

InflectionForm inflection_from_column(const std::string& column) {
    if (column.empty() || column == "*") {
        return InflectionForm::None;
    }
    if (column == "連用タ接続") {
        return InflectionForm::ContinuativeTa;
    }
    if (column == "連用テ接続") {
        return InflectionForm::ContinuativeTe;
    }
    if (column == "仮定形") {
        return InflectionForm::Hypothetical;
    }
    return InflectionForm::Other;
}

} // namespace

MorphToken token_from_feature(const std::string& surface, const std::string& feature) {
    std::vector<std::string> columns = split_feature(feature);
    MorphToken token;
    token.surface = surface;
    token.pos = pos_from_column(columns[0]);
    token.inflection = columns.size() > 5 ? inflection_from_column(columns[5]) : InflectionForm::None;
    token.headword = columns.size() > 6 && columns[6] != "*" ? columns[6] : surface;
    return token;
}

const char* to_string(PartOfSpeech pos) {
    switch (pos) {
        case PartOfSpeech::Noun: return "noun";
        case PartOfSpeech::Verb: return "verb";
        case PartOfSpeech::IAdjective: return "i_adjective";
        case PartOfSpeech::Adverb: return "adverb";
        case PartOfSpeech::Particle: return "particle";
        case PartOfSpeech::BoundAuxiliary: return "bound_auxiliary";
        case PartOfSpeech::Other: return "other";
    }
    return "other";
}

} // namespace yomikata
