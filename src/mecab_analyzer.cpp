#include "yomikata/mecab_analyzer.h"

#include <mecab.h>

#include <stdexcept>

namespace yomikata {

void MecabAnalyzer::TaggerDeleter::operator()(MeCab::Tagger* tagger) const {
    MeCab::deleteTagger(tagger);
}

MecabAnalyzer::MecabAnalyzer(const std::string& args) {
    MeCab::Tagger* tagger = MeCab::createTagger(args.c_str());
    if (!tagger) {
        throw std::runtime_error(std::string("MeCab initialization failed: ") + MeCab::getTaggerError());
    }
    tagger_.reset(tagger);
}

MecabAnalyzer::~MecabAnalyzer() = default;

std::vector<MorphToken> MecabAnalyzer::parse(const std::string& text) const {
    std::vector<MorphToken> tokens;
    if (text.empty()) {
        return tokens;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const MeCab::Node* node = tagger_->parseToNode(text.c_str());
    if (!node) {
        throw std::runtime_error(std::string("MeCab parsing failed: ") + tagger_->what());
    }
    for (; node; node = node->next) {
        if (node->stat == MECAB_BOS_NODE || node->stat == MECAB_EOS_NODE) {
            continue;
        }
        std::string surface(node->surface, node->length);
        tokens.push_back(token_from_feature(surface, node->feature ? node->feature : ""));
    }
    return tokens;
}

} // namespace yomikata
