#pragma once

#include "types.h"

#include <string>
#include <unordered_map>

namespace yomikata {

struct EngineSettings {
    std::unordered_map<std::string, std::string> options;
    std::string pid;
    std::string kanji_file;
    std::string exceptions_file;
    std::string settings_file;
    std::string mecab_args;
    bool use_mecab = false;
    std::string mode;
    std::string highlight;
    std::string text;
    std::string infile;
    std::string outfile;
    bool verbose = false;
    bool debug = false;

    std::string get(const std::string& key, const std::string& fallback = "") const;
    int get_int(const std::string& key, int fallback) const;
    bool get_bool(const std::string& key, bool fallback) const;
};

EngineSettings parse_arguments(int argc, char** argv);
EngineSettings load_settings(const EngineSettings& base);

// furigana, furikanji or kana_only; anything else throws std::invalid_argument
RenderMode render_mode_from_string(const std::string& text);

// Tag options from --with-tags, --merge, --katakana and --suru-okuri
WithTagsDef with_tags_from_settings(const EngineSettings& settings);

} // namespace yomikata
