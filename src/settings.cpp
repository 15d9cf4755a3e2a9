#include "yomikata/settings.h"
#include "yomikata/unicode_utils.h"

#include <pugixml.hpp>

#include <initializer_list>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace yomikata {

std::string EngineSettings::get(const std::string& key, const std::string& fallback) const {
    auto it = options.find(key);
    return it == options.end() ? fallback : it->second;
}

int EngineSettings::get_int(const std::string& key, int fallback) const {
    auto it = options.find(key);
    if (it == options.end()) {
        return fallback;
    }
    std::size_t used = 0;
    int value = 0;
    try {
        value = std::stoi(it->second, &used);
    } catch (const std::logic_error&) {
        used = 0;
    }
    if (used == 0 || used != it->second.size()) {
        throw std::invalid_argument("Option " + key + " is not a number: " + it->second);
    }
    return value;
}

bool EngineSettings::get_bool(const std::string& key, bool fallback) const {
    auto it = options.find(key);
    if (it == options.end()) {
        return fallback;
    }
    const std::string& val = it->second;
    return val == "1" || val == "true" || val == "TRUE" || val == "yes";
}

namespace {

// Options that are copied into a string member as they are
const std::pair<const char*, std::string EngineSettings::*> kStringOptions[] = {
    {"pid", &EngineSettings::pid},
    {"kanji", &EngineSettings::kanji_file},
    {"exceptions", &EngineSettings::exceptions_file},
    {"settings", &EngineSettings::settings_file},
    {"mode", &EngineSettings::mode},
    {"highlight", &EngineSettings::highlight},
    {"text", &EngineSettings::text},
    {"infile", &EngineSettings::infile},
    {"outfile", &EngineSettings::outfile},
};

void push_option(EngineSettings& settings, const std::string& key, const std::string& value) {
    settings.options[key] = value;
    for (const auto& [name, member] : kStringOptions) {
        if (key == name) {
            settings.*member = value;
            return;
        }
    }
    if (key == "mecab") {
        settings.use_mecab = true;
        // A bare --mecab keeps the default dictionary
        settings.mecab_args = value == "1" ? "" : value;
    } else if (key == "verbose") {
        settings.verbose = true;
    } else if (key == "debug") {
        settings.debug = true;
    }
}

// Data files named in a settings file are relative to that file
std::string resolve_data_path(const std::string& settings_file, const std::string& path) {
    if (path.empty() || path[0] == '/') {
        return path;
    }
    std::size_t slash = settings_file.rfind('/');
    if (slash == std::string::npos) {
        return path;
    }
    return settings_file.substr(0, slash + 1) + path;
}

void push_file_option(EngineSettings& settings, const std::string& key, const std::string& value) {
    if (key == "kanji" || key == "exceptions") {
        push_option(settings, key, resolve_data_path(settings.settings_file, value));
    } else {
        push_option(settings, key, value);
    }
}

// The item with the requested pid, or the first item when no pid is given
pugi::xml_node find_parameter_set(const pugi::xml_document& doc, const std::string& pid) {
    for (const auto& node : doc.select_nodes("/yomikata/parameters/item")) {
        pugi::xml_node item = node.node();
        if (pid.empty() || pid == item.attribute("pid").value()) {
            return item;
        }
    }
    return pugi::xml_node();
}

} // namespace

EngineSettings parse_arguments(int argc, char** argv) {
    EngineSettings settings;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            continue;
        }
        if (unicode::sanitize_utf8(arg) != arg) {
            throw std::invalid_argument("Argument is not valid UTF-8: " + unicode::sanitize_utf8(arg));
        }
        std::size_t eq = arg.find('=');
        if (eq == std::string::npos) {
            push_option(settings, arg.substr(2), "1");
        } else {
            push_option(settings, arg.substr(2, eq - 2), arg.substr(eq + 1));
        }
    }
    return settings;
}

EngineSettings load_settings(const EngineSettings& base) {
    if (base.settings_file.empty()) {
        throw std::runtime_error("No settings file given");
    }

    pugi::xml_document doc;
    pugi::xml_parse_result parsed = doc.load_file(base.settings_file.c_str());
    if (!parsed) {
        throw std::runtime_error("Failed to load settings file: " + base.settings_file + " (" +
                                 parsed.description() + ")");
    }
    pugi::xml_node root = doc.child("yomikata");
    if (!root) {
        throw std::runtime_error("Settings file has no <yomikata> root: " + base.settings_file);
    }
    pugi::xml_node item = find_parameter_set(doc, base.pid);
    if (!item) {
        throw std::runtime_error("No parameter set " + (base.pid.empty() ? std::string("at all") : base.pid) +
                                 " in " + base.settings_file);
    }

    // Command line first, then the parameter set, then the defaults on the root element
    EngineSettings combined = base;
    for (const pugi::xml_node& source : {item, root}) {
        for (const auto& attr : source.attributes()) {
            if (combined.options.count(attr.name()) > 0) {
                continue;
            }
            push_file_option(combined, attr.name(), attr.value());
        }
    }
    if (combined.debug) {
        std::cerr << "[yomikata] Using parameter set " << combined.pid << " from " << base.settings_file << " ("
                  << combined.options.size() << " options)\n";
    }
    return combined;
}

RenderMode render_mode_from_string(const std::string& text) {
    if (text.empty() || text == "furigana") {
        return RenderMode::Furigana;
    }
    if (text == "furikanji") {
        return RenderMode::Furikanji;
    }
    if (text == "kana_only") {
        return RenderMode::KanaOnly;
    }
    throw std::invalid_argument("Unknown mode: " + text + " (expected furigana, furikanji or kana_only)");
}

WithTagsDef with_tags_from_settings(const EngineSettings& settings) {
    WithTagsDef tags;
    tags.with_tags = settings.get_bool("with-tags", false);
    tags.merge_consecutive = settings.get_bool("merge", false);
    tags.onyomi_to_katakana = settings.get_bool("katakana", false);
    tags.include_suru_okuri = settings.get_bool("suru-okuri", false);
    return tags;
}

} // namespace yomikata
