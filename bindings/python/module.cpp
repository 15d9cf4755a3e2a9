#include "yomikata/engine.h"
#include "yomikata/exceptions.h"
#include "yomikata/kanji_dictionary.h"
#include "yomikata/mora_splitter.h"
#include "yomikata/number_to_kanji.h"
#include "yomikata/settings.h"
#include "yomikata/unicode_utils.h"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace py = pybind11;

namespace {
// Using ICU-based Unicode sanitization
using yomikata::unicode::sanitize_utf8;
}

using yomikata::EngineSettings;
using yomikata::ExceptionDictionary;
using yomikata::FuriganaEngine;
using yomikata::KanjiDictionary;
using yomikata::MoraAlignment;
using yomikata::ReadingMatchInfo;
using yomikata::WithTagsDef;
using yomikata::WordToken;

namespace {

std::string to_string_any(const py::handle& value) {
    if (value.is_none()) {
        return "";
    }
    return py::cast<std::string>(py::str(value));
}

bool to_bool_any(const py::handle& value) {
    // Handle boolean values that might come as strings from JSON
    if (py::isinstance<py::str>(value)) {
        std::string val_str = py::cast<std::string>(value);
        return val_str == "true" || val_str == "True" || val_str == "1";
    }
    return py::cast<bool>(value);
}

EngineSettings settings_from_py(const py::dict& options) {
    EngineSettings settings;
    for (const auto& item : options) {
        auto key = py::cast<std::string>(item.first);
        const auto& value = item.second;
        std::string value_str = to_string_any(value);
        settings.options[key] = value_str;

        if (key == "exceptions") {
            settings.exceptions_file = value_str;
        } else if (key == "max_partitions" || key == "max-partitions") {
            settings.options["max-partitions"] = value_str;
        } else if (key == "debug") {
            settings.debug = to_bool_any(value);
        } else if (key == "verbose") {
            settings.verbose = to_bool_any(value);
        }
    }
    return settings;
}

py::dict alignment_to_py(const MoraAlignment& alignment) {
    py::list positions;
    for (std::size_t i = 0; i < alignment.per_kanji.size(); ++i) {
        py::dict position;
        position["mora"] = sanitize_utf8(alignment.joined_mora(static_cast<int>(i)));
        if (const ReadingMatchInfo* match = yomikata::match_of(alignment.per_kanji[i])) {
            position["kanji"] = sanitize_utf8(match->kanji);
            position["class"] = yomikata::to_string(yomikata::reading_class_of(match->match_type));
            position["variant"] = yomikata::to_string(match->variant);
            position["dict_form"] = sanitize_utf8(match->dict_form);
        } else {
            position["kanji"] = py::none();
            position["class"] = py::none();
            position["variant"] = py::none();
            position["dict_form"] = py::none();
        }
        positions.append(position);
    }
    py::dict out;
    out["positions"] = positions;
    out["okurigana"] = sanitize_utf8(alignment.trailing_okurigana);
    out["rest"] = sanitize_utf8(alignment.trailing_rest);
    out["complete"] = alignment.is_complete;
    out["verb_like"] = alignment.verb_like;
    return out;
}

class PyEngine {
public:
    PyEngine(const std::string& kanji_file, const py::dict& options = py::dict()) {
        EngineSettings settings = settings_from_py(options);

        auto dictionary = std::make_shared<KanjiDictionary>();
        if (!dictionary->load(kanji_file)) {
            throw std::runtime_error("Failed to load kanji reading file: " + kanji_file);
        }
        auto exceptions = std::make_shared<ExceptionDictionary>();
        if (!settings.exceptions_file.empty() && !exceptions->load(settings.exceptions_file)) {
            throw std::runtime_error("Failed to load exceptions: " + settings.exceptions_file);
        }

        engine_ = std::make_unique<FuriganaEngine>(dictionary, exceptions);
        engine_->set_debug(settings.debug);
        engine_->set_max_partitions(static_cast<std::size_t>(settings.get_int("max-partitions", 0)));
    }

    std::string highlight(const std::string& text, const std::optional<std::string>& kanji,
                          const std::string& mode, bool with_tags, bool merge_consecutive,
                          bool onyomi_to_katakana, bool include_suru_okuri) const {
        WithTagsDef tags;
        tags.with_tags = with_tags;
        tags.merge_consecutive = merge_consecutive;
        tags.onyomi_to_katakana = onyomi_to_katakana;
        tags.include_suru_okuri = include_suru_okuri;
        return sanitize_utf8(engine_->highlight_text(text, kanji, yomikata::render_mode_from_string(mode), tags));
    }

    py::dict align(const std::string& word, const std::string& reading, const std::string& trailing) const {
        WordToken token;
        token.word = word;
        token.reading = reading;
        token.trailing_kana = trailing;
        return alignment_to_py(engine_->align(token));
    }

private:
    std::unique_ptr<FuriganaEngine> engine_;
};

py::list split_mora_py(const std::string& reading, std::size_t kanji_count) {
    py::list out;
    for (const auto& mora : yomikata::split_mora(reading, kanji_count).mora) {
        out.append(sanitize_utf8(mora));
    }
    return out;
}

} // namespace

PYBIND11_MODULE(yomikata_py, m) {
    m.doc() = "Python bindings for the yomikata furigana alignment engine";

    py::class_<PyEngine>(m, "Engine")
        .def(py::init<const std::string&, const py::dict&>(),
             py::arg("kanji_file"), py::arg("options") = py::dict())
        .def("highlight", &PyEngine::highlight, py::arg("text"), py::arg("kanji") = py::none(),
             py::arg("mode") = "furigana", py::arg("with_tags") = true, py::arg("merge_consecutive") = true,
             py::arg("onyomi_to_katakana") = true, py::arg("include_suru_okuri") = false,
             "Render every word[reading] token of the text, highlighting the given kanji")
        .def("align", &PyEngine::align, py::arg("word"), py::arg("reading"), py::arg("trailing") = "",
             "Split a reading over the kanji of a word");

    m.def("number_to_kanji", &yomikata::number_to_kanji, py::arg("text"),
          "Spell a digit string as kanji numerals");
    m.def("split_mora", &split_mora_py, py::arg("reading"), py::arg("kanji_count"),
          "Segment a kana reading into mora");
}
