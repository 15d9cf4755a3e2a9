#include "yomikata/settings.h"
#include "yomikata/kanji_dictionary.h"
#include "yomikata/exceptions.h"
#include "yomikata/engine.h"
#ifdef YOMIKATA_WITH_MECAB
#include "yomikata/mecab_analyzer.h"
#endif

#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>

using namespace yomikata;

namespace {

std::shared_ptr<const MorphAnalyzer> make_analyzer(const EngineSettings& settings) {
    if (!settings.use_mecab) {
        return std::make_shared<NullAnalyzer>();
    }
#ifdef YOMIKATA_WITH_MECAB
    auto mecab = std::make_shared<MecabAnalyzer>(settings.mecab_args);
    return std::make_shared<CachingAnalyzer>(mecab);
#else
    throw std::runtime_error("This build has no MeCab support (--mecab)");
#endif
}

} // namespace

int main(int argc, char** argv) {
    try {
        auto cli_settings = parse_arguments(argc, argv);
        EngineSettings settings;

        if (!cli_settings.settings_file.empty()) {
            settings = load_settings(cli_settings);
        } else {
            settings = cli_settings;
        }

        if (settings.kanji_file.empty()) {
            std::cerr << "No kanji reading file specified (--kanji=...)" << std::endl;
            return 1;
        }

        auto dictionary = std::make_shared<KanjiDictionary>();
        dictionary->set_debug(settings.debug);
        if (!dictionary->load(settings.kanji_file)) {
            std::cerr << "Failed to load kanji reading file: " << settings.kanji_file << std::endl;
            return 1;
        }

        auto exceptions = std::make_shared<ExceptionDictionary>();
        exceptions->set_debug(settings.debug);
        if (!settings.exceptions_file.empty() && !exceptions->load(settings.exceptions_file)) {
            std::cerr << "Warning: Failed to load exceptions: " << settings.exceptions_file << std::endl;
        }

        FuriganaEngine engine(dictionary, exceptions, make_analyzer(settings));
        engine.set_debug(settings.debug);
        engine.set_max_partitions(static_cast<std::size_t>(settings.get_int("max-partitions", 0)));

        const RenderMode mode = render_mode_from_string(settings.mode);
        const WithTagsDef tags = with_tags_from_settings(settings);
        std::optional<std::string> highlight;
        if (!settings.highlight.empty()) {
            highlight = settings.highlight;
        }

        std::ifstream infile;
        std::istream* input = &std::cin;
        std::istringstream text_input(settings.text);
        if (!settings.text.empty()) {
            input = &text_input;
        } else if (!settings.infile.empty()) {
            infile.open(settings.infile);
            if (!infile) {
                std::cerr << "Cannot open input file: " << settings.infile << std::endl;
                return 1;
            }
            input = &infile;
        }

        std::ofstream outfile;
        std::ostream* output = &std::cout;
        if (!settings.outfile.empty()) {
            outfile.open(settings.outfile);
            if (!outfile) {
                std::cerr << "Cannot open output file: " << settings.outfile << std::endl;
                return 1;
            }
            output = &outfile;
        }

        auto start = std::chrono::steady_clock::now();
        std::size_t line_count = 0;
        std::string line;
        while (std::getline(*input, line)) {
            *output << engine.highlight_text(line, highlight, mode, tags) << "\n";
            ++line_count;
        }
        output->flush();

        if (settings.verbose) {
            std::chrono::duration<float> elapsed = std::chrono::steady_clock::now() - start;
            float lines_per_sec = elapsed.count() > 0.f ? line_count / elapsed.count() : 0.f;
            std::cout << line_count << " lines processed in "
                      << elapsed.count() << "s ("
                      << lines_per_sec << " lines/s)" << std::endl;
        }

        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
}
