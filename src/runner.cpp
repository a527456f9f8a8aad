#include "ocrscore/runner.h"
#include "ocrscore/evaluator.h"
#include "ocrscore/corpus.h"
#include "ocrscore/json_io.h"
#include "ocrscore/unicode_utils.h"

#include <fstream>
#include <stdexcept>

namespace ocrscore {

namespace {

void write_report(const nlohmann::json& report, const ScoreSettings& settings, std::ostream& out) {
    int indent = settings.get_bool("pretty", false) ? 2 : -1;
    std::string text = report.dump(indent);
    if (settings.outfile.empty()) {
        out << text << std::endl;
        return;
    }
    std::ofstream file(settings.outfile);
    if (!file) {
        throw std::runtime_error("Cannot write output file: " + settings.outfile);
    }
    file << text << '\n';
}

std::string read_input(const std::string& path, std::size_t max_bytes) {
    std::string content = read_text_file(path, max_bytes);
    if (!unicode::is_valid_utf8(content)) {
        throw std::runtime_error("File must be UTF-8 encoded: " + path);
    }
    return content;
}

Corpus collect_corpus(const ScoreSettings& settings) {
    std::size_t max_bytes = settings.max_file_bytes();
    if (!settings.input_dir.empty()) {
        return load_corpus_directory(settings.input_dir, max_bytes);
    }

    // Explicit --gt/--ocr files keep their own names
    Corpus corpus;
    corpus.ground_truth = read_input(settings.gt_file, max_bytes);
    for (const auto& path : settings.ocr_files) {
        std::string filename = path.substr(path.find_last_of("/\\") + 1);
        corpus.candidates.push_back({extract_model_name(filename), read_input(path, max_bytes)});
    }
    if (corpus.candidates.empty()) {
        corpus.warnings.push_back("No OCR output given (--ocr=...)");
    }
    return corpus;
}

} // namespace

int run(const ScoreSettings& settings, std::ostream& out, std::ostream& err) {
    ReportOptions options;
    options.include_annotations = settings.get_bool("annotations", true);
    options.include_matches = settings.get_bool("matches", false);

    Evaluator evaluator;
    EvaluationStats stats;
    std::vector<EvaluationResult> results;
    std::vector<std::string> warnings;

    if (!settings.request_file.empty()) {
        ComparisonRequest request = parse_request(read_input(settings.request_file, settings.max_file_bytes()));
        evaluator.configure(request.config, request.threshold);
        evaluator.set_verbosity(settings.verbose, settings.debug);
        CandidateText candidate{"ocr_output", request.ocr_output};
        results = evaluator.evaluate_batch(request.ground_truth, {candidate}, &stats);
    } else {
        if (settings.input_dir.empty() && settings.gt_file.empty()) {
            err << "Usage: ocrscore --gt=gt.txt --ocr=<model>_out.txt [--ocr=...] | --input=<dir> | --request=<file.json>" << std::endl;
            return 1;
        }
        evaluator.configure(settings);

        Corpus corpus = collect_corpus(settings);
        warnings = corpus.warnings;
        if (settings.debug) {
            for (const auto& warning : warnings) {
                err << "[ocrscore] " << warning << "\n";
            }
        }
        if (!corpus.complete()) {
            write_report(build_error_report("Invalid input files", warnings), settings, out);
            return 1;
        }
        results = evaluator.evaluate_batch(*corpus.ground_truth, corpus.candidates, &stats);
    }

    write_report(build_report(results, warnings, options), settings, out);

    if (settings.verbose) {
        std::size_t words = stats.gt_words + stats.candidate_words;
        float words_per_sec = stats.elapsed_seconds > 0.f
            ? static_cast<float>(words) / stats.elapsed_seconds
            : 0.f;
        err << stats.candidate_count << " candidate(s), "
            << words << " words scored in "
            << stats.elapsed_seconds << "s ("
            << words_per_sec << " words/s)" << std::endl;
    }

    return 0;
}

} // namespace ocrscore
