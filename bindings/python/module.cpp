#include "ocrscore/normalizer.h"
#include "ocrscore/matcher.h"
#include "ocrscore/metrics.h"
#include "ocrscore/annotator.h"
#include "ocrscore/evaluator.h"
#include "ocrscore/unicode_utils.h"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <stdexcept>
#include <string>

namespace py = pybind11;

namespace {
// Using ICU-based Unicode sanitization
using ocrscore::unicode::sanitize_utf8;
}

using ocrscore::Alignment;
using ocrscore::Annotation;
using ocrscore::CandidateText;
using ocrscore::EvaluationResult;
using ocrscore::Evaluator;
using ocrscore::MatchRecord;
using ocrscore::MatchType;
using ocrscore::Metrics;
using ocrscore::NormalizationConfig;
using ocrscore::Side;
using ocrscore::Token;

namespace {

py::object optional_to_py(const std::optional<std::string>& value) {
    return value ? py::object(py::str(sanitize_utf8(*value))) : py::object(py::none());
}

py::object optional_to_py(const std::optional<std::size_t>& value) {
    return value ? py::object(py::int_(*value)) : py::object(py::none());
}

NormalizationConfig config_from_py(const py::dict& config) {
    NormalizationConfig out;
    if (auto it = config.attr("get")("case_sensitive"); !it.is_none()) out.case_sensitive = py::cast<bool>(it);
    if (auto it = config.attr("get")("ignore_punctuation"); !it.is_none()) out.ignore_punctuation = py::cast<bool>(it);
    if (auto it = config.attr("get")("punctuation_chars"); !it.is_none()) out.punctuation_chars = py::cast<std::string>(it);
    return out;
}

std::size_t threshold_from_py(long long threshold) {
    if (threshold < 0) {
        throw std::invalid_argument("edit_distance_threshold must be non-negative");
    }
    return static_cast<std::size_t>(threshold);
}

py::dict token_to_py(const Token& token) {
    py::dict out;
    out["normalized"] = sanitize_utf8(token.normalized);
    out["original"] = sanitize_utf8(token.original);
    out["position"] = token.position;
    return out;
}

Token token_from_py(const py::dict& token_dict) {
    Token token;
    if (auto it = token_dict.attr("get")("normalized"); !it.is_none()) token.normalized = py::cast<std::string>(it);
    if (auto it = token_dict.attr("get")("original"); !it.is_none()) token.original = py::cast<std::string>(it);
    if (auto it = token_dict.attr("get")("position"); !it.is_none()) token.position = py::cast<std::size_t>(it);
    return token;
}

py::tuple record_to_py(const MatchRecord& record) {
    return py::make_tuple(optional_to_py(record.gt_word), optional_to_py(record.ocr_word),
                          optional_to_py(record.distance), ocrscore::to_string(record.type));
}

MatchRecord record_from_py(const py::tuple& match) {
    if (match.size() != 4) {
        throw std::invalid_argument("match must be a (gt_word, ocr_word, edit_distance, match_type) tuple");
    }
    auto type_name = py::cast<std::string>(match[3]);
    auto type = ocrscore::match_type_from_string(type_name);
    if (!type) {
        throw std::invalid_argument("unknown match_type '" + type_name + "'");
    }
    MatchRecord record;
    record.type = *type;
    if (!match[0].is_none()) record.gt_word = py::cast<std::string>(match[0]);
    if (!match[1].is_none()) record.ocr_word = py::cast<std::string>(match[1]);
    if (!match[2].is_none()) record.distance = py::cast<std::size_t>(match[2]);
    return record;
}

Alignment alignment_from_py(const py::list& matches) {
    Alignment alignment;
    for (const auto& item : matches) {
        alignment.records.push_back(record_from_py(py::cast<py::tuple>(item)));
    }
    return alignment;
}

py::list alignment_to_py(const Alignment& alignment) {
    py::list out;
    for (const auto& record : alignment.records) {
        out.append(record_to_py(record));
    }
    return out;
}

py::dict metrics_to_py(const Metrics& metrics) {
    py::dict out;
    out["precision"] = metrics.precision;
    out["recall"] = metrics.recall;
    out["avg_crr"] = metrics.avg_crr;
    out["f1_score"] = metrics.f1;
    out["exact_matches"] = metrics.exact_count;
    out["fuzzy_matches"] = metrics.fuzzy_count;
    out["total_gt_words"] = metrics.total_gt;
    out["total_ocr_words"] = metrics.total_ocr;
    out["unmatched_gt"] = metrics.unmatched_gt;
    out["unmatched_ocr"] = metrics.unmatched_ocr;
    return out;
}

py::list annotations_to_py(const std::vector<Annotation>& annotations) {
    py::list out;
    for (const auto& annotation : annotations) {
        py::dict entry;
        entry["word"] = sanitize_utf8(annotation.word);
        entry["match_type"] = ocrscore::to_string(annotation.match_type);
        entry["matched_with"] = optional_to_py(annotation.matched_with);
        entry["edit_distance"] = optional_to_py(annotation.edit_distance);
        out.append(std::move(entry));
    }
    return out;
}

py::tuple tokenize_and_normalize_py(const std::string& text, const py::dict& config) {
    auto tokenized = ocrscore::tokenize_and_normalize(text, config_from_py(config));
    py::list normalized;
    for (const auto& word : tokenized.normalized) {
        normalized.append(sanitize_utf8(word));
    }
    py::list word_data;
    for (const auto& token : tokenized.tokens) {
        word_data.append(token_to_py(token));
    }
    return py::make_tuple(normalized, word_data);
}

py::list match_py(const std::vector<std::string>& gt_words, const std::vector<std::string>& ocr_words,
                  long long threshold) {
    return alignment_to_py(ocrscore::match(gt_words, ocr_words, threshold_from_py(threshold)));
}

py::dict compute_metrics_py(const py::list& matches) {
    return metrics_to_py(ocrscore::compute_metrics(alignment_from_py(matches)));
}

py::list annotate_py(const py::list& word_data, const py::list& matches, bool is_ground_truth) {
    std::vector<Token> tokens;
    for (const auto& item : word_data) {
        tokens.push_back(token_from_py(py::cast<py::dict>(item)));
    }
    Side side = is_ground_truth ? Side::GroundTruth : Side::Candidate;
    return annotations_to_py(ocrscore::annotate(tokens, alignment_from_py(matches), side));
}

py::list evaluate_batch_py(const std::string& ground_truth, const py::list& models, const py::dict& config) {
    long long threshold = 1;
    if (auto it = config.attr("get")("edit_distance_threshold"); !it.is_none()) threshold = py::cast<long long>(it);

    Evaluator evaluator;
    evaluator.configure(config_from_py(config), threshold_from_py(threshold));

    std::vector<CandidateText> candidates;
    for (const auto& item : models) {
        auto model = py::cast<py::dict>(item);
        CandidateText candidate;
        candidate.name = py::cast<std::string>(model["name"]);
        candidate.text = py::cast<std::string>(model["text"]);
        candidates.push_back(std::move(candidate));
    }

    std::vector<EvaluationResult> results;
    {
        py::gil_scoped_release release;
        results = evaluator.evaluate_batch(ground_truth, candidates);
    }

    py::list out;
    for (const auto& result : results) {
        py::dict entry;
        entry["model_name"] = sanitize_utf8(result.model_name);
        entry["metrics"] = metrics_to_py(result.metrics);
        entry["matches"] = alignment_to_py(result.alignment);
        entry["gt_annotations"] = annotations_to_py(result.gt_annotations);
        entry["ocr_annotations"] = annotations_to_py(result.ocr_annotations);
        out.append(std::move(entry));
    }
    return out;
}

} // namespace

PYBIND11_MODULE(ocrscore_py, m) {
    m.doc() = "Python bindings for the ocrscore word alignment and OCR metrics";

    m.def("tokenize_and_normalize", &tokenize_and_normalize_py, py::arg("text"), py::arg("config") = py::dict(),
          "Split text on whitespace and normalize each word; returns (normalized, word_data)");
    m.def("match", &match_py, py::arg("gt_words"), py::arg("ocr_words"), py::arg("threshold") = 1,
          "Align normalized words; returns (gt_word, ocr_word, edit_distance, match_type) tuples");
    m.def("compute_metrics", &compute_metrics_py, py::arg("matches"),
          "Precision, recall, F1 and average CRR of an alignment");
    m.def("annotate", &annotate_py, py::arg("word_data"), py::arg("matches"), py::arg("is_ground_truth") = true,
          "Per-word match outcomes in original text order");
    m.def("evaluate_batch", &evaluate_batch_py, py::arg("ground_truth"), py::arg("models"),
          py::arg("config") = py::dict(),
          "Score several {'name', 'text'} model outputs against one ground truth");
}
