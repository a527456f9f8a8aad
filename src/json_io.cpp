#include "ocrscore/json_io.h"
#include "ocrscore/unicode_utils.h"

#include <cstdio>
#include <stdexcept>

namespace ocrscore {

namespace {
using ocrscore::unicode::sanitize_utf8;

nlohmann::json optional_word(const std::optional<std::string>& word) {
    return word ? nlohmann::json(sanitize_utf8(*word)) : nlohmann::json(nullptr);
}

nlohmann::json optional_distance(const std::optional<std::size_t>& distance) {
    return distance ? nlohmann::json(*distance) : nlohmann::json(nullptr);
}

std::string percent(double ratio) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f%%", ratio * 100.0);
    return buf;
}

// Missing and null texts are both empty
std::string text_field(const nlohmann::json& request, const char* key) {
    auto it = request.find(key);
    if (it == request.end() || it->is_null()) {
        return std::string();
    }
    return it->get<std::string>();
}

} // namespace

void to_json(nlohmann::json& j, const Metrics& metrics) {
    j = nlohmann::json{
        {"precision", metrics.precision},
        {"recall", metrics.recall},
        {"avg_crr", metrics.avg_crr},
        {"f1_score", metrics.f1},
        {"exact_matches", metrics.exact_count},
        {"fuzzy_matches", metrics.fuzzy_count},
        {"total_gt_words", metrics.total_gt},
        {"total_ocr_words", metrics.total_ocr},
        {"unmatched_gt", metrics.unmatched_gt},
        {"unmatched_ocr", metrics.unmatched_ocr},
    };
}

void to_json(nlohmann::json& j, const Annotation& annotation) {
    j = nlohmann::json{
        {"word", sanitize_utf8(annotation.word)},
        {"match_type", to_string(annotation.match_type)},
        {"matched_with", optional_word(annotation.matched_with)},
        {"edit_distance", optional_distance(annotation.edit_distance)},
    };
}

void to_json(nlohmann::json& j, const MatchRecord& record) {
    j = nlohmann::json::array({
        optional_word(record.gt_word),
        optional_word(record.ocr_word),
        optional_distance(record.distance),
        to_string(record.type),
    });
}

nlohmann::json format_metrics_for_display(const Metrics& metrics) {
    nlohmann::json display = metrics;
    display["precision"] = percent(metrics.precision);
    display["recall"] = percent(metrics.recall);
    display["avg_crr"] = percent(metrics.avg_crr);
    display["f1_score"] = percent(metrics.f1);
    return display;
}

ComparisonRequest parse_request(const nlohmann::json& request) {
    if (!request.is_object() || request.empty()) {
        throw std::runtime_error("No data provided");
    }

    ComparisonRequest parsed;
    long long threshold = 1;
    try {
        parsed.ground_truth = text_field(request, "ground_truth");
        parsed.ocr_output = text_field(request, "ocr_output");

        if (auto it = request.find("config"); it != request.end() && !it->is_null()) {
            const nlohmann::json& config = *it;
            if (!config.is_object()) {
                throw std::runtime_error("'config' must be an object");
            }
            parsed.config.case_sensitive = config.value("case_sensitive", false);
            parsed.config.ignore_punctuation = config.value("ignore_punctuation", true);
            if (auto punct = config.find("punctuation_chars"); punct != config.end() && !punct->is_null()) {
                parsed.config.punctuation_chars = punct->get<std::string>();
            }
            if (auto thr = config.find("edit_distance_threshold"); thr != config.end() && !thr->is_null()) {
                if (!thr->is_number_integer()) {
                    throw std::runtime_error("'edit_distance_threshold' must be an integer");
                }
                threshold = thr->get<long long>();
            }
        }
    } catch (const nlohmann::json::exception& ex) {
        throw std::runtime_error(std::string("Malformed request: ") + ex.what());
    }

    if (threshold < 0) {
        throw std::invalid_argument("Edit distance threshold must be non-negative, got " + std::to_string(threshold));
    }
    parsed.threshold = static_cast<std::size_t>(threshold);
    return parsed;
}

ComparisonRequest parse_request(const std::string& text) {
    nlohmann::json request = nlohmann::json::parse(text, nullptr, false);
    if (request.is_discarded()) {
        throw std::runtime_error("Request is not valid JSON");
    }
    return parse_request(request);
}

nlohmann::json result_to_json(const EvaluationResult& result, const ReportOptions& options) {
    nlohmann::json out;
    out["model_name"] = sanitize_utf8(result.model_name);
    out["metrics"] = result.metrics;
    out["display"] = format_metrics_for_display(result.metrics);
    if (options.include_annotations) {
        out["gt_annotations"] = result.gt_annotations;
        out["ocr_annotations"] = result.ocr_annotations;
    }
    if (options.include_matches) {
        out["matches"] = result.alignment.records;
    }
    return out;
}

nlohmann::json build_report(const std::vector<EvaluationResult>& results,
                            const std::vector<std::string>& warnings,
                            const ReportOptions& options) {
    nlohmann::json report;
    report["success"] = true;
    report["results"] = nlohmann::json::array();
    for (const auto& result : results) {
        report["results"].push_back(result_to_json(result, options));
    }
    report["errors"] = warnings;
    return report;
}

nlohmann::json build_error_report(const std::string& message, const std::vector<std::string>& warnings) {
    nlohmann::json report;
    report["success"] = false;
    report["error"] = sanitize_utf8(message);
    if (!warnings.empty()) {
        report["errors"] = warnings;
    }
    return report;
}

} // namespace ocrscore
