#pragma once

#include "types.h"
#include "evaluator.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace ocrscore {

void to_json(nlohmann::json& j, const Metrics& metrics);
void to_json(nlohmann::json& j, const Annotation& annotation);
void to_json(nlohmann::json& j, const MatchRecord& record);

// Ratios as "66.67%" strings, counts unchanged
nlohmann::json format_metrics_for_display(const Metrics& metrics);

// Single manual comparison: ground truth, one OCR output and its settings
struct ComparisonRequest {
    std::string ground_truth;
    std::string ocr_output;
    NormalizationConfig config;
    std::size_t threshold = 1;
};

// Throws std::runtime_error on malformed JSON or wrong field types,
// std::invalid_argument on a negative threshold
ComparisonRequest parse_request(const nlohmann::json& request);
ComparisonRequest parse_request(const std::string& text);

struct ReportOptions {
    bool include_annotations = true;
    bool include_matches = false;
};

nlohmann::json result_to_json(const EvaluationResult& result, const ReportOptions& options = {});
nlohmann::json build_report(const std::vector<EvaluationResult>& results,
                            const std::vector<std::string>& warnings,
                            const ReportOptions& options = {});
nlohmann::json build_error_report(const std::string& message,
                                  const std::vector<std::string>& warnings = {});

} // namespace ocrscore
