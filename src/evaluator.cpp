#include "ocrscore/evaluator.h"
#include "ocrscore/matcher.h"
#include "ocrscore/metrics.h"
#include "ocrscore/annotator.h"

#include <chrono>
#include <iostream>

namespace ocrscore {

Evaluator::Evaluator() = default;

void Evaluator::configure(const ScoreSettings& settings) {
    configure(settings.to_normalization_config(), settings.threshold());
    verbose_ = settings.verbose;
    debug_ = settings.debug;
    if (debug_) {
        const NormalizationConfig& config = normalizer_.config();
        std::cerr << "[ocrscore] case_sensitive=" << config.case_sensitive
                  << " ignore_punctuation=" << config.ignore_punctuation
                  << " punctuation='" << config.punctuation_chars << "'"
                  << " threshold=" << threshold_ << "\n";
    }
}

void Evaluator::configure(const NormalizationConfig& config, std::size_t threshold) {
    normalizer_ = TextNormalizer(config);
    threshold_ = threshold;
}

EvaluationResult Evaluator::evaluate(const TokenizedText& ground_truth, const CandidateText& candidate) const {
    TokenizedText ocr = normalizer_.tokenize_and_normalize(candidate.text);

    EvaluationResult result;
    result.model_name = candidate.name;
    result.alignment = match(ground_truth.normalized, ocr.normalized, threshold_);
    result.metrics = compute_metrics(result.alignment);

    if (debug_) {
        std::cerr << "[ocrscore] " << candidate.name << ": "
                  << result.metrics.exact_count << " exact, "
                  << result.metrics.fuzzy_count << " fuzzy, "
                  << result.metrics.unmatched_gt << " gt_only, "
                  << result.metrics.unmatched_ocr << " ocr_only\n";
    }

    result.gt_annotations = annotate(ground_truth.tokens, result.alignment, Side::GroundTruth);
    result.ocr_annotations = annotate(ocr.tokens, result.alignment, Side::Candidate);
    return result;
}

std::vector<EvaluationResult> Evaluator::evaluate_batch(const std::string& ground_truth,
                                                        const std::vector<CandidateText>& candidates,
                                                        EvaluationStats* stats) const {
    EvaluationStats local_stats;
    auto start_time = std::chrono::steady_clock::now();

    TokenizedText gt = normalizer_.tokenize_and_normalize(ground_truth);
    local_stats.gt_words = gt.normalized.size();

    std::vector<EvaluationResult> results;
    results.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        results.push_back(evaluate(gt, candidate));
        local_stats.candidate_count++;
        local_stats.candidate_words += results.back().metrics.total_ocr;

        if (verbose_) {
            const Metrics& m = results.back().metrics;
            std::cerr << "[ocrscore] " << candidate.name
                      << ": precision=" << m.precision
                      << " recall=" << m.recall
                      << " f1=" << m.f1
                      << " avg_crr=" << m.avg_crr << "\n";
        }
    }

    std::chrono::duration<float> elapsed = std::chrono::steady_clock::now() - start_time;
    local_stats.elapsed_seconds = elapsed.count();
    if (stats) {
        *stats = local_stats;
    }
    return results;
}

} // namespace ocrscore
