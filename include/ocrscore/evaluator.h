#pragma once

#include "types.h"
#include "settings.h"
#include "normalizer.h"

#include <cstddef>
#include <string>
#include <vector>

namespace ocrscore {

struct CandidateText {
    std::string name;
    std::string text;
};

struct EvaluationResult {
    std::string model_name;
    Alignment alignment;
    Metrics metrics;
    std::vector<Annotation> gt_annotations;
    std::vector<Annotation> ocr_annotations;
};

struct EvaluationStats {
    int candidate_count = 0;
    std::size_t gt_words = 0;
    std::size_t candidate_words = 0;
    float elapsed_seconds = 0.f;
};

class Evaluator {
public:
    Evaluator();

    void configure(const ScoreSettings& settings);
    void configure(const NormalizationConfig& config, std::size_t threshold);
    void set_verbosity(bool verbose, bool debug) {
        verbose_ = verbose;
        debug_ = debug;
    }

    const TextNormalizer& normalizer() const { return normalizer_; }
    std::size_t threshold() const { return threshold_; }

    // Score one candidate against an already tokenized ground truth
    EvaluationResult evaluate(const TokenizedText& ground_truth, const CandidateText& candidate) const;

    // Tokenize the ground truth once and score every candidate in order
    std::vector<EvaluationResult> evaluate_batch(const std::string& ground_truth,
                                                 const std::vector<CandidateText>& candidates,
                                                 EvaluationStats* stats = nullptr) const;

private:
    TextNormalizer normalizer_;
    std::size_t threshold_ = 1;
    bool verbose_ = false;
    bool debug_ = false;
};

} // namespace ocrscore
