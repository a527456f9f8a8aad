#include "ocrscore/evaluator.h"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace ocrscore;

namespace {

ScoreSettings settings_with(std::initializer_list<std::pair<const std::string, std::string>> options) {
    ScoreSettings settings;
    settings.options = options;
    return settings;
}

} // namespace

TEST(Evaluator, DefaultsMatchDefaultConfig) {
    Evaluator evaluator;
    EXPECT_EQ(evaluator.threshold(), 1u);
    EXPECT_FALSE(evaluator.normalizer().config().case_sensitive);
    EXPECT_TRUE(evaluator.normalizer().config().ignore_punctuation);
}

TEST(Evaluator, EvaluatesSingleCandidate) {
    Evaluator evaluator;
    TokenizedText gt = evaluator.normalizer().tokenize_and_normalize("The quick brown fox.");
    EvaluationResult result = evaluator.evaluate(gt, CandidateText{"tesseract", "the quik brown"});

    EXPECT_EQ(result.model_name, "tesseract");
    EXPECT_EQ(result.metrics.exact_count, 2u);
    EXPECT_EQ(result.metrics.fuzzy_count, 1u);
    EXPECT_EQ(result.metrics.unmatched_gt, 1u);
    ASSERT_EQ(result.gt_annotations.size(), 4u);
    EXPECT_EQ(result.gt_annotations[3].word, "fox.");
    EXPECT_EQ(result.gt_annotations[3].match_type, MatchType::GtOnly);
    ASSERT_EQ(result.ocr_annotations.size(), 3u);
    EXPECT_EQ(result.ocr_annotations[1].match_type, MatchType::Fuzzy);
}

TEST(Evaluator, BatchKeepsCandidateOrderAndStats) {
    Evaluator evaluator;
    std::vector<CandidateText> candidates = {
        {"perfect", "one two three"},
        {"empty", ""},
        {"noisy", "one tw0 three four"},
    };
    EvaluationStats stats;
    auto results = evaluator.evaluate_batch("One, two; three!", candidates, &stats);

    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].model_name, "perfect");
    EXPECT_DOUBLE_EQ(results[0].metrics.f1, 1.0);
    EXPECT_EQ(results[1].model_name, "empty");
    EXPECT_EQ(results[1].metrics.unmatched_gt, 3u);
    EXPECT_DOUBLE_EQ(results[1].metrics.precision, 0.0);
    EXPECT_EQ(results[2].model_name, "noisy");
    EXPECT_EQ(results[2].metrics.exact_count, 2u);
    EXPECT_EQ(results[2].metrics.fuzzy_count, 1u);
    EXPECT_EQ(results[2].metrics.unmatched_ocr, 1u);

    EXPECT_EQ(stats.candidate_count, 3);
    EXPECT_EQ(stats.gt_words, 3u);
    EXPECT_EQ(stats.candidate_words, 3u + 0u + 4u);
    EXPECT_GE(stats.elapsed_seconds, 0.f);
}

TEST(Evaluator, BatchWithoutCandidates) {
    Evaluator evaluator;
    EXPECT_TRUE(evaluator.evaluate_batch("some text", {}).empty());
}

TEST(Evaluator, ConfigureFromSettings) {
    Evaluator evaluator;
    evaluator.configure(settings_with({{"case_sensitive", "true"}, {"threshold", "0"}}));
    EXPECT_EQ(evaluator.threshold(), 0u);

    auto results = evaluator.evaluate_batch("Word word", {CandidateText{"m", "word word"}});
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].metrics.exact_count, 1u);
    EXPECT_EQ(results[0].metrics.fuzzy_count, 0u);
    EXPECT_EQ(results[0].metrics.unmatched_gt, 1u);
    EXPECT_EQ(results[0].metrics.unmatched_ocr, 1u);
}

TEST(Evaluator, ConfigureKeepsPunctuationWhenAsked) {
    Evaluator evaluator;
    NormalizationConfig config;
    config.ignore_punctuation = false;
    evaluator.configure(config, 0);
    auto results = evaluator.evaluate_batch("end.", {CandidateText{"m", "end"}});
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].metrics.exact_count, 0u);
}

TEST(Evaluator, ConfigureRejectsNegativeThreshold) {
    Evaluator evaluator;
    EXPECT_THROW(evaluator.configure(settings_with({{"threshold", "-1"}})), std::invalid_argument);
}
