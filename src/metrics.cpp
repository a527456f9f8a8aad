#include "ocrscore/metrics.h"
#include "ocrscore/edit_distance.h"
#include "ocrscore/unicode_utils.h"

#include <algorithm>

namespace ocrscore {

namespace {

double ratio(std::size_t numerator, std::size_t denominator) {
    return denominator > 0 ? static_cast<double>(numerator) / static_cast<double>(denominator) : 0.0;
}

} // namespace

double character_recognition_rate(const std::string& gt_word, const std::string& ocr_word) {
    std::u32string gt = unicode::to_code_points(gt_word);
    std::u32string ocr = unicode::to_code_points(ocr_word);
    std::size_t max_len = std::max(gt.size(), ocr.size());
    if (max_len == 0) {
        return 1.0;
    }
    double crr = 1.0 - static_cast<double>(edit_distance(gt, ocr)) / static_cast<double>(max_len);
    return std::max(0.0, crr);
}

Metrics compute_metrics(const Alignment& alignment) {
    Metrics metrics;
    double crr_sum = 0.0;

    for (const auto& record : alignment.records) {
        switch (record.type) {
            case MatchType::Exact:
                metrics.exact_count++;
                crr_sum += 1.0;
                break;
            case MatchType::Fuzzy:
                metrics.fuzzy_count++;
                crr_sum += character_recognition_rate(record.gt_word.value_or(""), record.ocr_word.value_or(""));
                break;
            case MatchType::GtOnly:
                metrics.unmatched_gt++;
                break;
            case MatchType::OcrOnly:
                metrics.unmatched_ocr++;
                break;
        }
    }

    metrics.total_gt = metrics.exact_count + metrics.fuzzy_count + metrics.unmatched_gt;
    metrics.total_ocr = metrics.exact_count + metrics.fuzzy_count + metrics.unmatched_ocr;

    metrics.precision = ratio(metrics.exact_count, metrics.total_ocr);
    metrics.recall = ratio(metrics.exact_count, metrics.total_gt);
    if (metrics.precision + metrics.recall > 0.0) {
        metrics.f1 = 2.0 * metrics.precision * metrics.recall / (metrics.precision + metrics.recall);
    }

    std::size_t paired = metrics.exact_count + metrics.fuzzy_count;
    metrics.avg_crr = paired > 0 ? crr_sum / static_cast<double>(paired) : 0.0;

    return metrics;
}

} // namespace ocrscore
