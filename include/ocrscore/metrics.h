#pragma once

#include "types.h"

#include <string>

namespace ocrscore {

// Character recognition rate of one word pair: 1 - distance / max_length,
// measured in code points and never negative. Two empty words score 1.
double character_recognition_rate(const std::string& gt_word, const std::string& ocr_word);

// Precision and recall count exact pairs only; avg_crr averages over exact
// and fuzzy pairs. Every ratio with an empty denominator is 0.
Metrics compute_metrics(const Alignment& alignment);

} // namespace ocrscore
