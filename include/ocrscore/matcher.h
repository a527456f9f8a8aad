#pragma once

#include "types.h"

#include <cstddef>
#include <string>
#include <vector>

namespace ocrscore {

// Multiset word alignment between a ground truth and a candidate.
//
// Phase 1 pairs identical words, most frequent ground-truth words first,
// min(gt_count, ocr_count) times each. Phase 2 repeatedly takes the globally
// closest remaining pair with 0 < distance <= threshold (ground-truth
// residuals scanned outer, candidate residuals inner, first strict minimum
// wins). Phase 3 reports whatever is left on either side.
//
// Residuals are ordered by each side's first occurrence of the word, with
// repeated occurrences adjacent. threshold == 0 disables phase 2.
Alignment match(const std::vector<std::string>& gt_normalized,
                const std::vector<std::string>& ocr_normalized,
                std::size_t threshold);

} // namespace ocrscore
