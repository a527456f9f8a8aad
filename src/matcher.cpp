#include "ocrscore/matcher.h"
#include "ocrscore/edit_distance.h"
#include "ocrscore/unicode_utils.h"

#include <algorithm>
#include <limits>
#include <numeric>
#include <unordered_map>

namespace ocrscore {

namespace {

struct WordGroup {
    std::string word;
    std::size_t count = 0;
    std::size_t remaining = 0;
    std::u32string code_points;
};

struct WordCounts {
    std::vector<WordGroup> groups;  // first-encounter order
    std::unordered_map<std::string, std::size_t> index;
};

struct FuzzyCandidate {
    std::size_t ocr_group;
    std::size_t distance;
};

WordCounts count_words(const std::vector<std::string>& words) {
    WordCounts counts;
    for (const auto& word : words) {
        auto [it, inserted] = counts.index.emplace(word, counts.groups.size());
        if (inserted) {
            WordGroup group;
            group.word = word;
            counts.groups.push_back(std::move(group));
        }
        counts.groups[it->second].count++;
    }
    for (auto& group : counts.groups) {
        group.remaining = group.count;
    }
    return counts;
}

void match_exact(WordCounts& gt, WordCounts& ocr, Alignment& alignment) {
    std::vector<std::size_t> order(gt.groups.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(), [&gt](std::size_t a, std::size_t b) {
        return gt.groups[a].count > gt.groups[b].count;
    });

    for (std::size_t idx : order) {
        WordGroup& gt_group = gt.groups[idx];
        auto it = ocr.index.find(gt_group.word);
        if (it == ocr.index.end()) {
            continue;
        }
        WordGroup& ocr_group = ocr.groups[it->second];
        std::size_t pairs = std::min(gt_group.count, ocr_group.count);
        for (std::size_t i = 0; i < pairs; ++i) {
            alignment.records.push_back(MatchRecord::exact(gt_group.word));
        }
        gt_group.remaining -= pairs;
        ocr_group.remaining -= pairs;
    }
}

void match_fuzzy(WordCounts& gt, WordCounts& ocr, std::size_t threshold, Alignment& alignment) {
    for (auto& group : ocr.groups) {
        if (group.remaining > 0) {
            group.code_points = unicode::to_code_points(group.word);
        }
    }

    // Distances never change between rounds, only availability does, so the
    // within-threshold pairs are computed once per distinct word pair.
    std::vector<std::vector<FuzzyCandidate>> candidates(gt.groups.size());
    for (std::size_t g = 0; g < gt.groups.size(); ++g) {
        WordGroup& gt_group = gt.groups[g];
        if (gt_group.remaining == 0) {
            continue;
        }
        gt_group.code_points = unicode::to_code_points(gt_group.word);
        for (std::size_t o = 0; o < ocr.groups.size(); ++o) {
            const WordGroup& ocr_group = ocr.groups[o];
            if (ocr_group.remaining == 0) {
                continue;
            }
            std::size_t distance = bounded_edit_distance(gt_group.code_points, ocr_group.code_points, threshold);
            // Byte-distinct words can still decode alike (ill-formed UTF-8);
            // a fuzzy pair needs at least one real edit
            if (distance > 0 && distance <= threshold) {
                candidates[g].push_back({o, distance});
            }
        }
    }

    // Residual words on the two sides are all distinct after the exact phase,
    // so no pair can beat distance 1.
    while (true) {
        std::size_t best_distance = threshold + 1;
        std::size_t best_gt = 0;
        std::size_t best_ocr = 0;

        for (std::size_t g = 0; g < gt.groups.size() && best_distance > 1; ++g) {
            if (gt.groups[g].remaining == 0) {
                continue;
            }
            for (const auto& candidate : candidates[g]) {
                if (ocr.groups[candidate.ocr_group].remaining == 0) {
                    continue;
                }
                if (candidate.distance < best_distance) {
                    best_distance = candidate.distance;
                    best_gt = g;
                    best_ocr = candidate.ocr_group;
                }
            }
        }

        if (best_distance > threshold) {
            break;
        }

        // Every pair scanned before the winner is strictly worse, so the
        // winner stays the global best until one of its two words runs out.
        WordGroup& gt_group = gt.groups[best_gt];
        WordGroup& ocr_group = ocr.groups[best_ocr];
        std::size_t pairs = std::min(gt_group.remaining, ocr_group.remaining);
        for (std::size_t i = 0; i < pairs; ++i) {
            alignment.records.push_back(MatchRecord::fuzzy(gt_group.word, ocr_group.word, best_distance));
        }
        gt_group.remaining -= pairs;
        ocr_group.remaining -= pairs;
    }
}

} // namespace

Alignment match(const std::vector<std::string>& gt_normalized,
                const std::vector<std::string>& ocr_normalized,
                std::size_t threshold) {
    Alignment alignment;
    alignment.records.reserve(gt_normalized.size() + ocr_normalized.size());

    WordCounts gt = count_words(gt_normalized);
    WordCounts ocr = count_words(ocr_normalized);

    match_exact(gt, ocr, alignment);

    if (threshold > 0) {
        match_fuzzy(gt, ocr, std::min(threshold, std::numeric_limits<std::size_t>::max() - 1), alignment);
    }

    for (const auto& group : gt.groups) {
        for (std::size_t i = 0; i < group.remaining; ++i) {
            alignment.records.push_back(MatchRecord::gt_only(group.word));
        }
    }
    for (const auto& group : ocr.groups) {
        for (std::size_t i = 0; i < group.remaining; ++i) {
            alignment.records.push_back(MatchRecord::ocr_only(group.word));
        }
    }

    return alignment;
}

} // namespace ocrscore
